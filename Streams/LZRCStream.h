#ifndef LZRCStream_H
#define LZRCStream_H

#include "../Common.h"
#include "../Stats.h"
#include "Stream.h"
#include "RangeCoder.h"
#include "MatchFinder.h"
#include "ContextModels/LZModel.h"

// LZ77 tokens entropy-coded with an adaptive binary range coder.
// The payload carries no length; the decompressor is told how many bytes
// to produce and which level (window size) was used.
class LZRCCompressionStream: public CompressionStream {
	LevelParameters params;
	CodecStats stats;

public:
	LZRCCompressionStream (int level);

public:
	size_t compress (const uint8_t *source, size_t source_sz, Array<uint8_t> &dest, size_t dest_offset);
	const CodecStats &getStats (void) const { return stats; }
};

class LZRCDecompressionStream: public DecompressionStream {
	LevelParameters params;
	uint64_t expected;
	CodecStats stats;

public:
	LZRCDecompressionStream (int level, uint64_t expected);

public:
	// Appends exactly `expected` bytes or throws
	size_t decompress (const uint8_t *source, size_t source_sz, Array<uint8_t> &dest, size_t dest_offset);
	const CodecStats &getStats (void) const { return stats; }
};

#endif // LZRCStream_H
