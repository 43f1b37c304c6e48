#ifndef Stream_H
#define Stream_H

#include "../Common.h"

class CompressionStream {
public:
	virtual ~CompressionStream (void) {}

public:
	// append compressed data AFTER dest+dest_offset,
	// return new compressed size!
	virtual size_t compress (const uint8_t *source, size_t source_sz, Array<uint8_t> &dest, size_t dest_offset) = 0;
};

class DecompressionStream {
public:
	virtual ~DecompressionStream (void) {}

public:
	// append decompressed data AFTER dest+dest_offset,
	// return new decompressed size!
	virtual size_t decompress (const uint8_t *source, size_t source_sz, Array<uint8_t> &dest, size_t dest_offset) = 0;
};

#endif
