#ifndef Container_H
#define Container_H

#include "Common.h"
#include "Stats.h"

// [magic:4][version:1][level:1][originalLength:8][checksum:4], little-endian
struct ContainerHeader {
	static const size_t SIZE = 18;

	uint32_t magic;
	uint8_t  version;
	uint8_t  level;
	uint64_t originalLength;
	uint32_t checksum;

	ContainerHeader (void):
		magic(MAGIC), version(VERSION), level(0), originalLength(0), checksum(0)
	{
	}
};

class Container {
public:
	static void writeHeader (const ContainerHeader &h, Array<uint8_t> &dest);
	// Validates magic, version and level; does not look at the payload
	static ContainerHeader readHeader (const uint8_t *in, size_t in_sz);

	// dest is replaced by the complete container. Returns its size.
	static size_t compress (const uint8_t *source, size_t source_sz, int level,
		Array<uint8_t> &dest, CodecStats *stats = 0);
	// dest is replaced by the original bytes. Returns their count.
	static size_t decompress (const uint8_t *source, size_t source_sz,
		Array<uint8_t> &dest, ContainerHeader *header = 0, CodecStats *stats = 0);

	static uint32_t checksum (const uint8_t *data, size_t sz);
};

#endif // Container_H
