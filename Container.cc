#include <new>
#include <zlib.h>
#include "Container.h"
#include "Streams/LZRCStream.h"
using namespace std;

const size_t ContainerHeader::SIZE;

void Container::writeHeader (const ContainerHeader &h, Array<uint8_t> &dest)
{
	writeLE(h.magic, 4, dest);
	writeLE(h.version, 1, dest);
	writeLE(h.level, 1, dest);
	writeLE(h.originalLength, 8, dest);
	writeLE(h.checksum, 4, dest);
}

ContainerHeader Container::readHeader (const uint8_t *in, size_t in_sz)
{
	if (in_sz < ContainerHeader::SIZE) {
		uint8_t magic[4];
		for (int i = 0; i < 4; i++)
			magic[i] = (MAGIC >> (8 * i)) & 0xFF;
		if (!in_sz || memcmp(in, magic, min(in_sz, (size_t)4)) == 0)
			throw TruncationException(in_sz, ContainerHeader::SIZE, in_sz);
		throw FormatException("Not a CXM stream: bad magic");
	}

	ContainerHeader h;
	h.magic = readLE(in, 4);
	if (h.magic != MAGIC)
		throw FormatException("Not a CXM stream: bad magic %08x", h.magic);
	h.version = in[4];
	if (h.version != VERSION)
		throw FormatException("Unsupported CXM version %d", h.version);
	h.level = in[5];
	if (h.level > 9)
		throw FormatException("Invalid compression level %d in header", h.level);
	h.originalLength = readLE(in + 6, 8);
	h.checksum = readLE(in + 14, 4);
	return h;
}

uint32_t Container::checksum (const uint8_t *data, size_t sz)
{
	static const size_t CHUNK = 1u << 30; // crc32 takes a uInt length
	uLong crc = crc32(0L, Z_NULL, 0);
	while (sz > 0) {
		size_t chunk = min(sz, CHUNK);
		crc = crc32(crc, data, chunk);
		data += chunk, sz -= chunk;
	}
	return crc;
}

size_t Container::compress (const uint8_t *source, size_t source_sz, int level,
	Array<uint8_t> &dest, CodecStats *stats)
{
	if (level < 0 || level > 9)
		throw LevelOutOfRangeException(level);

	try {
		ContainerHeader h;
		h.level = level;
		h.originalLength = source_sz;
		h.checksum = checksum(source, source_sz);

		Array<uint8_t> out;
		out.reserve(ContainerHeader::SIZE + source_sz / 2 + 64);
		writeHeader(h, out);

		LZRCCompressionStream stream(level);
		stream.compress(source, source_sz, out, out.size());
		if (stats)
			*stats = stream.getStats();
		swap(dest, out);
	} catch (bad_alloc &e) {
		throw AllocationException(source_sz);
	}
	return dest.size();
}

size_t Container::decompress (const uint8_t *source, size_t source_sz,
	Array<uint8_t> &dest, ContainerHeader *header, CodecStats *stats)
{
	ContainerHeader h = readHeader(source, source_sz);
	if (header)
		*header = h;

	try {
		Array<uint8_t> out;
		LZRCDecompressionStream stream(h.level, h.originalLength);
		size_t produced = stream.decompress(source + ContainerHeader::SIZE,
			source_sz - ContainerHeader::SIZE, out, 0);
		if (produced != h.originalLength)
			throw TruncationException(source_sz, h.originalLength, produced);

		uint32_t crc = checksum(out.data(), out.size());
		if (crc != h.checksum)
			throw IntegrityException(h.checksum, crc);
		if (stats)
			*stats = stream.getStats();
		swap(dest, out);
	} catch (bad_alloc &e) {
		throw AllocationException(h.originalLength);
	}
	return dest.size();
}
