#include "LZRCStream.h"
using namespace std;

LZRCCompressionStream::LZRCCompressionStream (int level):
	params(LevelParameters::get(level))
{
}

size_t LZRCCompressionStream::compress (const uint8_t *source, size_t source_sz,
	Array<uint8_t> &dest, size_t dest_offset)
{
	ZAMAN_START(LZRCCompress);
	// range coder keeps appending to the array
	dest.resize(dest_offset);
	RangeEncoder rc(&dest);
	auto model = make_shared<LZModel>();
	LZParser parser(source, source_sz, params);

	while (parser.hasNext()) {
		size_t pos = parser.position();
		Token t = parser.next();
		stats.addToken(t, t.isMatch() && t.distance == model->getRep0());
		model->codeToken(rc, pos, pos ? source[pos - 1] : 0, t);
	}
	rc.flush();

	stats.originalSize += source_sz;
	stats.compressedSize += rc.written();
	ZAMAN_END(LZRCCompress);
	return dest.size() - dest_offset;
}

LZRCDecompressionStream::LZRCDecompressionStream (int level, uint64_t expected):
	params(LevelParameters::get(level)), expected(expected)
{
}

size_t LZRCDecompressionStream::decompress (const uint8_t *source, size_t source_sz,
	Array<uint8_t> &dest, size_t dest_offset)
{
	ZAMAN_START(LZRCDecompress);
	dest.resize(dest_offset);
	// the declared length is not trusted for a single large allocation
	dest.reserve(dest_offset + min(expected, (uint64_t)(64 * MB)));

	Window window(max((uint64_t)1, min((uint64_t)params.windowSize(), expected)));
	auto model = make_shared<LZModel>();
	uint64_t produced = 0;

	try {
		RangeDecoder rc(source, source_sz);
		while (produced < expected) {
			uint32_t rep0 = model->getRep0();
			Token t = model->codeToken(rc, produced, window.last(), Token());
			stats.addToken(t, t.isMatch() && t.distance == rep0);

			if (!t.isMatch()) {
				window.add(t.literal);
				dest.add(t.literal);
				produced++;
				continue;
			}
			if (t.distance == 0 || t.distance > window.size())
				throw FormatException("Match distance %u exceeds history of %zu bytes at position %" PRIu64,
					t.distance, window.size(), produced);
			if (t.length > expected - produced)
				throw TruncationException(rc.consumed(), expected, produced + t.length);
			window.copyMatch(t.distance, t.length, dest);
			produced += t.length;
		}

		if (!rc.finished())
			throw FormatException("Range decoder did not end cleanly at byte %zu", rc.consumed());
		if (rc.consumed() != source_sz)
			throw FormatException("%zu bytes of trailing data after the payload", source_sz - rc.consumed());
	} catch (TruncationException &e) {
		throw TruncationException(e.getOffset(), expected, max(produced, e.getActual()));
	}

	stats.originalSize += produced;
	stats.compressedSize += source_sz;
	ZAMAN_END(LZRCDecompress);
	return produced;
}
