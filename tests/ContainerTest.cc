#include <gtest/gtest.h>
#include <zlib.h>
#include "Container.h"
#include "TestData.h"
using namespace std;

class ContainerTest: public ::testing::Test {
protected:
	vector<uint8_t> text;
	Array<uint8_t> packed;

	void SetUp (void)
	{
		text = textBytes(20000);
		Container::compress(text.data(), text.size(), 6, packed);
	}

	vector<uint8_t> unpack (const Array<uint8_t> &in)
	{
		Array<uint8_t> out;
		Container::decompress(in.data(), in.size(), out);
		return vector<uint8_t>(out.begin(), out.end());
	}
};

TEST_F(ContainerTest, HeaderLayout)
{
	ASSERT_GT(packed.size(), ContainerHeader::SIZE);
	EXPECT_EQ(0x43, packed[0]);
	EXPECT_EQ(0x58, packed[1]);
	EXPECT_EQ(0x4D, packed[2]);
	EXPECT_EQ(0x1A, packed[3]);
	EXPECT_EQ(1, packed[4]);
	EXPECT_EQ(6, packed[5]);
	EXPECT_EQ(text.size(), readLE(packed.data() + 6, 8));
	uint32_t crc = crc32(0L, text.data(), text.size());
	EXPECT_EQ(crc, readLE(packed.data() + 14, 4));

	ContainerHeader h = Container::readHeader(packed.data(), packed.size());
	EXPECT_EQ(6, h.level);
	EXPECT_EQ(text.size(), h.originalLength);
	EXPECT_EQ(crc, h.checksum);
}

TEST_F(ContainerTest, RoundTripEveryLevel)
{
	vector<vector<uint8_t>> inputs = { {}, { 0 }, text, randomBytes(5000, 1), structuredBytes(40000) };
	for (int level = 0; level <= 9; level++) 
		for (auto &in: inputs) {
			Array<uint8_t> c;
			size_t n = Container::compress(in.data(), in.size(), level, c);
			EXPECT_EQ(c.size(), n);
			EXPECT_EQ(in, unpack(c)) << "level " << level << ", size " << in.size();
		}
}

TEST_F(ContainerTest, EmptyInput)
{
	for (int level = 0; level <= 9; level++) {
		Array<uint8_t> c;
		Container::compress(0, 0, level, c);
		EXPECT_EQ(ContainerHeader::SIZE + 5, c.size());
		EXPECT_TRUE(unpack(c).empty());
	}
}

TEST_F(ContainerTest, DecompressionIsIdempotent)
{
	EXPECT_EQ(unpack(packed), unpack(packed));
	EXPECT_EQ(text, unpack(packed));
}

TEST_F(ContainerTest, CompressionIsDeterministic)
{
	Array<uint8_t> again;
	Container::compress(text.data(), text.size(), 6, again);
	ASSERT_EQ(packed.size(), again.size());
	EXPECT_EQ(0, memcmp(packed.data(), again.data(), packed.size()));
}

TEST_F(ContainerTest, RepeatedByteLevelNineNoLargerThanLevelZero)
{
	vector<uint8_t> in(MB, 0x55);
	Array<uint8_t> c0, c9;
	Container::compress(in.data(), in.size(), 0, c0);
	Container::compress(in.data(), in.size(), 9, c9);
	EXPECT_LE(c9.size(), c0.size());
}

TEST_F(ContainerTest, ChecksumCorruptionIsIntegrityError)
{
	for (size_t i = 14; i < 18; i++) {
		Array<uint8_t> bad = packed;
		bad[i] ^= 0x5A;
		try {
			unpack(bad);
			FAIL() << "no error for byte " << i;
		} catch (IntegrityException &e) {
			EXPECT_EQ(readLE(bad.data() + 14, 4), e.getExpected());
			EXPECT_EQ(crc32(0L, text.data(), text.size()), e.getActual());
		}
	}
}

TEST_F(ContainerTest, EveryPrefixIsTruncation)
{
	for (size_t cut = 0; cut < packed.size(); cut += (cut < 64 ? 1 : 1 + cut / 16)) {
		Array<uint8_t> out;
		EXPECT_THROW(Container::decompress(packed.data(), cut, out), TruncationException) << "cut " << cut;
	}
	Array<uint8_t> out;
	EXPECT_THROW(Container::decompress(packed.data(), packed.size() - 1, out), TruncationException);
}

TEST_F(ContainerTest, EmptyInputIsTruncation)
{
	Array<uint8_t> empty, out;
	EXPECT_THROW(Container::decompress(empty.data(), empty.size(), out), TruncationException);
	EXPECT_THROW(Container::readHeader(0, 0), TruncationException);
	EXPECT_EQ(0u, out.size());
}

TEST_F(ContainerTest, ForeignInputIsFormatError)
{
	Array<uint8_t> out;
	const char *gz = "\x1f\x8b\x08\x00";
	EXPECT_THROW(Container::decompress((const uint8_t*)gz, 4, out), FormatException);

	Array<uint8_t> bad = packed;
	bad[0] = 'Z';
	EXPECT_THROW(Container::decompress(bad.data(), bad.size(), out), FormatException);

	bad = packed;
	bad[4] = 2;
	EXPECT_THROW(Container::decompress(bad.data(), bad.size(), out), FormatException);

	bad = packed;
	bad[5] = 10;
	EXPECT_THROW(Container::decompress(bad.data(), bad.size(), out), FormatException);
	EXPECT_THROW(Container::readHeader(bad.data(), bad.size()), FormatException);
}

TEST_F(ContainerTest, TrailingGarbageIsFormatError)
{
	Array<uint8_t> bad = packed;
	bad.add((const uint8_t*)"junk", 4);
	Array<uint8_t> out;
	EXPECT_THROW(Container::decompress(bad.data(), bad.size(), out), FormatException);
}

TEST_F(ContainerTest, LevelOutOfRangeLeavesOutputUntouched)
{
	Array<uint8_t> out;
	out.add((const uint8_t*)"keep", 4);
	for (int level: { -1, 10, 100 }) {
		try {
			Container::compress(text.data(), text.size(), level, out);
			FAIL() << "level " << level << " accepted";
		} catch (LevelOutOfRangeException &e) {
			EXPECT_EQ(level, e.getLevel());
		}
		ASSERT_EQ(4u, out.size());
		EXPECT_EQ(0, memcmp(out.data(), "keep", 4));
	}
}

TEST_F(ContainerTest, ReturnsHeaderAndStats)
{
	Array<uint8_t> out;
	ContainerHeader h;
	CodecStats st;
	Container::decompress(packed.data(), packed.size(), out, &h, &st);
	EXPECT_EQ(6, h.level);
	EXPECT_EQ(text.size(), h.originalLength);
	EXPECT_EQ(text.size(), st.getCoveredBytes());
}
