#include <vector>
#include <random>
#include <gtest/gtest.h>
#include "Streams/RangeCoder.h"
using namespace std;

static vector<uint32_t> skewedBits (size_t n, double p, unsigned seed)
{
	mt19937 gen(seed);
	bernoulli_distribution d(p);
	vector<uint32_t> bits(n);
	for (auto &b: bits)
		b = d(gen);
	return bits;
}

TEST(RangeCoderTest, AdaptiveBitsRoundTrip)
{
	auto bits = skewedBits(20000, 0.1, 7);
	Array<uint8_t> out;
	{
		RangeEncoder rc(&out);
		BitModel ctx[2];
		uint32_t prev = 0;
		for (auto b: bits)
			prev = rc.code(ctx[prev], b);
		rc.flush();
		EXPECT_EQ(out.size(), rc.written());
	}
	// a skewed source must compress
	EXPECT_LT(out.size(), bits.size() / 8);

	RangeDecoder rd(out.data(), out.size());
	BitModel ctx[2];
	uint32_t prev = 0;
	for (size_t i = 0; i < bits.size(); i++) {
		prev = rd.code(ctx[prev], 0);
		ASSERT_EQ(bits[i], prev) << "bit " << i;
	}
	EXPECT_TRUE(rd.finished());
	EXPECT_EQ(out.size(), rd.consumed());
}

TEST(RangeCoderTest, DirectBitsAndTreesRoundTrip)
{
	Array<uint8_t> out;
	vector<uint32_t> values = { 0, 1, 0x3FFFFFF, 12345, 0x2AAAAAA };
	{
		RangeEncoder rc(&out);
		BitModel tree[1 << 8], rev[1 << 4];
		for (auto v: values) {
			rc.codeDirect(v, 26);
			codeTree(rc, tree, 8, v & 0xFF);
			codeReverseTree(rc, rev, 4, v & 0xF);
		}
		rc.flush();
	}

	RangeDecoder rd(out.data(), out.size());
	BitModel tree[1 << 8], rev[1 << 4];
	for (auto v: values) {
		EXPECT_EQ(v, rd.codeDirect(0, 26));
		EXPECT_EQ(v & 0xFF, codeTree(rd, tree, 8, 0));
		EXPECT_EQ(v & 0xF, codeReverseTree(rd, rev, 4, 0));
	}
	EXPECT_TRUE(rd.finished());
}

TEST(RangeCoderTest, EmptyStreamIsFiveZeroBytes)
{
	Array<uint8_t> out;
	RangeEncoder rc(&out);
	rc.flush();
	ASSERT_EQ(5u, out.size());
	for (auto c: out)
		EXPECT_EQ(0, c);
	RangeDecoder rd(out.data(), out.size());
	EXPECT_TRUE(rd.finished());
}

TEST(RangeCoderTest, TruncatedPayloadThrows)
{
	auto bits = skewedBits(5000, 0.5, 11);
	Array<uint8_t> out;
	RangeEncoder rc(&out);
	BitModel m;
	for (auto b: bits)
		rc.code(m, b);
	rc.flush();

	size_t cut = out.size() / 2;
	EXPECT_THROW({
		RangeDecoder rd(out.data(), cut);
		BitModel d;
		for (size_t i = 0; i < bits.size(); i++)
			rd.code(d, 0);
	}, TruncationException);
	EXPECT_THROW({ RangeDecoder rd(out.data(), 3); }, TruncationException);
}

TEST(RangeCoderTest, NonZeroLeadByteIsRejected)
{
	uint8_t bad[] = { 1, 0, 0, 0, 0 };
	EXPECT_THROW({ RangeDecoder rd(bad, sizeof bad); }, FormatException);
}
