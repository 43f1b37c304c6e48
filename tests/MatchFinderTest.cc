#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "Streams/MatchFinder.h"
using namespace std;

static vector<Token> parse (const string &s, int level)
{
	vector<Token> tokens;
	LZParser p((const uint8_t*)s.data(), s.size(), LevelParameters::get(level));
	while (p.hasNext())
		tokens.push_back(p.next());
	return tokens;
}

static string replay (const vector<Token> &tokens)
{
	string out;
	for (auto &t: tokens) {
		if (!t.isMatch()) {
			out += (char)t.literal;
			continue;
		}
		for (int i = 0; i < t.length; i++)
			out += out[out.size() - t.distance];
	}
	return out;
}

TEST(MatchFinderTest, LevelTable)
{
	EXPECT_EQ(16u, LevelParameters::get(0).windowLog);
	EXPECT_EQ(3u, LevelParameters::get(0).minLength);
	EXPECT_FALSE(LevelParameters::get(2).lazy);
	EXPECT_TRUE(LevelParameters::get(3).lazy);
	EXPECT_EQ(2u, LevelParameters::get(9).minLength);
	EXPECT_EQ(1u << 26, LevelParameters::get(9).windowSize());
	EXPECT_THROW(LevelParameters::get(-1), LevelOutOfRangeException);
	EXPECT_THROW(LevelParameters::get(10), LevelOutOfRangeException);
}

TEST(MatchFinderTest, ParsesLevelText)
{
	EXPECT_EQ(0, LevelParameters::parse("0"));
	EXPECT_EQ(7, LevelParameters::parse("7"));
	EXPECT_THROW(LevelParameters::parse(""), CXException);
	EXPECT_THROW(LevelParameters::parse("fast"), CXException);
	EXPECT_THROW(LevelParameters::parse("3x"), CXException);

	try {
		LevelParameters::parse("99999999999");
		FAIL() << "level accepted";
	} catch (LevelOutOfRangeException &e) {
		EXPECT_TRUE(strstr(e.what(), "99999999999") != 0);
		EXPECT_GT(e.getLevel(), 9);
	}
	try {
		LevelParameters::parse("-3");
		FAIL() << "level accepted";
	} catch (LevelOutOfRangeException &e) {
		EXPECT_EQ(-3, e.getLevel());
	}
}

TEST(MatchFinderTest, LongestCandidateWins)
{
	string s = "abcdXabcdeYabcdeZ";
	MatchFinder f((const uint8_t*)s.data(), s.size(), LevelParameters::get(5));
	f.skip(0, 11);
	Token t = f.find(11);
	ASSERT_TRUE(t.isMatch());
	EXPECT_EQ(6u, t.distance);
	EXPECT_EQ(5u, t.length);
}

TEST(MatchFinderTest, TiesGoToSmallestDistance)
{
	string s = "abcXabcYabcZ";
	MatchFinder f((const uint8_t*)s.data(), s.size(), LevelParameters::get(5));
	f.skip(0, 8);
	Token t = f.find(8);
	ASSERT_TRUE(t.isMatch());
	EXPECT_EQ(4u, t.distance);
	EXPECT_EQ(3u, t.length);
}

TEST(MatchFinderTest, OverlappingRun)
{
	string s(100, 'z');
	auto tokens = parse(s, 1);
	ASSERT_EQ(2u, tokens.size());
	EXPECT_EQ(Token::Literal('z'), tokens[0]);
	EXPECT_EQ(Token::Match(1, 99), tokens[1]);
}

TEST(MatchFinderTest, MatchLengthIsCapped)
{
	string s(1000, 'q');
	for (auto &t: parse(s, 9))
		EXPECT_LE(t.length, MATCH_MAX_LEN);
	EXPECT_EQ(s, replay(parse(s, 9)));
}

TEST(MatchFinderTest, MinimumLengthBoundary)
{
	auto t = parse("aab", 0);
	ASSERT_EQ(3u, t.size());
	for (auto &x: t)
		EXPECT_FALSE(x.isMatch());

	t = parse("aaaa", 0);
	ASSERT_EQ(2u, t.size());
	EXPECT_EQ(Token::Match(1, 3), t[1]);

	t = parse("aab", 9);
	ASSERT_EQ(3u, t.size());
	for (auto &x: t)
		EXPECT_FALSE(x.isMatch());

	t = parse("aaa", 9);
	ASSERT_EQ(2u, t.size());
	EXPECT_EQ(Token::Match(1, 2), t[1]);
}

TEST(MatchFinderTest, WindowLimitIsRespected)
{
	// level 0 keeps 64 KiB of history
	string block;
	for (int i = 0; i < 64; i++)
		block += (char)('A' + (i * 7) % 26);
	string filler;
	uint32_t x = 12345;
	while (filler.size() < 70000) {
		x = x * 1103515245 + 12345;
		filler += (char)(x >> 24);
	}
	string s = block + filler + block;
	uint32_t window = LevelParameters::get(0).windowSize();
	for (auto &t: parse(s, 0))
		if (t.isMatch())
			EXPECT_LE(t.distance, window);
	EXPECT_EQ(s, replay(parse(s, 0)));
}

TEST(MatchFinderTest, ParsersReproduceInput)
{
	string s;
	for (int i = 0; i < 2000; i++)
		s += "the quick brown fox " + to_string(i % 37) + " jumps; ";
	for (int level = 0; level <= 9; level++) {
		auto tokens = parse(s, level);
		EXPECT_EQ(s, replay(tokens)) << "level " << level;
		EXPECT_LT(tokens.size(), s.size() / 4) << "level " << level;
	}
}
