#include <errno.h>
#include <limits.h>
#include <stdlib.h>
#include "MatchFinder.h"
using namespace std;

const uint32_t MatchFinder::EMPTY;

LevelParameters LevelParameters::get (int level)
{
	static const LevelParameters levels[10] = {
	//	  lvl  win  depth  nice  min  lazy
		{ 0,   16,     4,   16,   3,  false },
		{ 1,   18,     8,   32,   3,  false },
		{ 2,   20,    16,   48,   3,  false },
		{ 3,   21,    24,   64,   3,  true  },
		{ 4,   22,    32,   64,   3,  true  },
		{ 5,   23,    48,   96,   3,  true  },
		{ 6,   23,    64,  128,   2,  true  },
		{ 7,   24,   128,  192,   2,  true  },
		{ 8,   25,   256,  273,   2,  true  },
		{ 9,   26,  1024,  273,   2,  true  },
	};
	if (level < 0 || level > 9)
		throw LevelOutOfRangeException(level);
	return levels[level];
}

int LevelParameters::parse (const char *text)
{
	char *end;
	errno = 0;
	long l = strtol(text, &end, 10);
	if (end == text || *end)
		throw CXException("Invalid compression level %s", text);
	if (errno == ERANGE || l < 0 || l > 9)
		throw LevelOutOfRangeException(max((long)INT_MIN, min((long)INT_MAX, l)), text);
	return l;
}

MatchFinder::MatchFinder (const uint8_t *data, size_t size, const LevelParameters &params):
	data(data), size(size),
	windowSize(params.windowSize()),
	depth(params.depth),
	niceLength(params.niceLength),
	minLength(params.minLength)
{
	hashBits = min(params.windowLog, 20u);
	while (hashBits > 12 && (1ull << (hashBits - 2)) > size)
		hashBits--;
	head3.assign(1u << hashBits, EMPTY);
	if (minLength <= 2)
		head2.assign(HASH2_SIZE, EMPTY);

	// positions closer than the chain size never share a slot
	uint64_t needed = max((uint64_t)1, min((uint64_t)windowSize, (uint64_t)size));
	uint64_t chainSize = 1;
	while (chainSize < needed)
		chainSize <<= 1;
	chain.assign(chainSize, EMPTY);
	chainMask = chainSize - 1;
}

uint32_t MatchFinder::hash3 (size_t pos) const
{
	uint32_t v = (data[pos] << 16) | (data[pos + 1] << 8) | data[pos + 2];
	return (v * 2654435761u) >> (32 - hashBits);
}

uint32_t MatchFinder::matchLength (size_t from, size_t pos, uint32_t limit) const
{
	uint32_t len = 0;
	while (len < limit && data[from + len] == data[pos + len])
		len++;
	return len;
}

void MatchFinder::insert (size_t pos)
{
	if (minLength <= 2 && pos + 2 <= size)
		head2[data[pos] | (data[pos + 1] << 8)] = (uint32_t)pos;
	if (pos + 3 <= size) {
		uint32_t h = hash3(pos);
		chain[pos & chainMask] = head3[h];
		head3[h] = (uint32_t)pos;
	}
}

void MatchFinder::skip (size_t pos, size_t len)
{
	for (size_t i = pos; i < pos + len; i++)
		insert(i);
}

uint32_t MatchFinder::matchAt (size_t pos, uint32_t distance) const
{
	if (distance == 0 || distance > pos || distance > windowSize || pos >= size)
		return 0;
	uint32_t limit = min((uint64_t)MATCH_MAX_LEN, (uint64_t)(size - pos));
	return matchLength(pos - distance, pos, limit);
}

Token MatchFinder::find (size_t pos)
{
	Token best = Token::Literal(data[pos]);
	uint32_t bestLen = minLength - 1;
	uint32_t limit = min((uint64_t)MATCH_MAX_LEN, (uint64_t)(size - pos));
	if (limit < minLength) {
		insert(pos);
		return best;
	}

	if (minLength <= 2) {
		uint32_t cand = head2[data[pos] | (data[pos + 1] << 8)];
		uint32_t dist = (uint32_t)pos - cand;
		if (cand != EMPTY && dist >= 1 && dist <= MAX_LEN2_DISTANCE && dist <= pos) {
			uint32_t len = matchLength(pos - dist, pos, limit);
			if (len > bestLen) {
				bestLen = len;
				best = Token::Match(dist, len);
			}
		}
	}

	if (pos + 3 <= size && bestLen < limit && bestLen < niceLength) {
		uint32_t cand = head3[hash3(pos)];
		uint32_t prevDist = 0;
		for (uint32_t n = depth; n > 0 && cand != EMPTY; n--) {
			uint32_t dist = (uint32_t)pos - cand;
			// chains only go backwards; anything else is a stale slot
			if (dist <= prevDist || dist > windowSize || dist > pos)
				break;
			prevDist = dist;

			size_t from = pos - dist;
			if (data[from + bestLen] == data[pos + bestLen]) {
				uint32_t len = matchLength(from, pos, limit);
				if (len > bestLen) {
					bestLen = len;
					best = Token::Match(dist, len);
					if (len >= niceLength || len >= limit)
						break;
				}
			}
			cand = chain[from & chainMask];
		}
	}

	// a far 2-byte match costs more than two literals
	if (best.isMatch() && best.length == 2 && best.distance > MAX_LEN2_DISTANCE)
		best = Token::Literal(data[pos]);

	insert(pos);
	return best;
}

LZParser::LZParser (const uint8_t *data, size_t size, const LevelParameters &params):
	data(data), size(size), pos(0),
	params(params),
	finder(data, size, params),
	hasPending(false),
	lastDistance(0)
{
}

Token LZParser::preferRepeat (const Token &best, size_t at) const
{
	if (!lastDistance)
		return best;
	uint32_t repLen = finder.matchAt(at, lastDistance);
	if (repLen < params.minLength)
		return best;
	if (!best.isMatch() || repLen + 1 >= best.length)
		return Token::Match(lastDistance, repLen);
	return best;
}

Token LZParser::next (void)
{
	assert(hasNext());
	Token cur = hasPending ? pending : finder.find(pos);
	hasPending = false;
	cur = preferRepeat(cur, pos);

	if (!cur.isMatch()) {
		pos++;
		return cur;
	}

	if (params.lazy && cur.length < params.niceLength && pos + 1 < size) {
		Token later = preferRepeat(finder.find(pos + 1), pos + 1);
		if (later.isMatch() && later.length > cur.length) {
			pending = later;
			hasPending = true;
			return Token::Literal(data[pos++]);
		}
		finder.skip(pos + 2, cur.length - 2);
	} else {
		finder.skip(pos + 1, cur.length - 1);
	}
	pos += cur.length;
	lastDistance = cur.distance;
	return cur;
}
