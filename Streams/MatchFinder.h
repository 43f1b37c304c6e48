#ifndef MatchFinder_H
#define MatchFinder_H

#include <vector>
#include "../Common.h"
#include "Token.h"

// Effort settings of one compression level (format version 1)
struct LevelParameters {
	int      level;
	uint32_t windowLog;
	uint32_t depth;			// hash chain candidates visited per position
	uint32_t niceLength;	// stop searching once a match this long is found
	uint32_t minLength;
	bool     lazy;

	uint32_t windowSize (void) const
	{
		return 1u << windowLog;
	}

	static LevelParameters get (int level);
	// parses a decimal level, e.g. from the command line
	static int parse (const char *text);
};

// Hash-chain search over the input buffer. Candidates come from a 3-byte
// hash chain and, for levels with 2-byte matches, a table of the last
// position of every 2-byte prefix. Every candidate is verified against the
// data, so table collisions only cost time.
class MatchFinder {
	static const uint32_t EMPTY = 0xFFFFFFFF;
	static const uint32_t HASH2_SIZE = 1u << 16;
	static const uint32_t MAX_LEN2_DISTANCE = 256;

	const uint8_t *data;
	size_t size;

	uint32_t windowSize;
	uint32_t depth;
	uint32_t niceLength;
	uint32_t minLength;

	uint32_t hashBits;
	uint32_t chainMask;
	std::vector<uint32_t> head3;
	std::vector<uint32_t> head2;
	std::vector<uint32_t> chain;

public:
	MatchFinder (const uint8_t *data, size_t size, const LevelParameters &params);

private:
	uint32_t hash3 (size_t pos) const;
	uint32_t matchLength (size_t from, size_t pos, uint32_t limit) const;

public:
	// Longest match for pos, or Literal(data[pos]) if there is none.
	// Ties go to the smallest distance. Inserts pos into the tables.
	Token find (size_t pos);
	void insert (size_t pos);
	void skip (size_t pos, size_t len);

	// length of the match at a given distance, 0 if out of the window
	uint32_t matchAt (size_t pos, uint32_t distance) const;
};

// Splits a buffer into tokens: greedy, or with one step of lazy evaluation,
// and with a preference for repeating the last match distance.
class LZParser {
	const uint8_t *data;
	size_t size;
	size_t pos;

	LevelParameters params;
	MatchFinder finder;

	Token pending;
	bool hasPending;
	uint32_t lastDistance;

public:
	LZParser (const uint8_t *data, size_t size, const LevelParameters &params);

private:
	Token preferRepeat (const Token &best, size_t at) const;

public:
	bool hasNext (void) const { return pos < size; }
	size_t position (void) const { return pos; }
	Token next (void);
};

#endif // MatchFinder_H
