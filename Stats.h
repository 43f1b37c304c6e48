#ifndef Stats_H
#define Stats_H

#include "Common.h"
#include "Streams/Token.h"

// Token counts of one compress or decompress call
class CodecStats {
	uint64_t literals;
	uint64_t matches;
	uint64_t repMatches;
	uint64_t matchedBytes;

public:
	uint64_t originalSize;
	uint64_t compressedSize;

public:
	CodecStats (void);

public:
	void addToken (const Token &t, bool rep);

	uint64_t getLiteralCount (void) const { return literals; }
	uint64_t getMatchCount (void) const { return matches; }
	uint64_t getRepMatchCount (void) const { return repMatches; }
	uint64_t getMatchedBytes (void) const { return matchedBytes; }
	uint64_t getTokenCount (void) const { return literals + matches + repMatches; }

	// bytes covered by all tokens
	uint64_t getCoveredBytes (void) const { return literals + matchedBytes; }
	// percentage of space saved, 0 for empty input
	double getSavedPercent (void) const;
};

#endif // Stats_H
