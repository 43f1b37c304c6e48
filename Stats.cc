#include "Stats.h"
using namespace std;

CodecStats::CodecStats (void):
	literals(0), matches(0), repMatches(0), matchedBytes(0),
	originalSize(0), compressedSize(0)
{
}

void CodecStats::addToken (const Token &t, bool rep)
{
	if (!t.isMatch()) {
		literals++;
		return;
	}
	if (rep) repMatches++;
	else matches++;
	matchedBytes += t.length;
}

double CodecStats::getSavedPercent (void) const
{
	if (!originalSize)
		return 0;
	return (1.0 - double(compressedSize) / originalSize) * 100.0;
}
