#ifndef Compress_H
#define Compress_H

#include "Common.h"
#include "Stats.h"
#include "FileIO.h"

class FileCompressor {
	string inFile;
	string outFile;
	int level;

	CodecStats stats;

public:
	// outFile == "" writes to standard output
	FileCompressor (const string &inFile, const string &outFile, int level);

public:
	void compress (void);
	// compress, decompress and compare without writing anything
	void test (void);

	const CodecStats &getStats (void) const { return stats; }
};

#endif // Compress_H
