#ifndef Decompress_H
#define Decompress_H

#include "Common.h"
#include "Stats.h"
#include "FileIO.h"

class FileDecompressor {
	string inFile;
	string outFile;

	CodecStats stats;

public:
	// outFile == "" writes to standard output
	FileDecompressor (const string &inFile, const string &outFile);

public:
	void decompress (void);
	const CodecStats &getStats (void) const { return stats; }

public:
	// prints the container header of path
	static void printStats (const string &path);
	// true if path starts with the CXM magic
	static bool isCXMFile (const string &path);
};

#endif // Decompress_H
