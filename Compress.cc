#include "Compress.h"
#include "Container.h"
using namespace std;

FileCompressor::FileCompressor (const string &inFile, const string &outFile, int level): 
	inFile(inFile), outFile(outFile), level(level)
{
	if (level < 0 || level > 9)
		throw LevelOutOfRangeException(level);
}

void FileCompressor::compress (void) 
{
	ZAMAN_START(Compress);
	Array<uint8_t> in, out;
	{
		auto fi = File::Open(inFile, "rb");
		fi->readAll(in);
	}
	DEBUG("Read %s (%zu bytes)", inFile.c_str(), in.size());

	Container::compress(in.data(), in.size(), level, out, &stats);

	shared_ptr<File> fo;
	if (outFile == "")
		fo = make_shared<File>(stdout);
	else
		fo = File::Open(outFile, "wb");
	fo->write(out.data(), out.size());
	fo->close();
	ZAMAN_END(Compress);

	stats.compressedSize = out.size();
	LOG("%s: %s -> %s, %.2lf%% saved (level %d)", 
		inFile.c_str(),
		formatSize(stats.originalSize).c_str(), 
		formatSize(stats.compressedSize).c_str(), 
		stats.getSavedPercent(), level);
	DEBUG("  literals %'" PRIu64 ", matches %'" PRIu64 ", repeats %'" PRIu64 ", matched bytes %'" PRIu64,
		stats.getLiteralCount(), stats.getMatchCount(), 
		stats.getRepMatchCount(), stats.getMatchedBytes());
}

void FileCompressor::test (void)
{
	Array<uint8_t> in, out, back;
	{
		auto fi = File::Open(inFile, "rb");
		fi->readAll(in);
	}

	ZAMAN_START(Test);
	Container::compress(in.data(), in.size(), level, out, &stats);
	Container::decompress(out.data(), out.size(), back);
	ZAMAN_END(Test);

	if (back.size() != in.size() || memcmp(back.data(), in.data(), in.size()))
		throw CXException("%s: round trip failed at level %d", inFile.c_str(), level);

	stats.compressedSize = out.size();
	LOG("%s: OK, %s -> %s, %.2lf%% saved (level %d)", 
		inFile.c_str(),
		formatSize(stats.originalSize).c_str(), 
		formatSize(stats.compressedSize).c_str(), 
		stats.getSavedPercent(), level);
}
