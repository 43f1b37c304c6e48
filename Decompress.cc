#include "Decompress.h"
#include "Container.h"
using namespace std;

bool FileDecompressor::isCXMFile (const string &path)
{
	auto fi = File::Open(path, "rb");
	if (fi->size() < 4)
		return false;
	return fi->readU32() == MAGIC;
}

void FileDecompressor::printStats (const string &path) 
{
	auto fi = File::Open(path, "rb");
	size_t inFileSz = fi->size();

	uint8_t buf[ContainerHeader::SIZE];
	ssize_t got = fi->read(buf, min(inFileSz, sizeof buf));
	if (got < 0)
		throw CXException("Cannot read %s", path.c_str());
	ContainerHeader h = Container::readHeader(buf, got);

	SCREEN("File:              %s\n", path.c_str());
	SCREEN("Format version:    %d\n", h.version);
	SCREEN("Compression level: %d\n", h.level);
	SCREEN("Original size:     %s (%'" PRIu64 " bytes)\n", formatSize(h.originalLength).c_str(), h.originalLength);
	SCREEN("Compressed size:   %s (%'zu bytes)\n", formatSize(inFileSz).c_str(), inFileSz);
	SCREEN("CRC-32:            %08x\n", h.checksum);
	if (h.originalLength)
		SCREEN("Space saved:       %.2lf%%\n", (1.0 - double(inFileSz) / h.originalLength) * 100.0);
}

FileDecompressor::FileDecompressor (const string &inFile, const string &outFile): 
	inFile(inFile), outFile(outFile)
{
}

void FileDecompressor::decompress (void) 
{
	ZAMAN_START(Decompress);
	Array<uint8_t> in, out;
	{
		auto fi = File::Open(inFile, "rb");
		fi->readAll(in);
	}
	DEBUG("Read %s (%zu bytes)", inFile.c_str(), in.size());

	ContainerHeader h;
	Container::decompress(in.data(), in.size(), out, &h, &stats);

	shared_ptr<File> fo;
	if (outFile == "")
		fo = make_shared<File>(stdout);
	else
		fo = File::Open(outFile, "wb");
	fo->write(out.data(), out.size());
	fo->close();
	ZAMAN_END(Decompress);

	stats.originalSize = out.size();
	stats.compressedSize = in.size();
	LOG("%s: %s -> %s (level %d)", 
		inFile.c_str(),
		formatSize(stats.compressedSize).c_str(), 
		formatSize(stats.originalSize).c_str(), 
		h.level);
}
