#include <string>
#include <future>
#include <stdio.h>
#include <locale.h>
#include <getopt.h>
#include <curl/curl.h>
#include <ctpl.h>

#include "Common.h"
#include "Compress.h"
#include "Decompress.h"
#include "FileIO.h"
#include "Streams/MatchFinder.h"
using namespace std;

enum Mode { AUTO, COMPRESS, DECOMPRESS };

Mode optMode    = AUTO;
bool optTest 	= false;
bool optForce 	= false;
bool optStdout  = false;
bool optStats   = false;
vector<string> optInput;
string optOutput = "";
int optLevel    = 9;
int optThreads  = 4;

void printUsage (void)
{
	WARN("Compression:   cxm compress [input]... (-o [output]) (-l [0-9])");
	WARN("Decompression: cxm decompress [input.cxm]... (-o [output])");
	WARN("Without a command, .cxm inputs are decompressed and everything else is compressed.");
	WARN("Options:");
	WARN("  -o, --output     output file (single input only)");
	WARN("  -l, --level      compression level 0-9 (default 9)");
	WARN("  -c, --stdout     write to standard output");
	WARN("  -!, --force      overwrite existing files");
	WARN("  -t, --threads    number of files processed in parallel (default 4)");
	WARN("  -v, --verbosity  0 quiet, 1 report, 2 debug (default 1)");
	WARN("  -T, --test       compress, decompress and compare in memory");
	WARN("  -S, --stats      print the header of a .cxm file");
}

void parseArguments (int argc, char **argv) 
{
	int opt; 
	struct option long_opt[] = {
		{ "help",        0, NULL, 'h' },
		{ "force",       0, NULL, '!' },
		{ "test",        0, NULL, 'T' },
		{ "threads",     1, NULL, 't' },
		{ "stdout",      0, NULL, 'c' },
		{ "output",      1, NULL, 'o' },
		{ "level",       1, NULL, 'l' },
		{ "stats",       0, NULL, 'S' },
		{ "verbosity",   1, NULL, 'v' },
		{ NULL, 0, NULL, 0 }
	};
	const char *short_opt = "ht:T!co:l:Sv:";
	do {
		opt = getopt_long (argc, argv, short_opt, long_opt, NULL);
		switch (opt) {
			case 'h':
				printUsage();
				exit(0);
			case 'T':
				optTest = true;
				break;
			case 't':
				optThreads = atoi(optarg);
				if (optThreads < 1)
					throw CXException("Invalid number of threads %s", optarg);
				break;
			case 'v':
				optLogLevel = atoi(optarg);
				break;
			case '!':
				optForce = true;
				break;
			case 'c':
				optStdout = true;
				break;
			case 'o':
				optOutput = optarg;
				break;
			case 'l':
				optLevel = LevelParameters::parse(optarg);
				break;
			case 'S':
				optStats = true;
				break;
			case -1:
				break;
			default: 
				printUsage();
				exit(1);
		}
	} while (opt != -1);

	if (optind < argc && !strcmp(argv[optind], "compress"))
		optMode = COMPRESS, optind++;
	else if (optind < argc && !strcmp(argv[optind], "decompress"))
		optMode = DECOMPRESS, optind++;
	while (optind < argc)
		optInput.push_back(argv[optind++]);
}

bool endsWith (const string &s, const string &suffix)
{
	return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

string outputName (const string &in, bool isCompress)
{
	if (optStdout)
		return "";
	if (optOutput != "")
		return optOutput;

	string base = in;
	// web inputs are written to the current directory
	if (File::IsWeb(base)) {
		size_t p = base.find_last_of('/');
		base = base.substr(p + 1);
		if (base == "")
			base = "index";
	}
	if (isCompress)
		return base + ".cxm";
	if (endsWith(base, ".cxm"))
		return base.substr(0, base.size() - 4);
	return base + ".decompressed";
}

void checkOutput (const string &out)
{
	if (out == "")
		return;
	if (File::IsWeb(out))
		throw CXException("Web locations are not supported as output");
	if (File::Exists(out)) {
		if (!optForce) {
			throw CXException("File %s already exists. Use -! to overwrite", out.c_str());
		} else {
			WARN("File %s already exists. Overwriting it.", out.c_str());
		}
	}
}

void process (const string &in) 
{
	if (!File::Exists(in))
		throw CXException("File %s does not exist", in.c_str());

	bool isCXM = FileDecompressor::isCXMFile(in);
	if (optStats) {
		if (!isCXM)
			throw CXException("File %s is not a CXM file", in.c_str());
		FileDecompressor::printStats(in);
		return;
	}
	if (optTest) {
		FileCompressor(in, "", optLevel).test();
		return;
	}

	bool isCompress = (optMode == COMPRESS) || (optMode == AUTO && !isCXM);
	string out = outputName(in, isCompress);
	checkOutput(out);
	DEBUG("%s %s to %s ...", isCompress ? "Compressing" : "Decompressing", 
		in.c_str(), out == "" ? "stdout" : out.c_str());

	if (isCompress) {
		FileCompressor sc(in, out, optLevel);
		sc.compress();
	} else {
		FileDecompressor sd(in, out);
		sd.decompress();
	}
}

int main (int argc, char **argv) 
{
	curl_global_init(CURL_GLOBAL_ALL);
	setlocale(LC_ALL, "");

	int errors = 0;
	try {
		parseArguments(argc, argv);
		if (!optInput.size())
			throw CXException("Input not specified. Please run cxm --help for explanation");
		if (optInput.size() > 1 && optOutput != "")
			throw CXException("Option -o can be used with a single input only");
		if (optInput.size() > 1 && optStdout)
			throw CXException("Option -c can be used with a single input only");

		ctpl::thread_pool pool(min((size_t)optThreads, optInput.size()));
		vector<future<void>> jobs;
		for (auto &in: optInput) 
			jobs.push_back(pool.push([in](int id) {
				process(in);
				ZAMAN_THREAD_JOIN();
			}));
		for (size_t i = 0; i < jobs.size(); i++) {
			try {
				jobs[i].get();
			} catch (CXException &e) {
				ERROR("cxm error: %s", e.what());
				errors++;
			} catch (exception &e) {
				ERROR("cxm error: %s: %s", optInput[i].c_str(), e.what());
				errors++;
			}
		}
	} catch (CXException &e) {
		ERROR("cxm error: %s", e.what());
		errors++;
	} catch (exception &e) {
		ERROR("cxm error: %s", e.what());
		errors++;
	}
	curl_global_cleanup();

	#ifdef ZAMAN
		LOG("\nTime usage:");
		ZAMAN_REPORT();
	#endif
	return errors ? 1 : 0;
}
