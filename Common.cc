#include "Common.h"
#include <stdlib.h>
#include <stdarg.h>
using namespace std;

#ifdef ZAMAN
	thread_local __zaman__ __zaman_thread__;
	std::map<std::string, uint64_t> __zaman__::times_global;
	std::string __zaman__::prefix_global;
	std::mutex __zaman__::mtx;
#endif

int optLogLevel = 1;

string S (const char* fmt, ...)
{
	char *ptr = 0;
	va_list args;
	va_start(args, fmt);
	int r = vasprintf(&ptr, fmt, args);
	va_end(args);
	if (r < 0)
		throw AllocationException(0);
	string s = ptr;
	free(ptr);
	return s;
}

string formatSize (uint64_t size)
{
	static const char *units[] = { "B", "KB", "MB", "GB", "TB" };
	double sz = size;
	for (int i = 0; i < 5; i++) {
		if (sz < 1024.0)
			return S("%.2lf %s", sz, units[i]);
		sz /= 1024.0;
	}
	return S("%.2lf PB", sz);
}

void writeLE (uint64_t num, int bytes, Array<uint8_t> &o)
{
	REPEAT(bytes) o.add(num & 0xff), num >>= 8;
}

uint64_t readLE (const uint8_t *in, int bytes)
{
	uint64_t e = 0;
	REPEAT(bytes) e |= (uint64_t)(in[_]) << (8 * _);
	return e;
}
