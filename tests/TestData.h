#ifndef TestData_H
#define TestData_H

#include <string>
#include <vector>
#include <stdio.h>
#include <inttypes.h>

// Deterministic inputs shared by the codec tests
inline std::vector<uint8_t> randomBytes (size_t n, uint32_t seed)
{
	std::vector<uint8_t> v(n);
	uint32_t x = seed;
	for (auto &c: v) {
		x = x * 1103515245 + 12345;
		c = x >> 24;
	}
	return v;
}

inline std::vector<uint8_t> textBytes (size_t n)
{
	static const char *words[] = {
		"range", "coder", "window", "match", "literal", "distance",
		"length", "context", "model", "stream", "header", "level"
	};
	std::string s;
	uint32_t x = 42;
	while (s.size() < n) {
		x = x * 1103515245 + 12345;
		s += words[(x >> 16) % 12];
		s += (x & 0x100) ? ", " : " ";
	}
	s.resize(n);
	return std::vector<uint8_t>(s.begin(), s.end());
}

// repeated records with small mutations
inline std::vector<uint8_t> structuredBytes (size_t n)
{
	std::vector<uint8_t> v;
	uint32_t id = 0;
	while (v.size() < n) {
		char rec[64];
		int len = snprintf(rec, sizeof rec, "{\"id\":%u,\"flag\":%s,\"v\":%u}\n", id, id % 3 ? "true" : "false", (id * 37) % 1000);
		v.insert(v.end(), rec, rec + len);
		id++;
	}
	v.resize(n);
	return v;
}

#endif // TestData_H
