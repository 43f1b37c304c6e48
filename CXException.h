#ifndef CXException_H
#define CXException_H

#include <stdio.h>
#include <stdarg.h>
#include <inttypes.h>
#include <exception>

class CXException: public std::exception {
protected:
	char msg[256];

public:
	CXException (void) { msg[0] = 0; }
	CXException (const char *s, ...) {
		va_list args;
		va_start(args, s);
		vsnprintf(msg, sizeof(msg), s, args);
		va_end(args);
	}

	const char *what (void) const throw() {
		return msg;
	}
};

// Compression level outside 0-9; raised before any output is produced
class LevelOutOfRangeException: public CXException {
	int level;

public:
	LevelOutOfRangeException (int level):
		level(level)
	{
		snprintf(msg, sizeof(msg), "Compression level %d is out of range (0-9)", level);
	}

	// text: the level as the user wrote it, reported verbatim
	LevelOutOfRangeException (int level, const char *text):
		level(level)
	{
		snprintf(msg, sizeof(msg), "Compression level %s is out of range (0-9)", text);
	}

	int getLevel (void) const { return level; }
};

// Not a CXM stream, or a payload that does not decode
class FormatException: public CXException {
public:
	FormatException (const char *s, ...) {
		va_list args;
		va_start(args, s);
		vsnprintf(msg, sizeof(msg), s, args);
		va_end(args);
	}
};

class IntegrityException: public CXException {
	uint32_t expected;
	uint32_t actual;

public:
	IntegrityException (uint32_t expected, uint32_t actual):
		expected(expected), actual(actual)
	{
		snprintf(msg, sizeof(msg), "Checksum mismatch: expected %08x, got %08x", expected, actual);
	}

	uint32_t getExpected (void) const { return expected; }
	uint32_t getActual (void) const { return actual; }
};

class TruncationException: public CXException {
	uint64_t offset;
	uint64_t expected;
	uint64_t actual;

public:
	// raised by the range decoder; lengths are filled in by the caller
	TruncationException (uint64_t offset):
		offset(offset), expected(0), actual(0)
	{
		snprintf(msg, sizeof(msg), "Compressed data ends unexpectedly at byte %" PRIu64, offset);
	}

	// offset: position in the compressed input where data ran out
	TruncationException (uint64_t offset, uint64_t expected, uint64_t actual):
		offset(offset), expected(expected), actual(actual)
	{
		snprintf(msg, sizeof(msg), "Truncated input at byte %" PRIu64 ": expected %" PRIu64 " bytes, decoded %" PRIu64,
			offset, expected, actual);
	}

	uint64_t getOffset (void) const { return offset; }
	uint64_t getExpected (void) const { return expected; }
	uint64_t getActual (void) const { return actual; }
};

class AllocationException: public CXException {
	uint64_t size;

public:
	// size: length of the buffer being processed when allocation failed
	AllocationException (uint64_t size):
		size(size)
	{
		snprintf(msg, sizeof(msg), "Cannot allocate memory while processing %" PRIu64 " bytes", size);
	}

	uint64_t getSize (void) const { return size; }
};

#endif
