#ifndef RangeCoder_H
#define RangeCoder_H

// Binary range coder with carry propagation through a cached byte and a run
// of pending 0xFF bytes, in the style of the public LZMA format description.

#include "../Common.h"
#include "ContextModels/BitModel.h"

class RangeEncoder {
	static const uint32_t TOP = 1u << 24;

	uint64_t Low;
	uint32_t Range;

	uint8_t  rc_Cache;		// last byte not yet written, may still receive a carry
	uint64_t rc_FFNum;		// number of 0xFF bytes between rc_Cache and Low

	Array<uint8_t> *dataO;
	size_t dataStart;

private:
	void shiftLow (void);

public:
	static const bool Encoding = true;

	RangeEncoder (Array<uint8_t> *o);

public:
	void encodeBit (uint32_t prob, uint32_t bit);
	void encodeDirect (uint32_t value, int numBits);
	void flush (void);

	// bytes appended to the output so far
	size_t written (void) const
	{
		return dataO->size() - dataStart;
	}

	uint32_t code (BitModel &m, uint32_t bit)
	{
		encodeBit(m.predict(), bit);
		m.update(bit);
		return bit;
	}

	uint32_t codeDirect (uint32_t value, int numBits)
	{
		encodeDirect(value, numBits);
		return value;
	}
};

class RangeDecoder {
	static const uint32_t TOP = 1u << 24;

	uint32_t Range;
	uint32_t Code;

	const uint8_t *dataI;
	const uint8_t *dataStart;
	const uint8_t *dataEnd;

private:
	uint8_t getbyte (void);

public:
	static const bool Encoding = false;

	RangeDecoder (const uint8_t *source, size_t source_sz);

public:
	uint32_t decodeBit (uint32_t prob);
	uint32_t decodeDirect (int numBits);

	size_t consumed (void) const
	{
		return dataI - dataStart;
	}

	// a stream flushed by RangeEncoder leaves a zero code behind
	bool finished (void) const
	{
		return Code == 0;
	}

	uint32_t code (BitModel &m, uint32_t)
	{
		uint32_t bit = decodeBit(m.predict());
		m.update(bit);
		return bit;
	}

	uint32_t codeDirect (uint32_t, int numBits)
	{
		return decodeDirect(numBits);
	}
};

#endif // RangeCoder_H
