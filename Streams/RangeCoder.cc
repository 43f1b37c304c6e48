#include "RangeCoder.h"

RangeEncoder::RangeEncoder (Array<uint8_t> *o):
	Low(0), Range(0xFFFFFFFF), rc_Cache(0), rc_FFNum(0), dataO(o)
{
	dataStart = dataO->size();
}

void RangeEncoder::shiftLow (void)
{
	if ((uint32_t)Low < 0xFF000000u || (Low >> 32) != 0) {
		uint8_t rc_Carry = Low >> 32;
		dataO->add(rc_Cache + rc_Carry);
		for (; rc_FFNum > 0; rc_FFNum--)
			dataO->add(0xFF + rc_Carry);
		rc_Cache = (Low >> 24) & 0xFF;
	}
	else rc_FFNum++;
	Low = (Low & 0x00FFFFFF) << 8;
}

void RangeEncoder::encodeBit (uint32_t prob, uint32_t bit)
{
	assert(prob > 0 && prob < BitModel::TOTAL);
	uint32_t bound = (Range >> BitModel::NUM_BITS) * prob;
	if (!bit) {
		Range = bound;
	} else {
		Low += bound;
		Range -= bound;
	}
	while (Range < TOP) {
		Range <<= 8;
		shiftLow();
	}
}

void RangeEncoder::encodeDirect (uint32_t value, int numBits)
{
	for (int i = numBits - 1; i >= 0; i--) {
		Range >>= 1;
		if ((value >> i) & 1)
			Low += Range;
		while (Range < TOP) {
			Range <<= 8;
			shiftLow();
		}
	}
}

void RangeEncoder::flush (void)
{
	REPEAT(5) shiftLow();
}

RangeDecoder::RangeDecoder (const uint8_t *source, size_t source_sz):
	Range(0xFFFFFFFF), Code(0), dataI(source), dataStart(source), dataEnd(source + source_sz)
{
	if (getbyte() != 0)
		throw FormatException("Corrupted range coder stream: non-zero lead byte");
	REPEAT(4) Code = (Code << 8) | getbyte();
	if (Code == Range)
		throw FormatException("Corrupted range coder stream: invalid initial code");
}

uint8_t RangeDecoder::getbyte (void)
{
	if (dataI == dataEnd)
		throw TruncationException(consumed());
	return *dataI++;
}

uint32_t RangeDecoder::decodeBit (uint32_t prob)
{
	uint32_t bound = (Range >> BitModel::NUM_BITS) * prob;
	uint32_t bit;
	if (Code < bound) {
		Range = bound;
		bit = 0;
	} else {
		Code -= bound;
		Range -= bound;
		bit = 1;
	}
	if (Range < TOP) {
		Range <<= 8;
		Code = (Code << 8) | getbyte();
	}
	return bit;
}

uint32_t RangeDecoder::decodeDirect (int numBits)
{
	uint32_t res = 0;
	for (int i = 0; i < numBits; i++) {
		Range >>= 1;
		Code -= Range;
		uint32_t t = 0 - (Code >> 31); // all ones if Code went below zero
		Code += Range & t;
		if (Code == Range)
			throw FormatException("Corrupted range coder stream at byte %zu", consumed());
		if (Range < TOP) {
			Range <<= 8;
			Code = (Code << 8) | getbyte();
		}
		res = (res << 1) + (t + 1);
	}
	return res;
}
