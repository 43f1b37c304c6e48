#ifndef BitModel_H
#define BitModel_H

#include "../../Common.h"

// Adaptive estimate of P(bit = 0) in 1/2048 units
struct BitModel {
	static const int      NUM_BITS = 11;
	static const uint32_t TOTAL = 1u << NUM_BITS;
	static const int      MOVE_BITS = 5;

	uint16_t prob;

	BitModel (void):
		prob(TOTAL / 2)
	{
	}

	uint32_t predict (void) const
	{
		return prob;
	}

	void update (uint32_t bit)
	{
		if (bit)
			prob -= prob >> MOVE_BITS;
		else
			prob += (TOTAL - prob) >> MOVE_BITS;
	}
};

// Bit-tree helpers shared by encoder and decoder. TCoder::code() codes the
// given bit when encoding and ignores it when decoding; in both cases it
// returns the bit that was actually coded.

// MSB first; probs holds 1 << numBits models (index 0 unused)
template<typename TCoder>
uint32_t codeTree (TCoder &rc, BitModel *probs, int numBits, uint32_t symbol)
{
	uint32_t m = 1;
	for (int i = numBits - 1; i >= 0; i--)
		m = (m << 1) | rc.code(probs[m], (symbol >> i) & 1);
	return m - (1u << numBits);
}

// LSB first
template<typename TCoder>
uint32_t codeReverseTree (TCoder &rc, BitModel *probs, int numBits, uint32_t symbol)
{
	uint32_t m = 1, result = 0;
	for (int i = 0; i < numBits; i++) {
		uint32_t bit = rc.code(probs[m], (symbol >> i) & 1);
		m = (m << 1) | bit;
		result |= bit << i;
	}
	return result;
}

#endif // BitModel_H
