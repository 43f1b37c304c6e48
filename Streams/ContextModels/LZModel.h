#ifndef LZModel_H
#define LZModel_H

#include "../../Common.h"
#include "../Token.h"
#include "BitModel.h"

// Match length, coded as (length - MATCH_MIN_LEN):
// 0-7 in low[posState], 8-15 in mid[posState], 16-271 in high
class LengthModel {
public:
	static const int POS_STATES = 4;
	static const int LOW_BITS = 3;
	static const int MID_BITS = 3;
	static const int HIGH_BITS = 8;
	static const uint32_t LOW_SYMBOLS = 1u << LOW_BITS;
	static const uint32_t MID_SYMBOLS = 1u << MID_BITS;

private:
	BitModel choice;
	BitModel choice2;
	BitModel low[POS_STATES][1 << LOW_BITS];
	BitModel mid[POS_STATES][1 << MID_BITS];
	BitModel high[1 << HIGH_BITS];

public:
	template<typename TCoder>
	uint32_t code (TCoder &rc, uint32_t len, uint32_t posState);
};

// All adaptive contexts of one LZRC stream. codeToken() is the only place
// where contexts are selected; the encoder and the decoder both run it, so
// both sides update the same models in the same order.
class LZModel {
public:
	static const int NUM_STATES = 12;
	static const int POS_BITS = 2;
	static const int POS_STATES = 1 << POS_BITS;
	static const int LITERAL_CONTEXT_BITS = 3;

	static const int LEN_TO_POS_STATES = 4;
	static const int DIST_SLOT_BITS = 6;
	static const uint32_t START_POS_MODEL_INDEX = 4;
	static const uint32_t END_POS_MODEL_INDEX = 14;
	static const uint32_t FULL_DISTANCES = 1u << (END_POS_MODEL_INDEX >> 1);
	static const int ALIGN_BITS = 4;
	static const uint32_t ALIGN_MASK = (1u << ALIGN_BITS) - 1;

private:
	BitModel isMatch[NUM_STATES][POS_STATES];
	BitModel isRep[NUM_STATES];
	BitModel literal[1 << LITERAL_CONTEXT_BITS][0x100];
	LengthModel matchLength;
	LengthModel repLength;
	BitModel distSlot[LEN_TO_POS_STATES][1 << DIST_SLOT_BITS];
	BitModel distSpecial[FULL_DISTANCES - END_POS_MODEL_INDEX];
	BitModel distAlign[1 << ALIGN_BITS];

	uint32_t state;
	uint32_t rep0;	// distance of the last match, 0 before the first one

public:
	LZModel (void);

public:
	// Encoder: codes t and returns it. Decoder: ignores t and returns the
	// decoded token. pos is the uncompressed position of the token,
	// prevByte the byte just before it (0 at the start).
	template<typename TCoder>
	Token codeToken (TCoder &rc, uint64_t pos, uint8_t prevByte, const Token &t);

	uint32_t getRep0 (void) const { return rep0; }

	static uint32_t getDistanceSlot (uint32_t dist);

private:
	template<typename TCoder>
	uint32_t codeDistance (TCoder &rc, uint32_t dist, uint32_t len);

	void updateLiteral (void);
	void updateMatch (void);
	void updateRep (void);
};

#include "LZModel.tcc"

#endif // LZModel_H
