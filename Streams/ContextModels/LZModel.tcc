#include "LZModel.h"

template<typename TCoder>
uint32_t LengthModel::code (TCoder &rc, uint32_t len, uint32_t posState)
{
	if (!rc.code(choice, len >= LOW_SYMBOLS))
		return codeTree(rc, low[posState], LOW_BITS, len);
	len -= LOW_SYMBOLS;
	if (!rc.code(choice2, len >= MID_SYMBOLS))
		return LOW_SYMBOLS + codeTree(rc, mid[posState], MID_BITS, len);
	return LOW_SYMBOLS + MID_SYMBOLS + codeTree(rc, high, HIGH_BITS, len - MID_SYMBOLS);
}

template<typename TCoder>
Token LZModel::codeToken (TCoder &rc, uint64_t pos, uint8_t prevByte, const Token &t)
{
	uint32_t posState = pos & (POS_STATES - 1);

	if (!rc.code(isMatch[state][posState], t.isMatch())) {
		uint8_t c = codeTree(rc, literal[prevByte >> (8 - LITERAL_CONTEXT_BITS)], 8, t.literal);
		updateLiteral();
		return Token::Literal(c);
	}

	bool rep = TCoder::Encoding && rep0 && t.distance == rep0;
	if (rc.code(isRep[state], rep)) {
		if (!rep0)
			throw FormatException("Repeat match without a previous match at position %" PRIu64, pos);
		uint32_t len = repLength.code(rc, t.length - MATCH_MIN_LEN, posState) + MATCH_MIN_LEN;
		updateRep();
		return Token::Match(rep0, len);
	}

	uint32_t len = matchLength.code(rc, t.length - MATCH_MIN_LEN, posState) + MATCH_MIN_LEN;
	uint32_t dist = codeDistance(rc, t.distance - 1, len) + 1;
	rep0 = dist;
	updateMatch();
	return Token::Match(dist, len);
}

// dist is (distance - 1)
template<typename TCoder>
uint32_t LZModel::codeDistance (TCoder &rc, uint32_t dist, uint32_t len)
{
	uint32_t lenState = std::min(len - MATCH_MIN_LEN, (uint32_t)LEN_TO_POS_STATES - 1);
	uint32_t slot = codeTree(rc, distSlot[lenState], DIST_SLOT_BITS,
		TCoder::Encoding ? getDistanceSlot(dist) : 0);
	if (slot < START_POS_MODEL_INDEX)
		return slot;

	uint32_t footerBits = (slot >> 1) - 1;
	uint32_t base = (2 | (slot & 1)) << footerBits;
	uint32_t reduced = dist - base;
	if (slot < END_POS_MODEL_INDEX)
		return base + codeReverseTree(rc, distSpecial + base - slot - 1, footerBits, reduced);

	uint32_t direct = rc.codeDirect(reduced >> ALIGN_BITS, footerBits - ALIGN_BITS);
	return base + (direct << ALIGN_BITS) + codeReverseTree(rc, distAlign, ALIGN_BITS, reduced & ALIGN_MASK);
}
