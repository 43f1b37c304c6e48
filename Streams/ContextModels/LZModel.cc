#include "LZModel.h"

LZModel::LZModel (void):
	state(0), rep0(0)
{
}

uint32_t LZModel::getDistanceSlot (uint32_t dist)
{
	if (dist < START_POS_MODEL_INDEX)
		return dist;
	uint32_t n = 31 - __builtin_clz(dist);
	return (n << 1) | ((dist >> (n - 1)) & 1);
}

// 0-6: last token was a literal, 7-11: last token was a match or repeat
void LZModel::updateLiteral (void)
{
	if (state < 4) state = 0;
	else if (state < 10) state -= 3;
	else state -= 6;
}

void LZModel::updateMatch (void)
{
	state = state < 7 ? 7 : 10;
}

void LZModel::updateRep (void)
{
	state = state < 7 ? 8 : 11;
}
