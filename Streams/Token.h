#ifndef Token_H
#define Token_H

#include <inttypes.h>

static const uint32_t MATCH_MIN_LEN = 2;
static const uint32_t MATCH_MAX_LEN = 273;

struct Token {
	enum Type: uint8_t { LITERAL, MATCH };

	Type     type;
	uint8_t  literal;
	uint16_t length;
	uint32_t distance;

	Token (void):
		type(LITERAL), literal(0), length(0), distance(0)
	{
	}

	static Token Literal (uint8_t c)
	{
		Token t;
		t.literal = c;
		t.length = 1;
		return t;
	}

	static Token Match (uint32_t distance, uint32_t length)
	{
		Token t;
		t.type = MATCH;
		t.distance = distance;
		t.length = length;
		return t;
	}

	bool isMatch (void) const
	{
		return type == MATCH;
	}

	bool operator== (const Token &t) const
	{
		if (type != t.type) return false;
		if (type == LITERAL) return literal == t.literal;
		return distance == t.distance && length == t.length;
	}
};

#endif // Token_H
