#include <new>
#include <stdlib.h>
#include <gtest/gtest.h>
#include "Container.h"
#include "TestData.h"
using namespace std;

// Array and Window allocate with new[]; refuse blocks above the limit
static size_t arrayLimit = 0;

void *operator new[] (size_t size)
{
	if (arrayLimit && size > arrayLimit)
		throw bad_alloc();
	void *p = malloc(size ? size : 1);
	if (!p)
		throw bad_alloc();
	return p;
}

void operator delete[] (void *p) noexcept
{
	free(p);
}

class ArrayLimit {
public:
	ArrayLimit (size_t limit) { arrayLimit = limit; }
	~ArrayLimit (void) { arrayLimit = 0; }
};

TEST(AllocationTest, CompressMapsBadAlloc)
{
	auto in = textBytes(4 * MB);
	Array<uint8_t> out;
	ArrayLimit limit(MB);
	try {
		Container::compress(in.data(), in.size(), 5, out);
		FAIL() << "allocation did not fail";
	} catch (AllocationException &e) {
		EXPECT_EQ(in.size(), e.getSize());
	}
	EXPECT_EQ(0u, out.size());
}

TEST(AllocationTest, DecompressMapsBadAlloc)
{
	auto in = structuredBytes(4 * MB);
	Array<uint8_t> packed, out;
	Container::compress(in.data(), in.size(), 5, packed);

	ArrayLimit limit(MB);
	try {
		Container::decompress(packed.data(), packed.size(), out);
		FAIL() << "allocation did not fail";
	} catch (AllocationException &e) {
		EXPECT_EQ(in.size(), e.getSize());
	}
	EXPECT_EQ(0u, out.size());
}

TEST(AllocationTest, SmallCallsUnaffected)
{
	auto in = textBytes(10000);
	Array<uint8_t> packed, out;
	ArrayLimit limit(MB);
	Container::compress(in.data(), in.size(), 9, packed);
	Container::decompress(packed.data(), packed.size(), out);
	EXPECT_EQ(in, vector<uint8_t>(out.begin(), out.end()));
}
