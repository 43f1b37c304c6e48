#ifndef Window_H
#define Window_H

#include <cstring>
#include <algorithm>
#include <assert.h>
#include <inttypes.h>
#include <stdlib.h>

#include "Utils.h"
#include "Array.h"

// Fixed-capacity circular history of the most recent output bytes.
// Distances are counted backwards from the last written byte (1 = last byte).
class Window {
	uint8_t *_records;
	size_t _capacity;
	size_t _pos;
	size_t _size;

public:
	Window (void):
		_records(0), _capacity(0), _pos(0), _size(0)
	{
	}

	Window (size_t cap):
		_records(0), _capacity(cap), _pos(0), _size(0)
	{
		assert(_capacity > 0);
		_records = new uint8_t[_capacity];
	}

	~Window (void)
	{
		if (_records) {
			delete[] _records;
			_records = 0;
		}
	}

	Window (const Window& a):
		_records(0), _capacity(a._capacity), _pos(a._pos), _size(a._size)
	{
		if (_capacity) {
			_records = new uint8_t[_capacity];
			std::copy(a._records, a._records + _capacity, _records);
		}
	}

	Window (Window&& a): Window()
	{
		swap(*this, a);
	}

	Window& operator= (Window a)
	{
		swap(*this, a);
		return *this;
	}

	friend void swap(Window& a, Window& b) // nothrow
	{
		using std::swap;

		swap(a._records, b._records);
		swap(a._capacity, b._capacity);
		swap(a._pos, b._pos);
		swap(a._size, b._size);
	}

public:
	void add (uint8_t c)
	{
		_records[_pos] = c;
		if (++_pos == _capacity)
			_pos = 0;
		if (_size < _capacity)
			_size++;
	}

	uint8_t get (size_t distance) const
	{
		assert(distance >= 1 && distance <= _size);
		return _records[_pos >= distance ? _pos - distance : _pos + _capacity - distance];
	}

	// Appends `length` bytes starting `distance` bytes back, one byte at a time,
	// so that runs overlapping the bytes being written are reproduced.
	void copyMatch (size_t distance, size_t length, Array<uint8_t> &out)
	{
		assert(distance >= 1 && distance <= _size);
		size_t from = _pos >= distance ? _pos - distance : _pos + _capacity - distance;
		for (size_t i = 0; i < length; i++) {
			uint8_t c = _records[from];
			if (++from == _capacity)
				from = 0;
			add(c);
			out.add(c);
		}
	}

	uint8_t last (void) const
	{
		return _size ? get(1) : 0;
	}

	// available history, bounded by capacity
	size_t size (void) const
	{
		return _size;
	}
};

#endif
