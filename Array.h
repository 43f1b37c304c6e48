#ifndef Array_H
#define Array_H

#include <cstring>
#include <algorithm>
#include <assert.h>
#include <inttypes.h>
#include <stdlib.h>

#include "Utils.h"

// Growable buffer. Capacity at least doubles on overflow so that
// byte-by-byte appends stay amortized constant.
template<class T>
class Array {
	T 		*_records;
	size_t  _size;
	size_t  _capacity;
	size_t 	_extend;

public:
	Array (void):
		_records(0), _size(0), _capacity(0), _extend(100)
	{
	}

	~Array (void)
	{
		if (_records) {
			delete[] _records;
			_records = 0;
		}
	}

	Array (const Array& a):
		_records(0), _size(a._size), _capacity(a._capacity), _extend(a._extend)
	{
		if (_capacity) {
			_records = new T[_capacity];
			std::copy(a._records, a._records + a._size, _records);
		}
	}

	Array(Array&& a): Array()
	{
		swap(*this, a);
	}

	Array& operator= (Array a)
	{
		swap(*this, a);
		return *this;
	}

	friend void swap(Array& a, Array& b) // nothrow
	{
		using std::swap;

		swap(a._records, b._records);
		swap(a._size, b._size);
		swap(a._capacity, b._capacity);
		swap(a._extend, b._extend);
	}

public: // for range based loops
	T *begin() const
	{
		return _records;
	}

	T *end() const
	{
		return _records + _size;
	}

private:
	void grow (size_t sz)
	{
		realloc(std::max(sz, 2 * _capacity));
	}

public:
	void realloc (size_t sz)
	{
		_capacity = sz + _extend;
		if (_size > _capacity) _size = _capacity;

		T *tmp = new T[_capacity];
		std::copy(_records, _records + _size, tmp);
		delete[] _records;
		_records = tmp;
	}

	void reserve (size_t sz)
	{
		if (sz > _capacity)
			realloc(sz);
	}

	void resize (size_t sz)
	{
		if (sz > _capacity)
			grow(sz);
		_size = sz;
	}

	// add element, realloc if needed
	void add (const T &t)
	{
		if (_size == _capacity)
			grow(_size + 1);
		_records[_size++] = t;
	}

	// add array, realloc if needed
	void add (const T *t, size_t sz)
	{
		if (_size + sz > _capacity)
			grow(_size + sz);
		std::copy(t, t + sz, _records + _size);
		_size += sz;
	}

	size_t size (void) const
	{
		return _size;
	}

	T *data (void)
	{
		return _records;
	}

	const T *data (void) const
	{
		return _records;
	}

	T &operator[] (size_t i)
	{
		assert(i < _size);
		return _records[i];
	}

	const T &operator[] (size_t i) const
	{
		assert(i < _size);
		return _records[i];
	}
};

#endif
