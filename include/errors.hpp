// errors.hpp
// Exceptions thrown by BlockSequence and MemorySpace. Each derives from the
// closest standard exception so callers may catch either.

#pragma once

#include <stdexcept>
#include <string>

namespace memspace
{

// MemorySpace constructed with capacity <= 0.
class InvalidCapacity : public std::invalid_argument
{
public:
	explicit InvalidCapacity(int capacity)
	    : std::invalid_argument("capacity must be positive, got " + std::to_string(capacity)),
	      m_capacity(capacity)
	{
	}

	int capacity() const { return m_capacity; }

private:
	int m_capacity;
};

// A block with a negative base or a non-positive length.
class InvalidBlock : public std::invalid_argument
{
public:
	InvalidBlock(int base, int length)
	    : std::invalid_argument("invalid block (" + std::to_string(base) + " , " +
	                            std::to_string(length) + ")")
	{
	}
};

// Positional access outside [0, size) or, for insertion, [0, size].
class IndexOutOfRange : public std::out_of_range
{
public:
	IndexOutOfRange(int index, int size)
	    : std::out_of_range("index " + std::to_string(index) + " out of range for size " +
	                        std::to_string(size)),
	      m_index(index),
	      m_size(size)
	{
	}

	int index() const { return m_index; }
	int size() const { return m_size; }

private:
	int m_index;
	int m_size;
};

// Lookup or removal by handle or identity found no entry.
class NotFound : public std::runtime_error
{
public:
	explicit NotFound(const std::string &what) : std::runtime_error(what) {}
};

// free() on an address that is not currently allocated.
class InvalidFree : public std::invalid_argument
{
public:
	explicit InvalidFree(int address)
	    : std::invalid_argument("address " + std::to_string(address) + " is not allocated"),
	      m_address(address)
	{
	}

	int address() const { return m_address; }

private:
	int m_address;
};

} // namespace memspace
