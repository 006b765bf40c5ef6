// block.hpp
// Value types stored in a BlockSequence: the address interval itself and
// the handle that names one stored interval.

#pragma once

#include <cstdint>

namespace memspace
{

// Half-open interval [base, base + length) of the simulated address range.
struct Block
{
	int base = 0;
	int length = 0;

	Block() = default;
	Block(int base_, int length_) : base(base_), length(length_) {}

	int end() const { return base + length; }

	// True when this interval ends exactly where other begins.
	bool precedes(const Block &other) const { return end() == other.base; }

	bool overlaps(const Block &other) const
	{
		return base < other.end() && other.base < end();
	}
};

// Compares values only. Identity of stored blocks goes through BlockHandle.
inline bool operator==(const Block &a, const Block &b)
{
	return a.base == b.base && a.length == b.length;
}

inline bool operator!=(const Block &a, const Block &b)
{
	return !(a == b);
}

// Names one stored Block. The generation is bumped when the slot is
// released, so a handle to a removed block never aliases its successor.
struct BlockHandle
{
	static constexpr std::uint32_t INVALID_INDEX = 0xFFFFFFFFu;

	std::uint32_t index = INVALID_INDEX;
	std::uint32_t generation = 0;

	bool valid() const { return index != INVALID_INDEX; }
};

inline bool operator==(const BlockHandle &a, const BlockHandle &b)
{
	return a.index == b.index && a.generation == b.generation;
}

inline bool operator!=(const BlockHandle &a, const BlockHandle &b)
{
	return !(a == b);
}

} // namespace memspace
