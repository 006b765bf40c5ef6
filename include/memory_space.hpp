// memory_space.hpp
// Public API of the simulated memory space implemented in src/memory_space.cpp.

#pragma once

#include "block_sequence.hpp"

#include <cstddef>
#include <iosfwd>
#include <string>

namespace memspace
{

// Snapshot of the memory space returned by MemorySpace::stats().
struct MemoryStats
{
	int capacity = 0;
	int used = 0;                  // words in allocated blocks
	int used_blocks = 0;
	int free = 0;                  // words in free blocks
	int free_blocks = 0;
	int largest_free_block = 0;
	double external_fragmentation = 0.0; // percent of free space outside the largest free block
	double utilization = 0.0;            // percent of capacity allocated

	std::size_t malloc_requests = 0;
	std::size_t malloc_success = 0;
	std::size_t malloc_failures = 0;
	std::size_t free_calls = 0;
	std::size_t defrag_calls = 0;
	std::size_t merges = 0;
};

// A fixed-size, word-addressed range partitioned into a free list and an
// allocated list. Capacity is only ever moved between the two lists.
//
// Not thread-safe: concurrent callers must serialize every call.
class MemorySpace
{
public:
	// Starts with a single free block (0, capacity).
	// Throws InvalidCapacity if capacity <= 0.
	explicit MemorySpace(int capacity);

	// First-fit allocation of length words. Returns the base address of the
	// new block, or -1 if no free block is large enough (or length <= 0).
	// Never defragments on its own.
	int malloc(int length);

	// Returns the block based at address to the tail of the free list.
	// Throws InvalidFree if no allocated block starts at address.
	void free(int address);

	// Coalesces physically adjacent free blocks until no pair is left.
	// Returns the number of merges performed.
	int defrag();

	int capacity() const { return m_capacity; }
	const BlockSequence &free_blocks() const { return m_free; }
	const BlockSequence &allocated_blocks() const { return m_allocated; }

	MemoryStats stats() const;
	void print_stats(std::ostream &out) const;

	// Heap dump: every block in address order, then the raw lists.
	void dump(std::ostream &out) const;

	// Free list, newline, allocated list.
	std::string to_string() const;

private:
	BlockHandle find_first_fit(int length) const;
	bool merge_one_pair();

	int m_capacity;
	BlockSequence m_free;
	BlockSequence m_allocated;

	std::size_t m_malloc_requests = 0;
	std::size_t m_malloc_success = 0;
	std::size_t m_malloc_failures = 0;
	std::size_t m_free_calls = 0;
	std::size_t m_defrag_calls = 0;
	std::size_t m_merges = 0;
};

} // namespace memspace
