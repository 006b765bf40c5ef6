// memory_space.cpp
// First-fit allocation, free and defragmentation over two block lists.

#include "memory_space.hpp"
#include "errors.hpp"

#include <algorithm>
#include <ostream>
#include <vector>

namespace memspace
{

MemorySpace::MemorySpace(int capacity) : m_capacity(capacity)
{
	if (capacity <= 0)
		throw InvalidCapacity(capacity);

	// One free block spanning the whole range.
	m_free.push_back(Block(0, capacity));
}

BlockHandle MemorySpace::find_first_fit(int length) const
{
	for (auto it = m_free.begin(); it != m_free.end(); ++it)
	{
		if (it->length >= length)
			return it.handle();
	}
	return BlockHandle{};
}

int MemorySpace::malloc(int length)
{
	++m_malloc_requests;
	if (length <= 0)
	{
		++m_malloc_failures;
		return -1;
	}

	BlockHandle fit = find_first_fit(length);
	if (!fit.valid())
	{
		++m_malloc_failures;
		return -1; // out of memory
	}

	Block &free_block = m_free.get(fit);
	int address = free_block.base;

	if (free_block.length == length)
	{
		// Exact fit: the block moves over unchanged.
		Block whole = free_block;
		m_allocated.push_back(whole);
		m_free.remove(fit);
	}
	else
	{
		// Split: the remnant keeps its handle and list position.
		Block remnant(free_block.base + length, free_block.length - length);
		m_allocated.push_back(Block(address, length));
		m_free.get(fit) = remnant;
	}

	++m_malloc_success;
	return address;
}

void MemorySpace::free(int address)
{
	for (auto it = m_allocated.begin(); it != m_allocated.end(); ++it)
	{
		if (it->base != address)
			continue;

		Block block = *it;
		BlockHandle handle = it.handle();
		m_free.push_back(block);
		m_allocated.remove(handle);
		++m_free_calls;
		return;
	}

	throw InvalidFree(address);
}

// Finds one pair (a, b) of free blocks with a immediately preceding b,
// in any list order, and folds b into a. Returns false if none exists.
bool MemorySpace::merge_one_pair()
{
	for (auto a = m_free.begin(); a != m_free.end(); ++a)
	{
		for (auto b = m_free.begin(); b != m_free.end(); ++b)
		{
			if (a == b || !a->precedes(*b))
				continue;

			BlockHandle keep = a.handle();
			BlockHandle absorbed = b.handle();
			int extra = b->length;

			m_free.get(keep).length += extra;
			m_free.remove(absorbed);
			return true;
		}
	}
	return false;
}

int MemorySpace::defrag()
{
	++m_defrag_calls;

	// Each call rescans every pair, so the loop ends on the first pass
	// that finds nothing to merge.
	int merges = 0;
	while (merge_one_pair())
		++merges;

	m_merges += static_cast<std::size_t>(merges);
	return merges;
}

MemoryStats MemorySpace::stats() const
{
	MemoryStats s;
	s.capacity = m_capacity;

	for (const Block &b : m_allocated)
	{
		s.used += b.length;
		++s.used_blocks;
	}
	for (const Block &b : m_free)
	{
		s.free += b.length;
		++s.free_blocks;
		s.largest_free_block = std::max(s.largest_free_block, b.length);
	}

	s.utilization = 100.0 * static_cast<double>(s.used) / static_cast<double>(m_capacity);
	if (s.free != 0 && s.largest_free_block != 0)
	{
		s.external_fragmentation =
		    100.0 * (1.0 - static_cast<double>(s.largest_free_block) / static_cast<double>(s.free));
	}

	s.malloc_requests = m_malloc_requests;
	s.malloc_success = m_malloc_success;
	s.malloc_failures = m_malloc_failures;
	s.free_calls = m_free_calls;
	s.defrag_calls = m_defrag_calls;
	s.merges = m_merges;
	return s;
}

void MemorySpace::print_stats(std::ostream &out) const
{
	MemoryStats s = stats();

	double success_rate = 0.0;
	double failure_rate = 0.0;
	if (s.malloc_requests != 0)
	{
		success_rate = 100.0 * static_cast<double>(s.malloc_success) / static_cast<double>(s.malloc_requests);
		failure_rate = 100.0 * static_cast<double>(s.malloc_failures) / static_cast<double>(s.malloc_requests);
	}

	out << "Memory space stats:\n";
	out << "  Capacity:  " << s.capacity << " words\n";
	out << "  Used:      " << s.used << " words in " << s.used_blocks << " block(s)\n";
	out << "  Free:      " << s.free << " words in " << s.free_blocks << " block(s)\n";
	out << "  External fragmentation: " << s.external_fragmentation << "%\n";
	out << "  Largest free block:     " << s.largest_free_block << " words\n";
	out << "  Malloc requests:        " << s.malloc_requests << "\n";
	out << "    Success:              " << s.malloc_success << " (" << success_rate << "%)\n";
	out << "    Failures:             " << s.malloc_failures << " (" << failure_rate << "%)\n";
	out << "  Frees:                  " << s.free_calls << "\n";
	out << "  Defrags:                " << s.defrag_calls << " (" << s.merges << " merge(s))\n";
	out << "  Memory utilization:     " << s.utilization << "% of capacity\n";
}

void MemorySpace::dump(std::ostream &out) const
{
	struct Entry
	{
		Block block;
		bool free;
	};

	std::vector<Entry> entries;
	entries.reserve(static_cast<std::size_t>(m_free.size() + m_allocated.size()));
	for (const Block &b : m_free)
		entries.push_back(Entry{b, true});
	for (const Block &b : m_allocated)
		entries.push_back(Entry{b, false});

	std::sort(entries.begin(), entries.end(),
	          [](const Entry &a, const Entry &b) { return a.block.base < b.block.base; });

	out << "Memory dump (address order):\n";
	std::size_t index = 0;
	for (const Entry &e : entries)
	{
		out << "  Block " << index++
		    << ": offset=" << e.block.base
		    << ", length=" << e.block.length
		    << ", " << (e.free ? "FREE" : "USED")
		    << "\n";
	}
	out << "Free list:      " << m_free.to_string() << "\n";
	out << "Allocated list: " << m_allocated.to_string() << "\n";
}

std::string MemorySpace::to_string() const
{
	return m_free.to_string() + "\n" + m_allocated.to_string();
}

} // namespace memspace
