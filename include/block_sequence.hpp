// block_sequence.hpp
// Ordered collection of Blocks used for the free and allocated lists.
//
// Entries live in a vector of slots chained into a doubly linked list.
// Removed slots are recycled; each reuse bumps the slot generation so old
// handles are rejected instead of silently naming the new occupant.
// Order is insertion order, never address order.

#pragma once

#include "block.hpp"

#include <cstddef>
#include <cstdint>
#include <iterator>
#include <string>
#include <vector>

namespace memspace
{

class BlockSequence
{
	struct Slot
	{
		Block block;
		std::uint32_t prev = BlockHandle::INVALID_INDEX;
		std::uint32_t next = BlockHandle::INVALID_INDEX;
		std::uint32_t generation = 0;
		bool occupied = false;
	};

public:
	// Forward, single-pass traversal in sequence order. Undefined if the
	// sequence is mutated while an iterator is live.
	class const_iterator
	{
	public:
		using iterator_category = std::forward_iterator_tag;
		using value_type = Block;
		using difference_type = std::ptrdiff_t;
		using pointer = const Block *;
		using reference = const Block &;

		const_iterator() = default;

		reference operator*() const { return m_owner->m_slots[m_index].block; }
		pointer operator->() const { return &m_owner->m_slots[m_index].block; }

		const_iterator &operator++()
		{
			m_index = m_owner->m_slots[m_index].next;
			return *this;
		}

		const_iterator operator++(int)
		{
			const_iterator old = *this;
			++*this;
			return old;
		}

		// Handle of the entry under the iterator.
		BlockHandle handle() const
		{
			return BlockHandle{m_index, m_owner->m_slots[m_index].generation};
		}

		bool operator==(const const_iterator &other) const { return m_index == other.m_index; }
		bool operator!=(const const_iterator &other) const { return m_index != other.m_index; }

	private:
		friend class BlockSequence;

		const_iterator(const BlockSequence *owner, std::uint32_t index)
		    : m_owner(owner), m_index(index)
		{
		}

		const BlockSequence *m_owner = nullptr;
		std::uint32_t m_index = BlockHandle::INVALID_INDEX;
	};

	BlockSequence() = default;

	int size() const { return m_size; }
	bool empty() const { return m_size == 0; }

	// nullptr when the sequence is empty.
	Block *first();
	const Block *first() const;
	Block *last();
	const Block *last() const;

	// Invalid handle when the sequence is empty.
	BlockHandle first_handle() const;
	BlockHandle last_handle() const;

	// Handle of the entry following h, invalid at the end.
	// Throws NotFound if h is stale.
	BlockHandle next_handle(BlockHandle h) const;

	// Throws IndexOutOfRange unless 0 <= index < size().
	Block &at(int index);
	const Block &at(int index) const;
	BlockHandle handle_at(int index) const;

	// Throws NotFound if h does not name a live entry.
	Block &get(BlockHandle h);
	const Block &get(BlockHandle h) const;
	bool contains(BlockHandle h) const;

	// Inserts before position index; index == size() appends.
	// O(1) at either end. Throws IndexOutOfRange unless 0 <= index <= size(),
	// InvalidBlock for a negative base, a non-positive length, or an end
	// past INT_MAX.
	BlockHandle insert(int index, const Block &block);
	BlockHandle push_front(const Block &block);
	BlockHandle push_back(const Block &block);

	// Position of the entry, -1 if absent. Identity only: a different
	// entry holding an equal (base, length) never matches.
	int index_of(BlockHandle h) const;
	int index_of(const Block &block) const;

	// Each removes exactly one entry.
	void remove(BlockHandle h);          // NotFound when stale
	void remove_at(int index);           // IndexOutOfRange
	void remove(const Block &block);     // NotFound when not stored here

	void clear();

	const_iterator begin() const { return const_iterator(this, m_head); }
	const_iterator end() const { return const_iterator(this, BlockHandle::INVALID_INDEX); }

	// "(base , length) " for every entry, in sequence order.
	std::string to_string() const;

private:
	std::uint32_t acquire_slot(const Block &block);
	void unlink(std::uint32_t index);
	std::uint32_t slot_at(int index) const;
	std::uint32_t slot_of(const Block &block) const;
	void check_index(int index, int limit) const;

	std::vector<Slot> m_slots;
	std::vector<std::uint32_t> m_free_slots; // recycled slot indices
	std::uint32_t m_head = BlockHandle::INVALID_INDEX;
	std::uint32_t m_tail = BlockHandle::INVALID_INDEX;
	int m_size = 0;
};

} // namespace memspace
