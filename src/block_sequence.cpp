// block_sequence.cpp
// Slot-vector implementation of the ordered block list.

#include "block_sequence.hpp"
#include "errors.hpp"

#include <limits>

namespace memspace
{

Block *BlockSequence::first()
{
	return m_head == BlockHandle::INVALID_INDEX ? nullptr : &m_slots[m_head].block;
}

const Block *BlockSequence::first() const
{
	return m_head == BlockHandle::INVALID_INDEX ? nullptr : &m_slots[m_head].block;
}

Block *BlockSequence::last()
{
	return m_tail == BlockHandle::INVALID_INDEX ? nullptr : &m_slots[m_tail].block;
}

const Block *BlockSequence::last() const
{
	return m_tail == BlockHandle::INVALID_INDEX ? nullptr : &m_slots[m_tail].block;
}

BlockHandle BlockSequence::first_handle() const
{
	if (m_head == BlockHandle::INVALID_INDEX)
		return BlockHandle{};
	return BlockHandle{m_head, m_slots[m_head].generation};
}

BlockHandle BlockSequence::last_handle() const
{
	if (m_tail == BlockHandle::INVALID_INDEX)
		return BlockHandle{};
	return BlockHandle{m_tail, m_slots[m_tail].generation};
}

BlockHandle BlockSequence::next_handle(BlockHandle h) const
{
	if (!contains(h))
		throw NotFound("stale block handle");

	std::uint32_t next = m_slots[h.index].next;
	if (next == BlockHandle::INVALID_INDEX)
		return BlockHandle{};
	return BlockHandle{next, m_slots[next].generation};
}

Block &BlockSequence::at(int index)
{
	check_index(index, m_size);
	return m_slots[slot_at(index)].block;
}

const Block &BlockSequence::at(int index) const
{
	check_index(index, m_size);
	return m_slots[slot_at(index)].block;
}

BlockHandle BlockSequence::handle_at(int index) const
{
	check_index(index, m_size);
	std::uint32_t slot = slot_at(index);
	return BlockHandle{slot, m_slots[slot].generation};
}

Block &BlockSequence::get(BlockHandle h)
{
	if (!contains(h))
		throw NotFound("stale block handle");
	return m_slots[h.index].block;
}

const Block &BlockSequence::get(BlockHandle h) const
{
	if (!contains(h))
		throw NotFound("stale block handle");
	return m_slots[h.index].block;
}

bool BlockSequence::contains(BlockHandle h) const
{
	if (!h.valid() || h.index >= m_slots.size())
		return false;
	const Slot &slot = m_slots[h.index];
	return slot.occupied && slot.generation == h.generation;
}

BlockHandle BlockSequence::insert(int index, const Block &block)
{
	check_index(index, m_size + 1);
	// end() must stay representable.
	if (block.base < 0 || block.length <= 0 ||
	    block.length > std::numeric_limits<int>::max() - block.base)
		throw InvalidBlock(block.base, block.length);

	// Locate the successor before acquiring a slot; acquiring may grow m_slots.
	std::uint32_t after = BlockHandle::INVALID_INDEX;
	if (index < m_size)
		after = slot_at(index);

	std::uint32_t slot = acquire_slot(block);
	Slot &node = m_slots[slot];

	if (after == BlockHandle::INVALID_INDEX)
	{
		// Append at the tail.
		node.prev = m_tail;
		if (m_tail != BlockHandle::INVALID_INDEX)
			m_slots[m_tail].next = slot;
		else
			m_head = slot;
		m_tail = slot;
	}
	else
	{
		std::uint32_t before = m_slots[after].prev;
		node.prev = before;
		node.next = after;
		m_slots[after].prev = slot;
		if (before != BlockHandle::INVALID_INDEX)
			m_slots[before].next = slot;
		else
			m_head = slot;
	}

	++m_size;
	return BlockHandle{slot, node.generation};
}

BlockHandle BlockSequence::push_front(const Block &block)
{
	return insert(0, block);
}

BlockHandle BlockSequence::push_back(const Block &block)
{
	return insert(m_size, block);
}

int BlockSequence::index_of(BlockHandle h) const
{
	if (!contains(h))
		return -1;

	int i = 0;
	for (std::uint32_t curr = m_head; curr != BlockHandle::INVALID_INDEX; curr = m_slots[curr].next)
	{
		if (curr == h.index)
			return i;
		++i;
	}
	return -1;
}

int BlockSequence::index_of(const Block &block) const
{
	int i = 0;
	for (std::uint32_t curr = m_head; curr != BlockHandle::INVALID_INDEX; curr = m_slots[curr].next)
	{
		if (&m_slots[curr].block == &block)
			return i;
		++i;
	}
	return -1;
}

void BlockSequence::remove(BlockHandle h)
{
	if (!contains(h))
		throw NotFound("stale block handle");
	unlink(h.index);
}

void BlockSequence::remove_at(int index)
{
	check_index(index, m_size);
	unlink(slot_at(index));
}

void BlockSequence::remove(const Block &block)
{
	std::uint32_t slot = slot_of(block);
	if (slot == BlockHandle::INVALID_INDEX)
		throw NotFound("block (" + std::to_string(block.base) + " , " +
		               std::to_string(block.length) + ") is not in this sequence");
	unlink(slot);
}

void BlockSequence::clear()
{
	// Bump generations so handles taken before clear() stay rejected.
	m_free_slots.clear();
	for (std::uint32_t i = 0; i < m_slots.size(); ++i)
	{
		Slot &slot = m_slots[i];
		if (slot.occupied)
		{
			slot.occupied = false;
			++slot.generation;
		}
		slot.prev = BlockHandle::INVALID_INDEX;
		slot.next = BlockHandle::INVALID_INDEX;
		m_free_slots.push_back(i);
	}
	m_head = BlockHandle::INVALID_INDEX;
	m_tail = BlockHandle::INVALID_INDEX;
	m_size = 0;
}

std::string BlockSequence::to_string() const
{
	std::string out;
	for (const Block &b : *this)
		out += "(" + std::to_string(b.base) + " , " + std::to_string(b.length) + ") ";
	return out;
}

std::uint32_t BlockSequence::acquire_slot(const Block &block)
{
	std::uint32_t index;
	if (!m_free_slots.empty())
	{
		index = m_free_slots.back();
		m_free_slots.pop_back();
	}
	else
	{
		index = static_cast<std::uint32_t>(m_slots.size());
		m_slots.emplace_back();
	}

	Slot &slot = m_slots[index];
	slot.block = block;
	slot.prev = BlockHandle::INVALID_INDEX;
	slot.next = BlockHandle::INVALID_INDEX;
	slot.occupied = true;
	return index;
}

void BlockSequence::unlink(std::uint32_t index)
{
	Slot &slot = m_slots[index];

	if (slot.prev != BlockHandle::INVALID_INDEX)
		m_slots[slot.prev].next = slot.next;
	else
		m_head = slot.next;

	if (slot.next != BlockHandle::INVALID_INDEX)
		m_slots[slot.next].prev = slot.prev;
	else
		m_tail = slot.prev;

	slot.prev = BlockHandle::INVALID_INDEX;
	slot.next = BlockHandle::INVALID_INDEX;
	slot.occupied = false;
	++slot.generation;
	m_free_slots.push_back(index);
	--m_size;
}

// Walks from whichever end is closer. Caller has range-checked index.
std::uint32_t BlockSequence::slot_at(int index) const
{
	if (index < m_size / 2)
	{
		std::uint32_t curr = m_head;
		for (int i = 0; i < index; ++i)
			curr = m_slots[curr].next;
		return curr;
	}

	std::uint32_t curr = m_tail;
	for (int i = m_size - 1; i > index; --i)
		curr = m_slots[curr].prev;
	return curr;
}

std::uint32_t BlockSequence::slot_of(const Block &block) const
{
	for (std::uint32_t curr = m_head; curr != BlockHandle::INVALID_INDEX; curr = m_slots[curr].next)
	{
		if (&m_slots[curr].block == &block)
			return curr;
	}
	return BlockHandle::INVALID_INDEX;
}

void BlockSequence::check_index(int index, int limit) const
{
	if (index < 0 || index >= limit)
		throw IndexOutOfRange(index, m_size);
}

} // namespace memspace
