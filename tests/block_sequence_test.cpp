#include "block_sequence.hpp"
#include "errors.hpp"

#include <catch2/catch.hpp>

#include <limits>
#include <vector>

using memspace::Block;
using memspace::BlockHandle;
using memspace::BlockSequence;

// ============================================================================
// Construction and end insertion
// ============================================================================

TEST_CASE("BlockSequence: empty sequence", "[sequence][basic]")
{
	BlockSequence seq;

	REQUIRE(seq.size() == 0);
	REQUIRE(seq.empty());
	REQUIRE(seq.first() == nullptr);
	REQUIRE(seq.last() == nullptr);
	REQUIRE_FALSE(seq.first_handle().valid());
	REQUIRE_FALSE(seq.last_handle().valid());
	REQUIRE(seq.begin() == seq.end());
	REQUIRE(seq.to_string().empty());
}

TEST_CASE("BlockSequence: push_front and push_back keep insertion order", "[sequence][basic]")
{
	BlockSequence seq;
	seq.push_back(Block(1, 1));
	seq.push_back(Block(2, 2));
	seq.push_front(Block(0, 5));

	REQUIRE(seq.size() == 3);
	REQUIRE(*seq.first() == Block(0, 5));
	REQUIRE(*seq.last() == Block(2, 2));
	REQUIRE(seq.to_string() == "(0 , 5) (1 , 1) (2 , 2) ");
}

TEST_CASE("BlockSequence: insert in the middle", "[sequence][insert]")
{
	BlockSequence seq;
	seq.push_back(Block(0, 5));
	seq.push_back(Block(1, 1));
	seq.push_back(Block(2, 2));

	SECTION("Before the second entry")
	{
		seq.insert(1, Block(7, 1));
		REQUIRE(seq.to_string() == "(0 , 5) (7 , 1) (1 , 1) (2 , 2) ");
	}

	SECTION("Before the last entry")
	{
		seq.insert(2, Block(7, 1));
		REQUIRE(seq.to_string() == "(0 , 5) (1 , 1) (7 , 1) (2 , 2) ");
		REQUIRE(*seq.last() == Block(2, 2));
	}

	SECTION("At size() appends")
	{
		seq.insert(3, Block(7, 1));
		REQUIRE(*seq.last() == Block(7, 1));
	}

	SECTION("At zero prepends")
	{
		seq.insert(0, Block(7, 1));
		REQUIRE(*seq.first() == Block(7, 1));
	}
}

TEST_CASE("BlockSequence: insert rejects bad positions and blocks", "[sequence][errors]")
{
	BlockSequence seq;
	seq.push_back(Block(0, 5));

	REQUIRE_THROWS_AS(seq.insert(-1, Block(1, 1)), memspace::IndexOutOfRange);
	REQUIRE_THROWS_AS(seq.insert(2, Block(1, 1)), memspace::IndexOutOfRange);
	REQUIRE_THROWS_AS(seq.push_back(Block(1, 0)), memspace::InvalidBlock);
	REQUIRE_THROWS_AS(seq.push_back(Block(-1, 3)), memspace::InvalidBlock);
	REQUIRE(seq.size() == 1);
}

TEST_CASE("BlockSequence: blocks ending past INT_MAX are rejected", "[sequence][errors]")
{
	const int max = std::numeric_limits<int>::max();
	BlockSequence seq;

	REQUIRE_THROWS_AS(seq.push_back(Block(max, 1)), memspace::InvalidBlock);
	REQUIRE_THROWS_AS(seq.push_front(Block(max - 5, 6)), memspace::InvalidBlock);
	REQUIRE(seq.empty());

	// Ending exactly at INT_MAX is representable.
	seq.push_back(Block(max - 5, 5));
	REQUIRE(seq.last()->end() == max);
}

// ============================================================================
// Positional access
// ============================================================================

TEST_CASE("BlockSequence: at and handle_at", "[sequence][access]")
{
	BlockSequence seq;
	for (int i = 0; i < 5; ++i)
		seq.push_back(Block(i * 10, 10));

	REQUIRE(seq.at(0) == Block(0, 10));
	REQUIRE(seq.at(3) == Block(30, 10));
	REQUIRE(seq.at(4) == Block(40, 10));
	REQUIRE(seq.get(seq.handle_at(2)) == Block(20, 10));

	REQUIRE_THROWS_AS(seq.at(-1), memspace::IndexOutOfRange);
	REQUIRE_THROWS_AS(seq.at(5), memspace::IndexOutOfRange);
	REQUIRE_THROWS_AS(seq.handle_at(5), memspace::IndexOutOfRange);

	// The standard base catches it too.
	REQUIRE_THROWS_AS(seq.at(5), std::out_of_range);
}

TEST_CASE("BlockSequence: iteration visits entries in order", "[sequence][iterate]")
{
	BlockSequence seq;
	seq.push_back(Block(5, 1));
	seq.push_front(Block(3, 1));
	seq.push_back(Block(9, 1));

	std::vector<int> bases;
	int i = 0;
	for (auto it = seq.begin(); it != seq.end(); ++it)
	{
		bases.push_back(it->base);
		REQUIRE(it.handle() == seq.handle_at(i));
		++i;
	}
	REQUIRE(bases == std::vector<int>{3, 5, 9});

	BlockHandle h = seq.first_handle();
	REQUIRE(seq.get(h).base == 3);
	h = seq.next_handle(h);
	REQUIRE(seq.get(h).base == 5);
	h = seq.next_handle(h);
	REQUIRE(seq.get(h).base == 9);
	REQUIRE_FALSE(seq.next_handle(h).valid());
}

// ============================================================================
// Identity
// ============================================================================

TEST_CASE("BlockSequence: index_of compares identity, not value", "[sequence][identity]")
{
	BlockSequence seq;
	BlockHandle h1 = seq.push_back(Block(5, 5));
	BlockHandle h2 = seq.push_back(Block(5, 5));

	REQUIRE(h1 != h2);
	REQUIRE(seq.index_of(h1) == 0);
	REQUIRE(seq.index_of(h2) == 1);
	REQUIRE(seq.index_of(seq.at(1)) == 1);

	Block lookalike(5, 5);
	REQUIRE(seq.index_of(lookalike) == -1);
	REQUIRE_THROWS_AS(seq.remove(lookalike), memspace::NotFound);
	REQUIRE(seq.size() == 2);
}

TEST_CASE("BlockSequence: mutating through a handle keeps the entity", "[sequence][identity]")
{
	BlockSequence seq;
	seq.push_back(Block(0, 10));
	BlockHandle h = seq.push_back(Block(10, 20));

	Block &b = seq.get(h);
	b.base += 5;
	b.length -= 5;

	REQUIRE(seq.index_of(h) == 1);
	REQUIRE(seq.get(h) == Block(15, 15));
	REQUIRE(seq.to_string() == "(0 , 10) (15 , 15) ");
}

// ============================================================================
// Removal
// ============================================================================

TEST_CASE("BlockSequence: remove by handle", "[sequence][remove]")
{
	BlockSequence seq;
	BlockHandle a = seq.push_back(Block(0, 1));
	BlockHandle b = seq.push_back(Block(1, 1));
	BlockHandle c = seq.push_back(Block(2, 1));

	seq.remove(b);
	REQUIRE(seq.size() == 2);
	REQUIRE_FALSE(seq.contains(b));
	REQUIRE(seq.index_of(b) == -1);
	REQUIRE(seq.index_of(c) == 1);
	REQUIRE_THROWS_AS(seq.remove(b), memspace::NotFound);
	REQUIRE_THROWS_AS(seq.get(b), memspace::NotFound);

	seq.remove(a);
	REQUIRE(*seq.first() == Block(2, 1));
	seq.remove(c);
	REQUIRE(seq.empty());
	REQUIRE(seq.first() == nullptr);
	REQUIRE(seq.last() == nullptr);
}

TEST_CASE("BlockSequence: remove by index", "[sequence][remove]")
{
	BlockSequence seq;
	for (int i = 0; i < 4; ++i)
		seq.push_back(Block(i, 1));

	SECTION("Head")
	{
		seq.remove_at(0);
		REQUIRE(seq.to_string() == "(1 , 1) (2 , 1) (3 , 1) ");
	}

	SECTION("Tail")
	{
		seq.remove_at(3);
		REQUIRE(*seq.last() == Block(2, 1));
	}

	SECTION("Middle")
	{
		seq.remove_at(2);
		REQUIRE(seq.to_string() == "(0 , 1) (1 , 1) (3 , 1) ");
	}

	SECTION("Out of range")
	{
		REQUIRE_THROWS_AS(seq.remove_at(-1), memspace::IndexOutOfRange);
		REQUIRE_THROWS_AS(seq.remove_at(4), memspace::IndexOutOfRange);
		REQUIRE(seq.size() == 4);
	}
}

TEST_CASE("BlockSequence: remove by identity", "[sequence][remove]")
{
	BlockSequence seq;
	BlockHandle first = seq.push_back(Block(0, 1));
	BlockHandle second = seq.push_back(Block(0, 1));

	seq.remove(seq.get(second));

	REQUIRE(seq.size() == 1);
	REQUIRE_FALSE(seq.contains(second));
	REQUIRE(seq.contains(first));
	REQUIRE(seq.index_of(first) == 0);

	// The survivor holds an equal value but is a different entity.
	seq.remove(seq.get(first));
	REQUIRE(seq.empty());
	REQUIRE_FALSE(seq.contains(first));
}

TEST_CASE("BlockSequence: recycled slots reject old handles", "[sequence][handles]")
{
	BlockSequence seq;
	BlockHandle old_handle = seq.push_back(Block(0, 4));
	seq.remove(old_handle);

	BlockHandle new_handle = seq.push_back(Block(8, 4));

	REQUIRE(new_handle.index == old_handle.index);
	REQUIRE(new_handle != old_handle);
	REQUIRE_FALSE(seq.contains(old_handle));
	REQUIRE(seq.index_of(old_handle) == -1);
	REQUIRE(seq.get(new_handle) == Block(8, 4));
}

TEST_CASE("BlockSequence: clear invalidates every handle", "[sequence][handles]")
{
	BlockSequence seq;
	BlockHandle a = seq.push_back(Block(0, 4));
	BlockHandle b = seq.push_back(Block(4, 4));

	seq.clear();

	REQUIRE(seq.empty());
	REQUIRE_FALSE(seq.contains(a));
	REQUIRE_FALSE(seq.contains(b));

	seq.push_back(Block(1, 1));
	REQUIRE(seq.to_string() == "(1 , 1) ");
}
