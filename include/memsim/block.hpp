// block.hpp
// One contiguous region of the simulated address space.

#pragma once

#include <cstddef> // std::size_t
#include <cstdint> // std::uint64_t

namespace memsim
{

enum class BlockStatus
{
	Free,
	Allocated,
};

// Owner id of an allocated block. 0 means "no owner" (free block).
using OwnerId = std::uint64_t;

struct Block
{
	std::size_t start = 0;              // Offset of the first address unit.
	std::size_t size = 0;               // Length in address units, always > 0.
	BlockStatus status = BlockStatus::Free;
	OwnerId owner = 0;                  // Set iff status == Allocated.

	Block() = default;
	Block(std::size_t start_, std::size_t size_)
	    : start(start_), size(size_)
	{
	}
	Block(std::size_t start_, std::size_t size_, OwnerId owner_)
	    : start(start_), size(size_), status(BlockStatus::Allocated), owner(owner_)
	{
	}

	std::size_t end() const { return start + size; }
	bool is_free() const { return status == BlockStatus::Free; }
	bool has_owner() const { return status == BlockStatus::Allocated; }
};

inline bool operator==(const Block &a, const Block &b)
{
	return a.start == b.start && a.size == b.size && a.status == b.status && a.owner == b.owner;
}

inline bool operator!=(const Block &a, const Block &b)
{
	return !(a == b);
}

} // namespace memsim
