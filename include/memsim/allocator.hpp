// allocator.hpp
// Public API for the contiguous memory allocator implemented in src/allocator.cpp.

#pragma once

#include <cstddef> // std::size_t
#include <cstdint> // std::uint64_t
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

#include "memsim/block.hpp"
#include "memsim/strategy.hpp"

namespace memsim
{

// Request counters kept by the allocator.
struct AllocatorStats
{
	std::uint64_t requests = 0; // Allocation attempts with a non-zero size.
	std::uint64_t success = 0;  // Number of successful allocations.
	std::uint64_t failures = 0; // No free block was large enough.
	std::uint64_t rejected = 0; // Zero-size requests, not part of `requests`.
	std::uint64_t frees = 0;    // Successful deallocations.
	std::uint64_t bad_frees = 0; // Deallocations with no allocated block at the address.
};

// Simulated allocator over the address range [0, capacity).
// The block list always partitions the whole range and never holds two
// neighbouring free blocks.
class Allocator
{
public:
	// Throws std::invalid_argument when capacity is 0.
	explicit Allocator(std::size_t capacity);

	// Allocate `size` units using the given strategy.
	// Returns the start address of the new block, or std::nullopt when
	// size is 0 or no free block is large enough.
	std::optional<std::size_t> allocate(std::size_t size, FitStrategy strategy);

	// Convenience overload: strategy given by name. Unknown names fall back
	// to first-fit and write a diagnostic.
	std::optional<std::size_t> allocate(std::size_t size, const std::string &strategy);

	// Free the allocated block starting at `address`.
	// Returns false (and changes nothing) if there is no such block.
	bool deallocate(std::size_t address);

	// Merge every run of adjacent free blocks into one block.
	void merge_free_blocks();

	std::size_t capacity() const { return m_capacity; }
	const std::vector<Block> &blocks() const { return m_blocks; }
	const Block *find_block(std::size_t address) const;

	std::size_t free_bytes() const;
	std::size_t allocated_bytes() const;
	double fragmentation_percent() const;
	std::size_t free_block_count() const;
	std::size_t largest_free_block() const;

	// Number of owner ids handed out so far (the most recent id).
	OwnerId allocation_count() const { return m_next_id; }
	const AllocatorStats &stats() const { return m_stats; }

	// Where diagnostics go; nullptr silences them. Defaults to std::cerr.
	void set_diagnostic_stream(std::ostream *os) { m_diag = os; }

	// Dump the block list to `os`.
	void dump(std::ostream &os) const;

	// Print usage and request statistics to `os`.
	void print_stats(std::ostream &os) const;

private:
	std::optional<std::size_t> find_fit(std::size_t size, FitStrategy strategy) const;
	std::size_t split_and_allocate(std::size_t index, std::size_t size);
	void diagnostic(const std::string &message) const;

private:
	std::size_t m_capacity;
	std::vector<Block> m_blocks;
	OwnerId m_next_id = 0;
	AllocatorStats m_stats;
	std::ostream *m_diag;
};

} // namespace memsim
