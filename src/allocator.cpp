// Contiguous memory allocator simulation.
// Designed to be driven by an external CLI/simulation harness (e.g., main.cpp).

#include "memsim/allocator.hpp"

#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace memsim
{

Allocator::Allocator(std::size_t capacity)
    : m_capacity(capacity),
      m_diag(&std::cerr)
{
	if (capacity == 0)
		throw std::invalid_argument("allocator capacity must be greater than zero");

	// Start with a single big free block that spans the whole range.
	m_blocks.emplace_back(0, capacity);
}

void Allocator::diagnostic(const std::string &message) const
{
	if (m_diag)
		*m_diag << message << "\n";
}

// Index of the block chosen by `strategy`, if any free block fits.
// Best/worst only replace the candidate on a strict improvement, so ties
// go to the earliest block.
std::optional<std::size_t> Allocator::find_fit(std::size_t size, FitStrategy strategy) const
{
	std::optional<std::size_t> candidate;

	for (std::size_t i = 0; i < m_blocks.size(); ++i)
	{
		const Block &curr = m_blocks[i];
		if (!curr.is_free() || curr.size < size)
			continue;

		if (strategy == FitStrategy::First)
			return i;

		if (!candidate)
		{
			candidate = i;
			continue;
		}

		if (strategy == FitStrategy::Best)
		{
			if (curr.size < m_blocks[*candidate].size)
				candidate = i;
		}
		else // Worst
		{
			if (curr.size > m_blocks[*candidate].size)
				candidate = i;
		}
	}

	return candidate;
}

// Turn m_blocks[index] into an allocated block of `size` units, leaving the
// rest (if any) as a free block right after it.
std::size_t Allocator::split_and_allocate(std::size_t index, std::size_t size)
{
	const OwnerId owner = ++m_next_id;
	Block &block = m_blocks[index];
	const std::size_t start = block.start;

	if (block.size == size)
	{
		block.status = BlockStatus::Allocated;
		block.owner = owner;
		return start;
	}

	const Block remainder(start + size, block.size - size);
	block = Block(start, size, owner);
	m_blocks.insert(m_blocks.begin() + static_cast<std::ptrdiff_t>(index) + 1, remainder);
	return start;
}

std::optional<std::size_t> Allocator::allocate(std::size_t size, FitStrategy strategy)
{
	// Rejected requests are counted apart so success + failures == requests.
	if (size == 0)
	{
		++m_stats.rejected;
		diagnostic("Rejected allocation of size 0");
		return std::nullopt;
	}

	++m_stats.requests;

	std::optional<std::size_t> index = find_fit(size, strategy);
	if (!index)
	{
		++m_stats.failures;
		return std::nullopt; // not enough contiguous space
	}

	++m_stats.success;
	return split_and_allocate(*index, size);
}

std::optional<std::size_t> Allocator::allocate(std::size_t size, const std::string &strategy)
{
	FitStrategy strat = FitStrategy::First;
	if (!parse_strategy(strategy, strat))
		diagnostic("Invalid allocation strategy: " + strategy + ". Using first-fit.");
	return allocate(size, strat);
}

bool Allocator::deallocate(std::size_t address)
{
	for (Block &block : m_blocks)
	{
		if (block.start == address && !block.is_free())
		{
			block.status = BlockStatus::Free;
			block.owner = 0;
			++m_stats.frees;
			merge_free_blocks();
			return true;
		}
		if (block.start > address)
			break;
	}

	++m_stats.bad_frees;
	return false; // not found or already free
}

void Allocator::merge_free_blocks()
{
	std::size_t i = 0;
	while (i + 1 < m_blocks.size())
	{
		Block &curr = m_blocks[i];
		const Block &next = m_blocks[i + 1];
		if (curr.is_free() && next.is_free())
		{
			curr.size += next.size;
			m_blocks.erase(m_blocks.begin() + static_cast<std::ptrdiff_t>(i) + 1);
			continue; // attempt to merge with the new next block again
		}
		++i;
	}
}

const Block *Allocator::find_block(std::size_t address) const
{
	for (const Block &block : m_blocks)
	{
		if (block.start == address)
			return &block;
	}
	return nullptr;
}

std::size_t Allocator::free_bytes() const
{
	std::size_t total = 0;
	for (const Block &block : m_blocks)
	{
		if (block.is_free())
			total += block.size;
	}
	return total;
}

std::size_t Allocator::allocated_bytes() const
{
	std::size_t total = 0;
	for (const Block &block : m_blocks)
	{
		if (!block.is_free())
			total += block.size;
	}
	return total;
}

// Share of the whole range that is free. This is not a contiguity measure:
// one big hole and many small ones of the same total report the same value.
double Allocator::fragmentation_percent() const
{
	if (m_capacity == 0)
		return 0.0;
	return 100.0 * static_cast<double>(free_bytes()) / static_cast<double>(m_capacity);
}

std::size_t Allocator::free_block_count() const
{
	std::size_t count = 0;
	for (const Block &block : m_blocks)
	{
		if (block.is_free())
			++count;
	}
	return count;
}

std::size_t Allocator::largest_free_block() const
{
	std::size_t largest = 0;
	for (const Block &block : m_blocks)
	{
		if (block.is_free() && block.size > largest)
			largest = block.size;
	}
	return largest;
}

void Allocator::dump(std::ostream &os) const
{
	os << "Memory dump (block list):\n";
	std::size_t index = 0;
	for (const Block &block : m_blocks)
	{
		os << "  Block " << index++
		   << ": start=" << block.start
		   << ", size=" << block.size
		   << ", " << (block.is_free() ? "FREE" : "USED");
		if (block.has_owner())
			os << ", pid=" << block.owner;
		os << "\n";
	}
}

void Allocator::print_stats(std::ostream &os) const
{
	std::size_t used_blocks = m_blocks.size() - free_block_count();

	double success_rate = 0.0;
	double failure_rate = 0.0;
	if (m_stats.requests != 0)
	{
		success_rate = 100.0 * static_cast<double>(m_stats.success) / static_cast<double>(m_stats.requests);
		failure_rate = 100.0 * static_cast<double>(m_stats.failures) / static_cast<double>(m_stats.requests);
	}

	std::ostringstream out;
	out << std::fixed << std::setprecision(2);
	out << "Allocator stats:\n";
	out << "  Capacity:  " << m_capacity << " units\n";
	out << "  Used:      " << allocated_bytes() << " units in " << used_blocks << " block(s)\n";
	out << "  Free:      " << free_bytes() << " units in " << free_block_count() << " block(s)\n";
	out << "  Fragmentation:          " << fragmentation_percent() << "%\n";
	out << "  Largest free block:     " << largest_free_block() << " units\n";
	out << "  Allocation requests:    " << m_stats.requests << "\n";
	out << "    Success:              " << m_stats.success << " (" << success_rate << "%)\n";
	out << "    Failures:             " << m_stats.failures << " (" << failure_rate << "%)\n";
	out << "    Rejected:             " << m_stats.rejected << "\n";
	out << "  Deallocations:          " << m_stats.frees << " (" << m_stats.bad_frees << " invalid)\n";
	os << out.str();
}

} // namespace memsim
