// render.hpp
// Text rendering of the allocator state (memory map, block list, summary).

#pragma once

#include <cstddef>
#include <string>

#include "memsim/allocator.hpp"

namespace memsim
{

// One-line map of the address space scaled to `width` cells.
// '.' marks free cells, letters mark allocated cells (by owner id).
std::string render_map(const Allocator &allocator, std::size_t width);

// One line per block: "[start-end) FREE" or "[start-end) PID:n".
std::string render_blocks(const Allocator &allocator);

// Totals, fragmentation and free block count.
std::string render_summary(const Allocator &allocator);

} // namespace memsim
