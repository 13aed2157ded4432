// Text rendering of allocator state.

#include "memsim/render.hpp"

#include <iomanip>
#include <sstream>

namespace memsim
{

static char owner_glyph(OwnerId owner)
{
	static const char glyphs[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz";
	constexpr std::size_t glyph_count = sizeof(glyphs) - 1;
	return glyphs[(owner - 1) % glyph_count];
}

std::string render_map(const Allocator &allocator, std::size_t width)
{
	if (width == 0)
		return std::string();

	const std::size_t capacity = allocator.capacity();
	std::string map(width, '.');

	// Each cell shows the block owning the address at the cell's start.
	std::size_t block_index = 0;
	const auto &blocks = allocator.blocks();
	for (std::size_t cell = 0; cell < width; ++cell)
	{
		// cell * capacity / width without overflowing for large capacities.
		const std::size_t addr = capacity / width * cell + capacity % width * cell / width;
		while (block_index + 1 < blocks.size() && blocks[block_index].end() <= addr)
			++block_index;
		const Block &block = blocks[block_index];
		if (!block.is_free())
			map[cell] = owner_glyph(block.owner);
	}

	return "|" + map + "|";
}

std::string render_blocks(const Allocator &allocator)
{
	std::ostringstream os;
	for (const Block &block : allocator.blocks())
	{
		os << "[" << block.start << "-" << block.end() << ") ";
		if (block.is_free())
			os << "FREE";
		else
			os << "PID:" << block.owner;
		os << "\n";
	}
	return os.str();
}

std::string render_summary(const Allocator &allocator)
{
	std::ostringstream os;
	os << "Total Memory: " << allocator.capacity() << "\n"
	   << "Free Memory: " << allocator.free_bytes() << "\n"
	   << "Allocated Memory: " << allocator.allocated_bytes() << "\n"
	   << "Fragmentation: " << std::fixed << std::setprecision(2)
	   << allocator.fragmentation_percent() << "%\n"
	   << "Free Blocks: " << allocator.free_block_count() << "\n";
	return os.str();
}

} // namespace memsim
