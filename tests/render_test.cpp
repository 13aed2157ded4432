#include "memsim/render.hpp"

#include <catch2/catch.hpp>

#include <string>

using memsim::Allocator;
using memsim::FitStrategy;

TEST_CASE("Render: Map marks owners and free cells", "[render]")
{
	Allocator a(100);
	REQUIRE(memsim::render_map(a, 10) == "|..........|");

	a.allocate(30, FitStrategy::First); // A
	a.allocate(20, FitStrategy::First); // B
	REQUIRE(memsim::render_map(a, 10) == "|AAABB.....|");

	a.deallocate(0);
	REQUIRE(memsim::render_map(a, 10) == "|...BB.....|");
}

TEST_CASE("Render: Map wider than the address space", "[render][edge]")
{
	Allocator a(4);
	a.allocate(1, FitStrategy::First);
	a.allocate(1, FitStrategy::First);
	REQUIRE(memsim::render_map(a, 8) == "|AABB....|");
	REQUIRE(memsim::render_map(a, 0).empty());
}

TEST_CASE("Render: Map of a very large address space", "[render][edge]")
{
	const std::size_t capacity = std::size_t(1) << 62;
	Allocator a(capacity);
	a.allocate(capacity / 2, FitStrategy::First);

	REQUIRE(memsim::render_map(a, 8) == "|AAAA....|");
	REQUIRE(memsim::render_map(a, 3) == "|AA.|");
}

TEST_CASE("Render: Block list", "[render]")
{
	Allocator a(100);
	a.allocate(30, FitStrategy::First);

	REQUIRE(memsim::render_blocks(a) == "[0-30) PID:1\n[30-100) FREE\n");
}

TEST_CASE("Render: Summary", "[render]")
{
	Allocator a(100);
	a.allocate(30, FitStrategy::First);
	a.allocate(20, FitStrategy::First);
	a.deallocate(0);

	const std::string summary = memsim::render_summary(a);
	REQUIRE(summary ==
	        "Total Memory: 100\n"
	        "Free Memory: 80\n"
	        "Allocated Memory: 20\n"
	        "Fragmentation: 80.00%\n"
	        "Free Blocks: 2\n");
}
