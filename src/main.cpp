// Simple CLI for the contiguous memory allocation simulator.
// Commands:
//   malloc <size> [strategy]
//   free <addr>
//   dump
//   stats
//   show
//   step [n]
//   merge
//   help
//   exit / quit

#include <iostream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>

#include "memsim/allocator.hpp"
#include "memsim/render.hpp"
#include "memsim/simulation.hpp"

static void print_help()
{
	std::cout << "Available commands:\n"
	          << "  malloc <size> [strategy] - allocate <size> units using optional strategy (first|best|worst)\n"
	          << "  free <addr>              - free the block starting at <addr>\n"
	          << "  dump                     - show all memory blocks\n"
	          << "  stats                    - show allocator statistics\n"
	          << "  show                     - draw the memory map and summary\n"
	          << "  step [n]                 - run n random simulation steps (default 1)\n"
	          << "  merge                    - run the free block merge pass\n"
	          << "  help                     - show this help message\n"
	          << "  exit | quit              - exit the program\n";
}

static void show(const memsim::Simulation &sim)
{
	std::cout << memsim::render_map(sim.allocator(), sim.config().width) << "\n"
	          << memsim::render_blocks(sim.allocator())
	          << memsim::render_summary(sim.allocator());
}

static int run_shell(memsim::Simulation &sim)
{
	memsim::Allocator &allocator = sim.allocator();
	std::string line;
	print_help();

	while (true)
	{
		std::cout << "\n";
		std::cout << "memsim> " << std::flush;
		if (!std::getline(std::cin, line))
			break;

		std::istringstream iss(line);
		std::string cmd;
		if (!(iss >> cmd))
			continue; // empty line

		if (cmd == "malloc")
		{
			long long size = 0;
			if (!(iss >> size))
			{
				std::cout << "Usage: malloc <size> [strategy]\n";
				continue;
			}
			if (size <= 0)
			{
				std::cout << "Size must be > 0\n";
				continue;
			}
			std::string strategy;
			std::optional<std::size_t> start;
			if (iss >> strategy)
				start = allocator.allocate(static_cast<std::size_t>(size), strategy);
			else
				start = allocator.allocate(static_cast<std::size_t>(size), memsim::FitStrategy::First);

			if (start)
				std::cout << "Allocated " << size << " at " << *start
				          << " (pid=" << allocator.allocation_count() << ")\n";
			else
				std::cout << "Failed to allocate " << size << " (no space)\n";
		}
		else if (cmd == "free")
		{
			long long addr = -1;
			if (!(iss >> addr) || addr < 0)
			{
				std::cout << "Usage: free <addr>\n";
				continue;
			}
			if (allocator.deallocate(static_cast<std::size_t>(addr)))
				std::cout << "Deallocated memory at " << addr << "\n";
			else
				std::cout << "No allocated block starts at " << addr << "\n";
		}
		else if (cmd == "dump")
		{
			allocator.dump(std::cout);
		}
		else if (cmd == "stats")
		{
			allocator.print_stats(std::cout);
		}
		else if (cmd == "show")
		{
			show(sim);
		}
		else if (cmd == "step")
		{
			long long n = 1;
			std::string arg;
			if (iss >> arg)
			{
				std::istringstream nss(arg);
				if (!(nss >> n) || n <= 0)
				{
					std::cout << "Usage: step [n]\n";
					continue;
				}
			}
			sim.run(static_cast<std::size_t>(n), std::cout);
		}
		else if (cmd == "merge")
		{
			allocator.merge_free_blocks();
			std::cout << "Free blocks: " << allocator.free_block_count() << "\n";
		}
		else if (cmd == "help")
		{
			print_help();
		}
		else if (cmd == "exit" || cmd == "quit")
		{
			break;
		}
		else
		{
			std::cout << "Unknown command: " << cmd << " (type 'help' for usage)\n";
		}
	}

	return 0;
}

int main(int argc, char *argv[])
{
	memsim::SimulationConfig config;
	std::string error;
	if (!memsim::parse_options(argc, argv, config, error))
	{
		std::cerr << "memsim: " << error << "\n" << memsim::usage(argv[0]);
		return 1;
	}

	try
	{
		memsim::Simulation sim(config);
		if (config.batch)
		{
			sim.run(config.steps, std::cout);
			return 0;
		}
		return run_shell(sim);
	}
	catch (const std::invalid_argument &e)
	{
		std::cerr << "memsim: " << e.what() << "\n";
		return 1;
	}
}
