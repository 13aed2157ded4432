// simulation.hpp
// Randomized allocate/free driver and its command-line configuration.

#pragma once

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <random>
#include <string>
#include <vector>

#include "memsim/allocator.hpp"

namespace memsim
{

struct SimulationConfig
{
	std::size_t capacity = 100;    // Total memory size.
	std::uint64_t seed = 0;        // Used when has_seed is set.
	bool has_seed = false;
	double alloc_chance = 0.3;     // Chance of an allocation per step.
	double free_chance = 0.1;      // Chance of a deallocation per step.
	std::size_t max_request = 0;   // 0 means capacity / 5 (at least 1).
	std::size_t steps = 50;
	std::size_t width = 100;       // Columns of the rendered memory map.
	bool quiet = false;            // Do not render the map after each step.
	bool batch = false;            // "simulate" given: run steps and exit.

	std::size_t effective_max_request() const;
};

// Fill `config` from command-line arguments.
// Returns false and sets `error` on unknown options or malformed values.
bool parse_options(int argc, const char *const argv[], SimulationConfig &config, std::string &error);

// Usage text for the memsim executable.
std::string usage(const std::string &program);

enum class SimEventKind
{
	Allocated,
	AllocFailed,
	Freed,
};

struct SimEvent
{
	SimEventKind kind = SimEventKind::Allocated;
	std::size_t size = 0;     // Requested size (allocations) or freed block size.
	std::size_t address = 0;  // Meaningful for Allocated and Freed.
	FitStrategy strategy = FitStrategy::First;
};

// Human-readable line, e.g. "Allocated 12 at 30 using best-fit".
std::string describe(const SimEvent &event);

class Simulation
{
public:
	explicit Simulation(const SimulationConfig &config);

	// Perform one random step and return what happened (possibly nothing).
	std::vector<SimEvent> step();

	// Run `steps` steps, writing event lines (and the map unless quiet).
	void run(std::size_t steps, std::ostream &os);

	Allocator &allocator() { return m_allocator; }
	const Allocator &allocator() const { return m_allocator; }
	const SimulationConfig &config() const { return m_config; }
	std::size_t steps_taken() const { return m_steps; }

private:
	SimulationConfig m_config;
	Allocator m_allocator;
	std::mt19937_64 m_rng;
	std::size_t m_steps = 0;
};

} // namespace memsim
