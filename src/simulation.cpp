// Randomized allocation driver.

#include "memsim/simulation.hpp"

#include <iostream>
#include <sstream>

#include "memsim/render.hpp"

namespace memsim
{

std::size_t SimulationConfig::effective_max_request() const
{
	if (max_request != 0)
		return max_request;
	std::size_t n = capacity / 5;
	return n ? n : 1;
}

// Parse a whole string as a value of type T; trailing garbage is an error.
template <typename T>
static bool parse_value(const std::string &text, T &out)
{
	std::istringstream iss(text);
	T value;
	if (!(iss >> value))
		return false;
	char extra;
	if (iss >> extra)
		return false;
	out = value;
	return true;
}

static bool parse_chance(const std::string &text, double &out)
{
	double value = 0.0;
	if (!parse_value(text, value) || value < 0.0 || value > 1.0)
		return false;
	out = value;
	return true;
}

// Unsigned values: istream skips leading blanks and wraps negative numbers
// around, so any '-' is rejected.
template <typename T>
static bool parse_unsigned(const std::string &text, T &out)
{
	if (text.find('-') != std::string::npos)
		return false;
	return parse_value(text, out);
}

static bool parse_count(const std::string &text, std::size_t &out)
{
	return parse_unsigned(text, out);
}

bool parse_options(int argc, const char *const argv[], SimulationConfig &config, std::string &error)
{
	for (int i = 1; i < argc; ++i)
	{
		std::string arg = argv[i];

		if (arg == "simulate")
		{
			config.batch = true;
			continue;
		}
		if (arg == "--quiet")
		{
			config.quiet = true;
			continue;
		}

		if (arg != "--capacity" && arg != "--seed" && arg != "--alloc-chance" && arg != "--free-chance" &&
		    arg != "--max-request" && arg != "--steps" && arg != "--width")
		{
			error = "unknown option: " + arg;
			return false;
		}
		if (i + 1 >= argc)
		{
			error = "missing value for " + arg;
			return false;
		}
		std::string value = argv[++i];

		bool ok = false;
		if (arg == "--capacity")
			ok = parse_count(value, config.capacity) && config.capacity > 0;
		else if (arg == "--seed")
		{
			ok = parse_unsigned(value, config.seed);
			config.has_seed = ok;
		}
		else if (arg == "--alloc-chance")
			ok = parse_chance(value, config.alloc_chance);
		else if (arg == "--free-chance")
			ok = parse_chance(value, config.free_chance);
		else if (arg == "--max-request")
			ok = parse_count(value, config.max_request) && config.max_request > 0;
		else if (arg == "--steps")
			ok = parse_count(value, config.steps);
		else if (arg == "--width")
			ok = parse_count(value, config.width) && config.width > 0;

		if (!ok)
		{
			error = "invalid value for " + arg + ": " + value;
			return false;
		}
	}
	return true;
}

std::string usage(const std::string &program)
{
	std::ostringstream os;
	os << "Usage: " << program << " [options] [simulate]\n"
	   << "  --capacity N      total memory size (default 100)\n"
	   << "  --seed S          random seed (default: random)\n"
	   << "  --alloc-chance P  allocation chance per step, 0..1 (default 0.3)\n"
	   << "  --free-chance P   deallocation chance per step, 0..1 (default 0.1)\n"
	   << "  --max-request N   largest random request (default capacity/5)\n"
	   << "  --steps N         steps for 'simulate' (default 50)\n"
	   << "  --width W         columns of the memory map (default 100)\n"
	   << "  --quiet           do not draw the map after each step\n"
	   << "  simulate          run the random simulation and exit\n";
	return os.str();
}

std::string describe(const SimEvent &event)
{
	std::ostringstream os;
	switch (event.kind)
	{
	case SimEventKind::Allocated:
		os << "Allocated " << event.size << " at " << event.address << " using " << strategy_name(event.strategy);
		break;
	case SimEventKind::AllocFailed:
		os << "Failed to allocate " << event.size << " using " << strategy_name(event.strategy);
		break;
	case SimEventKind::Freed:
		os << "Deallocated memory at " << event.address;
		break;
	}
	return os.str();
}

static std::uint64_t pick_seed(const SimulationConfig &config)
{
	if (config.has_seed)
		return config.seed;
	std::random_device rd;
	return (static_cast<std::uint64_t>(rd()) << 32) ^ rd();
}

Simulation::Simulation(const SimulationConfig &config)
    : m_config(config),
      m_allocator(config.capacity),
      m_rng(pick_seed(config))
{
}

std::vector<SimEvent> Simulation::step()
{
	std::vector<SimEvent> events;
	std::uniform_real_distribution<double> chance(0.0, 1.0);
	++m_steps;

	if (chance(m_rng) < m_config.alloc_chance)
	{
		std::uniform_int_distribution<std::size_t> size_dist(1, m_config.effective_max_request());
		std::uniform_int_distribution<int> strategy_dist(0, 2);

		SimEvent ev;
		ev.size = size_dist(m_rng);
		ev.strategy = static_cast<FitStrategy>(strategy_dist(m_rng));
		std::optional<std::size_t> start = m_allocator.allocate(ev.size, ev.strategy);
		if (start)
		{
			ev.kind = SimEventKind::Allocated;
			ev.address = *start;
		}
		else
		{
			ev.kind = SimEventKind::AllocFailed;
		}
		events.push_back(ev);
	}

	if (chance(m_rng) < m_config.free_chance)
	{
		std::vector<const Block *> allocated;
		for (const Block &block : m_allocator.blocks())
		{
			if (!block.is_free())
				allocated.push_back(&block);
		}

		if (!allocated.empty())
		{
			std::uniform_int_distribution<std::size_t> pick(0, allocated.size() - 1);
			const Block *victim = allocated[pick(m_rng)];

			// victim points into the block list; copy before it changes.
			SimEvent ev;
			ev.kind = SimEventKind::Freed;
			ev.address = victim->start;
			ev.size = victim->size;
			if (m_allocator.deallocate(ev.address))
				events.push_back(ev);
		}
	}

	return events;
}

void Simulation::run(std::size_t steps, std::ostream &os)
{
	for (std::size_t i = 0; i < steps; ++i)
	{
		for (const SimEvent &ev : step())
			os << describe(ev) << "\n";
		if (!m_config.quiet)
			os << render_map(m_allocator, m_config.width) << "\n";
	}
	os << render_summary(m_allocator);
}

} // namespace memsim
