// strategy.hpp
// Placement strategies used to choose a free block.

#pragma once

#include <string>

namespace memsim
{

enum class FitStrategy
{
	First,
	Best,
	Worst,
};

// Parse a strategy name ("first", "best-fit", "worst_fit", ...).
// Returns false and leaves `out` untouched when the name is not recognized.
bool parse_strategy(const std::string &name, FitStrategy &out);

// Canonical name, e.g. "best-fit".
const char *strategy_name(FitStrategy strategy);

} // namespace memsim
