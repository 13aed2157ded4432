// Strategy name parsing.

#include "memsim/strategy.hpp"

#include <cctype>

namespace memsim
{

static std::string to_lower(const std::string &s)
{
	std::string out(s);
	for (char &c : out)
		c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
	return out;
}

bool parse_strategy(const std::string &name, FitStrategy &out)
{
	// Accept common spellings.
	std::string s = to_lower(name);
	if (s == "first" || s == "first_fit" || s == "first-fit" || s == "firstfit")
	{
		out = FitStrategy::First;
		return true;
	}
	if (s == "best" || s == "best_fit" || s == "best-fit" || s == "bestfit")
	{
		out = FitStrategy::Best;
		return true;
	}
	if (s == "worst" || s == "worst_fit" || s == "worst-fit" || s == "worstfit")
	{
		out = FitStrategy::Worst;
		return true;
	}
	return false;
}

const char *strategy_name(FitStrategy strategy)
{
	switch (strategy)
	{
	case FitStrategy::First:
		return "first-fit";
	case FitStrategy::Best:
		return "best-fit";
	case FitStrategy::Worst:
		return "worst-fit";
	}
	return "first-fit";
}

} // namespace memsim
