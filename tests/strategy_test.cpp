#include "memsim/strategy.hpp"

#include <catch2/catch.hpp>

#include <string>

using memsim::FitStrategy;

TEST_CASE("Strategy: Common spellings are accepted", "[strategy]")
{
	FitStrategy s = FitStrategy::Worst;

	for (const char *name : {"first", "first_fit", "first-fit", "firstfit", "First-Fit"})
	{
		s = FitStrategy::Worst;
		REQUIRE(memsim::parse_strategy(name, s));
		REQUIRE(s == FitStrategy::First);
	}

	REQUIRE(memsim::parse_strategy("best_fit", s));
	REQUIRE(s == FitStrategy::Best);
	REQUIRE(memsim::parse_strategy("BESTFIT", s));
	REQUIRE(s == FitStrategy::Best);
	REQUIRE(memsim::parse_strategy("worst-fit", s));
	REQUIRE(s == FitStrategy::Worst);
	REQUIRE(memsim::parse_strategy("worst", s));
	REQUIRE(s == FitStrategy::Worst);
}

TEST_CASE("Strategy: Unknown names leave the output alone", "[strategy][edge]")
{
	FitStrategy s = FitStrategy::Best;

	REQUIRE_FALSE(memsim::parse_strategy("next-fit", s));
	REQUIRE_FALSE(memsim::parse_strategy("", s));
	REQUIRE_FALSE(memsim::parse_strategy("first fit", s));
	REQUIRE(s == FitStrategy::Best);
}

TEST_CASE("Strategy: Canonical names parse back", "[strategy]")
{
	for (FitStrategy s : {FitStrategy::First, FitStrategy::Best, FitStrategy::Worst})
	{
		FitStrategy parsed = FitStrategy::First;
		REQUIRE(memsim::parse_strategy(memsim::strategy_name(s), parsed));
		REQUIRE(parsed == s);
	}
	REQUIRE(std::string(memsim::strategy_name(FitStrategy::Best)) == "best-fit");
}
