#include <catch2/catch_test_macros.hpp>
#include <optional>
#include <vector>
#include "CrossoverSignal.h"
#include "TestUtils.h"

using namespace mkc_crossover;

namespace
{
  std::optional<DecimalType> value (const std::string& s)
  {
    return createDecimal(s);
  }

  const std::optional<DecimalType> undefined;
}

TEST_CASE ("Undefined averages never produce a signal", "[CrossoverSignalGenerator]")
{
  CrossoverSignalGenerator<DecimalType> generator;

  REQUIRE (generator.classify(undefined, undefined) == Signal::Flat);
  REQUIRE (generator.classify(value("10"), undefined) == Signal::Flat);
  REQUIRE (generator.classify(undefined, value("10")) == Signal::Flat);
  REQUIRE (generator.getLastSign() == 0);
}

TEST_CASE ("Signal fires once per sign change", "[CrossoverSignalGenerator]")
{
  CrossoverSignalGenerator<DecimalType> generator;

  SECTION ("First defined bar with fast above slow is a Long")
    {
      REQUIRE (generator.classify(value("11"), value("10.5")) == Signal::Long);
      REQUIRE (generator.classify(value("13"), value("11.5")) == Signal::Flat);
      REQUIRE (generator.classify(value("15"), value("13")) == Signal::Flat);
      REQUIRE (generator.classify(value("13"), value("14")) == Signal::Short);
      REQUIRE (generator.classify(value("11"), value("13")) == Signal::Flat);
      REQUIRE (generator.getLastSign() == -1);
    }

  SECTION ("First defined bar with fast below slow is a Short")
    {
      REQUIRE (generator.classify(value("9"), value("10")) == Signal::Short);
      REQUIRE (generator.classify(value("8"), value("10")) == Signal::Flat);
    }

  SECTION ("Equal averages keep the previous sign")
    {
      REQUIRE (generator.classify(value("11"), value("10")) == Signal::Long);
      REQUIRE (generator.classify(value("10"), value("10")) == Signal::Flat);
      REQUIRE (generator.getLastSign() == 1);

      // touching and moving back up is not a new crossover
      REQUIRE (generator.classify(value("12"), value("10")) == Signal::Flat);

      REQUIRE (generator.classify(value("10"), value("10")) == Signal::Flat);
      REQUIRE (generator.classify(value("9"), value("10")) == Signal::Short);
    }

  SECTION ("Equal averages before any sign is known")
    {
      REQUIRE (generator.classify(value("10"), value("10")) == Signal::Flat);
      REQUIRE (generator.classify(value("10.1"), value("10")) == Signal::Long);
    }

  SECTION ("reset forgets the sign")
    {
      REQUIRE (generator.classify(value("11"), value("10")) == Signal::Long);
      generator.reset();
      REQUIRE (generator.classify(value("11"), value("10")) == Signal::Long);
    }
}

TEST_CASE ("Signal names", "[CrossoverSignalGenerator]")
{
  REQUIRE (signalToString(Signal::Long) == "LONG");
  REQUIRE (signalToString(Signal::Short) == "SHORT");
  REQUIRE (signalToString(Signal::Flat) == "FLAT");
}
