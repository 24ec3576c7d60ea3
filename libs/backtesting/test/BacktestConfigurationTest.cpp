#include <catch2/catch_test_macros.hpp>
#include <sstream>
#include <limits>
#include "BacktestConfiguration.h"
#include "TestUtils.h"

using namespace mkc_crossover;

namespace
{
  BacktestConfiguration<DecimalType> makeConfiguration (unsigned int fast, unsigned int slow,
							 const std::string& cash = "10000")
  {
    return BacktestConfiguration<DecimalType>(fast, slow,
					      SizingRule<DecimalType>::fixedQuantity(10),
					      CommissionModel<DecimalType>::none(),
					      SlippageModel<DecimalType>::none(),
					      false,
					      createDecimal(cash));
  }
}

TEST_CASE ("BacktestConfiguration validates windows and cash", "[BacktestConfiguration]")
{
  SECTION ("Valid configuration keeps its defaults")
    {
      auto config = makeConfiguration(2, 4);

      REQUIRE (config.getFastWindow() == 2);
      REQUIRE (config.getSlowWindow() == 4);
      REQUIRE_FALSE (config.isMarginAllowed());
      REQUIRE (config.getInitialCash() == createDecimal("10000"));
      REQUIRE (config.getPositionMode() == PositionMode::LONG_ONLY);
      REQUIRE (config.getMovingAverageType() == MovingAverageType::SIMPLE);
      REQUIRE (config.getVolumeUnits() == TradingVolume::SHARES);
    }

  SECTION ("Fast window equal to slow window")
    {
      REQUIRE_THROWS_AS (makeConfiguration(5, 5), BacktestConfigurationException);
    }

  SECTION ("Fast window above slow window")
    {
      REQUIRE_THROWS_AS (makeConfiguration(10, 4), BacktestConfigurationException);
    }

  SECTION ("Zero fast window")
    {
      REQUIRE_THROWS_AS (makeConfiguration(0, 4), BacktestConfigurationException);
    }

  SECTION ("Non-positive initial cash")
    {
      REQUIRE_THROWS_AS (makeConfiguration(2, 4, "0"), BacktestConfigurationException);
      REQUIRE_THROWS_AS (makeConfiguration(2, 4, "-100"), BacktestConfigurationException);
    }

  SECTION ("withWindows keeps costs and sizing")
    {
      auto config = makeConfiguration(2, 4).withWindows(5, 20);

      REQUIRE (config.getFastWindow() == 5);
      REQUIRE (config.getSlowWindow() == 20);
      REQUIRE (config.getSizingRule().getKind() == SizingRule<DecimalType>::FIXED_QUANTITY);
      REQUIRE (config.getSizingRule().getQuantity() == 10);
      REQUIRE_THROWS_AS (makeConfiguration(2, 4).withWindows(20, 5), BacktestConfigurationException);
    }

  SECTION ("Stream output names every policy")
    {
      std::ostringstream os;
      os << makeConfiguration(2, 4);

      REQUIRE (os.str().find("FixedQuantity(10)") != std::string::npos);
    }
}

TEST_CASE ("SizingRule computes whole units", "[SizingRule]")
{
  SECTION ("Fixed fraction floors to whole units")
    {
      auto rule = SizingRule<DecimalType>::fixedFraction(createDecimal("1.0"));

      REQUIRE (rule.computeUnits(createDecimal("1050"), createDecimal("100")) == 10);
      REQUIRE (rule.computeUnits(createDecimal("99"), createDecimal("100")) == 0);
      REQUIRE (rule.computeUnits(createDecimal("1000"), createDecimal("0")) == 0);
    }

  SECTION ("Half of equity")
    {
      auto rule = SizingRule<DecimalType>::fixedFraction(createDecimal("0.5"));

      REQUIRE (rule.computeUnits(createDecimal("10000"), createDecimal("30")) == 166);
    }

  SECTION ("Fixed quantity ignores equity and price")
    {
      auto rule = SizingRule<DecimalType>::fixedQuantity(25);

      REQUIRE (rule.computeUnits(createDecimal("1"), createDecimal("1000")) == 25);
      REQUIRE (rule.toString() == "FixedQuantity(25)");
    }

  SECTION ("Fraction outside (0, 1]")
    {
      REQUIRE_THROWS_AS (SizingRule<DecimalType>::fixedFraction(createDecimal("0")), BacktestConfigurationException);
      REQUIRE_THROWS_AS (SizingRule<DecimalType>::fixedFraction(createDecimal("1.5")), BacktestConfigurationException);
      REQUIRE_NOTHROW (SizingRule<DecimalType>::fixedFraction(createDecimal("1")));
    }

  SECTION ("Zero quantity")
    {
      REQUIRE_THROWS_AS (SizingRule<DecimalType>::fixedQuantity(0), BacktestConfigurationException);
    }

  SECTION ("Quantity beyond exact decimal range")
    {
      const volume_t limit = num::MaxExactUnits;

      REQUIRE_NOTHROW (SizingRule<DecimalType>::fixedQuantity(limit));
      REQUIRE_THROWS_AS (SizingRule<DecimalType>::fixedQuantity(limit + 1), BacktestConfigurationException);
      // A negative count that wrapped through an unsigned type
      REQUIRE_THROWS_AS (SizingRule<DecimalType>::fixedQuantity(std::numeric_limits<volume_t>::max() - 4),
			 BacktestConfigurationException);
    }
}

TEST_CASE ("Commission and slippage models", "[CommissionModel][SlippageModel]")
{
  SECTION ("Fixed commission is charged per order")
    {
      auto model = CommissionModel<DecimalType>::fixed(createDecimal("1.0"));

      REQUIRE (model.computeCommission(createDecimal("100"), 10) == createDecimal("1.0"));
      REQUIRE (model.computeCommission(createDecimal("50"), 1000) == createDecimal("1.0"));
    }

  SECTION ("Proportional commission scales with notional")
    {
      auto model = CommissionModel<DecimalType>::proportional(createDecimal("0.001"));

      REQUIRE (model.computeCommission(createDecimal("100"), 10) == createDecimal("1.0"));
    }

  SECTION ("Negative parameters are rejected")
    {
      REQUIRE_THROWS_AS (CommissionModel<DecimalType>::fixed(createDecimal("-1")), BacktestConfigurationException);
      REQUIRE_THROWS_AS (SlippageModel<DecimalType>::proportional(createDecimal("-0.01")),
			 BacktestConfigurationException);
    }

  SECTION ("Fixed slippage is per unit")
    {
      auto model = SlippageModel<DecimalType>::fixed(createDecimal("0.05"));

      REQUIRE (model.computePerUnitSlippage(createDecimal("100")) == createDecimal("0.05"));
      REQUIRE (model.computeSlippageCost(createDecimal("100"), 10) == createDecimal("0.5"));
    }

  SECTION ("Proportional slippage is a fraction of the quoted price")
    {
      auto model = SlippageModel<DecimalType>::proportional(createDecimal("0.001"));

      REQUIRE (model.computePerUnitSlippage(createDecimal("200")) == createDecimal("0.2"));
      REQUIRE (model.computeSlippageCost(createDecimal("200"), 5) == createDecimal("1.0"));
    }

  SECTION ("No costs")
    {
      REQUIRE (CommissionModel<DecimalType>::none().computeCommission(createDecimal("100"), 10) ==
	       createDecimal("0"));
      REQUIRE (SlippageModel<DecimalType>::none().computeSlippageCost(createDecimal("100"), 10) ==
	       createDecimal("0"));
    }
}

TEST_CASE ("PositionMode string conversion", "[BacktestConfiguration]")
{
  REQUIRE (getPositionModeFromString("long") == PositionMode::LONG_ONLY);
  REQUIRE (getPositionModeFromString("LONG_SHORT") == PositionMode::LONG_SHORT);
  REQUIRE (positionModeToString(PositionMode::LONG_SHORT) == "LONG_SHORT");
  REQUIRE_THROWS_AS (getPositionModeFromString("sideways"), BacktestConfigurationException);
}
