#include <catch2/catch_test_macros.hpp>
#include "InstrumentPosition.h"
#include "FillHelpers.h"

using namespace mkc_crossover;

TEST_CASE ("New position is flat", "[InstrumentPosition]")
{
  InstrumentPosition<DecimalType> position;

  REQUIRE (position.isFlatPosition());
  REQUIRE (position.getQuantity() == 0);
  REQUIRE (position.getAverageCost() == createDecimal("0"));
  REQUIRE (position.getMarketValue(createDecimal("100")) == createDecimal("0"));
}

TEST_CASE ("Weighted average cost and realized PnL", "[InstrumentPosition]")
{
  InstrumentPosition<DecimalType> position;

  REQUIRE_FALSE (position.applyFill(createOrderFill(1, OrderSide::Buy, 1, "100", 10)));
  REQUIRE_FALSE (position.applyFill(createOrderFill(2, OrderSide::Buy, 2, "110", 10)));

  REQUIRE (position.isLongPosition());
  REQUIRE (position.getQuantity() == 20);
  REQUIRE (position.getAverageCost() == createDecimal("105"));
  REQUIRE (position.getMarketValue(createDecimal("100")) == createDecimal("2000"));

  SECTION ("Partial close keeps the average cost")
    {
      auto trade = position.applyFill(createOrderFill(3, OrderSide::Sell, 3, "120", 5));

      REQUIRE (trade);
      REQUIRE (trade->isLongPosition());
      REQUIRE (trade->getUnits().getTradingVolume() == 5);
      REQUIRE (trade->getAverageEntryPrice() == createDecimal("105"));
      REQUIRE (trade->getExitPrice() == createDecimal("120"));
      REQUIRE (trade->getGrossPnl() == createDecimal("75"));
      REQUIRE (trade->getEntryBarIndex() == 1);
      REQUIRE (trade->getExitBarIndex() == 3);
      REQUIRE (trade->getNumBarsInPosition() == 2);
      REQUIRE (position.getQuantity() == 15);
      REQUIRE (position.getAverageCost() == createDecimal("105"));
    }

  SECTION ("Reversal closes the long and opens a short at the fill price")
    {
      auto trade = position.applyFill(createOrderFill(3, OrderSide::Sell, 4, "100", 25));

      REQUIRE (trade);
      REQUIRE (trade->getUnits().getTradingVolume() == 20);
      REQUIRE (trade->getGrossPnl() == createDecimal("-100"));
      REQUIRE (trade->isLosingPosition());

      REQUIRE (position.isShortPosition());
      REQUIRE (position.getQuantity() == -5);
      REQUIRE (position.getAverageCost() == createDecimal("100"));
      REQUIRE (position.getMarketValue(createDecimal("90")) == createDecimal("-450"));

      auto cover = position.applyFill(createOrderFill(4, OrderSide::Buy, 5, "90", 5));

      REQUIRE (cover);
      REQUIRE (cover->isShortPosition());
      REQUIRE (cover->getGrossPnl() == createDecimal("50"));
      REQUIRE (cover->getEntryBarIndex() == 4);
      REQUIRE (position.isFlatPosition());
      REQUIRE (position.getAverageCost() == createDecimal("0"));
    }
}

TEST_CASE ("Costs are allocated to closed units", "[InstrumentPosition]")
{
  InstrumentPosition<DecimalType> position;

  position.applyFill(createOrderFill(1, OrderSide::Buy, 1, "100", 10, "2"));
  REQUIRE (position.getOpenCosts() == createDecimal("2"));

  SECTION ("Half of the entry cost goes with half of the units")
    {
      auto first = position.applyFill(createOrderFill(2, OrderSide::Sell, 2, "100", 5, "1"));

      REQUIRE (first->getGrossPnl() == createDecimal("0"));
      REQUIRE (first->getCosts() == createDecimal("2"));
      REQUIRE (first->getNetPnl() == createDecimal("-2"));
      REQUIRE (position.getOpenCosts() == createDecimal("1"));

      auto second = position.applyFill(createOrderFill(3, OrderSide::Sell, 3, "100", 5, "1"));

      REQUIRE (second->getCosts() == createDecimal("2"));
      REQUIRE (position.isFlatPosition());
      REQUIRE (position.getOpenCosts() == createDecimal("0"));
    }

  SECTION ("Reversal splits the exit cost between closed and opened units")
    {
      auto trade = position.applyFill(createOrderFill(2, OrderSide::Sell, 2, "100", 20, "4"));

      REQUIRE (trade->getCosts() == createDecimal("4"));
      REQUIRE (position.getQuantity() == -10);
      REQUIRE (position.getOpenCosts() == createDecimal("2"));
    }
}
