#include <catch2/catch_test_macros.hpp>
#include "PortfolioLedger.h"
#include "FillHelpers.h"

using namespace mkc_crossover;
using namespace boost::gregorian;

namespace
{
  EntryType createBar (std::size_t barIndex, const std::string& close)
  {
    const DecimalType price = createDecimal(close);
    return EntryType(date(2020, Jan, 1) + days(static_cast<long>(barIndex)), price, price, price, price,
		     createDecimal("1000"), TimeFrame::DAILY);
  }
}

TEST_CASE ("PortfolioLedger starts with cash only", "[PortfolioLedger]")
{
  PortfolioLedger<DecimalType> ledger(createDecimal("10000"));

  auto snapshot = ledger.markToMarket(0, createBar(0, "50"));

  REQUIRE (snapshot.getBarIndex() == 0);
  REQUIRE (snapshot.getCash() == createDecimal("10000"));
  REQUIRE (snapshot.getPositionQuantity() == 0);
  REQUIRE (snapshot.getPositionMarketValue() == createDecimal("0"));
  REQUIRE (snapshot.getEquity() == createDecimal("10000"));
  REQUIRE (ledger.getNumFillsApplied() == 0);
}

TEST_CASE ("PortfolioLedger applies fills", "[PortfolioLedger]")
{
  PortfolioLedger<DecimalType> ledger(createDecimal("1050"));

  SECTION ("Buy with a fixed commission")
    {
      ledger.apply(createOrderFill(1, OrderSide::Buy, 3, "100", 10, "1.0"));

      REQUIRE (ledger.getCash() == createDecimal("49"));
      REQUIRE (ledger.getPosition().getQuantity() == 10);
      REQUIRE (ledger.getTotalCommission() == createDecimal("1"));

      auto snapshot = ledger.markToMarket(3, createBar(3, "105"));
      REQUIRE (snapshot.getPositionMarketValue() == createDecimal("1050"));
      REQUIRE (snapshot.getEquity() == createDecimal("1099"));
    }

  SECTION ("Round trip realizes PnL and records a closed trade")
    {
      ledger.apply(createOrderFill(1, OrderSide::Buy, 3, "100", 10, "1", "0.5"));
      ledger.apply(createOrderFill(2, OrderSide::Sell, 5, "110", 10, "1", "0.5"));

      REQUIRE (ledger.getPosition().isFlatPosition());
      REQUIRE (ledger.getRealizedPnl() == createDecimal("100"));
      REQUIRE (ledger.getTotalCommission() == createDecimal("2"));
      REQUIRE (ledger.getTotalSlippage() == createDecimal("1"));
      REQUIRE (ledger.getCash() == createDecimal("1147"));
      REQUIRE (ledger.getClosedPositionHistory().getNumPositions() == 1);
      REQUIRE (ledger.getClosedPositionHistory().beginTradingPositions()->getNetPnl() == createDecimal("97"));
      REQUIRE (ledger.getNumFillsApplied() == 2);

      auto snapshot = ledger.markToMarket(5, createBar(5, "120"));
      REQUIRE (snapshot.getEquity() == createDecimal("1147"));
    }

  SECTION ("Short sale credits the proceeds")
    {
      ledger.apply(createOrderFill(1, OrderSide::Sell, 3, "100", 5));

      REQUIRE (ledger.getCash() == createDecimal("1550"));
      REQUIRE (ledger.getPosition().getQuantity() == -5);

      auto snapshot = ledger.markToMarket(4, createBar(4, "90"));
      REQUIRE (snapshot.getPositionMarketValue() == createDecimal("-450"));
      REQUIRE (snapshot.getEquity() == createDecimal("1100"));
    }

  SECTION ("Zero quantity fill is refused")
    {
      REQUIRE_THROWS_AS (ledger.apply(createOrderFill(1, OrderSide::Buy, 3, "100", 0)), PortfolioLedgerException);
      REQUIRE (ledger.getCash() == createDecimal("1050"));
    }
}

TEST_CASE ("PortfolioLedger equity reconciles with realized and unrealized PnL", "[PortfolioLedger]")
{
  PortfolioLedger<DecimalType> ledger(createDecimal("100000"));

  // Average cost of these three buys is not representable: 3011.3 / 30
  ledger.apply(createOrderFill(1, OrderSide::Buy, 1, "100", 10, "1.25"));
  ledger.apply(createOrderFill(2, OrderSide::Buy, 2, "100", 10, "1.25", "0.1"));
  ledger.apply(createOrderFill(3, OrderSide::Buy, 3, "101.01", 10, "1.25"));
  REQUIRE_NOTHROW (ledger.markToMarket(3, createBar(3, "101.01")));
  REQUIRE (ledger.getPosition().getCostBasis() == createDecimal("3011.3"));

  // Partial close takes 7/30 of the basis
  ledger.apply(createOrderFill(4, OrderSide::Sell, 4, "103.37", 7, "1.25"));
  REQUIRE_NOTHROW (ledger.markToMarket(4, createBar(4, "102.13")));

  // Reversal closes the remaining 23 units and opens a 17 unit short
  ledger.apply(createOrderFill(5, OrderSide::Sell, 5, "99.99", 40, "2.5", "0.4"));
  REQUIRE (ledger.getPosition().getQuantity() == -17);
  REQUIRE (ledger.getPosition().getCostBasis() == createDecimal("1699.83"));

  const EntryType lastBar = createBar(6, "98.5");
  const PortfolioSnapshot<DecimalType> snapshot = ledger.markToMarket(6, lastBar);

  const DecimalType pnlEquity = ledger.getInitialCash() + ledger.getRealizedPnl()
    + ledger.getPosition().getUnrealizedPnl(lastBar.getCloseValue())
    - ledger.getTotalCommission() - ledger.getTotalSlippage();

  REQUIRE (snapshot.getEquity() == pnlEquity);
  REQUIRE (ledger.getPosition().getUnrealizedPnl(lastBar.getCloseValue()) == createDecimal("25.33"));
  REQUIRE (ledger.getClosedPositionHistory().getNumPositions() == 2);
}

TEST_CASE ("PortfolioLedger funds check", "[PortfolioLedger]")
{
  PortfolioLedger<DecimalType> ledger(createDecimal("500"));

  auto tooLarge = createOrderFill(1, OrderSide::Buy, 3, "100", 10);
  auto affordable = createOrderFill(2, OrderSide::Buy, 3, "100", 4, "1");
  auto exact = createOrderFill(3, OrderSide::Buy, 3, "100", 5);

  REQUIRE (ledger.getCashAfterFill(tooLarge) == createDecimal("-500"));
  REQUIRE_THROWS_AS (ledger.checkSufficientFunds(tooLarge), InsufficientFundsException);
  REQUIRE_NOTHROW (ledger.checkSufficientFunds(affordable));
  REQUIRE_NOTHROW (ledger.checkSufficientFunds(exact));

  // checking never changes the books
  REQUIRE (ledger.getCash() == createDecimal("500"));
  REQUIRE (ledger.getPosition().isFlatPosition());
}

TEST_CASE ("PortfolioSnapshot equality", "[PortfolioLedger]")
{
  PortfolioLedger<DecimalType> ledger(createDecimal("1000"));

  auto first = ledger.markToMarket(0, createBar(0, "10"));
  auto again = ledger.markToMarket(0, createBar(0, "10"));
  auto next = ledger.markToMarket(1, createBar(1, "10"));

  REQUIRE (first == again);
  REQUIRE (first != next);
}
