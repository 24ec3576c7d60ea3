#include <catch2/catch_test_macros.hpp>
#include <algorithm>
#include <sstream>
#include "ExecutionSimulator.h"
#include "TestUtils.h"

using namespace mkc_crossover;
using namespace boost::gregorian;

namespace
{
  EntryType createBar (std::size_t barIndex, const std::string& open, const std::string& close)
  {
    const DecimalType o = createDecimal(open);
    const DecimalType c = createDecimal(close);
    return EntryType(date(2020, Jan, 1) + days(static_cast<long>(barIndex)), o, std::max(o, c), std::min(o, c),
		     c, createDecimal("1000"), TimeFrame::DAILY);
  }

  BacktestConfiguration<DecimalType> createConfiguration (const SizingRule<DecimalType>& sizing,
							   const std::string& cash,
							   PositionMode mode = PositionMode::LONG_ONLY,
							   bool allowMargin = false)
  {
    return BacktestConfiguration<DecimalType>(2, 4, sizing,
					      CommissionModel<DecimalType>::fixed(createDecimal("1")),
					      SlippageModel<DecimalType>::fixed(createDecimal("0.1")),
					      allowMargin,
					      createDecimal(cash),
					      mode);
  }
}

TEST_CASE ("Orders are created only on transitions", "[ExecutionSimulator]")
{
  auto config = createConfiguration(SizingRule<DecimalType>::fixedQuantity(10), "10000");
  ExecutionSimulator<DecimalType> simulator(config);
  PortfolioLedger<DecimalType> ledger(config.getInitialCash());

  const EntryType bar0 = createBar(0, "100", "100");
  const EntryType bar1 = createBar(1, "101", "102");
  const EntryType bar2 = createBar(2, "103", "104");

  REQUIRE_FALSE (simulator.onSignal(Signal::Flat, 0, bar0, ledger.markToMarket(0, bar0)));
  REQUIRE_FALSE (simulator.onSignal(Signal::Short, 0, bar0, ledger.markToMarket(0, bar0)));
  REQUIRE (simulator.getTargetExposure() == Signal::Flat);

  auto order = simulator.onSignal(Signal::Long, 0, bar0, ledger.markToMarket(0, bar0));

  REQUIRE (order);
  REQUIRE (order->getOrderID() == 1);
  REQUIRE (order->isBuyOrder());
  REQUIRE (order->getUnitsInOrder().getTradingVolume() == 10);
  REQUIRE (order->getOriginatingBarIndex() == 0);
  REQUIRE (order->isOrderPending());
  REQUIRE (simulator.hasPendingOrder());
  REQUIRE (simulator.getTargetExposure() == Signal::Long);

  SECTION ("Fill waits for the next bar's open")
    {
      REQUIRE_THROWS_AS (simulator.fillPendingOrder(0, bar0, ledger), TradingOrderException);
    }

  SECTION ("Fill at the next open with costs")
    {
      auto fill = simulator.fillPendingOrder(1, bar1, ledger);

      REQUIRE (fill);
      REQUIRE (fill->getBarIndex() == 1);
      REQUIRE (fill->getFillPrice() == createDecimal("101"));
      REQUIRE (fill->getCommission() == createDecimal("1"));
      REQUIRE (fill->getSlippageCost() == createDecimal("1"));
      REQUIRE (order->isOrderFilled());
      REQUIRE (order->getCompletionBarIndex() == 1);
      REQUIRE_FALSE (simulator.hasPendingOrder());
      REQUIRE (ledger.getCash() == createDecimal("8988"));
      REQUIRE (simulator.getFills().size() == 1);

      // a repeated Long is not a transition
      REQUIRE_FALSE (simulator.onSignal(Signal::Long, 1, bar1, ledger.markToMarket(1, bar1)));

      // long only: Short means go flat
      auto exit = simulator.onSignal(Signal::Short, 2, bar2, ledger.markToMarket(2, bar2));
      REQUIRE (exit);
      REQUIRE (exit->isSellOrder());
      REQUIRE (exit->getUnitsInOrder().getTradingVolume() == 10);
      REQUIRE (exit->getOrderID() == 2);
      REQUIRE (simulator.getTargetExposure() == Signal::Flat);
    }

  SECTION ("A second transition while an order is pending is an error")
    {
      REQUIRE_THROWS_AS (simulator.onSignal(Signal::Short, 1, bar1, ledger.markToMarket(1, bar1)),
			 TradingOrderException);
    }

  SECTION ("Nothing to fill")
    {
      simulator.fillPendingOrder(1, bar1, ledger);
      REQUIRE_FALSE (simulator.fillPendingOrder(2, bar2, ledger));
    }
}

TEST_CASE ("Long-short mode reverses through zero", "[ExecutionSimulator]")
{
  auto config = createConfiguration(SizingRule<DecimalType>::fixedQuantity(10), "10000", PositionMode::LONG_SHORT);
  ExecutionSimulator<DecimalType> simulator(config);
  PortfolioLedger<DecimalType> ledger(config.getInitialCash());

  const EntryType bar0 = createBar(0, "100", "100");
  const EntryType bar1 = createBar(1, "100", "100");
  const EntryType bar2 = createBar(2, "100", "100");

  simulator.onSignal(Signal::Long, 0, bar0, ledger.markToMarket(0, bar0));
  simulator.fillPendingOrder(1, bar1, ledger);

  auto reverse = simulator.onSignal(Signal::Short, 1, bar1, ledger.markToMarket(1, bar1));

  REQUIRE (reverse);
  REQUIRE (reverse->isSellOrder());
  REQUIRE (reverse->getUnitsInOrder().getTradingVolume() == 20);
  REQUIRE (simulator.getTargetExposure() == Signal::Short);

  simulator.fillPendingOrder(2, bar2, ledger);
  REQUIRE (ledger.getPosition().getQuantity() == -10);
}

TEST_CASE ("Zero units are rejected on the decision bar", "[ExecutionSimulator]")
{
  auto config = createConfiguration(SizingRule<DecimalType>::fixedFraction(createDecimal("0.01")), "10000");
  std::ostringstream trace;
  ExecutionSimulator<DecimalType> simulator(config, &trace);
  PortfolioLedger<DecimalType> ledger(config.getInitialCash());

  const EntryType bar0 = createBar(0, "2000", "2000");

  auto order = simulator.onSignal(Signal::Long, 0, bar0, ledger.markToMarket(0, bar0));

  REQUIRE (order);
  REQUIRE (order->isOrderRejected());
  REQUIRE (order->getRejectionReason() == RejectionReason::DegenerateQuantity);
  REQUIRE (order->getCompletionBarIndex() == 0);
  REQUIRE (order->getUnitsInOrder().isZero());
  REQUIRE_FALSE (simulator.hasPendingOrder());
  REQUIRE (simulator.getTargetExposure() == Signal::Flat);
  REQUIRE (simulator.getRejectedOrders().size() == 1);
  REQUIRE (trace.str().find("DEGENERATE_QUANTITY") != std::string::npos);
}

TEST_CASE ("Unaffordable orders are rejected at the fill", "[ExecutionSimulator]")
{
  const EntryType bar0 = createBar(0, "100", "100");
  const EntryType bar1 = createBar(1, "100", "100");
  const EntryType bar2 = createBar(2, "100", "100");

  SECTION ("Without margin")
    {
      auto config = createConfiguration(SizingRule<DecimalType>::fixedQuantity(10), "500");
      ExecutionSimulator<DecimalType> simulator(config);
      PortfolioLedger<DecimalType> ledger(config.getInitialCash());

      auto order = simulator.onSignal(Signal::Long, 0, bar0, ledger.markToMarket(0, bar0));

      REQUIRE_FALSE (simulator.fillPendingOrder(1, bar1, ledger));
      REQUIRE (order->isOrderRejected());
      REQUIRE (order->getRejectionReason() == RejectionReason::InsufficientFunds);
      REQUIRE (order->getCompletionBarIndex() == 1);
      REQUIRE (ledger.getCash() == createDecimal("500"));
      REQUIRE (ledger.getPosition().isFlatPosition());
      REQUIRE (simulator.getTargetExposure() == Signal::Flat);

      // the target reverted, so the next Long is a transition again
      auto retry = simulator.onSignal(Signal::Long, 1, bar1, ledger.markToMarket(1, bar1));
      REQUIRE (retry);
      REQUIRE (retry->getOrderID() == 2);
    }

  SECTION ("With margin")
    {
      auto config = createConfiguration(SizingRule<DecimalType>::fixedQuantity(10), "500",
					PositionMode::LONG_ONLY, true);
      ExecutionSimulator<DecimalType> simulator(config);
      PortfolioLedger<DecimalType> ledger(config.getInitialCash());

      simulator.onSignal(Signal::Long, 0, bar0, ledger.markToMarket(0, bar0));

      REQUIRE (simulator.fillPendingOrder(1, bar1, ledger));
      REQUIRE (ledger.getCash() == createDecimal("-502"));
      REQUIRE (ledger.markToMarket(2, bar2).getEquity() == createDecimal("498"));
    }
}

TEST_CASE ("Reversal with an unsizeable new leg closes the old position", "[ExecutionSimulator]")
{
  auto config = createConfiguration(SizingRule<DecimalType>::fixedFraction(createDecimal("0.1")), "1000",
				    PositionMode::LONG_SHORT);
  std::ostringstream trace;
  ExecutionSimulator<DecimalType> simulator(config, &trace);
  PortfolioLedger<DecimalType> ledger(config.getInitialCash());

  const EntryType bar0 = createBar(0, "100", "100");
  const EntryType bar1 = createBar(1, "100", "100");
  const EntryType bar2 = createBar(2, "100", "9000");
  const EntryType bar3 = createBar(3, "9000", "9000");

  simulator.onSignal(Signal::Long, 0, bar0, ledger.markToMarket(0, bar0));
  simulator.fillPendingOrder(1, bar1, ledger);
  REQUIRE (ledger.getPosition().getQuantity() == 1);

  // 0.1 * 9898.9 / 9000 is less than one unit
  auto order = simulator.onSignal(Signal::Short, 2, bar2, ledger.markToMarket(2, bar2));

  REQUIRE (order);
  REQUIRE (order->isOrderPending());
  REQUIRE (order->isSellOrder());
  REQUIRE (order->getUnitsInOrder().getTradingVolume() == 1);
  REQUIRE (simulator.getTargetExposure() == Signal::Flat);
  REQUIRE (simulator.getRejectedOrders().empty());
  REQUIRE (trace.str().find("closing the long position") != std::string::npos);

  REQUIRE (simulator.fillPendingOrder(3, bar3, ledger));
  REQUIRE (ledger.getPosition().isFlatPosition());
}

TEST_CASE ("Price exit closes the whole position one bar later", "[ExecutionSimulator]")
{
  auto config = createConfiguration(SizingRule<DecimalType>::fixedQuantity(10), "10000", PositionMode::LONG_SHORT);
  std::ostringstream trace;
  ExecutionSimulator<DecimalType> simulator(config, &trace);
  PortfolioLedger<DecimalType> ledger(config.getInitialCash());

  const EntryType bar0 = createBar(0, "100", "100");
  const EntryType bar1 = createBar(1, "100", "100");
  const EntryType bar2 = createBar(2, "100", "90");
  const EntryType bar3 = createBar(3, "89", "88");

  REQUIRE_FALSE (simulator.onExit(ExitReason::StopLoss, 0, bar0, ledger.markToMarket(0, bar0)));

  simulator.onSignal(Signal::Short, 0, bar0, ledger.markToMarket(0, bar0));
  simulator.fillPendingOrder(1, bar1, ledger);
  REQUIRE (ledger.getPosition().getQuantity() == -10);

  auto order = simulator.onExit(ExitReason::TrailingStop, 2, bar2, ledger.markToMarket(2, bar2));

  REQUIRE (order);
  REQUIRE (order->isBuyOrder());
  REQUIRE (order->getUnitsInOrder().getTradingVolume() == 10);
  REQUIRE (order->getOriginatingBarIndex() == 2);
  REQUIRE (simulator.getTargetExposure() == Signal::Flat);
  REQUIRE (trace.str().find("exit TRAILING_STOP") != std::string::npos);

  // already on its way to flat
  REQUIRE_FALSE (simulator.onExit(ExitReason::StopLoss, 2, bar2, ledger.markToMarket(2, bar2)));

  auto fill = simulator.fillPendingOrder(3, bar3, ledger);
  REQUIRE (fill);
  REQUIRE (fill->getFillPrice() == createDecimal("89"));
  REQUIRE (ledger.getPosition().isFlatPosition());
}
