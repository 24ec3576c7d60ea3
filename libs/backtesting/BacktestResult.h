// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __BACKTEST_RESULT_H
#define __BACKTEST_RESULT_H 1

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <boost/date_time/posix_time/posix_time.hpp>
#include "BacktestConfiguration.h"
#include "CrossoverSignal.h"
#include "ExitMonitor.h"
#include "TradingOrder.h"
#include "PortfolioLedger.h"
#include "ClosedPositionHistory.h"
#include "PerformanceAnalyzer.h"

namespace mkc_crossover
{
  using boost::posix_time::ptime;

  enum class RunStatus { Completed, Aborted };

  inline std::string runStatusToString (RunStatus status)
  {
    return (status == RunStatus::Completed) ? "COMPLETED" : "ABORTED";
  }

  /**
   * @brief Indicator values and the decisions taken at the close of one bar.
   *
   * fastValue and slowValue are the two crossed lines: the moving averages,
   * or the MACD and signal lines. rsiValue is only set when the RSI gate is
   * on. exitReason is the price exit that was hit, if any.
   */
  template <class Decimal>
  struct SignalRecord
  {
    std::size_t barIndex;
    ptime dateTime;
    std::optional<Decimal> fastValue;
    std::optional<Decimal> slowValue;
    Signal signal;
    std::optional<Decimal> rsiValue;
    std::optional<ExitReason> exitReason;
  };

  template <class Decimal>
  bool operator==(const SignalRecord<Decimal>& lhs, const SignalRecord<Decimal>& rhs)
  {
    return (lhs.barIndex == rhs.barIndex) && (lhs.dateTime == rhs.dateTime) &&
      (lhs.fastValue == rhs.fastValue) && (lhs.slowValue == rhs.slowValue) &&
      (lhs.signal == rhs.signal) && (lhs.rsiValue == rhs.rsiValue) &&
      (lhs.exitReason == rhs.exitReason);
  }

  template <class Decimal>
  bool operator!=(const SignalRecord<Decimal>& lhs, const SignalRecord<Decimal>& rhs)
  {
    return !(lhs == rhs);
  }

  /**
   * @class BacktestResult
   * @brief Everything one run produced.
   *
   * Built only by BackTester and immutable afterwards. An aborted run keeps
   * the history accumulated up to the failing bar together with the reason.
   * Orders are copied out of the run, so the result outlives the BackTester.
   */
  template <class Decimal>
  class BacktestResult
  {
  public:
    BacktestResult (const BacktestConfiguration<Decimal>& configuration,
		    RunStatus status,
		    const std::string& abortReason,
		    std::vector<SignalRecord<Decimal>> signals,
		    std::vector<TradingOrder<Decimal>> orders,
		    std::vector<OrderFill<Decimal>> fills,
		    std::vector<PortfolioSnapshot<Decimal>> snapshots,
		    const ClosedPositionHistory<Decimal>& closedTrades,
		    const PerformanceSummary<Decimal>& summary)
      : mConfiguration(configuration),
	mStatus(status),
	mAbortReason(abortReason),
	mSignals(std::move(signals)),
	mOrders(std::move(orders)),
	mFills(std::move(fills)),
	mSnapshots(std::move(snapshots)),
	mClosedTrades(closedTrades),
	mSummary(summary)
    {}

    const BacktestConfiguration<Decimal>& getConfiguration() const { return mConfiguration; }
    RunStatus getStatus() const { return mStatus; }
    bool isCompleted() const { return mStatus == RunStatus::Completed; }
    bool isAborted() const { return mStatus == RunStatus::Aborted; }
    const std::string& getAbortReason() const { return mAbortReason; }

    const std::vector<SignalRecord<Decimal>>& getSignals() const { return mSignals; }
    const std::vector<TradingOrder<Decimal>>& getOrders() const { return mOrders; }
    const std::vector<OrderFill<Decimal>>& getFills() const { return mFills; }
    const std::vector<PortfolioSnapshot<Decimal>>& getSnapshots() const { return mSnapshots; }
    const ClosedPositionHistory<Decimal>& getClosedPositionHistory() const { return mClosedTrades; }
    const PerformanceSummary<Decimal>& getSummary() const { return mSummary; }

    std::vector<TradingOrder<Decimal>> getRejectedOrders() const
    {
      std::vector<TradingOrder<Decimal>> rejected;
      for (const auto& order : mOrders)
	if (order.isOrderRejected())
	  rejected.push_back(order);

      return rejected;
    }

    // Long and Short signals only, in bar order
    std::vector<SignalRecord<Decimal>> getSignalTransitions() const
    {
      std::vector<SignalRecord<Decimal>> transitions;
      for (const auto& record : mSignals)
	if (record.signal != Signal::Flat)
	  transitions.push_back(record);

      return transitions;
    }

    // Bars on which a stop loss, take profit or trailing stop was hit
    std::vector<SignalRecord<Decimal>> getExitTriggers() const
    {
      std::vector<SignalRecord<Decimal>> triggers;
      for (const auto& record : mSignals)
	if (record.exitReason)
	  triggers.push_back(record);

      return triggers;
    }

    // Equity of each bar, in bar order
    std::vector<Decimal> getEquityCurve() const
    {
      std::vector<Decimal> curve;
      curve.reserve(mSnapshots.size());
      for (const auto& snapshot : mSnapshots)
	curve.push_back(snapshot.getEquity());

      return curve;
    }

    const Decimal& getFinalEquity() const
    {
      return mSummary.finalEquity;
    }

  private:
    BacktestConfiguration<Decimal> mConfiguration;
    RunStatus mStatus;
    std::string mAbortReason;
    std::vector<SignalRecord<Decimal>> mSignals;
    std::vector<TradingOrder<Decimal>> mOrders;
    std::vector<OrderFill<Decimal>> mFills;
    std::vector<PortfolioSnapshot<Decimal>> mSnapshots;
    ClosedPositionHistory<Decimal> mClosedTrades;
    PerformanceSummary<Decimal> mSummary;
  };
}

#endif
