// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __EXIT_MONITOR_H
#define __EXIT_MONITOR_H 1

#include <optional>
#include <stdexcept>
#include <string>
#include "TimeSeriesEntry.h"
#include "BacktestConfiguration.h"
#include "InstrumentPosition.h"
#include "DecimalConstants.h"

namespace mkc_crossover
{
  enum class ExitReason { StopLoss, TakeProfit, TrailingStop };

  inline std::string exitReasonToString (ExitReason reason)
  {
    switch (reason)
      {
      case ExitReason::StopLoss:
	return "STOP_LOSS";
      case ExitReason::TakeProfit:
	return "TAKE_PROFIT";
      case ExitReason::TrailingStop:
	return "TRAILING_STOP";
      }

    throw std::domain_error("exitReasonToString: unknown exit reason");
  }

  /**
   * @class ExitMonitor
   * @brief Checks the open position against the exit policy at each close.
   *
   * The entry price is the position's average cost. The swing extreme starts
   * at the entry price when a position is opened and then follows the
   * highest close (long) or lowest close (short) seen since, including the
   * bar being evaluated. Levels are checked in the order stop loss, trailing
   * stop, take profit and the first one hit is reported. A level that is
   * exactly reached counts as hit.
   *
   * evaluate() sees only bar t and earlier, so an exit it reports can only be
   * acted on by an order filled at the open of bar t+1.
   */
  template <class Decimal>
  class ExitMonitor
  {
  public:
    explicit ExitMonitor (const ExitPolicy<Decimal>& policy)
      : mPolicy(policy),
	mExtremeClose(),
	mEntryBarIndex(0),
	mLongPosition(true)
    {}

    std::optional<ExitReason> evaluate (const InstrumentPosition<Decimal>& position,
					const OHLCTimeSeriesEntry<Decimal>& bar)
    {
      if (position.isFlatPosition())
	{
	  mExtremeClose.reset();
	  return std::nullopt;
	}

      const Decimal entryPrice = position.getAverageCost();
      const Decimal& close = bar.getCloseValue();
      const bool isLong = position.isLongPosition();

      if (!mExtremeClose || (mEntryBarIndex != position.getEntryBarIndex()) || (mLongPosition != isLong))
	{
	  mExtremeClose = entryPrice;
	  mEntryBarIndex = position.getEntryBarIndex();
	  mLongPosition = isLong;
	}

      if (isLong ? (close > *mExtremeClose) : (close < *mExtremeClose))
	mExtremeClose = close;

      if (!mPolicy.isEnabled())
	return std::nullopt;

      const Decimal& one = DecimalConstants<Decimal>::DecimalOne;

      const std::optional<Decimal>& stopLoss = mPolicy.getStopLoss();
      if (stopLoss &&
	  (isLong ? (close <= entryPrice * (one - *stopLoss)) : (close >= entryPrice * (one + *stopLoss))))
	return ExitReason::StopLoss;

      const std::optional<Decimal>& trailingStop = mPolicy.getTrailingStop();
      if (trailingStop &&
	  (isLong ? (close <= *mExtremeClose * (one - *trailingStop))
	   : (close >= *mExtremeClose * (one + *trailingStop))))
	return ExitReason::TrailingStop;

      const std::optional<Decimal>& takeProfit = mPolicy.getTakeProfit();
      if (takeProfit &&
	  (isLong ? (close >= entryPrice * (one + *takeProfit)) : (close <= entryPrice * (one - *takeProfit))))
	return ExitReason::TakeProfit;

      return std::nullopt;
    }

    // Best close since the open position was entered
    const std::optional<Decimal>& getExtremeClose() const
    {
      return mExtremeClose;
    }

  private:
    ExitPolicy<Decimal> mPolicy;
    std::optional<Decimal> mExtremeClose;
    std::size_t mEntryBarIndex;
    bool mLongPosition;
  };
}

#endif
