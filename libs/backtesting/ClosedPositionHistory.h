// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//
#ifndef __CLOSED_POSITION_HISTORY_H
#define __CLOSED_POSITION_HISTORY_H 1

#include <cstdint>
#include <stdexcept>
#include <vector>
#include <boost/accumulators/accumulators.hpp>
#include <boost/accumulators/statistics/stats.hpp>
#include <boost/accumulators/statistics/median.hpp>
#include <boost/accumulators/statistics/mean.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>
#include "TradingVolume.h"
#include "DecimalConstants.h"
#include "number.h"

namespace mkc_crossover
{
  using boost::accumulators::accumulator_set;
  using boost::accumulators::stats;
  using boost::posix_time::ptime;

  typedef boost::accumulators::tag::median median_tag;
  typedef boost::accumulators::tag::mean mean_tag;

  class ClosedPositionHistoryException : public std::runtime_error
  {
  public:
    ClosedPositionHistoryException(const std::string msg)
      : std::runtime_error(msg)
    {}

    ~ClosedPositionHistoryException()
    {}

  };

  /**
   * @class ClosedTrade
   * @brief The part of a position that one reducing fill took off.
   *
   * costs holds the commission and slippage of the opening fills allocated
   * pro rata to the closed units, plus the matching share of the closing
   * fill's costs. netPnl = grossPnl - costs.
   */
  template <class Decimal>
  class ClosedTrade
  {
  public:
    ClosedTrade (bool isLong,
		 const TradingVolume& units,
		 const ptime& entryDateTime,
		 std::size_t entryBarIndex,
		 const Decimal& averageEntryPrice,
		 const ptime& exitDateTime,
		 std::size_t exitBarIndex,
		 const Decimal& exitPrice,
		 const Decimal& grossPnl,
		 const Decimal& costs)
      : mIsLong(isLong),
	mUnits(units),
	mEntryDateTime(entryDateTime),
	mEntryBarIndex(entryBarIndex),
	mAverageEntryPrice(averageEntryPrice),
	mExitDateTime(exitDateTime),
	mExitBarIndex(exitBarIndex),
	mExitPrice(exitPrice),
	mGrossPnl(grossPnl),
	mCosts(costs),
	mNetPnl(grossPnl - costs)
    {
      if (exitBarIndex < entryBarIndex)
	throw ClosedPositionHistoryException("ClosedTrade: exit bar " + std::to_string(exitBarIndex) +
					     " precedes entry bar " + std::to_string(entryBarIndex));
    }

    bool isLongPosition() const { return mIsLong; }
    bool isShortPosition() const { return !mIsLong; }
    const TradingVolume& getUnits() const { return mUnits; }
    const ptime& getEntryDateTime() const { return mEntryDateTime; }
    std::size_t getEntryBarIndex() const { return mEntryBarIndex; }
    const Decimal& getAverageEntryPrice() const { return mAverageEntryPrice; }
    const ptime& getExitDateTime() const { return mExitDateTime; }
    std::size_t getExitBarIndex() const { return mExitBarIndex; }
    const Decimal& getExitPrice() const { return mExitPrice; }
    const Decimal& getGrossPnl() const { return mGrossPnl; }
    const Decimal& getCosts() const { return mCosts; }
    const Decimal& getNetPnl() const { return mNetPnl; }

    std::size_t getNumBarsInPosition() const
    {
      return mExitBarIndex - mEntryBarIndex;
    }

    bool isWinningPosition() const
    {
      return mNetPnl > DecimalConstants<Decimal>::DecimalZero;
    }

    bool isLosingPosition() const
    {
      return mNetPnl < DecimalConstants<Decimal>::DecimalZero;
    }

  private:
    bool mIsLong;
    TradingVolume mUnits;
    ptime mEntryDateTime;
    std::size_t mEntryBarIndex;
    Decimal mAverageEntryPrice;
    ptime mExitDateTime;
    std::size_t mExitBarIndex;
    Decimal mExitPrice;
    Decimal mGrossPnl;
    Decimal mCosts;
    Decimal mNetPnl;
  };

  /**
   * @class ClosedPositionHistory
   * @brief Closed trades of a run in the order they were closed.
   *
   * A trade with net PnL of exactly zero counts neither as a winner nor as a
   * loser, but it does count towards the number of positions.
   */
  template <class Decimal> class ClosedPositionHistory
  {
  public:
    typedef typename std::vector<ClosedTrade<Decimal>>::const_iterator ConstPositionIterator;

    ClosedPositionHistory()
      : mPositions(),
	mSumWinners(DecimalConstants<Decimal>::DecimalZero),
	mSumLosers(DecimalConstants<Decimal>::DecimalZero),
	mNumWinners(0),
	mNumLosers(0),
	mNumBarsInMarket(0),
	mNetPnlStats()
    {}

    ClosedPositionHistory (const ClosedPositionHistory<Decimal>& rhs) = default;
    ClosedPositionHistory<Decimal>& operator=(const ClosedPositionHistory<Decimal>& rhs) = default;

    ~ClosedPositionHistory()
    {}

    void addClosedPosition (const ClosedTrade<Decimal>& trade)
    {
      mPositions.push_back(trade);
      mNumBarsInMarket += trade.getNumBarsInPosition();
      mNetPnlStats(num::to_double(trade.getNetPnl()));

      if (trade.isWinningPosition())
	{
	  ++mNumWinners;
	  mSumWinners += trade.getNetPnl();
	}
      else if (trade.isLosingPosition())
	{
	  ++mNumLosers;
	  mSumLosers += trade.getNetPnl();
	}
    }

    uint32_t getNumPositions() const
    {
      return mPositions.size();
    }

    uint32_t getNumWinningPositions() const
    {
      return mNumWinners;
    }

    uint32_t getNumLosingPositions() const
    {
      return mNumLosers;
    }

    std::size_t getNumBarsInMarket() const
    {
      return mNumBarsInMarket;
    }

    Decimal getTotalNetPnl() const
    {
      return mSumWinners + mSumLosers;
    }

    Decimal getAverageWinningTrade() const
    {
      if (mNumWinners >= 1)
        return mSumWinners / num::fromUnits<Decimal>(mNumWinners);
      else
        return DecimalConstants<Decimal>::DecimalZero;
    }

    Decimal getAverageLosingTrade() const
    {
      if (mNumLosers >= 1)
        return mSumLosers / num::fromUnits<Decimal>(mNumLosers);
      else
        return DecimalConstants<Decimal>::DecimalZero;
    }

    double getMedianNetPnl() const
    {
      if (mPositions.empty())
	return 0.0;

      return boost::accumulators::median(mNetPnlStats);
    }

    double getMeanNetPnl() const
    {
      if (mPositions.empty())
	return 0.0;

      return boost::accumulators::mean(mNetPnlStats);
    }

    // Fraction in [0, 1]
    Decimal getWinRate() const
    {
      if (getNumPositions() > 0)
        return num::fromUnits<Decimal>(mNumWinners) / num::fromUnits<Decimal>(getNumPositions());
      else
        return DecimalConstants<Decimal>::DecimalZero;
    }

    Decimal getPercentWinners() const
    {
      return getWinRate() * DecimalConstants<Decimal>::DecimalOneHundred;
    }

    // Sum of winners divided by the absolute sum of losers; 0 without losers.
    Decimal getProfitFactor() const
    {
      if (mNumLosers == 0)
	return DecimalConstants<Decimal>::DecimalZero;

      return mSumWinners / mSumLosers.abs();
    }

    ConstPositionIterator beginTradingPositions() const
    {
      return mPositions.begin();
    }

    ConstPositionIterator endTradingPositions() const
    {
      return mPositions.end();
    }

  private:
    std::vector<ClosedTrade<Decimal>> mPositions;
    Decimal mSumWinners;
    Decimal mSumLosers;
    uint32_t mNumWinners;
    uint32_t mNumLosers;
    std::size_t mNumBarsInMarket;
    accumulator_set<double, stats<median_tag, mean_tag>> mNetPnlStats;
  };
}

#endif
