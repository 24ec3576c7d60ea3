// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __TIMESERIES_H
#define __TIMESERIES_H 1

#include <vector>
#include <algorithm>
#include <string>
#include <ostream>
#include <boost/date_time/posix_time/posix_time.hpp>
#include "TimeSeriesEntry.h"
#include "TimeSeriesException.h"

namespace mkc_crossover
{
  using boost::posix_time::ptime;

  /**
   * @class OHLCTimeSeries
   * @brief Strictly time-ordered sequence of OHLCV bars for one instrument.
   *
   * Entries may only be appended, and each appended entry must be stamped
   * later than the last one. Out-of-order or duplicate timestamps raise
   * TimeSeriesDataException instead of being re-sorted: the series is the
   * clock of a backtest and is never repaired.
   *
   * Once handed to a BackTester (as shared_ptr<const OHLCTimeSeries>) the
   * series is read-only, which lets any number of runs share it concurrently
   * without locking.
   *
   * @tparam Decimal Numeric type of the bar fields.
   */
  template <class Decimal>
  class OHLCTimeSeries
  {
  public:
    using EntryType = OHLCTimeSeriesEntry<Decimal>;
    using ConstRandomAccessIterator = typename std::vector<EntryType>::const_iterator;

    explicit OHLCTimeSeries (TimeFrame::Duration timeFrame)
      : mSequentialTimeSeries(),
	mTimeFrame(timeFrame)
    {}

    OHLCTimeSeries (TimeFrame::Duration timeFrame, std::size_t numElements)
      : mSequentialTimeSeries(),
	mTimeFrame(timeFrame)
    {
      mSequentialTimeSeries.reserve(numElements);
    }

    OHLCTimeSeries (const OHLCTimeSeries<Decimal>& rhs) = default;
    OHLCTimeSeries<Decimal>& operator=(const OHLCTimeSeries<Decimal>& rhs) = default;

    ~OHLCTimeSeries()
    {}

    /**
     * @brief Append a bar to the end of the series.
     * @throws TimeSeriesDataException if the bar's time frame differs from the
     *         series or its timestamp is not strictly after the last bar.
     */
    void addEntry (const EntryType& entry)
    {
      if (entry.getTimeFrame() != getTimeFrame())
	throw TimeSeriesDataException("OHLCTimeSeries::addEntry - time frame of entry at " +
				      boost::posix_time::to_simple_string(entry.getDateTime()) +
				      " does not match the series time frame");

      if (!mSequentialTimeSeries.empty() &&
	  (entry.getDateTime() <= mSequentialTimeSeries.back().getDateTime()))
	throw TimeSeriesDataException("OHLCTimeSeries::addEntry - timestamp " +
				      boost::posix_time::to_simple_string(entry.getDateTime()) +
				      " is not after previous bar at " +
				      boost::posix_time::to_simple_string(mSequentialTimeSeries.back().getDateTime()));

      mSequentialTimeSeries.push_back(entry);
    }

    TimeFrame::Duration getTimeFrame() const
    {
      return mTimeFrame;
    }

    std::size_t getNumEntries() const
    {
      return mSequentialTimeSeries.size();
    }

    bool isEmpty() const
    {
      return mSequentialTimeSeries.empty();
    }

    const EntryType& getEntry (std::size_t barIndex) const
    {
      if (barIndex >= mSequentialTimeSeries.size())
	throw TimeSeriesOffsetOutOfRangeException("OHLCTimeSeries::getEntry - bar index " +
						  std::to_string(barIndex) + " is out of range, series has " +
						  std::to_string(mSequentialTimeSeries.size()) + " entries");

      return mSequentialTimeSeries[barIndex];
    }

    const ptime& getFirstDateTime() const
    {
      return getEntry(0).getDateTime();
    }

    const ptime& getLastDateTime() const
    {
      if (isEmpty())
	throw TimeSeriesDataException("OHLCTimeSeries::getLastDateTime - series is empty");

      return mSequentialTimeSeries.back().getDateTime();
    }

    ConstRandomAccessIterator beginRandomAccess() const
    {
      return mSequentialTimeSeries.begin();
    }

    ConstRandomAccessIterator endRandomAccess() const
    {
      return mSequentialTimeSeries.end();
    }

  private:
    std::vector<EntryType> mSequentialTimeSeries;
    TimeFrame::Duration mTimeFrame;
  };

  template <class Decimal>
  bool operator==(const OHLCTimeSeries<Decimal>& lhs, const OHLCTimeSeries<Decimal>& rhs)
  {
    if (lhs.getTimeFrame() != rhs.getTimeFrame())
      return false;

    if (lhs.getNumEntries() != rhs.getNumEntries())
      return false;

    return std::equal(lhs.beginRandomAccess(), lhs.endRandomAccess(), rhs.beginRandomAccess());
  }

  template <class Decimal>
  bool operator!=(const OHLCTimeSeries<Decimal>& lhs, const OHLCTimeSeries<Decimal>& rhs)
  {
    return !(lhs == rhs);
  }

  template <class Decimal>
  std::ostream& operator<<(std::ostream& os, const OHLCTimeSeries<Decimal>& series)
  {
    os << "DateTime,Open,High,Low,Close,Volume" << std::endl;

    for (auto it = series.beginRandomAccess(); it != series.endRandomAccess(); ++it)
      {
	os << boost::posix_time::to_simple_string(it->getDateTime()) << ","
	   << it->getOpenValue() << ","
	   << it->getHighValue() << ","
	   << it->getLowValue() << ","
	   << it->getCloseValue() << ","
	   << it->getVolumeValue() << std::endl;
      }

    return os;
  }
}

#endif
