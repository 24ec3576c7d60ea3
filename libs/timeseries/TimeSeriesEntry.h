// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __TIMESERIES_ENTRY_H
#define __TIMESERIES_ENTRY_H 1

#include <optional>
#include <string>
#include <boost/date_time.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>
#include "TimeSeriesException.h"
#include "TimeFrame.h"
#include "number.h"

namespace mkc_crossover
{
  typedef boost::gregorian::date TimeSeriesDate;
  using boost::posix_time::ptime;
  using boost::posix_time::time_duration;

  // Bar time stamped on entries built from a date only (end of US equity session)
  inline time_duration getDefaultBarTime()
  {
    return time_duration(15, 0, 0);
  }

  //
  // class TimeSeriesEntryException
  //
  // A single bar failed validation. Part of the data error family so callers
  // can catch every ingestion failure through TimeSeriesDataException.
  //

  class TimeSeriesEntryException : public TimeSeriesDataException
  {
  public:
    TimeSeriesEntryException(const std::string msg)
      : TimeSeriesDataException(msg)
    {}

    ~TimeSeriesEntryException()
    {}

  };

  //
  // class OHLCTimeSeriesEntry
  //
  // One OHLCV bar. Immutable after construction; the constructor enforces
  // that no field is negative and that high/low bracket open and close.
  //

  template <class Decimal> class OHLCTimeSeriesEntry
  {
  public:
    OHLCTimeSeriesEntry (const ptime& entryDateTime,
			 const Decimal& open,
			 const Decimal& high,
			 const Decimal& low,
			 const Decimal& close,
			 const Decimal& volumeForEntry,
			 TimeFrame::Duration timeFrame,
			 std::optional<Decimal> dividends = std::nullopt,
			 std::optional<Decimal> splitRatio = std::nullopt)
        : mDateTime(entryDateTime),
          mOpen(open),
          mHigh(high),
          mLow(low),
          mClose(close),
          mVolume(volumeForEntry),
          mTimeFrame(timeFrame),
          mDividends(dividends),
          mSplitRatio(splitRatio)
    {
      if (entryDateTime.is_special())
	throw TimeSeriesEntryException("TimeSeriesEntryException: bar timestamp is not a valid date/time");

      const Decimal& zero = DecimalConstants<Decimal>::DecimalZero;

      checkNonNegative (open, "open");
      checkNonNegative (high, "high");
      checkNonNegative (low, "low");
      checkNonNegative (close, "close");
      checkNonNegative (volumeForEntry, "volume");

      if (high < open)
        throw TimeSeriesEntryException(errorPrefix() + "high of " + num::toString (high) + " is less than open of " + num::toString (open));

      if (high < low)
        throw TimeSeriesEntryException(errorPrefix() + "high of " + num::toString (high) + " is less than low of " + num::toString (low));

      if (high < close)
        throw TimeSeriesEntryException(errorPrefix() + "high of " + num::toString (high) + " is less than close of " + num::toString (close));

      if (low > open)
        throw TimeSeriesEntryException(errorPrefix() + "low of " + num::toString (low) + " is greater than open of " + num::toString (open));

      if (low > close)
        throw TimeSeriesEntryException(errorPrefix() + "low of " + num::toString (low) + " is greater than close of " + num::toString (close));

      if (mDividends && (*mDividends < zero))
	throw TimeSeriesEntryException(errorPrefix() + "dividend of " + num::toString (*mDividends) + " is negative");

      if (mSplitRatio && (*mSplitRatio < zero))
	throw TimeSeriesEntryException(errorPrefix() + "split ratio of " + num::toString (*mSplitRatio) + " is negative");
    }

    OHLCTimeSeriesEntry (const boost::gregorian::date& entryDate,
			 const Decimal& open,
			 const Decimal& high,
			 const Decimal& low,
			 const Decimal& close,
			 const Decimal& volumeForEntry,
			 TimeFrame::Duration timeFrame)
      :  OHLCTimeSeriesEntry (ptime(entryDate, getDefaultBarTime()),
			      open, high, low, close,
			      volumeForEntry, timeFrame)
    {}

    OHLCTimeSeriesEntry (const OHLCTimeSeriesEntry<Decimal>& rhs) = default;
    OHLCTimeSeriesEntry<Decimal>& operator=(const OHLCTimeSeriesEntry<Decimal>& rhs) = default;

    ~OHLCTimeSeriesEntry()
    {}

    TimeFrame::Duration getTimeFrame() const
    {
      return mTimeFrame;
    }

    boost::gregorian::date getDateValue() const
    {
      return mDateTime.date();
    }

    time_duration getBarTime() const
    {
      return mDateTime.time_of_day();
    }

    const ptime& getDateTime() const
    {
      return mDateTime;
    }

    const Decimal& getOpenValue() const
    {
      return mOpen;
    }

    const Decimal& getHighValue() const
    {
      return mHigh;
    }

    const Decimal& getLowValue() const
    {
      return mLow;
    }

    const Decimal& getCloseValue() const
    {
      return mClose;
    }

    const Decimal& getVolumeValue() const
    {
      return mVolume;
    }

    const std::optional<Decimal>& getDividends() const
    {
      return mDividends;
    }

    const std::optional<Decimal>& getSplitRatio() const
    {
      return mSplitRatio;
    }

  private:
    std::string errorPrefix() const
    {
      return std::string ("TimeSeriesEntryException: on - ") +
	boost::posix_time::to_simple_string (mDateTime) + std::string (" ");
    }

    void checkNonNegative (const Decimal& value, const char *fieldName) const
    {
      if (value < DecimalConstants<Decimal>::DecimalZero)
	throw TimeSeriesEntryException(errorPrefix() + fieldName + " of " + num::toString (value) + " is negative");
    }

  private:
    ptime mDateTime;
    Decimal mOpen;
    Decimal mHigh;
    Decimal mLow;
    Decimal mClose;
    Decimal mVolume;
    TimeFrame::Duration mTimeFrame;
    std::optional<Decimal> mDividends;
    std::optional<Decimal> mSplitRatio;
  };

  template <class Decimal>
  bool operator==(const OHLCTimeSeriesEntry<Decimal>& lhs, const OHLCTimeSeriesEntry<Decimal>& rhs)
  {
    return ((lhs.getDateTime() == rhs.getDateTime()) &&
	    (lhs.getOpenValue() == rhs.getOpenValue()) &&
	    (lhs.getHighValue() == rhs.getHighValue()) &&
	    (lhs.getLowValue() == rhs.getLowValue()) &&
	    (lhs.getCloseValue() == rhs.getCloseValue()) &&
	    (lhs.getVolumeValue() == rhs.getVolumeValue()) &&
	    (lhs.getTimeFrame() == rhs.getTimeFrame()) &&
	    (lhs.getDividends() == rhs.getDividends()) &&
	    (lhs.getSplitRatio() == rhs.getSplitRatio()));
  }

  template <class Decimal>
  bool operator!=(const OHLCTimeSeriesEntry<Decimal>& lhs, const OHLCTimeSeriesEntry<Decimal>& rhs)
  {
    return !(lhs == rhs);
  }
}

#endif
