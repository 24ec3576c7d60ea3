// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __TIME_SERIES_INDICATORS_H
#define __TIME_SERIES_INDICATORS_H 1

#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <boost/circular_buffer.hpp>
#include <boost/algorithm/string.hpp>
#include "TimeSeriesEntry.h"
#include "DecimalConstants.h"
#include "number.h"

namespace mkc_crossover
{
  class IndicatorException : public std::domain_error
  {
  public:
    IndicatorException(const std::string msg)
      : std::domain_error(msg)
    {}

    ~IndicatorException()
    {}
  };

  enum class MovingAverageType { SIMPLE, EXPONENTIAL };

  inline MovingAverageType getMovingAverageTypeFromString(const std::string& typeString)
  {
    const std::string name = boost::algorithm::to_lower_copy(typeString);

    if ((name == "sma") || (name == "simple"))
      return MovingAverageType::SIMPLE;
    else if ((name == "ema") || (name == "exponential"))
      return MovingAverageType::EXPONENTIAL;

    throw IndicatorException("getMovingAverageTypeFromString: unknown moving average type " + typeString);
  }

  inline std::string movingAverageTypeToString(MovingAverageType type)
  {
    switch (type)
      {
      case MovingAverageType::SIMPLE:
	return "SMA";
      case MovingAverageType::EXPONENTIAL:
	return "EMA";
      }

    throw IndicatorException("movingAverageTypeToString: unknown moving average type");
  }

  /**
   * @class MovingAverage
   * @brief Incremental rolling statistic over the close of each bar.
   *
   * update() is called exactly once per bar, in series order. The value it
   * returns for bar t depends only on bars 0..t. Until the window has been
   * filled the indicator is undefined and update() returns std::nullopt,
   * which callers must treat as "no signal possible yet".
   *
   * Implementations must be O(1) amortized per update.
   */
  template <class Decimal>
  class MovingAverage
  {
  public:
    explicit MovingAverage (unsigned int window)
      : mWindow(window)
    {
      if (window == 0)
	throw IndicatorException("MovingAverage: window length must be positive");
    }

    virtual ~MovingAverage()
    {}

    virtual std::optional<Decimal> update (const OHLCTimeSeriesEntry<Decimal>& entry) = 0;
    virtual std::optional<Decimal> getValue() const = 0;
    virtual MovingAverageType getType() const = 0;

    bool isReady() const
    {
      return getValue().has_value();
    }

    unsigned int getWindow() const
    {
      return mWindow;
    }

  private:
    unsigned int mWindow;
  };

  /**
   * @class SimpleMovingAverage
   * @brief Arithmetic mean of the last N closes.
   *
   * Keeps the last N closes in a bounded circular buffer together with their
   * running sum; each update adds the new close and subtracts the one that
   * falls out of the window. With fixed-point Decimal the running sum is
   * exact, so there is no drift to re-anchor.
   */
  template <class Decimal>
  class SimpleMovingAverage : public MovingAverage<Decimal>
  {
  public:
    explicit SimpleMovingAverage (unsigned int window)
      : MovingAverage<Decimal>(window),
	mCloses(window),
	mRunningSum(DecimalConstants<Decimal>::DecimalZero),
	mDivisor(num::fromUnits<Decimal>(window)),
	mValue()
    {}

    std::optional<Decimal> update (const OHLCTimeSeriesEntry<Decimal>& entry) override
    {
      const Decimal& close = entry.getCloseValue();

      if (mCloses.full())
	mRunningSum -= mCloses.front();

      mCloses.push_back(close);
      mRunningSum += close;

      if (mCloses.full())
	mValue = mRunningSum / mDivisor;

      return mValue;
    }

    std::optional<Decimal> getValue() const override
    {
      return mValue;
    }

    MovingAverageType getType() const override
    {
      return MovingAverageType::SIMPLE;
    }

  private:
    boost::circular_buffer<Decimal> mCloses;
    Decimal mRunningSum;
    Decimal mDivisor;
    std::optional<Decimal> mValue;
  };

  /**
   * @class ExponentialMovingAverage
   * @brief EMA with smoothing alpha = 2 / (N + 1).
   *
   * Undefined for the first N-1 bars. The value at bar N-1 is seeded with the
   * simple mean of the first N closes; afterwards
   *   ema = ema + alpha * (close - ema)
   */
  template <class Decimal>
  class ExponentialMovingAverage : public MovingAverage<Decimal>
  {
  public:
    explicit ExponentialMovingAverage (unsigned int window)
      : MovingAverage<Decimal>(window),
	mAlpha(DecimalConstants<Decimal>::DecimalTwo / num::fromUnits<Decimal>(window + 1)),
	mSeedSum(DecimalConstants<Decimal>::DecimalZero),
	mBarsSeen(0),
	mValue()
    {}

    std::optional<Decimal> update (const OHLCTimeSeriesEntry<Decimal>& entry) override
    {
      return updateValue(entry.getCloseValue());
    }

    // Smooths an arbitrary input series; MACD feeds its own line through here
    std::optional<Decimal> updateValue (const Decimal& value)
    {
      if (mValue)
	{
	  mValue = *mValue + mAlpha * (value - *mValue);
	  return mValue;
	}

      mSeedSum += value;
      ++mBarsSeen;

      if (mBarsSeen == this->getWindow())
	mValue = mSeedSum / num::fromUnits<Decimal>(this->getWindow());

      return mValue;
    }

    std::optional<Decimal> getValue() const override
    {
      return mValue;
    }

    MovingAverageType getType() const override
    {
      return MovingAverageType::EXPONENTIAL;
    }

    const Decimal& getSmoothingFactor() const
    {
      return mAlpha;
    }

  private:
    Decimal mAlpha;
    Decimal mSeedSum;
    unsigned int mBarsSeen;
    std::optional<Decimal> mValue;
  };

  template <class Decimal>
  std::unique_ptr<MovingAverage<Decimal>> createMovingAverage (MovingAverageType type,
							       unsigned int window)
  {
    switch (type)
      {
      case MovingAverageType::SIMPLE:
	return std::make_unique<SimpleMovingAverage<Decimal>>(window);
      case MovingAverageType::EXPONENTIAL:
	return std::make_unique<ExponentialMovingAverage<Decimal>>(window);
      }

    throw IndicatorException("createMovingAverage: unknown moving average type");
  }

  /**
   * @class MovingAverageConvergenceDivergence
   * @brief MACD line = EMA(fast) - EMA(slow) of the close; signal line = EMA
   *        of the MACD line over the signal window.
   *
   * The MACD line is defined from bar slow-1 onwards and the signal line
   * signal-1 bars later. Both averages use the same seeding as
   * ExponentialMovingAverage.
   */
  template <class Decimal>
  class MovingAverageConvergenceDivergence
  {
  public:
    MovingAverageConvergenceDivergence (unsigned int fastWindow,
					unsigned int slowWindow,
					unsigned int signalWindow)
      : mFastAverage(fastWindow),
	mSlowAverage(slowWindow),
	mSignalAverage(signalWindow),
	mMacdLine(),
	mSignalLine()
    {
      if (fastWindow >= slowWindow)
	throw IndicatorException("MovingAverageConvergenceDivergence: fast window " + std::to_string(fastWindow) +
				 " must be less than slow window " + std::to_string(slowWindow));
    }

    void update (const OHLCTimeSeriesEntry<Decimal>& entry)
    {
      const std::optional<Decimal> fastValue = mFastAverage.update(entry);
      const std::optional<Decimal> slowValue = mSlowAverage.update(entry);

      if (!fastValue || !slowValue)
	return;

      mMacdLine = *fastValue - *slowValue;
      mSignalLine = mSignalAverage.updateValue(*mMacdLine);
    }

    const std::optional<Decimal>& getMacdLine() const
    {
      return mMacdLine;
    }

    const std::optional<Decimal>& getSignalLine() const
    {
      return mSignalLine;
    }

    std::optional<Decimal> getHistogram() const
    {
      if (!mMacdLine || !mSignalLine)
	return std::nullopt;

      return *mMacdLine - *mSignalLine;
    }

  private:
    ExponentialMovingAverage<Decimal> mFastAverage;
    ExponentialMovingAverage<Decimal> mSlowAverage;
    ExponentialMovingAverage<Decimal> mSignalAverage;
    std::optional<Decimal> mMacdLine;
    std::optional<Decimal> mSignalLine;
  };

  /**
   * @class RelativeStrengthIndex
   * @brief Wilder's RSI over N close-to-close changes, in [0, 100].
   *
   * The average gain and loss are seeded with the simple mean of the first N
   * changes, so the first value appears on bar N. Afterwards
   *   avg = (avg * (N - 1) + change) / N
   * RSI is 100 when there were no losses and 50 when the closes never moved.
   */
  template <class Decimal>
  class RelativeStrengthIndex
  {
  public:
    explicit RelativeStrengthIndex (unsigned int period)
      : mPeriod(period),
	mPreviousClose(),
	mAverageGain(DecimalConstants<Decimal>::DecimalZero),
	mAverageLoss(DecimalConstants<Decimal>::DecimalZero),
	mChangesSeen(0),
	mValue()
    {
      if (period == 0)
	throw IndicatorException("RelativeStrengthIndex: period must be positive");
    }

    std::optional<Decimal> update (const OHLCTimeSeriesEntry<Decimal>& entry)
    {
      const Decimal& close = entry.getCloseValue();
      const Decimal& zero = DecimalConstants<Decimal>::DecimalZero;

      if (!mPreviousClose)
	{
	  mPreviousClose = close;
	  return mValue;
	}

      const Decimal change = close - *mPreviousClose;
      const Decimal gain = (change > zero) ? change : zero;
      const Decimal loss = (change < zero) ? (zero - change) : zero;
      const Decimal period = num::fromUnits<Decimal>(mPeriod);

      mPreviousClose = close;
      ++mChangesSeen;

      if (mChangesSeen <= mPeriod)
	{
	  mAverageGain += gain;
	  mAverageLoss += loss;

	  if (mChangesSeen < mPeriod)
	    return mValue;

	  mAverageGain /= period;
	  mAverageLoss /= period;
	}
      else
	{
	  const Decimal weight = num::fromUnits<Decimal>(mPeriod - 1);
	  mAverageGain = ((mAverageGain * weight) + gain) / period;
	  mAverageLoss = ((mAverageLoss * weight) + loss) / period;
	}

      mValue = computeIndex();
      return mValue;
    }

    std::optional<Decimal> getValue() const
    {
      return mValue;
    }

    unsigned int getPeriod() const
    {
      return mPeriod;
    }

  private:
    Decimal computeIndex() const
    {
      const Decimal& zero = DecimalConstants<Decimal>::DecimalZero;
      const Decimal& hundred = DecimalConstants<Decimal>::DecimalOneHundred;

      if (mAverageLoss == zero)
	return (mAverageGain == zero) ? (hundred / DecimalConstants<Decimal>::DecimalTwo) : hundred;

      // 100 - 100 / (1 + gain / loss), rearranged to divide once
      return (hundred * mAverageGain) / (mAverageGain + mAverageLoss);
    }

  private:
    unsigned int mPeriod;
    std::optional<Decimal> mPreviousClose;
    Decimal mAverageGain;
    Decimal mAverageLoss;
    unsigned int mChangesSeen;
    std::optional<Decimal> mValue;
  };
}

#endif
