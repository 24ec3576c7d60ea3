// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __SIGNAL_ENGINE_H
#define __SIGNAL_ENGINE_H 1

#include <memory>
#include <optional>
#include "TimeSeriesEntry.h"
#include "TimeSeriesIndicators.h"
#include "BacktestConfiguration.h"
#include "CrossoverSignal.h"

namespace mkc_crossover
{
  /**
   * @class SignalEngine
   * @brief Owns the indicators of one run and classifies each bar.
   *
   * The two crossed lines depend on the signal rule: the fast and slow
   * moving averages, or the MACD line (EMA fast - EMA slow) and its signal
   * line. Either pair goes through the same CrossoverSignalGenerator. When
   * the policy has an RSI gate, a Short from the generator is replaced by
   * Flat unless the RSI of the bar is above the overbought level.
   *
   * update() must be called once per bar in series order.
   */
  template <class Decimal>
  class SignalEngine
  {
  public:
    explicit SignalEngine (const BacktestConfiguration<Decimal>& configuration)
      : mPolicy(configuration.getSignalPolicy()),
	mFastAverage(),
	mSlowAverage(),
	mMacd(),
	mRsi(),
	mGenerator(),
	mFastValue(),
	mSlowValue(),
	mRsiValue()
    {
      if (mPolicy.getRule() == SignalRule::MACD_CROSSOVER)
	mMacd = std::make_unique<MovingAverageConvergenceDivergence<Decimal>>(configuration.getFastWindow(),
									      configuration.getSlowWindow(),
									      mPolicy.getSignalWindow());
      else
	{
	  mFastAverage = createMovingAverage<Decimal>(configuration.getMovingAverageType(),
						      configuration.getFastWindow());
	  mSlowAverage = createMovingAverage<Decimal>(configuration.getMovingAverageType(),
						      configuration.getSlowWindow());
	}

      if (mPolicy.hasRsiGate())
	mRsi = std::make_unique<RelativeStrengthIndex<Decimal>>(mPolicy.getRsiPeriod());
    }

    SignalEngine (const SignalEngine<Decimal>& rhs) = delete;
    SignalEngine<Decimal>& operator=(const SignalEngine<Decimal>& rhs) = delete;

    Signal update (const OHLCTimeSeriesEntry<Decimal>& bar)
    {
      if (mMacd)
	{
	  mMacd->update(bar);
	  mFastValue = mMacd->getMacdLine();
	  mSlowValue = mMacd->getSignalLine();
	}
      else
	{
	  mFastValue = mFastAverage->update(bar);
	  mSlowValue = mSlowAverage->update(bar);
	}

      if (mRsi)
	mRsiValue = mRsi->update(bar);

      const Signal signal = mGenerator.classify(mFastValue, mSlowValue);

      if ((signal == Signal::Short) && mRsi &&
	  (!mRsiValue || (*mRsiValue <= *mPolicy.getRsiOverbought())))
	return Signal::Flat;

      return signal;
    }

    // Fast moving average, or the MACD line
    const std::optional<Decimal>& getFastValue() const
    {
      return mFastValue;
    }

    // Slow moving average, or the MACD signal line
    const std::optional<Decimal>& getSlowValue() const
    {
      return mSlowValue;
    }

    const std::optional<Decimal>& getRsiValue() const
    {
      return mRsiValue;
    }

  private:
    SignalPolicy<Decimal> mPolicy;
    std::unique_ptr<MovingAverage<Decimal>> mFastAverage;
    std::unique_ptr<MovingAverage<Decimal>> mSlowAverage;
    std::unique_ptr<MovingAverageConvergenceDivergence<Decimal>> mMacd;
    std::unique_ptr<RelativeStrengthIndex<Decimal>> mRsi;
    CrossoverSignalGenerator<Decimal> mGenerator;
    std::optional<Decimal> mFastValue;
    std::optional<Decimal> mSlowValue;
    std::optional<Decimal> mRsiValue;
  };
}

#endif
