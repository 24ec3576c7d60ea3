// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __CROSSOVER_SIGNAL_H
#define __CROSSOVER_SIGNAL_H 1

#include <optional>
#include <stdexcept>
#include <string>
#include "DecimalConstants.h"

namespace mkc_crossover
{
  enum class Signal { Long, Short, Flat };

  inline std::string signalToString (Signal signal)
  {
    switch (signal)
      {
      case Signal::Long:
	return "LONG";
      case Signal::Short:
	return "SHORT";
      case Signal::Flat:
	return "FLAT";
      }

    throw std::domain_error("signalToString: unknown signal");
  }

  /**
   * @class CrossoverSignalGenerator
   * @brief Classifies each bar from the fast and slow moving average values.
   *
   * The generator remembers only the sign of (fast - slow) from the last bar
   * on which the two averages differed. That sign starts neutral.
   *
   *  - Long:  the difference turns positive from a non-positive sign
   *  - Short: the difference turns negative from a non-negative sign
   *  - Flat:  anything else, including either average still undefined and
   *           fast == slow, which leaves the remembered sign untouched
   *
   * A Long is therefore emitted once when fast moves above slow and not
   * again until a Short has been emitted in between.
   */
  template <class Decimal>
  class CrossoverSignalGenerator
  {
  public:
    CrossoverSignalGenerator()
      : mLastSign(0)
    {}

    Signal classify (const std::optional<Decimal>& fastValue,
		     const std::optional<Decimal>& slowValue)
    {
      if (!fastValue || !slowValue)
	return Signal::Flat;

      const Decimal difference = *fastValue - *slowValue;
      const Decimal& zero = DecimalConstants<Decimal>::DecimalZero;

      if (difference > zero)
	{
	  const bool crossedAbove = (mLastSign <= 0);
	  mLastSign = 1;
	  return crossedAbove ? Signal::Long : Signal::Flat;
	}
      else if (difference < zero)
	{
	  const bool crossedBelow = (mLastSign >= 0);
	  mLastSign = -1;
	  return crossedBelow ? Signal::Short : Signal::Flat;
	}

      return Signal::Flat;
    }

    int getLastSign() const
    {
      return mLastSign;
    }

    void reset()
    {
      mLastSign = 0;
    }

  private:
    int mLastSign;
  };
}

#endif
