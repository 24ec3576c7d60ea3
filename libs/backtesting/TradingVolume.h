// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef TRADING_VOLUME_H
#define TRADING_VOLUME_H 1

#include <string>
#include "number.h"

namespace mkc_crossover
{
  typedef unsigned long long volume_t;

  //
  // class TradingVolume
  //
  // A whole, unsigned number of units together with the unit they are
  // counted in. Direction lives on the order side or the position sign,
  // never here.
  //

  class TradingVolume
  {
  public:
    enum VolumeUnit {SHARES, CONTRACTS};

    TradingVolume (volume_t volume, TradingVolume::VolumeUnit units) :
      mVolume(volume), mVolumeUnits(units)
    {}

    TradingVolume (const TradingVolume& rhs) = default;
    TradingVolume& operator=(const TradingVolume &rhs) = default;

    ~TradingVolume() = default;

    volume_t getTradingVolume() const
    {
      return mVolume;
    }

    TradingVolume::VolumeUnit getVolumeUnits() const
    {
      return mVolumeUnits;
    }

    // Unit count as a price multiplier
    template <class Decimal>
    Decimal getVolumeAsDecimal() const
    {
      return num::fromUnits<Decimal>(mVolume);
    }

    bool isZero() const
    {
      return mVolume == 0;
    }

    std::string toString() const;

  private:
    volume_t mVolume;
    TradingVolume::VolumeUnit mVolumeUnits;
  };

  inline std::string volumeUnitToString (TradingVolume::VolumeUnit units)
  {
    return (units == TradingVolume::SHARES) ? "shares" : "contracts";
  }

  // "10 shares", "3 contracts"
  inline std::string TradingVolume::toString() const
  {
    return std::to_string(mVolume) + " " + volumeUnitToString(mVolumeUnits);
  }

  inline bool operator==(const TradingVolume& lhs, const TradingVolume& rhs)
  {
    return (lhs.getVolumeUnits() == rhs.getVolumeUnits()) &&
      (lhs.getTradingVolume() == rhs.getTradingVolume());
  }

  inline bool operator!=(const TradingVolume& lhs, const TradingVolume& rhs){ return !(lhs == rhs); }
}
#endif
