// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __INSTRUMENT_POSITION_H
#define __INSTRUMENT_POSITION_H 1

#include <algorithm>
#include <cstdlib>
#include <optional>
#include <boost/date_time/posix_time/posix_time.hpp>
#include "TradingOrder.h"
#include "ClosedPositionHistory.h"
#include "DecimalConstants.h"
#include "number.h"

namespace mkc_crossover
{
  using boost::posix_time::ptime;

  /**
   * @class InstrumentPosition
   * @brief Signed position in the single instrument of a run.
   *
   * Positive quantity is long, negative is short, zero is flat. The position
   * exists for the whole run and only changes through applyFill().
   *
   * The position carries the exact cost basis of its open units; the
   * average cost is derived from it. A fill against the position closes
   * min(|position|, fill units) at the fill price, removes their share of
   * the basis and reports them as a ClosedTrade; any remainder opens a
   * reversed position at the fill price. Realized plus unrealized PnL
   * therefore always equals the net trade cash flow plus market value.
   *
   * Commission and slippage of opening fills are carried with the position
   * and allocated pro rata to the units closed.
   */
  template <class Decimal>
  class InstrumentPosition
  {
  public:
    InstrumentPosition()
      : mQuantity(0),
	mCostBasis(DecimalConstants<Decimal>::DecimalZero),
	mOpenCosts(DecimalConstants<Decimal>::DecimalZero),
	mEntryDateTime(),
	mEntryBarIndex(0)
    {}

    InstrumentPosition (const InstrumentPosition<Decimal>& rhs) = default;
    InstrumentPosition<Decimal>& operator=(const InstrumentPosition<Decimal>& rhs) = default;

    ~InstrumentPosition()
    {}

    long long getQuantity() const
    {
      return mQuantity;
    }

    volume_t getAbsoluteQuantity() const
    {
      return static_cast<volume_t>(std::llabs(mQuantity));
    }

    bool isFlatPosition() const { return mQuantity == 0; }
    bool isLongPosition() const { return mQuantity > 0; }
    bool isShortPosition() const { return mQuantity < 0; }

    Decimal getAverageCost() const
    {
      if (mQuantity == 0)
	return DecimalConstants<Decimal>::DecimalZero;

      return mCostBasis / num::fromUnits<Decimal>(getAbsoluteQuantity());
    }

    // Price paid (long) or received (short) for the open units
    const Decimal& getCostBasis() const
    {
      return mCostBasis;
    }

    // Bar of the fill that opened the current position; meaningless when flat
    std::size_t getEntryBarIndex() const
    {
      return mEntryBarIndex;
    }

    const ptime& getEntryDateTime() const
    {
      return mEntryDateTime;
    }

    // Entry costs not yet allocated to a closed trade
    const Decimal& getOpenCosts() const
    {
      return mOpenCosts;
    }

    Decimal getMarketValue (const Decimal& price) const
    {
      const Decimal units = num::fromUnits<Decimal>(getAbsoluteQuantity());

      if (mQuantity >= 0)
	return units * price;

      return DecimalConstants<Decimal>::DecimalZero - (units * price);
    }

    Decimal getUnrealizedPnl (const Decimal& price) const
    {
      const Decimal marketValue = getMarketValue(price);

      if (mQuantity >= 0)
	return marketValue - mCostBasis;

      return marketValue + mCostBasis;
    }

    std::optional<ClosedTrade<Decimal>> applyFill (const OrderFill<Decimal>& fill)
    {
      const long long delta = fill.getSignedQuantity();
      const volume_t fillUnits = fill.getFillQuantity().getTradingVolume();

      if (fillUnits == 0)
	return std::nullopt;

      if ((mQuantity == 0) || ((mQuantity > 0) == (delta > 0)))
	{
	  increasePosition(fill, delta);
	  return std::nullopt;
	}

      const volume_t heldUnits = getAbsoluteQuantity();
      const volume_t closedUnits = std::min(heldUnits, fillUnits);
      const bool wasLong = (mQuantity > 0);
      const Decimal closed = num::fromUnits<Decimal>(closedUnits);
      const Decimal& fillPrice = fill.getFillPrice();

      const Decimal averageCost = getAverageCost();
      const Decimal closedBasis = (closedUnits == heldUnits) ? mCostBasis :
	(mCostBasis * closed) / num::fromUnits<Decimal>(heldUnits);
      const Decimal exitValue = fillPrice * closed;

      const Decimal grossPnl = wasLong ? (exitValue - closedBasis) : (closedBasis - exitValue);

      const Decimal entryCosts = (closedUnits == heldUnits) ? mOpenCosts :
	(mOpenCosts * closed) / num::fromUnits<Decimal>(heldUnits);

      const Decimal exitCosts = (closedUnits == fillUnits) ? fill.getTotalCost() :
	(fill.getTotalCost() * closed) / num::fromUnits<Decimal>(fillUnits);

      ClosedTrade<Decimal> trade(wasLong,
				 TradingVolume(closedUnits, fill.getFillQuantity().getVolumeUnits()),
				 mEntryDateTime,
				 mEntryBarIndex,
				 averageCost,
				 fill.getFillDateTime(),
				 fill.getBarIndex(),
				 fillPrice,
				 grossPnl,
				 entryCosts + exitCosts);

      mOpenCosts -= entryCosts;
      mCostBasis -= closedBasis;
      mQuantity += delta;

      if (mQuantity == 0)
	{
	  mCostBasis = DecimalConstants<Decimal>::DecimalZero;
	  mOpenCosts = DecimalConstants<Decimal>::DecimalZero;
	}
      else if (fillUnits > closedUnits)
	{
	  // reversal: the remainder opens a new position at the fill price
	  mCostBasis = fillPrice * num::fromUnits<Decimal>(fillUnits - closedUnits);
	  mOpenCosts = fill.getTotalCost() - exitCosts;
	  mEntryDateTime = fill.getFillDateTime();
	  mEntryBarIndex = fill.getBarIndex();
	}

      return trade;
    }

  private:
    void increasePosition (const OrderFill<Decimal>& fill, long long delta)
    {
      const Decimal added = fill.getFillQuantity().getVolumeAsDecimal<Decimal>();

      if (mQuantity == 0)
	{
	  mEntryDateTime = fill.getFillDateTime();
	  mEntryBarIndex = fill.getBarIndex();
	}

      mCostBasis += fill.getFillPrice() * added;

      mOpenCosts += fill.getTotalCost();
      mQuantity += delta;
    }

  private:
    long long mQuantity;
    Decimal mCostBasis;
    Decimal mOpenCosts;
    ptime mEntryDateTime;
    std::size_t mEntryBarIndex;
  };
}

#endif
