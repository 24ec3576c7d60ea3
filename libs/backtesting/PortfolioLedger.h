// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __PORTFOLIO_LEDGER_H
#define __PORTFOLIO_LEDGER_H 1

#include <stdexcept>
#include <string>
#include <boost/date_time/posix_time/posix_time.hpp>
#include "TimeSeriesEntry.h"
#include "TradingOrder.h"
#include "InstrumentPosition.h"
#include "ClosedPositionHistory.h"
#include "DecimalConstants.h"
#include "number.h"

namespace mkc_crossover
{
  using boost::posix_time::ptime;

  /**
   * @brief The ledger's books no longer balance. Fatal for the run.
   */
  class PortfolioLedgerException : public std::runtime_error
  {
  public:
    PortfolioLedgerException(const std::string msg)
      : std::runtime_error(msg)
    {}

    ~PortfolioLedgerException()
    {}
  };

  /**
   * @class PortfolioSnapshot
   * @brief Ledger state at the close of one bar.
   *
   * equity == cash + positionMarketValue holds for every snapshot.
   */
  template <class Decimal>
  class PortfolioSnapshot
  {
  public:
    PortfolioSnapshot (std::size_t barIndex,
		       const ptime& dateTime,
		       const Decimal& cash,
		       long long positionQuantity,
		       const Decimal& positionMarketValue)
      : mBarIndex(barIndex),
	mDateTime(dateTime),
	mCash(cash),
	mPositionQuantity(positionQuantity),
	mPositionMarketValue(positionMarketValue),
	mEquity(cash + positionMarketValue)
    {}

    std::size_t getBarIndex() const { return mBarIndex; }
    const ptime& getDateTime() const { return mDateTime; }
    const Decimal& getCash() const { return mCash; }
    long long getPositionQuantity() const { return mPositionQuantity; }
    const Decimal& getPositionMarketValue() const { return mPositionMarketValue; }
    const Decimal& getEquity() const { return mEquity; }

  private:
    std::size_t mBarIndex;
    ptime mDateTime;
    Decimal mCash;
    long long mPositionQuantity;
    Decimal mPositionMarketValue;
    Decimal mEquity;
  };

  template <class Decimal>
  bool operator==(const PortfolioSnapshot<Decimal>& lhs, const PortfolioSnapshot<Decimal>& rhs)
  {
    return (lhs.getBarIndex() == rhs.getBarIndex()) &&
      (lhs.getDateTime() == rhs.getDateTime()) &&
      (lhs.getCash() == rhs.getCash()) &&
      (lhs.getPositionQuantity() == rhs.getPositionQuantity()) &&
      (lhs.getPositionMarketValue() == rhs.getPositionMarketValue()) &&
      (lhs.getEquity() == rhs.getEquity());
  }

  template <class Decimal>
  bool operator!=(const PortfolioSnapshot<Decimal>& lhs, const PortfolioSnapshot<Decimal>& rhs)
  {
    return !(lhs == rhs);
  }

  /**
   * @class PortfolioLedger
   * @brief Cash and position books of one run.
   *
   * apply() moves cash by -(side * price * quantity) - commission - slippage
   * and updates the position. markToMarket() values the position at the
   * bar's close and cross-checks the books: cash must equal the initial cash
   * less all trade flows and costs, and cash plus the position's market value
   * must equal the initial cash plus realized and unrealized PnL less all
   * costs. A mismatch raises PortfolioLedgerException.
   *
   * The ledger performs no I/O and owns no shared state; every run has its own.
   */
  template <class Decimal>
  class PortfolioLedger
  {
  public:
    explicit PortfolioLedger (const Decimal& initialCash)
      : mInitialCash(initialCash),
	mCash(initialCash),
	mPosition(),
	mRealizedPnl(DecimalConstants<Decimal>::DecimalZero),
	mTotalCommission(DecimalConstants<Decimal>::DecimalZero),
	mTotalSlippage(DecimalConstants<Decimal>::DecimalZero),
	mNetTradeFlow(DecimalConstants<Decimal>::DecimalZero),
	mClosedPositions(),
	mNumFillsApplied(0)
    {}

    PortfolioLedger (const PortfolioLedger<Decimal>& rhs) = default;
    PortfolioLedger<Decimal>& operator=(const PortfolioLedger<Decimal>& rhs) = default;

    ~PortfolioLedger()
    {}

    const Decimal& getInitialCash() const { return mInitialCash; }
    const Decimal& getCash() const { return mCash; }
    const InstrumentPosition<Decimal>& getPosition() const { return mPosition; }
    const Decimal& getRealizedPnl() const { return mRealizedPnl; }
    const Decimal& getTotalCommission() const { return mTotalCommission; }
    const Decimal& getTotalSlippage() const { return mTotalSlippage; }
    const ClosedPositionHistory<Decimal>& getClosedPositionHistory() const { return mClosedPositions; }
    std::size_t getNumFillsApplied() const { return mNumFillsApplied; }

    // Cash balance after the fill would be applied
    Decimal getCashAfterFill (const OrderFill<Decimal>& fill) const
    {
      return mCash - signedNotional(fill) - fill.getCommission() - fill.getSlippageCost();
    }

    /**
     * @throws InsufficientFundsException if applying the fill would leave
     *         negative cash.
     */
    void checkSufficientFunds (const OrderFill<Decimal>& fill) const
    {
      const Decimal cashAfter = getCashAfterFill(fill);

      if (cashAfter < DecimalConstants<Decimal>::DecimalZero)
	throw InsufficientFundsException("PortfolioLedger: order " + std::to_string(fill.getOrderID()) +
					 " needs " + num::toString(mCash - cashAfter) +
					 " but only " + num::toString(mCash) + " cash is available");
    }

    void apply (const OrderFill<Decimal>& fill)
    {
      if (fill.getFillQuantity().isZero())
	throw PortfolioLedgerException("PortfolioLedger::apply - fill for order " +
				       std::to_string(fill.getOrderID()) + " has zero quantity");

      const Decimal notional = signedNotional(fill);

      mCash = mCash - notional - fill.getCommission() - fill.getSlippageCost();
      mNetTradeFlow += notional;
      mTotalCommission += fill.getCommission();
      mTotalSlippage += fill.getSlippageCost();
      ++mNumFillsApplied;

      std::optional<ClosedTrade<Decimal>> closed = mPosition.applyFill(fill);
      if (closed)
	{
	  mRealizedPnl += closed->getGrossPnl();
	  mClosedPositions.addClosedPosition(*closed);
	}
    }

    PortfolioSnapshot<Decimal> markToMarket (std::size_t barIndex,
					     const OHLCTimeSeriesEntry<Decimal>& bar) const
    {
      const Decimal expectedCash = mInitialCash - mNetTradeFlow - mTotalCommission - mTotalSlippage;

      if (expectedCash != mCash)
	throw PortfolioLedgerException("PortfolioLedger::markToMarket - cash " + num::toString(mCash) +
				       " does not reconcile with trade history " + num::toString(expectedCash) +
				       " on bar " + std::to_string(barIndex));

      PortfolioSnapshot<Decimal> snapshot(barIndex, bar.getDateTime(), mCash, mPosition.getQuantity(),
					  mPosition.getMarketValue(bar.getCloseValue()));

      const Decimal pnlEquity = mInitialCash + mRealizedPnl + mPosition.getUnrealizedPnl(bar.getCloseValue())
	- mTotalCommission - mTotalSlippage;

      if (snapshot.getEquity() != pnlEquity)
	throw PortfolioLedgerException("PortfolioLedger::markToMarket - equity " + num::toString(snapshot.getEquity()) +
				       " does not reconcile with realized and unrealized PnL " +
				       num::toString(pnlEquity) + " on bar " + std::to_string(barIndex));

      return snapshot;
    }

  private:
    static Decimal signedNotional (const OrderFill<Decimal>& fill)
    {
      const Decimal notional = fill.getNotional();

      if (fill.getSide() == OrderSide::Buy)
	return notional;

      return DecimalConstants<Decimal>::DecimalZero - notional;
    }

  private:
    Decimal mInitialCash;
    Decimal mCash;
    InstrumentPosition<Decimal> mPosition;
    Decimal mRealizedPnl;
    Decimal mTotalCommission;
    Decimal mTotalSlippage;
    Decimal mNetTradeFlow;
    ClosedPositionHistory<Decimal> mClosedPositions;
    std::size_t mNumFillsApplied;
  };
}

#endif
