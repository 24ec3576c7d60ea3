// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __EXECUTION_SIMULATOR_H
#define __EXECUTION_SIMULATOR_H 1

#include <cstdint>
#include <memory>
#include <optional>
#include <ostream>
#include <vector>
#include "BacktestConfiguration.h"
#include "CrossoverSignal.h"
#include "ExitMonitor.h"
#include "PortfolioLedger.h"
#include "TradingOrder.h"
#include "TimeSeriesEntry.h"

namespace mkc_crossover
{
  /**
   * @class ExecutionSimulator
   * @brief Turns signal transitions into market-on-open orders and fills them
   *        one bar later.
   *
   * The simulator keeps a target exposure (Long, Short or Flat), initially
   * Flat. onSignal() is called at the close of bar t. A Flat signal, or one
   * that matches the current target, produces nothing. Otherwise the target
   * changes and an order is queued that moves the position from its current
   * size to the size the sizing rule gives for the new exposure, evaluated
   * with the equity and close of bar t.
   *
   * fillPendingOrder() is called on bar t+1 before the ledger is marked to
   * market. It fills the queued order at the open of that bar, so no order
   * can ever see the price of the bar that produced it. The queue holds at
   * most one order.
   *
   * Rejections do not stop the run. A zero quantity is rejected on the
   * decision bar (DEGENERATE_QUANTITY); a fill that would drive cash negative
   * without margin is rejected on the fill bar (INSUFFICIENT_FUNDS). Either
   * way the target reverts to the exposure the actual position implies.
   * A reversal whose new leg sizes to zero units still closes the old
   * position: the target becomes Flat instead.
   *
   * onExit() is the price-exit path: it sets the target to Flat and queues
   * an order closing the whole position, with the same one-bar delay.
   */
  template <class Decimal>
  class ExecutionSimulator
  {
  public:
    typedef std::shared_ptr<TradingOrder<Decimal>> OrderPtr;
    typedef typename std::vector<OrderPtr>::const_iterator ConstOrderIterator;

    explicit ExecutionSimulator (const BacktestConfiguration<Decimal>& configuration,
				 std::ostream* trace = nullptr)
      : mConfiguration(configuration),
	mTargetExposure(Signal::Flat),
	mPendingOrder(),
	mOrders(),
	mFills(),
	mNextOrderID(1),
	mTrace(trace),
	mTraceObserver()
    {
      if (mTrace)
	mTraceObserver = std::make_shared<OrderTraceObserver<Decimal>>(*mTrace);
    }

    ExecutionSimulator (const ExecutionSimulator<Decimal>& rhs) = delete;
    ExecutionSimulator<Decimal>& operator=(const ExecutionSimulator<Decimal>& rhs) = delete;

    ~ExecutionSimulator()
    {}

    /**
     * @brief Decide at the close of barIndex.
     * @param snapshot ledger snapshot of the same bar, used for sizing
     * @return the order that was created (pending or already rejected), or
     *         nullptr if the signal is not a transition.
     */
    OrderPtr onSignal (Signal signal,
		       std::size_t barIndex,
		       const OHLCTimeSeriesEntry<Decimal>& bar,
		       const PortfolioSnapshot<Decimal>& snapshot)
    {
      if (signal == Signal::Flat)
	return OrderPtr();

      Signal desiredExposure = signal;
      if ((signal == Signal::Short) && (mConfiguration.getPositionMode() == PositionMode::LONG_ONLY))
	desiredExposure = Signal::Flat;

      if (desiredExposure == mTargetExposure)
	return OrderPtr();

      if (mPendingOrder)
	throw TradingOrderException("ExecutionSimulator::onSignal - order " +
				    std::to_string(mPendingOrder->getOrderID()) +
				    " is still pending on bar " + std::to_string(barIndex));

      const long long currentQuantity = snapshot.getPositionQuantity();
      long long targetQuantity = 0;

      if (desiredExposure != Signal::Flat)
	{
	  const volume_t units = mConfiguration.getSizingRule().computeUnits(snapshot.getEquity(),
									      bar.getCloseValue());
	  if (units > num::MaxExactUnits)
	    throw TradingOrderException("ExecutionSimulator::onSignal - sizing rule gives " + std::to_string(units) +
					" units on bar " + std::to_string(barIndex));

	  const bool holdsOpposite = (desiredExposure == Signal::Long) ? (currentQuantity < 0)
	    : (currentQuantity > 0);

	  if ((units == 0) && !holdsOpposite)
	    return rejectDegenerateOrder(desiredExposure, barIndex, bar, currentQuantity);

	  if (units == 0)
	    {
	      if (mTrace)
		*mTrace << "        sizing rule " << mConfiguration.getSizingRule().toString()
			<< " gives zero units on bar " << barIndex << ", closing the "
			<< ((currentQuantity > 0) ? "long" : "short") << " position instead" << std::endl;

	      desiredExposure = Signal::Flat;
	    }
	  else
	    targetQuantity = (desiredExposure == Signal::Long) ? static_cast<long long>(units)
	      : -static_cast<long long>(units);
	}

      mTargetExposure = desiredExposure;

      const long long delta = targetQuantity - currentQuantity;
      if (delta == 0)
	return OrderPtr();

      const OrderSide side = (delta > 0) ? OrderSide::Buy : OrderSide::Sell;
      const volume_t units = static_cast<volume_t>((delta > 0) ? delta : -delta);

      mPendingOrder = createOrder(side, units, barIndex, bar);

      if (mTrace)
	*mTrace << "ORDER   order " << mPendingOrder->getOrderID() << " "
		<< orderSideToString(side) << " " << units
		<< " bar " << barIndex
		<< " (" << boost::posix_time::to_simple_string(bar.getDateTime()) << ")"
		<< " signal " << signalToString(signal) << std::endl;

      return mPendingOrder;
    }

    /**
     * @brief Close the whole position because a price exit was hit at the
     *        close of barIndex.
     * @return the closing order, or nullptr if the position is already flat
     *         or already targeted to be flat.
     */
    OrderPtr onExit (ExitReason reason,
		     std::size_t barIndex,
		     const OHLCTimeSeriesEntry<Decimal>& bar,
		     const PortfolioSnapshot<Decimal>& snapshot)
    {
      const long long currentQuantity = snapshot.getPositionQuantity();

      if ((currentQuantity == 0) || (mTargetExposure == Signal::Flat))
	return OrderPtr();

      if (mPendingOrder)
	throw TradingOrderException("ExecutionSimulator::onExit - order " +
				    std::to_string(mPendingOrder->getOrderID()) +
				    " is still pending on bar " + std::to_string(barIndex));

      mTargetExposure = Signal::Flat;

      const OrderSide side = (currentQuantity > 0) ? OrderSide::Sell : OrderSide::Buy;
      const volume_t units = static_cast<volume_t>((currentQuantity > 0) ? currentQuantity : -currentQuantity);

      mPendingOrder = createOrder(side, units, barIndex, bar);

      if (mTrace)
	*mTrace << "ORDER   order " << mPendingOrder->getOrderID() << " "
		<< orderSideToString(side) << " " << units
		<< " bar " << barIndex
		<< " (" << boost::posix_time::to_simple_string(bar.getDateTime()) << ")"
		<< " exit " << exitReasonToString(reason) << std::endl;

      return mPendingOrder;
    }

    /**
     * @brief Fill the queued order at the open of barIndex.
     * @return the fill, or std::nullopt if nothing was pending or the order
     *         was rejected for insufficient funds.
     */
    std::optional<OrderFill<Decimal>> fillPendingOrder (std::size_t barIndex,
							const OHLCTimeSeriesEntry<Decimal>& bar,
							PortfolioLedger<Decimal>& ledger)
    {
      if (!mPendingOrder)
	return std::nullopt;

      OrderPtr order = mPendingOrder;
      mPendingOrder.reset();

      if (barIndex <= order->getOriginatingBarIndex())
	throw TradingOrderException("ExecutionSimulator::fillPendingOrder - order " +
				    std::to_string(order->getOrderID()) + " from bar " +
				    std::to_string(order->getOriginatingBarIndex()) +
				    " cannot fill on bar " + std::to_string(barIndex));

      const Decimal& fillPrice = bar.getOpenValue();
      const volume_t units = order->getUnitsInOrder().getTradingVolume();

      OrderFill<Decimal> fill(order->getOrderID(),
			      order->getSide(),
			      barIndex,
			      bar.getDateTime(),
			      fillPrice,
			      order->getUnitsInOrder(),
			      mConfiguration.getCommissionModel().computeCommission(fillPrice, units),
			      mConfiguration.getSlippageModel().computeSlippageCost(fillPrice, units));

      if (!mConfiguration.isMarginAllowed())
	{
	  try
	    {
	      ledger.checkSufficientFunds(fill);
	    }
	  catch (const InsufficientFundsException& e)
	    {
	      if (mTrace)
		*mTrace << "        " << e.what() << std::endl;

	      order->MarkOrderRejected(barIndex, RejectionReason::InsufficientFunds);
	      revertTargetToPosition(ledger.getPosition().getQuantity());
	      return std::nullopt;
	    }
	}

      ledger.apply(fill);
      order->MarkOrderFilled(fill);
      mFills.push_back(fill);

      return fill;
    }

    Signal getTargetExposure() const
    {
      return mTargetExposure;
    }

    bool hasPendingOrder() const
    {
      return static_cast<bool>(mPendingOrder);
    }

    OrderPtr getPendingOrder() const
    {
      return mPendingOrder;
    }

    // Every order in creation order, whatever its status
    const std::vector<OrderPtr>& getOrders() const
    {
      return mOrders;
    }

    const std::vector<OrderFill<Decimal>>& getFills() const
    {
      return mFills;
    }

    std::vector<OrderPtr> getRejectedOrders() const
    {
      std::vector<OrderPtr> rejected;
      for (const auto& order : mOrders)
	if (order->isOrderRejected())
	  rejected.push_back(order);

      return rejected;
    }

  private:
    OrderPtr createOrder (OrderSide side,
			  volume_t units,
			  std::size_t barIndex,
			  const OHLCTimeSeriesEntry<Decimal>& bar)
    {
      auto order = std::make_shared<TradingOrder<Decimal>>(mNextOrderID++,
							   side,
							   TradingVolume(units, mConfiguration.getVolumeUnits()),
							   barIndex,
							   bar.getDateTime());
      if (mTraceObserver)
	order->addObserver(mTraceObserver);

      mOrders.push_back(order);
      return order;
    }

    OrderPtr rejectDegenerateOrder (Signal desiredExposure,
				    std::size_t barIndex,
				    const OHLCTimeSeriesEntry<Decimal>& bar,
				    long long currentQuantity)
    {
      const OrderSide side = (desiredExposure == Signal::Long) ? OrderSide::Buy : OrderSide::Sell;
      OrderPtr order = createOrder(side, 0, barIndex, bar);

      if (mTrace)
	*mTrace << "        sizing rule " << mConfiguration.getSizingRule().toString()
		<< " gives zero units on bar " << barIndex << std::endl;

      order->MarkOrderRejected(barIndex, RejectionReason::DegenerateQuantity);
      revertTargetToPosition(currentQuantity);
      return order;
    }

    void revertTargetToPosition (long long quantity)
    {
      if (quantity > 0)
	mTargetExposure = Signal::Long;
      else if (quantity < 0)
	mTargetExposure = Signal::Short;
      else
	mTargetExposure = Signal::Flat;
    }

  private:
    BacktestConfiguration<Decimal> mConfiguration;
    Signal mTargetExposure;
    OrderPtr mPendingOrder;
    std::vector<OrderPtr> mOrders;
    std::vector<OrderFill<Decimal>> mFills;
    uint32_t mNextOrderID;
    std::ostream* mTrace;
    std::shared_ptr<OrderTraceObserver<Decimal>> mTraceObserver;
  };
}

#endif
