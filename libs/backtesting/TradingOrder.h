// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

/**
 * @file TradingOrder.h
 * @brief Order lifecycle for the crossover backtester.
 *
 * Every order is a market-on-open order for the single instrument of a run.
 * An order starts Pending and moves exactly once, to Filled or Rejected.
 * The transitions are implemented with a small state hierarchy so an
 * illegal transition (filling a rejected order, rejecting a filled one)
 * raises instead of silently overwriting the outcome.
 */
#ifndef __TRADING_ORDER_H
#define __TRADING_ORDER_H 1

#include <cstdint>
#include <list>
#include <memory>
#include <ostream>
#include <string>
#include <boost/date_time/posix_time/posix_time.hpp>
#include "TradingOrderException.h"
#include "TradingVolume.h"
#include "TimeSeriesEntry.h"
#include "DecimalConstants.h"

namespace mkc_crossover
{
  using boost::posix_time::ptime;

  enum class OrderSide { Buy, Sell };

  enum class OrderStatus { Pending, Filled, Rejected };

  enum class OrderType { MarketOnOpen };

  enum class RejectionReason { None, InsufficientFunds, DegenerateQuantity };

  inline std::string orderSideToString (OrderSide side)
  {
    switch (side)
      {
      case OrderSide::Buy:
	return "BUY";
      case OrderSide::Sell:
	return "SELL";
      }

    throw TradingOrderException("orderSideToString: unknown side");
  }

  inline std::string orderStatusToString (OrderStatus status)
  {
    switch (status)
      {
      case OrderStatus::Pending:
	return "PENDING";
      case OrderStatus::Filled:
	return "FILLED";
      case OrderStatus::Rejected:
	return "REJECTED";
      }

    throw TradingOrderException("orderStatusToString: unknown status");
  }

  inline std::string rejectionReasonToString (RejectionReason reason)
  {
    switch (reason)
      {
      case RejectionReason::None:
	return "NONE";
      case RejectionReason::InsufficientFunds:
	return "INSUFFICIENT_FUNDS";
      case RejectionReason::DegenerateQuantity:
	return "DEGENERATE_QUANTITY";
      }

    throw TradingOrderException("rejectionReasonToString: unknown reason");
  }

  // +1 for a buy, -1 for a sell
  inline long long orderSideSign (OrderSide side)
  {
    return (side == OrderSide::Buy) ? 1 : -1;
  }

  /**
   * @class OrderFill
   * @brief Execution record of one filled order.
   *
   * fillPrice is the quoted open of the fill bar. Slippage is carried as a
   * separate cost so the cash movement is
   *   -(side * fillPrice * quantity) - commission - slippageCost
   */
  template <class Decimal>
  class OrderFill
  {
  public:
    OrderFill (uint32_t orderID,
	       OrderSide side,
	       std::size_t barIndex,
	       const ptime& fillDateTime,
	       const Decimal& fillPrice,
	       const TradingVolume& fillQuantity,
	       const Decimal& commission,
	       const Decimal& slippageCost)
      : mOrderID(orderID),
	mSide(side),
	mBarIndex(barIndex),
	mFillDateTime(fillDateTime),
	mFillPrice(fillPrice),
	mFillQuantity(fillQuantity),
	mCommission(commission),
	mSlippageCost(slippageCost)
    {}

    OrderFill (const OrderFill<Decimal>& rhs) = default;
    OrderFill<Decimal>& operator=(const OrderFill<Decimal>& rhs) = default;

    ~OrderFill()
    {}

    uint32_t getOrderID() const { return mOrderID; }
    OrderSide getSide() const { return mSide; }
    std::size_t getBarIndex() const { return mBarIndex; }
    const ptime& getFillDateTime() const { return mFillDateTime; }
    const Decimal& getFillPrice() const { return mFillPrice; }
    const TradingVolume& getFillQuantity() const { return mFillQuantity; }
    const Decimal& getCommission() const { return mCommission; }
    const Decimal& getSlippageCost() const { return mSlippageCost; }

    // Signed change in position units
    long long getSignedQuantity() const
    {
      return orderSideSign(mSide) * static_cast<long long>(mFillQuantity.getTradingVolume());
    }

    Decimal getNotional() const
    {
      return mFillPrice * mFillQuantity.getVolumeAsDecimal<Decimal>();
    }

    Decimal getTotalCost() const
    {
      return mCommission + mSlippageCost;
    }

  private:
    uint32_t mOrderID;
    OrderSide mSide;
    std::size_t mBarIndex;
    ptime mFillDateTime;
    Decimal mFillPrice;
    TradingVolume mFillQuantity;
    Decimal mCommission;
    Decimal mSlippageCost;
  };

  template <class Decimal>
  bool operator==(const OrderFill<Decimal>& lhs, const OrderFill<Decimal>& rhs)
  {
    return (lhs.getOrderID() == rhs.getOrderID()) &&
      (lhs.getSide() == rhs.getSide()) &&
      (lhs.getBarIndex() == rhs.getBarIndex()) &&
      (lhs.getFillDateTime() == rhs.getFillDateTime()) &&
      (lhs.getFillPrice() == rhs.getFillPrice()) &&
      (lhs.getFillQuantity() == rhs.getFillQuantity()) &&
      (lhs.getCommission() == rhs.getCommission()) &&
      (lhs.getSlippageCost() == rhs.getSlippageCost());
  }

  template <class Decimal>
  bool operator!=(const OrderFill<Decimal>& lhs, const OrderFill<Decimal>& rhs)
  {
    return !(lhs == rhs);
  }

  template <class Decimal> class TradingOrder;
  template <class Decimal> class FilledOrderState;
  template <class Decimal> class RejectedOrderState;

  /**
   * @class TradingOrderObserver
   * @brief Notified when an order leaves the Pending state.
   */
  template <class Decimal>
  class TradingOrderObserver
  {
  public:
    TradingOrderObserver()
    {}

    virtual ~TradingOrderObserver()
    {}

    virtual void OrderFilled (const TradingOrder<Decimal>& order, const OrderFill<Decimal>& fill) = 0;
    virtual void OrderRejected (const TradingOrder<Decimal>& order) = 0;
  };

  template <class Decimal>
  class TradingOrderState
  {
  public:
    TradingOrderState()
    {}

    virtual ~TradingOrderState()
    {}

    virtual OrderStatus getStatus() const = 0;
    virtual std::size_t getCompletionBarIndex() const = 0;
    virtual const Decimal& getFillPrice() const = 0;
    virtual RejectionReason getRejectionReason() const = 0;

    virtual void MarkOrderFilled (TradingOrder<Decimal>* order,
				  std::size_t fillBarIndex,
				  const Decimal& fillPrice) = 0;

    virtual void MarkOrderRejected (TradingOrder<Decimal>* order,
				    std::size_t barIndex,
				    RejectionReason reason) = 0;
  };

  template <class Decimal>
  class PendingOrderState : public TradingOrderState<Decimal>
  {
  public:
    PendingOrderState()
      : TradingOrderState<Decimal>()
    {}

    ~PendingOrderState()
    {}

    OrderStatus getStatus() const override
    {
      return OrderStatus::Pending;
    }

    std::size_t getCompletionBarIndex() const override
    {
      throw TradingOrderException("PendingOrderState: order has not completed");
    }

    const Decimal& getFillPrice() const override
    {
      throw TradingOrderException("PendingOrderState: no fill price in pending state");
    }

    RejectionReason getRejectionReason() const override
    {
      return RejectionReason::None;
    }

    void MarkOrderFilled (TradingOrder<Decimal>* order,
			  std::size_t fillBarIndex,
			  const Decimal& fillPrice) override;

    void MarkOrderRejected (TradingOrder<Decimal>* order,
			    std::size_t barIndex,
			    RejectionReason reason) override;
  };

  template <class Decimal>
  class FilledOrderState : public TradingOrderState<Decimal>
  {
  public:
    FilledOrderState (std::size_t fillBarIndex, const Decimal& fillPrice)
      : TradingOrderState<Decimal>(),
	mFillBarIndex(fillBarIndex),
	mFillPrice(fillPrice)
    {}

    ~FilledOrderState()
    {}

    OrderStatus getStatus() const override
    {
      return OrderStatus::Filled;
    }

    std::size_t getCompletionBarIndex() const override
    {
      return mFillBarIndex;
    }

    const Decimal& getFillPrice() const override
    {
      return mFillPrice;
    }

    RejectionReason getRejectionReason() const override
    {
      return RejectionReason::None;
    }

    void MarkOrderFilled (TradingOrder<Decimal>*, std::size_t, const Decimal&) override
    {
      throw TradingOrderException("FilledOrderState: order has already been filled");
    }

    void MarkOrderRejected (TradingOrder<Decimal>*, std::size_t, RejectionReason) override
    {
      throw TradingOrderException("FilledOrderState: cannot reject a filled order");
    }

  private:
    std::size_t mFillBarIndex;
    Decimal mFillPrice;
  };

  template <class Decimal>
  class RejectedOrderState : public TradingOrderState<Decimal>
  {
  public:
    RejectedOrderState (std::size_t barIndex, RejectionReason reason)
      : TradingOrderState<Decimal>(),
	mBarIndex(barIndex),
	mReason(reason)
    {}

    ~RejectedOrderState()
    {}

    OrderStatus getStatus() const override
    {
      return OrderStatus::Rejected;
    }

    std::size_t getCompletionBarIndex() const override
    {
      return mBarIndex;
    }

    const Decimal& getFillPrice() const override
    {
      throw TradingOrderException("RejectedOrderState: a rejected order has no fill price");
    }

    RejectionReason getRejectionReason() const override
    {
      return mReason;
    }

    void MarkOrderFilled (TradingOrder<Decimal>*, std::size_t, const Decimal&) override
    {
      throw TradingOrderException("RejectedOrderState: cannot fill a rejected order");
    }

    void MarkOrderRejected (TradingOrder<Decimal>*, std::size_t, RejectionReason) override
    {
      throw TradingOrderException("RejectedOrderState: order has already been rejected");
    }

  private:
    std::size_t mBarIndex;
    RejectionReason mReason;
  };

  /**
   * @class TradingOrder
   * @brief A market-on-open order decided at the close of its originating bar.
   *
   * Invariant: an order can only be filled on a bar index strictly greater
   * than its originating bar index. MarkOrderFilled() enforces it.
   *
   * Order IDs are assigned by the owner (the ExecutionSimulator of a run),
   * so two runs over the same input number their orders identically.
   */
  template <class Decimal>
  class TradingOrder
  {
  public:
    typedef typename std::list<std::shared_ptr<TradingOrderObserver<Decimal>>>::const_iterator ConstObserverIterator;

    TradingOrder (uint32_t orderID,
		  OrderSide side,
		  const TradingVolume& unitsInOrder,
		  std::size_t originatingBarIndex,
		  const ptime& orderDateTime)
      : mOrderID(orderID),
	mSide(side),
	mUnitsInOrder(unitsInOrder),
	mOriginatingBarIndex(originatingBarIndex),
	mOrderDateTime(orderDateTime),
	mOrderState(std::make_shared<PendingOrderState<Decimal>>()),
	mObservers()
    {}

    TradingOrder (const TradingOrder<Decimal>& rhs) = default;
    TradingOrder<Decimal>& operator=(const TradingOrder<Decimal>& rhs) = default;

    ~TradingOrder()
    {}

    uint32_t getOrderID() const { return mOrderID; }
    OrderSide getSide() const { return mSide; }
    OrderType getOrderType() const { return OrderType::MarketOnOpen; }
    const TradingVolume& getUnitsInOrder() const { return mUnitsInOrder; }
    std::size_t getOriginatingBarIndex() const { return mOriginatingBarIndex; }
    const ptime& getOrderDateTime() const { return mOrderDateTime; }

    bool isBuyOrder() const { return mSide == OrderSide::Buy; }
    bool isSellOrder() const { return mSide == OrderSide::Sell; }

    OrderStatus getStatus() const { return mOrderState->getStatus(); }
    bool isOrderPending() const { return getStatus() == OrderStatus::Pending; }
    bool isOrderFilled() const { return getStatus() == OrderStatus::Filled; }
    bool isOrderRejected() const { return getStatus() == OrderStatus::Rejected; }

    // Bar index on which the order was filled or rejected
    std::size_t getCompletionBarIndex() const { return mOrderState->getCompletionBarIndex(); }
    const Decimal& getFillPrice() const { return mOrderState->getFillPrice(); }
    RejectionReason getRejectionReason() const { return mOrderState->getRejectionReason(); }

    void MarkOrderFilled (const OrderFill<Decimal>& fill)
    {
      if (fill.getOrderID() != mOrderID)
	throw TradingOrderException("TradingOrder::MarkOrderFilled - fill for order " +
				    std::to_string(fill.getOrderID()) + " applied to order " +
				    std::to_string(mOrderID));

      if (fill.getBarIndex() <= mOriginatingBarIndex)
	throw TradingOrderException("TradingOrder::MarkOrderFilled - order " + std::to_string(mOrderID) +
				    " decided on bar " + std::to_string(mOriginatingBarIndex) +
				    " cannot fill on bar " + std::to_string(fill.getBarIndex()));

      if (mUnitsInOrder.isZero())
	throw OrderExecutionException("TradingOrder::MarkOrderFilled - order " + std::to_string(mOrderID) +
				      " has zero units");

      mOrderState->MarkOrderFilled(this, fill.getBarIndex(), fill.getFillPrice());

      for (auto it = beginObserverList(); it != endObserverList(); ++it)
	(*it)->OrderFilled(*this, fill);
    }

    void MarkOrderRejected (std::size_t barIndex, RejectionReason reason)
    {
      if (reason == RejectionReason::None)
	throw TradingOrderException("TradingOrder::MarkOrderRejected - a rejection needs a reason");

      mOrderState->MarkOrderRejected(this, barIndex, reason);

      for (auto it = beginObserverList(); it != endObserverList(); ++it)
	(*it)->OrderRejected(*this);
    }

    void addObserver (std::shared_ptr<TradingOrderObserver<Decimal>> observer)
    {
      mObservers.push_back(observer);
    }

  private:
    ConstObserverIterator beginObserverList() const { return mObservers.begin(); }
    ConstObserverIterator endObserverList() const { return mObservers.end(); }

    void ChangeState (std::shared_ptr<TradingOrderState<Decimal>> newState)
    {
      mOrderState = newState;
    }

    friend class PendingOrderState<Decimal>;

  private:
    uint32_t mOrderID;
    OrderSide mSide;
    TradingVolume mUnitsInOrder;
    std::size_t mOriginatingBarIndex;
    ptime mOrderDateTime;
    std::shared_ptr<TradingOrderState<Decimal>> mOrderState;
    std::list<std::shared_ptr<TradingOrderObserver<Decimal>>> mObservers;
  };

  template <class Decimal>
  void PendingOrderState<Decimal>::MarkOrderFilled (TradingOrder<Decimal>* order,
						    std::size_t fillBarIndex,
						    const Decimal& fillPrice)
  {
    order->ChangeState(std::make_shared<FilledOrderState<Decimal>>(fillBarIndex, fillPrice));
  }

  template <class Decimal>
  void PendingOrderState<Decimal>::MarkOrderRejected (TradingOrder<Decimal>* order,
						      std::size_t barIndex,
						      RejectionReason reason)
  {
    order->ChangeState(std::make_shared<RejectedOrderState<Decimal>>(barIndex, reason));
  }

  template <class Decimal>
  bool operator==(const TradingOrder<Decimal>& lhs, const TradingOrder<Decimal>& rhs)
  {
    if ((lhs.getOrderID() != rhs.getOrderID()) ||
	(lhs.getSide() != rhs.getSide()) ||
	(lhs.getUnitsInOrder() != rhs.getUnitsInOrder()) ||
	(lhs.getOriginatingBarIndex() != rhs.getOriginatingBarIndex()) ||
	(lhs.getOrderDateTime() != rhs.getOrderDateTime()) ||
	(lhs.getStatus() != rhs.getStatus()))
      return false;

    if (lhs.isOrderPending())
      return true;

    if (lhs.getCompletionBarIndex() != rhs.getCompletionBarIndex())
      return false;

    if (lhs.isOrderFilled())
      return lhs.getFillPrice() == rhs.getFillPrice();

    return lhs.getRejectionReason() == rhs.getRejectionReason();
  }

  template <class Decimal>
  bool operator!=(const TradingOrder<Decimal>& lhs, const TradingOrder<Decimal>& rhs)
  {
    return !(lhs == rhs);
  }

  /**
   * @class OrderTraceObserver
   * @brief Writes one line per fill or rejection to a stream.
   */
  template <class Decimal>
  class OrderTraceObserver : public TradingOrderObserver<Decimal>
  {
  public:
    explicit OrderTraceObserver (std::ostream& os)
      : TradingOrderObserver<Decimal>(),
	mOutput(os)
    {}

    void OrderFilled (const TradingOrder<Decimal>& order, const OrderFill<Decimal>& fill) override
    {
      mOutput << "FILL    order " << order.getOrderID() << " "
	      << orderSideToString(fill.getSide()) << " "
	      << fill.getFillQuantity().toString() << " @ " << fill.getFillPrice()
	      << " bar " << fill.getBarIndex()
	      << " (" << boost::posix_time::to_simple_string(fill.getFillDateTime()) << ")"
	      << " commission " << fill.getCommission()
	      << " slippage " << fill.getSlippageCost() << std::endl;
    }

    void OrderRejected (const TradingOrder<Decimal>& order) override
    {
      mOutput << "REJECT  order " << order.getOrderID() << " "
	      << orderSideToString(order.getSide()) << " "
	      << order.getUnitsInOrder().toString()
	      << " bar " << order.getCompletionBarIndex()
	      << " reason " << rejectionReasonToString(order.getRejectionReason()) << std::endl;
    }

  private:
    std::ostream& mOutput;
  };
}

#endif
