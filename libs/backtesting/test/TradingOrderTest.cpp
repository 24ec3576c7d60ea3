#include <catch2/catch_test_macros.hpp>
#include <sstream>
#include <boost/date_time/posix_time/posix_time.hpp>
#include "TradingOrder.h"
#include "TestUtils.h"

using namespace mkc_crossover;
using namespace boost::gregorian;
using boost::posix_time::ptime;

namespace
{
  const ptime orderTime(date(2020, Jan, 6));
  const ptime fillTime(date(2020, Jan, 7));

  OrderFill<DecimalType> createFill (uint32_t orderID, std::size_t barIndex, OrderSide side = OrderSide::Buy)
  {
    return OrderFill<DecimalType>(orderID, side, barIndex, fillTime, createDecimal("100"),
				  TradingVolume(10, TradingVolume::SHARES),
				  createDecimal("1"), createDecimal("0.5"));
  }

  class CountingObserver : public TradingOrderObserver<DecimalType>
  {
  public:
    CountingObserver()
      : numFills(0), numRejections(0)
    {}

    void OrderFilled (const TradingOrder<DecimalType>&, const OrderFill<DecimalType>&) override
    {
      ++numFills;
    }

    void OrderRejected (const TradingOrder<DecimalType>&) override
    {
      ++numRejections;
    }

    int numFills;
    int numRejections;
  };
}

TEST_CASE ("OrderFill values", "[OrderFill]")
{
  auto buy = createFill(1, 5);
  auto sell = createFill(2, 5, OrderSide::Sell);

  REQUIRE (buy.getNotional() == createDecimal("1000"));
  REQUIRE (buy.getTotalCost() == createDecimal("1.5"));
  REQUIRE (buy.getSignedQuantity() == 10);
  REQUIRE (sell.getSignedQuantity() == -10);
  REQUIRE (buy == createFill(1, 5));
  REQUIRE (buy != sell);
}

TEST_CASE ("TradingOrder state transitions", "[TradingOrder]")
{
  TradingOrder<DecimalType> order(1, OrderSide::Buy, TradingVolume(10, TradingVolume::SHARES), 4, orderTime);
  auto observer = std::make_shared<CountingObserver>();
  order.addObserver(observer);

  REQUIRE (order.isOrderPending());
  REQUIRE (order.isBuyOrder());
  REQUIRE (order.getOrderType() == OrderType::MarketOnOpen);
  REQUIRE (order.getRejectionReason() == RejectionReason::None);
  REQUIRE_THROWS_AS (order.getFillPrice(), TradingOrderException);
  REQUIRE_THROWS_AS (order.getCompletionBarIndex(), TradingOrderException);

  SECTION ("Fill on the next bar")
    {
      order.MarkOrderFilled(createFill(1, 5));

      REQUIRE (order.isOrderFilled());
      REQUIRE (order.getCompletionBarIndex() == 5);
      REQUIRE (order.getFillPrice() == createDecimal("100"));
      REQUIRE (observer->numFills == 1);

      REQUIRE_THROWS_AS (order.MarkOrderFilled(createFill(1, 6)), TradingOrderException);
      REQUIRE_THROWS_AS (order.MarkOrderRejected(6, RejectionReason::InsufficientFunds), TradingOrderException);
    }

  SECTION ("Fill on the decision bar is refused")
    {
      REQUIRE_THROWS_AS (order.MarkOrderFilled(createFill(1, 4)), TradingOrderException);
      REQUIRE_THROWS_AS (order.MarkOrderFilled(createFill(1, 3)), TradingOrderException);
      REQUIRE (order.isOrderPending());
      REQUIRE (observer->numFills == 0);
    }

  SECTION ("Fill for a different order is refused")
    {
      REQUIRE_THROWS_AS (order.MarkOrderFilled(createFill(2, 5)), TradingOrderException);
      REQUIRE (order.isOrderPending());
    }

  SECTION ("Rejection records bar and reason")
    {
      order.MarkOrderRejected(5, RejectionReason::InsufficientFunds);

      REQUIRE (order.isOrderRejected());
      REQUIRE (order.getCompletionBarIndex() == 5);
      REQUIRE (order.getRejectionReason() == RejectionReason::InsufficientFunds);
      REQUIRE (observer->numRejections == 1);
      REQUIRE_THROWS_AS (order.MarkOrderFilled(createFill(1, 6)), TradingOrderException);
    }

  SECTION ("Rejection needs a reason")
    {
      REQUIRE_THROWS_AS (order.MarkOrderRejected(5, RejectionReason::None), TradingOrderException);
    }

  SECTION ("Copies keep their own state")
    {
      TradingOrder<DecimalType> copy(order);
      order.MarkOrderRejected(5, RejectionReason::InsufficientFunds);

      REQUIRE (copy.isOrderPending());
      REQUIRE (order != copy);
    }
}

TEST_CASE ("Zero unit order cannot fill", "[TradingOrder]")
{
  TradingOrder<DecimalType> order(3, OrderSide::Sell, TradingVolume(0, TradingVolume::SHARES), 4, orderTime);

  REQUIRE_THROWS_AS (order.MarkOrderFilled(createFill(3, 5, OrderSide::Sell)), OrderExecutionException);
}

TEST_CASE ("OrderTraceObserver writes one line per event", "[TradingOrder]")
{
  std::ostringstream trace;
  auto observer = std::make_shared<OrderTraceObserver<DecimalType>>(trace);

  TradingOrder<DecimalType> filled(1, OrderSide::Buy, TradingVolume(10, TradingVolume::SHARES), 4, orderTime);
  TradingOrder<DecimalType> rejected(2, OrderSide::Buy, TradingVolume(10, TradingVolume::SHARES), 4, orderTime);
  filled.addObserver(observer);
  rejected.addObserver(observer);

  filled.MarkOrderFilled(createFill(1, 5));
  rejected.MarkOrderRejected(5, RejectionReason::InsufficientFunds);

  const std::string output = trace.str();
  REQUIRE (output.find("FILL    order 1 BUY 10") != std::string::npos);
  REQUIRE (output.find("REJECT  order 2") != std::string::npos);
  REQUIRE (output.find("INSUFFICIENT_FUNDS") != std::string::npos);
}
