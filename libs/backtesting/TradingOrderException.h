// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __TRADING_ORDER_EXCEPTION_H
#define __TRADING_ORDER_EXCEPTION_H 1

#include <stdexcept>
#include <string>

namespace mkc_crossover
{
  // Illegal order state transition or an order that breaks the fill timing
  // contract. Fatal for the run.
  class TradingOrderException : public std::runtime_error
  {
  public:
    TradingOrderException(const std::string msg)
      : std::runtime_error(msg)
    {}

    ~TradingOrderException()
    {}
  };

  // Filling the order would drive cash negative while margin is disallowed.
  // Caught by the ExecutionSimulator and turned into a rejected order.
  class InsufficientFundsException : public TradingOrderException
  {
  public:
    InsufficientFundsException(const std::string msg)
      : TradingOrderException(msg)
    {}

    ~InsufficientFundsException()
    {}
  };

  // The sizing rule produced a zero quantity. Also absorbed as a rejection.
  class OrderExecutionException : public TradingOrderException
  {
  public:
    OrderExecutionException(const std::string msg)
      : TradingOrderException(msg)
    {}

    ~OrderExecutionException()
    {}
  };
}

#endif
