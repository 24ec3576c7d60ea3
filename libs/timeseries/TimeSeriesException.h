// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __TIMESERIES_EXCEPTION_H
#define __TIMESERIES_EXCEPTION_H 1

#include <stdexcept>
#include <string>

namespace mkc_crossover
{
  class TimeSeriesException : public std::runtime_error
  {
  public:
    TimeSeriesException(const std::string msg)
      : std::runtime_error(msg)
    {}

    virtual ~TimeSeriesException() = default;
  };

  /**
   * @brief Raised when a bar series violates its input contract: empty series,
   * non-monotonic timestamps, missing or non-numeric OHLCV fields.
   *
   * Data errors are never repaired. They abort the run before the first bar
   * is simulated and no partial result is produced.
   */
  class TimeSeriesDataException : public TimeSeriesException
  {
  public:
    explicit TimeSeriesDataException(const std::string& msg)
      : TimeSeriesException(msg) {}
  };

  class TimeSeriesOffsetOutOfRangeException : public TimeSeriesException
  {
  public:
    explicit TimeSeriesOffsetOutOfRangeException(const std::string& msg)
      : TimeSeriesException(msg) {}
  };

} // namespace mkc_crossover

#endif // __TIMESERIES_EXCEPTION_H
