#ifndef __ANNUALIZER_H
#define __ANNUALIZER_H

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <vector>
#include "number.h"
#include "DecimalConstants.h"
#include "TimeFrame.h"
#include "TimeSeries.h"

namespace mkc_crossover
{
  /**
   * @brief Number of bars of the given time frame in one year.
   *
   * @param timeFrame The time frame of the data (e.g., DAILY, WEEKLY, INTRADAY).
   * @param intraday_minutes_per_bar Minutes per bar for INTRADAY data; must be > 0.
   * @param trading_days_per_year Number of trading days per year (default 252).
   * @param trading_hours_per_day Number of trading hours per day (default 6.5).
   */
  inline double computeAnnualizationFactor(TimeFrame::Duration timeFrame,
                                           int intraday_minutes_per_bar = 0,
                                           double trading_days_per_year = 252.0,
                                           double trading_hours_per_day = 6.5)
  {
    switch (timeFrame)
      {
      case TimeFrame::DAILY:
        return trading_days_per_year;

      case TimeFrame::WEEKLY:
        return 52.0;

      case TimeFrame::MONTHLY:
        return 12.0;

      case TimeFrame::QUARTERLY:
        return 4.0;

      case TimeFrame::YEARLY:
        return 1.0;

      case TimeFrame::INTRADAY:
        {
          if (intraday_minutes_per_bar <= 0)
	    throw std::invalid_argument("computeAnnualizationFactor(INTRADAY): minutes per bar must be positive.");

          const double bars_per_hour = 60.0 / static_cast<double>(intraday_minutes_per_bar);
          if (!(trading_days_per_year > 0.0) || !(trading_hours_per_day > 0.0))
	    throw std::invalid_argument("Annualization inputs must be positive finite values.");

          return trading_hours_per_day * bars_per_hour * trading_days_per_year;
        }
      }

    throw std::invalid_argument("Unsupported time frame for annualization.");
  }

  /**
   * @brief Most common spacing, in minutes, between consecutive bars that
   *        fall on the same day.
   * @return 0 if the series has no two bars on the same day.
   */
  template <class Decimal>
  int inferIntradayMinutesPerBar(const OHLCTimeSeries<Decimal>& series)
  {
    std::vector<long> spacings;

    for (std::size_t i = 1; i < series.getNumEntries(); ++i)
      {
	const ptime& previous = series.getEntry(i - 1).getDateTime();
	const ptime& current = series.getEntry(i).getDateTime();

	if (previous.date() == current.date())
	  spacings.push_back((current - previous).total_seconds() / 60);
      }

    if (spacings.empty())
      return 0;

    std::sort(spacings.begin(), spacings.end());

    long mode = spacings.front();
    std::size_t modeCount = 0;
    for (std::size_t i = 0; i < spacings.size(); )
      {
	std::size_t j = i;
	while ((j < spacings.size()) && (spacings[j] == spacings[i]))
	  ++j;

	if ((j - i) > modeCount)
	  {
	    modeCount = j - i;
	    mode = spacings[i];
	  }
	i = j;
      }

    return static_cast<int>(mode);
  }

  /**
   * @brief Annualization factor for a whole series; INTRADAY series have
   *        their bar spacing inferred from the timestamps.
   *
   * An INTRADAY series with no two bars on the same day is annualized as
   * one bar per trading day.
   */
  template <class Decimal>
  double computeAnnualizationFactorForSeries(const OHLCTimeSeries<Decimal>& series,
					     double trading_days_per_year = 252.0,
					     double trading_hours_per_day = 6.5)
  {
    if (series.getTimeFrame() == TimeFrame::INTRADAY)
      {
	const int minutesPerBar = inferIntradayMinutesPerBar(series);
	if (minutesPerBar <= 0)
	  return trading_days_per_year;

	return computeAnnualizationFactor(TimeFrame::INTRADAY, minutesPerBar,
					  trading_days_per_year, trading_hours_per_day);
      }

    return computeAnnualizationFactor(series.getTimeFrame(), 0, trading_days_per_year,
				      trading_hours_per_day);
  }

  /**
   * Annualizer for compounded returns.
   *
   * annualize_one(r, K) = (1 + r)^K - 1, computed as exp(K * log1p(r)) - 1.
   * A return of -100% or worse stays at -1. Results are capped at
   * kMaxAnnualizedReturn.
   */
  template <class Decimal>
  class Annualizer
  {
  public:
    static constexpr long double kMaxAnnualizedReturn = 1.0e9L;

    static Decimal annualize_one(const Decimal& r, double K)
    {
      if (!(K > 0.0) || !std::isfinite(K))
	throw std::invalid_argument("Annualizer: K must be positive and finite.");

      if (r <= DecimalConstants<Decimal>::DecimalMinusOne)
	return DecimalConstants<Decimal>::DecimalMinusOne;

      const long double lr = std::log1p(static_cast<long double>(num::to_double(r)));
      long double y = std::exp(static_cast<long double>(K) * lr) - 1.0L;

      // short, strongly trending samples compound past what Decimal can hold
      if (!std::isfinite(y) || (y > kMaxAnnualizedReturn))
	y = kMaxAnnualizedReturn;

      return Decimal(static_cast<double>(y));
    }

    /**
     * @brief Compound annual growth rate of a total return earned over numBars
     *        bars, with barsPerYear bars in a year.
     */
    static Decimal annualizeTotalReturn(const Decimal& totalReturn,
					std::size_t numBars,
					double barsPerYear)
    {
      if (numBars == 0)
	return DecimalConstants<Decimal>::DecimalZero;

      return annualize_one(totalReturn, barsPerYear / static_cast<double>(numBars));
    }
  };
} // namespace mkc_crossover

#endif // __ANNUALIZER_H
