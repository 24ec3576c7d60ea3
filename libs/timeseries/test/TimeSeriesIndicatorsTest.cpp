#include <catch2/catch_test_macros.hpp>
#include <vector>
#include <string>
#include "TimeSeriesIndicators.h"
#include "TimeSeries.h"
#include "TestUtils.h"

using namespace mkc_crossover;

namespace
{
  std::vector<std::optional<DecimalType>>
  runIndicator (MovingAverage<DecimalType>& indicator, const SeriesType& series)
  {
    std::vector<std::optional<DecimalType>> values;
    for (auto it = series.beginRandomAccess(); it != series.endRandomAccess(); ++it)
      values.push_back (indicator.update (*it));

    return values;
  }
}

TEST_CASE ("SimpleMovingAverage values", "[TimeSeriesIndicators]")
{
  auto series = createSeriesFromCloses ({"10", "10", "10", "12", "14", "16", "14", "12", "10", "8"});

  SECTION ("Window of two")
    {
      SimpleMovingAverage<DecimalType> sma (2);
      auto values = runIndicator (sma, *series);

      REQUIRE_FALSE (values[0]);
      REQUIRE (*values[1] == createDecimal("10"));
      REQUIRE (*values[3] == createDecimal("11"));
      REQUIRE (*values[4] == createDecimal("13"));
      REQUIRE (*values[9] == createDecimal("9"));
      REQUIRE (sma.isReady());
      REQUIRE (sma.getType() == MovingAverageType::SIMPLE);
    }

  SECTION ("Window of four")
    {
      SimpleMovingAverage<DecimalType> sma (4);
      auto values = runIndicator (sma, *series);

      REQUIRE_FALSE (values[0]);
      REQUIRE_FALSE (values[1]);
      REQUIRE_FALSE (values[2]);
      REQUIRE (*values[3] == createDecimal("10.5"));
      REQUIRE (*values[4] == createDecimal("11.5"));
      REQUIRE (*values[5] == createDecimal("13"));
      REQUIRE (*values[9] == createDecimal("11"));
    }

  SECTION ("Window of one tracks the close")
    {
      SimpleMovingAverage<DecimalType> sma (1);
      auto values = runIndicator (sma, *series);

      for (std::size_t i = 0; i < values.size(); ++i)
	REQUIRE (*values[i] == series->getEntry(i).getCloseValue());
    }

  SECTION ("Window longer than the series never becomes defined")
    {
      SimpleMovingAverage<DecimalType> sma (11);
      auto values = runIndicator (sma, *series);

      for (const auto& value : values)
	REQUIRE_FALSE (value);

      REQUIRE_FALSE (sma.isReady());
    }
}

TEST_CASE ("ExponentialMovingAverage values", "[TimeSeriesIndicators]")
{
  auto series = createSeriesFromCloses ({"1", "2", "3", "4", "8"});
  ExponentialMovingAverage<DecimalType> ema (3);

  REQUIRE (ema.getSmoothingFactor() == createDecimal("0.5"));

  auto values = runIndicator (ema, *series);

  REQUIRE_FALSE (values[0]);
  REQUIRE_FALSE (values[1]);
  // seeded with the simple mean of the first window
  REQUIRE (*values[2] == createDecimal("2"));
  REQUIRE (*values[3] == createDecimal("3"));
  REQUIRE (*values[4] == createDecimal("5.5"));
  REQUIRE (ema.getType() == MovingAverageType::EXPONENTIAL);
}

TEST_CASE ("Moving average values depend only on past bars", "[TimeSeriesIndicators]")
{
  auto prefix = createSeriesFromCloses ({"10", "11", "9", "12", "13"});
  auto extended = createSeriesFromCloses ({"10", "11", "9", "12", "13", "40", "1", "25"});

  for (MovingAverageType type : {MovingAverageType::SIMPLE, MovingAverageType::EXPONENTIAL})
    {
      auto shortRun = createMovingAverage<DecimalType> (type, 3);
      auto longRun = createMovingAverage<DecimalType> (type, 3);

      auto prefixValues = runIndicator (*shortRun, *prefix);
      auto extendedValues = runIndicator (*longRun, *extended);

      for (std::size_t i = 0; i < prefixValues.size(); ++i)
	REQUIRE (prefixValues[i] == extendedValues[i]);
    }
}

TEST_CASE ("Moving average factory and names", "[TimeSeriesIndicators]")
{
  REQUIRE (createMovingAverage<DecimalType> (MovingAverageType::SIMPLE, 5)->getWindow() == 5);
  REQUIRE (createMovingAverage<DecimalType> (MovingAverageType::EXPONENTIAL, 7)->getType() ==
	   MovingAverageType::EXPONENTIAL);

  REQUIRE_THROWS_AS (SimpleMovingAverage<DecimalType> (0), IndicatorException);
  REQUIRE_THROWS_AS (createMovingAverage<DecimalType> (MovingAverageType::EXPONENTIAL, 0),
		     IndicatorException);

  REQUIRE (getMovingAverageTypeFromString ("sma") == MovingAverageType::SIMPLE);
  REQUIRE (getMovingAverageTypeFromString ("EMA") == MovingAverageType::EXPONENTIAL);
  REQUIRE (movingAverageTypeToString (MovingAverageType::SIMPLE) == "SMA");
  REQUIRE_THROWS_AS (getMovingAverageTypeFromString ("wma"), IndicatorException);
}

TEST_CASE ("MACD line, signal line and histogram", "[TimeSeriesIndicators]")
{
  // A window of one makes the fast average the close itself
  auto series = createSeriesFromCloses ({"1", "2", "3", "4", "8", "8", "8"});
  MovingAverageConvergenceDivergence<DecimalType> macd (1, 3, 3);

  std::vector<std::optional<DecimalType>> macdLine, signalLine;
  for (auto it = series->beginRandomAccess(); it != series->endRandomAccess(); ++it)
    {
      macd.update (*it);
      macdLine.push_back (macd.getMacdLine());
      signalLine.push_back (macd.getSignalLine());
    }

  REQUIRE_FALSE (macdLine[1]);
  REQUIRE (*macdLine[2] == createDecimal("1"));
  REQUIRE (*macdLine[3] == createDecimal("1"));
  REQUIRE (*macdLine[4] == createDecimal("2.5"));
  REQUIRE (*macdLine[6] == createDecimal("0.625"));

  REQUIRE_FALSE (signalLine[3]);
  REQUIRE (*signalLine[4] == createDecimal("1.5"));
  REQUIRE (*signalLine[5] == createDecimal("1.375"));
  REQUIRE (*signalLine[6] == createDecimal("1"));
  REQUIRE (*macd.getHistogram() == createDecimal("-0.375"));

  REQUIRE_THROWS_AS (MovingAverageConvergenceDivergence<DecimalType> (26, 12, 9), IndicatorException);
  REQUIRE_THROWS_AS (MovingAverageConvergenceDivergence<DecimalType> (12, 26, 0), IndicatorException);
}

TEST_CASE ("RelativeStrengthIndex uses Wilder smoothing", "[TimeSeriesIndicators]")
{
  SECTION ("Seed and smoothed values")
    {
      auto series = createSeriesFromCloses ({"10", "13", "12", "11"});
      RelativeStrengthIndex<DecimalType> rsi (2);

      std::vector<std::optional<DecimalType>> values;
      for (auto it = series->beginRandomAccess(); it != series->endRandomAccess(); ++it)
	values.push_back (rsi.update (*it));

      REQUIRE_FALSE (values[0]);
      REQUIRE_FALSE (values[1]);
      // gains 3, 0 and losses 0, 1 average to 1.5 and 0.5
      REQUIRE (*values[2] == createDecimal("75"));
      // (1.5 + 0) / 2 against (0.5 + 1) / 2
      REQUIRE (*values[3] == createDecimal("50"));
      REQUIRE (rsi.getPeriod() == 2);
    }

  SECTION ("Only gains")
    {
      auto series = createSeriesFromCloses ({"5", "6", "7"});
      RelativeStrengthIndex<DecimalType> rsi (2);

      for (auto it = series->beginRandomAccess(); it != series->endRandomAccess(); ++it)
	rsi.update (*it);

      REQUIRE (*rsi.getValue() == createDecimal("100"));
    }

  SECTION ("No movement")
    {
      auto series = createSeriesFromCloses ({"5", "5", "5"});
      RelativeStrengthIndex<DecimalType> rsi (2);

      for (auto it = series->beginRandomAccess(); it != series->endRandomAccess(); ++it)
	rsi.update (*it);

      REQUIRE (*rsi.getValue() == createDecimal("50"));
    }

  REQUIRE_THROWS_AS (RelativeStrengthIndex<DecimalType> (0), IndicatorException);
}
