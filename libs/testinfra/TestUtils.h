#ifndef __TEST_UTILS_H
#define __TEST_UTILS_H 1

#include <string>
#include <memory>
#include <vector>
#include <utility>

#include <boost/date_time.hpp>
#include "TimeSeriesEntry.h"
#include "TimeSeries.h"

typedef dec::decimal<7> DecimalType;
typedef mkc_crossover::OHLCTimeSeriesEntry<DecimalType> EntryType;
typedef mkc_crossover::OHLCTimeSeries<DecimalType> SeriesType;

DecimalType createDecimal(const std::string& valueString);

// dateString is undelimited ISO, e.g. "20160104"
std::shared_ptr<EntryType>
createTimeSeriesEntry (const std::string& dateString,
		       const std::string& openPrice,
		       const std::string& highPrice,
		       const std::string& lowPrice,
		       const std::string& closePrice,
		       const std::string& vol);

std::shared_ptr<EntryType>
createTimeSeriesEntry (const mkc_crossover::TimeSeriesDate& aDate,
		       const DecimalType& openPrice,
		       const DecimalType& highPrice,
		       const DecimalType& lowPrice,
		       const DecimalType& closePrice,
		       const DecimalType& vol);

// One daily bar per close, starting 2020-01-01, with open == high == low == close.
std::shared_ptr<SeriesType>
createSeriesFromCloses (const std::vector<std::string>& closes);

// One daily bar per (open, close) pair; high and low bracket both prices.
std::shared_ptr<SeriesType>
createSeriesFromOpenClose (const std::vector<std::pair<std::string, std::string>>& openClose);

// Writes contents to a file in the working directory and returns its path.
std::string writeTemporaryFile (const std::string& baseName, const std::string& contents);

#endif
