#include <algorithm>
#include <cstdio>
#include <fstream>
#include <stdexcept>
#include "TestUtils.h"
#include "DecimalConstants.h"

using namespace boost::gregorian;
using namespace boost::posix_time;
using namespace mkc_crossover;

DecimalType createDecimal(const std::string& valueString)
{
  return dec::fromString<DecimalType>(valueString);
}

std::shared_ptr<EntryType>
createTimeSeriesEntry (const std::string& dateString,
		       const std::string& openPrice,
		       const std::string& highPrice,
		       const std::string& lowPrice,
		       const std::string& closePrice,
		       const std::string& vol)
{
  return createTimeSeriesEntry (from_undelimited_string(dateString),
				createDecimal(openPrice),
				createDecimal(highPrice),
				createDecimal(lowPrice),
				createDecimal(closePrice),
				createDecimal(vol));
}

std::shared_ptr<EntryType>
createTimeSeriesEntry (const TimeSeriesDate& aDate,
		       const DecimalType& openPrice,
		       const DecimalType& highPrice,
		       const DecimalType& lowPrice,
		       const DecimalType& closePrice,
		       const DecimalType& vol)
{
  return std::make_shared<EntryType>(aDate, openPrice, highPrice, lowPrice,
				     closePrice, vol, TimeFrame::DAILY);
}

std::shared_ptr<SeriesType>
createSeriesFromCloses (const std::vector<std::string>& closes)
{
  std::vector<std::pair<std::string, std::string>> openClose;
  for (const auto& close : closes)
    openClose.push_back(std::make_pair(close, close));

  return createSeriesFromOpenClose(openClose);
}

std::shared_ptr<SeriesType>
createSeriesFromOpenClose (const std::vector<std::pair<std::string, std::string>>& openClose)
{
  auto series = std::make_shared<SeriesType>(TimeFrame::DAILY, openClose.size());
  date barDate(2020, Jan, 1);
  const DecimalType volume(createDecimal("1000"));

  for (const auto& prices : openClose)
    {
      DecimalType open(createDecimal(prices.first));
      DecimalType close(createDecimal(prices.second));

      series->addEntry(EntryType(barDate, open, std::max(open, close), std::min(open, close),
				 close, volume, TimeFrame::DAILY));
      barDate = barDate + days(1);
    }

  return series;
}

std::string writeTemporaryFile (const std::string& baseName, const std::string& contents)
{
  const std::string path = "crossover_test_" + baseName;
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out.is_open())
    throw std::runtime_error("writeTemporaryFile: cannot create " + path);

  out << contents;
  return path;
}
