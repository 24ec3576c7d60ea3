// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __CSVREADER_H
#define __CSVREADER_H 1

#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <boost/algorithm/string.hpp>
#include <boost/date_time.hpp>
#include "TimeSeries.h"
#include "DecimalConstants.h"
#include "csv.h"

namespace mkc_crossover
{
  using boost::posix_time::ptime;

  /**
   * @class TimeSeriesCsvReader
   * @brief Loads an OHLCV bar series from a delimited text file.
   *
   * The reader accepts the column spellings produced by the usual data
   * vendors (Yahoo style "Date,Open,High,Low,Close,Volume,Dividends,Stock
   * Splits", lower case headers, and the Chinese headers of A-share exports).
   * Descriptive lines in front of the header row are skipped.
   *
   * Dates are "YYYY-MM-DD", "YYYYMMDD" or "YYYY-MM-DD HH:MM:SS"; a trailing
   * UTC offset is dropped. Rows must already be in strictly increasing time
   * order. Any malformed row raises TimeSeriesDataException, the reader never
   * skips or repairs data.
   */
  template <class Decimal>
  class TimeSeriesCsvReader
  {
  private:
    enum ColumnId {DATE_COLUMN, OPEN_COLUMN, HIGH_COLUMN, LOW_COLUMN, CLOSE_COLUMN,
		   VOLUME_COLUMN, DIVIDENDS_COLUMN, SPLITS_COLUMN};

    static constexpr unsigned int NumColumns = 8;
    static constexpr unsigned int MaxPreambleLines = 10;

  public:
    TimeSeriesCsvReader (const std::string& fileName, TimeFrame::Duration timeFrame)
      : mFileName (fileName),
	mTimeFrame(timeFrame),
	mTimeSeries(std::make_shared<OHLCTimeSeries<Decimal>> (timeFrame))
    {
      std::ifstream fin(mFileName);
      if (!fin.is_open())
	throw TimeSeriesDataException("Cannot open file: " + mFileName);
    }

    TimeSeriesCsvReader (const TimeSeriesCsvReader& rhs) = default;
    TimeSeriesCsvReader& operator=(const TimeSeriesCsvReader& rhs) = default;

    ~TimeSeriesCsvReader()
    {}

    const std::string& getFileName() const
    {
      return mFileName;
    }

    TimeFrame::Duration getTimeFrame() const
    {
      return mTimeFrame;
    }

    std::shared_ptr<OHLCTimeSeries<Decimal>> getTimeSeries()
    {
      return mTimeSeries;
    }

    void readFile()
    {
      unsigned int preambleLines = 0;
      std::map<ColumnId, std::string> columnNames = locateHeader(preambleLines);

      std::ifstream input(mFileName);
      std::string skipped;
      for (unsigned int i = 0; i < preambleLines; ++i)
	std::getline(input, skipped);

      io::CSVReader<NumColumns, io::trim_chars<' ', '\t'>, io::double_quote_escape<',', '"'>> csvFile(mFileName, input);

      try
	{
	  readRows(csvFile, columnNames);
	}
      catch (const io::error::base& e)
	{
	  throw TimeSeriesDataException("TimeSeriesCsvReader: " + mFileName + ": " + e.what());
	}

      if (mTimeSeries->isEmpty())
	throw TimeSeriesDataException("TimeSeriesCsvReader: no bars found in " + mFileName);
    }

  private:
    template <class CsvFile>
    void readRows(CsvFile& csvFile, std::map<ColumnId, std::string>& columnNames)
    {
      csvFile.read_header(io::ignore_extra_column | io::ignore_missing_column,
			  columnNames[DATE_COLUMN], columnNames[OPEN_COLUMN],
			  columnNames[HIGH_COLUMN], columnNames[LOW_COLUMN],
			  columnNames[CLOSE_COLUMN], columnNames[VOLUME_COLUMN],
			  columnNames[DIVIDENDS_COLUMN], columnNames[SPLITS_COLUMN]);

      const bool hasDividends = csvFile.has_column(columnNames[DIVIDENDS_COLUMN]);
      const bool hasSplits = csvFile.has_column(columnNames[SPLITS_COLUMN]);

      std::string dateString, openString, highString, lowString, closeString, volumeString;
      std::string dividendString, splitString;
      const Decimal& zero = DecimalConstants<Decimal>::DecimalZero;

      while (csvFile.read_row(dateString, openString, highString, lowString, closeString,
			      volumeString, dividendString, splitString))
	{
	  const unsigned int lineNumber = csvFile.get_file_line();

	  std::optional<Decimal> dividends;
	  if (hasDividends && !dividendString.empty())
	    dividends = parseDecimal(dividendString, "dividends", lineNumber);

	  std::optional<Decimal> splitRatio;
	  if (hasSplits && !splitString.empty())
	    {
	      Decimal ratio = parseDecimal(splitString, "split ratio", lineNumber);
	      // vendors write 0 for "no split on this bar"
	      if (ratio != zero)
		splitRatio = ratio;
	    }

	  mTimeSeries->addEntry(OHLCTimeSeriesEntry<Decimal>(parseDateTime(dateString, lineNumber),
							     parseDecimal(openString, "open", lineNumber),
							     parseDecimal(highString, "high", lineNumber),
							     parseDecimal(lowString, "low", lineNumber),
							     parseDecimal(closeString, "close", lineNumber),
							     parseDecimal(volumeString, "volume", lineNumber),
							     mTimeFrame,
							     dividends,
							     splitRatio));
	  dividendString.clear();
	  splitString.clear();
	}
    }

    static const std::vector<std::string>& getAliases(ColumnId column)
    {
      static const std::map<ColumnId, std::vector<std::string>> aliases =
	{
	  {DATE_COLUMN, {"Date", "date", "Datetime", "datetime", "DateTime", "交易日期", "日期"}},
	  {OPEN_COLUMN, {"Open", "open", "开盘价"}},
	  {HIGH_COLUMN, {"High", "high", "最高价"}},
	  {LOW_COLUMN, {"Low", "low", "最低价"}},
	  {CLOSE_COLUMN, {"Close", "close", "收盘价"}},
	  {VOLUME_COLUMN, {"Volume", "volume", "成交量"}},
	  {DIVIDENDS_COLUMN, {"Dividends", "dividends"}},
	  {SPLITS_COLUMN, {"Stock Splits", "stock_splits", "Splits", "splits"}}
	};

      return aliases.at(column);
    }

    static std::vector<std::string> splitHeaderLine(std::string line)
    {
      // strip a UTF-8 byte order mark
      if (line.size() >= 3 && line.compare(0, 3, "\xEF\xBB\xBF") == 0)
	line.erase(0, 3);

      std::vector<std::string> fields;
      boost::algorithm::split(fields, line, boost::is_any_of(","));
      for (auto& field : fields)
	{
	  boost::algorithm::trim_if(field, boost::is_any_of(" \t\r\""));
	}

      return fields;
    }

    static std::optional<std::string> findColumn(const std::vector<std::string>& fields,
						 ColumnId column)
    {
      for (const auto& alias : getAliases(column))
	{
	  for (const auto& field : fields)
	    if (field == alias)
	      return field;
	}

      return std::nullopt;
    }

    // Scans for the header row, returning the actual spelling of each column
    // and the number of descriptive lines in front of it.
    std::map<ColumnId, std::string> locateHeader(unsigned int& preambleLines) const
    {
      std::ifstream input(mFileName);
      std::string line;
      preambleLines = 0;

      while (std::getline(input, line) && (preambleLines <= MaxPreambleLines))
	{
	  std::vector<std::string> fields = splitHeaderLine(line);
	  std::optional<std::string> dateColumn = findColumn(fields, DATE_COLUMN);

	  if (dateColumn)
	    {
	      std::map<ColumnId, std::string> columnNames;
	      columnNames[DATE_COLUMN] = *dateColumn;

	      for (ColumnId required : {OPEN_COLUMN, HIGH_COLUMN, LOW_COLUMN, CLOSE_COLUMN, VOLUME_COLUMN})
		{
		  std::optional<std::string> name = findColumn(fields, required);
		  if (!name)
		    throw TimeSeriesDataException("TimeSeriesCsvReader: required column " +
						  getAliases(required).front() + " missing in " + mFileName);
		  columnNames[required] = *name;
		}

	      for (ColumnId optionalColumn : {DIVIDENDS_COLUMN, SPLITS_COLUMN})
		{
		  std::optional<std::string> name = findColumn(fields, optionalColumn);
		  columnNames[optionalColumn] = name ? *name : getAliases(optionalColumn).front();
		}

	      return columnNames;
	    }

	  ++preambleLines;
	}

      throw TimeSeriesDataException("TimeSeriesCsvReader: no header row with a date column found in " + mFileName);
    }

    Decimal parseDecimal(const std::string& field, const std::string& columnName,
			 unsigned int lineNumber) const
    {
      if (field.empty())
	throw TimeSeriesDataException(rowError(lineNumber) + "missing " + columnName + " value");

      std::size_t consumed = 0;
      double value;

      try
	{
	  value = std::stod(field, &consumed);
	}
      catch (const std::logic_error&)
	{
	  throw TimeSeriesDataException(rowError(lineNumber) + columnName + " value '" + field + "' is not a number");
	}

      if (consumed != field.size())
	throw TimeSeriesDataException(rowError(lineNumber) + columnName + " value '" + field + "' is not a number");

      if (!std::isfinite(value))
	throw TimeSeriesDataException(rowError(lineNumber) + columnName + " value '" + field + "' is not finite");

      if (field.find_first_of("eE") != std::string::npos)
	return Decimal(value);

      return DecimalConstants<Decimal>::createDecimal(field);
    }

    ptime parseDateTime(const std::string& field, unsigned int lineNumber) const
    {
      try
	{
	  if (field.size() == 8 &&
	      std::all_of(field.begin(), field.end(), [](char c) { return std::isdigit(static_cast<unsigned char>(c)); }))
	    return ptime(boost::gregorian::from_undelimited_string(field), getDefaultBarTime());

	  if (field.size() == 10)
	    return ptime(boost::gregorian::from_simple_string(field), getDefaultBarTime());

	  if (field.size() >= 19)
	    {
	      std::string dateTimePart = field.substr(0, 19);
	      std::replace(dateTimePart.begin(), dateTimePart.end(), 'T', ' ');
	      ptime result = boost::posix_time::time_from_string(dateTimePart);
	      if (!result.is_special())
		return result;
	    }
	}
      catch (const std::exception&)
	{
	  // reported below together with the row number
	}

      throw TimeSeriesDataException(rowError(lineNumber) + "unparseable date '" + field + "'");
    }

    std::string rowError(unsigned int lineNumber) const
    {
      return "TimeSeriesCsvReader: " + mFileName + " line " + std::to_string(lineNumber) + ": ";
    }

  private:
    std::string mFileName;
    TimeFrame::Duration mTimeFrame;
    std::shared_ptr<OHLCTimeSeries<Decimal>> mTimeSeries;
  };
}

#endif
