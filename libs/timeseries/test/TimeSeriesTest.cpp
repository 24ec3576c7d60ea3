#include <catch2/catch_test_macros.hpp>
#include <sstream>
#include "TimeSeries.h"
#include "TestUtils.h"

using namespace mkc_crossover;
using namespace boost::gregorian;
using namespace boost::posix_time;

TEST_CASE ("OHLCTimeSeries operations", "[TimeSeries]")
{
  auto entry0 = createTimeSeriesEntry ("19851118", "3664.51025", "3687.58178", "3656.81982", "3672.20068", "0");
  auto entry1 = createTimeSeriesEntry ("19851119", "3710.65307", "3722.18872", "3679.89380", "3714.49829", "0");
  auto entry2 = createTimeSeriesEntry ("19851120", "3737.56763", "3756.79321", "3726.03101", "3729.87646", "0");
  auto entry3 = createTimeSeriesEntry ("19851121", "3699.11694", "3710.65307", "3668.35815", "3683.73755", "0");

  OHLCTimeSeries<DecimalType> spySeries (TimeFrame::DAILY);
  spySeries.addEntry (*entry0);
  spySeries.addEntry (*entry1);
  spySeries.addEntry (*entry2);
  spySeries.addEntry (*entry3);

  SECTION ("Size and bounds")
    {
      REQUIRE (spySeries.getNumEntries() == 4);
      REQUIRE_FALSE (spySeries.isEmpty());
      REQUIRE (spySeries.getTimeFrame() == TimeFrame::DAILY);
      REQUIRE (spySeries.getFirstDateTime() == entry0->getDateTime());
      REQUIRE (spySeries.getLastDateTime() == entry3->getDateTime());
    }

  SECTION ("Random access by bar index")
    {
      REQUIRE (spySeries.getEntry(0) == *entry0);
      REQUIRE (spySeries.getEntry(2) == *entry2);
      REQUIRE (spySeries.getEntry(3).getCloseValue() == createDecimal("3683.73755"));
      REQUIRE_THROWS_AS (spySeries.getEntry(4), TimeSeriesOffsetOutOfRangeException);
    }

  SECTION ("Iteration visits bars in time order")
    {
      ptime previous (boost::date_time::neg_infin);
      std::size_t count = 0;

      for (auto it = spySeries.beginRandomAccess(); it != spySeries.endRandomAccess(); ++it)
	{
	  REQUIRE (it->getDateTime() > previous);
	  previous = it->getDateTime();
	  ++count;
	}

      REQUIRE (count == 4);
    }

  SECTION ("Duplicate timestamp is rejected")
    {
      REQUIRE_THROWS_AS (spySeries.addEntry (*entry3), TimeSeriesDataException);
      REQUIRE (spySeries.getNumEntries() == 4);
    }

  SECTION ("Earlier timestamp is rejected")
    {
      REQUIRE_THROWS_AS (spySeries.addEntry (*entry1), TimeSeriesDataException);
    }

  SECTION ("Time frame mismatch is rejected")
    {
      EntryType weekly (date(1985, Nov, 29), createDecimal("10"), createDecimal("10"),
			createDecimal("10"), createDecimal("10"), createDecimal("0"),
			TimeFrame::WEEKLY);

      REQUIRE_THROWS_AS (spySeries.addEntry (weekly), TimeSeriesDataException);
    }

  SECTION ("Equality and copy")
    {
      OHLCTimeSeries<DecimalType> copy (spySeries);
      REQUIRE (copy == spySeries);

      OHLCTimeSeries<DecimalType> shorter (TimeFrame::DAILY);
      shorter.addEntry (*entry0);
      REQUIRE (shorter != spySeries);
    }

  SECTION ("Stream output has a header and one line per bar")
    {
      std::ostringstream os;
      os << spySeries;

      std::istringstream is (os.str());
      std::string line;
      unsigned int lines = 0;
      while (std::getline (is, line))
	++lines;

      REQUIRE (lines == 5);
      REQUIRE (os.str().find ("DateTime,Open,High,Low,Close,Volume") == 0);
    }
}

TEST_CASE ("Empty OHLCTimeSeries", "[TimeSeries]")
{
  OHLCTimeSeries<DecimalType> empty (TimeFrame::DAILY, 10);

  REQUIRE (empty.isEmpty());
  REQUIRE (empty.getNumEntries() == 0);
  REQUIRE_THROWS_AS (empty.getFirstDateTime(), TimeSeriesOffsetOutOfRangeException);
  REQUIRE_THROWS_AS (empty.getLastDateTime(), TimeSeriesDataException);
}

TEST_CASE ("TimeFrame conversions", "[TimeSeries]")
{
  REQUIRE (getTimeFrameFromString ("daily") == TimeFrame::DAILY);
  REQUIRE (getTimeFrameFromString ("Weekly") == TimeFrame::WEEKLY);
  REQUIRE (getTimeFrameFromString ("INTRADAY") == TimeFrame::INTRADAY);
  REQUIRE (timeFrameToString (TimeFrame::MONTHLY) == "MONTHLY");
  REQUIRE_THROWS_AS (getTimeFrameFromString ("hourly"), TimeFrameException);
}
