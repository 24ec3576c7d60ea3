// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __TIME_FRAME_H
#define __TIME_FRAME_H 1

#include <stdexcept>
#include <string>
#include <boost/algorithm/string.hpp>

namespace mkc_crossover
{
  //
  // class TimeFrameException
  //

  class TimeFrameException : public std::domain_error
  {
  public:
    TimeFrameException(const std::string msg)
      : std::domain_error(msg)
    {}

    ~TimeFrameException()
    {}

  };

  class TimeFrame
  {
  public:
    enum Duration {INTRADAY, DAILY, WEEKLY, MONTHLY, QUARTERLY, YEARLY} ;
  };

  inline TimeFrame::Duration getTimeFrameFromString(const std::string& timeFrameString)
  {
    const std::string name = boost::algorithm::to_upper_copy(timeFrameString);

    if (name == "INTRADAY")
      return TimeFrame::INTRADAY;
    else if (name == "DAILY")
      return TimeFrame::DAILY;
    else if (name == "WEEKLY")
      return TimeFrame::WEEKLY;
    else if (name == "MONTHLY")
      return TimeFrame::MONTHLY;
    else if (name == "QUARTERLY")
      return TimeFrame::QUARTERLY;
    else if (name == "YEARLY")
      return TimeFrame::YEARLY;

    throw TimeFrameException("getTimeFrameFromString: unknown time frame " + timeFrameString);
  }

  inline std::string timeFrameToString(TimeFrame::Duration timeFrame)
  {
    switch (timeFrame)
      {
      case TimeFrame::INTRADAY:
	return "INTRADAY";
      case TimeFrame::DAILY:
	return "DAILY";
      case TimeFrame::WEEKLY:
	return "WEEKLY";
      case TimeFrame::MONTHLY:
	return "MONTHLY";
      case TimeFrame::QUARTERLY:
	return "QUARTERLY";
      case TimeFrame::YEARLY:
	return "YEARLY";
      }

    throw TimeFrameException("timeFrameToString: unknown time frame");
  }
}

#endif
