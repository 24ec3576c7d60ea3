// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __PARAMETER_SWEEP_H
#define __PARAMETER_SWEEP_H 1

#include <algorithm>
#include <cstdint>
#include <iterator>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>
#include "BackTester.h"
#include "BacktestConfiguration.h"
#include "BacktestResult.h"
#include "TimeSeries.h"
#include "IParallelExecutor.h"
#include "ParallelFor.h"

namespace mkc_crossover
{
  typedef std::pair<unsigned int, unsigned int> WindowPair;

  template <class Decimal>
  struct SweepEntry
  {
    unsigned int fastWindow;
    unsigned int slowWindow;
    std::shared_ptr<const BacktestResult<Decimal>> result;
  };

  /**
   * @class ParameterSweep
   * @brief Runs one backtest per (fast, slow) window pair over a shared series.
   *
   * Every run gets its own BackTester, ledger and result; the only thing the
   * runs share is the read-only series. Results are stored by grid position,
   * so any executor yields the same vector in the same order.
   */
  template <class Decimal>
  class ParameterSweep
  {
  public:
    typedef typename BackTester<Decimal>::SeriesPtr SeriesPtr;

    ParameterSweep (SeriesPtr series, const BacktestConfiguration<Decimal>& baseConfiguration)
      : mSeries(series),
	mBaseConfiguration(baseConfiguration)
    {
      if (!mSeries || mSeries->isEmpty())
	throw TimeSeriesDataException("ParameterSweep: bar series is missing or empty");
    }

    /**
     * @brief All pairs with fastMin <= fast <= fastMax and
     *        slowMin <= slow <= slowMax, fast outermost. Pairs with
     *        fast >= slow or a zero window are left out.
     */
    static std::vector<WindowPair> makeGrid (unsigned int fastMin, unsigned int fastMax, unsigned int fastStep,
					     unsigned int slowMin, unsigned int slowMax, unsigned int slowStep)
    {
      if ((fastStep == 0) || (slowStep == 0))
	throw std::invalid_argument("ParameterSweep::makeGrid - step must be positive");

      std::vector<WindowPair> grid;
      for (unsigned int fast = fastMin; fast <= fastMax; fast += fastStep)
	for (unsigned int slow = slowMin; slow <= slowMax; slow += slowStep)
	  if (isValidPair(fast, slow))
	    grid.push_back(WindowPair(fast, slow));

      return grid;
    }

    static bool isValidPair (unsigned int fast, unsigned int slow)
    {
      return (fast > 0) && (fast < slow);
    }

    std::vector<SweepEntry<Decimal>> run (const std::vector<WindowPair>& grid,
					  concurrency::IParallelExecutor& executor) const
    {
      std::vector<WindowPair> validPairs;
      std::copy_if(grid.begin(), grid.end(), std::back_inserter(validPairs),
		   [](const WindowPair& p) { return isValidPair(p.first, p.second); });

      std::vector<SweepEntry<Decimal>> entries(validPairs.size());

      concurrency::parallel_for(static_cast<uint32_t>(validPairs.size()), executor,
				[this, &validPairs, &entries](uint32_t i) {
				  const WindowPair& windows = validPairs[i];
				  BackTester<Decimal> backTester(mSeries,
								 mBaseConfiguration.withWindows(windows.first,
												windows.second));
				  entries[i].fastWindow = windows.first;
				  entries[i].slowWindow = windows.second;
				  entries[i].result = std::make_shared<const BacktestResult<Decimal>>(backTester.run());
				});

      return entries;
    }

    // Entries ordered by descending total return; ties keep grid order.
    static std::vector<SweepEntry<Decimal>> rankByTotalReturn (std::vector<SweepEntry<Decimal>> entries)
    {
      std::stable_sort(entries.begin(), entries.end(),
		       [](const SweepEntry<Decimal>& lhs, const SweepEntry<Decimal>& rhs) {
			 return lhs.result->getSummary().totalReturn > rhs.result->getSummary().totalReturn;
		       });
      return entries;
    }

    const BacktestConfiguration<Decimal>& getBaseConfiguration() const
    {
      return mBaseConfiguration;
    }

  private:
    SeriesPtr mSeries;
    BacktestConfiguration<Decimal> mBaseConfiguration;
  };
}

#endif
