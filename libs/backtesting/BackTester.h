// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __BACKTESTER_H
#define __BACKTESTER_H 1

#include <memory>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <vector>
#include <boost/date_time/posix_time/posix_time.hpp>
#include "number.h"
#include "TimeSeries.h"
#include "TimeSeriesException.h"
#include "TimeSeriesIndicators.h"
#include "BacktestConfiguration.h"
#include "CrossoverSignal.h"
#include "SignalEngine.h"
#include "ExitMonitor.h"
#include "ExecutionSimulator.h"
#include "PortfolioLedger.h"
#include "BacktestResult.h"
#include "PerformanceAnalyzer.h"
#include "Annualizer.h"

namespace mkc_crossover
{
  class BackTesterException : public std::runtime_error
  {
  public:
    BackTesterException(const std::string msg)
      : std::runtime_error(msg)
    {}

    ~BackTesterException()
    {}
  };

  enum class BackTesterState { INITIALIZED, RUNNING, COMPLETED, ABORTED };

  inline std::string backTesterStateToString (BackTesterState state)
  {
    switch (state)
      {
      case BackTesterState::INITIALIZED:
	return "INITIALIZED";
      case BackTesterState::RUNNING:
	return "RUNNING";
      case BackTesterState::COMPLETED:
	return "COMPLETED";
      case BackTesterState::ABORTED:
	return "ABORTED";
      }

    throw BackTesterException("backTesterStateToString: unknown state");
  }

  /**
   * @class BackTester
   * @brief Runs one moving-average crossover simulation over a bar series.
   *
   * Each bar t is processed in a fixed order:
   *   1. the indicators are updated with bar t
   *   2. the signal engine classifies bar t
   *   3. the order queued at bar t-1, if any, fills at the open of bar t
   *   4. the ledger applies the fill and is marked to market at the close of t
   *   5. the snapshot is recorded
   *   6. the exit monitor checks the position against the close of t
   *   7. the signal of bar t may queue an order, sized from that snapshot,
   *      which can only fill on bar t+1; if it does not, a price exit hit in
   *      step 6 queues an order closing the position
   *
   * run() may be called once: INITIALIZED -> RUNNING -> COMPLETED or ABORTED.
   * A ledger that fails to reconcile, or an order that breaks the one-bar
   * delay, aborts the run; the result then holds the history up to the
   * failing bar. Rejected orders never abort a run.
   *
   * Thread Safety:
   * - Not thread-safe. A BackTester owns all of its mutable state; the series
   *   is shared read-only, so independent instances may run concurrently.
   */
  template <class Decimal>
  class BackTester
  {
  public:
    typedef std::shared_ptr<const OHLCTimeSeries<Decimal>> SeriesPtr;

    /**
     * @throws TimeSeriesDataException if the series is null or empty.
     */
    BackTester (SeriesPtr series,
		const BacktestConfiguration<Decimal>& configuration,
		std::ostream* trace = nullptr)
      : mSeries(series),
	mConfiguration(configuration),
	mTrace(trace),
	mState(BackTesterState::INITIALIZED),
	mResult()
    {
      if (!mSeries)
	throw TimeSeriesDataException("BackTester: no bar series supplied");

      if (mSeries->getNumEntries() == 0)
	throw TimeSeriesDataException("BackTester: bar series is empty");
    }

    BackTester (const BackTester<Decimal>& rhs) = delete;
    BackTester<Decimal>& operator=(const BackTester<Decimal>& rhs) = delete;

    virtual ~BackTester()
    {}

    const BacktestResult<Decimal>& run()
    {
      if (mState != BackTesterState::INITIALIZED)
	throw BackTesterException("BackTester::run - run already started, state is " +
				  backTesterStateToString(mState));

      mState = BackTesterState::RUNNING;

      SignalEngine<Decimal> signalEngine(mConfiguration);
      ExitMonitor<Decimal> exitMonitor(mConfiguration.getExitPolicy());
      ExecutionSimulator<Decimal> simulator(mConfiguration, mTrace);
      PortfolioLedger<Decimal> ledger(mConfiguration.getInitialCash());

      std::vector<SignalRecord<Decimal>> signals;
      std::vector<PortfolioSnapshot<Decimal>> snapshots;
      signals.reserve(mSeries->getNumEntries());
      snapshots.reserve(mSeries->getNumEntries());

      std::string abortReason;

      try
	{
	  for (std::size_t barIndex = 0; barIndex < mSeries->getNumEntries(); ++barIndex)
	    {
	      const OHLCTimeSeriesEntry<Decimal>& bar = getBar(barIndex);

	      const Signal signal = signalEngine.update(bar);

	      simulator.fillPendingOrder(barIndex, bar, ledger);

	      const PortfolioSnapshot<Decimal> snapshot = ledger.markToMarket(barIndex, bar);
	      snapshots.push_back(snapshot);

	      const std::optional<ExitReason> exitReason = exitMonitor.evaluate(ledger.getPosition(), bar);

	      signals.push_back(SignalRecord<Decimal>{barIndex, bar.getDateTime(), signalEngine.getFastValue(),
						      signalEngine.getSlowValue(), signal,
						      signalEngine.getRsiValue(), exitReason});

	      simulator.onSignal(signal, barIndex, bar, snapshot);

	      if (exitReason && !simulator.hasPendingOrder())
		simulator.onExit(*exitReason, barIndex, bar, snapshot);

	      if (simulator.hasPendingOrder() &&
		  (simulator.getPendingOrder()->getOriginatingBarIndex() != barIndex))
		throw BackTesterException("BackTester::run - pending order " +
					  std::to_string(simulator.getPendingOrder()->getOrderID()) +
					  " does not belong to bar " + std::to_string(barIndex));
	    }

	  mState = BackTesterState::COMPLETED;
	}
      catch (const BackTesterException& e)
	{
	  abortReason = e.what();
	}
      catch (const PortfolioLedgerException& e)
	{
	  abortReason = e.what();
	}
      catch (const TradingOrderException& e)
	{
	  abortReason = e.what();
	}

      if (mState != BackTesterState::COMPLETED)
	{
	  mState = BackTesterState::ABORTED;
	  if (mTrace)
	    *mTrace << "ABORT   " << abortReason << std::endl;
	}

      std::vector<TradingOrder<Decimal>> orders;
      orders.reserve(simulator.getOrders().size());
      for (const auto& order : simulator.getOrders())
	orders.push_back(*order);

      const PerformanceSummary<Decimal> summary =
	PerformanceAnalyzer<Decimal>::analyze(mConfiguration.getInitialCash(),
					      snapshots,
					      ledger.getClosedPositionHistory(),
					      ledger.getTotalCommission(),
					      ledger.getTotalSlippage(),
					      computeAnnualizationFactorForSeries(*mSeries));

      mResult = std::make_unique<BacktestResult<Decimal>>(mConfiguration,
							 (mState == BackTesterState::COMPLETED) ?
							 RunStatus::Completed : RunStatus::Aborted,
							 abortReason,
							 std::move(signals),
							 std::move(orders),
							 simulator.getFills(),
							 std::move(snapshots),
							 ledger.getClosedPositionHistory(),
							 summary);
      return *mResult;
    }

    BackTesterState getState() const
    {
      return mState;
    }

    /**
     * @throws BackTesterException if run() has not finished.
     */
    const BacktestResult<Decimal>& getResult() const
    {
      if (!mResult)
	throw BackTesterException("BackTester::getResult - no result, state is " +
				  backTesterStateToString(mState));

      return *mResult;
    }

    const BacktestConfiguration<Decimal>& getConfiguration() const
    {
      return mConfiguration;
    }

    const OHLCTimeSeries<Decimal>& getSeries() const
    {
      return *mSeries;
    }

  protected:
    // Bar barIndex of the series; the only place the run loop reads bars
    virtual const OHLCTimeSeriesEntry<Decimal>& getBar (std::size_t barIndex) const
    {
      return mSeries->getEntry(barIndex);
    }

  private:
    SeriesPtr mSeries;
    BacktestConfiguration<Decimal> mConfiguration;
    std::ostream* mTrace;
    BackTesterState mState;
    std::unique_ptr<BacktestResult<Decimal>> mResult;
  };
}

#endif
