// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __PERFORMANCE_ANALYZER_H
#define __PERFORMANCE_ANALYZER_H 1

#include <cmath>
#include <cstdint>
#include <stdexcept>
#include <vector>
#include <boost/accumulators/accumulators.hpp>
#include <boost/accumulators/statistics/stats.hpp>
#include <boost/accumulators/statistics/mean.hpp>
#include <boost/accumulators/statistics/variance.hpp>
#include <boost/accumulators/statistics/count.hpp>
#include "PortfolioLedger.h"
#include "ClosedPositionHistory.h"
#include "Annualizer.h"
#include "DecimalConstants.h"
#include "number.h"

namespace mkc_crossover
{
  /**
   * @class PerformanceSummary
   * @brief Summary statistics of one run.
   *
   * Returns and drawdown are fractions (0.05 is 5%). Volatility and the
   * sharpe-like ratio are annualized from per-bar returns and are plain
   * doubles since they need a square root.
   */
  template <class Decimal>
  struct PerformanceSummary
  {
    Decimal initialCapital;
    Decimal finalEquity;
    Decimal totalReturn;
    Decimal annualizedReturn;
    Decimal maxDrawdown;
    double annualizedVolatility;
    double sharpeLikeRatio;
    uint32_t numClosedTrades;
    uint32_t numWinningTrades;
    uint32_t numLosingTrades;
    Decimal winRate;
    Decimal totalCommission;
    Decimal totalSlippage;
    std::size_t numBars;

    explicit PerformanceSummary(const Decimal& initial)
      : initialCapital(initial),
	finalEquity(initial),
	totalReturn(DecimalConstants<Decimal>::DecimalZero),
	annualizedReturn(DecimalConstants<Decimal>::DecimalZero),
	maxDrawdown(DecimalConstants<Decimal>::DecimalZero),
	annualizedVolatility(0.0),
	sharpeLikeRatio(0.0),
	numClosedTrades(0),
	numWinningTrades(0),
	numLosingTrades(0),
	winRate(DecimalConstants<Decimal>::DecimalZero),
	totalCommission(DecimalConstants<Decimal>::DecimalZero),
	totalSlippage(DecimalConstants<Decimal>::DecimalZero),
	numBars(0)
    {}
  };

  /**
   * @class PerformanceAnalyzer
   * @brief Derives summary statistics from the ledger's own history.
   *
   * The analyzer never looks at prices: everything comes from the per-bar
   * PortfolioSnapshots, the closed trades and the cost totals recorded by
   * the ledger. All members are pure functions.
   */
  template <class Decimal>
  class PerformanceAnalyzer
  {
  public:
    typedef std::vector<PortfolioSnapshot<Decimal>> SnapshotVector;

    static PerformanceSummary<Decimal> analyze(const Decimal& initialCapital,
					       const SnapshotVector& snapshots,
					       const ClosedPositionHistory<Decimal>& closedTrades,
					       const Decimal& totalCommission,
					       const Decimal& totalSlippage,
					       double annualizationFactor)
    {
      if (initialCapital <= DecimalConstants<Decimal>::DecimalZero)
	throw std::domain_error("PerformanceAnalyzer::analyze - initial capital must be positive");

      PerformanceSummary<Decimal> summary(initialCapital);

      summary.numBars = snapshots.size();
      summary.totalCommission = totalCommission;
      summary.totalSlippage = totalSlippage;
      summary.numClosedTrades = closedTrades.getNumPositions();
      summary.numWinningTrades = closedTrades.getNumWinningPositions();
      summary.numLosingTrades = closedTrades.getNumLosingPositions();
      summary.winRate = closedTrades.getWinRate();

      if (snapshots.empty())
	return summary;

      summary.finalEquity = snapshots.back().getEquity();
      summary.totalReturn = computeTotalReturn(initialCapital, snapshots);
      summary.annualizedReturn = Annualizer<Decimal>::annualizeTotalReturn(summary.totalReturn,
									   snapshots.size(),
									   annualizationFactor);
      summary.maxDrawdown = computeMaxDrawdown(initialCapital, snapshots);

      const std::vector<double> returns = computeBarReturns(initialCapital, snapshots);
      summary.annualizedVolatility = computeAnnualizedVolatility(returns, annualizationFactor);
      summary.sharpeLikeRatio = computeSharpeLikeRatio(returns, annualizationFactor);

      return summary;
    }

    static Decimal computeTotalReturn(const Decimal& initialCapital, const SnapshotVector& snapshots)
    {
      if (snapshots.empty())
	return DecimalConstants<Decimal>::DecimalZero;

      return (snapshots.back().getEquity() / initialCapital) - DecimalConstants<Decimal>::DecimalOne;
    }

    /**
     * @brief Largest peak-to-trough decline as a fraction of the peak.
     *
     * Single forward pass. The running peak starts at the initial capital,
     * so a run that loses money from the first bar has a drawdown.
     */
    static Decimal computeMaxDrawdown(const Decimal& initialCapital, const SnapshotVector& snapshots)
    {
      const Decimal& zero = DecimalConstants<Decimal>::DecimalZero;
      Decimal peak = initialCapital;
      Decimal maxDrawdown = zero;

      for (const auto& snapshot : snapshots)
	{
	  const Decimal& equity = snapshot.getEquity();

	  if (equity > peak)
	    peak = equity;
	  else if (peak > zero)
	    {
	      const Decimal drawdown = (peak - equity) / peak;
	      if (drawdown > maxDrawdown)
		maxDrawdown = drawdown;
	    }
	}

      return maxDrawdown;
    }

    // Simple per-bar returns of the equity curve, the first against the initial capital.
    static std::vector<double> computeBarReturns(const Decimal& initialCapital, const SnapshotVector& snapshots)
    {
      std::vector<double> returns;
      returns.reserve(snapshots.size());

      double previous = num::to_double(initialCapital);
      for (const auto& snapshot : snapshots)
	{
	  const double equity = num::to_double(snapshot.getEquity());

	  if (previous > 0.0)
	    returns.push_back((equity / previous) - 1.0);

	  previous = equity;
	}

      return returns;
    }

    static double computeAnnualizedVolatility(const std::vector<double>& returns, double annualizationFactor)
    {
      return sampleStandardDeviation(returns) * std::sqrt(annualizationFactor);
    }

    /**
     * @brief mean / stdev * sqrt(factor) of per-bar returns, with a zero
     *        risk-free rate. 0 when fewer than two returns or no variation.
     */
    static double computeSharpeLikeRatio(const std::vector<double>& returns, double annualizationFactor)
    {
      const double stdev = sampleStandardDeviation(returns);
      if (!(stdev > 0.0))
	return 0.0;

      accumulator_set<double, stats<mean_tag>> acc;
      for (double r : returns)
	acc(r);

      return (boost::accumulators::mean(acc) / stdev) * std::sqrt(annualizationFactor);
    }

  private:
    static double sampleStandardDeviation(const std::vector<double>& returns)
    {
      if (returns.size() < 2)
	return 0.0;

      accumulator_set<double, stats<boost::accumulators::tag::variance>> acc;
      for (double r : returns)
	acc(r);

      // population variance from the accumulator, corrected to the sample estimate
      const double n = static_cast<double>(returns.size());
      const double variance = boost::accumulators::variance(acc) * (n / (n - 1.0));

      return (variance > 0.0) ? std::sqrt(variance) : 0.0;
    }
  };
}

#endif
