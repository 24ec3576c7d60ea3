#pragma once

#include <ostream>
#include <string>
#include <vector>
#include "number.h"
#include "TimeSeries.h"
#include "BacktestConfiguration.h"
#include "BacktestResult.h"
#include "ParameterSweep.h"

namespace crossbacktest
{
namespace reporting
{

using namespace mkc_crossover;
using Num = num::DefaultNumber;

/**
 * @brief Console reporter for single runs and parameter sweeps
 *
 * Every section starts with a "=== title ===" header and ends with a
 * rule line. Returns and drawdowns are printed as percentages.
 */
class BacktestReporter
{
public:
    /**
     * @brief Write the series description and run parameters
     * @param os Output stream
     * @param dataFile Name of the file the bars were read from
     * @param series The bar series the run uses
     * @param config Configuration of the run
     */
    static void writeConfiguration(std::ostream& os,
                                   const std::string& dataFile,
                                   const OHLCTimeSeries<Num>& series,
                                   const BacktestConfiguration<Num>& config);

    /**
     * @brief Write summary metrics, closed trades and rejected orders of a run
     */
    static void writeBacktestReport(std::ostream& os, const BacktestResult<Num>& result);

    static void writeSummary(std::ostream& os, const BacktestResult<Num>& result);

    static void writeClosedTrades(std::ostream& os, const BacktestResult<Num>& result);

    static void writeRejectedOrders(std::ostream& os, const BacktestResult<Num>& result);

    /**
     * @brief Write one row per sweep entry, best total return first
     * @param os Output stream
     * @param entries Sweep entries in grid order
     * @param maxRows Rows to print; 0 prints all of them
     */
    static void writeSweepTable(std::ostream& os,
                                const std::vector<SweepEntry<Num>>& entries,
                                std::size_t maxRows = 0);

    // "12.3400%" from the fraction 0.1234
    static std::string formatPercent(const Num& fraction);

private:
    static void writeSectionHeader(std::ostream& os, const std::string& title);

    static void writeSectionFooter(std::ostream& os);
};

} // namespace reporting
} // namespace crossbacktest
