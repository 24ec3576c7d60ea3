#include "BacktestReporter.h"
#include <algorithm>
#include <iomanip>
#include <sstream>
#include <boost/date_time/posix_time/posix_time.hpp>
#include "DecimalConstants.h"

namespace crossbacktest
{
namespace reporting
{

void BacktestReporter::writeConfiguration(std::ostream& os,
                                          const std::string& dataFile,
                                          const OHLCTimeSeries<Num>& series,
                                          const BacktestConfiguration<Num>& config)
{
    writeSectionHeader(os, "Backtest Configuration");

    os << "Data file: " << dataFile << std::endl;
    os << "Time frame: " << timeFrameToString(series.getTimeFrame()) << std::endl;
    os << "Number of bars: " << series.getNumEntries() << std::endl;
    os << "First bar: " << boost::posix_time::to_simple_string(series.getFirstDateTime()) << std::endl;
    os << "Last bar: " << boost::posix_time::to_simple_string(series.getLastDateTime()) << std::endl;
    os << "Moving average: " << movingAverageTypeToString(config.getMovingAverageType())
       << " fast " << config.getFastWindow() << " slow " << config.getSlowWindow() << std::endl;
    os << "Signal: " << config.getSignalPolicy().toString() << std::endl;
    os << "Exits: " << config.getExitPolicy().toString() << std::endl;
    os << "Position mode: " << positionModeToString(config.getPositionMode()) << std::endl;
    os << "Sizing: " << config.getSizingRule().toString() << std::endl;
    os << "Commission: " << config.getCommissionModel().toString() << std::endl;
    os << "Slippage: " << config.getSlippageModel().toString() << std::endl;
    os << "Margin: " << (config.isMarginAllowed() ? "allowed" : "disallowed") << std::endl;
    os << "Initial cash: " << config.getInitialCash() << std::endl;

    writeSectionFooter(os);
    os << std::endl;
}

void BacktestReporter::writeBacktestReport(std::ostream& os, const BacktestResult<Num>& result)
{
    writeSummary(os, result);
    writeClosedTrades(os, result);
    writeRejectedOrders(os, result);
}

void BacktestReporter::writeSummary(std::ostream& os, const BacktestResult<Num>& result)
{
    const PerformanceSummary<Num>& summary = result.getSummary();

    writeSectionHeader(os, "Backtest Performance Summary");

    os << "Run status: " << runStatusToString(result.getStatus()) << std::endl;
    if (result.getStatus() == RunStatus::Aborted)
        os << "Abort reason: " << result.getAbortReason() << std::endl;

    os << "Bars processed: " << summary.numBars << std::endl;
    os << "Initial capital: " << summary.initialCapital << std::endl;
    os << "Final equity: " << summary.finalEquity << std::endl;
    os << "Total return: " << formatPercent(summary.totalReturn) << std::endl;
    os << "Annualized return: " << formatPercent(summary.annualizedReturn) << std::endl;
    os << "Maximum drawdown: " << formatPercent(summary.maxDrawdown) << std::endl;
    os << std::fixed << std::setprecision(4);
    os << "Annualized volatility: " << summary.annualizedVolatility << std::endl;
    os << "Sharpe-like ratio: " << summary.sharpeLikeRatio << std::endl;
    os.unsetf(std::ios_base::floatfield);
    os << "Closed trades: " << summary.numClosedTrades << std::endl;
    os << "Winning trades: " << summary.numWinningTrades << std::endl;
    os << "Losing trades: " << summary.numLosingTrades << std::endl;
    os << "Win rate: " << formatPercent(summary.winRate) << std::endl;
    os << "Profit factor: " << result.getClosedPositionHistory().getProfitFactor() << std::endl;
    os << "Total commission: " << summary.totalCommission << std::endl;
    os << "Total slippage: " << summary.totalSlippage << std::endl;
    os << "Price exits: " << result.getExitTriggers().size() << std::endl;
    os << "Orders: " << result.getOrders().size()
       << " (filled " << result.getFills().size()
       << ", rejected " << result.getRejectedOrders().size() << ")" << std::endl;

    writeSectionFooter(os);
    os << std::endl;
}

void BacktestReporter::writeClosedTrades(std::ostream& os, const BacktestResult<Num>& result)
{
    const ClosedPositionHistory<Num>& trades = result.getClosedPositionHistory();

    writeSectionHeader(os, "Closed Trades");

    if (trades.getNumPositions() == 0)
    {
        os << "No closed trades" << std::endl;
    }
    else
    {
        os << std::left
           << std::setw(6) << "Side"
           << std::setw(8) << "Units"
           << std::setw(22) << "Entry"
           << std::setw(14) << "Entry Price"
           << std::setw(22) << "Exit"
           << std::setw(14) << "Exit Price"
           << std::setw(14) << "Gross PnL"
           << std::setw(12) << "Costs"
           << "Net PnL" << std::endl;

        for (auto it = trades.beginTradingPositions(); it != trades.endTradingPositions(); ++it)
        {
            os << std::setw(6) << (it->isLongPosition() ? "LONG" : "SHORT")
               << std::setw(8) << it->getUnits().getTradingVolume()
               << std::setw(22) << boost::posix_time::to_simple_string(it->getEntryDateTime())
               << std::setw(14) << num::toString(it->getAverageEntryPrice())
               << std::setw(22) << boost::posix_time::to_simple_string(it->getExitDateTime())
               << std::setw(14) << num::toString(it->getExitPrice())
               << std::setw(14) << num::toString(it->getGrossPnl())
               << std::setw(12) << num::toString(it->getCosts())
               << num::toString(it->getNetPnl()) << std::endl;
        }
        os << std::right;
    }

    writeSectionFooter(os);
    os << std::endl;
}

void BacktestReporter::writeRejectedOrders(std::ostream& os, const BacktestResult<Num>& result)
{
    const std::vector<TradingOrder<Num>> rejected = result.getRejectedOrders();

    writeSectionHeader(os, "Rejected Orders");

    if (rejected.empty())
    {
        os << "No rejected orders" << std::endl;
    }
    else
    {
        for (const auto& order : rejected)
        {
            os << "Order " << order.getOrderID()
               << " " << orderSideToString(order.getSide())
               << " " << order.getUnitsInOrder().toString()
               << " decided " << boost::posix_time::to_simple_string(order.getOrderDateTime())
               << " rejected on bar " << order.getCompletionBarIndex()
               << ": " << rejectionReasonToString(order.getRejectionReason()) << std::endl;
        }
    }

    writeSectionFooter(os);
    os << std::endl;
}

void BacktestReporter::writeSweepTable(std::ostream& os,
                                       const std::vector<SweepEntry<Num>>& entries,
                                       std::size_t maxRows)
{
    const std::vector<SweepEntry<Num>> ranked = ParameterSweep<Num>::rankByTotalReturn(entries);
    const std::size_t numRows = (maxRows == 0) ? ranked.size() : std::min(maxRows, ranked.size());

    writeSectionHeader(os, "Parameter Sweep (" + std::to_string(entries.size()) + " runs)");

    os << std::left
       << std::setw(6) << "Fast"
       << std::setw(6) << "Slow"
       << std::setw(12) << "Status"
       << std::setw(16) << "Total Return"
       << std::setw(16) << "Max Drawdown"
       << std::setw(10) << "Sharpe"
       << std::setw(8) << "Trades"
       << "Final Equity" << std::endl;

    for (std::size_t i = 0; i < numRows; ++i)
    {
        const PerformanceSummary<Num>& summary = ranked[i].result->getSummary();
        std::ostringstream sharpe;
        sharpe << std::fixed << std::setprecision(3) << summary.sharpeLikeRatio;

        os << std::setw(6) << ranked[i].fastWindow
           << std::setw(6) << ranked[i].slowWindow
           << std::setw(12) << runStatusToString(ranked[i].result->getStatus())
           << std::setw(16) << formatPercent(summary.totalReturn)
           << std::setw(16) << formatPercent(summary.maxDrawdown)
           << std::setw(10) << sharpe.str()
           << std::setw(8) << summary.numClosedTrades
           << num::toString(summary.finalEquity) << std::endl;
    }
    os << std::right;

    writeSectionFooter(os);
    os << std::endl;
}

std::string BacktestReporter::formatPercent(const Num& fraction)
{
    return num::toString(fraction * DecimalConstants<Num>::DecimalOneHundred) + "%";
}

void BacktestReporter::writeSectionHeader(std::ostream& os, const std::string& title)
{
    os << "=== " << title << " ===" << std::endl;
}

void BacktestReporter::writeSectionFooter(std::ostream& os)
{
    os << "===================================" << std::endl;
}

} // namespace reporting
} // namespace crossbacktest
