#include <iostream>
#include <fstream>
#include <memory>
#include <string>
#include <vector>
#include <boost/program_options.hpp>
#include "number.h"
#include "TimeFrame.h"
#include "TimeSeries.h"
#include "TimeSeriesCsvReader.h"
#include "TimeSeriesIndicators.h"
#include "BacktestConfiguration.h"
#include "BackTester.h"
#include "ParameterSweep.h"
#include "ParallelExecutors.h"
#include "BacktestReporter.h"
#include "OutputUtils.h"
#include "CommandLineOptions.h"

namespace po = boost::program_options;

using namespace mkc_crossover;
using Num = num::DefaultNumber;
using crossbacktest::reporting::BacktestReporter;
using crossbacktest::cli::parseRange;

namespace
{
    const int kExitSuccess = 0;
    const int kExitFailure = 1;
    const int kExitUsage = 2;
    const int kExitAborted = 3;
}

void printUsage(const po::options_description& desc) {
    std::cout << "Moving-average crossover backtester\n\n";
    std::cout << "Usage: crossbacktest --data <file.csv> [options]\n\n";
    std::cout << desc << std::endl;

    std::cout << "\nExamples:\n";
    std::cout << "  # Single run, 10/30 simple averages, 95% of equity per position\n";
    std::cout << "  crossbacktest --data SPY.csv --fast 10 --slow 30\n\n";
    std::cout << "  # Exponential averages, long and short, 0.1% commission and 1 cent slippage\n";
    std::cout << "  crossbacktest --data SPY.csv --ma-type ema --mode long-short \\\n";
    std::cout << "      --commission-type proportional --commission 0.001 --slippage 0.01\n\n";
    std::cout << "  # Sweep fast 5..20 step 5 against slow 20..60 step 10 on 4 threads\n";
    std::cout << "  crossbacktest --data SPY.csv --sweep --fast-range 5,20,5 --slow-range 20,60,10 --threads 4\n\n";
    std::cout << "  # MACD 12/26/9 crossover, exits only while RSI(14) > 70, 8% stop, 15% target, 5% trailing stop\n";
    std::cout << "  crossbacktest --data 601668.csv --timeframe Monthly --signal macd --fast 12 --slow 26 \\\n";
    std::cout << "      --macd-signal 9 --rsi-overbought 70 --stop-loss 0.08 --take-profit 0.15 --trailing-stop 0.05\n\n";
    std::cout << "  # Options from an INI file, report mirrored to a log file\n";
    std::cout << "  crossbacktest --config run.ini --log run.log\n";
}

std::shared_ptr<const OHLCTimeSeries<Num>> loadSeries(const std::string& dataFile, TimeFrame::Duration timeFrame)
{
    TimeSeriesCsvReader<Num> reader(dataFile, timeFrame);
    reader.readFile();
    return reader.getTimeSeries();
}

int runSingleBacktest(std::ostream& out,
                      const std::string& dataFile,
                      std::shared_ptr<const OHLCTimeSeries<Num>> series,
                      const BacktestConfiguration<Num>& config,
                      bool trace)
{
    BacktestReporter::writeConfiguration(out, dataFile, *series, config);

    if (trace)
        out << "=== Order Trace ===" << std::endl;

    BackTester<Num> backTester(series, config, trace ? &out : nullptr);
    const BacktestResult<Num>& result = backTester.run();

    if (trace)
        out << std::endl;

    BacktestReporter::writeBacktestReport(out, result);

    if (result.getStatus() == RunStatus::Aborted)
    {
        std::cerr << "Error: backtest aborted: " << result.getAbortReason() << std::endl;
        return kExitAborted;
    }

    return kExitSuccess;
}

int runSweep(std::ostream& out,
             const std::string& dataFile,
             std::shared_ptr<const OHLCTimeSeries<Num>> series,
             const BacktestConfiguration<Num>& config,
             const po::variables_map& vm)
{
    const std::vector<unsigned int> fastRange = parseRange(vm["fast-range"].as<std::string>(), "fast-range");
    const std::vector<unsigned int> slowRange = parseRange(vm["slow-range"].as<std::string>(), "slow-range");

    const std::vector<WindowPair> grid = ParameterSweep<Num>::makeGrid(fastRange[0], fastRange[1], fastRange[2],
                                                                        slowRange[0], slowRange[1], slowRange[2]);
    if (grid.empty())
        throw BacktestConfigurationException("Sweep ranges contain no pair with fast < slow");

    BacktestReporter::writeConfiguration(out, dataFile, *series, config);

    const std::size_t threads = vm["threads"].as<std::size_t>();
    std::unique_ptr<concurrency::IParallelExecutor> executor;
    if (threads == 1)
        executor = std::make_unique<concurrency::SingleThreadExecutor>();
    else
        executor = std::make_unique<concurrency::ThreadPoolExecutor<>>(threads);

    out << "Running " << grid.size() << " backtests on "
        << executor->getConcurrency() << " thread(s)" << std::endl << std::endl;

    ParameterSweep<Num> sweep(series, config);
    const std::vector<SweepEntry<Num>> entries = sweep.run(grid, *executor);

    BacktestReporter::writeSweepTable(out, entries, vm["top"].as<std::size_t>());

    for (const auto& entry : entries)
    {
        if (entry.result->getStatus() == RunStatus::Aborted)
        {
            std::cerr << "Error: run " << entry.fastWindow << "/" << entry.slowWindow
                      << " aborted: " << entry.result->getAbortReason() << std::endl;
            return kExitAborted;
        }
    }

    return kExitSuccess;
}

int main(int argc, char* argv[]) {
    const po::options_description desc = crossbacktest::cli::createOptionsDescription();

    po::variables_map vm;
    try {
        po::store(po::parse_command_line(argc, argv, desc), vm);

        if (vm.count("config")) {
            const std::string configFile = vm["config"].as<std::string>();
            std::ifstream configStream(configFile);
            if (!configStream) {
                std::cerr << "Error: cannot open config file " << configFile << std::endl;
                return kExitUsage;
            }
            po::store(po::parse_config_file(configStream, desc), vm);
        }

        po::notify(vm);
    }
    catch (const po::error& e) {
        std::cerr << "Error: " << e.what() << std::endl << std::endl;
        printUsage(desc);
        return kExitUsage;
    }

    if (vm.count("help")) {
        printUsage(desc);
        return kExitSuccess;
    }

    if (!vm.count("data")) {
        std::cerr << "Error: --data is required" << std::endl << std::endl;
        printUsage(desc);
        return kExitUsage;
    }

    try {
        const std::string dataFile = vm["data"].as<std::string>();
        const BacktestConfiguration<Num> config = crossbacktest::cli::createConfiguration(vm);
        const TimeFrame::Duration timeFrame = getTimeFrameFromString(vm["timeframe"].as<std::string>());

        crossbacktest::utils::ReportOutput output(vm["log"].as<std::string>());
        std::ostream& out = output.stream();

        std::shared_ptr<const OHLCTimeSeries<Num>> series = loadSeries(dataFile, timeFrame);

        int status;
        if (vm.count("sweep"))
            status = runSweep(out, dataFile, series, config, vm);
        else
            status = runSingleBacktest(out, dataFile, series, config, vm.count("trace") > 0);

        out.flush();
        return status;
    }
    catch (const po::error& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return kExitUsage;
    }
    catch (const BacktestConfigurationException& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return kExitUsage;
    }
    catch (const TimeFrameException& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return kExitUsage;
    }
    catch (const IndicatorException& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return kExitUsage;
    }
    catch (const TimeSeriesException& e) {
        std::cerr << "Data error: " << e.what() << std::endl;
        return kExitFailure;
    }
    catch (const BackTesterException& e) {
        std::cerr << "Backtest error: " << e.what() << std::endl;
        return kExitFailure;
    }
    catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return kExitFailure;
    }
}
