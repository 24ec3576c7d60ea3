#include "CommandLineOptions.h"

#include <climits>
#include <memory>
#include <boost/algorithm/string.hpp>
#include "TimeSeriesIndicators.h"

namespace po = boost::program_options;

using namespace mkc_crossover;

namespace crossbacktest
{
namespace cli
{

namespace
{

volume_t getPositiveQuantity(const po::variables_map& vm, const std::string& optionName)
{
    const long long value = vm[optionName].as<long long>();
    if (value <= 0)
        throw BacktestConfigurationException("--" + optionName + " must be positive, got " + std::to_string(value));

    return static_cast<volume_t>(value);
}

std::unique_ptr<SizingRule<Num>> createSizingRule(const po::variables_map& vm)
{
    const std::string sizing = boost::algorithm::to_lower_copy(vm["sizing"].as<std::string>());

    if (sizing == "fraction")
        return std::make_unique<SizingRule<Num>>(
            SizingRule<Num>::fixedFraction(num::fromString<Num>(vm["fraction"].as<std::string>())));
    else if (sizing == "quantity")
        return std::make_unique<SizingRule<Num>>(SizingRule<Num>::fixedQuantity(getPositiveQuantity(vm, "quantity")));

    throw BacktestConfigurationException("Unknown sizing rule '" + sizing + "', expected fraction or quantity");
}

SignalPolicy<Num> createSignalPolicy(const po::variables_map& vm)
{
    const SignalRule rule = getSignalRuleFromString(vm["signal"].as<std::string>());

    SignalPolicy<Num> policy = (rule == SignalRule::MACD_CROSSOVER) ?
        SignalPolicy<Num>::macdCrossover(getPositiveWindow(vm, "macd-signal")) :
        SignalPolicy<Num>::movingAverageCrossover();

    if (vm.count("rsi-overbought"))
        policy = policy.withRsiGate(getPositiveWindow(vm, "rsi-period"),
                                    num::fromString<Num>(vm["rsi-overbought"].as<std::string>()));

    return policy;
}

ExitPolicy<Num> createExitPolicy(const po::variables_map& vm)
{
    ExitPolicy<Num> policy = ExitPolicy<Num>::none();

    if (vm.count("stop-loss"))
        policy = policy.withStopLoss(num::fromString<Num>(vm["stop-loss"].as<std::string>()));

    if (vm.count("take-profit"))
        policy = policy.withTakeProfit(num::fromString<Num>(vm["take-profit"].as<std::string>()));

    if (vm.count("trailing-stop"))
        policy = policy.withTrailingStop(num::fromString<Num>(vm["trailing-stop"].as<std::string>()));

    return policy;
}

} // namespace

po::options_description createOptionsDescription()
{
    po::options_description desc("Options");
    desc.add_options()
        ("help,h", "Show help message")
        ("config,c", po::value<std::string>(), "Read options from an INI style file (key = value); command line wins")
        ("data,d", po::value<std::string>(), "CSV file with Date, Open, High, Low, Close, Volume columns")
        ("timeframe,t", po::value<std::string>()->default_value("Daily"),
         "Bar time frame: Intraday, Daily, Weekly, Monthly, Quarterly, Yearly")
        ("fast", po::value<int>()->default_value(10), "Fast moving average window")
        ("slow", po::value<int>()->default_value(30), "Slow moving average window")
        ("ma-type", po::value<std::string>()->default_value("sma"), "Moving average type: sma or ema")
        ("signal", po::value<std::string>()->default_value("ma"),
         "Signal rule: ma (fast/slow averages) or macd (EMA fast - EMA slow against its signal line)")
        ("macd-signal", po::value<int>()->default_value(9), "MACD signal line window")
        ("rsi-period", po::value<int>()->default_value(14), "RSI period for --rsi-overbought")
        ("rsi-overbought", po::value<std::string>(),
         "Only act on bearish crossovers while the RSI is above this level, in (0, 100)")
        ("stop-loss", po::value<std::string>(), "Close when the close moves this fraction against the entry price")
        ("take-profit", po::value<std::string>(), "Close when the close moves this fraction beyond the entry price")
        ("trailing-stop", po::value<std::string>(),
         "Close when the close retreats this fraction from the best close since entry")
        ("sizing", po::value<std::string>()->default_value("fraction"), "Sizing rule: fraction or quantity")
        ("fraction", po::value<std::string>()->default_value("0.95"),
         "Fraction of equity per position, in (0, 1]; the default leaves room for costs and gap openings")
        ("quantity", po::value<long long>()->default_value(100), "Units per position for quantity sizing")
        ("units", po::value<std::string>()->default_value("shares"), "Volume units: shares or contracts")
        ("commission-type", po::value<std::string>()->default_value("fixed"), "Commission model: fixed or proportional")
        ("commission", po::value<std::string>()->default_value("0"), "Commission per order, or rate of notional")
        ("slippage-type", po::value<std::string>()->default_value("fixed"), "Slippage model: fixed or proportional")
        ("slippage", po::value<std::string>()->default_value("0"), "Slippage per unit, or rate of the open")
        ("margin", "Allow orders that cost more than the available cash")
        ("mode,m", po::value<std::string>()->default_value("long-only"), "Position mode: long-only or long-short")
        ("cash", po::value<std::string>()->default_value("100000"), "Initial cash")
        ("sweep", "Run a parameter sweep over fast and slow windows")
        ("fast-range", po::value<std::string>()->default_value("5,20,5"), "Sweep fast windows: min,max,step")
        ("slow-range", po::value<std::string>()->default_value("20,60,10"), "Sweep slow windows: min,max,step")
        ("threads", po::value<std::size_t>()->default_value(0), "Sweep threads; 0 uses all cores, 1 runs serially")
        ("top", po::value<std::size_t>()->default_value(0), "Rows of the sweep table to print; 0 prints all")
        ("log,l", po::value<std::string>()->default_value(""), "Mirror the report to this file")
        ("trace", "Print one line per order, fill and rejection (single run only)");

    return desc;
}

unsigned int getPositiveWindow(const po::variables_map& vm, const std::string& optionName)
{
    const int value = vm[optionName].as<int>();
    if (value <= 0)
        throw BacktestConfigurationException("--" + optionName + " must be positive, got " + std::to_string(value));

    return static_cast<unsigned int>(value);
}

std::vector<unsigned int> parseRange(const std::string& rangeString, const std::string& optionName)
{
    std::vector<std::string> parts;
    boost::split(parts, rangeString, boost::is_any_of(","));

    if (parts.size() != 3)
        throw po::validation_error(po::validation_error::invalid_option_value, optionName, rangeString);

    std::vector<unsigned int> values;
    for (auto& part : parts)
    {
        boost::trim(part);
        long value = 0;
        try
        {
            value = std::stol(part);
        }
        catch (const std::logic_error&)
        {
            value = 0;
        }

        if ((value <= 0) || (value > INT_MAX))
            throw po::validation_error(po::validation_error::invalid_option_value, optionName, rangeString);

        values.push_back(static_cast<unsigned int>(value));
    }

    return values;
}

BacktestConfiguration<Num> createConfiguration(const po::variables_map& vm)
{
    const unsigned int fastWindow = getPositiveWindow(vm, "fast");
    const unsigned int slowWindow = getPositiveWindow(vm, "slow");
    const std::unique_ptr<SizingRule<Num>> sizingRule = createSizingRule(vm);

    const Num commission = num::fromString<Num>(vm["commission"].as<std::string>());
    const std::string commissionType = boost::algorithm::to_lower_copy(vm["commission-type"].as<std::string>());
    std::unique_ptr<CommissionModel<Num>> commissionModel;
    if (commissionType == "fixed")
        commissionModel = std::make_unique<CommissionModel<Num>>(CommissionModel<Num>::fixed(commission));
    else if (commissionType == "proportional")
        commissionModel = std::make_unique<CommissionModel<Num>>(CommissionModel<Num>::proportional(commission));
    else
        throw BacktestConfigurationException("Unknown commission type '" + commissionType + "'");

    const Num slippage = num::fromString<Num>(vm["slippage"].as<std::string>());
    const std::string slippageType = boost::algorithm::to_lower_copy(vm["slippage-type"].as<std::string>());
    std::unique_ptr<SlippageModel<Num>> slippageModel;
    if (slippageType == "fixed")
        slippageModel = std::make_unique<SlippageModel<Num>>(SlippageModel<Num>::fixed(slippage));
    else if (slippageType == "proportional")
        slippageModel = std::make_unique<SlippageModel<Num>>(SlippageModel<Num>::proportional(slippage));
    else
        throw BacktestConfigurationException("Unknown slippage type '" + slippageType + "'");

    const std::string units = boost::algorithm::to_lower_copy(vm["units"].as<std::string>());
    TradingVolume::VolumeUnit volumeUnits = TradingVolume::SHARES;
    if (units == "contracts")
        volumeUnits = TradingVolume::CONTRACTS;
    else if (units != "shares")
        throw BacktestConfigurationException("Unknown volume units '" + units + "', expected shares or contracts");

    const BacktestConfiguration<Num> configuration(fastWindow,
                                                   slowWindow,
                                                   *sizingRule,
                                                   *commissionModel,
                                                   *slippageModel,
                                                   vm.count("margin") > 0,
                                                   num::fromString<Num>(vm["cash"].as<std::string>()),
                                                   getPositionModeFromString(vm["mode"].as<std::string>()),
                                                   getMovingAverageTypeFromString(vm["ma-type"].as<std::string>()),
                                                   volumeUnits);

    return configuration.withSignalPolicy(createSignalPolicy(vm)).withExitPolicy(createExitPolicy(vm));
}

} // namespace cli
} // namespace crossbacktest
