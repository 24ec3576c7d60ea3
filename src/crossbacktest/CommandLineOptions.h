#pragma once

#include <string>
#include <vector>
#include <boost/program_options.hpp>
#include "number.h"
#include "BacktestConfiguration.h"

namespace crossbacktest
{
namespace cli
{

using Num = num::DefaultNumber;

/**
 * @brief Every option crossbacktest accepts, with its default
 *
 * Window lengths and the fixed quantity are read as signed values so that
 * a negative entry is reported instead of wrapping around.
 */
boost::program_options::options_description createOptionsDescription();

/**
 * @brief Build and validate the run configuration from parsed options
 * @throws mkc_crossover::BacktestConfigurationException for any invalid value
 */
mkc_crossover::BacktestConfiguration<Num>
createConfiguration(const boost::program_options::variables_map& vm);

// "min,max,step" -> three positive integers
std::vector<unsigned int> parseRange(const std::string& rangeString, const std::string& optionName);

/**
 * @brief Value of an integer option that must be positive
 * @throws mkc_crossover::BacktestConfigurationException if it is zero or negative
 */
unsigned int getPositiveWindow(const boost::program_options::variables_map& vm, const std::string& optionName);

} // namespace cli
} // namespace crossbacktest
