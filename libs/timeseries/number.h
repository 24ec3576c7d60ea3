#ifndef NUMBER_H
#define NUMBER_H

#include <string>
#include <cmath>
#include "decimal.h"
#include "DecimalConstants.h"

/**
 * @file number.h
 * @brief Utility functions for the decimal type used throughout the engine.
 *
 * Every price, cash amount and cost in the backtester is a fixed-point
 * `dec::decimal`. This namespace hides the concrete type behind
 * `num::DefaultNumber` and collects the conversions the engine needs.
 */
namespace num
{
  /**
   * @brief Default decimal type with 7 decimal places using the default rounding policy.
   * @see dec::decimal
   */
  using DefaultNumber  = dec::decimal<7>;

  inline std::string toString(const DefaultNumber& d) {
    return dec::toString(d);
  }

  /**
   * @brief Converts a DefaultNumber to a double.
   * Note: This conversion may result in a loss of precision.
   */
  inline double to_double(const DefaultNumber& d) {
    return d.getAsDouble();
  }

  template<class N>
  inline N fromString(const std::string& s) {
    return ::dec::fromString<N>(s);
  }

  template<typename Decimal>
  inline Decimal abs(const Decimal& d) {
    return d.abs();
  }

  // Largest unit count a double, and so a decimal built from one, holds exactly
  const unsigned long long MaxExactUnits = 1ULL << 53;

  /**
   * @brief Converts a whole unit count to a decimal.
   *
   * Unit counts in the engine never exceed 2^53, so the round trip through
   * double is exact.
   */
  template<typename Decimal>
  inline Decimal fromUnits(unsigned long long units)
  {
    return Decimal(static_cast<double>(units));
  }

  /**
   * @brief Largest whole number of units not exceeding a non-negative decimal.
   * Returns 0 for zero or negative input and saturates at MaxExactUnits.
   */
  template<typename Decimal>
  inline unsigned long long floorToUnits(const Decimal& d)
  {
    const double asDouble = d.getAsDouble();
    if (!(asDouble > 0.0))
      return 0;

    if (asDouble >= static_cast<double>(MaxExactUnits))
      return MaxExactUnits;

    unsigned long long units = static_cast<unsigned long long>(std::floor(asDouble));

    // getAsDouble() can land a hair above an exact integer boundary
    if (fromUnits<Decimal>(units) > d && units > 0)
      --units;

    return units;
  }

} // namespace num

#endif // NUMBER_H
