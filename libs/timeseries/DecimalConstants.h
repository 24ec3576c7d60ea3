// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __DECIMAL_CONSTANT_H
#define __DECIMAL_CONSTANT_H 1

#include <string>
#include "decimal.h"

namespace mkc_crossover
{
  /**
   * @class DecimalConstants
   * @brief Shared constants for the engine's fixed-point type.
   *
   * Comparisons against zero, sign flips and percentage scaling all go
   * through these so no component builds its own literals.
   */
  template <class Decimal>
  class DecimalConstants
    {
    public:
      static const Decimal DecimalZero;
      static const Decimal DecimalOne;
      static const Decimal DecimalMinusOne;
      static const Decimal DecimalTwo;
      static const Decimal DecimalOneHundred;

      // Parses a literal at full precision, with no detour through double
      static Decimal createDecimal (const std::string& valueString)
      {
        return dec::fromString<Decimal>(valueString);
      }
    };

  template <class Decimal>
  const Decimal DecimalConstants<Decimal>::DecimalZero(DecimalConstants<Decimal>::createDecimal("0"));

  template <class Decimal>
  const Decimal DecimalConstants<Decimal>::DecimalOne(DecimalConstants<Decimal>::createDecimal("1"));

  template <class Decimal>
  const Decimal DecimalConstants<Decimal>::DecimalMinusOne(DecimalConstants<Decimal>::createDecimal("-1"));

  template <class Decimal>
  const Decimal DecimalConstants<Decimal>::DecimalTwo(DecimalConstants<Decimal>::createDecimal("2"));

  template <class Decimal>
  const Decimal DecimalConstants<Decimal>::DecimalOneHundred(DecimalConstants<Decimal>::createDecimal("100"));
}

#endif
