// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __BACKTEST_CONFIGURATION_H
#define __BACKTEST_CONFIGURATION_H 1

#include <optional>
#include <stdexcept>
#include <string>
#include <ostream>
#include <boost/algorithm/string.hpp>
#include "TimeSeriesIndicators.h"
#include "TradingVolume.h"
#include "DecimalConstants.h"
#include "number.h"

namespace mkc_crossover
{
  /**
   * @brief Invalid run parameters. Raised before the first bar is simulated.
   */
  class BacktestConfigurationException : public std::runtime_error
  {
  public:
    BacktestConfigurationException(const std::string msg)
      : std::runtime_error(msg)
    {}

    ~BacktestConfigurationException()
    {}
  };

  // In LONG_ONLY mode a bearish crossover closes the long position instead of
  // opening a short one.
  enum class PositionMode { LONG_ONLY, LONG_SHORT };

  inline PositionMode getPositionModeFromString (const std::string& modeString)
  {
    const std::string name = boost::algorithm::to_lower_copy(modeString);

    if ((name == "long") || (name == "long_only") || (name == "long-only"))
      return PositionMode::LONG_ONLY;
    else if ((name == "long_short") || (name == "long-short") || (name == "both"))
      return PositionMode::LONG_SHORT;

    throw BacktestConfigurationException("getPositionModeFromString: unknown position mode " + modeString);
  }

  inline std::string positionModeToString (PositionMode mode)
  {
    return (mode == PositionMode::LONG_ONLY) ? "LONG_ONLY" : "LONG_SHORT";
  }

  /**
   * @class SizingRule
   * @brief Number of units a new exposure should hold.
   *
   * FixedFraction(f): floor(f * equity / close), f in (0, 1].
   * FixedQuantity(n): n units, 0 < n <= 2^53.
   *
   * Both are evaluated with the ledger state of the bar the signal was
   * decided on, never with the fill bar.
   */
  template <class Decimal>
  class SizingRule
  {
  public:
    enum Kind {FIXED_FRACTION, FIXED_QUANTITY};

    static SizingRule<Decimal> fixedFraction (const Decimal& fraction)
    {
      if ((fraction <= DecimalConstants<Decimal>::DecimalZero) ||
	  (fraction > DecimalConstants<Decimal>::DecimalOne))
	throw BacktestConfigurationException("SizingRule: fixed fraction " + num::toString(fraction) +
					     " must be in (0, 1]");

      return SizingRule<Decimal>(FIXED_FRACTION, fraction, 0);
    }

    static SizingRule<Decimal> fixedQuantity (volume_t units)
    {
      if (units == 0)
	throw BacktestConfigurationException("SizingRule: fixed quantity must be positive");

      if (units > num::MaxExactUnits)
	throw BacktestConfigurationException("SizingRule: fixed quantity " + std::to_string(units) +
					     " exceeds " + std::to_string(num::MaxExactUnits) + " units");

      return SizingRule<Decimal>(FIXED_QUANTITY, DecimalConstants<Decimal>::DecimalZero, units);
    }

    Kind getKind() const
    {
      return mKind;
    }

    const Decimal& getFraction() const
    {
      return mFraction;
    }

    volume_t getQuantity() const
    {
      return mQuantity;
    }

    /**
     * @brief Units to hold given the equity and close of the decision bar.
     * @return 0 when no whole unit can be afforded or the price is not
     *         positive; the caller treats 0 as a degenerate order.
     */
    volume_t computeUnits (const Decimal& equity, const Decimal& closePrice) const
    {
      if (mKind == FIXED_QUANTITY)
	return mQuantity;

      if (closePrice <= DecimalConstants<Decimal>::DecimalZero)
	return 0;

      return static_cast<volume_t>(num::floorToUnits<Decimal>((mFraction * equity) / closePrice));
    }

    std::string toString() const
    {
      if (mKind == FIXED_QUANTITY)
	return "FixedQuantity(" + std::to_string(mQuantity) + ")";

      return "FixedFraction(" + num::toString(mFraction) + ")";
    }

  private:
    SizingRule (Kind kind, const Decimal& fraction, volume_t quantity)
      : mKind(kind),
	mFraction(fraction),
	mQuantity(quantity)
    {}

  private:
    Kind mKind;
    Decimal mFraction;
    volume_t mQuantity;
  };

  /**
   * @class CommissionModel
   * @brief Fixed(amount) per order, or Proportional(rate) of the fill notional.
   */
  template <class Decimal>
  class CommissionModel
  {
  public:
    enum Kind {FIXED, PROPORTIONAL};

    static CommissionModel<Decimal> fixed (const Decimal& amount)
    {
      checkNonNegative(amount, "commission amount");
      return CommissionModel<Decimal>(FIXED, amount);
    }

    static CommissionModel<Decimal> proportional (const Decimal& rate)
    {
      checkNonNegative(rate, "commission rate");
      return CommissionModel<Decimal>(PROPORTIONAL, rate);
    }

    static CommissionModel<Decimal> none()
    {
      return CommissionModel<Decimal>(FIXED, DecimalConstants<Decimal>::DecimalZero);
    }

    Kind getKind() const { return mKind; }
    const Decimal& getParameter() const { return mParameter; }

    Decimal computeCommission (const Decimal& fillPrice, volume_t units) const
    {
      if (mKind == FIXED)
	return mParameter;

      return mParameter * fillPrice * num::fromUnits<Decimal>(units);
    }

    std::string toString() const
    {
      return std::string((mKind == FIXED) ? "Fixed(" : "Proportional(") + num::toString(mParameter) + ")";
    }

  private:
    CommissionModel (Kind kind, const Decimal& parameter)
      : mKind(kind),
	mParameter(parameter)
    {}

    static void checkNonNegative (const Decimal& value, const std::string& name)
    {
      if (value < DecimalConstants<Decimal>::DecimalZero)
	throw BacktestConfigurationException("CommissionModel: " + name + " " + num::toString(value) +
					     " must not be negative");
    }

  private:
    Kind mKind;
    Decimal mParameter;
  };

  /**
   * @class SlippageModel
   * @brief Per-unit price concession: Fixed(amount) or Proportional(rate) of the open.
   */
  template <class Decimal>
  class SlippageModel
  {
  public:
    enum Kind {FIXED, PROPORTIONAL};

    static SlippageModel<Decimal> fixed (const Decimal& amount)
    {
      checkNonNegative(amount, "slippage amount");
      return SlippageModel<Decimal>(FIXED, amount);
    }

    static SlippageModel<Decimal> proportional (const Decimal& rate)
    {
      checkNonNegative(rate, "slippage rate");
      return SlippageModel<Decimal>(PROPORTIONAL, rate);
    }

    static SlippageModel<Decimal> none()
    {
      return SlippageModel<Decimal>(FIXED, DecimalConstants<Decimal>::DecimalZero);
    }

    Kind getKind() const { return mKind; }
    const Decimal& getParameter() const { return mParameter; }

    Decimal computePerUnitSlippage (const Decimal& quotedPrice) const
    {
      if (mKind == FIXED)
	return mParameter;

      return mParameter * quotedPrice;
    }

    Decimal computeSlippageCost (const Decimal& quotedPrice, volume_t units) const
    {
      return computePerUnitSlippage(quotedPrice) * num::fromUnits<Decimal>(units);
    }

    std::string toString() const
    {
      return std::string((mKind == FIXED) ? "Fixed(" : "Proportional(") + num::toString(mParameter) + ")";
    }

  private:
    SlippageModel (Kind kind, const Decimal& parameter)
      : mKind(kind),
	mParameter(parameter)
    {}

    static void checkNonNegative (const Decimal& value, const std::string& name)
    {
      if (value < DecimalConstants<Decimal>::DecimalZero)
	throw BacktestConfigurationException("SlippageModel: " + name + " " + num::toString(value) +
					     " must not be negative");
    }

  private:
    Kind mKind;
    Decimal mParameter;
  };

  // MA_CROSSOVER compares the fast and slow moving averages; MACD_CROSSOVER
  // compares the MACD line built from the same two windows with its signal line.
  enum class SignalRule { MA_CROSSOVER, MACD_CROSSOVER };

  inline SignalRule getSignalRuleFromString (const std::string& ruleString)
  {
    const std::string name = boost::algorithm::to_lower_copy(ruleString);

    if ((name == "ma") || (name == "crossover") || (name == "ma_crossover") || (name == "ma-crossover"))
      return SignalRule::MA_CROSSOVER;
    else if ((name == "macd") || (name == "macd_crossover") || (name == "macd-crossover"))
      return SignalRule::MACD_CROSSOVER;

    throw BacktestConfigurationException("getSignalRuleFromString: unknown signal rule " + ruleString);
  }

  inline std::string signalRuleToString (SignalRule rule)
  {
    return (rule == SignalRule::MA_CROSSOVER) ? "MA_CROSSOVER" : "MACD_CROSSOVER";
  }

  /**
   * @class SignalPolicy
   * @brief Which lines are crossed, and an optional RSI gate on bearish signals.
   *
   * With the RSI gate enabled a bearish crossover only counts when the RSI of
   * the same bar is above the overbought level; otherwise the bar is Flat.
   */
  template <class Decimal>
  class SignalPolicy
  {
  public:
    static SignalPolicy<Decimal> movingAverageCrossover()
    {
      return SignalPolicy<Decimal>(SignalRule::MA_CROSSOVER, 0);
    }

    static SignalPolicy<Decimal> macdCrossover (unsigned int signalWindow)
    {
      if (signalWindow == 0)
	throw BacktestConfigurationException("SignalPolicy: MACD signal window must be positive");

      return SignalPolicy<Decimal>(SignalRule::MACD_CROSSOVER, signalWindow);
    }

    SignalPolicy<Decimal> withRsiGate (unsigned int period, const Decimal& overbought) const
    {
      if (period == 0)
	throw BacktestConfigurationException("SignalPolicy: RSI period must be positive");

      if ((overbought <= DecimalConstants<Decimal>::DecimalZero) ||
	  (overbought >= DecimalConstants<Decimal>::DecimalOneHundred))
	throw BacktestConfigurationException("SignalPolicy: RSI overbought level " + num::toString(overbought) +
					     " must be in (0, 100)");

      SignalPolicy<Decimal> policy(*this);
      policy.mRsiPeriod = period;
      policy.mRsiOverbought = overbought;
      return policy;
    }

    SignalRule getRule() const { return mRule; }
    unsigned int getSignalWindow() const { return mSignalWindow; }
    bool hasRsiGate() const { return mRsiOverbought.has_value(); }
    unsigned int getRsiPeriod() const { return mRsiPeriod; }
    const std::optional<Decimal>& getRsiOverbought() const { return mRsiOverbought; }

    std::string toString() const
    {
      std::string text = (mRule == SignalRule::MA_CROSSOVER) ? std::string("MACrossover") :
	"MACDCrossover(signal " + std::to_string(mSignalWindow) + ")";

      if (mRsiOverbought)
	text += " RSI(" + std::to_string(mRsiPeriod) + ") > " + num::toString(*mRsiOverbought);

      return text;
    }

  private:
    SignalPolicy (SignalRule rule, unsigned int signalWindow)
      : mRule(rule),
	mSignalWindow(signalWindow),
	mRsiPeriod(0),
	mRsiOverbought()
    {}

  private:
    SignalRule mRule;
    unsigned int mSignalWindow;
    unsigned int mRsiPeriod;
    std::optional<Decimal> mRsiOverbought;
  };

  /**
   * @class ExitPolicy
   * @brief Price exits checked against the close of every bar a position is open.
   *
   * Each level is a fraction of a price and is off unless set:
   *  - stop loss: adverse move from the entry price, in (0, 1)
   *  - take profit: favourable move from the entry price, positive
   *  - trailing stop: retreat from the best close since entry, in (0, 1)
   */
  template <class Decimal>
  class ExitPolicy
  {
  public:
    static ExitPolicy<Decimal> none()
    {
      return ExitPolicy<Decimal>();
    }

    ExitPolicy<Decimal> withStopLoss (const Decimal& fraction) const
    {
      checkBelowOne(fraction, "stop loss");
      ExitPolicy<Decimal> policy(*this);
      policy.mStopLoss = fraction;
      return policy;
    }

    ExitPolicy<Decimal> withTakeProfit (const Decimal& fraction) const
    {
      if (fraction <= DecimalConstants<Decimal>::DecimalZero)
	throw BacktestConfigurationException("ExitPolicy: take profit " + num::toString(fraction) +
					     " must be positive");

      ExitPolicy<Decimal> policy(*this);
      policy.mTakeProfit = fraction;
      return policy;
    }

    ExitPolicy<Decimal> withTrailingStop (const Decimal& fraction) const
    {
      checkBelowOne(fraction, "trailing stop");
      ExitPolicy<Decimal> policy(*this);
      policy.mTrailingStop = fraction;
      return policy;
    }

    const std::optional<Decimal>& getStopLoss() const { return mStopLoss; }
    const std::optional<Decimal>& getTakeProfit() const { return mTakeProfit; }
    const std::optional<Decimal>& getTrailingStop() const { return mTrailingStop; }

    bool isEnabled() const
    {
      return mStopLoss || mTakeProfit || mTrailingStop;
    }

    std::string toString() const
    {
      if (!isEnabled())
	return "None";

      std::string text;
      appendLevel(text, "StopLoss", mStopLoss);
      appendLevel(text, "TakeProfit", mTakeProfit);
      appendLevel(text, "TrailingStop", mTrailingStop);
      return text;
    }

  private:
    ExitPolicy()
      : mStopLoss(),
	mTakeProfit(),
	mTrailingStop()
    {}

    static void checkBelowOne (const Decimal& fraction, const std::string& name)
    {
      if ((fraction <= DecimalConstants<Decimal>::DecimalZero) ||
	  (fraction >= DecimalConstants<Decimal>::DecimalOne))
	throw BacktestConfigurationException("ExitPolicy: " + name + " " + num::toString(fraction) +
					     " must be in (0, 1)");
    }

    static void appendLevel (std::string& text, const std::string& name, const std::optional<Decimal>& level)
    {
      if (!level)
	return;

      if (!text.empty())
	text += " ";

      text += name + "(" + num::toString(*level) + ")";
    }

  private:
    std::optional<Decimal> mStopLoss;
    std::optional<Decimal> mTakeProfit;
    std::optional<Decimal> mTrailingStop;
  };

  /**
   * @class BacktestConfiguration
   * @brief Validated parameters of one crossover run.
   *
   * Construction fails with BacktestConfigurationException unless
   * 0 < fastWindow < slowWindow and initialCash > 0. Sizing, commission,
   * slippage, signal and exit policies validate themselves when they are
   * built. The signal policy defaults to a plain moving-average crossover and
   * the exit policy to none; withSignalPolicy() and withExitPolicy() replace
   * them.
   */
  template <class Decimal>
  class BacktestConfiguration
  {
  public:
    BacktestConfiguration (unsigned int fastWindow,
			   unsigned int slowWindow,
			   const SizingRule<Decimal>& sizingRule,
			   const CommissionModel<Decimal>& commissionModel,
			   const SlippageModel<Decimal>& slippageModel,
			   bool allowMargin,
			   const Decimal& initialCash,
			   PositionMode positionMode = PositionMode::LONG_ONLY,
			   MovingAverageType movingAverageType = MovingAverageType::SIMPLE,
			   TradingVolume::VolumeUnit volumeUnits = TradingVolume::SHARES)
      : mFastWindow(fastWindow),
	mSlowWindow(slowWindow),
	mSizingRule(sizingRule),
	mCommissionModel(commissionModel),
	mSlippageModel(slippageModel),
	mAllowMargin(allowMargin),
	mInitialCash(initialCash),
	mPositionMode(positionMode),
	mMovingAverageType(movingAverageType),
	mVolumeUnits(volumeUnits),
	mSignalPolicy(SignalPolicy<Decimal>::movingAverageCrossover()),
	mExitPolicy(ExitPolicy<Decimal>::none())
    {
      if (fastWindow == 0)
	throw BacktestConfigurationException("BacktestConfiguration: fast window must be positive");

      if (fastWindow >= slowWindow)
	throw BacktestConfigurationException("BacktestConfiguration: fast window " + std::to_string(fastWindow) +
					     " must be less than slow window " + std::to_string(slowWindow));

      if (initialCash <= DecimalConstants<Decimal>::DecimalZero)
	throw BacktestConfigurationException("BacktestConfiguration: initial cash " + num::toString(initialCash) +
					     " must be positive");
    }

    BacktestConfiguration (const BacktestConfiguration<Decimal>& rhs) = default;
    BacktestConfiguration<Decimal>& operator=(const BacktestConfiguration<Decimal>& rhs) = default;

    ~BacktestConfiguration()
    {}

    // Same costs and sizing with different windows; used by parameter sweeps.
    BacktestConfiguration<Decimal> withWindows (unsigned int fastWindow, unsigned int slowWindow) const
    {
      BacktestConfiguration<Decimal> configuration(fastWindow, slowWindow, mSizingRule, mCommissionModel,
						   mSlippageModel, mAllowMargin, mInitialCash, mPositionMode,
						   mMovingAverageType, mVolumeUnits);
      configuration.mSignalPolicy = mSignalPolicy;
      configuration.mExitPolicy = mExitPolicy;
      return configuration;
    }

    BacktestConfiguration<Decimal> withSignalPolicy (const SignalPolicy<Decimal>& signalPolicy) const
    {
      BacktestConfiguration<Decimal> configuration(*this);
      configuration.mSignalPolicy = signalPolicy;
      return configuration;
    }

    BacktestConfiguration<Decimal> withExitPolicy (const ExitPolicy<Decimal>& exitPolicy) const
    {
      BacktestConfiguration<Decimal> configuration(*this);
      configuration.mExitPolicy = exitPolicy;
      return configuration;
    }

    unsigned int getFastWindow() const { return mFastWindow; }
    unsigned int getSlowWindow() const { return mSlowWindow; }
    const SizingRule<Decimal>& getSizingRule() const { return mSizingRule; }
    const CommissionModel<Decimal>& getCommissionModel() const { return mCommissionModel; }
    const SlippageModel<Decimal>& getSlippageModel() const { return mSlippageModel; }
    bool isMarginAllowed() const { return mAllowMargin; }
    const Decimal& getInitialCash() const { return mInitialCash; }
    PositionMode getPositionMode() const { return mPositionMode; }
    MovingAverageType getMovingAverageType() const { return mMovingAverageType; }
    TradingVolume::VolumeUnit getVolumeUnits() const { return mVolumeUnits; }
    const SignalPolicy<Decimal>& getSignalPolicy() const { return mSignalPolicy; }
    const ExitPolicy<Decimal>& getExitPolicy() const { return mExitPolicy; }

  private:
    unsigned int mFastWindow;
    unsigned int mSlowWindow;
    SizingRule<Decimal> mSizingRule;
    CommissionModel<Decimal> mCommissionModel;
    SlippageModel<Decimal> mSlippageModel;
    bool mAllowMargin;
    Decimal mInitialCash;
    PositionMode mPositionMode;
    MovingAverageType mMovingAverageType;
    TradingVolume::VolumeUnit mVolumeUnits;
    SignalPolicy<Decimal> mSignalPolicy;
    ExitPolicy<Decimal> mExitPolicy;
  };

  template <class Decimal>
  std::ostream& operator<<(std::ostream& os, const BacktestConfiguration<Decimal>& config)
  {
    os << movingAverageTypeToString(config.getMovingAverageType())
       << "(" << config.getFastWindow() << "/" << config.getSlowWindow() << ")"
       << " sizing " << config.getSizingRule().toString()
       << " commission " << config.getCommissionModel().toString()
       << " slippage " << config.getSlippageModel().toString()
       << " margin " << (config.isMarginAllowed() ? "allowed" : "disallowed")
       << " signal " << config.getSignalPolicy().toString()
       << " exits " << config.getExitPolicy().toString()
       << " mode " << positionModeToString(config.getPositionMode())
       << " initial cash " << config.getInitialCash();

    return os;
  }
}

#endif
