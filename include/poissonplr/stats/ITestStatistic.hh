#pragma once

#include <string>

#include "poissonplr/stats/TestStatisticKind.hh"

namespace poissonplr::stats {

/**
 * Outcome of the two profile fits, before the kind-specific policy.
 *
 *  q_raw   : -2 [ ln L(mu, theta_hathat) - ln L(mu_hat', theta_hat) ] >= 0,
 *            where mu_hat' is mu_hat after flooring
 *  mu      : hypothesis
 *  mu_hat  : unconstrained best-fit signal strength, after flooring
 *  floored : true if the unconstrained mu_hat was negative or at its lower
 *            bound and the denominator was refitted at the floor
 */
struct ProfileRatio {
  double q_raw   = 0.0;
  double mu      = 0.0;
  double mu_hat  = 0.0;
  bool   floored = false;
};

/**
 * Abstract profile-likelihood test statistic.
 *
 * The fits are shared by all kinds (TestStatisticCalculator runs them);
 * an implementation decides how the profile ratio becomes q, and how q
 * is distributed asymptotically.
 */
class ITestStatistic {
public:
  virtual ~ITestStatistic() = default;

  virtual TestStatisticKind Kind() const = 0;
  std::string Name() const { return ToString(Kind()); }

  /// One-sided/bounded policy. Result is >= 0.
  virtual double Apply(const ProfileRatio& r) const = 0;

  /// True if only upward fluctuations of mu_hat count against the hypothesis.
  virtual bool OneSided() const = 0;

  virtual double AsymptoticCdf(double q, const AsymptoticParameters& ap) const = 0;
  virtual double AsymptoticPValue(double q, const AsymptoticParameters& ap) const = 0;
  virtual double AsymptoticPdf(double q, const AsymptoticParameters& ap) const = 0;
};

} // namespace poissonplr::stats
