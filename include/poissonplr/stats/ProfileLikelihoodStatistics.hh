#pragma once

#include "poissonplr/stats/ITestStatistic.hh"

namespace poissonplr::stats {

/**
 * q_mu: two-sided profile likelihood ratio with the bounded-parameter
 * convention (mu_hat < 0 replaced by 0). Asymptotically chi-square with
 * one degree of freedom.
 */
class QMuStatistic : public ITestStatistic {
public:
  TestStatisticKind Kind() const override { return TestStatisticKind::QMu; }
  double Apply(const ProfileRatio& r) const override;
  bool OneSided() const override { return false; }

  double AsymptoticCdf(double q, const AsymptoticParameters& ap) const override;
  double AsymptoticPValue(double q, const AsymptoticParameters& ap) const override;
  double AsymptoticPdf(double q, const AsymptoticParameters& ap) const override;
};

/**
 * q0: discovery statistic at mu = 0, zero whenever mu_hat is not above 0.
 * Asymptotically half chi-square with a point mass of 1/2 at zero.
 */
class Q0Statistic : public ITestStatistic {
public:
  TestStatisticKind Kind() const override { return TestStatisticKind::Q0; }
  double Apply(const ProfileRatio& r) const override;
  bool OneSided() const override { return true; }

  double AsymptoticCdf(double q, const AsymptoticParameters& ap) const override;
  double AsymptoticPValue(double q, const AsymptoticParameters& ap) const override;
  double AsymptoticPdf(double q, const AsymptoticParameters& ap) const override;
};

/**
 * q_tilde_mu: exclusion statistic. Denominator at max(mu_hat, 0), and
 * zero when mu_hat > mu (an excess is not evidence against mu).
 */
class QTildeMuStatistic : public ITestStatistic {
public:
  TestStatisticKind Kind() const override { return TestStatisticKind::QTildeMu; }
  double Apply(const ProfileRatio& r) const override;
  bool OneSided() const override { return true; }

  double AsymptoticCdf(double q, const AsymptoticParameters& ap) const override;
  double AsymptoticPValue(double q, const AsymptoticParameters& ap) const override;
  double AsymptoticPdf(double q, const AsymptoticParameters& ap) const override;
};

} // namespace poissonplr::stats
