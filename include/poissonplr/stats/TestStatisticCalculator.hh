#pragma once

#include <array>
#include <memory>
#include <optional>

#include "poissonplr/dataset/IDataset.hh"
#include "poissonplr/fit/FitEngine.hh"
#include "poissonplr/stats/ITestStatistic.hh"
#include "poissonplr/stats/StatisticsConfig.hh"

namespace poissonplr::stats {

struct TestStatisticResult {
  TestStatisticKind kind = TestStatisticKind::QMu;
  double q       = 0.0;
  double mu      = 0.0;   ///< hypothesis
  double mu_hat  = 0.0;   ///< unconstrained best fit after flooring
  double mu_hat_raw = 0.0;
  bool   floored = false;
  fit::FitResult constrained;
  fit::FitResult unconstrained;
};

/**
 * Profile-likelihood test statistic:
 *
 *   q = -2 [ ln L(mu, theta_hathat) - ln L(mu_hat, theta_hat) ]
 *
 * 1) fit with the signal fixed at mu (constrained)
 * 2) fit with the signal free inside its bounds (unconstrained)
 * 3) if mu_hat < 0 or mu_hat sits at its lower bound, refit the
 *    denominator with the signal fixed at max(0, lower bound)
 * 4) apply the kind's policy (ITestStatistic::Apply)
 *
 * A non-converged fit throws FitConvergenceError. Evaluate leaves the
 * dataset parameters at the unconstrained best fit.
 */
class TestStatisticCalculator {
public:
  explicit TestStatisticCalculator(fit::FitEngine engine = fit::FitEngine{},
                                   StatisticsConfig cfg = {});

  double Evaluate(dataset::IDataset& ds, double mu, TestStatisticKind kind) const;

  TestStatisticResult EvaluateDetailed(dataset::IDataset& ds, double mu,
                                       TestStatisticKind kind) const;

  const ITestStatistic& Statistic(TestStatisticKind kind) const;

  const fit::FitEngine& engine() const noexcept { return engine_; }
  const StatisticsConfig& config() const noexcept { return cfg_; }

private:
  fit::FitResult checked_fit_(dataset::IDataset& ds, std::optional<double> fixed_mu,
                              const char* what) const;

  fit::FitEngine   engine_;
  StatisticsConfig cfg_;
  std::array<std::unique_ptr<ITestStatistic>, 3> stats_;
};

} // namespace poissonplr::stats
