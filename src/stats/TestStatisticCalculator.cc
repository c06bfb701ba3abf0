#include "poissonplr/stats/TestStatisticCalculator.hh"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <utility>

#include "poissonplr/core/Errors.hh"
#include "poissonplr/stats/TestStatisticFactory.hh"

namespace poissonplr::stats {

TestStatisticCalculator::TestStatisticCalculator(fit::FitEngine engine, StatisticsConfig cfg)
  : engine_(std::move(engine)), cfg_(std::move(cfg))
{
  if (cfg_.bound_tolerance < 0.0) throw std::invalid_argument("bound_tolerance must be >= 0");
  if (cfg_.floor_q_tolerance < 0.0) throw std::invalid_argument("floor_q_tolerance must be >= 0");
  stats_[0] = MakeTestStatistic(TestStatisticKind::QMu);
  stats_[1] = MakeTestStatistic(TestStatisticKind::Q0);
  stats_[2] = MakeTestStatistic(TestStatisticKind::QTildeMu);
}

const ITestStatistic& TestStatisticCalculator::Statistic(TestStatisticKind kind) const {
  for (const auto& s : stats_) {
    if (s->Kind() == kind) return *s;
  }
  throw std::invalid_argument("TestStatisticCalculator: no statistic for kind " + ToString(kind));
}

fit::FitResult TestStatisticCalculator::checked_fit_(dataset::IDataset& ds,
                                                     std::optional<double> fixed_mu,
                                                     const char* what) const {
  fit::FitResult res = engine_.Fit(ds, fixed_mu);
  if (!res.converged) {
    std::ostringstream ctx;
    ctx << what << " fit of '" << ds.Name() << "'";
    if (fixed_mu) ctx << " at mu=" << *fixed_mu;
    throw FitConvergenceError(ctx.str(), res.names, res.values, res.status);
  }
  return res;
}

double TestStatisticCalculator::Evaluate(dataset::IDataset& ds, double mu,
                                         TestStatisticKind kind) const {
  return EvaluateDetailed(ds, mu, kind).q;
}

TestStatisticResult TestStatisticCalculator::EvaluateDetailed(dataset::IDataset& ds, double mu,
                                                              TestStatisticKind kind) const {
  if (!std::isfinite(mu)) throw std::invalid_argument("TestStatisticCalculator: mu must be finite");
  if (kind == TestStatisticKind::Q0 && mu != 0.0)
    throw std::invalid_argument("TestStatisticCalculator: q0 is defined at mu = 0 only");

  TestStatisticResult r;
  r.kind = kind;
  r.mu = mu;

  // 1) constrained: L(mu, theta_hathat)
  r.constrained = checked_fit_(ds, mu, "constrained");

  // 2) unconstrained: L(mu_hat, theta_hat)
  r.unconstrained = checked_fit_(ds, std::nullopt, "unconstrained");
  r.mu_hat_raw = r.unconstrained.mu_hat();

  // 3) bounded-parameter convention
  const auto& mu_par = ds.Parameters().at(ds.SignalIndex());
  const double floor_value = mu_par.has_lower() ? std::max(0.0, mu_par.lo) : 0.0;
  const bool at_bound = mu_par.has_lower() && (r.mu_hat_raw - mu_par.lo) <= cfg_.bound_tolerance;
  const bool floor_indistinct = (mu == floor_value) &&
      2.0 * (r.unconstrained.loglike - r.constrained.loglike) < cfg_.floor_q_tolerance;
  r.floored = (r.mu_hat_raw < floor_value) || at_bound || floor_indistinct;

  const fit::FitResult* best = &r.unconstrained;
  fit::FitResult floor_fit;
  if (r.floored) {
    if (mu == floor_value) {
      best = &r.constrained;
    } else {
      floor_fit = checked_fit_(ds, floor_value, "floored");
      best = &floor_fit;
    }
    r.mu_hat = floor_value;
  } else {
    r.mu_hat = r.mu_hat_raw;
  }

  // the global maximum can never be below the constrained one
  if (r.constrained.loglike > best->loglike) best = &r.constrained;

  ProfileRatio ratio;
  ratio.q_raw = std::max(0.0, 2.0 * (best->loglike - r.constrained.loglike));
  // hypothesis indistinguishable from the best fit at fit precision
  if (ratio.q_raw < cfg_.floor_q_tolerance) ratio.q_raw = 0.0;
  ratio.mu = mu;
  ratio.mu_hat = r.mu_hat;
  ratio.floored = r.floored;

  // 4) kind policy
  r.q = Statistic(kind).Apply(ratio);

  ds.Parameters().SetValues(best->values);

  if (cfg_.verbosity > 1) {
    std::cout << "[stats] " << ToString(kind) << "(mu=" << mu << ") = " << r.q
              << "  mu_hat=" << r.mu_hat << (r.floored ? " (floored)" : "") << "\n";
  }
  return r;
}

} // namespace poissonplr::stats
