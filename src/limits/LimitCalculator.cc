#include "poissonplr/limits/LimitCalculator.hh"

#include "Math/BrentRootFinder.h"
#include "Math/Functor.h"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <utility>

#include "poissonplr/core/Errors.hh"
#include "poissonplr/dataset/AsimovGenerator.hh"
#include "poissonplr/stats/Asymptotics.hh"

namespace poissonplr::limits {

LimitCalculator::LimitCalculator(std::shared_ptr<const stats::TestStatisticCalculator> calc,
                                 LimitConfig cfg)
  : calc_(calc), sig_(calc), cfg_(std::move(cfg))
{
  if (cfg_.mu_max <= 0.0) throw std::invalid_argument("limit.mu_max must be > 0");
  if (cfg_.initial_step <= 0.0) throw std::invalid_argument("limit.initial_step must be > 0");
  if (cfg_.tolerance <= 0.0) throw std::invalid_argument("limit.tolerance must be > 0");
  if (cfg_.max_iterations <= 0) throw std::invalid_argument("limit.max_iterations must be > 0");
  if (cfg_.min_asimov_q <= 0.0) throw std::invalid_argument("limit.min_asimov_q must be > 0");
}

double LimitCalculator::asimov_sigma_(dataset::IDataset& asimov_bkg_only, double mu) const {
  double mu_s = mu;
  for (;;) {
    const double q_a = calc_->Evaluate(asimov_bkg_only, mu_s, stats::TestStatisticKind::QMu);
    if (q_a >= cfg_.min_asimov_q) return mu_s / std::sqrt(q_a);
    if (mu_s >= cfg_.mu_max) {
      std::ostringstream msg;
      msg << "Limit: q_mu,A = " << q_a << " < " << cfg_.min_asimov_q << " up to mu_max=" << cfg_.mu_max
          << ", no sensitivity to " << asimov_bkg_only.SignalParameter();
      throw Error(msg.str());
    }
    mu_s = std::min(2.0 * mu_s, cfg_.mu_max);
  }
}

double LimitCalculator::Limit(const dataset::IDataset& data, double confidence_level,
                              stats::TestStatisticKind kind) const {
  if (!(confidence_level > 0.0 && confidence_level < 1.0))
    throw std::invalid_argument("Limit: confidence_level must be in (0,1)");
  if (kind == stats::TestStatisticKind::Q0)
    throw std::invalid_argument("Limit: q0 is a discovery statistic, use q_mu or q_tilde_mu");

  const double alpha = 1.0 - confidence_level;
  auto work = data.Clone();
  std::unique_ptr<dataset::IDataset> asimov_bkg;
  if (kind == stats::TestStatisticKind::QTildeMu) {
    asimov_bkg = dataset::AsimovGenerator::Build(data, 0.0);
  }

  // f(mu) = p(mu) - alpha, decreasing in mu above mu_hat
  auto f = [&](double mu) {
    const double q = calc_->Evaluate(*work, mu, kind);
    stats::AsymptoticParameters ap;
    ap.mu = mu;
    if (asimov_bkg) ap.sigma = asimov_sigma_(*asimov_bkg, mu);
    const double p = sig_.PValue(q, kind, ap);
    if (cfg_.verbosity > 1) {
      std::cout << "[limit]   mu=" << mu << " q=" << q << " p=" << p << "\n";
    }
    return p - alpha;
  };

  // start from the (floored) best fit
  const fit::FitResult best = calc_->engine().Fit(*work);
  if (!best.converged) {
    throw FitConvergenceError("unconstrained fit of '" + data.Name() + "' before limit search",
                              best.names, best.values, best.status);
  }
  const double mu_hat = best.mu_hat();
  double lo = std::max(mu_hat, 0.0);
  if (lo <= 0.0) lo = 1e-3 * cfg_.initial_step;

  double f_lo = f(lo);
  if (f_lo <= 0.0) {
    throw NoRootFoundError(lo, lo, f_lo, f_lo);
  }

  if (lo >= cfg_.mu_max) {
    throw NoRootFoundError(lo, cfg_.mu_max, f_lo, f_lo);
  }
  double step = cfg_.initial_step;
  double hi = std::min(lo + step, cfg_.mu_max);
  double f_hi = f(hi);
  while (f_hi > 0.0) {
    if (hi >= cfg_.mu_max) {
      throw NoRootFoundError(lo, hi, f_lo, f_hi);
    }
    lo = hi;
    f_lo = f_hi;
    step *= 2.0;
    hi = std::min(lo + step, cfg_.mu_max);
    f_hi = f(hi);
  }

  ROOT::Math::Functor1D func(f);
  ROOT::Math::BrentRootFinder brf;
  brf.SetNpx(4);  // bracket is already known, keep the pre-scan short
  brf.SetFunction(func, lo, hi);
  if (!brf.Solve(cfg_.max_iterations, cfg_.tolerance, 0.0)) {
    throw NoRootFoundError(lo, hi, f_lo, f_hi);
  }
  const double mu_up = brf.Root();

  if (cfg_.verbosity > 0) {
    std::cout << "[limit] " << stats::ToString(kind) << " " << 100.0 * confidence_level
              << "% CL upper limit on " << data.SignalParameter() << ": " << mu_up
              << " (mu_hat=" << mu_hat << ")\n";
  }
  return mu_up;
}

double LimitCalculator::ExpectedLimit(const dataset::IDataset& template_dataset,
                                      double confidence_level,
                                      stats::TestStatisticKind kind) const {
  auto asimov = dataset::AsimovGenerator::Build(template_dataset, 0.0);
  return Limit(*asimov, confidence_level, kind);
}

LimitBands LimitCalculator::ExpectedLimitBands(const dataset::IDataset& template_dataset,
                                               double confidence_level,
                                               stats::TestStatisticKind kind) const {
  LimitBands b;
  b.median = ExpectedLimit(template_dataset, confidence_level, kind);
  b.sigma = sig_.Sigma(template_dataset, b.median);

  auto band = [&](double n) { return std::max(0.0, b.median + n * b.sigma); };
  b.minus2 = band(-2.0);
  b.minus1 = band(-1.0);
  b.plus1  = band(+1.0);
  b.plus2  = band(+2.0);
  return b;
}

std::vector<std::pair<double, double>>
LimitCalculator::Scan(const dataset::IDataset& data, const std::vector<double>& mu_values,
                      stats::TestStatisticKind kind) const {
  auto work = data.Clone();
  std::vector<std::pair<double, double>> out;
  out.reserve(mu_values.size());
  for (double mu : mu_values) {
    out.emplace_back(mu, calc_->Evaluate(*work, mu, kind));
  }
  return out;
}

} // namespace poissonplr::limits
