#include "poissonplr/fit/FitEngine.hh"

#include "poissonplr/fit/RootMathMinimizer.hh"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace poissonplr::fit {

namespace {

// Keep a start value strictly inside finite bounds; a start sitting on a
// limit stalls the bounded-variable transformation.
double inside_bounds(double x, double lo, double hi, double step) {
  const bool has_lo = std::isfinite(lo);
  const bool has_hi = std::isfinite(hi);
  double margin = 0.1 * step;
  if (has_lo && has_hi) margin = std::min(margin, 1e-3 * (hi - lo));
  if (has_lo && x <= lo + margin) x = lo + margin;
  if (has_hi && x >= hi - margin) x = hi - margin;
  return x;
}

} // namespace

FitEngine::FitEngine(FitConfig cfg)
  : cfg_(std::move(cfg)), minimizer_(std::make_shared<RootMathMinimizer>(cfg_))
{
  if (cfg_.max_retries < 0) throw std::invalid_argument("fit.max_retries must be >= 0");
}

FitEngine::FitEngine(std::shared_ptr<const IMinimizer> minimizer, FitConfig cfg)
  : cfg_(std::move(cfg)), minimizer_(std::move(minimizer))
{
  if (!minimizer_) throw std::invalid_argument("FitEngine: null minimizer");
  if (cfg_.max_retries < 0) throw std::invalid_argument("fit.max_retries must be >= 0");
}

std::vector<MinimizerVariable>
FitEngine::make_variables_(const dataset::IDataset& ds, std::optional<double> fixed_mu) const {
  const auto& pars = ds.Parameters();
  const std::size_t mu_index = ds.SignalIndex();

  std::vector<MinimizerVariable> vars;
  vars.reserve(pars.size());
  for (std::size_t i = 0; i < pars.size(); ++i) {
    const auto& p = pars.at(i);
    MinimizerVariable v;
    v.name = p.name;
    v.step = p.step;
    v.lo = p.lo;
    v.hi = p.hi;

    if (i == mu_index && fixed_mu) {
      v.fixed = true;
      v.start = *fixed_mu;
    } else if (p.frozen) {
      v.fixed = true;
      v.start = p.value;
    } else {
      v.start = inside_bounds(p.value, p.lo, p.hi, p.step);
    }
    vars.push_back(std::move(v));
  }
  return vars;
}

void FitEngine::perturb_(std::vector<MinimizerVariable>& vars, int attempt) const {
  // alternate sign, growing amplitude: +1, -1, +2, -2, ... steps
  const double sign = (attempt % 2 == 1) ? 1.0 : -1.0;
  const double amp = cfg_.retry_spread * static_cast<double>((attempt + 1) / 2);
  for (auto& v : vars) {
    if (v.fixed) continue;
    const double shift = sign * amp * std::max(v.step, 0.1 * std::abs(v.start));
    v.start = inside_bounds(v.start + shift, v.lo, v.hi, v.step);
  }
}

FitResult FitEngine::Fit(dataset::IDataset& ds, std::optional<double> fixed_mu) const {
  auto& pars = ds.Parameters();
  const std::vector<double> original = pars.Values();
  const std::vector<double>& counts = ds.Counts();
  const std::size_t npar = pars.size();

  IMinimizer::Objective nll = [&ds, &counts, npar](const double* x) {
    const std::vector<double> values(x, x + npar);
    return -ds.LogLikelihood(counts, values);
  };

  const std::vector<MinimizerVariable> start_vars = make_variables_(ds, fixed_mu);

  FitResult res;
  res.names = pars.Names();
  res.signal_index = ds.SignalIndex();
  res.fixed_mu = fixed_mu;

  MinimizerOutcome outcome;
  for (int attempt = 0; attempt <= cfg_.max_retries; ++attempt) {
    std::vector<MinimizerVariable> vars = start_vars;
    if (attempt > 0) perturb_(vars, attempt);

    outcome = minimizer_->Minimize(nll, vars);
    res.attempts = attempt + 1;
    if (outcome.converged) break;

    if (cfg_.verbosity > 0) {
      std::cerr << "[fit] WARNING: " << minimizer_->Name() << " did not converge (status "
                << outcome.status << ", attempt " << res.attempts << " of "
                << (cfg_.max_retries + 1) << ")\n";
    }
  }

  res.values = outcome.x.size() == npar ? outcome.x : original;
  res.loglike = -outcome.fval;
  res.converged = outcome.converged;
  res.status = outcome.status;

  if (res.converged) {
    pars.SetValues(res.values);
  } else {
    pars.SetValues(original);
  }

  if (cfg_.verbosity > 1) {
    std::cout << "[fit] " << ds.Name() << (fixed_mu ? " constrained" : " unconstrained")
              << " lnL=" << res.loglike << " mu=" << res.values[res.signal_index]
              << " status=" << res.status << "\n";
  }
  return res;
}

} // namespace poissonplr::fit
