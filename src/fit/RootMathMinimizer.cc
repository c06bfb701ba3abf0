#include "poissonplr/fit/RootMathMinimizer.hh"

#include "Math/Factory.h"
#include "Math/Functor.h"
#include "Math/Minimizer.h"

#include <cmath>
#include <memory>
#include <stdexcept>
#include <utility>

namespace poissonplr::fit {

RootMathMinimizer::RootMathMinimizer(FitConfig cfg) : cfg_(std::move(cfg)) {
  if (cfg_.tolerance <= 0.0) throw std::invalid_argument("fit.tolerance must be > 0");
  if (cfg_.max_function_calls <= 0) throw std::invalid_argument("fit.max_function_calls must be > 0");
}

MinimizerOutcome RootMathMinimizer::Minimize(const Objective& fcn,
                                             const std::vector<MinimizerVariable>& vars) const {
  MinimizerOutcome out;

  std::unique_ptr<ROOT::Math::Minimizer> min(
      ROOT::Math::Factory::CreateMinimizer(cfg_.minimizer, cfg_.algorithm));
  if (!min) {
    throw std::runtime_error("RootMathMinimizer: cannot create minimizer " + Name());
  }

  min->SetMaxFunctionCalls(static_cast<unsigned int>(cfg_.max_function_calls));
  min->SetMaxIterations(static_cast<unsigned int>(cfg_.max_iterations));
  min->SetTolerance(cfg_.tolerance);
  min->SetStrategy(cfg_.strategy);
  min->SetPrintLevel(cfg_.print_level);
  min->SetErrorDef(0.5);  // objective is -ln L

  const unsigned int npar = static_cast<unsigned int>(vars.size());
  ROOT::Math::Functor functor(fcn, npar);
  min->SetFunction(functor);

  unsigned int n_free = 0;
  for (unsigned int i = 0; i < npar; ++i) {
    const auto& v = vars[i];
    const bool has_lo = std::isfinite(v.lo);
    const bool has_hi = std::isfinite(v.hi);

    if (v.fixed) {
      min->SetFixedVariable(i, v.name, v.start);
      continue;
    }
    ++n_free;
    if (has_lo && has_hi) {
      min->SetLimitedVariable(i, v.name, v.start, v.step, v.lo, v.hi);
    } else if (has_lo) {
      min->SetLowerLimitedVariable(i, v.name, v.start, v.step, v.lo);
    } else if (has_hi) {
      min->SetUpperLimitedVariable(i, v.name, v.start, v.step, v.hi);
    } else {
      min->SetVariable(i, v.name, v.start, v.step);
    }
  }

  if (n_free == 0) {
    // nothing to optimize: evaluate at the fixed point
    out.x.reserve(npar);
    for (const auto& v : vars) out.x.push_back(v.start);
    out.fval = fcn(out.x.data());
    out.status = 0;
    out.converged = std::isfinite(out.fval);
    return out;
  }

  const bool ok = min->Minimize();
  out.status = min->Status();
  out.fval = min->MinValue();

  const double* xs = min->X();
  out.x.assign(xs, xs + npar);
  out.converged = ok && std::isfinite(out.fval);
  return out;
}

} // namespace poissonplr::fit
