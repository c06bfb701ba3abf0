#pragma once

#include "poissonplr/fit/FitConfig.hh"
#include "poissonplr/fit/IMinimizer.hh"

namespace poissonplr::fit {

/**
 * IMinimizer backed by ROOT::Math::Minimizer (Minuit2/Migrad by default).
 *
 * A fresh minimizer instance is created per call, so one RootMathMinimizer
 * may be shared by concurrent fits.
 */
class RootMathMinimizer : public IMinimizer {
public:
  explicit RootMathMinimizer(FitConfig cfg = {});

  MinimizerOutcome Minimize(const Objective& fcn,
                            const std::vector<MinimizerVariable>& vars) const override;

  std::string Name() const override { return cfg_.minimizer + "/" + cfg_.algorithm; }

private:
  FitConfig cfg_;
};

} // namespace poissonplr::fit
