#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "poissonplr/dataset/IDataset.hh"
#include "poissonplr/fit/FitConfig.hh"
#include "poissonplr/fit/IMinimizer.hh"

namespace poissonplr::fit {

struct FitResult {
  std::vector<std::string> names;
  std::vector<double>      values;      ///< best fit (or last point if not converged)
  std::size_t              signal_index = 0;
  double                   loglike   = 0.0;
  bool                     converged = false;
  int                      status    = -1;
  int                      attempts  = 0;
  std::optional<double>    fixed_mu;

  double mu_hat() const { return values.at(signal_index); }
};

/**
 * Maximum-likelihood fit of a dataset's free parameters.
 *
 * With fixed_mu the signal strength is held at that value; otherwise it is
 * fitted inside its declared bounds. Frozen parameters are never fitted.
 * On convergence the dataset parameters are left at the best fit; on
 * failure they are restored to their values before the call.
 */
class FitEngine {
public:
  explicit FitEngine(FitConfig cfg = {});
  FitEngine(std::shared_ptr<const IMinimizer> minimizer, FitConfig cfg = {});

  FitResult Fit(dataset::IDataset& ds, std::optional<double> fixed_mu = std::nullopt) const;

  const FitConfig& config() const noexcept { return cfg_; }
  const IMinimizer& minimizer() const noexcept { return *minimizer_; }

private:
  std::vector<MinimizerVariable> make_variables_(const dataset::IDataset& ds,
                                                 std::optional<double> fixed_mu) const;
  void perturb_(std::vector<MinimizerVariable>& vars, int attempt) const;

  FitConfig                         cfg_;
  std::shared_ptr<const IMinimizer> minimizer_;
};

} // namespace poissonplr::fit
