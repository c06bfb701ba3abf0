#include "poissonplr/stats/PoissonLikelihood.hh"

#include <cmath>
#include <stdexcept>

namespace poissonplr::stats {

double PoissonLikelihood::EvaluateNLL(const std::vector<double>& data,
                                      const std::vector<double>& model) const {
  if (data.size() != model.size()) {
    throw std::invalid_argument("PoissonLikelihood::EvaluateNLL: data/model size mismatch");
  }

  const std::size_t n = data.size();
  double nll = 0.0;

  for (std::size_t i = 0; i < n; ++i) {
    const double n_i = data[i];
    const double mu_i = model[i];

    if (!std::isfinite(mu_i)) {
      nll += kPenalty;
      continue;
    }
    if (mu_i <= 0.0) {
      if (n_i <= 0.0) {
        // both zero: L_i = 1
        continue;
      }
      nll += kPenalty;
      continue;
    }

    nll += mu_i - n_i * std::log(mu_i) + std::lgamma(n_i + 1.0);
  }

  return nll;
}

} // namespace poissonplr::stats
