#pragma once

#include <vector>

namespace poissonplr::stats {

/**
 * Binned Poisson likelihood kernel.
 *
 * EvaluateNLL:
 *   -ln L = sum_i [ lambda_i - n_i ln(lambda_i) + ln Gamma(n_i + 1) ]
 *
 * The ln Gamma term keeps the value a true log-likelihood for real-valued
 * (Asimov) counts as well as integer ones. Bins with lambda_i <= 0 and
 * n_i > 0 are impossible and receive a large finite penalty, so a
 * minimizer wandering outside the physical region is pushed back.
 */
class PoissonLikelihood {
public:
  static constexpr double kPenalty = 1e9;

  double EvaluateNLL(const std::vector<double>& data,
                     const std::vector<double>& model) const;

  double EvaluateLogL(const std::vector<double>& data,
                      const std::vector<double>& model) const {
    return -EvaluateNLL(data, model);
  }
};

} // namespace poissonplr::stats
