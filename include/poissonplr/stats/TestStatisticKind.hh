#pragma once

#include <cmath>
#include <limits>
#include <string>

namespace poissonplr::stats {

enum class TestStatisticKind {
  QMu,       ///< two-sided profile ratio, mu_hat floored at 0
  Q0,        ///< discovery, evaluated at mu = 0
  QTildeMu   ///< one-sided exclusion, mu_hat floored at 0
};

std::string ToString(TestStatisticKind kind);

/// Accepts "q_mu"/"qmu", "q0", "q_tilde_mu"/"qtildemu" (case-insensitive).
/// Throws std::invalid_argument for anything else.
TestStatisticKind ParseTestStatisticKind(const std::string& name);

/**
 * Inputs of the asymptotic (Wilks/Wald) distributions.
 *
 * mu      : hypothesis the statistic was evaluated at
 * mu_true : signal strength the data are distributed under (NaN = mu)
 * sigma   : Asimov standard deviation of mu_hat (needed whenever
 *           mu_true != mu, and always for q_tilde_mu)
 */
struct AsymptoticParameters {
  double mu      = 0.0;
  double mu_true = std::numeric_limits<double>::quiet_NaN();
  double sigma   = std::numeric_limits<double>::quiet_NaN();

  double true_mu() const { return std::isnan(mu_true) ? mu : mu_true; }
};

} // namespace poissonplr::stats
