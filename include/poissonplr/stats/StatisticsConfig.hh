#pragma once

#include <string>

namespace poissonplr::stats {

/**
 * Configuration for the test-statistic calculator, derived from the JSON
 * "run" block.
 */
struct StatisticsConfig {
  std::string test_stat = "q_tilde_mu"; ///< q_mu | q0 | q_tilde_mu
  double      cl        = 0.90;         ///< confidence level (0 < cl < 1)

  /// An unconstrained mu_hat within this distance of the lower bound of the
  /// signal parameter counts as "at the bound" and is floored.
  double bound_tolerance = 1e-4;

  /// Differences in -2 ln L below this are fit noise: such a q is reported
  /// as exactly 0, and when the constrained fit already sits at the floor
  /// mu_hat is floored too.
  double floor_q_tolerance = 1e-4;

  int verbosity = 0; ///< 0=silent, 1=summary, 2+=debug
};

} // namespace poissonplr::stats
