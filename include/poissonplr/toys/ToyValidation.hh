#pragma once

#include "poissonplr/stats/TestStatisticKind.hh"
#include "poissonplr/toys/Distribution.hh"

namespace poissonplr::toys {

struct ValidationReport {
  long long n = 0;
  double ks_distance = 0.0;          ///< sup |F_toys - F_asymptotic|
  double empirical_median = 0.0;
  double asymptotic_median = 0.0;
  double empirical_q95 = 0.0;
  double asymptotic_q95 = 0.0;
  double zero_fraction = 0.0;
  double asymptotic_zero_fraction = 0.0;  ///< point mass at q = 0
};

/// Inverse of the asymptotic CDF; 0 if the point mass at zero already covers p.
double AsymptoticQuantile(stats::TestStatisticKind kind, double p,
                          const stats::AsymptoticParameters& ap);

/**
 * Compare a toy distribution with the asymptotic formula for its kind,
 * to check whether the asymptotic regime is reached.
 */
ValidationReport ValidateAgainstAsymptotics(const Distribution& dist,
                                            const stats::AsymptoticParameters& ap);

} // namespace poissonplr::toys
