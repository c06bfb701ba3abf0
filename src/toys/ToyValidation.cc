#include "poissonplr/toys/ToyValidation.hh"

#include "Math/BrentRootFinder.h"
#include "Math/Functor.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>

#include "poissonplr/stats/Asymptotics.hh"

namespace poissonplr::toys {

double AsymptoticQuantile(stats::TestStatisticKind kind, double p,
                          const stats::AsymptoticParameters& ap) {
  if (!(p > 0.0 && p < 1.0)) throw std::invalid_argument("AsymptoticQuantile: p must be in (0,1)");
  if (stats::asymptotics::Cdf(kind, 0.0, ap) >= p) return 0.0;

  double hi = 10.0;
  while (stats::asymptotics::Cdf(kind, hi, ap) < p) {
    hi *= 2.0;
    if (hi > 1e6) throw std::runtime_error("AsymptoticQuantile: quantile beyond q = 1e6");
  }

  ROOT::Math::Functor1D f([&](double q) { return stats::asymptotics::Cdf(kind, q, ap) - p; });
  ROOT::Math::BrentRootFinder brf;
  brf.SetFunction(f, 0.0, hi);
  if (!brf.Solve(200, 1e-10, 1e-10)) {
    throw std::runtime_error("AsymptoticQuantile: Brent solver did not converge");
  }
  return brf.Root();
}

ValidationReport ValidateAgainstAsymptotics(const Distribution& dist,
                                            const stats::AsymptoticParameters& ap) {
  if (dist.empty()) throw std::invalid_argument("ValidateAgainstAsymptotics: empty distribution");
  const auto kind = dist.kind();

  ValidationReport rep;
  rep.n = static_cast<long long>(dist.size());
  rep.empirical_median = dist.Median();
  rep.empirical_q95 = dist.Quantile(0.95);
  rep.asymptotic_median = AsymptoticQuantile(kind, 0.5, ap);
  rep.asymptotic_q95 = AsymptoticQuantile(kind, 0.95, ap);
  rep.zero_fraction = dist.ZeroFraction();
  rep.asymptotic_zero_fraction = stats::asymptotics::Cdf(kind, 0.0, ap);

  std::vector<double> v = dist.Values();
  std::sort(v.begin(), v.end());
  const double n = static_cast<double>(v.size());

  double d = 0.0;
  std::size_t i = 0;
  while (i < v.size()) {
    std::size_t j = i;
    while (j < v.size() && v[j] == v[i]) ++j;
    const double f_asym = stats::asymptotics::Cdf(kind, v[i], ap);
    const double fe_hi = static_cast<double>(j) / n;
    const double fe_lo = static_cast<double>(i) / n;
    d = std::max(d, std::abs(fe_hi - f_asym));
    if (v[i] > 0.0) d = std::max(d, std::abs(fe_lo - f_asym));
    i = j;
  }
  rep.ks_distance = d;
  return rep;
}

} // namespace poissonplr::toys
