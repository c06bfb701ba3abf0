#include "poissonplr/stats/ProfileLikelihoodStatistics.hh"

#include "poissonplr/stats/Asymptotics.hh"

#include <algorithm>

namespace poissonplr::stats {

double QMuStatistic::Apply(const ProfileRatio& r) const {
  return std::max(r.q_raw, 0.0);
}

double QMuStatistic::AsymptoticCdf(double q, const AsymptoticParameters& ap) const {
  return asymptotics::QMuCdf(q, ap);
}

double QMuStatistic::AsymptoticPValue(double q, const AsymptoticParameters& ap) const {
  return asymptotics::QMuPValue(q, ap);
}

double QMuStatistic::AsymptoticPdf(double q, const AsymptoticParameters& ap) const {
  return asymptotics::QMuPdf(q, ap);
}

double Q0Statistic::Apply(const ProfileRatio& r) const {
  if (r.floored || r.mu_hat <= 0.0) return 0.0;
  return std::max(r.q_raw, 0.0);
}

double Q0Statistic::AsymptoticCdf(double q, const AsymptoticParameters& ap) const {
  return asymptotics::Q0Cdf(q, ap);
}

double Q0Statistic::AsymptoticPValue(double q, const AsymptoticParameters& ap) const {
  return asymptotics::Q0PValue(q, ap);
}

double Q0Statistic::AsymptoticPdf(double q, const AsymptoticParameters& ap) const {
  return asymptotics::Q0Pdf(q, ap);
}

double QTildeMuStatistic::Apply(const ProfileRatio& r) const {
  if (r.mu_hat > r.mu) return 0.0;
  return std::max(r.q_raw, 0.0);
}

double QTildeMuStatistic::AsymptoticCdf(double q, const AsymptoticParameters& ap) const {
  return asymptotics::QTildeMuCdf(q, ap);
}

double QTildeMuStatistic::AsymptoticPValue(double q, const AsymptoticParameters& ap) const {
  return asymptotics::QTildeMuPValue(q, ap);
}

double QTildeMuStatistic::AsymptoticPdf(double q, const AsymptoticParameters& ap) const {
  return asymptotics::QTildeMuPdf(q, ap);
}

} // namespace poissonplr::stats
