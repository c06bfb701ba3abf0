#include "poissonplr/stats/Asymptotics.hh"

#include "Math/ProbFuncMathCore.h"
#include "Math/QuantFuncMathCore.h"

#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>

namespace poissonplr::stats::asymptotics {

namespace {

constexpr double kInvSqrt2Pi = 0.39894228040143267794;

double checked_sigma(const AsymptoticParameters& ap, const char* who) {
  if (!(ap.sigma > 0.0) || std::isnan(ap.sigma)) {
    throw std::invalid_argument(std::string(who) + ": a positive Asimov sigma is required");
  }
  return ap.sigma;
}

bool is_central(const AsymptoticParameters& ap) {
  return ap.true_mu() == ap.mu;
}

void check_q(double q, const char* who) {
  if (std::isnan(q)) throw std::invalid_argument(std::string(who) + ": q is NaN");
}

} // namespace

// ---------------------------------------------------------------- q0

double Q0Cdf(double q0, const AsymptoticParameters& ap) {
  check_q(q0, "Q0Cdf");
  if (q0 < 0.0) return 0.0;
  const double shift = (ap.true_mu() == 0.0) ? 0.0 : ap.true_mu() / checked_sigma(ap, "Q0Cdf");
  return ROOT::Math::normal_cdf(std::sqrt(q0) - shift);
}

double Q0PValue(double q0, const AsymptoticParameters& ap) {
  check_q(q0, "Q0PValue");
  if (q0 < 0.0) return 1.0;
  const double shift = (ap.true_mu() == 0.0) ? 0.0 : ap.true_mu() / checked_sigma(ap, "Q0PValue");
  return ROOT::Math::normal_cdf_c(std::sqrt(q0) - shift);
}

double Q0Pdf(double q0, const AsymptoticParameters& ap) {
  if (q0 <= 0.0) return 0.0;
  const double shift = (ap.true_mu() == 0.0) ? 0.0 : ap.true_mu() / checked_sigma(ap, "Q0Pdf");
  const double r = std::sqrt(q0);
  return 0.5 * kInvSqrt2Pi / r * std::exp(-0.5 * (r - shift) * (r - shift));
}

// ---------------------------------------------------------------- q_mu (two-sided)

double QMuCdf(double q, const AsymptoticParameters& ap) {
  check_q(q, "QMuCdf");
  if (q < 0.0) return 0.0;
  if (is_central(ap)) return ROOT::Math::chisquared_cdf(q, 1.0);
  const double d = (ap.mu - ap.true_mu()) / checked_sigma(ap, "QMuCdf");
  const double r = std::sqrt(q);
  return ROOT::Math::normal_cdf(r + d) + ROOT::Math::normal_cdf(r - d) - 1.0;
}

double QMuPValue(double q, const AsymptoticParameters& ap) {
  check_q(q, "QMuPValue");
  if (q < 0.0) return 1.0;
  if (is_central(ap)) return ROOT::Math::chisquared_cdf_c(q, 1.0);
  const double d = (ap.mu - ap.true_mu()) / checked_sigma(ap, "QMuPValue");
  const double r = std::sqrt(q);
  return ROOT::Math::normal_cdf_c(r + d) + ROOT::Math::normal_cdf_c(r - d);
}

double QMuPdf(double q, const AsymptoticParameters& ap) {
  if (q <= 0.0) return 0.0;
  const double d = is_central(ap) ? 0.0 : (ap.mu - ap.true_mu()) / checked_sigma(ap, "QMuPdf");
  const double r = std::sqrt(q);
  return 0.5 * kInvSqrt2Pi / r *
         (std::exp(-0.5 * (r + d) * (r + d)) + std::exp(-0.5 * (r - d) * (r - d)));
}

// ---------------------------------------------------------------- q_tilde_mu

double QTildeMuCdf(double q, const AsymptoticParameters& ap) {
  return 1.0 - QTildeMuPValue(q, ap);
}

double QTildeMuPValue(double q, const AsymptoticParameters& ap) {
  check_q(q, "QTildeMuPValue");
  if (q < 0.0) return 1.0;
  if (ap.mu <= 0.0) throw std::invalid_argument("QTildeMuPValue: hypothesis mu must be > 0");
  const double sigma = checked_sigma(ap, "QTildeMuPValue");
  const double mup = ap.true_mu();
  const double edge = ap.mu * ap.mu / (sigma * sigma);

  if (q <= edge) {
    return ROOT::Math::normal_cdf_c(std::sqrt(q) - (ap.mu - mup) / sigma);
  }
  const double num = q - (ap.mu * ap.mu - 2.0 * ap.mu * mup) / (sigma * sigma);
  return ROOT::Math::normal_cdf_c(num / (2.0 * ap.mu / sigma));
}

double QTildeMuPdf(double q, const AsymptoticParameters& ap) {
  if (q <= 0.0) return 0.0;
  if (ap.mu <= 0.0) throw std::invalid_argument("QTildeMuPdf: hypothesis mu must be > 0");
  const double sigma = checked_sigma(ap, "QTildeMuPdf");
  const double mup = ap.true_mu();
  const double edge = ap.mu * ap.mu / (sigma * sigma);

  if (q <= edge) {
    const double r = std::sqrt(q);
    const double x = r - (ap.mu - mup) / sigma;
    return 0.5 * kInvSqrt2Pi / r * std::exp(-0.5 * x * x);
  }
  const double w = 2.0 * ap.mu / sigma;
  const double x = (q - (ap.mu * ap.mu - 2.0 * ap.mu * mup) / (sigma * sigma)) / w;
  return kInvSqrt2Pi / w * std::exp(-0.5 * x * x);
}

// ---------------------------------------------------------------- dispatch

double Cdf(TestStatisticKind kind, double q, const AsymptoticParameters& ap) {
  switch (kind) {
    case TestStatisticKind::Q0:       return Q0Cdf(q, ap);
    case TestStatisticKind::QMu:      return QMuCdf(q, ap);
    case TestStatisticKind::QTildeMu: return QTildeMuCdf(q, ap);
  }
  throw std::invalid_argument("asymptotics::Cdf: unknown kind");
}

double PValue(TestStatisticKind kind, double q, const AsymptoticParameters& ap) {
  switch (kind) {
    case TestStatisticKind::Q0:       return Q0PValue(q, ap);
    case TestStatisticKind::QMu:      return QMuPValue(q, ap);
    case TestStatisticKind::QTildeMu: return QTildeMuPValue(q, ap);
  }
  throw std::invalid_argument("asymptotics::PValue: unknown kind");
}

double Pdf(TestStatisticKind kind, double q, const AsymptoticParameters& ap) {
  switch (kind) {
    case TestStatisticKind::Q0:       return Q0Pdf(q, ap);
    case TestStatisticKind::QMu:      return QMuPdf(q, ap);
    case TestStatisticKind::QTildeMu: return QTildeMuPdf(q, ap);
  }
  throw std::invalid_argument("asymptotics::Pdf: unknown kind");
}

double Significance(double p) {
  if (!(p >= 0.0 && p <= 1.0)) throw std::invalid_argument("Significance: p must be in [0,1]");
  if (p == 0.0) return std::numeric_limits<double>::infinity();
  if (p == 1.0) return -std::numeric_limits<double>::infinity();
  return ROOT::Math::normal_quantile_c(p, 1.0);
}

double PValueFromSignificance(double z) {
  return ROOT::Math::normal_cdf_c(z);
}

double CriticalValue(TestStatisticKind kind, double alpha, const AsymptoticParameters& ap) {
  if (!(alpha > 0.0 && alpha < 1.0)) throw std::invalid_argument("CriticalValue: alpha must be in (0,1)");
  switch (kind) {
    case TestStatisticKind::Q0: {
      if (alpha >= 0.5) return 0.0;
      const double z = ROOT::Math::normal_quantile_c(alpha, 1.0);
      return z * z;
    }
    case TestStatisticKind::QMu:
      return ROOT::Math::chisquared_quantile_c(alpha, 1.0);
    case TestStatisticKind::QTildeMu: {
      if (alpha >= 0.5) return 0.0;
      const double sigma = checked_sigma(ap, "CriticalValue");
      const double z = ROOT::Math::normal_quantile_c(alpha, 1.0);
      const double edge = ap.mu * ap.mu / (sigma * sigma);
      if (z * z <= edge) return z * z;
      // q = z * 2mu/sigma - mu^2/sigma^2 solves the upper branch with mu' = mu
      return z * 2.0 * ap.mu / sigma - edge;
    }
  }
  throw std::invalid_argument("CriticalValue: unknown kind");
}

} // namespace poissonplr::stats::asymptotics
