#pragma once

#include "poissonplr/stats/TestStatisticKind.hh"

namespace poissonplr::stats::asymptotics {

// Asymptotic distributions of the profile-likelihood statistics
// (Cowan, Cranmer, Gross, Vitells, Eur. Phys. J. C 71 (2011) 1554).
// CDFs include the point mass at q = 0; PDFs return the continuous part.

double Q0Cdf(double q0, const AsymptoticParameters& ap);
double Q0PValue(double q0, const AsymptoticParameters& ap);
double Q0Pdf(double q0, const AsymptoticParameters& ap);

double QMuCdf(double q, const AsymptoticParameters& ap);
double QMuPValue(double q, const AsymptoticParameters& ap);
double QMuPdf(double q, const AsymptoticParameters& ap);

double QTildeMuCdf(double q, const AsymptoticParameters& ap);
double QTildeMuPValue(double q, const AsymptoticParameters& ap);
double QTildeMuPdf(double q, const AsymptoticParameters& ap);

double Cdf(TestStatisticKind kind, double q, const AsymptoticParameters& ap);
double PValue(TestStatisticKind kind, double q, const AsymptoticParameters& ap);
double Pdf(TestStatisticKind kind, double q, const AsymptoticParameters& ap);

/// One-sided Gaussian significance: z with P(Z > z) = p.
double Significance(double p);

/// Inverse of Significance.
double PValueFromSignificance(double z);

/// Critical value of q with asymptotic p-value alpha under the central
/// distribution (mu_true == mu). For q_tilde_mu it uses ap.sigma.
double CriticalValue(TestStatisticKind kind, double alpha, const AsymptoticParameters& ap);

} // namespace poissonplr::stats::asymptotics
