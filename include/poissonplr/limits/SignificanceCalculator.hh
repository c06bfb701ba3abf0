#pragma once

#include <memory>

#include "poissonplr/dataset/IDataset.hh"
#include "poissonplr/stats/TestStatisticCalculator.hh"
#include "poissonplr/toys/Distribution.hh"

namespace poissonplr::limits {

/**
 * p-values and Gaussian significances, from toy distributions or from the
 * asymptotic formulae.
 */
class SignificanceCalculator {
public:
  explicit SignificanceCalculator(std::shared_ptr<const stats::TestStatisticCalculator> calc);

  /// Fraction of toys with q >= observed_q.
  static double PValue(double observed_q, const toys::Distribution& dist);

  /// Asymptotic survival function of the given kind.
  double PValue(double observed_q, stats::TestStatisticKind kind,
                const stats::AsymptoticParameters& ap) const;

  /// One-sided Gaussian-equivalent significance of p.
  static double Significance(double p);

  /// Asimov standard deviation of mu_hat at hypothesis mu:
  ///   sigma = |mu| / sqrt(q_mu,A),  q_mu,A on the background-only Asimov
  /// dataset built from template_dataset. Throws poissonplr::Error when
  /// q_mu,A comes out as 0 (no sensitivity, or mu too small for the fit).
  double Sigma(const dataset::IDataset& template_dataset, double mu) const;

  /// Same, with the background-only Asimov dataset already built.
  double SigmaFromAsimov(dataset::IDataset& asimov_bkg_only, double mu) const;

  /// Z from q0 evaluated on `data` (a working copy is fitted).
  double DiscoverySignificance(const dataset::IDataset& data) const;

  /// Median expected Z for signal strength true_mu (Asimov).
  double ExpectedDiscoverySignificance(const dataset::IDataset& template_dataset,
                                       double true_mu) const;

  /// Z from q0 on `data` with the p-value taken from a toy distribution of q0.
  double EmpiricalDiscoverySignificance(const dataset::IDataset& data,
                                        const toys::Distribution& null_distribution) const;

  const stats::TestStatisticCalculator& calculator() const noexcept { return *calc_; }

private:
  std::shared_ptr<const stats::TestStatisticCalculator> calc_;
};

} // namespace poissonplr::limits
