#pragma once

#include <memory>
#include <utility>
#include <vector>

#include "poissonplr/dataset/IDataset.hh"
#include "poissonplr/limits/SignificanceCalculator.hh"
#include "poissonplr/stats/TestStatisticCalculator.hh"

namespace poissonplr::limits {

struct LimitConfig {
  double mu_max         = 1000.0; ///< give up bracketing beyond this
  double initial_step   = 1.0;    ///< first bracket width above mu_hat
  double tolerance      = 1e-4;   ///< absolute tolerance on mu
  int    max_iterations = 100;    ///< Brent iterations
  double min_asimov_q   = 1e-2;   ///< smallest q_mu,A trusted for the q_tilde_mu sigma
  int    verbosity      = 0;
};

struct LimitBands {
  double median   = 0.0;
  double minus1   = 0.0;
  double plus1    = 0.0;
  double minus2   = 0.0;
  double plus2    = 0.0;
  double sigma    = 0.0;   ///< Asimov sigma at the median limit
};

/**
 * Upper limits on the signal strength by monotone root finding of
 *
 *   p(mu) = p_value( q(mu) ) = 1 - CL
 *
 * over the hypothesis mu, with q evaluated by the TestStatisticCalculator
 * and p from the asymptotic formula of its kind (q_tilde_mu uses the
 * Asimov sigma). The bracket starts above mu_hat and doubles until p drops
 * below 1 - CL; Brent's method then refines the root.
 *
 * Close to mu = 0 the Asimov q_mu,A ~ (mu / sigma)^2 is below the fit
 * precision. Where it falls under min_asimov_q, sigma is taken at the
 * smallest doubled mu that reaches it.
 */
class LimitCalculator {
public:
  LimitCalculator(std::shared_ptr<const stats::TestStatisticCalculator> calc,
                  LimitConfig cfg = {});

  /// Limit for the counts of `data` (observed, toy or Asimov).
  double Limit(const dataset::IDataset& data, double confidence_level,
               stats::TestStatisticKind kind) const;

  /// Median expected limit: Limit on the background-only Asimov dataset.
  double ExpectedLimit(const dataset::IDataset& template_dataset, double confidence_level,
                       stats::TestStatisticKind kind) const;

  /// Median and +-1/+-2 sigma expected limits: median + N * sigma, floored at 0.
  LimitBands ExpectedLimitBands(const dataset::IDataset& template_dataset, double confidence_level,
                                stats::TestStatisticKind kind) const;

  /// q(mu) over a list of hypotheses on a working copy of `data`.
  std::vector<std::pair<double, double>> Scan(const dataset::IDataset& data,
                                              const std::vector<double>& mu_values,
                                              stats::TestStatisticKind kind) const;

  const LimitConfig& config() const noexcept { return cfg_; }

private:
  double asimov_sigma_(dataset::IDataset& asimov_bkg_only, double mu) const;

  std::shared_ptr<const stats::TestStatisticCalculator> calc_;
  SignificanceCalculator sig_;
  LimitConfig cfg_;
};

} // namespace poissonplr::limits
