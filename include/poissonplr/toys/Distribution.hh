#pragma once

#include <cstdint>
#include <vector>

#include "poissonplr/stats/TestStatisticKind.hh"

namespace poissonplr::toys {

struct TestStatisticSample {
  double        q             = 0.0;
  double        mu_hypothesis = 0.0;
  double        mu_true       = 0.0;
  double        mu_hat        = 0.0;
  std::uint64_t seed          = 0;
  long long     toy_index     = -1;  ///< -1 if not a toy
};

/**
 * Ordered collection of samples sharing hypothesis and true mu.
 *
 * Samples are kept in toy-index order. Campaign bookkeeping (requested,
 * completed, failed, cancelled) travels with the samples.
 */
class Distribution {
public:
  Distribution() = default;
  Distribution(stats::TestStatisticKind kind, double mu_hypothesis, double mu_true);

  /// Throws std::invalid_argument if mu_hypothesis/mu_true differ from the distribution's.
  void Append(const TestStatisticSample& s);

  stats::TestStatisticKind kind() const noexcept { return kind_; }
  double mu_hypothesis() const noexcept { return mu_hypothesis_; }
  double mu_true() const noexcept { return mu_true_; }

  const std::vector<TestStatisticSample>& samples() const noexcept { return samples_; }
  std::size_t size() const noexcept { return samples_.size(); }
  bool empty() const noexcept { return samples_.empty(); }

  std::vector<double> Values() const;

  /// Empirical quantile (Hyndman-Fan type 7) for p in [0,1].
  double Quantile(double p) const;
  double Median() const { return Quantile(0.5); }

  /// Fraction of samples with q >= q_obs.
  double TailFraction(double q_obs) const;

  /// Fraction of samples equal to zero.
  double ZeroFraction() const;

  // Campaign bookkeeping
  long long NRequested() const noexcept { return n_requested_; }
  long long NCompleted() const noexcept { return n_completed_; }
  long long NFailed() const noexcept { return n_failed_; }
  bool      Cancelled() const noexcept { return cancelled_; }

  void SetBookkeeping(long long n_requested, long long n_completed, long long n_failed, bool cancelled);

private:
  stats::TestStatisticKind kind_ = stats::TestStatisticKind::QMu;
  double mu_hypothesis_ = 0.0;
  double mu_true_       = 0.0;
  std::vector<TestStatisticSample> samples_;

  long long n_requested_ = 0;
  long long n_completed_ = 0;
  long long n_failed_    = 0;
  bool      cancelled_   = false;
};

} // namespace poissonplr::toys
