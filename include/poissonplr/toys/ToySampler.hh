#pragma once

#include <atomic>
#include <cstdint>
#include <memory>

#include "poissonplr/dataset/IDataset.hh"
#include "poissonplr/stats/TestStatisticCalculator.hh"
#include "poissonplr/toys/Distribution.hh"

namespace poissonplr::toys {

struct ToyConfig {
  long long     n_toys        = 1000;
  std::uint64_t base_seed     = 12345;
  double        hypothesis_mu = 0.0;
  int           n_threads     = 0;     ///< 0 = OpenMP default, 1 = serial
  double        max_failure_fraction = 0.05;
  int           verbosity     = 0;     ///< 0=silent, 1=summary, 2+=per-toy
};

/// Seed of toy `index`: SplitMix64 finalizer over the base seed and index.
std::uint64_t DeriveToySeed(std::uint64_t base_seed, long long index);

/**
 * Toy Monte Carlo campaign.
 *
 * For toy i: clone the template, Poisson-fill at true_mu with
 * DeriveToySeed(base_seed, i), evaluate the statistic at hypothesis_mu.
 * Toys share no mutable state and run on an OpenMP pool; samples are
 * stored in toy-index order, so the result does not depend on the number
 * of threads.
 *
 * Non-converged toys are counted and dropped; when their fraction exceeds
 * max_failure_fraction the campaign throws CalibrationError. Setting
 * *cancel stops the campaign between toys and returns what has completed.
 */
class ToySampler {
public:
  explicit ToySampler(std::shared_ptr<const stats::TestStatisticCalculator> calc,
                      ToyConfig cfg = {});

  Distribution Sample(const dataset::IDataset& template_dataset,
                      double true_mu,
                      double hypothesis_mu,
                      stats::TestStatisticKind kind,
                      long long n_toys,
                      std::uint64_t base_seed,
                      const std::atomic<bool>* cancel = nullptr) const;

  const ToyConfig& config() const noexcept { return cfg_; }

private:
  std::shared_ptr<const stats::TestStatisticCalculator> calc_;
  ToyConfig cfg_;
};

} // namespace poissonplr::toys
