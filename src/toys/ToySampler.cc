#include "poissonplr/toys/ToySampler.hh"

#include <TROOT.h>
#include <omp.h>

#include <exception>
#include <iostream>
#include <stdexcept>
#include <utility>
#include <vector>

#include "poissonplr/core/Errors.hh"

namespace poissonplr::toys {

namespace {

enum ToyState : char { kPending = 0, kDone = 1, kFailed = 2 };

std::uint64_t splitmix64(std::uint64_t x) {
  x += 0x9E3779B97F4A7C15ULL;
  x = (x ^ (x >> 30)) * 0xBF58476D1CE4E5B9ULL;
  x = (x ^ (x >> 27)) * 0x94D049BB133111EBULL;
  return x ^ (x >> 31);
}

} // namespace

std::uint64_t DeriveToySeed(std::uint64_t base_seed, long long index) {
  return splitmix64(splitmix64(base_seed) ^ static_cast<std::uint64_t>(index));
}

ToySampler::ToySampler(std::shared_ptr<const stats::TestStatisticCalculator> calc, ToyConfig cfg)
  : calc_(std::move(calc)), cfg_(std::move(cfg))
{
  if (!calc_) throw std::invalid_argument("ToySampler: null calculator");
  if (cfg_.n_threads < 0) throw std::invalid_argument("toys.n_threads must be >= 0");
  if (!(cfg_.max_failure_fraction >= 0.0 && cfg_.max_failure_fraction <= 1.0))
    throw std::invalid_argument("toys.max_failure_fraction must be in [0,1]");
}

Distribution ToySampler::Sample(const dataset::IDataset& template_dataset,
                                double true_mu,
                                double hypothesis_mu,
                                stats::TestStatisticKind kind,
                                long long n_toys,
                                std::uint64_t base_seed,
                                const std::atomic<bool>* cancel) const {
  if (n_toys <= 0) throw std::invalid_argument("ToySampler::Sample: n_toys must be > 0");

  const int n_threads = cfg_.n_threads > 0 ? cfg_.n_threads : omp_get_max_threads();
  if (n_threads > 1) ROOT::EnableThreadSafety();

  if (cfg_.verbosity > 0) {
    std::cout << "[toys] " << n_toys << " toys of " << stats::ToString(kind)
              << " (mu_true=" << true_mu << ", mu_test=" << hypothesis_mu
              << ", seed=" << base_seed << ", threads=" << n_threads << ")\n";
  }

  std::vector<TestStatisticSample> results(static_cast<std::size_t>(n_toys));
  std::vector<char> state(static_cast<std::size_t>(n_toys), kPending);
  std::exception_ptr first_error;
  std::atomic<bool> abort{false};

  #pragma omp parallel for schedule(dynamic) num_threads(n_threads)
  for (long long i = 0; i < n_toys; ++i) {
    if (abort.load() || (cancel && cancel->load())) continue;

    const std::size_t k = static_cast<std::size_t>(i);
    const std::uint64_t seed = DeriveToySeed(base_seed, i);
    try {
      auto toy = template_dataset.Clone();
      toy->FillPoisson(true_mu, seed);
      auto& pars = toy->Parameters();
      pars.SetValues(pars.Nominals());
      pars.at(toy->SignalIndex()).value = true_mu;

      const auto r = calc_->EvaluateDetailed(*toy, hypothesis_mu, kind);

      TestStatisticSample& s = results[k];
      s.q = r.q;
      s.mu_hypothesis = hypothesis_mu;
      s.mu_true = true_mu;
      s.mu_hat = r.mu_hat;
      s.seed = seed;
      s.toy_index = i;
      state[k] = kDone;
    } catch (const FitConvergenceError& e) {
      state[k] = kFailed;
      if (cfg_.verbosity > 1) {
        #pragma omp critical(toys_log)
        std::cerr << "[toys] WARNING: toy " << i << " (seed " << seed << ") excluded: " << e.what() << "\n";
      }
    } catch (...) {
      #pragma omp critical(toys_error)
      {
        if (!first_error) first_error = std::current_exception();
      }
      abort.store(true);
    }
  }

  if (first_error) std::rethrow_exception(first_error);

  Distribution dist(kind, hypothesis_mu, true_mu);
  long long n_done = 0, n_failed = 0;
  for (std::size_t k = 0; k < state.size(); ++k) {
    if (state[k] == kDone) {
      dist.Append(results[k]);
      ++n_done;
    } else if (state[k] == kFailed) {
      ++n_failed;
    }
  }
  const bool cancelled = (n_done + n_failed) < n_toys;
  dist.SetBookkeeping(n_toys, n_done, n_failed, cancelled);

  if (cfg_.verbosity > 0) {
    std::cout << "[toys] completed " << n_done << ", failed " << n_failed
              << (cancelled ? " (cancelled)" : "") << "\n";
  }

  const long long attempted = n_done + n_failed;
  if (attempted > 0 &&
      static_cast<double>(n_failed) / static_cast<double>(attempted) > cfg_.max_failure_fraction) {
    throw CalibrationError(n_failed, attempted, cfg_.max_failure_fraction);
  }
  return dist;
}

} // namespace poissonplr::toys
