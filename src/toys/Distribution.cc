#include "poissonplr/toys/Distribution.hh"

#include <TMath.h>

#include <algorithm>
#include <stdexcept>

namespace poissonplr::toys {

Distribution::Distribution(stats::TestStatisticKind kind, double mu_hypothesis, double mu_true)
  : kind_(kind), mu_hypothesis_(mu_hypothesis), mu_true_(mu_true) {}

void Distribution::Append(const TestStatisticSample& s) {
  if (s.mu_hypothesis != mu_hypothesis_ || s.mu_true != mu_true_)
    throw std::invalid_argument("Distribution::Append: sample hypothesis/true mu mismatch");
  samples_.push_back(s);
}

std::vector<double> Distribution::Values() const {
  std::vector<double> v;
  v.reserve(samples_.size());
  for (const auto& s : samples_) v.push_back(s.q);
  return v;
}

double Distribution::Quantile(double p) const {
  if (samples_.empty()) throw std::runtime_error("Distribution::Quantile: empty distribution");
  if (!(p >= 0.0 && p <= 1.0)) throw std::invalid_argument("Distribution::Quantile: p must be in [0,1]");

  std::vector<double> v = Values();
  std::sort(v.begin(), v.end());
  double prob = p;
  double q = 0.0;
  TMath::Quantiles(static_cast<Int_t>(v.size()), 1, v.data(), &q, &prob, kTRUE);
  return q;
}

double Distribution::TailFraction(double q_obs) const {
  if (samples_.empty()) throw std::runtime_error("Distribution::TailFraction: empty distribution");
  const auto n = std::count_if(samples_.begin(), samples_.end(),
                               [q_obs](const TestStatisticSample& s) { return s.q >= q_obs; });
  return static_cast<double>(n) / static_cast<double>(samples_.size());
}

double Distribution::ZeroFraction() const {
  if (samples_.empty()) return 0.0;
  const auto n = std::count_if(samples_.begin(), samples_.end(),
                               [](const TestStatisticSample& s) { return s.q == 0.0; });
  return static_cast<double>(n) / static_cast<double>(samples_.size());
}

void Distribution::SetBookkeeping(long long n_requested, long long n_completed,
                                  long long n_failed, bool cancelled) {
  n_requested_ = n_requested;
  n_completed_ = n_completed;
  n_failed_    = n_failed;
  cancelled_   = cancelled;
}

} // namespace poissonplr::toys
