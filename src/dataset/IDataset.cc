#include "poissonplr/dataset/IDataset.hh"

#include <cmath>
#include <random>

#include "poissonplr/core/Errors.hh"
#include "poissonplr/stats/PoissonLikelihood.hh"

namespace poissonplr::dataset {

std::vector<double> IDataset::Expectation(const std::vector<double>& values) const {
  std::vector<double> lambda = Evaluate(values);
  for (std::size_t i = 0; i < lambda.size(); ++i) {
    if (!std::isfinite(lambda[i]) || lambda[i] < 0.0) {
      throw InvalidModelError(i, lambda[i], "dataset '" + Name() + "'");
    }
  }
  return lambda;
}

double IDataset::LogLikelihood(const std::vector<double>& counts,
                               const std::vector<double>& values) const {
  static const stats::PoissonLikelihood kernel;
  return kernel.EvaluateLogL(counts, Evaluate(values));
}

std::vector<double> IDataset::GenerationValues(double true_mu) const {
  std::vector<double> v = Parameters().Nominals();
  v.at(SignalIndex()) = true_mu;
  return v;
}

void IDataset::FillAsimov(double true_mu) {
  SetCounts(Expectation(GenerationValues(true_mu)));
}

void IDataset::FillPoisson(double true_mu, std::uint64_t seed) {
  const std::vector<double> lambda = Expectation(GenerationValues(true_mu));

  std::mt19937_64 rng(seed);
  std::vector<double> counts(lambda.size(), 0.0);
  for (std::size_t i = 0; i < lambda.size(); ++i) {
    if (lambda[i] <= 0.0) continue;
    std::poisson_distribution<long long> pois(lambda[i]);
    counts[i] = static_cast<double>(pois(rng));
  }
  SetCounts(std::move(counts));
}

} // namespace poissonplr::dataset
