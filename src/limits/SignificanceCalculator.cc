#include "poissonplr/limits/SignificanceCalculator.hh"

#include <cmath>
#include <sstream>
#include <stdexcept>
#include <utility>

#include "poissonplr/core/Errors.hh"
#include "poissonplr/dataset/AsimovGenerator.hh"
#include "poissonplr/stats/Asymptotics.hh"

namespace poissonplr::limits {

SignificanceCalculator::SignificanceCalculator(std::shared_ptr<const stats::TestStatisticCalculator> calc)
  : calc_(std::move(calc))
{
  if (!calc_) throw std::invalid_argument("SignificanceCalculator: null calculator");
}

double SignificanceCalculator::PValue(double observed_q, const toys::Distribution& dist) {
  return dist.TailFraction(observed_q);
}

double SignificanceCalculator::PValue(double observed_q, stats::TestStatisticKind kind,
                                      const stats::AsymptoticParameters& ap) const {
  return calc_->Statistic(kind).AsymptoticPValue(observed_q, ap);
}

double SignificanceCalculator::Significance(double p) {
  return stats::asymptotics::Significance(p);
}

double SignificanceCalculator::Sigma(const dataset::IDataset& template_dataset, double mu) const {
  auto asimov = dataset::AsimovGenerator::Build(template_dataset, 0.0);
  return SigmaFromAsimov(*asimov, mu);
}

double SignificanceCalculator::SigmaFromAsimov(dataset::IDataset& asimov_bkg_only, double mu) const {
  if (mu == 0.0) throw std::invalid_argument("Sigma: undefined at mu = 0");
  const double q_a = calc_->Evaluate(asimov_bkg_only, mu, stats::TestStatisticKind::QMu);
  if (!(q_a > 0.0)) {
    std::ostringstream msg;
    msg << "Sigma: q_mu,A = " << q_a << " at mu=" << mu
        << ", background-only Asimov dataset '" << asimov_bkg_only.Name() << "' does not resolve mu";
    throw Error(msg.str());
  }
  return std::abs(mu) / std::sqrt(q_a);
}

double SignificanceCalculator::DiscoverySignificance(const dataset::IDataset& data) const {
  auto work = data.Clone();
  const double q0 = calc_->Evaluate(*work, 0.0, stats::TestStatisticKind::Q0);
  stats::AsymptoticParameters ap;
  ap.mu = 0.0;
  return Significance(PValue(q0, stats::TestStatisticKind::Q0, ap));
}

double SignificanceCalculator::ExpectedDiscoverySignificance(const dataset::IDataset& template_dataset,
                                                             double true_mu) const {
  auto asimov = dataset::AsimovGenerator::Build(template_dataset, true_mu);
  return DiscoverySignificance(*asimov);
}

double SignificanceCalculator::EmpiricalDiscoverySignificance(const dataset::IDataset& data,
                                                              const toys::Distribution& null_distribution) const {
  if (null_distribution.kind() != stats::TestStatisticKind::Q0 || null_distribution.mu_true() != 0.0)
    throw std::invalid_argument("EmpiricalDiscoverySignificance: need a q0 distribution generated at mu_true = 0");
  auto work = data.Clone();
  const double q0 = calc_->Evaluate(*work, 0.0, stats::TestStatisticKind::Q0);
  return Significance(PValue(q0, null_distribution));
}

} // namespace poissonplr::limits
