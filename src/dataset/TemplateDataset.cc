#include "poissonplr/dataset/TemplateDataset.hh"

#include <TH1D.h>

#include <cmath>
#include <numeric>
#include <stdexcept>
#include <utility>

namespace poissonplr::dataset {

namespace {

std::vector<double> hist_contents(const TH1D& h) {
  const int nb = h.GetNbinsX();
  std::vector<double> v(static_cast<std::size_t>(nb));
  for (int b = 1; b <= nb; ++b) v[static_cast<std::size_t>(b - 1)] = h.GetBinContent(b);
  return v;
}

void check_template(const std::vector<double>& t, std::size_t nbins, const std::string& what) {
  if (t.size() != nbins)
    throw std::invalid_argument("TemplateDataset: " + what + " has " + std::to_string(t.size()) +
                                " bins, expected " + std::to_string(nbins));
  for (double x : t) {
    if (!std::isfinite(x) || x < 0.0)
      throw std::invalid_argument("TemplateDataset: " + what + " has a negative or non-finite bin");
  }
}

} // namespace

TemplateDataset::TemplateDataset(std::vector<double> signal,
                                 std::vector<BackgroundTemplate> backgrounds,
                                 TemplateDatasetConfig cfg)
  : cfg_(std::move(cfg)), signal_(std::move(signal)), backgrounds_(std::move(backgrounds))
{
  if (signal_.empty()) throw std::invalid_argument("TemplateDataset: empty signal template");
  check_template(signal_, signal_.size(), "signal template");
  for (const auto& b : backgrounds_) check_template(b.counts, signal_.size(), "background '" + b.name + "'");
  build_parameters_();
  counts_ = Expectation(pars_.Nominals());
}

TemplateDataset::TemplateDataset(std::vector<double> signal,
                                 std::vector<BackgroundTemplate> backgrounds,
                                 std::vector<double> observed,
                                 TemplateDatasetConfig cfg)
  : TemplateDataset(std::move(signal), std::move(backgrounds), std::move(cfg))
{
  SetCounts(std::move(observed));
}

std::unique_ptr<TemplateDataset>
TemplateDataset::FromHistograms(const TH1D& signal,
                                const std::vector<std::pair<std::string, const TH1D*>>& backgrounds,
                                const TH1D* observed,
                                TemplateDatasetConfig cfg) {
  std::vector<BackgroundTemplate> bkgs;
  for (const auto& [name, h] : backgrounds) {
    if (!h) throw std::invalid_argument("TemplateDataset::FromHistograms: null histogram for " + name);
    if (h->GetNbinsX() != signal.GetNbinsX())
      throw std::invalid_argument("TemplateDataset::FromHistograms: binning mismatch for " + name);
    bkgs.push_back(BackgroundTemplate{name, hist_contents(*h), false});
  }
  if (observed) {
    if (observed->GetNbinsX() != signal.GetNbinsX())
      throw std::invalid_argument("TemplateDataset::FromHistograms: binning mismatch for observed");
    return std::make_unique<TemplateDataset>(hist_contents(signal), std::move(bkgs),
                                             hist_contents(*observed), std::move(cfg));
  }
  return std::make_unique<TemplateDataset>(hist_contents(signal), std::move(bkgs), std::move(cfg));
}

void TemplateDataset::build_parameters_() {
  Parameter mu;
  mu.name    = cfg_.signal_parameter;
  mu.value   = cfg_.mu_nominal;
  mu.nominal = cfg_.mu_nominal;
  mu.lo      = cfg_.mu_lo;
  mu.hi      = cfg_.mu_hi;
  mu.step    = cfg_.mu_step;
  mu_index_ = pars_.size();
  pars_.Add(mu);

  norm_index_.clear();
  for (const auto& b : backgrounds_) {
    Parameter p;
    p.name    = "norm_" + b.name;
    p.value   = 1.0;
    p.nominal = 1.0;
    p.lo      = cfg_.norm_lo;
    p.hi      = cfg_.norm_hi;
    p.step    = cfg_.norm_step;
    p.frozen  = b.frozen;
    norm_index_.push_back(pars_.size());
    pars_.Add(p);
  }
}

std::vector<double> TemplateDataset::Evaluate(const std::vector<double>& values) const {
  if (values.size() != pars_.size())
    throw std::invalid_argument("TemplateDataset::Evaluate: parameter vector size mismatch");

  const double mu = values[mu_index_];
  std::vector<double> lambda(signal_.size());
  for (std::size_t i = 0; i < signal_.size(); ++i) lambda[i] = mu * signal_[i];

  for (std::size_t k = 0; k < backgrounds_.size(); ++k) {
    const double norm = values[norm_index_[k]];
    const auto& b = backgrounds_[k].counts;
    for (std::size_t i = 0; i < b.size(); ++i) lambda[i] += norm * b[i];
  }
  return lambda;
}

std::unique_ptr<IDataset> TemplateDataset::Clone() const {
  return std::make_unique<TemplateDataset>(*this);
}

void TemplateDataset::SetCounts(std::vector<double> counts) {
  if (counts.size() != signal_.size())
    throw std::invalid_argument("TemplateDataset::SetCounts: size mismatch");
  for (double c : counts) {
    if (!std::isfinite(c) || c < 0.0)
      throw std::invalid_argument("TemplateDataset::SetCounts: counts must be finite and >= 0");
  }
  counts_ = std::move(counts);
}

double TemplateDataset::SignalTotal() const {
  return std::accumulate(signal_.begin(), signal_.end(), 0.0);
}

double TemplateDataset::BackgroundTotal() const {
  double s = 0.0;
  for (const auto& b : backgrounds_) s += std::accumulate(b.counts.begin(), b.counts.end(), 0.0);
  return s;
}

} // namespace poissonplr::dataset
