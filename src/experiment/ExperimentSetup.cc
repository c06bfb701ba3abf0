#include "poissonplr/experiment/ExperimentSetup.hh"
#include <numeric>
#include <stdexcept>
#include <utility>

#include "poissonplr/dataset/AsimovGenerator.hh"
#include "poissonplr/io/TemplateTable.hh"

namespace poissonplr::experiment {

std::string mode_to_string(ExperimentMode m) {
  switch (m) {
    case ExperimentMode::Observed: return "observed";
    case ExperimentMode::Asimov:   return "asimov";
    case ExperimentMode::Toys:     return "toys";
  }
  return "unknown";
}

ExperimentSetup::ExperimentSetup(ExperimentConfig cfg, uint64_t rng_seed)
  : cfg_(std::move(cfg)), rng_seed_(rng_seed)
{
  if (cfg_.templates.empty())
    throw std::invalid_argument("dataset.templates must name a CSV file");

  io::TemplateTable table;
  if (!table.LoadCSV(cfg_.templates))
    throw std::runtime_error("Failed to load templates '" + cfg_.templates + "': " + table.error());
  has_observed_ = table.has_observed();

  template_ = table.MakeDataset(cfg_.dataset, cfg_.frozen);

  switch (cfg_.mode) {
    case ExperimentMode::Observed:
      if (!has_observed_)
        throw std::invalid_argument("mode 'observed' needs an 'observed' column in " + cfg_.templates);
      data_ = template_->Clone();
      break;
    case ExperimentMode::Asimov:
      data_ = dataset::AsimovGenerator::Build(*template_, cfg_.true_mu);
      break;
    case ExperimentMode::Toys:
      data_ = template_->Clone();
      data_->FillPoisson(cfg_.true_mu, rng_seed_);
      break;
  }
}

ExperimentSummary ExperimentSetup::prepare_summary() const {
  ExperimentSummary s;
  s.n_bins = template_->NBins();
  s.signal_total = template_->SignalTotal();
  s.background_total = template_->BackgroundTotal();
  const auto& n = data_->Counts();
  s.data_total = std::accumulate(n.begin(), n.end(), 0.0);
  s.rng_seed_used = rng_seed_;
  s.mode_string = mode_to_string(cfg_.mode);
  for (const auto& b : template_->backgrounds()) s.backgrounds.push_back(b.name);
  return s;
}

} // namespace poissonplr::experiment
