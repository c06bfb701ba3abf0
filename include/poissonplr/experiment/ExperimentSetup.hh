#pragma once
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "poissonplr/dataset/TemplateDataset.hh"

namespace poissonplr::experiment {

/// Which counts the drivers analyse.
enum class ExperimentMode { Observed, Asimov, Toys };

std::string mode_to_string(ExperimentMode m);

struct ExperimentConfig {
  ExperimentMode mode = ExperimentMode::Asimov;
  std::string    templates;                 ///< CSV path
  dataset::TemplateDatasetConfig dataset;
  std::vector<std::string> frozen;          ///< fixed background normalizations
  double         true_mu = 0.0;             ///< Asimov / pseudo-experiment signal
};

struct ExperimentSummary {
  std::size_t n_bins = 0;
  double      signal_total = 0.0;           ///< at mu = 1
  double      background_total = 0.0;       ///< at nominal norms
  double      data_total = 0.0;
  uint64_t    rng_seed_used = 0;
  std::string mode_string;
  std::vector<std::string> backgrounds;
};

/**
 * Loads the template table and prepares the two datasets the drivers need:
 *   - template: nominal model, counts from the table's observed column
 *     (or the nominal expectation when absent)
 *   - data: the counts to analyse, according to the mode
 *       observed  the template's counts (requires an observed column)
 *       asimov    Asimov counts at true_mu
 *       toys      one Poisson pseudo-experiment at true_mu with rng_seed
 */
class ExperimentSetup {
public:
  ExperimentSetup(ExperimentConfig cfg, uint64_t rng_seed);

  const dataset::TemplateDataset& template_dataset() const noexcept { return *template_; }
  const dataset::IDataset&        data() const noexcept { return *data_; }

  ExperimentSummary prepare_summary() const;

private:
  ExperimentConfig cfg_;
  uint64_t         rng_seed_;
  std::unique_ptr<dataset::TemplateDataset> template_;
  std::unique_ptr<dataset::IDataset>        data_;
  bool has_observed_ = false;
};

} // namespace poissonplr::experiment
