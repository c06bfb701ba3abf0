#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "poissonplr/dataset/TemplateDataset.hh"
#include "poissonplr/experiment/ExperimentSetup.hh"
#include "poissonplr/fit/FitConfig.hh"
#include "poissonplr/limits/LimitCalculator.hh"
#include "poissonplr/stats/StatisticsConfig.hh"
#include "poissonplr/toys/ToySampler.hh"

namespace poissonplr::io {

struct RunHeader {
  std::string    label;
  std::string    outdir = ".";
  double         cl = 0.90;
  std::string    test_stat = "q_tilde_mu";
  experiment::ExperimentMode mode = experiment::ExperimentMode::Asimov;
  double         true_mu = 0.0;     ///< Asimov/toy generation
  uint64_t       rng_seed = 12345;  ///< single pseudo-experiment in toys mode
  int            verbosity = 1;
};

struct DatasetJSON {
  std::string templates;           ///< CSV path (see TemplateTable)
  dataset::TemplateDatasetConfig cfg;
  std::vector<std::string> frozen; ///< background names with fixed normalization
};

class ConfigManager {
public:
  explicit ConfigManager(std::string path);
  void parse();

  /// Parse from an in-memory document (used by tests and by parse()).
  void parse(const nlohmann::json& j);

  const RunHeader&          run()     const noexcept { return run_; }
  const DatasetJSON&        dataset() const noexcept { return dataset_; }
  const fit::FitConfig&     fit()     const noexcept { return fit_; }
  const toys::ToyConfig&    toys()    const noexcept { return toys_; }
  const limits::LimitConfig& limit()  const noexcept { return limit_; }

  bool has_toys() const noexcept { return has_toys_; }

  stats::StatisticsConfig statistics() const;
  experiment::ExperimentConfig experiment_cfg() const;

private:
  std::string         path_;
  RunHeader           run_;
  DatasetJSON         dataset_;
  fit::FitConfig      fit_;
  toys::ToyConfig     toys_;
  limits::LimitConfig limit_;
  double              bound_tolerance_ = 1e-4;
  double              floor_q_tolerance_ = 1e-4;
  bool                has_toys_ = false;

  void parse_run_(const nlohmann::json& j);
  void parse_dataset_(const nlohmann::json& j);
  void parse_fit_(const nlohmann::json& j);
  void parse_toys_(const nlohmann::json& j);
  void parse_limit_(const nlohmann::json& j);
  void validate_() const;
};

} // namespace poissonplr::io
