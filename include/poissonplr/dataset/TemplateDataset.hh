#pragma once

#include <memory>
#include <string>
#include <vector>

#include "poissonplr/dataset/IDataset.hh"

class TH1D;

namespace poissonplr::dataset {

struct BackgroundTemplate {
  std::string         name;     ///< parameter becomes "norm_<name>"
  std::vector<double> counts;   ///< expected counts per bin at norm = 1
  bool                frozen = false;
};

struct TemplateDatasetConfig {
  std::string name = "dataset";

  // Signal strength
  std::string signal_parameter = "mu";
  double mu_nominal = 0.0;
  double mu_lo      = 0.0;
  double mu_hi      = 1000.0;
  double mu_step    = 0.1;

  // Background normalizations
  double norm_lo   = 0.0;
  double norm_hi   = 10.0;
  double norm_step = 0.01;
};

/**
 * Binned dataset with a linear template model:
 *
 *   lambda_i = mu * s_i + sum_k norm_k * b_ki
 *
 * s is the signal expectation at mu = 1, b_k the background
 * expectations at norm_k = 1. Counts start as the nominal expectation
 * unless observed counts are supplied.
 */
class TemplateDataset : public IDataset {
public:
  TemplateDataset(std::vector<double> signal,
                  std::vector<BackgroundTemplate> backgrounds,
                  TemplateDatasetConfig cfg = {});

  TemplateDataset(std::vector<double> signal,
                  std::vector<BackgroundTemplate> backgrounds,
                  std::vector<double> observed,
                  TemplateDatasetConfig cfg = {});

  /// Bins 1..N of each histogram; under/overflow are ignored.
  static std::unique_ptr<TemplateDataset>
  FromHistograms(const TH1D& signal,
                 const std::vector<std::pair<std::string, const TH1D*>>& backgrounds,
                 const TH1D* observed = nullptr,
                 TemplateDatasetConfig cfg = {});

  std::size_t NBins() const override { return signal_.size(); }
  std::string Name() const override { return cfg_.name; }

  std::vector<double> Evaluate(const std::vector<double>& values) const override;

  std::unique_ptr<IDataset> Clone() const override;

  const std::vector<double>& Counts() const override { return counts_; }
  void SetCounts(std::vector<double> counts) override;

  ParameterSet&       Parameters() override { return pars_; }
  const ParameterSet& Parameters() const override { return pars_; }

  const std::string& SignalParameter() const override { return cfg_.signal_parameter; }

  const std::vector<double>& signal() const noexcept { return signal_; }
  const std::vector<BackgroundTemplate>& backgrounds() const noexcept { return backgrounds_; }

  /// Expected signal / background totals at nominal parameter values.
  double SignalTotal() const;
  double BackgroundTotal() const;

private:
  void build_parameters_();

  TemplateDatasetConfig           cfg_;
  std::vector<double>             signal_;
  std::vector<BackgroundTemplate> backgrounds_;
  std::vector<double>             counts_;
  ParameterSet                    pars_;
  std::vector<std::size_t>        norm_index_;
  std::size_t                     mu_index_ = 0;
};

} // namespace poissonplr::dataset
