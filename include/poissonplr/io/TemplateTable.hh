#pragma once
#include <memory>
#include <string>
#include <vector>

#include "poissonplr/dataset/TemplateDataset.hh"

namespace poissonplr::io {

/// Per-bin templates read from a CSV file.
///
/// One header row names the columns; comments (#) and blank lines are
/// ignored. Fields are separated by commas or whitespace. Recognised
/// columns: "signal" (required), "bkg_<name>" (one per background,
/// at least one) and "observed" (optional).
class TemplateTable {
public:
  TemplateTable() = default;

  /// Returns true on success. On failure the table is empty and
  /// error() describes the first problem found.
  bool LoadCSV(const std::string& path);

  /// Same grammar as LoadCSV, from an in-memory string.
  bool Parse(const std::string& text);

  std::size_t NBins() const noexcept { return signal_.size(); }
  const std::vector<double>& signal() const noexcept { return signal_; }
  const std::vector<std::string>& background_names() const noexcept { return bkg_names_; }
  const std::vector<std::vector<double>>& backgrounds() const noexcept { return bkg_; }
  bool has_observed() const noexcept { return !observed_.empty(); }
  const std::vector<double>& observed() const noexcept { return observed_; }
  const std::string& error() const noexcept { return error_; }

  /// Backgrounds named in `frozen` keep their normalization fixed.
  /// Observed counts are used when present, else the nominal expectation.
  /// Throws std::invalid_argument for an unknown frozen name.
  std::unique_ptr<dataset::TemplateDataset>
  MakeDataset(const dataset::TemplateDatasetConfig& cfg,
              const std::vector<std::string>& frozen = {}) const;

private:
  bool fail_(const std::string& msg);

  std::vector<double>              signal_;
  std::vector<std::string>         bkg_names_;
  std::vector<std::vector<double>> bkg_;
  std::vector<double>              observed_;
  std::string                      error_;
};

} // namespace poissonplr::io
