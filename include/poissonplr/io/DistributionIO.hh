#pragma once
#include <string>

#include "poissonplr/toys/Distribution.hh"

class TDirectory;

namespace poissonplr::io {

/// Persist a test-statistic distribution into a ROOT directory.
///
/// Layout under <dir>/<name>/:
///   samples          TTree (q, mu_hypothesis, mu_true, mu_hat, seed, toy_index)
///   test_stat        TNamed
///   mu_hypothesis, mu_true            TParameter<double>
///   n_requested, n_completed, n_failed TParameter<Long64_t>
///   cancelled        TParameter<int>
class DistributionIO {
public:
  static void Write(const toys::Distribution& dist, TDirectory& dir, const std::string& name);

  /// Opens `path` in UPDATE mode (creating it if needed).
  static void Write(const toys::Distribution& dist, const std::string& path, const std::string& name);

  /// Throws std::runtime_error if the directory or any key is missing.
  static toys::Distribution Read(TDirectory& dir, const std::string& name);
  static toys::Distribution Read(const std::string& path, const std::string& name);
};

} // namespace poissonplr::io
