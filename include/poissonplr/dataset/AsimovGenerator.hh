#pragma once

#include <memory>

#include "poissonplr/dataset/IDataset.hh"

namespace poissonplr::dataset {

// Asimov dataset: counts equal to the model expectation at true_mu, nuisances
// at nominal. Evaluating a statistic on it gives the median expected value.
class AsimovGenerator {
public:
  static std::unique_ptr<IDataset> Build(const IDataset& template_dataset, double true_mu);
};

} // namespace poissonplr::dataset
