#include "poissonplr/dataset/AsimovGenerator.hh"

namespace poissonplr::dataset {

std::unique_ptr<IDataset> AsimovGenerator::Build(const IDataset& template_dataset, double true_mu) {
  auto asimov = template_dataset.Clone();
  asimov->FillAsimov(true_mu);
  // start the fits from the generating point
  asimov->Parameters().SetValues(asimov->Parameters().Nominals());
  asimov->Parameters().at(asimov->SignalIndex()).value = true_mu;
  return asimov;
}

} // namespace poissonplr::dataset
