#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "poissonplr/dataset/Parameter.hh"

namespace poissonplr::dataset {

/**
 * Capability interface for a binned Poisson counting dataset.
 *
 * Any concrete counts container can satisfy it:
 *  - Evaluate(values)     : raw model expectation per bin (no checks)
 *  - Expectation(values)  : same, but throws InvalidModelError when a bin is
 *                           negative or non-finite
 *  - LogLikelihood        : Poisson ln L of counts against the expectation
 *  - Clone                : deep copy (independent counts and parameters)
 *  - FillAsimov/Poisson   : overwrite counts from the model at a given true
 *                           signal strength, nuisances at nominal values
 *
 * Generation never leaves parameter values mutated. Only the fit engine
 * changes parameter values.
 */
class IDataset {
public:
  virtual ~IDataset() = default;

  virtual std::size_t NBins() const = 0;
  virtual std::string Name() const = 0;

  virtual std::vector<double> Evaluate(const std::vector<double>& values) const = 0;

  virtual std::unique_ptr<IDataset> Clone() const = 0;

  virtual const std::vector<double>& Counts() const = 0;
  virtual void SetCounts(std::vector<double> counts) = 0;

  virtual ParameterSet&       Parameters() = 0;
  virtual const ParameterSet& Parameters() const = 0;

  /// Name of the signal-strength parameter inside Parameters().
  virtual const std::string& SignalParameter() const = 0;

  std::vector<double> Expectation(const std::vector<double>& values) const;
  std::vector<double> Expectation() const { return Expectation(Parameters().Values()); }

  virtual double LogLikelihood(const std::vector<double>& counts,
                               const std::vector<double>& values) const;
  double LogLikelihood() const { return LogLikelihood(Counts(), Parameters().Values()); }

  virtual void FillAsimov(double true_mu);
  virtual void FillPoisson(double true_mu, std::uint64_t seed);

  std::size_t SignalIndex() const { return Parameters().IndexOf(SignalParameter()); }

protected:
  /// Nominal parameter vector with the signal strength replaced by true_mu.
  std::vector<double> GenerationValues(double true_mu) const;
};

} // namespace poissonplr::dataset
