#pragma once

#include <cstddef>
#include <limits>
#include <map>
#include <string>
#include <vector>

namespace poissonplr::dataset {

struct Parameter {
  std::string name;
  double value   = 0.0;
  double nominal = 0.0;   ///< reference value used for Asimov/toy generation
  double lo      = -std::numeric_limits<double>::infinity();
  double hi      =  std::numeric_limits<double>::infinity();
  double step    = 0.1;   ///< initial step handed to the minimizer
  bool   frozen  = false; ///< never fitted

  bool has_lower() const { return lo > -std::numeric_limits<double>::infinity(); }
};

/**
 * Ordered name -> Parameter mapping.
 *
 * Order is insertion order and defines the layout of the value vectors
 * passed around by the dataset and the fit engine.
 */
class ParameterSet {
public:
  /// Throws std::invalid_argument on duplicate name or lo > hi.
  void Add(Parameter p);

  std::size_t size() const noexcept { return pars_.size(); }
  bool contains(const std::string& name) const { return index_.count(name) > 0; }

  /// Throws std::out_of_range for an unknown name.
  std::size_t IndexOf(const std::string& name) const;

  Parameter&       at(std::size_t i)       { return pars_.at(i); }
  const Parameter& at(std::size_t i) const { return pars_.at(i); }
  Parameter&       at(const std::string& name)       { return pars_.at(IndexOf(name)); }
  const Parameter& at(const std::string& name) const { return pars_.at(IndexOf(name)); }

  std::vector<double>      Values() const;
  std::vector<double>      Nominals() const;
  std::vector<std::string> Names() const;

  /// Sets all values; size must match.
  void SetValues(const std::vector<double>& values);

  std::vector<Parameter>::const_iterator begin() const { return pars_.begin(); }
  std::vector<Parameter>::const_iterator end() const { return pars_.end(); }

private:
  std::vector<Parameter>             pars_;
  std::map<std::string, std::size_t> index_;
};

} // namespace poissonplr::dataset
