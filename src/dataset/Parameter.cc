#include "poissonplr/dataset/Parameter.hh"

#include <stdexcept>
#include <utility>

namespace poissonplr::dataset {

void ParameterSet::Add(Parameter p) {
  if (p.name.empty()) throw std::invalid_argument("ParameterSet::Add: empty parameter name");
  if (index_.count(p.name)) throw std::invalid_argument("ParameterSet::Add: duplicate parameter " + p.name);
  if (p.lo > p.hi) throw std::invalid_argument("ParameterSet::Add: lo > hi for " + p.name);
  if (p.step <= 0.0) p.step = 0.1;
  index_.emplace(p.name, pars_.size());
  pars_.push_back(std::move(p));
}

std::size_t ParameterSet::IndexOf(const std::string& name) const {
  auto it = index_.find(name);
  if (it == index_.end()) throw std::out_of_range("ParameterSet: unknown parameter " + name);
  return it->second;
}

std::vector<double> ParameterSet::Values() const {
  std::vector<double> v;
  v.reserve(pars_.size());
  for (const auto& p : pars_) v.push_back(p.value);
  return v;
}

std::vector<double> ParameterSet::Nominals() const {
  std::vector<double> v;
  v.reserve(pars_.size());
  for (const auto& p : pars_) v.push_back(p.nominal);
  return v;
}

std::vector<std::string> ParameterSet::Names() const {
  std::vector<std::string> v;
  v.reserve(pars_.size());
  for (const auto& p : pars_) v.push_back(p.name);
  return v;
}

void ParameterSet::SetValues(const std::vector<double>& values) {
  if (values.size() != pars_.size())
    throw std::invalid_argument("ParameterSet::SetValues: size mismatch");
  for (std::size_t i = 0; i < pars_.size(); ++i) pars_[i].value = values[i];
}

} // namespace poissonplr::dataset
