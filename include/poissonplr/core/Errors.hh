#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

namespace poissonplr {

/// Base of all domain errors raised by the statistics engine.
class Error : public std::runtime_error {
public:
  explicit Error(const std::string& what) : std::runtime_error(what) {}
};

/// Expected counts negative or non-finite in some bin.
class InvalidModelError : public Error {
public:
  InvalidModelError(std::size_t bin, double value, const std::string& context);

  std::size_t bin() const noexcept { return bin_; }
  double value() const noexcept { return value_; }

private:
  std::size_t bin_;
  double      value_;
};

/// Minimizer did not converge. Carries the parameter values at failure.
class FitConvergenceError : public Error {
public:
  FitConvergenceError(const std::string& context,
                      std::vector<std::string> names,
                      std::vector<double> values,
                      int status);

  const std::vector<std::string>& names() const noexcept { return names_; }
  const std::vector<double>& values() const noexcept { return values_; }
  int status() const noexcept { return status_; }

private:
  std::vector<std::string> names_;
  std::vector<double>      values_;
  int                      status_;
};

/// Too many toys failed to converge for the campaign to be trusted.
class CalibrationError : public Error {
public:
  CalibrationError(long long n_failed, long long n_attempted, double threshold);

  long long n_failed() const noexcept { return n_failed_; }
  long long n_attempted() const noexcept { return n_attempted_; }

private:
  long long n_failed_;
  long long n_attempted_;
};

/// Limit search bracket does not contain a sign change.
class NoRootFoundError : public Error {
public:
  NoRootFoundError(double lo, double hi, double f_lo, double f_hi);

  double lo() const noexcept { return lo_; }
  double hi() const noexcept { return hi_; }

private:
  double lo_, hi_;
};

} // namespace poissonplr
