#include "poissonplr/core/Errors.hh"

#include <sstream>
#include <utility>

namespace poissonplr {

namespace {

std::string format_params(const std::vector<std::string>& names,
                          const std::vector<double>& values) {
  std::ostringstream ss;
  ss << "{";
  for (std::size_t i = 0; i < values.size(); ++i) {
    if (i > 0) ss << ", ";
    ss << (i < names.size() ? names[i] : "p" + std::to_string(i)) << "=" << values[i];
  }
  ss << "}";
  return ss.str();
}

std::string invalid_model_message(std::size_t bin, double value, const std::string& context) {
  std::ostringstream ss;
  ss << "InvalidModelError: " << context << ": expected counts in bin " << bin
     << " is " << value << " (must be finite and >= 0)";
  return ss.str();
}

std::string convergence_message(const std::string& context,
                                const std::vector<std::string>& names,
                                const std::vector<double>& values,
                                int status) {
  std::ostringstream ss;
  ss << "FitConvergenceError: " << context << ": minimizer status " << status
     << " at parameters " << format_params(names, values);
  return ss.str();
}

std::string calibration_message(long long n_failed, long long n_attempted, double threshold) {
  std::ostringstream ss;
  ss << "CalibrationError: " << n_failed << " of " << n_attempted
     << " toys failed to converge (allowed fraction " << threshold << ")";
  return ss.str();
}

std::string no_root_message(double lo, double hi, double f_lo, double f_hi) {
  std::ostringstream ss;
  ss << "NoRootFoundError: no sign change of p(mu) - alpha in [" << lo << ", " << hi
     << "] (f(lo)=" << f_lo << ", f(hi)=" << f_hi << ")";
  return ss.str();
}

} // namespace

InvalidModelError::InvalidModelError(std::size_t bin, double value, const std::string& context)
  : Error(invalid_model_message(bin, value, context)), bin_(bin), value_(value) {}

FitConvergenceError::FitConvergenceError(const std::string& context,
                                         std::vector<std::string> names,
                                         std::vector<double> values,
                                         int status)
  : Error(convergence_message(context, names, values, status)),
    names_(std::move(names)), values_(std::move(values)), status_(status) {}

CalibrationError::CalibrationError(long long n_failed, long long n_attempted, double threshold)
  : Error(calibration_message(n_failed, n_attempted, threshold)),
    n_failed_(n_failed), n_attempted_(n_attempted) {}

NoRootFoundError::NoRootFoundError(double lo, double hi, double f_lo, double f_hi)
  : Error(no_root_message(lo, hi, f_lo, f_hi)), lo_(lo), hi_(hi) {}

} // namespace poissonplr
