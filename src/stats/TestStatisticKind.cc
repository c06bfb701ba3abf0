#include "poissonplr/stats/TestStatisticKind.hh"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace poissonplr::stats {

namespace {

std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

} // namespace

std::string ToString(TestStatisticKind kind) {
  switch (kind) {
    case TestStatisticKind::QMu:      return "q_mu";
    case TestStatisticKind::Q0:       return "q0";
    case TestStatisticKind::QTildeMu: return "q_tilde_mu";
  }
  return "unknown";
}

TestStatisticKind ParseTestStatisticKind(const std::string& name) {
  const std::string n = to_lower(name);
  if (n == "q_mu" || n == "qmu") return TestStatisticKind::QMu;
  if (n == "q0" || n == "q_0") return TestStatisticKind::Q0;
  if (n == "q_tilde_mu" || n == "qtildemu" || n == "qtilde_mu") return TestStatisticKind::QTildeMu;
  throw std::invalid_argument("unknown test statistic \"" + name +
                              "\" (expected q_mu, q0 or q_tilde_mu)");
}

} // namespace poissonplr::stats
