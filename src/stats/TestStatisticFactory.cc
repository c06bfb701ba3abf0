#include "poissonplr/stats/TestStatisticFactory.hh"

#include <iostream>
#include <stdexcept>

#include "poissonplr/stats/ProfileLikelihoodStatistics.hh"

namespace poissonplr::stats {

std::unique_ptr<ITestStatistic> MakeTestStatistic(TestStatisticKind kind) {
  switch (kind) {
    case TestStatisticKind::QMu:      return std::make_unique<QMuStatistic>();
    case TestStatisticKind::Q0:       return std::make_unique<Q0Statistic>();
    case TestStatisticKind::QTildeMu: return std::make_unique<QTildeMuStatistic>();
  }
  throw std::invalid_argument("MakeTestStatistic: unknown kind");
}

std::unique_ptr<ITestStatistic>
MakeTestStatistic(const StatisticsConfig& cfg) {
  const TestStatisticKind kind = ParseTestStatisticKind(cfg.test_stat);
  if (cfg.verbosity > 0) {
    std::cout << "[stats] Using " << ToString(kind) << " test statistic (\"" << cfg.test_stat << "\")\n";
  }
  return MakeTestStatistic(kind);
}

} // namespace poissonplr::stats
