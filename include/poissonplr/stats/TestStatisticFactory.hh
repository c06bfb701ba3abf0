#pragma once

#include <memory>
#include <string>

#include "poissonplr/stats/ITestStatistic.hh"
#include "poissonplr/stats/StatisticsConfig.hh"

namespace poissonplr::stats {

std::unique_ptr<ITestStatistic> MakeTestStatistic(TestStatisticKind kind);

/**
 * Create the test statistic named by cfg.test_stat (case-insensitive):
 *   "q_mu" | "qmu"             -> QMuStatistic
 *   "q0"                       -> Q0Statistic
 *   "q_tilde_mu" | "qtildemu"  -> QTildeMuStatistic
 * Unknown names throw std::invalid_argument.
 */
std::unique_ptr<ITestStatistic> MakeTestStatistic(const StatisticsConfig& cfg);

} // namespace poissonplr::stats
