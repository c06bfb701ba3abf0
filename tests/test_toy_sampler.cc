#include <gtest/gtest.h>

#include <atomic>
#include <cmath>
#include <memory>
#include <set>
#include <stdexcept>
#include <vector>

#include "poissonplr/core/Errors.hh"
#include "poissonplr/dataset/TemplateDataset.hh"
#include "poissonplr/fit/FitEngine.hh"
#include "poissonplr/fit/RootMathMinimizer.hh"
#include "poissonplr/stats/TestStatisticCalculator.hh"
#include "poissonplr/toys/ToySampler.hh"

using namespace poissonplr;
using namespace poissonplr::dataset;
using namespace poissonplr::stats;
using namespace poissonplr::toys;

namespace {

TemplateDataset FiveBin() {
  return TemplateDataset({1.0, 4.0, 8.0, 4.0, 1.0},
                         {BackgroundTemplate{"flat", {100.0, 100.0, 100.0, 100.0, 100.0}, false}});
}

std::shared_ptr<const TestStatisticCalculator> DefaultCalc() {
  return std::make_shared<const TestStatisticCalculator>();
}

ToyConfig Threads(int n) {
  ToyConfig c;
  c.n_threads = n;
  c.verbosity = 0;
  return c;
}

class AlwaysFails : public fit::IMinimizer {
public:
  fit::MinimizerOutcome Minimize(const Objective& fcn,
                                 const std::vector<fit::MinimizerVariable>& vars) const override {
    fit::MinimizerOutcome out;
    for (const auto& v : vars) out.x.push_back(v.start);
    out.fval = fcn(out.x.data());
    out.status = 3;
    return out;
  }
  std::string Name() const override { return "AlwaysFails"; }
};

// Minuit underneath; raises the cancel flag once `after_calls` fits have run.
class CancelAfter : public fit::IMinimizer {
public:
  CancelAfter(std::atomic<bool>* flag, int after_calls) : flag_(flag), after_(after_calls) {}

  fit::MinimizerOutcome Minimize(const Objective& fcn,
                                 const std::vector<fit::MinimizerVariable>& vars) const override {
    if (++calls_ >= after_) flag_->store(true);
    return inner_.Minimize(fcn, vars);
  }
  std::string Name() const override { return "CancelAfter"; }

private:
  fit::RootMathMinimizer inner_;
  std::atomic<bool>* flag_;
  int after_;
  mutable std::atomic<int> calls_{0};
};

} // namespace

TEST(ToySeeds, DerivedSeedsAreStableAndDistinct) {
  EXPECT_EQ(DeriveToySeed(12345, 7), DeriveToySeed(12345, 7));
  std::set<std::uint64_t> seen;
  for (long long i = 0; i < 1000; ++i) seen.insert(DeriveToySeed(12345, i));
  EXPECT_EQ(seen.size(), 1000u);
  EXPECT_NE(DeriveToySeed(12345, 0), DeriveToySeed(12346, 0));
}

TEST(ToySampler, SameSeedSameDistributionAcrossThreadCounts) {
  const auto tmpl = FiveBin();
  ToySampler serial(DefaultCalc(), Threads(1));
  ToySampler parallel(DefaultCalc(), Threads(4));

  const auto a = serial.Sample(tmpl, 2.0, 3.0, TestStatisticKind::QTildeMu, 40, 99);
  const auto b = parallel.Sample(tmpl, 2.0, 3.0, TestStatisticKind::QTildeMu, 40, 99);
  ASSERT_EQ(a.size(), 40u);
  ASSERT_EQ(a.size(), b.size());
  for (std::size_t i = 0; i < a.size(); ++i) {
    EXPECT_EQ(a.samples()[i].toy_index, static_cast<long long>(i));
    EXPECT_EQ(a.samples()[i].seed, b.samples()[i].seed);
    EXPECT_DOUBLE_EQ(a.samples()[i].q, b.samples()[i].q);
  }
  EXPECT_EQ(a.NRequested(), 40);
  EXPECT_EQ(a.NCompleted(), 40);
  EXPECT_EQ(a.NFailed(), 0);
  EXPECT_FALSE(a.Cancelled());
  EXPECT_DOUBLE_EQ(a.mu_true(), 2.0);
  EXPECT_DOUBLE_EQ(a.mu_hypothesis(), 3.0);
}

TEST(ToySampler, DifferentSeedDifferentDistribution) {
  const auto tmpl = FiveBin();
  ToySampler sampler(DefaultCalc(), Threads(1));
  const auto a = sampler.Sample(tmpl, 0.0, 3.0, TestStatisticKind::QMu, 20, 1);
  const auto b = sampler.Sample(tmpl, 0.0, 3.0, TestStatisticKind::QMu, 20, 2);
  EXPECT_NE(a.Values(), b.Values());
}

TEST(ToySampler, SingleToyIsReproducibleFromItsSeed) {
  const auto tmpl = FiveBin();
  auto calc = DefaultCalc();
  ToySampler sampler(calc, Threads(2));
  const auto dist = sampler.Sample(tmpl, 1.0, 0.0, TestStatisticKind::Q0, 10, 777);
  ASSERT_EQ(dist.size(), 10u);

  const auto& s = dist.samples()[6];
  EXPECT_EQ(s.seed, DeriveToySeed(777, 6));
  auto toy = tmpl.Clone();
  toy->FillPoisson(1.0, s.seed);
  toy->Parameters().at("mu").value = 1.0;
  EXPECT_NEAR(calc->Evaluate(*toy, 0.0, TestStatisticKind::Q0), s.q, 1e-6);
}

TEST(ToySampler, DiscoveryNullMatchesHalfChiSquare) {
  const auto tmpl = FiveBin();
  ToySampler sampler(DefaultCalc(), Threads(0));
  const auto dist = sampler.Sample(tmpl, 0.0, 0.0, TestStatisticKind::Q0, 1000, 2024);
  ASSERT_EQ(dist.size(), 1000u);
  // P(q0 >= 2.706) = 0.05 and P(q0 = 0) = 0.5 under the null
  EXPECT_NEAR(dist.Quantile(0.95), 2.706, 0.6);
  EXPECT_NEAR(dist.ZeroFraction(), 0.5, 0.06);
  EXPECT_NEAR(dist.TailFraction(2.706), 0.05, 0.025);
  for (double q : dist.Values()) EXPECT_GE(q, 0.0);
}

TEST(ToySampler, CancelledCampaignReportsPartialResult) {
  const auto tmpl = FiveBin();
  ToySampler sampler(DefaultCalc(), Threads(1));
  std::atomic<bool> cancel{true};
  const auto dist = sampler.Sample(tmpl, 0.0, 0.0, TestStatisticKind::Q0, 50, 5, &cancel);
  EXPECT_TRUE(dist.Cancelled());
  EXPECT_EQ(dist.NRequested(), 50);
  EXPECT_EQ(dist.NCompleted(), 0);
  EXPECT_TRUE(dist.empty());
}

TEST(ToySampler, CancelDuringCampaignKeepsCompletedToysInOrder) {
  const auto tmpl = FiveBin();

  // serial: q0 costs two fits per toy, so the flag goes up inside toy 9
  std::atomic<bool> cancel{false};
  auto calc = std::make_shared<const TestStatisticCalculator>(
      fit::FitEngine(std::make_shared<CancelAfter>(&cancel, 20)));
  const auto dist = ToySampler(calc, Threads(1)).Sample(tmpl, 0.0, 0.0, TestStatisticKind::Q0, 50, 5, &cancel);
  EXPECT_TRUE(dist.Cancelled());
  EXPECT_EQ(dist.NRequested(), 50);
  EXPECT_EQ(dist.NCompleted(), static_cast<long long>(dist.size()));
  ASSERT_GT(dist.size(), 0u);
  EXPECT_LT(dist.size(), 50u);
  for (std::size_t i = 0; i < dist.size(); ++i) {
    EXPECT_EQ(dist.samples()[i].toy_index, static_cast<long long>(i));
    EXPECT_EQ(dist.samples()[i].seed, DeriveToySeed(5, static_cast<long long>(i)));
  }

  // threaded: completed toys may have gaps but stay sorted by index
  std::atomic<bool> cancel_mt{false};
  auto calc_mt = std::make_shared<const TestStatisticCalculator>(
      fit::FitEngine(std::make_shared<CancelAfter>(&cancel_mt, 20)));
  const auto dist_mt = ToySampler(calc_mt, Threads(3)).Sample(tmpl, 0.0, 0.0, TestStatisticKind::Q0, 200, 5, &cancel_mt);
  EXPECT_TRUE(dist_mt.Cancelled());
  EXPECT_EQ(dist_mt.NCompleted(), static_cast<long long>(dist_mt.size()));
  EXPECT_LT(dist_mt.size(), 200u);
  for (std::size_t i = 1; i < dist_mt.size(); ++i) {
    EXPECT_LT(dist_mt.samples()[i - 1].toy_index, dist_mt.samples()[i].toy_index);
  }
}

TEST(ToySampler, TooManyFailuresRaiseCalibrationError) {
  const auto tmpl = FiveBin();
  auto calc = std::make_shared<const TestStatisticCalculator>(
      fit::FitEngine(std::make_shared<AlwaysFails>()));
  ToySampler sampler(calc, Threads(2));
  try {
    sampler.Sample(tmpl, 0.0, 1.0, TestStatisticKind::QMu, 20, 3);
    FAIL() << "expected CalibrationError";
  } catch (const CalibrationError& e) {
    EXPECT_EQ(e.n_failed(), 20);
    EXPECT_EQ(e.n_attempted(), 20);
  }
}

TEST(ToySampler, FailuresWithinThresholdAreCounted) {
  const auto tmpl = FiveBin();
  auto calc = std::make_shared<const TestStatisticCalculator>(
      fit::FitEngine(std::make_shared<AlwaysFails>()));
  ToyConfig cfg = Threads(1);
  cfg.max_failure_fraction = 1.0;
  ToySampler sampler(calc, cfg);
  const auto dist = sampler.Sample(tmpl, 0.0, 1.0, TestStatisticKind::QMu, 8, 3);
  EXPECT_TRUE(dist.empty());
  EXPECT_EQ(dist.NFailed(), 8);
  EXPECT_FALSE(dist.Cancelled());
}

TEST(ToySampler, RejectsBadArguments) {
  EXPECT_THROW(ToySampler(nullptr), std::invalid_argument);
  ToyConfig bad;
  bad.max_failure_fraction = 1.5;
  EXPECT_THROW(ToySampler(DefaultCalc(), bad), std::invalid_argument);

  const auto tmpl = FiveBin();
  ToySampler sampler(DefaultCalc(), Threads(1));
  EXPECT_THROW(sampler.Sample(tmpl, 0.0, 1.0, TestStatisticKind::Q0, 5, 1), std::invalid_argument);
  EXPECT_THROW(sampler.Sample(tmpl, 0.0, 0.0, TestStatisticKind::Q0, 0, 1), std::invalid_argument);
}

TEST(Distribution, QuantilesAndTails) {
  Distribution d(TestStatisticKind::QMu, 1.0, 0.0);
  for (int i = 0; i < 5; ++i) {
    TestStatisticSample s;
    s.q = static_cast<double>(i);  // 0 1 2 3 4
    s.mu_hypothesis = 1.0;
    s.toy_index = i;
    d.Append(s);
  }
  EXPECT_DOUBLE_EQ(d.Median(), 2.0);
  EXPECT_DOUBLE_EQ(d.Quantile(0.25), 1.0);
  EXPECT_DOUBLE_EQ(d.TailFraction(3.0), 0.4);
  EXPECT_DOUBLE_EQ(d.ZeroFraction(), 0.2);

  TestStatisticSample wrong;
  wrong.mu_hypothesis = 2.0;
  EXPECT_THROW(d.Append(wrong), std::invalid_argument);
}
