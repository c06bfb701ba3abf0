#include <gtest/gtest.h>

#include <cmath>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "poissonplr/dataset/TemplateDataset.hh"
#include "poissonplr/fit/FitEngine.hh"
#include "poissonplr/fit/RootMathMinimizer.hh"

using namespace poissonplr;
using namespace poissonplr::dataset;
using namespace poissonplr::fit;

namespace {

FitConfig PreciseConfig() {
  FitConfig c;
  c.tolerance = 1e-4;
  return c;
}

// Minimizer that fails a given number of times, then hands over to Minuit2.
class ScriptedMinimizer : public IMinimizer {
public:
  ScriptedMinimizer(int n_failures, FitConfig cfg)
    : n_failures_(n_failures), real_(std::move(cfg)) {}

  MinimizerOutcome Minimize(const Objective& fcn,
                            const std::vector<MinimizerVariable>& vars) const override {
    std::vector<double> starts;
    for (const auto& v : vars) starts.push_back(v.start);
    starts_.push_back(starts);

    if (static_cast<int>(starts_.size()) <= n_failures_) {
      MinimizerOutcome out;
      out.converged = false;
      out.status = 4;
      out.x = starts;
      out.fval = fcn(out.x.data());
      return out;
    }
    return real_.Minimize(fcn, vars);
  }
  std::string Name() const override { return "Scripted"; }

  mutable std::vector<std::vector<double>> starts_;

private:
  int n_failures_;
  RootMathMinimizer real_;
};

TemplateDataset SingleBin(double s, double b, double n) {
  return TemplateDataset({s}, {BackgroundTemplate{"b", {b}, true}}, std::vector<double>{n});
}

} // namespace

TEST(FitEngine, SingleBinAnalyticMaximum) {
  auto ds = SingleBin(5.0, 10.0, 25.0);
  FitEngine engine(PreciseConfig());
  const auto r = engine.Fit(ds);
  ASSERT_TRUE(r.converged);
  EXPECT_NEAR(r.mu_hat(), 3.0, 1e-3);
  EXPECT_NEAR(ds.Parameters().at("mu").value, r.mu_hat(), 1e-12);
  // frozen normalization untouched
  EXPECT_DOUBLE_EQ(ds.Parameters().at("norm_b").value, 1.0);
  EXPECT_NEAR(r.loglike, ds.LogLikelihood(), 1e-9);
}

TEST(FitEngine, ProfilesBackgroundNormalization) {
  TemplateDataset ds({0.0, 10.0}, {BackgroundTemplate{"b", {100.0, 10.0}, false}},
                     std::vector<double>{150.0, 40.0});
  FitEngine engine(PreciseConfig());
  const auto r = engine.Fit(ds);
  ASSERT_TRUE(r.converged);
  EXPECT_NEAR(r.values[0], 2.5, 2e-3);
  EXPECT_NEAR(r.values[1], 1.5, 2e-4);
  EXPECT_EQ(r.names, (std::vector<std::string>{"mu", "norm_b"}));
  EXPECT_FALSE(r.fixed_mu.has_value());
}

TEST(FitEngine, FixedSignalStrength) {
  TemplateDataset ds({0.0, 10.0}, {BackgroundTemplate{"b", {100.0, 10.0}, false}},
                     std::vector<double>{150.0, 40.0});
  FitEngine engine(PreciseConfig());
  const auto free_fit = engine.Fit(ds);
  const auto fixed_fit = engine.Fit(ds, 1.0);
  ASSERT_TRUE(free_fit.converged);
  ASSERT_TRUE(fixed_fit.converged);
  EXPECT_DOUBLE_EQ(fixed_fit.mu_hat(), 1.0);
  EXPECT_LE(fixed_fit.loglike, free_fit.loglike + 1e-9);
  // the profiled normalization absorbs part of the missing signal
  EXPECT_GT(fixed_fit.values[1], 1.5);
  ASSERT_TRUE(fixed_fit.fixed_mu.has_value());
  EXPECT_DOUBLE_EQ(*fixed_fit.fixed_mu, 1.0);
}

TEST(FitEngine, RespectsLowerBound) {
  // deficit: the unbounded maximum would be negative
  auto ds = SingleBin(5.0, 20.0, 10.0);
  FitEngine engine(PreciseConfig());
  const auto r = engine.Fit(ds);
  ASSERT_TRUE(r.converged);
  EXPECT_GE(r.mu_hat(), 0.0);
  EXPECT_LT(r.mu_hat(), 1e-3);
}

TEST(FitEngine, AllParametersFixedEvaluatesDirectly) {
  auto ds = SingleBin(5.0, 10.0, 25.0);
  FitEngine engine;
  const auto r = engine.Fit(ds, 2.0);
  ASSERT_TRUE(r.converged);
  EXPECT_DOUBLE_EQ(r.mu_hat(), 2.0);
  EXPECT_NEAR(r.loglike, ds.LogLikelihood(ds.Counts(), {2.0, 1.0}), 1e-12);
}

TEST(FitEngine, FailureRestoresParameters) {
  TemplateDataset ds({0.0, 10.0}, {BackgroundTemplate{"b", {100.0, 10.0}, false}},
                     std::vector<double>{150.0, 40.0});
  ds.Parameters().at("mu").value = 0.7;
  FitConfig cfg;
  cfg.max_retries = 2;
  auto m = std::make_shared<ScriptedMinimizer>(100, cfg);
  FitEngine engine(m, cfg);
  const auto r = engine.Fit(ds);
  EXPECT_FALSE(r.converged);
  EXPECT_EQ(r.attempts, 3);
  EXPECT_EQ(r.status, 4);
  EXPECT_DOUBLE_EQ(ds.Parameters().at("mu").value, 0.7);
  EXPECT_DOUBLE_EQ(ds.Parameters().at("norm_b").value, 1.0);
}

TEST(FitEngine, RetriesFromPerturbedStart) {
  TemplateDataset ds({0.0, 10.0}, {BackgroundTemplate{"b", {100.0, 10.0}, false}},
                     std::vector<double>{150.0, 40.0});
  FitConfig cfg = PreciseConfig();
  cfg.max_retries = 3;
  auto m = std::make_shared<ScriptedMinimizer>(2, cfg);
  FitEngine engine(m, cfg);
  const auto r = engine.Fit(ds);
  ASSERT_TRUE(r.converged);
  EXPECT_EQ(r.attempts, 3);
  ASSERT_EQ(m->starts_.size(), 3u);
  EXPECT_NE(m->starts_[0], m->starts_[1]);
  EXPECT_NE(m->starts_[1], m->starts_[2]);
  EXPECT_NEAR(r.values[0], 2.5, 2e-3);
}

TEST(FitEngine, RetriesAreOptIn) {
  auto ds = SingleBin(5.0, 10.0, 25.0);
  auto m = std::make_shared<ScriptedMinimizer>(1, FitConfig{});
  FitEngine engine(m, FitConfig{});
  const auto r = engine.Fit(ds);
  EXPECT_FALSE(r.converged);
  EXPECT_EQ(r.attempts, 1);
}

TEST(FitEngine, RejectsBadConfiguration) {
  FitConfig cfg;
  cfg.max_retries = -1;
  EXPECT_THROW(FitEngine{cfg}, std::invalid_argument);
  EXPECT_THROW(FitEngine(nullptr, FitConfig{}), std::invalid_argument);
  FitConfig bad_tol;
  bad_tol.tolerance = 0.0;
  EXPECT_THROW(RootMathMinimizer{bad_tol}, std::invalid_argument);
}
