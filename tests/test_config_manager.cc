#include <gtest/gtest.h>

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include "poissonplr/experiment/ExperimentSetup.hh"
#include "poissonplr/io/ConfigManager.hh"
#include "poissonplr/io/TemplateTable.hh"

using namespace poissonplr;
using nlohmann::json;

namespace {

const std::string kExampleCsv = std::string(POISSONPLR_TEST_DATA_DIR) + "/example_templates.csv";

json MinimalConfig() {
  return json::parse(R"({
    "run": { "label": "unit", "mode": "asimov", "true_mu": 2.0 },
    "dataset": { "templates": "t.csv" }
  })");
}

} // namespace

TEST(ConfigManager, DefaultsFromMinimalDocument) {
  io::ConfigManager cfg("unused.json");
  cfg.parse(MinimalConfig());

  EXPECT_EQ(cfg.run().label, "unit");
  EXPECT_EQ(cfg.run().mode, experiment::ExperimentMode::Asimov);
  EXPECT_DOUBLE_EQ(cfg.run().true_mu, 2.0);
  EXPECT_DOUBLE_EQ(cfg.run().cl, 0.90);
  EXPECT_EQ(cfg.run().test_stat, "q_tilde_mu");
  EXPECT_EQ(cfg.dataset().templates, "t.csv");
  EXPECT_EQ(cfg.dataset().cfg.signal_parameter, "mu");
  EXPECT_DOUBLE_EQ(cfg.dataset().cfg.mu_lo, 0.0);
  EXPECT_EQ(cfg.fit().minimizer, "Minuit2");
  EXPECT_EQ(cfg.fit().algorithm, "Migrad");
  EXPECT_EQ(cfg.fit().max_retries, 0);
  EXPECT_FALSE(cfg.has_toys());
  EXPECT_EQ(cfg.toys().n_toys, 1000);
  EXPECT_DOUBLE_EQ(cfg.limit().mu_max, 1000.0);

  const auto st = cfg.statistics();
  EXPECT_EQ(st.test_stat, "q_tilde_mu");
  EXPECT_DOUBLE_EQ(st.bound_tolerance, 1e-4);
}

TEST(ConfigManager, ReadsAllBlocks) {
  json j = MinimalConfig();
  j["run"]["mode"] = "toys";
  j["run"]["test_stat"] = "q_mu";
  j["run"]["cl"] = 0.95;
  j["run"]["rng_seed"] = 99;
  j["dataset"]["signal"] = {{"lo", -5.0}, {"hi", 50.0}, {"nominal", 1.0}};
  j["dataset"]["background_norm"] = {{"lo", 0.5}, {"hi", 2.0}};
  j["dataset"]["frozen"] = {"flat"};
  j["fit"] = {{"tolerance", 0.001}, {"strategy", 2}, {"max_retries", 3}};
  j["toys"] = {{"n_toys", 250}, {"base_seed", 7}, {"hypothesis_mu", 1.5}, {"n_threads", 2}};
  j["limit"] = {{"mu_max", 20.0}, {"initial_step", 0.25}, {"min_asimov_q", 0.05}};

  io::ConfigManager cfg("unused.json");
  cfg.parse(j);

  EXPECT_EQ(cfg.run().mode, experiment::ExperimentMode::Toys);
  EXPECT_EQ(cfg.run().rng_seed, 99u);
  EXPECT_DOUBLE_EQ(cfg.dataset().cfg.mu_lo, -5.0);
  EXPECT_DOUBLE_EQ(cfg.dataset().cfg.mu_hi, 50.0);
  EXPECT_DOUBLE_EQ(cfg.dataset().cfg.mu_nominal, 1.0);
  EXPECT_DOUBLE_EQ(cfg.dataset().cfg.norm_lo, 0.5);
  ASSERT_EQ(cfg.dataset().frozen.size(), 1u);
  EXPECT_EQ(cfg.dataset().frozen[0], "flat");
  EXPECT_DOUBLE_EQ(cfg.fit().tolerance, 0.001);
  EXPECT_EQ(cfg.fit().strategy, 2);
  EXPECT_EQ(cfg.fit().max_retries, 3);
  EXPECT_TRUE(cfg.has_toys());
  EXPECT_EQ(cfg.toys().n_toys, 250);
  EXPECT_EQ(cfg.toys().base_seed, 7u);
  EXPECT_DOUBLE_EQ(cfg.toys().hypothesis_mu, 1.5);
  EXPECT_EQ(cfg.toys().n_threads, 2);
  EXPECT_DOUBLE_EQ(cfg.limit().mu_max, 20.0);
  EXPECT_DOUBLE_EQ(cfg.limit().initial_step, 0.25);
  EXPECT_DOUBLE_EQ(cfg.limit().min_asimov_q, 0.05);
  EXPECT_DOUBLE_EQ(cfg.statistics().cl, 0.95);

  const auto e = cfg.experiment_cfg();
  EXPECT_EQ(e.mode, experiment::ExperimentMode::Toys);
  EXPECT_EQ(e.templates, "t.csv");
  EXPECT_DOUBLE_EQ(e.true_mu, 2.0);
}

TEST(ConfigManager, RejectsInvalidValues) {
  io::ConfigManager cfg("unused.json");

  json bad_mode = MinimalConfig();
  bad_mode["run"]["mode"] = "replay";
  EXPECT_THROW(cfg.parse(bad_mode), std::invalid_argument);

  json bad_stat = MinimalConfig();
  bad_stat["run"]["test_stat"] = "cls";
  EXPECT_THROW(cfg.parse(bad_stat), std::invalid_argument);

  json bad_cl = MinimalConfig();
  bad_cl["run"]["cl"] = 1.0;
  EXPECT_THROW(cfg.parse(bad_cl), std::invalid_argument);

  json bad_toys = MinimalConfig();
  bad_toys["toys"] = {{"n_toys", 0}};
  EXPECT_THROW(cfg.parse(bad_toys), std::invalid_argument);

  json bad_limit = MinimalConfig();
  bad_limit["limit"] = {{"min_asimov_q", 0.0}};
  EXPECT_THROW(cfg.parse(bad_limit), std::invalid_argument);

  json no_run = json::parse(R"({ "dataset": { "templates": "t.csv" } })");
  EXPECT_THROW(cfg.parse(no_run), json::out_of_range);
}

TEST(ConfigManager, OneSidedToysNeedPositiveHypothesis) {
  io::ConfigManager cfg("unused.json");

  json j = MinimalConfig();  // test_stat defaults to q_tilde_mu
  j["toys"] = {{"n_toys", 10}};
  EXPECT_THROW(cfg.parse(j), std::invalid_argument);

  j["toys"]["hypothesis_mu"] = 1.0;
  EXPECT_NO_THROW(cfg.parse(j));

  json discovery = MinimalConfig();
  discovery["run"]["test_stat"] = "q0";
  discovery["toys"] = {{"n_toys", 10}};
  EXPECT_NO_THROW(cfg.parse(discovery));

  // without a toys block the hypothesis is never used
  EXPECT_NO_THROW(cfg.parse(MinimalConfig()));
}

TEST(ConfigManager, MissingFileThrows) {
  io::ConfigManager cfg("/nonexistent/poissonplr.json");
  EXPECT_THROW(cfg.parse(), std::runtime_error);
}

TEST(TemplateTable, ParsesCommaAndWhitespaceTables) {
  io::TemplateTable t;
  ASSERT_TRUE(t.Parse("# comment\n"
                      "signal, bkg_flat, bkg_tail, observed\n"
                      "1.0, 10, 2, 12\n"
                      "\n"
                      "   # indented comment\n"
                      "2.5,10,1,14\n")) << t.error();
  EXPECT_EQ(t.NBins(), 2u);
  ASSERT_EQ(t.background_names().size(), 2u);
  EXPECT_EQ(t.background_names()[1], "tail");
  EXPECT_DOUBLE_EQ(t.backgrounds()[1][0], 2.0);
  ASSERT_TRUE(t.has_observed());
  EXPECT_DOUBLE_EQ(t.observed()[1], 14.0);

  io::TemplateTable w;
  ASSERT_TRUE(w.Parse("signal bkg_only\n0.5 20\n1.5   30\n"));
  EXPECT_EQ(w.NBins(), 2u);
  EXPECT_FALSE(w.has_observed());
  EXPECT_DOUBLE_EQ(w.backgrounds()[0][1], 30.0);
}

TEST(TemplateTable, ReportsMalformedTables) {
  io::TemplateTable t;
  EXPECT_FALSE(t.Parse(""));
  EXPECT_FALSE(t.Parse("bkg_a\n1\n"));                       // no signal column
  EXPECT_FALSE(t.Parse("signal\n1\n"));                      // no background
  EXPECT_FALSE(t.Parse("signal,bkg_a,extra\n1,2,3\n"));      // unknown column
  EXPECT_FALSE(t.Parse("signal,bkg_a\n1,2\n3\n"));           // short row
  EXPECT_FALSE(t.Parse("signal,bkg_a\n1,abc\n"));            // not a number
  EXPECT_FALSE(t.Parse("signal,bkg_a\n"));                   // header only
  EXPECT_FALSE(t.error().empty());
  EXPECT_EQ(t.NBins(), 0u);
  EXPECT_FALSE(t.LoadCSV("/nonexistent/templates.csv"));
}

TEST(TemplateTable, BuildsDatasetWithFrozenBackgrounds) {
  io::TemplateTable t;
  ASSERT_TRUE(t.LoadCSV(kExampleCsv)) << t.error();
  EXPECT_EQ(t.NBins(), 10u);

  dataset::TemplateDatasetConfig dc;
  auto ds = t.MakeDataset(dc, {"flat"});
  EXPECT_TRUE(ds->Parameters().at("norm_flat").frozen);
  EXPECT_FALSE(ds->Parameters().at("norm_falling").frozen);
  EXPECT_DOUBLE_EQ(ds->Counts()[0], 52.0);

  EXPECT_THROW(t.MakeDataset(dc, {"nope"}), std::invalid_argument);
}

TEST(ExperimentSetup, PreparesDataPerMode) {
  experiment::ExperimentConfig ec;
  ec.templates = kExampleCsv;
  ec.true_mu = 1.0;

  ec.mode = experiment::ExperimentMode::Observed;
  experiment::ExperimentSetup obs(ec, 1);
  EXPECT_DOUBLE_EQ(obs.data().Counts()[0], 52.0);
  const auto sum = obs.prepare_summary();
  EXPECT_EQ(sum.n_bins, 10u);
  EXPECT_EQ(sum.mode_string, "observed");
  ASSERT_EQ(sum.backgrounds.size(), 2u);

  ec.mode = experiment::ExperimentMode::Asimov;
  experiment::ExperimentSetup asimov(ec, 1);
  const auto& tmpl = asimov.template_dataset();
  EXPECT_NEAR(asimov.data().Counts()[4],
              tmpl.signal()[4] + tmpl.backgrounds()[0].counts[4] + tmpl.backgrounds()[1].counts[4], 1e-12);

  ec.mode = experiment::ExperimentMode::Toys;
  experiment::ExperimentSetup toy_a(ec, 42);
  experiment::ExperimentSetup toy_b(ec, 42);
  EXPECT_EQ(toy_a.data().Counts(), toy_b.data().Counts());
}

TEST(ExperimentSetup, ObservedModeNeedsObservedColumn) {
  const auto path = (std::filesystem::temp_directory_path() / "poissonplr_no_observed.csv").string();
  {
    std::ofstream out(path);
    out << "signal,bkg_a\n1,10\n2,10\n";
  }
  experiment::ExperimentConfig ec;
  ec.templates = path;
  ec.mode = experiment::ExperimentMode::Observed;
  EXPECT_THROW(experiment::ExperimentSetup(ec, 1), std::invalid_argument);

  ec.mode = experiment::ExperimentMode::Asimov;
  EXPECT_NO_THROW(experiment::ExperimentSetup(ec, 1));
  std::remove(path.c_str());

  ec.templates = "/nonexistent/templates.csv";
  EXPECT_THROW(experiment::ExperimentSetup(ec, 1), std::runtime_error);
}
