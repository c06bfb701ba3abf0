#include "poissonplr/io/ConfigManager.hh"
#include <fstream>
#include <stdexcept>
#include <utility>

#include <nlohmann/json.hpp>

#include "poissonplr/stats/TestStatisticKind.hh"

namespace poissonplr::io {

ConfigManager::ConfigManager(std::string path) : path_(std::move(path)) {}

void ConfigManager::parse() {
  std::ifstream in(path_);
  if (!in) throw std::runtime_error("Cannot open config: " + path_);
  nlohmann::json j;
  in >> j;
  parse(j);
}

void ConfigManager::parse(const nlohmann::json& j) {
  parse_run_(j.at("run"));
  if (j.contains("dataset")) parse_dataset_(j.at("dataset"));
  if (j.contains("fit"))     parse_fit_(j.at("fit"));
  has_toys_ = j.contains("toys");
  if (has_toys_)             parse_toys_(j.at("toys"));
  if (j.contains("limit"))   parse_limit_(j.at("limit"));

  // verbosity from "run" unless a block overrides it
  if (!j.contains("fit") || !j.at("fit").contains("verbosity"))
    fit_.verbosity = run_.verbosity > 1 ? run_.verbosity - 1 : 0;
  if (!j.contains("toys") || !j.at("toys").contains("verbosity"))
    toys_.verbosity = run_.verbosity;
  if (!j.contains("limit") || !j.at("limit").contains("verbosity"))
    limit_.verbosity = run_.verbosity;

  validate_();
}

using experiment::ExperimentMode;

static ExperimentMode parse_mode(const std::string& s) {
  if (s == "observed") return ExperimentMode::Observed;
  if (s == "asimov")   return ExperimentMode::Asimov;
  if (s == "toys")     return ExperimentMode::Toys;
  throw std::invalid_argument("run.mode must be observed/asimov/toys");
}

void ConfigManager::parse_run_(const nlohmann::json& j) {
  run_.label     = j.value("label", std::string{});
  run_.outdir    = j.value("outdir", std::string("."));
  run_.cl        = j.value("cl", 0.90);
  run_.test_stat = j.value("test_stat", std::string("q_tilde_mu"));
  run_.mode      = parse_mode(j.value("mode", std::string("asimov")));
  run_.true_mu   = j.value("true_mu", 0.0);
  run_.rng_seed  = j.value("rng_seed", 12345ULL);
  run_.verbosity = j.value("verbosity", 1);
  bound_tolerance_ = j.value("bound_tolerance", 1e-4);
  floor_q_tolerance_ = j.value("floor_q_tolerance", 1e-4);
}

void ConfigManager::parse_dataset_(const nlohmann::json& j) {
  dataset_.templates = j.at("templates").get<std::string>();

  auto& c = dataset_.cfg;
  c.name = j.value("name", std::string("dataset"));
  if (j.contains("signal")) {
    const auto& js = j.at("signal");
    c.signal_parameter = js.value("parameter", std::string("mu"));
    c.mu_nominal = js.value("nominal", 0.0);
    c.mu_lo      = js.value("lo", 0.0);
    c.mu_hi      = js.value("hi", 1000.0);
    c.mu_step    = js.value("step", 0.1);
  }
  if (j.contains("background_norm")) {
    const auto& jb = j.at("background_norm");
    c.norm_lo   = jb.value("lo", 0.0);
    c.norm_hi   = jb.value("hi", 10.0);
    c.norm_step = jb.value("step", 0.01);
  }
  if (j.contains("frozen"))
    dataset_.frozen = j.at("frozen").get<std::vector<std::string>>();
}

void ConfigManager::parse_fit_(const nlohmann::json& j) {
  fit_.minimizer          = j.value("minimizer", std::string("Minuit2"));
  fit_.algorithm          = j.value("algorithm", std::string("Migrad"));
  fit_.tolerance          = j.value("tolerance", 0.01);
  fit_.max_function_calls = j.value("max_function_calls", 20000);
  fit_.max_iterations     = j.value("max_iterations", 10000);
  fit_.strategy           = j.value("strategy", 1);
  fit_.print_level        = j.value("print_level", -1);
  fit_.max_retries        = j.value("max_retries", 0);
  fit_.retry_spread       = j.value("retry_spread", 0.5);
  fit_.verbosity          = j.value("verbosity", 0);
}

void ConfigManager::parse_toys_(const nlohmann::json& j) {
  toys_.n_toys               = j.value("n_toys", 1000LL);
  toys_.base_seed            = j.value("base_seed", 12345ULL);
  toys_.hypothesis_mu        = j.value("hypothesis_mu", 0.0);
  toys_.n_threads            = j.value("n_threads", 0);
  toys_.max_failure_fraction = j.value("max_failure_fraction", 0.05);
  toys_.verbosity            = j.value("verbosity", 1);
}

void ConfigManager::parse_limit_(const nlohmann::json& j) {
  limit_.mu_max         = j.value("mu_max", 1000.0);
  limit_.initial_step   = j.value("initial_step", 1.0);
  limit_.tolerance      = j.value("tolerance", 1e-4);
  limit_.max_iterations = j.value("max_iterations", 100);
  limit_.min_asimov_q   = j.value("min_asimov_q", 1e-2);
  limit_.verbosity      = j.value("verbosity", 1);
}

void ConfigManager::validate_() const {
  if (!(run_.cl > 0.0 && run_.cl < 1.0))
    throw std::invalid_argument("run.cl must be in (0,1)");
  const auto kind = stats::ParseTestStatisticKind(run_.test_stat);  // throws on unknown names
  if (dataset_.cfg.mu_lo > dataset_.cfg.mu_hi)
    throw std::invalid_argument("dataset.signal.lo must be <= dataset.signal.hi");
  if (toys_.n_toys <= 0)
    throw std::invalid_argument("toys.n_toys must be > 0");
  if (toys_.n_threads < 0)
    throw std::invalid_argument("toys.n_threads must be >= 0");
  if (!(toys_.max_failure_fraction >= 0.0 && toys_.max_failure_fraction <= 1.0))
    throw std::invalid_argument("toys.max_failure_fraction must be in [0,1]");
  if (has_toys_ && kind == stats::TestStatisticKind::QTildeMu && toys_.hypothesis_mu <= 0.0)
    throw std::invalid_argument("toys.hypothesis_mu must be > 0 for q_tilde_mu");
  if (fit_.tolerance <= 0.0)
    throw std::invalid_argument("fit.tolerance must be > 0");
  if (fit_.max_retries < 0)
    throw std::invalid_argument("fit.max_retries must be >= 0");
  if (limit_.mu_max <= 0.0 || limit_.initial_step <= 0.0 || limit_.tolerance <= 0.0)
    throw std::invalid_argument("limit.mu_max, limit.initial_step and limit.tolerance must be > 0");
  if (limit_.min_asimov_q <= 0.0)
    throw std::invalid_argument("limit.min_asimov_q must be > 0");
}

stats::StatisticsConfig ConfigManager::statistics() const {
  stats::StatisticsConfig s;
  s.test_stat = run_.test_stat;
  s.cl = run_.cl;
  s.bound_tolerance = bound_tolerance_;
  s.floor_q_tolerance = floor_q_tolerance_;
  s.verbosity = run_.verbosity;
  return s;
}

experiment::ExperimentConfig ConfigManager::experiment_cfg() const {
  experiment::ExperimentConfig e;
  e.mode = run_.mode;
  e.templates = dataset_.templates;
  e.dataset = dataset_.cfg;
  e.frozen = dataset_.frozen;
  e.true_mu = run_.true_mu;
  return e;
}

} // namespace poissonplr::io
