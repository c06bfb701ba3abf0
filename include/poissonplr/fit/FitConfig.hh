#pragma once

#include <string>

namespace poissonplr::fit {

/**
 * Minimizer and fit-engine settings, from the JSON "fit" block.
 */
struct FitConfig {
  std::string minimizer = "Minuit2";   ///< ROOT::Math::Factory type
  std::string algorithm = "Migrad";
  double      tolerance = 0.01;        ///< EDM-based stopping tolerance
  int         max_function_calls = 20000;
  int         max_iterations     = 10000;
  int         strategy    = 1;
  int         print_level = -1;        ///< ROOT minimizer print level

  // Opt-in retries with perturbed starting values
  int    max_retries  = 0;
  double retry_spread = 0.5;           ///< perturbation in units of the parameter step

  int verbosity = 0;                   ///< 0=silent, 1=summary, 2+=debug
};

} // namespace poissonplr::fit
