#pragma once

#include <functional>
#include <limits>
#include <string>
#include <vector>

namespace poissonplr::fit {

struct MinimizerVariable {
  std::string name;
  double start = 0.0;
  double step  = 0.1;
  double lo    = -std::numeric_limits<double>::infinity();
  double hi    =  std::numeric_limits<double>::infinity();
  bool   fixed = false;
};

struct MinimizerOutcome {
  bool                converged = false;
  int                 status    = -1;
  double              fval      = 0.0;
  std::vector<double> x;
};

/**
 * Bounded multivariate minimization strategy used by the FitEngine.
 *
 * Implementations must keep every free variable inside [lo, hi] during the
 * search, not clip the final point.
 */
class IMinimizer {
public:
  using Objective = std::function<double(const double*)>;

  virtual ~IMinimizer() = default;

  virtual MinimizerOutcome Minimize(const Objective& fcn,
                                    const std::vector<MinimizerVariable>& vars) const = 0;

  virtual std::string Name() const = 0;
};

} // namespace poissonplr::fit
