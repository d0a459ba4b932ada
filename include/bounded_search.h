// Derivative-free bounded scalar minimization (Brent's bounded method).
#ifndef BOUNDED_SEARCH_H
#define BOUNDED_SEARCH_H

#include <functional>
#include <string>

struct SearchOptions {
  double lower = 0.0;
  double upper = 1.0;
  double xatol = 1e-5;       // absolute tolerance on x
  int max_evaluations = 500; // includes the initial golden-section point
};

struct SearchResult {
  double x = 0.0;        // best point found by the search
  double fx = 0.0;
  int evaluations = 0;
  bool converged = false;
  std::string message;
};

using ScalarObjective = std::function<double(double)>;

// Golden-section search with parabolic interpolation on [lower, upper]. The
// objective is called exactly `result->evaluations` times, never more than
// max_evaluations. Returns false (with `error`) for invalid options only; a
// budget stop or a non-finite objective value is reported through
// `converged` and `message`.
bool MinimizeScalarBounded(const ScalarObjective& objective,
                           const SearchOptions& options,
                           SearchResult* result,
                           std::string* error);

#endif  // BOUNDED_SEARCH_H
