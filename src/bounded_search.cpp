#include "bounded_search.h"

#include <cmath>
#include <limits>

namespace {

const double kGoldenMean = 0.5 * (3.0 - std::sqrt(5.0));
const double kSqrtEps = std::sqrt(2.2e-16);

// sign(v), with 0 mapped to +1.
double StepSign(double v) {
  return v < 0.0 ? -1.0 : 1.0;
}

}  // namespace

bool MinimizeScalarBounded(const ScalarObjective& objective,
                           const SearchOptions& options,
                           SearchResult* result,
                           std::string* error) {
  if (!objective) {
    if (error) {
      *error = "missing objective";
    }
    return false;
  }
  if (!std::isfinite(options.lower) || !std::isfinite(options.upper)) {
    if (error) {
      *error = "search bounds must be finite";
    }
    return false;
  }
  if (options.lower > options.upper) {
    if (error) {
      *error = "search lower bound exceeds upper bound";
    }
    return false;
  }
  if (!(options.xatol > 0.0) || !std::isfinite(options.xatol)) {
    if (error) {
      *error = "search xatol must be positive";
    }
    return false;
  }
  if (options.max_evaluations < 1) {
    if (error) {
      *error = "search budget must allow at least one evaluation";
    }
    return false;
  }

  double a = options.lower;
  double b = options.upper;
  double fulc = a + kGoldenMean * (b - a);
  double nfc = fulc;
  double xf = fulc;
  double rat = 0.0;
  double e = 0.0;
  double x = xf;
  double fx = objective(x);
  int num = 1;
  double fu = std::numeric_limits<double>::infinity();
  double ffulc = fx;
  double fnfc = fx;
  double xm = 0.5 * (a + b);
  double tol1 = kSqrtEps * std::fabs(xf) + options.xatol / 3.0;
  double tol2 = 2.0 * tol1;
  bool budget_hit = false;

  if (num >= options.max_evaluations && std::fabs(xf - xm) > (tol2 - 0.5 * (b - a))) {
    budget_hit = true;
  }

  while (!budget_hit && std::fabs(xf - xm) > (tol2 - 0.5 * (b - a))) {
    bool golden = true;
    if (std::fabs(e) > tol1) {
      golden = false;
      double r = (xf - nfc) * (fx - ffulc);
      double q = (xf - fulc) * (fx - fnfc);
      double p = (xf - fulc) * q - (xf - nfc) * r;
      q = 2.0 * (q - r);
      if (q > 0.0) {
        p = -p;
      }
      q = std::fabs(q);
      r = e;
      e = rat;

      if (std::fabs(p) < std::fabs(0.5 * q * r) && p > q * (a - xf) && p < q * (b - xf)) {
        rat = p / q;
        x = xf + rat;
        // Keep the parabolic step off the bounds.
        if ((x - a) < tol2 || (b - x) < tol2) {
          rat = tol1 * StepSign(xm - xf);
        }
      } else {
        golden = true;
      }
    }
    if (golden) {
      e = (xf >= xm) ? a - xf : b - xf;
      rat = kGoldenMean * e;
    }

    x = xf + StepSign(rat) * std::fmax(std::fabs(rat), tol1);
    fu = objective(x);
    ++num;

    if (fu <= fx) {
      if (x >= xf) {
        a = xf;
      } else {
        b = xf;
      }
      fulc = nfc;
      ffulc = fnfc;
      nfc = xf;
      fnfc = fx;
      xf = x;
      fx = fu;
    } else {
      if (x < xf) {
        a = x;
      } else {
        b = x;
      }
      if (fu <= fnfc || nfc == xf) {
        fulc = nfc;
        ffulc = fnfc;
        nfc = x;
        fnfc = fu;
      } else if (fu <= ffulc || fulc == xf || fulc == nfc) {
        fulc = x;
        ffulc = fu;
      }
    }

    xm = 0.5 * (a + b);
    tol1 = kSqrtEps * std::fabs(xf) + options.xatol / 3.0;
    tol2 = 2.0 * tol1;

    if (num >= options.max_evaluations) {
      budget_hit = std::fabs(xf - xm) > (tol2 - 0.5 * (b - a));
      break;
    }
  }

  SearchResult out;
  out.x = xf;
  out.fx = fx;
  out.evaluations = num;
  if (std::isnan(xf) || std::isnan(fx) || std::isnan(fu)) {
    out.converged = false;
    out.message = "objective returned NaN";
  } else if (budget_hit) {
    out.converged = false;
    out.message = "maximum number of evaluations reached";
  } else {
    out.converged = true;
    out.message = "solution found within xatol";
  }
  if (result) {
    *result = out;
  }
  return true;
}
