#ifndef REFERENCE_CURVE_H
#define REFERENCE_CURVE_H

#include <filesystem>
#include <string>
#include <vector>

// Reference (u/u_inf, T/T_inf) pairs, non-decreasing in the abscissa.
struct ReferenceCurve {
  std::vector<double> u_norm;
  std::vector<double> t_norm;

  size_t size() const { return u_norm.size(); }
  bool empty() const { return u_norm.empty(); }
};

// First two numeric fields of each line; lines without two numbers (headers,
// comments) are skipped. Fails on an empty or unsorted curve.
bool ParseReferenceCurve(const std::string& content, ReferenceCurve* curve, std::string* error);
bool LoadReferenceCurve(const std::filesystem::path& path, ReferenceCurve* curve, std::string* error);

// Piecewise-linear interpolation, clamped to the end ordinates outside the range.
double InterpolateClamped(const ReferenceCurve& curve, double x);

#endif  // REFERENCE_CURVE_H
