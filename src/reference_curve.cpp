#include "reference_curve.h"

#include <algorithm>
#include <sstream>

#include "file_utils.h"
#include "string_utils.h"

bool ParseReferenceCurve(const std::string& content, ReferenceCurve* curve, std::string* error) {
  if (!curve) {
    if (error) {
      *error = "missing reference curve output";
    }
    return false;
  }
  ReferenceCurve parsed;
  std::istringstream in(content);
  std::string line;
  int line_no = 0;
  while (std::getline(in, line)) {
    ++line_no;
    const std::vector<std::string> fields = prtcal::SplitAny(line, ",;\t \r");
    if (fields.size() < 2) {
      continue;
    }
    double u = 0.0;
    double t = 0.0;
    if (!prtcal::ParseDouble(fields[0], &u) || !prtcal::ParseDouble(fields[1], &t)) {
      continue;
    }
    if (!parsed.u_norm.empty() && u < parsed.u_norm.back()) {
      if (error) {
        *error = "reference abscissa decreases at line " + std::to_string(line_no);
      }
      return false;
    }
    parsed.u_norm.push_back(u);
    parsed.t_norm.push_back(t);
  }
  if (parsed.empty()) {
    if (error) {
      *error = "reference dataset has no numeric rows";
    }
    return false;
  }
  *curve = std::move(parsed);
  return true;
}

bool LoadReferenceCurve(const std::filesystem::path& path, ReferenceCurve* curve, std::string* error) {
  std::string content;
  if (!ReadTextFile(path, &content, error)) {
    return false;
  }
  std::string parse_error;
  if (!ParseReferenceCurve(content, curve, &parse_error)) {
    if (error) {
      *error = path.string() + ": " + parse_error;
    }
    return false;
  }
  return true;
}

double InterpolateClamped(const ReferenceCurve& curve, double x) {
  const std::vector<double>& xs = curve.u_norm;
  const std::vector<double>& ys = curve.t_norm;
  if (xs.empty()) {
    return 0.0;
  }
  if (x <= xs.front()) {
    return ys.front();
  }
  if (x >= xs.back()) {
    return ys.back();
  }
  // First knot strictly greater than x; x lies in [xs[hi-1], xs[hi]).
  const size_t hi = static_cast<size_t>(std::upper_bound(xs.begin(), xs.end(), x) - xs.begin());
  const size_t lo = hi - 1;
  const double w = (x - xs[lo]) / (xs[hi] - xs[lo]);
  return ys[lo] + w * (ys[hi] - ys[lo]);
}
