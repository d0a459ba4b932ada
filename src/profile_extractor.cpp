#include "profile_extractor.h"

#include <algorithm>
#include <cmath>
#include <iterator>
#include <sstream>

bool InStationWindow(double x, const StationWindow& window) {
  const double lo = window.station - window.tolerance;
  const double hi = window.station + window.tolerance;
  if (window.inclusive) {
    return x >= lo && x <= hi;
  }
  return x > lo && x < hi;
}

bool ExtractProfile(const ResultTable& table,
                    const StationWindow& window,
                    const FreestreamScales& scales,
                    ProfileSlice* slice,
                    std::string* error) {
  if (!slice) {
    if (error) {
      *error = "missing slice output";
    }
    return false;
  }
  *slice = {};
  slice->station = window.station;
  if (!(scales.u_inf > 0.0) || !(scales.t_inf > 0.0)) {
    if (error) {
      *error = "freestream scales must be positive";
    }
    return false;
  }
  const int ix = table.FindColumn(column::kX);
  const int iu = table.FindColumn(column::kVelocityX);
  const int it = table.FindColumn(column::kTemperature);
  if (ix < 0 || iu < 0 || it < 0) {
    if (error) {
      *error = "result table lacks x, u or T";
    }
    return false;
  }
  const std::vector<double>& xs = table.columns[static_cast<size_t>(ix)];
  const std::vector<double>& us = table.columns[static_cast<size_t>(iu)];
  const std::vector<double>& ts = table.columns[static_cast<size_t>(it)];

  std::vector<ProfilePoint> points;
  for (size_t r = 0; r < table.row_count(); ++r) {
    if (!InStationWindow(xs[r], window)) {
      continue;
    }
    ProfilePoint p;
    p.x = xs[r];
    p.u = us[r];
    p.t = ts[r];
    p.u_norm = p.u / scales.u_inf;
    p.t_norm = p.t / scales.t_inf;
    if (!std::isfinite(p.u_norm) || !std::isfinite(p.t_norm)) {
      ++slice->nonfinite_rows;
    }
    points.push_back(p);
  }
  slice->window_rows = static_cast<int>(points.size());
  if (points.empty()) {
    if (error) {
      std::ostringstream oss;
      oss << "no rows within " << window.tolerance << " of x=" << window.station;
      *error = oss.str();
    }
    return false;
  }
  if (slice->nonfinite_rows > 0) {
    if (error) {
      *error = std::to_string(slice->nonfinite_rows) + " slice rows have non-finite u or T";
    }
    return false;
  }

  // Stable sort keeps file order among equal abscissae so unique() keeps the first seen.
  std::stable_sort(points.begin(), points.end(),
                   [](const ProfilePoint& a, const ProfilePoint& b) {
                     return a.u_norm < b.u_norm;
                   });
  auto last = std::unique(points.begin(), points.end(),
                          [](const ProfilePoint& a, const ProfilePoint& b) {
                            return a.u_norm == b.u_norm;
                          });
  slice->duplicate_rows = static_cast<int>(std::distance(last, points.end()));
  points.erase(last, points.end());
  slice->points = std::move(points);
  return true;
}
