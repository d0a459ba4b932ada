#ifndef PROFILE_EXTRACTOR_H
#define PROFILE_EXTRACTOR_H

#include <string>
#include <vector>

#include "calib_config.h"
#include "tecplot_reader.h"

struct ProfilePoint {
  double x = 0.0;
  double u = 0.0;
  double t = 0.0;
  double u_norm = 0.0;
  double t_norm = 0.0;
};

// Wall-normal profile at one station, ascending in u_norm with unique abscissae.
struct ProfileSlice {
  double station = 0.0;
  std::vector<ProfilePoint> points;
  int window_rows = 0;     // rows inside the window before de-duplication
  int duplicate_rows = 0;  // rows dropped for repeating a u_norm value
  int nonfinite_rows = 0;  // window rows with a non-finite normalized value

  bool empty() const { return points.empty(); }
};

bool InStationWindow(double x, const StationWindow& window);

// Returns false (with `error`) when the table lacks x/u/T, the scales are not
// positive, no row falls inside the window, or a window row normalizes to a
// non-finite value.
bool ExtractProfile(const ResultTable& table,
                    const StationWindow& window,
                    const FreestreamScales& scales,
                    ProfileSlice* slice,
                    std::string* error);

#endif  // PROFILE_EXTRACTOR_H
