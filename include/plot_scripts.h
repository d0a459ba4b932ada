// gnuplot scripts and their CSV inputs for profile and convergence plots.
#ifndef PLOT_SCRIPTS_H
#define PLOT_SCRIPTS_H

#include <filesystem>
#include <string>
#include <vector>

#include "profile_extractor.h"
#include "reference_curve.h"
#include "trial_log.h"

struct ProfilePlotFiles {
  std::filesystem::path csv;
  std::filesystem::path script;
  std::filesystem::path image;
};

// `<dir>/profile_Pr<tag>.csv`, `<dir>/plot_Pr<tag>.gp`, `<dir>/plot_Pr<tag>.png`.
ProfilePlotFiles ProfilePlotPaths(const std::filesystem::path& dir, const std::string& tag);

// Columns: u_norm,t_norm,t_ref,x.
bool WriteProfileCsv(const std::filesystem::path& csv_path,
                     const ProfileSlice& slice,
                     const ReferenceCurve& curve,
                     std::string* error);

// The reference curve is embedded as a datablock and the CSV/PNG are named
// relative to the script, so the script can be re-rendered after archiving.
bool WriteProfilePlotScript(const ProfilePlotFiles& files,
                            const ReferenceCurve& curve,
                            const std::string& title,
                            std::string* error);

struct ConvergenceRow {
  int iteration = 0;
  double parameter = 0.0;
  double loss = 0.0;
  bool valid = false;  // loss below the valid threshold (not a crash sentinel)
  bool best = false;   // minimum loss among valid rows
  bool last = false;
};

std::vector<ConvergenceRow> BuildConvergenceRows(const std::vector<Trial>& trials,
                                                 double valid_threshold);

bool WriteConvergenceCsv(const std::filesystem::path& csv_path,
                         const std::vector<ConvergenceRow>& rows,
                         std::string* error);

// Loss against iteration: valid trials scaled to their loss range, crashed
// trials as markers along the top edge, best and last trials highlighted.
bool WriteConvergencePlotScript(const std::filesystem::path& plot_path,
                                const std::filesystem::path& csv_path,
                                const std::vector<ConvergenceRow>& rows,
                                std::string* error);

// Runs `gnuplot <script>` from the script's directory.
bool RenderPlotScript(const std::string& gnuplot,
                      const std::filesystem::path& script_path,
                      std::string* error);

#endif  // PLOT_SCRIPTS_H
