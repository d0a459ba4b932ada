#ifndef CALIB_CONFIG_H
#define CALIB_CONFIG_H

#include <filesystem>
#include <string>
#include <vector>

// Values written into every generated solver configuration.
struct SolverOverrides {
  int iterations = 51;
  int output_frequency = 10;
  std::string output_files = "(RESTART, PARAVIEW, TECPLOT_ASCII)";
  std::string volume_filename = "flow";
  std::string conv_filename = "history";
  std::string restart_filename = "restart_flow";
};

struct SolverSettings {
  std::string executable = "SU2_CFD";
  std::string launcher = "mpirun";  // used only when workers > 1
  int workers = 4;
  double timeout_seconds = 0.0;     // 0 = wait forever
  std::string log_filename = "solver.log";
};

struct StationWindow {
  double station = 1.5;       // streamwise location [m]
  double tolerance = 0.005;   // half-width [m]
  bool inclusive = false;     // false: station-tol < x < station+tol
};

struct FreestreamScales {
  double u_inf = 1882.0;  // [m/s]
  double t_inf = 47.4;    // [K]
};

struct SearchSettings {
  double lower = 0.5;
  double upper = 0.95;
  double xatol = 1e-3;
  int max_trials = 5;
};

struct LossSettings {
  double archive_threshold = 50.0;  // archive trial artifacts when loss is below this
  double valid_threshold = 20.0;    // convergence plot splits valid/crashed trials here
};

struct PlotSettings {
  bool render = false;              // run gnuplot on generated scripts
  std::string gnuplot = "gnuplot";
};

struct CalibConfig {
  int schema_version = 1;

  std::filesystem::path base_config;
  std::filesystem::path reference_data;
  std::filesystem::path results_dir = "results";
  std::filesystem::path work_dir = ".";

  SolverSettings solver;
  SolverOverrides overrides;
  StationWindow window;
  FreestreamScales freestream;
  SearchSettings search;
  LossSettings loss;
  PlotSettings plot;

  int parameter_precision = 4;  // digits used in artifact directory names
  std::string log_filename = "optimization_log.csv";
};

bool LoadCalibConfigFromFile(const std::filesystem::path& path,
                             CalibConfig* config,
                             std::string* error);
bool LoadCalibConfigFromString(const std::string& content,
                               CalibConfig* config,
                               std::string* error);
bool SaveCalibConfigToFile(const std::filesystem::path& path,
                           const CalibConfig& config,
                           std::string* error);
std::string SerializeCalibConfig(const CalibConfig& config, int indent = 2);

bool ValidateCalibConfig(const CalibConfig& config, std::string* error);

// Files the solver leaves in the work directory that belong to one trial.
std::vector<std::string> TrialOutputFiles(const SolverOverrides& overrides,
                                          const SolverSettings& solver);

#endif  // CALIB_CONFIG_H
