#include "calib_config.h"

#include <cmath>

#include <nlohmann/json.hpp>

#include "file_utils.h"

namespace {
using json = nlohmann::json;

bool ReadStringField(const json& j, const char* key, std::string* out, std::string* error) {
  if (!j.contains(key)) {
    return true;
  }
  const json& value = j.at(key);
  if (!value.is_string()) {
    if (error) {
      *error = std::string("expected string for '") + key + "'";
    }
    return false;
  }
  if (out) {
    *out = value.get<std::string>();
  }
  return true;
}

bool ReadPathField(const json& j, const char* key, std::filesystem::path* out,
                   std::string* error) {
  std::string text;
  if (!j.contains(key)) {
    return true;
  }
  if (!ReadStringField(j, key, &text, error)) {
    return false;
  }
  if (out) {
    *out = text;
  }
  return true;
}

bool ReadIntField(const json& j, const char* key, int* out, std::string* error) {
  if (!j.contains(key)) {
    return true;
  }
  const json& value = j.at(key);
  if (!value.is_number_integer()) {
    if (error) {
      *error = std::string("expected integer for '") + key + "'";
    }
    return false;
  }
  if (out) {
    *out = value.get<int>();
  }
  return true;
}

bool ReadDoubleField(const json& j, const char* key, double* out, std::string* error) {
  if (!j.contains(key)) {
    return true;
  }
  const json& value = j.at(key);
  if (!value.is_number()) {
    if (error) {
      *error = std::string("expected number for '") + key + "'";
    }
    return false;
  }
  if (out) {
    *out = value.get<double>();
  }
  return true;
}

bool ReadBoolField(const json& j, const char* key, bool* out, std::string* error) {
  if (!j.contains(key)) {
    return true;
  }
  const json& value = j.at(key);
  if (!value.is_boolean()) {
    if (error) {
      *error = std::string("expected boolean for '") + key + "'";
    }
    return false;
  }
  if (out) {
    *out = value.get<bool>();
  }
  return true;
}

bool RequireObject(const json& j, const char* name, std::string* error) {
  if (j.is_object()) {
    return true;
  }
  if (error) {
    *error = std::string(name) + " must be an object";
  }
  return false;
}

bool ReadBounds(const json& j, SearchSettings* search, std::string* error) {
  if (!j.contains("bounds")) {
    return true;
  }
  const json& value = j.at("bounds");
  if (!value.is_array() || value.size() != 2 || !value[0].is_number() || !value[1].is_number()) {
    if (error) {
      *error = "expected search.bounds as [lower,upper]";
    }
    return false;
  }
  search->lower = value[0].get<double>();
  search->upper = value[1].get<double>();
  return true;
}

json CalibConfigToJson(const CalibConfig& config) {
  json root;
  root["schema_version"] = config.schema_version;

  json paths;
  paths["base_config"] = config.base_config.string();
  paths["reference_data"] = config.reference_data.string();
  paths["results_dir"] = config.results_dir.string();
  paths["work_dir"] = config.work_dir.string();
  paths["log_file"] = config.log_filename;
  root["paths"] = paths;

  json solver;
  solver["executable"] = config.solver.executable;
  solver["launcher"] = config.solver.launcher;
  solver["workers"] = config.solver.workers;
  solver["timeout_seconds"] = config.solver.timeout_seconds;
  solver["log_file"] = config.solver.log_filename;
  root["solver"] = solver;

  json overrides;
  overrides["iterations"] = config.overrides.iterations;
  overrides["output_frequency"] = config.overrides.output_frequency;
  overrides["output_files"] = config.overrides.output_files;
  overrides["volume_filename"] = config.overrides.volume_filename;
  overrides["conv_filename"] = config.overrides.conv_filename;
  overrides["restart_filename"] = config.overrides.restart_filename;
  root["overrides"] = overrides;

  json station;
  station["x"] = config.window.station;
  station["tolerance"] = config.window.tolerance;
  station["inclusive"] = config.window.inclusive;
  root["station"] = station;

  json freestream;
  freestream["u_inf"] = config.freestream.u_inf;
  freestream["t_inf"] = config.freestream.t_inf;
  root["freestream"] = freestream;

  json search;
  search["bounds"] = {config.search.lower, config.search.upper};
  search["xatol"] = config.search.xatol;
  search["max_trials"] = config.search.max_trials;
  search["parameter_precision"] = config.parameter_precision;
  root["search"] = search;

  json loss;
  loss["archive_threshold"] = config.loss.archive_threshold;
  loss["valid_threshold"] = config.loss.valid_threshold;
  root["loss"] = loss;

  json plot;
  plot["render"] = config.plot.render;
  plot["gnuplot"] = config.plot.gnuplot;
  root["plot"] = plot;
  return root;
}

bool ParsePaths(const json& j, CalibConfig* config, std::string* error) {
  if (!RequireObject(j, "paths", error)) return false;
  if (!ReadPathField(j, "base_config", &config->base_config, error)) return false;
  if (!ReadPathField(j, "reference_data", &config->reference_data, error)) return false;
  if (!ReadPathField(j, "results_dir", &config->results_dir, error)) return false;
  if (!ReadPathField(j, "work_dir", &config->work_dir, error)) return false;
  if (!ReadStringField(j, "log_file", &config->log_filename, error)) return false;
  return true;
}

bool ParseSolver(const json& j, CalibConfig* config, std::string* error) {
  if (!RequireObject(j, "solver", error)) return false;
  if (!ReadStringField(j, "executable", &config->solver.executable, error)) return false;
  if (!ReadStringField(j, "launcher", &config->solver.launcher, error)) return false;
  if (!ReadIntField(j, "workers", &config->solver.workers, error)) return false;
  if (!ReadDoubleField(j, "timeout_seconds", &config->solver.timeout_seconds, error)) return false;
  if (!ReadStringField(j, "log_file", &config->solver.log_filename, error)) return false;
  return true;
}

bool ParseOverrides(const json& j, CalibConfig* config, std::string* error) {
  if (!RequireObject(j, "overrides", error)) return false;
  SolverOverrides& o = config->overrides;
  if (!ReadIntField(j, "iterations", &o.iterations, error)) return false;
  if (!ReadIntField(j, "output_frequency", &o.output_frequency, error)) return false;
  if (!ReadStringField(j, "output_files", &o.output_files, error)) return false;
  if (!ReadStringField(j, "volume_filename", &o.volume_filename, error)) return false;
  if (!ReadStringField(j, "conv_filename", &o.conv_filename, error)) return false;
  if (!ReadStringField(j, "restart_filename", &o.restart_filename, error)) return false;
  return true;
}

bool ParseStation(const json& j, CalibConfig* config, std::string* error) {
  if (!RequireObject(j, "station", error)) return false;
  if (!ReadDoubleField(j, "x", &config->window.station, error)) return false;
  if (!ReadDoubleField(j, "tolerance", &config->window.tolerance, error)) return false;
  if (!ReadBoolField(j, "inclusive", &config->window.inclusive, error)) return false;
  return true;
}

bool ParseFreestream(const json& j, CalibConfig* config, std::string* error) {
  if (!RequireObject(j, "freestream", error)) return false;
  if (!ReadDoubleField(j, "u_inf", &config->freestream.u_inf, error)) return false;
  if (!ReadDoubleField(j, "t_inf", &config->freestream.t_inf, error)) return false;
  return true;
}

bool ParseSearch(const json& j, CalibConfig* config, std::string* error) {
  if (!RequireObject(j, "search", error)) return false;
  if (!ReadBounds(j, &config->search, error)) return false;
  if (!ReadDoubleField(j, "xatol", &config->search.xatol, error)) return false;
  if (!ReadIntField(j, "max_trials", &config->search.max_trials, error)) return false;
  if (!ReadIntField(j, "parameter_precision", &config->parameter_precision, error)) return false;
  return true;
}

bool ParseLoss(const json& j, CalibConfig* config, std::string* error) {
  if (!RequireObject(j, "loss", error)) return false;
  if (!ReadDoubleField(j, "archive_threshold", &config->loss.archive_threshold, error)) return false;
  if (!ReadDoubleField(j, "valid_threshold", &config->loss.valid_threshold, error)) return false;
  return true;
}

bool ParsePlot(const json& j, CalibConfig* config, std::string* error) {
  if (!RequireObject(j, "plot", error)) return false;
  if (!ReadBoolField(j, "render", &config->plot.render, error)) return false;
  if (!ReadStringField(j, "gnuplot", &config->plot.gnuplot, error)) return false;
  return true;
}

bool ParseCalibConfigJson(const json& root, CalibConfig* config, std::string* error) {
  if (!config) {
    if (error) {
      *error = "missing config output";
    }
    return false;
  }
  if (!root.is_object()) {
    if (error) {
      *error = "calibration config must be a JSON object";
    }
    return false;
  }
  CalibConfig parsed;
  if (!ReadIntField(root, "schema_version", &parsed.schema_version, error)) return false;
  if (parsed.schema_version != 1) {
    if (error) {
      *error = "unsupported schema_version";
    }
    return false;
  }

  if (root.contains("paths")) {
    if (!ParsePaths(root.at("paths"), &parsed, error)) return false;
  }
  if (root.contains("solver")) {
    if (!ParseSolver(root.at("solver"), &parsed, error)) return false;
  }
  if (root.contains("overrides")) {
    if (!ParseOverrides(root.at("overrides"), &parsed, error)) return false;
  }
  if (root.contains("station")) {
    if (!ParseStation(root.at("station"), &parsed, error)) return false;
  }
  if (root.contains("freestream")) {
    if (!ParseFreestream(root.at("freestream"), &parsed, error)) return false;
  }
  if (root.contains("search")) {
    if (!ParseSearch(root.at("search"), &parsed, error)) return false;
  }
  if (root.contains("loss")) {
    if (!ParseLoss(root.at("loss"), &parsed, error)) return false;
  }
  if (root.contains("plot")) {
    if (!ParsePlot(root.at("plot"), &parsed, error)) return false;
  }

  if (!ValidateCalibConfig(parsed, error)) {
    return false;
  }
  *config = std::move(parsed);
  return true;
}

}  // namespace

bool LoadCalibConfigFromString(const std::string& content,
                               CalibConfig* config,
                               std::string* error) {
  json root;
  try {
    root = json::parse(content);
  } catch (const json::exception& e) {
    if (error) {
      *error = std::string("invalid JSON: ") + e.what();
    }
    return false;
  }
  return ParseCalibConfigJson(root, config, error);
}

bool LoadCalibConfigFromFile(const std::filesystem::path& path,
                             CalibConfig* config,
                             std::string* error) {
  std::string content;
  if (!ReadTextFile(path, &content, error)) {
    return false;
  }
  return LoadCalibConfigFromString(content, config, error);
}

bool SaveCalibConfigToFile(const std::filesystem::path& path,
                           const CalibConfig& config,
                           std::string* error) {
  return WriteTextFile(path, SerializeCalibConfig(config, 2), error);
}

std::string SerializeCalibConfig(const CalibConfig& config, int indent) {
  return CalibConfigToJson(config).dump(indent);
}

bool ValidateCalibConfig(const CalibConfig& config, std::string* error) {
  auto fail = [error](const std::string& message) {
    if (error) {
      *error = message;
    }
    return false;
  };
  if (config.schema_version != 1) {
    return fail("unsupported schema_version");
  }
  if (!std::isfinite(config.search.lower) || !std::isfinite(config.search.upper) ||
      config.search.lower >= config.search.upper) {
    return fail("search.bounds must be finite with lower < upper");
  }
  if (!(config.search.xatol > 0.0)) {
    return fail("search.xatol must be positive");
  }
  if (config.search.max_trials < 1) {
    return fail("search.max_trials must be at least 1");
  }
  if (!(config.window.tolerance > 0.0)) {
    return fail("station.tolerance must be positive");
  }
  if (!(config.freestream.u_inf > 0.0) || !(config.freestream.t_inf > 0.0)) {
    return fail("freestream scales must be positive");
  }
  if (config.solver.executable.empty()) {
    return fail("solver.executable is required");
  }
  if (config.solver.workers < 1) {
    return fail("solver.workers must be at least 1");
  }
  if (config.solver.timeout_seconds < 0.0) {
    return fail("solver.timeout_seconds must be non-negative");
  }
  if (config.overrides.iterations < 1 || config.overrides.output_frequency < 1) {
    return fail("overrides.iterations and overrides.output_frequency must be positive");
  }
  if (config.overrides.volume_filename.empty()) {
    return fail("overrides.volume_filename is required");
  }
  if (config.parameter_precision < 0 || config.parameter_precision > 12) {
    return fail("search.parameter_precision must be in [0, 12]");
  }
  if (config.log_filename.empty()) {
    return fail("paths.log_file is required");
  }
  return true;
}

std::vector<std::string> TrialOutputFiles(const SolverOverrides& overrides,
                                          const SolverSettings& solver) {
  std::vector<std::string> files;
  files.push_back(overrides.volume_filename + ".dat");
  files.push_back(overrides.volume_filename + ".vtu");
  files.push_back("surface_" + overrides.volume_filename + ".vtu");
  files.push_back("surface_" + overrides.volume_filename + ".csv");
  if (!overrides.conv_filename.empty()) {
    files.push_back(overrides.conv_filename + ".csv");
  }
  if (!overrides.restart_filename.empty()) {
    files.push_back(overrides.restart_filename + ".dat");
  }
  if (!solver.log_filename.empty()) {
    files.push_back(solver.log_filename);
  }
  return files;
}
