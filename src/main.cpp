#include <filesystem>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

#include "calib_config.h"
#include "calibration_session.h"
#include "log_service.h"
#include "loss_evaluator.h"
#include "provenance.h"
#include "reference_curve.h"
#include "solver_process.h"
#include "string_utils.h"
#include "trial_log.h"

namespace {

void PrintUsage() {
  std::cout
      << "Usage: prt_calib --config <file.json> [options]\n"
      << "Optional: --base-config <file.cfg> (solver configuration template)\n"
      << "Optional: --reference <file> (reference T/T_inf vs u/u_inf curve)\n"
      << "Optional: --results-dir <dir> --work-dir <dir>\n"
      << "Optional: --solver <exe> --launcher <exe> --workers N\n"
      << "Optional: --timeout S (solver wall-clock limit, 0 = none)\n"
      << "Optional: --iterations N (solver ITER per trial)\n"
      << "Optional: --bounds lo,hi --xatol T --max-trials N\n"
      << "Optional: --station X --tolerance T --inclusive-window\n"
      << "Optional: --render-plots [--gnuplot <exe>]\n"
      << "Optional: --export-config <file> (write effective JSON configuration and exit)\n"
      << "Optional: --score <flow.dat> (score an existing solver output and exit)\n"
      << "Optional: --summarize <session dir|trial log> (print trials and best, then exit)\n"
      << "Optional: --quiet (session log only, no console trace)\n"
      << "Optional: --help\n";
}

bool ParseBounds(const std::string& text, double* lower, double* upper) {
  const std::vector<std::string> parts = prtcal::SplitAny(text, ",");
  if (parts.size() != 2) {
    return false;
  }
  return prtcal::ParseDouble(prtcal::Trim(parts[0]), lower) &&
         prtcal::ParseDouble(prtcal::Trim(parts[1]), upper);
}

int ScoreOutput(const CalibConfig& config, const std::filesystem::path& output_path) {
  ReferenceCurve reference;
  std::string error;
  if (!LoadReferenceCurve(config.reference_data, &reference, &error)) {
    std::cerr << "reference load error: " << error << "\n";
    return 1;
  }
  const LossEvaluation eval =
      EvaluateOutputFile(output_path, config.window, config.freestream, reference);
  std::cout << "status: " << LossStatusToken(eval.status) << "\n";
  std::cout << "loss: " << std::setprecision(10) << eval.loss << "\n";
  if (eval.scored()) {
    std::cout << "points: " << eval.points << "\n";
  } else if (!eval.note.empty()) {
    std::cout << "note: " << eval.note << "\n";
  }
  return 0;
}

int SummarizeLog(const CalibConfig& config, const std::filesystem::path& target) {
  std::filesystem::path log_path = target;
  std::error_code ec;
  if (std::filesystem::is_directory(target, ec)) {
    log_path = target / config.log_filename;
  }
  std::vector<Trial> trials;
  std::string error;
  if (!ReadTrialLog(log_path, &trials, &error)) {
    std::cerr << "summarize error: " << error << "\n";
    return 1;
  }
  std::cout << "Iteration,Pr_t,RMSE,Time_Sec\n";
  for (const auto& trial : trials) {
    std::cout << FormatTrialLogRow(trial) << "\n";
  }
  const Trial* best = BestTrial(trials);
  if (!best) {
    std::cout << "no trials recorded\n";
    return 1;
  }
  std::cout << "best: iteration " << best->iteration << ", Pr_t = "
            << FormatParameterTag(best->parameter, config.parameter_precision)
            << ", RMSE = " << best->loss << "\n";
  return 0;
}

}  // namespace

int main(int argc, char** argv) {
  if (argc == 1) {
    PrintUsage();
    return 1;
  }

  std::string config_path;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--help" || arg == "-h") {
      PrintUsage();
      return 0;
    }
    if (arg == "--config") {
      if (i + 1 >= argc) {
        std::cerr << "--config requires a file path\n";
        return 1;
      }
      config_path = argv[++i];
    }
  }

  CalibConfig config;
  if (!config_path.empty()) {
    std::string config_error;
    if (!LoadCalibConfigFromFile(config_path, &config, &config_error)) {
      std::cerr << "config load error: " << config_error << "\n";
      return 1;
    }
  }

  std::string export_config_path;
  std::string score_path;
  std::string summarize_path;
  bool quiet = false;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    auto next_value = [&](const char* what, std::string* out) {
      if (i + 1 >= argc) {
        std::cerr << arg << " requires " << what << "\n";
        return false;
      }
      *out = argv[++i];
      return true;
    };
    std::string value;
    if (arg == "--config") {
      ++i;
    } else if (arg == "--base-config") {
      if (!next_value("a file path", &value)) return 1;
      config.base_config = value;
    } else if (arg == "--reference") {
      if (!next_value("a file path", &value)) return 1;
      config.reference_data = value;
    } else if (arg == "--results-dir") {
      if (!next_value("a directory", &value)) return 1;
      config.results_dir = value;
    } else if (arg == "--work-dir") {
      if (!next_value("a directory", &value)) return 1;
      config.work_dir = value;
    } else if (arg == "--solver") {
      if (!next_value("an executable", &value)) return 1;
      config.solver.executable = value;
    } else if (arg == "--launcher") {
      if (!next_value("an executable", &value)) return 1;
      config.solver.launcher = value;
    } else if (arg == "--workers") {
      if (!next_value("a count", &value)) return 1;
      if (!prtcal::ParseInt(value, &config.solver.workers)) {
        std::cerr << "invalid --workers: " << value << "\n";
        return 1;
      }
    } else if (arg == "--timeout") {
      if (!next_value("seconds", &value)) return 1;
      if (!prtcal::ParseDouble(value, &config.solver.timeout_seconds)) {
        std::cerr << "invalid --timeout: " << value << "\n";
        return 1;
      }
    } else if (arg == "--iterations") {
      if (!next_value("a count", &value)) return 1;
      if (!prtcal::ParseInt(value, &config.overrides.iterations)) {
        std::cerr << "invalid --iterations: " << value << "\n";
        return 1;
      }
    } else if (arg == "--bounds") {
      if (!next_value("lo,hi", &value)) return 1;
      if (!ParseBounds(value, &config.search.lower, &config.search.upper)) {
        std::cerr << "invalid --bounds (expected lo,hi): " << value << "\n";
        return 1;
      }
    } else if (arg == "--xatol") {
      if (!next_value("a tolerance", &value)) return 1;
      if (!prtcal::ParseDouble(value, &config.search.xatol)) {
        std::cerr << "invalid --xatol: " << value << "\n";
        return 1;
      }
    } else if (arg == "--max-trials") {
      if (!next_value("a count", &value)) return 1;
      if (!prtcal::ParseInt(value, &config.search.max_trials)) {
        std::cerr << "invalid --max-trials: " << value << "\n";
        return 1;
      }
    } else if (arg == "--station") {
      if (!next_value("a coordinate", &value)) return 1;
      if (!prtcal::ParseDouble(value, &config.window.station)) {
        std::cerr << "invalid --station: " << value << "\n";
        return 1;
      }
    } else if (arg == "--tolerance") {
      if (!next_value("a half-width", &value)) return 1;
      if (!prtcal::ParseDouble(value, &config.window.tolerance)) {
        std::cerr << "invalid --tolerance: " << value << "\n";
        return 1;
      }
    } else if (arg == "--inclusive-window") {
      config.window.inclusive = true;
    } else if (arg == "--render-plots") {
      config.plot.render = true;
    } else if (arg == "--gnuplot") {
      if (!next_value("an executable", &value)) return 1;
      config.plot.gnuplot = value;
    } else if (arg == "--export-config") {
      if (!next_value("a file path", &export_config_path)) return 1;
    } else if (arg == "--score") {
      if (!next_value("a file path", &score_path)) return 1;
    } else if (arg == "--summarize") {
      if (!next_value("a path", &summarize_path)) return 1;
    } else if (arg == "--quiet") {
      quiet = true;
    } else {
      std::cerr << "unknown argument: " << arg << "\n";
      PrintUsage();
      return 1;
    }
  }

  std::string error;
  if (!ValidateCalibConfig(config, &error)) {
    std::cerr << "config error: " << error << "\n";
    return 1;
  }

  if (!export_config_path.empty()) {
    if (!SaveCalibConfigToFile(export_config_path, config, &error)) {
      std::cerr << "export config error: " << error << "\n";
      return 1;
    }
    std::cout << "wrote config: " << export_config_path << "\n";
    return 0;
  }
  if (!score_path.empty()) {
    return ScoreOutput(config, score_path);
  }
  if (!summarize_path.empty()) {
    return SummarizeLog(config, summarize_path);
  }

  LogService log;
  if (!quiet) {
    log.SetEcho(&std::cout);
  }
  SubprocessSolver solver(config.solver, config.work_dir);
  CalibrationLoop loop(config, solver, log);
  CalibrationReport report;
  if (!loop.Run(&report, &error)) {
    std::cerr << "calibration error: " << error << "\n";
    return 1;
  }

  if (report.has_best) {
    std::cout << "optimal Pr_t: "
              << FormatParameterTag(report.best.parameter, config.parameter_precision)
              << " (RMSE " << report.best.loss << ", trial " << report.best.iteration << " of "
              << report.trials.size() << ")\n";
  }
  if (report.verification.ran) {
    std::cout << "verification: " << TrialStatusToken(report.verification.status) << ", loss "
              << report.verification.loss << "\n";
  }
  LogService::FilterOptions problems;
  problems.show_info = false;
  const size_t problem_count = log.GetFiltered(problems).size();
  if (problem_count > 0) {
    std::cout << problem_count << " warning(s)/error(s), see "
              << (report.session_dir / "session.log").string() << "\n";
  }
  std::cout << "results: " << report.session_dir.string() << "\n";
  return 0;
}
