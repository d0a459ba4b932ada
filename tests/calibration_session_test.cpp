#include "calibration_session.h"
#include "file_utils.h"
#include "loss_evaluator.h"
#include "provenance.h"
#include "string_utils.h"

#include <cmath>
#include <filesystem>
#include <iostream>
#include <sstream>
#include <string>

namespace {

int failures = 0;

void Check(bool condition, const std::string& message) {
  if (!condition) {
    std::cerr << "FAIL: " << message << "\n";
    ++failures;
  }
}

// Solver stand-in whose temperature error grows away from Pr_t = 0.7 and that
// crashes above `crash_above`.
class ParabolaSolver : public SolverInvoker {
 public:
  explicit ParabolaSolver(std::filesystem::path work_dir) : work_dir_(std::move(work_dir)) {}

  ProcessResult Invoke(const std::filesystem::path& config_path) override {
    ++calls;
    ProcessResult result;
    result.started = true;
    result.exit_code = 0;
    std::string text;
    std::string error;
    if (!ReadTextFile(config_path, &text, &error)) {
      result.exit_code = 2;
      return result;
    }
    double pr = 0.0;
    const size_t pos = text.find("PRANDTL_TURB= ");
    if (pos == std::string::npos) {
      result.exit_code = 2;
      return result;
    }
    const size_t end = text.find('\n', pos);
    if (!prtcal::ParseDouble(prtcal::Trim(text.substr(pos + 14, end - pos - 14)), &pr)) {
      result.exit_code = 2;
      return result;
    }
    WriteTextFile(work_dir_ / "solver.log", "pr " + std::to_string(pr) + "\n", &error);
    if (pr > crash_above) {
      result.exit_code = 139;
      return result;
    }
    if (calls <= unparseable_calls) {
      WriteTextFile(work_dir_ / "flow.dat",
                    "VARIABLES = \"x\",\"y\",\"Velocity_x\",\"Temperature\"\n"
                    "ZONE NODES= 1\n"
                    "1.5 0.0 ***** 300.0\n",
                    &error);
      return result;
    }
    const FreestreamScales scales;
    const double scale = 1.0 + 4.0 * (pr - 0.7) * (pr - 0.7);
    std::ostringstream out;
    out.precision(17);
    out << "VARIABLES = \"x\",\"y\",\"Velocity_x\",\"Temperature\"\n";
    out << "ZONE NODES= 3\n";
    out << "1.5 0.0 0.0 " << 3.0 * scales.t_inf * scale << "\n";
    out << "1.5 0.001 " << 0.5 * scales.u_inf << " " << 2.0 * scales.t_inf * scale << "\n";
    out << "1.5 0.002 " << scales.u_inf << " " << 1.0 * scales.t_inf * scale << "\n";
    WriteTextFile(work_dir_ / "flow.dat", out.str(), &error);
    return result;
  }

  int calls = 0;
  double crash_above = 10.0;
  int unparseable_calls = 0;  // the first N calls write headers without numeric rows

 private:
  std::filesystem::path work_dir_;
};

struct SessionFixture {
  std::filesystem::path root;
  CalibConfig config;

  SessionFixture() {
    root = std::filesystem::temp_directory_path() / ("prtcal_session_" + GenerateRandomTag(8));
    config.base_config = root / "flatplate_M14.cfg";
    config.reference_data = root / "reference.csv";
    config.results_dir = root / "results";
    config.work_dir = root / "work";
    std::string error;
    WriteTextFile(config.base_config, "PRANDTL_TURB= 0.90\nITER= 10\n", &error);
    WriteTextFile(config.reference_data, "u_norm,t_norm\n0.0,3.0\n1.0,1.0\n", &error);
  }

  ~SessionFixture() {
    std::error_code ec;
    std::filesystem::remove_all(root, ec);
  }
};

void TestRunTrialIsPure() {
  SessionState state;
  state.next_iteration = 4;
  int seen_iteration = 0;
  const TrialEvaluator evaluate = [&seen_iteration](int iteration, double parameter) {
    seen_iteration = iteration;
    TrialOutcome outcome;
    outcome.loss = parameter * 2.0;
    outcome.status = TrialStatus::Scored;
    return outcome;
  };
  const TrialStep step = RunTrial(state, 0.6, evaluate);
  Check(seen_iteration == 4, "evaluator sees the next iteration number");
  Check(step.trial.iteration == 4 && step.trial.parameter == 0.6, "trial identity");
  Check(step.trial.loss == 1.2, "trial loss from the evaluator");
  Check(step.state.next_iteration == 5, "iteration advances");
  Check(step.state.history.size() == 1, "history grows by one");
  Check(state.history.empty() && state.next_iteration == 4, "input state untouched");
}

void TestFullSession() {
  SessionFixture fx;
  fx.config.search.max_trials = 6;
  LogService log;
  ParabolaSolver solver(fx.config.work_dir);
  solver.crash_above = 0.85;
  CalibrationLoop loop(fx.config, solver, log);
  int progress_calls = 0;
  loop.SetProgressCallback([&progress_calls](const std::string&, double) { ++progress_calls; });

  CalibrationReport report;
  std::string error;
  Check(loop.Run(&report, &error), "session runs: " + error);
  Check(!report.trials.empty(), "trials recorded");
  Check(static_cast<int>(report.trials.size()) <= fx.config.search.max_trials, "budget honoured");
  Check(solver.calls == static_cast<int>(report.trials.size()) + 1,
        "one solver call per trial plus verification");
  Check(progress_calls > 0, "progress reported");

  for (size_t i = 0; i < report.trials.size(); ++i) {
    const Trial& trial = report.trials[i];
    Check(trial.iteration == static_cast<int>(i) + 1, "iterations are sequential");
    Check(std::isfinite(trial.loss) && trial.loss >= 0.0, "loss finite and non-negative");
    Check(trial.parameter >= 0.5 && trial.parameter <= 0.95, "parameter within bounds");
    Check(report.has_best && report.best.loss <= trial.loss, "best is minimal over the history");
  }
  Check(report.best.loss < 0.1, "best lands near the optimum");

  Check(report.verification.ran, "verification ran");
  Check(report.verification.parameter == report.best.parameter, "verification at the best parameter");
  Check(report.verification.status == TrialStatus::Scored, "verification scored");

  const std::string expected_prefix =
      "flatplate_M14_" + std::to_string(report.trials.size()) + "iter_";
  Check(report.session_dir.parent_path() == fx.config.results_dir, "session under results dir");
  Check(prtcal::StartsWith(report.session_dir.filename().string(), expected_prefix),
        "session renamed after the base config and trial count");
  Check(std::filesystem::exists(report.session_dir / "optimization_log.csv"), "trial log moved");
  Check(std::filesystem::exists(report.session_dir / "optimization_convergence.csv"),
        "convergence data written");
  Check(std::filesystem::exists(report.session_dir / "optimization_convergence.gp"),
        "convergence script written");
  Check(std::filesystem::exists(report.session_dir / "session.log"), "session log written");
  Check(std::filesystem::exists(report.session_dir / kSessionMetadataFile), "metadata written");
  Check(std::filesystem::exists(report.session_dir / kSessionSummaryFile), "summary written");
  const std::filesystem::path verify_dir =
      report.session_dir / ArtifactDirName(report.best.parameter);
  Check(std::filesystem::exists(verify_dir / "flow.dat"), "verification artifacts archived");

  std::vector<Trial> logged;
  Check(ReadTrialLog(report.session_dir / "optimization_log.csv", &logged, &error),
        "trial log readable");
  Check(logged.size() == report.trials.size(), "every trial logged once, verification excluded");

  Check(!std::filesystem::exists(fx.config.work_dir / "optimization_log.csv"),
        "no trial log left in the work directory");
  Check(!std::filesystem::exists(fx.config.work_dir / "flow.dat"), "no volume output left behind");
  for (const auto& entry : std::filesystem::directory_iterator(fx.config.work_dir)) {
    Check(entry.path().extension() != ".cfg", "no trial config left behind");
  }

  // Same base config and trial count on the same day collide.
  ParabolaSolver second_solver(fx.config.work_dir);
  second_solver.crash_above = 0.85;
  LogService second_log;
  CalibrationLoop second(fx.config, second_solver, second_log);
  CalibrationReport second_report;
  Check(second.Run(&second_report, &error), "second session runs: " + error);
  if (second_report.trials.size() == report.trials.size()) {
    Check(second_report.session_dir != report.session_dir, "second session gets its own folder");
    Check(prtcal::StartsWith(second_report.session_dir.filename().string(),
                             report.session_dir.filename().string() + "_"),
          "collision appends a time suffix");
  }
}

void TestCrashesArePenalized() {
  SessionFixture fx;
  fx.config.search.max_trials = 4;
  LogService log;
  ParabolaSolver solver(fx.config.work_dir);
  solver.crash_above = 0.0;
  CalibrationLoop loop(fx.config, solver, log);
  CalibrationReport report;
  std::string error;
  Check(loop.Run(&report, &error), "all-crash session still completes: " + error);
  Check(report.trials.size() == 4, "budget spent on crashes");
  for (const auto& trial : report.trials) {
    Check(trial.loss == kFailurePenalty, "every crash is penalized");
    Check(trial.status == TrialStatus::SolverFailed, "crash status recorded");
  }
  Check(report.verification.ran && report.verification.loss == kFailurePenalty,
        "verification of a crashing parameter is penalized");
}

void TestUnparseableTrialDoesNotStopSession() {
  SessionFixture fx;
  fx.config.search.max_trials = 4;
  LogService log;
  ParabolaSolver solver(fx.config.work_dir);
  solver.unparseable_calls = 1;
  CalibrationLoop loop(fx.config, solver, log);
  CalibrationReport report;
  std::string error;
  Check(loop.Run(&report, &error), "session with an unparseable trial completes: " + error);
  Check(report.trials.size() >= 2, "search continues after an unparseable trial");
  if (report.trials.size() < 2) {
    return;
  }
  Check(report.trials[0].loss == kSentinelLoss, "unparseable trial gets the sentinel");
  Check(report.trials[0].status == TrialStatus::Unparseable, "unparseable status recorded");
  Check(report.trials[1].status == TrialStatus::Scored, "next trial is scored");
  Check(report.has_best && report.best.iteration != 1, "sentinel trial is never the best");
}

void TestMissingInputsAreFatal() {
  SessionFixture fx;
  LogService log;
  ParabolaSolver solver(fx.config.work_dir);
  CalibConfig missing_reference = fx.config;
  missing_reference.reference_data = fx.root / "absent.csv";
  CalibrationLoop loop(missing_reference, solver, log);
  CalibrationReport report;
  std::string error;
  Check(!loop.Run(&report, &error), "missing reference is fatal");
  Check(!error.empty(), "missing reference explained");
  Check(solver.calls == 0, "no trial runs without a reference");

  CalibConfig missing_base = fx.config;
  missing_base.base_config = fx.root / "absent.cfg";
  CalibrationLoop base_loop(missing_base, solver, log);
  Check(!base_loop.Run(&report, &error), "missing base config is fatal");
  Check(error.find("absent.cfg") != std::string::npos, "missing base config named");
  Check(solver.calls == 0, "no trial runs without a base config");
  Check(!std::filesystem::exists(fx.config.results_dir), "no session folder for a fatal start");
}

}  // namespace

int main() {
  TestRunTrialIsPure();
  TestFullSession();
  TestCrashesArePenalized();
  TestUnparseableTrialDoesNotStopSession();
  TestMissingInputsAreFatal();
  if (failures > 0) {
    std::cerr << failures << " calibration session check(s) failed\n";
    return 1;
  }
  std::cout << "calibration_session_test passed\n";
  return 0;
}
