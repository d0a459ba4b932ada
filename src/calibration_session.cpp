#include "calibration_session.h"

#include <chrono>
#include <sstream>
#include <system_error>
#include <utility>

#include "plot_scripts.h"
#include "provenance.h"
#include "reference_curve.h"

namespace {

constexpr const char* kCategory = "session";
constexpr const char* kConvergenceCsv = "optimization_convergence.csv";
constexpr const char* kConvergencePlot = "optimization_convergence.gp";
constexpr const char* kSessionLog = "session.log";

double SecondsSince(std::chrono::steady_clock::time_point start) {
  return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
}

bool Fail(const std::string& message, std::string* error) {
  if (error) {
    *error = message;
  }
  return false;
}

}  // namespace

TrialStep RunTrial(const SessionState& state, double parameter, const TrialEvaluator& evaluate) {
  TrialStep step;
  step.state = state;
  step.trial.iteration = state.next_iteration;
  step.trial.parameter = parameter;

  const auto start = std::chrono::steady_clock::now();
  const TrialOutcome outcome = evaluate(state.next_iteration, parameter);
  step.trial.elapsed_seconds = SecondsSince(start);
  step.trial.loss = outcome.loss;
  step.trial.status = outcome.status;

  step.state.history.push_back(step.trial);
  step.state.next_iteration = state.next_iteration + 1;
  return step;
}

CalibrationLoop::CalibrationLoop(CalibConfig config, SolverInvoker& solver, LogService& log)
    : config_(std::move(config)), solver_(solver), log_(log) {}

void CalibrationLoop::Report(const std::string& phase, double fraction) const {
  if (progress_) {
    progress_(phase, fraction);
  }
}

void CalibrationLoop::WriteConvergence(const std::filesystem::path& session_dir,
                                       const std::vector<Trial>& trials,
                                       std::vector<std::filesystem::path>* written) {
  const std::vector<ConvergenceRow> rows = BuildConvergenceRows(trials, config_.loss.valid_threshold);
  const std::filesystem::path csv_path = session_dir / kConvergenceCsv;
  const std::filesystem::path plot_path = session_dir / kConvergencePlot;
  std::string error;
  if (!WriteConvergenceCsv(csv_path, rows, &error) ||
      !WriteConvergencePlotScript(plot_path, csv_path, rows, &error)) {
    log_.Warning(kCategory, "convergence plot skipped: " + error);
    return;
  }
  written->push_back(csv_path);
  written->push_back(plot_path);
  if (config_.plot.render) {
    if (RenderPlotScript(config_.plot.gnuplot, plot_path, &error)) {
      log_.Info(kCategory, "convergence plot rendered");
    } else {
      log_.Warning(kCategory, "convergence plot render failed: " + error);
    }
  } else {
    log_.Info(kCategory, "convergence plot script written: " + plot_path.string());
  }
}

bool CalibrationLoop::Run(CalibrationReport* report, std::string* error) {
  const auto session_start = std::chrono::steady_clock::now();
  std::string local_error;

  if (!ValidateCalibConfig(config_, &local_error)) {
    return Fail(local_error, error);
  }
  std::error_code ec;
  if (!std::filesystem::is_regular_file(config_.base_config, ec)) {
    return Fail("base config not found: " + config_.base_config.string(), error);
  }
  ReferenceCurve reference;
  if (!LoadReferenceCurve(config_.reference_data, &reference, &local_error)) {
    return Fail(local_error, error);
  }
  log_.Info(kCategory, "reference curve: " + std::to_string(reference.size()) + " points from " +
                           config_.reference_data.string());

  std::filesystem::create_directories(config_.work_dir, ec);
  if (ec) {
    return Fail("failed to create work directory: " + ec.message(), error);
  }
  const std::tm started_at = LocalTimeNow();
  const std::filesystem::path session_dir =
      ResolveSessionDirCollision(config_.results_dir, InitialSessionDirName(started_at), started_at);
  std::filesystem::create_directories(session_dir, ec);
  if (ec) {
    return Fail("failed to create session directory " + session_dir.string() + ": " + ec.message(),
                error);
  }
  log_.Info(kCategory, "session directory: " + session_dir.string());
  if (!WriteSessionMetadata(session_dir, config_, &local_error)) {
    log_.Warning(kCategory, "metadata sidecar skipped: " + local_error);
  }

  const std::filesystem::path trial_log_path = config_.work_dir / config_.log_filename;
  TrialLogWriter trial_log;
  if (!trial_log.Open(trial_log_path, &local_error)) {
    return Fail(local_error, error);
  }

  RunDriver driver(config_, reference, solver_, log_, session_dir);
  SessionState state;
  const int precision = config_.parameter_precision;
  const int budget = config_.search.max_trials;
  const TrialEvaluator evaluate = [&](int iteration, double parameter) {
    return driver.Evaluate(parameter, BuildRunId(iteration, parameter, precision),
                           ArchivePolicy::BelowThreshold);
  };
  const ScalarObjective objective = [&](double parameter) {
    TrialStep step = RunTrial(state, parameter, evaluate);
    state = std::move(step.state);
    std::string append_error;
    if (!trial_log.Append(step.trial, &append_error)) {
      log_.Error("search", append_error);
    }
    std::ostringstream msg;
    msg << "trial " << step.trial.iteration << ": Pr_t = "
        << FormatParameterTag(step.trial.parameter, precision) << ", loss = " << step.trial.loss
        << " [" << TrialStatusToken(step.trial.status) << "], " << step.trial.elapsed_seconds
        << " s";
    log_.Info("search", msg.str());
    Report("search", budget > 0 ? static_cast<double>(step.trial.iteration) / budget : 1.0);
    return step.trial.loss;
  };

  SearchOptions options;
  options.lower = config_.search.lower;
  options.upper = config_.search.upper;
  options.xatol = config_.search.xatol;
  options.max_evaluations = budget;
  SearchResult search;
  if (!MinimizeScalarBounded(objective, options, &search, &local_error)) {
    trial_log.Close();
    return Fail(local_error, error);
  }
  trial_log.Close();
  {
    std::ostringstream msg;
    msg << "search finished after " << search.evaluations << " trials: " << search.message
        << " (terminal Pr_t = " << FormatParameterTag(search.x, precision) << ")";
    log_.Info("search", msg.str());
  }

  CalibrationReport out;
  out.trials = state.history;
  out.search = search;
  const Trial* best = BestTrial(state.history);
  if (best) {
    out.has_best = true;
    out.best = *best;
    std::ostringstream msg;
    msg << "best trial " << best->iteration << ": Pr_t = "
        << FormatParameterTag(best->parameter, precision) << ", loss = " << best->loss;
    log_.Info(kCategory, msg.str());
  }

  std::vector<std::filesystem::path> session_files;
  WriteConvergence(session_dir, state.history, &session_files);

  if (out.has_best) {
    Report("verification", 0.0);
    log_.Info(kCategory, "running verification case at the best parameter");
    const std::string run_id = FormatParameterTag(out.best.parameter, precision);
    const TrialOutcome verify = driver.Evaluate(out.best.parameter, run_id, ArchivePolicy::Always);
    out.verification.ran = true;
    out.verification.parameter = out.best.parameter;
    out.verification.loss = verify.loss;
    out.verification.status = verify.status;
    out.verification.archived = verify.archived;
    out.verification.note = verify.note;
    Report("verification", 1.0);
  }

  session_files.push_back(trial_log_path);
  const std::string stem = config_.base_config.stem().string();
  const std::string final_name =
      BuildSessionDirName(stem, static_cast<int>(state.history.size()), LocalTimeNow());
  std::filesystem::path final_dir = session_dir;
  if (!FinalizeSession(session_dir, session_files, final_name, LocalTimeNow(), &final_dir,
                       &local_error)) {
    log_.Error("archive", "session finalize failed: " + local_error);
  }
  out.session_dir = final_dir;
  if (out.verification.archived) {
    out.verification.artifact_dir =
        (final_dir / ArtifactDirName(out.verification.parameter, precision)).string();
  }
  log_.Info(kCategory, "results saved under: " + final_dir.string());

  out.total_seconds = SecondsSince(session_start);
  SessionSummaryData summary;
  summary.session_dir = final_dir.string();
  summary.trials = out.trials;
  summary.search = out.search;
  summary.verification = out.verification;
  summary.total_seconds = out.total_seconds;
  if (!WriteSessionSummary(final_dir, summary, &local_error)) {
    log_.Warning(kCategory, "session summary skipped: " + local_error);
  }
  if (!log_.WriteToFile(final_dir / kSessionLog, &local_error)) {
    log_.Warning(kCategory, "session log not written: " + local_error);
  }

  if (report) {
    *report = std::move(out);
  }
  return true;
}
