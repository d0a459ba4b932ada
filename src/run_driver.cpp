#include "run_driver.h"

#include <exception>
#include <sstream>
#include <utility>

#include "config_overlay.h"
#include "file_utils.h"
#include "loss_evaluator.h"
#include "plot_scripts.h"
#include "provenance.h"

namespace {

constexpr const char* kCategory = "driver";

TrialStatus ToTrialStatus(LossStatus status) {
  switch (status) {
    case LossStatus::Scored:
      return TrialStatus::Scored;
    case LossStatus::Unparseable:
      return TrialStatus::Unparseable;
    case LossStatus::EmptySlice:
      return TrialStatus::EmptySlice;
    case LossStatus::NumericalError:
      return TrialStatus::NumericalError;
  }
  return TrialStatus::NumericalError;
}

}  // namespace

std::string BuildRunId(int iteration, double parameter, int precision) {
  return "Iter_" + std::to_string(iteration) + "_Pr" + FormatParameterTag(parameter, precision);
}

RunDriver::RunDriver(const CalibConfig& config,
                     const ReferenceCurve& reference,
                     SolverInvoker& solver,
                     LogService& log,
                     std::filesystem::path session_dir)
    : config_(config),
      reference_(reference),
      solver_(solver),
      log_(log),
      session_dir_(std::move(session_dir)) {}

std::filesystem::path RunDriver::VolumeOutputPath() const {
  return config_.work_dir / (config_.overrides.volume_filename + ".dat");
}

TrialOutcome RunDriver::Evaluate(double parameter, const std::string& run_id, ArchivePolicy policy) {
  const std::filesystem::path config_path = TrialConfigPath(config_.work_dir, run_id);
  TrialOutcome outcome;
  try {
    outcome = RunStages(parameter, run_id, policy, config_path);
  } catch (const std::exception& exc) {
    log_.Error(kCategory, run_id + ": unexpected exception: " + exc.what());
    outcome = TrialOutcome();
    outcome.loss = kFailurePenalty;
    outcome.status = TrialStatus::Exception;
    outcome.note = exc.what();
  }
  Cleanup(config_path);
  return outcome;
}

TrialOutcome RunDriver::RunStages(double parameter,
                                  const std::string& run_id,
                                  ArchivePolicy policy,
                                  const std::filesystem::path& config_path) {
  TrialOutcome outcome;
  std::ostringstream banner;
  banner << "--- " << run_id << ": Pr_t = "
         << FormatParameterTag(parameter, config_.parameter_precision) << " ---";
  log_.Info(kCategory, banner.str());

  // A volume file left by an earlier trial must never be scored as this one's.
  std::string error;
  if (!RemoveFileIfExists(VolumeOutputPath(), &error)) {
    log_.Warning(kCategory, error);
  }

  OverlayResult overlay;
  if (!WriteTrialConfig(config_.base_config, config_path,
                        BuildTrialDirectives(parameter, config_.overrides), &overlay, &error)) {
    log_.Error(kCategory, run_id + ": config generation failed: " + error);
    outcome.loss = kFailurePenalty;
    outcome.status = TrialStatus::Exception;
    outcome.note = error;
    return outcome;
  }
  for (const auto& key : overlay.appended) {
    log_.Warning(kCategory, key + " not found in base config, appended");
  }

  const ProcessResult run = solver_.Invoke(config_path);
  log_.Append("solver", run_id + ": " + DescribeProcessResult(run));
  if (!run.ok()) {
    outcome.loss = kFailurePenalty;
    outcome.status = run.timed_out ? TrialStatus::SolverTimeout : TrialStatus::SolverFailed;
    outcome.note = DescribeProcessResult(run);
    log_.Warning(kCategory, run_id + ": solver failed, penalty applied");
  } else {
    ProfileSlice slice;
    const LossEvaluation eval = EvaluateOutputFile(VolumeOutputPath(), config_.window,
                                                   config_.freestream, reference_, &slice);
    outcome.loss = eval.loss;
    outcome.status = ToTrialStatus(eval.status);
    outcome.note = eval.note;
    if (eval.scored()) {
      std::ostringstream msg;
      msg << run_id << ": RMSE = " << eval.loss << " (" << eval.points << " points)";
      log_.Info(kCategory, msg.str());
    } else {
      log_.Warning(kCategory, run_id + ": " + LossStatusToken(eval.status) + ": " + eval.note);
    }
    const bool archive = policy == ArchivePolicy::Always ||
                         outcome.loss < config_.loss.archive_threshold;
    if (archive) {
      PlotAndArchive(parameter, eval.scored() ? &slice : nullptr, &outcome);
    }
    return outcome;
  }

  if (policy == ArchivePolicy::Always) {
    PlotAndArchive(parameter, nullptr, &outcome);
  }
  return outcome;
}

void RunDriver::PlotAndArchive(double parameter, const ProfileSlice* slice, TrialOutcome* outcome) {
  try {
    ArchiveStages(parameter, slice, outcome);
  } catch (const std::exception& exc) {
    log_.Error("archive", std::string("archive aborted: ") + exc.what());
  }
}

void RunDriver::ArchiveStages(double parameter, const ProfileSlice* slice, TrialOutcome* outcome) {
  const std::string tag = FormatParameterTag(parameter, config_.parameter_precision);
  std::vector<std::string> files = TrialOutputFiles(config_.overrides, config_.solver);
  std::string error;

  if (slice && !slice->empty()) {
    const ProfilePlotFiles plot = ProfilePlotPaths(config_.work_dir, tag);
    if (!WriteProfileCsv(plot.csv, *slice, reference_, &error) ||
        !WriteProfilePlotScript(plot, reference_, "Pr_t = " + tag, &error)) {
      log_.Warning("archive", "profile plot skipped: " + error);
    } else if (config_.plot.render && !RenderPlotScript(config_.plot.gnuplot, plot.script, &error)) {
      log_.Warning("archive", "profile plot render failed: " + error);
    }
    files.push_back(plot.csv.filename().string());
    files.push_back(plot.script.filename().string());
    files.push_back(plot.image.filename().string());
  }

  const std::string dir_name = ArtifactDirName(parameter, config_.parameter_precision);
  const ArchivePlan plan = PlanTrialArchive(config_.work_dir, session_dir_, dir_name, files);
  int moved = 0;
  if (!CommitArchivePlan(plan, &moved, &error)) {
    log_.Error("archive", "archive failed: " + error);
  }
  if (moved > 0) {
    outcome->archived = true;
    outcome->artifact_dir = plan.target_dir;
    log_.Info("archive", "moved " + std::to_string(moved) + " files to " + plan.target_dir.string());
  }
}

void RunDriver::Cleanup(const std::filesystem::path& config_path) {
  std::string error;
  if (!RemoveFileIfExists(config_path, &error)) {
    log_.Warning(kCategory, error);
  }
  if (!RemoveFileIfExists(VolumeOutputPath(), &error)) {
    log_.Warning(kCategory, error);
  }
}
