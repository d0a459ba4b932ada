// One calibration trial: config -> solver -> score -> archive -> cleanup.
#ifndef RUN_DRIVER_H
#define RUN_DRIVER_H

#include <filesystem>
#include <string>

#include "calib_config.h"
#include "log_service.h"
#include "profile_extractor.h"
#include "reference_curve.h"
#include "solver_process.h"
#include "trial_log.h"

// Loss assigned when the solver fails, times out, or the trial throws. Kept
// separate from kSentinelLoss so crashes and unscorable output stay distinct.
constexpr double kFailurePenalty = 100.0;

enum class ArchivePolicy {
  BelowThreshold,  // archive when loss < archive_threshold
  Always,
};

struct TrialOutcome {
  double loss = kFailurePenalty;
  TrialStatus status = TrialStatus::SolverFailed;
  bool archived = false;
  std::filesystem::path artifact_dir;
  std::string note;
};

// "Iter_<n>_Pr<tag>".
std::string BuildRunId(int iteration, double parameter, int precision = 4);

class RunDriver {
 public:
  // `session_dir` receives the per-parameter artifact directories.
  RunDriver(const CalibConfig& config,
            const ReferenceCurve& reference,
            SolverInvoker& solver,
            LogService& log,
            std::filesystem::path session_dir);

  // Never throws; every failure path yields a finite loss.
  TrialOutcome Evaluate(double parameter, const std::string& run_id, ArchivePolicy policy);

  std::filesystem::path VolumeOutputPath() const;

 private:
  TrialOutcome RunStages(double parameter,
                         const std::string& run_id,
                         ArchivePolicy policy,
                         const std::filesystem::path& config_path);
  // Plot and archive failures are logged and never change the trial loss.
  void PlotAndArchive(double parameter, const ProfileSlice* slice, TrialOutcome* outcome);
  void ArchiveStages(double parameter, const ProfileSlice* slice, TrialOutcome* outcome);
  void Cleanup(const std::filesystem::path& config_path);

  const CalibConfig& config_;
  const ReferenceCurve& reference_;
  SolverInvoker& solver_;
  LogService& log_;
  std::filesystem::path session_dir_;
};

#endif  // RUN_DRIVER_H
