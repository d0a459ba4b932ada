// Bounded search over the turbulent Prandtl number, one solver trial per
// objective call, followed by a verification run and session finalization.
#ifndef CALIBRATION_SESSION_H
#define CALIBRATION_SESSION_H

#include <filesystem>
#include <functional>
#include <string>
#include <utility>
#include <vector>

#include "bounded_search.h"
#include "calib_config.h"
#include "log_service.h"
#include "progress.h"
#include "run_driver.h"
#include "session_metadata.h"
#include "solver_process.h"
#include "trial_log.h"

struct SessionState {
  int next_iteration = 1;
  std::vector<Trial> history;
};

struct TrialStep {
  SessionState state;
  Trial trial;
};

using TrialEvaluator = std::function<TrialOutcome(int iteration, double parameter)>;

// Runs one trial at `parameter` and returns the advanced state. `state` is not
// modified; the trial is appended to the returned history.
TrialStep RunTrial(const SessionState& state, double parameter, const TrialEvaluator& evaluate);

struct CalibrationReport {
  std::filesystem::path session_dir;  // final (renamed) session directory
  std::vector<Trial> trials;
  SearchResult search;
  bool has_best = false;
  Trial best;
  VerificationRecord verification;
  double total_seconds = 0.0;
};

class CalibrationLoop {
 public:
  CalibrationLoop(CalibConfig config, SolverInvoker& solver, LogService& log);

  void SetProgressCallback(ProgressCallback callback) { progress_ = std::move(callback); }

  // Returns false only for fatal setup errors (missing inputs, unwritable
  // results directory); trial failures are recorded as penalized trials.
  bool Run(CalibrationReport* report, std::string* error);

 private:
  void Report(const std::string& phase, double fraction) const;
  void WriteConvergence(const std::filesystem::path& session_dir,
                        const std::vector<Trial>& trials,
                        std::vector<std::filesystem::path>* written);

  CalibConfig config_;
  SolverInvoker& solver_;
  LogService& log_;
  ProgressCallback progress_;
};

#endif  // CALIBRATION_SESSION_H
