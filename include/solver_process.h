// External process execution for the CFD solver and helper tools.
#ifndef SOLVER_PROCESS_H
#define SOLVER_PROCESS_H

#include <filesystem>
#include <string>
#include <vector>

#include "calib_config.h"

struct ProcessOptions {
  std::filesystem::path working_dir;   // empty = inherit
  std::filesystem::path output_path;   // stdout+stderr target; empty = /dev/null
  double timeout_seconds = 0.0;        // 0 = wait forever
  double kill_grace_seconds = 5.0;     // SIGTERM -> SIGKILL delay on timeout
};

struct ProcessResult {
  bool started = false;
  bool timed_out = false;
  int exit_code = -1;    // valid when the child exited normally
  int term_signal = 0;   // non-zero when the child was killed by a signal
  double seconds = 0.0;
  std::string error;

  bool ok() const { return started && !timed_out && term_signal == 0 && exit_code == 0; }
};

// Spawns args[0] (PATH lookup) and blocks until it exits or times out.
ProcessResult RunProcess(const std::vector<std::string>& args, const ProcessOptions& options);

std::string DescribeProcessResult(const ProcessResult& result);

// Seam between the run driver and the solver; tests substitute fakes.
class SolverInvoker {
 public:
  virtual ~SolverInvoker() = default;
  virtual ProcessResult Invoke(const std::filesystem::path& config_path) = 0;
};

class SubprocessSolver : public SolverInvoker {
 public:
  SubprocessSolver(SolverSettings settings, std::filesystem::path working_dir);

  ProcessResult Invoke(const std::filesystem::path& config_path) override;

  // `[launcher -n workers] executable config` (launcher only when workers > 1).
  std::vector<std::string> BuildCommand(const std::filesystem::path& config_path) const;

 private:
  SolverSettings settings_;
  std::filesystem::path working_dir_;
};

#endif  // SOLVER_PROCESS_H
