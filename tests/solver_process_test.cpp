#include "file_utils.h"
#include "solver_process.h"
#include "string_utils.h"

#include <filesystem>
#include <iostream>
#include <string>

namespace {

int failures = 0;

void Check(bool condition, const std::string& message) {
  if (!condition) {
    std::cerr << "FAIL: " << message << "\n";
    ++failures;
  }
}

void TestExitStatus() {
  ProcessOptions options;
  ProcessResult ok = RunProcess({"/bin/sh", "-c", "exit 0"}, options);
  Check(ok.started && ok.exit_code == 0 && ok.ok(), "exit 0 is success");

  ProcessResult failed = RunProcess({"/bin/sh", "-c", "exit 3"}, options);
  Check(failed.started, "failing command still starts");
  Check(failed.exit_code == 3 && !failed.ok(), "exit 3 is failure");
  Check(DescribeProcessResult(failed) == "exit 3", "exit status described");

  ProcessResult missing = RunProcess({"prtcal-no-such-solver-binary"}, options);
  Check(!missing.started && !missing.ok(), "missing executable does not start");
  Check(!missing.error.empty(), "missing executable explained");

  ProcessResult empty = RunProcess({}, options);
  Check(!empty.started && !empty.error.empty(), "empty command rejected");
}

void TestTimeoutKillsProcess() {
  ProcessOptions options;
  options.timeout_seconds = 0.5;
  options.kill_grace_seconds = 1.0;
  const ProcessResult result = RunProcess({"/bin/sh", "-c", "sleep 30"}, options);
  Check(result.started, "sleeping command starts");
  Check(result.timed_out, "sleeping command times out");
  Check(!result.ok(), "timeout is not success");
  Check(result.seconds < 10.0, "timeout returns promptly");
}

void TestOutputAndWorkingDirectory() {
  const std::filesystem::path dir =
      std::filesystem::temp_directory_path() / ("prtcal_process_" + GenerateRandomTag(8));
  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  ProcessOptions options;
  options.working_dir = dir;
  options.output_path = dir / "out.log";
  const ProcessResult result =
      RunProcess({"/bin/sh", "-c", "echo hello; echo oops 1>&2; touch marker"}, options);
  Check(result.ok(), "echo command succeeds: " + DescribeProcessResult(result));
  std::string text;
  std::string error;
  Check(ReadTextFile(dir / "out.log", &text, &error), "output captured: " + error);
  Check(text.find("hello") != std::string::npos, "stdout redirected");
  Check(text.find("oops") != std::string::npos, "stderr redirected");
  Check(std::filesystem::exists(dir / "marker"), "child runs in the working directory");
  std::filesystem::remove_all(dir, ec);
}

void TestSubprocessSolver() {
  SolverSettings settings;
  settings.executable = "SU2_CFD";
  settings.launcher = "mpirun";
  settings.workers = 4;
  SubprocessSolver parallel(settings, ".");
  const std::vector<std::string> command = parallel.BuildCommand("run_Iter_1_Pr0.6719.cfg");
  Check(command.size() == 5, "parallel command has launcher");
  if (command.size() == 5) {
    Check(command[0] == "mpirun" && command[1] == "-n" && command[2] == "4",
          "launcher prefix");
    Check(command[3] == "SU2_CFD" && command[4] == "run_Iter_1_Pr0.6719.cfg", "solver and config");
  }
  settings.workers = 1;
  SubprocessSolver serial(settings, ".");
  Check(serial.BuildCommand("a.cfg").size() == 2, "single worker runs without launcher");

  // A shell script stands in for the solver so the whole invocation is exercised.
  const std::filesystem::path dir =
      std::filesystem::temp_directory_path() / ("prtcal_solver_" + GenerateRandomTag(8));
  std::string error;
  Check(WriteTextFile(dir / "run.cfg", "echo iterating\ntouch flow.dat\nexit 0\n", &error),
        "script written: " + error);
  settings.executable = "/bin/sh";
  settings.log_filename = "solver.log";
  SubprocessSolver script_solver(settings, dir);
  const ProcessResult result = script_solver.Invoke(dir / "run.cfg");
  Check(result.ok(), "script solver succeeds: " + DescribeProcessResult(result));
  Check(std::filesystem::exists(dir / "flow.dat"), "solver output lands in the work directory");
  std::string log;
  Check(ReadTextFile(dir / "solver.log", &log, &error) && prtcal::Trim(log) == "iterating",
        "solver log captured in the work directory");

  settings.timeout_seconds = 0.3;
  Check(WriteTextFile(dir / "hang.cfg", "sleep 30\n", &error), "hanging script written");
  SubprocessSolver hanging(settings, dir);
  const ProcessResult hung = hanging.Invoke(dir / "hang.cfg");
  Check(hung.timed_out, "hanging solver times out");

  std::error_code ec;
  std::filesystem::remove_all(dir, ec);
}

}  // namespace

int main() {
  TestExitStatus();
  TestTimeoutKillsProcess();
  TestOutputAndWorkingDirectory();
  TestSubprocessSolver();
  if (failures > 0) {
    std::cerr << failures << " solver process check(s) failed\n";
    return 1;
  }
  std::cout << "solver_process_test passed\n";
  return 0;
}
