#include "solver_process.h"

#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <sstream>
#include <system_error>
#include <thread>
#include <utility>

#include <fcntl.h>
#include <spawn.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace {

constexpr auto kPollInterval = std::chrono::milliseconds(50);

double SecondsSince(std::chrono::steady_clock::time_point start) {
  return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
}

void RecordExit(int status, ProcessResult* result) {
  if (WIFEXITED(status)) {
    result->exit_code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    result->term_signal = WTERMSIG(status);
  }
}

// Blocks until the child is reaped; returns false if waitpid fails.
bool WaitBlocking(pid_t pid, int* status) {
  while (true) {
    const pid_t r = waitpid(pid, status, 0);
    if (r == pid) return true;
    if (r < 0 && errno == EINTR) continue;
    return false;
  }
}

// Polls until the child exits or `limit` seconds pass. Returns 1 when reaped,
// 0 on timeout, -1 on waitpid failure.
int WaitWithLimit(pid_t pid, int* status, double limit,
                  std::chrono::steady_clock::time_point start) {
  while (true) {
    const pid_t r = waitpid(pid, status, WNOHANG);
    if (r == pid) return 1;
    if (r < 0 && errno != EINTR) return -1;
    if (SecondsSince(start) >= limit) return 0;
    std::this_thread::sleep_for(kPollInterval);
  }
}

}  // namespace

ProcessResult RunProcess(const std::vector<std::string>& args, const ProcessOptions& options) {
  ProcessResult result;
  if (args.empty()) {
    result.error = "missing process args";
    return result;
  }

  posix_spawn_file_actions_t actions;
  posix_spawn_file_actions_init(&actions);
  const std::string out_path =
      options.output_path.empty() ? std::string("/dev/null") : options.output_path.string();
  const std::string cwd = options.working_dir.string();
  // Redirections run before the chdir so relative paths resolve against our cwd.
  posix_spawn_file_actions_addopen(&actions, STDIN_FILENO, "/dev/null", O_RDONLY, 0);
  posix_spawn_file_actions_addopen(&actions, STDOUT_FILENO, out_path.c_str(),
                                   O_WRONLY | O_CREAT | O_TRUNC, 0644);
  posix_spawn_file_actions_adddup2(&actions, STDOUT_FILENO, STDERR_FILENO);
  if (!cwd.empty()) {
    posix_spawn_file_actions_addchdir_np(&actions, cwd.c_str());
  }

  // Own process group so a timeout can signal launcher workers too.
  posix_spawnattr_t attr;
  posix_spawnattr_init(&attr);
  posix_spawnattr_setflags(&attr, POSIX_SPAWN_SETPGROUP);
  posix_spawnattr_setpgroup(&attr, 0);

  std::vector<char*> argv;
  argv.reserve(args.size() + 1);
  for (const std::string& arg : args) {
    argv.push_back(const_cast<char*>(arg.c_str()));
  }
  argv.push_back(nullptr);

  const auto start = std::chrono::steady_clock::now();
  pid_t pid = 0;
  const int spawn_status = posix_spawnp(&pid, argv[0], &actions, &attr, argv.data(), environ);
  posix_spawn_file_actions_destroy(&actions);
  posix_spawnattr_destroy(&attr);
  if (spawn_status != 0) {
    result.error = "failed to start " + args[0] + ": " + std::strerror(spawn_status);
    return result;
  }
  result.started = true;

  int status = 0;
  if (options.timeout_seconds <= 0.0) {
    if (!WaitBlocking(pid, &status)) {
      result.error = std::string("waitpid failed: ") + std::strerror(errno);
      result.seconds = SecondsSince(start);
      return result;
    }
    RecordExit(status, &result);
    result.seconds = SecondsSince(start);
    return result;
  }

  const int waited = WaitWithLimit(pid, &status, options.timeout_seconds, start);
  if (waited == 1) {
    RecordExit(status, &result);
    result.seconds = SecondsSince(start);
    return result;
  }
  if (waited < 0) {
    result.error = std::string("waitpid failed: ") + std::strerror(errno);
    result.seconds = SecondsSince(start);
    return result;
  }

  result.timed_out = true;
  kill(-pid, SIGTERM);
  const auto term_sent = std::chrono::steady_clock::now();
  if (WaitWithLimit(pid, &status, options.kill_grace_seconds, term_sent) != 1) {
    kill(-pid, SIGKILL);
    WaitBlocking(pid, &status);
  }
  RecordExit(status, &result);
  result.seconds = SecondsSince(start);
  std::ostringstream oss;
  oss << "timed out after " << options.timeout_seconds << " s";
  result.error = oss.str();
  return result;
}

std::string DescribeProcessResult(const ProcessResult& result) {
  std::ostringstream oss;
  if (!result.started) {
    oss << "not started";
  } else if (result.timed_out) {
    oss << "timeout";
  } else if (result.term_signal != 0) {
    oss << "killed by signal " << result.term_signal;
  } else {
    oss << "exit " << result.exit_code;
  }
  if (!result.error.empty()) {
    oss << " (" << result.error << ")";
  }
  return oss.str();
}

SubprocessSolver::SubprocessSolver(SolverSettings settings, std::filesystem::path working_dir)
    : settings_(std::move(settings)), working_dir_(std::move(working_dir)) {}

std::vector<std::string> SubprocessSolver::BuildCommand(const std::filesystem::path& config_path) const {
  std::vector<std::string> command;
  if (settings_.workers > 1 && !settings_.launcher.empty()) {
    command.push_back(settings_.launcher);
    command.push_back("-n");
    command.push_back(std::to_string(settings_.workers));
  }
  command.push_back(settings_.executable);
  command.push_back(config_path.string());
  return command;
}

ProcessResult SubprocessSolver::Invoke(const std::filesystem::path& config_path) {
  ProcessOptions options;
  options.working_dir = working_dir_;
  if (!settings_.log_filename.empty()) {
    options.output_path = working_dir_ / settings_.log_filename;
  }
  options.timeout_seconds = settings_.timeout_seconds;
  // The child runs inside working_dir_, so hand it an absolute config path.
  std::error_code ec;
  std::filesystem::path absolute_config = std::filesystem::absolute(config_path, ec);
  if (ec) {
    absolute_config = config_path;
  }
  return RunProcess(BuildCommand(absolute_config), options);
}
