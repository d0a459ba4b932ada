#ifndef TRIAL_LOG_H
#define TRIAL_LOG_H

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

enum class TrialStatus {
  Scored,
  Unparseable,
  EmptySlice,
  NumericalError,
  SolverFailed,
  SolverTimeout,
  Exception,
};

const char* TrialStatusToken(TrialStatus status);

// One objective evaluation. Immutable once recorded.
struct Trial {
  int iteration = 0;
  double parameter = 0.0;
  double loss = 0.0;
  double elapsed_seconds = 0.0;
  TrialStatus status = TrialStatus::Scored;
};

// Minimum-loss trial (earliest on ties); nullptr when `trials` is empty.
const Trial* BestTrial(const std::vector<Trial>& trials);

// CSV trial log `Iteration,Pr_t,RMSE,Time_Sec`, flushed after every row so an
// interrupted session keeps every completed trial.
class TrialLogWriter {
 public:
  TrialLogWriter() = default;
  TrialLogWriter(const TrialLogWriter&) = delete;
  TrialLogWriter& operator=(const TrialLogWriter&) = delete;

  // Truncates `path` and writes the header.
  bool Open(const std::filesystem::path& path, std::string* error);
  bool Append(const Trial& trial, std::string* error);
  void Close();

  bool is_open() const { return out_.is_open(); }
  const std::filesystem::path& path() const { return path_; }

 private:
  std::filesystem::path path_;
  std::ofstream out_;
};

std::string FormatTrialLogRow(const Trial& trial);

// Reads a trial log back; status is not stored in the log and is inferred as
// Scored. Malformed rows are skipped.
bool ReadTrialLog(const std::filesystem::path& path, std::vector<Trial>* trials, std::string* error);

#endif  // TRIAL_LOG_H
