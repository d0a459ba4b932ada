#include "trial_log.h"

#include <iomanip>
#include <sstream>
#include <utility>

#include "file_utils.h"
#include "string_utils.h"

namespace {
constexpr const char* kTrialLogHeader = "Iteration,Pr_t,RMSE,Time_Sec";
}  // namespace

const char* TrialStatusToken(TrialStatus status) {
  switch (status) {
    case TrialStatus::Scored:
      return "scored";
    case TrialStatus::Unparseable:
      return "unparseable";
    case TrialStatus::EmptySlice:
      return "empty_slice";
    case TrialStatus::NumericalError:
      return "numerical_error";
    case TrialStatus::SolverFailed:
      return "solver_failed";
    case TrialStatus::SolverTimeout:
      return "solver_timeout";
    case TrialStatus::Exception:
      return "exception";
  }
  return "unknown";
}

const Trial* BestTrial(const std::vector<Trial>& trials) {
  const Trial* best = nullptr;
  for (const auto& trial : trials) {
    if (!best || trial.loss < best->loss) {
      best = &trial;
    }
  }
  return best;
}

std::string FormatTrialLogRow(const Trial& trial) {
  std::ostringstream row;
  row << trial.iteration << ","
      << std::setprecision(12) << trial.parameter << ","
      << std::setprecision(12) << trial.loss << ","
      << std::setprecision(6) << trial.elapsed_seconds;
  return row.str();
}

bool TrialLogWriter::Open(const std::filesystem::path& path, std::string* error) {
  Close();
  if (path.has_parent_path()) {
    std::error_code ec;
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) {
      if (error) {
        *error = "failed to create trial log directory: " + ec.message();
      }
      return false;
    }
  }
  out_.open(path, std::ios::out | std::ios::trunc);
  if (!out_.is_open()) {
    if (error) {
      *error = "failed to open trial log: " + path.string();
    }
    return false;
  }
  path_ = path;
  out_ << kTrialLogHeader << "\n";
  out_.flush();
  if (!out_.good()) {
    if (error) {
      *error = "failed to write trial log: " + path.string();
    }
    return false;
  }
  return true;
}

bool TrialLogWriter::Append(const Trial& trial, std::string* error) {
  if (!out_.is_open()) {
    if (error) {
      *error = "trial log is not open";
    }
    return false;
  }
  out_ << FormatTrialLogRow(trial) << "\n";
  out_.flush();
  if (!out_.good()) {
    if (error) {
      *error = "failed to append to trial log: " + path_.string();
    }
    return false;
  }
  return true;
}

void TrialLogWriter::Close() {
  if (out_.is_open()) {
    out_.close();
  }
}

bool ReadTrialLog(const std::filesystem::path& path, std::vector<Trial>* trials, std::string* error) {
  std::string content;
  if (!ReadTextFile(path, &content, error)) {
    return false;
  }
  std::vector<Trial> parsed;
  std::istringstream in(content);
  std::string line;
  while (std::getline(in, line)) {
    const std::vector<std::string> fields = prtcal::SplitAny(line, ",\r");
    if (fields.size() < 3) {
      continue;
    }
    double iteration = 0.0;
    Trial trial;
    if (!prtcal::ParseDouble(prtcal::Trim(fields[0]), &iteration) ||
        !prtcal::ParseDouble(prtcal::Trim(fields[1]), &trial.parameter) ||
        !prtcal::ParseDouble(prtcal::Trim(fields[2]), &trial.loss)) {
      continue;
    }
    trial.iteration = static_cast<int>(iteration);
    if (fields.size() > 3 && !prtcal::ParseDouble(prtcal::Trim(fields[3]), &trial.elapsed_seconds)) {
      trial.elapsed_seconds = 0.0;
    }
    parsed.push_back(trial);
  }
  if (trials) {
    *trials = std::move(parsed);
  }
  return true;
}
