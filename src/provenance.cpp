#include "provenance.h"

#include <iomanip>
#include <sstream>
#include <system_error>

#include "file_utils.h"

namespace {

std::string FormatTime(const std::tm& when, const char* pattern) {
  std::ostringstream oss;
  oss << std::put_time(&when, pattern);
  return oss.str();
}

bool SameDirectory(const std::filesystem::path& a, const std::filesystem::path& b) {
  std::error_code ec;
  if (std::filesystem::exists(a, ec) && std::filesystem::exists(b, ec)) {
    const bool same = std::filesystem::equivalent(a, b, ec);
    if (!ec) {
      return same;
    }
  }
  return a.lexically_normal() == b.lexically_normal();
}

}  // namespace

std::string FormatParameterTag(double value, int precision) {
  std::ostringstream oss;
  oss << std::fixed << std::setprecision(precision) << value;
  return oss.str();
}

std::string ArtifactDirName(double value, int precision) {
  return "Pr_" + FormatParameterTag(value, precision);
}

ArchivePlan PlanTrialArchive(const std::filesystem::path& work_dir,
                             const std::filesystem::path& session_dir,
                             const std::string& dir_name,
                             const std::vector<std::string>& files) {
  ArchivePlan plan;
  plan.target_dir = session_dir / dir_name;
  plan.moves.reserve(files.size());
  for (const auto& name : files) {
    if (name.empty()) {
      continue;
    }
    plan.moves.push_back({work_dir / name, plan.target_dir / name});
  }
  return plan;
}

bool CommitArchivePlan(const ArchivePlan& plan, int* moved, std::string* error) {
  int count = 0;
  bool dir_ready = false;
  for (const auto& move : plan.moves) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(move.source, ec)) {
      continue;
    }
    if (!dir_ready) {
      std::filesystem::create_directories(plan.target_dir, ec);
      if (ec) {
        if (error) {
          *error = "failed to create artifact directory " + plan.target_dir.string() + ": " +
                   ec.message();
        }
        if (moved) {
          *moved = count;
        }
        return false;
      }
      dir_ready = true;
    }
    if (!MoveFileReplacing(move.source, move.destination, error)) {
      if (moved) {
        *moved = count;
      }
      return false;
    }
    ++count;
  }
  if (moved) {
    *moved = count;
  }
  return true;
}

std::tm LocalTimeNow() {
  const std::time_t t = std::time(nullptr);
  std::tm local = {};
  localtime_r(&t, &local);
  return local;
}

std::string InitialSessionDirName(const std::tm& when) {
  return "run_" + FormatTime(when, "%y%m%d_%H%M");
}

std::string BuildSessionDirName(const std::string& config_stem, int trial_count, const std::tm& when) {
  std::ostringstream oss;
  oss << config_stem << "_" << trial_count << "iter_" << FormatTime(when, "%y%m%d");
  return oss.str();
}

std::filesystem::path ResolveSessionDirCollision(const std::filesystem::path& results_root,
                                                 const std::string& name,
                                                 const std::tm& when) {
  std::error_code ec;
  std::filesystem::path candidate = results_root / name;
  if (!std::filesystem::exists(candidate, ec)) {
    return candidate;
  }
  const std::string timed = name + "_" + FormatTime(when, "%H%M");
  candidate = results_root / timed;
  for (int suffix = 2; std::filesystem::exists(candidate, ec); ++suffix) {
    candidate = results_root / (timed + "_" + std::to_string(suffix));
  }
  return candidate;
}

bool FinalizeSession(const std::filesystem::path& session_dir,
                     const std::vector<std::filesystem::path>& session_files,
                     const std::string& final_name,
                     const std::tm& when,
                     std::filesystem::path* final_dir,
                     std::string* error) {
  std::error_code ec;
  if (!std::filesystem::is_directory(session_dir, ec)) {
    if (error) {
      *error = "session directory not found: " + session_dir.string();
    }
    return false;
  }
  for (const auto& file : session_files) {
    if (!std::filesystem::is_regular_file(file, ec)) {
      continue;
    }
    const std::filesystem::path parent = file.has_parent_path() ? file.parent_path()
                                                                : std::filesystem::path(".");
    if (SameDirectory(parent, session_dir)) {
      continue;
    }
    if (!MoveFileReplacing(file, session_dir / file.filename(), error)) {
      return false;
    }
  }

  const std::filesystem::path root = session_dir.has_parent_path() ? session_dir.parent_path()
                                                                   : std::filesystem::path(".");
  if (session_dir.filename() == final_name) {
    if (final_dir) {
      *final_dir = session_dir;
    }
    return true;
  }
  const std::filesystem::path target = ResolveSessionDirCollision(root, final_name, when);
  std::filesystem::rename(session_dir, target, ec);
  if (ec) {
    if (error) {
      *error = "failed to rename " + session_dir.string() + " to " + target.string() + ": " +
               ec.message();
    }
    return false;
  }
  if (final_dir) {
    *final_dir = target;
  }
  return true;
}
