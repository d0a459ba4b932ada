// Naming and placement of trial artifacts and session directories.
#ifndef PROVENANCE_H
#define PROVENANCE_H

#include <ctime>
#include <filesystem>
#include <string>
#include <vector>

// Fixed-point parameter text used in directory and file names ("0.5660").
std::string FormatParameterTag(double value, int precision = 4);

// "Pr_<tag>".
std::string ArtifactDirName(double value, int precision = 4);

struct ArchiveMove {
  std::filesystem::path source;
  std::filesystem::path destination;
};

struct ArchivePlan {
  std::filesystem::path target_dir;
  std::vector<ArchiveMove> moves;
};

// Pure: maps each work-directory file name to `<session_dir>/<dir_name>/<name>`.
ArchivePlan PlanTrialArchive(const std::filesystem::path& work_dir,
                             const std::filesystem::path& session_dir,
                             const std::string& dir_name,
                             const std::vector<std::string>& files);

// Executes a plan. The target directory is created only when at least one
// source exists; existing destination files are replaced one at a time and
// missing sources are skipped. `moved` receives the number of files moved.
bool CommitArchivePlan(const ArchivePlan& plan, int* moved, std::string* error);

std::tm LocalTimeNow();

// "run_<yymmdd_HHMM>".
std::string InitialSessionDirName(const std::tm& when);

// "<stem>_<N>iter_<yymmdd>".
std::string BuildSessionDirName(const std::string& config_stem, int trial_count, const std::tm& when);

// `<root>/<name>` when free, otherwise `<root>/<name>_<HHMM>`, then a numeric
// suffix if that is taken too.
std::filesystem::path ResolveSessionDirCollision(const std::filesystem::path& results_root,
                                                 const std::string& name,
                                                 const std::tm& when);

// Moves `session_files` (those not already inside) into `session_dir`, then
// renames the directory to the collision-free form of `final_name`.
bool FinalizeSession(const std::filesystem::path& session_dir,
                     const std::vector<std::filesystem::path>& session_files,
                     const std::string& final_name,
                     const std::tm& when,
                     std::filesystem::path* final_dir,
                     std::string* error);

#endif  // PROVENANCE_H
