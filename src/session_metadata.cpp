#include "session_metadata.h"

#include <ctime>
#include <iomanip>
#include <sstream>

#include <sys/utsname.h>

#include <nlohmann/json.hpp>

#include "file_utils.h"
#include "provenance.h"

#ifndef PRTCAL_GIT_SHA
#define PRTCAL_GIT_SHA "unknown"
#endif
#ifndef PRTCAL_BUILD_TIMESTAMP
#define PRTCAL_BUILD_TIMESTAMP __DATE__ " " __TIME__
#endif
#ifndef PRTCAL_BUILD_TYPE
#define PRTCAL_BUILD_TYPE "unknown"
#endif

namespace {
using json = nlohmann::json;

// Local time, matching the session directory names.
std::string Timestamp() {
  const std::tm now = LocalTimeNow();
  std::ostringstream oss;
  oss << std::put_time(&now, "%Y-%m-%dT%H:%M:%S");
  return oss.str();
}

json HostJson() {
  json host = {{"os", "unknown"}, {"release", "unknown"}, {"arch", "unknown"}};
  struct utsname info;
  if (uname(&info) == 0) {
    host["os"] = info.sysname;
    host["release"] = info.release;
    host["arch"] = info.machine;
  }
  return host;
}

json TrialJson(const Trial& trial) {
  json entry;
  entry["iteration"] = trial.iteration;
  entry["parameter"] = trial.parameter;
  entry["loss"] = trial.loss;
  entry["elapsed_seconds"] = trial.elapsed_seconds;
  entry["status"] = TrialStatusToken(trial.status);
  return entry;
}

bool DumpAndWrite(const json& root, int indent, const std::filesystem::path& path,
                  std::string* error) {
  std::string payload;
  try {
    payload = root.dump(indent);
  } catch (const json::exception& exc) {
    if (error) {
      *error = std::string("failed to serialize ") + path.filename().string() + ": " + exc.what();
    }
    return false;
  }
  return WriteTextFile(path, payload, error);
}
}  // namespace

std::string BuildSessionMetadataJson(const CalibConfig& config,
                                     const std::filesystem::path& session_dir) {
  json root;
  root["schema_version"] = 1;
  root["generated_at"] = Timestamp();
  std::string git_sha = PRTCAL_GIT_SHA;
  if (git_sha.empty()) {
    git_sha = "unknown";
  }
  root["git_sha"] = git_sha;

  json build;
  std::string build_type = PRTCAL_BUILD_TYPE;
  if (build_type.empty()) {
    build_type = "unknown";
  }
  build["type"] = build_type;
  build["timestamp"] = PRTCAL_BUILD_TIMESTAMP;
  build["compiler"] = __VERSION__;
  build["cxx_standard"] = static_cast<int>(__cplusplus);
  root["build"] = build;
  root["host"] = HostJson();

  const std::string config_text = SerializeCalibConfig(config, 0);
  try {
    root["config"] = json::parse(config_text);
  } catch (const json::exception&) {
    root["config"] = config_text;
  }
  root["session_dir"] = session_dir.string();
  return root.dump(2);
}

bool WriteSessionMetadata(const std::filesystem::path& session_dir,
                          const CalibConfig& config,
                          std::string* error) {
  return WriteTextFile(session_dir / kSessionMetadataFile,
                       BuildSessionMetadataJson(config, session_dir), error);
}

namespace {
json BuildSummaryRoot(const SessionSummaryData& data) {
  json root;
  root["schema_version"] = 1;
  root["generated_at"] = Timestamp();
  root["session_dir"] = data.session_dir;
  root["total_seconds"] = data.total_seconds;

  json trials = json::array();
  for (const auto& trial : data.trials) {
    trials.push_back(TrialJson(trial));
  }
  root["trials"] = trials;

  const Trial* best = BestTrial(data.trials);
  root["best"] = best ? TrialJson(*best) : json(nullptr);

  json search;
  search["x"] = data.search.x;
  search["fx"] = data.search.fx;
  search["evaluations"] = data.search.evaluations;
  search["converged"] = data.search.converged;
  search["message"] = data.search.message;
  root["search"] = search;

  json verification;
  verification["ran"] = data.verification.ran;
  if (data.verification.ran) {
    verification["parameter"] = data.verification.parameter;
    verification["loss"] = data.verification.loss;
    verification["status"] = TrialStatusToken(data.verification.status);
    verification["archived"] = data.verification.archived;
    if (!data.verification.artifact_dir.empty()) {
      verification["artifact_dir"] = data.verification.artifact_dir;
    }
    if (!data.verification.note.empty()) {
      verification["note"] = data.verification.note;
    }
  }
  root["verification"] = verification;
  return root;
}
}  // namespace

std::string BuildSessionSummaryJson(const SessionSummaryData& data, int indent) {
  return BuildSummaryRoot(data).dump(indent);
}

bool WriteSessionSummary(const std::filesystem::path& session_dir,
                         const SessionSummaryData& data,
                         std::string* error) {
  return DumpAndWrite(BuildSummaryRoot(data), 2, session_dir / kSessionSummaryFile, error);
}
