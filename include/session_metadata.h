#ifndef SESSION_METADATA_H
#define SESSION_METADATA_H

#include <filesystem>
#include <string>
#include <vector>

#include "bounded_search.h"
#include "calib_config.h"
#include "trial_log.h"

constexpr const char* kSessionMetadataFile = "session.meta.json";
constexpr const char* kSessionSummaryFile = "session.summary.json";

// Build/platform provenance plus the effective configuration.
std::string BuildSessionMetadataJson(const CalibConfig& config,
                                     const std::filesystem::path& session_dir);

bool WriteSessionMetadata(const std::filesystem::path& session_dir,
                          const CalibConfig& config,
                          std::string* error);

struct VerificationRecord {
  bool ran = false;
  double parameter = 0.0;
  double loss = 0.0;
  TrialStatus status = TrialStatus::Scored;
  bool archived = false;
  std::string artifact_dir;
  std::string note;
};

struct SessionSummaryData {
  std::string session_dir;
  std::vector<Trial> trials;
  SearchResult search;
  VerificationRecord verification;
  double total_seconds = 0.0;
};

std::string BuildSessionSummaryJson(const SessionSummaryData& data, int indent = 2);
bool WriteSessionSummary(const std::filesystem::path& session_dir,
                         const SessionSummaryData& data,
                         std::string* error);

#endif  // SESSION_METADATA_H
