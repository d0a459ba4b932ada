#include "log_service.h"

#include <cstddef>
#include <ostream>
#include <sstream>

#include "file_utils.h"
#include "string_utils.h"

namespace {

bool IsError(const std::string& line) {
  return prtcal::ContainsCaseInsensitive(line, "error");
}

bool IsWarning(const std::string& line) {
  return prtcal::ContainsCaseInsensitive(line, "warning");
}

bool HasCategory(const std::string& line, const std::string& category) {
  if (category.empty()) return true;
  return prtcal::StartsWith(line, "[" + category + "]");
}

}  // namespace

LogService::LogService(const LogService& other) {
  std::lock_guard<std::mutex> lock(other.mutex_);
  logs_ = other.logs_;
  echo_ = other.echo_;
}

LogService& LogService::operator=(const LogService& other) {
  if (this == &other) {
    return *this;
  }
  std::scoped_lock lock(mutex_, other.mutex_);
  logs_ = other.logs_;
  echo_ = other.echo_;
  return *this;
}

void LogService::Append(const std::string& category, const std::string& message) {
  if (prtcal::Trim(message).empty()) {
    return;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  logs_.push_back("[" + category + "] " + message);
  if (echo_) {
    *echo_ << logs_.back() << "\n";
    echo_->flush();
  }
  if (logs_.size() > static_cast<size_t>(kMaxLogs)) {
    const size_t start = logs_.size() - static_cast<size_t>(kMaxLogs);
    logs_.erase(logs_.begin(), logs_.begin() + static_cast<std::ptrdiff_t>(start));
  }
}

void LogService::Info(const std::string& category, const std::string& message) {
  Append(category, message);
}

void LogService::Warning(const std::string& category, const std::string& message) {
  Append(category, "warning: " + message);
}

void LogService::Error(const std::string& category, const std::string& message) {
  Append(category, "error: " + message);
}

void LogService::Clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  logs_.clear();
}

void LogService::SetEcho(std::ostream* echo) {
  std::lock_guard<std::mutex> lock(mutex_);
  echo_ = echo;
}

std::vector<std::string> LogService::GetFiltered(const FilterOptions& opts) const {
  std::vector<std::string> out;
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto& line : logs_) {
    const bool error_line = IsError(line);
    const bool warning_line = IsWarning(line);

    if (error_line && !opts.show_errors) continue;
    if (warning_line && !opts.show_warnings) continue;
    if (!error_line && !warning_line && !opts.show_info) continue;
    if (!HasCategory(line, opts.category)) continue;

    if (!opts.search_text.empty() && !prtcal::ContainsCaseInsensitive(line, opts.search_text)) {
      continue;
    }
    out.push_back(line);
  }
  return out;
}

std::vector<std::string> LogService::GetLogs() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return logs_;
}

bool LogService::WriteToFile(const std::filesystem::path& path, std::string* error) const {
  std::ostringstream text;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& line : logs_) {
      text << line << "\n";
    }
  }
  return WriteTextFile(path, text.str(), error);
}
