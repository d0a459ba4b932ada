// Category-tagged session log shared by the driver, the search loop and the CLI.
#ifndef LOG_SERVICE_H
#define LOG_SERVICE_H

#include <filesystem>
#include <iosfwd>
#include <mutex>
#include <string>
#include <vector>

class LogService {
 public:
  struct FilterOptions {
    bool show_errors = true;
    bool show_warnings = true;
    bool show_info = true;
    std::string category;
    std::string search_text;
  };

  LogService() = default;
  explicit LogService(std::ostream* echo) : echo_(echo) {}
  LogService(const LogService& other);
  LogService& operator=(const LogService& other);
  LogService(LogService&&) = delete;
  LogService& operator=(LogService&&) = delete;
  ~LogService() = default;

  void Append(const std::string& category, const std::string& message);
  void Info(const std::string& category, const std::string& message);
  void Warning(const std::string& category, const std::string& message);
  void Error(const std::string& category, const std::string& message);
  void Clear();

  // Mirror every appended line to `echo` (nullptr disables the console trace).
  void SetEcho(std::ostream* echo);

  std::vector<std::string> GetFiltered(const FilterOptions& opts) const;
  std::vector<std::string> GetLogs() const;

  bool WriteToFile(const std::filesystem::path& path, std::string* error) const;

 private:
  std::vector<std::string> logs_;
  std::ostream* echo_ = nullptr;
  mutable std::mutex mutex_;
  static constexpr int kMaxLogs = 5000;
};

#endif  // LOG_SERVICE_H
