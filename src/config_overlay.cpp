#include "config_overlay.h"

#include <iomanip>
#include <set>
#include <sstream>

#include "file_utils.h"
#include "string_utils.h"

namespace {

std::string FormatValue(double value) {
  std::ostringstream oss;
  oss << std::setprecision(12) << value;
  return oss.str();
}

// Key of a `KEY= value` line, or empty for comments and other lines.
std::string DirectiveKey(const std::string& line) {
  const std::string trimmed = prtcal::Trim(line);
  if (trimmed.empty() || trimmed[0] == '%') {
    return {};
  }
  const size_t eq = trimmed.find('=');
  if (eq == std::string::npos) {
    return {};
  }
  return prtcal::ToUpper(prtcal::Trim(trimmed.substr(0, eq)));
}

}  // namespace

DirectiveList BuildTrialDirectives(double prandtl_turb, const SolverOverrides& overrides) {
  DirectiveList directives;
  directives.emplace_back("PRANDTL_TURB", FormatValue(prandtl_turb));
  directives.emplace_back("RESTART_SOL", "NO");
  directives.emplace_back("OUTPUT_WRT_FREQ", std::to_string(overrides.output_frequency));
  directives.emplace_back("ITER", std::to_string(overrides.iterations));
  directives.emplace_back("OUTPUT_FILES", overrides.output_files);
  directives.emplace_back("VOLUME_FILENAME", overrides.volume_filename);
  if (!overrides.conv_filename.empty()) {
    directives.emplace_back("CONV_FILENAME", overrides.conv_filename);
  }
  if (!overrides.restart_filename.empty()) {
    directives.emplace_back("RESTART_FILENAME", overrides.restart_filename);
  }
  return directives;
}

OverlayResult OverlayConfigText(const std::string& base, const DirectiveList& directives) {
  OverlayResult result;
  std::set<std::string> seen;
  std::ostringstream out;
  std::istringstream in(base);
  std::string line;
  while (std::getline(in, line)) {
    const std::string key = DirectiveKey(line);
    bool rewritten = false;
    if (!key.empty()) {
      for (const auto& directive : directives) {
        if (directive.first != key) {
          continue;
        }
        out << directive.first << "= " << directive.second << "\n";
        if (seen.insert(key).second) {
          result.replaced.push_back(key);
        }
        rewritten = true;
        break;
      }
    }
    if (!rewritten) {
      out << line << "\n";
    }
  }
  for (const auto& directive : directives) {
    if (seen.count(directive.first) > 0) {
      continue;
    }
    out << directive.first << "= " << directive.second << "\n";
    result.appended.push_back(directive.first);
  }
  result.text = out.str();
  return result;
}

bool WriteTrialConfig(const std::filesystem::path& base_path,
                      const std::filesystem::path& out_path,
                      const DirectiveList& directives,
                      OverlayResult* result,
                      std::string* error) {
  std::string base;
  if (!ReadTextFile(base_path, &base, error)) {
    return false;
  }
  OverlayResult overlay = OverlayConfigText(base, directives);
  if (!WriteTextFile(out_path, overlay.text, error)) {
    return false;
  }
  if (result) {
    *result = std::move(overlay);
  }
  return true;
}

std::filesystem::path TrialConfigPath(const std::filesystem::path& work_dir, const std::string& run_id) {
  return work_dir / ("run_" + run_id + ".cfg");
}
