// Textual overlay of calibration directives onto a base solver configuration.
#ifndef CONFIG_OVERLAY_H
#define CONFIG_OVERLAY_H

#include <filesystem>
#include <string>
#include <utility>
#include <vector>

#include "calib_config.h"

// Directive key -> value, in output order.
using DirectiveList = std::vector<std::pair<std::string, std::string>>;

DirectiveList BuildTrialDirectives(double prandtl_turb, const SolverOverrides& overrides);

struct OverlayResult {
  std::string text;
  std::vector<std::string> replaced;  // keys found and rewritten in the template
  std::vector<std::string> appended;  // keys absent from the template, added at the end
};

// Rewrites lines of the form `KEY= value` whose key is in `directives`; comment
// lines ('%') and every other line pass through verbatim.
OverlayResult OverlayConfigText(const std::string& base, const DirectiveList& directives);

bool WriteTrialConfig(const std::filesystem::path& base_path,
                      const std::filesystem::path& out_path,
                      const DirectiveList& directives,
                      OverlayResult* result,
                      std::string* error);

std::filesystem::path TrialConfigPath(const std::filesystem::path& work_dir, const std::string& run_id);

#endif  // CONFIG_OVERLAY_H
