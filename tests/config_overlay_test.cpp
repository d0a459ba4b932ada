#include "config_overlay.h"
#include "file_utils.h"

#include <algorithm>
#include <filesystem>
#include <iostream>
#include <string>

namespace {

int failures = 0;

void Check(bool condition, const std::string& message) {
  if (!condition) {
    std::cerr << "FAIL: " << message << "\n";
    ++failures;
  }
}

bool Contains(const std::string& text, const std::string& needle) {
  return text.find(needle) != std::string::npos;
}

bool HasKey(const std::vector<std::string>& keys, const std::string& key) {
  return std::find(keys.begin(), keys.end(), key) != keys.end();
}

const char* kBase =
    "% ------------- TURBULENCE MODEL -------------\n"
    "KIND_TURB_MODEL= SA\n"
    "% PRANDTL_TURB= 0.90 (commented default)\n"
    "PRANDTL_TURB= 0.90\n"
    "  iter = 9999\n"
    "RESTART_SOL= YES\n"
    "OUTPUT_FILES= (RESTART, PARAVIEW)\n"
    "VOLUME_FILENAME= vol_solution\n"
    "MESH_FILENAME= mesh_flatplate.su2\n";

void TestRewritesKnownDirectives() {
  SolverOverrides overrides;
  const DirectiveList directives = BuildTrialDirectives(0.566, overrides);
  const OverlayResult result = OverlayConfigText(kBase, directives);

  Check(Contains(result.text, "PRANDTL_TURB= 0.566\n"), "PRANDTL_TURB rewritten");
  Check(Contains(result.text, "ITER= 51\n"), "lowercase iter key rewritten");
  Check(!Contains(result.text, "9999"), "old ITER value removed");
  Check(Contains(result.text, "RESTART_SOL= NO\n"), "restart disabled");
  Check(Contains(result.text, "OUTPUT_FILES= (RESTART, PARAVIEW, TECPLOT_ASCII)\n"),
        "output files include Tecplot ASCII");
  Check(Contains(result.text, "VOLUME_FILENAME= flow\n"), "volume filename fixed");
  Check(Contains(result.text, "% PRANDTL_TURB= 0.90 (commented default)\n"),
        "comment lines pass through");
  Check(Contains(result.text, "KIND_TURB_MODEL= SA\n"), "unrelated directives pass through");
  Check(Contains(result.text, "MESH_FILENAME= mesh_flatplate.su2\n"), "mesh line preserved");

  Check(HasKey(result.replaced, "PRANDTL_TURB"), "PRANDTL_TURB reported as replaced");
  Check(HasKey(result.appended, "OUTPUT_WRT_FREQ"), "missing OUTPUT_WRT_FREQ appended");
  Check(HasKey(result.appended, "CONV_FILENAME"), "missing CONV_FILENAME appended");
  Check(Contains(result.text, "OUTPUT_WRT_FREQ= 10\n"), "appended directive written");
}

void TestDirectiveValues() {
  SolverOverrides overrides;
  overrides.iterations = 7;
  overrides.conv_filename.clear();
  const DirectiveList directives = BuildTrialDirectives(0.9, overrides);
  bool has_conv = false;
  for (const auto& directive : directives) {
    if (directive.first == "CONV_FILENAME") {
      has_conv = true;
    }
    if (directive.first == "ITER") {
      Check(directive.second == "7", "iteration override used");
    }
  }
  Check(!has_conv, "empty conv filename is not emitted");
  Check(directives.front().first == "PRANDTL_TURB", "PRANDTL_TURB leads the directives");
}

void TestWriteTrialConfig() {
  const std::filesystem::path dir =
      std::filesystem::temp_directory_path() / ("prtcal_overlay_" + GenerateRandomTag(8));
  const std::filesystem::path base = dir / "base.cfg";
  std::string error;
  Check(WriteTextFile(base, kBase, &error), "base config written: " + error);

  const std::filesystem::path out = TrialConfigPath(dir, "Iter_1_Pr0.6719");
  Check(out.filename() == "run_Iter_1_Pr0.6719.cfg", "trial config name");
  OverlayResult result;
  Check(WriteTrialConfig(base, out, BuildTrialDirectives(0.6719, SolverOverrides()), &result,
                         &error),
        "trial config written: " + error);
  std::string text;
  Check(ReadTextFile(out, &text, &error), "trial config readable");
  Check(Contains(text, "PRANDTL_TURB= 0.6719\n"), "trial config has the parameter");

  Check(!WriteTrialConfig(dir / "missing.cfg", out, DirectiveList(), nullptr, &error),
        "missing base config is an error");

  std::error_code ec;
  std::filesystem::remove_all(dir, ec);
}

}  // namespace

int main() {
  TestRewritesKnownDirectives();
  TestDirectiveValues();
  TestWriteTrialConfig();
  if (failures > 0) {
    std::cerr << failures << " config overlay check(s) failed\n";
    return 1;
  }
  std::cout << "config_overlay_test passed\n";
  return 0;
}
