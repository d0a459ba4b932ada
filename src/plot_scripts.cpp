#include "plot_scripts.h"

#include <algorithm>
#include <iomanip>
#include <sstream>

#include "file_utils.h"
#include "solver_process.h"

namespace {

struct LossRange {
  double low = 0.0;
  double high = 1.0;
  double crash_y = 0.95;
};

LossRange ComputeLossRange(const std::vector<ConvergenceRow>& rows) {
  LossRange range;
  bool have_valid = false;
  double min_loss = 0.0;
  double max_loss = 0.0;
  for (const auto& row : rows) {
    if (!row.valid) {
      continue;
    }
    if (!have_valid) {
      min_loss = row.loss;
      max_loss = row.loss;
      have_valid = true;
    } else {
      min_loss = std::min(min_loss, row.loss);
      max_loss = std::max(max_loss, row.loss);
    }
  }
  if (have_valid) {
    range.low = min_loss * 0.9;
    range.high = max_loss * 1.1;
    if (range.high <= range.low) {
      range.high = range.low + 1.0;
    }
  }
  range.crash_y = range.high * 0.95;
  return range;
}

}  // namespace

ProfilePlotFiles ProfilePlotPaths(const std::filesystem::path& dir, const std::string& tag) {
  ProfilePlotFiles files;
  files.csv = dir / ("profile_Pr" + tag + ".csv");
  files.script = dir / ("plot_Pr" + tag + ".gp");
  files.image = dir / ("plot_Pr" + tag + ".png");
  return files;
}

bool WriteProfileCsv(const std::filesystem::path& csv_path,
                     const ProfileSlice& slice,
                     const ReferenceCurve& curve,
                     std::string* error) {
  std::ostringstream csv;
  csv << "u_norm,t_norm,t_ref,x\n";
  csv << std::setprecision(12);
  for (const auto& point : slice.points) {
    const double t_ref = curve.empty() ? 0.0 : InterpolateClamped(curve, point.u_norm);
    csv << point.u_norm << "," << point.t_norm << "," << t_ref << "," << point.x << "\n";
  }
  return WriteTextFile(csv_path, csv.str(), error);
}

bool WriteProfilePlotScript(const ProfilePlotFiles& files,
                            const ReferenceCurve& curve,
                            const std::string& title,
                            std::string* error) {
  std::ostringstream script;
  script << "set datafile separator ','\n";
  script << "set grid\n";
  script << "set key left top\n";
  script << "set title '" << title << "'\n";
  script << "set xlabel 'u / u_inf'\n";
  script << "set ylabel 'T / T_inf'\n";
  script << "set term pngcairo size 900,700\n";
  script << "set output '" << files.image.filename().string() << "'\n";
  script << "$ref << EOD\n";
  script << std::setprecision(12);
  for (size_t i = 0; i < curve.size(); ++i) {
    script << curve.u_norm[i] << "," << curve.t_norm[i] << "\n";
  }
  script << "EOD\n";
  script << "plot $ref using 1:2 with lines lw 2 title 'Reference', \\\n";
  script << "     '" << files.csv.filename().string()
         << "' every ::1 using 1:2 with points pt 7 ps 0.8 title 'Solver'\n";
  return WriteTextFile(files.script, script.str(), error);
}

std::vector<ConvergenceRow> BuildConvergenceRows(const std::vector<Trial>& trials,
                                                 double valid_threshold) {
  std::vector<ConvergenceRow> rows;
  rows.reserve(trials.size());
  int best = -1;
  for (size_t i = 0; i < trials.size(); ++i) {
    ConvergenceRow row;
    row.iteration = trials[i].iteration;
    row.parameter = trials[i].parameter;
    row.loss = trials[i].loss;
    row.valid = trials[i].loss < valid_threshold;
    row.last = (i + 1 == trials.size());
    if (row.valid && (best < 0 || row.loss < rows[static_cast<size_t>(best)].loss)) {
      best = static_cast<int>(i);
    }
    rows.push_back(row);
  }
  if (best >= 0) {
    rows[static_cast<size_t>(best)].best = true;
  }
  return rows;
}

bool WriteConvergenceCsv(const std::filesystem::path& csv_path,
                         const std::vector<ConvergenceRow>& rows,
                         std::string* error) {
  std::ostringstream csv;
  csv << "iteration,parameter,loss,valid,best,last\n";
  csv << std::setprecision(12);
  for (const auto& row : rows) {
    csv << row.iteration << "," << row.parameter << "," << row.loss << ","
        << (row.valid ? 1 : 0) << "," << (row.best ? 1 : 0) << "," << (row.last ? 1 : 0) << "\n";
  }
  return WriteTextFile(csv_path, csv.str(), error);
}

bool WriteConvergencePlotScript(const std::filesystem::path& plot_path,
                                const std::filesystem::path& csv_path,
                                const std::vector<ConvergenceRow>& rows,
                                std::string* error) {
  std::filesystem::path image_path = plot_path;
  image_path.replace_extension(".png");
  const std::string csv_name = csv_path.filename().string();
  const LossRange range = ComputeLossRange(rows);

  std::ostringstream script;
  script << std::setprecision(12);
  script << "set datafile separator ','\n";
  script << "set grid\n";
  script << "set key right top\n";
  script << "set title 'Convergence of Pr_t calibration'\n";
  script << "set xlabel 'Iteration'\n";
  script << "set ylabel 'RMSE (temperature error)'\n";
  script << "set yrange [" << range.low << ":" << range.high << "]\n";
  script << "crash_y = " << range.crash_y << "\n";
  script << "set term pngcairo size 900,700\n";
  script << "set output '" << image_path.filename().string() << "'\n";
  script << "plot '" << csv_name << "' every ::1 using 1:($4==1 ? $3 : 1/0) "
         << "with linespoints pt 7 ps 1.2 lc rgb 'blue' title 'Optimization path', \\\n";
  script << "     '" << csv_name << "' every ::1 using 1:($4==0 ? crash_y : 1/0) "
         << "with points pt 2 ps 1.5 lc rgb 'red' title 'Crash penalty', \\\n";
  script << "     '" << csv_name << "' every ::1 using 1:($5==1 ? $3 : 1/0) "
         << "with points pt 3 ps 2.5 lc rgb 'dark-green' title 'Best', \\\n";
  script << "     '" << csv_name << "' every ::1 using 1:($6==1 ? ($4==1 ? $3 : crash_y) : 1/0) "
         << "with points pt 6 ps 2.0 lc rgb 'black' title 'Last iteration'\n";

  return WriteTextFile(plot_path, script.str(), error);
}

bool RenderPlotScript(const std::string& gnuplot,
                      const std::filesystem::path& script_path,
                      std::string* error) {
  ProcessOptions options;
  options.working_dir = script_path.has_parent_path() ? script_path.parent_path()
                                                      : std::filesystem::path(".");
  const ProcessResult result = RunProcess({gnuplot, script_path.filename().string()}, options);
  if (!result.ok()) {
    if (error) {
      *error = gnuplot + " " + script_path.filename().string() + ": " +
               DescribeProcessResult(result);
    }
    return false;
  }
  return true;
}
