#include "loss_evaluator.h"
#include "profile_extractor.h"
#include "reference_curve.h"
#include "tecplot_reader.h"

#include <cmath>
#include <iostream>
#include <limits>
#include <string>

namespace {

int failures = 0;

void Check(bool condition, const std::string& message) {
  if (!condition) {
    std::cerr << "FAIL: " << message << "\n";
    ++failures;
  }
}

bool Near(double a, double b, double tol = 1e-12) {
  return std::fabs(a - b) <= tol;
}

ResultTable MakeTable(const std::vector<double>& x,
                      const std::vector<double>& u,
                      const std::vector<double>& t) {
  ResultTable table;
  table.names = {column::kX, column::kVelocityX, column::kTemperature};
  table.columns = {x, u, t};
  return table;
}

ReferenceCurve MakeCurve(const std::vector<double>& u, const std::vector<double>& t) {
  ReferenceCurve curve;
  curve.u_norm = u;
  curve.t_norm = t;
  return curve;
}

// Solver output that lies exactly on the reference scores zero.
void TestExactMatchScoresZero() {
  const FreestreamScales scales;
  const StationWindow window;
  const ResultTable table =
      MakeTable({1.5, 1.5, 1.5, 1.6, 1.4},
                {0.5 * scales.u_inf, 0.0, scales.u_inf, 10.0, 20.0},
                {2.0 * scales.t_inf, 3.0 * scales.t_inf, 1.0 * scales.t_inf, 1.0, 1.0});
  const ReferenceCurve curve = MakeCurve({0.0, 1.0}, {3.0, 1.0});
  ProfileSlice slice;
  const LossEvaluation eval = EvaluateTable(table, window, scales, curve, &slice);
  Check(eval.scored(), "exact match is scored");
  Check(Near(eval.loss, 0.0), "exact match loss is zero");
  Check(eval.points == 3, "only station rows are used");
  Check(slice.points.size() == 3, "slice keeps three rows");
  Check(slice.points.front().u_norm == 0.0 && slice.points.back().u_norm == 1.0,
        "slice is sorted by u_norm");
}

void TestKnownRmse() {
  const FreestreamScales scales{1.0, 1.0};
  const StationWindow window;
  const ResultTable table = MakeTable({1.5, 1.5}, {0.0, 1.0}, {1.0, 3.0});
  const ReferenceCurve curve = MakeCurve({0.0, 1.0}, {0.0, 0.0});
  const LossEvaluation eval = EvaluateTable(table, window, scales, curve);
  Check(eval.scored(), "known profile is scored");
  Check(Near(eval.loss, std::sqrt(5.0)), "rmse of residuals 1 and 3");
}

void TestSentinels() {
  const FreestreamScales scales;
  const StationWindow window;
  const ReferenceCurve curve = MakeCurve({0.0, 1.0}, {3.0, 1.0});

  const ResultTable off_station = MakeTable({0.1, 2.0}, {100.0, 200.0}, {300.0, 200.0});
  LossEvaluation eval = EvaluateTable(off_station, window, scales, curve);
  Check(eval.status == LossStatus::EmptySlice, "no station rows is an empty slice");
  Check(eval.loss == kSentinelLoss, "empty slice reports the sentinel");

  ResultTable no_temperature;
  no_temperature.names = {column::kX, column::kVelocityX};
  no_temperature.columns = {{1.5}, {100.0}};
  eval = EvaluateTable(no_temperature, window, scales, curve);
  Check(eval.status == LossStatus::Unparseable, "missing T is unparseable");
  Check(eval.loss == kSentinelLoss, "missing T reports the sentinel");

  const ResultTable good = MakeTable({1.5}, {100.0}, {300.0});
  eval = EvaluateTable(good, window, scales, ReferenceCurve());
  Check(eval.status == LossStatus::NumericalError, "empty reference is a numerical error");
  Check(eval.loss == kSentinelLoss, "empty reference reports the sentinel");

  const ResultTable infinite =
      MakeTable({1.5, 1.5}, {std::numeric_limits<double>::infinity(), 10.0}, {300.0, 200.0});
  eval = EvaluateTable(infinite, window, scales, curve);
  Check(eval.status == LossStatus::NumericalError, "non-finite velocity is a numerical error");
  Check(eval.loss == kSentinelLoss, "non-finite velocity reports the sentinel");

  eval = EvaluateTable(good, window, FreestreamScales{0.0, 47.4}, curve);
  Check(eval.status == LossStatus::NumericalError, "zero u_inf is a numerical error");

  eval = EvaluateOutputFile("/nonexistent/prtcal/flow.dat", window, scales, curve);
  Check(eval.status == LossStatus::Unparseable, "missing output file is unparseable");
  Check(eval.loss == kSentinelLoss, "missing output file reports the sentinel");
}

void TestWindowBoundaries() {
  const FreestreamScales scales{1.0, 1.0};
  StationWindow window;
  window.station = 1.0;
  window.tolerance = 0.5;
  const ResultTable table = MakeTable({0.5, 1.0, 1.5}, {1.0, 2.0, 3.0}, {1.0, 1.0, 1.0});

  ProfileSlice slice;
  std::string error;
  Check(ExtractProfile(table, window, scales, &slice, &error), "strict window keeps the centre");
  Check(slice.points.size() == 1, "strict window excludes both boundaries");

  window.inclusive = true;
  Check(ExtractProfile(table, window, scales, &slice, &error), "inclusive window extracts");
  Check(slice.points.size() == 3, "inclusive window keeps both boundaries");

  Check(!InStationWindow(0.5, StationWindow{1.0, 0.5, false}), "strict lower bound excluded");
  Check(InStationWindow(1.5, StationWindow{1.0, 0.5, true}), "inclusive upper bound kept");
}

void TestDuplicateAbscissaKeepsFirst() {
  const FreestreamScales scales{1.0, 1.0};
  const StationWindow window;
  const ResultTable table =
      MakeTable({1.5, 1.5, 1.5, 1.5}, {2.0, 1.0, 2.0, 0.5}, {20.0, 10.0, 99.0, 5.0});
  ProfileSlice slice;
  std::string error;
  Check(ExtractProfile(table, window, scales, &slice, &error), "duplicates extract: " + error);
  Check(slice.window_rows == 4, "all window rows counted");
  Check(slice.duplicate_rows == 1, "one duplicate dropped");
  Check(slice.points.size() == 3, "three unique abscissae remain");
  if (slice.points.size() == 3) {
    Check(slice.points[2].t_norm == 20.0, "first-seen duplicate survives");
  }
}

void TestDeterminism() {
  const FreestreamScales scales;
  const StationWindow window;
  const ResultTable table =
      MakeTable({1.5, 1.5, 1.5, 1.501}, {100.0, 900.0, 1500.0, 1800.0}, {400.0, 300.0, 120.0, 50.0});
  const ReferenceCurve curve = MakeCurve({0.0, 0.5, 1.0}, {8.0, 5.0, 1.0});
  const LossEvaluation first = EvaluateTable(table, window, scales, curve);
  const LossEvaluation second = EvaluateTable(table, window, scales, curve);
  Check(first.scored(), "determinism table is scored");
  Check(first.loss == second.loss, "identical inputs give identical loss");
  Check(std::isfinite(first.loss) && first.loss >= 0.0, "loss is finite and non-negative");
}

void TestInterpolationClamps() {
  const ReferenceCurve curve = MakeCurve({0.2, 0.4, 0.8}, {1.0, 3.0, 5.0});
  Check(InterpolateClamped(curve, 0.0) == 1.0, "below range clamps to first ordinate");
  Check(InterpolateClamped(curve, 2.0) == 5.0, "above range clamps to last ordinate");
  Check(Near(InterpolateClamped(curve, 0.3), 2.0), "interior point is linear");
  Check(Near(InterpolateClamped(curve, 0.4), 3.0), "knot returns its ordinate");
}

void TestReferenceParsing() {
  ReferenceCurve curve;
  std::string error;
  Check(ParseReferenceCurve("u/u_inf;T/T_inf\n0.0;3.0\n0.5;2.0\n\n1.0;1.0\n", &curve, &error),
        "semicolon reference parses: " + error);
  Check(curve.size() == 3, "header line skipped");

  Check(ParseReferenceCurve("0.0, 3.0\n0.5\t2.0\n", &curve, &error), "mixed delimiters parse");
  Check(curve.size() == 2, "mixed delimiters give two points");

  Check(!ParseReferenceCurve("0.5,1\n0.2,2\n", &curve, &error), "decreasing abscissa rejected");
  Check(!ParseReferenceCurve("only,text\n", &curve, &error), "curve without numbers rejected");
}

}  // namespace

int main() {
  TestExactMatchScoresZero();
  TestKnownRmse();
  TestSentinels();
  TestWindowBoundaries();
  TestDuplicateAbscissaKeepsFirst();
  TestDeterminism();
  TestInterpolationClamps();
  TestReferenceParsing();
  if (failures > 0) {
    std::cerr << failures << " profile/loss check(s) failed\n";
    return 1;
  }
  std::cout << "profile_loss_test passed\n";
  return 0;
}
