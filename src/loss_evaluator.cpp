#include "loss_evaluator.h"

#include <cmath>

namespace {

LossEvaluation Sentinel(LossStatus status, const std::string& note) {
  LossEvaluation out;
  out.loss = kSentinelLoss;
  out.status = status;
  out.note = note;
  return out;
}

}  // namespace

const char* LossStatusToken(LossStatus status) {
  switch (status) {
    case LossStatus::Scored:
      return "scored";
    case LossStatus::Unparseable:
      return "unparseable";
    case LossStatus::EmptySlice:
      return "empty_slice";
    case LossStatus::NumericalError:
      return "numerical_error";
  }
  return "unknown";
}

LossEvaluation ComputeProfileRmse(const ProfileSlice& slice, const ReferenceCurve& curve) {
  if (slice.empty()) {
    return Sentinel(LossStatus::EmptySlice, "empty slice");
  }
  if (curve.empty()) {
    return Sentinel(LossStatus::NumericalError, "empty reference curve");
  }
  double sum_sq = 0.0;
  for (const auto& p : slice.points) {
    const double expected = InterpolateClamped(curve, p.u_norm);
    const double diff = p.t_norm - expected;
    sum_sq += diff * diff;
  }
  const double rmse = std::sqrt(sum_sq / static_cast<double>(slice.points.size()));
  if (!std::isfinite(rmse)) {
    return Sentinel(LossStatus::NumericalError, "non-finite RMSE");
  }
  LossEvaluation out;
  out.loss = rmse;
  out.status = LossStatus::Scored;
  out.points = static_cast<int>(slice.points.size());
  return out;
}

LossEvaluation EvaluateTable(const ResultTable& table,
                             const StationWindow& window,
                             const FreestreamScales& scales,
                             const ReferenceCurve& curve,
                             ProfileSlice* slice_out) {
  ProfileSlice slice;
  std::string error;
  if (!ExtractProfile(table, window, scales, &slice, &error)) {
    if (slice_out) {
      *slice_out = slice;
    }
    if (slice.nonfinite_rows > 0 || !(scales.u_inf > 0.0) || !(scales.t_inf > 0.0)) {
      return Sentinel(LossStatus::NumericalError, error);
    }
    if (slice.window_rows == 0 && table.HasColumn(column::kX) &&
        table.HasColumn(column::kVelocityX) && table.HasColumn(column::kTemperature)) {
      return Sentinel(LossStatus::EmptySlice, error);
    }
    return Sentinel(LossStatus::Unparseable, error);
  }
  LossEvaluation result = ComputeProfileRmse(slice, curve);
  if (slice_out) {
    *slice_out = std::move(slice);
  }
  return result;
}

LossEvaluation EvaluateOutputFile(const std::filesystem::path& path,
                                  const StationWindow& window,
                                  const FreestreamScales& scales,
                                  const ReferenceCurve& curve,
                                  ProfileSlice* slice_out) {
  const TableReadResult read = ReadTecplotTable(path);
  if (!read.ok) {
    return Sentinel(LossStatus::Unparseable, read.error);
  }
  return EvaluateTable(read.table, window, scales, curve, slice_out);
}
