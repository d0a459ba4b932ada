#ifndef LOSS_EVALUATOR_H
#define LOSS_EVALUATOR_H

#include <filesystem>
#include <string>

#include "calib_config.h"
#include "profile_extractor.h"
#include "reference_curve.h"

// Loss reported when a trial's output cannot be scored. Far above any converged
// RMSE but finite, so the bounded search still orders it.
constexpr double kSentinelLoss = 999.0;

enum class LossStatus {
  Scored,
  Unparseable,
  EmptySlice,
  NumericalError,
};

const char* LossStatusToken(LossStatus status);

struct LossEvaluation {
  double loss = kSentinelLoss;
  LossStatus status = LossStatus::Unparseable;
  std::string note;
  int points = 0;

  bool scored() const { return status == LossStatus::Scored; }
};

// RMSE of t_norm against the reference interpolated at each u_norm.
LossEvaluation ComputeProfileRmse(const ProfileSlice& slice, const ReferenceCurve& curve);

// Extract + score; each failure maps to kSentinelLoss with a status.
LossEvaluation EvaluateTable(const ResultTable& table,
                             const StationWindow& window,
                             const FreestreamScales& scales,
                             const ReferenceCurve& curve,
                             ProfileSlice* slice_out = nullptr);

// Parse + extract + score a solver output file.
LossEvaluation EvaluateOutputFile(const std::filesystem::path& path,
                                  const StationWindow& window,
                                  const FreestreamScales& scales,
                                  const ReferenceCurve& curve,
                                  ProfileSlice* slice_out = nullptr);

#endif  // LOSS_EVALUATOR_H
