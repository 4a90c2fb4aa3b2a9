#pragma once

#include <string>
#include <string_view>

#include "pipeline.hpp"

namespace foreman::pipeline {

inline constexpr std::string_view kMaxIterationsReason = "max_iterations_reached";

/*
  Interprets the verification worker's conclusion.

  An explicit "decision" field wins. Without one, "overall_status" maps
  success -> complete, partial -> iterate, failed -> replan. Output that
  carries no usable JSON becomes an Iterate with a single issue so the
  builder gets another pass.
*/
Decision ParseDecision(std::string_view verification_output);

/*
  Applies one decision to the pipeline. The iteration record is appended
  before any state change.

  Complete  -> Completed, status "completed".
  GiveUp    -> VerificationFailed -> GaveUp, status "failed".
  Iterate   -> ReadyForExecution, build and verify reset.
  Replan    -> Planning, every step reset.

  Iterate and Replan fail the pipeline with kMaxIterationsReason when the
  next iteration would exceed a bounded max_iterations. Requires the
  pipeline to be in Verifying; throws util::InvalidTransition otherwise.
*/
void ApplyDecision(Pipeline& pipeline, const Decision& decision);

/*
  Finalizes the pipeline as failed from whatever working state it is in.
  States with no direct edge to Failed pass through the next working state
  first. No-op for a pipeline that is already terminal.
*/
void MarkFailed(Pipeline& pipeline, const std::string& reason);

} // namespace foreman::pipeline
