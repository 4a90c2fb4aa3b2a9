#pragma once

#include <string>
#include <vector>

#include "pipeline.hpp"

namespace foreman::pipeline {

/*
  Role prompts sent as the first user turn of each step's worker.

  The planning and verification prompts ask for a single JSON object so the
  output can be parsed into StepOutput::structured_data.
*/

std::string PlanningPrompt(const Pipeline& pipeline);

// Carries the plan and, from the second iteration on, the issues and suggestions of the last decision.
std::string BuildingPrompt(const Pipeline& pipeline);

std::string VerificationPrompt(const Pipeline& pipeline);

// Planning prompt for iteration > 1 after a replan decision.
std::string ReplanPrompt(const Pipeline& pipeline);

// Top-level "questions" array of the planning step's structured output.
std::vector<std::string> ExtractQuestions(const StepOutput& planning_output);

} // namespace foreman::pipeline
