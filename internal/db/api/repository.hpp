#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/output_record.hpp"
#include "internal/db/model/prompt_record.hpp"
#include "internal/db/model/run_record.hpp"
#include "internal/db/model/run_stats_record.hpp"

namespace foreman::db {

/*
  Run history repository.

  - All access goes through a Transaction
  - Data errors come back as Result, never as exceptions
  - Runs are keyed by agent_id; prompts and outputs reference it

  The repository is the durable record of worker lifetimes. Live worker
  state is owned by the supervisor and only mirrored here.
*/

class Repository {
 public:
  virtual ~Repository() = default;

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Runs
  // ---------------------------------------------------------------------

  // Assigns record.id. AlreadyExists if agent_id already has a run.
  virtual Result InsertRun(Transaction&, model::RunRecord& record) = 0;

  // Full-row update keyed by agent_id. NotFound if absent.
  virtual Result UpdateRun(Transaction&, const model::RunRecord& record) = 0;

  virtual std::optional<model::RunRecord> GetRun(Transaction&, const std::string& agent_id) = 0;

  // Filtered, newest started_at first.
  virtual std::vector<model::RunRecord> QueryRuns(Transaction&, const model::RunQuery& query) = 0;

  virtual std::vector<model::RunRecord> ListRunsByStatus(Transaction&, foreman::v1::RunStatus status) = 0;

  /*
    Startup reconciliation: every running / waiting_input run becomes
    crashed + resumable, ended and last-active at now_ms. An existing
    error message is kept, otherwise the restart message is stored.
  */
  virtual Result MarkStaleRunsCrashed(Transaction&, int64_t now_ms, uint64_t& affected) = 0;

  // Removes runs started before cutoff_ms along with their prompts and outputs.
  virtual Result DeleteRunsOlderThan(Transaction&, int64_t cutoff_ms, uint64_t& deleted) = 0;

  virtual model::RunStatsRecord GetRunStats(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Prompts
  // ---------------------------------------------------------------------

  virtual Result InsertPrompt(Transaction&, model::PromptRecord& record) = 0;

  // Oldest first.
  virtual std::vector<model::PromptRecord> GetPrompts(Transaction&, const std::string& agent_id) = 0;

  // ---------------------------------------------------------------------
  // Output history
  // ---------------------------------------------------------------------

  virtual Result InsertOutput(Transaction&, model::OutputRecord& record) = 0;

  // Oldest first; with a limit, the most recent `limit` rows.
  virtual std::vector<model::OutputRecord> GetOutputs(Transaction&, const model::OutputQuery& query) = 0;
};

constexpr const char* kRestartErrorMessage = "Process terminated unexpectedly (app restart)";

} // namespace foreman::db
