#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace foreman::db::memory {

class MemoryTransaction;

/*
  In-process repository used when no database is configured and by tests.
  Nothing survives a restart.
*/
class MemoryRepository final : public db::Repository {
 public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result                           InsertRun(Transaction&, model::RunRecord&) override;
  Result                           UpdateRun(Transaction&, const model::RunRecord&) override;
  std::optional<model::RunRecord>  GetRun(Transaction&, const std::string& agent_id) override;
  std::vector<model::RunRecord>    QueryRuns(Transaction&, const model::RunQuery&) override;
  std::vector<model::RunRecord>    ListRunsByStatus(Transaction&, foreman::v1::RunStatus) override;
  Result                           MarkStaleRunsCrashed(Transaction&, int64_t now_ms, uint64_t& affected) override;
  Result                           DeleteRunsOlderThan(Transaction&, int64_t cutoff_ms, uint64_t& deleted) override;
  model::RunStatsRecord            GetRunStats(Transaction&) override;

  Result                           InsertPrompt(Transaction&, model::PromptRecord&) override;
  std::vector<model::PromptRecord> GetPrompts(Transaction&, const std::string& agent_id) override;

  Result                           InsertOutput(Transaction&, model::OutputRecord&) override;
  std::vector<model::OutputRecord> GetOutputs(Transaction&, const model::OutputQuery&) override;

 private:
  friend class MemoryTransaction;

  struct State {
    std::map<std::string, model::RunRecord> runs; // by agent_id
    std::vector<model::PromptRecord>        prompts;
    std::vector<model::OutputRecord>        outputs;
    int64_t                                 next_run_id    = 1;
    int64_t                                 next_prompt_id = 1;
    int64_t                                 next_output_id = 1;
  };

  std::mutex writer_mutex_; // held for a transaction's lifetime
  std::mutex mutex_;
  State      committed_;
  uint64_t   committed_version_ = 0;
};

} // namespace foreman::db::memory
