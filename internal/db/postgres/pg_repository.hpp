#pragma once

#include "internal/db/api/repository.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace foreman::db::postgres {

class PgRepository final : public db::Repository {
 public:
  explicit PgRepository(std::shared_ptr<PgPool> pool);

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
  std::shared_ptr<PgPool> pool_;

  static PgTransaction& TX(Transaction& t);
  static Result         Translate(const std::exception&);
};

} // namespace foreman::db::postgres
