#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace foreman::runs {

/*
  RunStore

  Facade over db::Repository for worker run history. Every write runs in its
  own transaction; failures are logged with the agent id and returned as a
  db::Result so callers on the stream path can ignore them safely.

  Reads propagate backend exceptions to the caller.
*/
class RunStore {
 public:
  using Mutator = std::function<void(db::model::RunRecord&)>;

  explicit RunStore(std::shared_ptr<db::Repository> repository);

  db::Result Create(db::model::RunRecord record);

  // read-modify-write of one run inside a single transaction
  db::Result Update(const std::string& agent_id, const Mutator& mutate);

  db::Result RecordPrompt(const std::string& agent_id, const std::string& prompt, int64_t timestamp_ms);
  db::Result RecordOutput(db::model::OutputRecord record);

  std::optional<db::model::RunRecord>  Get(const std::string& agent_id);
  std::vector<db::model::RunRecord>    Query(const db::model::RunQuery& query);
  std::vector<db::model::RunRecord>    Resumable();
  std::vector<db::model::PromptRecord> Prompts(const std::string& agent_id);
  std::vector<db::model::OutputRecord> Outputs(const db::model::OutputQuery& query);
  db::model::RunStatsRecord            Stats();

  /*
    Startup reconciliation: runs left running / waiting_input by a previous
    process become crashed and resumable. Returns how many were marked.
  */
  uint64_t ReconcileStaleRuns(int64_t now_ms);

  // Deletes runs (with prompts and outputs) that started more than `days` ago.
  uint64_t CleanupOlderThan(uint32_t days, int64_t now_ms);

 private:
  db::Result Write(const char* op, const std::string& agent_id, const std::function<db::Result(db::Repository&, db::Transaction&)>& body);

  template <typename T>
  T Read(const std::function<T(db::Repository&, db::Transaction&)>& body);

  std::shared_ptr<db::Repository> repository_;
};

} // namespace foreman::runs
