#include "pg_schema.hpp"

namespace foreman::db::postgres {

void BootstrapSchema(const std::shared_ptr<PgPool>& pool) {
  auto       conn = pool->Acquire();
  pqxx::work tx(*conn);

  tx.exec("CREATE TABLE IF NOT EXISTS agent_runs (id BIGSERIAL PRIMARY KEY, agent_id TEXT NOT NULL UNIQUE, session_id TEXT, "
          "working_dir TEXT NOT NULL, source TEXT NOT NULL, pipeline_id TEXT, status TEXT NOT NULL, started_at BIGINT NOT NULL, "
          "ended_at BIGINT, last_activity BIGINT NOT NULL, initial_prompt TEXT, error_message TEXT, total_prompts BIGINT DEFAULT 0, "
          "total_tool_calls BIGINT DEFAULT 0, total_output_bytes BIGINT DEFAULT 0, total_tokens_used BIGINT, "
          "total_cost_usd DOUBLE PRECISION, model_usage TEXT, can_resume BOOLEAN DEFAULT FALSE, resume_data TEXT);");
  tx.exec("CREATE INDEX IF NOT EXISTS idx_runs_status ON agent_runs(status);");
  tx.exec("CREATE INDEX IF NOT EXISTS idx_runs_started_at ON agent_runs(started_at DESC);");
  tx.exec("CREATE TABLE IF NOT EXISTS agent_prompts (id BIGSERIAL PRIMARY KEY, agent_id TEXT NOT NULL, timestamp BIGINT NOT NULL, prompt TEXT NOT NULL);");
  tx.exec("CREATE INDEX IF NOT EXISTS idx_prompts_agent ON agent_prompts(agent_id, timestamp);");
  tx.exec("CREATE TABLE IF NOT EXISTS agent_outputs (id BIGSERIAL PRIMARY KEY, agent_id TEXT NOT NULL, pipeline_id TEXT, session_id TEXT, "
          "output_type TEXT NOT NULL, content TEXT NOT NULL, metadata TEXT, byte_size BIGINT NOT NULL DEFAULT 0, timestamp BIGINT NOT NULL);");
  tx.exec("CREATE INDEX IF NOT EXISTS idx_outputs_agent ON agent_outputs(agent_id, timestamp DESC);");
  tx.exec("CREATE INDEX IF NOT EXISTS idx_outputs_pipeline ON agent_outputs(pipeline_id, timestamp DESC);");
  tx.commit();
}

} // namespace foreman::db::postgres
