#include "sqlite_schema.hpp"

#include <string>
#include <vector>

namespace foreman::db::sqlite {

void BootstrapSchema(SqliteDB& db) {
  static const std::vector<std::string> kBootstrapSql = {
      "CREATE TABLE IF NOT EXISTS agent_runs ("
      " id INTEGER PRIMARY KEY AUTOINCREMENT,"
      " agent_id TEXT NOT NULL UNIQUE,"
      " session_id TEXT,"
      " working_dir TEXT NOT NULL,"
      " source TEXT NOT NULL,"
      " pipeline_id TEXT,"
      " status TEXT NOT NULL,"
      " started_at INTEGER NOT NULL,"
      " ended_at INTEGER,"
      " last_activity INTEGER NOT NULL,"
      " initial_prompt TEXT,"
      " error_message TEXT,"
      " total_prompts INTEGER DEFAULT 0,"
      " total_tool_calls INTEGER DEFAULT 0,"
      " total_output_bytes INTEGER DEFAULT 0,"
      " total_tokens_used INTEGER,"
      " total_cost_usd REAL,"
      " model_usage TEXT,"
      " can_resume INTEGER DEFAULT 0,"
      " resume_data TEXT);",
      "CREATE INDEX IF NOT EXISTS idx_runs_status ON agent_runs(status);",
      "CREATE INDEX IF NOT EXISTS idx_runs_started_at ON agent_runs(started_at DESC);",
      "CREATE INDEX IF NOT EXISTS idx_runs_working_dir ON agent_runs(working_dir);",
      "CREATE INDEX IF NOT EXISTS idx_runs_source ON agent_runs(source);",
      "CREATE TABLE IF NOT EXISTS agent_prompts ("
      " id INTEGER PRIMARY KEY AUTOINCREMENT,"
      " agent_id TEXT NOT NULL,"
      " timestamp INTEGER NOT NULL,"
      " prompt TEXT NOT NULL);",
      "CREATE INDEX IF NOT EXISTS idx_prompts_agent ON agent_prompts(agent_id, timestamp);",
      "CREATE TABLE IF NOT EXISTS agent_outputs ("
      " id INTEGER PRIMARY KEY AUTOINCREMENT,"
      " agent_id TEXT NOT NULL,"
      " pipeline_id TEXT,"
      " session_id TEXT,"
      " output_type TEXT NOT NULL,"
      " content TEXT NOT NULL,"
      " metadata TEXT,"
      " byte_size INTEGER NOT NULL DEFAULT 0,"
      " timestamp INTEGER NOT NULL);",
      "CREATE INDEX IF NOT EXISTS idx_outputs_agent ON agent_outputs(agent_id, timestamp DESC);",
      "CREATE INDEX IF NOT EXISTS idx_outputs_pipeline ON agent_outputs(pipeline_id, timestamp DESC);"};

  for (const auto& sql : kBootstrapSql) {
    db.Exec(sql);
  }

  // fail fast on a file created by an incompatible build
  db.Exec("SELECT agent_id,status,started_at,model_usage,pipeline_id FROM agent_runs LIMIT 1;");
  db.Exec("SELECT agent_id,timestamp,prompt FROM agent_prompts LIMIT 1;");
  db.Exec("SELECT agent_id,pipeline_id,output_type,content,metadata,timestamp FROM agent_outputs LIMIT 1;");
}

} // namespace foreman::db::sqlite
