#include "pg_pool.hpp"

namespace foreman::db::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)), max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  std::unique_lock lock(mutex_);
  cv_.wait(lock, [this] { return !idle_.empty() || live_connections_ < max_connections_; });

  if (!idle_.empty()) {
    auto conn = std::move(idle_.back());
    idle_.pop_back();
    return Wrap(conn.release());
  }

  ++live_connections_;
  lock.unlock();

  std::unique_ptr<pqxx::connection> conn;
  try {
    conn = std::make_unique<pqxx::connection>(conninfo_);
    PrepareStatements(*conn);
  } catch (const std::exception&) {
    {
      std::lock_guard rollback_lock(mutex_);
      --live_connections_;
    }
    cv_.notify_one();
    throw;
  }
  return Wrap(conn.release());
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  conn.prepare("get_run", "SELECT id,agent_id,session_id,working_dir,source,pipeline_id,status,started_at,ended_at,last_activity,"
                          "initial_prompt,error_message,total_prompts,total_tool_calls,total_output_bytes,total_tokens_used,"
                          "total_cost_usd,model_usage,can_resume,resume_data FROM agent_runs WHERE agent_id=$1");

  conn.prepare("insert_prompt", "INSERT INTO agent_prompts(agent_id,timestamp,prompt) VALUES($1,$2,$3) RETURNING id");

  conn.prepare("insert_output",
               "INSERT INTO agent_outputs(agent_id,pipeline_id,session_id,output_type,content,metadata,byte_size,timestamp) "
               "VALUES($1,$2,$3,$4,$5,$6,$7,$8) RETURNING id");
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self](pqxx::connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  {
    std::lock_guard lock(mutex_);
    idle_.emplace_back(conn);
  }
  cv_.notify_one();
}

} // namespace foreman::db::postgres
