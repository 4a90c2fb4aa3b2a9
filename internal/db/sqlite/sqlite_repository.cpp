#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <string>
#include <vector>

namespace foreman::db::sqlite {

using foreman::db::ErrorCode;
using foreman::db::Result;

namespace {

constexpr const char* kRunColumns =
    "id,agent_id,session_id,working_dir,source,pipeline_id,status,started_at,ended_at,last_activity,"
    "initial_prompt,error_message,total_prompts,total_tool_calls,total_output_bytes,total_tokens_used,"
    "total_cost_usd,model_usage,can_resume,resume_data";

// Finalizes on scope exit.
class Statement {
 public:
  Statement(sqlite3* db, const std::string& sql) {
    rc_ = sqlite3_prepare_v2(db, sql.c_str(), -1, &st_, nullptr);
  }
  ~Statement() {
    if (st_) sqlite3_finalize(st_);
  }

  Statement(const Statement&)            = delete;
  Statement& operator=(const Statement&) = delete;

  bool Ok() const {
    return rc_ == SQLITE_OK && st_ != nullptr;
  }
  int PrepareCode() const {
    return rc_;
  }
  sqlite3_stmt* Get() const {
    return st_;
  }

 private:
  sqlite3_stmt* st_ = nullptr;
  int           rc_ = SQLITE_ERROR;
};

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

// empty strings are stored as NULL
void BindOptionalText(sqlite3_stmt* st, int idx, const std::string& s) {
  if (s.empty()) {
    sqlite3_bind_null(st, idx);
  } else {
    BindText(st, idx, s);
  }
}

void BindI64(sqlite3_stmt* st, int idx, int64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

int64_t ColI64(sqlite3_stmt* st, int col) {
  return static_cast<int64_t>(sqlite3_column_int64(st, col));
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

bool ColIsNull(sqlite3_stmt* st, int col) {
  return sqlite3_column_type(st, col) == SQLITE_NULL;
}

// Binds the 19 value columns of kRunColumns (everything but id) from idx 1.
void BindRunValues(sqlite3_stmt* st, const model::RunRecord& r) {
  BindText(st, 1, r.agent_id);
  BindOptionalText(st, 2, r.session_id);
  BindText(st, 3, r.working_dir);
  BindText(st, 4, r.source);
  BindOptionalText(st, 5, r.pipeline_id);
  BindText(st, 6, model::RunStatusName(r.status));
  BindI64(st, 7, r.started_at_ms);
  if (r.ended_at_ms > 0) {
    BindI64(st, 8, r.ended_at_ms);
  } else {
    sqlite3_bind_null(st, 8);
  }
  BindI64(st, 9, r.last_activity_ms);
  BindOptionalText(st, 10, r.initial_prompt);
  BindOptionalText(st, 11, r.error_message);
  BindU64(st, 12, r.total_prompts);
  BindU64(st, 13, r.total_tool_calls);
  BindU64(st, 14, r.total_output_bytes);
  if (r.total_tokens_used) {
    BindU64(st, 15, *r.total_tokens_used);
  } else {
    sqlite3_bind_null(st, 15);
  }
  if (r.total_cost_usd) {
    sqlite3_bind_double(st, 16, *r.total_cost_usd);
  } else {
    sqlite3_bind_null(st, 16);
  }
  BindOptionalText(st, 17, r.model_usage_json);
  sqlite3_bind_int(st, 18, r.can_resume ? 1 : 0);
  BindOptionalText(st, 19, r.resume_data);
}

model::RunRecord ReadRun(sqlite3_stmt* st) {
  model::RunRecord r;
  r.id                 = ColI64(st, 0);
  r.agent_id           = ColText(st, 1);
  r.session_id         = ColText(st, 2);
  r.working_dir        = ColText(st, 3);
  r.source             = ColText(st, 4);
  r.pipeline_id        = ColText(st, 5);
  r.status             = model::ParseRunStatus(ColText(st, 6));
  r.started_at_ms      = ColI64(st, 7);
  r.ended_at_ms        = ColIsNull(st, 8) ? 0 : ColI64(st, 8);
  r.last_activity_ms   = ColI64(st, 9);
  r.initial_prompt     = ColText(st, 10);
  r.error_message      = ColText(st, 11);
  r.total_prompts      = ColU64(st, 12);
  r.total_tool_calls   = ColU64(st, 13);
  r.total_output_bytes = ColU64(st, 14);
  if (!ColIsNull(st, 15)) r.total_tokens_used = ColU64(st, 15);
  if (!ColIsNull(st, 16)) r.total_cost_usd = sqlite3_column_double(st, 16);
  r.model_usage_json = ColText(st, 17);
  r.can_resume       = sqlite3_column_int(st, 18) != 0;
  r.resume_data      = ColText(st, 19);
  return r;
}

model::OutputRecord ReadOutput(sqlite3_stmt* st) {
  model::OutputRecord r;
  r.id           = ColI64(st, 0);
  r.agent_id     = ColText(st, 1);
  r.pipeline_id  = ColText(st, 2);
  r.session_id   = ColText(st, 3);
  r.output_type  = ColText(st, 4);
  r.content      = ColText(st, 5);
  r.parsed_json  = ColText(st, 6);
  r.byte_size    = ColU64(st, 7);
  r.timestamp_ms = ColI64(st, 8);
  return r;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      if (rc == SQLITE_CONSTRAINT_UNIQUE || rc == SQLITE_CONSTRAINT_PRIMARYKEY) {
        return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
      }
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
    case SQLITE_FULL:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
    case SQLITE_NOTADB:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Runs
// ------------------------------------------------------------------

Result SqliteRepository::InsertRun(Transaction& t, model::RunRecord& r) {
  auto* db = TX(t).Handle();

  Statement st(db,
               "INSERT INTO agent_runs(agent_id,session_id,working_dir,source,pipeline_id,status,started_at,ended_at,"
               "last_activity,initial_prompt,error_message,total_prompts,total_tool_calls,total_output_bytes,"
               "total_tokens_used,total_cost_usd,model_usage,can_resume,resume_data) "
               "VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?);");
  if (!st.Ok()) return Translate(db, st.PrepareCode());

  BindRunValues(st.Get(), r);

  int rc = sqlite3_step(st.Get());
  if (rc != SQLITE_DONE) return Translate(db, sqlite3_extended_errcode(db));

  r.id = static_cast<int64_t>(sqlite3_last_insert_rowid(db));
  return Result::Ok();
}

Result SqliteRepository::UpdateRun(Transaction& t, const model::RunRecord& r) {
  auto* db = TX(t).Handle();

  Statement st(db,
               "UPDATE agent_runs SET agent_id=?1,session_id=?2,working_dir=?3,source=?4,pipeline_id=?5,status=?6,"
               "started_at=?7,ended_at=?8,last_activity=?9,initial_prompt=?10,error_message=?11,total_prompts=?12,"
               "total_tool_calls=?13,total_output_bytes=?14,total_tokens_used=?15,total_cost_usd=?16,model_usage=?17,"
               "can_resume=?18,resume_data=?19 WHERE agent_id=?1;");
  if (!st.Ok()) return Translate(db, st.PrepareCode());

  BindRunValues(st.Get(), r);

  int rc = sqlite3_step(st.Get());
  if (rc != SQLITE_DONE) return Translate(db, sqlite3_extended_errcode(db));
  if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "no run for agent " + r.agent_id);
  return Result::Ok();
}

std::optional<model::RunRecord> SqliteRepository::GetRun(Transaction& t, const std::string& agent_id) {
  auto* db = TX(t).Handle();

  Statement st(db, std::string("SELECT ") + kRunColumns + " FROM agent_runs WHERE agent_id=?;");
  if (!st.Ok()) return std::nullopt;

  BindText(st.Get(), 1, agent_id);
  if (sqlite3_step(st.Get()) != SQLITE_ROW) return std::nullopt;
  return ReadRun(st.Get());
}

std::vector<model::RunRecord> SqliteRepository::QueryRuns(Transaction& t, const model::RunQuery& query) {
  auto* db = TX(t).Handle();

  std::string sql = std::string("SELECT ") + kRunColumns + " FROM agent_runs WHERE 1=1";
  if (query.status) sql += " AND status=:status";
  if (!query.working_dir.empty()) sql += " AND working_dir=:working_dir";
  if (!query.source.empty()) sql += " AND source=:source";
  if (query.date_from_ms > 0) sql += " AND started_at>=:date_from";
  if (query.date_to_ms > 0) sql += " AND started_at<=:date_to";
  sql += " ORDER BY started_at DESC, id DESC";
  if (query.limit > 0) {
    sql += " LIMIT " + std::to_string(query.limit);
  } else if (query.offset > 0) {
    sql += " LIMIT -1";
  }
  if (query.offset > 0) sql += " OFFSET " + std::to_string(query.offset);
  sql += ";";

  std::vector<model::RunRecord> out;
  Statement                     st(db, sql);
  if (!st.Ok()) return out;

  auto* s = st.Get();
  if (query.status) BindText(s, sqlite3_bind_parameter_index(s, ":status"), model::RunStatusName(*query.status));
  if (!query.working_dir.empty()) BindText(s, sqlite3_bind_parameter_index(s, ":working_dir"), query.working_dir);
  if (!query.source.empty()) BindText(s, sqlite3_bind_parameter_index(s, ":source"), query.source);
  if (query.date_from_ms > 0) BindI64(s, sqlite3_bind_parameter_index(s, ":date_from"), query.date_from_ms);
  if (query.date_to_ms > 0) BindI64(s, sqlite3_bind_parameter_index(s, ":date_to"), query.date_to_ms);

  while (sqlite3_step(s) == SQLITE_ROW) {
    out.push_back(ReadRun(s));
  }
  return out;
}

std::vector<model::RunRecord> SqliteRepository::ListRunsByStatus(Transaction& t, foreman::v1::RunStatus status) {
  model::RunQuery query;
  query.status = status;
  return QueryRuns(t, query);
}

Result SqliteRepository::MarkStaleRunsCrashed(Transaction& t, int64_t now_ms, uint64_t& affected) {
  auto* db = TX(t).Handle();
  affected = 0;

  Statement st(db,
               "UPDATE agent_runs SET status='crashed', ended_at=?1, last_activity=?1, can_resume=1, "
               "error_message=COALESCE(NULLIF(error_message,''), ?2) "
               "WHERE status IN ('running','waiting_input');");
  if (!st.Ok()) return Translate(db, st.PrepareCode());

  BindI64(st.Get(), 1, now_ms);
  BindText(st.Get(), 2, kRestartErrorMessage);

  int rc = sqlite3_step(st.Get());
  if (rc != SQLITE_DONE) return Translate(db, sqlite3_extended_errcode(db));

  affected = static_cast<uint64_t>(sqlite3_changes(db));
  return Result::Ok();
}

Result SqliteRepository::DeleteRunsOlderThan(Transaction& t, int64_t cutoff_ms, uint64_t& deleted) {
  auto* db = TX(t).Handle();
  deleted  = 0;

  for (const char* child_sql : {"DELETE FROM agent_prompts WHERE agent_id IN (SELECT agent_id FROM agent_runs WHERE started_at < ?);",
                                "DELETE FROM agent_outputs WHERE agent_id IN (SELECT agent_id FROM agent_runs WHERE started_at < ?);"}) {
    Statement st(db, child_sql);
    if (!st.Ok()) return Translate(db, st.PrepareCode());
    BindI64(st.Get(), 1, cutoff_ms);
    if (sqlite3_step(st.Get()) != SQLITE_DONE) return Translate(db, sqlite3_extended_errcode(db));
  }

  Statement st(db, "DELETE FROM agent_runs WHERE started_at < ?;");
  if (!st.Ok()) return Translate(db, st.PrepareCode());
  BindI64(st.Get(), 1, cutoff_ms);
  if (sqlite3_step(st.Get()) != SQLITE_DONE) return Translate(db, sqlite3_extended_errcode(db));

  deleted = static_cast<uint64_t>(sqlite3_changes(db));
  return Result::Ok();
}

model::RunStatsRecord SqliteRepository::GetRunStats(Transaction& t) {
  auto*                 db = TX(t).Handle();
  model::RunStatsRecord stats;

  {
    Statement st(db, "SELECT COUNT(*), COALESCE(SUM(total_cost_usd), 0.0), "
                     "COALESCE(SUM(CASE WHEN can_resume = 1 AND status = 'crashed' THEN 1 ELSE 0 END), 0) FROM agent_runs;");
    if (st.Ok() && sqlite3_step(st.Get()) == SQLITE_ROW) {
      stats.total_runs     = ColU64(st.Get(), 0);
      stats.total_cost_usd = sqlite3_column_double(st.Get(), 1);
      stats.resumable_runs = ColU64(st.Get(), 2);
    }
  }
  {
    Statement st(db, "SELECT status, COUNT(*) FROM agent_runs GROUP BY status;");
    while (st.Ok() && sqlite3_step(st.Get()) == SQLITE_ROW) {
      stats.by_status[ColText(st.Get(), 0)] = ColU64(st.Get(), 1);
    }
  }
  {
    Statement st(db, "SELECT source, COUNT(*) FROM agent_runs GROUP BY source;");
    while (st.Ok() && sqlite3_step(st.Get()) == SQLITE_ROW) {
      stats.by_source[ColText(st.Get(), 0)] = ColU64(st.Get(), 1);
    }
  }
  return stats;
}

// ------------------------------------------------------------------
// Prompts
// ------------------------------------------------------------------

Result SqliteRepository::InsertPrompt(Transaction& t, model::PromptRecord& r) {
  auto* db = TX(t).Handle();

  Statement st(db, "INSERT INTO agent_prompts(agent_id,timestamp,prompt) VALUES(?,?,?);");
  if (!st.Ok()) return Translate(db, st.PrepareCode());

  BindText(st.Get(), 1, r.agent_id);
  BindI64(st.Get(), 2, r.timestamp_ms);
  BindText(st.Get(), 3, r.prompt);

  if (sqlite3_step(st.Get()) != SQLITE_DONE) return Translate(db, sqlite3_extended_errcode(db));
  r.id = static_cast<int64_t>(sqlite3_last_insert_rowid(db));
  return Result::Ok();
}

std::vector<model::PromptRecord> SqliteRepository::GetPrompts(Transaction& t, const std::string& agent_id) {
  auto* db = TX(t).Handle();

  std::vector<model::PromptRecord> out;
  Statement                        st(db, "SELECT id,agent_id,prompt,timestamp FROM agent_prompts WHERE agent_id=? ORDER BY timestamp ASC, id ASC;");
  if (!st.Ok()) return out;

  BindText(st.Get(), 1, agent_id);
  while (sqlite3_step(st.Get()) == SQLITE_ROW) {
    model::PromptRecord r;
    r.id           = ColI64(st.Get(), 0);
    r.agent_id     = ColText(st.Get(), 1);
    r.prompt       = ColText(st.Get(), 2);
    r.timestamp_ms = ColI64(st.Get(), 3);
    out.push_back(std::move(r));
  }
  return out;
}

// ------------------------------------------------------------------
// Output history
// ------------------------------------------------------------------

Result SqliteRepository::InsertOutput(Transaction& t, model::OutputRecord& r) {
  auto* db = TX(t).Handle();

  Statement st(db,
               "INSERT INTO agent_outputs(agent_id,pipeline_id,session_id,output_type,content,metadata,byte_size,timestamp) "
               "VALUES(?,?,?,?,?,?,?,?);");
  if (!st.Ok()) return Translate(db, st.PrepareCode());

  BindText(st.Get(), 1, r.agent_id);
  BindOptionalText(st.Get(), 2, r.pipeline_id);
  BindOptionalText(st.Get(), 3, r.session_id);
  BindText(st.Get(), 4, r.output_type);
  BindText(st.Get(), 5, r.content);
  BindOptionalText(st.Get(), 6, r.parsed_json);
  BindU64(st.Get(), 7, r.byte_size);
  BindI64(st.Get(), 8, r.timestamp_ms);

  if (sqlite3_step(st.Get()) != SQLITE_DONE) return Translate(db, sqlite3_extended_errcode(db));
  r.id = static_cast<int64_t>(sqlite3_last_insert_rowid(db));
  return Result::Ok();
}

std::vector<model::OutputRecord> SqliteRepository::GetOutputs(Transaction& t, const model::OutputQuery& query) {
  auto* db = TX(t).Handle();

  // newest N by (timestamp, id), returned oldest first
  std::string inner = "SELECT id,agent_id,pipeline_id,session_id,output_type,content,metadata,byte_size,timestamp FROM agent_outputs WHERE 1=1";
  if (!query.agent_id.empty()) inner += " AND agent_id=:agent_id";
  if (!query.pipeline_id.empty()) inner += " AND pipeline_id=:pipeline_id";
  inner += " ORDER BY timestamp DESC, id DESC";
  if (query.limit > 0) inner += " LIMIT " + std::to_string(query.limit);

  const std::string sql = "SELECT * FROM (" + inner + ") ORDER BY timestamp ASC, id ASC;";

  std::vector<model::OutputRecord> out;
  Statement                        st(db, sql);
  if (!st.Ok()) return out;

  auto* s = st.Get();
  if (!query.agent_id.empty()) BindText(s, sqlite3_bind_parameter_index(s, ":agent_id"), query.agent_id);
  if (!query.pipeline_id.empty()) BindText(s, sqlite3_bind_parameter_index(s, ":pipeline_id"), query.pipeline_id);

  while (sqlite3_step(s) == SQLITE_ROW) {
    out.push_back(ReadOutput(s));
  }
  return out;
}

} // namespace foreman::db::sqlite
