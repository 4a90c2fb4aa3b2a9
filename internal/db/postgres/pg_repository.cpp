#include "pg_repository.hpp"

#include <optional>
#include <string>

namespace foreman::db::postgres {

namespace {

constexpr const char* kRunColumns =
    "id,agent_id,session_id,working_dir,source,pipeline_id,status,started_at,ended_at,last_activity,"
    "initial_prompt,error_message,total_prompts,total_tool_calls,total_output_bytes,total_tokens_used,"
    "total_cost_usd,model_usage,can_resume,resume_data";

std::optional<std::string> NullIfEmpty(const std::string& s) {
  if (s.empty()) return std::nullopt;
  return s;
}

std::string TextOrEmpty(const pqxx::field& f) {
  return f.is_null() ? std::string() : std::string(f.c_str());
}

model::RunRecord ReadRun(const pqxx::row& row) {
  model::RunRecord r;
  r.id                 = row[0].as<int64_t>();
  r.agent_id           = row[1].c_str();
  r.session_id         = TextOrEmpty(row[2]);
  r.working_dir        = row[3].c_str();
  r.source             = row[4].c_str();
  r.pipeline_id        = TextOrEmpty(row[5]);
  r.status             = model::ParseRunStatus(row[6].c_str());
  r.started_at_ms      = row[7].as<int64_t>();
  r.ended_at_ms        = row[8].is_null() ? 0 : row[8].as<int64_t>();
  r.last_activity_ms   = row[9].as<int64_t>();
  r.initial_prompt     = TextOrEmpty(row[10]);
  r.error_message      = TextOrEmpty(row[11]);
  r.total_prompts      = row[12].as<uint64_t>(0);
  r.total_tool_calls   = row[13].as<uint64_t>(0);
  r.total_output_bytes = row[14].as<uint64_t>(0);
  if (!row[15].is_null()) r.total_tokens_used = row[15].as<uint64_t>();
  if (!row[16].is_null()) r.total_cost_usd = row[16].as<double>();
  r.model_usage_json = TextOrEmpty(row[17]);
  r.can_resume       = row[18].as<bool>(false);
  r.resume_data      = TextOrEmpty(row[19]);
  return r;
}

std::optional<int64_t> EndedAt(const model::RunRecord& r) {
  if (r.ended_at_ms <= 0) return std::nullopt;
  return r.ended_at_ms;
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) return Result::Err(ErrorCode::AlreadyExists, e.what());
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) return Result::Err(ErrorCode::ConstraintViolation, e.what());
  if (dynamic_cast<const pqxx::serialization_failure*>(&e)) return Result::Err(ErrorCode::SerializationFailure, e.what());
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) return Result::Err(ErrorCode::IOError, e.what());
  return Result::Err(ErrorCode::InternalError, e.what());
}

// ------------------------------------------------------------------
// Runs
// ------------------------------------------------------------------

Result PgRepository::InsertRun(Transaction& t, model::RunRecord& r) {
  try {
    auto res = TX(t).Work().exec_params(
        "INSERT INTO agent_runs(agent_id,session_id,working_dir,source,pipeline_id,status,started_at,ended_at,last_activity,"
        "initial_prompt,error_message,total_prompts,total_tool_calls,total_output_bytes,total_tokens_used,total_cost_usd,"
        "model_usage,can_resume,resume_data) VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10,$11,$12,$13,$14,$15,$16,$17,$18,$19) RETURNING id;",
        r.agent_id, NullIfEmpty(r.session_id), r.working_dir, r.source, NullIfEmpty(r.pipeline_id), std::string(model::RunStatusName(r.status)),
        r.started_at_ms, EndedAt(r), r.last_activity_ms, NullIfEmpty(r.initial_prompt), NullIfEmpty(r.error_message),
        static_cast<int64_t>(r.total_prompts), static_cast<int64_t>(r.total_tool_calls), static_cast<int64_t>(r.total_output_bytes),
        r.total_tokens_used ? std::optional<int64_t>(static_cast<int64_t>(*r.total_tokens_used)) : std::nullopt, r.total_cost_usd,
        NullIfEmpty(r.model_usage_json), r.can_resume, NullIfEmpty(r.resume_data));
    r.id = res[0][0].as<int64_t>();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::UpdateRun(Transaction& t, const model::RunRecord& r) {
  try {
    auto res = TX(t).Work().exec_params(
        "UPDATE agent_runs SET session_id=$2,working_dir=$3,source=$4,pipeline_id=$5,status=$6,started_at=$7,ended_at=$8,"
        "last_activity=$9,initial_prompt=$10,error_message=$11,total_prompts=$12,total_tool_calls=$13,total_output_bytes=$14,"
        "total_tokens_used=$15,total_cost_usd=$16,model_usage=$17,can_resume=$18,resume_data=$19 WHERE agent_id=$1;",
        r.agent_id, NullIfEmpty(r.session_id), r.working_dir, r.source, NullIfEmpty(r.pipeline_id), std::string(model::RunStatusName(r.status)),
        r.started_at_ms, EndedAt(r), r.last_activity_ms, NullIfEmpty(r.initial_prompt), NullIfEmpty(r.error_message),
        static_cast<int64_t>(r.total_prompts), static_cast<int64_t>(r.total_tool_calls), static_cast<int64_t>(r.total_output_bytes),
        r.total_tokens_used ? std::optional<int64_t>(static_cast<int64_t>(*r.total_tokens_used)) : std::nullopt, r.total_cost_usd,
        NullIfEmpty(r.model_usage_json), r.can_resume, NullIfEmpty(r.resume_data));
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, "no run for agent " + r.agent_id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::RunRecord> PgRepository::GetRun(Transaction& t, const std::string& agent_id) {
  auto res = TX(t).Work().exec_prepared("get_run", agent_id);
  if (res.empty()) return std::nullopt;
  return ReadRun(res[0]);
}

std::vector<model::RunRecord> PgRepository::QueryRuns(Transaction& t, const model::RunQuery& query) {
  auto& work = TX(t).Work();

  // filters are optional; NULL parameters disable a clause
  const std::optional<std::string> status = query.status ? std::optional<std::string>(model::RunStatusName(*query.status)) : std::nullopt;
  const std::optional<int64_t>     from   = query.date_from_ms > 0 ? std::optional<int64_t>(query.date_from_ms) : std::nullopt;
  const std::optional<int64_t>     to     = query.date_to_ms > 0 ? std::optional<int64_t>(query.date_to_ms) : std::nullopt;
  const std::optional<int64_t>     limit  = query.limit > 0 ? std::optional<int64_t>(query.limit) : std::nullopt;

  auto res = work.exec_params(std::string("SELECT ") + kRunColumns +
                                  " FROM agent_runs WHERE ($1::text IS NULL OR status=$1) AND ($2::text IS NULL OR working_dir=$2)"
                                  " AND ($3::text IS NULL OR source=$3) AND ($4::bigint IS NULL OR started_at>=$4)"
                                  " AND ($5::bigint IS NULL OR started_at<=$5) ORDER BY started_at DESC, id DESC LIMIT $6 OFFSET $7;",
                              status, NullIfEmpty(query.working_dir), NullIfEmpty(query.source), from, to, limit,
                              static_cast<int64_t>(query.offset));

  std::vector<model::RunRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(ReadRun(row));
  }
  return out;
}

std::vector<model::RunRecord> PgRepository::ListRunsByStatus(Transaction& t, foreman::v1::RunStatus status) {
  model::RunQuery query;
  query.status = status;
  return QueryRuns(t, query);
}

Result PgRepository::MarkStaleRunsCrashed(Transaction& t, int64_t now_ms, uint64_t& affected) {
  affected = 0;
  try {
    auto res = TX(t).Work().exec_params(
        "UPDATE agent_runs SET status='crashed', ended_at=$1, last_activity=$1, can_resume=TRUE, "
        "error_message=COALESCE(NULLIF(error_message,''), $2) WHERE status IN ('running','waiting_input');",
        now_ms, std::string(kRestartErrorMessage));
    affected = static_cast<uint64_t>(res.affected_rows());
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::DeleteRunsOlderThan(Transaction& t, int64_t cutoff_ms, uint64_t& deleted) {
  deleted = 0;
  try {
    auto& work = TX(t).Work();
    work.exec_params("DELETE FROM agent_prompts WHERE agent_id IN (SELECT agent_id FROM agent_runs WHERE started_at < $1);", cutoff_ms);
    work.exec_params("DELETE FROM agent_outputs WHERE agent_id IN (SELECT agent_id FROM agent_runs WHERE started_at < $1);", cutoff_ms);
    auto res = work.exec_params("DELETE FROM agent_runs WHERE started_at < $1;", cutoff_ms);
    deleted  = static_cast<uint64_t>(res.affected_rows());
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

model::RunStatsRecord PgRepository::GetRunStats(Transaction& t) {
  auto&                 work = TX(t).Work();
  model::RunStatsRecord stats;

  auto totals = work.exec("SELECT COUNT(*), COALESCE(SUM(total_cost_usd), 0.0), "
                          "COUNT(*) FILTER (WHERE can_resume AND status = 'crashed') FROM agent_runs;");
  stats.total_runs     = totals[0][0].as<uint64_t>();
  stats.total_cost_usd = totals[0][1].as<double>();
  stats.resumable_runs = totals[0][2].as<uint64_t>();

  for (const auto& row : work.exec("SELECT status, COUNT(*) FROM agent_runs GROUP BY status;")) {
    stats.by_status[row[0].c_str()] = row[1].as<uint64_t>();
  }
  for (const auto& row : work.exec("SELECT source, COUNT(*) FROM agent_runs GROUP BY source;")) {
    stats.by_source[row[0].c_str()] = row[1].as<uint64_t>();
  }
  return stats;
}

// ------------------------------------------------------------------
// Prompts
// ------------------------------------------------------------------

Result PgRepository::InsertPrompt(Transaction& t, model::PromptRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared("insert_prompt", r.agent_id, r.timestamp_ms, r.prompt);
    r.id     = res[0][0].as<int64_t>();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::PromptRecord> PgRepository::GetPrompts(Transaction& t, const std::string& agent_id) {
  auto res = TX(t).Work().exec_params("SELECT id,agent_id,prompt,timestamp FROM agent_prompts WHERE agent_id=$1 ORDER BY timestamp ASC, id ASC;",
                                      agent_id);

  std::vector<model::PromptRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    model::PromptRecord r;
    r.id           = row[0].as<int64_t>();
    r.agent_id     = row[1].c_str();
    r.prompt       = row[2].c_str();
    r.timestamp_ms = row[3].as<int64_t>();
    out.push_back(std::move(r));
  }
  return out;
}

// ------------------------------------------------------------------
// Output history
// ------------------------------------------------------------------

Result PgRepository::InsertOutput(Transaction& t, model::OutputRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared("insert_output", r.agent_id, NullIfEmpty(r.pipeline_id), NullIfEmpty(r.session_id), r.output_type,
                                          r.content, NullIfEmpty(r.parsed_json), static_cast<int64_t>(r.byte_size), r.timestamp_ms);
    r.id = res[0][0].as<int64_t>();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::OutputRecord> PgRepository::GetOutputs(Transaction& t, const model::OutputQuery& query) {
  const std::optional<int64_t> limit = query.limit > 0 ? std::optional<int64_t>(query.limit) : std::nullopt;

  auto res = TX(t).Work().exec_params(
      "SELECT * FROM (SELECT id,agent_id,pipeline_id,session_id,output_type,content,metadata,byte_size,timestamp FROM agent_outputs "
      "WHERE ($1::text IS NULL OR agent_id=$1) AND ($2::text IS NULL OR pipeline_id=$2) "
      "ORDER BY timestamp DESC, id DESC LIMIT $3) recent ORDER BY timestamp ASC, id ASC;",
      NullIfEmpty(query.agent_id), NullIfEmpty(query.pipeline_id), limit);

  std::vector<model::OutputRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    model::OutputRecord r;
    r.id           = row[0].as<int64_t>();
    r.agent_id     = row[1].c_str();
    r.pipeline_id  = TextOrEmpty(row[2]);
    r.session_id   = TextOrEmpty(row[3]);
    r.output_type  = row[4].c_str();
    r.content      = row[5].c_str();
    r.parsed_json  = TextOrEmpty(row[6]);
    r.byte_size    = row[7].as<uint64_t>();
    r.timestamp_ms = row[8].as<int64_t>();
    out.push_back(std::move(r));
  }
  return out;
}

} // namespace foreman::db::postgres
