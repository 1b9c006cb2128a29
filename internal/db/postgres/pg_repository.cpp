#include "pg_repository.hpp"

namespace relay::db::postgres {

using relay::manager::v1::JobStatus;

namespace {

model::ItemRecord ReadItem(const pqxx::row& row) {
  model::ItemRecord r;
  r.external_id        = row[0].c_str();
  r.title              = row[1].c_str();
  r.source_name        = row[2].c_str();
  r.duration_seconds   = row[3].as<uint32_t>();
  r.thumbnail          = row[4].c_str();
  r.retrieval_status   = static_cast<JobStatus>(row[5].as<int>());
  r.retrieval_attempts = row[6].as<uint32_t>();
  r.retrieval_error    = row[7].c_str();
  r.local_path         = row[8].c_str();
  r.local_size         = row[9].as<uint64_t>();
  r.retrieved_at_ms    = row[10].as<uint64_t>();
  r.relay_status       = static_cast<JobStatus>(row[11].as<int>());
  r.relay_attempts     = row[12].as<uint32_t>();
  r.relay_error        = row[13].c_str();
  r.remote_ref         = row[14].c_str();
  r.relayed_at_ms      = row[15].as<uint64_t>();
  r.created_at_ms      = row[16].as<uint64_t>();
  return r;
}

model::SourceRecord ReadSource(const pqxx::row& row) {
  model::SourceRecord r;
  r.source_id          = row[0].c_str();
  r.name               = row[1].c_str();
  r.thumbnail          = row[2].c_str();
  r.last_seen_item_id  = row[3].c_str();
  r.last_seen_at_ms    = row[4].as<uint64_t>();
  r.last_scanned_at_ms = row[5].as<uint64_t>();
  r.enabled            = row[6].as<bool>();
  return r;
}

std::vector<model::ItemRecord> ReadItems(const pqxx::result& res) {
  std::vector<model::ItemRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(ReadItem(row));
  return out;
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
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) {
    return Result::Err(ErrorCode::AlreadyExists, e.what());
  }
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::serialization_failure*>(&e)) {
    return Result::Err(ErrorCode::SerializationFailure, e.what());
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

// ------------------------------------------------------------------
// Items
// ------------------------------------------------------------------

Result PgRepository::InsertItem(Transaction& t, const model::ItemRecord& r) {
  try {
    TX(t).Work().exec_prepared("insert_item", r.external_id, r.title, r.source_name, r.duration_seconds, r.thumbnail,
                               static_cast<int>(r.retrieval_status), r.retrieval_attempts, r.retrieval_error, r.local_path, r.local_size,
                               r.retrieved_at_ms, static_cast<int>(r.relay_status), r.relay_attempts, r.relay_error, r.remote_ref,
                               r.relayed_at_ms, r.created_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::ItemRecord> PgRepository::GetItem(Transaction& t, const std::string& id) {
  auto res = TX(t).Work().exec_prepared("get_item", id);
  if (res.empty()) return std::nullopt;
  return ReadItem(res[0]);
}

Result PgRepository::UpdateItem(Transaction& t, const model::ItemRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared("update_item", r.external_id, r.title, r.source_name, r.duration_seconds, r.thumbnail,
                                          static_cast<int>(r.retrieval_status), r.retrieval_attempts, r.retrieval_error, r.local_path,
                                          r.local_size, r.retrieved_at_ms, static_cast<int>(r.relay_status), r.relay_attempts, r.relay_error,
                                          r.remote_ref, r.relayed_at_ms);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, r.external_id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::DeleteItem(Transaction& t, const std::string& id) {
  try {
    TX(t).Work().exec_prepared("delete_item", id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::ItemRecord> PgRepository::ListItems(Transaction& t) {
  return ReadItems(TX(t).Work().exec_prepared("list_items"));
}

std::vector<model::ItemRecord> PgRepository::ListItemsByRetrievalStatus(Transaction& t, JobStatus status) {
  return ReadItems(TX(t).Work().exec_prepared("list_items_by_retrieval_status", static_cast<int>(status)));
}

std::vector<model::ItemRecord> PgRepository::ListItemsByRelayStatus(Transaction& t, JobStatus status) {
  return ReadItems(TX(t).Work().exec_prepared("list_items_by_relay_status", static_cast<int>(status)));
}

// ------------------------------------------------------------------
// Sources
// ------------------------------------------------------------------

Result PgRepository::UpsertSource(Transaction& t, const model::SourceRecord& r) {
  try {
    TX(t).Work().exec_params(
        "INSERT INTO sources(source_id,name,thumbnail,last_seen_item_id,last_seen_at_ms,last_scanned_at_ms,enabled) "
        "VALUES($1,$2,$3,$4,$5,$6,$7) "
        "ON CONFLICT(source_id) DO UPDATE SET name=EXCLUDED.name,thumbnail=EXCLUDED.thumbnail,"
        "last_seen_item_id=EXCLUDED.last_seen_item_id,last_seen_at_ms=EXCLUDED.last_seen_at_ms,"
        "last_scanned_at_ms=EXCLUDED.last_scanned_at_ms,enabled=EXCLUDED.enabled;",
        r.source_id, r.name, r.thumbnail, r.last_seen_item_id, r.last_seen_at_ms, r.last_scanned_at_ms, r.enabled);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::SourceRecord> PgRepository::GetSource(Transaction& t, const std::string& source_id) {
  auto res = TX(t).Work().exec_params(
      "SELECT source_id,name,thumbnail,last_seen_item_id,last_seen_at_ms,last_scanned_at_ms,enabled FROM sources WHERE source_id=$1;", source_id);
  if (res.empty()) return std::nullopt;
  return ReadSource(res[0]);
}

std::vector<model::SourceRecord> PgRepository::ListSources(Transaction& t) {
  auto res = TX(t).Work().exec(
      "SELECT source_id,name,thumbnail,last_seen_item_id,last_seen_at_ms,last_scanned_at_ms,enabled FROM sources ORDER BY source_id ASC;");

  std::vector<model::SourceRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(ReadSource(row));
  return out;
}

// ------------------------------------------------------------------
// Key/value state
// ------------------------------------------------------------------

Result PgRepository::PutState(Transaction& t, const model::StateRecord& r) {
  try {
    TX(t).Work().exec_params(
        "INSERT INTO app_state(key,value,updated_at_ms) VALUES($1,$2,$3) "
        "ON CONFLICT(key) DO UPDATE SET value=EXCLUDED.value,updated_at_ms=EXCLUDED.updated_at_ms;",
        r.key, r.value, r.updated_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::StateRecord> PgRepository::GetState(Transaction& t, const std::string& key) {
  auto res = TX(t).Work().exec_params("SELECT key,value,updated_at_ms FROM app_state WHERE key=$1;", key);
  if (res.empty()) return std::nullopt;

  model::StateRecord r;
  r.key           = res[0][0].c_str();
  r.value         = res[0][1].c_str();
  r.updated_at_ms = res[0][2].as<uint64_t>();
  return r;
}

} // namespace relay::db::postgres
