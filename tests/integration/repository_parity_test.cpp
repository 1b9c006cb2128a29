#include <atomic>
#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "internal/core/item_store.hpp"
#include "internal/core/source_store.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/migrations.hpp"

#if RELAY_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

#if RELAY_DB_POSTGRES
#include <pqxx/pqxx>

#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace {

using relay::db::ErrorCode;
using relay::db::Repository;
using relay::db::memory::MemoryRepository;
using relay::db::model::ItemRecord;
using relay::db::model::SourceRecord;
using relay::db::model::StateRecord;
using namespace relay::manager::v1;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
};

ItemRecord NewItem(const std::string& id, uint64_t created_at_ms) {
  ItemRecord record;
  record.external_id      = id;
  record.title            = "Title " + id;
  record.source_name      = "Channel";
  record.duration_seconds = 42;
  record.thumbnail        = "https://img/" + id;
  record.created_at_ms    = created_at_ms;
  return record;
}

void VerifyItemCrud(Repository& repo, const std::string& prefix) {
  const auto id = prefix + "-crud";
  {
    auto tx = repo.Begin();
    assert(repo.InsertItem(*tx, NewItem(id, NowMs())));
    assert(repo.InsertItem(*tx, NewItem(id, NowMs())).code == ErrorCode::AlreadyExists);
    tx->Commit();
  }

  {
    auto tx     = repo.Begin();
    auto loaded = repo.GetItem(*tx, id);
    assert(loaded.has_value());
    assert(loaded->title == "Title " + id);
    assert(loaded->retrieval_status == JOB_STATUS_PENDING);
    assert(loaded->relay_status == JOB_STATUS_PENDING);

    loaded->retrieval_status   = JOB_STATUS_COMPLETED;
    loaded->retrieval_attempts = 2;
    loaded->local_path         = "/data/" + id + ".mp4";
    loaded->local_size         = 123456789012ULL;
    loaded->retrieved_at_ms    = NowMs();
    loaded->relay_error        = std::string(1000, 'e');
    assert(repo.UpdateItem(*tx, *loaded));
    tx->Commit();
  }

  {
    auto tx     = repo.Begin();
    auto loaded = repo.GetItem(*tx, id);
    assert(loaded->retrieval_status == JOB_STATUS_COMPLETED);
    assert(loaded->retrieval_attempts == 2);
    assert(loaded->local_size == 123456789012ULL);
    assert(loaded->relay_error.size() == 1000);

    auto missing = NewItem(prefix + "-ghost", NowMs());
    assert(repo.UpdateItem(*tx, missing).code == ErrorCode::NotFound);

    assert(repo.DeleteItem(*tx, id));
    assert(!repo.GetItem(*tx, id).has_value());
    tx->Commit();
  }
}

void VerifyListsAndOrdering(Repository& repo, const std::string& prefix) {
  const uint64_t base = NowMs();
  {
    auto tx = repo.Begin();
    for (int i = 0; i < 4; ++i) {
      auto record = NewItem(prefix + "-order-" + std::to_string(i), base + i);
      if (i % 2 == 1) record.retrieval_status = JOB_STATUS_ERROR;
      if (i == 3) record.relay_status = JOB_STATUS_IN_PROGRESS;
      assert(repo.InsertItem(*tx, record));
    }
    tx->Commit();
  }

  auto tx       = repo.Begin();
  auto all      = repo.ListItems(*tx);
  auto failed   = repo.ListItemsByRetrievalStatus(*tx, JOB_STATUS_ERROR);
  auto relaying = repo.ListItemsByRelayStatus(*tx, JOB_STATUS_IN_PROGRESS);

  std::vector<std::string> ordered;
  for (const auto& record : all) {
    if (record.external_id.rfind(prefix + "-order-", 0) == 0) ordered.push_back(record.external_id);
  }
  assert(ordered.size() == 4);
  for (int i = 0; i < 4; ++i) assert(ordered[i] == prefix + "-order-" + std::to_string(i));

  std::size_t failed_here = 0;
  for (const auto& record : failed) {
    if (record.external_id.rfind(prefix + "-order-", 0) == 0) ++failed_here;
  }
  assert(failed_here == 2);
  std::vector<std::string> relaying_here;
  for (const auto& record : relaying) {
    if (record.external_id.rfind(prefix + "-order-", 0) == 0) relaying_here.push_back(record.external_id);
  }
  assert(relaying_here.size() == 1 && relaying_here[0] == prefix + "-order-3");
  tx->Commit();
}

void VerifyRollbackBehavior(Repository& repo, const std::string& prefix) {
  const auto id = prefix + "-rollback";
  {
    auto tx = repo.Begin();
    assert(repo.InsertItem(*tx, NewItem(id, NowMs())));
    // destroyed without commit
  }
  {
    auto tx = repo.Begin();
    assert(repo.InsertItem(*tx, NewItem(id + "-explicit", NowMs())));
    tx->Rollback();
  }

  auto tx = repo.Begin();
  assert(!repo.GetItem(*tx, id).has_value());
  assert(!repo.GetItem(*tx, id + "-explicit").has_value());
  tx->Commit();
}

void VerifySourcesAndState(Repository& repo, const std::string& prefix) {
  const auto id = prefix + "-source";
  {
    auto         tx = repo.Begin();
    SourceRecord source{.source_id = id, .name = "Alpha", .thumbnail = "t"};
    assert(repo.UpsertSource(*tx, source));

    source.name               = "Alpha Renamed";
    source.last_seen_item_id  = "V3";
    source.last_seen_at_ms    = 1714560000000ULL;
    source.last_scanned_at_ms = 1714563600000ULL;
    source.enabled            = false;
    assert(repo.UpsertSource(*tx, source));

    assert(repo.PutState(*tx, StateRecord{.key = prefix + "-state", .value = R"({"used":1})", .updated_at_ms = NowMs()}));
    assert(repo.PutState(*tx, StateRecord{.key = prefix + "-state", .value = R"({"used":2})", .updated_at_ms = NowMs()}));
    tx->Commit();
  }

  auto tx     = repo.Begin();
  auto source = repo.GetSource(*tx, id);
  assert(source.has_value());
  assert(source->name == "Alpha Renamed");
  assert(source->last_seen_item_id == "V3");
  assert(source->last_seen_at_ms == 1714560000000ULL);
  assert(!source->enabled);

  std::size_t matches = 0;
  for (const auto& listed : repo.ListSources(*tx)) {
    if (listed.source_id == id) ++matches;
  }
  assert(matches == 1);

  auto state = repo.GetState(*tx, prefix + "-state");
  assert(state.has_value() && state->value == R"({"used":2})");
  assert(!repo.GetState(*tx, prefix + "-absent").has_value());
  tx->Commit();
}

// Racing workers claim one pending item; exactly one must win.
void VerifyConcurrentClaims(const std::shared_ptr<Repository>& repo, const std::string& prefix) {
  relay::core::ItemStore store(repo, nullptr);
  const auto             id = prefix + "-claim";

  ItemRecord candidate;
  candidate.external_id = id;
  store.RecordDiscovered(candidate);

  std::atomic<int>         claimed{0};
  std::vector<std::thread> workers;
  for (int i = 0; i < 8; ++i) {
    workers.emplace_back([&] {
      if (store.BeginRetrieval(id)) claimed++;
    });
  }
  for (auto& worker : workers) worker.join();

  assert(claimed == 1);
  const auto record = store.Get(id);
  assert(record->retrieval_status == JOB_STATUS_IN_PROGRESS);
  assert(record->retrieval_attempts == 1);
}

void VerifyRestartDurability(BackendFactory& backend, const std::string& prefix) {
  if (!backend.supports_restart()) {
    return;
  }

  auto repo = backend.make_repository();
  {
    relay::core::ItemStore   items(repo, nullptr);
    relay::core::SourceStore sources(repo);

    ItemRecord candidate;
    candidate.external_id = prefix + "-durable";
    candidate.title       = "Durable";
    items.RecordDiscovered(candidate);
    items.BeginRetrieval(candidate.external_id);

    sources.UpsertSource(prefix + "-durable-source", "Durable Source", "");
    sources.AdvanceCheckpoint(prefix + "-durable-source", "V9", 1000, 2000);
    sources.PutState(prefix + "-durable-state", "kept");
  }

  backend.restart(repo);

  relay::core::ItemStore   items(repo, nullptr);
  relay::core::SourceStore sources(repo);

  // crash leaves the job in_progress until startup recovery runs
  assert(items.Get(prefix + "-durable")->retrieval_status == JOB_STATUS_IN_PROGRESS);
  const auto reset = items.ResetStuck();
  assert(reset.retrieval >= 1);
  assert(items.Get(prefix + "-durable")->retrieval_status == JOB_STATUS_PENDING);
  assert(items.Get(prefix + "-durable")->retrieval_attempts == 1);

  assert(sources.GetSource(prefix + "-durable-source")->last_seen_item_id == "V9");
  assert(sources.GetState(prefix + "-durable-state") == "kept");
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name             = "memory",
      .make_repository  = []() { return std::make_shared<MemoryRepository>(); },
      .supports_restart = []() { return false; },
      .restart          = [](std::shared_ptr<Repository>&) {},
      .cleanup          = []() {},
  };
}

#if RELAY_DB_SQLITE
class SqliteExecutor final : public relay::db::sql::MigrationExecutor {
 public:
  explicit SqliteExecutor(relay::db::sqlite::SqliteDB& db) : db_(db) {
  }

  void ExecuteSQL(const std::string& sql) override {
    db_.Exec(sql);
  }

 private:
  relay::db::sqlite::SqliteDB& db_;
};

BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("relay_manager_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  auto make_repo = [db_path]() {
    auto           db = std::make_shared<relay::db::sqlite::SqliteDB>(db_path);
    SqliteExecutor executor(*db);
    relay::db::sql::RunMigrations(executor, relay::db::sql::SqliteSchema());
    // second run must be a no-op
    relay::db::sql::RunMigrations(executor, relay::db::sql::SqliteSchema());
    return std::make_shared<relay::db::sqlite::SqliteRepository>(std::move(db));
  };

  return BackendFactory{
      .name             = "sqlite",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup =
          [db_path]() {
            std::filesystem::remove(db_path);
            std::filesystem::remove(db_path + "-wal");
            std::filesystem::remove(db_path + "-shm");
          },
  };
}
#endif

#if RELAY_DB_POSTGRES
class PostgresExecutor final : public relay::db::sql::MigrationExecutor {
 public:
  explicit PostgresExecutor(pqxx::work& tx) : tx_(tx) {
  }

  void ExecuteSQL(const std::string& sql) override {
    tx_.exec(sql);
  }

 private:
  pqxx::work& tx_;
};

BackendFactory MakePostgresFactory() {
  const char* uri = std::getenv("RELAY_TEST_POSTGRES_URI");
  if (uri == nullptr || std::string(uri).empty()) {
    throw std::runtime_error("RELAY_TEST_POSTGRES_URI is not set");
  }

  auto conninfo  = std::string(uri);
  auto make_repo = [conninfo]() {
    {
      pqxx::connection conn(conninfo);
      pqxx::work       tx(conn);
      PostgresExecutor executor(tx);
      relay::db::sql::RunMigrations(executor, relay::db::sql::PostgresSchema());
      tx.commit();
    }
    return std::make_shared<relay::db::postgres::PgRepository>(std::make_shared<relay::db::postgres::PgPool>(conninfo));
  };

  return BackendFactory{
      .name             = "postgres",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup          = []() {},
  };
}
#endif

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  auto       repo   = backend.make_repository();
  const auto prefix = backend.name + "-" + std::to_string(NowMs());

  VerifyItemCrud(*repo, prefix);
  VerifyListsAndOrdering(*repo, prefix);
  VerifyRollbackBehavior(*repo, prefix);
  VerifySourcesAndState(*repo, prefix);
  VerifyConcurrentClaims(repo, prefix);

  VerifyRestartDurability(backend, prefix);

  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());

#if RELAY_DB_SQLITE
  backends.push_back(MakeSqliteFactory());
#endif

#if RELAY_DB_POSTGRES
  try {
    backends.push_back(MakePostgresFactory());
  } catch (const std::exception& ex) {
    std::cout << "skipping postgres integration suite: " << ex.what() << "\n";
  }
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "relay_manager_integration_repository_parity: pass\n";
  return 0;
}
