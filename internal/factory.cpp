#include "factory.hpp"

#include <chrono>
#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/collab/command_fetcher.hpp"
#include "internal/collab/http_client.hpp"
#include "internal/collab/share_transfer.hpp"
#include "internal/collab/youtube_provider.hpp"
#include "internal/core/item_store.hpp"
#include "internal/core/relay_manager.hpp"
#include "internal/core/source_store.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/migrations.hpp"
#include "internal/discovery/quota_tracker.hpp"
#include "internal/discovery/scan_loop.hpp"
#include "internal/discovery/scanner.hpp"
#include "internal/events/event_broadcaster.hpp"
#include "internal/grpc/admin_server.hpp"
#include "internal/observability/logging.hpp"
#include "internal/progress/progress_tracker.hpp"
#include "internal/recovery/crash_recovery.hpp"
#include "internal/recovery/retry_classifier.hpp"
#include "internal/service/admin_service.hpp"
#include "internal/service/service_context.hpp"
#if RELAY_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if RELAY_DB_POSTGRES
#include <pqxx/pqxx>

#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace relay::factory {

using relay::runtime::config::RuntimeConfig;

namespace {

#if RELAY_DB_SQLITE
class SqliteMigrationExecutor final : public db::sql::MigrationExecutor {
 public:
  explicit SqliteMigrationExecutor(db::sqlite::SqliteDB& db) : db_(db) {
  }

  void ExecuteSQL(const std::string& sql) override {
    db_.Exec(sql);
  }

 private:
  db::sqlite::SqliteDB& db_;
};
#endif

#if RELAY_DB_POSTGRES
class PostgresMigrationExecutor final : public db::sql::MigrationExecutor {
 public:
  explicit PostgresMigrationExecutor(pqxx::work& tx) : tx_(tx) {
  }

  void ExecuteSQL(const std::string& sql) override {
    tx_.exec(sql);
  }

 private:
  pqxx::work& tx_;
};
#endif

std::shared_ptr<db::Repository> BuildRepository(const RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if RELAY_DB_SQLITE
    const auto& path   = database.sqlite().path();
    const auto  parent = std::filesystem::path(path).parent_path();
    if (!parent.empty()) std::filesystem::create_directories(parent);

    auto                    sqlite_db = std::make_shared<db::sqlite::SqliteDB>(path, database.sqlite().wal_mode());
    SqliteMigrationExecutor executor(*sqlite_db);
    db::sql::RunMigrations(executor, db::sql::SqliteSchema());

    RELAY_LOG_INFO("sqlite store opened", {observability::StringField("path", path)});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if RELAY_DB_POSTGRES
    // Bootstrap on a private connection: pooled connections prepare
    // statements against the tables on connect.
    {
      pqxx::connection          conn(database.postgres().connection_uri());
      pqxx::work                tx(conn);
      PostgresMigrationExecutor executor(tx);
      db::sql::RunMigrations(executor, db::sql::PostgresSchema());
      tx.commit();
    }

    auto pool = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri(), database.postgres().max_connections());
    RELAY_LOG_INFO("postgres store opened");
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  RELAY_LOG_WARN("no database configured, state is kept in memory only");
  return std::make_shared<db::memory::MemoryRepository>();
}

std::shared_ptr<collab::Fetcher> BuildFetcher(const RuntimeConfig& config) {
  const auto& fetcher = config.retrieval().fetcher();

  collab::CommandFetcherOptions options;
  options.program = fetcher.program();
  options.quality = fetcher.quality();
  options.extra_args.assign(fetcher.extra_args().begin(), fetcher.extra_args().end());
  return std::make_shared<collab::CommandFetcher>(std::move(options));
}

std::shared_ptr<collab::Transfer> BuildTransfer(const RuntimeConfig& config) {
  const auto& relay = config.relay();
  if (relay.enabled() && relay.share_root().empty()) {
    throw std::runtime_error("relay.share_root is required when relay is enabled");
  }

  collab::ShareTransferOptions options;
  options.share_root       = relay.share_root();
  options.standard_dir     = relay.standard_dir();
  options.short_dir        = relay.short_dir();
  options.chunk_size_bytes = relay.chunk_size_bytes();
  return std::make_shared<collab::ShareTransfer>(std::move(options));
}

} // namespace

/*
    Build full application dependency graph
*/
Application Build(const RuntimeConfig& config) {
  Application app;

  std::filesystem::create_directories(config.retrieval().download_dir());

  // ------------------------------------------------------------------
  // Persistence
  // ------------------------------------------------------------------
  auto repository = BuildRepository(config);

  // ------------------------------------------------------------------
  // Core components
  // ------------------------------------------------------------------
  auto broadcaster = std::make_shared<events::EventBroadcaster>(config.events().subscriber_buffer());
  auto progress    = std::make_shared<progress::ProgressTracker>(std::chrono::milliseconds(config.events().progress_throttle_ms()));
  auto items       = std::make_shared<core::ItemStore>(repository, broadcaster);
  auto sources     = std::make_shared<core::SourceStore>(repository);

  auto manager = std::make_shared<core::RelayManager>(core::ManagerOptions::FromConfig(config), items, progress, broadcaster,
                                                      BuildFetcher(config), BuildTransfer(config));

  // ------------------------------------------------------------------
  // Recovery
  // ------------------------------------------------------------------
  const auto&               recovery_config = config.recovery();
  recovery::RetryClassifier classifier(
      std::vector<std::string>(recovery_config.transient_markers().begin(), recovery_config.transient_markers().end()),
      recovery_config.max_attempts());
  auto recovery = std::make_shared<recovery::CrashRecovery>(items, progress, std::move(classifier), *manager, config.relay().enabled());

  // ------------------------------------------------------------------
  // Discovery
  // ------------------------------------------------------------------
  const auto& discovery = config.discovery();
  const auto& provider  = discovery.provider();

  auto quota = std::make_shared<discovery::QuotaTracker>(sources, provider.daily_quota_units(), provider.quota_reset_utc_offset_hours());

  collab::YoutubeProviderOptions provider_options;
  provider_options.token_file   = provider.token_file();
  provider_options.api_base_url = provider.api_base_url();
  provider_options.token_url    = provider.token_url();
  auto http_client = std::make_shared<collab::CurlHttpClient>(std::chrono::seconds(provider.request_timeout_seconds()));
  auto youtube     = std::make_shared<collab::YoutubeProvider>(std::move(provider_options), std::move(http_client), quota);

  discovery::ScannerOptions scanner_options;
  scanner_options.lookback_days        = discovery.lookback_days();
  scanner_options.max_items_per_source = discovery.max_items_per_source();
  scanner_options.source_delay         = std::chrono::milliseconds(discovery.source_delay_ms());

  auto scanner   = std::make_shared<discovery::Scanner>(scanner_options, youtube, items, sources, *manager);
  auto scan_loop = std::make_shared<discovery::ScanLoop>(scanner, std::chrono::seconds(discovery.interval_seconds()),
                                                         std::chrono::seconds(discovery.initial_delay_seconds()), discovery.enabled());

  // ------------------------------------------------------------------
  // Engine
  // ------------------------------------------------------------------
  runtime::Engine::Components components;
  components.items             = items;
  components.sources           = sources;
  components.progress          = progress;
  components.events            = broadcaster;
  components.manager           = manager;
  components.recovery          = recovery;
  components.quota             = quota;
  components.scanner           = scanner;
  components.scan_loop         = scan_loop;
  components.watchdog_interval = std::chrono::seconds(recovery_config.watchdog_interval_seconds());
  app.engine                   = std::make_unique<runtime::Engine>(std::move(components));

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.items     = items;
  ctx.sources   = sources;
  ctx.manager   = manager;
  ctx.progress  = progress;
  ctx.events    = broadcaster;
  ctx.quota     = quota;
  ctx.scanner   = scanner;
  ctx.scan_loop = scan_loop;

  auto admin_service = std::make_shared<service::AdminService>(ctx);

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_unique<grpc::AdminServer>(admin_service));

  return app;
}

} // namespace relay::factory
