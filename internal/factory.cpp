#include "factory.hpp"

#include <chrono>
#include <cstdlib>
#include <memory>
#include <string>
#include <vector>

#include "internal/auth/openssl_credentials.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/hash.hpp"
#include "internal/video/video_validator.hpp"
#if DEMONLIST_DB_SQLITE
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/db/sqlite/sqlite_tx.hpp"
#endif
#if DEMONLIST_DB_POSTGRES
#include "internal/db/postgres/pg_repository.hpp"
#include "internal/db/postgres/pg_tx.hpp"
#endif

namespace demonlist::factory {

using demonlist::runtime::config::RuntimeConfig;

namespace {

#if DEMONLIST_DB_SQLITE
void BootstrapSqliteSchema(db::Repository& repository) {
  static const std::vector<std::string> kBootstrapSql = {
      "CREATE TABLE IF NOT EXISTS players (id INTEGER PRIMARY KEY AUTOINCREMENT, name TEXT NOT NULL UNIQUE, banned INTEGER NOT NULL DEFAULT 0);",
      "CREATE TABLE IF NOT EXISTS demons (name TEXT PRIMARY KEY, position INTEGER NOT NULL, requirement INTEGER NOT NULL, video TEXT, verifier INTEGER NOT NULL REFERENCES players(id), publisher INTEGER NOT NULL REFERENCES players(id));",
      "CREATE TABLE IF NOT EXISTS submitters (id INTEGER PRIMARY KEY AUTOINCREMENT, ip TEXT NOT NULL UNIQUE, banned INTEGER NOT NULL DEFAULT 0);",
      "CREATE TABLE IF NOT EXISTS records (id INTEGER PRIMARY KEY AUTOINCREMENT, progress INTEGER NOT NULL CHECK (progress BETWEEN 0 AND 100), video TEXT, status INTEGER NOT NULL, player INTEGER NOT NULL REFERENCES players(id), submitter INTEGER NOT NULL REFERENCES submitters(id), demon TEXT NOT NULL REFERENCES demons(name) ON UPDATE CASCADE);",
      "CREATE TABLE IF NOT EXISTS users (id INTEGER PRIMARY KEY AUTOINCREMENT, name TEXT NOT NULL UNIQUE, display_name TEXT, youtube_channel TEXT, password_hash TEXT NOT NULL, permissions INTEGER NOT NULL DEFAULT 0);",
      "CREATE INDEX IF NOT EXISTS records_player_demon ON records(player, demon);",
      "CREATE INDEX IF NOT EXISTS records_video ON records(video);"};

  // the idle handle stays in the pool, which keeps shared in-memory databases alive
  auto  conn   = repository.Acquire();
  auto& sqlite = static_cast<db::sqlite::SqliteConnection&>(*conn);
  for (const auto& sql : kBootstrapSql) {
    sqlite.Exec(sql);
  }
}
#endif

#if DEMONLIST_DB_POSTGRES
void BootstrapPostgresSchema(db::Repository& repository) {
  auto       conn = repository.Acquire();
  pqxx::work tx(static_cast<db::postgres::PgConnection&>(*conn).Raw());

  tx.exec("CREATE TABLE IF NOT EXISTS players (id BIGSERIAL PRIMARY KEY, name TEXT NOT NULL UNIQUE, banned BOOLEAN NOT NULL DEFAULT FALSE);");
  tx.exec("CREATE TABLE IF NOT EXISTS demons (name TEXT PRIMARY KEY, position INTEGER NOT NULL, requirement INTEGER NOT NULL, video TEXT, verifier BIGINT NOT NULL REFERENCES players(id), publisher BIGINT NOT NULL REFERENCES players(id));");
  tx.exec("CREATE TABLE IF NOT EXISTS submitters (id BIGSERIAL PRIMARY KEY, ip TEXT NOT NULL UNIQUE, banned BOOLEAN NOT NULL DEFAULT FALSE);");
  tx.exec("CREATE TABLE IF NOT EXISTS records (id BIGSERIAL PRIMARY KEY, progress INTEGER NOT NULL CHECK (progress BETWEEN 0 AND 100), video TEXT, status SMALLINT NOT NULL, player BIGINT NOT NULL REFERENCES players(id), submitter BIGINT NOT NULL REFERENCES submitters(id), demon TEXT NOT NULL REFERENCES demons(name) ON UPDATE CASCADE);");
  tx.exec("CREATE TABLE IF NOT EXISTS users (id BIGSERIAL PRIMARY KEY, name TEXT NOT NULL UNIQUE, display_name TEXT, youtube_channel TEXT, password_hash TEXT NOT NULL, permissions INTEGER NOT NULL DEFAULT 0);");
  tx.exec("CREATE INDEX IF NOT EXISTS records_player_demon ON records(player, demon);");
  tx.exec("CREATE INDEX IF NOT EXISTS records_video ON records(video);");
  tx.commit();
}
#endif

std::string TokenSecret() {
  if (const char* secret = std::getenv("DEMONLIST_TOKEN_SECRET"); secret && *secret) {
    return secret;
  }
  DEMONLIST_LOG_WARN("DEMONLIST_TOKEN_SECRET not set, tokens will not survive a restart");
  return util::RandomHex(32);
}

} // namespace

std::shared_ptr<db::Repository> BuildRepository(const RuntimeConfig& config) {
  const auto& database        = config.database();
  const auto  max_connections = static_cast<std::size_t>(database.max_connections());
  const auto  acquire_timeout = std::chrono::milliseconds(database.acquire_timeout_ms());

  if (database.has_sqlite()) {
#if DEMONLIST_DB_SQLITE
    auto repository = std::make_shared<db::sqlite::SqliteRepository>(database.sqlite().path(), max_connections, acquire_timeout);
    BootstrapSqliteSchema(*repository);
    DEMONLIST_LOG_INFO("storage backend ready", {observability::StringField("backend", "sqlite"), observability::StringField("path", database.sqlite().path())});
    return repository;
#else
    throw util::InvalidState("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if DEMONLIST_DB_POSTGRES
    auto repository = std::make_shared<db::postgres::PgRepository>(database.postgres().connection_uri(), max_connections, acquire_timeout);
    BootstrapPostgresSchema(*repository);
    DEMONLIST_LOG_INFO("storage backend ready", {observability::StringField("backend", "postgres")});
    return repository;
#else
    throw util::InvalidState("postgres backend requested but not enabled at build time");
#endif
  }

  DEMONLIST_LOG_INFO("storage backend ready", {observability::StringField("backend", "memory")});
  return std::make_shared<db::memory::MemoryRepository>(max_connections, acquire_timeout);
}

Runtime BuildRuntime(const RuntimeConfig& config) {
  Runtime runtime;

  // ------------------------------------------------------------------
  // Storage
  // ------------------------------------------------------------------
  runtime.repository = BuildRepository(config);

  // ------------------------------------------------------------------
  // Collaborators
  // ------------------------------------------------------------------
  auto services                = std::make_shared<service::ServiceContext>();
  services->repository         = runtime.repository;
  services->password_hasher    = std::make_shared<auth::Pbkdf2PasswordHasher>();
  services->token_codec        = std::make_shared<auth::HmacTokenCodec>(TokenSecret());
  services->video_validator    = std::make_shared<video::HostListVideoValidator>();
  services->list_size          = static_cast<int>(config.list().list_size());
  services->extended_list_size = static_cast<int>(config.list().extended_list_size());
  services->default_page_limit = config.pagination().default_limit();
  services->max_page_limit     = config.pagination().max_limit();
  runtime.services             = services;

  // ------------------------------------------------------------------
  // Workers
  // ------------------------------------------------------------------
  runtime.workers = std::make_unique<executor::WorkerPool>(runtime.services, config.workers().threads());
  runtime.workers->Start();

  DEMONLIST_LOG_INFO("runtime started", {observability::IntField("workers", config.workers().threads()),
                                         observability::IntField("list_size", services->list_size),
                                         observability::IntField("extended_list_size", services->extended_list_size)});
  return runtime;
}

} // namespace demonlist::factory
