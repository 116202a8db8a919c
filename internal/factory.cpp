#include "factory.hpp"

#include <memory>
#include <stdexcept>
#include <string>

#include "internal/collab/table_lifecycle.hpp"
#include "internal/collab/wallet_service.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/engine/holdem_engine.hpp"
#include "internal/grpc/table_server.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/service_context.hpp"
#include "internal/service/table_service.hpp"
#if POKERTABLE_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if POKERTABLE_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace pokertable::factory {

using pokertable::observability::IntField;
using pokertable::observability::StringField;

core::GameSettings BuildGameSettings(const pokertable::runtime::config::GameConfig& game) {
  core::GameSettings settings;
  if (game.post_hand_delay_seconds() != 0) settings.post_hand_delay_seconds = game.post_hand_delay_seconds();
  if (game.default_small_blind() != 0) settings.default_small_blind = game.default_small_blind();
  if (game.default_big_blind() != 0) settings.default_big_blind = game.default_big_blind();
  if (game.turn_timeout_seconds() != 0) settings.turn_timeout_seconds = game.turn_timeout_seconds();
  if (game.has_rake()) {
    settings.rake.rate_basis_points = game.rake().rate_basis_points();
    settings.rake.cap               = game.rake().cap();
  }

  if (settings.default_small_blind <= 0 || settings.default_big_blind < settings.default_small_blind) {
    throw std::runtime_error("invalid game config: default blinds must satisfy 0 < small <= big");
  }
  if (settings.rake.rate_basis_points > 10000) {
    throw std::runtime_error("invalid game config: rake rate_basis_points must be <= 10000");
  }
  return settings;
}

std::shared_ptr<db::Repository> BuildRepository(const pokertable::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if POKERTABLE_DB_SQLITE
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path());
    sqlite_db->BootstrapSchema();
    POKERTABLE_LOG_INFO("sqlite repository ready", {StringField("path", database.sqlite().path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if POKERTABLE_DB_POSTGRES
    const auto max_connections = database.postgres().max_connections() == 0 ? 16u : database.postgres().max_connections();
    auto       pool            = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri(), max_connections);
    pool->BootstrapSchema();
    POKERTABLE_LOG_INFO("postgres repository ready", {IntField("max_connections", max_connections)});
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  POKERTABLE_LOG_WARN("no database configured; using the in-memory repository");
  return std::make_shared<db::memory::MemoryRepository>();
}

Application Build(const pokertable::runtime::config::RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Persistence
  // ------------------------------------------------------------------
  app.repository = BuildRepository(config);

  // ------------------------------------------------------------------
  // Core
  // ------------------------------------------------------------------
  auto engine_factory = std::make_shared<engine::HoldemEngineFactory>();
  auto wallet         = std::make_shared<collab::LedgerWalletService>();
  auto lifecycle      = std::make_shared<collab::DefaultTableLifecycle>();

  app.manager = std::make_shared<core::RuntimeManager>(app.repository, engine_factory, wallet, lifecycle, BuildGameSettings(config.game()));

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.manager    = app.manager;
  ctx.repository = app.repository;

  auto table_service = std::make_shared<service::TableService>(ctx);

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_unique<grpc::TableServer>(table_service));

  return app;
}

} // namespace pokertable::factory
