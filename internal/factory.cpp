#include "factory.hpp"

#include <memory>
#include <stdexcept>
#include <string>

#include "internal/cache/result_cache.hpp"
#include "internal/core/graph_reader.hpp"
#include "internal/core/publication_coordinator.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/graph/graph_store.hpp"
#include "internal/grpc/graph_server.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/graph_service.hpp"
#include "internal/service/service_context.hpp"
#if DEPGRAPH_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if DEPGRAPH_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace depgraph::factory {

using depgraph::observability::BoolField;
using depgraph::observability::IntField;
using depgraph::observability::StringField;

std::shared_ptr<db::Repository> BuildRepository(const depgraph::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if DEPGRAPH_DB_SQLITE
    const auto& sqlite = database.sqlite();
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(sqlite.path(), sqlite.wal_mode());
    sqlite_db->Bootstrap();
    DEPGRAPH_LOG_INFO("publication log backend", {StringField("backend", "sqlite"), StringField("path", sqlite.path()),
                                                  BoolField("wal_mode", sqlite.wal_mode())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if DEPGRAPH_DB_POSTGRES
    const auto& postgres = database.postgres();
    auto        pool     = std::make_shared<db::postgres::PgPool>(postgres.connection_uri(),
                                                                  postgres.max_connections() == 0 ? 16 : postgres.max_connections());
    pool->Bootstrap();
    DEPGRAPH_LOG_INFO("publication log backend",
                      {StringField("backend", "postgres"), IntField("max_connections", static_cast<std::int64_t>(pool->MaxConnections()))});
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  DEPGRAPH_LOG_WARN("publication log backend", {StringField("backend", "memory"), BoolField("durable", false)});
  return std::make_shared<db::memory::MemoryRepository>();
}

/*
    Build full application dependency graph
*/
Application Build(const depgraph::runtime::config::RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Core components
  // ------------------------------------------------------------------
  const auto& cache_config = config.cache();

  auto graph_store  = std::make_shared<graph::GraphStore>();
  auto result_cache = std::make_shared<cache::ResultCache>(static_cast<std::size_t>(cache_config.max_entries()), !cache_config.disabled());

  app.repository  = BuildRepository(config);
  app.coordinator = std::make_shared<core::PublicationCoordinator>(graph_store, result_cache, app.repository);
  app.reader      = std::make_shared<core::GraphReader>(graph_store, result_cache, config.graph().max_tree_depth());

  app.coordinator->Hydrate();

  DEPGRAPH_LOG_INFO("graph engine ready", {IntField("epoch", static_cast<std::int64_t>(graph_store->Current()->Epoch())),
                                           BoolField("cache_enabled", result_cache->Enabled()),
                                           IntField("cache_max_entries", static_cast<std::int64_t>(cache_config.max_entries())),
                                           IntField("max_tree_depth", app.reader->MaxTreeDepth())});

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.coordinator = app.coordinator;
  ctx.reader      = app.reader;

  app.graph_service = std::make_shared<service::GraphService>(ctx);

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_unique<grpc::GraphServer>(app.graph_service));

  return app;
}

} // namespace depgraph::factory
