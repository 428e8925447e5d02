#include "pg_pool.hpp"

#include "internal/db/schema.hpp"

namespace depgraph::db::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)),
      max_connections_(max_connections == 0 ? 1 : max_connections) {
}

void PgPool::Bootstrap() {
  pqxx::connection conn(conninfo_);
  pqxx::work       tx(conn);

  tx.exec(schema::kCreatePublications);
  tx.exec(schema::kCreateReferences);

  tx.exec(schema::kProbePublications);
  tx.exec(schema::kProbeReferences);
  tx.commit();
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  std::unique_lock lock(mutex_);

  for (;;) {
    if (!idle_.empty()) {
      auto conn = std::move(idle_.back());
      idle_.pop_back();
      return Wrap(conn.release());
    }

    if (live_connections_ < max_connections_) {
      ++live_connections_;
      lock.unlock();

      try {
        auto conn = std::make_unique<pqxx::connection>(conninfo_);
        PrepareStatements(*conn);
        return Wrap(conn.release());
      } catch (const std::exception&) {
        std::lock_guard rollback_lock(mutex_);
        --live_connections_;
        cv_.notify_one();
        throw;
      }
    }

    cv_.wait(lock, [this] {
      return !idle_.empty() || live_connections_ < max_connections_;
    });
  }
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  conn.prepare("insert_publication",
               "INSERT INTO contract_publication(epoch,contract_id,version_label,interface_hash,published_at_ms) "
               "VALUES($1,$2,$3,$4,$5)");

  conn.prepare("insert_reference",
               "INSERT INTO contract_reference(epoch,seq,target_contract_id,kind) VALUES($1,$2,$3,$4)");

  conn.prepare("last_epoch", "SELECT MAX(epoch) FROM contract_publication");

  conn.prepare("list_publications",
               "SELECT epoch,contract_id,version_label,interface_hash,published_at_ms "
               "FROM contract_publication ORDER BY epoch");

  conn.prepare("get_publication",
               "SELECT epoch,contract_id,version_label,interface_hash,published_at_ms "
               "FROM contract_publication WHERE contract_id=$1 AND version_label=$2");

  conn.prepare("list_references",
               "SELECT epoch,target_contract_id,kind FROM contract_reference ORDER BY epoch,seq");

  conn.prepare("get_references",
               "SELECT target_contract_id,kind FROM contract_reference WHERE epoch=$1 ORDER BY seq");
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
    if (!conn->is_open()) {
      --live_connections_;
      delete conn;
    } else {
      idle_.emplace_back(conn);
    }
  }
  cv_.notify_one();
}

} // namespace depgraph::db::postgres
