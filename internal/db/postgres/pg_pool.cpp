#include "pg_pool.hpp"

#include "internal/db/sql/sql_queries.hpp"

namespace assetdb::db::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)),
      max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  for (;;) {
    {
      std::unique_lock lock(mutex_);

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
        } catch (...) {
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
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  conn.prepare("insert_genesis_point", sql::Numbered(sql::INSERT_GENESIS_POINT));
  conn.prepare("select_genesis_point_id", sql::Numbered(sql::SELECT_GENESIS_POINT_ID));
  conn.prepare("insert_genesis_asset", sql::Numbered(sql::INSERT_GENESIS_ASSET));
  conn.prepare("select_genesis_asset_id", sql::Numbered(sql::SELECT_GENESIS_ASSET_ID));
  conn.prepare("select_genesis_by_id", sql::Numbered(sql::SELECT_GENESIS_BY_ID));

  conn.prepare("upsert_internal_key", sql::Numbered(sql::UPSERT_INTERNAL_KEY));
  conn.prepare("select_internal_key_by_raw", sql::Numbered(sql::SELECT_INTERNAL_KEY_BY_RAW));
  conn.prepare("select_internal_key_by_id", sql::Numbered(sql::SELECT_INTERNAL_KEY_BY_ID));

  conn.prepare("upsert_script_key", sql::Numbered(sql::UPSERT_SCRIPT_KEY));
  conn.prepare("select_script_key_id_by_tweaked", sql::Numbered(sql::SELECT_SCRIPT_KEY_ID_BY_TWEAKED));
  conn.prepare("select_script_key_by_id", sql::Numbered(sql::SELECT_SCRIPT_KEY_BY_ID));

  conn.prepare("insert_group_key", sql::Numbered(sql::INSERT_GROUP_KEY));
  conn.prepare("select_group_key_id", sql::Numbered(sql::SELECT_GROUP_KEY_ID));
  conn.prepare("insert_group_sig", sql::Numbered(sql::INSERT_GROUP_SIG));
  conn.prepare("select_group_sig_id", sql::Numbered(sql::SELECT_GROUP_SIG_ID));

  conn.prepare("select_asset_id_by_identity", sql::Numbered(sql::SELECT_ASSET_ID_BY_IDENTITY));
  conn.prepare("insert_asset", sql::Numbered(sql::INSERT_ASSET));
  conn.prepare("select_asset_by_id", sql::Numbered(sql::SELECT_ASSET_BY_ID));
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

} // namespace assetdb::db::postgres
