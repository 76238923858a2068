#include "pg_tx.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace assetdb::db::postgres {

PgTransaction::PgTransaction(std::shared_ptr<PgPool> pool)
{
  conn_ = pool->Acquire();
  tx_ = std::make_unique<pqxx::work>(*conn_);
}

PgTransaction::~PgTransaction() {
  if (!finished_) {
    try {
      tx_->abort();
    } catch (const std::exception& e) {
      ASSETDB_LOG_WARN("postgres rollback failed", {observability::StringField("error", e.what())});
    }
  }
}

void PgTransaction::Commit() {
  try {
    tx_->commit();
  } catch (const pqxx::serialization_failure& e) {
    finished_ = true;
    throw util::StoreError(ErrorCode::SerializationFailure, std::string("commit: ") + e.what());
  } catch (const pqxx::broken_connection& e) {
    finished_ = true;
    throw util::StoreError(ErrorCode::IOError, std::string("commit: ") + e.what());
  } catch (const pqxx::in_doubt_error& e) {
    finished_ = true;
    throw util::StoreError(ErrorCode::IOError, std::string("commit outcome unknown: ") + e.what());
  } catch (const pqxx::sql_error& e) {
    finished_ = true;
    throw util::StoreError(ErrorCode::InternalError, std::string("commit: ") + e.what());
  }
  committed_ = true;
  finished_  = true;
}

void PgTransaction::Rollback() {
  finished_ = true;
  tx_->abort();
}

}
