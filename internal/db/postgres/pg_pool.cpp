#include "pg_pool.hpp"

namespace relay::db::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)),
      max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  std::unique_lock lock(mutex_);
  cv_.wait(lock, [this] { return !idle_.empty() || live_connections_ < max_connections_; });

  if (!idle_.empty()) {
    auto conn = std::move(idle_.back());
    idle_.pop_back();
    return Wrap(conn.release());
  }

  ++live_connections_;
  lock.unlock();

  std::unique_ptr<pqxx::connection> conn;
  try {
    conn = std::make_unique<pqxx::connection>(conninfo_);
    PrepareStatements(*conn);
  } catch (const std::exception&) {
    std::lock_guard rollback_lock(mutex_);
    --live_connections_;
    cv_.notify_one();
    throw;
  }
  return Wrap(conn.release());
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  conn.prepare("get_device",
               "SELECT id,name,secret_hash,COALESCE(info_json,''),COALESCE(status_json,''),settings_json,presence,last_seen_ms,created_at_ms,paired "
               "FROM devices WHERE id=$1");

  conn.prepare("update_device",
               "UPDATE devices SET name=$2,secret_hash=$3,info_json=$4,status_json=$5,settings_json=$6,presence=$7,last_seen_ms=$8,paired=$9 "
               "WHERE id=$1");

  conn.prepare("get_command",
               "SELECT id,device_id,action,params_json,status,created_at_ms,delivered_at_ms,completed_at_ms,COALESCE(error,''),seq "
               "FROM commands WHERE id=$1");

  conn.prepare("update_command", "UPDATE commands SET status=$2,delivered_at_ms=$3,completed_at_ms=$4,error=$5 WHERE id=$1");
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

} // namespace relay::db::postgres
