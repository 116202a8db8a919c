#include "pg_pool.hpp"

namespace pokertable::db::postgres {

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
}

void PgPool::BootstrapSchema() {
  static const std::vector<std::string> kBootstrapSql = {
      "CREATE TABLE IF NOT EXISTS poker_tables (id BIGSERIAL PRIMARY KEY, status INTEGER NOT NULL, config_json TEXT NOT NULL, "
      "last_action_at_ms BIGINT NOT NULL DEFAULT 0, expires_at_ms BIGINT NOT NULL DEFAULT 0, updated_at_ms BIGINT NOT NULL DEFAULT 0)",
      "CREATE TABLE IF NOT EXISTS seats (id BIGSERIAL PRIMARY KEY, table_id BIGINT NOT NULL REFERENCES poker_tables(id), "
      "user_id BIGINT NOT NULL, position INTEGER NOT NULL, chips BIGINT NOT NULL, joined_at_ms BIGINT NOT NULL, "
      "left_at_ms BIGINT NOT NULL DEFAULT 0, is_sitting_out_next_hand BOOLEAN NOT NULL DEFAULT FALSE)",
      "CREATE UNIQUE INDEX IF NOT EXISTS seats_active_position ON seats(table_id, position) WHERE left_at_ms = 0",
      "CREATE UNIQUE INDEX IF NOT EXISTS seats_active_user ON seats(table_id, user_id) WHERE left_at_ms = 0",
      "CREATE TABLE IF NOT EXISTS hands (id BIGSERIAL PRIMARY KEY, table_id BIGINT NOT NULL REFERENCES poker_tables(id), "
      "hand_no INTEGER NOT NULL, status INTEGER NOT NULL, engine_state_json TEXT NOT NULL, inter_hand_json TEXT NOT NULL, "
      "pot_size BIGINT NOT NULL DEFAULT 0, timeout_tracking_json TEXT NOT NULL, version BIGINT NOT NULL DEFAULT 0, "
      "started_at_ms BIGINT NOT NULL, ended_at_ms BIGINT NOT NULL DEFAULT 0, UNIQUE(table_id, hand_no))",
      "CREATE UNIQUE INDEX IF NOT EXISTS hands_one_live ON hands(table_id) WHERE status <> 6",
      "CREATE TABLE IF NOT EXISTS pots (hand_id BIGINT NOT NULL REFERENCES hands(id), pot_index INTEGER NOT NULL, size BIGINT NOT NULL, "
      "PRIMARY KEY (hand_id, pot_index))",
      "CREATE TABLE IF NOT EXISTS hand_history (table_id BIGINT NOT NULL REFERENCES poker_tables(id), hand_no INTEGER NOT NULL, "
      "payload_json TEXT NOT NULL, created_at_ms BIGINT NOT NULL, PRIMARY KEY (table_id, hand_no))",
      "CREATE TABLE IF NOT EXISTS hand_actions (id BIGSERIAL PRIMARY KEY, hand_id BIGINT NOT NULL REFERENCES hands(id), "
      "user_id BIGINT NOT NULL, type INTEGER NOT NULL, amount BIGINT NOT NULL, created_at_ms BIGINT NOT NULL)",
      "CREATE TABLE IF NOT EXISTS ledger (id BIGSERIAL PRIMARY KEY, user_id BIGINT NOT NULL, amount BIGINT NOT NULL, "
      "type INTEGER NOT NULL, hand_id BIGINT NOT NULL, table_id BIGINT NOT NULL, reference TEXT NOT NULL, created_at_ms BIGINT NOT NULL)"};

  auto       conn = Acquire();
  pqxx::work tx(*conn);
  for (const auto& sql : kBootstrapSql) {
    tx.exec(sql);
  }
  tx.commit();
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  conn.prepare("get_table",
               "SELECT id,status,config_json,last_action_at_ms,expires_at_ms,updated_at_ms "
               "FROM poker_tables WHERE id=$1");
  conn.prepare("lock_table",
               "SELECT id,status,config_json,last_action_at_ms,expires_at_ms,updated_at_ms "
               "FROM poker_tables WHERE id=$1 FOR UPDATE");

  conn.prepare("update_table",
               "UPDATE poker_tables SET status=$2,config_json=$3,last_action_at_ms=$4,expires_at_ms=$5,updated_at_ms=$6 "
               "WHERE id=$1");

  conn.prepare("list_active_seats",
               "SELECT id,table_id,user_id,position,chips,joined_at_ms,left_at_ms,is_sitting_out_next_hand "
               "FROM seats WHERE table_id=$1 AND left_at_ms=0 ORDER BY position ASC");

  conn.prepare("update_seat", "UPDATE seats SET chips=$2,left_at_ms=$3,is_sitting_out_next_hand=$4,position=$5 WHERE id=$1");

  conn.prepare("insert_hand",
               "INSERT INTO hands(table_id,hand_no,status,engine_state_json,inter_hand_json,pot_size,timeout_tracking_json,version,"
               "started_at_ms,ended_at_ms) VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10) RETURNING id");

  conn.prepare("get_hand",
               "SELECT id,table_id,hand_no,status,engine_state_json,inter_hand_json,pot_size,timeout_tracking_json,version,"
               "started_at_ms,ended_at_ms FROM hands WHERE id=$1");

  conn.prepare("lock_hand",
               "SELECT id,table_id,hand_no,status,engine_state_json,inter_hand_json,pot_size,timeout_tracking_json,version,"
               "started_at_ms,ended_at_ms FROM hands WHERE id=$1 FOR UPDATE");

  conn.prepare("get_active_hand",
               "SELECT id,table_id,hand_no,status,engine_state_json,inter_hand_json,pot_size,timeout_tracking_json,version,"
               "started_at_ms,ended_at_ms FROM hands WHERE table_id=$1 AND status<>6 ORDER BY hand_no DESC LIMIT 1");

  conn.prepare("update_hand",
               "UPDATE hands SET status=$2,engine_state_json=$3,inter_hand_json=$4,pot_size=$5,timeout_tracking_json=$6,version=$7,"
               "ended_at_ms=$8 WHERE id=$1 AND version=$9");

  conn.prepare("insert_action", "INSERT INTO hand_actions(hand_id,user_id,type,amount,created_at_ms) VALUES($1,$2,$3,$4,$5)");

  conn.prepare("insert_ledger",
               "INSERT INTO ledger(user_id,amount,type,hand_id,table_id,reference,created_at_ms) "
               "VALUES($1,$2,$3,$4,$5,$6,$7)");
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

} // namespace pokertable::db::postgres
