#include "pg_pool.hpp"

namespace tracebrain::db::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)),
      max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  std::unique_lock lock(mutex_);
  cv_.wait(lock, [this] {
    return !idle_.empty() || live_connections_ < max_connections_;
  });

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
    {
      std::lock_guard rollback_lock(mutex_);
      --live_connections_;
    }
    cv_.notify_one();
    throw;
  }
  return Wrap(conn.release());
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  conn.prepare("insert_trace",
               "INSERT INTO traces(trace_id,attributes,created_at_ms,updated_at_ms) "
               "VALUES($1,$2::jsonb,$3,$4)");

  conn.prepare("update_trace", "UPDATE traces SET attributes=$2::jsonb,updated_at_ms=$3 WHERE trace_id=$1");

  conn.prepare("get_trace",
               "SELECT trace_id,attributes::text,created_at_ms,updated_at_ms "
               "FROM traces WHERE trace_id=$1");

  conn.prepare("list_traces",
               "SELECT trace_id,attributes::text,created_at_ms,updated_at_ms "
               "FROM traces ORDER BY row_order ASC");

  conn.prepare("insert_span",
               "INSERT INTO spans(trace_id,span_id,parent_id,name,start_time_ns,end_time_ns,attributes,seq) "
               "VALUES($1,$2,NULLIF($3,''),$4,$5,$6,$7::jsonb,$8)");

  conn.prepare("get_spans",
               "SELECT trace_id,span_id,COALESCE(parent_id,''),name,start_time_ns,end_time_ns,attributes::text,seq "
               "FROM spans WHERE trace_id=$1 ORDER BY seq ASC");

  conn.prepare("list_spans",
               "SELECT s.trace_id,s.span_id,COALESCE(s.parent_id,''),s.name,s.start_time_ns,s.end_time_ns,"
               "s.attributes::text,s.seq "
               "FROM spans s JOIN traces t ON t.trace_id=s.trace_id ORDER BY t.row_order ASC, s.seq ASC");

  conn.prepare("insert_feedback",
               "INSERT INTO feedback(trace_id,seq,json,created_at_ms) VALUES($1,$2,$3::jsonb,$4)");

  conn.prepare("get_feedback",
               "SELECT trace_id,seq,json::text,created_at_ms FROM feedback WHERE trace_id=$1 ORDER BY seq ASC");

  conn.prepare("list_feedback",
               "SELECT f.trace_id,f.seq,f.json::text,f.created_at_ms "
               "FROM feedback f JOIN traces t ON t.trace_id=f.trace_id ORDER BY t.row_order ASC, f.seq ASC");

  conn.prepare("insert_review_signal",
               "INSERT INTO review_signals(trace_id,reason,created_at_ms) VALUES($1,$2,$3)");

  conn.prepare("get_review_signals",
               "SELECT trace_id,reason,created_at_ms FROM review_signals WHERE trace_id=$1 ORDER BY id ASC");

  conn.prepare("list_review_signals",
               "SELECT trace_id,reason,created_at_ms FROM review_signals ORDER BY id ASC");
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
    if (conn->is_open()) {
      idle_.emplace_back(conn);
    } else {
      // broken connection; let Acquire() open a fresh one
      delete conn;
      --live_connections_;
    }
  }
  cv_.notify_one();
}

} // namespace tracebrain::db::postgres
