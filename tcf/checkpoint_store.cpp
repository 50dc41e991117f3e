/*
 * checkpoint_store.cpp  Oct 5th, 2026
 *
 * sqlite backed checkpoint. WAL journal with synchronous=FULL so a committed
 * transition survives a crash of the process or the host.
 *
 */

#include "tcf/checkpoint_store.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

namespace tcf {

/************ SQL Queries *********************************/
static const std::string schema_sql =
R"(
PRAGMA journal_mode = WAL;
PRAGMA synchronous = FULL;
CREATE TABLE IF NOT EXISTS nodes (
  node_id    TEXT PRIMARY KEY,
  parent_id  TEXT NOT NULL DEFAULT '',
  level      INTEGER NOT NULL,
  name       TEXT NOT NULL DEFAULT '',
  state      INTEGER NOT NULL DEFAULT 0,
  attempts   INTEGER NOT NULL DEFAULT 0,
  error      TEXT NOT NULL DEFAULT '',
  updated_at TEXT NOT NULL DEFAULT ''
);
CREATE INDEX IF NOT EXISTS nodes_parent ON nodes(parent_id);
CREATE TABLE IF NOT EXISTS run_meta (
  key   TEXT PRIMARY KEY,
  value TEXT NOT NULL
);
)";

static const std::string insert_node_sql =
R"(
INSERT INTO nodes (node_id, parent_id, level, name, state, updated_at)
VALUES (?1, ?2, ?3, ?4, 0, ?5)
  ON CONFLICT(node_id) DO UPDATE SET
  name = excluded.name;
)";

static const std::string update_state_sql =
R"(
UPDATE nodes SET state = ?2, attempts = ?3, error = ?4, updated_at = ?5
WHERE node_id = ?1;
)";

static const std::string upsert_meta_sql =
R"(
INSERT INTO run_meta (key, value) VALUES (?1, ?2)
  ON CONFLICT(key) DO UPDATE SET value = excluded.value;
)";

CheckpointStore::CheckpointStore(std::string path)
  : dat::SqliteDB(path), path_(std::move(path))
{
  init_schema_();
  load();
}

/************ load() **************************************/
/* Reads the whole checkpoint. Nodes left in_progress by a crashed run are
 * put back to pending first: their partial results were never durable.
 *
 * We return:
 *   Snapshot of every node and the run metadata
 */
Checkpoint
CheckpointStore::load()
{
  std::lock_guard<std::mutex> lock(mu_);
  load_unlocked_();

  Checkpoint cp{};
  for (const auto& [id, entry] : cache_) {
    cp.nodes.emplace(id, entry);
  }
  cp.started_at    = started_at_;
  cp.last_updated  = last_updated_;
  cp.total_records = total_records_;
  return cp;
}

/************ reset() *************************************/
/* Drops every node and restarts the run metadata. Used by --fresh
 */
void
CheckpointStore::reset()
{
  std::lock_guard<std::mutex> lock(mu_);
  Tx tx(*this);
  exec("DELETE FROM nodes; DELETE FROM run_meta;");
  tx.commit();

  cache_.clear();
  order_.clear();
  total_records_ = 0;
  started_at_ = now_iso();
  last_updated_ = started_at_;
  write_meta_("started_at", started_at_);
  write_meta_("last_updated", last_updated_);
  write_meta_("total_records", "0");
  spdlog::info("checkpoint: reset {}", path_);
}

/************ register_node() *****************************/
/* Inserts a newly discovered node as pending. Known nodes keep their state,
 * only the display name is refreshed.
 */
void
CheckpointStore::register_node(const HierarchyNode& node)
{
  std::lock_guard<std::mutex> lock(mu_);
  const auto now = now_iso();

  try {
    const auto stmt = prepare(insert_node_sql);
    bind(stmt, 1, node.id);
    bind(stmt, 2, node.parent_id);
    bind(stmt, 3, static_cast<int64_t>(node.level));
    bind(stmt, 4, node.name);
    bind(stmt, 5, now);
    step(stmt);
  } catch (const PersistenceError&) {
    std::throw_with_nested(PersistenceError("checkpoint: register " + node.id));
  }

  auto [it, inserted] = cache_.try_emplace(node.id);
  if ( inserted ) {
    it->second.id         = node.id;
    it->second.parent_id  = node.parent_id;
    it->second.level      = node.level;
    it->second.updated_at = now;
    order_.push_back(node.id);
  }
  it->second.name = node.name;
}

/************ try_claim() *********************************/
/* Atomically moves a pending node to in_progress. Refuses nodes that are
 * claimed, completed or failed so no two workers ever fetch the same node.
 * A failed node needs retry_failed() first.
 *
 * We return:
 *   true when the caller now owns the node
 */
bool
CheckpointStore::try_claim(const std::string& node_id)
{
  std::lock_guard<std::mutex> lock(mu_);
  auto it = cache_.find(node_id);
  if ( it == cache_.end() ) {
    throw TransitionError("checkpoint: claim of unknown node " + node_id);
  }

  if ( it->second.state != NodeState::Pending ) {
    return false;
  }

  NodeEntry next = it->second;
  next.state = NodeState::InProgress;
  next.attempts += 1;
  next.error.clear();
  const auto now = now_iso();
  write_state_(next, now);
  it->second = std::move(next);
  return true;
}

/************ mark() **************************************/
/* Sole mutator of NodeState. The new state is durable when this returns,
 * a failed write throws PersistenceError and leaves the cached state as it
 * was.
 *
 * Throws:
 *   TransitionError for unknown nodes and illegal transitions
 *   PersistenceError for failure to commit
 */
void
CheckpointStore::mark(const std::string& node_id, NodeState state, std::string_view error)
{
  std::lock_guard<std::mutex> lock(mu_);
  auto it = cache_.find(node_id);
  if ( it == cache_.end() ) {
    throw TransitionError("checkpoint: mark of unknown node " + node_id);
  }

  const auto from = it->second.state;
  if ( !legal_(from, state) ) {
    throw TransitionError("checkpoint: illegal transition " + std::string(to_string(from)) +
                          " -> " + std::string(to_string(state)) + " for " + node_id);
  }

  NodeEntry next = it->second;
  next.state = state;
  if ( state == NodeState::InProgress ) {
    next.attempts += 1;
  }
  next.error = state == NodeState::Failed ? std::string(error) : std::string{};

  const auto now = now_iso();
  write_state_(next, now);
  it->second = std::move(next);
  spdlog::debug("checkpoint: {} {} -> {}", node_id, to_string(from), to_string(state));
}

/************ retry_failed() ******************************/
/* Explicit operator retry: failed -> pending, for one parent or everywhere.
 *
 * We return:
 *   Number of nodes moved back to pending
 */
size_t
CheckpointStore::retry_failed(const std::optional<std::string>& parent_id)
{
  std::lock_guard<std::mutex> lock(mu_);
  const auto now = now_iso();

  std::vector<NodeEntry> moved;
  for (const auto& id : order_) {
    const auto& entry = cache_.at(id);
    if ( entry.state != NodeState::Failed ) {
      continue;
    }
    if ( parent_id && entry.parent_id != *parent_id ) {
      continue;
    }
    NodeEntry next = entry;
    next.state = NodeState::Pending;
    next.error.clear();
    moved.push_back(std::move(next));
  }

  if ( moved.empty() ) {
    return 0;
  }

  Tx tx(*this);
  for (const auto& entry : moved) {
    write_state_(entry, now);
  }
  tx.commit();

  for (auto& entry : moved) {
    cache_[entry.id] = std::move(entry);
  }
  spdlog::info("checkpoint: {} failed nodes returned to pending", moved.size());
  return moved.size();
}

void
CheckpointStore::add_records(size_t count)
{
  std::lock_guard<std::mutex> lock(mu_);
  const auto total = total_records_ + static_cast<int64_t>(count);
  write_meta_("total_records", std::to_string(total));
  total_records_ = total;
}

bool
CheckpointStore::is_completed(const std::string& node_id) const
{
  return state_of(node_id) == NodeState::Completed;
}

bool
CheckpointStore::is_failed(const std::string& node_id) const
{
  return state_of(node_id) == NodeState::Failed;
}

std::optional<NodeState>
CheckpointStore::state_of(const std::string& node_id) const
{
  std::lock_guard<std::mutex> lock(mu_);
  auto it = cache_.find(node_id);
  if ( it == cache_.end() ) {
    return std::nullopt;
  }
  return it->second.state;
}

std::optional<NodeEntry>
CheckpointStore::entry(const std::string& node_id) const
{
  std::lock_guard<std::mutex> lock(mu_);
  auto it = cache_.find(node_id);
  if ( it == cache_.end() ) {
    return std::nullopt;
  }
  return it->second;
}

/************ pending_nodes() *****************************/
/* Children of parent_id still to be fetched, in discovery order. Failed
 * children are only included on a retry pass.
 */
std::vector<std::string>
CheckpointStore::pending_nodes(const std::string& parent_id, bool include_failed) const
{
  std::lock_guard<std::mutex> lock(mu_);
  std::vector<std::string> out;
  for (const auto& id : order_) {
    const auto& entry = cache_.at(id);
    if ( entry.parent_id != parent_id ) {
      continue;
    }
    if ( entry.state == NodeState::Pending ||
         (include_failed && entry.state == NodeState::Failed) ) {
      out.push_back(id);
    }
  }
  return out;
}

std::vector<std::string>
CheckpointStore::failed_nodes(const std::string& parent_id) const
{
  std::lock_guard<std::mutex> lock(mu_);
  std::vector<std::string> out;
  for (const auto& id : order_) {
    const auto& entry = cache_.at(id);
    if ( entry.parent_id == parent_id && entry.state == NodeState::Failed ) {
      out.push_back(id);
    }
  }
  return out;
}

std::vector<NodeEntry>
CheckpointStore::children(const std::string& parent_id) const
{
  std::lock_guard<std::mutex> lock(mu_);
  std::vector<NodeEntry> out;
  for (const auto& id : order_) {
    const auto& entry = cache_.at(id);
    if ( entry.parent_id == parent_id ) {
      out.push_back(entry);
    }
  }
  return out;
}

ResumeStatus
CheckpointStore::status() const
{
  std::lock_guard<std::mutex> lock(mu_);
  ResumeStatus st{};
  st.path          = path_;
  st.started_at    = started_at_;
  st.last_updated  = last_updated_;
  st.total_records = total_records_;

  for (const auto& [id, entry] : cache_) {
    if ( entry.level == NodeLevel::Category ) {
      if ( entry.state == NodeState::Completed ) {
        st.categories_completed += 1;
      }
      continue;
    }
    switch ( entry.state ) {
      case NodeState::Pending:    st.pending += 1; break;
      case NodeState::InProgress: st.in_progress += 1; break;
      case NodeState::Completed:  st.completed += 1; break;
      case NodeState::Failed:     st.failed += 1; break;
    }
  }
  st.can_resume = st.completed > 0 || st.failed > 0 || st.pending > 0;
  return st;
}

/************ private *************************************/

void
CheckpointStore::init_schema_()
{
  try {
    exec(schema_sql);
  } catch (const PersistenceError&) {
    std::throw_with_nested(PersistenceError("checkpoint: schema init " + path_));
  }
}

void
CheckpointStore::load_unlocked_()
{
  cache_.clear();
  order_.clear();

  Tx tx(*this);
  exec("UPDATE nodes SET state = 0 WHERE state = 1;");

  try {
    const auto stmt = prepare("SELECT node_id, parent_id, level, name, state, attempts, "
                              "error, updated_at FROM nodes ORDER BY rowid;");
    while ( step(stmt) ) {
      NodeEntry entry{};
      entry.id         = column_text(stmt, 0);
      entry.parent_id  = column_text(stmt, 1);
      entry.level      = static_cast<NodeLevel>(column_int(stmt, 2));
      entry.name       = column_text(stmt, 3);
      entry.state      = static_cast<NodeState>(column_int(stmt, 4));
      entry.attempts   = column_int(stmt, 5);
      entry.error      = column_text(stmt, 6);
      entry.updated_at = column_text(stmt, 7);
      order_.push_back(entry.id);
      cache_.emplace(entry.id, std::move(entry));
    }
  } catch (const PersistenceError&) {
    std::throw_with_nested(PersistenceError("checkpoint: load " + path_));
  }

  started_at_   = read_meta_("started_at");
  last_updated_ = read_meta_("last_updated");
  const auto total = read_meta_("total_records");
  total_records_ = total.empty() ? 0 : std::stoll(total);

  if ( started_at_.empty() ) {
    started_at_ = now_iso();
    write_meta_("started_at", started_at_);
  }
  tx.commit();

  spdlog::info("checkpoint: loaded {} nodes from {}", cache_.size(), path_);
}

/* Node row and last_updated in one transaction */
void
CheckpointStore::write_state_(const NodeEntry& entry, const std::string& now)
{
  std::optional<Tx> tx;
  if ( !in_transaction() ) {
    tx.emplace(*this);
  }

  try {
    const auto stmt = prepare(update_state_sql);
    bind(stmt, 1, entry.id);
    bind(stmt, 2, static_cast<int64_t>(entry.state));
    bind(stmt, 3, entry.attempts);
    bind(stmt, 4, entry.error);
    bind(stmt, 5, now);
    step(stmt);
  } catch (const PersistenceError&) {
    std::throw_with_nested(PersistenceError("checkpoint: write " + entry.id));
  }

  write_meta_("last_updated", now);
  if ( tx ) {
    tx->commit();
  }
  last_updated_ = now;
}

void
CheckpointStore::write_meta_(std::string_view key, const std::string& value)
{
  try {
    const auto stmt = prepare(upsert_meta_sql);
    bind(stmt, 1, key);
    bind(stmt, 2, value);
    step(stmt);
  } catch (const PersistenceError&) {
    std::throw_with_nested(PersistenceError("checkpoint: meta " + std::string(key)));
  }
}

std::string
CheckpointStore::read_meta_(std::string_view key)
{
  std::string value;
  try {
    const auto stmt = prepare("SELECT value FROM run_meta WHERE key = ?1;");
    bind(stmt, 1, key);
    if ( step(stmt) ) {
      value = column_text(stmt, 0);
    }
  } catch (const PersistenceError&) {
    std::throw_with_nested(PersistenceError("checkpoint: meta " + std::string(key)));
  }
  return value;
}

bool
CheckpointStore::legal_(NodeState from, NodeState to) noexcept
{
  switch ( from ) {
    case NodeState::Pending:
      return true;
    case NodeState::InProgress:
      return to != NodeState::InProgress;
    case NodeState::Completed:
      return to == NodeState::Completed;
    case NodeState::Failed:
      return to == NodeState::Pending || to == NodeState::Failed;
  }
  return false;
}

} // end namespace tcf
