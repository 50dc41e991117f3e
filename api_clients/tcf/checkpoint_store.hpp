/*
 * checkpoint_store.hpp  Oct 5th, 2026
 *
 * Durable per-node state for resumable runs. A sqlite file holds every
 * discovered category and group with its NodeState, plus run metadata.
 */

#ifndef __TCF_CHECKPOINT_STORE_HPP
#define __TCF_CHECKPOINT_STORE_HPP

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "database.hpp"
#include "fetch_support.hpp"

namespace tcf {

struct NodeEntry {
  std::string id;
  std::string parent_id;
  NodeLevel level{NodeLevel::Category};
  std::string name;
  NodeState state{NodeState::Pending};
  int64_t attempts{0};              // number of claims across runs
  std::string error;                // last failure message, failed only
  std::string updated_at;
};

struct Checkpoint {
  std::map<std::string, NodeEntry> nodes;
  std::string started_at;
  std::string last_updated;
  int64_t total_records{0};
};

struct ResumeStatus {
  std::string path;
  std::string started_at;
  std::string last_updated;
  size_t categories_completed{0};
  size_t pending{0};
  size_t in_progress{0};
  size_t completed{0};
  size_t failed{0};
  int64_t total_records{0};
  bool can_resume{false};
};

/************ tcf::CheckpointStore ************************/
/* Sole owner of NodeState. mark() and try_claim() write through to sqlite
 * before returning, the in-memory map is only updated after the write
 * committed. Safe for concurrent callers: one mutex serializes all access.
 *
 * Transitions:
 *   pending     -> in_progress | completed | failed
 *   in_progress -> pending | completed | failed
 *   failed      -> pending (explicit retry)
 *   completed   -> terminal
 */
class CheckpointStore : private dat::SqliteDB {
public:
  explicit CheckpointStore(std::string path);

  Checkpoint load();
  void reset();

  void register_node(const HierarchyNode& node);
  bool try_claim(const std::string& node_id);
  void mark(const std::string& node_id, NodeState state, std::string_view error = {});
  size_t retry_failed(const std::optional<std::string>& parent_id = std::nullopt);
  void add_records(size_t count);

  /********** queries *************************************/
  bool is_completed(const std::string& node_id) const;
  bool is_failed(const std::string& node_id) const;
  std::optional<NodeState> state_of(const std::string& node_id) const;
  std::optional<NodeEntry> entry(const std::string& node_id) const;
  std::vector<std::string> pending_nodes(const std::string& parent_id,
                                         bool include_failed = false) const;
  std::vector<std::string> failed_nodes(const std::string& parent_id) const;
  std::vector<NodeEntry> children(const std::string& parent_id) const;
  ResumeStatus status() const;
  const std::string& path() const noexcept { return path_; }

private:
  std::string path_;
  mutable std::mutex mu_;
  std::unordered_map<std::string, NodeEntry> cache_;
  std::vector<std::string> order_;  // discovery order, for stable traversal
  std::string started_at_;
  std::string last_updated_;
  int64_t total_records_{0};

  void init_schema_();
  void load_unlocked_();
  void write_state_(const NodeEntry& entry, const std::string& now);
  void write_meta_(std::string_view key, const std::string& value);
  std::string read_meta_(std::string_view key);
  static bool legal_(NodeState from, NodeState to) noexcept;
};

} // end namespace tcf

#endif // !__TCF_CHECKPOINT_STORE_HPP
