/*
 * fetch_support.hpp  Oct 2nd, 2026
 *
 * Defines the structures and detached helper functions that the fetcher and
 * its collaborators (governor, pool, checkpoint, sink) share
 *
 */

#ifndef __TCF_FETCH_SUPPORT_HPP
#define __TCF_FETCH_SUPPORT_HPP

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include <boost/json.hpp>

using millis = std::chrono::milliseconds;

namespace tcf {

/************ supporting structures ***********************/

enum class NodeLevel : uint8_t {
  Category = 0,
  Group    = 1,
  Item     = 2
};

/* Owned by CheckpointStore. Integer values are persisted, do not reorder */
enum class NodeState : uint8_t {
  Pending    = 0,
  InProgress = 1,
  Completed  = 2,
  Failed     = 3
};

/* Classification of a single request, consumed by governor and pool */
enum class Outcome : uint8_t {
  Ok,
  RateLimited,
  ServerError,
  ClientError
};

struct HierarchyNode {
  std::string id;                   // stable external id, "<cat>" or "<cat>:<group>"
  std::string parent_id;            // empty for categories
  NodeLevel level{NodeLevel::Category};
  std::string name;                 // display only
  boost::json::object source{};     // object as listed by the parent request
};

/* One flat warehouse row: a catalog item or a price observation */
struct Record {
  std::string category_id;
  std::string group_id;
  std::string product_id;           // empty when the item carries none
  std::string update_date;          // ISO date of the run
  boost::json::object fields{};     // category_*, group_*, product_* members

  // Rough size used for byte bounded batches
  size_t approx_bytes() const;
};

/************ helpers *************************************/

std::string_view to_string(NodeState state) noexcept;
std::string_view to_string(Outcome outcome) noexcept;

/************ classify_status() ***************************/
/* Maps an HTTP status onto the throttle/server/client taxonomy.
 * 403 and 429 are throttling, not authorization, on the catalog api
 */
inline Outcome
classify_status(unsigned status) noexcept
{
  if ( status >= 200 && status < 300 ) {
    return Outcome::Ok;
  }
  if ( status == 403 || status == 429 ) {
    return Outcome::RateLimited;
  }
  if ( status >= 500 && status <= 599 ) {
    return Outcome::ServerError;
  }
  return Outcome::ClientError;
}

inline std::string
group_key(std::string_view category_id, std::string_view group_id)
{
  std::string key{category_id};
  key.push_back(':');
  key.append(group_id);
  return key;
}

/************ make_records() ******************************/
/* Denormalizes a group's items into flat records. Each member of the
 * category, group and item objects is copied under its prefix
 */
std::vector<Record> make_records(const HierarchyNode& category,
                                 const HierarchyNode& group,
                                 const boost::json::array& items,
                                 const std::string& update_date);

// Local date as YYYY-MM-DD
std::string today_iso();

// Wall clock as ISO-8601 with seconds, used for checkpoint metadata
std::string now_iso();

} // end namespace tcf

#endif // !__TCF_FETCH_SUPPORT_HPP
