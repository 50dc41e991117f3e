/*
 * fetch_support.cpp  Oct 2nd, 2026
 *
 * Record flattening and the string conversions for the shared enums
 *
 */

#include "tcf/fetch_support.hpp"

#include <ctime>

#include "tcf/json.hpp"

namespace tcf {

namespace json = boost::json;

std::string_view
to_string(NodeState state) noexcept
{
  switch ( state ) {
    case NodeState::Pending:    return "pending";
    case NodeState::InProgress: return "in_progress";
    case NodeState::Completed:  return "completed";
    case NodeState::Failed:     return "failed";
  }
  return "unknown";
}

std::string_view
to_string(Outcome outcome) noexcept
{
  switch ( outcome ) {
    case Outcome::Ok:          return "ok";
    case Outcome::RateLimited: return "rate_limited";
    case Outcome::ServerError: return "server_error";
    case Outcome::ClientError: return "client_error";
  }
  return "unknown";
}

size_t
Record::approx_bytes() const
{
  size_t bytes = category_id.size() + group_id.size() + product_id.size() +
                 update_date.size();
  for (const auto& kv : fields) {
    bytes += kv.key().size();
    const auto& v = kv.value();
    bytes += v.is_string() ? v.get_string().size() : 8;
  }
  return bytes;
}

/************ copy_prefixed_() ****************************/
static void
copy_prefixed_(json::object& out, std::string_view prefix, const json::object& in)
{
  for (const auto& kv : in) {
    std::string key{prefix};
    key.append(kv.key().data(), kv.key().size());
    out[key] = jsc::flat_value(kv.value());
  }
}

std::vector<Record>
make_records(const HierarchyNode& category, const HierarchyNode& group,
             const json::array& items, const std::string& update_date)
{
  const auto category_id = category.id;
  const auto group_id = jsc::id_string(group.source, "groupId")
                          .value_or(group.id.substr(group.id.find(':') + 1));

  std::vector<Record> records;
  records.reserve(items.size());
  for (const auto& entry : items) {
    if ( !entry.is_object() ) {
      continue;
    }
    const auto& item = entry.as_object();

    Record rec{};
    rec.category_id = category_id;
    rec.group_id    = group_id;
    rec.product_id  = jsc::id_string(item, "productId").value_or("");
    rec.update_date = update_date;

    copy_prefixed_(rec.fields, "category_", category.source);
    copy_prefixed_(rec.fields, "group_", group.source);
    copy_prefixed_(rec.fields, "product_", item);
    rec.fields["update_date"] = update_date;

    records.push_back(std::move(rec));
  }
  return records;
}

static std::string
format_local_(const char* fmt)
{
  const std::time_t t = std::time(nullptr);
  std::tm tm{};
  localtime_r(&t, &tm);
  char buf[32];
  const size_t n = std::strftime(buf, sizeof(buf), fmt, &tm);
  return std::string(buf, n);
}

std::string today_iso() { return format_local_("%Y-%m-%d"); }
std::string now_iso() { return format_local_("%Y-%m-%dT%H:%M:%S"); }

} // end namespace tcf
