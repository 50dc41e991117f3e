/*
 * fetcher.cpp  Oct 9th, 2026
 *
 * Traversal, per node state machine and the optional worker pool of the
 * hierarchical fetcher
 *
 */

#include "tcf/fetcher.hpp"

#include <algorithm>
#include <deque>
#include <exception>
#include <iterator>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <unordered_set>

#include <spdlog/spdlog.h>

#include "tcf/errors.hpp"
#include "tcf/json.hpp"

namespace tcf {

namespace json = boost::json;

HierarchicalFetcher::HierarchicalFetcher(std::string base_url, Transport& transport,
                                         RateGovernor& governor, ProxyPool& pool,
                                         CheckpointStore& store, BatchSink& sink)
  : base_url_(std::move(base_url)), transport_(transport), governor_(governor),
    pool_(pool), store_(store), sink_(sink)
{
  // validates scheme and host up front, throws invalid_argument
  htc::parse_url(base_url_);
  while ( !base_url_.empty() && base_url_.back() == '/' ) {
    base_url_.pop_back();
  }
}

/************ discover_categories() ***********************/
/* Lists every category and registers it in the checkpoint.
 *
 * Throws:
 *   TransportError when the listing cannot be fetched at all
 *   SchemaError when the listing is malformed
 */
std::vector<HierarchyNode>
HierarchicalFetcher::discover_categories(const FetchOptions& opts)
{
  spdlog::info("fetcher: downloading categories");
  const auto attempt = fetch_(build_url_({"categories"}), opts);
  if ( attempt.kind != Attempt::Kind::Ok ) {
    throw TransportError("fetcher: category listing failed: " + attempt.error);
  }

  std::vector<HierarchyNode> categories;
  for (const auto& entry : jsc::results(attempt.body)) {
    if ( !entry.is_object() ) {
      continue;
    }
    const auto& obj = entry.as_object();
    auto id = jsc::id_string(obj, "categoryId");
    if ( !id ) {
      spdlog::warn("fetcher: category without categoryId skipped");
      continue;
    }

    HierarchyNode node{};
    node.id     = *id;
    node.level  = NodeLevel::Category;
    node.name   = jsc::get_or<std::string>(obj, "name")
                    .value_or(jsc::get_or<std::string>(obj, "displayName").value_or(""));
    node.source = obj;
    store_.register_node(node);
    categories.push_back(std::move(node));
  }

  spdlog::info("fetcher: {} categories listed", categories.size());
  return categories;
}

/************ run() ***************************************/
/* Traverses the given categories. The sink is drained on every exit path,
 * a fatal error is rethrown only after the drain and the final log line.
 *
 * Caller Provides:
 *   Category nodes, usually from discover_categories()
 *   Options selecting mode, filter, concurrency and retry policy
 *
 * We return:
 *   Summary of this run's outcomes
 */
Summary
HierarchicalFetcher::run(const std::vector<HierarchyNode>& roots, const FetchOptions& opts)
{
  counters_.processed = 0;
  counters_.skipped   = 0;
  counters_.failed    = 0;
  counters_.pending   = 0;
  counters_.records   = 0;
  counters_.requests  = 0;

  const auto started = std::chrono::steady_clock::now();
  spdlog::info("=== starting catalog download: {} categories, {} workers ===",
               roots.size(), std::max<size_t>(opts.workers, 1));

  std::exception_ptr fatal;
  try {
    maybe_health_check_(opts);
    size_t index{0};
    for (const auto& category : roots) {
      index += 1;
      if ( stop_.stop_requested() ) {
        break;
      }

      if ( !opts.categories.empty() &&
           std::find(opts.categories.begin(), opts.categories.end(), category.id) ==
             opts.categories.end() ) {
        continue;
      }

      spdlog::info("=== [{}/{}] category {} ({}) ===", index, roots.size(),
                   category.name, category.id);
      maybe_health_check_(opts);
      store_.register_node(category);
      process_category_(category, opts);
    }
  } catch (const std::exception& e) {
    spdlog::error("fetcher: run aborted: {}", describe(e));
    fatal = std::current_exception();
    stop_.request_stop();
  }

  try {
    sink_.drain_on_shutdown();
  } catch (const std::exception& e) {
    spdlog::error("fetcher: final drain failed: {}", describe(e));
    if ( !fatal ) {
      fatal = std::current_exception();
    }
  }

  auto summary = snapshot_();
  summary.cancelled = stop_.stop_requested() && !fatal;

  const auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(
      std::chrono::steady_clock::now() - started);
  const auto status = store_.status();
  spdlog::info("=== download {}: {} completed, {} skipped, {} failed, {} pending, "
               "{} records, {} requests, {} s ===",
               fatal ? "aborted" : (summary.cancelled ? "interrupted" : "complete"),
               summary.processed, summary.skipped, summary.failed, summary.pending,
               summary.total_records, summary.requests, elapsed.count());
  spdlog::info("checkpoint {}: {} groups completed, {} pending, {} failed; "
               "safe to resume: {}",
               status.path, status.completed, status.pending + status.in_progress,
               status.failed, status.can_resume ? "yes" : "no");

  {
    std::lock_guard<std::mutex> lock(stop_mu_);
    stop_ = std::stop_source{};
  }

  if ( fatal ) {
    std::rethrow_exception(fatal);
  }
  return summary;
}

/************ process_category_() *************************/
/* Claims the category, lists its groups (one request) and processes the
 * groups the mode selects. The category completes only once every listed
 * group has completed, otherwise it goes back to pending so the next run
 * lists it again.
 */
void
HierarchicalFetcher::process_category_(const HierarchyNode& category, const FetchOptions& opts)
{
  const bool retry = opts.mode == RunMode::RetryFailed;
  const auto state = store_.state_of(category.id);
  if ( state == NodeState::Completed || (state == NodeState::Failed && !retry) ) {
    spdlog::info("fetcher: skipping {} category {}", to_string(*state), category.id);
    counters_.skipped += 1;
    return;
  }

  if ( state == NodeState::Failed ) {
    store_.mark(category.id, NodeState::Pending);
  }
  if ( !store_.try_claim(category.id) ) {
    counters_.skipped += 1;
    return;
  }

  auto attempt = fetch_(build_url_({category.id, "groups"}), opts);
  if ( attempt.kind != Attempt::Kind::Ok ) {
    settle_(category, attempt, opts);
    return;
  }

  std::vector<HierarchyNode> listed;
  try {
    listed = parse_groups_(category, attempt.body);
  } catch (const SchemaError& e) {
    settle_(category, Attempt{Attempt::Kind::Client, {}, describe(e)}, opts);
    return;
  }
  spdlog::info("fetcher: {} groups in category {}", listed.size(), category.id);

  for (const auto& group : listed) {
    store_.register_node(group);
  }

  // a retry pass returns the failed groups to pending and takes only those
  const auto selected_ids = retry ? store_.failed_nodes(category.id)
                                  : store_.pending_nodes(category.id, false);
  if ( retry && !selected_ids.empty() ) {
    store_.retry_failed(category.id);
  }
  const std::unordered_set<std::string> selected(selected_ids.begin(), selected_ids.end());

  std::vector<HierarchyNode> work;
  for (auto& group : listed) {
    if ( selected.count(group.id) ) {
      work.push_back(std::move(group));
      continue;
    }
    const auto s = store_.state_of(group.id);
    if ( s == NodeState::Completed || (s == NodeState::Failed && !retry) ) {
      counters_.skipped += 1;
    }
  }

  process_groups_(category, std::move(work), opts);

  // settles the groups still waiting on buffered records
  sink_.flush();

  if ( stop_.stop_requested() ) {
    store_.mark(category.id, NodeState::Pending);
    counters_.pending += 1;
    return;
  }

  const auto children = store_.children(category.id);
  const bool done = std::all_of(children.begin(), children.end(), [](const NodeEntry& e) {
    return e.state == NodeState::Completed;
  });

  if ( done ) {
    store_.mark(category.id, NodeState::Completed);
    counters_.processed += 1;
    spdlog::info("fetcher: category {} completed", category.id);
  } else {
    store_.mark(category.id, NodeState::Pending);
    counters_.pending += 1;
    spdlog::info("fetcher: category {} left pending, unresolved groups remain", category.id);
  }
}

/************ process_groups_() ***************************/
/* Sequential when workers <= 1. Otherwise a bounded pool of jthreads pulls
 * from a shared queue. The first fatal error stops the pool and is
 * rethrown once every worker has joined.
 */
void
HierarchicalFetcher::process_groups_(const HierarchyNode& category,
                                     std::vector<HierarchyNode> groups,
                                     const FetchOptions& opts)
{
  if ( opts.workers <= 1 || groups.size() <= 1 ) {
    for (const auto& group : groups) {
      if ( stop_.stop_requested() ) {
        break;
      }
      process_group_(category, group, opts);
    }
    return;
  }

  std::mutex queue_mu;
  std::deque<HierarchyNode> queue(std::make_move_iterator(groups.begin()),
                                  std::make_move_iterator(groups.end()));
  std::exception_ptr first_error;

  auto worker_loop = [&] {
    while ( !stop_.stop_requested() ) {
      std::optional<HierarchyNode> next;
      {
        std::lock_guard<std::mutex> lock(queue_mu);
        if ( queue.empty() || first_error ) {
          return;
        }
        next = std::move(queue.front());
        queue.pop_front();
      }

      try {
        process_group_(category, *next, opts);
      } catch (const std::exception& e) {
        spdlog::error("fetcher: worker stopping on {}: {}", next->id, describe(e));
        std::lock_guard<std::mutex> lock(queue_mu);
        if ( !first_error ) {
          first_error = std::current_exception();
        }
        return;
      }
    }
  };

  {
    const size_t count = std::min(opts.workers, queue.size());
    std::vector<std::jthread> workers;
    workers.reserve(count);
    for (size_t i{0}; i < count; i++) {
      workers.emplace_back(worker_loop);
    }
  } // jthreads join here

  if ( first_error ) {
    std::rethrow_exception(first_error);
  }
}

/************ process_group_() ****************************/
/* pending -> in_progress -> {completed | pending | failed} for one group.
 * A group with records stays in_progress until the sink acks their load,
 * so a crash before the flush re-fetches it (at-least-once).
 */
void
HierarchicalFetcher::process_group_(const HierarchyNode& category, const HierarchyNode& group,
                                    const FetchOptions& opts)
{
  if ( !store_.try_claim(group.id) ) {
    counters_.skipped += 1;
    return;
  }

  const auto group_id = jsc::id_string(group.source, "groupId")
                          .value_or(group.id.substr(group.id.find(':') + 1));
  auto attempt = fetch_(build_url_({category.id, group_id, opts.item_endpoint}), opts);

  if ( attempt.kind == Attempt::Kind::Ok ) {
    const auto date = opts.update_date.empty() ? today_iso() : opts.update_date;
    std::vector<Record> records;
    try {
      records = make_records(category, group, jsc::results(attempt.body), date);
    } catch (const SchemaError& e) {
      settle_(group, Attempt{Attempt::Kind::Client, {}, describe(e)}, opts);
      return;
    }

    const size_t count = records.size();
    spdlog::info("fetcher: {} / {}: +{} records", category.name,
                 group.name.empty() ? group.id : group.name, count);
    if ( count > 0 ) {
      store_.add_records(count);
      counters_.records += count;
      sink_.push(std::move(records), [this, id = group.id] { complete_(id); });
      return;
    }
  }

  settle_(group, attempt, opts);
}

/************ fetch_() ************************************/
/* Up to max_attempts requests for one node. Before each: wait for the
 * governor, pick a route. After each: report the outcome to both.
 *
 * We return:
 *   Ok with the parsed body, or the last failure class seen
 */
HierarchicalFetcher::Attempt
HierarchicalFetcher::fetch_(const std::string& url, const FetchOptions& opts)
{
  const auto token = stop_.get_token();
  const size_t max_attempts = std::max<size_t>(opts.max_attempts, 1);
  Attempt last{Attempt::Kind::Cancelled, {}, "cancelled"};

  for (size_t attempt{1}; attempt <= max_attempts; attempt++) {
    if ( !governor_.wait_turn(token) ) {
      return Attempt{Attempt::Kind::Cancelled, {}, "cancelled"};
    }

    const auto route = pool_.select_route();
    counters_.requests += 1;

    htc::Response res;
    try {
      res = transport_.get(url, route, token);
    } catch (const TransportError& e) {
      if ( token.stop_requested() ) {
        return Attempt{Attempt::Kind::Cancelled, {}, "cancelled"};
      }
      governor_.record_outcome(Outcome::ServerError);
      pool_.report(route.name, Outcome::ServerError);
      last = Attempt{Attempt::Kind::Transport, {}, describe(e)};
      spdlog::warn("fetcher: attempt {}/{} {} via {}: {}", attempt, max_attempts, url,
                   route.name, last.error);
      continue;
    } catch (const std::invalid_argument& e) {
      // unusable redirect target, nothing a retry would change
      return Attempt{Attempt::Kind::Client, {}, e.what()};
    }

    const auto outcome = classify_status(res.status);
    governor_.record_outcome(outcome);
    pool_.report(route.name, outcome);

    const std::string status = "HTTP " + std::to_string(res.status);
    switch ( outcome ) {
      case Outcome::Ok:
        try {
          return Attempt{Attempt::Kind::Ok, jsc::parse(res.body), {}};
        } catch (const SchemaError& e) {
          return Attempt{Attempt::Kind::Client, {}, describe(e)};
        }

      case Outcome::RateLimited:
        last = Attempt{Attempt::Kind::Throttled, {}, status};
        spdlog::warn("fetcher: attempt {}/{} {} throttled ({}) via {}", attempt,
                     max_attempts, url, status, route.name);
        break;

      case Outcome::ServerError:
        last = Attempt{Attempt::Kind::Server, {}, status};
        spdlog::warn("fetcher: attempt {}/{} {} server error ({}) via {}", attempt,
                     max_attempts, url, status, route.name);
        break;

      case Outcome::ClientError:
        return Attempt{Attempt::Kind::Client, {}, status};
    }
  }
  return last;
}

/************ settle_() ***********************************/
/* Writes the node's final state for this run and counts it. Throttling and
 * server errors leave the node pending unless it has been claimed
 * throttle_fail_after times, transport exhaustion and client errors fail it.
 */
void
HierarchicalFetcher::settle_(const HierarchyNode& node, const Attempt& attempt,
                             const FetchOptions& opts)
{
  switch ( attempt.kind ) {
    case Attempt::Kind::Ok:
      complete_(node.id);
      return;

    case Attempt::Kind::Throttled:
    case Attempt::Kind::Server: {
      const auto entry = store_.entry(node.id);
      const auto claims = entry ? static_cast<size_t>(entry->attempts) : 0;
      if ( opts.throttle_fail_after > 0 && claims >= opts.throttle_fail_after ) {
        const auto error = attempt.error + " on " + std::to_string(claims) + " runs";
        store_.mark(node.id, NodeState::Failed, error);
        counters_.failed += 1;
        spdlog::error("fetcher: {} failed: {}", node.id, error);
      } else {
        store_.mark(node.id, NodeState::Pending);
        counters_.pending += 1;
        spdlog::warn("fetcher: {} left pending after {}", node.id, attempt.error);
      }
      return;
    }

    case Attempt::Kind::Client:
    case Attempt::Kind::Transport:
      store_.mark(node.id, NodeState::Failed, attempt.error);
      counters_.failed += 1;
      spdlog::error("fetcher: {} failed: {}", node.id, attempt.error);
      return;

    case Attempt::Kind::Cancelled:
      store_.mark(node.id, NodeState::Pending);
      counters_.pending += 1;
      return;
  }
}

void
HierarchicalFetcher::complete_(const std::string& node_id)
{
  store_.mark(node_id, NodeState::Completed);
  counters_.processed += 1;
}

std::vector<HierarchyNode>
HierarchicalFetcher::parse_groups_(const HierarchyNode& category, const json::value& body) const
{
  std::vector<HierarchyNode> groups;
  for (const auto& entry : jsc::results(body)) {
    if ( !entry.is_object() ) {
      continue;
    }
    const auto& obj = entry.as_object();
    auto id = jsc::id_string(obj, "groupId");
    if ( !id ) {
      spdlog::warn("fetcher: group without groupId in category {} skipped", category.id);
      continue;
    }

    HierarchyNode node{};
    node.id        = group_key(category.id, *id);
    node.parent_id = category.id;
    node.level     = NodeLevel::Group;
    node.name      = jsc::get_or<std::string>(obj, "name").value_or("");
    node.source    = obj;
    groups.push_back(std::move(node));
  }
  return groups;
}

/************ build_url_() ********************************/
/* base_url_ joined with each segment by a single slash */
std::string
HierarchicalFetcher::build_url_(std::initializer_list<std::string_view> segments) const
{
  std::string url = base_url_;
  for (const auto& segment : segments) {
    url.push_back('/');
    url.append(segment.data(), segment.size());
  }
  return url;
}

void
HierarchicalFetcher::maybe_health_check_(const FetchOptions& opts)
{
  if ( pool_.empty() ) {
    return;
  }
  pool_.health_check_if_due(opts.health_interval);
}

Summary
HierarchicalFetcher::snapshot_() const
{
  Summary s{};
  s.processed     = counters_.processed.load();
  s.skipped       = counters_.skipped.load();
  s.failed        = counters_.failed.load();
  s.pending       = counters_.pending.load();
  s.total_records = counters_.records.load();
  s.requests      = counters_.requests.load();
  return s;
}

} // end namespace tcf
