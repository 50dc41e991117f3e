/*
 * fetcher.hpp  Oct 9th, 2026
 *
 * HierarchicalFetcher. Walks category -> group -> item against the catalog
 * api, one request per node, pacing through the RateGovernor, routing
 * through the ProxyPool, recording every outcome in the CheckpointStore and
 * handing records to the BatchSink.
 */

#ifndef __TCF_FETCHER_HPP
#define __TCF_FETCHER_HPP

#include <atomic>
#include <chrono>
#include <cstdint>
#include <initializer_list>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

#include <boost/json.hpp>

#include "batch_sink.hpp"
#include "checkpoint_store.hpp"
#include "fetch_support.hpp"
#include "proxy_pool.hpp"
#include "rate_governor.hpp"
#include "transport.hpp"

namespace tcf {

enum class RunMode : uint8_t {
  Fresh,                            // checkpoint wiped before the run
  Resume,                           // pending work only
  RetryFailed,                      // failed work only
  SingleCategory                    // resume restricted to FetchOptions::categories
};

struct FetchOptions {
  RunMode mode{RunMode::Resume};
  std::vector<std::string> categories;   // category ids, empty = all
  size_t workers{1};                     // 1 = sequential traversal
  size_t max_attempts{3};                // local attempts per node and run
  size_t throttle_fail_after{0};         // claims before a throttled node fails, 0 = never
  std::string item_endpoint{"products"}; // "products" or "prices"
  std::chrono::seconds health_interval{600};
  std::string update_date;               // empty = today
};

struct Summary {
  size_t processed{0};              // nodes completed this run
  size_t skipped{0};                // completed earlier, or failed outside a retry pass
  size_t failed{0};                 // nodes marked failed this run
  size_t pending{0};                // nodes left pending for a later run
  size_t total_records{0};
  size_t requests{0};
  bool cancelled{false};

  bool unresolved() const noexcept { return failed > 0 || pending > 0 || cancelled; }
};

/************ tcf::HierarchicalFetcher ********************/
/* Collaborators are owned by the caller and must outlive the fetcher.
 *
 * Node level errors never escape run(), they land in the Summary and the
 * checkpoint. PersistenceError and SinkError do escape, after the sink has
 * been drained.
 */
class HierarchicalFetcher {
public:
  HierarchicalFetcher(std::string base_url, Transport& transport, RateGovernor& governor,
                      ProxyPool& pool, CheckpointStore& store, BatchSink& sink);

  HierarchicalFetcher(const HierarchicalFetcher&) = delete;
  HierarchicalFetcher& operator=(const HierarchicalFetcher&) = delete;

  std::vector<HierarchyNode> discover_categories(const FetchOptions& opts);
  Summary run(const std::vector<HierarchyNode>& roots, const FetchOptions& opts);

  /* A stop requested before or during run() ends that run. run() re-arms
   * the stop source on return, so the next run starts fresh.
   */
  void request_stop()
  {
    std::lock_guard<std::mutex> lock(stop_mu_);
    stop_.request_stop();
  }

  std::stop_token stop_token() const
  {
    std::lock_guard<std::mutex> lock(stop_mu_);
    return stop_.get_token();
  }

private:
  /* Terminal result of one node's local attempts */
  struct Attempt {
    enum class Kind : uint8_t { Ok, Throttled, Server, Client, Transport, Cancelled };

    Kind kind{Kind::Cancelled};
    boost::json::value body{};
    std::string error;
  };

  struct Counters {
    std::atomic<size_t> processed{0};
    std::atomic<size_t> skipped{0};
    std::atomic<size_t> failed{0};
    std::atomic<size_t> pending{0};
    std::atomic<size_t> records{0};
    std::atomic<size_t> requests{0};
  };

  std::string base_url_;
  Transport& transport_;
  RateGovernor& governor_;
  ProxyPool& pool_;
  CheckpointStore& store_;
  BatchSink& sink_;
  mutable std::mutex stop_mu_;     // guards re-arming stop_ against request_stop()
  std::stop_source stop_;
  Counters counters_{};

  void process_category_(const HierarchyNode& category, const FetchOptions& opts);
  void process_groups_(const HierarchyNode& category, std::vector<HierarchyNode> groups,
                       const FetchOptions& opts);
  void process_group_(const HierarchyNode& category, const HierarchyNode& group,
                      const FetchOptions& opts);

  Attempt fetch_(const std::string& url, const FetchOptions& opts);
  void settle_(const HierarchyNode& node, const Attempt& attempt, const FetchOptions& opts);
  void complete_(const std::string& node_id);
  std::vector<HierarchyNode> parse_groups_(const HierarchyNode& category,
                                           const boost::json::value& body) const;

  std::string build_url_(std::initializer_list<std::string_view> segments) const;
  void maybe_health_check_(const FetchOptions& opts);
  Summary snapshot_() const;
};

} // end namespace tcf

#endif // !__TCF_FETCHER_HPP
