/*
 * proxy_pool.hpp  Oct 4th, 2026
 *
 * Candidate egress routes, their health and their scores. The pool hands the
 * fetcher one route per request and learns from what it reports back.
 */

#ifndef __TCF_PROXY_POOL_HPP
#define __TCF_PROXY_POOL_HPP

#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "fetch_support.hpp"

namespace tcf {

struct Route {
  std::string name;                 // selector name or label
  std::string proxy_url;            // "http://host:port", empty = direct/control plane

  bool operator==(const Route&) const = default;
};

/* Counters of one route. Never deleted within a run */
struct ProxyRecord {
  Route route;
  size_t attempts{0};
  size_t successes{0};
  size_t rate_limited{0};
  size_t server_errors{0};
  size_t probe_failures{0};         // consecutive failed probes
  std::optional<bool> healthy{};    // unknown until probed
  std::chrono::steady_clock::time_point last_checked{};
  std::chrono::steady_clock::time_point last_passed{};

  // Untried routes rank as perfect so they get a chance
  double success_ratio() const noexcept
  {
    return attempts == 0 ? 1.0 : static_cast<double>(successes) / attempts;
  }
};

struct PoolConfig {
  std::chrono::seconds freshness{600};   // probe age still trusted, 0 = forever
  size_t max_probe_failures{2};          // consecutive failed probes to exclude
  Route default_route{"DIRECT", ""};     // used when nothing is known healthy
};

/************ tcf::ProxyPool ******************************/
/* Thread safe. Selection is sticky: the active route is kept until a throttle
 * or server error is reported on it, it stops being healthy, or it goes
 * stale. Then the next select_route() re-ranks.
 *
 * Probes only flip health flags. They never touch the traffic counters so
 * probe traffic cannot skew the success ratios.
 */
class ProxyPool {
public:
  using clock  = std::chrono::steady_clock;
  using NowFn  = std::function<clock::time_point()>;
  using Prober = std::function<bool(const Route&)>;

  ProxyPool(std::vector<Route> candidates, PoolConfig cfg, Prober prober,
            NowFn now = {});

  ProxyPool(const ProxyPool&) = delete;
  ProxyPool& operator=(const ProxyPool&) = delete;

  Route select_route();
  void report(const std::string& route_name, Outcome outcome);

  std::map<std::string, bool> health_check_all();
  bool health_check_if_due(std::chrono::seconds interval);

  /********** getters *************************************/
  std::vector<ProxyRecord> records() const;
  std::optional<std::string> active() const;
  size_t healthy_count() const;
  bool empty() const noexcept { return records_.empty(); }
  const Route& default_route() const noexcept { return cfg_.default_route; }

private:
  PoolConfig cfg_;
  Prober prober_;
  NowFn now_;

  mutable std::mutex mu_;
  std::vector<ProxyRecord> records_;
  ProxyRecord default_record_;
  std::optional<size_t> active_{};
  std::optional<std::string> last_failed_{};
  bool reselect_{false};
  std::optional<clock::time_point> last_sweep_{};

  bool eligible_(const ProxyRecord& rec, clock::time_point now) const;
  ProxyRecord* find_(const std::string& name);
};

} // end namespace tcf

#endif // !__TCF_PROXY_POOL_HPP
