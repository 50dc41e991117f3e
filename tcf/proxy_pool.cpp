/*
 * proxy_pool.cpp  Oct 4th, 2026
 *
 * Route ranking, sticky selection and concurrent health probes
 *
 */

#include "tcf/proxy_pool.hpp"

#include <algorithm>
#include <exception>
#include <future>
#include <stdexcept>

#include <spdlog/spdlog.h>

#include "tcf/errors.hpp"

namespace tcf {

ProxyPool::ProxyPool(std::vector<Route> candidates, PoolConfig cfg, Prober prober,
                     NowFn now)
  : cfg_(std::move(cfg)), prober_(std::move(prober)), now_(std::move(now))
{
  if ( !prober_ ) {
    throw std::invalid_argument("tcf::ProxyPool requires a probe function");
  }
  if ( !now_ ) {
    now_ = [] { return clock::now(); };
  }

  default_record_.route = cfg_.default_route;
  for (auto& route : candidates) {
    if ( route.name.empty() ) {
      throw std::invalid_argument("tcf::ProxyPool route without a name");
    }
    if ( route.name == cfg_.default_route.name ) {
      continue;
    }
    ProxyRecord rec{};
    rec.route = std::move(route);
    records_.push_back(std::move(rec));
  }
}

/************ select_route() ******************************/
/* Keeps the active route while it is still trusted. Otherwise ranks healthy
 * and fresh routes by success ratio, then fewest attempts. The route that
 * just failed is skipped when there is anything else to pick.
 *
 * We return:
 *   The route to use, or the default route when nothing is known healthy
 */
Route
ProxyPool::select_route()
{
  std::lock_guard<std::mutex> lock(mu_);
  const auto now = now_();

  if ( active_ && !reselect_ && eligible_(records_[*active_], now) ) {
    return records_[*active_].route;
  }

  std::vector<size_t> candidates;
  for (size_t i{0}; i < records_.size(); i++) {
    if ( eligible_(records_[i], now) ) {
      candidates.push_back(i);
    }
  }

  if ( candidates.size() > 1 && last_failed_ ) {
    std::erase_if(candidates, [&](size_t i) {
      return records_[i].route.name == *last_failed_;
    });
  }

  reselect_ = false;
  if ( candidates.empty() ) {
    if ( active_ ) {
      spdlog::warn("proxy pool: no healthy route, falling back to {}",
                   cfg_.default_route.name);
    }
    active_.reset();
    return cfg_.default_route;
  }

  const auto best = *std::min_element(candidates.begin(), candidates.end(),
    [&](size_t a, size_t b) {
      const auto& ra = records_[a];
      const auto& rb = records_[b];
      if ( ra.success_ratio() != rb.success_ratio() ) {
        return ra.success_ratio() > rb.success_ratio();
      }
      if ( ra.attempts != rb.attempts ) {
        return ra.attempts < rb.attempts;
      }
      return ra.route.name < rb.route.name;
    });

  if ( !active_ || *active_ != best ) {
    spdlog::info("proxy pool: selecting route {} (success {:.1f}%, {} attempts)",
                 records_[best].route.name, records_[best].success_ratio() * 100.0,
                 records_[best].attempts);
  }
  active_ = best;
  return records_[best].route;
}

/************ report() ************************************/
/* Updates the traffic counters of the route a request went through. A
 * client error still means the route delivered a response, so it scores as
 * a success for routing purposes.
 */
void
ProxyPool::report(const std::string& route_name, Outcome outcome)
{
  std::lock_guard<std::mutex> lock(mu_);
  ProxyRecord* rec = find_(route_name);
  if ( rec == nullptr ) {
    spdlog::warn("proxy pool: report for unknown route {}", route_name);
    return;
  }

  rec->attempts += 1;
  switch ( outcome ) {
    case Outcome::Ok:
    case Outcome::ClientError:
      rec->successes += 1;
      if ( last_failed_ && *last_failed_ == route_name ) {
        last_failed_.reset();
      }
      break;

    case Outcome::RateLimited:
    case Outcome::ServerError:
      if ( outcome == Outcome::RateLimited ) {
        rec->rate_limited += 1;
      } else {
        rec->server_errors += 1;
      }

      if ( active_ && records_[*active_].route.name == route_name ) {
        reselect_ = true;
        last_failed_ = route_name;
        spdlog::info("proxy pool: {} on route {}, will reselect",
                     to_string(outcome), route_name);
      }
      break;
  }
}

/************ health_check_all() **************************/
/* Probes every candidate concurrently without holding the lock, then
 * applies the results. A throwing probe counts as a failed probe.
 *
 * We return:
 *   route name -> whether this round's probe passed
 */
std::map<std::string, bool>
ProxyPool::health_check_all()
{
  std::vector<Route> routes;
  {
    std::lock_guard<std::mutex> lock(mu_);
    last_sweep_ = now_();
    for (const auto& rec : records_) {
      routes.push_back(rec.route);
    }
  }

  std::vector<std::future<bool>> probes;
  probes.reserve(routes.size());
  for (const auto& route : routes) {
    probes.push_back(std::async(std::launch::async, [this, route] {
      try {
        return prober_(route);
      } catch (const std::exception& e) {
        spdlog::warn("proxy pool: probe of {} threw: {}", route.name, describe(e));
        return false;
      }
    }));
  }

  std::map<std::string, bool> results;
  for (size_t i{0}; i < routes.size(); i++) {
    results[routes[i].name] = probes[i].get();
  }

  std::lock_guard<std::mutex> lock(mu_);
  const auto now = now_();
  size_t healthy{0};
  for (const auto& [name, passed] : results) {
    ProxyRecord* rec = find_(name);
    rec->last_checked = now;
    if ( passed ) {
      rec->probe_failures = 0;
      rec->healthy = true;
      rec->last_passed = now;
      healthy += 1;
    } else {
      rec->probe_failures += 1;
      if ( rec->probe_failures >= cfg_.max_probe_failures ) {
        rec->healthy = false;
      }
    }
  }

  spdlog::info("proxy pool: health check complete, {}/{} routes passed",
               healthy, results.size());
  return results;
}

bool
ProxyPool::health_check_if_due(std::chrono::seconds interval)
{
  {
    std::lock_guard<std::mutex> lock(mu_);
    if ( records_.empty() ) {
      return false;
    }
    if ( last_sweep_ && now_() - *last_sweep_ < interval ) {
      return false;
    }
  }
  health_check_all();
  return true;
}

std::vector<ProxyRecord>
ProxyPool::records() const
{
  std::lock_guard<std::mutex> lock(mu_);
  auto out = records_;
  out.push_back(default_record_);
  return out;
}

std::optional<std::string>
ProxyPool::active() const
{
  std::lock_guard<std::mutex> lock(mu_);
  if ( !active_ ) {
    return std::nullopt;
  }
  return records_[*active_].route.name;
}

size_t
ProxyPool::healthy_count() const
{
  std::lock_guard<std::mutex> lock(mu_);
  return static_cast<size_t>(std::count_if(records_.begin(), records_.end(),
    [](const ProxyRecord& r) { return r.healthy.value_or(false); }));
}

bool
ProxyPool::eligible_(const ProxyRecord& rec, clock::time_point now) const
{
  if ( !rec.healthy.value_or(false) ) {
    return false;
  }
  if ( cfg_.freshness.count() == 0 ) {
    return true;
  }
  return now - rec.last_passed <= cfg_.freshness;
}

ProxyRecord*
ProxyPool::find_(const std::string& name)
{
  if ( name == default_record_.route.name ) {
    return &default_record_;
  }
  for (auto& rec : records_) {
    if ( rec.route.name == name ) {
      return &rec;
    }
  }
  return nullptr;
}

} // end namespace tcf
