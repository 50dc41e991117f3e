/*
 * control_plane.hpp  Oct 8th, 2026
 *
 * Client for a Mihomo/Clash style external controller. Routes are proxies of
 * one selector group, picking a route means switching the selector.
 *
 */

#pragma once

#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <boost/json.hpp>

#include "http.hpp"
#include "proxy_pool.hpp"

namespace tcf {

struct ControlConfig {
  std::string url;                                    // e.g. http://127.0.0.1:9090
  std::string secret;                                 // bearer token, may be empty
  std::string group{"manual-select"};                 // selector to drive
  std::string egress_proxy{"http://127.0.0.1:7890"};  // local mixed port
  std::string probe_url{"https://tcgcsv.com/tcgplayer/categories"};
  millis probe_timeout{5000};
};

/************ routes_from_proxies() ***********************/
/* Candidate routes out of a /proxies listing: the members of `group` minus
 * DIRECT, REJECT, GLOBAL and group types. Every non-group proxy when the
 * group is missing.
 *
 * Throws:
 *   SchemaError when the listing has no proxies object
 */
std::vector<Route> routes_from_proxies(const boost::json::value& root,
                                       const std::string& group);

/************ tcf::ControlPlane ***************************/
/* select() is cached: switching to the route already active is free. The
 * controller's delay endpoint probes a proxy without switching to it, so
 * health checks never disturb live traffic.
 */
class ControlPlane {
public:
  explicit ControlPlane(ControlConfig cfg, htc::Options opts = {});

  std::vector<Route> list_routes();
  std::optional<std::string> current();
  void select(const std::string& name);
  bool probe(const std::string& name);

  const ControlConfig& config() const noexcept { return cfg_; }

private:
  ControlConfig cfg_;
  htc::Options opts_;
  std::mutex mu_;
  std::optional<std::string> selected_{};

  htc::Response call_(htc::Method method, const std::string& path,
                      const std::string& body = {});
};

} // end namespace tcf
