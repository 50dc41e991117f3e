/*
 * control_plane.cpp  Oct 8th, 2026
 *
 * Mihomo external controller calls: /proxies listing, selector switching and
 * per proxy delay probes
 *
 */

#include "tcf/control_plane.hpp"

#include <array>
#include <string_view>

#include <spdlog/spdlog.h>

#include "tcf/errors.hpp"
#include "tcf/json.hpp"

namespace tcf {

namespace json = boost::json;

/* Entries of a selector that are not actual egress proxies */
static constexpr std::array<std::string_view, 9> non_routes = {
  "DIRECT", "REJECT", "GLOBAL", "Selector", "URLTest", "Fallback",
  "LoadBalance", "Direct", "Reject"
};

static bool
is_non_route_(std::string_view name_or_type)
{
  for (const auto& skip : non_routes) {
    if ( skip == name_or_type ) {
      return true;
    }
  }
  return false;
}

std::vector<Route>
routes_from_proxies(const json::value& root, const std::string& group)
{
  const auto* proxies = jsc::as_obj(root).if_contains("proxies");
  if ( proxies == nullptr || !proxies->is_object() ) {
    throw SchemaError("control plane: /proxies without proxies object");
  }
  const auto& all = proxies->as_object();

  auto type_of = [&](std::string_view name) -> std::string {
    if ( const auto* p = all.if_contains(name); p && p->is_object() ) {
      return jsc::get_or<std::string>(p->as_object(), "type").value_or("");
    }
    return "";
  };

  std::vector<Route> routes;
  auto consider = [&](std::string_view name) {
    if ( is_non_route_(name) || is_non_route_(type_of(name)) ) {
      return;
    }
    routes.push_back(Route{std::string(name), ""});
  };

  if ( const auto* selector = all.if_contains(group); selector && selector->is_object() ) {
    if ( const auto* members = selector->as_object().if_contains("all");
         members && members->is_array() ) {
      for (const auto& m : members->as_array()) {
        if ( m.is_string() ) {
          consider(m.get_string());
        }
      }
      spdlog::info("control plane: {} routes in selector {}", routes.size(), group);
      return routes;
    }
  }

  spdlog::warn("control plane: selector {} not found, using every proxy", group);
  for (const auto& kv : all) {
    consider(kv.key());
  }
  return routes;
}

ControlPlane::ControlPlane(ControlConfig cfg, htc::Options opts)
  : cfg_(std::move(cfg)), opts_(std::move(opts))
{
  if ( cfg_.url.empty() ) {
    throw ConfigError("control plane url is empty");
  }
  while ( !cfg_.url.empty() && cfg_.url.back() == '/' ) {
    cfg_.url.pop_back();
  }
  opts_.bearer = cfg_.secret;
}

std::vector<Route>
ControlPlane::list_routes()
{
  const auto res = call_(htc::Method::Get, "/proxies");
  return routes_from_proxies(jsc::parse(res.body), cfg_.group);
}

std::optional<std::string>
ControlPlane::current()
{
  auto res = call_(htc::Method::Get, "/proxies/" + htc::url_encode(cfg_.group));
  const auto root = jsc::parse(res.body);
  return jsc::get_or<std::string>(jsc::as_obj(root), "now");
}

/************ select() ************************************/
/* PUT /proxies/{group} {"name": route}. Skipped when already selected
 */
void
ControlPlane::select(const std::string& name)
{
  std::lock_guard<std::mutex> lock(mu_);
  if ( selected_ && *selected_ == name ) {
    return;
  }

  const json::object body{{"name", name}};
  call_(htc::Method::Put, "/proxies/" + htc::url_encode(cfg_.group),
        json::serialize(body));
  selected_ = name;
  spdlog::info("control plane: switched {} to {}", cfg_.group, name);
}

/************ probe() *************************************/
/* GET /proxies/{name}/delay. The controller answers with {"delay": ms} when
 * the proxy reached the probe url, an error status otherwise.
 */
bool
ControlPlane::probe(const std::string& name)
{
  const std::string path = "/proxies/" + htc::url_encode(name) + "/delay?timeout=" +
                           std::to_string(cfg_.probe_timeout.count()) + "&url=" +
                           htc::url_encode(cfg_.probe_url);
  htc::Request req{};
  req.method = htc::Method::Get;
  req.url = htc::parse_url(cfg_.url + path);
  const auto res = htc::request(req, opts_);
  if ( res.status != 200 ) {
    spdlog::debug("control plane: probe {} status {}", name, res.status);
    return false;
  }

  const auto root = jsc::parse(res.body);
  const auto delay = jsc::get_or<int64_t>(jsc::as_obj(root), "delay");
  return delay.has_value() && *delay > 0;
}

htc::Response
ControlPlane::call_(htc::Method method, const std::string& path, const std::string& body)
{
  htc::Request req{};
  req.method = method;
  req.url = htc::parse_url(cfg_.url + path);
  req.body = body;

  auto res = htc::request(req, opts_);
  if ( res.status < 200 || res.status >= 300 ) {
    throw TransportError("control plane: " + path + " returned " +
                         std::to_string(res.status));
  }
  return res;
}

} // end namespace tcf
