/*
 * transport.cpp  Oct 8th, 2026
 *
 * Route application and redirect following on top of htc::request
 *
 */

#include "tcf/transport.hpp"

#include <spdlog/spdlog.h>

#include "tcf/errors.hpp"

namespace tcf {

HttpTransport::HttpTransport(htc::Options opts, size_t max_redirects, ControlPlane* control,
                             Sender send)
  : opts_(std::move(opts)), max_redirects_(max_redirects), control_(control),
    send_(std::move(send))
{
  if ( !send_ ) {
    send_ = [this](const htc::Request& req) { return htc::request(req, opts_); };
  }
}

/************ get() ***************************************/
/* Applies the route, then follows redirects up to max_redirects_.
 *
 * Throws:
 *   TransportError when cancelled, on redirect loops and on network failure
 */
htc::Response
HttpTransport::get(const std::string& url, const Route& route, std::stop_token token)
{
  htc::Request req{};
  req.method = htc::Method::Get;
  req.url = htc::parse_url(url);
  req.proxy_url = egress_for_(route);

  for (size_t hop{0}; hop <= max_redirects_; hop++) {
    if ( token.stop_requested() ) {
      throw TransportError("request cancelled: " + url);
    }

    auto res = send_(req);
    if ( !htc::is_redirect(res.status) || res.location.empty() ) {
      return res;
    }

    const auto next = htc::handle_redirect(req.url, res.location);
    spdlog::debug("transport: {} redirected to {}", req.url.str(), next);
    req.url = htc::parse_url(next);
  }

  throw TransportError("too many redirects: " + url);
}

bool
HttpTransport::probe(const Route& route, const std::string& probe_url)
{
  if ( control_ != nullptr ) {
    return control_->probe(route.name);
  }

  htc::Request req{};
  req.url = htc::parse_url(probe_url);
  req.proxy_url = route.proxy_url;
  const auto res = send_(req);
  return res.status >= 200 && res.status < 300;
}

std::string
HttpTransport::egress_for_(const Route& route)
{
  if ( !route.proxy_url.empty() ) {
    return route.proxy_url;
  }
  if ( control_ != nullptr ) {
    control_->select(route.name);
    return control_->config().egress_proxy;
  }
  return {};
}

} // end namespace tcf
