/*
 * transport.hpp  Oct 8th, 2026
 *
 * The fetcher's only view of the network: one GET through one route
 *
 */

#ifndef __TCF_TRANSPORT_HPP
#define __TCF_TRANSPORT_HPP

#include <functional>
#include <stop_token>
#include <string>

#include "control_plane.hpp"
#include "http.hpp"
#include "proxy_pool.hpp"

namespace tcf {

/************ tcf::Transport ******************************/
/* Returns any status the origin produced. Throws TransportError when no
 * status was produced at all.
 */
class Transport {
public:
  virtual ~Transport() = default;
  virtual htc::Response get(const std::string& url, const Route& route,
                            std::stop_token token) = 0;
};

/************ tcf::HttpTransport **************************/
/* Beast backed transport. A route with a proxy_url is used as an http proxy.
 * With a control plane every route is applied by switching the selector and
 * traffic leaves through the controller's local egress proxy.
 *
 * Each hop goes through the sender, htc::request unless one is given.
 */
class HttpTransport final : public Transport {
public:
  using Sender = std::function<htc::Response(const htc::Request&)>;

  HttpTransport(htc::Options opts, size_t max_redirects = 5,
                ControlPlane* control = nullptr, Sender send = {});

  HttpTransport(const HttpTransport&) = delete;
  HttpTransport& operator=(const HttpTransport&) = delete;

  htc::Response get(const std::string& url, const Route& route,
                    std::stop_token token) override;

  /********** probe() *************************************/
  /* Lightweight health probe of one route, suitable as ProxyPool::Prober
   */
  bool probe(const Route& route, const std::string& probe_url);

private:
  htc::Options opts_;
  size_t max_redirects_;
  ControlPlane* control_;
  Sender send_;

  std::string egress_for_(const Route& route);
};

} // end namespace tcf

#endif // !__TCF_TRANSPORT_HPP
