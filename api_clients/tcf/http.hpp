/*
 * http.hpp  Oct 7th, 2026
 *
 * Provides Interface for exposed http helper functions. Blocking requests
 * over Boost.Beast, optionally through an http proxy.
 *
 */

#pragma once

#include <chrono>
#include <string>
#include <string_view>

namespace tcf::htc {

struct Url {
  std::string scheme, host, port, target;

  std::string authority() const { return host + ":" + port; }
  std::string str() const { return scheme + "://" + authority() + target; }
};

enum class Method {
  Get,
  Put
};

struct Options {
  std::chrono::seconds timeout{30};
  std::string user_agent{"tcgfetch/1.0"};
  std::string bearer;               // Authorization header value, empty = none
  size_t body_limit{64u << 20};
};

struct Request {
  Method method{Method::Get};
  Url url;
  std::string body;
  std::string content_type;
  std::string proxy_url;            // "http://host:port", empty = direct
};

/* Every status is returned, classification is the caller's business */
struct Response {
  unsigned status{0};
  std::string body;
  std::string location;             // Location header, redirects only
};

/************ parse_url() *********************************/
/* Splits scheme://host[:port][/target]. Default ports by scheme.
 *
 * Throws:
 *   invalid_argument for anything without a scheme or host
 */
Url parse_url(std::string_view url);

/************ request() ***********************************/
/* Issues a single request, no redirect following.
 *
 * Throws:
 *   TransportError for resolve, connect, TLS, proxy tunnel and timeout
 */
Response request(const Request& req, const Options& opts);

/************ handle_redirect() ***************************/
/* Resolves a Location header against the url it came from */
std::string handle_redirect(const Url& url, std::string_view loc);

bool is_redirect(unsigned status) noexcept;

// Percent-encodes a query parameter value
std::string url_encode(std::string_view value);

} // end namespace tcf::htc
