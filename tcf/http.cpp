/*
 * http.cpp  Oct 7th, 2026
 *
 * Beast implementation of the blocking http helpers. Plain http and https,
 * direct or through an http proxy (absolute-form for http, CONNECT tunnel
 * for https).
 *
 */

#include "tcf/http.hpp"

#include <utility>

#include <boost/asio.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/core/stream_traits.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>

#include <openssl/err.h>

#include <cctype>
#include <exception>
#include <optional>
#include <stdexcept>

#include "tcf/errors.hpp"

namespace {

namespace asio  = boost::asio;
namespace ssl   = asio::ssl;
namespace beast = boost::beast;
namespace http  = beast::http;

using tcp = asio::ip::tcp;

}

/************ http for tcf ********************************/
namespace tcf::htc {

/************ is_redirect() *******************************/
/*
 * Confirms if a given status implies a redirect
 */
bool
is_redirect(unsigned status) noexcept
{
  return status == 301 || status == 302 || status == 303 ||
         status == 307 || status == 308;
}

Url
parse_url(std::string_view url)
{
  // lambda helper to throw exception on parse failure
  auto bad = [&url]{
    throw std::invalid_argument("invalid URL: " + std::string(url));
  };

  const auto scheme_position = url.find("://");
  if ( scheme_position == std::string_view::npos ) {
    bad();
  }

  Url res{};
  res.scheme = std::string(url.substr(0, scheme_position));
  if ( res.scheme != "http" && res.scheme != "https" ) {
    bad();
  }
  auto trunc = url.substr(scheme_position + 3);

  auto slash_position = trunc.find_first_of("/?");
  bool slash_last = slash_position == std::string_view::npos;
  std::string_view host_port = slash_last? trunc : trunc.substr(0, slash_position);
  res.target = slash_last? "/" : std::string(trunc.substr(slash_position));
  if ( res.target.front() == '?' ) {
    res.target.insert(res.target.begin(), '/');
  }

  auto colon_position = host_port.find(':');
  if ( colon_position == std::string_view::npos ) {
    res.host = std::string(host_port);
    res.port = res.scheme == "https"? "443" : "80";
  } else {
    res.host = std::string(host_port.substr(0, colon_position));
    res.port = std::string(host_port.substr(colon_position + 1));
  }

  if ( res.host.empty() || res.port.empty() ) {
    bad();
  }
  return res;
}

std::string
handle_redirect(const Url& url, std::string_view loc)
{
  if ( loc.find("http://") == 0 || loc.find("https://") == 0 ) {
    return std::string(loc);
  }

  if ( !loc.empty() && loc.front() == '/') {
    return url.scheme + "://" + url.authority() + std::string(loc);
  }

  auto path_end = url.target.rfind('/');
  bool is_end = path_end == std::string::npos;
  std::string dir = is_end? "/" : url.target.substr(0, path_end + 1);
  return url.scheme + "://" + url.authority() + dir + std::string(loc);
}

std::string
url_encode(std::string_view value)
{
  static constexpr char hex[] = "0123456789ABCDEF";
  std::string out;
  out.reserve(value.size());
  for (unsigned char c : value) {
    if ( std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~' ) {
      out.push_back(static_cast<char>(c));
    } else {
      out.push_back('%');
      out.push_back(hex[c >> 4]);
      out.push_back(hex[c & 0x0F]);
    }
  }
  return out;
}

/************ build_request() *****************************/
/* Assembles the beast request. Through a plain proxy the target must be in
 * absolute form, everywhere else origin form.
 */
static http::request<http::string_body>
build_request(const Request& r, const Options& opts, bool absolute_target)
{
  const auto verb = r.method == Method::Put ? http::verb::put : http::verb::get;
  const std::string target = absolute_target ? r.url.str() : r.url.target;

  http::request<http::string_body> req{verb, target, 11};
  req.set(http::field::host, r.url.host);
  req.set(http::field::user_agent, opts.user_agent);

  if ( !opts.bearer.empty() ) {
    req.set(http::field::authorization, "Bearer " + opts.bearer);
  }

  req.set(http::field::accept, "application/json");
  req.set(http::field::connection, "close");

  if ( !r.body.empty() ) {
    req.set(http::field::content_type,
            r.content_type.empty() ? "application/json" : r.content_type);
    req.body() = r.body;
    req.prepare_payload();
  }
  return req;
}

template <class Stream>
static Response
exchange_(Stream& stream, beast::tcp_stream& lowest, const Request& r,
          const Options& opts, bool absolute_target)
{
  auto req = build_request(r, opts, absolute_target);
  lowest.expires_after(opts.timeout);
  http::write(stream, req);

  beast::flat_buffer bufr;
  http::response_parser<http::string_body> parser;
  parser.body_limit(opts.body_limit);
  lowest.expires_after(opts.timeout);
  http::read(stream, bufr, parser);

  auto res = parser.release();
  Response out{};
  out.status = res.result_int();
  if ( auto it = res.find(http::field::location); it != res.end() ) {
    out.location = std::string(it->value());
  }
  out.body = std::move(res.body());
  return out;
}

/************ open_tcp_() *********************************/
/* Connects to the origin, or to the proxy when one is given */
static beast::tcp_stream
open_tcp_(asio::io_context& ioc, const Url& hop, const Options& opts)
{
  tcp::resolver resolver{ioc};
  const auto results = resolver.resolve(hop.host, hop.port);

  beast::tcp_stream stream{ioc};
  stream.expires_after(opts.timeout);
  stream.connect(results);
  return stream;
}

/************ connect_tunnel_() ***************************/
/* CONNECT host:port through an http proxy. Anything but a 2xx means the
 * proxy refused the tunnel.
 */
static void
connect_tunnel_(beast::tcp_stream& stream, const Url& url, const Options& opts)
{
  http::request<http::empty_body> req{http::verb::connect, url.authority(), 11};
  req.set(http::field::host, url.authority());
  req.set(http::field::user_agent, opts.user_agent);
  stream.expires_after(opts.timeout);
  http::write(stream, req);

  beast::flat_buffer bufr;
  http::response_parser<http::empty_body> parser;
  parser.skip(true);
  http::read_header(stream, bufr, parser);

  const auto status = parser.get().result_int();
  if ( status < 200 || status >= 300 ) {
    throw TransportError("proxy refused CONNECT " + url.authority() +
                         " with status " + std::to_string(status));
  }
}

static Response
https_request_(const Request& r, const Options& opts, asio::io_context& ioc,
               const std::optional<Url>& proxy)
{
  beast::tcp_stream tcp_stream = open_tcp_(ioc, proxy ? *proxy : r.url, opts);
  if ( proxy ) {
    connect_tunnel_(tcp_stream, r.url, opts);
  }

  ssl::context ctx{ssl::context::tls_client};
  ctx.set_default_verify_paths();
  ctx.set_verify_mode(ssl::verify_peer);
  beast::ssl_stream<beast::tcp_stream> stream{std::move(tcp_stream), ctx};

  // throw error on failure to setup SNI for SSL prior to TLS handshake
  if ( !SSL_set_tlsext_host_name(stream.native_handle(), r.url.host.c_str()) ) {
    throw beast::system_error(
      beast::error_code(
        static_cast<int>(::ERR_get_error()),
        asio::error::get_ssl_category()
      )
    );
  }
  stream.set_verify_callback(ssl::host_name_verification(r.url.host));

  // perform ssl handshake
  beast::get_lowest_layer(stream).expires_after(opts.timeout);
  stream.handshake(ssl::stream_base::client);

  auto res = exchange_(stream, beast::get_lowest_layer(stream), r, opts, false);

  beast::error_code err;
  stream.shutdown(err);
  return res;
}

static Response
http_request_(const Request& r, const Options& opts, asio::io_context& ioc,
              const std::optional<Url>& proxy)
{
  beast::tcp_stream stream = open_tcp_(ioc, proxy ? *proxy : r.url, opts);
  auto res = exchange_(stream, stream, r, opts, proxy.has_value());

  beast::error_code err;
  stream.socket().shutdown(tcp::socket::shutdown_both, err);
  return res;
}

Response
request(const Request& r, const Options& opts)
{
  std::optional<Url> proxy;
  if ( !r.proxy_url.empty() ) {
    proxy = parse_url(r.proxy_url);
  }

  asio::io_context ioc;
  try {
    if ( r.url.scheme == "https" ) {
      return https_request_(r, opts, ioc, proxy);
    } else if ( r.url.scheme == "http" ) {
      return http_request_(r, opts, ioc, proxy);
    }
  } catch (const TransportError&) {
    throw;
  } catch (const std::exception&) {
    std::throw_with_nested(TransportError("htc::request " + r.url.str() +
                                          (proxy ? " via " + r.proxy_url : "")));
  }
  throw std::invalid_argument("Url was malformed, choked on invalid scheme");
}

} // end namespace tcf::htc
