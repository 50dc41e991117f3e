/*
 * config.hpp  Oct 10th, 2026
 *
 * Application configuration. A json file provides the base values, command
 * line flags override them. Every key is optional.
 */

#ifndef __TCF_CONFIG_HPP
#define __TCF_CONFIG_HPP

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <boost/json.hpp>

#include "batch_sink.hpp"
#include "control_plane.hpp"
#include "fetcher.hpp"
#include "proxy_pool.hpp"
#include "rate_governor.hpp"

namespace tcf {

struct ApiConfig {
  std::string base_url{"https://tcgcsv.com/tcgplayer"};
  std::chrono::seconds timeout{30};
  std::string user_agent{"tcgfetch/1.0"};
  size_t max_redirects{5};
};

struct RouteConfig {
  std::vector<Route> routes;        // explicit http proxies, ignored with a control plane
  PoolConfig pool{};
  std::string probe_url{"https://tcgcsv.com/tcgplayer/categories"};
};

struct StorageConfig {
  std::string checkpoint{"data/checkpoint.db"};
  std::string warehouse{"data/catalog.db"};
  std::string table{"records"};
};

struct LoggingConfig {
  std::string file{"logs/tcgfetch.log"};
  std::string level{"info"};
};

struct AppConfig {
  ApiConfig api{};
  RateConfig rate{};
  RouteConfig proxy{};
  std::optional<ControlConfig> control{};  // set when control.url is present
  SinkConfig sink{};
  StorageConfig storage{};
  LoggingConfig logging{};
  FetchOptions run{};
};

/************ CliArgs *************************************/
/* Flags as given. Unset optionals leave the file's value alone */
struct CliArgs {
  std::optional<std::string> config_path;
  std::optional<RunMode> mode;
  std::vector<std::string> categories;
  std::optional<size_t> workers;
  std::optional<millis> base_delay;
  std::optional<double> backoff;
  std::optional<millis> ceiling;
  std::optional<size_t> max_attempts;
  std::optional<std::string> checkpoint;
  std::optional<std::string> warehouse;
  std::optional<std::string> control_url;
  std::vector<Route> proxies;
  bool prices{false};
  bool status{false};
  bool health_check{false};
  bool verbose{false};
  bool help{false};
};

AppConfig config_from_json(const boost::json::value& root);
AppConfig load_config(const std::string& path);

CliArgs parse_args(int argc, const char* const argv[]);
void apply_cli(AppConfig& cfg, const CliArgs& args);
void validate(const AppConfig& cfg);

RunMode parse_mode(std::string_view name);
std::string usage(std::string_view program);

} // end namespace tcf

#endif // !__TCF_CONFIG_HPP
