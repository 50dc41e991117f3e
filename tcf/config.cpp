/*
 * config.cpp  Oct 10th, 2026
 *
 * Json config loading, argv parsing and the checks both must pass before a
 * run is wired up
 *
 */

#include "tcf/config.hpp"

#include <charconv>
#include <exception>
#include <fstream>
#include <set>
#include <sstream>
#include <stdexcept>

#include "tcf/errors.hpp"
#include "tcf/http.hpp"

namespace tcf {

namespace json = boost::json;

namespace {

/************ Section *************************************/
/* One top level object of the config file. Missing sections and keys
 * leave the defaults untouched, present keys must have the right type.
 */
class Section {
public:
  Section(const json::object& root, std::string_view name)
    : name_(name)
  {
    if ( const auto* p = root.if_contains(name) ) {
      if ( !p->is_object() ) {
        throw ConfigError("config: section " + name_ + " must be an object");
      }
      obj_ = &p->as_object();
    }
  }

  bool present() const noexcept { return obj_ != nullptr; }

  const json::value* raw(std::string_view key) const
  {
    if ( obj_ == nullptr ) {
      return nullptr;
    }
    const auto* p = obj_->if_contains(key);
    return (p == nullptr || p->is_null()) ? nullptr : p;
  }

  template <class T>
  void read(std::string_view key, T& out) const
  {
    if ( auto v = get_<T>(key) ) {
      out = std::move(*v);
    }
  }

  void read(std::string_view key, millis& out) const
  {
    if ( auto v = get_<int64_t>(key) ) {
      out = millis{non_negative_(key, *v)};
    }
  }

  void read(std::string_view key, std::chrono::seconds& out) const
  {
    if ( auto v = get_<int64_t>(key) ) {
      out = std::chrono::seconds{non_negative_(key, *v)};
    }
  }

  std::string where(std::string_view key) const { return name_ + "." + std::string(key); }

private:
  std::string name_;
  const json::object* obj_{nullptr};

  template <class T>
  std::optional<T> get_(std::string_view key) const
  {
    const auto* p = raw(key);
    if ( p == nullptr ) {
      return std::nullopt;
    }
    try {
      return json::value_to<T>(*p);
    } catch (const std::exception&) {
      std::throw_with_nested(ConfigError("config: " + where(key) + " has the wrong type"));
    }
  }

  int64_t non_negative_(std::string_view key, int64_t v) const
  {
    if ( v < 0 ) {
      throw ConfigError("config: " + where(key) + " must not be negative");
    }
    return v;
  }
};

Route
route_from_json_(const json::value& v, const Section& sec)
{
  if ( !v.is_object() ) {
    throw ConfigError("config: " + sec.where("routes") + " entries must be objects");
  }
  const auto& obj = v.as_object();
  const auto* name = obj.if_contains("name");
  const auto* url  = obj.if_contains("url");
  if ( name == nullptr || !name->is_string() || url == nullptr || !url->is_string() ) {
    throw ConfigError("config: " + sec.where("routes") + " entries need string name and url");
  }
  return Route{std::string(name->get_string()), std::string(url->get_string())};
}

Route
route_from_flag_(std::string_view text)
{
  const auto eq = text.find('=');
  if ( eq == std::string_view::npos || eq == 0 || eq + 1 == text.size() ) {
    throw ConfigError("--proxy expects NAME=URL, got " + std::string(text));
  }
  return Route{std::string(text.substr(0, eq)), std::string(text.substr(eq + 1))};
}

template <class T>
T
integer_(std::string_view flag, std::string_view text)
{
  T out{};
  const auto* end = text.data() + text.size();
  const auto [ptr, ec] = std::from_chars(text.data(), end, out);
  if ( ec != std::errc{} || ptr != end ) {
    throw ConfigError(std::string(flag) + " expects an integer, got " + std::string(text));
  }
  return out;
}

double
decimal_(std::string_view flag, const std::string& text)
{
  size_t used{0};
  double out{0.0};
  try {
    out = std::stod(text, &used);
  } catch (const std::exception&) {
    std::throw_with_nested(ConfigError(std::string(flag) + " expects a number, got " + text));
  }
  if ( used != text.size() ) {
    throw ConfigError(std::string(flag) + " expects a number, got " + text);
  }
  return out;
}

} // end anonymous namespace

/************ parse_mode() ********************************/
RunMode
parse_mode(std::string_view name)
{
  if ( name == "fresh" ) {
    return RunMode::Fresh;
  } else if ( name == "resume" ) {
    return RunMode::Resume;
  } else if ( name == "retry_failed" || name == "retry-failed" ) {
    return RunMode::RetryFailed;
  } else if ( name == "single_category" || name == "single-category" ) {
    return RunMode::SingleCategory;
  }
  throw ConfigError("config: unknown run mode " + std::string(name));
}

/************ config_from_json() **************************/
/* Caller Provides:
 *   Parsed config document, must be an object
 *
 * We return:
 *   Defaults overlaid with every key present in the document
 *
 * Throws:
 *   ConfigError on a wrong type. Unknown keys are ignored
 */
AppConfig
config_from_json(const json::value& root)
{
  if ( !root.is_object() ) {
    throw ConfigError("config: top level must be an object");
  }
  const auto& doc = root.as_object();
  AppConfig cfg{};

  Section api(doc, "api");
  api.read("base_url", cfg.api.base_url);
  api.read("timeout_s", cfg.api.timeout);
  api.read("user_agent", cfg.api.user_agent);
  api.read("max_redirects", cfg.api.max_redirects);

  Section rate(doc, "rate");
  rate.read("floor_ms", cfg.rate.floor);
  rate.read("base_ms", cfg.rate.base);
  rate.read("backoff_factor", cfg.rate.backoff_factor);
  rate.read("ceiling_ms", cfg.rate.ceiling);
  rate.read("server_error_threshold", cfg.rate.server_error_threshold);

  Section proxy(doc, "proxy");
  proxy.read("freshness_s", cfg.proxy.pool.freshness);
  proxy.read("max_probe_failures", cfg.proxy.pool.max_probe_failures);
  proxy.read("health_interval_s", cfg.run.health_interval);
  proxy.read("probe_url", cfg.proxy.probe_url);
  if ( const auto* routes = proxy.raw("routes") ) {
    if ( !routes->is_array() ) {
      throw ConfigError("config: " + proxy.where("routes") + " must be an array");
    }
    for (const auto& r : routes->as_array()) {
      cfg.proxy.routes.push_back(route_from_json_(r, proxy));
    }
  }

  Section control(doc, "control");
  if ( control.raw("url") != nullptr ) {
    ControlConfig cc{};
    cc.probe_url = cfg.proxy.probe_url;
    control.read("url", cc.url);
    control.read("secret", cc.secret);
    control.read("group", cc.group);
    control.read("egress_proxy", cc.egress_proxy);
    control.read("probe_url", cc.probe_url);
    control.read("probe_timeout_ms", cc.probe_timeout);
    cfg.control = std::move(cc);
  }

  Section sink(doc, "sink");
  sink.read("batch_records", cfg.sink.max_records);
  sink.read("batch_bytes", cfg.sink.max_bytes);
  sink.read("max_flush_attempts", cfg.sink.max_flush_attempts);
  sink.read("flush_backoff_ms", cfg.sink.flush_backoff);
  sink.read("spill_dir", cfg.sink.spill_dir);
  sink.read("database", cfg.storage.warehouse);
  sink.read("table", cfg.storage.table);

  Section checkpoint(doc, "checkpoint");
  checkpoint.read("path", cfg.storage.checkpoint);

  Section logging(doc, "logging");
  logging.read("file", cfg.logging.file);
  logging.read("level", cfg.logging.level);

  Section run(doc, "run");
  if ( const auto* mode = run.raw("mode") ) {
    if ( !mode->is_string() ) {
      throw ConfigError("config: " + run.where("mode") + " must be a string");
    }
    cfg.run.mode = parse_mode(mode->get_string());
  }
  if ( const auto* cats = run.raw("categories") ) {
    if ( !cats->is_array() ) {
      throw ConfigError("config: " + run.where("categories") + " must be an array");
    }
    for (const auto& c : cats->as_array()) {
      if ( c.is_int64() ) {
        cfg.run.categories.push_back(std::to_string(c.get_int64()));
      } else if ( c.is_uint64() ) {
        cfg.run.categories.push_back(std::to_string(c.get_uint64()));
      } else if ( c.is_string() ) {
        cfg.run.categories.emplace_back(c.get_string());
      } else {
        throw ConfigError("config: " + run.where("categories") + " holds ids only");
      }
    }
  }
  run.read("workers", cfg.run.workers);
  run.read("max_attempts", cfg.run.max_attempts);
  run.read("throttle_fail_after", cfg.run.throttle_fail_after);
  run.read("item_endpoint", cfg.run.item_endpoint);
  run.read("update_date", cfg.run.update_date);

  return cfg;
}

/************ load_config() *******************************/
/* Throws:
 *   ConfigError if the file cannot be read, is not json or is ill-typed
 */
AppConfig
load_config(const std::string& path)
{
  std::ifstream in(path);
  if ( !in ) {
    throw ConfigError("config: cannot open " + path);
  }
  std::stringstream buffer;
  buffer << in.rdbuf();

  boost::system::error_code err;
  auto root = json::parse(buffer.str(), err);
  if ( err ) {
    throw ConfigError("config: " + path + " is not valid json: " + err.message());
  }

  try {
    return config_from_json(root);
  } catch (const ConfigError&) {
    std::throw_with_nested(ConfigError("config: while reading " + path));
  }
}

/************ parse_args() ********************************/
/* Throws:
 *   ConfigError on an unknown flag, a missing value or a malformed number
 */
CliArgs
parse_args(int argc, const char* const argv[])
{
  CliArgs args{};
  auto set_mode = [&args](RunMode mode, std::string_view flag) {
    if ( args.mode && *args.mode != mode ) {
      throw ConfigError(std::string(flag) + " conflicts with an earlier mode flag");
    }
    args.mode = mode;
  };

  for (int i{1}; i < argc; i++) {
    const std::string_view flag = argv[i];
    auto value = [&]() -> std::string {
      if ( i + 1 >= argc ) {
        throw ConfigError("missing value for " + std::string(flag));
      }
      return argv[++i];
    };

    if ( flag == "--config" ) {
      args.config_path = value();
    } else if ( flag == "--fresh" ) {
      set_mode(RunMode::Fresh, flag);
    } else if ( flag == "--resume" ) {
      set_mode(RunMode::Resume, flag);
    } else if ( flag == "--retry-failed" ) {
      set_mode(RunMode::RetryFailed, flag);
    } else if ( flag == "--category" ) {
      args.categories.push_back(value());
    } else if ( flag == "--workers" ) {
      args.workers = integer_<size_t>(flag, value());
    } else if ( flag == "--base-delay" ) {
      args.base_delay = millis{integer_<int64_t>(flag, value())};
    } else if ( flag == "--backoff" ) {
      args.backoff = decimal_(flag, value());
    } else if ( flag == "--ceiling" ) {
      args.ceiling = millis{integer_<int64_t>(flag, value())};
    } else if ( flag == "--max-attempts" ) {
      args.max_attempts = integer_<size_t>(flag, value());
    } else if ( flag == "--checkpoint" ) {
      args.checkpoint = value();
    } else if ( flag == "--db" ) {
      args.warehouse = value();
    } else if ( flag == "--proxy" ) {
      args.proxies.push_back(route_from_flag_(value()));
    } else if ( flag == "--control" ) {
      args.control_url = value();
    } else if ( flag == "--prices" ) {
      args.prices = true;
    } else if ( flag == "--status" ) {
      args.status = true;
    } else if ( flag == "--health-check" ) {
      args.health_check = true;
    } else if ( flag == "--verbose" || flag == "-v" ) {
      args.verbose = true;
    } else if ( flag == "--help" || flag == "-h" ) {
      args.help = true;
    } else {
      throw ConfigError("unknown flag " + std::string(flag));
    }
  }
  return args;
}

void
apply_cli(AppConfig& cfg, const CliArgs& args)
{
  if ( args.mode ) {
    cfg.run.mode = *args.mode;
  }
  if ( !args.categories.empty() ) {
    cfg.run.categories = args.categories;
  }
  if ( !cfg.run.categories.empty() && cfg.run.mode == RunMode::Resume ) {
    cfg.run.mode = RunMode::SingleCategory;
  }

  if ( args.workers ) cfg.run.workers = *args.workers;
  if ( args.max_attempts ) cfg.run.max_attempts = *args.max_attempts;
  if ( args.base_delay ) cfg.rate.base = *args.base_delay;
  if ( args.backoff ) cfg.rate.backoff_factor = *args.backoff;
  if ( args.ceiling ) cfg.rate.ceiling = *args.ceiling;
  if ( args.checkpoint ) cfg.storage.checkpoint = *args.checkpoint;
  if ( args.warehouse ) cfg.storage.warehouse = *args.warehouse;
  if ( args.prices ) cfg.run.item_endpoint = "prices";

  if ( args.control_url ) {
    if ( !cfg.control ) {
      cfg.control = ControlConfig{};
      cfg.control->probe_url = cfg.proxy.probe_url;
    }
    cfg.control->url = *args.control_url;
  }

  if ( !args.proxies.empty() ) {
    cfg.proxy.routes = args.proxies;
  }
}

/************ validate() **********************************/
/* Cross field checks on the merged configuration
 *
 * Throws:
 *   ConfigError naming the first offending value
 */
void
validate(const AppConfig& cfg)
{
  auto check_url = [](const std::string& what, const std::string& url) {
    try {
      htc::parse_url(url);
    } catch (const std::invalid_argument&) {
      std::throw_with_nested(ConfigError("config: " + what + " is not an http(s) url"));
    }
  };

  check_url("api.base_url", cfg.api.base_url);
  if ( cfg.rate.backoff_factor < 1.0 ) {
    throw ConfigError("config: rate.backoff_factor must be >= 1");
  }
  if ( cfg.rate.ceiling < cfg.rate.floor ) {
    throw ConfigError("config: rate.ceiling_ms must be >= rate.floor_ms");
  }
  if ( cfg.run.workers == 0 ) {
    throw ConfigError("config: run.workers must be >= 1");
  }
  if ( cfg.run.max_attempts == 0 ) {
    throw ConfigError("config: run.max_attempts must be >= 1");
  }
  if ( cfg.run.item_endpoint != "products" && cfg.run.item_endpoint != "prices" ) {
    throw ConfigError("config: run.item_endpoint must be products or prices");
  }
  if ( cfg.sink.max_records == 0 || cfg.sink.max_flush_attempts == 0 ) {
    throw ConfigError("config: sink.batch_records and sink.max_flush_attempts must be >= 1");
  }

  std::set<std::string> names;
  for (const auto& route : cfg.proxy.routes) {
    if ( route.name == cfg.proxy.pool.default_route.name ) {
      throw ConfigError("config: route name " + route.name + " is reserved");
    }
    if ( !names.insert(route.name).second ) {
      throw ConfigError("config: duplicate route " + route.name);
    }
    check_url("route " + route.name, route.proxy_url);
  }

  if ( cfg.control ) {
    check_url("control.url", cfg.control->url);
    check_url("control.egress_proxy", cfg.control->egress_proxy);
  }
}

std::string
usage(std::string_view program)
{
  std::ostringstream out;
  out << "usage: " << program << " [options]\n"
      << "\n"
      << "  --config FILE        json configuration\n"
      << "  --fresh              discard the checkpoint and start over\n"
      << "  --resume             continue pending work (default)\n"
      << "  --retry-failed       re-attempt failed groups only\n"
      << "  --category ID        restrict to a category, repeatable\n"
      << "  --workers N          concurrent group workers\n"
      << "  --base-delay MS      delay after the first failure\n"
      << "  --backoff F          backoff multiplier\n"
      << "  --ceiling MS         maximum delay\n"
      << "  --max-attempts N     attempts per node and run\n"
      << "  --checkpoint FILE    checkpoint database\n"
      << "  --db FILE            warehouse database\n"
      << "  --proxy NAME=URL     http proxy route, repeatable\n"
      << "  --control URL        proxy controller api\n"
      << "  --prices             download prices instead of products\n"
      << "  --status             print resume status and exit\n"
      << "  --health-check       probe every route and exit\n"
      << "  --verbose            debug logging on the console\n"
      << "  --help               this text\n"
      << "\n"
      << "exit status: 0 all resolved, 1 unresolved work remains, 2 fatal error\n";
  return out.str();
}

} // end namespace tcf
