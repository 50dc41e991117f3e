/*
 * tcgcsv.cpp  Oct 11th, 2026
 *
 * tcgfetch. Bulk download of the tcgcsv catalog (categories -> groups ->
 * products or prices) into a sqlite warehouse, resumable through a
 * checkpoint database and routed through an optional proxy pool
 *
 */

#include <csignal>
#include <filesystem>
#include <functional>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "tcf/batch_sink.hpp"
#include "tcf/checkpoint_store.hpp"
#include "tcf/config.hpp"
#include "tcf/control_plane.hpp"
#include "tcf/errors.hpp"
#include "tcf/fetcher.hpp"
#include "tcf/proxy_pool.hpp"
#include "tcf/rate_governor.hpp"
#include "tcf/transport.hpp"
#include "tcf/warehouse.hpp"

namespace asio = boost::asio;

/************ Exit Status *********************************/
static constexpr int exit_clean      = 0;
static constexpr int exit_unresolved = 1;
static constexpr int exit_fatal      = 2;

/************ StopOnSignal ********************************/
/* Watches SIGINT and SIGTERM on a dedicated io_context thread and turns
 * them into a cooperative stop. In-flight requests finish, nodes not yet
 * claimed stay pending.
 */
class StopOnSignal {
public:
  explicit StopOnSignal(std::function<void()> on_signal)
    : on_signal_(std::move(on_signal)), signals_(ioc_, SIGINT, SIGTERM)
  {
    arm_();
    thread_ = std::jthread([this] { ioc_.run(); });
  }

  StopOnSignal(const StopOnSignal&) = delete;
  StopOnSignal& operator=(const StopOnSignal&) = delete;

  // thread_ is joined after the loop is stopped
  ~StopOnSignal() { ioc_.stop(); }

private:
  std::function<void()> on_signal_;
  asio::io_context ioc_;
  asio::signal_set signals_;
  bool stopping_{false};
  std::jthread thread_;

  void arm_()
  {
    signals_.async_wait([this](const boost::system::error_code& ec, int signo) {
      if ( ec ) {
        return;
      }
      if ( stopping_ ) {
        spdlog::warn("signal {}: already stopping, waiting for in-flight work", signo);
      } else {
        spdlog::warn("signal {}: stopping after in-flight requests", signo);
        stopping_ = true;
        on_signal_();
      }
      arm_();
    });
  }
};

/************ ensure_parent_() ****************************/
/* Creates the directory a database or log file will live in */
static void
ensure_parent_(const std::string& file)
{
  const auto parent = std::filesystem::path(file).parent_path();
  if ( !parent.empty() ) {
    std::filesystem::create_directories(parent);
  }
}

/************ setup_logging_() ****************************/
/* Console at info (debug with --verbose), rotating file at the configured
 * level, 10 MiB x 5. Installed as the default logger every component uses.
 */
static void
setup_logging_(const tcf::LoggingConfig& cfg, bool verbose)
{
  std::vector<spdlog::sink_ptr> sinks;

  auto console = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  console->set_level(verbose ? spdlog::level::debug : spdlog::level::info);
  sinks.push_back(console);

  if ( !cfg.file.empty() ) {
    ensure_parent_(cfg.file);
    auto file = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
      cfg.file, 10u << 20, 5
    );
    file->set_level(spdlog::level::from_str(cfg.level));
    sinks.push_back(file);
  }

  auto logger = std::make_shared<spdlog::logger>("tcgfetch", sinks.begin(), sinks.end());
  logger->set_level(spdlog::level::debug);
  logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");
  logger->flush_on(spdlog::level::warn);
  spdlog::set_default_logger(logger);
}

static void
print_status_(const tcf::ResumeStatus& st)
{
  std::cout << "checkpoint:           " << st.path << '\n'
            << "started:              " << (st.started_at.empty() ? "-" : st.started_at) << '\n'
            << "last updated:         " << (st.last_updated.empty() ? "-" : st.last_updated) << '\n'
            << "categories completed: " << st.categories_completed << '\n'
            << "groups completed:     " << st.completed << '\n'
            << "groups pending:       " << st.pending << '\n'
            << "groups in progress:   " << st.in_progress << '\n'
            << "groups failed:        " << st.failed << '\n'
            << "records:              " << st.total_records << '\n'
            << "can resume:           " << (st.can_resume ? "yes" : "no") << '\n';
}

static void
print_routes_(const std::vector<tcf::ProxyRecord>& records)
{
  std::cout << std::left << std::setw(28) << "route" << std::setw(10) << "health"
            << std::setw(10) << "attempts" << "success" << '\n';
  for (const auto& rec : records) {
    const char* health = !rec.healthy ? "unknown" : (*rec.healthy ? "healthy" : "down");
    std::cout << std::left << std::setw(28) << rec.route.name << std::setw(10) << health
              << std::setw(10) << rec.attempts << std::fixed << std::setprecision(2)
              << rec.success_ratio() << '\n';
  }
}

/************ run_() **************************************/
/* Wires the components for one invocation
 *
 * We return:
 *   Process exit status
 *
 * Throws:
 *   Anything fatal: config, persistence, sink, category listing
 */
static int
run_(const tcf::AppConfig& cfg, const tcf::CliArgs& args)
{
  ensure_parent_(cfg.storage.checkpoint);
  tcf::CheckpointStore store(cfg.storage.checkpoint);

  if ( args.status ) {
    print_status_(store.status());
    return exit_clean;
  }

  tcf::htc::Options http_opts{};
  http_opts.timeout    = cfg.api.timeout;
  http_opts.user_agent = cfg.api.user_agent;

  std::unique_ptr<tcf::ControlPlane> control;
  std::vector<tcf::Route> routes = cfg.proxy.routes;
  if ( cfg.control ) {
    control = std::make_unique<tcf::ControlPlane>(*cfg.control, http_opts);
    routes = control->list_routes();
  }

  tcf::HttpTransport transport(http_opts, cfg.api.max_redirects, control.get());
  const std::string probe_url = cfg.proxy.probe_url;
  tcf::ProxyPool pool(routes, cfg.proxy.pool,
                      [&transport, probe_url](const tcf::Route& route) {
                        return transport.probe(route, probe_url);
                      });
  spdlog::info("tcgfetch: {} candidate routes{}", routes.size(),
               control ? " from the control plane" : "");

  if ( args.health_check ) {
    pool.health_check_all();
    print_routes_(pool.records());
    if ( control ) {
      std::cout << cfg.control->group << " now: "
                << control->current().value_or("unknown") << '\n';
    }
    return pool.empty() || pool.healthy_count() > 0 ? exit_clean : exit_unresolved;
  }

  if ( cfg.run.mode == tcf::RunMode::Fresh ) {
    spdlog::info("tcgfetch: fresh run, discarding checkpoint {}", store.path());
    store.reset();
  } else {
    const auto st = store.status();
    if ( st.can_resume ) {
      spdlog::info("tcgfetch: resuming, {} groups completed, {} pending, {} failed",
                   st.completed, st.pending, st.failed);
    }
  }

  ensure_parent_(cfg.storage.warehouse);
  tcf::SqliteWarehouse warehouse(cfg.storage.warehouse, cfg.storage.table);
  tcf::BatchSink sink(warehouse, cfg.sink);
  tcf::RateGovernor governor(cfg.rate);
  tcf::HierarchicalFetcher fetcher(cfg.api.base_url, transport, governor, pool, store, sink);

  StopOnSignal watch([&fetcher] { fetcher.request_stop(); });

  std::vector<tcf::HierarchyNode> roots;
  try {
    roots = fetcher.discover_categories(cfg.run);
  } catch (const tcf::TransportError&) {
    if ( fetcher.stop_token().stop_requested() ) {
      spdlog::warn("tcgfetch: stopped before categories were listed");
      return exit_unresolved;
    }
    throw;
  }

  const auto summary = fetcher.run(roots, cfg.run);
  const auto stats = sink.stats();
  spdlog::info("tcgfetch: {} flushes, {} records loaded, {} failed flush attempts",
               stats.flushes, stats.records_flushed, stats.failed_attempts);
  for (const auto& rec : pool.records()) {
    spdlog::info("route {}: {} requests, {} throttled, {} server errors, ratio {:.2f}",
                 rec.route.name, rec.attempts, rec.rate_limited, rec.server_errors,
                 rec.success_ratio());
  }

  return summary.unresolved() ? exit_unresolved : exit_clean;
}

int
main(int argc, char* argv[])
{
  tcf::CliArgs args{};
  tcf::AppConfig cfg{};
  try {
    args = tcf::parse_args(argc, argv);
    if ( args.help ) {
      std::cout << tcf::usage(argv[0]);
      return exit_clean;
    }
    if ( args.config_path ) {
      cfg = tcf::load_config(*args.config_path);
    }
    tcf::apply_cli(cfg, args);
    tcf::validate(cfg);
  } catch (const tcf::ConfigError& e) {
    std::cerr << "tcgfetch: " << tcf::describe(e) << "\n\n" << tcf::usage(argv[0]);
    return exit_fatal;
  }

  try {
    setup_logging_(cfg.logging, args.verbose);
  } catch (const std::exception& e) {
    std::cerr << "tcgfetch: cannot set up logging: " << tcf::describe(e) << '\n';
    return exit_fatal;
  }

  int status = exit_fatal;
  try {
    status = run_(cfg, args);
  } catch (const std::exception& e) {
    spdlog::critical("tcgfetch: fatal: {}", tcf::describe(e));
    status = exit_fatal;
  }

  spdlog::shutdown();
  return status;
}
