/*
 * fetcher_test.cpp  Oct 13th, 2026
 *
 * End to end traversal against a scripted in-memory transport
 */

#include <algorithm>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include <gtest/gtest.h>
#include <sqlite3.h>

#include "test_support.hpp"
#include "tcf/errors.hpp"
#include "tcf/fetcher.hpp"

namespace tcf::test {

using namespace std::chrono_literals;

static const std::string base = "http://catalog.test/tcgplayer";

/************ ScriptedTransport ***************************/
/* Responses per url, consumed front to back, the last one repeats.
 * Unscripted urls answer 404. Urls marked broken throw TransportError.
 * The hook sees each answered url before its response is returned.
 */
class ScriptedTransport final : public Transport {
public:
  void script(const std::string& path, std::vector<htc::Response> responses)
  {
    std::lock_guard<std::mutex> lock(mu_);
    scripts_[base + path] = std::deque<htc::Response>(responses.begin(), responses.end());
  }

  void ok(const std::string& path, const std::string& body)
  {
    script(path, {htc::Response{200, body, ""}});
  }

  void broken(const std::string& path)
  {
    std::lock_guard<std::mutex> lock(mu_);
    broken_.insert(base + path);
  }

  void on_request(std::function<void(const std::string&)> hook)
  {
    std::lock_guard<std::mutex> lock(mu_);
    hook_ = std::move(hook);
  }

  htc::Response get(const std::string& url, const Route&, std::stop_token token) override
  {
    htc::Response res{404, "{\"success\":false}", ""};
    std::function<void(const std::string&)> hook;
    {
      std::lock_guard<std::mutex> lock(mu_);
      if ( token.stop_requested() ) {
        throw TransportError("request cancelled: " + url);
      }
      calls_.push_back(url);
      if ( broken_.count(url) ) {
        throw TransportError("connection reset: " + url);
      }

      auto it = scripts_.find(url);
      if ( it != scripts_.end() && !it->second.empty() ) {
        res = it->second.front();
        if ( it->second.size() > 1 ) {
          it->second.pop_front();
        }
      }
      hook = hook_;
    }

    if ( hook ) {
      hook(url);
    }
    return res;
  }

  size_t calls_to(const std::string& path) const
  {
    std::lock_guard<std::mutex> lock(mu_);
    return static_cast<size_t>(std::count(calls_.begin(), calls_.end(), base + path));
  }

  size_t total_calls() const
  {
    std::lock_guard<std::mutex> lock(mu_);
    return calls_.size();
  }

private:
  mutable std::mutex mu_;
  std::map<std::string, std::deque<htc::Response>> scripts_;
  std::set<std::string> broken_;
  std::vector<std::string> calls_;
  std::function<void(const std::string&)> hook_;
};

static std::string
results(const std::string& items)
{
  return "{\"success\":true,\"errors\":[],\"results\":[" + items + "]}";
}

static std::string
products(int first, int count)
{
  std::string items;
  for (int i = 0; i < count; i++) {
    if ( i > 0 ) {
      items += ",";
    }
    items += "{\"productId\":" + std::to_string(first + i) + ",\"name\":\"card " +
             std::to_string(first + i) + "\"}";
  }
  return results(items);
}

class FetcherTest : public ScratchDirTest {
protected:
  ScriptedTransport transport_;
  MemoryWarehouse warehouse_;
  std::unique_ptr<RateGovernor> governor_;
  std::unique_ptr<ProxyPool> pool_;
  std::unique_ptr<CheckpointStore> store_;
  std::unique_ptr<BatchSink> sink_;
  std::unique_ptr<HierarchicalFetcher> fetcher_;
  size_t max_records_{3};

  void SetUp() override
  {
    ScratchDirTest::SetUp();
    reopen();
  }

  /* Rebuilds every collaborator over the same checkpoint file, as a new
   * process would
   */
  void reopen()
  {
    fetcher_.reset();
    sink_.reset();
    store_.reset();

    RateConfig rate{};
    rate.floor = 0ms;
    rate.base = 0ms;
    rate.ceiling = 0ms;
    governor_ = std::make_unique<RateGovernor>(rate);
    pool_ = std::make_unique<ProxyPool>(std::vector<Route>{}, PoolConfig{},
                                        [](const Route&) { return true; });
    store_ = std::make_unique<CheckpointStore>(file("checkpoint.db"));

    SinkConfig sink{};
    sink.max_records = max_records_;
    sink.spill_dir = file("spill");
    sink_ = std::make_unique<BatchSink>(warehouse_, sink, [](millis) {});
    fetcher_ = std::make_unique<HierarchicalFetcher>(base, transport_, *governor_, *pool_,
                                                     *store_, *sink_);
  }

  /* Runs sql on a second connection to the checkpoint file */
  void exec_on_checkpoint(const std::string& sql)
  {
    sqlite3* db = nullptr;
    ASSERT_EQ(sqlite3_open(file("checkpoint.db").c_str(), &db), SQLITE_OK);
    char* err = nullptr;
    const int rc = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err);
    const std::string msg = err ? err : "";
    sqlite3_free(err);
    sqlite3_close(db);
    ASSERT_EQ(rc, SQLITE_OK) << msg;
  }

  /* Copies the checkpoint as it is on disk right now, WAL included */
  void copy_checkpoint(const std::string& from, const std::string& to)
  {
    for (const std::string suffix : {"", "-wal"}) {
      std::error_code ec;
      fs::remove(file(to + suffix), ec);
      if ( fs::exists(file(from + suffix)) ) {
        fs::copy_file(file(from + suffix), file(to + suffix));
      }
    }
    std::error_code ec;
    fs::remove(file(to + "-shm"), ec);
  }

  FetchOptions options(RunMode mode = RunMode::Resume)
  {
    FetchOptions opts{};
    opts.mode = mode;
    opts.max_attempts = 3;
    opts.update_date = "2026-10-13";
    return opts;
  }

  /* Category 1 already done, category 2 with groups 10 (throttled once)
   * and 11 (missing upstream)
   */
  void script_catalog()
  {
    transport_.ok("/categories", results(R"({"categoryId":1,"name":"Magic"},)"
                                         R"({"categoryId":2,"name":"YuGiOh"})"));
    transport_.ok("/1/groups", results(R"({"groupId":5,"name":"Alpha"})"));
    transport_.ok("/2/groups", results(R"({"groupId":10,"name":"LOB"},)"
                                       R"({"groupId":11,"name":"MRD"})"));
    transport_.script("/2/10/products", {htc::Response{429, "", ""},
                                         htc::Response{200, products(100, 2), ""}});
  }
};

TEST_F(FetcherTest, MixedOutcomesScenario)
{
  script_catalog();
  store_->register_node(category_node("1", "Magic"));
  store_->mark("1", NodeState::Completed);

  const auto roots = fetcher_->discover_categories(options());
  ASSERT_EQ(roots.size(), 2u);
  const auto summary = fetcher_->run(roots, options());

  // completed category is skipped without a request
  EXPECT_EQ(transport_.calls_to("/1/groups"), 0u);
  EXPECT_EQ(store_->state_of("1"), NodeState::Completed);

  EXPECT_EQ(transport_.calls_to("/2/10/products"), 2u);
  EXPECT_EQ(store_->state_of("2:10"), NodeState::Completed);

  EXPECT_EQ(transport_.calls_to("/2/11/products"), 1u);
  EXPECT_EQ(store_->state_of("2:11"), NodeState::Failed);
  EXPECT_NE(store_->entry("2:11")->error.find("404"), std::string::npos);

  // a failed group keeps its category open
  EXPECT_EQ(store_->state_of("2"), NodeState::Pending);

  EXPECT_EQ(summary.processed, 1u);
  EXPECT_EQ(summary.failed, 1u);
  EXPECT_EQ(summary.skipped, 1u);
  EXPECT_EQ(summary.pending, 1u);
  EXPECT_EQ(summary.total_records, 2u);
  EXPECT_EQ(summary.requests, 5u);
  EXPECT_FALSE(summary.cancelled);
  EXPECT_TRUE(summary.unresolved());

  // drained at the end of the run
  const auto rows = warehouse_.rows();
  ASSERT_EQ(rows.size(), 2u);
  EXPECT_EQ(rows[0].category_id, "2");
  EXPECT_EQ(rows[0].group_id, "10");
  EXPECT_EQ(rows[0].product_id, "100");
  EXPECT_EQ(rows[0].fields.at("category_name").as_string(), "YuGiOh");
  EXPECT_EQ(rows[0].fields.at("group_name").as_string(), "LOB");
  EXPECT_EQ(rows[0].fields.at("update_date").as_string(), "2026-10-13");
  EXPECT_EQ(store_->status().total_records, 2);
}

TEST_F(FetcherTest, ResumeSkipsCompletedAndFailedGroups)
{
  script_catalog();
  store_->register_node(category_node("1", "Magic"));
  store_->mark("1", NodeState::Completed);
  fetcher_->run(fetcher_->discover_categories(options()), options());

  reopen();
  const auto products_before = transport_.calls_to("/2/10/products") +
                               transport_.calls_to("/2/11/products");
  const auto summary = fetcher_->run(fetcher_->discover_categories(options()), options());

  EXPECT_EQ(transport_.calls_to("/2/10/products") + transport_.calls_to("/2/11/products"),
            products_before);
  EXPECT_EQ(summary.processed, 0u);
  EXPECT_EQ(summary.failed, 0u);
  EXPECT_EQ(summary.skipped, 3u);
  EXPECT_EQ(store_->state_of("2:11"), NodeState::Failed);
  EXPECT_EQ(warehouse_.rows().size(), 2u);
}

TEST_F(FetcherTest, RetryPassRecoversFailedGroups)
{
  script_catalog();
  const auto first = fetcher_->run(fetcher_->discover_categories(options()), options());
  ASSERT_EQ(store_->state_of("2:11"), NodeState::Failed);
  ASSERT_EQ(first.failed, 2u);  // 1:5 is unscripted upstream

  transport_.ok("/2/11/products", products(200, 1));
  transport_.ok("/1/5/products", products(300, 4));

  reopen();
  const auto retry = fetcher_->run(fetcher_->discover_categories(options(RunMode::RetryFailed)),
                                   options(RunMode::RetryFailed));

  EXPECT_EQ(store_->state_of("2:11"), NodeState::Completed);
  EXPECT_EQ(store_->state_of("1:5"), NodeState::Completed);
  EXPECT_EQ(store_->state_of("2"), NodeState::Completed);
  EXPECT_EQ(store_->state_of("1"), NodeState::Completed);
  EXPECT_EQ(transport_.calls_to("/2/10/products"), 2u);
  EXPECT_EQ(retry.processed, 4u);
  EXPECT_FALSE(retry.unresolved());
  EXPECT_EQ(warehouse_.rows().size(), 7u);
}

TEST_F(FetcherTest, FullyCompletedCheckpointMakesNoRequests)
{
  store_->register_node(category_node("1"));
  store_->register_node(category_node("2"));
  store_->mark("1", NodeState::Completed);
  store_->mark("2", NodeState::Completed);

  const auto summary = fetcher_->run({category_node("1"), category_node("2")}, options());
  EXPECT_EQ(transport_.total_calls(), 0u);
  EXPECT_EQ(summary.skipped, 2u);
  EXPECT_FALSE(summary.unresolved());
}

TEST_F(FetcherTest, PersistentThrottlingLeavesGroupPending)
{
  transport_.ok("/7/groups", results(R"({"groupId":70})"));
  transport_.script("/7/70/products", {htc::Response{429, "", ""}});

  const auto summary = fetcher_->run({category_node("7")}, options());
  EXPECT_EQ(transport_.calls_to("/7/70/products"), 3u);
  EXPECT_EQ(store_->state_of("7:70"), NodeState::Pending);
  EXPECT_EQ(store_->state_of("7"), NodeState::Pending);
  EXPECT_EQ(summary.pending, 2u);
  EXPECT_EQ(summary.failed, 0u);
}

TEST_F(FetcherTest, ThrottleLimitAcrossRunsFailsTheGroup)
{
  transport_.ok("/7/groups", results(R"({"groupId":70})"));
  transport_.script("/7/70/products", {htc::Response{503, "", ""}});

  auto opts = options();
  opts.max_attempts = 1;
  opts.throttle_fail_after = 2;

  fetcher_->run({category_node("7")}, opts);
  EXPECT_EQ(store_->state_of("7:70"), NodeState::Pending);

  reopen();
  const auto second = fetcher_->run({category_node("7")}, opts);
  EXPECT_EQ(store_->state_of("7:70"), NodeState::Failed);
  EXPECT_EQ(second.failed, 1u);
}

TEST_F(FetcherTest, TransportFailuresExhaustIntoFailed)
{
  transport_.ok("/7/groups", results(R"({"groupId":70},{"groupId":71})"));
  transport_.broken("/7/70/products");
  transport_.ok("/7/71/products", products(1, 1));

  const auto summary = fetcher_->run({category_node("7")}, options());
  EXPECT_EQ(transport_.calls_to("/7/70/products"), 3u);
  EXPECT_EQ(store_->state_of("7:70"), NodeState::Failed);
  EXPECT_NE(store_->entry("7:70")->error.find("connection reset"), std::string::npos);
  EXPECT_EQ(store_->state_of("7:71"), NodeState::Completed);
  EXPECT_EQ(summary.failed, 1u);
  EXPECT_EQ(summary.processed, 1u);
}

TEST_F(FetcherTest, SchemaMismatchFailsTheGroup)
{
  transport_.ok("/7/groups", results(R"({"groupId":70})"));
  transport_.ok("/7/70/products", R"({"success":true})");

  fetcher_->run({category_node("7")}, options());
  EXPECT_EQ(store_->state_of("7:70"), NodeState::Failed);
  EXPECT_EQ(transport_.calls_to("/7/70/products"), 1u);
}

TEST_F(FetcherTest, FailedGroupListingFailsTheCategory)
{
  transport_.ok("/7/groups", "<html>maintenance</html>");

  const auto summary = fetcher_->run({category_node("7")}, options());
  EXPECT_EQ(store_->state_of("7"), NodeState::Failed);
  EXPECT_EQ(summary.failed, 1u);
}

TEST_F(FetcherTest, CategoryFilterRestrictsTraversal)
{
  transport_.ok("/7/groups", results(""));
  transport_.ok("/8/groups", results(""));

  auto opts = options(RunMode::SingleCategory);
  opts.categories = {"8"};
  const auto summary = fetcher_->run({category_node("7"), category_node("8")}, opts);

  EXPECT_EQ(transport_.calls_to("/7/groups"), 0u);
  EXPECT_EQ(transport_.calls_to("/8/groups"), 1u);
  EXPECT_EQ(store_->state_of("8"), NodeState::Completed);
  EXPECT_EQ(summary.processed, 1u);
}

TEST_F(FetcherTest, PricesEndpointIsSelectable)
{
  transport_.ok("/7/groups", results(R"({"groupId":70})"));
  transport_.ok("/7/70/prices", results(R"({"productId":1,"marketPrice":0.25})"));

  auto opts = options();
  opts.item_endpoint = "prices";
  fetcher_->run({category_node("7")}, opts);

  EXPECT_EQ(transport_.calls_to("/7/70/products"), 0u);
  EXPECT_EQ(store_->state_of("7:70"), NodeState::Completed);
  ASSERT_EQ(warehouse_.rows().size(), 1u);
  EXPECT_DOUBLE_EQ(warehouse_.rows()[0].fields.at("product_marketPrice").as_double(), 0.25);
}

TEST_F(FetcherTest, ConcurrentWorkersFetchEachGroupOnce)
{
  std::string groups;
  for (int g = 0; g < 24; g++) {
    groups += (g ? "," : "") + std::string("{\"groupId\":") + std::to_string(100 + g) + "}";
    transport_.ok("/7/" + std::to_string(100 + g) + "/products", products(g * 10, 2));
  }
  transport_.ok("/7/groups", results(groups));

  auto opts = options();
  opts.workers = 4;
  const auto summary = fetcher_->run({category_node("7")}, opts);

  for (int g = 0; g < 24; g++) {
    const auto id = std::to_string(100 + g);
    EXPECT_EQ(transport_.calls_to("/7/" + id + "/products"), 1u) << id;
    EXPECT_EQ(store_->state_of("7:" + id), NodeState::Completed) << id;
  }
  EXPECT_EQ(store_->state_of("7"), NodeState::Completed);
  EXPECT_EQ(summary.processed, 25u);
  EXPECT_EQ(summary.total_records, 48u);
  EXPECT_EQ(warehouse_.rows().size(), 48u);
}

TEST_F(FetcherTest, StopBeforeRunIssuesNoRequests)
{
  transport_.ok("/7/groups", results(R"({"groupId":70})"));
  fetcher_->request_stop();

  const auto summary = fetcher_->run({category_node("7")}, options());
  EXPECT_EQ(transport_.total_calls(), 0u);
  EXPECT_TRUE(summary.cancelled);
  EXPECT_TRUE(summary.unresolved());
  EXPECT_FALSE(store_->state_of("7").has_value());
}

TEST_F(FetcherTest, SinkFailureIsFatalAfterDrain)
{
  transport_.ok("/7/groups", results(R"({"groupId":70})"));
  transport_.ok("/7/70/products", products(1, 5));
  warehouse_.fail_next(1000);

  EXPECT_THROW(fetcher_->run({category_node("7")}, options()), SinkError);

  // records never reached the warehouse, so the group was not completed
  EXPECT_NE(store_->state_of("7:70"), NodeState::Completed);
}

TEST_F(FetcherTest, GroupStaysOpenUntilItsRecordsLoad)
{
  max_records_ = 500;
  reopen();
  transport_.ok("/7/groups", results(R"({"groupId":70},{"groupId":71})"));
  transport_.ok("/7/70/products", products(1, 3));
  transport_.ok("/7/71/products", products(10, 2));

  // power loss while 7:70's records are still buffered
  std::optional<NodeState> state_at_crash;
  size_t rows_at_crash{99};
  transport_.on_request([&](const std::string& url) {
    if ( url == base + "/7/71/products" ) {
      state_at_crash = store_->state_of("7:70");
      rows_at_crash = warehouse_.rows().size();
      copy_checkpoint("checkpoint.db", "crash.db");
    }
  });

  fetcher_->run({category_node("7")}, options());
  EXPECT_EQ(state_at_crash, NodeState::InProgress);
  EXPECT_EQ(rows_at_crash, 0u);
  EXPECT_EQ(store_->state_of("7:70"), NodeState::Completed);

  transport_.on_request({});
  fetcher_.reset();
  sink_.reset();
  store_.reset();
  copy_checkpoint("crash.db", "checkpoint.db");
  reopen();

  // nothing was loaded before the crash, so both groups are fetched again
  EXPECT_EQ(store_->state_of("7:70"), NodeState::Pending);
  const auto summary = fetcher_->run({category_node("7")}, options());
  EXPECT_EQ(transport_.calls_to("/7/70/products"), 2u);
  EXPECT_EQ(transport_.calls_to("/7/71/products"), 2u);
  EXPECT_EQ(store_->state_of("7:70"), NodeState::Completed);
  EXPECT_EQ(store_->state_of("7"), NodeState::Completed);
  EXPECT_EQ(summary.processed, 3u);
}

TEST_F(FetcherTest, CategoryEndFlushCompletesBufferedGroups)
{
  max_records_ = 500;
  reopen();
  transport_.ok("/7/groups", results(R"({"groupId":70})"));
  transport_.ok("/7/70/products", products(1, 2));
  transport_.ok("/8/groups", results(R"({"groupId":80})"));

  // by the time category 8 is listed, category 7 has loaded and completed
  std::optional<NodeState> seven_at_eight;
  size_t rows_at_eight{0};
  transport_.on_request([&](const std::string& url) {
    if ( url == base + "/8/groups" ) {
      seven_at_eight = store_->state_of("7");
      rows_at_eight = warehouse_.rows().size();
    }
  });

  fetcher_->run({category_node("7"), category_node("8")}, options());
  EXPECT_EQ(seven_at_eight, NodeState::Completed);
  EXPECT_EQ(rows_at_eight, 2u);
}

TEST_F(FetcherTest, StopMidTraversalLeavesRemainingWorkPending)
{
  transport_.ok("/7/groups", results(R"({"groupId":70},{"groupId":71},{"groupId":72})"));
  transport_.ok("/7/70/products", products(1, 2));
  transport_.ok("/7/71/products", products(10, 1));
  transport_.ok("/7/72/products", products(20, 1));

  // the in-flight request finishes, nothing after it starts
  transport_.on_request([this](const std::string& url) {
    if ( url == base + "/7/70/products" ) {
      fetcher_->request_stop();
    }
  });

  const auto summary = fetcher_->run({category_node("7")}, options());
  EXPECT_TRUE(summary.cancelled);
  EXPECT_TRUE(summary.unresolved());
  EXPECT_EQ(transport_.calls_to("/7/71/products"), 0u);
  EXPECT_EQ(transport_.calls_to("/7/72/products"), 0u);

  EXPECT_EQ(store_->state_of("7:70"), NodeState::Completed);
  EXPECT_EQ(store_->state_of("7:71"), NodeState::Pending);
  EXPECT_EQ(store_->state_of("7:72"), NodeState::Pending);
  EXPECT_EQ(store_->state_of("7"), NodeState::Pending);
  EXPECT_EQ(summary.processed, 1u);

  // buffered records were drained rather than dropped
  EXPECT_EQ(warehouse_.rows().size(), 2u);
  EXPECT_EQ(sink_->buffered(), 0u);
}

TEST_F(FetcherTest, NextRunAfterStopStartsFresh)
{
  transport_.ok("/7/groups", results(R"({"groupId":70})"));
  transport_.ok("/7/70/products", products(1, 1));
  fetcher_->request_stop();

  const auto stopped = fetcher_->run({category_node("7")}, options());
  ASSERT_TRUE(stopped.cancelled);
  EXPECT_FALSE(fetcher_->stop_token().stop_requested());

  const auto summary = fetcher_->run({category_node("7")}, options());
  EXPECT_FALSE(summary.cancelled);
  EXPECT_EQ(store_->state_of("7:70"), NodeState::Completed);
  EXPECT_EQ(store_->state_of("7"), NodeState::Completed);
  EXPECT_EQ(summary.processed, 2u);
}

TEST_F(FetcherTest, CheckpointWriteFailureAbortsAfterDrain)
{
  transport_.ok("/7/groups", results(R"({"groupId":70},{"groupId":71})"));
  transport_.ok("/7/70/products", products(1, 2));
  transport_.ok("/7/71/products", products(10, 2));

  // every node update fails from here on
  transport_.on_request([this](const std::string& url) {
    if ( url == base + "/7/70/products" ) {
      exec_on_checkpoint("CREATE TRIGGER refuse_updates BEFORE UPDATE ON nodes "
                         "BEGIN SELECT RAISE(ABORT, 'disk full'); END;");
    }
  });

  EXPECT_THROW(fetcher_->run({category_node("7")}, options()), PersistenceError);

  // the run stopped at the failed claim of 7:71, buffered rows still loaded
  EXPECT_EQ(transport_.calls_to("/7/71/products"), 0u);
  EXPECT_EQ(warehouse_.rows().size(), 2u);
  EXPECT_NE(store_->state_of("7:70"), NodeState::Completed);
}

} // end namespace tcf::test
