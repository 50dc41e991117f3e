/*
 * checkpoint_store_test.cpp  Oct 12th, 2026
 */

#include <memory>

#include <gtest/gtest.h>

#include "test_support.hpp"
#include "tcf/checkpoint_store.hpp"
#include "tcf/errors.hpp"

namespace tcf::test {

class CheckpointStoreTest : public ScratchDirTest {
protected:
  std::string path() const { return file("checkpoint.db"); }

  std::unique_ptr<CheckpointStore> open() { return std::make_unique<CheckpointStore>(path()); }

  /* category 1 with groups 10, 11, 12 and category 2 with group 20 */
  void seed(CheckpointStore& store)
  {
    store.register_node(category_node("1"));
    store.register_node(group_node("1", "10"));
    store.register_node(group_node("1", "11"));
    store.register_node(group_node("1", "12"));
    store.register_node(category_node("2"));
    store.register_node(group_node("2", "20"));
  }
};

TEST_F(CheckpointStoreTest, RegisteredNodesStartPending)
{
  auto store = open();
  seed(*store);

  EXPECT_EQ(store->state_of("1"), NodeState::Pending);
  EXPECT_EQ(store->state_of("1:10"), NodeState::Pending);
  EXPECT_FALSE(store->state_of("9").has_value());
}

TEST_F(CheckpointStoreTest, ReRegisteringKeepsState)
{
  auto store = open();
  seed(*store);
  store->mark("1:10", NodeState::Completed);

  auto renamed = group_node("1", "10");
  renamed.name = "renamed";
  store->register_node(renamed);

  const auto entry = store->entry("1:10");
  ASSERT_TRUE(entry.has_value());
  EXPECT_EQ(entry->state, NodeState::Completed);
  EXPECT_EQ(entry->name, "renamed");
}

TEST_F(CheckpointStoreTest, CompletedAndFailedQueries)
{
  auto store = open();
  seed(*store);
  store->mark("1:10", NodeState::Completed);
  store->mark("1:11", NodeState::Failed, "HTTP 404");

  EXPECT_TRUE(store->is_completed("1:10"));
  EXPECT_FALSE(store->is_failed("1:10"));
  EXPECT_TRUE(store->is_failed("1:11"));
  EXPECT_FALSE(store->is_completed("1:11"));
  EXPECT_FALSE(store->is_completed("1:12"));
  EXPECT_FALSE(store->is_failed("9"));
  EXPECT_EQ(store->entry("1:11")->error, "HTTP 404");
}

TEST_F(CheckpointStoreTest, ClaimIsExclusive)
{
  auto store = open();
  seed(*store);

  EXPECT_TRUE(store->try_claim("1:10"));
  EXPECT_FALSE(store->try_claim("1:10"));
  EXPECT_EQ(store->state_of("1:10"), NodeState::InProgress);
  EXPECT_EQ(store->entry("1:10")->attempts, 1);
}

TEST_F(CheckpointStoreTest, CompletedNodesAreNeverClaimed)
{
  auto store = open();
  seed(*store);
  store->mark("1:10", NodeState::Completed);

  EXPECT_FALSE(store->try_claim("1:10"));
}

TEST_F(CheckpointStoreTest, FailedNodesClaimedOnlyAfterRetry)
{
  auto store = open();
  seed(*store);
  store->mark("1:11", NodeState::Failed, "HTTP 404");

  EXPECT_FALSE(store->try_claim("1:11"));
  EXPECT_THROW(store->mark("1:11", NodeState::InProgress), TransitionError);

  ASSERT_EQ(store->retry_failed(std::string("1")), 1u);
  EXPECT_TRUE(store->entry("1:11")->error.empty());
  EXPECT_TRUE(store->try_claim("1:11"));
}

TEST_F(CheckpointStoreTest, IllegalTransitionsThrow)
{
  auto store = open();
  seed(*store);

  store->mark("1:10", NodeState::Completed);
  EXPECT_THROW(store->mark("1:10", NodeState::Pending), TransitionError);
  EXPECT_THROW(store->mark("1:10", NodeState::Failed), TransitionError);

  ASSERT_TRUE(store->try_claim("1:11"));
  EXPECT_THROW(store->mark("1:11", NodeState::InProgress), TransitionError);

  EXPECT_THROW(store->mark("nope", NodeState::Completed), TransitionError);
  EXPECT_THROW(store->try_claim("nope"), TransitionError);

  // rejected transitions leave the node untouched
  EXPECT_EQ(store->state_of("1:10"), NodeState::Completed);
}

TEST_F(CheckpointStoreTest, InProgressRecoveredAsPendingOnReopen)
{
  {
    auto store = open();
    seed(*store);
    ASSERT_TRUE(store->try_claim("1:10"));
    ASSERT_TRUE(store->try_claim("1:11"));
    store->mark("1:11", NodeState::Completed);
  }

  auto store = open();
  EXPECT_EQ(store->state_of("1:10"), NodeState::Pending);
  EXPECT_EQ(store->state_of("1:11"), NodeState::Completed);
  EXPECT_EQ(store->entry("1:10")->attempts, 1);
}

TEST_F(CheckpointStoreTest, StatePersistsAcrossReopen)
{
  {
    auto store = open();
    seed(*store);
    store->mark("1:10", NodeState::Completed);
    store->mark("1:12", NodeState::Failed, "HTTP 404");
    store->add_records(42);
  }

  auto store = open();
  const auto cp = store->load();
  EXPECT_EQ(cp.nodes.size(), 6u);
  EXPECT_EQ(cp.nodes.at("1:10").state, NodeState::Completed);
  EXPECT_EQ(cp.nodes.at("1:12").state, NodeState::Failed);
  EXPECT_EQ(cp.nodes.at("1:12").error, "HTTP 404");
  EXPECT_EQ(cp.nodes.at("1:12").parent_id, "1");
  EXPECT_EQ(cp.nodes.at("1:12").level, NodeLevel::Group);
  EXPECT_EQ(cp.total_records, 42);
  EXPECT_FALSE(cp.started_at.empty());
}

TEST_F(CheckpointStoreTest, PendingNodesFilterByParentInDiscoveryOrder)
{
  auto store = open();
  seed(*store);
  store->mark("1:11", NodeState::Completed);
  store->mark("1:12", NodeState::Failed, "boom");

  EXPECT_EQ(store->pending_nodes("1"), (std::vector<std::string>{"1:10"}));
  EXPECT_EQ(store->pending_nodes("1", true), (std::vector<std::string>{"1:10", "1:12"}));
  EXPECT_EQ(store->failed_nodes("1"), (std::vector<std::string>{"1:12"}));
  EXPECT_EQ(store->pending_nodes("2"), (std::vector<std::string>{"2:20"}));
  EXPECT_EQ(store->pending_nodes(""), (std::vector<std::string>{"1", "2"}));
  EXPECT_EQ(store->children("1").size(), 3u);
}

TEST_F(CheckpointStoreTest, RetryFailedReturnsNodesToPending)
{
  auto store = open();
  seed(*store);
  store->mark("1:12", NodeState::Failed, "boom");
  store->mark("2:20", NodeState::Failed, "boom");

  EXPECT_EQ(store->retry_failed(std::string("1")), 1u);
  EXPECT_EQ(store->state_of("1:12"), NodeState::Pending);
  EXPECT_EQ(store->state_of("2:20"), NodeState::Failed);

  EXPECT_EQ(store->retry_failed(), 1u);
  EXPECT_EQ(store->state_of("2:20"), NodeState::Pending);
  EXPECT_EQ(store->retry_failed(), 0u);
}

TEST_F(CheckpointStoreTest, StatusCountsGroupsOnly)
{
  auto store = open();
  EXPECT_FALSE(store->status().can_resume);

  seed(*store);
  store->mark("1:10", NodeState::Completed);
  store->mark("1:11", NodeState::Failed, "boom");
  ASSERT_TRUE(store->try_claim("1:12"));
  store->mark("2:20", NodeState::Completed);
  store->mark("2", NodeState::Completed);

  const auto st = store->status();
  EXPECT_EQ(st.path, path());
  EXPECT_EQ(st.categories_completed, 1u);
  EXPECT_EQ(st.completed, 2u);
  EXPECT_EQ(st.failed, 1u);
  EXPECT_EQ(st.in_progress, 1u);
  EXPECT_EQ(st.pending, 0u);
  EXPECT_TRUE(st.can_resume);
}

TEST_F(CheckpointStoreTest, ResetClearsEverything)
{
  auto store = open();
  seed(*store);
  store->mark("1:10", NodeState::Completed);
  store->add_records(10);

  store->reset();
  EXPECT_FALSE(store->state_of("1:10").has_value());
  EXPECT_EQ(store->status().total_records, 0);

  auto reopened = open();
  EXPECT_TRUE(reopened->load().nodes.empty());
}

} // end namespace tcf::test
