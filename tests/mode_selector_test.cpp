// SPDX-License-Identifier: MIT

// tests/mode_selector_test.cpp
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "src/mode_selector.hpp"
#include "tests/fake_content_stream.hpp"
#include "tests/mock_membership_oracle.hpp"

using namespace feedpipe;
using feedpipe::fakes::FakeMembership;
using feedpipe::fakes::MockMembershipOracle;
using ::testing::Return;
using ::testing::StrictMock;

TEST(ModeSelectorTest, FollowingDeferredUntilFollowListLoads) {
    ModeSelector selector{FeedConfig{}};
    FakeMembership oracle;

    QueryPlan plan = selector.Resolve(mode::Following{}, oracle);

    EXPECT_EQ(plan.status, PlanStatus::Deferred);
    EXPECT_FALSE(plan.query.has_value());
    EXPECT_EQ(oracle.follow_list_calls, 0);
}

TEST(ModeSelectorTest, FollowingWithEmptyFollowListIsEmpty) {
    ModeSelector selector{FeedConfig{}};
    FakeMembership oracle;
    oracle.follows_available = true;
    oracle.viewer = "me";

    QueryPlan plan = selector.Resolve(mode::Following{}, oracle);

    EXPECT_EQ(plan.status, PlanStatus::Empty);
    EXPECT_FALSE(plan.query.has_value());
}

TEST(ModeSelectorTest, FollowingIncludesViewer) {
    ModeSelector selector{FeedConfig::PhotoFeed(true)};
    FakeMembership oracle;
    oracle.follows_available = true;
    oracle.follows = {"carol", "alice"};
    oracle.viewer = "me";

    QueryPlan plan = selector.Resolve(mode::Following{}, oracle);

    ASSERT_EQ(plan.status, PlanStatus::Ready);
    ASSERT_TRUE(plan.query.has_value());
    EXPECT_EQ(plan.query->authors, (std::vector<AuthorId>{"alice", "carol", "me"}));
    EXPECT_EQ(plan.query->kinds, (std::vector<Kind>{kinds::kImage, kinds::kShortVideo}));
    EXPECT_EQ(plan.query->limit, 50u);
    EXPECT_EQ(plan.query->cache_policy, CachePolicy::CacheWithNetwork);
    EXPECT_FALSE(plan.query->close_on_eose);
}

TEST(ModeSelectorTest, FollowingSignedOutOmitsEmptyViewer) {
    ModeSelector selector{FeedConfig{}};
    FakeMembership oracle;
    oracle.follows_available = true;
    oracle.follows = {"alice"};

    QueryPlan plan = selector.Resolve(mode::Following{}, oracle);

    ASSERT_EQ(plan.status, PlanStatus::Ready);
    EXPECT_EQ(plan.query->authors, (std::vector<AuthorId>{"alice"}));
}

TEST(ModeSelectorTest, FollowListOfEmptyIdsSignedOutIsEmpty) {
    ModeSelector selector{FeedConfig{}};
    FakeMembership oracle;
    oracle.follows_available = true;
    oracle.follows = {""};

    QueryPlan plan = selector.Resolve(mode::Following{}, oracle);

    // Never widens into an unrestricted query
    EXPECT_EQ(plan.status, PlanStatus::Empty);
    EXPECT_FALSE(plan.query.has_value());
}

TEST(ModeSelectorTest, SingleRelayIsExclusiveAndNetworkOnly) {
    ModeSelector selector{FeedConfig{}};
    FakeMembership oracle;

    QueryPlan plan = selector.Resolve(mode::SingleRelay{"wss://relay.olas.app"}, oracle);

    ASSERT_EQ(plan.status, PlanStatus::Ready);
    EXPECT_TRUE(plan.query->authors.empty());
    EXPECT_EQ(plan.query->relays, (std::vector<std::string>{"wss://relay.olas.app"}));
    EXPECT_TRUE(plan.query->exclusive_relays);
    EXPECT_EQ(plan.query->cache_policy, CachePolicy::NetworkOnly);

    EXPECT_EQ(selector.Resolve(mode::SingleRelay{""}, oracle).status, PlanStatus::Empty);
}

TEST(ModeSelectorTest, CuratedPackUsesMembers) {
    ModeSelector selector{FeedConfig{}};
    FakeMembership oracle;

    SavedPack pack{.id = "p", .name = "Pack", .members = {"bob", "alice", "bob"}};
    QueryPlan plan = selector.Resolve(mode::CuratedPack{pack}, oracle);

    ASSERT_EQ(plan.status, PlanStatus::Ready);
    EXPECT_EQ(plan.query->authors, (std::vector<AuthorId>{"alice", "bob"}));

    SavedPack empty{.id = "e", .name = "Empty"};
    EXPECT_EQ(selector.Resolve(mode::CuratedPack{empty}, oracle).status, PlanStatus::Empty);
}

TEST(ModeSelectorTest, NetworkWideIsUnrestricted) {
    ModeSelector selector{FeedConfig{}};
    FakeMembership oracle;

    QueryPlan plan = selector.Resolve(mode::NetworkWide{}, oracle);

    ASSERT_EQ(plan.status, PlanStatus::Ready);
    EXPECT_TRUE(plan.query->authors.empty());
    EXPECT_TRUE(plan.query->relays.empty());
    EXPECT_TRUE(plan.query->tags.empty());
    EXPECT_EQ(plan.query->cache_policy, CachePolicy::CacheWithNetwork);
}

TEST(ModeSelectorTest, HashtagFiltersByNormalizedTag) {
    ModeSelector selector{FeedConfig{}};
    FakeMembership oracle;

    QueryPlan plan = selector.Resolve(mode::Hashtag{"#Sunset"}, oracle);

    ASSERT_EQ(plan.status, PlanStatus::Ready);
    ASSERT_EQ(plan.query->tags.count("t"), 1u);
    EXPECT_EQ(plan.query->tags.at("t"), (std::vector<std::string>{"sunset"}));

    EXPECT_EQ(selector.Resolve(mode::Hashtag{"#"}, oracle).status, PlanStatus::Empty);
}

TEST(ModeSelectorTest, PageSizeBecomesLimit) {
    ModeSelector selector{FeedConfig{.page_size = 20}};
    FakeMembership oracle;

    QueryPlan plan = selector.Resolve(mode::NetworkWide{}, oracle);
    ASSERT_EQ(plan.status, PlanStatus::Ready);
    EXPECT_EQ(plan.query->limit, 20u);
}

TEST(ModeSelectorTest, PlanStatusNames) {
    EXPECT_EQ(plan_status_name(PlanStatus::Ready), "ready");
    EXPECT_EQ(plan_status_name(PlanStatus::Deferred), "deferred");
    EXPECT_EQ(plan_status_name(PlanStatus::Empty), "empty");
}

TEST(ModeSelectorTest, DeferredPlanDoesNotReadFollowList) {
    ModeSelector selector{FeedConfig{}};
    StrictMock<MockMembershipOracle> oracle;

    EXPECT_CALL(oracle, IsFollowListAvailable()).WillOnce(Return(false));

    EXPECT_EQ(selector.Resolve(mode::Following{}, oracle).status, PlanStatus::Deferred);
}

TEST(ModeSelectorTest, NonFollowingModesIgnoreSocialGraph) {
    ModeSelector selector{FeedConfig{}};
    StrictMock<MockMembershipOracle> oracle;

    // No expectations: any oracle call fails the test
    EXPECT_EQ(selector.Resolve(mode::NetworkWide{}, oracle).status, PlanStatus::Ready);
    EXPECT_EQ(selector.Resolve(mode::Hashtag{"art"}, oracle).status, PlanStatus::Ready);
    EXPECT_EQ(selector.Resolve(mode::SingleRelay{"wss://r"}, oracle).status, PlanStatus::Ready);
}

TEST(ModeSelectorTest, FollowingQueriesOracleOnce) {
    ModeSelector selector{FeedConfig{}};
    StrictMock<MockMembershipOracle> oracle;

    EXPECT_CALL(oracle, IsFollowListAvailable()).WillOnce(Return(true));
    EXPECT_CALL(oracle, FollowList()).WillOnce(Return(AuthorSet{"bob"}));
    EXPECT_CALL(oracle, Viewer()).WillOnce(Return(AuthorId{"me"}));

    QueryPlan plan = selector.Resolve(mode::Following{}, oracle);
    ASSERT_EQ(plan.status, PlanStatus::Ready);
    EXPECT_THAT(plan.query->authors, ::testing::ElementsAre("bob", "me"));
}
