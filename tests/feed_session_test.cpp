// SPDX-License-Identifier: MIT

// tests/feed_session_test.cpp
#include <gtest/gtest.h>

#include "src/feed_session.hpp"
#include "tests/fake_content_stream.hpp"

using namespace feedpipe;
using feedpipe::fakes::FakeMembership;
using feedpipe::fakes::Ids;
using feedpipe::fakes::Item;

using Strings = std::vector<std::string>;

TEST(FeedSessionTest, AdmitOrdersByTimestamp) {
    FeedSession session;
    FakeMembership oracle;
    FeedConfig config;

    auto stats = session.Admit({Item("b", "x", 100), Item("a", "x", 300), Item("c", "x", 200)},
                               oracle, config);

    EXPECT_EQ(stats.delivered, 3u);
    EXPECT_EQ(stats.admitted, 3u);
    EXPECT_EQ(Ids(session.visible_items), (Strings{"a", "c", "b"}));
}

TEST(FeedSessionTest, AdmitDropsDuplicatesWithinAndAcrossBatches) {
    FeedSession session;
    FakeMembership oracle;
    FeedConfig config;

    session.Admit({Item("a", "x", 100), Item("a", "x", 100)}, oracle, config);
    auto stats = session.Admit({Item("a", "x", 100), Item("b", "x", 50)}, oracle, config);

    EXPECT_EQ(stats.duplicates, 1u);
    EXPECT_EQ(stats.admitted, 1u);
    EXPECT_EQ(Ids(session.visible_items), (Strings{"a", "b"}));
}

TEST(FeedSessionTest, MutedItemsStaySeen) {
    FeedSession session;
    FakeMembership oracle;
    oracle.muted = {"mallory"};
    FeedConfig config;

    auto stats = session.Admit({Item("m", "mallory", 100)}, oracle, config);
    EXPECT_EQ(stats.muted, 1u);
    EXPECT_TRUE(session.visible_items.empty());

    // Unmuting does not resurrect an item already seen this session
    oracle.muted.clear();
    stats = session.Admit({Item("m", "mallory", 100)}, oracle, config);
    EXPECT_EQ(stats.duplicates, 1u);
    EXPECT_TRUE(session.visible_items.empty());
}

TEST(FeedSessionTest, TrustFilterAppliesOnlyToNetworkWide) {
    FakeMembership oracle;
    oracle.trust_available = true;
    oracle.trusted = {"alice"};
    FeedConfig config;

    FeedSession network;
    network.mode = mode::NetworkWide{};
    auto stats = network.Admit({Item("a", "alice", 2), Item("b", "stranger", 1)}, oracle, config);
    EXPECT_EQ(stats.untrusted, 1u);
    EXPECT_EQ(Ids(network.visible_items), (Strings{"a"}));

    FeedSession tagged;
    tagged.mode = mode::Hashtag{"art"};
    tagged.Admit({Item("a", "alice", 2), Item("b", "stranger", 1)}, oracle, config);
    EXPECT_EQ(tagged.visible_items.size(), 2u);
}

TEST(FeedSessionTest, TrustFilterFailsOpenWhileUnavailable) {
    FakeMembership oracle;
    FeedConfig config;

    FeedSession session;
    session.mode = mode::NetworkWide{};
    auto stats = session.Admit({Item("b", "stranger", 1)}, oracle, config);

    EXPECT_EQ(stats.untrusted, 0u);
    EXPECT_EQ(session.visible_items.size(), 1u);
}

TEST(FeedSessionTest, ResetItemsPreservingReseedsSeenIds) {
    FeedSession session;
    FakeMembership oracle;
    FeedConfig config;

    session.Admit({Item("a", "x", 2), Item("b", "x", 1)}, oracle, config);

    session.ResetItems(true);
    EXPECT_EQ(session.visible_items.size(), 2u);
    auto stats = session.Admit({Item("a", "x", 2), Item("c", "x", 3)}, oracle, config);
    EXPECT_EQ(stats.duplicates, 1u);
    EXPECT_EQ(Ids(session.visible_items), (Strings{"c", "a", "b"}));

    session.ResetItems(false);
    EXPECT_TRUE(session.visible_items.empty());
    EXPECT_TRUE(session.seen_ids.empty());
}

TEST(FeedSessionTest, RemoveAuthorsKeepsSeenIds) {
    FeedSession session;
    FakeMembership oracle;
    FeedConfig config;

    session.Admit({Item("a", "alice", 3), Item("b", "bob", 2), Item("c", "alice", 1)},
                  oracle, config);

    EXPECT_EQ(session.RemoveAuthors({"alice"}), 2u);
    EXPECT_EQ(Ids(session.visible_items), (Strings{"b"}));
    EXPECT_TRUE(session.seen_ids.contains("a"));
    EXPECT_EQ(session.RemoveAuthors({}), 0u);
}

TEST(FeedSessionTest, RemoveUntrustedNoOpWhileUnavailable) {
    FeedSession session;
    FakeMembership oracle;
    FeedConfig config;

    session.Admit({Item("a", "alice", 2), Item("b", "stranger", 1)}, oracle, config);
    EXPECT_EQ(session.RemoveUntrusted(oracle), 0u);

    oracle.trust_available = true;
    oracle.trusted = {"alice"};
    EXPECT_EQ(session.RemoveUntrusted(oracle), 1u);
    EXPECT_EQ(Ids(session.visible_items), (Strings{"a"}));
}

TEST(FeedSessionTest, DiversifiedAdmit) {
    FeedSession session;
    FakeMembership oracle;
    FeedConfig config = FeedConfig::VideoFeed();

    session.Admit({Item("a1", "alice", 90), Item("a2", "alice", 80), Item("a3", "alice", 70),
                   Item("b1", "bob", 60), Item("b2", "bob", 50)},
                  oracle, config);
    ASSERT_EQ(session.visible_items.size(), 5u);

    // A fourth alice item lands below the bob items instead of extending the run
    session.Admit({Item("a4", "alice", 65)}, oracle, config);
    EXPECT_EQ(Ids(session.visible_items), (Strings{"a1", "a2", "a3", "b1", "b2", "a4"}));
}

TEST(FeedSessionTest, ReleaseStreamCancels) {
    feedpipe::fakes::FakeContentStream stream;
    FeedSession session;

    auto sink = std::make_shared<ContentSink>(nullptr, nullptr, nullptr);
    session.stream = stream.Open(FeedQuery{}, sink);
    ASSERT_EQ(stream.ActiveCount(), 1u);

    session.ReleaseStream();
    EXPECT_FALSE(session.stream);
    EXPECT_EQ(stream.ActiveCount(), 0u);

    session.ReleaseStream();  // Idempotent
}

TEST(FeedSessionTest, AdmitAfterDiversifiedPlacement) {
    FeedSession session;
    FakeMembership oracle;
    FeedConfig config = FeedConfig::VideoFeed();

    session.Admit({Item("a1", "alice", 100), Item("a2", "alice", 90), Item("a3", "alice", 80),
                   Item("b1", "bob", 10)},
                  oracle, config);
    session.Admit({Item("a4", "alice", 70)}, oracle, config);
    ASSERT_EQ(Ids(session.visible_items), (Strings{"a1", "a2", "a3", "b1", "a4"}));

    // Later items still land next to their timestamps
    session.Admit({Item("c1", "carol", 50)}, oracle, config);
    session.Admit({Item("c2", "carol", 85)}, oracle, config);

    EXPECT_EQ(Ids(session.visible_items),
              (Strings{"a1", "a2", "c2", "a3", "b1", "a4", "c1"}));
}
