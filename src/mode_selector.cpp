// SPDX-License-Identifier: MIT

#include "src/mode_selector.hpp"

#include <algorithm>
#include <utility>
#include <vector>

#include "lib/stream/log.hpp"

namespace feedpipe {

namespace {

QueryPlan Ready(FeedQuery query) {
    return QueryPlan{.status = PlanStatus::Ready, .query = std::move(query)};
}

QueryPlan Deferred() {
    return QueryPlan{.status = PlanStatus::Deferred, .query = std::nullopt};
}

QueryPlan Empty() {
    return QueryPlan{.status = PlanStatus::Empty, .query = std::nullopt};
}

// Sorted, duplicate-free author list so equal inputs yield equal queries
std::vector<AuthorId> SortedUnique(std::vector<AuthorId> authors) {
    std::sort(authors.begin(), authors.end());
    authors.erase(std::unique(authors.begin(), authors.end()), authors.end());
    std::erase(authors, AuthorId{});
    return authors;
}

}  // namespace

FeedQuery ModeSelector::BaseQuery() const {
    FeedQuery query;
    query.kinds = config_.kinds;
    query.limit = config_.page_size;
    query.cache_policy = CachePolicy::CacheWithNetwork;
    return query;
}

QueryPlan ModeSelector::Resolve(const FeedMode& mode, const IMembershipOracle& oracle) const {
    FeedQuery query = BaseQuery();

    switch (KindOf(mode)) {
        case ModeKind::Following: {
            if (!oracle.IsFollowListAvailable()) {
                FEEDPIPE_LOG_DEBUG("follow list not loaded yet, deferring following feed");
                return Deferred();
            }
            AuthorSet follows = oracle.FollowList();
            if (follows.empty()) {
                return Empty();
            }
            std::vector<AuthorId> authors(follows.begin(), follows.end());
            authors.push_back(oracle.Viewer());
            query.authors = SortedUnique(std::move(authors));
            if (query.authors.empty()) {
                return Empty();
            }
            return Ready(std::move(query));
        }

        case ModeKind::SingleRelay: {
            const auto& relay = std::get<mode::SingleRelay>(mode);
            if (relay.url.empty()) {
                FEEDPIPE_LOG_WARN("single-relay mode without a relay url");
                return Empty();
            }
            query.relays = {relay.url};
            query.exclusive_relays = true;
            query.cache_policy = CachePolicy::NetworkOnly;
            return Ready(std::move(query));
        }

        case ModeKind::CuratedPack: {
            const auto& pack = std::get<mode::CuratedPack>(mode).pack;
            query.authors = SortedUnique(pack.members);
            if (query.authors.empty()) {
                return Empty();
            }
            return Ready(std::move(query));
        }

        case ModeKind::NetworkWide:
            return Ready(std::move(query));

        case ModeKind::Hashtag: {
            std::string tag = NormalizeHashtag(std::get<mode::Hashtag>(mode).tag);
            if (tag.empty()) {
                return Empty();
            }
            query.tags["t"] = {std::move(tag)};
            return Ready(std::move(query));
        }
    }
    return Empty();
}

}  // namespace feedpipe
