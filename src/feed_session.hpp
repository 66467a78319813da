// SPDX-License-Identifier: MIT

// src/feed_session.hpp
#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <unordered_set>
#include <vector>

#include "src/content_item.hpp"
#include "src/content_stream.hpp"
#include "src/feed_config.hpp"
#include "src/feed_mode.hpp"
#include "src/feed_query.hpp"
#include "src/membership_oracle.hpp"

namespace feedpipe {

/// Per-batch outcome of FeedSession::Admit().
struct AdmitStats {
    std::size_t delivered = 0;   ///< Items in the batch
    std::size_t duplicates = 0;  ///< Already seen this session
    std::size_t muted = 0;       ///< Author muted
    std::size_t untrusted = 0;   ///< Outside web of trust (network-wide only)
    std::size_t admitted = 0;    ///< Inserted into the visible list
};

/// Mutable state of one aggregation run, owned by FeedAggregator.
///
/// Invariants: visible_items has no duplicate id and, unless diversification
/// is enabled, is ordered by IsNewerThan(); every visible id is in seen_ids.
struct FeedSession {
    FeedMode mode;
    uint64_t generation = 0;
    std::vector<ContentItem> visible_items;
    std::unordered_set<ContentId> seen_ids;
    bool is_loading = false;
    bool received_batch = false;          ///< First batch of the session processed
    bool failed = false;                  ///< Stream reported a terminal error
    std::optional<FeedQuery> query;       ///< Resolved query; unset when deferred or empty
    std::unique_ptr<IStreamHandle> stream;

    /// Clear seen ids and, unless @p preserve, the visible list. Preserved
    /// items are re-seeded into seen_ids so redelivery cannot duplicate them.
    void ResetItems(bool preserve);

    /// Run one batch through dedup, mute, trust and ordered insertion.
    AdmitStats Admit(ContentBatch&& batch, const IMembershipOracle& oracle,
                     const FeedConfig& config);

    /// Drop visible items written by any of @p authors. seen_ids is untouched.
    /// @return Number of items removed.
    std::size_t RemoveAuthors(const AuthorSet& authors);

    /// Drop visible items whose author is outside the web of trust.
    /// No-op while trust data is unavailable. @return Number of items removed.
    std::size_t RemoveUntrusted(const IMembershipOracle& oracle);

    /// Cancel and release the stream handle, if any.
    void ReleaseStream();
};

}  // namespace feedpipe
