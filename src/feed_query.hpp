// SPDX-License-Identifier: MIT

// src/feed_query.hpp
#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "src/content_item.hpp"

namespace feedpipe {

/// Where a stream may answer from.
enum class CachePolicy {
    CacheWithNetwork,  ///< Serve cached items first, then live network results
    NetworkOnly,       ///< Skip the local cache entirely
};

/// Concrete query handed to a content stream.
///
/// Empty authors / kinds / relays mean "unrestricted".
struct FeedQuery {
    std::vector<AuthorId> authors;
    std::vector<Kind> kinds;
    std::map<std::string, std::vector<std::string>> tags;  ///< Tag name -> accepted values
    std::optional<Timestamp> until;                         ///< Only items with timestamp <= until
    uint32_t limit = 50;
    std::vector<std::string> relays;
    bool exclusive_relays = false;     ///< Use only `relays`, not the default pool
    CachePolicy cache_policy = CachePolicy::CacheWithNetwork;
    bool close_on_eose = false;        ///< Bounded: terminate after the stored results

    bool operator==(const FeedQuery&) const = default;
};

/// Compact single-line description for logs, e.g.
/// "authors=12 kinds=[20,22] #t=[art] until=1700000000 limit=50 relays=1(exclusive) bounded".
std::string Describe(const FeedQuery& query);

}  // namespace feedpipe
