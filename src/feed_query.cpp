// SPDX-License-Identifier: MIT

#include "src/feed_query.hpp"

#include <iterator>

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace feedpipe {

std::string Describe(const FeedQuery& query) {
    fmt::memory_buffer out;
    auto it = std::back_inserter(out);

    if (query.authors.empty()) {
        it = fmt::format_to(it, "authors=any");
    } else {
        it = fmt::format_to(it, "authors={}", query.authors.size());
    }
    it = fmt::format_to(it, " kinds=[{}]", fmt::join(query.kinds, ","));
    for (const auto& [name, values] : query.tags) {
        it = fmt::format_to(it, " #{}=[{}]", name, fmt::join(values, ","));
    }
    if (query.until) {
        it = fmt::format_to(it, " until={}", *query.until);
    }
    it = fmt::format_to(it, " limit={}", query.limit);
    if (!query.relays.empty()) {
        it = fmt::format_to(it, " relays={}{}", query.relays.size(),
                            query.exclusive_relays ? "(exclusive)" : "");
    }
    if (query.cache_policy == CachePolicy::NetworkOnly) {
        it = fmt::format_to(it, " network-only");
    }
    if (query.close_on_eose) {
        it = fmt::format_to(it, " bounded");
    }
    return fmt::to_string(out);
}

}  // namespace feedpipe
