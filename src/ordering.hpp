// SPDX-License-Identifier: MIT

// src/ordering.hpp
#pragma once

#include <algorithm>
#include <cstddef>
#include <vector>

#include "src/content_item.hpp"

namespace feedpipe {

/// Feed order: newer timestamp first, equal timestamps by ascending id.
inline bool IsNewerThan(const ContentItem& a, const ContentItem& b) {
    if (a.timestamp != b.timestamp) {
        return a.timestamp > b.timestamp;
    }
    return a.id < b.id;
}

/// Position that keeps @p items in feed order after inserting @p item.
/// Binary search; O(log n). Also well defined on a diversified list, which
/// is not strictly ordered; the result is then a position near the item's
/// timestamp.
inline std::size_t InsertionIndex(const std::vector<ContentItem>& items,
                                  const ContentItem& item) {
    std::size_t low = 0;
    std::size_t high = items.size();
    while (low < high) {
        std::size_t mid = low + (high - low) / 2;
        if (IsNewerThan(item, items[mid])) {
            high = mid;
        } else {
            low = mid + 1;
        }
    }
    return low;
}

/// Insertion position with same-author burst avoidance.
///
/// Starts from the natural InsertionIndex() and counts the run of items by
/// the same author immediately above it. Once that run reaches
/// @p max_consecutive, the item is pushed down 2, 4, 8, ... positions
/// (doubling per extra run item), capped at the end of the list.
inline std::size_t DiversifiedInsertionIndex(const std::vector<ContentItem>& items,
                                             const ContentItem& item,
                                             std::size_t max_consecutive) {
    std::size_t natural = InsertionIndex(items, item);
    if (max_consecutive == 0) {
        return natural;
    }

    std::size_t consecutive = 0;
    for (std::size_t i = natural; i > 0; --i) {
        if (items[i - 1].author_id != item.author_id) break;
        ++consecutive;
    }

    if (consecutive < max_consecutive) {
        return natural;
    }

    // Keep the shift representable; any run this long lands at the end anyway
    std::size_t exponent = std::min<std::size_t>(consecutive - max_consecutive + 1, 62);
    std::size_t offset = std::size_t{1} << exponent;
    return std::min(natural + offset, items.size());
}

}  // namespace feedpipe
