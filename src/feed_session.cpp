// SPDX-License-Identifier: MIT

#include "src/feed_session.hpp"

#include <iterator>
#include <utility>

#include "src/ordering.hpp"

namespace feedpipe {

void FeedSession::ResetItems(bool preserve) {
    seen_ids.clear();
    if (!preserve) {
        visible_items.clear();
        return;
    }
    for (const auto& item : visible_items) {
        seen_ids.insert(item.id);
    }
}

AdmitStats FeedSession::Admit(ContentBatch&& batch, const IMembershipOracle& oracle,
                              const FeedConfig& config) {
    AdmitStats stats;
    stats.delivered = batch.size();

    // Fail-open: until trust data arrives nothing is filtered by it
    const bool filter_trust = KindOf(mode) == ModeKind::NetworkWide &&
                              oracle.IsWebOfTrustAvailable();

    for (auto& item : batch) {
        if (!seen_ids.insert(item.id).second) {
            ++stats.duplicates;
            continue;
        }
        if (oracle.IsMuted(item.author_id)) {
            ++stats.muted;
            continue;
        }
        if (filter_trust && !oracle.IsInWebOfTrust(item.author_id)) {
            ++stats.untrusted;
            continue;
        }

        std::size_t index = config.diversify
            ? DiversifiedInsertionIndex(visible_items, item, config.max_consecutive)
            : InsertionIndex(visible_items, item);
        visible_items.insert(visible_items.begin() + static_cast<std::ptrdiff_t>(index),
                             std::move(item));
        ++stats.admitted;
    }
    return stats;
}

std::size_t FeedSession::RemoveAuthors(const AuthorSet& authors) {
    if (authors.empty()) {
        return 0;
    }
    return std::erase_if(visible_items, [&authors](const ContentItem& item) {
        return authors.contains(item.author_id);
    });
}

std::size_t FeedSession::RemoveUntrusted(const IMembershipOracle& oracle) {
    if (!oracle.IsWebOfTrustAvailable()) {
        return 0;
    }
    return std::erase_if(visible_items, [&oracle](const ContentItem& item) {
        return !oracle.IsInWebOfTrust(item.author_id);
    });
}

void FeedSession::ReleaseStream() {
    if (stream) {
        stream->Cancel();
        stream.reset();
    }
}

}  // namespace feedpipe
