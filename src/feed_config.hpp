// SPDX-License-Identifier: MIT

// src/feed_config.hpp
#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "src/content_item.hpp"

namespace feedpipe {

/// Configuration for one feed aggregator instance.
struct FeedConfig {
    std::vector<Kind> kinds{kinds::kImage};             ///< Content kinds to subscribe to
    uint32_t page_size = 50;                            ///< Query limit, initial and per page
    std::chrono::milliseconds loading_timeout{10000};   ///< Loading fallback per session
    bool diversify = false;                             ///< Anti-burst insertion for same-author runs
    std::size_t max_consecutive = 3;                    ///< Run length before diversification pushes down

    /// Preset for the photo grid: images, plus short videos when enabled.
    static FeedConfig PhotoFeed(bool show_videos) {
        FeedConfig config{.kinds = {kinds::kImage}};
        if (show_videos) {
            config.kinds.push_back(kinds::kShortVideo);
        }
        return config;
    }

    /// Preset for the vertical video feed: both short video kinds, diversified.
    static FeedConfig VideoFeed() {
        return FeedConfig{
            .kinds = {kinds::kShortVideo, kinds::kAddressableVideo},
            .page_size = 50,
            .loading_timeout = std::chrono::milliseconds{10000},
            .diversify = true,
            .max_consecutive = 3,
        };
    }
};

/// Relays suggested to the caller for single-relay discovery.
inline const std::vector<std::string>& DiscoveryRelays() {
    static const std::vector<std::string> relays = {
        "wss://relay.olas.app",
        "wss://relay.divine.video",
    };
    return relays;
}

}  // namespace feedpipe
