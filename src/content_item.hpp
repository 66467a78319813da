// SPDX-License-Identifier: MIT

// src/content_item.hpp
#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace feedpipe {

using ContentId = std::string;
using AuthorId = std::string;
using Timestamp = int64_t;  ///< Seconds since epoch, author-claimed
using Kind = uint32_t;

/// Content kinds the feeds subscribe to.
namespace kinds {
inline constexpr Kind kImage = 20;
inline constexpr Kind kShortVideo = 22;
inline constexpr Kind kAddressableVideo = 34236;
}  // namespace kinds

/// One unit of streamed content (post, video, etc.).
///
/// id, author and timestamp are extracted once when the source decodes the
/// item; the payload is carried through untouched for the caller.
struct ContentItem {
    ContentId id;                        ///< Unique, stable across redelivery
    AuthorId author_id;                  ///< Producing author
    Timestamp timestamp = 0;             ///< Author-claimed creation time
    Kind kind = kinds::kImage;           ///< Content kind
    std::shared_ptr<const void> payload; ///< Opaque to the aggregator
};

/// A batch of items as delivered by a content stream, in delivery order.
using ContentBatch = std::vector<ContentItem>;

}  // namespace feedpipe
