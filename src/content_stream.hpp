// SPDX-License-Identifier: MIT

// src/content_stream.hpp
#pragma once

#include <memory>

#include "lib/stream/sink.hpp"
#include "src/content_item.hpp"
#include "src/feed_query.hpp"

namespace feedpipe {

/// Sink a content stream pushes batches into.
using ContentSink = StreamSink<ContentBatch>;

static_assert(StreamingSink<ContentSink, ContentBatch>,
              "ContentSink must satisfy StreamingSink");

/// Ownership of one open subscription. Destroying the handle cancels it.
class IStreamHandle {
public:
    virtual ~IStreamHandle() = default;

    /// Stop delivery and release the subscription. Idempotent.
    virtual void Cancel() = 0;
};

/// Producer of content batches for a query (the protocol client).
///
/// Open() returns immediately; batches arrive later through the sink, on
/// any thread. An open-ended query calls OnComplete() once its stored
/// results are exhausted and keeps delivering live items; a query with
/// close_on_eose calls OnComplete() and then stops. OnError() is terminal.
class IContentStream {
public:
    virtual ~IContentStream() = default;

    /// Open a subscription for @p query delivering into @p sink.
    virtual std::unique_ptr<IStreamHandle> Open(const FeedQuery& query,
                                                std::shared_ptr<ContentSink> sink) = 0;
};

}  // namespace feedpipe
