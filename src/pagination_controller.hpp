// SPDX-License-Identifier: MIT

// src/pagination_controller.hpp
#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>

#include "src/content_stream.hpp"
#include "src/feed_query.hpp"
#include "src/feed_session.hpp"

namespace feedpipe {

/// "Load older" requests for the active feed session.
///
/// A page is the session's query bounded by a watermark cursor
/// (oldest visible timestamp - 1) and closed after its stored results. At
/// most one page is in flight per generation; the guard clears when the
/// page completes or fails, or when the session is superseded (Reset()).
///
/// Items sharing the exact boundary timestamp with the oldest visible item
/// but not yet seen are skipped by the cursor; that is accepted.
///
/// Page batches are not handled here: the sink comes from the owner and
/// funnels into the same admission path as the live session.
class PaginationController {
public:
    /// Builds the sink that routes a page's callbacks for a generation.
    using SinkFactory = std::function<std::shared_ptr<ContentSink>(uint64_t generation)>;

    explicit PaginationController(IContentStream& stream) : stream_(stream) {}

    ~PaginationController() { Reset(); }

    PaginationController(const PaginationController&) = delete;
    PaginationController& operator=(const PaginationController&) = delete;

    /// Request the next older page for @p session.
    /// @return true if a page query was issued; false when a page is already
    ///         in flight, the list is empty, or the session has no query.
    bool LoadMore(const FeedSession& session, const SinkFactory& make_sink);

    /// Mark the page of @p generation finished (complete or failed).
    void OnPageFinished(uint64_t generation);

    /// Cancel any in-flight page and clear the guard.
    void Reset();

    /// @return true while a page for @p generation is in flight.
    bool IsLoadingMore(uint64_t generation) const {
        return in_flight_.has_value() && *in_flight_ == generation;
    }

    /// Watermark for the next page, or nullopt for an empty list.
    static std::optional<Timestamp> Cursor(const FeedSession& session);

    /// @p base bounded to items at or before @p cursor, closed after stored results.
    static FeedQuery PageQuery(const FeedQuery& base, Timestamp cursor);

private:
    IContentStream& stream_;
    std::optional<uint64_t> in_flight_;
    std::shared_ptr<ContentSink> sink_;
    std::unique_ptr<IStreamHandle> page_;
};

}  // namespace feedpipe
