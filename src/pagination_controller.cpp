// SPDX-License-Identifier: MIT

#include "src/pagination_controller.hpp"

#include <utility>

#include "lib/stream/log.hpp"

namespace feedpipe {

std::optional<Timestamp> PaginationController::Cursor(const FeedSession& session) {
    if (session.visible_items.empty()) {
        return std::nullopt;
    }
    return session.visible_items.back().timestamp - 1;
}

FeedQuery PaginationController::PageQuery(const FeedQuery& base, Timestamp cursor) {
    FeedQuery query = base;
    query.until = cursor;
    query.close_on_eose = true;
    return query;
}

bool PaginationController::LoadMore(const FeedSession& session, const SinkFactory& make_sink) {
    if (IsLoadingMore(session.generation)) {
        FEEDPIPE_LOG_DEBUG("load more: already loading, skipping");
        return false;
    }
    if (!session.query) {
        FEEDPIPE_LOG_DEBUG("load more: no active query for generation {}", session.generation);
        return false;
    }
    auto cursor = Cursor(session);
    if (!cursor) {
        FEEDPIPE_LOG_DEBUG("load more: no items yet, nothing to page from");
        return false;
    }

    // A page left over from an older generation is dropped, not awaited
    Reset();

    const uint64_t generation = session.generation;
    in_flight_ = generation;
    sink_ = make_sink(generation);

    FeedQuery query = PageQuery(*session.query, *cursor);
    FEEDPIPE_LOG_INFO("load more: generation {} until {} ({} items visible): {}",
                      generation, *cursor, session.visible_items.size(), Describe(query));

    auto handle = stream_.Open(query, sink_);
    if (IsLoadingMore(generation)) {
        page_ = std::move(handle);
    } else if (handle) {
        // Page finished synchronously inside Open()
        handle->Cancel();
    }
    return true;
}

void PaginationController::OnPageFinished(uint64_t generation) {
    if (!IsLoadingMore(generation)) {
        return;
    }
    in_flight_.reset();
    if (sink_) {
        sink_->Invalidate();
    }
    if (page_) {
        page_->Cancel();
        page_.reset();
    }
}

void PaginationController::Reset() {
    in_flight_.reset();
    if (sink_) {
        sink_->Invalidate();
        sink_.reset();
    }
    if (page_) {
        page_->Cancel();
        page_.reset();
    }
}

}  // namespace feedpipe
