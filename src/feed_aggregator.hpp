// SPDX-License-Identifier: MIT

// src/feed_aggregator.hpp
#pragma once

#include <cassert>
#include <cstdint>
#include <functional>
#include <memory>
#include <vector>

#include "lib/stream/error.hpp"
#include "lib/stream/event_loop.hpp"
#include "lib/stream/timer.hpp"
#include "src/content_item.hpp"
#include "src/content_stream.hpp"
#include "src/feed_config.hpp"
#include "src/feed_mode.hpp"
#include "src/feed_session.hpp"
#include "src/membership_oracle.hpp"
#include "src/mode_selector.hpp"
#include "src/pagination_controller.hpp"

namespace feedpipe {

/// Turns a live content stream into a deduplicated, filtered, ordered list.
///
/// One FeedAggregator owns one FeedSession at a time. Start() and
/// SwitchMode() supersede the running session by minting a new generation;
/// every stream, page and timer continuation carries the generation it was
/// created under and is dropped once that generation is no longer current.
///
/// Thread safety: all public methods must be called from the event loop
/// thread. Stream callbacks may arrive on any thread; they are deferred
/// onto the loop before touching the session.
///
/// @code
/// auto feed = FeedAggregator::Create(loop, relay_pool, membership, FeedConfig::VideoFeed());
/// feed->OnItems([](const std::vector<ContentItem>& items) { /* render */ });
/// feed->OnLoadingChanged([](bool loading) { /* spinner */ });
/// feed->Start(mode::Following{});
/// @endcode
class FeedAggregator : public std::enable_shared_from_this<FeedAggregator> {
    struct PrivateTag {};

public:
    using ItemsHandler = std::function<void(const std::vector<ContentItem>&)>;
    using LoadingHandler = std::function<void(bool)>;
    using ErrorHandler = std::function<void(const Error&)>;
    using SyncHandler = std::function<void()>;

    /// Create a new aggregator. Factory method required for weak_from_this safety.
    /// @param loop    Event loop that owns all session state
    /// @param stream  Content source; must outlive the aggregator
    /// @param oracle  Mute / trust / follow data; must outlive the aggregator
    /// @param config  Kinds, page size, loading timeout, diversification
    static std::shared_ptr<FeedAggregator> Create(IEventLoop& loop, IContentStream& stream,
                                                  const IMembershipOracle& oracle,
                                                  FeedConfig config = {}) {
        return std::make_shared<FeedAggregator>(PrivateTag{}, loop, stream, oracle,
                                                std::move(config));
    }

    /// @internal
    FeedAggregator(PrivateTag, IEventLoop& loop, IContentStream& stream,
                   const IMembershipOracle& oracle, FeedConfig config);

    ~FeedAggregator();

    FeedAggregator(const FeedAggregator&) = delete;
    FeedAggregator& operator=(const FeedAggregator&) = delete;

    /// Set callback for visible list updates (after every batch and every removal).
    template <typename H>
    void OnItems(H&& h) {
        assert(loop_.IsInEventLoopThread());
        items_handler_ = std::forward<H>(h);
    }

    /// Set callback for loading state transitions.
    template <typename H>
    void OnLoadingChanged(H&& h) {
        assert(loop_.IsInEventLoopThread());
        loading_handler_ = std::forward<H>(h);
    }

    /// Set callback for stream failures. Terminal for Error::generation.
    template <typename H>
    void OnError(H&& h) {
        assert(loop_.IsInEventLoopThread());
        error_handler_ = std::forward<H>(h);
    }

    /// Set callback for end of the live stream's initial sync.
    template <typename H>
    void OnSyncComplete(H&& h) {
        assert(loop_.IsInEventLoopThread());
        sync_handler_ = std::forward<H>(h);
    }

    /// Start a session for @p mode, superseding any running one.
    /// @param preserve_existing  Keep the visible list (same content family)
    void Start(FeedMode mode, bool preserve_existing = false);

    /// Tear down the session. Idempotent.
    void Stop();

    /// Switch to @p mode; no-op if it is the current mode.
    void SwitchMode(FeedMode mode);

    /// Request the next older page. No-op while one is in flight.
    /// @return true if a page query was issued.
    bool LoadMore();

    /// Remove visible items by newly muted authors. Seen ids are kept.
    void UpdateForMuteList(const AuthorSet& muted);

    /// Remove visible items outside the web of trust, if trust data is loaded.
    void FilterByWebOfTrust();

    const std::vector<ContentItem>& VisibleItems() const { return session_.visible_items; }
    bool IsLoading() const { return session_.is_loading; }
    bool IsLoadingMore() const { return pagination_.IsLoadingMore(session_.generation); }
    bool HasFailed() const { return session_.failed; }
    const FeedMode& Mode() const { return session_.mode; }
    uint64_t Generation() const { return session_.generation; }
    const FeedConfig& Config() const { return config_; }

private:
    enum class Channel { Live, Page };

    // Invalidate the current generation and release everything it owns.
    void Supersede();

    std::shared_ptr<ContentSink> MakeSink(uint64_t generation, Channel channel);
    void Dispatch(std::function<void(FeedAggregator&)> fn);

    void HandleBatch(uint64_t generation, Channel channel, ContentBatch&& batch);
    void HandleError(uint64_t generation, Channel channel, const Error& error);
    void HandleComplete(uint64_t generation, Channel channel);
    void HandleLoadingTimeout(uint64_t generation);

    void SetLoading(bool loading);
    void Publish();

    IEventLoop& loop_;
    IContentStream& stream_;
    const IMembershipOracle& oracle_;
    FeedConfig config_;
    ModeSelector selector_;

    FeedSession session_;
    uint64_t generation_counter_ = 0;
    std::shared_ptr<ContentSink> live_sink_;
    Timer loading_timer_;
    PaginationController pagination_;

    ItemsHandler items_handler_;
    LoadingHandler loading_handler_;
    ErrorHandler error_handler_;
    SyncHandler sync_handler_;
};

}  // namespace feedpipe
