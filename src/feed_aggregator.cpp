// SPDX-License-Identifier: MIT

#include "src/feed_aggregator.hpp"

#include <utility>

#include "lib/stream/log.hpp"

namespace feedpipe {

FeedAggregator::FeedAggregator(PrivateTag, IEventLoop& loop, IContentStream& stream,
                               const IMembershipOracle& oracle, FeedConfig config)
    : loop_(loop),
      stream_(stream),
      oracle_(oracle),
      config_(std::move(config)),
      selector_(config_),
      loading_timer_(loop),
      pagination_(stream) {}

FeedAggregator::~FeedAggregator() {
    if (live_sink_) live_sink_->Invalidate();
    session_.ReleaseStream();
}

void FeedAggregator::Start(FeedMode mode, bool preserve_existing) {
    assert(loop_.IsInEventLoopThread());

    Supersede();
    const uint64_t generation = session_.generation;

    session_.mode = std::move(mode);
    session_.ResetItems(preserve_existing);
    session_.received_batch = false;
    session_.failed = false;
    session_.query.reset();

    // A kept list is already something to show
    SetLoading(session_.visible_items.empty());

    QueryPlan plan = selector_.Resolve(session_.mode, oracle_);
    FEEDPIPE_LOG_INFO("feed start: generation {} mode {} ({}) plan {}{}", generation,
                      ModeKindName(KindOf(session_.mode)), ToString(session_.mode),
                      plan_status_name(plan.status), preserve_existing ? " preserving" : "");

    switch (plan.status) {
        case PlanStatus::Deferred:
            // Stays loading until the caller restarts with the follow list loaded
            Publish();
            return;
        case PlanStatus::Empty:
            SetLoading(false);
            Publish();
            return;
        case PlanStatus::Ready:
            break;
    }

    session_.query = std::move(plan.query);
    Publish();

    loading_timer_.OnTimer([this, generation]() { HandleLoadingTimeout(generation); });
    loading_timer_.Start(config_.loading_timeout);

    live_sink_ = MakeSink(generation, Channel::Live);
    FEEDPIPE_LOG_DEBUG("feed open: generation {}: {}", generation, Describe(*session_.query));
    auto handle = stream_.Open(*session_.query, live_sink_);

    // Open() may deliver synchronously, including a failure or a restart
    if (session_.generation != generation || session_.failed) {
        if (handle) handle->Cancel();
        return;
    }
    session_.stream = std::move(handle);
}

void FeedAggregator::Stop() {
    assert(loop_.IsInEventLoopThread());

    Supersede();
    session_.query.reset();
    SetLoading(false);
    FEEDPIPE_LOG_DEBUG("feed stop: generation {} invalidated", session_.generation);
}

void FeedAggregator::SwitchMode(FeedMode mode) {
    assert(loop_.IsInEventLoopThread());

    if (mode == session_.mode) {
        return;
    }
    const bool preserve = PreservesItemsOnSwitch(session_.mode, mode);
    Stop();
    Start(std::move(mode), preserve);
}

bool FeedAggregator::LoadMore() {
    assert(loop_.IsInEventLoopThread());

    return pagination_.LoadMore(session_, [this](uint64_t generation) {
        return MakeSink(generation, Channel::Page);
    });
}

void FeedAggregator::UpdateForMuteList(const AuthorSet& muted) {
    assert(loop_.IsInEventLoopThread());

    std::size_t removed = session_.RemoveAuthors(muted);
    if (removed > 0) {
        FEEDPIPE_LOG_DEBUG("mute update removed {} items", removed);
        Publish();
    }
}

void FeedAggregator::FilterByWebOfTrust() {
    assert(loop_.IsInEventLoopThread());

    std::size_t removed = session_.RemoveUntrusted(oracle_);
    if (removed > 0) {
        FEEDPIPE_LOG_DEBUG("web of trust filter removed {} items", removed);
        Publish();
    }
}

void FeedAggregator::Supersede() {
    // The generation moves first so nothing queued by the old session applies
    session_.generation = ++generation_counter_;
    loading_timer_.Stop();
    if (live_sink_) {
        live_sink_->Invalidate();
        live_sink_.reset();
    }
    session_.ReleaseStream();
    pagination_.Reset();
}

std::shared_ptr<ContentSink> FeedAggregator::MakeSink(uint64_t generation, Channel channel) {
    std::weak_ptr<FeedAggregator> weak = weak_from_this();

    return std::make_shared<ContentSink>(
        [weak, generation, channel](ContentBatch&& batch) {
            if (auto self = weak.lock()) {
                self->Dispatch([generation, channel, batch = std::move(batch)](
                                   FeedAggregator& feed) mutable {
                    feed.HandleBatch(generation, channel, std::move(batch));
                });
            }
        },
        [weak, generation, channel](const Error& error) {
            if (auto self = weak.lock()) {
                self->Dispatch([generation, channel, error](FeedAggregator& feed) {
                    feed.HandleError(generation, channel, error);
                });
            }
        },
        [weak, generation, channel]() {
            if (auto self = weak.lock()) {
                self->Dispatch([generation, channel](FeedAggregator& feed) {
                    feed.HandleComplete(generation, channel);
                });
            }
        });
}

void FeedAggregator::Dispatch(std::function<void(FeedAggregator&)> fn) {
    if (loop_.IsInEventLoopThread()) {
        fn(*this);
        return;
    }
    std::weak_ptr<FeedAggregator> weak = weak_from_this();
    loop_.Defer([weak, fn = std::move(fn)]() {
        if (auto self = weak.lock()) {
            fn(*self);
        }
    });
}

void FeedAggregator::HandleBatch(uint64_t generation, Channel channel, ContentBatch&& batch) {
    if (generation != session_.generation) {
        FEEDPIPE_LOG_DEBUG("dropping stale batch of {} items (generation {}, current {})",
                           batch.size(), generation, session_.generation);
        return;
    }

    if (channel == Channel::Live && !session_.received_batch) {
        session_.received_batch = true;
        loading_timer_.Stop();
    }

    AdmitStats stats = session_.Admit(std::move(batch), oracle_, config_);
    FEEDPIPE_LOG_DEBUG("{} batch: {} delivered, {} new, {} duplicate, {} muted, {} untrusted, total {}",
                       channel == Channel::Live ? "live" : "page", stats.delivered,
                       stats.admitted, stats.duplicates, stats.muted, stats.untrusted,
                       session_.visible_items.size());

    if (channel == Channel::Live) {
        SetLoading(false);
    }
    Publish();
}

void FeedAggregator::HandleError(uint64_t generation, Channel channel, const Error& error) {
    if (generation != session_.generation) {
        return;
    }

    FEEDPIPE_LOG_ERROR("{} stream failed for generation {}: {} ({} {})",
                       channel == Channel::Live ? "live" : "page", generation,
                       error.message, error_category(error.code), error_code_name(error.code));

    if (channel == Channel::Live) {
        session_.failed = true;
        if (live_sink_) live_sink_->Invalidate();
        session_.ReleaseStream();
    } else {
        pagination_.OnPageFinished(generation);
    }

    if (error_handler_) {
        Error tagged = error;
        tagged.generation = generation;
        error_handler_(tagged);
    }
}

void FeedAggregator::HandleComplete(uint64_t generation, Channel channel) {
    if (generation != session_.generation) {
        return;
    }

    if (channel == Channel::Page) {
        FEEDPIPE_LOG_INFO("load more finished for generation {}, total {}", generation,
                          session_.visible_items.size());
        pagination_.OnPageFinished(generation);
        return;
    }

    FEEDPIPE_LOG_DEBUG("initial sync complete for generation {}", generation);
    if (sync_handler_) {
        sync_handler_();
    }
}

void FeedAggregator::HandleLoadingTimeout(uint64_t generation) {
    if (generation != session_.generation || !session_.is_loading) {
        return;
    }
    FEEDPIPE_LOG_INFO("no content within {}ms for generation {}, showing empty feed",
                      config_.loading_timeout.count(), generation);
    SetLoading(false);
}

void FeedAggregator::SetLoading(bool loading) {
    if (session_.is_loading == loading) {
        return;
    }
    session_.is_loading = loading;
    if (loading_handler_) {
        loading_handler_(loading);
    }
}

void FeedAggregator::Publish() {
    if (items_handler_) {
        items_handler_(session_.visible_items);
    }
}

}  // namespace feedpipe
