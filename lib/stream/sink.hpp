// SPDX-License-Identifier: MIT

// lib/stream/sink.hpp
#pragma once

#include <atomic>
#include <concepts>
#include <functional>
#include <utility>

#include "lib/stream/error.hpp"

namespace feedpipe {

/// Concept for the minimal sink lifecycle: error, completion, and invalidation.
template<typename S>
concept BasicSink = requires(S& s, const Error& e) {
    { s.OnError(e) } -> std::same_as<void>;
    { s.OnComplete() } -> std::same_as<void>;
    { s.Invalidate() } -> std::same_as<void>;
};

/// Concept for a streaming sink that receives batches of type @p Batch.
template<typename S, typename Batch>
concept StreamingSink = BasicSink<S> && requires(S& s, Batch&& batch) {
    { s.OnData(std::move(batch)) } -> std::same_as<void>;
};

/// Streaming sink that dispatches batches through user-provided callbacks.
///
/// This is the producer-facing end of a stream session: a content source
/// holds a sink and pushes into it; the consumer that created the sink
/// calls Invalidate() when the session is superseded. After that every
/// OnData / OnError / OnComplete is dropped, and IsValid() lets the
/// producer stop early.
template<typename Batch>
class StreamSink {
public:
    /// @param on_data      Invoked for each incoming batch.
    /// @param on_error     Invoked when the stream fails (terminal).
    /// @param on_complete  Invoked at end of initial sync, or end of a bounded query.
    StreamSink(
        std::function<void(Batch&&)> on_data,
        std::function<void(const Error&)> on_error,
        std::function<void()> on_complete
    ) : on_data_(std::move(on_data)),
        on_error_(std::move(on_error)),
        on_complete_(std::move(on_complete)) {}

    /// Deliver a batch to the downstream consumer.
    void OnData(Batch&& batch) {
        if (valid_.load(std::memory_order_acquire) && on_data_) on_data_(std::move(batch));
    }

    /// Report a terminal error to the downstream consumer.
    void OnError(const Error& e) {
        if (valid_.load(std::memory_order_acquire) && on_error_) on_error_(e);
    }

    /// Signal end of initial sync (open stream) or end of results (bounded stream).
    void OnComplete() {
        if (valid_.load(std::memory_order_acquire) && on_complete_) on_complete_();
    }

    /// Atomically disable all future callback dispatches.
    void Invalidate() { valid_.store(false, std::memory_order_release); }

    /// @return false once the consumer has invalidated the sink.
    bool IsValid() const { return valid_.load(std::memory_order_acquire); }

private:
    std::function<void(Batch&&)> on_data_;
    std::function<void(const Error&)> on_error_;
    std::function<void()> on_complete_;
    std::atomic<bool> valid_{true};
};

}  // namespace feedpipe
