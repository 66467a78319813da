// SPDX-License-Identifier: MIT

// src/mode_selector.hpp
#pragma once

#include <optional>
#include <string_view>
#include <utility>

#include "src/feed_config.hpp"
#include "src/feed_mode.hpp"
#include "src/feed_query.hpp"
#include "src/membership_oracle.hpp"

namespace feedpipe {

enum class PlanStatus {
    Ready,     ///< Query resolved; open a stream
    Deferred,  ///< Prerequisite (follow list) not loaded; caller restarts later
    Empty,     ///< Nothing to subscribe to (empty author set or tag)
};

constexpr std::string_view plan_status_name(PlanStatus status) {
    switch (status) {
        case PlanStatus::Ready:    return "ready";
        case PlanStatus::Deferred: return "deferred";
        case PlanStatus::Empty:    return "empty";
    }
    return "unknown";
}

/// Outcome of ModeSelector::Resolve(). query is set only when Ready.
struct QueryPlan {
    PlanStatus status = PlanStatus::Empty;
    std::optional<FeedQuery> query;
};

/// Maps a feed mode to the query that feeds it.
///
/// Stateless apart from the configuration; it never watches for
/// prerequisites. A Deferred plan means the caller must call Start() again
/// once the follow list has loaded.
class ModeSelector {
public:
    explicit ModeSelector(FeedConfig config) : config_(std::move(config)) {}

    QueryPlan Resolve(const FeedMode& mode, const IMembershipOracle& oracle) const;

private:
    FeedQuery BaseQuery() const;

    FeedConfig config_;
};

}  // namespace feedpipe
