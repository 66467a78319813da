// SPDX-License-Identifier: MIT

// src/mute_list.hpp
#pragma once

#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

#include "src/membership_oracle.hpp"

namespace feedpipe {

/// Combined mute state from the viewer's own list and from moderation sources.
///
/// An author is muted if the viewer muted it or any configured source's
/// list contains it. Lists published by authors that are not configured
/// sources are ignored. Not thread-safe; owned by the feed's loop thread.
class MuteList {
public:
    using ChangeHandler = std::function<void(const AuthorSet& muted)>;

    MuteList() = default;
    explicit MuteList(std::vector<AuthorId> sources);

    /// Replace the viewer's own mute list.
    void SetUserMutes(AuthorSet authors);

    /// Add @p author to the viewer's list. @return true if it was not muted by the viewer.
    bool Mute(const AuthorId& author);

    /// Remove @p author from the viewer's list. @return true if it was muted by the viewer.
    bool Unmute(const AuthorId& author);

    /// Replace the list published by @p source. Ignored for unknown sources.
    /// @return true if the list was accepted.
    bool SetSourceMutes(const AuthorId& source, AuthorSet authors);

    /// Replace the configured sources; lists of dropped sources are forgotten.
    void SetSources(std::vector<AuthorId> sources);

    bool IsMuted(const AuthorId& author) const { return muted_.contains(author); }
    bool IsMutedByUser(const AuthorId& author) const { return user_.contains(author); }

    /// @return Union of all lists.
    const AuthorSet& Muted() const { return muted_; }

    /// @return The viewer's own list.
    const AuthorSet& UserMutes() const { return user_; }

    const std::vector<AuthorId>& Sources() const { return sources_; }

    /// Set a handler invoked with the combined set after every change.
    void OnChanged(ChangeHandler handler) { on_changed_ = std::move(handler); }

private:
    bool IsSource(const AuthorId& author) const;
    void Recalculate();

    std::vector<AuthorId> sources_;
    AuthorSet user_;
    std::unordered_map<AuthorId, AuthorSet> by_source_;
    AuthorSet muted_;
    ChangeHandler on_changed_;
};

}  // namespace feedpipe
