// SPDX-License-Identifier: MIT

// src/session_membership.hpp
#pragma once

#include <optional>

#include "src/membership_oracle.hpp"
#include "src/mute_list.hpp"

namespace feedpipe {

/// In-process IMembershipOracle backed by a MuteList plus follow list and
/// web-of-trust sets that arrive asynchronously.
///
/// Follow list and trust data are unavailable until first set; Reset()
/// (e.g. on sign-out) makes them unavailable again.
class SessionMembership : public IMembershipOracle {
public:
    /// @param mutes  Mute state consulted by IsMuted(); must outlive this object
    explicit SessionMembership(const MuteList& mutes) : mutes_(mutes) {}

    void SetViewer(AuthorId viewer) { viewer_ = std::move(viewer); }
    void SetFollowList(AuthorSet follows) { follows_ = std::move(follows); }
    void SetWebOfTrust(AuthorSet trusted) { trusted_ = std::move(trusted); }

    /// Forget viewer, follow list and trust data.
    void Reset();

    bool IsMuted(const AuthorId& author) const override;
    bool IsInWebOfTrust(const AuthorId& author) const override;
    bool IsWebOfTrustAvailable() const override { return trusted_.has_value(); }
    bool IsFollowListAvailable() const override { return follows_.has_value(); }
    AuthorSet FollowList() const override;
    AuthorId Viewer() const override { return viewer_; }

private:
    const MuteList& mutes_;
    AuthorId viewer_;
    std::optional<AuthorSet> follows_;
    std::optional<AuthorSet> trusted_;
};

}  // namespace feedpipe
