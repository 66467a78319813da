// SPDX-License-Identifier: MIT

// src/membership_oracle.hpp
#pragma once

#include <unordered_set>

#include "src/content_item.hpp"

namespace feedpipe {

using AuthorSet = std::unordered_set<AuthorId>;

/// Read-only view of the viewer's social graph and moderation state.
///
/// Queried synchronously from the feed's event loop thread. Follow list and
/// web-of-trust data load asynchronously; the Is*Available() methods report
/// whether they have arrived.
class IMembershipOracle {
public:
    virtual ~IMembershipOracle() = default;

    virtual bool IsMuted(const AuthorId& author) const = 0;

    virtual bool IsInWebOfTrust(const AuthorId& author) const = 0;
    virtual bool IsWebOfTrustAvailable() const = 0;

    virtual bool IsFollowListAvailable() const = 0;
    virtual AuthorSet FollowList() const = 0;

    /// The viewer's own author id, empty when signed out.
    virtual AuthorId Viewer() const = 0;
};

}  // namespace feedpipe
