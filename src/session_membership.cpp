// SPDX-License-Identifier: MIT

#include "src/session_membership.hpp"

namespace feedpipe {

void SessionMembership::Reset() {
    viewer_.clear();
    follows_.reset();
    trusted_.reset();
}

bool SessionMembership::IsMuted(const AuthorId& author) const {
    return mutes_.IsMuted(author);
}

bool SessionMembership::IsInWebOfTrust(const AuthorId& author) const {
    return trusted_.has_value() && trusted_->contains(author);
}

AuthorSet SessionMembership::FollowList() const {
    return follows_.value_or(AuthorSet{});
}

}  // namespace feedpipe
