// SPDX-License-Identifier: MIT

#include "src/mute_list.hpp"

#include <algorithm>
#include <utility>

#include "lib/stream/log.hpp"

namespace feedpipe {

MuteList::MuteList(std::vector<AuthorId> sources) : sources_(std::move(sources)) {}

void MuteList::SetUserMutes(AuthorSet authors) {
    user_ = std::move(authors);
    Recalculate();
}

bool MuteList::Mute(const AuthorId& author) {
    if (!user_.insert(author).second) {
        return false;
    }
    Recalculate();
    return true;
}

bool MuteList::Unmute(const AuthorId& author) {
    if (user_.erase(author) == 0) {
        return false;
    }
    Recalculate();
    return true;
}

bool MuteList::SetSourceMutes(const AuthorId& source, AuthorSet authors) {
    if (!IsSource(source)) {
        FEEDPIPE_LOG_DEBUG("ignoring mute list from non-source author {}", source);
        return false;
    }
    by_source_[source] = std::move(authors);
    Recalculate();
    return true;
}

void MuteList::SetSources(std::vector<AuthorId> sources) {
    sources_ = std::move(sources);
    std::erase_if(by_source_, [this](const auto& entry) { return !IsSource(entry.first); });
    Recalculate();
}

bool MuteList::IsSource(const AuthorId& author) const {
    return std::find(sources_.begin(), sources_.end(), author) != sources_.end();
}

void MuteList::Recalculate() {
    AuthorSet combined = user_;
    for (const auto& [source, authors] : by_source_) {
        combined.insert(authors.begin(), authors.end());
    }
    muted_ = std::move(combined);

    FEEDPIPE_LOG_DEBUG("mute list now {} authors ({} by viewer, {} sources)",
                       muted_.size(), user_.size(), by_source_.size());
    if (on_changed_) {
        on_changed_(muted_);
    }
}

}  // namespace feedpipe
