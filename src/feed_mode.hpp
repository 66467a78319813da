// SPDX-License-Identifier: MIT

// src/feed_mode.hpp
#pragma once

#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "src/content_item.hpp"

namespace feedpipe {

/// A curated author set saved by the viewer (a "follow pack").
struct SavedPack {
    std::string id;
    std::string name;
    std::vector<AuthorId> members;
    AuthorId creator;

    bool operator==(const SavedPack&) const = default;
};

namespace mode {

/// Posts from the viewer's follow list (and the viewer).
struct Following {
    bool operator==(const Following&) const = default;
};

/// Everything one relay serves, and only that relay.
struct SingleRelay {
    std::string url;
    bool operator==(const SingleRelay&) const = default;
};

/// Posts from the members of a saved pack.
struct CuratedPack {
    SavedPack pack;
    bool operator==(const CuratedPack&) const = default;
};

/// Broad discovery feed, filtered by web of trust once it is known.
struct NetworkWide {
    bool operator==(const NetworkWide&) const = default;
};

/// Posts tagged with a hashtag.
struct Hashtag {
    std::string tag;
    bool operator==(const Hashtag&) const = default;
};

}  // namespace mode

/// Feed mode selected by the caller. Alternative order matches ModeKind.
using FeedMode = std::variant<mode::Following, mode::SingleRelay, mode::CuratedPack,
                              mode::NetworkWide, mode::Hashtag>;

enum class ModeKind {
    Following,
    SingleRelay,
    CuratedPack,
    NetworkWide,
    Hashtag,
};

/// Return the kind of a feed mode.
constexpr ModeKind KindOf(const FeedMode& m) {
    return static_cast<ModeKind>(m.index());
}

/// Return the enumerator name of a mode kind (e.g. "network-wide").
std::string_view ModeKindName(ModeKind kind);

/// Display name of a mode: "Following", "Relay relay.example.com", pack name, "#tag".
std::string ToString(const FeedMode& m);

/// Strip a leading '#', trim whitespace and lowercase.
std::string NormalizeHashtag(std::string_view tag);

/// True only for the following -> network-wide transition, where the
/// broader feed is a superset of the narrower one and the visible list is kept.
bool PreservesItemsOnSwitch(const FeedMode& from, const FeedMode& to);

}  // namespace feedpipe
