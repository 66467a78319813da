// SPDX-License-Identifier: MIT

#include "src/feed_mode.hpp"

#include <algorithm>
#include <cctype>

#include <fmt/format.h>

namespace feedpipe {

namespace {

template<class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};

// "wss://relay.example.com/" -> "relay.example.com"
std::string_view RelayHost(std::string_view url) {
    auto scheme = url.find("://");
    if (scheme != std::string_view::npos) {
        url.remove_prefix(scheme + 3);
    }
    while (!url.empty() && url.back() == '/') {
        url.remove_suffix(1);
    }
    return url;
}

}  // namespace

std::string_view ModeKindName(ModeKind kind) {
    switch (kind) {
        case ModeKind::Following:   return "following";
        case ModeKind::SingleRelay: return "single-relay";
        case ModeKind::CuratedPack: return "curated-pack";
        case ModeKind::NetworkWide: return "network-wide";
        case ModeKind::Hashtag:     return "hashtag";
    }
    return "unknown";
}

std::string ToString(const FeedMode& m) {
    return std::visit(Overloaded{
        [](const mode::Following&) { return std::string("Following"); },
        [](const mode::SingleRelay& r) { return fmt::format("Relay {}", RelayHost(r.url)); },
        [](const mode::CuratedPack& p) { return p.pack.name; },
        [](const mode::NetworkWide&) { return std::string("Network"); },
        [](const mode::Hashtag& h) { return fmt::format("#{}", NormalizeHashtag(h.tag)); },
    }, m);
}

std::string NormalizeHashtag(std::string_view tag) {
    auto is_space = [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; };

    auto trim = [&is_space](std::string_view s) {
        while (!s.empty() && is_space(s.front())) s.remove_prefix(1);
        while (!s.empty() && is_space(s.back())) s.remove_suffix(1);
        return s;
    };

    tag = trim(tag);
    while (!tag.empty() && tag.front() == '#') tag.remove_prefix(1);
    tag = trim(tag);

    std::string out(tag);
    std::transform(out.begin(), out.end(), out.begin(), [](char c) {
        return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    });
    return out;
}

bool PreservesItemsOnSwitch(const FeedMode& from, const FeedMode& to) {
    return KindOf(from) == ModeKind::Following && KindOf(to) == ModeKind::NetworkWide;
}

}  // namespace feedpipe
