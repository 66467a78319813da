// SPDX-License-Identifier: MIT

// lib/stream/log.hpp
#pragma once

#include <spdlog/spdlog.h>

#ifdef FEEDPIPE_LOGGING_ENABLED
#ifndef FEEDPIPE_SOURCE_DIR
#error "FEEDPIPE_SOURCE_DIR must be defined when FEEDPIPE_LOGGING_ENABLED is set."
#endif

namespace feedpipe::detail {

/// Strip the source tree prefix so log lines carry repo-relative paths.
constexpr const char* strip_source_dir(const char* path) {
    const char* prefix = FEEDPIPE_SOURCE_DIR;

    const char* path_ptr = path;
    const char* prefix_ptr = prefix;

    while (*prefix_ptr != '\0' && *path_ptr == *prefix_ptr) {
        ++path_ptr;
        ++prefix_ptr;
    }

    return (*prefix_ptr == '\0') ? path_ptr : path;
}

}  // namespace feedpipe::detail

#define FEEDPIPE_LOG_IMPL(level, msg, ...)                                              \
    do {                                                                                \
        spdlog::level("[{}:{}] " msg, ::feedpipe::detail::strip_source_dir(__FILE__),   \
                      __LINE__, ##__VA_ARGS__);                                         \
    } while (0)
#else
#define FEEDPIPE_LOG_IMPL(level, msg, ...) ((void)0)
#endif

#define FEEDPIPE_LOG_ERROR(msg, ...) FEEDPIPE_LOG_IMPL(error, msg, ##__VA_ARGS__)
#define FEEDPIPE_LOG_WARN(msg, ...) FEEDPIPE_LOG_IMPL(warn, msg, ##__VA_ARGS__)
#define FEEDPIPE_LOG_INFO(msg, ...) FEEDPIPE_LOG_IMPL(info, msg, ##__VA_ARGS__)
#define FEEDPIPE_LOG_DEBUG(msg, ...) FEEDPIPE_LOG_IMPL(debug, msg, ##__VA_ARGS__)
