// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file diagnostics.h
/// @brief stderr logging helpers, compiled in when OPACK_VERBOSE_LOG is set.

#pragma once

#include <opack/opack_config.h>

#include <cstddef>
#include <iostream>
#include <source_location>
#include <string_view>

namespace opack::detail {

inline void log_access_error(
    std::string_view func,
    std::string_view message,
    std::source_location loc = std::source_location::current()) noexcept
{
#if OPACK_VERBOSE_LOG
    std::cerr << "[" << func << "] " << message
              << " (called from " << loc.file_name()
              << ":" << loc.line() << ")\n";
#else
    (void)func;
    (void)message;
    (void)loc;
#endif
}

inline void log_index_error(
    std::string_view func,
    std::size_t index,
    std::string_view reason,
    std::source_location loc = std::source_location::current()) noexcept
{
#if OPACK_VERBOSE_LOG
    std::cerr << "[" << func << "] index " << index << " " << reason
              << " (called from " << loc.file_name()
              << ":" << loc.line() << ")\n";
#else
    (void)func;
    (void)index;
    (void)reason;
    (void)loc;
#endif
}

/// Trace line for one-off events (type baked, run aborted)
inline void log_event(std::string_view component, std::string_view message) noexcept
{
#if OPACK_VERBOSE_LOG
    std::cerr << "[opack:" << component << "] " << message << "\n";
#else
    (void)component;
    (void)message;
#endif
}

} // namespace opack::detail
