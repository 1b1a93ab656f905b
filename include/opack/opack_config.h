// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file opack_config.h
/// @brief Centralized compile-time configuration for opack and its dependencies
///
/// Third-party libraries configured here:
///   - immer: persistent map + atom backing the baked type registry
///   - tsl::robin_map: hash index of Object containers
///   - boost: hash combination and type name demangling
///
/// All opack public headers include this file first, so users who only use
/// opack headers don't need to define anything themselves.

#pragma once

// ============================================================
// Configuration Guard
// ============================================================

#if defined(IMMER_CONFIG_HPP_INCLUDED_) && !defined(OPACK_CONFIGURED)
#error "immer headers were included before opack/opack_config.h. " \
       "Please include opack headers before any direct immer includes."
#endif

#define OPACK_CONFIGURED 1

// ============================================================
// Immer Settings
// ============================================================
// IMMER_NO_THREAD_SAFETY must stay undefined: the baked type registry is
// read concurrently from many threads. The registry also names an atomic
// refcount + spinlock memory policy explicitly (see baker.h).

/// @brief Disable tagged node assertions
#ifndef IMMER_TAGGED_NODE
#define IMMER_TAGGED_NODE 0
#endif

/// @brief Disable debug trace output
#ifndef IMMER_DEBUG_TRACES
#define IMMER_DEBUG_TRACES 0
#endif

/// @brief Disable debug print output
#ifndef IMMER_DEBUG_PRINT
#define IMMER_DEBUG_PRINT 0
#endif

/// @brief Disable deep data structure consistency checks
#ifndef IMMER_DEBUG_DEEP_CHECK
#define IMMER_DEBUG_DEEP_CHECK 0
#endif

// ============================================================
// Boost Library Configuration
// ============================================================

/// @brief Disable Boost auto-linking for all libraries (MSVC)
///
/// opack only uses header-only parts of boost (container_hash, core).
#ifndef BOOST_ALL_NO_LIB
#define BOOST_ALL_NO_LIB 1
#endif

// ============================================================
// Verbose Logging
//
// When OPACK_VERBOSE_LOG is non-zero:
//   - baking, failed bakes and aborted VM runs are logged to stderr
//   - missing Object/Array lookups are logged
//
// Default: enabled in debug builds, disabled when NDEBUG is defined.
// ============================================================

#ifndef OPACK_VERBOSE_LOG
#  if defined(NDEBUG)
#    define OPACK_VERBOSE_LOG 0
#  else
#    define OPACK_VERBOSE_LOG 1
#  endif
#endif

// ============================================================
// Virtual Machine Defaults
// ============================================================

/// @brief Default maximum frame-stack depth for a VM run (0 = unlimited)
///
/// Object graphs must be acyclic. A cyclic graph makes a traversal run
/// until memory is exhausted unless a bound is set; with a bound the run
/// fails with DepthExceededError instead.
#ifndef OPACK_DEFAULT_MAX_DEPTH
#define OPACK_DEFAULT_MAX_DEPTH 1024
#endif
