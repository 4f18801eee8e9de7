// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file json_patch_config.h
/// @brief Centralized compile-time configuration for json_patch and immer.
///
/// It MUST be included before any immer headers to ensure consistent settings.
/// All json_patch public headers already include this file.
///
/// Unlike a single-threaded value store, a patch engine is expected to read
/// the same source document from several threads at once, so immer's atomic
/// reference counting stays enabled.

#pragma once

// ============================================================
// Configuration Guard
// ============================================================

#if defined(IMMER_CONFIG_HPP_INCLUDED_) && !defined(JSON_PATCH_CONFIGURED)
#error "immer headers were included before json_patch/json_patch_config.h. " \
       "Please include json_patch headers before any direct immer includes."
#endif

#define JSON_PATCH_CONFIGURED 1

// ============================================================
// Immer Settings
// ============================================================

/// @brief Keep atomic refcounts: documents are shared across threads
#ifndef IMMER_NO_THREAD_SAFETY
#define IMMER_NO_THREAD_SAFETY 0
#endif

/// @brief Disable tagged node assertions (smaller nodes)
#ifndef IMMER_TAGGED_NODE
#define IMMER_TAGGED_NODE 0
#endif

#ifndef IMMER_DEBUG_TRACES
#define IMMER_DEBUG_TRACES 0
#endif

#ifndef IMMER_DEBUG_PRINT
#define IMMER_DEBUG_PRINT 0
#endif

#ifndef IMMER_DEBUG_DEEP_CHECK
#define IMMER_DEBUG_DEEP_CHECK 0
#endif

// ============================================================
// Verbose Logging Configuration
//
// When JSON_PATCH_VERBOSE_LOG is enabled, failed lookups and failed
// patch steps are reported to stderr together with the call site.
// Results returned to callers are identical either way.
//
// Default: disabled. The engine reports failures only through its
// result values; console diagnostics are opt-in.
//
// To explicitly enable: #define JSON_PATCH_VERBOSE_LOG 1
// ============================================================

#ifndef JSON_PATCH_VERBOSE_LOG
#define JSON_PATCH_VERBOSE_LOG 0
#endif

// ============================================================
// Configuration Summary (compile-time message)
// ============================================================

#ifdef JSON_PATCH_CONFIG_VERBOSE
#if IMMER_NO_THREAD_SAFETY
#pragma message("json_patch: immer thread safety DISABLED (documents must not cross threads)")
#else
#pragma message("json_patch: immer thread safety ENABLED")
#endif

#if JSON_PATCH_VERBOSE_LOG
#pragma message("json_patch: verbose logging ENABLED")
#endif
#endif // JSON_PATCH_CONFIG_VERBOSE
