#pragma once

/// @file config.hpp
/// @brief Configuration macros for the scanjson library.
///
/// Controls:
///   - Branch prediction hints
///   - Nesting depth limit for Reader
///   - Capacity of the Reader's fixed key/value buffers

// =====================================================================
// Branch prediction hints
// =====================================================================

#if defined(__GNUC__) || defined(__clang__)
    #define SCANJSON_LIKELY(x)   __builtin_expect(!!(x), 1)
    #define SCANJSON_UNLIKELY(x) __builtin_expect(!!(x), 0)
    #define SCANJSON_NOINLINE    __attribute__((noinline))
#elif defined(_MSC_VER)
    #define SCANJSON_LIKELY(x)   (x)
    #define SCANJSON_UNLIKELY(x) (x)
    #define SCANJSON_NOINLINE    __declspec(noinline)
#else
    #define SCANJSON_LIKELY(x)   (x)
    #define SCANJSON_UNLIKELY(x) (x)
    #define SCANJSON_NOINLINE
#endif

// =====================================================================
// Recursion depth limit (stack overflow protection)
// =====================================================================
// Reader recurses once per nested container. Embedded hosts have small
// stacks, so the default is well below what a desktop parser would allow.

#if !defined(SCANJSON_MAX_DEPTH)
    #define SCANJSON_MAX_DEPTH 128
#endif

// =====================================================================
// Token capacity
// =====================================================================
// Size of the fixed key and value buffers owned by Reader. A key or scalar
// longer than this fails with errc::token_too_long.

#if !defined(SCANJSON_MAX_TOKEN_LENGTH)
    #define SCANJSON_MAX_TOKEN_LENGTH 1024
#endif
