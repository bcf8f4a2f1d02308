#pragma once

/// @file read_options.hpp
/// @brief Options for a Reader decode pass.

#include <cstddef>

namespace scanjson {

/// @brief Reader configuration.
struct ReadOptions {
    /// Maximum nesting depth (0 = use SCANJSON_MAX_DEPTH from config.hpp)
    size_t max_depth = 0;

    /// Accept user keys that look like container meta keys
    /// ("x:type", "x:length", "x:hidden", "__array_index").
    bool allow_reserved_keys = false;

    // ─── Factory methods ─────────────────────────────────────────────────

    /// Default: reserved keys rejected, default depth limit.
    static constexpr ReadOptions strict() noexcept {
        return {};
    }

    /// Reserved keys passed through to the handler.
    static constexpr ReadOptions permissive() noexcept {
        ReadOptions opts;
        opts.allow_reserved_keys = true;
        return opts;
    }
};

} // namespace scanjson
