#pragma once

/// @file meta_key.hpp
/// @brief Reserved key names the container layer stores beside user keys.
///
/// For a user key "k" the container keeps its type tag under "k:type", the
/// length of an array value under "k:length" and the hidden flag under
/// "k:hidden". Arrays track their next element index under
/// kArrayIndexKey. This header only defines the names and recognises them;
/// interpreting the stored values is the container's business.

#include "buffer.hpp"

#include <cstdint>
#include <string_view>

namespace scanjson {

inline constexpr std::string_view kArrayIndexKey = "__array_index";
inline constexpr std::string_view kTypeSuffix    = ":type";
inline constexpr std::string_view kLengthSuffix  = ":length";
inline constexpr std::string_view kHiddenSuffix  = ":hidden";

/// @brief Which reserved name a key is.
enum class MetaKey : uint8_t {
    None       = 0,
    ArrayIndex = 1,
    Type       = 2,
    Length     = 3,
    Hidden     = 4
};

namespace detail {

constexpr bool ends_with(std::string_view s, std::string_view suffix) noexcept {
    return s.size() >= suffix.size() &&
           s.substr(s.size() - suffix.size()) == suffix;
}

} // namespace detail

/// @brief Suffix appended for @p kind; empty for None and ArrayIndex.
constexpr std::string_view meta_suffix(MetaKey kind) noexcept {
    switch (kind) {
        case MetaKey::Type:   return kTypeSuffix;
        case MetaKey::Length: return kLengthSuffix;
        case MetaKey::Hidden: return kHiddenSuffix;
        default:              return {};
    }
}

/// @brief Recognise a reserved key.
constexpr MetaKey meta_key_kind(std::string_view key) noexcept {
    if (key == kArrayIndexKey) return MetaKey::ArrayIndex;
    if (detail::ends_with(key, kTypeSuffix))   return MetaKey::Type;
    if (detail::ends_with(key, kLengthSuffix)) return MetaKey::Length;
    if (detail::ends_with(key, kHiddenSuffix)) return MetaKey::Hidden;
    return MetaKey::None;
}

constexpr bool is_meta_key(std::string_view key) noexcept {
    return meta_key_kind(key) != MetaKey::None;
}

/// @brief The user key a meta key belongs to ("k:type" -> "k").
/// Keys that carry no suffix are returned unchanged.
constexpr std::string_view base_key(std::string_view key) noexcept {
    const std::string_view suffix = meta_suffix(meta_key_kind(key));
    return key.substr(0, key.size() - suffix.size());
}

/// @brief Build the meta key of @p kind for @p key into @p out.
/// @return false if @p kind has no suffix or the result does not fit.
inline bool make_meta_key(std::string_view key, MetaKey kind,
                          TokenBuffer& out) noexcept {
    const std::string_view suffix = meta_suffix(kind);
    if (suffix.empty() || key.size() + suffix.size() > out.capacity()) {
        return false;
    }
    out.assign(key);
    out.append(suffix);
    return true;
}

} // namespace scanjson
