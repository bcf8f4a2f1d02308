#pragma once

/// @file buffer.hpp
/// @brief Fixed-capacity output buffers for extracted tokens.
///
/// The host environment only offers fixed-size, NUL-terminated character
/// arrays. TokenBuffer is a non-owning view over such an array; FixedBuffer
/// carries its storage inline. Neither ever allocates, and a write that does
/// not fit fails instead of truncating silently.

#include <cstddef>
#include <cstring>
#include <string_view>

namespace scanjson {

/// @brief Non-owning, fixed-capacity, NUL-terminated character buffer.
///
/// The storage passed in must hold capacity + 1 bytes (content plus the
/// terminator). The buffer always keeps data()[size()] == '\0'.
class TokenBuffer {
public:
    /// @param storage   Caller-owned array of at least capacity + 1 bytes.
    /// @param capacity  Maximum number of content bytes.
    TokenBuffer(char* storage, size_t capacity) noexcept
        : data_(storage), capacity_(capacity) {
        data_[0] = '\0';
    }

    /// Wrap a char array; one byte is kept for the terminator.
    template <size_t N>
    explicit TokenBuffer(char (&storage)[N]) noexcept
        : TokenBuffer(storage, N - 1) {}

    // A copy would be a second view with its own size over the same bytes.
    TokenBuffer(const TokenBuffer&) = delete;
    TokenBuffer& operator=(const TokenBuffer&) = delete;

    // ─── Access ───────────────────────────────────────────────────────

    [[nodiscard]] const char* data() const noexcept { return data_; }
    [[nodiscard]] char* data() noexcept { return data_; }
    [[nodiscard]] const char* c_str() const noexcept { return data_; }
    [[nodiscard]] size_t size() const noexcept { return size_; }
    [[nodiscard]] size_t capacity() const noexcept { return capacity_; }
    [[nodiscard]] bool empty() const noexcept { return size_ == 0; }

    [[nodiscard]] std::string_view view() const noexcept {
        return {data_, size_};
    }

    char operator[](size_t i) const noexcept { return data_[i]; }

    // ─── Modification ────────────────────────────────────────────────

    void clear() noexcept {
        size_ = 0;
        data_[0] = '\0';
    }

    /// @brief Replace the content with @p s.
    /// @return false (buffer cleared) if @p s exceeds capacity.
    bool assign(std::string_view s) noexcept {
        if (s.size() > capacity_) {
            clear();
            return false;
        }
        // memmove: s may alias our own storage (in-place rewrites)
        if (!s.empty()) std::memmove(data_, s.data(), s.size());
        size_ = s.size();
        data_[size_] = '\0';
        return true;
    }

    /// @return false (content unchanged) if the buffer is full.
    bool push_back(char c) noexcept {
        if (size_ >= capacity_) return false;
        data_[size_++] = c;
        data_[size_] = '\0';
        return true;
    }

    /// @return false (content unchanged) if @p s does not fit.
    bool append(std::string_view s) noexcept {
        if (s.size() > capacity_ - size_) return false;
        if (!s.empty()) std::memcpy(data_ + size_, s.data(), s.size());
        size_ += s.size();
        data_[size_] = '\0';
        return true;
    }

    /// @brief Shrink to @p n bytes. Growing is not allowed.
    void truncate(size_t n) noexcept {
        if (n < size_) {
            size_ = n;
            data_[size_] = '\0';
        }
    }

private:
    char* data_;
    size_t capacity_;
    size_t size_ = 0;
};

inline bool operator==(const TokenBuffer& a, std::string_view b) noexcept {
    return a.view() == b;
}

inline bool operator!=(const TokenBuffer& a, std::string_view b) noexcept {
    return !(a == b);
}

namespace detail {

template <size_t N>
struct FixedStorage {
    char bytes_[N + 1];
};

} // namespace detail

/// @brief TokenBuffer that owns N + 1 bytes of inline storage.
///
/// @code
///   scanjson::FixedBuffer<64> key;
///   size_t pos = 0;
///   if (scanjson::extract_string(doc, pos, key, false)) use(key.view());
/// @endcode
template <size_t N>
class FixedBuffer : private detail::FixedStorage<N>, public TokenBuffer {
    using Storage = detail::FixedStorage<N>;

public:
    static constexpr size_t kCapacity = N;

    FixedBuffer() noexcept : Storage(), TokenBuffer(Storage::bytes_, N) {}

    /// Starts empty when @p s is longer than N; check empty() if that matters.
    explicit FixedBuffer(std::string_view s) noexcept : FixedBuffer() {
        assign(s);
    }

    FixedBuffer(const FixedBuffer& other) noexcept : FixedBuffer() {
        assign(other.view());
    }

    FixedBuffer& operator=(const FixedBuffer& other) noexcept {
        if (this != &other) assign(other.view());
        return *this;
    }
};

} // namespace scanjson
