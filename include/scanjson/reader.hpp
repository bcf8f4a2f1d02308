#pragma once

/// @file reader.hpp
/// @brief Decode-pass driver: walks one document with the scanner and
///        extractor primitives and reports what it finds to a handler.
///
/// No tree is built. The handler is any type providing:
///
/// @code
///   void on_object_begin();
///   void on_object_end(size_t count);      // number of key/value pairs
///   void on_array_begin();
///   void on_array_end(size_t length);      // number of elements
///   void on_key(std::string_view key);     // unescaped
///   void on_value(CellType type, std::string_view text);
/// @endcode
///
/// on_value() receives unescaped text for strings and the raw token for
/// everything else; convert it with to_integer() / to_float() / to_bool().
/// Views passed to the handler are only valid during the call.
///
/// The top-level value must be an object or an array. A failed pass stops
/// at the first invalid token; the handler has then seen a prefix of the
/// document and must discard whatever it built.

#include "buffer.hpp"
#include "config.hpp"
#include "conversion.hpp"
#include "error.hpp"
#include "extractor.hpp"
#include "meta_key.hpp"
#include "number.hpp"
#include "read_options.hpp"
#include "scanner.hpp"
#include "types.hpp"

#include <cstddef>
#include <string_view>
#include <system_error>

namespace scanjson {

/// @brief One decode pass over one buffer.
///
/// Owns the cursor and two fixed token buffers. Not thread-safe; use one
/// Reader per concurrent pass.
class Reader {
public:
    using token_buffer = FixedBuffer<SCANJSON_MAX_TOKEN_LENGTH>;

    explicit Reader(std::string_view buf, const ReadOptions& opts = {}) noexcept
        : buf_(buf)
        , opts_(opts)
        , max_depth_(opts.max_depth > 0 ? opts.max_depth : SCANJSON_MAX_DEPTH) {}

    /// @brief Run the pass from offset 0.
    /// @return false on the first invalid token; see error().
    template <typename Handler>
    [[nodiscard]] bool read(Handler& handler) {
        pos_ = 0;
        depth_ = 0;
        ec_.clear();
        error_offset_ = 0;

        if (SCANJSON_UNLIKELY(!skip_whitespace(buf_, pos_))) {
            return fail(errc::unterminated_token, pos_);
        }

        bool ok = false;
        switch (peek_token(buf_, pos_)) {
            case TokenKind::ObjectStart: ok = read_object(handler); break;
            case TokenKind::ArrayStart:  ok = read_array(handler);  break;
            default:
                return fail(errc::unexpected_character, pos_);
        }
        if (!ok) return false;

        if (skip_whitespace(buf_, pos_)) {
            return fail(errc::trailing_content, pos_);
        }
        return true;
    }

    /// Cursor position: end of the document after a successful pass.
    [[nodiscard]] size_t position() const noexcept { return pos_; }

    [[nodiscard]] const std::error_code& error() const noexcept { return ec_; }

    /// Offset of the offending token or byte after a failed pass.
    [[nodiscard]] size_t error_offset() const noexcept { return error_offset_; }

    [[nodiscard]] SourceLocation error_location() const noexcept {
        return locate(buf_, error_offset_);
    }

private:
    std::string_view buf_;
    size_t pos_ = 0;
    ReadOptions opts_;
    size_t depth_ = 0;
    size_t max_depth_;
    std::error_code ec_;
    size_t error_offset_ = 0;
    token_buffer key_;
    token_buffer value_;

    // ─── Error reporting ──────────────────────────────────────────────────

    SCANJSON_NOINLINE bool fail(std::error_code ec, size_t offset) noexcept {
        ec_ = ec;
        error_offset_ = offset;
        return false;
    }

    bool fail(errc code, size_t offset) noexcept {
        return fail(make_error_code(code), offset);
    }

    // ─── Depth tracking ──────────────────────────────────────────────────

    bool push_depth() noexcept {
        if (SCANJSON_UNLIKELY(++depth_ > max_depth_)) {
            return fail(errc::max_depth_exceeded, pos_);
        }
        return true;
    }

    void pop_depth() noexcept { --depth_; }

    /// Step over the byte at the cursor and the whitespace after it.
    bool advance_and_skip() noexcept {
        ++pos_;
        if (SCANJSON_UNLIKELY(!skip_whitespace(buf_, pos_))) {
            return fail(errc::unterminated_token, pos_);
        }
        return true;
    }

    // ─── Values ──────────────────────────────────────────────────────────

    /// Cursor on the first byte of a value. On success the cursor is on the
    /// boundary that follows it.
    template <typename Handler>
    bool read_value(Handler& handler, bool in_array) {
        std::error_code ec;
        const size_t start = pos_;

        switch (peek_token(buf_, pos_)) {
            case TokenKind::String:
                if (!extract_string(buf_, pos_, value_, in_array, ec)) {
                    return fail(ec, pos_);
                }
                handler.on_value(CellType::String, value_.view());
                return true;

            case TokenKind::ObjectStart:
                if (!read_object(handler)) return false;
                break;

            case TokenKind::ArrayStart:
                if (!read_array(handler)) return false;
                break;

            case TokenKind::Scalar: {
                if (!extract_token(buf_, pos_, value_, in_array, ec)) {
                    return fail(ec, pos_);
                }
                const TokenKind kind = classify_scalar(value_.view());
                if (SCANJSON_UNLIKELY(kind == TokenKind::Invalid)) {
                    return fail(looks_numeric(value_.view())
                                    ? errc::invalid_numeric_grammar
                                    : errc::invalid_literal,
                                start);
                }
                handler.on_value(cell_type_of(kind), value_.view());
                return true;
            }

            case TokenKind::End:
                return fail(errc::unterminated_token, pos_);

            default:
                return fail(errc::unexpected_character, pos_);
        }

        // Nested container: the cursor is just past its closing byte and
        // the same boundary rule as for scalars applies.
        if (!detail::finish_at_boundary(buf_, pos_, in_array, ec)) {
            return fail(ec, pos_);
        }
        return true;
    }

    // ─── Objects ─────────────────────────────────────────────────────────

    template <typename Handler>
    bool read_object(Handler& handler) {
        if (!push_depth()) return false;
        handler.on_object_begin();
        if (!advance_and_skip()) return false;

        size_t count = 0;
        if (is_object_end(buf_, pos_)) {
            ++pos_;
            pop_depth();
            handler.on_object_end(count);
            return true;
        }

        std::error_code ec;
        for (;;) {
            const size_t key_pos = pos_;
            if (SCANJSON_UNLIKELY(!is_string_start(buf_, pos_))) {
                return fail(errc::unexpected_character, pos_);
            }
            if (!extract_string(buf_, pos_, key_, false, ec)) {
                return fail(ec, pos_);
            }
            if (SCANJSON_UNLIKELY(buf_[pos_] != ':')) {
                return fail(errc::malformed_boundary, pos_);
            }
            if (!opts_.allow_reserved_keys && is_meta_key(key_.view())) {
                return fail(errc::reserved_key, key_pos);
            }
            handler.on_key(key_.view());

            if (!advance_and_skip()) return false;
            if (!read_value(handler, false)) return false;
            ++count;

            switch (buf_[pos_]) {
                case ',':
                    if (!advance_and_skip()) return false;
                    continue;
                case '}':
                    ++pos_;
                    pop_depth();
                    handler.on_object_end(count);
                    return true;
                default:
                    return fail(errc::malformed_boundary, pos_);
            }
        }
    }

    // ─── Arrays ──────────────────────────────────────────────────────────

    template <typename Handler>
    bool read_array(Handler& handler) {
        if (!push_depth()) return false;
        handler.on_array_begin();
        if (!advance_and_skip()) return false;

        size_t length = 0;
        if (is_array_end(buf_, pos_)) {
            ++pos_;
            pop_depth();
            handler.on_array_end(length);
            return true;
        }

        for (;;) {
            if (!read_value(handler, true)) return false;
            ++length;

            switch (buf_[pos_]) {
                case ',':
                    if (!advance_and_skip()) return false;
                    continue;
                case ']':
                    ++pos_;
                    pop_depth();
                    handler.on_array_end(length);
                    return true;
                default:
                    return fail(errc::malformed_boundary, pos_);
            }
        }
    }
};

// ─── Handlers ───────────────────────────────────────────────────────────────

/// @brief Handler that ignores every event; used by validate().
struct NullHandler {
    void on_object_begin() noexcept {}
    void on_object_end(size_t) noexcept {}
    void on_array_begin() noexcept {}
    void on_array_end(size_t) noexcept {}
    void on_key(std::string_view) noexcept {}
    void on_value(CellType, std::string_view) noexcept {}
};

// ─── Public API ─────────────────────────────────────────────────────────────

/// @brief Decode @p buf into @p handler (with exceptions).
/// @throws DecodeError carrying the error code and location.
template <typename Handler>
void read(std::string_view buf, Handler& handler, const ReadOptions& opts = {}) {
    Reader reader(buf, opts);
    if (!reader.read(handler)) {
        throw DecodeError(reader.error(), reader.error_location());
    }
}

/// @brief Decode @p buf into @p handler (no exceptions of its own).
/// @return bytes consumed on success; the failure offset and error_code
///         otherwise.
template <typename Handler>
[[nodiscard]] result<size_t> try_read(std::string_view buf, Handler& handler,
                                      const ReadOptions& opts = {}) {
    Reader reader(buf, opts);
    if (!reader.read(handler)) {
        return {reader.error_offset(), reader.error()};
    }
    return {reader.position(), {}};
}

/// @brief Check that @p buf is a document Reader accepts.
[[nodiscard]] inline std::error_code validate(std::string_view buf,
                                              const ReadOptions& opts = {}) noexcept {
    NullHandler handler;
    Reader reader(buf, opts);
    if (!reader.read(handler)) return reader.error();
    return {};
}

} // namespace scanjson
