#pragma once

#include "errors.hpp"
#include <cstddef>
#include <cstdint>
#include <type_traits>

namespace weft {

// forward cursor over a function body; reading past the end is malformed
class safe_byte_iterator {
    const uint8_t *start;
    const uint8_t *iter;
    const uint8_t *end;

  public:
    safe_byte_iterator(const uint8_t *ptr, size_t length);

    uint8_t operator*() const;
    safe_byte_iterator &operator++();
    safe_byte_iterator &operator+=(size_t n);
    const uint8_t *get_with_at_least(size_t n) const;
    bool empty() const;
    bool has_n_left(size_t n) const;
    size_t remaining() const { return end - iter; }

    // position relative to the start of the body
    size_t offset() const { return iter - start; }
};

template <typename T, size_t bits = sizeof(T) * 8>
T safe_read_leb128(safe_byte_iterator &iter) {
    static_assert(std::is_unsigned_v<T>);
    constexpr size_t max_bytes = (bits + 6) / 7;

    T result = 0;
    for (size_t i = 0; i < max_bytes; ++i) {
        uint8_t byte = *iter;
        ++iter;
        result |= static_cast<T>(byte & 0x7f) << (i * 7);
        if (!(byte & 0x80)) {
            if (i == max_bytes - 1 && ((byte & 0x7f) >> (bits - i * 7)))
                error<malformed_error>("integer too large");
            return result;
        }
    }
    error<malformed_error>("integer representation too long");
}

template <typename T, size_t bits = sizeof(T) * 8>
T safe_read_sleb128(safe_byte_iterator &iter) {
    static_assert(std::is_signed_v<T>);
    using U = std::make_unsigned_t<T>;
    constexpr size_t max_bytes = (bits + 6) / 7;

    U result = 0;
    for (size_t i = 0; i < max_bytes; ++i) {
        uint8_t byte = *iter;
        ++iter;
        result |= static_cast<U>(byte & 0x7f) << (i * 7);
        if (!(byte & 0x80)) {
            if (i == max_bytes - 1) {
                // unused high bits must all be copies of the sign bit
                auto sign_and_unused = (byte & 0x7f) >> (bits - i * 7 - 1);
                if (sign_and_unused != 0 &&
                    sign_and_unused != (0x7f >> (bits - i * 7 - 1)))
                    error<malformed_error>("integer too large");
            }
            auto shift = (i + 1) * 7;
            if (shift < sizeof(U) * 8 && (byte & 0x40))
                result |= ~U(0) << shift;
            return static_cast<T>(result);
        }
    }
    error<malformed_error>("integer representation too long");
}

} // namespace weft
