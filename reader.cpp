#include "reader.hpp"

namespace weft {

safe_byte_iterator::safe_byte_iterator(const uint8_t *ptr, size_t length)
    : start(ptr), iter(ptr), end(ptr + length) {}

uint8_t safe_byte_iterator::operator*() const {
    if (iter >= end) {
        error<malformed_error>("unexpected end");
    }
    return *iter;
}

safe_byte_iterator &safe_byte_iterator::operator++() {
    ++iter;
    return *this;
}

safe_byte_iterator &safe_byte_iterator::operator+=(size_t n) {
    iter += n;
    return *this;
}

const uint8_t *safe_byte_iterator::get_with_at_least(size_t n) const {
    if (!has_n_left(n)) {
        error<malformed_error>("length out of bounds");
    }
    return iter;
}

bool safe_byte_iterator::empty() const { return iter == end; }

bool safe_byte_iterator::has_n_left(size_t n) const {
    return static_cast<size_t>(end - iter) >= n;
}

} // namespace weft
