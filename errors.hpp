#pragma once

#include "wasm.hpp"
#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace weft {

enum class ErrorKind : uint8_t {
    malformed_encoding,
    structural,
    type_mismatch,
    predecessor_count,
    unresolved_signature,
};

const char *error_kind_name(ErrorKind kind);

struct ValidationError {
    static constexpr size_t unknown_offset = std::numeric_limits<size_t>::max();

    ErrorKind kind;
    std::string message;
    size_t offset = unknown_offset;
    std::optional<uint32_t> funclet;
    std::optional<valtype_vector> expected;
    std::optional<valtype_vector> actual;

    std::string to_string() const;
};

class validation_error : public std::runtime_error {
  public:
    ValidationError info;

    validation_error(ErrorKind kind, const std::string &message);
    validation_error(ErrorKind kind, const std::string &message,
                     valtype_vector expected, valtype_vector actual);

    validation_error &in_funclet(uint32_t funclet);
};

class malformed_error : public validation_error {
  public:
    explicit malformed_error(const std::string &message)
        : validation_error(ErrorKind::malformed_encoding, message) {}
};

class structural_error : public validation_error {
  public:
    explicit structural_error(const std::string &message)
        : validation_error(ErrorKind::structural, message) {}
};

class type_mismatch_error : public validation_error {
  public:
    explicit type_mismatch_error(const std::string &message)
        : validation_error(ErrorKind::type_mismatch, message) {}
    type_mismatch_error(const std::string &message, valtype_vector expected,
                        valtype_vector actual)
        : validation_error(ErrorKind::type_mismatch, message,
                           std::move(expected), std::move(actual)) {}
};

class predecessor_count_error : public validation_error {
  public:
    explicit predecessor_count_error(const std::string &message)
        : validation_error(ErrorKind::predecessor_count, message) {}
};

class unresolved_signature_error : public validation_error {
  public:
    explicit unresolved_signature_error(const std::string &message)
        : validation_error(ErrorKind::unresolved_signature, message) {}
};

// a broken invariant inside weft itself, never a property of the input
class internal_error : public std::logic_error {
  public:
    using std::logic_error::logic_error;
};

template <typename T, typename... Args>
[[noreturn]] static inline void error(Args &&...args) {
    throw T(std::forward<Args>(args)...);
}

template <typename T>
static inline void ensure(bool condition, const std::string &message) {
    if (!condition) [[unlikely]]
        error<T>(message);
}

} // namespace weft
