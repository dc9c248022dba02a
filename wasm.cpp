#include "wasm.hpp"
#include <array>

namespace weft {

namespace {

consteval std::array<const char *, 256> make_instruction_names() {
    std::array<const char *, 256> names{};
#define V(name, text, byte, ...) names[byte] = text;
    FOREACH_OPCODE(V)
#undef V
    return names;
}

constexpr auto instruction_names = make_instruction_names();

} // namespace

const char *valtype_name(valtype type) {
    switch (type) {
    case valtype::null:
        return "null";
    case valtype::any:
        return "any";
    case valtype::empty:
        return "empty";
    case valtype::i32:
        return "i32";
    case valtype::i64:
        return "i64";
    case valtype::f32:
        return "f32";
    case valtype::f64:
        return "f64";
    case valtype::funcref:
        return "funcref";
    case valtype::externref:
        return "externref";
    }
    return "invalid";
}

std::optional<valtype> valtype_from_name(std::string_view name) {
    for (auto type : {valtype::i32, valtype::i64, valtype::f32, valtype::f64,
                      valtype::funcref, valtype::externref}) {
        if (name == valtype_name(type))
            return type;
    }
    return std::nullopt;
}

std::string to_string(const valtype_vector &types) {
    std::string out = "[";
    for (size_t i = 0; i < types.size(); ++i) {
        if (i)
            out += ' ';
        out += valtype_name(types[i]);
    }
    return out + "]";
}

const char *instruction_name(uint8_t byte) {
    auto name = instruction_names[byte];
    return name ? name : "<invalid>";
}

} // namespace weft
