#pragma once

#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace weft {

enum class valtype : uint8_t {
    // no value, used for statements and stack floors
    null = 0x00,
    // bottom type produced by popping an unreachable stack
    any = 0x01,
    empty = 0x40,
    i32 = 0x7f,
    i64 = 0x7e,
    f32 = 0x7d,
    f64 = 0x7c,
    funcref = 0x70,
    externref = 0x6f,
};

static inline bool is_valtype(uint32_t byte) {
    return byte == static_cast<uint8_t>(valtype::i32) ||
           byte == static_cast<uint8_t>(valtype::i64) ||
           byte == static_cast<uint8_t>(valtype::f32) ||
           byte == static_cast<uint8_t>(valtype::f64) ||
           byte == static_cast<uint8_t>(valtype::funcref) ||
           byte == static_cast<uint8_t>(valtype::externref);
}

static inline bool is_numtype(valtype type) {
    return type == valtype::i32 || type == valtype::i64 ||
           type == valtype::f32 || type == valtype::f64;
}

const char *valtype_name(valtype type);
std::optional<valtype> valtype_from_name(std::string_view name);

using valtype_vector = std::vector<valtype>;

std::string to_string(const valtype_vector &types);

struct Signature {
    valtype_vector params;
    valtype_vector results;

    bool operator==(const Signature &other) const = default;
};

// handles into the SSA engine's value and block arenas
using ValueId = uint32_t;
using BlockId = uint32_t;
inline constexpr ValueId no_value = std::numeric_limits<ValueId>::max();
inline constexpr BlockId no_block = std::numeric_limits<BlockId>::max();

// V(name, text, byte)
#define FOREACH_INSTRUCTION(V)                                                 \
    V(unreachable, "unreachable", 0x00)                                        \
    V(nop, "nop", 0x01)                                                        \
    V(block, "block", 0x02)                                                    \
    V(loop, "loop", 0x03)                                                      \
    V(if_, "if", 0x04)                                                         \
    V(else_, "else", 0x05)                                                     \
    V(end, "end", 0x0b)                                                        \
    V(br, "br", 0x0c)                                                          \
    V(br_if, "br_if", 0x0d)                                                    \
    V(br_table, "br_table", 0x0e)                                              \
    V(return_, "return", 0x0f)                                                 \
    V(call, "call", 0x10)                                                      \
    V(funclet_region, "funclet_region", 0x16)                                  \
    V(funclet_sig, "funclet_sig", 0x17)                                        \
    V(funclet_call, "funclet_call", 0x18)                                      \
    V(funclet_call_if, "funclet_call_if", 0x19)                                \
    V(drop, "drop", 0x1a)                                                      \
    V(select, "select", 0x1b)                                                  \
    V(select_t, "select", 0x1c)                                                \
    V(funclet_call_table, "funclet_call_table", 0x1d)                          \
    V(localget, "local.get", 0x20)                                             \
    V(localset, "local.set", 0x21)                                             \
    V(localtee, "local.tee", 0x22)                                             \
    V(globalget, "global.get", 0x23)                                           \
    V(globalset, "global.set", 0x24)                                           \
    V(memorysize, "memory.size", 0x3f)                                         \
    V(memorygrow, "memory.grow", 0x40)                                         \
    V(i32const, "i32.const", 0x41)                                             \
    V(i64const, "i64.const", 0x42)                                             \
    V(f32const, "f32.const", 0x43)                                             \
    V(f64const, "f64.const", 0x44)

// V(name, text, byte, natural alignment in bytes, loaded type)
#define FOREACH_LOAD(V)                                                        \
    V(i32load, "i32.load", 0x28, 4, i32)                                       \
    V(i64load, "i64.load", 0x29, 8, i64)                                       \
    V(f32load, "f32.load", 0x2a, 4, f32)                                       \
    V(f64load, "f64.load", 0x2b, 8, f64)                                       \
    V(i32load8_s, "i32.load8_s", 0x2c, 1, i32)                                 \
    V(i32load8_u, "i32.load8_u", 0x2d, 1, i32)                                 \
    V(i32load16_s, "i32.load16_s", 0x2e, 2, i32)                               \
    V(i32load16_u, "i32.load16_u", 0x2f, 2, i32)                               \
    V(i64load8_s, "i64.load8_s", 0x30, 1, i64)                                 \
    V(i64load8_u, "i64.load8_u", 0x31, 1, i64)                                 \
    V(i64load16_s, "i64.load16_s", 0x32, 2, i64)                               \
    V(i64load16_u, "i64.load16_u", 0x33, 2, i64)                               \
    V(i64load32_s, "i64.load32_s", 0x34, 4, i64)                               \
    V(i64load32_u, "i64.load32_u", 0x35, 4, i64)

// V(name, text, byte, natural alignment in bytes, stored type)
#define FOREACH_STORE(V)                                                       \
    V(i32store, "i32.store", 0x36, 4, i32)                                     \
    V(i64store, "i64.store", 0x37, 8, i64)                                     \
    V(f32store, "f32.store", 0x38, 4, f32)                                     \
    V(f64store, "f64.store", 0x39, 8, f64)                                     \
    V(i32store8, "i32.store8", 0x3a, 1, i32)                                   \
    V(i32store16, "i32.store16", 0x3b, 2, i32)                                 \
    V(i64store8, "i64.store8", 0x3c, 1, i64)                                   \
    V(i64store16, "i64.store16", 0x3d, 2, i64)                                 \
    V(i64store32, "i64.store32", 0x3e, 4, i64)

// V(name, text, byte, operand type, result type)
#define FOREACH_UNARY(V)                                                       \
    V(i32eqz, "i32.eqz", 0x45, i32, i32)                                       \
    V(i64eqz, "i64.eqz", 0x50, i64, i32)                                       \
    V(i32clz, "i32.clz", 0x67, i32, i32)                                       \
    V(i32ctz, "i32.ctz", 0x68, i32, i32)                                       \
    V(i32popcnt, "i32.popcnt", 0x69, i32, i32)                                 \
    V(i64clz, "i64.clz", 0x79, i64, i64)                                       \
    V(i64ctz, "i64.ctz", 0x7a, i64, i64)                                       \
    V(i64popcnt, "i64.popcnt", 0x7b, i64, i64)                                 \
    V(f32abs, "f32.abs", 0x8b, f32, f32)                                       \
    V(f32neg, "f32.neg", 0x8c, f32, f32)                                       \
    V(f32ceil, "f32.ceil", 0x8d, f32, f32)                                     \
    V(f32floor, "f32.floor", 0x8e, f32, f32)                                   \
    V(f32trunc, "f32.trunc", 0x8f, f32, f32)                                   \
    V(f32nearest, "f32.nearest", 0x90, f32, f32)                               \
    V(f32sqrt, "f32.sqrt", 0x91, f32, f32)                                     \
    V(f64abs, "f64.abs", 0x99, f64, f64)                                       \
    V(f64neg, "f64.neg", 0x9a, f64, f64)                                       \
    V(f64ceil, "f64.ceil", 0x9b, f64, f64)                                     \
    V(f64floor, "f64.floor", 0x9c, f64, f64)                                   \
    V(f64trunc, "f64.trunc", 0x9d, f64, f64)                                   \
    V(f64nearest, "f64.nearest", 0x9e, f64, f64)                               \
    V(f64sqrt, "f64.sqrt", 0x9f, f64, f64)                                     \
    V(i32wrap_i64, "i32.wrap_i64", 0xa7, i64, i32)                             \
    V(i32trunc_f32_s, "i32.trunc_f32_s", 0xa8, f32, i32)                       \
    V(i32trunc_f32_u, "i32.trunc_f32_u", 0xa9, f32, i32)                       \
    V(i32trunc_f64_s, "i32.trunc_f64_s", 0xaa, f64, i32)                       \
    V(i32trunc_f64_u, "i32.trunc_f64_u", 0xab, f64, i32)                       \
    V(i64extend_i32_s, "i64.extend_i32_s", 0xac, i32, i64)                     \
    V(i64extend_i32_u, "i64.extend_i32_u", 0xad, i32, i64)                     \
    V(i64trunc_f32_s, "i64.trunc_f32_s", 0xae, f32, i64)                       \
    V(i64trunc_f32_u, "i64.trunc_f32_u", 0xaf, f32, i64)                       \
    V(i64trunc_f64_s, "i64.trunc_f64_s", 0xb0, f64, i64)                       \
    V(i64trunc_f64_u, "i64.trunc_f64_u", 0xb1, f64, i64)                       \
    V(f32convert_i32_s, "f32.convert_i32_s", 0xb2, i32, f32)                   \
    V(f32convert_i32_u, "f32.convert_i32_u", 0xb3, i32, f32)                   \
    V(f32convert_i64_s, "f32.convert_i64_s", 0xb4, i64, f32)                   \
    V(f32convert_i64_u, "f32.convert_i64_u", 0xb5, i64, f32)                   \
    V(f32demote_f64, "f32.demote_f64", 0xb6, f64, f32)                         \
    V(f64convert_i32_s, "f64.convert_i32_s", 0xb7, i32, f64)                   \
    V(f64convert_i32_u, "f64.convert_i32_u", 0xb8, i32, f64)                   \
    V(f64convert_i64_s, "f64.convert_i64_s", 0xb9, i64, f64)                   \
    V(f64convert_i64_u, "f64.convert_i64_u", 0xba, i64, f64)                   \
    V(f64promote_f32, "f64.promote_f32", 0xbb, f32, f64)                       \
    V(i32reinterpret_f32, "i32.reinterpret_f32", 0xbc, f32, i32)               \
    V(i64reinterpret_f64, "i64.reinterpret_f64", 0xbd, f64, i64)               \
    V(f32reinterpret_i32, "f32.reinterpret_i32", 0xbe, i32, f32)               \
    V(f64reinterpret_i64, "f64.reinterpret_i64", 0xbf, i64, f64)               \
    V(i32extend8_s, "i32.extend8_s", 0xc0, i32, i32)                           \
    V(i32extend16_s, "i32.extend16_s", 0xc1, i32, i32)                         \
    V(i64extend8_s, "i64.extend8_s", 0xc2, i64, i64)                           \
    V(i64extend16_s, "i64.extend16_s", 0xc3, i64, i64)                         \
    V(i64extend32_s, "i64.extend32_s", 0xc4, i64, i64)

// V(name, text, byte, operand type, result type); both operands share a type
#define FOREACH_BINARY(V)                                                      \
    V(i32eq, "i32.eq", 0x46, i32, i32)                                         \
    V(i32ne, "i32.ne", 0x47, i32, i32)                                         \
    V(i32lt_s, "i32.lt_s", 0x48, i32, i32)                                     \
    V(i32lt_u, "i32.lt_u", 0x49, i32, i32)                                     \
    V(i32gt_s, "i32.gt_s", 0x4a, i32, i32)                                     \
    V(i32gt_u, "i32.gt_u", 0x4b, i32, i32)                                     \
    V(i32le_s, "i32.le_s", 0x4c, i32, i32)                                     \
    V(i32le_u, "i32.le_u", 0x4d, i32, i32)                                     \
    V(i32ge_s, "i32.ge_s", 0x4e, i32, i32)                                     \
    V(i32ge_u, "i32.ge_u", 0x4f, i32, i32)                                     \
    V(i64eq, "i64.eq", 0x51, i64, i32)                                         \
    V(i64ne, "i64.ne", 0x52, i64, i32)                                         \
    V(i64lt_s, "i64.lt_s", 0x53, i64, i32)                                     \
    V(i64lt_u, "i64.lt_u", 0x54, i64, i32)                                     \
    V(i64gt_s, "i64.gt_s", 0x55, i64, i32)                                     \
    V(i64gt_u, "i64.gt_u", 0x56, i64, i32)                                     \
    V(i64le_s, "i64.le_s", 0x57, i64, i32)                                     \
    V(i64le_u, "i64.le_u", 0x58, i64, i32)                                     \
    V(i64ge_s, "i64.ge_s", 0x59, i64, i32)                                     \
    V(i64ge_u, "i64.ge_u", 0x5a, i64, i32)                                     \
    V(f32eq, "f32.eq", 0x5b, f32, i32)                                         \
    V(f32ne, "f32.ne", 0x5c, f32, i32)                                         \
    V(f32lt, "f32.lt", 0x5d, f32, i32)                                         \
    V(f32gt, "f32.gt", 0x5e, f32, i32)                                         \
    V(f32le, "f32.le", 0x5f, f32, i32)                                         \
    V(f32ge, "f32.ge", 0x60, f32, i32)                                         \
    V(f64eq, "f64.eq", 0x61, f64, i32)                                         \
    V(f64ne, "f64.ne", 0x62, f64, i32)                                         \
    V(f64lt, "f64.lt", 0x63, f64, i32)                                         \
    V(f64gt, "f64.gt", 0x64, f64, i32)                                         \
    V(f64le, "f64.le", 0x65, f64, i32)                                         \
    V(f64ge, "f64.ge", 0x66, f64, i32)                                         \
    V(i32add, "i32.add", 0x6a, i32, i32)                                       \
    V(i32sub, "i32.sub", 0x6b, i32, i32)                                       \
    V(i32mul, "i32.mul", 0x6c, i32, i32)                                       \
    V(i32div_s, "i32.div_s", 0x6d, i32, i32)                                   \
    V(i32div_u, "i32.div_u", 0x6e, i32, i32)                                   \
    V(i32rem_s, "i32.rem_s", 0x6f, i32, i32)                                   \
    V(i32rem_u, "i32.rem_u", 0x70, i32, i32)                                   \
    V(i32and, "i32.and", 0x71, i32, i32)                                       \
    V(i32or, "i32.or", 0x72, i32, i32)                                         \
    V(i32xor, "i32.xor", 0x73, i32, i32)                                       \
    V(i32shl, "i32.shl", 0x74, i32, i32)                                       \
    V(i32shr_s, "i32.shr_s", 0x75, i32, i32)                                   \
    V(i32shr_u, "i32.shr_u", 0x76, i32, i32)                                   \
    V(i32rotl, "i32.rotl", 0x77, i32, i32)                                     \
    V(i32rotr, "i32.rotr", 0x78, i32, i32)                                     \
    V(i64add, "i64.add", 0x7c, i64, i64)                                       \
    V(i64sub, "i64.sub", 0x7d, i64, i64)                                       \
    V(i64mul, "i64.mul", 0x7e, i64, i64)                                       \
    V(i64div_s, "i64.div_s", 0x7f, i64, i64)                                   \
    V(i64div_u, "i64.div_u", 0x80, i64, i64)                                   \
    V(i64rem_s, "i64.rem_s", 0x81, i64, i64)                                   \
    V(i64rem_u, "i64.rem_u", 0x82, i64, i64)                                   \
    V(i64and, "i64.and", 0x83, i64, i64)                                       \
    V(i64or, "i64.or", 0x84, i64, i64)                                         \
    V(i64xor, "i64.xor", 0x85, i64, i64)                                       \
    V(i64shl, "i64.shl", 0x86, i64, i64)                                       \
    V(i64shr_s, "i64.shr_s", 0x87, i64, i64)                                   \
    V(i64shr_u, "i64.shr_u", 0x88, i64, i64)                                   \
    V(i64rotl, "i64.rotl", 0x89, i64, i64)                                     \
    V(i64rotr, "i64.rotr", 0x8a, i64, i64)                                     \
    V(f32add, "f32.add", 0x92, f32, f32)                                       \
    V(f32sub, "f32.sub", 0x93, f32, f32)                                       \
    V(f32mul, "f32.mul", 0x94, f32, f32)                                       \
    V(f32div, "f32.div", 0x95, f32, f32)                                       \
    V(f32min, "f32.min", 0x96, f32, f32)                                       \
    V(f32max, "f32.max", 0x97, f32, f32)                                       \
    V(f32copysign, "f32.copysign", 0x98, f32, f32)                             \
    V(f64add, "f64.add", 0xa0, f64, f64)                                       \
    V(f64sub, "f64.sub", 0xa1, f64, f64)                                       \
    V(f64mul, "f64.mul", 0xa2, f64, f64)                                       \
    V(f64div, "f64.div", 0xa3, f64, f64)                                       \
    V(f64min, "f64.min", 0xa4, f64, f64)                                       \
    V(f64max, "f64.max", 0xa5, f64, f64)                                       \
    V(f64copysign, "f64.copysign", 0xa6, f64, f64)

#define FOREACH_OPCODE(V)                                                      \
    FOREACH_INSTRUCTION(V)                                                     \
    FOREACH_LOAD(V)                                                            \
    FOREACH_STORE(V)                                                           \
    FOREACH_UNARY(V)                                                           \
    FOREACH_BINARY(V)

enum class Instruction : uint8_t {
#define V(name, _, byte, ...) name = byte,
    FOREACH_OPCODE(V)
#undef V
};

const char *instruction_name(uint8_t byte);

} // namespace weft
