#pragma once

#include "../wasm.hpp"
#include <cstdint>
#include <cstring>
#include <vector>

namespace weft::test {

// assembles function bodies byte by byte, each declared local gets its own
// declaration entry
class BodyBuilder {
    std::vector<uint8_t> bytes;
    uint64_t instructions = 0;

    BodyBuilder &op(Instruction instruction) {
        bytes.push_back(static_cast<uint8_t>(instruction));
        ++instructions;
        return *this;
    }

  public:
    explicit BodyBuilder(const valtype_vector &locals = {}) {
        u32(locals.size());
        for (auto type : locals) {
            u32(1);
            bytes.push_back(static_cast<uint8_t>(type));
        }
    }

    BodyBuilder &u32(uint32_t value) {
        do {
            uint8_t byte = value & 0x7f;
            value >>= 7;
            if (value)
                byte |= 0x80;
            bytes.push_back(byte);
        } while (value);
        return *this;
    }

    BodyBuilder &s32(int32_t value) {
        auto more = true;
        while (more) {
            uint8_t byte = value & 0x7f;
            value >>= 7;
            if ((value == 0 && !(byte & 0x40)) || (value == -1 && (byte & 0x40)))
                more = false;
            else
                byte |= 0x80;
            bytes.push_back(byte);
        }
        return *this;
    }

    BodyBuilder &raw(std::initializer_list<uint8_t> raw_bytes) {
        bytes.insert(bytes.end(), raw_bytes);
        return *this;
    }

    BodyBuilder &blocktype(valtype type) {
        bytes.push_back(static_cast<uint8_t>(type));
        return *this;
    }

    BodyBuilder &region(valtype result, uint32_t n_funclets) {
        op(Instruction::funclet_region).blocktype(result);
        return u32(n_funclets);
    }
    BodyBuilder &sig(const valtype_vector &params, uint32_t num_preds) {
        op(Instruction::funclet_sig).u32(params.size());
        for (auto type : params)
            bytes.push_back(static_cast<uint8_t>(type));
        return u32(num_preds);
    }
    BodyBuilder &call(int32_t delta) {
        return op(Instruction::funclet_call).s32(delta);
    }
    BodyBuilder &call_if(int32_t delta) {
        return op(Instruction::funclet_call_if).s32(delta);
    }
    BodyBuilder &call_table(const std::vector<int32_t> &deltas,
                            int32_t fallback) {
        op(Instruction::funclet_call_table).u32(deltas.size());
        for (auto delta : deltas)
            s32(delta);
        return s32(fallback);
    }

    BodyBuilder &block(valtype result) {
        return op(Instruction::block).blocktype(result);
    }
    BodyBuilder &loop(valtype result) {
        return op(Instruction::loop).blocktype(result);
    }
    BodyBuilder &if_(valtype result) {
        return op(Instruction::if_).blocktype(result);
    }
    BodyBuilder &else_() { return op(Instruction::else_); }
    BodyBuilder &end() { return op(Instruction::end); }
    BodyBuilder &br(uint32_t depth) { return op(Instruction::br).u32(depth); }
    BodyBuilder &br_if(uint32_t depth) {
        return op(Instruction::br_if).u32(depth);
    }
    BodyBuilder &ret() { return op(Instruction::return_); }
    BodyBuilder &unreachable() { return op(Instruction::unreachable); }
    BodyBuilder &drop() { return op(Instruction::drop); }
    BodyBuilder &nop() { return op(Instruction::nop); }

    BodyBuilder &local_get(uint32_t index) {
        return op(Instruction::localget).u32(index);
    }
    BodyBuilder &local_set(uint32_t index) {
        return op(Instruction::localset).u32(index);
    }
    BodyBuilder &local_tee(uint32_t index) {
        return op(Instruction::localtee).u32(index);
    }

    BodyBuilder &i32_const(int32_t value) {
        return op(Instruction::i32const).s32(value);
    }
    BodyBuilder &f32_const(float value) {
        uint8_t raw_bytes[sizeof(value)];
        std::memcpy(raw_bytes, &value, sizeof(value));
        op(Instruction::f32const);
        bytes.insert(bytes.end(), raw_bytes, raw_bytes + sizeof(value));
        return *this;
    }
    BodyBuilder &i32_add() { return op(Instruction::i32add); }
    BodyBuilder &i32_eqz() { return op(Instruction::i32eqz); }

    // offset the next instruction will start at
    size_t size() const { return bytes.size(); }
    // counts every opcode emitted, funclet_sig included
    uint64_t instruction_count() const { return instructions; }
    const std::vector<uint8_t> &build() const { return bytes; }
};

} // namespace weft::test
