#pragma once

#include "errors.hpp"
#include "wasm.hpp"
#include <cstddef>
#include <cstdint>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

namespace weft {

enum class ValueKind : uint8_t {
    param,
    zero,
    undef,
    constant,
    phi,
    op,
    project,
};

enum class BlockKind : uint8_t {
    entry,
    body,
    join,
    loop_header,
    funclet,
    exit,
};

enum class SealState : uint8_t {
    unsealed,
    sealed,
};

struct SsaValue {
    ValueKind kind;
    valtype type;
    BlockId block;
    // bit pattern for constants, index for params and projections, local
    // slot or argument index for phis, the instruction immediate for ops
    uint64_t immediate = 0;
    Instruction opcode = Instruction::nop;
    std::vector<ValueId> operands;

    // phis only
    bool is_argument = false;
    bool complete = false;
    std::vector<ValueId> users;
    ValueId alias = no_value;
};

struct Predecessor {
    BlockId block;
    std::vector<ValueId> args;
};

struct Final {
    ValueId value;
};

struct Placeholder {
    ValueId phi;
};

using Definition = std::variant<Final, Placeholder>;

struct SsaBlock {
    BlockKind kind;
    SealState seal = SealState::unsealed;
    std::vector<Predecessor> preds;
    bool args_declared = false;
    std::vector<ValueId> args;
    std::vector<ValueId> body;
    std::unordered_map<uint32_t, Definition> defs;
    // placeholders waiting for the final predecessor set
    std::vector<std::pair<uint32_t, ValueId>> pending;
};

class SsaBuilder {
    valtype_vector locals;
    uint32_t n_params = 0;
    std::vector<SsaValue> values;
    std::vector<SsaBlock> blocks;
    size_t removed_phis_ = 0;

    ValueId make_value(SsaValue value);
    ValueId new_phi(BlockId block, valtype type, uint32_t slot,
                    bool is_argument);
    // merge block whose phi is still collecting operands during a lookup
    struct PendingMerge {
        BlockId block;
        ValueId phi;
        size_t next = 0;
        // single predecessor blocks walked to reach the merge
        std::vector<BlockId> chain;
    };

    ValueId lookup(BlockId block, uint32_t slot);
    ValueId find_definition(BlockId block, uint32_t slot,
                            std::vector<PendingMerge> &merges);
    ValueId entry_value(uint32_t slot);
    ValueId add_phi_operands(BlockId block, uint32_t slot, ValueId phi);
    void add_operand(ValueId phi, ValueId operand);
    ValueId try_remove_trivial_phi(ValueId phi);

  public:
    SsaBuilder();
    SsaBuilder(valtype_vector locals, uint32_t n_params);

    BlockId entry() const { return 0; }
    BlockId new_block(BlockKind kind);

    // block arguments may be declared after predecessors were added
    void declare_args(BlockId block, const valtype_vector &types);
    std::vector<ValueId> args(BlockId block) const;

    void add_edge(BlockId from, BlockId to, std::vector<ValueId> args);
    void seal(BlockId block);
    bool sealed(BlockId block) const {
        return blocks[block].seal == SealState::sealed;
    }

    void write_local(BlockId block, uint32_t slot, ValueId value);
    ValueId read_local(BlockId block, uint32_t slot);

    ValueId emit(BlockId block, Instruction opcode, valtype type,
                 std::vector<ValueId> operands, uint64_t immediate = 0);
    ValueId constant(BlockId block, valtype type, uint64_t bits);
    ValueId project(BlockId block, ValueId tuple, uint32_t index,
                    valtype type);
    ValueId undef(valtype type);

    // follows eliminated phis to the value that replaced them
    ValueId resolve(ValueId value) const;

    const SsaValue &value(ValueId id) const { return values[id]; }
    const SsaBlock &block(BlockId id) const { return blocks[id]; }
    size_t value_count() const { return values.size(); }
    size_t block_count() const { return blocks.size(); }
    const valtype_vector &local_types() const { return locals; }

    size_t live_phis() const;
    size_t removed_phis() const { return removed_phis_; }
};

} // namespace weft
