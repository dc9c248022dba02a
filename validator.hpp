#pragma once

#include "call_graph.hpp"
#include "errors.hpp"
#include "operand_stack.hpp"
#include "reader.hpp"
#include "ssa.hpp"
#include "wasm.hpp"
#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <variant>
#include <vector>

namespace weft {

struct GlobalType {
    valtype type;
    bool mutable_ = false;
};

// everything a function body can refer to outside of itself
struct TypeContext {
    std::vector<Signature> types;
    std::vector<Signature> functions;
    std::vector<GlobalType> globals;
    bool has_memory = false;
    Signature signature;
};

struct Funclet {
    uint32_t index = 0;
    valtype_vector params;
    bool explicit_signature = false;
    uint32_t declared_preds = 0;
    uint32_t observed_preds = 0;
    bool sealed = false;
    BlockId block = no_block;
};

struct FuncletRegion {
    Signature signature;
    uint32_t depth = 0;
    size_t offset = 0;
    std::vector<Funclet> funclets;
    std::vector<CallEdge> edges;
    BlockId exit = no_block;
};

struct BodyStats {
    uint64_t instructions = 0;
    uint32_t regions = 0;
    uint32_t funclets = 0;
    uint32_t edges = 0;
    size_t live_phis = 0;
    size_t removed_phis = 0;
};

struct ValidatedBody {
    valtype_vector locals;
    // in the order they were closed, so inner regions come first
    std::vector<FuncletRegion> regions;
    SsaBuilder ssa;
    BlockId exit = no_block;
    BodyStats stats;
};

using ValidationResult = std::variant<ValidatedBody, ValidationError>;

ValidationResult validate_function_body(std::span<const uint8_t> body,
                                        const TypeContext &context);

struct RegionState {
    Signature signature;
    uint32_t depth;
    size_t offset;
    FuncletCallGraph graph;
    std::vector<BlockId> blocks;
    BlockId exit;
    // stack height where funclet arguments start
    uint32_t base = 0;
};

struct Function {};

struct Block {};

struct Loop {};

struct If {
    BlockId condition;
    std::vector<ValueId> params;
};

struct IfElse {};

struct Region {
    std::unique_ptr<RegionState> state;
};

struct ControlFlow {
    Signature sig;
    StackMark mark;
    // block receiving the branches that target this frame
    BlockId target;
    std::variant<Function, Block, Loop, If, IfElse, Region> construct;
    // innermost enclosing region, its own state for a region frame
    RegionState *region = nullptr;
    // a frame between this one and the innermost region was unreachable when
    // this frame was entered
    bool outer_unreachable = false;

    const valtype_vector &expected() const {
        return std::holds_alternative<Loop>(construct) ? sig.params
                                                       : sig.results;
    }
};

class FunctionValidator {
    using Handler = void (FunctionValidator::*)();

    const TypeContext &context;
    safe_byte_iterator iter;
    size_t instruction_start = 0;
    uint64_t n_instructions = 0;

    valtype_vector locals;
    OperandStack stack;
    std::vector<ControlFlow> control_stack;

    SsaBuilder ssa;
    BlockId current = 0;
    BlockId exit = 0;
    std::vector<FuncletRegion> regions;

    static const std::array<Handler, 256> handlers;
    static consteval std::array<Handler, 256> make_handlers();

    void read_locals();
    Signature read_blocktype();
    valtype_vector read_valtypes();

    void push_frame(ControlFlow frame);
    ControlFlow &label(uint32_t depth);
    RegionState *innermost_region() const;

    ValueId operand_value(const Operand &operand);
    std::vector<ValueId> operand_values(const std::vector<Operand> &operands);
    std::vector<ValueId> pop_values(const valtype_vector &expected);
    std::vector<ValueId> peek_values(const valtype_vector &expected);
    std::vector<ValueId> take_results(const valtype_vector &results);
    void push_values(const valtype_vector &types,
                     const std::vector<ValueId> &values);

    void apply(Instruction instruction, const valtype_vector &params,
               valtype result, uint64_t immediate = 0);
    void load(Instruction instruction, uint32_t natural, valtype type);
    void store(Instruction instruction, uint32_t natural, valtype type);

    void split();
    void after_transfer();

    void enter_funclet(uint32_t index);
    void seal_funclet(RegionState &region, uint32_t index);
    std::vector<Operand> funclet_args(const RegionState &region) const;
    bool funclet_args_unreachable() const;
    void call_funclet(RegionState &region, uint32_t target,
                      const std::vector<Operand> &args, bool polymorphic);
    void leave_funclet();
    void finalize_region();

#define V(name, ...) void validate_##name();
    FOREACH_OPCODE(V)
#undef V
    void validate_missing();

  public:
    static constexpr uint32_t MAX_LOCALS = 50000;

    FunctionValidator(std::span<const uint8_t> body,
                      const TypeContext &context);

    ValidatedBody validate();

    // offset of the instruction being validated
    size_t offset() const { return instruction_start; }
    std::optional<uint32_t> current_funclet() const;
};

} // namespace weft
