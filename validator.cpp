#include "validator.hpp"
#include <algorithm>
#include <cstring>
#include <unordered_set>

#ifdef WEFT_DEBUG
#include <iostream>
#endif

namespace weft {

#define HANDLER(name) void FunctionValidator::validate_##name()

consteval std::array<FunctionValidator::Handler, 256>
FunctionValidator::make_handlers() {
    std::array<Handler, 256> funcs{};
    funcs.fill(&FunctionValidator::validate_missing);

#define V(name, _, byte, ...) funcs[byte] = &FunctionValidator::validate_##name;
    FOREACH_OPCODE(V)
#undef V

    return funcs;
}

const std::array<FunctionValidator::Handler, 256> FunctionValidator::handlers =
    FunctionValidator::make_handlers();

FunctionValidator::FunctionValidator(std::span<const uint8_t> body,
                                     const TypeContext &context)
    : context(context), iter(body.data(), body.size()) {}

ValidatedBody FunctionValidator::validate() {
    read_locals();

    ssa = SsaBuilder(locals, context.signature.params.size());
    current = ssa.entry();
    exit = ssa.new_block(BlockKind::exit);
    ssa.declare_args(exit, context.signature.results);
    push_frame(ControlFlow{Signature{{}, context.signature.results},
                           StackMark{0, 0, false}, exit, Function{}});

    while (!control_stack.empty()) {
        instruction_start = iter.offset();
        if (iter.empty() && innermost_region())
            error<structural_error>(
                "funclet region ends before all funclets are produced");

        auto byte = *iter;
        ++iter;
        ++n_instructions;

#ifdef WEFT_DEBUG
        std::cerr << "reading instruction " << instruction_name(byte)
                  << " at offset " << instruction_start << std::endl;
        std::cerr << "control stack size: " << control_stack.size()
                  << std::endl;
        std::cerr << "stack: " << to_string(stack.values_above(0))
                  << (stack.polymorphism() ? " (polymorphic)" : "")
                  << std::endl;
        std::cerr << std::endl;
#endif

        (this->*handlers[byte])();
    }

    instruction_start = iter.offset();
    ensure<malformed_error>(iter.empty(), "unexpected bytes after function end");

    auto stats = BodyStats{};
    stats.instructions = n_instructions;
    stats.regions = regions.size();
    for (auto &region : regions) {
        stats.funclets += region.funclets.size();
        stats.edges += region.edges.size();
    }
    stats.live_phis = ssa.live_phis();
    stats.removed_phis = ssa.removed_phis();

    return ValidatedBody{std::move(locals), std::move(regions), std::move(ssa),
                         exit, stats};
}

std::optional<uint32_t> FunctionValidator::current_funclet() const {
    if (auto region = innermost_region())
        return region->graph.current();
    return std::nullopt;
}

void FunctionValidator::read_locals() {
    locals = context.signature.params;

    auto n_decls = safe_read_leb128<uint32_t>(iter);
    for (uint32_t i = 0; i < n_decls; ++i) {
        auto n = safe_read_leb128<uint32_t>(iter);
        auto type = *iter;
        ++iter;
        ensure<malformed_error>(is_valtype(type), "invalid local type");
        ensure<malformed_error>(
            n <= MAX_LOCALS - std::min<size_t>(locals.size(), MAX_LOCALS),
            "too many locals");
        locals.insert(locals.end(), n, static_cast<valtype>(type));
    }
}

Signature FunctionValidator::read_blocktype() {
    auto byte = *iter;
    if (byte == static_cast<uint8_t>(valtype::empty)) {
        ++iter;
        return Signature{};
    }
    if (is_valtype(byte)) {
        ++iter;
        return Signature{{}, {static_cast<valtype>(byte)}};
    }

    auto index = safe_read_sleb128<int64_t, 33>(iter);
    ensure<malformed_error>(index >= 0, "invalid block type");
    ensure<structural_error>(
        index < static_cast<int64_t>(context.types.size()), "unknown type");
    return context.types[index];
}

valtype_vector FunctionValidator::read_valtypes() {
    auto n = safe_read_leb128<uint32_t>(iter);
    ensure<malformed_error>(n <= iter.remaining(), "length out of bounds");

    valtype_vector types;
    types.reserve(n);
    for (uint32_t i = 0; i < n; ++i) {
        auto byte = *iter;
        ++iter;
        ensure<malformed_error>(is_valtype(byte), "invalid value type");
        types.push_back(static_cast<valtype>(byte));
    }
    return types;
}

void FunctionValidator::push_frame(ControlFlow frame) {
    if (auto region = std::get_if<Region>(&frame.construct)) {
        frame.region = region->state.get();
        frame.outer_unreachable = false;
    } else if (!control_stack.empty()) {
        auto &parent = control_stack.back();
        frame.region = parent.region;
        frame.outer_unreachable =
            parent.outer_unreachable || frame.mark.polymorphized;
    }
    control_stack.push_back(std::move(frame));
}

ControlFlow &FunctionValidator::label(uint32_t depth) {
    ensure<structural_error>(depth < control_stack.size(), "unknown label");
    return control_stack[control_stack.size() - 1 - depth];
}

RegionState *FunctionValidator::innermost_region() const {
    return control_stack.empty() ? nullptr : control_stack.back().region;
}

ValueId FunctionValidator::operand_value(const Operand &operand) {
    // operands conjured by an unreachable stack have no definition
    if (operand.value == no_value)
        return ssa.undef(operand.type);
    return operand.value;
}

std::vector<ValueId>
FunctionValidator::operand_values(const std::vector<Operand> &operands) {
    std::vector<ValueId> values;
    values.reserve(operands.size());
    for (auto &operand : operands)
        values.push_back(operand_value(operand));
    return values;
}

std::vector<ValueId>
FunctionValidator::pop_values(const valtype_vector &expected) {
    return operand_values(stack.pop(expected));
}

std::vector<ValueId>
FunctionValidator::peek_values(const valtype_vector &expected) {
    auto values = pop_values(expected);
    push_values(expected, values);
    return values;
}

std::vector<ValueId>
FunctionValidator::take_results(const valtype_vector &results) {
    if (!stack.exactly(results))
        error<type_mismatch_error>("type mismatch stack vs. results", results,
                                   stack.values_above(stack.floor()));
    return pop_values(results);
}

void FunctionValidator::push_values(const valtype_vector &types,
                                    const std::vector<ValueId> &values) {
    for (size_t i = 0; i < types.size(); ++i)
        stack.push(types[i], values[i]);
}

void FunctionValidator::apply(Instruction instruction,
                              const valtype_vector &params, valtype result,
                              uint64_t immediate) {
    auto operands = pop_values(params);
    auto value =
        ssa.emit(current, instruction, result, std::move(operands), immediate);
    if (result != valtype::null)
        stack.push(result, value);
}

void FunctionValidator::load(Instruction instruction, uint32_t natural,
                             valtype type) {
    auto a = safe_read_leb128<uint32_t>(iter);
    ensure<structural_error>(context.has_memory, "unknown memory");
    ensure<malformed_error>(a < 32, "malformed memop flags");
    ensure<structural_error>((1ull << a) <= natural,
                             "alignment must not be larger than natural");
    auto offset = safe_read_leb128<uint32_t>(iter);
    apply(instruction, {valtype::i32}, type, offset);
}

void FunctionValidator::store(Instruction instruction, uint32_t natural,
                              valtype type) {
    auto a = safe_read_leb128<uint32_t>(iter);
    ensure<structural_error>(context.has_memory, "unknown memory");
    ensure<malformed_error>(a < 32, "malformed memop flags");
    ensure<structural_error>((1ull << a) <= natural,
                             "alignment must not be larger than natural");
    auto offset = safe_read_leb128<uint32_t>(iter);
    apply(instruction, {valtype::i32, type}, valtype::null, offset);
}

// conditional transfers continue in a fresh block with a single predecessor
void FunctionValidator::split() {
    auto next = ssa.new_block(BlockKind::body);
    ssa.add_edge(current, next, {});
    ssa.seal(next);
    current = next;
}

void FunctionValidator::after_transfer() {
    if (std::holds_alternative<Region>(control_stack.back().construct)) {
        leave_funclet();
        return;
    }

    stack.polymorphize();
    current = ssa.new_block(BlockKind::body);
    ssa.seal(current);
}

void FunctionValidator::enter_funclet(uint32_t index) {
    auto &frame = control_stack.back();
    auto &region = *std::get<Region>(frame.construct).state;
    instruction_start = iter.offset();
    region.graph.enter(index);

    if (!iter.empty() &&
        *iter == static_cast<uint8_t>(Instruction::funclet_sig)) {
        ++iter;
        ++n_instructions;
        auto params = read_valtypes();
        auto num_preds = safe_read_leb128<uint32_t>(iter);
        region.graph.declare(index, std::move(params), num_preds);
    } else if (index == 0) {
        region.graph.declare(index, {}, 0, false);
    } else {
        region.graph.infer(index);
    }

    auto &params = *region.graph.node(index).params;
    if (index == 0 && params != frame.sig.params)
        error<type_mismatch_error>(
            "funclet region parameters do not match the first funclet", params,
            frame.sig.params);

    auto block = region.blocks[index];
    ssa.declare_args(block, params);
    if (region.graph.seal_ready(index))
        seal_funclet(region, index);

    current = block;
    stack.reset(params, ssa.args(block));

#ifdef WEFT_DEBUG
    std::cerr << "entering funclet " << index << " of "
              << region.graph.size() << " with params " << to_string(params)
              << std::endl;
#endif
}

void FunctionValidator::seal_funclet(RegionState &region, uint32_t index) {
    region.graph.mark_sealed(index);
    ssa.seal(region.blocks[index]);

#ifdef WEFT_DEBUG
    std::cerr << "sealed funclet " << index << " after "
              << region.graph.node(index).observed_preds
              << " backward predecessors" << std::endl;
#endif
}

// funclet calls pass everything above the region baseline, values below the
// floors of nested blocks included
std::vector<Operand>
FunctionValidator::funclet_args(const RegionState &region) const {
    return stack.operands_above(region.base);
}

bool FunctionValidator::funclet_args_unreachable() const {
    return stack.polymorphism() || control_stack.back().outer_unreachable;
}

void FunctionValidator::call_funclet(RegionState &region, uint32_t target,
                                     const std::vector<Operand> &args,
                                     bool polymorphic) {
    valtype_vector types;
    for (auto &arg : args)
        types.push_back(arg.type);

    auto ready = region.graph.add_edge(target, std::move(types), polymorphic,
                                       instruction_start);
    ssa.add_edge(current, region.blocks[target], operand_values(args));
    if (ready)
        seal_funclet(region, target);
}

void FunctionValidator::leave_funclet() {
    auto &region = *std::get<Region>(control_stack.back().construct).state;
    auto next = region.graph.current() + 1;
    if (next < region.graph.size())
        enter_funclet(next);
    else
        finalize_region();
}

void FunctionValidator::finalize_region() {
    auto &frame = control_stack.back();
    auto &region = *std::get<Region>(frame.construct).state;
    region.graph.finalize();
    ssa.seal(region.exit);

    auto edges = region.graph.edges();
    auto record = FuncletRegion{region.signature,
                                region.depth,
                                region.offset,
                                {},
                                std::vector<CallEdge>(edges.begin(), edges.end()),
                                region.exit};
    for (uint32_t i = 0; i < region.graph.size(); ++i) {
        auto &node = region.graph.node(i);
        record.funclets.push_back(Funclet{i, *node.params,
                                          node.explicit_signature,
                                          node.declared_preds,
                                          node.observed_preds, node.sealed,
                                          region.blocks[i]});
    }
    regions.push_back(std::move(record));

    auto results = ssa.args(region.exit);
    stack.leave(frame.mark);
    current = region.exit;
    push_values(frame.sig.results, results);
    control_stack.pop_back();
}

HANDLER(missing) { error<malformed_error>("illegal opcode"); }

HANDLER(unreachable) {
    ssa.emit(current, Instruction::unreachable, valtype::null, {});
    after_transfer();
}
HANDLER(nop) {}
HANDLER(block) {
    auto signature = read_blocktype();

    auto join = ssa.new_block(BlockKind::join);
    ssa.declare_args(join, signature.results);
    auto mark = stack.enter(signature.params);
    push_frame(ControlFlow{std::move(signature), mark, join, Block{}});
}
HANDLER(loop) {
    auto signature = read_blocktype();

    auto header = ssa.new_block(BlockKind::loop_header);
    ssa.declare_args(header, signature.params);
    ssa.add_edge(current, header, peek_values(signature.params));
    auto mark = stack.enter(signature.params);
    current = header;
    stack.reset(signature.params, ssa.args(header));
    push_frame(ControlFlow{std::move(signature), mark, header, Loop{}});
}
HANDLER(if_) {
    auto signature = read_blocktype();

    auto condition = pop_values({valtype::i32})[0];
    auto params = peek_values(signature.params);
    ssa.emit(current, Instruction::if_, valtype::null, {condition});
    auto mark = stack.enter(signature.params);

    auto join = ssa.new_block(BlockKind::join);
    ssa.declare_args(join, signature.results);
    auto from = current;
    split();
    push_frame(ControlFlow{std::move(signature), mark, join,
                           If{from, std::move(params)}});
}
HANDLER(else_) {
    auto &frame = control_stack.back();
    ensure<structural_error>(std::holds_alternative<If>(frame.construct),
                             "else must close an if");

    ssa.add_edge(current, frame.target, take_results(frame.sig.results));

    auto if_ = std::move(std::get<If>(frame.construct));
    frame.construct = IfElse{};

    auto otherwise = ssa.new_block(BlockKind::body);
    ssa.add_edge(if_.condition, otherwise, {});
    ssa.seal(otherwise);
    current = otherwise;
    stack.reset(frame.sig.params, if_.params);
}
HANDLER(end) {
    auto &frame = control_stack.back();

    if (auto region = std::get_if<Region>(&frame.construct)) {
        auto &state = *region->state;
        auto index = state.graph.current();
        if (index + 1 < state.graph.size()) {
            // falls through into the next funclet
            call_funclet(state, index + 1, funclet_args(state),
                         funclet_args_unreachable());
            leave_funclet();
        } else {
            ssa.add_edge(current, state.exit,
                         take_results(frame.sig.results));
            finalize_region();
        }
        return;
    }

    auto results = take_results(frame.sig.results);

    if (std::holds_alternative<Function>(frame.construct)) {
        ssa.add_edge(current, exit, std::move(results));
        ssa.seal(exit);
        control_stack.pop_back();
        return;
    }

    if (std::holds_alternative<Loop>(frame.construct)) {
        ssa.seal(frame.target);
        stack.leave(frame.mark);
        push_values(frame.sig.results, results);
        control_stack.pop_back();
        return;
    }

    if (auto if_ = std::get_if<If>(&frame.construct)) {
        if (frame.sig.params != frame.sig.results)
            error<type_mismatch_error>("type mismatch params vs. results",
                                       frame.sig.results, frame.sig.params);
        ssa.add_edge(if_->condition, frame.target, if_->params);
    }

    ssa.add_edge(current, frame.target, std::move(results));
    ssa.seal(frame.target);
    stack.leave(frame.mark);
    current = frame.target;
    push_values(frame.sig.results, ssa.args(frame.target));
    control_stack.pop_back();
}
HANDLER(br) {
    auto depth = safe_read_leb128<uint32_t>(iter);
    auto &target = label(depth);
    ssa.add_edge(current, target.target, peek_values(target.expected()));
    after_transfer();
}
HANDLER(br_if) {
    auto depth = safe_read_leb128<uint32_t>(iter);
    auto condition = pop_values({valtype::i32})[0];
    auto &target = label(depth);
    auto args = peek_values(target.expected());
    ssa.emit(current, Instruction::br_if, valtype::null, {condition}, depth);
    ssa.add_edge(current, target.target, std::move(args));
    split();
}
HANDLER(br_table) {
    auto n_targets = safe_read_leb128<uint32_t>(iter);
    ensure<malformed_error>(n_targets < iter.remaining(),
                            "length out of bounds");

    std::vector<uint32_t> depths;
    depths.reserve(n_targets + 1);
    for (uint64_t i = 0; i <= n_targets; ++i) {
        auto depth = safe_read_leb128<uint32_t>(iter);
        ensure<structural_error>(depth < control_stack.size(),
                                 "unknown label");
        depths.push_back(depth);
    }

    auto index = pop_values({valtype::i32})[0];
    ssa.emit(current, Instruction::br_table, valtype::null, {index},
             n_targets);

    auto &default_types = label(depths.back()).expected();
    std::unordered_set<BlockId> seen;
    for (auto depth : depths) {
        auto &target = label(depth);
        if (target.expected().size() != default_types.size())
            error<type_mismatch_error>("type mismatch", default_types,
                                       target.expected());
        auto args = peek_values(target.expected());
        if (seen.insert(target.target).second)
            ssa.add_edge(current, target.target, std::move(args));
    }
    after_transfer();
}
HANDLER(return_) {
    auto &function = control_stack.front();
    ssa.add_edge(current, exit, peek_values(function.sig.results));
    after_transfer();
}
HANDLER(call) {
    auto index = safe_read_leb128<uint32_t>(iter);
    ensure<structural_error>(index < context.functions.size(),
                             "unknown function");

    auto &callee = context.functions[index];
    auto args = pop_values(callee.params);
    auto type =
        callee.results.size() == 1 ? callee.results[0] : valtype::null;
    auto result =
        ssa.emit(current, Instruction::call, type, std::move(args), index);

    if (callee.results.size() == 1) {
        stack.push(type, result);
        return;
    }
    for (uint32_t i = 0; i < callee.results.size(); ++i)
        stack.push(callee.results[i],
                   ssa.project(current, result, i, callee.results[i]));
}
HANDLER(drop) { stack.pop(); }
HANDLER(select) {
    auto condition = pop_values({valtype::i32})[0];
    auto second = stack.pop();
    auto first = second.type == valtype::any ? stack.pop()
                                             : stack.pop(second.type);
    auto type = first.type;
    ensure<type_mismatch_error>(type == valtype::any || is_numtype(type),
                                "type mismatch: select needs numeric operands");

    stack.push(type, ssa.emit(current, Instruction::select, type,
                              {operand_value(first), operand_value(second),
                               condition}));
}
HANDLER(select_t) {
    auto n = safe_read_leb128<uint32_t>(iter);
    ensure<structural_error>(n == 1, "invalid result arity");
    auto byte = *iter;
    ++iter;
    ensure<malformed_error>(is_valtype(byte), "invalid value type");
    auto type = static_cast<valtype>(byte);

    auto condition = pop_values({valtype::i32})[0];
    auto operands = pop_values({type, type});
    operands.push_back(condition);
    stack.push(type, ssa.emit(current, Instruction::select_t, type,
                              std::move(operands)));
}
HANDLER(localget) {
    auto index = safe_read_leb128<uint32_t>(iter);
    ensure<structural_error>(index < locals.size(), "unknown local");
    stack.push(locals[index], ssa.read_local(current, index));
}
HANDLER(localset) {
    auto index = safe_read_leb128<uint32_t>(iter);
    ensure<structural_error>(index < locals.size(), "unknown local");
    ssa.write_local(current, index, pop_values({locals[index]})[0]);
}
HANDLER(localtee) {
    auto index = safe_read_leb128<uint32_t>(iter);
    ensure<structural_error>(index < locals.size(), "unknown local");
    auto value = pop_values({locals[index]})[0];
    ssa.write_local(current, index, value);
    stack.push(locals[index], value);
}
HANDLER(globalget) {
    auto index = safe_read_leb128<uint32_t>(iter);
    ensure<structural_error>(index < context.globals.size(), "unknown global");
    apply(Instruction::globalget, {}, context.globals[index].type, index);
}
HANDLER(globalset) {
    auto index = safe_read_leb128<uint32_t>(iter);
    ensure<structural_error>(index < context.globals.size(), "unknown global");
    auto &global = context.globals[index];
    ensure<structural_error>(global.mutable_, "global is immutable");
    apply(Instruction::globalset, {global.type}, valtype::null, index);
}
HANDLER(memorysize) {
    auto byte = *iter;
    ++iter;
    ensure<malformed_error>(byte == 0, "zero byte expected");
    ensure<structural_error>(context.has_memory, "unknown memory");
    apply(Instruction::memorysize, {}, valtype::i32);
}
HANDLER(memorygrow) {
    auto byte = *iter;
    ++iter;
    ensure<malformed_error>(byte == 0, "zero byte expected");
    ensure<structural_error>(context.has_memory, "unknown memory");
    apply(Instruction::memorygrow, {valtype::i32}, valtype::i32);
}
HANDLER(i32const) {
    auto value = safe_read_sleb128<int32_t>(iter);
    stack.push(valtype::i32, ssa.constant(current, valtype::i32,
                                          static_cast<uint32_t>(value)));
}
HANDLER(i64const) {
    auto value = safe_read_sleb128<int64_t>(iter);
    stack.push(valtype::i64, ssa.constant(current, valtype::i64,
                                          static_cast<uint64_t>(value)));
}
HANDLER(f32const) {
    uint32_t bits;
    std::memcpy(&bits, iter.get_with_at_least(sizeof(bits)), sizeof(bits));
    iter += sizeof(bits);
    stack.push(valtype::f32, ssa.constant(current, valtype::f32, bits));
}
HANDLER(f64const) {
    uint64_t bits;
    std::memcpy(&bits, iter.get_with_at_least(sizeof(bits)), sizeof(bits));
    iter += sizeof(bits);
    stack.push(valtype::f64, ssa.constant(current, valtype::f64, bits));
}

#define V(name, _, byte, natural, type)                                        \
    HANDLER(name) { load(Instruction::name, natural, valtype::type); }
FOREACH_LOAD(V)
#undef V

#define V(name, _, byte, natural, type)                                        \
    HANDLER(name) { store(Instruction::name, natural, valtype::type); }
FOREACH_STORE(V)
#undef V

#define V(name, _, byte, in, out)                                              \
    HANDLER(name) {                                                            \
        apply(Instruction::name, {valtype::in}, valtype::out);                 \
    }
FOREACH_UNARY(V)
#undef V

#define V(name, _, byte, in, out)                                              \
    HANDLER(name) {                                                            \
        apply(Instruction::name, {valtype::in, valtype::in}, valtype::out);    \
    }
FOREACH_BINARY(V)
#undef V

HANDLER(funclet_region) {
    auto signature = read_blocktype();
    auto n_funclets = safe_read_leb128<uint32_t>(iter);
    ensure<malformed_error>(n_funclets != 0,
                            "funclet region must declare at least one funclet");
    // every funclet occupies at least one byte
    ensure<malformed_error>(n_funclets <= iter.remaining(),
                            "funclet count exceeds the remaining body");

    auto state = std::make_unique<RegionState>(RegionState{
        signature, static_cast<uint32_t>(control_stack.size()),
        instruction_start, FuncletCallGraph(n_funclets), {}, no_block});
    for (uint32_t i = 0; i < n_funclets; ++i)
        state->blocks.push_back(ssa.new_block(BlockKind::funclet));
    state->exit = ssa.new_block(BlockKind::join);
    ssa.declare_args(state->exit, signature.results);

    ssa.add_edge(current, state->blocks[0], peek_values(signature.params));
    auto mark = stack.enter(signature.params);
    state->base = mark.height;
    auto region_exit = state->exit;
    push_frame(ControlFlow{std::move(signature), mark, region_exit,
                           Region{std::move(state)}});
    enter_funclet(0);
}
HANDLER(funclet_sig) {
    ensure<structural_error>(innermost_region() != nullptr,
                             "funclet_sig outside of a funclet region");
    error<structural_error>(
        "funclet_sig must be the first instruction of a funclet");
}
HANDLER(funclet_call) {
    auto delta = safe_read_sleb128<int32_t>(iter);
    auto region = innermost_region();
    ensure<structural_error>(region != nullptr,
                             "funclet call outside of a funclet region");

    auto target = region->graph.resolve(delta);
    ssa.emit(current, Instruction::funclet_call, valtype::null, {}, target);
    call_funclet(*region, target, funclet_args(*region),
                 funclet_args_unreachable());
    after_transfer();
}
HANDLER(funclet_call_if) {
    auto delta = safe_read_sleb128<int32_t>(iter);
    auto region = innermost_region();
    ensure<structural_error>(region != nullptr,
                             "funclet call outside of a funclet region");

    auto target = region->graph.resolve(delta);
    auto condition = pop_values({valtype::i32})[0];
    ssa.emit(current, Instruction::funclet_call_if, valtype::null, {condition},
             target);
    call_funclet(*region, target, funclet_args(*region),
                 funclet_args_unreachable());
    split();
}
HANDLER(funclet_call_table) {
    auto region = innermost_region();
    ensure<structural_error>(region != nullptr,
                             "funclet call outside of a funclet region");

    auto n_targets = safe_read_leb128<uint32_t>(iter);
    ensure<malformed_error>(n_targets < iter.remaining(),
                            "length out of bounds");

    std::vector<uint32_t> targets;
    targets.reserve(n_targets + 1);
    for (uint64_t i = 0; i <= n_targets; ++i)
        targets.push_back(
            region->graph.resolve(safe_read_sleb128<int32_t>(iter)));

    auto index = pop_values({valtype::i32})[0];
    ssa.emit(current, Instruction::funclet_call_table, valtype::null, {index},
             n_targets);

    auto args = funclet_args(*region);
    auto polymorphic = funclet_args_unreachable();
    // a target listed twice is still a single predecessor
    std::unordered_set<uint32_t> seen;
    for (auto target : targets) {
        if (seen.insert(target).second)
            call_funclet(*region, target, args, polymorphic);
    }
    after_transfer();
}

ValidationResult validate_function_body(std::span<const uint8_t> body,
                                        const TypeContext &context) {
    auto validator = FunctionValidator(body, context);
    try {
        return validator.validate();
    } catch (validation_error &e) {
        auto info = e.info;
        if (info.offset == ValidationError::unknown_offset)
            info.offset = validator.offset();
        if (!info.funclet)
            info.funclet = validator.current_funclet();
        return info;
    }
}

} // namespace weft
