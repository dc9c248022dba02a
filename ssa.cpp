#include "ssa.hpp"
#include <unordered_set>

namespace weft {

namespace {

ValueId defined_value(const Definition &definition) {
    if (auto done = std::get_if<Final>(&definition))
        return done->value;
    return std::get<Placeholder>(definition).phi;
}

} // namespace

SsaBuilder::SsaBuilder() : SsaBuilder(valtype_vector{}, 0) {}

SsaBuilder::SsaBuilder(valtype_vector locals, uint32_t n_params)
    : locals(std::move(locals)), n_params(n_params) {
    blocks.push_back(SsaBlock{BlockKind::entry, SealState::sealed});
}

BlockId SsaBuilder::new_block(BlockKind kind) {
    blocks.push_back(SsaBlock{kind});
    return blocks.size() - 1;
}

ValueId SsaBuilder::make_value(SsaValue value) {
    if (values.size() >= no_value)
        error<internal_error>("value arena exhausted");
    values.push_back(std::move(value));
    return values.size() - 1;
}

ValueId SsaBuilder::new_phi(BlockId block, valtype type, uint32_t slot,
                            bool is_argument) {
    auto phi = SsaValue{ValueKind::phi, type, block, slot};
    phi.is_argument = is_argument;
    return make_value(std::move(phi));
}

ValueId SsaBuilder::undef(valtype type) {
    return make_value(SsaValue{ValueKind::undef, type, no_block});
}

ValueId SsaBuilder::entry_value(uint32_t slot) {
    if (slot < n_params)
        return make_value(
            SsaValue{ValueKind::param, locals[slot], entry(), slot});
    return make_value(SsaValue{ValueKind::zero, locals[slot], entry()});
}

ValueId SsaBuilder::resolve(ValueId value) const {
    while (value < values.size() && values[value].alias != no_value)
        value = values[value].alias;
    return value;
}

void SsaBuilder::declare_args(BlockId block, const valtype_vector &types) {
    if (blocks[block].args_declared || sealed(block))
        error<internal_error>("block arguments declared twice");
    blocks[block].args_declared = true;

    for (uint32_t i = 0; i < types.size(); ++i)
        blocks[block].args.push_back(new_phi(block, types[i], i, true));

    for (auto &pred : blocks[block].preds) {
        if (pred.args.size() > types.size())
            error<internal_error>("edge carries more values than the block "
                                  "accepts");
        // unreachable callers supply only a suffix of the arguments
        auto missing = types.size() - pred.args.size();
        for (size_t i = 0; i < missing; ++i)
            pred.args.insert(pred.args.begin() + i, undef(types[i]));
        for (size_t i = 0; i < types.size(); ++i)
            add_operand(blocks[block].args[i], pred.args[i]);
    }
}

std::vector<ValueId> SsaBuilder::args(BlockId block) const {
    std::vector<ValueId> result;
    for (auto arg : blocks[block].args)
        result.push_back(resolve(arg));
    return result;
}

void SsaBuilder::add_edge(BlockId from, BlockId to, std::vector<ValueId> args) {
    if (sealed(to))
        error<internal_error>("predecessor added to sealed block");

    auto &target = blocks[to];
    if (target.args_declared) {
        if (args.size() > target.args.size())
            error<internal_error>("edge carries more values than the block "
                                  "accepts");
        auto missing = target.args.size() - args.size();
        for (size_t i = 0; i < missing; ++i)
            args.insert(args.begin() + i,
                        undef(values[target.args[i]].type));
        for (size_t i = 0; i < args.size(); ++i)
            add_operand(target.args[i], args[i]);
    }
    target.preds.push_back(Predecessor{from, std::move(args)});
}

void SsaBuilder::seal(BlockId block) {
    if (sealed(block))
        return;

    // filling operands may read through this block and queue more placeholders
    for (size_t i = 0; i < blocks[block].pending.size(); ++i) {
        auto [slot, phi] = blocks[block].pending[i];
        add_phi_operands(block, slot, phi);
    }
    for (auto [slot, phi] : blocks[block].pending) {
        auto &definition = blocks[block].defs[slot];
        auto placeholder = std::get_if<Placeholder>(&definition);
        if (placeholder && placeholder->phi == phi)
            definition = Final{resolve(phi)};
    }
    blocks[block].pending.clear();

    for (auto arg : blocks[block].args)
        values[arg].complete = true;
    for (auto arg : blocks[block].args)
        try_remove_trivial_phi(arg);

    blocks[block].seal = SealState::sealed;
}

void SsaBuilder::write_local(BlockId block, uint32_t slot, ValueId value) {
    if (slot >= locals.size() || value >= values.size())
        error<internal_error>("write of unknown local or value");
    blocks[block].defs[slot] = Final{value};
}

ValueId SsaBuilder::read_local(BlockId block, uint32_t slot) {
    if (slot >= locals.size())
        error<internal_error>("read of unknown local");

    auto &defs = blocks[block].defs;
    if (auto it = defs.find(slot); it != defs.end())
        return resolve(defined_value(it->second));
    return resolve(lookup(block, slot));
}

ValueId SsaBuilder::find_definition(BlockId block, uint32_t slot,
                                    std::vector<PendingMerge> &merges) {
    std::vector<BlockId> chain;
    std::unordered_set<BlockId> seen;
    auto type = locals[slot];
    auto current = block;
    ValueId value;

    while (true) {
        auto &b = blocks[current];
        if (auto it = b.defs.find(slot); it != b.defs.end()) {
            value = resolve(defined_value(it->second));
            break;
        }
        if (b.seal == SealState::unsealed) {
            value = new_phi(current, type, slot, false);
            b.pending.emplace_back(slot, value);
            b.defs[slot] = Placeholder{value};
            break;
        }
        if (b.kind == BlockKind::entry) {
            value = entry_value(slot);
            b.defs[slot] = Final{value};
            break;
        }
        if (b.preds.empty()) {
            value = undef(type);
            b.defs[slot] = Final{value};
            break;
        }
        if (b.preds.size() == 1) {
            chain.push_back(current);
            seen.insert(current);
            current = b.preds[0].block;
            // a cycle of single predecessors is never reached from the entry
            if (seen.contains(current)) {
                value = undef(type);
                break;
            }
            continue;
        }

        // the phi is the definition while its operands are collected, which
        // terminates lookups that loop back into this block
        auto phi = new_phi(current, type, slot, false);
        b.defs[slot] = Final{phi};
        merges.push_back(PendingMerge{current, phi, 0, std::move(chain)});
        return no_value;
    }

    for (auto id : chain)
        blocks[id].defs[slot] = Final{value};
    return value;
}

// merges are kept on an explicit stack so long chains of joins cannot
// exhaust the native one
ValueId SsaBuilder::lookup(BlockId block, uint32_t slot) {
    std::vector<PendingMerge> merges;
    auto value = find_definition(block, slot, merges);

    while (!merges.empty()) {
        auto &merge = merges.back();
        if (value != no_value) {
            add_operand(merge.phi, value);
            ++merge.next;
            value = no_value;
        }

        auto &preds = blocks[merge.block].preds;
        if (merge.next < preds.size()) {
            // may push a new merge, so merge is not used past this point
            value = find_definition(preds[merge.next].block, slot, merges);
            continue;
        }

        values[merge.phi].complete = true;
        auto same = try_remove_trivial_phi(merge.phi);
        blocks[merge.block].defs[slot] = Final{same};
        for (auto id : merge.chain)
            blocks[id].defs[slot] = Final{same};
        merges.pop_back();
        value = same;
    }
    return value;
}

ValueId SsaBuilder::add_phi_operands(BlockId block, uint32_t slot,
                                     ValueId phi) {
    for (size_t i = 0; i < blocks[block].preds.size(); ++i)
        add_operand(phi, read_local(blocks[block].preds[i].block, slot));
    values[phi].complete = true;
    return try_remove_trivial_phi(phi);
}

void SsaBuilder::add_operand(ValueId phi, ValueId operand) {
    operand = resolve(operand);
    if (operand >= values.size())
        error<internal_error>("phi operand is not a value");

    values[phi].operands.push_back(operand);
    if (operand != phi && values[operand].kind == ValueKind::phi)
        values[operand].users.push_back(phi);
}

ValueId SsaBuilder::try_remove_trivial_phi(ValueId phi) {
    // removing one phi can make its users trivial in turn
    std::vector<ValueId> worklist{phi};

    while (!worklist.empty()) {
        auto candidate = worklist.back();
        worklist.pop_back();
        if (values[candidate].alias != no_value)
            continue;

        ValueId same = no_value;
        auto trivial = true;
        for (auto operand : values[candidate].operands) {
            operand = resolve(operand);
            if (operand == same || operand == candidate)
                continue;
            if (same != no_value) {
                trivial = false;
                break;
            }
            same = operand;
        }
        if (!trivial)
            continue;
        if (same == no_value)
            same = undef(values[candidate].type);

        values[candidate].alias = same;
        ++removed_phis_;

        auto users = std::move(values[candidate].users);
        values[candidate].users.clear();
        if (values[same].kind == ValueKind::phi)
            values[same].users.insert(values[same].users.end(), users.begin(),
                                      users.end());

        for (auto user : users) {
            if (user != candidate && values[user].complete &&
                values[user].alias == no_value)
                worklist.push_back(user);
        }
    }
    return resolve(phi);
}

ValueId SsaBuilder::emit(BlockId block, Instruction opcode, valtype type,
                         std::vector<ValueId> operands, uint64_t immediate) {
    for (auto &operand : operands) {
        operand = resolve(operand);
        if (operand >= values.size())
            error<internal_error>("operation operand is not a value");
    }

    auto op = SsaValue{ValueKind::op, type, block, immediate, opcode,
                       std::move(operands)};
    auto id = make_value(std::move(op));
    blocks[block].body.push_back(id);
    return id;
}

ValueId SsaBuilder::constant(BlockId block, valtype type, uint64_t bits) {
    auto id = make_value(SsaValue{ValueKind::constant, type, block, bits});
    blocks[block].body.push_back(id);
    return id;
}

ValueId SsaBuilder::project(BlockId block, ValueId tuple, uint32_t index,
                            valtype type) {
    auto id = make_value(SsaValue{ValueKind::project, type, block, index,
                                  Instruction::nop, {resolve(tuple)}});
    blocks[block].body.push_back(id);
    return id;
}

size_t SsaBuilder::live_phis() const {
    size_t count = 0;
    for (auto &value : values) {
        if (value.kind == ValueKind::phi && value.alias == no_value)
            ++count;
    }
    return count;
}

} // namespace weft
