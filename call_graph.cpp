#include "call_graph.hpp"
#include <string>
#include <utility>

namespace weft {

namespace {

template <typename T, typename... Args>
[[noreturn]] void funclet_error(uint32_t funclet, Args &&...args) {
    auto e = T(std::forward<Args>(args)...);
    e.in_funclet(funclet);
    throw e;
}

} // namespace

bool matches(const CallEdge &edge, const valtype_vector &params) {
    auto &args = edge.args;
    if (args.size() > params.size())
        return false;
    // an unreachable caller may have fewer values than the signature needs
    if (!edge.polymorphic && args.size() != params.size())
        return false;

    auto skipped = params.size() - args.size();
    for (size_t i = 0; i < args.size(); ++i) {
        if (args[i] != params[skipped + i] && args[i] != valtype::any)
            return false;
    }
    return true;
}

FuncletCallGraph::FuncletCallGraph(uint32_t n_funclets) : nodes(n_funclets) {
    if (n_funclets == 0)
        error<internal_error>("funclet region without funclets");
}

std::vector<const CallEdge *>
FuncletCallGraph::incoming(uint32_t index) const {
    std::vector<const CallEdge *> result;
    for (auto edge : nodes[index].incoming)
        result.push_back(&edges_[edge]);
    return result;
}

uint32_t FuncletCallGraph::resolve(int32_t delta) const {
    auto target = static_cast<int64_t>(current_) + delta;
    if (target < 0 || target >= static_cast<int64_t>(nodes.size()))
        error<structural_error>("funclet call delta " + std::to_string(delta) +
                                " out of range for region of " +
                                std::to_string(nodes.size()) + " funclets");
    return static_cast<uint32_t>(target);
}

void FuncletCallGraph::enter(uint32_t index) {
    if (index != visited || index >= nodes.size())
        error<internal_error>("funclets must be entered in index order");

    nodes[index].entered = true;
    current_ = index;
    ++visited;
}

void FuncletCallGraph::declare(uint32_t index, valtype_vector params,
                               uint32_t num_preds, bool explicit_signature) {
    auto &node = nodes[index];
    if (!node.entered || node.params)
        error<internal_error>("funclet signature declared out of order");

    node.params = std::move(params);
    node.declared_preds = num_preds;
    node.explicit_signature = explicit_signature;
    check_incoming(index);
}

const valtype_vector &FuncletCallGraph::infer(uint32_t index) {
    auto &node = nodes[index];
    if (!node.entered || node.params)
        error<internal_error>("funclet signature inferred out of order");

    for (auto edge : node.incoming) {
        if (!edges_[edge].polymorphic) {
            node.params = edges_[edge].args;
            break;
        }
    }
    if (!node.params) {
        if (node.incoming.empty())
            funclet_error<unresolved_signature_error>(
                index, "funclet has no signature and is not reachable from "
                       "above");
        funclet_error<unresolved_signature_error>(
            index, "funclet has no signature and is only reachable from "
                   "unreachable code");
    }

    check_incoming(index);
    return *node.params;
}

void FuncletCallGraph::check_incoming(uint32_t index) {
    auto &node = nodes[index];
    for (auto i : node.incoming) {
        auto &edge = edges_[i];
        if (edge.checked)
            continue;
        if (!matches(edge, *node.params))
            funclet_error<type_mismatch_error>(
                index,
                "funclet call from funclet " + std::to_string(edge.from) +
                    " at offset " + std::to_string(edge.offset) +
                    " does not match funclet signature",
                *node.params, edge.args);
        edge.checked = true;
    }
}

bool FuncletCallGraph::add_edge(uint32_t to, valtype_vector args,
                                bool polymorphic, size_t offset) {
    if (to >= nodes.size())
        error<internal_error>("funclet call target out of range");

    auto &target = nodes[to];
    auto edge = CallEdge{
        current_, to, std::move(args), to <= current_, polymorphic, offset};

    if (edge.backward) {
        if (target.observed_preds == target.declared_preds)
            funclet_error<predecessor_count_error>(
                to, "funclet declares " +
                        std::to_string(target.declared_preds) +
                        " backward predecessors but is called from below "
                        "more often");
        if (target.sealed)
            error<internal_error>("predecessor added to sealed funclet");
        if (!matches(edge, *target.params))
            funclet_error<type_mismatch_error>(
                to, "backward funclet call does not match funclet signature",
                *target.params, edge.args);

        edge.checked = true;
        ++target.observed_preds;
    } else if (target.entered) {
        error<internal_error>("forward call to an entered funclet");
    }

    target.incoming.push_back(edges_.size());
    edges_.push_back(std::move(edge));
    return edges_.back().backward && seal_ready(to);
}

bool FuncletCallGraph::seal_ready(uint32_t index) const {
    auto &node = nodes[index];
    return node.entered && !node.sealed && node.params &&
           node.observed_preds == node.declared_preds;
}

void FuncletCallGraph::mark_sealed(uint32_t index) {
    if (nodes[index].sealed)
        return;
    if (!seal_ready(index))
        error<internal_error>("funclet sealed before its last predecessor");
    nodes[index].sealed = true;
}

void FuncletCallGraph::finalize() const {
    if (visited != nodes.size())
        error<structural_error>(
            "funclet region ends before all funclets are produced");

    for (uint32_t i = 0; i < nodes.size(); ++i) {
        auto &node = nodes[i];
        if (node.observed_preds != node.declared_preds)
            funclet_error<predecessor_count_error>(
                i, "funclet declares " + std::to_string(node.declared_preds) +
                       " backward predecessors but " +
                       std::to_string(node.observed_preds) +
                       " were observed");
        if (!node.sealed)
            error<internal_error>("funclet left unsealed");
    }

    for (auto &edge : edges_) {
        if (!edge.checked)
            error<internal_error>("funclet call left unchecked");
    }
}

} // namespace weft
