#pragma once

#include "errors.hpp"
#include "wasm.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace weft {

struct CallEdge {
    uint32_t from;
    uint32_t to;
    valtype_vector args;
    // to <= from, self calls included
    bool backward;
    // arguments were taken from an unreachable stack
    bool polymorphic;
    size_t offset;
    bool checked = false;
};

struct FuncletNode {
    std::optional<valtype_vector> params;
    bool explicit_signature = false;
    uint32_t declared_preds = 0;
    uint32_t observed_preds = 0;
    bool entered = false;
    bool sealed = false;
    std::vector<uint32_t> incoming;
};

bool matches(const CallEdge &edge, const valtype_vector &params);

class FuncletCallGraph {
    std::vector<FuncletNode> nodes;
    std::vector<CallEdge> edges_;
    uint32_t visited = 0;
    uint32_t current_ = 0;

    void check_incoming(uint32_t index);

  public:
    explicit FuncletCallGraph(uint32_t n_funclets);

    uint32_t size() const { return nodes.size(); }
    uint32_t current() const { return current_; }
    const FuncletNode &node(uint32_t index) const { return nodes[index]; }
    std::span<const CallEdge> edges() const { return edges_; }
    std::vector<const CallEdge *> incoming(uint32_t index) const;

    uint32_t resolve(int32_t delta) const;

    // makes index the current funclet; its forward predecessors are final
    void enter(uint32_t index);
    void declare(uint32_t index, valtype_vector params, uint32_t num_preds,
                 bool explicit_signature = true);
    const valtype_vector &infer(uint32_t index);

    // records a call from the current funclet, returns whether the target
    // became ready to seal
    bool add_edge(uint32_t to, valtype_vector args, bool polymorphic,
                  size_t offset);

    bool seal_ready(uint32_t index) const;
    void mark_sealed(uint32_t index);

    void finalize() const;
};

} // namespace weft
