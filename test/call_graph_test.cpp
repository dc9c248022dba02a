#include "../call_graph.hpp"
#include <gtest/gtest.h>

using namespace weft;

TEST(FuncletCallGraph, ResolvesDeltasInsideTheRegion) {
    FuncletCallGraph graph(3);
    graph.enter(0);
    graph.declare(0, {}, 0);
    graph.mark_sealed(0);
    graph.add_edge(1, {}, false, 0);
    graph.enter(1);

    EXPECT_EQ(graph.resolve(0), 1u);
    EXPECT_EQ(graph.resolve(-1), 0u);
    EXPECT_EQ(graph.resolve(1), 2u);
    EXPECT_THROW(graph.resolve(2), structural_error);
    EXPECT_THROW(graph.resolve(-2), structural_error);
}

TEST(FuncletCallGraph, SelfLoopSealsOnItsBackwardEdge) {
    FuncletCallGraph graph(1);
    graph.enter(0);
    graph.declare(0, {valtype::i32}, 1);
    EXPECT_FALSE(graph.seal_ready(0));
    EXPECT_THROW(graph.mark_sealed(0), internal_error);

    EXPECT_TRUE(graph.add_edge(0, {valtype::i32}, false, 9));
    graph.mark_sealed(0);
    graph.mark_sealed(0);
    EXPECT_TRUE(graph.node(0).sealed);

    auto edges = graph.edges();
    ASSERT_EQ(edges.size(), 1u);
    EXPECT_TRUE(edges[0].backward);
    EXPECT_EQ(edges[0].offset, 9u);
    EXPECT_NO_THROW(graph.finalize());
}

TEST(FuncletCallGraph, InfersTheSignatureOfForwardOnlyFunclets) {
    FuncletCallGraph graph(2);
    graph.enter(0);
    graph.declare(0, {}, 0, false);
    graph.mark_sealed(0);
    EXPECT_FALSE(graph.add_edge(1, {valtype::i32, valtype::f64}, false, 4));
    EXPECT_FALSE(graph.add_edge(1, {valtype::i32, valtype::f64}, false, 7));

    graph.enter(1);
    EXPECT_EQ(graph.infer(1), (valtype_vector{valtype::i32, valtype::f64}));
    EXPECT_FALSE(graph.node(1).explicit_signature);
    EXPECT_EQ(graph.incoming(1).size(), 2u);
    EXPECT_TRUE(graph.seal_ready(1));
    graph.mark_sealed(1);
    EXPECT_NO_THROW(graph.finalize());
}

TEST(FuncletCallGraph, DisagreeingForwardEdgesAreATypeMismatch) {
    FuncletCallGraph graph(2);
    graph.enter(0);
    graph.declare(0, {}, 0, false);
    graph.add_edge(1, {valtype::i32}, false, 4);
    graph.add_edge(1, {valtype::f32}, false, 8);
    graph.enter(1);

    try {
        graph.infer(1);
        FAIL() << "expected a type mismatch";
    } catch (type_mismatch_error &e) {
        EXPECT_EQ(e.info.funclet, 1u);
        EXPECT_NE(e.info.message.find("at offset 8"), std::string::npos);
        EXPECT_EQ(*e.info.expected, valtype_vector{valtype::i32});
        EXPECT_EQ(*e.info.actual, valtype_vector{valtype::f32});
    }
}

TEST(FuncletCallGraph, ExplicitSignatureChecksQueuedEdges) {
    FuncletCallGraph graph(2);
    graph.enter(0);
    graph.declare(0, {}, 0, false);
    graph.add_edge(1, {valtype::i64}, false, 2);
    graph.enter(1);

    EXPECT_THROW(graph.declare(1, {valtype::i32}, 0), type_mismatch_error);
}

TEST(FuncletCallGraph, BackwardEdgesAreCountedAgainstNumPreds) {
    FuncletCallGraph graph(2);
    graph.enter(0);
    graph.declare(0, {}, 0, false);
    graph.mark_sealed(0);
    graph.add_edge(1, {}, false, 1);
    graph.enter(1);
    graph.infer(1);
    graph.mark_sealed(1);

    try {
        graph.add_edge(0, {}, false, 5);
        FAIL() << "expected a predecessor count error";
    } catch (predecessor_count_error &e) {
        EXPECT_EQ(e.info.kind, ErrorKind::predecessor_count);
        EXPECT_EQ(e.info.funclet, 0u);
    }
}

TEST(FuncletCallGraph, ForwardEdgesDoNotCountAsPredecessors) {
    FuncletCallGraph graph(2);
    graph.enter(0);
    graph.declare(0, {}, 0, false);
    graph.mark_sealed(0);
    graph.add_edge(1, {}, false, 1);
    graph.add_edge(1, {}, false, 2);
    graph.enter(1);
    graph.declare(1, {}, 1);

    EXPECT_EQ(graph.node(1).observed_preds, 0u);
    EXPECT_FALSE(graph.seal_ready(1));
    EXPECT_TRUE(graph.add_edge(1, {}, false, 3));
    graph.mark_sealed(1);
    EXPECT_NO_THROW(graph.finalize());
}

TEST(FuncletCallGraph, MissingBackwardEdgesFailAtFinalize) {
    FuncletCallGraph graph(1);
    graph.enter(0);
    graph.declare(0, {}, 2);
    EXPECT_FALSE(graph.add_edge(0, {}, false, 3));

    try {
        graph.finalize();
        FAIL() << "expected a predecessor count error";
    } catch (predecessor_count_error &e) {
        EXPECT_EQ(e.info.message,
                  "funclet declares 2 backward predecessors but 1 were "
                  "observed");
    }
}

TEST(FuncletCallGraph, RegionMustProduceEveryFunclet) {
    FuncletCallGraph graph(2);
    graph.enter(0);
    graph.declare(0, {}, 0, false);
    graph.mark_sealed(0);
    EXPECT_THROW(graph.finalize(), structural_error);
}

TEST(FuncletCallGraph, UnreachableCallersNeverDriveInference) {
    FuncletCallGraph graph(2);
    graph.enter(0);
    graph.declare(0, {}, 0, false);
    graph.add_edge(1, {valtype::i32}, true, 3);
    graph.enter(1);

    try {
        graph.infer(1);
        FAIL() << "expected an unresolved signature";
    } catch (unresolved_signature_error &e) {
        EXPECT_EQ(e.info.funclet, 1u);
        EXPECT_EQ(e.info.message, "funclet has no signature and is only "
                                  "reachable from unreachable code");
    }
}

TEST(FuncletCallGraph, FuncletWithoutCallersIsUnresolved) {
    FuncletCallGraph graph(2);
    graph.enter(0);
    graph.declare(0, {}, 0, false);
    graph.enter(1);
    EXPECT_THROW(graph.infer(1), unresolved_signature_error);
}

TEST(FuncletCallGraph, FuncletsAreEnteredInOrder) {
    FuncletCallGraph graph(3);
    EXPECT_THROW(graph.enter(1), internal_error);
    graph.enter(0);
    EXPECT_THROW(graph.enter(2), internal_error);
}

TEST(CallEdgeMatch, PolymorphicEdgesMatchASuffix) {
    auto params = valtype_vector{valtype::i64, valtype::f32};

    auto exact = CallEdge{0, 1, params, false, false, 0};
    EXPECT_TRUE(matches(exact, params));

    auto short_edge = CallEdge{0, 1, {valtype::f32}, false, false, 0};
    EXPECT_FALSE(matches(short_edge, params));

    auto suffix = CallEdge{0, 1, {valtype::f32}, false, true, 0};
    EXPECT_TRUE(matches(suffix, params));

    auto wildcard = CallEdge{0, 1, {valtype::any, valtype::f32}, false, true, 0};
    EXPECT_TRUE(matches(wildcard, params));

    auto wrong = CallEdge{0, 1, {valtype::i32}, false, true, 0};
    EXPECT_FALSE(matches(wrong, params));
}
