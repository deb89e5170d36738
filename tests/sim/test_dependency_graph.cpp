/**
 * @file test_dependency_graph.cpp
 * @brief Unit tests for DependencyGraph
 */

#include <gtest/gtest.h>
#include <sigflow/sim/DependencyGraph.hpp>

#include <algorithm>
#include <string>
#include <vector>

namespace sigflow {
namespace {

// Position of a block in an execution order
std::size_t PositionOf(const std::vector<std::string> &order, const std::string &name) {
    auto it = std::find(order.begin(), order.end(), name);
    return static_cast<std::size_t>(std::distance(order.begin(), it));
}

// =============================================================================
// Construction
// =============================================================================

TEST(DependencyGraphTest, EmptyGraphHasNoNodes) {
    DependencyGraph graph;
    EXPECT_TRUE(graph.Empty());
    EXPECT_EQ(graph.Size(), 0u);
    EXPECT_EQ(graph.NumEdges(), 0u);
}

TEST(DependencyGraphTest, NodesKeepRegistrationOrder) {
    DependencyGraph graph;
    graph.AddNode("zeta");
    graph.AddNode("alpha");
    graph.AddNode("mid");
    graph.AddNode("alpha"); // no-op

    const auto &nodes = graph.GetNodes();
    ASSERT_EQ(nodes.size(), 3u);
    EXPECT_EQ(nodes[0], "zeta");
    EXPECT_EQ(nodes[1], "alpha");
    EXPECT_EQ(nodes[2], "mid");
}

TEST(DependencyGraphTest, AddEdgeCreatesBothNodes) {
    DependencyGraph graph;
    graph.AddEdge("producer", "consumer", "sig");

    EXPECT_EQ(graph.Size(), 2u);
    EXPECT_TRUE(graph.HasNode("producer"));
    EXPECT_TRUE(graph.HasNode("consumer"));
    EXPECT_FALSE(graph.HasNode("other"));
}

TEST(DependencyGraphTest, ParallelEdgesMergeButKeepSignals) {
    DependencyGraph graph;
    graph.AddEdge("a", "b", "s1");
    graph.AddEdge("a", "b", "s2");
    graph.AddEdge("a", "b", "s1"); // exact duplicate

    EXPECT_EQ(graph.NumEdges(), 1u);
    auto edges = graph.GetEdges();
    ASSERT_EQ(edges.size(), 1u);
    EXPECT_EQ(edges[0].producer, "a");
    EXPECT_EQ(edges[0].consumer, "b");
    EXPECT_EQ(edges[0].signals, (std::vector<std::string>{"s1", "s2"}));
}

TEST(DependencyGraphTest, DependentsAndDependencies) {
    DependencyGraph graph;
    graph.AddEdge("src", "gain", "x");
    graph.AddEdge("src", "sink", "x");
    graph.AddEdge("gain", "sink", "y");

    EXPECT_EQ(graph.GetDependents("src"), (std::vector<std::string>{"gain", "sink"}));
    EXPECT_EQ(graph.GetDependencies("sink"), (std::vector<std::string>{"src", "gain"}));
    EXPECT_TRUE(graph.GetDependencies("src").empty());
    EXPECT_TRUE(graph.GetDependents("unknown").empty());
}

// =============================================================================
// Topological Sort
// =============================================================================

TEST(DependencyGraphTest, SortRespectsEdges) {
    DependencyGraph graph;
    graph.AddNode("sink");
    graph.AddNode("gain");
    graph.AddNode("src");
    graph.AddEdge("src", "gain", "x");
    graph.AddEdge("gain", "sink", "y");

    auto result = graph.TopologicalSort();
    ASSERT_TRUE(result.IsValid());
    EXPECT_EQ(result.execution_order, (std::vector<std::string>{"src", "gain", "sink"}));
}

TEST(DependencyGraphTest, SortBreaksTiesByRegistrationOrder) {
    DependencyGraph graph;
    graph.AddNode("c");
    graph.AddNode("a");
    graph.AddNode("b");

    auto result = graph.TopologicalSort();
    EXPECT_EQ(result.execution_order, (std::vector<std::string>{"c", "a", "b"}));
}

TEST(DependencyGraphTest, SortIsDeterministic) {
    auto make = [] {
        DependencyGraph graph;
        graph.AddEdge("a", "d", "s1");
        graph.AddEdge("b", "d", "s2");
        graph.AddEdge("c", "e", "s3");
        graph.AddEdge("d", "e", "s4");
        return graph;
    };

    auto first = make().TopologicalSort();
    for (int i = 0; i < 5; ++i) {
        EXPECT_EQ(make().TopologicalSort().execution_order, first.execution_order);
    }
}

TEST(DependencyGraphTest, DiamondOrderIsSound) {
    DependencyGraph graph;
    graph.AddEdge("top", "left", "l");
    graph.AddEdge("top", "right", "r");
    graph.AddEdge("left", "bottom", "lb");
    graph.AddEdge("right", "bottom", "rb");

    auto result = graph.TopologicalSort();
    ASSERT_TRUE(result.IsValid());
    const auto &order = result.execution_order;
    ASSERT_EQ(order.size(), 4u);
    for (const auto &edge : graph.GetEdges()) {
        EXPECT_LT(PositionOf(order, edge.producer), PositionOf(order, edge.consumer))
            << edge.producer << " -> " << edge.consumer;
    }
}

// =============================================================================
// Cycle Detection
// =============================================================================

TEST(DependencyGraphTest, TwoBlockCycleDetected) {
    DependencyGraph graph;
    graph.AddEdge("a", "b", "ab");
    graph.AddEdge("b", "a", "ba");

    auto result = graph.TopologicalSort();
    EXPECT_TRUE(result.has_cycles);
    EXPECT_FALSE(result.IsValid());
    ASSERT_EQ(result.cycles.size(), 1u);
    EXPECT_EQ(result.cycles[0].blocks, (std::vector<std::string>{"a", "b"}));
    EXPECT_EQ(result.cycles[0].signals, (std::vector<std::string>{"ab", "ba"}));
    EXPECT_EQ(result.cycles[0].ToString(), "a -[ab]-> b -[ba]-> a");
}

TEST(DependencyGraphTest, SelfEdgeIsACycle) {
    DependencyGraph graph;
    graph.AddNode("const");
    graph.AddEdge("adder", "adder", "x");

    auto result = graph.TopologicalSort();
    ASSERT_TRUE(result.has_cycles);
    ASSERT_EQ(result.cycles.size(), 1u);
    EXPECT_EQ(result.cycles[0].blocks, (std::vector<std::string>{"adder"}));
    EXPECT_EQ(result.cycles[0].ToString(), "adder -[x]-> adder");
}

TEST(DependencyGraphTest, CycleDownstreamOfAcyclicPart) {
    DependencyGraph graph;
    graph.AddEdge("src", "a", "s");
    graph.AddEdge("a", "b", "ab");
    graph.AddEdge("b", "c", "bc");
    graph.AddEdge("c", "a", "ca");

    auto cycles = graph.DetectCycles();
    ASSERT_EQ(cycles.size(), 1u);
    EXPECT_EQ(cycles[0].blocks, (std::vector<std::string>{"a", "b", "c"}));
    EXPECT_EQ(cycles[0].signals, (std::vector<std::string>{"ab", "bc", "ca"}));
}

TEST(DependencyGraphTest, AcyclicGraphHasNoCycles) {
    DependencyGraph graph;
    graph.AddEdge("a", "b", "s");
    EXPECT_TRUE(graph.DetectCycles().empty());
}

// =============================================================================
// DOT Export
// =============================================================================

TEST(DependencyGraphTest, ToDotListsNodesAndLabelledEdges) {
    DependencyGraph graph;
    graph.AddNode("lonely");
    graph.AddEdge("a", "b", "s1");
    graph.AddEdge("a", "b", "s2");

    std::string dot = graph.ToDot("demo");
    EXPECT_NE(dot.find("digraph \"demo\" {"), std::string::npos);
    EXPECT_NE(dot.find("rankdir=LR;"), std::string::npos);
    EXPECT_NE(dot.find("\"lonely\";"), std::string::npos);
    EXPECT_NE(dot.find("\"a\" -> \"b\" [label=\"s1, s2\"];"), std::string::npos);
    EXPECT_EQ(dot.back(), '\n');
}

TEST(DependencyGraphTest, ToDotEscapesQuotes) {
    DependencyGraph graph;
    graph.AddNode("say \"hi\"");

    std::string dot = graph.ToDot();
    EXPECT_NE(dot.find("\"say \\\"hi\\\"\";"), std::string::npos);
}

} // namespace
} // namespace sigflow
