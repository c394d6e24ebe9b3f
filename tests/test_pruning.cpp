#include <gtest/gtest.h>
#include "pruning/circuit_pruner.hpp"
#include "toy_fixtures.hpp"

#include <cmath>
#include <limits>
#include <random>

using namespace eap;

namespace {

Graph scoredGraph(uint32_t seed) {
    Graph g = Graph::build(eap_test::smallConfig());
    std::mt19937 rng(seed);
    std::normal_distribution<double> dist(0.0, 1.0);
    for (const Edge& e : g.edges()) g.accumulate(e.id, dist(rng));
    return g;
}

EdgeId edgeNamed(const Graph& g, const std::string& name) {
    std::optional<EdgeId> id = g.findEdge(name);
    EXPECT_TRUE(id.has_value()) << name;
    return id.value_or(0);
}

NodeId nodeNamed(const Graph& g, const std::string& name) {
    std::optional<NodeId> id = g.findNode(name);
    EXPECT_TRUE(id.has_value()) << name;
    return id.value_or(0);
}

} // namespace

TEST(PruningTest, KeepsExactlyMinOfNAndEdgeCount) {
    for (size_t n : {size_t(0), size_t(5), size_t(46), size_t(100)}) {
        Graph g = scoredGraph(1);
        PruneResult r = CircuitPruner().pruneTopN(g, n);
        EXPECT_EQ(r.edges_kept, std::min<size_t>(n, 46));
        EXPECT_EQ(g.countIncludedEdges(), std::min<size_t>(n, 46));
    }
}

TEST(PruningTest, KeptEdgesAreTheLargestMagnitudes) {
    Graph g = scoredGraph(2);
    PruneResult r = CircuitPruner().pruneTopN(g, 10);
    for (const Edge& e : g.edges()) {
        if (e.in_circuit) {
            EXPECT_GE(std::abs(e.score), r.min_kept_magnitude);
        } else {
            EXPECT_LE(std::abs(e.score), r.min_kept_magnitude);
        }
    }
}

TEST(PruningTest, NodeCountMonotonicInN) {
    size_t previous = 0;
    for (size_t n = 0; n <= 46; n++) {
        Graph g = scoredGraph(3);
        size_t nodes = CircuitPruner().pruneTopN(g, n).nodes_kept;
        EXPECT_GE(nodes, previous) << "n = " << n;
        previous = nodes;
    }
    EXPECT_EQ(previous, 8u);
}

TEST(PruningTest, DeadEndsRemovedUnlessKept) {
    Graph g = Graph::build(eap_test::smallConfig());
    g.accumulate(edgeNamed(g, "input->a0.h0<v>"), 10.0);
    g.accumulate(edgeNamed(g, "input->logits"), 5.0);
    NodeId head = nodeNamed(g, "a0.h0");

    CircuitPruner().pruneTopN(g, 2, false);
    EXPECT_TRUE(g.edge(edgeNamed(g, "input->a0.h0<v>")).in_circuit);
    EXPECT_FALSE(g.node(head).in_circuit);
    EXPECT_EQ(g.countIncludedNodes(), 2u);   // input, logits

    CircuitPruner().pruneTopN(g, 2, true);
    EXPECT_TRUE(g.node(head).in_circuit);
    EXPECT_EQ(g.countIncludedNodes(), 3u);
}

TEST(PruningTest, NodesWithoutKeptInputsDropped) {
    Graph g = Graph::build(eap_test::smallConfig());
    g.accumulate(edgeNamed(g, "a0.h1->logits"), 3.0);

    CircuitPruner().pruneTopN(g, 1, true);
    EXPECT_FALSE(g.node(nodeNamed(g, "a0.h1")).in_circuit);
    EXPECT_TRUE(g.node(nodeNamed(g, "logits")).in_circuit);
    EXPECT_TRUE(g.node(nodeNamed(g, "input")).in_circuit);
}

TEST(PruningTest, TiesBrokenByEdgeId) {
    Graph g = Graph::build(eap_test::smallConfig());
    CircuitPruner().pruneTopN(g, 3);
    for (const Edge& e : g.edges()) {
        EXPECT_EQ(e.in_circuit, e.id < 3) << g.edgeName(e.id);
    }
}

TEST(PruningTest, RanksByMagnitudeNotSign) {
    Graph g = Graph::build(eap_test::smallConfig());
    g.accumulate(10, -4.0);
    g.accumulate(20, 3.0);
    g.accumulate(30, 1.0);

    std::vector<EdgeId> order = CircuitPruner::rankEdges(g);
    EXPECT_EQ(order[0], 10u);
    EXPECT_EQ(order[1], 20u);
    EXPECT_EQ(order[2], 30u);
    EXPECT_EQ(order[3], 0u);
}

TEST(PruningTest, NaNScoresRankLast) {
    Graph g = Graph::build(eap_test::smallConfig());
    g.accumulate(0, std::numeric_limits<double>::quiet_NaN());
    g.accumulate(1, 0.5);

    std::vector<EdgeId> order = CircuitPruner::rankEdges(g);
    EXPECT_EQ(order.front(), 1u);
    EXPECT_EQ(order.back(), 0u);

    CircuitPruner().pruneTopN(g, 45);
    EXPECT_FALSE(g.edge(0).in_circuit);
}

TEST(PruningTest, EmptyCircuit) {
    Graph g = scoredGraph(4);
    EXPECT_EQ(CircuitPruner().pruneTopN(g, 0, false).nodes_kept, 0u);
    EXPECT_EQ(CircuitPruner().pruneTopN(g, 0, true).nodes_kept, 1u);
    EXPECT_TRUE(g.node(g.catalog().inputNode()).in_circuit);
}

TEST(PruningTest, GraphDelegatesToPruner) {
    Graph a = scoredGraph(5);
    Graph b = scoredGraph(5);
    a.pruneTopN(12);
    CircuitPruner().pruneTopN(b, 12);
    for (size_t i = 0; i < a.edgeCount(); i++) {
        EXPECT_EQ(a.edge(static_cast<EdgeId>(i)).in_circuit, b.edge(static_cast<EdgeId>(i)).in_circuit);
    }
    EXPECT_EQ(a.countIncludedNodes(), b.countIncludedNodes());
}

TEST(PruningTest, InjectedPathCircuit) {
    ToyTransformer model = eap_test::injectedPathModel();
    Graph g = Graph::build(model.config());
    g.accumulate(edgeNamed(g, "input->a1.h0<v>"), 0.5);
    g.accumulate(edgeNamed(g, "a1.h0->logits"), 0.5);

    PruneResult r = CircuitPruner().pruneTopN(g, 2);
    EXPECT_EQ(r.edges_kept, 2u);
    EXPECT_EQ(r.nodes_kept, 3u);
    EXPECT_TRUE(g.node(nodeNamed(g, "a1.h0")).in_circuit);
    EXPECT_FALSE(g.node(nodeNamed(g, "a0.h0")).in_circuit);
}
