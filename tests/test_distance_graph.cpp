#include <gtest/gtest.h>
#include "distance/distance_graph.hpp"
#include "storage/memory_store.hpp"
#include "test_support.hpp"

using namespace landscape;
using test_support::LookupDistance;

class DistanceGraphTest : public ::testing::Test {
protected:
    DistanceGraphTest()
        : distance_fn(lookup.function()),
          cache(store, distance_fn, diagnostics),
          dg(store, graph, cache, diagnostics) {}

    // Minimum whose lookup index is `index`; energies are all distinct.
    Minimum addMinimum(int index) {
        Minimum m = store.addMinimum(-static_cast<double>(index), {static_cast<double>(index)});
        graph.addMinimum(m.id);
        return m;
    }

    void connect(const Minimum& a, const Minimum& b) {
        graph.addTransitionState(store.addTransitionState(0.0, {}, a.id, b.id));
    }

    MemoryStore store;
    ConnectivityGraph graph;
    LookupDistance lookup;
    CallbackDistance distance_fn;
    Diagnostics diagnostics;
    DistanceCache cache;
    DistanceGraph dg;
};

// ─── Admission ─────────────────────────────────────────────────

TEST_F(DistanceGraphTest, AdmitAddsEdgeToEveryNode) {
    Minimum a = addMinimum(0);
    Minimum b = addMinimum(2);
    Minimum c = addMinimum(5);

    EXPECT_TRUE(dg.admit(a));
    EXPECT_TRUE(dg.admit(b));
    EXPECT_TRUE(dg.admit(c));
    EXPECT_FALSE(dg.admit(b));

    EXPECT_EQ(dg.nodeCount(), 3u);
    EXPECT_EQ(dg.edgeCount(), 3u);
    EXPECT_DOUBLE_EQ(*dg.weight(a.id, b.id), 4.0);
    EXPECT_DOUBLE_EQ(*dg.weight(c.id, a.id), 25.0);
    EXPECT_DOUBLE_EQ(*dg.weight(b.id, c.id), 9.0);
    EXPECT_EQ(cache.computeCount(), 3u);
    EXPECT_EQ(diagnostics.count(DiagnosticKind::MINIMUM_ADMITTED), 3u);
}

TEST_F(DistanceGraphTest, AdmitSkipsDistancesWithinComponent) {
    Minimum a = addMinimum(0);
    Minimum b = addMinimum(2);
    Minimum c = addMinimum(5);
    connect(a, b);

    dg.admit(a);
    dg.admit(b);
    dg.admit(c);

    EXPECT_DOUBLE_EQ(*dg.weight(a.id, b.id), 0.0);
    EXPECT_FALSE(cache.contains(a.id, b.id));
    EXPECT_EQ(cache.computeCount(), 2u);
}

TEST_F(DistanceGraphTest, FailedAdmissionChangesNothing) {
    DistanceGraphConfig config;
    config.db_update_min = 1;
    DistanceCache eager(store, distance_fn, diagnostics, config);
    DistanceGraph g(store, graph, eager, diagnostics);

    Minimum a = addMinimum(0);
    Minimum b = addMinimum(1);
    Minimum c = addMinimum(2);
    Minimum bad = addMinimum(3);
    lookup.failOn(3, 1);

    g.admit(a);
    g.admit(b);
    g.admit(c);
    size_t stored = store.distanceCount();
    size_t cached = eager.size();

    EXPECT_THROW(g.admit(bad), AdmissionError);

    EXPECT_FALSE(g.hasNode(bad.id));
    EXPECT_EQ(g.nodeCount(), 3u);
    EXPECT_EQ(g.edgeCount(), 3u);
    EXPECT_EQ(eager.size(), cached);
    EXPECT_FALSE(eager.contains(bad.id, a.id));
    EXPECT_FALSE(eager.contains(bad.id, c.id));
    EXPECT_EQ(store.distanceCount(), stored);
    EXPECT_FALSE(store.inTransaction());
    EXPECT_EQ(diagnostics.count(DiagnosticKind::ADMISSION_ROLLED_BACK), 1u);

    // the failure is not sticky
    lookup = LookupDistance();
    EXPECT_TRUE(g.admit(bad));
    EXPECT_EQ(g.edgeCount(), 6u);
}

TEST_F(DistanceGraphTest, AdmissionErrorNamesMinimum) {
    Minimum a = addMinimum(0);
    Minimum b = addMinimum(1);
    lookup.failOn(0, 1);
    dg.admit(a);
    try {
        dg.admit(b);
        FAIL() << "expected AdmissionError";
    } catch (const AdmissionError& e) {
        EXPECT_EQ(e.minimum(), b.id);
    }
}

// ─── Initialization ────────────────────────────────────────────

TEST_F(DistanceGraphTest, InitializeAdmitsRelevantMinimaFromCachedDistances) {
    Minimum s = addMinimum(0);
    Minimum e = addMinimum(10);
    Minimum inside = addMinimum(4);
    Minimum outside = addMinimum(30);
    Minimum unknown = addMinimum(5);
    store.setDistanceBulk({
        DistanceEntry(MinimumPair(s.id, e.id), 10.0),
        DistanceEntry(MinimumPair(inside.id, s.id), 4.0),
        DistanceEntry(MinimumPair(inside.id, e.id), 6.0),
        DistanceEntry(MinimumPair(outside.id, s.id), 30.0),
        DistanceEntry(MinimumPair(outside.id, e.id), 20.0),
    });

    size_t admitted = dg.initialize(s, e);

    EXPECT_EQ(admitted, 3u);
    EXPECT_TRUE(dg.hasNode(inside.id));
    EXPECT_FALSE(dg.hasNode(outside.id));
    EXPECT_FALSE(dg.hasNode(unknown.id));
    // every distance the admitted nodes need was already persisted
    EXPECT_EQ(cache.computeCount(), 0u);
}

TEST_F(DistanceGraphTest, InitializeAllAdmitsEveryMinimum) {
    Minimum s = addMinimum(0);
    Minimum e = addMinimum(3);
    addMinimum(1);
    addMinimum(2);

    InitOptions options;
    options.mode = AdmissionMode::ALL;
    EXPECT_EQ(dg.initialize(s, e, options), 4u);
    EXPECT_EQ(dg.edgeCount(), 6u);
}

TEST_F(DistanceGraphTest, InitializeStartEndOnly) {
    Minimum s = addMinimum(0);
    Minimum e = addMinimum(3);
    addMinimum(1);

    InitOptions options;
    options.mode = AdmissionMode::START_END_ONLY;
    EXPECT_EQ(dg.initialize(s, e, options), 2u);
    EXPECT_DOUBLE_EQ(*dg.weight(s.id, e.id), 9.0);
}

TEST_F(DistanceGraphTest, InitializeWithoutLoadingDistances) {
    Minimum s = addMinimum(0);
    Minimum e = addMinimum(3);
    store.setDistanceBulk({DistanceEntry(MinimumPair(s.id, e.id), 7.0)});

    InitOptions options;
    options.mode = AdmissionMode::ALL;
    options.load_no_distances = true;
    addMinimum(1);

    EXPECT_EQ(dg.initialize(s, e, options), 2u);
    // the stored distance was not loaded, so it was recomputed
    EXPECT_DOUBLE_EQ(*dg.weight(s.id, e.id), 9.0);
}

// ─── Shortest path ─────────────────────────────────────────────

TEST_F(DistanceGraphTest, ShortestPathPrefersSmallSteps) {
    Minimum s = addMinimum(0);
    Minimum m = addMinimum(1);
    Minimum e = addMinimum(2);
    dg.admit(s);
    dg.admit(m);
    dg.admit(e);

    auto path = dg.shortestPath(s.id, e.id);
    ASSERT_TRUE(path.has_value());
    EXPECT_EQ(path->nodes, (std::vector<MinimumId>{s.id, m.id, e.id}));
    EXPECT_DOUBLE_EQ(path->totalWeight(), 2.0);
}

TEST_F(DistanceGraphTest, ShortestPathFollowsZeroEdges) {
    Minimum s = addMinimum(0);
    Minimum m = addMinimum(5);
    Minimum e = addMinimum(6);
    dg.admit(s);
    dg.admit(m);
    dg.admit(e);
    connect(s, m);
    dg.markConnected(s.id, m.id);

    auto path = dg.shortestPath(s.id, e.id);
    ASSERT_TRUE(path.has_value());
    EXPECT_EQ(path->nodes, (std::vector<MinimumId>{s.id, m.id, e.id}));
    EXPECT_DOUBLE_EQ(path->totalWeight(), 1.0);
    EXPECT_EQ(path->weakestLink(), MinimumPair(m.id, e.id));
}

TEST_F(DistanceGraphTest, ShortestPathToUnadmittedMinimum) {
    Minimum s = addMinimum(0);
    Minimum e = addMinimum(1);
    dg.admit(s);

    EXPECT_FALSE(dg.shortestPath(s.id, e.id).has_value());
    EXPECT_FALSE(dg.hasNode(e.id));
    EXPECT_EQ(dg.nodeCount(), 1u);

    auto self = dg.shortestPath(s.id, s.id);
    ASSERT_TRUE(self.has_value());
    EXPECT_EQ(self->nodes.size(), 1u);
}

// ─── Mutation feed ─────────────────────────────────────────────

TEST_F(DistanceGraphTest, MarkConnectedNeedsBothNodes) {
    Minimum a = addMinimum(0);
    Minimum b = addMinimum(1);
    dg.admit(a);
    EXPECT_FALSE(dg.markConnected(a.id, b.id));
    dg.admit(b);
    EXPECT_TRUE(dg.markConnected(a.id, b.id));
    EXPECT_DOUBLE_EQ(*dg.weight(a.id, b.id), 0.0);
    EXPECT_FALSE(dg.markConnected(a.id, a.id));
}

TEST_F(DistanceGraphTest, MarkUnproductive) {
    Minimum a = addMinimum(0);
    Minimum b = addMinimum(1);
    Minimum c = addMinimum(2);
    dg.admit(a);
    dg.admit(b);
    dg.admit(c);

    EXPECT_TRUE(dg.markUnproductive(a.id, b.id));
    EXPECT_DOUBLE_EQ(*dg.weight(a.id, b.id), dg.config().infinite_weight);
    EXPECT_FALSE(dg.markUnproductive(a.id, b.id));

    // a known connection is never undone
    dg.markConnected(b.id, c.id);
    EXPECT_FALSE(dg.markUnproductive(b.id, c.id));
    EXPECT_DOUBLE_EQ(*dg.weight(b.id, c.id), 0.0);

    EXPECT_FALSE(dg.markUnproductive(a.id, 99));
}

TEST_F(DistanceGraphTest, MergeKeepsLowerWeights) {
    Minimum keep = addMinimum(0);
    Minimum drop = addMinimum(1);
    Minimum x = addMinimum(3);
    Minimum y = addMinimum(10);
    for (const Minimum& m : {keep, drop, x, y}) dg.admit(m);
    dg.markConnected(drop.id, y.id);

    dg.merge(keep.id, drop.id);

    EXPECT_FALSE(dg.hasNode(drop.id));
    EXPECT_EQ(dg.nodeCount(), 3u);
    EXPECT_DOUBLE_EQ(*dg.weight(keep.id, x.id), 4.0);  // min(9, 4)
    EXPECT_DOUBLE_EQ(*dg.weight(keep.id, y.id), 0.0);  // min(100, 0)
    EXPECT_FALSE(cache.contains(keep.id, drop.id));
    EXPECT_EQ(diagnostics.count(DiagnosticKind::MINIMA_MERGED), 1u);
}

TEST_F(DistanceGraphTest, MergeIntoUnadmittedMinimum) {
    Minimum keep = addMinimum(0);
    Minimum drop = addMinimum(1);
    Minimum x = addMinimum(3);
    dg.admit(drop);
    dg.admit(x);

    dg.merge(keep.id, drop.id);

    EXPECT_TRUE(dg.hasNode(keep.id));
    EXPECT_FALSE(dg.hasNode(drop.id));
    EXPECT_DOUBLE_EQ(*dg.weight(keep.id, x.id), 4.0);
}

// ─── Consistency ───────────────────────────────────────────────

TEST_F(DistanceGraphTest, ConsistencyZeroesConnectedPair) {
    Minimum a = addMinimum(0);
    Minimum b = addMinimum(1);
    dg.admit(a);
    dg.admit(b);
    connect(a, b);  // never reported through markConnected

    ConsistencyReport report = dg.checkConsistency();
    EXPECT_EQ(report.edges_checked, 1u);
    EXPECT_EQ(report.connected_repaired, 1u);
    EXPECT_DOUBLE_EQ(*dg.weight(a.id, b.id), 0.0);
    EXPECT_TRUE(dg.checkConsistency().consistent());
    EXPECT_EQ(diagnostics.count(DiagnosticKind::INCONSISTENCY_REPAIRED), 1u);
}

TEST_F(DistanceGraphTest, ConsistencyRestoresDisconnectedPair) {
    Minimum a = addMinimum(0);
    Minimum b = addMinimum(2);
    dg.admit(a);
    dg.admit(b);
    dg.markConnected(a.id, b.id);  // no transition state backs this

    ConsistencyReport report = dg.checkConsistency();
    EXPECT_EQ(report.disconnected_repaired, 1u);
    EXPECT_DOUBLE_EQ(*dg.weight(a.id, b.id), 4.0);
    EXPECT_EQ(diagnostics.inconsistentPassStreak(), 1u);
}

TEST_F(DistanceGraphTest, ConsistencyZeroesRedundantEdges) {
    Minimum a = addMinimum(0);
    Minimum b = addMinimum(1);
    Minimum c = addMinimum(2);
    for (const Minimum& m : {a, b, c}) dg.admit(m);
    connect(a, b);
    connect(b, c);
    dg.markConnected(a.id, b.id);
    dg.markConnected(b.id, c.id);

    ConsistencyReport report = dg.checkConsistency();
    EXPECT_TRUE(report.consistent());
    EXPECT_EQ(report.redundant_zeroed, 1u);
    EXPECT_DOUBLE_EQ(*dg.weight(a.id, c.id), 0.0);
    EXPECT_EQ(diagnostics.inconsistentPassStreak(), 0u);
}

TEST_F(DistanceGraphTest, ConsistencyFollowsReplacedConnectivityGraph) {
    Minimum a = addMinimum(0);
    Minimum b = addMinimum(2);
    dg.admit(a);
    dg.admit(b);

    // a graph built elsewhere in which a and b are already joined
    ConnectivityGraph joined;
    joined.addMinimum(a.id);
    joined.addMinimum(b.id);
    joined.addTransitionState(store.addTransitionState(0.0, {}, a.id, b.id));

    dg.setConnectivityGraph(joined);
    ConsistencyReport report = dg.checkConsistency();
    EXPECT_EQ(report.connected_repaired, 1u);
    EXPECT_DOUBLE_EQ(*dg.weight(a.id, b.id), 0.0);

    // back to the fixture graph, which never saw that transition state
    dg.setConnectivityGraph(graph);
    report = dg.checkConsistency();
    EXPECT_EQ(report.disconnected_repaired, 1u);
    EXPECT_DOUBLE_EQ(*dg.weight(a.id, b.id), 4.0);
}
