#include <gtest/gtest.h>
#include "distance/distance_graph.hpp"
#include "storage/memory_store.hpp"
#include "test_support.hpp"

#include <algorithm>
#include <map>
#include <unordered_set>

using namespace landscape;
using test_support::LookupDistance;

// Ten minima on a line, two clusters joined by transition states:
//   A = {0, 1, 2, 3}   B = {5, 6, 7}   singletons 4, 8, 9
class ScenarioTest : public ::testing::Test {
protected:
    ScenarioTest()
        : distance_fn(lookup.function()),
          cache(store, distance_fn, diagnostics),
          dg(store, graph, cache, diagnostics) {}

    void SetUp() override {
        for (int i = 0; i < 10; i++) {
            ids.push_back(store.addMinimum(-static_cast<double>(i), {static_cast<double>(i)}).id);
        }
        for (auto [a, b] : {std::make_pair(0, 1), std::make_pair(1, 2), std::make_pair(2, 3),
                            std::make_pair(5, 6), std::make_pair(6, 7)}) {
            store.addTransitionState(0.0, {}, ids[a], ids[b]);
        }
        graph = ConnectivityGraph::fromStore(store);

        InitOptions options;
        options.mode = AdmissionMode::ALL;
        dg.initialize(*store.getMinimum(ids[0]), *store.getMinimum(ids[9]), options);
    }

    MemoryStore store;
    ConnectivityGraph graph;
    LookupDistance lookup;
    CallbackDistance distance_fn;
    Diagnostics diagnostics;
    DistanceCache cache;
    DistanceGraph dg;
    std::vector<MinimumId> ids;
};

TEST_F(ScenarioTest, EveryMinimumAdmitted) {
    EXPECT_EQ(dg.nodeCount(), 10u);
    EXPECT_EQ(dg.edgeCount(), 45u);
    EXPECT_TRUE(dg.checkConsistency().consistent());
}

TEST_F(ScenarioTest, ZeroPathWithinCluster) {
    auto path = dg.shortestPath(ids[0], ids[3]);
    ASSERT_TRUE(path.has_value());
    EXPECT_DOUBLE_EQ(path->totalWeight(), 0.0);

    auto b = dg.shortestPath(ids[7], ids[5]);
    ASSERT_TRUE(b.has_value());
    EXPECT_DOUBLE_EQ(b->totalWeight(), 0.0);
}

TEST_F(ScenarioTest, NoZeroEdgeAcrossComponents) {
    for (size_t i = 0; i < ids.size(); i++) {
        for (size_t j = i + 1; j < ids.size(); j++) {
            bool connected = graph.areConnected(ids[i], ids[j]);
            double w = *dg.weight(ids[i], ids[j]);
            if (connected) {
                EXPECT_DOUBLE_EQ(w, 0.0) << i << "-" << j;
            } else {
                EXPECT_GT(w, 0.0) << i << "-" << j;
            }
        }
    }
}

TEST_F(ScenarioTest, ShortestPathCrossesGapOnce) {
    auto path = dg.shortestPath(ids[0], ids[7]);
    ASSERT_TRUE(path.has_value());
    // the only nonzero step is the cheapest hop from A to B: 3 -> 4 -> 5
    EXPECT_DOUBLE_EQ(path->totalWeight(), 2.0);
    EXPECT_DOUBLE_EQ(path->weakestLinkWeight(), 1.0);
}

TEST_F(ScenarioTest, MergeAcrossClusters) {
    const MinimumId keep = ids[0];
    const MinimumId drop = ids[5];
    std::map<MinimumId, double> expected;
    for (MinimumId x : ids) {
        if (x == keep || x == drop) continue;
        expected[x] = std::min(*dg.weight(x, keep), *dg.weight(x, drop));
    }

    // 5 turns out to be the same structure as 0
    store.mergeMinima(keep, drop);
    graph.mergeMinima(keep, drop);
    dg.merge(keep, drop);

    EXPECT_EQ(dg.nodeCount(), 9u);
    EXPECT_FALSE(dg.hasNode(drop));
    EXPECT_TRUE(graph.areConnected(ids[3], ids[7]));
    for (const auto& [x, w] : expected) {
        EXPECT_DOUBLE_EQ(*dg.weight(x, keep), w) << "minimum " << x;
    }
    // the gap 0-4 shrank to the 4-5 distance, 0-9 to the 5-9 distance
    EXPECT_DOUBLE_EQ(expected[ids[4]], 1.0);
    EXPECT_DOUBLE_EQ(expected[ids[9]], 16.0);
    EXPECT_DOUBLE_EQ(expected[ids[6]], 0.0);

    ConsistencyReport report = dg.checkConsistency();
    EXPECT_EQ(report.connected_repaired, 0u);
    EXPECT_EQ(report.disconnected_repaired, 0u);
    EXPECT_GT(report.redundant_zeroed, 0u);

    auto path = dg.shortestPath(ids[3], ids[7]);
    ASSERT_TRUE(path.has_value());
    EXPECT_DOUBLE_EQ(path->totalWeight(), 0.0);
    EXPECT_FALSE(cache.contains(ids[0], ids[5]));
}
