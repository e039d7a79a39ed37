/**
 * @file test_cycle_detector.cpp
 * @brief Unit and property tests for family-scoped cycle detection.
 */

#include "graph/cycle_detector.hpp"
#include "graph/edge_index.hpp"

#include <gtest/gtest.h>

#include <random>

using namespace taskweave;

namespace {

Dependency edge(const std::string& src, const std::string& dst,
                DependencyType type = DependencyType::Blocks) {
    Dependency dep;
    dep.source_id = src;
    dep.target_id = dst;
    dep.type = type;
    return dep;
}

}  // namespace

static_assert(AdjacencySource<EdgeIndex>);
static_assert(AdjacencySource<EdgeList>);

TEST(CycleDetectorTest, SelfLoopIsCycle) {
    std::vector<Dependency> edges;
    EXPECT_TRUE(would_create_cycle(edges, Family::Scheduling, "a", "a"));
}

TEST(CycleDetectorTest, DetectsClosingEdge) {
    std::vector<Dependency> edges{edge("a", "b"), edge("b", "c")};
    EXPECT_TRUE(would_create_cycle(edges, Family::Scheduling, "c", "a"));
    EXPECT_FALSE(would_create_cycle(edges, Family::Scheduling, "a", "c"));
}

TEST(CycleDetectorTest, BlocksAndAwaitsShareFamily) {
    std::vector<Dependency> edges{edge("a", "b"), edge("b", "c", DependencyType::Awaits)};
    EXPECT_TRUE(would_create_cycle(edges, Family::Scheduling, "c", "a"));
}

TEST(CycleDetectorTest, FamiliesAreIndependent) {
    std::vector<Dependency> edges{edge("a", "b"), edge("b", "a", DependencyType::ParentChild)};
    EXPECT_FALSE(has_cycle(edges, Family::Scheduling));
    EXPECT_FALSE(has_cycle(edges, Family::Containment));
    EXPECT_FALSE(would_create_cycle(edges, Family::Containment, "b", "a"));
    EXPECT_TRUE(would_create_cycle(edges, Family::Containment, "a", "b"));
}

TEST(CycleDetectorTest, UncheckedTypesNeverTraversed) {
    std::vector<Dependency> edges{edge("a", "b", DependencyType::References),
                                  edge("b", "a", DependencyType::References)};
    EXPECT_FALSE(has_cycle(edges, Family::Scheduling));
}

TEST(CycleDetectorTest, WorksOverEdgeIndex) {
    EdgeIndex index;
    index.insert(edge("a", "b"));
    index.insert(edge("b", "c"));
    EXPECT_TRUE(would_create_cycle(index, Family::Scheduling, "c", "a"));
    EXPECT_FALSE(would_create_cycle(index, Family::Containment, "c", "a"));
}

TEST(CycleDetectorTest, FindCyclePathReportsLoop) {
    std::vector<Dependency> edges{edge("a", "b"), edge("b", "c"), edge("c", "a"), edge("c", "d")};
    auto path = find_cycle_path(edges, Family::Scheduling);
    ASSERT_TRUE(path.has_value());
    ASSERT_GE(path->size(), 4u);
    EXPECT_EQ(path->front(), path->back());
    EXPECT_EQ(*path, (std::vector<ElementId>{"a", "b", "c", "a"}));
}

TEST(CycleDetectorTest, DiamondIsAcyclic) {
    std::vector<Dependency> edges{edge("a", "b"), edge("a", "c"), edge("b", "d"), edge("c", "d")};
    EXPECT_FALSE(has_cycle(edges, Family::Scheduling));
    EXPECT_FALSE(find_cycle_path(edges, Family::Scheduling).has_value());
}

TEST(CycleDetectorProperty, AcceptedEdgesStayAcyclic) {
    // Random insertion guarded by would_create_cycle never yields a cycle.
    std::mt19937 rng(20240611);
    std::uniform_int_distribution<int> node(0, 29);
    std::uniform_int_distribution<int> kind(0, 2);

    for (int round = 0; round < 20; ++round) {
        EdgeIndex index;
        for (int i = 0; i < 200; ++i) {
            auto src = "n" + std::to_string(node(rng));
            auto dst = "n" + std::to_string(node(rng));
            auto type = kind(rng) == 0 ? DependencyType::Awaits : DependencyType::Blocks;
            Dependency dep = edge(src, dst, type);
            if (index.contains(key_of(dep))) continue;
            if (would_create_cycle(index, Family::Scheduling, src, dst)) continue;
            index.insert(dep);
        }
        auto accepted = index.edges();
        ASSERT_FALSE(has_cycle(accepted, Family::Scheduling)) << "round " << round;
    }
}
