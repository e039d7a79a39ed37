/**
 * @file test_edge_index.cpp
 * @brief Unit tests for the arena adjacency index.
 */

#include "graph/edge_index.hpp"

#include <gtest/gtest.h>

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

TEST(EdgeIndexTest, InsertAndFind) {
    EdgeIndex index;
    index.insert(edge("a", "b"));

    EXPECT_EQ(index.size(), 1u);
    EXPECT_TRUE(index.contains({"a", "b", DependencyType::Blocks}));
    EXPECT_FALSE(index.contains({"a", "b", DependencyType::RelatesTo}));
    EXPECT_FALSE(index.contains({"b", "a", DependencyType::Blocks}));

    const auto* found = index.find(EdgeKey{"a", "b", DependencyType::Blocks});
    ASSERT_NE(found, nullptr);
    EXPECT_EQ(found->target_id, "b");
}

TEST(EdgeIndexTest, OutgoingIncomingFilteredByType) {
    EdgeIndex index;
    index.insert(edge("a", "b"));
    index.insert(edge("a", "c", DependencyType::References));
    index.insert(edge("d", "b", DependencyType::Awaits));

    EXPECT_EQ(index.outgoing("a").size(), 2u);

    constexpr DependencyType kRefs[] = {DependencyType::References};
    auto refs = index.outgoing("a", kRefs);
    ASSERT_EQ(refs.size(), 1u);
    EXPECT_EQ(refs[0].target_id, "c");

    constexpr DependencyType kBlocking[] = {DependencyType::Blocks, DependencyType::Awaits};
    EXPECT_EQ(index.incoming("b", kBlocking).size(), 2u);
    EXPECT_TRUE(index.incoming("a").empty());
}

TEST(EdgeIndexTest, SuccessorsRespectFamily) {
    EdgeIndex index;
    index.insert(edge("a", "b"));
    index.insert(edge("a", "c", DependencyType::ParentChild));
    index.insert(edge("a", "d", DependencyType::References));

    auto scheduling = index.successors("a", Family::Scheduling);
    ASSERT_EQ(scheduling.size(), 1u);
    EXPECT_EQ(scheduling[0], "b");

    auto containment = index.successors("a", Family::Containment);
    ASSERT_EQ(containment.size(), 1u);
    EXPECT_EQ(containment[0], "c");
}

TEST(EdgeIndexTest, EraseRecyclesSlot) {
    EdgeIndex index;
    size_t first = index.insert(edge("a", "b"));
    index.insert(edge("b", "c"));

    EXPECT_TRUE(index.erase({"a", "b", DependencyType::Blocks}));
    EXPECT_FALSE(index.erase({"a", "b", DependencyType::Blocks}));
    EXPECT_EQ(index.size(), 1u);
    EXPECT_TRUE(index.outgoing("a").empty());

    size_t reused = index.insert(edge("x", "y"));
    EXPECT_EQ(reused, first);
    EXPECT_EQ(index.slot_capacity(), 2u);
    EXPECT_EQ(index.edges().size(), 2u);
}

TEST(EdgeIndexTest, PurgeRemovesBothDirections) {
    EdgeIndex index;
    index.insert(edge("a", "b"));
    index.insert(edge("c", "b"));
    index.insert(edge("b", "d"));
    index.insert(edge("c", "d"));

    auto removed = index.purge("b");
    EXPECT_EQ(removed.size(), 3u);
    EXPECT_EQ(index.size(), 1u);
    EXPECT_TRUE(index.outgoing("a").empty());
    EXPECT_EQ(index.outgoing("c").size(), 1u);
    EXPECT_TRUE(index.purge("b").empty());
}

TEST(EdgeIndexTest, FindReturnsMutableEdge) {
    EdgeIndex index;
    auto dep = edge("a", "b", DependencyType::Awaits);
    dep.gate = Gate{};
    index.insert(dep);

    auto* found = index.find(EdgeKey{"a", "b", DependencyType::Awaits});
    ASSERT_NE(found, nullptr);
    found->gate->satisfied = true;
    EXPECT_TRUE(index.edges().front().gate->satisfied);
}
