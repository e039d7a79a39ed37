/**
 * @file test_types.cpp
 * @brief Unit tests for core vocabulary types, variables and id generation.
 */

#include "core/id_generator.hpp"
#include "core/types.hpp"
#include "core/variables.hpp"
#include "graph/dependency.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <unordered_set>

using namespace taskweave;

TEST(TaskStatusTest, ToStringAndParse) {
    EXPECT_EQ(to_string(TaskStatus::InProgress), "in_progress");
    EXPECT_EQ(parse_task_status("closed"), TaskStatus::Closed);
    EXPECT_FALSE(parse_task_status("done").has_value());
}

TEST(TaskStatusTest, Terminal) {
    EXPECT_TRUE(is_terminal(TaskStatus::Closed));
    EXPECT_TRUE(is_terminal(TaskStatus::Cancelled));
    EXPECT_FALSE(is_terminal(TaskStatus::Blocked));
    EXPECT_FALSE(is_terminal(TaskStatus::Open));
}

TEST(DependencyTypeTest, FamilyMapping) {
    EXPECT_EQ(family_of(DependencyType::Blocks), Family::Scheduling);
    EXPECT_EQ(family_of(DependencyType::Awaits), Family::Scheduling);
    EXPECT_EQ(family_of(DependencyType::ParentChild), Family::Containment);
    EXPECT_EQ(family_of(DependencyType::References), Family::None);
    EXPECT_EQ(family_of(DependencyType::RelatesTo), Family::None);
}

TEST(DependencyTypeTest, Categories) {
    EXPECT_EQ(category_of(DependencyType::Awaits), Category::Blocking);
    EXPECT_EQ(category_of(DependencyType::Supersedes), Category::Associative);
    EXPECT_EQ(category_of(DependencyType::AssignedTo), Category::Attribution);
    EXPECT_EQ(category_of(DependencyType::RepliesTo), Category::Threading);
}

TEST(DependencyTypeTest, ParseRoundTripsEveryType) {
    for (auto type : kAllDependencyTypes) {
        EXPECT_EQ(parse_dependency_type(to_string(type)), type) << to_string(type);
    }
    EXPECT_FALSE(parse_dependency_type("depends-on").has_value());
}

TEST(GateTest, TimerSatisfiedAfterDeadline) {
    auto now = std::chrono::system_clock::now();
    Gate gate;
    gate.type = GateType::Timer;
    gate.wait_until = now + std::chrono::hours{1};
    EXPECT_FALSE(gate.is_satisfied(now));
    EXPECT_TRUE(gate.is_satisfied(now + std::chrono::hours{2}));
}

TEST(GateTest, ApprovalCountsOnlyRequiredApprovers) {
    Gate gate;
    gate.type = GateType::Approval;
    gate.required_approvers = {"ent-a", "ent-b"};
    gate.approval_count = 2;
    gate.current_approvers = {"ent-a", "ent-x"};
    auto now = std::chrono::system_clock::now();
    EXPECT_FALSE(gate.is_satisfied(now));

    gate.current_approvers.push_back("ent-b");
    EXPECT_TRUE(gate.is_satisfied(now));
}

TEST(VariablesTest, DisplayString) {
    EXPECT_EQ(to_display_string(VariableValue{42.0}), "42");
    EXPECT_EQ(to_display_string(VariableValue{2.5}), "2.5");
    EXPECT_EQ(to_display_string(VariableValue{true}), "true");
    EXPECT_EQ(to_display_string(VariableValue{std::string{"x"}}), "x");
}

TEST(VariablesTest, Truthiness) {
    EXPECT_FALSE(is_truthy(std::string_view{""}));
    EXPECT_FALSE(is_truthy(std::string_view{"OFF"}));
    EXPECT_FALSE(is_truthy(std::string_view{"No"}));
    EXPECT_FALSE(is_truthy(std::string_view{"0"}));
    EXPECT_TRUE(is_truthy(std::string_view{"yes"}));
    EXPECT_FALSE(is_truthy(VariableValue{0.0}));
    EXPECT_TRUE(is_truthy(VariableValue{3.0}));
    EXPECT_FALSE(is_truthy(VariableValue{false}));
}

TEST(IdGeneratorTest, PrefixedAndUnique) {
    IdGenerator ids(7);
    std::unordered_set<ElementId> seen;
    for (int i = 0; i < 1000; ++i) {
        auto id = ids.next(ElementType::Task);
        ASSERT_EQ(id.rfind("tsk-", 0), 0u) << id;
        ASSERT_EQ(id.size(), 12u);
        seen.insert(id);
    }
    EXPECT_GT(seen.size(), 990u);
}

TEST(IdGeneratorTest, SeededSequencesRepeat) {
    IdGenerator a(42);
    IdGenerator b(42);
    EXPECT_EQ(a.next(ElementType::Workflow), b.next(ElementType::Workflow));
    EXPECT_EQ(a.next(ElementType::Plan), b.next(ElementType::Plan));
}

TEST(IdGeneratorTest, ChildIds) {
    EXPECT_EQ(IdGenerator::child_id("wf-0000abcd", 3), "wf-0000abcd.3");
}
