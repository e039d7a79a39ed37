/**
 * @file test_pour.cpp
 * @brief Unit tests for workflow instantiation from playbooks.
 */

#include "workflow/pour.hpp"

#include <gtest/gtest.h>

#include <algorithm>

using namespace taskweave;

namespace {

PlaybookStep step(std::string id, std::string title, std::vector<std::string> depends_on = {},
                  std::string condition = {}) {
    PlaybookStep s;
    s.id = std::move(id);
    s.title = std::move(title);
    s.depends_on = std::move(depends_on);
    s.condition = std::move(condition);
    return s;
}

/// step1 -> step2 -> step3, step2 gated on {{include_review}}.
Playbook review_playbook() {
    Playbook pb;
    pb.id = "pb-review";
    pb.name = "review";
    pb.title = "Review {{component}}";
    pb.steps = {
        step("step1", "Implement {{component}}"),
        step("step2", "Review {{component}}", {"step1"}, "{{include_review}}"),
        step("step3", "Merge {{component}}", {"step1", "step2"}),
    };

    VariableDef component;
    component.name = "component";
    component.required = true;
    VariableDef include_review;
    include_review.name = "include_review";
    include_review.type = VariableType::Boolean;
    include_review.default_value = true;
    pb.variables = {component, include_review};
    return pb;
}

VariableMap vars(bool include_review) {
    return VariableMap{{"component", std::string("parser")}, {"include_review", include_review}};
}

std::vector<std::string> titles(const PourResult& result) {
    std::vector<std::string> out;
    for (const auto& poured : result.tasks) out.push_back(poured.task.title);
    return out;
}

}  // namespace

TEST(PourTest, AllStepsIncluded) {
    auto r = pour(review_playbook(), vars(true), "ent-alice");
    ASSERT_TRUE(r.has_value()) << r.error().message;

    EXPECT_EQ(r->workflow.title, "Review parser");
    EXPECT_EQ(r->workflow.status, WorkflowStatus::Pending);
    EXPECT_EQ(r->workflow.playbook_id, std::optional<std::string>{"pb-review"});
    EXPECT_EQ(titles(*r), (std::vector<std::string>{"Implement parser", "Review parser",
                                                    "Merge parser"}));
    EXPECT_EQ(r->blocks_dependencies.size(), 3u);
    EXPECT_EQ(r->parent_child_dependencies.size(), 3u);
    EXPECT_TRUE(r->skipped_steps.empty());
}

TEST(PourTest, SkippedStepDropsItsEdges) {
    auto r = pour(review_playbook(), vars(false), "ent-alice");
    ASSERT_TRUE(r.has_value()) << r.error().message;

    ASSERT_EQ(r->tasks.size(), 2u);
    EXPECT_EQ(r->tasks[0].step_id, "step1");
    EXPECT_EQ(r->tasks[1].step_id, "step3");
    EXPECT_EQ(r->skipped_steps, (std::vector<std::string>{"step2"}));

    ASSERT_EQ(r->blocks_dependencies.size(), 1u);
    const auto& edge = r->blocks_dependencies.front();
    EXPECT_EQ(edge.source_id, r->tasks[0].task.id);
    EXPECT_EQ(edge.target_id, r->tasks[1].task.id);
    EXPECT_EQ(edge.type, DependencyType::Blocks);
}

TEST(PourTest, TaskIdsAreChildrenOfWorkflow) {
    IdGenerator ids(7);
    PourOptions options;
    options.id_generator = &ids;

    auto r = pour(review_playbook(), vars(false), "ent-alice", options);
    ASSERT_TRUE(r.has_value());

    const auto& wf = r->workflow.id;
    EXPECT_TRUE(wf.starts_with("wf-"));
    EXPECT_EQ(r->tasks[0].task.id, wf + ".1");
    EXPECT_EQ(r->tasks[1].task.id, wf + ".2");
    for (const auto& dep : r->parent_child_dependencies) {
        EXPECT_EQ(dep.target_id, wf);
        EXPECT_EQ(dep.type, DependencyType::ParentChild);
        EXPECT_EQ(dep.created_by, "ent-alice");
    }
}

TEST(PourTest, RepeatedPoursAreDeterministicExceptIds) {
    auto first = pour(review_playbook(), vars(false), "ent-alice");
    auto second = pour(review_playbook(), vars(false), "ent-alice");
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());

    EXPECT_EQ(titles(*first), titles(*second));
    EXPECT_EQ(first->skipped_steps, second->skipped_steps);
    EXPECT_EQ(first->blocks_dependencies.size(), second->blocks_dependencies.size());
    EXPECT_NE(first->workflow.id, second->workflow.id);
}

TEST(PourTest, OptionsApplyToWorkflow) {
    PourOptions options;
    options.title = "Hotfix";
    options.ephemeral = true;
    options.tags = {"urgent"};

    auto r = pour(review_playbook(), vars(true), "ent-alice", options);
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->workflow.title, "Hotfix");
    EXPECT_TRUE(r->workflow.ephemeral);
    EXPECT_TRUE(r->workflow.tags.contains("urgent"));
    EXPECT_EQ(std::get<std::string>(r->workflow.variables.at("component")), "parser");
}

TEST(PourTest, StepFieldsSubstituted) {
    auto pb = review_playbook();
    pb.steps[0].description = "Owner: {{owner}}";
    pb.steps[0].assignee = "{{owner}}";
    pb.steps[0].priority = 1;
    pb.steps[0].task_type = "feature";
    pb.steps[0].tags = {"{{component}}", "{{unset}}"};

    auto provided = vars(true);
    provided.emplace("owner", std::string("ent-bob"));
    auto r = pour(pb, provided, "ent-alice");
    ASSERT_TRUE(r.has_value()) << r.error().message;

    const auto& task = r->tasks[0].task;
    EXPECT_EQ(task.description, "Owner: ent-bob");
    EXPECT_EQ(task.assignee, std::optional<EntityId>{"ent-bob"});
    EXPECT_EQ(task.priority, 1);
    EXPECT_EQ(task.task_type, "feature");
    EXPECT_EQ(task.tags, (std::set<std::string>{"parser"}));
    EXPECT_EQ(r->tasks[1].task.priority, kDefaultPriority);
}

TEST(PourTest, RejectsEmptyAndFullyFilteredPlaybooks) {
    auto empty = review_playbook();
    empty.steps.clear();
    auto no_steps = pour(empty, vars(true), "ent-alice");
    ASSERT_FALSE(no_steps.has_value());
    EXPECT_EQ(no_steps.error().code, ErrorCode::ValidationError);
    EXPECT_NE(no_steps.error().message.find("no steps"), std::string::npos);

    auto gated = review_playbook();
    for (auto& s : gated.steps) s.condition = "{{include_review}}";
    auto filtered = pour(gated, vars(false), "ent-alice");
    ASSERT_FALSE(filtered.has_value());
    EXPECT_NE(filtered.error().message.find("all steps filtered"), std::string::npos);
}

TEST(PourTest, PropagatesVariableAndConditionErrors) {
    auto missing = pour(review_playbook(), {}, "ent-alice");
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().code, ErrorCode::ValidationError);

    auto pb = review_playbook();
    pb.steps[1].condition = "{{include_review}} ==";
    auto bad_condition = pour(pb, vars(true), "ent-alice");
    ASSERT_FALSE(bad_condition.has_value());
    EXPECT_NE(bad_condition.error().message.find("step2"), std::string::npos);
}

TEST(PourTest, InheritedStepsArePoured) {
    auto base = review_playbook();
    Playbook child;
    child.id = "pb-release";
    child.name = "release";
    child.title = "Release {{component}}";
    child.extends = "review";
    child.steps = {step("step4", "Tag {{component}}", {"step3"})};

    PourOptions options;
    options.loader = [base](const std::string& name) -> std::optional<Playbook> {
        if (name == base.name) return base;
        return std::nullopt;
    };

    auto r = pour(child, vars(true), "ent-alice", options);
    ASSERT_TRUE(r.has_value()) << r.error().message;
    EXPECT_EQ(r->tasks.size(), 4u);
    EXPECT_EQ(r->workflow.title, "Release parser");
    EXPECT_EQ(r->workflow.playbook_id, std::optional<std::string>{"pb-release"});
}

TEST(ValidatePourTest, ReportsInclusionWithoutBuilding) {
    auto report = validate_pour(review_playbook(), vars(false));
    EXPECT_TRUE(report.valid);
    EXPECT_FALSE(report.error.has_value());
    EXPECT_EQ(report.included_steps, (std::vector<std::string>{"step1", "step3"}));
    EXPECT_EQ(report.skipped_steps, (std::vector<std::string>{"step2"}));
    EXPECT_TRUE(std::get<bool>(report.resolved_variables.at("include_review")) == false);

    auto failed = validate_pour(review_playbook(), {});
    EXPECT_FALSE(failed.valid);
    ASSERT_TRUE(failed.error.has_value());
    EXPECT_EQ(failed.error->code, ErrorCode::ValidationError);
}
