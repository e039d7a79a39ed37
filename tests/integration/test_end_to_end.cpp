/**
 * @file test_end_to_end.cpp
 * @brief Integration tests running the full config -> pour -> progress -> burn path.
 */

#include "core/config.hpp"
#include "core/id_generator.hpp"
#include "core/logger.hpp"
#include "derived/derived_state.hpp"
#include "entity/reporting.hpp"
#include "graph/dependency_graph.hpp"
#include "storage/element_store.hpp"
#include "telemetry/audit_log.hpp"
#include "telemetry/json_sink.hpp"
#include "workflow/containers.hpp"
#include "workflow/pour.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>

using namespace taskweave;

namespace {

std::string read_file(const std::filesystem::path& path) {
    std::ifstream in(path);
    return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
}

PlaybookStep step(std::string id, std::string title, std::vector<std::string> depends_on = {},
                  std::string condition = {}) {
    PlaybookStep s;
    s.id = std::move(id);
    s.title = std::move(title);
    s.depends_on = std::move(depends_on);
    s.condition = std::move(condition);
    return s;
}

Playbook deploy_playbook() {
    Playbook pb;
    pb.id = "pb-deploy";
    pb.name = "deploy";
    pb.title = "Deploy {{service}} to {{env}}";
    pb.steps = {
        step("build", "Build {{service}}"),
        step("canary", "Canary {{service}}", {"build"}, "{{env}} == prod"),
        step("rollout", "Roll out {{service}}", {"build", "canary"}),
        step("verify", "Verify {{service}} in {{env}}", {"rollout"}),
    };

    VariableDef service;
    service.name = "service";
    service.required = true;
    VariableDef env;
    env.name = "env";
    env.default_value = std::string("staging");
    env.enum_values = {std::string("staging"), std::string("prod")};
    pb.variables = {service, env};
    return pb;
}

}  // namespace

// ═══════════════════════════════════════════════
// Full Pipeline
// ═══════════════════════════════════════════════

class EndToEndTest : public ::testing::Test {
protected:
    std::filesystem::path dir_ = std::filesystem::temp_directory_path() / "tw_test_e2e";

    void SetUp() override {
        std::filesystem::remove_all(dir_);
        std::filesystem::create_directories(dir_);
        std::ofstream(dir_ / "engine.toml") << R"(
[graph]
normalize_relates_to = true
reporting_chain_max_depth = 8

[pour]
default_ephemeral = true
max_extends_depth = 4

[telemetry]
log_level = "debug"
audit_file_prefix = "audit"
)";
    }

    void TearDown() override { std::filesystem::remove_all(dir_); }
};

TEST_F(EndToEndTest, PourProgressAndBurn) {
    auto config = load_config(dir_ / "engine.toml");
    ASSERT_TRUE(config.has_value()) << config.error().message;
    config->telemetry.log_dir = dir_;

    auto level = parse_log_level(config->telemetry.log_level);
    ASSERT_TRUE(level.has_value());
    Logger logger(std::make_unique<JsonFileSink>(dir_, "taskweave"), *level);
    AuditLog audit(std::make_unique<JsonFileSink>(dir_, config->telemetry.audit_file_prefix));

    InMemoryElementStore store;
    DependencyGraph graph(store, GraphOptions{config->graph.normalize_relates_to}, &logger, &audit);
    DerivedState derived(graph, &logger, &audit);
    IdGenerator ids(2024);
    ContainerService containers(graph, ids, &logger, &audit);

    PourOptions options;
    options.ephemeral = config->pour.default_ephemeral;
    options.max_extends_depth = config->pour.max_extends_depth;
    options.id_generator = &ids;

    auto poured = pour(deploy_playbook(), {{"service", std::string("api")}}, "ent-ops", options);
    ASSERT_TRUE(poured.has_value()) << poured.error().message;
    EXPECT_EQ(poured->workflow.title, "Deploy api to staging");
    EXPECT_EQ(poured->skipped_steps, (std::vector<std::string>{"canary"}));

    auto wf = containers.persist_pour(*poured, "ent-ops");
    ASSERT_TRUE(wf.has_value()) << wf.error().message;
    const ElementId build = wf->id + ".1";
    const ElementId rollout = wf->id + ".2";
    const ElementId verify = wf->id + ".3";

    auto ready = derived.ready();
    ASSERT_EQ(ready.size(), 1u);
    EXPECT_EQ(ready[0].id, build);
    EXPECT_EQ(derived.blocked().size(), 2u);

    auto reconciled = derived.reconcile_blocked_status("ent-ops");
    EXPECT_EQ(reconciled.auto_blocked.size(), 2u);

    // Work the tasks in order, syncing the workflow as we go.
    for (const auto& id : {build, rollout, verify}) {
        ASSERT_TRUE(store.set_task_status(id, TaskStatus::InProgress));
        ASSERT_TRUE(containers.sync_workflow_status(wf->id, "ent-ops").has_value());
        ASSERT_TRUE(store.set_task_status(id, TaskStatus::Closed));
        derived.reconcile_blocked_status("ent-ops");
    }

    auto progress = derived.workflow_progress(wf->id);
    ASSERT_TRUE(progress.has_value());
    EXPECT_EQ(progress->total, 3u);
    EXPECT_DOUBLE_EQ(progress->percent_complete, 100.0);
    EXPECT_EQ(*containers.sync_workflow_status(wf->id, "ent-ops"), WorkflowStatus::Completed);

    auto burned = containers.burn_workflow(wf->id, false, "ent-ops");
    ASSERT_TRUE(burned.has_value()) << burned.error().message;
    EXPECT_EQ(*burned, 3u);
    EXPECT_EQ(store.size(), 0u);
    EXPECT_EQ(graph.edge_count(), 0u);

    logger.flush();
    audit.flush();
    auto audit_text = read_file(dir_ / "audit.ndjson");
    EXPECT_NE(audit_text.find(R"("event":"workflow_poured")"), std::string::npos);
    EXPECT_NE(audit_text.find(R"("event":"auto_blocked")"), std::string::npos);
    EXPECT_NE(audit_text.find(R"("event":"workflow_burned")"), std::string::npos);
    EXPECT_NE(read_file(dir_ / "taskweave.ndjson").find(R"("component":"containers")"),
              std::string::npos);
}

TEST_F(EndToEndTest, ProdPourKeepsCanaryAndBlocksOnIt) {
    InMemoryElementStore store;
    DependencyGraph graph(store);
    DerivedState derived(graph);
    IdGenerator ids(7);
    ContainerService containers(graph, ids);

    PourOptions options;
    options.id_generator = &ids;
    auto poured = pour(deploy_playbook(),
                       {{"service", std::string("api")}, {"env", std::string("prod")}},
                       "ent-ops", options);
    ASSERT_TRUE(poured.has_value());
    ASSERT_EQ(poured->tasks.size(), 4u);
    ASSERT_TRUE(containers.persist_pour(*poured).has_value());

    const ElementId rollout = poured->workflow.id + ".3";
    auto blockers = derived.blockers_of(rollout);
    ASSERT_TRUE(blockers.has_value());
    EXPECT_EQ(blockers->size(), 2u);

    // Prod rejects a value outside the declared set.
    auto invalid = validate_pour(deploy_playbook(),
                                 {{"service", std::string("api")}, {"env", std::string("dev")}});
    EXPECT_FALSE(invalid.valid);
}

TEST_F(EndToEndTest, OrgChartAlongsideWork) {
    auto config = load_config(dir_ / "engine.toml");
    ASSERT_TRUE(config.has_value());

    InMemoryElementStore store;
    ReportingService reporting(store, config->graph.reporting_chain_max_depth);

    for (int i = 0; i < 12; ++i) {
        Entity entity;
        static_cast<Element&>(entity) = make_header("ent-" + std::to_string(i), ElementType::Entity,
                                                    "Entity " + std::to_string(i), "system");
        ASSERT_TRUE(store.insert(entity));
    }
    for (int i = 0; i < 11; ++i) {
        ASSERT_TRUE(reporting.assign_manager("ent-" + std::to_string(i),
                                             "ent-" + std::to_string(i + 1)));
    }

    // The configured walk depth caps the chain.
    auto chain = reporting.management_chain("ent-0");
    ASSERT_TRUE(chain.has_value());
    EXPECT_EQ(chain->size(), 8u);

    EXPECT_FALSE(reporting.assign_manager("ent-11", "ent-5").has_value());
}
