/**
 * @file main.cpp
 * @brief TaskWeave command-line entry point.
 *
 * Wires the engine together:
 *   Config → Logger → ElementStore → DependencyGraph → DerivedState / Containers
 * and, in demo mode, pours a release playbook and reports the derived state.
 */

#include "core/config.hpp"
#include "core/id_generator.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "derived/derived_state.hpp"
#include "entity/reporting.hpp"
#include "graph/dependency_graph.hpp"
#include "storage/element_store.hpp"
#include "telemetry/audit_log.hpp"
#include "telemetry/json_sink.hpp"
#include "workflow/containers.hpp"
#include "workflow/playbook.hpp"
#include "workflow/pour.hpp"

#include <filesystem>
#include <format>
#include <iostream>
#include <memory>
#include <string>

using namespace taskweave;

namespace {

void print_banner() {
    std::cout << R"(
  ╔═══════════════════════════════════════════╗
  ║             TaskWeave v1.0.0              ║
  ║   Typed Dependency Graph & Workflow       ║
  ║   Instantiation Engine                    ║
  ╚═══════════════════════════════════════════╝
)" << std::endl;
}

struct CLIArgs {
    std::filesystem::path config_path = "config/default.toml";
    std::string log_dir;
    std::string log_level;
    bool demo_mode = false;
    bool show_help = false;
};

CLIArgs parse_args(int argc, char* argv[]) {
    CLIArgs args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            args.config_path = argv[++i];
        } else if (arg == "--log-dir" && i + 1 < argc) {
            args.log_dir = argv[++i];
        } else if (arg == "--log-level" && i + 1 < argc) {
            args.log_level = argv[++i];
        } else if (arg == "--demo") {
            args.demo_mode = true;
        } else if (arg == "--help" || arg == "-h") {
            args.show_help = true;
        }
    }
    return args;
}

void print_usage() {
    std::cout << "Usage: taskweave [OPTIONS]\n"
              << "  --config <path>     Configuration file (default: config/default.toml)\n"
              << "  --log-dir <path>    Log output directory (empty: stdout)\n"
              << "  --log-level <lvl>   debug | info | warn | error\n"
              << "  --demo              Pour a demo playbook and print derived state\n"
              << "  --help, -h          Show this help message\n";
}

Playbook release_playbook() {
    Playbook pb;
    pb.id = "pb-release";
    pb.name = "release";
    pb.title = "Release {{version}}";

    VariableDef version;
    version.name = "version";
    version.required = true;
    VariableDef with_docs;
    with_docs.name = "with_docs";
    with_docs.type = VariableType::Boolean;
    with_docs.default_value = VariableValue{false};
    pb.variables = {version, with_docs};

    PlaybookStep build;
    build.id = "build";
    build.title = "Build {{version}}";
    build.priority = 1;

    PlaybookStep docs;
    docs.id = "docs";
    docs.title = "Write release notes for {{version}}";
    docs.condition = "{{with_docs}}";

    PlaybookStep test;
    test.id = "test";
    test.title = "Test {{version}}";
    test.depends_on = {"build"};

    PlaybookStep ship;
    ship.id = "ship";
    ship.title = "Ship {{version}}";
    ship.depends_on = {"test", "docs"};

    pb.steps = {build, docs, test, ship};
    return pb;
}

void print_tasks(std::string_view heading, const std::vector<Task>& tasks) {
    std::cout << heading << " (" << tasks.size() << "):\n";
    for (const auto& task : tasks) {
        std::cout << std::format("  [P{}] {}  {}\n", task.priority, task.id, task.title);
    }
}

void print_progress(const ElementId& id, const Progress& p) {
    std::cout << std::format("Progress of {}: {}/{} closed, {} blocked, {:.1f}% complete\n",
                             id, p.closed, p.total, p.blocked, p.percent_complete);
}

/**
 * @brief Pour the release playbook, walk it to completion step by step and
 *        print what the derived state reports along the way.
 */
int run_demo(const Config& config, Logger& logger, AuditLog& audit) {
    logger.info("app", "=== Demo Mode ===");

    InMemoryElementStore store;
    DependencyGraph graph(store, GraphOptions{config.graph.normalize_relates_to}, &logger, &audit);
    DerivedState derived(graph, &logger, &audit);
    IdGenerator ids;
    ContainerService containers(graph, ids, &logger, &audit);

    PourOptions options;
    options.ephemeral = config.pour.default_ephemeral;
    options.id_generator = &ids;
    options.max_extends_depth = config.pour.max_extends_depth;

    VariableMap vars{{"version", VariableValue{std::string{"2.4.0"}}}};
    auto poured = pour(release_playbook(), vars, EntityId{"ent-demo"}, options);
    if (!poured) {
        logger.error("app", "Pour failed: " + poured.error().message);
        return 1;
    }
    for (const auto& step : poured->skipped_steps) {
        std::cout << "Skipped step: " << step << "\n";
    }

    auto workflow = containers.persist_pour(*poured, EntityId{"ent-demo"});
    if (!workflow) {
        logger.error("app", "Persist failed: " + workflow.error().message);
        return 1;
    }
    std::cout << "Workflow " << workflow->id << ": " << workflow->title << "\n\n";

    // Release crew: the demo actor reports to a lead.
    ReportingService reporting(store, config.graph.reporting_chain_max_depth, &logger, &audit);
    for (const auto& [id, name] : {std::pair{"ent-lead", "Release lead"},
                                   std::pair{"ent-demo", "Release engineer"}}) {
        Entity entity;
        static_cast<Element&>(entity) =
            make_header(ElementId{id}, ElementType::Entity, name, EntityId{kSystemActor});
        entity.name = name;
        entity.kind = EntityKind::Human;
        if (auto inserted = store.insert(entity); !inserted) {
            logger.error("app", inserted.error().message);
            return 1;
        }
    }
    if (auto assigned = reporting.assign_manager("ent-demo", "ent-lead"); !assigned) {
        logger.error("app", assigned.error().message);
        return 1;
    }
    if (auto chain = reporting.management_chain("ent-demo")) {
        std::cout << "ent-demo reports to:";
        for (const auto& manager : *chain) std::cout << " " << manager.id;
        std::cout << "\n\n";
    }

    for (const auto& entry : poured->tasks) {
        print_tasks("Ready", derived.ready());
        print_tasks("Blocked", derived.blocked());
        if (auto progress = derived.workflow_progress(workflow->id)) {
            print_progress(workflow->id, *progress);
        }

        if (auto started = store.set_task_status(entry.task.id, TaskStatus::InProgress); !started) {
            logger.error("app", started.error().message);
            return 1;
        }
        if (auto status = containers.sync_workflow_status(workflow->id); !status) {
            logger.error("app", status.error().message);
            return 1;
        }
        if (auto closed = store.set_task_status(entry.task.id, TaskStatus::Closed); !closed) {
            logger.error("app", closed.error().message);
            return 1;
        }
        std::cout << "Closed " << entry.task.id << "\n\n";
    }

    auto final_status = containers.sync_workflow_status(workflow->id);
    if (!final_status) {
        logger.error("app", final_status.error().message);
        return 1;
    }
    std::cout << "Workflow status: " << to_string(*final_status) << "\n";
    if (auto progress = derived.workflow_progress(workflow->id)) {
        print_progress(workflow->id, *progress);
    }

    logger.info("app", std::format("Audit events recorded: {}", audit.events_recorded()));
    logger.info("app", "=== Demo Complete ===");
    return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    auto args = parse_args(argc, argv);
    if (args.show_help) {
        print_usage();
        return 0;
    }

    print_banner();

    // Load configuration
    auto config_result = load_config(args.config_path);
    if (!config_result) {
        std::cerr << "Failed to load config: " << config_result.error().message << std::endl;
        std::cerr << "Using default configuration." << std::endl;
    }
    auto config = config_result ? *config_result : default_config();

    // Apply CLI overrides
    if (!args.log_dir.empty()) config.telemetry.log_dir = args.log_dir;
    if (!args.log_level.empty()) config.telemetry.log_level = args.log_level;

    auto level = parse_log_level(config.telemetry.log_level);
    if (!level) {
        std::cerr << "Unknown log level: " << config.telemetry.log_level << std::endl;
        return 2;
    }

    // ── Initialize Logger & Audit Log ────────
    std::unique_ptr<ILogSink> log_sink;
    std::unique_ptr<ILogSink> audit_sink;
    if (!config.telemetry.log_dir.empty()) {
        log_sink = std::make_unique<JsonFileSink>(config.telemetry.log_dir, "taskweave",
                                                  config.telemetry.max_file_size_mb,
                                                  config.telemetry.rotate_count);
        audit_sink = std::make_unique<JsonFileSink>(config.telemetry.log_dir,
                                                    config.telemetry.audit_file_prefix,
                                                    config.telemetry.max_file_size_mb,
                                                    config.telemetry.rotate_count);
    } else {
        log_sink = std::make_unique<StdoutSink>();
        audit_sink = std::make_unique<NullSink>();
    }
    Logger logger(std::move(log_sink), *level);
    AuditLog audit(std::move(audit_sink));

    logger.info("app", "TaskWeave starting...");
    logger.info("app", std::format("relates-to normalization: {}, reporting depth: {}, "
                                   "max extends depth: {}",
                                   config.graph.normalize_relates_to ? "on" : "off",
                                   config.graph.reporting_chain_max_depth,
                                   config.pour.max_extends_depth));

    if (!args.demo_mode) {
        print_usage();
        return 0;
    }

    int rc = run_demo(config, logger, audit);
    audit.flush();
    logger.flush();
    return rc;
}
