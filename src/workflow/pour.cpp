/**
 * @file pour.cpp
 * @brief Pour engine implementation.
 */

#include "workflow/pour.hpp"

#include "workflow/template_eval.hpp"

#include <chrono>
#include <unordered_map>

namespace taskweave {

namespace {

/**
 * @brief Steps 1-4 of a pour: everything up to building elements.
 */
struct Expansion {
    Playbook resolved;
    VariableMap variables;
    std::vector<size_t> included;               ///< Indices into resolved.steps
    std::vector<std::string> skipped;
};

Result<Expansion> expand(const Playbook& playbook, const VariableMap& variables,
                         const PourOptions& options) {
    auto resolved = resolve_inheritance(playbook, options.loader, options.max_extends_depth);
    if (!resolved) return resolved.error();

    Expansion expansion{std::move(*resolved), {}, {}, {}};
    const auto& steps = expansion.resolved.steps;

    if (steps.empty()) {
        return Error{ErrorCode::ValidationError,
                     "Playbook '" + playbook.name + "' has no steps defined"};
    }
    if (auto valid = validate_playbook(expansion.resolved); !valid) return valid.error();

    auto vars = resolve_variables(expansion.resolved.variables, variables);
    if (!vars) return vars.error();
    expansion.variables = std::move(*vars);

    for (size_t i = 0; i < steps.size(); ++i) {
        auto include = evaluate_condition(steps[i].condition, expansion.variables);
        if (!include) {
            return Error{ErrorCode::ValidationError,
                         "Step '" + steps[i].id + "': " + include.error().message};
        }
        if (*include) {
            expansion.included.push_back(i);
        } else {
            expansion.skipped.push_back(steps[i].id);
        }
    }

    if (expansion.included.empty()) {
        return Error{ErrorCode::ValidationError,
                     "Playbook '" + playbook.name + "': all steps filtered by conditions"};
    }
    return expansion;
}

Result<Task> build_task(const PlaybookStep& step, const VariableMap& vars, ElementId id,
                        const EntityId& created_by) {
    auto title = substitute(step.title, vars);
    if (!title) return title.error();
    auto description = substitute(step.description, vars);
    if (!description) return description.error();

    Task task;
    static_cast<Element&>(task) =
        make_header(std::move(id), ElementType::Task, std::move(*title), created_by);
    task.description = std::move(*description);
    task.priority = step.priority.value_or(kDefaultPriority);
    task.task_type = step.task_type.value_or("task");

    if (step.assignee) {
        auto assignee = substitute(*step.assignee, vars);
        if (!assignee) return assignee.error();
        if (!assignee->empty()) task.assignee = std::move(*assignee);
    }

    for (const auto& raw : step.tags) {
        auto tag = substitute(raw, vars);
        if (!tag) return tag.error();
        if (!tag->empty()) task.tags.insert(std::move(*tag));
    }
    return task;
}

Dependency make_edge(ElementId source, ElementId target, DependencyType type,
                     const EntityId& created_by, Timestamp now) {
    Dependency dep;
    dep.source_id = std::move(source);
    dep.target_id = std::move(target);
    dep.type = type;
    dep.created_by = created_by;
    dep.created_at = now;
    return dep;
}

}  // namespace

Result<PourResult> pour(const Playbook& playbook, const VariableMap& variables,
                        const EntityId& created_by, const PourOptions& options) {
    auto expanded = expand(playbook, variables, options);
    if (!expanded) return expanded.error();
    const Expansion& expansion = *expanded;
    const auto& steps = expansion.resolved.steps;

    IdGenerator fallback_ids;
    IdGenerator& ids = options.id_generator ? *options.id_generator : fallback_ids;
    auto now = std::chrono::system_clock::now();

    PourResult result;
    result.resolved_variables = expansion.variables;
    result.skipped_steps = expansion.skipped;

    // ── Workflow ────────────────────────────
    std::string title;
    if (options.title) {
        title = *options.title;
    } else {
        auto rendered = substitute(playbook.title, expansion.variables);
        if (!rendered) return rendered.error();
        title = std::move(*rendered);
    }

    Workflow& workflow = result.workflow;
    static_cast<Element&>(workflow) =
        make_header(ids.next(ElementType::Workflow), ElementType::Workflow, std::move(title),
                    created_by);
    workflow.status = WorkflowStatus::Pending;
    workflow.ephemeral = options.ephemeral;
    workflow.variables = expansion.variables;
    workflow.playbook_id = playbook.id;
    workflow.tags.insert(options.tags.begin(), options.tags.end());

    // ── Tasks ───────────────────────────────
    std::unordered_map<std::string, ElementId> task_of_step;
    for (size_t n = 0; n < expansion.included.size(); ++n) {
        const auto& step = steps[expansion.included[n]];
        auto task = build_task(step, expansion.variables,
                               IdGenerator::child_id(workflow.id, n + 1), created_by);
        if (!task) return task.error();

        task_of_step.emplace(step.id, task->id);
        result.tasks.push_back(PouredTask{std::move(*task), step.id});
    }

    // ── Edges ───────────────────────────────
    for (size_t index : expansion.included) {
        const auto& step = steps[index];
        const ElementId& dependent = task_of_step.at(step.id);
        for (const auto& prerequisite : step.depends_on) {
            auto blocker = task_of_step.find(prerequisite);
            if (blocker == task_of_step.end()) continue;  // prerequisite was skipped
            result.blocks_dependencies.push_back(
                make_edge(blocker->second, dependent, DependencyType::Blocks, created_by, now));
        }
    }

    for (const auto& poured : result.tasks) {
        result.parent_child_dependencies.push_back(
            make_edge(poured.task.id, workflow.id, DependencyType::ParentChild, created_by, now));
    }

    return result;
}

PourValidation validate_pour(const Playbook& playbook, const VariableMap& variables,
                             const PourOptions& options) {
    PourValidation report;
    auto expanded = expand(playbook, variables, options);
    if (!expanded) {
        report.error = expanded.error();
        return report;
    }

    report.valid = true;
    for (size_t index : expanded->included) {
        report.included_steps.push_back(expanded->resolved.steps[index].id);
    }
    report.skipped_steps = expanded->skipped;
    report.resolved_variables = expanded->variables;
    return report;
}

}  // namespace taskweave
