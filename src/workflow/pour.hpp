/**
 * @file pour.hpp
 * @brief Workflow instantiation: playbook + variables -> candidate graph fragment.
 *
 * pour() is a pure transformation. It builds an unpersisted Workflow, its
 * Tasks and the blocks/parent-child edges between them; storing the
 * fragment (and running every edge through the graph's validation) is
 * ContainerService::persist_pour's job.
 */

#pragma once

#include "core/id_generator.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "core/variables.hpp"
#include "graph/dependency.hpp"
#include "storage/elements.hpp"
#include "workflow/playbook.hpp"

#include <optional>
#include <string>
#include <vector>

namespace taskweave {

inline constexpr size_t kDefaultMaxExtendsDepth = 10;

struct PourOptions {
    std::optional<std::string> title;           ///< Overrides the playbook title
    bool ephemeral = false;
    std::vector<std::string> tags;              ///< Applied to the workflow
    PlaybookLoader loader;                      ///< Resolves `extends`; may be empty
    IdGenerator* id_generator = nullptr;        ///< Defaults to a fresh random generator
    size_t max_extends_depth = kDefaultMaxExtendsDepth;
};

/// A generated task and the step it came from.
struct PouredTask {
    Task task;
    std::string step_id;
};

struct PourResult {
    Workflow workflow;
    std::vector<PouredTask> tasks;
    std::vector<Dependency> blocks_dependencies;
    std::vector<Dependency> parent_child_dependencies;
    std::vector<std::string> skipped_steps;
    VariableMap resolved_variables;
};

/**
 * @brief Instantiate a playbook.
 *
 * Generated task ids are children of the workflow id ("wf-xxxx.1",
 * ".2", ...) in step order. Fails with ValidationError when the playbook
 * has no steps, a variable does not resolve, a placeholder is malformed,
 * or every step is filtered out by its condition.
 */
Result<PourResult> pour(const Playbook& playbook,
                        const VariableMap& variables,
                        const EntityId& created_by,
                        const PourOptions& options = {});

/**
 * @brief Dry-run report: what pour() would include, without building tasks.
 */
struct PourValidation {
    bool valid = false;
    std::optional<Error> error;
    std::vector<std::string> included_steps;
    std::vector<std::string> skipped_steps;
    VariableMap resolved_variables;
};

[[nodiscard]] PourValidation validate_pour(const Playbook& playbook,
                                           const VariableMap& variables,
                                           const PourOptions& options = {});

}  // namespace taskweave
