/**
 * @file types.cpp
 * @brief String parsing for vocabulary enumerations.
 */

#include "core/types.hpp"

namespace taskweave {

std::optional<TaskStatus> parse_task_status(std::string_view text) {
    for (auto status : {TaskStatus::Open, TaskStatus::InProgress, TaskStatus::Blocked,
                        TaskStatus::Closed, TaskStatus::Cancelled}) {
        if (to_string(status) == text) return status;
    }
    return std::nullopt;
}

}  // namespace taskweave
