/**
 * @file elements.cpp
 * @brief Element header construction.
 */

#include "storage/elements.hpp"

#include <chrono>

namespace taskweave {

Element make_header(ElementId id, ElementType type, std::string title, EntityId created_by) {
    auto now = std::chrono::system_clock::now();
    Element header;
    header.id = std::move(id);
    header.type = type;
    header.title = std::move(title);
    header.created_at = now;
    header.updated_at = now;
    header.created_by = std::move(created_by);
    return header;
}

}  // namespace taskweave
