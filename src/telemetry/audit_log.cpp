/**
 * @file audit_log.cpp
 * @brief AuditLog implementation.
 */

#include "telemetry/audit_log.hpp"

#include <sstream>

namespace taskweave {

AuditLog::AuditLog(std::unique_ptr<ILogSink> sink)
    : sink_(std::move(sink)) {}

void AuditLog::record_dependency(AuditEvent event, const Dependency& dep,
                                 const EntityId& actor) {
    std::ostringstream oss;
    oss << R"({"event":")" << to_string(event) << "\""
        << R"(,"ts":")" << iso8601_now() << "\""
        << R"(,"source":")" << json_escape(dep.source_id) << "\""
        << R"(,"target":")" << json_escape(dep.target_id) << "\""
        << R"(,"type":")" << to_string(dep.type) << "\""
        << R"(,"actor":")" << json_escape(actor) << "\""
        << "}";
    emit(oss.str());
}

void AuditLog::record_element(AuditEvent event, const ElementId& id, ElementType type,
                              const EntityId& actor) {
    std::ostringstream oss;
    oss << R"({"event":")" << to_string(event) << "\""
        << R"(,"ts":")" << iso8601_now() << "\""
        << R"(,"element":")" << json_escape(id) << "\""
        << R"(,"element_type":")" << to_string(type) << "\""
        << R"(,"actor":")" << json_escape(actor) << "\""
        << "}";
    emit(oss.str());
}

void AuditLog::record_status(AuditEvent event, const ElementId& id, std::string_view old_status,
                             std::string_view new_status, const EntityId& actor) {
    std::ostringstream oss;
    oss << R"({"event":")" << to_string(event) << "\""
        << R"(,"ts":")" << iso8601_now() << "\""
        << R"(,"element":")" << json_escape(id) << "\""
        << R"(,"old":")" << old_status << "\""
        << R"(,"new":")" << new_status << "\""
        << R"(,"actor":")" << json_escape(actor) << "\""
        << "}";
    emit(oss.str());
}

void AuditLog::record_custom(AuditEvent event, const ElementId& id, const EntityId& actor,
                             std::string_view json_payload) {
    std::ostringstream oss;
    oss << R"({"event":")" << to_string(event) << "\""
        << R"(,"ts":")" << iso8601_now() << "\""
        << R"(,"element":")" << json_escape(id) << "\""
        << R"(,"actor":")" << json_escape(actor) << "\""
        << R"(,"data":)" << json_payload
        << "}";
    emit(oss.str());
}

void AuditLog::emit(std::string_view json_line) {
    std::lock_guard lock(write_mutex_);
    sink_->write(json_line);
    ++events_;
}

uint64_t AuditLog::events_recorded() const noexcept {
    return events_.load();
}

void AuditLog::flush() {
    std::lock_guard lock(write_mutex_);
    sink_->flush();
}

}  // namespace taskweave
