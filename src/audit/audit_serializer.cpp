#include "audit/audit_serializer.hpp"
#include "core/utils.hpp"

#include <format>

namespace sqlaudit {

// ============================================================================
// JSON Serialization - Section Builders
// ============================================================================

namespace {

void append_value(std::string& out, const SqlValue& value) {
    if (value) {
        out += '"';
        out += utils::escape_json(*value);
        out += '"';
    } else {
        out += "null";
    }
}

template <typename Range>
std::string value_map_to_json(const Range& entries) {
    std::string out = "{";
    bool first = true;
    for (const auto& [key, value] : entries) {
        if (!first) out += ',';
        first = false;
        out += std::format("\"{}\":", utils::escape_json(key));
        append_value(out, value);
    }
    out += '}';
    return out;
}

void append_optional_string(std::string& out, std::string_view key,
                            const std::optional<std::string>& value) {
    if (value) {
        out += std::format("\"{}\":\"{}\",", key, utils::escape_json(*value));
    }
}

void append_event_tracking(std::string& out, const AuditRecord& r) {
    out += std::format("\"audit_id\":\"{}\",\"sequence_num\":{},\"timestamp\":\"{}\",",
                       r.audit_id, r.sequence_num, utils::format_timestamp(r.timestamp));
    out += std::format("\"event_name\":\"{}\",", utils::escape_json(r.event_name));
}

void append_statement(std::string& out, const AuditRecord& r) {
    out += std::format("\"operation\":\"{}\",", operation_kind_to_string(r.operation));
    append_optional_string(out, "schema", r.schema_name);
    out += std::format("\"table\":\"{}\",", utils::escape_json(r.table_name));
    out += std::format("\"query\":\"{}\",", utils::escape_json(r.query));
    out += std::format("\"parameters\":{},", parameters_to_json(r.parameters));
    out += std::format("\"rows_affected\":{},\"capture_strategy\":\"{}\",",
                       r.rows_affected, utils::escape_json(r.capture_strategy));
}

void append_images(std::string& out, const AuditRecord& r) {
    out += std::format("\"before\":{},\"after\":{},",
                       snapshot_to_json(r.before), snapshot_to_json(r.after));
}

void append_actor(std::string& out, const AuditRecord& r) {
    append_optional_string(out, "actor_id", r.actor_id);
    append_optional_string(out, "actor_name", r.actor_name);
    append_optional_string(out, "network_address", r.network_address);
    append_optional_string(out, "agent", r.agent_string);
}

void append_origin(std::string& out, const AuditRecord& r) {
    out += std::format("\"host_name\":\"{}\",\"process_id\":{},\"thread_id\":\"{}\",",
                       utils::escape_json(r.host_name), r.process_id, r.thread_id);
    if (!r.custom_properties.empty()) {
        out += std::format("\"custom_properties\":{},", properties_to_json(r.custom_properties));
    }
}

void append_integrity(std::string& out, const AuditRecord& r) {
    if (!r.record_hash.empty()) {
        out += std::format("\"record_hash\":\"{}\",\"previous_hash\":\"{}\"",
                           r.record_hash, r.previous_hash);
    } else {
        if (!out.empty() && out.back() == ',') out.pop_back();
    }
}

} // anonymous namespace

std::string snapshot_to_json(const RowSnapshot& snapshot) {
    return value_map_to_json(snapshot);
}

std::string parameters_to_json(const ParameterMap& params) {
    return value_map_to_json(params);
}

std::string properties_to_json(const PropertyMap& properties) {
    std::string out = "{";
    bool first = true;
    for (const auto& [key, value] : properties) {
        if (!first) out += ',';
        first = false;
        out += std::format("\"{}\":\"{}\"", utils::escape_json(key), utils::escape_json(value));
    }
    out += '}';
    return out;
}

std::string audit_to_json(const AuditRecord& record) {
    std::string result;
    result.reserve(512);
    result += '{';
    append_event_tracking(result, record);
    append_statement(result, record);
    append_images(result, record);
    append_actor(result, record);
    append_origin(result, record);
    append_integrity(result, record);
    result += '}';
    return result;
}

} // namespace sqlaudit
