#pragma once
/**
 * @file schema.hpp
 * @brief Runtime schema check for serialized events.
 *
 * Typed payloads make most mistakes impossible at compile time; this check
 * covers what types cannot express (empty required text, ids in the wrong
 * shape) and records read back from disk.
 */

#include <activity-log/event.hpp>

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace activity {

/** @brief JSON shape a required field must have. */
enum class FieldShape { String, Text, Integer, Number, Boolean, Array, Object };

/** @brief One required field of a kind. */
struct FieldRule {
    const char* name;
    FieldShape shape;
};

/** @brief Result of validate(); ok() when problems is empty. */
struct ValidationResult {
    std::vector<std::string> problems;

    bool ok() const { return problems.empty(); }
};

/**
 * @brief Required fields of @p t.
 *
 * FieldShape::Text is a string that must not be empty; FieldShape::String
 * allows "" (decision rationale, validation task).
 */
inline const std::vector<FieldRule>& required_fields(EventType t) {
    static const std::vector<FieldRule> rules[kEventTypeCount] = {
        // agent_invocation
        {{"agent", FieldShape::Text}, {"invoked_by", FieldShape::Text},
         {"reason", FieldShape::Text}, {"status", FieldShape::Text}},
        // tool_usage
        {{"agent", FieldShape::Text}, {"tool", FieldShape::Text},
         {"success", FieldShape::Boolean}},
        // file_operation
        {{"agent", FieldShape::Text}, {"operation", FieldShape::Text},
         {"file_path", FieldShape::Text}},
        // decision
        {{"agent", FieldShape::Text}, {"question", FieldShape::Text},
         {"options", FieldShape::Array}, {"selected", FieldShape::Text},
         {"rationale", FieldShape::String}},
        // error
        {{"agent", FieldShape::Text}, {"error_type", FieldShape::Text},
         {"error_message", FieldShape::Text}, {"severity", FieldShape::Text},
         {"context", FieldShape::Object}},
        // context_snapshot
        {{"tokens_before", FieldShape::Integer}, {"tokens_after", FieldShape::Integer},
         {"tokens_consumed", FieldShape::Integer}, {"tokens_remaining", FieldShape::Integer},
         {"tokens_total_budget", FieldShape::Integer}, {"files_in_context", FieldShape::Array},
         {"files_in_context_count", FieldShape::Integer}},
        // validation
        {{"agent", FieldShape::Text}, {"task", FieldShape::String},
         {"validation_type", FieldShape::Text}, {"checks", FieldShape::Object},
         {"result", FieldShape::Text}},
    };
    return rules[static_cast<size_t>(t)];
}

namespace detail {

inline const char* shape_name(FieldShape s) {
    switch (s) {
        case FieldShape::String:
        case FieldShape::Text:    return "string";
        case FieldShape::Integer: return "integer";
        case FieldShape::Number:  return "number";
        case FieldShape::Boolean: return "boolean";
        case FieldShape::Array:   return "array";
        case FieldShape::Object:  return "object";
    }
    return "value";
}

inline bool has_shape(const nlohmann::json& v, FieldShape s) {
    switch (s) {
        case FieldShape::String:
        case FieldShape::Text:    return v.is_string();
        case FieldShape::Integer: return v.is_number_integer();
        case FieldShape::Number:  return v.is_number();
        case FieldShape::Boolean: return v.is_boolean();
        case FieldShape::Array:   return v.is_array();
        case FieldShape::Object:  return v.is_object();
    }
    return false;
}

inline void check_field(const nlohmann::json& e, const FieldRule& rule,
                        std::vector<std::string>& problems) {
    auto it = e.find(rule.name);
    if (it == e.end() || it->is_null()) {
        problems.push_back(std::string("missing required field '") + rule.name + "'");
        return;
    }
    if (!has_shape(*it, rule.shape)) {
        problems.push_back(std::string("field '") + rule.name + "' must be " + shape_name(rule.shape));
        return;
    }
    if (rule.shape == FieldShape::Text && it->get_ref<const std::string&>().empty()) {
        problems.push_back(std::string("missing required field '") + rule.name + "' (empty)");
    }
}

} // namespace detail

/**
 * @brief Validate a serialized event.
 *
 * Checks the common fields (event_type is one of the seven kinds, timestamp
 * carries a time part, session_id is non-empty, event_id starts with "evt_",
 * parent_event_id is null or a string) and then every required field of the
 * event's kind.
 */
inline ValidationResult validate(const nlohmann::json& event) {
    ValidationResult r;
    if (!event.is_object()) {
        r.problems.push_back("event must be a JSON object");
        return r;
    }

    std::optional<EventType> type;
    auto et = event.find("event_type");
    if (et == event.end() || !et->is_string()) {
        r.problems.push_back("missing required field 'event_type'");
    } else {
        type = parse_event_type(et->get<std::string>());
        if (!type) r.problems.push_back("unknown event_type '" + et->get<std::string>() + "'");
    }

    auto ts = event.find("timestamp");
    if (ts == event.end() || !ts->is_string()) {
        r.problems.push_back("missing required field 'timestamp'");
    } else if (ts->get_ref<const std::string&>().find('T') == std::string::npos) {
        r.problems.push_back("timestamp '" + ts->get<std::string>() + "' is not ISO-8601");
    }

    auto sid = event.find("session_id");
    if (sid == event.end() || !sid->is_string() || sid->get_ref<const std::string&>().empty()) {
        r.problems.push_back("missing required field 'session_id'");
    }

    auto eid = event.find("event_id");
    if (eid == event.end() || !eid->is_string()) {
        r.problems.push_back("missing required field 'event_id'");
    } else if (eid->get_ref<const std::string&>().compare(0, 4, "evt_") != 0) {
        r.problems.push_back("event_id '" + eid->get<std::string>() + "' must start with 'evt_'");
    }

    auto pid = event.find("parent_event_id");
    if (pid != event.end() && !pid->is_null() && !pid->is_string()) {
        r.problems.push_back("field 'parent_event_id' must be string or null");
    }

    if (type) {
        for (const FieldRule& rule : required_fields(*type)) {
            detail::check_field(event, rule, r.problems);
        }
    }
    return r;
}

} // namespace activity
