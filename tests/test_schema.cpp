/**
 * @file test_schema.cpp
 * @brief Tests for event serialization and schema validation.
 */

#include "test_framework.hpp"
#include <activity-log/event.hpp>
#include <activity-log/schema.hpp>

#include <nlohmann/json.hpp>

#include <string>

using namespace activity;
using nlohmann::json;

namespace {

Event make_event(Payload p, const std::string& id = "evt_001") {
    Event e;
    e.event_id = id;
    e.session_id = "session_20250101_120000";
    e.timestamp = "2025-01-01T12:00:00.000Z";
    e.payload = std::move(p);
    return e;
}

bool has_problem(const ValidationResult& r, const std::string& needle) {
    for (const auto& p : r.problems) {
        if (p.find(needle) != std::string::npos) return true;
    }
    return false;
}

} // namespace

TEST(agent_invocation_serializes_required_fields) {
    AgentInvocation a;
    a.agent = "coder";
    a.invoked_by = "orchestrator";
    a.reason = "implement parser";
    json j = make_event(a).to_json();

    TEST_ASSERT_EQ(j["event_type"].get<std::string>(), std::string("agent_invocation"), "kind");
    TEST_ASSERT_EQ(j["status"].get<std::string>(), std::string("started"), "default status");
    TEST_ASSERT(j["parent_event_id"].is_null(), "parent serialized as null");
    TEST_ASSERT(!j.contains("context"), "absent optional omitted");
    TEST_ASSERT(!j.contains("duration_ms"), "absent optional omitted");
    TEST_ASSERT(validate(j).ok(), "valid");
}

TEST(every_kind_validates_when_complete) {
    ToolUsage t;
    t.agent = "coder";
    t.tool = "Read";
    FileOperation f;
    f.agent = "coder";
    f.operation = FileOperationType::Create;
    f.file_path = "src/main.cpp";
    Decision d;
    d.agent = "planner";
    d.question = "which parser?";
    d.options = {"recursive descent", "table driven"};
    d.selected = "recursive descent";
    ErrorReport er;
    er.agent = "tester";
    er.error_type = "AssertionError";
    er.error_message = "expected 4 got 5";
    ContextSnapshot cs;
    cs.resolve(200000);
    ValidationReport v;
    v.agent = "reviewer";
    v.validation_type = "unit_tests";
    v.result = "PASSED";

    Payload payloads[] = {t, f, d, er, cs, v};
    for (auto& p : payloads) {
        json j = make_event(p).to_json();
        ValidationResult r = validate(j);
        TEST_ASSERT(r.ok(), j["event_type"].get<std::string>().c_str());
    }
}

TEST(decision_allows_empty_rationale) {
    Decision d;
    d.agent = "planner";
    d.question = "q";
    d.options = {"a"};
    d.selected = "a";
    json j = make_event(d).to_json();
    TEST_ASSERT_EQ(j["rationale"].get<std::string>(), std::string(), "empty rationale written");
    TEST_ASSERT(validate(j).ok(), "empty rationale is allowed");
}

TEST(empty_required_text_is_missing) {
    ToolUsage t;
    t.agent = "coder";
    ValidationResult r = validate(make_event(t).to_json());
    TEST_ASSERT(!r.ok(), "empty tool rejected");
    TEST_ASSERT(has_problem(r, "'tool'"), "problem names the field");
    TEST_ASSERT_EQ(r.problems.size(), (size_t)1, "only the tool field is wrong");
}

TEST(common_field_checks) {
    json j = make_event(ToolUsage{"coder", "Read"}).to_json();
    TEST_ASSERT(validate(j).ok(), "baseline valid");

    json bad_id = j;
    bad_id["event_id"] = "42";
    TEST_ASSERT(has_problem(validate(bad_id), "evt_"), "event_id prefix");

    json bad_ts = j;
    bad_ts["timestamp"] = "2025-01-01";
    TEST_ASSERT(has_problem(validate(bad_ts), "ISO"), "timestamp needs a time part");

    json bad_kind = j;
    bad_kind["event_type"] = "heartbeat";
    TEST_ASSERT(has_problem(validate(bad_kind), "unknown event_type"), "unknown kind");

    json bad_parent = j;
    bad_parent["parent_event_id"] = 7;
    TEST_ASSERT(has_problem(validate(bad_parent), "parent_event_id"), "parent must be string or null");

    json no_session = j;
    no_session.erase("session_id");
    TEST_ASSERT(has_problem(validate(no_session), "session_id"), "session_id required");

    TEST_ASSERT(has_problem(validate(json::array()), "object"), "non-object rejected");
}

TEST(wrong_shape_reported) {
    json j = make_event(ToolUsage{"coder", "Read"}).to_json();
    j["success"] = "yes";
    TEST_ASSERT(has_problem(validate(j), "must be boolean"), "success must be boolean");

    json e = make_event(ErrorReport{"a", "T", "m"}).to_json();
    e["context"] = "not an object";
    TEST_ASSERT(has_problem(validate(e), "must be object"), "error context must be object");
}

TEST(metadata_nested_not_merged) {
    Event e = make_event(ToolUsage{"coder", "Read"});
    e.metadata = {{"agent", "spoofed"}, {"ticket", "ABC-1"}};
    json j = e.to_json();
    TEST_ASSERT_EQ(j["agent"].get<std::string>(), std::string("coder"), "payload field intact");
    TEST_ASSERT_EQ(j["metadata"]["ticket"].get<std::string>(), std::string("ABC-1"), "metadata kept");
}

TEST(context_snapshot_defaults) {
    ContextSnapshot s;
    s.tokens_before = 40000;
    s.tokens_consumed = 5000;
    s.files_in_context = {"a.cpp", "b.cpp"};
    s.resolve(200000);
    TEST_ASSERT_EQ(*s.tokens_after, (int64_t)45000, "after = before + consumed");
    TEST_ASSERT_EQ(*s.tokens_remaining, (int64_t)155000, "remaining = budget - after");
    TEST_ASSERT_EQ(*s.tokens_total_budget, (int64_t)200000, "default budget");

    json j = make_event(s).to_json();
    TEST_ASSERT_EQ(j["files_in_context_count"].get<int>(), 2, "file count derived");

    ContextSnapshot over;
    over.tokens_before = 190000;
    over.tokens_consumed = 20000;
    over.resolve(200000);
    TEST_ASSERT_EQ(*over.tokens_remaining, (int64_t)0, "remaining clamps at zero");
}

TEST(validation_status_normalization) {
    TEST_ASSERT(normalize_validation_status("PASS") == ValidationStatus::Pass, "PASS");
    TEST_ASSERT(normalize_validation_status(" passed ") == ValidationStatus::Pass, "passed with spaces");
    TEST_ASSERT(normalize_validation_status("ok") == ValidationStatus::Pass, "ok");
    TEST_ASSERT(normalize_validation_status("1") == ValidationStatus::Pass, "1");
    TEST_ASSERT(normalize_validation_status("Error") == ValidationStatus::Fail, "error");
    TEST_ASSERT(normalize_validation_status("false") == ValidationStatus::Fail, "false");
    TEST_ASSERT(normalize_validation_status("caution") == ValidationStatus::Warning, "caution");
    TEST_ASSERT(normalize_validation_status("N/A") == ValidationStatus::Skipped, "n/a");
    TEST_ASSERT(normalize_validation_status("banana") == ValidationStatus::Skipped, "unknown");
}

TEST(validation_checks_normalized_on_write) {
    ValidationReport v;
    v.agent = "reviewer";
    v.validation_type = "ci";
    v.checks = {{"schema_validation", "PASS"}, {"performance", "warn"}, {"lint", "FAILED"}};
    v.result = "Warning";
    json j = make_event(v).to_json();
    TEST_ASSERT_EQ(j["checks"]["schema_validation"].get<std::string>(), std::string("pass"), "pass");
    TEST_ASSERT_EQ(j["checks"]["performance"].get<std::string>(), std::string("warning"), "warning");
    TEST_ASSERT_EQ(j["checks"]["lint"].get<std::string>(), std::string("fail"), "fail");
    TEST_ASSERT_EQ(j["result"].get<std::string>(), std::string("warning"), "result");
    TEST_ASSERT_EQ(j["task"].get<std::string>(), std::string(), "task may be empty");
}

TEST(event_type_names_roundtrip) {
    for (size_t i = 0; i < kEventTypeCount; ++i) {
        EventType t = static_cast<EventType>(i);
        auto parsed = parse_event_type(to_string(t));
        TEST_ASSERT(parsed && *parsed == t, to_string(t));
    }
    TEST_ASSERT(!parse_event_type("tool"), "unknown name");
}

int main(int argc, char** argv) {
    return run_tests(argc, argv);
}
