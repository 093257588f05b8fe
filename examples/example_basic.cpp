/**
 * @file example_basic.cpp
 * @brief Basic example: an orchestrator delegating to two worker agents.
 *
 * Shows:
 * - Scoped agent invocations with activity::AgentScope
 * - Scoped tool usage with automatic duration (ACTIVITY_TOOL_SCOPE())
 * - Decisions, file operations, errors, validations and context snapshots
 * - Multi-threaded logging with independent per-thread hierarchies
 * - Explicit shutdown and reading the session back
 */

#include <activity-log/activity_log.hpp>
#include <thread>
#include <chrono>
#include <cstdio>

/**
 * @brief Worker agent: reads a file, edits it and runs the tests.
 *
 * Runs on its own thread, so the hierarchy of the orchestrator's thread is
 * not visible here; the invocation names its parent explicitly.
 *
 * @param name Agent name
 * @param file File the agent works on
 * @param parent Orchestrator invocation that delegated the work
 */
void worker(const std::string& name, const std::string& file, const std::string& parent) {
    activity::AgentInvocation inv;
    inv.agent = name;
    inv.invoked_by = "orchestrator";
    inv.reason = "implement " + file;
    activity::EventOptions opts;
    opts.parent_event_id = parent;
    activity::AgentScope agent(activity::default_logger(), inv, opts);

    {
        ACTIVITY_TOOL_SCOPE(name, "Read", "load " + file);
        activity::log_file_operation(name, activity::FileOperationType::Read, file);
        std::this_thread::sleep_for(std::chrono::milliseconds(3));
    }

    activity::log_decision(name, "How to structure the change?",
                           std::vector<std::string>{"inline helper", "new module"},
                           "inline helper", "change is small");

    {
        ACTIVITY_TOOL_SCOPE(name, "Edit", "patch " + file);
        activity::FileOperation op;
        op.agent = name;
        op.operation = activity::FileOperationType::Modify;
        op.file_path = file;
        op.lines_changed = 12;
        op.language = "cpp";
        activity::log_file_operation(op);
    }

    activity::ToolScope tests(activity::default_logger(), name, "Bash", "run unit tests");
    if (file == "src/parser.cpp") {
        activity::ErrorReport err;
        err.agent = name;
        err.error_type = "TestFailure";
        err.error_message = "parser_test: expected 3 tokens, got 2";
        err.severity = activity::ErrorSeverity::High;
        err.recoverable = true;
        err.attempted_fix = "handle trailing comma";
        activity::log_error(err);
        tests.fail("1 test failed");
    }
}

/**
 * @brief Main function: one session, two concurrent workers.
 */
int main() {
    activity::Config cfg;
    cfg.log_dir = "activity_logs";
    cfg.retention_count = 5;
    activity::configure(cfg);

    std::string sid = activity::initialize();
    std::printf("Session %s\n", sid.c_str());

    {
        activity::AgentScope orchestrator(activity::default_logger(), "orchestrator", "user",
                                          "add trailing comma support");
        std::string parent = orchestrator.event_id();

        activity::ContextSnapshot before;
        before.tokens_before = 12000;
        before.trigger = "phase start";
        activity::log_context_snapshot(before);

        std::thread t1([&parent]() { worker("parser-agent", "src/parser.cpp", parent); });
        std::thread t2([&parent]() { worker("docs-agent", "docs/syntax.md", parent); });
        t1.join();
        t2.join();

        activity::ValidationReport report;
        report.agent = "orchestrator";
        report.task = "trailing comma support";
        report.validation_type = "unit_tests";
        report.checks = {{"parser", "FAILED"}, {"docs", "ok"}};
        report.result = "fail";
        report.failures = {"parser_test: expected 3 tokens, got 2"};
        activity::log_validation(report);
    }

    std::string path = activity::default_logger().sink_path();
    activity::shutdown(std::chrono::seconds(5));

    activity::ReadResult r = activity::read_session_file(path);
    std::printf("Wrote %zu events to %s (%zu malformed)\n",
                r.events.size(), path.c_str(), r.malformed_lines.size());
    for (const auto& e : r.events) {
        std::printf("  %-10s %-18s parent=%s\n",
                    e["event_id"].get<std::string>().c_str(),
                    e["event_type"].get<std::string>().c_str(),
                    e["parent_event_id"].is_null() ? "-" : e["parent_event_id"].get<std::string>().c_str());
    }

    return 0;
}
