/**
 * @file dll_main.cpp
 * @brief Executable sharing one activity logger with a shared library.
 *
 * Both this file and agent_tools.cpp are compiled with ACTIVITY_LOG_SHARED
 * and link activity_log_shared, which holds the only default_logger(). The
 * events the library records carry this session's id, continue its event
 * numbering and nest under the scopes opened here.
 */

#include <activity-log/activity_log.hpp>
#include "agent_tools.h"
#include <cstdio>
#include <string>
#include <vector>

int main() {
    activity::Config cfg;
    cfg.log_dir = "dll_example_logs";
    activity::configure(cfg);

    std::string sid;
    try {
        sid = activity::initialize();
    } catch (const activity::Error& e) {
        std::fprintf(stderr, "ERROR: %s\n", e.what());
        return 1;
    }

    std::printf("=== Shared Library Example ===\n");
    std::printf("Session %s\n\n", sid.c_str());

    {
        activity::AgentScope agent(activity::default_logger(), "maintainer", "user", "triage TODOs");

        std::vector<std::string> source = {
            "int main() {",
            "    // TODO: parse arguments",
            "    run();",
            "    // TODO: report errors",
            "}",
        };
        std::string joined;
        for (const auto& l : source) joined += l + "\n";

        std::printf("Test 1: count lines -> %d\n", count_lines("maintainer", joined));
        std::printf("Test 2: TODO lines -> %zu\n", grep_lines("maintainer", source, "TODO").size());
        std::printf("Test 3: failing tests -> %d\n", run_suite("maintainer", "unit", 2));

        activity::log_decision("maintainer", "Fix now or file issues?",
                               std::vector<std::string>{"fix now", "file issues"},
                               "file issues", "failures are unrelated to the TODOs");
    }

    std::string path = activity::default_logger().sink_path();
    activity::shutdown();

    activity::ReadResult r = activity::read_session_file(path);
    std::printf("\n%zu events in %s\n", r.events.size(), path.c_str());
    for (const auto& e : r.events) {
        std::printf("  %s %-16s parent=%s\n", e["event_id"].get<std::string>().c_str(),
                    e["event_type"].get<std::string>().c_str(),
                    e["parent_event_id"].is_null() ? "-" : e["parent_event_id"].get<std::string>().c_str());
    }
    return 0;
}
