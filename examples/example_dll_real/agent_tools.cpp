/**
 * @file agent_tools.cpp
 * @brief Shared library whose functions log through the executable's logger.
 */

#include "agent_tools.h"
#include <activity-log/activity_log.hpp>

int count_lines(const std::string& agent, const std::string& text) {
    activity::ToolScope tool(activity::default_logger(), agent, "wc", "count lines");
    int n = 0;
    for (char c : text) {
        if (c == '\n') ++n;
    }
    tool.set_result_summary(std::to_string(n) + " lines");
    return n;
}

std::vector<size_t> grep_lines(const std::string& agent, const std::vector<std::string>& lines,
                               const std::string& pattern) {
    activity::ToolScope tool(activity::default_logger(), agent, "Grep", "search for " + pattern,
                             nlohmann::json{{"pattern", pattern}, {"lines", lines.size()}});
    std::vector<size_t> hits;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (lines[i].find(pattern) != std::string::npos) hits.push_back(i);
    }
    tool.set_result_summary(std::to_string(hits.size()) + " match(es)");
    return hits;
}

int run_suite(const std::string& agent, const std::string& suite, int failing) {
    activity::ToolScope tool(activity::default_logger(), agent, "Bash", "run " + suite);
    if (failing > 0) {
        activity::ErrorReport err;
        err.agent = agent;
        err.error_type = "TestFailure";
        err.error_message = std::to_string(failing) + " test(s) failed in " + suite;
        err.context = {{"suite", suite}, {"failing", failing}};
        activity::log_error(err);
        tool.fail(err.error_message);
    }
    return failing;
}
