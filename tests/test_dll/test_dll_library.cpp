/**
 * @file test_dll_library.cpp
 * @brief Shared library logging through the process-wide default logger.
 */

#include "test_dll_library.h"
#include <activity-log/activity_log.hpp>

std::string dll_log_tool(const std::string& agent) {
    return activity::log_tool_usage(agent, "Read", "called from the library");
}

std::string dll_nested_file_operation(const std::string& agent) {
    activity::ToolScope tool(activity::default_logger(), agent, "Edit", "library edit");
    return activity::log_file_operation(agent, activity::FileOperationType::Modify, "lib/module.cpp");
}

std::string dll_session_id() {
    return activity::session_id();
}
