/**
 * @file test_dll_main.cpp
 * @brief Checks that an executable and a shared library share one default logger.
 *
 * Both sides are built with ACTIVITY_LOG_SHARED and link activity_log_shared.
 * Events recorded inside the library must continue the executable's
 * session: same session id, next event number, parent taken from the scope
 * the executable opened.
 */

#include "../test_framework.hpp"
#include "../test_support.hpp"
#include "test_dll_library.h"
#include <activity-log/activity_log.hpp>

#include <string>
#include <vector>

using namespace activity;
using test_support::TempDir;

TEST(library_shares_session_and_hierarchy) {
    TempDir dir("dll");
    activity::configure(test_support::test_config(dir));
    std::string sid = activity::initialize();

    TEST_ASSERT_EQ(dll_session_id(), sid, "library sees the executable's session");

    std::string outer, from_lib, nested;
    {
        AgentScope agent(default_logger(), "host", "user", "exercise library");
        outer = agent.event_id();
        from_lib = dll_log_tool("host");
        nested = dll_nested_file_operation("host");
    }
    TEST_ASSERT_EQ(outer, std::string("evt_001"), "first event from the executable");
    TEST_ASSERT_EQ(from_lib, std::string("evt_002"), "library continues the numbering");
    TEST_ASSERT_EQ(nested, std::string("evt_004"), "tool scope reserved evt_003");

    std::string path = default_logger().sink_path();
    activity::shutdown();

    ReadResult r = read_session_file(path);
    TEST_ASSERT_EQ(r.events.size(), (size_t)4, "one file holds both sides");
    for (const auto& e : r.events) {
        TEST_ASSERT_EQ(e["session_id"].get<std::string>(), sid, "same session id");
        std::string id = e["event_id"].get<std::string>();
        if (id == from_lib || id == "evt_003") {
            TEST_ASSERT_EQ(e["parent_event_id"].get<std::string>(), outer, "library event under host scope");
        }
        if (id == nested) {
            TEST_ASSERT_EQ(e["parent_event_id"].get<std::string>(), std::string("evt_003"),
                           "nested under the library's tool scope");
        }
    }
}

int main(int argc, char** argv) {
    return run_tests(argc, argv);
}
