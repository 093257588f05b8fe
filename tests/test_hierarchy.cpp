/**
 * @file test_hierarchy.cpp
 * @brief Tests for per-thread parent tracking and scope guards.
 */

#include "test_framework.hpp"
#include "test_support.hpp"
#include <activity-log/hierarchy.hpp>

#include <cstdio>
#include <stdexcept>
#include <string>
#include <thread>

using namespace activity;

TEST(empty_tracker_has_no_parent) {
    HierarchyTracker t;
    TEST_ASSERT(!t.current_parent(), "no parent before any scope");
    TEST_ASSERT_EQ(t.depth(), (size_t)0, "depth zero");
}

TEST(begin_end_lifo) {
    HierarchyTracker t;
    t.begin("evt_001");
    t.begin("evt_002");
    TEST_ASSERT_EQ(*t.current_parent(), std::string("evt_002"), "innermost wins");
    TEST_ASSERT_EQ(t.depth(), (size_t)2, "two open scopes");

    t.end("evt_002");
    TEST_ASSERT_EQ(*t.current_parent(), std::string("evt_001"), "outer scope is parent again");
    TEST_ASSERT_EQ(t.end(), std::string("evt_001"), "end() returns popped id");
    TEST_ASSERT(!t.current_parent(), "stack empty");
}

TEST(end_out_of_order_throws) {
    HierarchyTracker t;
    t.begin("evt_001");
    t.begin("evt_002");
    TEST_ASSERT_THROWS(t.end("evt_001"), ScopeOrderError, "ending outer scope first");
    TEST_ASSERT_EQ(t.depth(), (size_t)2, "failed end leaves stack untouched");
}

TEST(end_on_empty_stack_throws) {
    HierarchyTracker t;
    TEST_ASSERT_THROWS(t.end(), ScopeOrderError, "end() with nothing open");
    TEST_ASSERT_THROWS(t.end("evt_009"), ScopeOrderError, "end(id) with nothing open");
}

TEST(threads_have_independent_stacks) {
    HierarchyTracker t;
    t.begin("evt_main");

    std::optional<std::string> seen_in_worker = std::string("unset");
    std::optional<std::string> worker_inner;
    std::thread worker([&]() {
        seen_in_worker = t.current_parent();
        t.begin("evt_worker");
        worker_inner = t.current_parent();
        t.end("evt_worker");
    });
    worker.join();

    TEST_ASSERT(!seen_in_worker, "worker does not see main thread's parent");
    TEST_ASSERT_EQ(*worker_inner, std::string("evt_worker"), "worker sees its own scope");
    TEST_ASSERT_EQ(*t.current_parent(), std::string("evt_main"), "main unaffected by worker");
}

TEST(unwind_to_removes_inner_scopes) {
    HierarchyTracker t;
    t.begin("evt_001");
    t.begin("evt_002");
    t.begin("evt_003");
    TEST_ASSERT_EQ(t.unwind_to("evt_002"), (size_t)2, "removes 003 and 002");
    TEST_ASSERT_EQ(*t.current_parent(), std::string("evt_001"), "001 remains");
    TEST_ASSERT_EQ(t.unwind_to("evt_404"), (size_t)0, "unknown id removes nothing");
}

TEST(scope_guard_pops_on_exception) {
    HierarchyTracker t;
    try {
        HierarchyScope s(t, "evt_001");
        TEST_ASSERT_EQ(*t.current_parent(), std::string("evt_001"), "guard opened scope");
        throw std::runtime_error("boom");
    } catch (const std::runtime_error&) {
    }
    TEST_ASSERT(!t.current_parent(), "guard closed scope while unwinding");
}

TEST(scope_guard_out_of_order_reports_and_unwinds) {
    HierarchyTracker t;
    FILE* diag = std::tmpfile();
    TEST_ASSERT(diag != nullptr, "tmpfile");

    {
        HierarchyScope outer(t, "evt_001", diag);
        t.begin("evt_002");  // opened by hand, never ended
    }

    TEST_ASSERT_EQ(t.depth(), (size_t)0, "outer guard unwound the leaked inner scope too");
    std::string text = test_support::slurp(diag);
    TEST_ASSERT(text.find("out of order") != std::string::npos, "violation reported");
    TEST_ASSERT(text.find("evt_002") != std::string::npos, "report names the innermost scope");
    std::fclose(diag);
}

TEST(clear_drops_all_threads) {
    HierarchyTracker t;
    t.begin("evt_001");
    t.clear();
    TEST_ASSERT_EQ(t.depth(), (size_t)0, "cleared");
}

int main(int argc, char** argv) {
    return run_tests(argc, argv);
}
