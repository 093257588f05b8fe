/**
 * @file test_framework_test.cpp
 * @brief Self-test for the test framework.
 *
 * Checks that assertions pass when they should, and that a failing
 * assertion surfaces as test_framework::AssertionFailure carrying the
 * location and message.
 */

#include "test_framework.hpp"
#include <cstring>
#include <stdexcept>
#include <string>

namespace {

struct BaseError : std::runtime_error {
    explicit BaseError(const char* m) : std::runtime_error(m) {}
};

struct DerivedError : BaseError {
    explicit DerivedError(const char* m) : BaseError(m) {}
};

void throw_derived() { throw DerivedError("derived"); }
void throw_logic() { throw std::logic_error("logic"); }
void no_throw() {}

/// Run @p fn and return the AssertionFailure text it raised, or "" if none.
template <typename Fn>
std::string failure_of(Fn fn) {
    try {
        fn();
    } catch (const test_framework::AssertionFailure& e) {
        return e.what();
    }
    return std::string();
}

} // namespace

// Basic assertion that should pass
TEST(assertion_pass) {
    TEST_ASSERT(true, "true should be true");
    TEST_ASSERT(1 + 1 == 2, "Basic arithmetic");
    TEST_ASSERT(std::strcmp("hello", "hello") == 0, "String comparison");
}

// Equality and inequality assertions
TEST(assertion_eq_ne) {
    TEST_ASSERT_EQ(42, 42, "Integers should be equal");
    TEST_ASSERT_EQ(std::string("evt_001"), std::string("evt_001"), "Strings should be equal");
    TEST_ASSERT_NE(1, 2, "Different values");
    TEST_ASSERT_NE(std::string("a"), std::string("b"), "Different strings");
}

// Expected exception, exact type and base type
TEST(assertion_throws_matches) {
    TEST_ASSERT_THROWS(throw_derived(), DerivedError, "Exact type");
    TEST_ASSERT_THROWS(throw_derived(), BaseError, "Base type");
    TEST_ASSERT_THROWS(throw_logic(), std::exception, "std::exception catches all");
}

// Failing TEST_ASSERT reports file, line and message
TEST(failed_assert_reports_location) {
    std::string text = failure_of([]() { TEST_ASSERT(1 == 2, "one is not two"); });
    TEST_ASSERT(!text.empty(), "failure raised");
    TEST_ASSERT(text.find("test_framework_test.cpp") != std::string::npos, "file in message");
    TEST_ASSERT(text.find("one is not two") != std::string::npos, "message in failure");
}

// Failing TEST_ASSERT_EQ names both expressions
TEST(failed_eq_names_expressions) {
    std::string text = failure_of([]() {
        int lhs = 3;
        TEST_ASSERT_EQ(lhs, 4, "values differ");
    });
    TEST_ASSERT(text.find("lhs == 4") != std::string::npos, "expressions in message");
}

// TEST_ASSERT_THROWS fails when nothing is thrown
TEST(throws_fails_without_exception) {
    std::string text = failure_of([]() { TEST_ASSERT_THROWS(no_throw(), BaseError, "must throw"); });
    TEST_ASSERT(text.find("did not throw") != std::string::npos, "missing throw reported");
}

// TEST_ASSERT_THROWS fails on the wrong exception type
TEST(throws_fails_on_wrong_type) {
    std::string text = failure_of([]() { TEST_ASSERT_THROWS(throw_logic(), BaseError, "wrong type"); });
    TEST_ASSERT(text.find("instead of") != std::string::npos, "wrong type reported");
    TEST_ASSERT(text.find("logic") != std::string::npos, "actual what() included");
}

// Assertions inside loops
TEST(loop_test) {
    int sum = 0;
    for (int i = 0; i < 10; ++i) {
        TEST_ASSERT(i >= 0 && i < 10, "Loop counter in range");
        sum += i;
    }
    TEST_ASSERT_EQ(sum, 45, "Sum of 0..9");
}

/**
 * @brief Main function - runs all tests.
 */
int main(int argc, char** argv) {
    return run_tests(argc, argv);
}
