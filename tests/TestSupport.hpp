#pragma once

#include <cmath>
#include <functional>
#include <iostream>
#include <stdexcept>
#include <string>

namespace vigil::test {

struct TestFailure : std::runtime_error {
    using std::runtime_error::runtime_error;
};

inline int g_tests_run = 0;
inline int g_tests_failed = 0;

inline void expect(bool condition, const std::string& message) {
    if (!condition) throw TestFailure(message);
}

inline void expect_near(double actual, double expected, double tol, const std::string& message) {
    if (std::fabs(actual - expected) > tol) {
        throw TestFailure(message + " (got " + std::to_string(actual) +
                          ", want " + std::to_string(expected) + ")");
    }
}

template<typename Ex, typename Fn>
void expect_throws(Fn&& fn, const std::string& message) {
    try {
        fn();
    } catch (const Ex&) {
        return;
    }
    throw TestFailure(message + " (no exception)");
}

inline void run_test(const std::string& name, const std::function<void()>& fn) {
    ++g_tests_run;
    std::cout << "[TEST] " << name << "...";
    try {
        fn();
        std::cout << " PASSED" << std::endl;
    } catch (const TestFailure& e) {
        ++g_tests_failed;
        std::cout << " FAILED\n[TEST]   " << e.what() << std::endl;
    } catch (const std::exception& e) {
        ++g_tests_failed;
        std::cout << " FAILED\n[TEST]   unexpected exception: " << e.what() << std::endl;
    }
}

inline int finish(const char* suite) {
    std::cout << "[TEST] " << suite << ": " << (g_tests_run - g_tests_failed)
              << "/" << g_tests_run << " passed" << std::endl;
    return g_tests_failed == 0 ? 0 : 1;
}

} // namespace vigil::test
