#pragma once
/**
 * test_framework.hpp - Minimal test macros shared by the prism test executables
 *
 * Each test is a `bool testXxx()` that starts with TEST_BEGIN and ends with
 * TEST_PASS. A failing EXPECT_* prints the reason and returns false.
 */

#include <cmath>
#include <iostream>
#include <string>

namespace prism::tests {

inline int testsRun = 0;
inline int testsPassed = 0;
inline int testsFailed = 0;

#define TEST_BEGIN(name) \
    do { \
        prism::tests::testsRun++; \
        std::cout << "  TEST: " << name << "... " << std::flush; \
    } while(0)

#define TEST_PASS() \
    do { \
        prism::tests::testsPassed++; \
        std::cout << "\033[32mPASS\033[0m" << std::endl; \
    } while(0)

#define TEST_FAIL(msg) \
    do { \
        prism::tests::testsFailed++; \
        std::cout << "\033[31mFAIL: " << msg << "\033[0m" << std::endl; \
    } while(0)

#define EXPECT_TRUE(expr) \
    do { \
        if (!(expr)) { \
            TEST_FAIL(#expr " was false"); \
            return false; \
        } \
    } while(0)

#define EXPECT_FALSE(expr) EXPECT_TRUE(!(expr))

#define EXPECT_EQ(a, b) \
    do { \
        if ((a) != (b)) { \
            TEST_FAIL(#a " != " #b); \
            return false; \
        } \
    } while(0)

#define EXPECT_NE(a, b) \
    do { \
        if ((a) == (b)) { \
            TEST_FAIL(#a " == " #b); \
            return false; \
        } \
    } while(0)

#define EXPECT_NEAR(a, b, tol) \
    do { \
        double _va = static_cast<double>(a); \
        double _vb = static_cast<double>(b); \
        if (!(std::abs(_va - _vb) <= (tol))) { \
            TEST_FAIL(#a " = " << _va << ", expected " << _vb << " +/- " << (tol)); \
            return false; \
        } \
    } while(0)

#define EXPECT_VEC_NEAR(a, b, tol) \
    do { \
        auto _va = (a); \
        auto _vb = (b); \
        if (!(std::abs(_va.x - _vb.x) <= (tol) && std::abs(_va.y - _vb.y) <= (tol) && \
              std::abs(_va.z - _vb.z) <= (tol))) { \
            TEST_FAIL(#a " = (" << _va.x << ", " << _va.y << ", " << _va.z << "), expected (" \
                      << _vb.x << ", " << _vb.y << ", " << _vb.z << ")"); \
            return false; \
        } \
    } while(0)

#define EXPECT_THROWS(stmt, exceptionType) \
    do { \
        bool _thrown = false; \
        try { \
            stmt; \
        } catch (const exceptionType&) { \
            _thrown = true; \
        } \
        if (!_thrown) { \
            TEST_FAIL(#stmt " did not throw " #exceptionType); \
            return false; \
        } \
    } while(0)

#define EXPECT_NO_THROW(stmt) \
    do { \
        try { \
            stmt; \
        } catch (const std::exception& _e) { \
            TEST_FAIL(#stmt " threw: " << _e.what()); \
            return false; \
        } \
    } while(0)

inline void printSection(const std::string& title) {
    std::cout << "\n\033[1m--- " << title << " ---\033[0m" << std::endl;
}

// Prints the totals; returns the process exit code
inline int printResults(const std::string& suite) {
    std::cout << "\n\033[1m=== " << suite << " Results ===\033[0m" << std::endl;
    std::cout << "Tests run:    " << testsRun << std::endl;
    std::cout << "\033[32mPassed:       " << testsPassed << "\033[0m" << std::endl;
    if (testsFailed > 0) {
        std::cout << "\033[31mFailed:       " << testsFailed << "\033[0m" << std::endl;
    }

    if (testsFailed > 0) {
        std::cout << "\n\033[31m*** SOME TESTS FAILED ***\033[0m" << std::endl;
    } else {
        std::cout << "\n\033[32m*** ALL TESTS PASSED ***\033[0m" << std::endl;
    }
    return testsFailed > 0 ? 1 : 0;
}

} // namespace prism::tests
