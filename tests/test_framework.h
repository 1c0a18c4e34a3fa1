/*
 * test_framework.h - Minimal test harness for the TafKit test programs
 * This file is part of TafKit.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * TafKit is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef TAFKIT_TEST_FRAMEWORK_H
#define TAFKIT_TEST_FRAMEWORK_H

#include <chrono>
#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

namespace TestFramework {

// Every assertion throws AssertionFailure with the location and both values.
#define TAFKIT_ASSERTION_FAILED(message, detail) \
    do { \
        std::ostringstream tafkit_oss; \
        tafkit_oss << "ASSERTION FAILED: " << (message) << " at " << __FILE__ << ":" << __LINE__ \
                   << " - " << detail; \
        throw TestFramework::AssertionFailure(tafkit_oss.str()); \
    } while (0)

#define ASSERT_TRUE(condition, message) \
    do { \
        if (!(condition)) { \
            TAFKIT_ASSERTION_FAILED(message, "Expected: true, Got: false"); \
        } \
    } while (0)

#define ASSERT_FALSE(condition, message) \
    do { \
        if ((condition)) { \
            TAFKIT_ASSERTION_FAILED(message, "Expected: false, Got: true"); \
        } \
    } while (0)

#define ASSERT_EQUALS(expected, actual, message) \
    do { \
        if (!((expected) == (actual))) { \
            TAFKIT_ASSERTION_FAILED(message, "Expected: " << (expected) << ", Got: " << (actual)); \
        } \
    } while (0)

#define ASSERT_NOT_EQUALS(unexpected, actual, message) \
    do { \
        if ((unexpected) == (actual)) { \
            TAFKIT_ASSERTION_FAILED(message, "Both values were: " << (actual)); \
        } \
    } while (0)

#define ASSERT_NOT_NULL(ptr, message) \
    do { \
        if ((ptr) == nullptr) { \
            TAFKIT_ASSERTION_FAILED(message, "Expected: non-null pointer, Got: null"); \
        } \
    } while (0)

#define ASSERT_NULL(ptr, message) \
    do { \
        if ((ptr) != nullptr) { \
            TAFKIT_ASSERTION_FAILED(message, "Expected: null pointer, Got: non-null"); \
        } \
    } while (0)

class AssertionFailure : public std::exception {
public:
    explicit AssertionFailure(const std::string& message) : m_message(message) {}
    const char* what() const noexcept override { return m_message.c_str(); }

private:
    std::string m_message;
};

enum class TestResult {
    PASSED,
    FAILED, ///< an assertion did not hold
    ERROR   ///< the test threw something other than AssertionFailure
};

struct TestCaseInfo {
    std::string name;
    TestResult result = TestResult::PASSED;
    std::string failure_message;
    std::chrono::milliseconds execution_time{0};

    explicit TestCaseInfo(const std::string& test_name) : name(test_name) {}
};

/**
 * @brief One named test. Derived classes implement runTest() with the
 * ASSERT_* macros.
 */
class TestCase {
public:
    explicit TestCase(const std::string& name) : m_name(name) {}
    virtual ~TestCase() = default;

    /**
     * @brief Run the test, turning assertion failures and stray exceptions
     * into a result record.
     */
    TestCaseInfo run();

    const std::string& getName() const { return m_name; }

protected:
    virtual void runTest() = 0;

private:
    std::string m_name;
};

/**
 * @brief Ordered collection of test cases that share one report.
 */
class TestSuite {
public:
    explicit TestSuite(const std::string& name) : m_name(name) {}

    void addTest(std::unique_ptr<TestCase> test);

    std::vector<TestCaseInfo> runAll();
    void printResults(const std::vector<TestCaseInfo>& results) const;

    /// Tests that failed an assertion or threw
    int getFailureCount(const std::vector<TestCaseInfo>& results) const;

private:
    std::string m_name;
    std::vector<std::unique_ptr<TestCase>> m_tests;
};

namespace ByteTestUtils {

/**
 * @brief Assert that two byte buffers are identical.
 *
 * The failure message names the first differing offset, both sizes and a
 * short hex dump of each buffer from that offset.
 */
void assertBytesEqual(const std::vector<uint8_t>& expected, const std::vector<uint8_t>& actual,
                      const std::string& message);

std::string hexDump(const std::vector<uint8_t>& data, size_t offset = 0, size_t limit = 32);

} // namespace ByteTestUtils

namespace TestPatterns {

void assertNoThrow(const std::function<void()>& test_func,
                   const std::string& message = "Unexpected exception was thrown");

} // namespace TestPatterns

} // namespace TestFramework

#endif // TAFKIT_TEST_FRAMEWORK_H
