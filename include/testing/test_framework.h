#pragma once

#include <string>
#include <vector>
#include <functional>
#include <chrono>
#include <map>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <algorithm>
#include <type_traits>

namespace ulagen::testing {

enum class TestStatus {
    PASSED,
    FAILED,
    SKIPPED,
    ERROR
};

struct TestCase {
    std::string name;
    std::string description;
    std::function<void()> test_function;
    std::vector<std::string> tags;

    TestCase(const std::string& test_name, const std::function<void()>& func,
             const std::string& desc = "", const std::vector<std::string>& test_tags = {})
        : name(test_name), description(desc), test_function(func), tags(test_tags) {}
};

// setup and teardown wrap every test case of the suite.
struct TestSuite {
    std::string name;
    std::vector<TestCase> tests;
    std::function<void()> setup_function;
    std::function<void()> teardown_function;

    TestSuite() = default;
    explicit TestSuite(const std::string& suite_name) : name(suite_name) {}

    void add_test(const TestCase& test) {
        tests.push_back(test);
    }

    void set_setup(const std::function<void()>& setup) {
        setup_function = setup;
    }

    void set_teardown(const std::function<void()>& teardown) {
        teardown_function = teardown;
    }
};

struct TestResult {
    std::string test_name;
    std::string suite_name;
    TestStatus status;
    std::string error_message;
    std::chrono::milliseconds execution_time;
    std::chrono::system_clock::time_point timestamp;

    TestResult() : status(TestStatus::FAILED), execution_time(0),
                   timestamp(std::chrono::system_clock::now()) {}
};

class AssertionException : public std::runtime_error {
public:
    AssertionException(const std::string& message, const char* file, int line)
        : std::runtime_error(std::string(file) + ":" + std::to_string(line) + ": " + message) {}
};

class TestRunner {
public:
    static TestRunner& instance();

    void register_suite(const TestSuite& suite);
    TestSuite& get_or_create_suite(const std::string& suite_name);

    std::vector<TestResult> run_all_tests();
    std::vector<TestResult> run_suite(const std::string& suite_name);
    TestResult run_test(const std::string& suite_name, const std::string& test_name);
    std::vector<TestResult> run_tests_by_tag(const std::string& tag);

    // Only suites whose name contains filter run; empty runs everything.
    void set_filter(const std::string& filter) { filter_ = filter; }

    void set_output_format(const std::string& format) { output_format_ = format; }
    void set_stop_on_failure(bool stop) { stop_on_failure_ = stop; }

    size_t get_suite_count() const { return test_suites_.size(); }
    size_t get_test_count() const;

    void generate_report(const std::vector<TestResult>& results, std::ostream& output) const;
    void export_xml_report(const std::vector<TestResult>& results, const std::string& filename) const;
    void export_json_report(const std::vector<TestResult>& results, const std::string& filename) const;

    static std::string status_to_string(TestStatus status);

private:
    TestRunner() = default;

    TestResult run_single_test(const TestSuite& suite, const TestCase& test);

    void generate_console_report(const std::vector<TestResult>& results, std::ostream& output) const;
    void generate_json_report(const std::vector<TestResult>& results, std::ostream& output) const;
    void generate_xml_report(const std::vector<TestResult>& results, std::ostream& output) const;

    static std::string escape_json(const std::string& str);
    static std::string escape_xml(const std::string& str);

    std::map<std::string, TestSuite> test_suites_;
    std::string output_format_{"console"};
    std::string filter_;
    bool stop_on_failure_{false};
};

// Static-initialization hooks behind TEST_CASE, SETUP and TEARDOWN.
struct TestRegistrar {
    TestRegistrar(const char* suite_name, const char* test_name, const char* description, void (*func)()) {
        TestRunner::instance().get_or_create_suite(suite_name).add_test(TestCase(test_name, func, description));
    }
};

enum class SuiteHook {
    SETUP,
    TEARDOWN
};

struct SuiteHookRegistrar {
    SuiteHookRegistrar(const char* suite_name, SuiteHook hook, void (*func)()) {
        auto& suite = TestRunner::instance().get_or_create_suite(suite_name);
        if (hook == SuiteHook::SETUP) {
            suite.set_setup(func);
        } else {
            suite.set_teardown(func);
        }
    }
};

template<typename T, typename = void>
struct is_streamable : std::false_type {};

template<typename T>
struct is_streamable<T, std::void_t<decltype(std::declval<std::ostream&>() << std::declval<const T&>())>>
    : std::true_type {};

template<typename T>
std::string describe_value(const T& value) {
    if constexpr (is_streamable<T>::value) {
        std::ostringstream oss;
        if constexpr (std::is_same_v<T, bool>) {
            oss << std::boolalpha;
        }
        oss << value;
        return oss.str();
    } else {
        return "<unprintable>";
    }
}

class Assertion {
public:
    template<typename T, typename U>
    static void assert_equal(const T& expected, const U& actual, const std::string& expression,
                             const char* file, int line) {
        if (!(expected == actual)) {
            throw AssertionException(expression + ": expected <" + describe_value(expected) +
                                     "> but was <" + describe_value(actual) + ">", file, line);
        }
    }

    template<typename T, typename U>
    static void assert_not_equal(const T& unexpected, const U& actual, const std::string& expression,
                                 const char* file, int line) {
        if (unexpected == actual) {
            throw AssertionException(expression + ": both are <" + describe_value(actual) + ">", file, line);
        }
    }

    static void assert_true(bool condition, const std::string& expression, const char* file, int line) {
        if (!condition) {
            throw AssertionException(expression + " is false", file, line);
        }
    }

    static void assert_false(bool condition, const std::string& expression, const char* file, int line) {
        if (condition) {
            throw AssertionException(expression + " is true", file, line);
        }
    }

    template<typename T, typename U>
    static void assert_greater(const T& value, const U& threshold, const std::string& expression,
                               const char* file, int line) {
        if (!(value > threshold)) {
            throw AssertionException(expression + ": <" + describe_value(value) + "> is not greater than <" +
                                     describe_value(threshold) + ">", file, line);
        }
    }

    template<typename T, typename U>
    static void assert_less(const T& value, const U& threshold, const std::string& expression,
                            const char* file, int line) {
        if (!(value < threshold)) {
            throw AssertionException(expression + ": <" + describe_value(value) + "> is not less than <" +
                                     describe_value(threshold) + ">", file, line);
        }
    }

    static void assert_contains(const std::string& haystack, const std::string& needle,
                                const std::string& expression, const char* file, int line) {
        if (haystack.find(needle) == std::string::npos) {
            throw AssertionException(expression + ": \"" + haystack + "\" does not contain \"" + needle + "\"",
                                     file, line);
        }
    }

    template<typename Exception>
    static void assert_throws(const std::function<void()>& func, const std::string& expression,
                              const char* file, int line) {
        try {
            func();
        } catch (const Exception&) {
            return;
        } catch (const AssertionException&) {
            throw;
        } catch (const std::exception& e) {
            throw AssertionException(expression + ": threw a different exception: " + e.what(), file, line);
        }
        throw AssertionException(expression + ": no exception thrown", file, line);
    }

    static void assert_no_throw(const std::function<void()>& func, const std::string& expression,
                                const char* file, int line) {
        try {
            func();
        } catch (const AssertionException&) {
            throw;
        } catch (const std::exception& e) {
            throw AssertionException(expression + ": threw " + e.what(), file, line);
        }
    }
};

// Records calls made on a test double.
class MockObject {
public:
    struct MethodCall {
        std::string method_name;
        std::vector<std::string> arguments;
        std::chrono::system_clock::time_point timestamp;

        MethodCall(const std::string& name, const std::vector<std::string>& args = {})
            : method_name(name), arguments(args), timestamp(std::chrono::system_clock::now()) {}
    };

    void record_call(const std::string& method_name, const std::vector<std::string>& args = {}) const {
        method_calls_.emplace_back(method_name, args);
    }

    size_t get_call_count(const std::string& method_name) const {
        return static_cast<size_t>(std::count_if(method_calls_.begin(), method_calls_.end(),
                                                 [&method_name](const MethodCall& call) {
                                                     return call.method_name == method_name;
                                                 }));
    }

    bool was_called(const std::string& method_name) const {
        return get_call_count(method_name) > 0;
    }

    std::vector<MethodCall> get_calls() const {
        return method_calls_;
    }

    void clear_calls() {
        method_calls_.clear();
    }

private:
    mutable std::vector<MethodCall> method_calls_;
};

}

// TEST_SUITE(Name) { TEST_CASE(Case, "description") { ... } }
// The description is optional: TEST_CASE(Case) { ... }
#define TEST_SUITE(suite_name) \
    namespace suite_name##_suite { \
        [[maybe_unused]] static const char* const ulagen_test_suite_name = #suite_name; \
    } \
    namespace suite_name##_suite

#define TEST_CASE(case_name, ...) \
    static void case_name(); \
    static const ::ulagen::testing::TestRegistrar case_name##_registrar( \
        ulagen_test_suite_name, #case_name, "" __VA_ARGS__, &case_name); \
    static void case_name()

#define SETUP() \
    static void ulagen_suite_setup(); \
    static const ::ulagen::testing::SuiteHookRegistrar ulagen_suite_setup_registrar( \
        ulagen_test_suite_name, ::ulagen::testing::SuiteHook::SETUP, &ulagen_suite_setup); \
    static void ulagen_suite_setup()

#define TEARDOWN() \
    static void ulagen_suite_teardown(); \
    static const ::ulagen::testing::SuiteHookRegistrar ulagen_suite_teardown_registrar( \
        ulagen_test_suite_name, ::ulagen::testing::SuiteHook::TEARDOWN, &ulagen_suite_teardown); \
    static void ulagen_suite_teardown()

#define ASSERT_EQ(expected, actual) \
    ::ulagen::testing::Assertion::assert_equal(expected, actual, #expected " == " #actual, __FILE__, __LINE__)

#define ASSERT_EQUAL(expected, actual) ASSERT_EQ(expected, actual)

#define ASSERT_NE(unexpected, actual) \
    ::ulagen::testing::Assertion::assert_not_equal(unexpected, actual, #unexpected " != " #actual, __FILE__, __LINE__)

#define ASSERT_NOT_EQUAL(unexpected, actual) ASSERT_NE(unexpected, actual)

#define ASSERT_TRUE(condition) \
    ::ulagen::testing::Assertion::assert_true(static_cast<bool>(condition), #condition, __FILE__, __LINE__)

#define ASSERT_FALSE(condition) \
    ::ulagen::testing::Assertion::assert_false(static_cast<bool>(condition), #condition, __FILE__, __LINE__)

#define ASSERT_NOT_NULL(ptr) \
    ::ulagen::testing::Assertion::assert_true((ptr) != nullptr, #ptr " is not null", __FILE__, __LINE__)

#define ASSERT_GT(value, threshold) \
    ::ulagen::testing::Assertion::assert_greater(value, threshold, #value " > " #threshold, __FILE__, __LINE__)

#define ASSERT_GREATER(value, threshold) ASSERT_GT(value, threshold)

#define ASSERT_LT(value, threshold) \
    ::ulagen::testing::Assertion::assert_less(value, threshold, #value " < " #threshold, __FILE__, __LINE__)

#define ASSERT_CONTAINS(haystack, needle) \
    ::ulagen::testing::Assertion::assert_contains(haystack, needle, #haystack " contains " #needle, __FILE__, __LINE__)

#define ASSERT_THROWS(expression, exception_type) \
    ::ulagen::testing::Assertion::assert_throws<exception_type>( \
        [&]() { (void)(expression); }, #expression " throws " #exception_type, __FILE__, __LINE__)

#define ASSERT_NO_THROW(expression) \
    ::ulagen::testing::Assertion::assert_no_throw( \
        [&]() { (void)(expression); }, #expression " does not throw", __FILE__, __LINE__)
