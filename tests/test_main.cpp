#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>
#include "log/TaggedLogger.hpp"
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <mutex>

namespace {

// Prints each test case and subcase name as it starts; every other event is ignored.
struct TestProgress : doctest::IReporter {
    explicit TestProgress(const doctest::ContextOptions&) {}

    void test_case_start(const doctest::TestCaseData& in) override { print("Test: ", in.m_name); }
    void subcase_start(const doctest::SubcaseSignature& in) override { print("\tSubcase: ", in.m_name.c_str()); }

    void report_query(const doctest::QueryData&) override {}
    void test_run_start() override {}
    void test_run_end(const doctest::TestRunStats&) override {}
    void test_case_reenter(const doctest::TestCaseData&) override {}
    void test_case_end(const doctest::CurrentTestCaseStats&) override {}
    void test_case_exception(const doctest::TestCaseException&) override {}
    void subcase_end() override {}
    void log_assert(const doctest::AssertData&) override {}
    void log_message(const doctest::MessageData&) override {}
    void test_case_skipped(const doctest::TestCaseData&) override {}

private:
    static void print(const char* prefix, const char* name) {
#ifdef TP_LOG_DEBUG
        std::lock_guard<std::mutex> lock(TP::TaggedLogger::coutMutex);
#endif
        std::cout << prefix << name << std::endl;
    }
};

#ifdef TP_LOG_DEBUG
auto logging_requested() -> bool {
    const char* value = std::getenv("TREEPATH_LOG");
    return value != nullptr && std::strcmp(value, "0") != 0;
}
#endif

} // namespace

REGISTER_LISTENER("test_progress", 1, TestProgress);

int main(int argc, char** argv) {
    doctest::Context context;
    context.applyCommandLine(argc, argv);
    if (context.shouldExit())
        return context.run();

#ifdef TP_LOG_DEBUG
    // Individual tests switch logging on themselves; the run as a whole stays quiet unless asked.
    TP::set_thread_name("TestMain");
    TP::set_logging_enabled(logging_requested());
    tp_log("Starting test execution", "TEST");
#endif

    int const result = context.run();
    tp_log(result == 0 ? "All tests passed" : "Some tests failed", "TEST");
    return result;
}
