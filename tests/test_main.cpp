#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>
#include "log/TaggedLogger.hpp"

#include <cstdlib>
#include <string>

#ifdef LB_LOG_DEBUG
// With LABELBRIDGE_LOG set, test case boundaries go to the same log as the
// library messages so each diagnostic can be traced to its test.
struct LogTestCases : public doctest::IReporter {
    LogTestCases(const doctest::ContextOptions&) {}
    void test_case_start(const doctest::TestCaseData& in) override {
        lb_log(std::string{"Start: "} + in.m_name, "Test");
    }
    void test_case_end(const doctest::CurrentTestCaseStats& stats) override {
        if (stats.failure_flags != 0)
            lb_log("Failed", "Test", "ERROR");
    }
    void report_query(const doctest::QueryData&) override {}
    void test_run_start() override {}
    void test_run_end(const doctest::TestRunStats&) override {}
    void test_case_reenter(const doctest::TestCaseData&) override {}
    void test_case_exception(const doctest::TestCaseException&) override {}
    void subcase_start(const doctest::SubcaseSignature&) override {}
    void subcase_end() override {}
    void log_assert(const doctest::AssertData&) override {}
    void log_message(const doctest::MessageData&) override {}
    void test_case_skipped(const doctest::TestCaseData&) override {}
};

REGISTER_LISTENER("log_test_cases", 1, LogTestCases);
#endif

int main(int argc, char** argv) {
#ifdef LB_LOG_DEBUG
    LB::set_thread_name("TestMain");
    char const* setting = std::getenv("LABELBRIDGE_LOG");
    LB::configure_logging(LB::parseLogSetting(setting != nullptr ? setting : ""));
#endif

    doctest::Context context;
    context.applyCommandLine(argc, argv);
    int res = context.run();

#ifdef LB_LOG_DEBUG
    LB::logger().flush();
#endif
    return res;
}
