#include <cstdio>
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "judge/test_case_runner.hpp"
#include "test/environment.hpp"
#include "test/mock_executor.hpp"
#include "worker.hpp"

using namespace std;
using namespace sandbox;
using namespace testing;

/**
 * @brief 模拟一个把输入的两个数相加的程序
 */
static raw_run_outcome add_program(const string &, language, const string &stdin_data) {
    int a = 0, b = 0;
    if (sscanf(stdin_data.c_str(), "%d %d", &a, &b) != 2)
        return completed_outcome(1, "", "ValueError: not enough values to unpack");
    return completed_outcome(0, std::to_string(a + b) + "\n");
}

class TestCaseRunnerTest : public ::testing::Test {
protected:
    unique_ptr<judge> j;

    void SetUp() override {
        auto strategy = make_unique<NiceMock<mock_executor>>();
        ON_CALL(*strategy, run(_, _, _)).WillByDefault(Invoke(add_program));
        j = make_unique<judge>(test_config(), move(strategy));
    }
};

TEST_F(TestCaseRunnerTest, SummaryTest) {
    vector<test_case> cases = {
        {"1 2", "3"},
        {"10 20", "30\n"},
        {"2 2", "5"},
        {"  7 8  ", " 15 "},
    };
    test_report report = run_test_cases(*j, "a, b = map(int, input().split())\nprint(a + b)", "python", cases);
    ASSERT_EQ(report.results.size(), 4u);
    EXPECT_EQ(report.passed, 3u);
    EXPECT_EQ(report.total, 4u);
    EXPECT_DOUBLE_EQ(report.avg_execution_time_ms, 12.5);

    for (size_t i = 0; i < report.results.size(); ++i)
        EXPECT_EQ(report.results[i].test_id, i + 1);

    EXPECT_TRUE(report.results[0].passed);
    EXPECT_TRUE(report.results[1].passed);
    EXPECT_FALSE(report.results[2].passed);
    EXPECT_EQ(report.results[2].actual_preview, "4");
    EXPECT_EQ(report.results[2].expected_preview, "5");
    EXPECT_TRUE(report.results[3].passed);

    // 预览中的期望输出和实际输出都去掉了首尾空白
    EXPECT_EQ(report.results[1].expected_preview, "30");
    EXPECT_EQ(report.results[3].expected_preview, "15");
    EXPECT_EQ(report.results[3].actual_preview, "15");
    EXPECT_EQ(report.results[3].input_preview, "  7 8  ");
}

TEST_F(TestCaseRunnerTest, FailedExecutionTest) {
    test_report report = run_test_cases(*j, "print(1)", "python", {{"oops", "3"}});
    ASSERT_EQ(report.results.size(), 1u);
    EXPECT_FALSE(report.results[0].passed);
    EXPECT_EQ(report.results[0].error, "ValueError: not enough values to unpack");
}

TEST_F(TestCaseRunnerTest, RejectedCodeTest) {
    test_report report = run_test_cases(*j, "import os", "python", {{"1 2", "3"}, {"3 4", "7"}});
    EXPECT_EQ(report.passed, 0u);
    EXPECT_EQ(report.total, 2u);
    EXPECT_DOUBLE_EQ(report.avg_execution_time_ms, 0);
    for (auto &r : report.results)
        EXPECT_EQ(r.error->find("Security violation"), 0u);
}

TEST_F(TestCaseRunnerTest, EmptyTest) {
    test_report report = run_test_cases(*j, "print(1)", "python", {});
    EXPECT_EQ(report.total, 0u);
    EXPECT_EQ(report.passed, 0u);
    EXPECT_DOUBLE_EQ(report.avg_execution_time_ms, 0);
}

TEST_F(TestCaseRunnerTest, PreviewTest) {
    EXPECT_EQ(make_preview("short", true), "short");
    EXPECT_EQ(make_preview(string(100, 'x'), true), string(100, 'x'));
    EXPECT_EQ(make_preview(string(150, 'x'), true), string(100, 'x') + "...");
    EXPECT_EQ(make_preview(string(150, 'x'), false), string(100, 'x'));

    string wide;
    for (int i = 0; i < 100; ++i) wide += "\xe4\xbd\xa0";
    EXPECT_EQ(make_preview(wide, true), wide);
    EXPECT_EQ(make_preview(wide + "x", true), wide + "...");

    string long_input = "1 2" + string(200, ' ');
    test_report report = run_test_cases(*j, "print(1)", "python", {{long_input, "3"}});
    EXPECT_EQ(report.results[0].input_preview, long_input.substr(0, 100) + "...");
    EXPECT_TRUE(report.results[0].passed);
}

TEST_F(TestCaseRunnerTest, ConcurrentRunTest) {
    vector<test_case> cases;
    for (int i = 0; i < 20; ++i)
        cases.push_back({std::to_string(i) + " " + std::to_string(i), std::to_string(i * 2)});
    cases.push_back({"1 1", "3"});

    execution_pool pool(*j, 4);
    test_report report = run_test_cases(pool, "print(1)", "python", cases);
    ASSERT_EQ(report.total, 21u);
    EXPECT_EQ(report.passed, 20u);
    for (size_t i = 0; i < report.results.size(); ++i) {
        EXPECT_EQ(report.results[i].test_id, i + 1);
        EXPECT_EQ(report.results[i].expected_preview, cases[i].expected);
    }
    EXPECT_FALSE(report.results.back().passed);
}

TEST_F(TestCaseRunnerTest, JsonTest) {
    test_report report = run_test_cases(*j, "print(1)", "python", {{"1 2", "3"}});
    nlohmann::json json = report;
    EXPECT_EQ(json["summary"]["passed"], 1);
    EXPECT_EQ(json["summary"]["total"], 1);
    ASSERT_EQ(json["results"].size(), 1u);
    EXPECT_EQ(json["results"][0]["test_id"], 1);
    EXPECT_EQ(json["results"][0]["actual"], "3");
    EXPECT_TRUE(json["results"][0]["error"].is_null());

    auto cases = nlohmann::json::parse(R"([{"input": "1 2", "expected": "3"}, {"input": "4 5"}])").get<vector<test_case>>();
    ASSERT_EQ(cases.size(), 2u);
    EXPECT_EQ(cases[0].input, "1 2");
    EXPECT_EQ(cases[1].expected, "");
}
