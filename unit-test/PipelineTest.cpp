#include <filesystem>
#include <thread>
#include "common/exceptions.hpp"
#include "gtest/gtest.h"
#include "judge/pipeline.hpp"
#include "test/sandbox_env.hpp"

using namespace std;
using namespace oibox;
namespace fs = std::filesystem;

static const string ADD_PROGRAM = R"(#include <iostream>
int main() {
    long long a, b;
    std::cin >> a >> b;
    std::cout << a + b << std::endl;
    return 0;
})";

static const string MULTIPLY_PROGRAM = R"(#include <iostream>
int main() {
    long long a, b;
    std::cin >> a >> b;
    std::cout << a * b << std::endl;
    return 0;
})";

class PipelineTest : public ::testing::Test {
protected:
    test::temp_directory temp;
    configuration config = test::make_config(temp.path);

    void SetUp() override {
        if (!test::has_compiler()) GTEST_SKIP();
    }

    size_t count_files(const pipeline &judge) const {
        size_t count = 0;
        for (auto &entry : fs::recursive_directory_iterator(judge.paths().root()))
            if (!entry.is_directory()) ++count;
        return count;
    }
};

TEST_F(PipelineTest, CompileRunAndCompare) {
    pipeline judge(config);
    judge.prepare();

    run_request request;
    request.code = ADD_PROGRAM;
    request.input = "2 3";
    request.expected_output = "5";
    run_report report = judge.compile_and_run(request);

    EXPECT_EQ(report.execution.output, "5\n");
    EXPECT_EQ(report.execution.cause, termination_cause::COMPLETED);
    ASSERT_TRUE(report.comparison);
    EXPECT_TRUE(report.comparison->match);
    EXPECT_TRUE(report.success());
    EXPECT_EQ(report.limits.time_limit_ms, config.execution.default_time_limit_ms);
    EXPECT_EQ(count_files(judge), 0u);
}

TEST_F(PipelineTest, WrongAnswer) {
    pipeline judge(config);
    judge.prepare();

    run_request request;
    request.code = ADD_PROGRAM;
    request.input = "2 3";
    request.expected_output = "6\n";
    run_report report = judge.compile_and_run(request);

    ASSERT_TRUE(report.comparison);
    EXPECT_FALSE(report.comparison->match);
    EXPECT_EQ(report.comparison->first_difference->line, 1u);
    EXPECT_FALSE(report.success());
}

TEST_F(PipelineTest, NoComparisonWithoutExpectedOutput) {
    pipeline judge(config);
    judge.prepare();

    run_request request;
    request.code = "int main() { return 7; }";
    run_report report = judge.compile_and_run(request);
    EXPECT_FALSE(report.comparison);
    EXPECT_EQ(report.execution.exit_code, 7);
    EXPECT_FALSE(report.success());
}

TEST_F(PipelineTest, FilenameHintAndKeepFiles) {
    config.keep_files = true;
    pipeline judge(config);
    judge.prepare();

    run_request request;
    request.code = ADD_PROGRAM;
    request.input = "1 1";
    request.filename = "my solution.cpp";
    run_report report = judge.compile_and_run(request);

    EXPECT_EQ(report.artifact.name.rfind("mysolution-", 0), 0u) << report.artifact.name;
    EXPECT_TRUE(fs::exists(report.artifact.source));
    EXPECT_TRUE(fs::exists(report.artifact.executable));
    EXPECT_TRUE(fs::exists(judge.paths().resolve(report.artifact.name, subarea::INPUTS)));
    EXPECT_TRUE(fs::exists(judge.paths().resolve(report.artifact.name, subarea::OUTPUTS)));
}

TEST_F(PipelineTest, CompilationErrorCleansUp) {
    pipeline judge(config);
    judge.prepare();

    run_request request;
    request.code = "int main() { syntax error }";
    EXPECT_THROW(judge.compile_and_run(request), compilation_error);
    EXPECT_EQ(count_files(judge), 0u);
}

TEST_F(PipelineTest, InvalidRequestsFailBeforeCompiling) {
    pipeline judge(config);
    judge.prepare();

    run_request request;
    request.code = ADD_PROGRAM;
    request.time_limit_ms = 0;
    EXPECT_THROW(judge.compile_and_run(request), validation_error);

    request.time_limit_ms = nullopt;
    request.memory_limit_mb = -1;
    EXPECT_THROW(judge.compile_and_run(request), validation_error);

    request.memory_limit_mb = nullopt;
    request.standard = "c++17 -fplugin=evil.so";
    EXPECT_THROW(judge.compile_and_run(request), validation_error);

    request.standard = nullopt;
    request.optimization = "-O2;id";
    EXPECT_THROW(judge.compile_and_run(request), validation_error);
    EXPECT_EQ(count_files(judge), 0u);
}

TEST_F(PipelineTest, LimitsAreClamped) {
    pipeline judge(config);
    judge.prepare();

    run_request request;
    request.code = "int main() { return 0; }";
    request.time_limit_ms = 1000000;
    request.memory_limit_mb = 1000000;
    run_report report = judge.compile_and_run(request);
    EXPECT_EQ(report.limits.time_limit_ms, config.execution.max_time_limit_ms);
    EXPECT_EQ(report.limits.memory_limit_mb, config.execution.max_memory_limit_mb);
}

TEST_F(PipelineTest, CancelledRequest) {
    pipeline judge(config);
    judge.prepare();

    run_options options;
    options.cancellation = make_shared<cancellation_token>();
    options.cancellation->cancel();

    run_request request;
    request.code = ADD_PROGRAM;
    EXPECT_THROW(judge.compile_and_run(request, options), invocation_cancelled);
    EXPECT_EQ(count_files(judge), 0u);
}

TEST_F(PipelineTest, ConcurrentRequestsAreIndependent) {
    pipeline judge(config);
    judge.prepare();

    run_report add_report, multiply_report;
    thread add_thread([&] {
        run_request request;
        request.code = ADD_PROGRAM;
        request.input = "20 22";
        request.expected_output = "42";
        request.filename = "solution.cpp";
        add_report = judge.compile_and_run(request);
    });
    thread multiply_thread([&] {
        run_request request;
        request.code = MULTIPLY_PROGRAM;
        request.input = "6 7";
        request.expected_output = "42";
        request.filename = "solution.cpp";
        multiply_report = judge.compile_and_run(request);
    });
    add_thread.join();
    multiply_thread.join();

    EXPECT_NE(add_report.artifact.name, multiply_report.artifact.name);
    EXPECT_EQ(add_report.execution.output, "42\n");
    EXPECT_EQ(multiply_report.execution.output, "42\n");
    EXPECT_TRUE(add_report.success());
    EXPECT_TRUE(multiply_report.success());
    EXPECT_EQ(count_files(judge), 0u);
}
