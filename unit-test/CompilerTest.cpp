#include <filesystem>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "gtest/gtest.h"
#include "judge/compiler.hpp"
#include "test/sandbox_env.hpp"

using namespace std;
using namespace oibox;
namespace fs = std::filesystem;

class CompilerTest : public ::testing::Test {
protected:
    static void SetUpTestCase() {
        if (!test::has_compiler())
            GTEST_LOG_(WARNING) << test::COMPILER_PATH << " is not available, compiler tests are skipped";
    }

    test::temp_directory temp;
    configuration config = test::make_config(temp.path);
    path_guard paths{config.sandbox_root};
    command_guard commands{config, paths};
    resource_limiter limiter;
    compiler cc{config, paths, commands, limiter};

    void SetUp() override {
        if (!test::has_compiler()) GTEST_SKIP();
        paths.prepare();
    }

    bool sandbox_is_empty() const {
        for (auto &entry : fs::recursive_directory_iterator(config.sandbox_root))
            if (!entry.is_directory()) return false;
        return true;
    }
};

TEST_F(CompilerTest, CompilesProgram) {
    string source = R"(#include <iostream>
int main() {
    std::cout << "hello" << std::endl;
    return 0;
})";
    compiled_artifact artifact = cc.compile(source, "hello", "c++17", "-O2");
    EXPECT_EQ(artifact.name, "hello");
    EXPECT_EQ(artifact.exit_code, 0);
    EXPECT_EQ(artifact.source, paths.directory(subarea::SOURCES) / "hello.cpp");
    EXPECT_EQ(artifact.executable, paths.directory(subarea::EXECUTE) / "hello.exe");
    EXPECT_TRUE(fs::is_regular_file(artifact.executable));
    EXPECT_EQ(read_file_content(artifact.source), source);
}

TEST_F(CompilerTest, CompilationErrorCarriesDiagnostics) {
    try {
        cc.compile("int main() { return undeclared_variable; }", "broken", "c++17", "-O2");
        FAIL() << "compilation_error expected";
    } catch (compilation_error &e) {
        EXPECT_NE(e.error_log.find("undeclared_variable"), string::npos) << e.error_log;
        EXPECT_NE(e.error_log.find("error"), string::npos) << e.error_log;
        EXPECT_NE(e.exit_code, 0);
        EXPECT_STREQ(e.kind(), "compilation_error");
    }
    EXPECT_FALSE(fs::exists(paths.directory(subarea::EXECUTE) / "broken.exe"));
}

TEST_F(CompilerTest, WarningsAreNotErrors) {
    compiled_artifact artifact = cc.compile("int main() { int unused; return 0; }", "warn", "c++17", "-O0");
    EXPECT_NE(artifact.diagnostics.find("warning"), string::npos) << artifact.diagnostics;
    EXPECT_TRUE(fs::is_regular_file(artifact.executable));
}

TEST_F(CompilerTest, StaleExecutableIsRemoved) {
    cc.compile("int main() { return 0; }", "stale", "c++17", "-O2");
    ASSERT_TRUE(fs::exists(paths.directory(subarea::EXECUTE) / "stale.exe"));
    EXPECT_THROW(cc.compile("int main() { return }", "stale", "c++17", "-O2"), compilation_error);
    EXPECT_FALSE(fs::exists(paths.directory(subarea::EXECUTE) / "stale.exe"));
}

TEST_F(CompilerTest, RejectsInvalidFlagsBeforeWritingFiles) {
    EXPECT_THROW(cc.compile("int main() {}", "flags", "c++17; rm -rf /", "-O2"), validation_error);
    EXPECT_THROW(cc.compile("int main() {}", "flags", "c++17", "-O2 -fplugin=x"), validation_error);
    EXPECT_THROW(cc.compile("int main() {}", "flags", "python3", "-O2"), validation_error);
    EXPECT_THROW(cc.compile("int main() {}", "../flags", "c++17", "-O2"), path_violation);
    EXPECT_THROW(cc.compile("int main() {}", "/tmp/flags", "c++17", "-O2"), path_violation);
    EXPECT_TRUE(sandbox_is_empty());
}

TEST_F(CompilerTest, AcceptsKnownStandards) {
    for (string standard : {"c++11", "c++14", "c++17", "gnu++17", "c++20", "c++2a"})
        EXPECT_TRUE(is_valid_standard(standard)) << standard;
    for (string standard : {"c++", "c++17 ", "c11", "c++99", "-std=c++17", ""})
        EXPECT_FALSE(is_valid_standard(standard)) << standard;
    for (string flag : {"-O0", "-O1", "-O2", "-O3", "-Os", "-Og", "-Ofast"})
        EXPECT_TRUE(is_valid_optimization(flag)) << flag;
    for (string flag : {"-O4", "O2", "-O2 -g", "-march=native", ""})
        EXPECT_FALSE(is_valid_optimization(flag)) << flag;
}

TEST_F(CompilerTest, StandardIsPassedToCompiler) {
    string source = R"(
#if __cplusplus < 201703L
#error "requires C++17"
#endif
int main() { return 0; }
)";
    EXPECT_NO_THROW(cc.compile(source, "std17", "c++17", "-O2"));
    EXPECT_THROW(cc.compile(source, "std11", "c++11", "-O2"), compilation_error);
}

TEST_F(CompilerTest, CompilationTimeLimit) {
    config.compiler.time_limit_ms = 3000;
    // 读取 /dev/random 永远不会结束，编译器要么超时要么报错
    EXPECT_THROW(cc.compile("#include </dev/random>\nint main() { return 0; }", "random", "c++17", "-O2"), compilation_error);
}

TEST_F(CompilerTest, DebugBuild) {
    compiled_artifact artifact = cc.compile_debug("int main() { return 0; }", "debug", "c++17");
    EXPECT_TRUE(fs::is_regular_file(artifact.executable));
}
