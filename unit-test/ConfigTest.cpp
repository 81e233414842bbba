#include <filesystem>
#include <functional>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "config.hpp"
#include "gtest/gtest.h"
#include "test/sandbox_env.hpp"

using namespace std;
using namespace oibox;
using json = nlohmann::json;
namespace fs = std::filesystem;

class ConfigTest : public ::testing::Test {
protected:
    test::temp_directory temp;

    // 任何存在的可执行文件都可以作为编译器通过检查
    json minimal() const {
        return {{"sandbox_root", (temp.path / "sandbox").string()},
                {"compiler", {{"path", "/bin/sh"}}}};
    }

    fs::path write_config(const string &content) const {
        fs::path file = temp.path / "oibox.json";
        write_file_content(file, content);
        return file;
    }
};

TEST_F(ConfigTest, DefaultsForOmittedFields) {
    configuration config = parse_configuration(minimal());
    EXPECT_EQ(config.sandbox_root, temp.path / "sandbox");
    EXPECT_EQ(config.compiler.path, "/bin/sh");
    EXPECT_EQ(config.compiler.standard, "c++17");
    EXPECT_EQ(config.compiler.optimization, "-O2");
    EXPECT_EQ(config.compiler.flags, vector<string>{"-Wall"});
    EXPECT_EQ(config.debugger.path, "/usr/bin/gdb");
    EXPECT_EQ(config.execution.default_time_limit_ms, 5000);
    EXPECT_EQ(config.execution.default_memory_limit_mb, 256);
    EXPECT_EQ(config.execution.max_output_size, 65536u);
    EXPECT_EQ(config.execution.max_processes, 256);
    EXPECT_FALSE(config.keep_files);
    EXPECT_EQ(config.workers, 2u);
    EXPECT_NO_THROW(validate_configuration(config));
}

TEST_F(ConfigTest, LoadsFileWithOverrides) {
    json j = minimal();
    j["execution"] = {{"default_time_limit_ms", 1000}, {"max_time_limit_ms", 2000}};
    j["workers"] = 4;
    fs::path file = write_config(j.dump());

    configuration config = load_configuration(file);
    EXPECT_EQ(config.execution.default_time_limit_ms, 1000);
    EXPECT_EQ(config.execution.max_time_limit_ms, 2000);
    EXPECT_EQ(config.workers, 4u);

    json overrides = {{"sandbox_root", (temp.path / "other").string()}, {"keep_files", true}};
    config = load_configuration(file, overrides);
    EXPECT_EQ(config.sandbox_root, temp.path / "other");
    EXPECT_TRUE(config.keep_files);
    EXPECT_EQ(config.workers, 4u);
}

TEST_F(ConfigTest, MissingOrMalformedFile) {
    EXPECT_THROW(load_configuration(temp.path / "missing.json"), configuration_error);
    EXPECT_THROW(load_configuration(write_config("{ not json")), configuration_error);
    EXPECT_THROW(load_configuration(write_config("{}")), configuration_error);
    EXPECT_THROW(load_configuration(write_config(R"({"sandbox_root": "/tmp/x", "compiler": {"path": 42}})")), configuration_error);
    EXPECT_THROW(load_configuration(write_config(R"({"sandbox_root": "/tmp/x", "compiler": {"path": "/bin/sh"}, "workers": "two"})")), configuration_error);
}

TEST_F(ConfigTest, InvalidValues) {
    auto expect_invalid = [&](const function<void(json &)> &mutate) {
        json j = minimal();
        mutate(j);
        EXPECT_THROW(validate_configuration(parse_configuration(j)), configuration_error) << j.dump();
    };
    expect_invalid([](json &j) { j["sandbox_root"] = "relative/sandbox"; });
    expect_invalid([](json &j) { j["sandbox_root"] = "/"; });
    expect_invalid([](json &j) { j["compiler"]["path"] = "g++"; });
    expect_invalid([&](json &j) { j["compiler"]["path"] = (temp.path / "no-such-compiler").string(); });
    expect_invalid([](json &j) { j["debugger"] = {{"path", "gdb"}}; });
    expect_invalid([](json &j) { j["compiler"]["time_limit_ms"] = 0; });
    expect_invalid([](json &j) { j["execution"] = {{"default_time_limit_ms", -1}}; });
    expect_invalid([](json &j) { j["execution"] = {{"max_output_size", 0}}; });
    expect_invalid([](json &j) { j["execution"] = {{"default_time_limit_ms", 10000}, {"max_time_limit_ms", 5000}}; });
    expect_invalid([](json &j) { j["execution"] = {{"default_memory_limit_mb", 4096}, {"max_memory_limit_mb", 1024}}; });
    expect_invalid([](json &j) { j["execution"] = {{"max_processes", -1}}; });
    expect_invalid([](json &j) { j["workers"] = 0; });
    expect_invalid([](json &j) { j["compiler"]["standard"] = "c++99x"; });
    expect_invalid([](json &j) { j["compiler"]["standard"] = "-std=c++17"; });
    expect_invalid([](json &j) { j["compiler"]["optimization"] = "-O9"; });
    expect_invalid([](json &j) { j["compiler"]["flags"] = json::array({"-I/usr/include"}); });
    expect_invalid([](json &j) { j["compiler"]["flags"] = json::array({"-Wall", "--sysroot=/"}); });
    expect_invalid([](json &j) { j["compiler"]["flags"] = json::array({"-DX=$(id)"}); });
}

TEST_F(ConfigTest, CompilerSettingsAccepted) {
    json j = minimal();
    j["compiler"]["standard"] = "gnu++20";
    j["compiler"]["optimization"] = "-O0";
    j["compiler"]["flags"] = json::array({"-Wall", "-Wextra", "-DONLINE_JUDGE"});
    j["sandbox_root"] = (temp.path / "sandbox").string() + "/";
    EXPECT_NO_THROW(validate_configuration(parse_configuration(j)));
}

TEST_F(ConfigTest, MissingDebuggerIsOnlyAWarning) {
    json j = minimal();
    j["debugger"] = {{"path", (temp.path / "no-such-gdb").string()}};
    EXPECT_NO_THROW(validate_configuration(parse_configuration(j)));
}

TEST_F(ConfigTest, ShippedConfigurationParses) {
    fs::path shipped = fs::path(__FILE__).parent_path().parent_path() / "config" / "oibox.json";
    if (!fs::exists(shipped)) GTEST_SKIP();
    configuration config = parse_configuration(json::parse(read_file_content(shipped)));
    EXPECT_EQ(config.sandbox_root, "/var/lib/oibox");
    EXPECT_EQ(config.compiler.path, "/usr/bin/g++");
    EXPECT_GT(config.execution.max_processes, 0);
}
