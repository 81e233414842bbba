#include "judge/compiler.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/algorithm/string.hpp>
#include <regex>
#include <set>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"

namespace oibox {
using namespace std;
namespace fs = std::filesystem;

bool is_valid_standard(const string &standard) {
    static const regex matcher("^(c|gnu)\\+\\+(98|03|0x|11|1y|14|1z|17|2a|20|2b|23|2c|26)$");
    return regex_match(standard, matcher);
}

bool is_valid_optimization(const string &optimization) {
    static const set<string> allowed = {"-O0", "-O1", "-O2", "-O3", "-Os", "-Og", "-Ofast"};
    return allowed.count(optimization) > 0;
}

/**
 * @brief 诊断信息中是否包含编译错误
 * gcc/clang 的格式为 "file:line:col: error: ..."，驱动程序的格式为 "g++: fatal error: ..."
 */
static bool has_error_diagnostic(const string &diagnostics) {
    vector<string> lines;
    boost::split(lines, diagnostics, boost::is_any_of("\n"));
    for (auto &line : lines) {
        if (boost::starts_with(line, "error:") ||
            line.find(": error:") != string::npos ||
            line.find(": fatal error:") != string::npos)
            return true;
    }
    return false;
}

compiler::compiler(const configuration &config, const path_guard &paths, const command_guard &commands, const resource_limiter &limiter)
    : config(config), paths(paths), commands(commands), limiter(limiter) {}

compiled_artifact compiler::compile(const string &source_text, const string &name, const string &standard, const string &optimization, const run_options &options) const {
    if (!is_valid_optimization(optimization))
        throw validation_error(fmt::format("Unrecognized optimization flag \"{}\"", optimization));
    return invoke(source_text, name, standard, {optimization}, options);
}

compiled_artifact compiler::compile_debug(const string &source_text, const string &name, const string &standard, const run_options &options) const {
    return invoke(source_text, name, standard, {"-g", "-O0"}, options);
}

compiled_artifact compiler::invoke(const string &source_text, const string &name, const string &standard, const vector<string> &mode_flags, const run_options &options) const {
    if (!is_valid_standard(standard))
        throw validation_error(fmt::format("Unrecognized language standard \"{}\"", standard));

    compiled_artifact artifact;
    artifact.name = name;
    artifact.source = paths.resolve(name + ".cpp", subarea::SOURCES);
    artifact.executable = paths.resolve(name + ".exe", subarea::EXECUTE);

    // compile <source> -std=<standard> <mode flags> -o <executable> <flags>
    auto args = make_arguments(artifact.source, "-std=" + standard, mode_flags, "-o", artifact.executable, config.compiler.flags);
    commands.enforce(config.compiler.path, args);

    paths.remove(artifact.executable);
    write_file_content(artifact.source, source_text);

    run_limits limits;
    limits.time_limit_ms = config.compiler.time_limit_ms;
    limits.memory_limit_mb = config.compiler.memory_limit_mb;
    limits.max_output_size = config.compiler.max_diagnostics_size;

    run_options compile_options = options;
    compile_options.working_directory = paths.directory(subarea::SOURCES);

    LOG(INFO) << "Compiling " << artifact.source.filename() << " with " << standard << " " << boost::join(mode_flags, " ");
    run_result result = limiter.run(config.compiler.path, args, "", limits, compile_options);

    artifact.diagnostics = result.error;
    if (!result.output.empty()) {
        if (!artifact.diagnostics.empty() && artifact.diagnostics.back() != '\n')
            artifact.diagnostics += '\n';
        artifact.diagnostics += result.output;
    }
    artifact.exit_code = result.exit_code;
    artifact.time_ms = result.wall_time_ms;

    switch (result.cause) {
        case termination_cause::TIMED_OUT:
            throw compilation_error(fmt::format("Compilation timed out after {} ms", config.compiler.time_limit_ms), artifact.diagnostics, result.exit_code);
        case termination_cause::MEMORY_EXCEEDED:
            throw compilation_error(fmt::format("Compiler exceeded the memory limit of {} MB", config.compiler.memory_limit_mb), artifact.diagnostics, result.exit_code);
        case termination_cause::OUTPUT_TRUNCATED:
            throw compilation_error("Compiler produced too many diagnostics", artifact.diagnostics, result.exit_code);
        case termination_cause::CRASHED:
            throw compilation_error(fmt::format("Compiler was killed by signal {}", result.signal), artifact.diagnostics, result.exit_code);
        case termination_cause::COMPLETED:
            break;
    }

    if (result.exit_code != 0 || has_error_diagnostic(artifact.diagnostics))
        throw compilation_error(fmt::format("Compilation failed with exit code {}", result.exit_code), artifact.diagnostics, result.exit_code);
    if (!fs::is_regular_file(artifact.executable))
        throw compilation_error("Compiler did not produce an executable", artifact.diagnostics, result.exit_code);

    return artifact;
}

}  // namespace oibox
