#include "judge/executor.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"

namespace oibox {
using namespace std;

static int64_t clamp_limit(optional<int64_t> requested, int64_t def_value, int64_t max_value, const char *name) {
    if (!requested) return def_value;
    if (*requested <= 0)
        throw validation_error(fmt::format("{} must be positive, got {}", name, *requested));
    if (*requested > max_value) {
        LOG(WARNING) << name << " " << *requested << " exceeds the maximum, clamped to " << max_value;
        return max_value;
    }
    return *requested;
}

run_limits resolve_limits(const execution_config &config, optional<int64_t> time_limit_ms, optional<int64_t> memory_limit_mb) {
    run_limits limits;
    limits.time_limit_ms = clamp_limit(time_limit_ms, config.default_time_limit_ms, config.max_time_limit_ms, "time_limit_ms");
    limits.memory_limit_mb = clamp_limit(memory_limit_mb, config.default_memory_limit_mb, config.max_memory_limit_mb, "memory_limit_mb");
    limits.max_output_size = config.max_output_size;
    limits.max_file_size = config.max_output_size;
    limits.max_processes = config.max_processes;
    return limits;
}

executor::executor(const configuration &config, const path_guard &paths, const command_guard &commands, const resource_limiter &limiter)
    : config(config), paths(paths), commands(commands), limiter(limiter) {}

run_result executor::execute(const compiled_artifact &artifact, const string &input, const run_limits &limits, const run_options &options) const {
    commands.enforce(artifact.executable, {});

    run_options run_opts = options;
    run_opts.working_directory = paths.make_work_directory(artifact.name);
    defer {
        if (!config.keep_files) paths.remove_work_directory(run_opts.working_directory);
    };

    if (config.keep_files)
        write_file_content(paths.resolve(artifact.name, subarea::INPUTS), input);

    run_result result = limiter.run(artifact.executable, {}, input, limits, run_opts);

    if (config.keep_files)
        write_file_content(paths.resolve(artifact.name, subarea::OUTPUTS), result.output);
    return result;
}

}  // namespace oibox
