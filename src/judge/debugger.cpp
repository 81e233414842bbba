#include "judge/debugger.hpp"
#include <unistd.h>
#include <fmt/core.h>
#include <glog/logging.h>
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"

namespace oibox {
using namespace std;
namespace fs = std::filesystem;

// 批处理模式下不能等待用户确认，也不能通过 shell 启动被调试程序
static const string SCRIPT_PRELUDE =
    "set pagination off\n"
    "set confirm off\n"
    "set startup-with-shell off\n";

debugger::debugger(const configuration &config, const path_guard &paths, const command_guard &commands,
                   const compiler &cc, const resource_limiter &limiter)
    : config(config), paths(paths), commands(commands), cc(cc), limiter(limiter) {}

const string &debugger::default_script() {
    static const string script =
        "break main\n"
        "run\n"
        "backtrace\n"
        "info registers\n"
        "x/10i $pc\n"
        "quit\n";
    return script;
}

debug_session debugger::debug(const string &source_text, const string &name, const optional<string> &script, const run_options &options) const {
    const string &user_script = script ? *script : default_script();
    if (auto reason = commands.check_debug_script(user_script)) {
        LOG(WARNING) << "Debug script denied: " << *reason;
        throw command_denied(*reason);
    }

    if (!fs::is_regular_file(config.debugger.path) || access(config.debugger.path.c_str(), X_OK) != 0)
        throw internal_error(fmt::format("Debugger {} is not available", config.debugger.path.string()));

    debug_session session;
    session.artifact = cc.compile_debug(source_text, name, config.compiler.standard, options);
    session.script = SCRIPT_PRELUDE + user_script;
    if (!session.script.empty() && session.script.back() != '\n') session.script += '\n';
    session.script_path = paths.resolve(name, subarea::SCRIPTS);

    // -nx 不读取任何 .gdbinit
    auto args = make_arguments("-nx", "-batch", "-x", session.script_path, session.artifact.executable);
    commands.enforce(config.debugger.path, args);
    write_file_content(session.script_path, session.script);

    run_limits limits;
    limits.time_limit_ms = config.debugger.time_limit_ms;
    limits.memory_limit_mb = config.debugger.memory_limit_mb;
    limits.max_output_size = config.execution.max_output_size;
    limits.max_file_size = config.execution.max_output_size;

    run_options debug_options = options;
    debug_options.working_directory = paths.make_work_directory(name);
    defer {
        if (!config.keep_files) paths.remove_work_directory(debug_options.working_directory);
    };

    LOG(INFO) << "Debugging " << session.artifact.executable.filename();
    session.transcript = limiter.run(config.debugger.path, args, "", limits, debug_options);
    return session;
}

}  // namespace oibox
