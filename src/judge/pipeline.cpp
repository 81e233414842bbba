#include "judge/pipeline.hpp"
#include <glog/logging.h>
#include "common/defer.hpp"
#include "common/exceptions.hpp"

namespace oibox {
using namespace std;

bool run_report::success() const {
    return execution.cause == termination_cause::COMPLETED &&
           execution.exit_code == 0 &&
           (!comparison || comparison->match);
}

pipeline::pipeline(const configuration &config, shared_ptr<const resource_limiter> limiter)
    : conf(config),
      limiter(limiter ? move(limiter) : make_shared<resource_limiter>()),
      guard(config.sandbox_root),
      commands(config, guard),
      cc(config, guard, commands, *this->limiter),
      exec(config, guard, commands, *this->limiter),
      gdb(config, guard, commands, cc, *this->limiter) {}

void pipeline::prepare() const {
    guard.prepare();
}

void pipeline::cleanup(const string &name) const {
    if (conf.keep_files) {
        LOG(INFO) << "Keeping files of " << name;
        return;
    }
    guard.remove(guard.resolve(name, subarea::SOURCES));
    guard.remove(guard.resolve(name, subarea::EXECUTE));
    guard.remove(guard.resolve(name, subarea::SCRIPTS));
}

run_report pipeline::compile_and_run(const run_request &request, const run_options &options) const {
    run_report report;
    // 先检查所有参数，参数不合法时不创建任何文件
    report.limits = resolve_limits(conf.execution, request.time_limit_ms, request.memory_limit_mb);
    string standard = request.standard.value_or(conf.compiler.standard);
    string optimization = request.optimization.value_or(conf.compiler.optimization);
    if (!is_valid_standard(standard))
        throw validation_error("Unrecognized language standard \"" + standard + "\"");
    if (!is_valid_optimization(optimization))
        throw validation_error("Unrecognized optimization flag \"" + optimization + "\"");

    string name = guard.unique_name(request.filename.value_or(""));
    defer { cleanup(name); };

    report.artifact = cc.compile(request.code, name, standard, optimization, options);
    report.execution = exec.execute(report.artifact, request.input, report.limits, options);
    if (request.expected_output)
        report.comparison = compare_outputs(report.execution.output, *request.expected_output,
                                            request.ignore_whitespace, request.ignore_case);
    return report;
}

debug_session pipeline::debug(const string &code, const optional<string> &script, const run_options &options) const {
    string name = guard.unique_name("debug");
    defer { cleanup(name); };
    return gdb.debug(code, name, script, options);
}

const configuration &pipeline::config() const {
    return conf;
}

const path_guard &pipeline::paths() const {
    return guard;
}

}  // namespace oibox
