#include "server/tools.hpp"
#include "common/exceptions.hpp"
#include "common/json_utils.hpp"

namespace oibox {
using namespace std;
using json = nlohmann::json;

tool::~tool() {}

json tool::descriptor() const {
    return {{"name", name()}, {"description", description()}, {"inputSchema", input_schema()}};
}

void to_json(json &j, const run_limits &limits) {
    j = {{"time_limit_ms", limits.time_limit_ms},
         {"memory_limit_mb", limits.memory_limit_mb},
         {"max_output_size", limits.max_output_size}};
}

void to_json(json &j, const run_result &result) {
    j = {{"stdout", result.output},
         {"stderr", result.error},
         {"exit_code", result.exit_code},
         {"signal", result.signal},
         {"termination", to_string(result.cause)},
         {"timed_out", result.cause == termination_cause::TIMED_OUT},
         {"memory_exceeded", result.cause == termination_cause::MEMORY_EXCEEDED},
         {"output_truncated", result.cause == termination_cause::OUTPUT_TRUNCATED},
         {"wall_time_ms", result.wall_time_ms},
         {"cpu_time_ms", result.cpu_time_ms},
         {"output_bytes", result.output_bytes}};
    // 无法获得峰值内存时输出 null
    if (result.peak_memory_kb >= 0)
        j["peak_memory_kb"] = result.peak_memory_kb;
    else
        j["peak_memory_kb"] = nullptr;
}

void to_json(json &j, const compiled_artifact &artifact) {
    j = {{"exit_code", artifact.exit_code},
         {"diagnostics", artifact.diagnostics},
         {"time_ms", artifact.time_ms}};
}

void to_json(json &j, const line_difference &difference) {
    j = {{"line", difference.line}, {"actual", difference.actual}, {"expected", difference.expected}};
}

void to_json(json &j, const comparison_verdict &verdict) {
    j = {{"match", verdict.match},
         {"differences", verdict.differences},
         {"difference_count", verdict.difference_count},
         {"actual_lines", verdict.actual_lines},
         {"expected_lines", verdict.expected_lines},
         {"summary", verdict.summary}};
    if (verdict.first_difference) {
        j["first_difference"] = *verdict.first_difference;
        j["first_difference"]["column"] = verdict.first_difference_column;
    } else {
        j["first_difference"] = nullptr;
    }
}

void to_json(json &j, const run_report &report) {
    j = {{"success", report.success()},
         {"name", report.artifact.name},
         {"compilation", report.artifact},
         {"limits", report.limits},
         {"execution", report.execution}};
    if (report.comparison)
        j["comparison"] = *report.comparison;
}

void to_json(json &j, const debug_session &session) {
    j = {{"name", session.artifact.name},
         {"compilation", session.artifact},
         {"script", session.script},
         {"transcript", session.transcript.output},
         {"stderr", session.transcript.error},
         {"exit_code", session.transcript.exit_code},
         {"termination", to_string(session.transcript.cause)}};
}

void to_json(json &j, const test_case &tc) {
    j = {{"id", tc.id}, {"input", tc.input}, {"expected_output", tc.expected_output}};
}

static optional<string> optional_string(const json &args, const char *key) {
    if (!exists(args, key)) return nullopt;
    return get_value<string>(args, key);
}

static optional<int64_t> optional_int(const json &args, const char *key) {
    if (!exists(args, key)) return nullopt;
    return get_value<int64_t>(args, key);
}

compile_and_run_tool::compile_and_run_tool(const pipeline &judge, const test_case_store &store)
    : judge(judge), store(store) {}

string compile_and_run_tool::name() const {
    return "compile_and_run";
}

string compile_and_run_tool::description() const {
    return "Compile C++ source code, run it with the given standard input under time, memory and output limits, "
           "and optionally compare its output with the expected output.";
}

json compile_and_run_tool::input_schema() const {
    // clang-format off
    return {
        {"type", "object"},
        {"properties", {
            {"code", {{"type", "string"}, {"description", "C++ source code"}}},
            {"input", {{"type", "string"}, {"description", "Standard input of the program"}}},
            {"expected_output", {{"type", "string"}, {"description", "Expected standard output"}}},
            {"test_case_id", {{"type", "string"}, {"description", "Read input and expected output from a stored test case"}}},
            {"filename", {{"type", "string"}, {"description", "Suggested file name"}}},
            {"time_limit_ms", {{"type", "integer"}, {"default", judge.config().execution.default_time_limit_ms}}},
            {"memory_limit_mb", {{"type", "integer"}, {"default", judge.config().execution.default_memory_limit_mb}}},
            {"standard", {{"type", "string"}, {"default", judge.config().compiler.standard}}},
            {"optimization", {{"type", "string"}, {"default", judge.config().compiler.optimization}}},
            {"ignore_whitespace", {{"type", "boolean"}, {"default", true}}},
            {"ignore_case", {{"type", "boolean"}, {"default", false}}}
        }},
        {"required", json::array({"code"})}
    };
    // clang-format on
}

json compile_and_run_tool::call(const json &args, const run_options &options) const {
    run_request request;
    request.code = get_value<string>(args, "code");
    request.filename = optional_string(args, "filename");
    request.time_limit_ms = optional_int(args, "time_limit_ms");
    request.memory_limit_mb = optional_int(args, "memory_limit_mb");
    request.standard = optional_string(args, "standard");
    request.optimization = optional_string(args, "optimization");
    request.ignore_whitespace = get_value_def<bool>(args, true, "ignore_whitespace");
    request.ignore_case = get_value_def<bool>(args, false, "ignore_case");

    if (exists(args, "test_case_id")) {
        if (exists(args, "input") || exists(args, "expected_output"))
            throw validation_error("test_case_id cannot be combined with input or expected_output");
        test_case tc = store.lookup(get_value<string>(args, "test_case_id"));
        request.input = tc.input;
        request.expected_output = tc.expected_output;
    } else {
        request.input = get_value<string>(args, "input");
        request.expected_output = optional_string(args, "expected_output");
    }

    return judge.compile_and_run(request, options);
}

debug_with_gdb_tool::debug_with_gdb_tool(const pipeline &judge)
    : judge(judge) {}

string debug_with_gdb_tool::name() const {
    return "debug_with_gdb";
}

string debug_with_gdb_tool::description() const {
    return "Compile C++ source code with debug information and run it under gdb in batch mode. "
           "Without a script, breaks at main and prints a backtrace, registers and the next instructions.";
}

json debug_with_gdb_tool::input_schema() const {
    // clang-format off
    return {
        {"type", "object"},
        {"properties", {
            {"code", {{"type", "string"}, {"description", "C++ source code"}}},
            {"gdb_script", {{"type", "string"}, {"description", "gdb commands, one per line"}}}
        }},
        {"required", json::array({"code"})}
    };
    // clang-format on
}

json debug_with_gdb_tool::call(const json &args, const run_options &options) const {
    return judge.debug(get_value<string>(args, "code"), optional_string(args, "gdb_script"), options);
}

string compare_outputs_tool::name() const {
    return "compare_outputs";
}

string compare_outputs_tool::description() const {
    return "Compare an actual output with the expected output and report the first differing line.";
}

json compare_outputs_tool::input_schema() const {
    // clang-format off
    return {
        {"type", "object"},
        {"properties", {
            {"actual", {{"type", "string"}}},
            {"expected", {{"type", "string"}}},
            {"ignore_whitespace", {{"type", "boolean"}, {"default", true}}},
            {"ignore_case", {{"type", "boolean"}, {"default", false}}}
        }},
        {"required", {"actual", "expected"}}
    };
    // clang-format on
}

json compare_outputs_tool::call(const json &args, const run_options &) const {
    return compare_outputs(get_value<string>(args, "actual"),
                           get_value<string>(args, "expected"),
                           get_value_def<bool>(args, true, "ignore_whitespace"),
                           get_value_def<bool>(args, false, "ignore_case"));
}

read_test_case_tool::read_test_case_tool(const test_case_store &store)
    : store(store) {}

string read_test_case_tool::name() const {
    return "read_test_case";
}

string read_test_case_tool::description() const {
    return "Read the input and expected output of a stored test case.";
}

json read_test_case_tool::input_schema() const {
    return {{"type", "object"},
            {"properties", {{"test_case_id", {{"type", "string"}}}}},
            {"required", json::array({"test_case_id"})}};
}

json read_test_case_tool::call(const json &args, const run_options &) const {
    return store.lookup(get_value<string>(args, "test_case_id"));
}

list_test_cases_tool::list_test_cases_tool(const test_case_store &store)
    : store(store) {}

string list_test_cases_tool::name() const {
    return "list_test_cases";
}

string list_test_cases_tool::description() const {
    return "List the ids of all stored test cases.";
}

json list_test_cases_tool::input_schema() const {
    return {{"type", "object"}, {"properties", json::object()}};
}

json list_test_cases_tool::call(const json &, const run_options &) const {
    return {{"test_cases", store.list()}};
}

vector<unique_ptr<tool>> make_builtin_tools(const pipeline &judge, const test_case_store &store) {
    vector<unique_ptr<tool>> tools;
    tools.push_back(make_unique<compile_and_run_tool>(judge, store));
    tools.push_back(make_unique<debug_with_gdb_tool>(judge));
    tools.push_back(make_unique<compare_outputs_tool>());
    tools.push_back(make_unique<read_test_case_tool>(store));
    tools.push_back(make_unique<list_test_cases_tool>(store));
    return tools;
}

}  // namespace oibox
