#pragma once

#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "judge/comparator.hpp"
#include "judge/pipeline.hpp"
#include "server/test_case_store.hpp"

namespace oibox {

/**
 * @brief 表示一个可以通过 tools/call 调用的工具
 * 工具本身没有状态，call 可能在多个 worker 线程中同时被调用
 */
struct tool {
    virtual ~tool();

    /**
     * @brief 工具名，tools/call 的 name 参数
     */
    virtual std::string name() const = 0;

    /**
     * @brief 工具的说明，给客户端展示
     */
    virtual std::string description() const = 0;

    /**
     * @brief 参数的 JSON Schema
     */
    virtual nlohmann::json input_schema() const = 0;

    /**
     * @brief 调用工具
     * @param arguments tools/call 的 arguments 参数
     * @param options 取消标记等运行选项
     * @return structuredContent
     * @throw oibox_exception 调用失败，由协议层转换为 isError 的结果
     */
    virtual nlohmann::json call(const nlohmann::json &arguments, const run_options &options) const = 0;

    /**
     * @brief tools/list 中的一项
     */
    nlohmann::json descriptor() const;
};

struct compile_and_run_tool : public tool {
    compile_and_run_tool(const pipeline &judge, const test_case_store &store);

    std::string name() const override;
    std::string description() const override;
    nlohmann::json input_schema() const override;
    nlohmann::json call(const nlohmann::json &arguments, const run_options &options) const override;

private:
    const pipeline &judge;
    const test_case_store &store;
};

struct debug_with_gdb_tool : public tool {
    explicit debug_with_gdb_tool(const pipeline &judge);

    std::string name() const override;
    std::string description() const override;
    nlohmann::json input_schema() const override;
    nlohmann::json call(const nlohmann::json &arguments, const run_options &options) const override;

private:
    const pipeline &judge;
};

struct compare_outputs_tool : public tool {
    std::string name() const override;
    std::string description() const override;
    nlohmann::json input_schema() const override;
    nlohmann::json call(const nlohmann::json &arguments, const run_options &options) const override;
};

struct read_test_case_tool : public tool {
    explicit read_test_case_tool(const test_case_store &store);

    std::string name() const override;
    std::string description() const override;
    nlohmann::json input_schema() const override;
    nlohmann::json call(const nlohmann::json &arguments, const run_options &options) const override;

private:
    const test_case_store &store;
};

struct list_test_cases_tool : public tool {
    explicit list_test_cases_tool(const test_case_store &store);

    std::string name() const override;
    std::string description() const override;
    nlohmann::json input_schema() const override;
    nlohmann::json call(const nlohmann::json &arguments, const run_options &options) const override;

private:
    const test_case_store &store;
};

/**
 * @brief 创建所有内置工具
 */
std::vector<std::unique_ptr<tool>> make_builtin_tools(const pipeline &judge, const test_case_store &store);

void to_json(nlohmann::json &j, const run_limits &limits);
void to_json(nlohmann::json &j, const run_result &result);
void to_json(nlohmann::json &j, const compiled_artifact &artifact);
void to_json(nlohmann::json &j, const line_difference &difference);
void to_json(nlohmann::json &j, const comparison_verdict &verdict);
void to_json(nlohmann::json &j, const run_report &report);
void to_json(nlohmann::json &j, const debug_session &session);
void to_json(nlohmann::json &j, const test_case &tc);

}  // namespace oibox
