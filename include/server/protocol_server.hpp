#pragma once

#include <atomic>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include <thread>
#include <vector>
#include "common/concurrent_queue.hpp"
#include "sandbox/resource_limiter.hpp"
#include "server/tools.hpp"

namespace oibox {

/**
 * @brief JSON-RPC 2.0 错误码
 */
namespace rpc_error {
const int PARSE_ERROR = -32700;
const int INVALID_REQUEST = -32600;
const int METHOD_NOT_FOUND = -32601;
const int INVALID_PARAMS = -32602;
const int INTERNAL_ERROR = -32603;
}  // namespace rpc_error

extern const char *PROTOCOL_VERSION;
extern const char *SERVER_NAME;
extern const char *SERVER_VERSION;

/**
 * @brief 基于标准输入输出的 JSON-RPC 服务，每行一条消息
 * 主线程读取消息，initialize、tools/list 等请求直接回复，
 * tools/call 请求放入队列由 worker 线程处理。回复的写入通过互斥锁串行化。
 * 
 * notifications/cancelled 会触发对应请求的取消标记，被取消的请求不再回复。
 */
struct protocol_server {
    /**
     * @param in 读取请求的流
     * @param out 写入回复的流
     * @param workers worker 线程数
     */
    protocol_server(std::istream &in, std::ostream &out, size_t workers);
    ~protocol_server();

    /**
     * @brief 注册工具，必须在 serve 之前调用
     */
    void register_tool(std::unique_ptr<tool> &&t);

    /**
     * @brief 处理请求直到输入结束或者 shutdown 被调用
     * 输入结束时，已经收到的请求处理完并回复后才返回。
     */
    void serve();

    /**
     * @brief 取消所有正在处理和排队的请求，停止 worker
     * 可以在任意线程中调用，多次调用没有副作用
     */
    void shutdown();

    /**
     * @brief 处理一行消息
     * 回复直接写入输出流，tools/call 请求在 worker 启动前调用时会排队等待
     */
    void handle_message(const std::string &line);

    /**
     * @brief 正在处理或排队的 tools/call 请求数
     */
    size_t in_flight() const;

private:
    struct call_task {
        nlohmann::json id;
        std::string tool_name;
        nlohmann::json arguments;
        std::shared_ptr<cancellation_token> cancellation;
    };

    std::istream &in;
    std::ostream &out;
    size_t worker_count;

    std::map<std::string, std::unique_ptr<tool>> tools;
    std::vector<std::string> tool_order;

    concurrent_queue<call_task> tasks;
    std::vector<std::thread> workers;
    std::mutex workers_mutex;
    std::atomic<bool> stopping{false};
    std::atomic<bool> cancelled{false};

    std::mutex write_mutex;

    // 键为请求 id 序列化后的字符串
    mutable std::mutex inflight_mutex;
    std::map<std::string, std::shared_ptr<cancellation_token>> inflight;

    void start_workers();
    void join_workers();
    void worker_loop(size_t worker_id);

    void dispatch(const nlohmann::json &message);
    void handle_call(const nlohmann::json &id, const nlohmann::json &params);
    void handle_cancel(const nlohmann::json &params);
    nlohmann::json run_tool(const call_task &task);

    void write(const nlohmann::json &message);
    void respond(const nlohmann::json &id, const nlohmann::json &result);
    void respond_error(const nlohmann::json &id, int code, const std::string &message);
};

/**
 * @brief 将工具调用的结果包装为 tools/call 的 result
 * @param content structuredContent
 * @param is_error 是否为错误结果
 */
nlohmann::json make_tool_result(const nlohmann::json &content, bool is_error);

/**
 * @brief 将异常转换为结构化错误 {kind, message, ...}
 */
nlohmann::json make_error_content(const std::exception &ex);

}  // namespace oibox
