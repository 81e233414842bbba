#include "server/protocol_server.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/algorithm/string/trim.hpp>
#include <system_error>
#include "common/exceptions.hpp"

namespace oibox {
using namespace std;
using json = nlohmann::json;

const char *PROTOCOL_VERSION = "2024-11-05";
const char *SERVER_NAME = "oibox";
const char *SERVER_VERSION = "1.0.0";

json make_tool_result(const json &content, bool is_error) {
    json text = {{"type", "text"}, {"text", content.dump(2, ' ', false, json::error_handler_t::replace)}};
    return {{"content", json::array({text})}, {"structuredContent", content}, {"isError", is_error}};
}

json make_error_content(const std::exception &ex) {
    json error = {{"message", ex.what()}};
    if (auto e = dynamic_cast<const oibox_exception *>(&ex)) {
        error["kind"] = e->kind();
        if (auto ce = dynamic_cast<const compilation_error *>(&ex)) {
            error["diagnostics"] = ce->error_log;
            error["exit_code"] = ce->exit_code;
        }
    } else {
        error["kind"] = "internal_error";
    }
    return {{"error", error}};
}

protocol_server::protocol_server(istream &in, ostream &out, size_t workers)
    : in(in), out(out), worker_count(workers) {}

protocol_server::~protocol_server() {
    shutdown();
}

void protocol_server::register_tool(unique_ptr<tool> &&t) {
    string name = t->name();
    if (tools.count(name))
        throw internal_error(fmt::format("Tool {} is registered twice", name));
    tool_order.push_back(name);
    tools.insert({name, move(t)});
}

void protocol_server::start_workers() {
    scoped_lock guard(workers_mutex);
    if (!workers.empty()) return;
    for (size_t i = 0; i < worker_count; ++i)
        workers.emplace_back([this, i] { worker_loop(i); });
    LOG(INFO) << "Started " << worker_count << " workers";
}

void protocol_server::join_workers() {
    scoped_lock guard(workers_mutex);
    for (auto &worker : workers)
        if (worker.joinable()) worker.join();
    workers.clear();
}

void protocol_server::serve() {
    start_workers();
    string line;
    while (!cancelled && getline(in, line)) {
        boost::algorithm::trim(line);
        if (line.empty()) continue;
        handle_message(line);
    }

    // 输入结束：不再接受新请求，worker 处理完队列中的请求后退出
    LOG(INFO) << "Input closed, waiting for " << in_flight() << " requests";
    stopping = true;
    join_workers();
    LOG(INFO) << "Protocol server stopped";
}

void protocol_server::shutdown() {
    if (cancelled.exchange(true)) return;
    stopping = true;
    {
        scoped_lock guard(inflight_mutex);
        for (auto &[id, token] : inflight) token->cancel();
        if (!inflight.empty())
            LOG(WARNING) << "Cancelled " << inflight.size() << " requests on shutdown";
    }
    join_workers();
}

size_t protocol_server::in_flight() const {
    scoped_lock guard(inflight_mutex);
    return inflight.size();
}

void protocol_server::handle_message(const string &line) {
    json message;
    try {
        message = json::parse(line);
    } catch (json::parse_error &e) {
        LOG(WARNING) << "Unable to parse message: " << e.what();
        respond_error(nullptr, rpc_error::PARSE_ERROR, "Parse error");
        return;
    }

    try {
        dispatch(message);
    } catch (std::exception &e) {
        LOG(ERROR) << "Unexpected error while handling message: " << e.what();
        json id = message.is_object() && message.count("id") ? message["id"] : json();
        respond_error(id, rpc_error::INTERNAL_ERROR, e.what());
    }
}

static bool is_valid_id(const json &id) {
    return id.is_string() || id.is_number_integer() || id.is_null();
}

void protocol_server::dispatch(const json &message) {
    if (!message.is_object() || !message.count("jsonrpc") || message.at("jsonrpc") != "2.0") {
        respond_error(nullptr, rpc_error::INVALID_REQUEST, "Invalid request");
        return;
    }

    bool has_id = message.count("id");
    json id = has_id ? message.at("id") : json();
    if (has_id && !is_valid_id(id)) {
        respond_error(nullptr, rpc_error::INVALID_REQUEST, "Invalid request id");
        return;
    }

    if (!message.count("method")) {
        // 客户端发来的回复，服务端不会发出请求，直接忽略
        if (message.count("result") || message.count("error")) return;
        respond_error(id, rpc_error::INVALID_REQUEST, "Missing method");
        return;
    }
    if (!message.at("method").is_string()) {
        respond_error(id, rpc_error::INVALID_REQUEST, "Method must be a string");
        return;
    }

    string method = message.at("method").get<string>();
    json params = message.count("params") ? message.at("params") : json::object();
    if (!params.is_object()) {
        if (has_id) respond_error(id, rpc_error::INVALID_PARAMS, "Params must be an object");
        return;
    }

    if (!has_id) {
        if (method == "notifications/cancelled")
            handle_cancel(params);
        else if (method == "notifications/initialized")
            LOG(INFO) << "Client initialized";
        else
            LOG(INFO) << "Ignoring notification " << method;
        return;
    }

    if (method == "initialize") {
        if (params.count("clientInfo"))
            LOG(INFO) << "Client connected: " << params["clientInfo"].dump();
        json result = {
            {"protocolVersion", PROTOCOL_VERSION},
            {"capabilities", {{"tools", {{"listChanged", false}}}}},
            {"serverInfo", {{"name", SERVER_NAME}, {"version", SERVER_VERSION}}}};
        respond(id, result);
    } else if (method == "ping") {
        respond(id, json::object());
    } else if (method == "tools/list") {
        json list = json::array();
        for (auto &name : tool_order) list.push_back(tools.at(name)->descriptor());
        respond(id, {{"tools", list}});
    } else if (method == "tools/call") {
        handle_call(id, params);
    } else {
        respond_error(id, rpc_error::METHOD_NOT_FOUND, fmt::format("Method not found: {}", method));
    }
}

void protocol_server::handle_call(const json &id, const json &params) {
    if (!params.count("name") || !params.at("name").is_string()) {
        respond_error(id, rpc_error::INVALID_PARAMS, "Missing tool name");
        return;
    }
    string name = params.at("name").get<string>();
    if (!tools.count(name)) {
        respond_error(id, rpc_error::INVALID_PARAMS, fmt::format("Unknown tool: {}", name));
        return;
    }
    json arguments = params.count("arguments") ? params.at("arguments") : json::object();
    if (arguments.is_null()) arguments = json::object();
    if (!arguments.is_object()) {
        respond_error(id, rpc_error::INVALID_PARAMS, "Tool arguments must be an object");
        return;
    }
    if (stopping) {
        respond_error(id, rpc_error::INTERNAL_ERROR, "Server is shutting down");
        return;
    }

    auto token = make_shared<cancellation_token>();
    {
        scoped_lock guard(inflight_mutex);
        if (!inflight.insert({id.dump(), token}).second) {
            respond_error(id, rpc_error::INVALID_REQUEST, "Duplicate request id");
            return;
        }
    }
    tasks.push({id, name, move(arguments), token});
}

void protocol_server::handle_cancel(const json &params) {
    if (!params.count("requestId")) return;
    string key = params.at("requestId").dump();
    scoped_lock guard(inflight_mutex);
    auto it = inflight.find(key);
    if (it == inflight.end()) {
        LOG(INFO) << "Cancellation of unknown or finished request " << key;
        return;
    }
    LOG(INFO) << "Cancelling request " << key
              << (params.count("reason") ? ": " + params.at("reason").dump() : string());
    it->second->cancel();
}

json protocol_server::run_tool(const call_task &task) {
    run_options options;
    options.cancellation = task.cancellation;
    const tool &t = *tools.at(task.tool_name);
    try {
        return make_tool_result(t.call(task.arguments, options), false);
    } catch (oibox_exception &e) {
        LOG(WARNING) << "Tool " << task.tool_name << " failed for request " << task.id.dump()
                     << ", " << e.kind() << ": " << e.what();
        return make_tool_result(make_error_content(e), true);
    } catch (std::exception &e) {
        LOG(ERROR) << "Tool " << task.tool_name << " crashed for request " << task.id.dump() << ": " << e.what();
        return make_tool_result(make_error_content(e), true);
    }
}

void protocol_server::worker_loop(size_t worker_id) {
    while (true) {
        call_task task;
        if (!tasks.pop_for(task, chrono::milliseconds(50))) {
            if (stopping) break;
            continue;
        }

        json result;
        if (!task.cancellation->cancelled()) {
            LOG(INFO) << "Worker " << worker_id << " calling tool " << task.tool_name << " for request " << task.id.dump();
            result = run_tool(task);
        }

        {
            scoped_lock guard(inflight_mutex);
            inflight.erase(task.id.dump());
        }

        // 被取消的请求不回复
        if (task.cancellation->cancelled()) {
            LOG(INFO) << "Request " << task.id.dump() << " was cancelled";
            continue;
        }
        respond(task.id, result);
    }
}

void protocol_server::write(const json &message) {
    string text = message.dump(-1, ' ', false, json::error_handler_t::replace);
    scoped_lock guard(write_mutex);
    out << text << endl;
}

void protocol_server::respond(const json &id, const json &result) {
    write({{"jsonrpc", "2.0"}, {"id", id}, {"result", result}});
}

void protocol_server::respond_error(const json &id, int code, const string &message) {
    write({{"jsonrpc", "2.0"}, {"id", id}, {"error", {{"code", code}, {"message", message}}}});
}

}  // namespace oibox
