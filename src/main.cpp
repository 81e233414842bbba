#include <glog/logging.h>
#include <signal.h>
#include <unistd.h>
#include <boost/exception/diagnostic_information.hpp>
#include <boost/program_options.hpp>
#include <cstdlib>
#include <iostream>
#include <thread>
#include "common/exceptions.hpp"
#include "common/utils.hpp"
#include "config.hpp"
#include "judge/pipeline.hpp"
#include "sandbox/resource_limiter.hpp"
#include "server/protocol_server.hpp"
#include "server/test_case_store.hpp"
#include "server/tools.hpp"
using namespace std;

static const char *DEFAULT_CONFIG = "/etc/oibox/oibox.json";

int main(int argc, char* argv[]) {
    google::InitGoogleLogging(argv[0]);
    // 标准输出用于协议，日志只能写到标准错误
    FLAGS_logtostderr = true;

    namespace po = boost::program_options;
    po::options_description desc("oibox options");
    po::variables_map vm;

    // clang-format off
    desc.add_options()
        ("config", po::value<string>(), "set the configuration file. You can either pass it from environ OIBOX_CONFIG, default to /etc/oibox/oibox.json")
        ("sandbox-root", po::value<string>(), "override the sandbox root directory. You can either pass it from environ OIBOX_SANDBOX_ROOT")
        ("workers", po::value<size_t>(), "override the number of worker threads handling tool calls")
        ("keep-files", "do not delete sources, executables and scripts after each request")
        ("help", "display this help text")
        ("version", "display version of this application");
    // clang-format on

    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(desc)
                      .run(),
                  vm);
        po::notify(vm);
    } catch (po::error& e) {
        cerr << e.what() << endl
             << endl;
        cerr << desc << endl;
        return EXIT_FAILURE;
    }

    if (vm.count("help")) {
        cerr << "oibox: compile, run and compare untrusted C++ programs in a sandbox" << endl
             << "Speaks JSON-RPC 2.0 (Model Context Protocol) over standard input and output" << endl
             << "Usage: " << argv[0] << " [options]" << endl;
        cerr << desc << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("version")) {
        cerr << oibox::SERVER_NAME << " " << oibox::SERVER_VERSION << endl;
        return EXIT_SUCCESS;
    }

    string config_path = oibox::get_env("OIBOX_CONFIG", DEFAULT_CONFIG);
    if (vm.count("config")) config_path = vm.at("config").as<string>();

    nlohmann::json overrides = nlohmann::json::object();
    if (vm.count("sandbox-root")) {
        overrides["sandbox_root"] = vm.at("sandbox-root").as<string>();
    } else if (getenv("OIBOX_SANDBOX_ROOT")) {
        overrides["sandbox_root"] = getenv("OIBOX_SANDBOX_ROOT");
    }
    if (vm.count("workers")) overrides["workers"] = vm.at("workers").as<size_t>();
    if (vm.count("keep-files")) overrides["keep_files"] = true;

    oibox::configuration config;
    try {
        config = oibox::load_configuration(config_path, overrides);
    } catch (oibox::configuration_error& e) {
        LOG(FATAL) << "Invalid configuration: " << e.what();
    }

    auto caps = oibox::resource_limiter::capabilities();
    LOG(INFO) << "Limiter capabilities: address space limit " << caps.address_space_limit
              << ", rss sampling " << caps.rss_sampling
              << ", process group kill " << caps.process_group_kill
              << ", cpu time limit " << caps.cpu_time_limit;
    if (geteuid() == 0 && config.execution.max_processes > 0)
        LOG(WARNING) << "Running as root, execution.max_processes is not enforced by the kernel";
    if (!caps.rss_sampling)
        LOG(WARNING) << "Resident memory sampling is unavailable, memory limit relies on RLIMIT_AS only";

    oibox::pipeline judge(config);
    try {
        judge.prepare();
    } catch (std::exception& e) {
        LOG(FATAL) << "Unable to prepare sandbox " << config.sandbox_root << ": " << boost::diagnostic_information(e);
    }
    oibox::test_case_store store(judge.paths());

    // 在启动任何线程之前屏蔽信号，由专门的线程通过 sigwait 处理
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    CHECK(pthread_sigmask(SIG_BLOCK, &signals, nullptr) == 0) << "Unable to block signals";

    oibox::protocol_server server(cin, cout, config.workers);
    for (auto& tool : oibox::make_builtin_tools(judge, store))
        server.register_tool(move(tool));

    thread signal_thread([&server, signals] {
        int signum = 0;
        if (sigwait(&signals, &signum) != 0) return;
        LOG(WARNING) << "Received signal " << signum << ", cancelling requests";
        server.shutdown();
        google::FlushLogFiles(google::GLOG_INFO);
        // 主线程可能阻塞在读取标准输入上，直接退出
        std::quick_exit(EXIT_SUCCESS);
    });
    signal_thread.detach();

    LOG(INFO) << "oibox serving on stdio with " << config.workers << " workers, sandbox at " << config.sandbox_root;
    server.serve();
    return EXIT_SUCCESS;
}
