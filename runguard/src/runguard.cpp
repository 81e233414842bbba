#include <glog/logging.h>
#include <signal.h>
#include <unistd.h>
#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/classification.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/program_options.hpp>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <iterator>
#include <sstream>
#include <thread>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"
#include "sandbox/resource_limiter.hpp"

using namespace std;
namespace fs = std::filesystem;

void validate(boost::any& v, const vector<string>& values, size_t*, int) {
    using namespace boost::program_options;
    validators::check_first_occurrence(v);

    string const& s = validators::get_single_string(values);
    if (s.empty() || s[0] == '-') {
        throw validation_error(validation_error::invalid_option_value);
    }

    v = boost::lexical_cast<size_t>(s);
}

struct wall_time {
    double seconds;
};

void validate(boost::any& v, const vector<string>& values, wall_time*, int) {
    using namespace boost::program_options;
    validators::check_first_occurrence(v);

    string const& s = validators::get_single_string(values);
    wall_time result;
    try {
        result.seconds = boost::lexical_cast<double>(s);
    } catch (boost::bad_lexical_cast&) {
        throw validation_error(validation_error::invalid_option_value);
    }
    if (!isfinite(result.seconds) || result.seconds <= 0)
        throw validation_error(validation_error::invalid_option_value);

    v = result;
}

/**
 * @brief 在 PATH 中查找可执行文件，包含 / 的路径直接转为绝对路径
 */
static fs::path find_executable(const string& command, const string& search_path) {
    if (command.find('/') != string::npos)
        return fs::absolute(command);

    vector<string> dirs;
    boost::split(dirs, search_path, boost::is_any_of(":"));
    for (auto& dir : dirs) {
        if (dir.empty()) continue;
        fs::path candidate = fs::path(dir) / command;
        if (access(candidate.c_str(), X_OK) == 0) return candidate;
    }
    throw oibox::not_found("Command " + command + " is not found in " + search_path);
}

static void write_meta(ostream& os, const oibox::run_result& result) {
    os << "wall-time: " << fixed << setprecision(3) << result.wall_time_ms / 1000.0 << endl
       << "cpu-time: " << fixed << setprecision(3) << result.cpu_time_ms / 1000.0 << endl
       << "memory-bytes: " << (result.peak_memory_kb >= 0 ? result.peak_memory_kb * 1024 : -1) << endl
       << "exitcode: " << result.exit_code << endl
       << "signal: " << result.signal << endl
       << "termination: " << oibox::to_string(result.cause) << endl
       << "output-truncated: " << (result.cause == oibox::termination_cause::OUTPUT_TRUNCATED) << endl
       << "stdout-bytes: " << result.output.size() << endl
       << "stderr-bytes: " << result.error.size() << endl;
}

int main(int argc, const char* argv[]) {
    google::InitGoogleLogging(argv[0]);
    FLAGS_logtostderr = true;

    namespace po = boost::program_options;
    po::options_description desc("oibox-runguard options");
    po::positional_options_description pos;
    po::variables_map vm;

    // clang-format off
    desc.add_options()
        ("wall-time,T", po::value<wall_time>(), "kill command after wall time clock seconds (floating point is acceptable), default to 5")
        ("memory-limit,m", po::value<size_t>(), "set maximum memory consumption of the command in MB, 0 for unlimited, default to 256")
        ("file-limit,f", po::value<size_t>(), "set maximum created file size of the command in KB")
        ("nproc,p", po::value<size_t>(), "set maximum process living simutanously")
        ("stream-size,s", po::value<size_t>(), "truncate command output streams at the size in KB, default to 64")
        ("standard-input-file,i", po::value<string>(), "feed the content of file to command standard input, or forward standard input if omitted")
        ("standard-output-file,o", po::value<string>(), "write captured command standard output to file")
        ("standard-error-file,e", po::value<string>(), "write captured command standard error to file")
        ("directory,d", po::value<string>(), "run command in directory")
        ("variable,V", po::value<vector<string>>(), "add additional environment variables (e.g. -Vkey1=value1 -Vkey2=value2), only PATH is set by default")
        ("out-meta,M", po::value<string>(), "write runguard monitor results (run time, exitcode, memory usage, ...) to file, or standard error if omitted")
        ("cmd", po::value<vector<string>>()->composing()->required(), "commands")
        ("help", "display this help text")
        ("version", "display version of this application");
    // clang-format on

    pos.add("cmd", -1);

    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(desc)
                      .positional(pos)
                      .run(),
                  vm);
        if (vm.count("help")) {
            cout << "oibox-runguard: run a command under wall time, memory and output limits." << endl
                 << "The command and all of its descendants are killed when a limit is exceeded." << endl
                 << "Usage: " << argv[0] << " [options] -- [command]" << endl;
            cout << desc << endl;
            return 0;
        }
        if (vm.count("version")) {
            cout << "oibox-runguard 1.0.0" << endl;
            return 0;
        }
        po::notify(vm);
    } catch (po::error& e) {
        cerr << e.what() << endl
             << endl;
        cerr << desc << endl;
        return 1;
    }

    oibox::run_limits limits;
    oibox::run_options options;
    if (vm.count("wall-time")) limits.time_limit_ms = (int64_t)ceil(vm["wall-time"].as<wall_time>().seconds * 1000);
    if (vm.count("memory-limit")) limits.memory_limit_mb = vm["memory-limit"].as<size_t>();
    if (vm.count("file-limit")) limits.max_file_size = vm["file-limit"].as<size_t>() * 1024;
    if (vm.count("nproc")) limits.max_processes = vm["nproc"].as<size_t>();
    if (vm.count("stream-size")) limits.max_output_size = vm["stream-size"].as<size_t>() * 1024;
    if (vm.count("directory")) options.working_directory = fs::absolute(vm["directory"].as<string>());
    if (vm.count("variable")) options.environment = vm["variable"].as<vector<string>>();

    string search_path = "/usr/local/bin:/usr/bin:/bin";
    for (auto& env : options.environment)
        if (env.rfind("PATH=", 0) == 0) search_path = env.substr(5);

    vector<string> command = vm["cmd"].as<vector<string>>();
    vector<string> args(command.begin() + 1, command.end());

    // 收到 SIGINT 或 SIGTERM 时杀死受控进程
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    CHECK(pthread_sigmask(SIG_BLOCK, &signals, nullptr) == 0) << "Unable to block signals";

    options.cancellation = make_shared<oibox::cancellation_token>();
    thread signal_thread([signals, token = options.cancellation] {
        int signum = 0;
        if (sigwait(&signals, &signum) == 0) {
            LOG(WARNING) << "Received signal " << signum << ", killing command";
            token->cancel();
        }
    });
    signal_thread.detach();

    try {
        fs::path executable = find_executable(command[0], search_path);

        string input;
        if (vm.count("standard-input-file")) {
            input = oibox::read_file_content(vm["standard-input-file"].as<string>());
        } else if (!isatty(STDIN_FILENO)) {
            input.assign(istreambuf_iterator<char>(cin), istreambuf_iterator<char>());
        }

        oibox::resource_limiter limiter;
        oibox::run_result result = limiter.run(executable, args, input, limits, options);

        if (vm.count("standard-output-file"))
            oibox::write_file_content(vm["standard-output-file"].as<string>(), result.output);
        else
            cout << result.output << flush;
        if (vm.count("standard-error-file"))
            oibox::write_file_content(vm["standard-error-file"].as<string>(), result.error);
        else
            cerr << result.error << flush;

        if (vm.count("out-meta")) {
            ofstream meta(vm["out-meta"].as<string>());
            if (!meta) {
                LOG(ERROR) << "Unable to open meta file " << vm["out-meta"].as<string>();
                return 1;
            }
            write_meta(meta, result);
        } else {
            write_meta(cerr, result);
        }

        return result.exit_code;
    } catch (oibox::invocation_cancelled& e) {
        LOG(WARNING) << "Command cancelled";
        return 128 + SIGTERM;
    } catch (oibox::oibox_exception& e) {
        LOG(ERROR) << e;
        return 1;
    } catch (std::exception& e) {
        LOG(ERROR) << "Unable to run command: " << e.what();
        return 1;
    }
}
