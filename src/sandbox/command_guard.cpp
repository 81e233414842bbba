#include "sandbox/command_guard.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/algorithm/string.hpp>
#include <set>
#include "common/exceptions.hpp"

namespace oibox {
using namespace std;
namespace fs = std::filesystem;

// shell 元字符，即使不经过 shell 也不允许出现在参数中
static const vector<string> denied_sequences = {";", "|", "&", "`", "$(", string(1, '\0'), "\n", "\r"};

// gdb 命令白名单，包括常用缩写
// clang-format off
static const set<string> allowed_debug_commands = {
    "break", "b", "br", "tbreak", "tb", "rbreak", "condition", "ignore", "commands", "end", "silent",
    "run", "r", "start", "starti", "continue", "c", "cont", "next", "n", "step", "s",
    "nexti", "ni", "stepi", "si", "finish", "fin", "until", "u", "advance", "kill", "k",
    "backtrace", "bt", "where", "frame", "f", "up", "down", "info", "i", "inf",
    "print", "p", "inspect", "output", "printf", "echo", "display", "undisplay", "x",
    "ptype", "whatis", "list", "l", "disassemble", "watch", "rwatch", "awatch",
    "delete", "d", "disable", "enable", "clear", "thread", "set", "show", "quit", "q"
};

// set 子命令白名单，"set $var = ..." 也被允许
static const set<string> allowed_set_commands = {
    "var", "variable", "print", "p", "pagination", "confirm", "listsize", "width", "height",
    "disassembly-flavor", "language", "startup-with-shell"
};

static const set<string> run_commands = {"run", "r", "start", "starti"};
// clang-format on

command_guard::command_guard(const configuration &config, const path_guard &paths)
    : config(config), paths(paths) {}

static bool same_file(const fs::path &a, const fs::path &b) {
    error_code ec;
    fs::path ca = fs::weakly_canonical(a, ec);
    if (ec) return false;
    fs::path cb = fs::weakly_canonical(b, ec);
    if (ec) return false;
    return ca == cb;
}

static bool has_parent_reference(const fs::path &path) {
    for (auto &part : path)
        if (part == "..") return true;
    return false;
}

optional<string> command_guard::check(const fs::path &executable, const vector<string> &args) const {
    if (!executable.is_absolute())
        return fmt::format("Executable {} is not an absolute path", executable.string());

    bool allowed = same_file(executable, config.compiler.path) ||
                   same_file(executable, config.debugger.path);
    if (!allowed) {
        allowed = executable.extension() == ".exe" &&
                  paths.contains(executable, subarea::EXECUTE) &&
                  fs::is_regular_file(executable);
    }
    if (!allowed)
        return fmt::format("Executable {} is not allowed", executable.string());

    for (auto &arg : args) {
        for (auto &seq : denied_sequences)
            if (arg.find(seq) != string::npos)
                return fmt::format("Argument \"{}\" contains a disallowed character sequence", arg);

        // 形如 -o/path 或 -fplugin=/path 的参数同样需要检查路径部分
        string value = arg;
        auto eq = value.find('=');
        auto slash = value.find('/');
        if (eq != string::npos && eq + 1 < value.size() && value[eq + 1] == '/')
            value = value.substr(eq + 1);
        else if (!value.empty() && value[0] == '-' && slash != string::npos)
            value = value.substr(slash);
        fs::path path(value);
        if (has_parent_reference(path))
            return fmt::format("Argument \"{}\" refers to a parent directory", arg);
        if (path.is_absolute() && !paths.contains(path))
            return fmt::format("Argument \"{}\" refers to a path outside of the sandbox", arg);
    }
    return nullopt;
}

void command_guard::enforce(const fs::path &executable, const vector<string> &args) const {
    auto reason = check(executable, args);
    if (reason) {
        LOG(WARNING) << "Command denied: " << *reason;
        throw command_denied(*reason);
    }
}

optional<string> command_guard::check_debug_script(const string &script) const {
    if (script.find('\0') != string::npos)
        return "Debug script contains NUL character";

    vector<string> lines;
    boost::split(lines, script, boost::is_any_of("\n"));
    size_t line_no = 0;
    for (auto &raw_line : lines) {
        ++line_no;
        string line = boost::trim_copy(raw_line);
        if (line.empty() || line[0] == '#') continue;

        // "!" 和 "|" 开头的命令不需要空格分隔
        if (line[0] == '!' || line[0] == '|')
            return fmt::format("Line {}: shell commands are not allowed", line_no);
        if (line.find("$_shell") != string::npos)
            return fmt::format("Line {}: $_shell is not allowed", line_no);

        vector<string> words;
        boost::split(words, line, boost::is_any_of(" \t"), boost::token_compress_on);
        // x/10i、print/x 这样的命令带有格式后缀
        string command = boost::to_lower_copy(words[0].substr(0, words[0].find('/')));

        if (!allowed_debug_commands.count(command))
            return fmt::format("Line {}: command \"{}\" is not allowed", line_no, words[0]);

        if (command == "set") {
            if (words.size() < 2)
                return fmt::format("Line {}: incomplete set command", line_no);
            string sub = boost::to_lower_copy(words[1]);
            if (sub[0] != '$' && !allowed_set_commands.count(sub))
                return fmt::format("Line {}: \"set {}\" is not allowed", line_no, words[1]);
            if (sub == "startup-with-shell" && (words.size() < 3 || boost::to_lower_copy(words[2]) != "off"))
                return fmt::format("Line {}: startup-with-shell must stay off", line_no);
        }

        if (run_commands.count(command)) {
            string rest = line.substr(words[0].size());
            if (rest.find_first_of("<>|&;`$") != string::npos)
                return fmt::format("Line {}: redirections are not allowed in {}", line_no, words[0]);
        }
    }
    return nullopt;
}

}  // namespace oibox
