#include "sandbox/path_guard.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/algorithm/string/erase.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <algorithm>
#include <map>
#include "common/exceptions.hpp"

namespace oibox {
using namespace std;
namespace fs = std::filesystem;

// clang-format off
static const map<subarea, vector<string>> subarea_extensions = {
    {subarea::SOURCES, {".cpp"}},
    {subarea::EXECUTE, {".exe"}},
    {subarea::INPUTS, {".in"}},
    {subarea::OUTPUTS, {".out"}},
    {subarea::TESTS, {".in", ".out", ".ans"}},
    {subarea::SCRIPTS, {".gdb"}}
};

static const map<subarea, string> subarea_names = {
    {subarea::SOURCES, "sources"},
    {subarea::EXECUTE, "execute"},
    {subarea::INPUTS, "inputs"},
    {subarea::OUTPUTS, "outputs"},
    {subarea::TESTS, "tests"},
    {subarea::SCRIPTS, "scripts"}
};
// clang-format on

const char *to_string(subarea area) {
    return subarea_names.at(area).c_str();
}

const vector<string> &allowed_extensions(subarea area) {
    return subarea_extensions.at(area);
}

/**
 * @brief 逐个比较路径组成部分，判断 child 是否为 base 或者在 base 之下
 * 两个参数都应该已经规范化
 */
static bool is_within(const fs::path &base, const fs::path &child) {
    auto base_it = base.begin(), child_it = child.begin();
    for (; base_it != base.end(); ++base_it, ++child_it) {
        // base 以分隔符结尾时最后一个组成部分为空
        if (base_it->empty()) continue;
        if (child_it == child.end() || *base_it != *child_it) return false;
    }
    return true;
}

static bool is_safe_char(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_' || c == '-';
}

/**
 * @brief 规范化沙箱根目录，去掉末尾的分隔符，使其与 canonical 的结果一致
 */
static fs::path normalize_root(const fs::path &root) {
    fs::path result = fs::weakly_canonical(root).lexically_normal();
    if (!result.has_filename() && result != result.root_path())
        result = result.parent_path();
    return result;
}

path_guard::path_guard(const fs::path &root)
    : root_dir(normalize_root(root)) {}

void path_guard::prepare() const {
    fs::create_directories(root_dir);
    fs::path canonical_root = fs::canonical(root_dir);
    if (canonical_root != root_dir)
        throw path_violation(fmt::format("Sandbox root {} changed to {} after creation", root_dir.string(), canonical_root.string()));

    for (auto &[area, name] : subarea_names) {
        fs::path dir = root_dir / name;
        if (fs::is_symlink(fs::symlink_status(dir)))
            throw path_violation(fmt::format("Sandbox directory {} must not be a symlink", dir.string()));
        fs::create_directories(dir);
        fs::permissions(dir, fs::perms::owner_all, fs::perm_options::replace);
    }
    LOG(INFO) << "Sandbox prepared at " << root_dir;
}

fs::path path_guard::resolve(const string &raw_name, subarea area) const {
    if (raw_name.empty())
        throw path_violation("Empty file name");
    if (raw_name.size() > MAX_NAME_LENGTH)
        throw path_violation(fmt::format("File name is longer than {} characters", MAX_NAME_LENGTH));
    if (raw_name.find('\0') != string::npos)
        throw path_violation("File name contains NUL character");
    if (raw_name.find('/') != string::npos || raw_name.find('\\') != string::npos)
        throw path_violation(fmt::format("File name \"{}\" contains a path separator", raw_name));
    if (raw_name.find("..") != string::npos)
        throw path_violation(fmt::format("File name \"{}\" refers to a parent directory", raw_name));
    if (sanitize(raw_name) != raw_name)
        throw path_violation(fmt::format("File name \"{}\" contains disallowed characters", raw_name));

    fs::path name(raw_name);
    auto &extensions = allowed_extensions(area);
    string extension = name.extension().string();
    if (extension.empty()) {
        name += extensions.front();
    } else if (find(extensions.begin(), extensions.end(), extension) == extensions.end()) {
        throw path_violation(fmt::format("Extension {} is not allowed in {}", extension, to_string(area)));
    }

    fs::path dir = directory(area);
    fs::path result = dir / name;

    // 已经存在的符号链接只有在指向子目录内部时才被接受
    error_code ec;
    if (fs::is_symlink(fs::symlink_status(result, ec))) {
        fs::path target = fs::weakly_canonical(result, ec);
        if (ec || !is_within(fs::weakly_canonical(dir), target))
            throw path_violation(fmt::format("{} resolves outside of {} through a symlink", name.string(), to_string(area)));
    }
    return result;
}

string path_guard::sanitize(const string &raw_name) {
    string name = raw_name;
    auto separator = name.find_last_of("/\\");
    if (separator != string::npos) name = name.substr(separator + 1);

    string result;
    for (char c : name)
        if (is_safe_char(c) || c == '.')
            result.push_back(c);

    // 去掉开头的点，避免生成隐藏文件或者 "." ".."
    result.erase(0, result.find_first_not_of('.'));
    while (!result.empty() && result.back() == '.') result.pop_back();

    // 只保留最后一个点作为扩展名分隔
    auto last_dot = result.rfind('.');
    if (last_dot != string::npos)
        replace(result.begin(), result.begin() + last_dot, '.', '_');

    if (result.empty())
        throw path_violation(fmt::format("File name \"{}\" has no usable characters", raw_name));
    if (result.size() > MAX_NAME_LENGTH)
        throw path_violation(fmt::format("File name is longer than {} characters", MAX_NAME_LENGTH));
    return result;
}

string path_guard::unique_name(const string &hint) const {
    string stem = "program";
    if (!hint.empty()) {
        try {
            stem = fs::path(sanitize(hint)).stem().string();
        } catch (path_violation &) {
            // 无法使用的 hint 退回到默认名字
        }
        if (stem.size() > 32) stem.resize(32);
        if (stem.empty()) stem = "program";
    }

    // random_generator 不是线程安全的，每次调用都构造一个新的
    boost::uuids::random_generator generator;
    string uuid = boost::uuids::to_string(generator());
    boost::algorithm::erase_all(uuid, "-");
    return fmt::format("{}-{}", stem, uuid.substr(0, 16));
}

fs::path path_guard::directory(subarea area) const {
    return root_dir / to_string(area);
}

const fs::path &path_guard::root() const {
    return root_dir;
}

bool path_guard::contains(const fs::path &path) const {
    error_code ec;
    fs::path resolved = fs::weakly_canonical(fs::absolute(path), ec);
    return !ec && is_within(root_dir, resolved);
}

bool path_guard::contains(const fs::path &path, subarea area) const {
    error_code ec;
    fs::path resolved = fs::weakly_canonical(fs::absolute(path), ec);
    return !ec && is_within(directory(area), resolved);
}

fs::path path_guard::make_work_directory(const string &name) const {
    if (name.empty() || sanitize(name) != name || !fs::path(name).extension().empty())
        throw path_violation(fmt::format("Invalid work directory name \"{}\"", name));

    fs::path dir = directory(subarea::EXECUTE) / (name + ".work");
    if (fs::is_symlink(fs::symlink_status(dir)))
        throw path_violation(fmt::format("Work directory {} must not be a symlink", dir.string()));
    fs::create_directory(dir);
    fs::permissions(dir, fs::perms::owner_all, fs::perm_options::replace);
    return dir;
}

void path_guard::remove_work_directory(const fs::path &dir) const {
    fs::path execute_dir = directory(subarea::EXECUTE);
    fs::path normal = dir.lexically_normal();
    if (normal.parent_path() != execute_dir || normal.extension() != ".work") {
        LOG(WARNING) << "Refusing to remove " << dir << ", not a work directory";
        return;
    }
    // remove_all 不会跟随目录中的符号链接
    error_code ec;
    fs::remove_all(normal, ec);
    if (ec) LOG(WARNING) << "Unable to remove " << dir << ": " << ec.message();
}

void path_guard::remove(const fs::path &path) const {
    if (!is_within(root_dir, path.lexically_normal())) {
        LOG(WARNING) << "Refusing to remove " << path << " outside of the sandbox";
        return;
    }
    error_code ec;
    fs::remove(path, ec);
    if (ec) LOG(WARNING) << "Unable to remove " << path << ": " << ec.message();
}

}  // namespace oibox
