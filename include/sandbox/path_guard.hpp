#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace oibox {

/**
 * @brief 沙箱根目录下的工作区子目录，每个文件只属于一个子目录
 */
enum class subarea {
    SOURCES,  // 源代码，.cpp
    EXECUTE,  // 编译产物，.exe，也是选手程序的工作目录
    INPUTS,   // 保留的标准输入，.in
    OUTPUTS,  // 保留的标准输出，.out
    TESTS,    // 测试数据，.in/.out/.ans
    SCRIPTS   // 调试脚本，.gdb
};

/**
 * @brief 子目录的目录名，同时也用于日志
 */
const char *to_string(subarea area);

/**
 * @brief 子目录允许的文件扩展名，第一个为默认扩展名
 */
const std::vector<std::string> &allowed_extensions(subarea area);

/**
 * @brief 文件名的最大长度（包括扩展名）
 */
const size_t MAX_NAME_LENGTH = 64;

/**
 * @brief 将所有文件系统路径限制在沙箱根目录之内
 * 其他组件使用的所有路径都必须经过 path_guard 解析。
 * path_guard 本身没有可变状态，可以被多个线程同时使用。
 */
struct path_guard {
    /**
     * @param root 沙箱根目录，必须是绝对路径，可以不存在（由 prepare 创建）
     */
    explicit path_guard(const std::filesystem::path &root);

    /**
     * @brief 创建沙箱根目录以及所有子目录，并检查它们没有通过符号链接指向沙箱外
     * 只在启动时调用一次
     * @throw path_violation 子目录是指向根目录外的符号链接
     */
    void prepare() const;

    /**
     * @brief 将用户提供的文件名解析为子目录中的路径
     * 不会创建任何文件或目录。没有扩展名时使用子目录的默认扩展名。
     * @param raw_name 文件名，不能包含目录
     * @param area 文件所属的子目录
     * @return 子目录中的绝对路径
     * @throw path_violation 文件名为空、过长、包含分隔符/NUL/".."、扩展名不允许、
     *        或者已存在的同名符号链接指向子目录外
     */
    std::filesystem::path resolve(const std::string &raw_name, subarea area) const;

    /**
     * @brief 将任意文件名清理为安全的文件名
     * 去掉目录部分和不在 [A-Za-z0-9_-.] 中的字符，去掉开头的点，只保留最后一个点。
     * @throw path_violation 清理后为空或超过 MAX_NAME_LENGTH
     */
    static std::string sanitize(const std::string &raw_name);

    /**
     * @brief 生成不会与并发调用冲突的文件名（不含扩展名）
     * @param hint 用户建议的文件名，可以为空
     * @return "<清理后的 hint 或 program>-<随机串>"
     */
    std::string unique_name(const std::string &hint = "") const;

    /**
     * @brief 为一次调用创建独立的工作目录 execute/<name>.work
     * 并发的调用写入相对路径的文件时不会互相覆盖
     * @param name unique_name 生成的名字，不含扩展名
     * @throw path_violation 名字不合法，或者同名目录是符号链接
     */
    std::filesystem::path make_work_directory(const std::string &name) const;

    /**
     * @brief 删除 make_work_directory 创建的目录和程序在其中写入的所有文件
     * 删除失败只记录日志，不抛出异常
     */
    void remove_work_directory(const std::filesystem::path &dir) const;

    /**
     * @brief 子目录的绝对路径
     */
    std::filesystem::path directory(subarea area) const;

    const std::filesystem::path &root() const;

    /**
     * @brief 判断 path 解析符号链接后是否在沙箱根目录之内
     */
    bool contains(const std::filesystem::path &path) const;

    /**
     * @brief 判断 path 解析符号链接后是否在子目录之内
     */
    bool contains(const std::filesystem::path &path, subarea area) const;

    /**
     * @brief 删除沙箱内的文件，文件不存在时什么都不做
     * 删除失败只记录日志，不抛出异常
     */
    void remove(const std::filesystem::path &path) const;

private:
    std::filesystem::path root_dir;
};

}  // namespace oibox
