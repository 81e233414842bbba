#pragma once

#include <boost/stacktrace.hpp>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>

namespace oibox {

/**
 * @brief 所有 oibox 异常的基类
 * 构造时记录调用栈，通过 operator<< 输出诊断信息和调用栈
 */
struct oibox_exception : std::exception {
    oibox_exception();
    explicit oibox_exception(const std::string &message);

    friend std::ostream &operator<<(std::ostream &os, const oibox_exception &ex);

    const char *what() const noexcept override;

    /**
     * @brief 机器可读的错误类别，协议层据此生成结构化错误
     */
    virtual const char *kind() const noexcept;

private:
    std::string message;
    std::shared_ptr<boost::stacktrace::stacktrace> stacktrace;
};

/**
 * @brief 表示沙箱的内部错误
 * 一般是系统调用失败或者外部工具不可用
 */
struct internal_error : public oibox_exception {
    using oibox_exception::oibox_exception;
    const char *kind() const noexcept override;
};

/**
 * @brief 路径越界：文件名包含目录分隔符、".."、符号链接逃逸等
 * 在创建任何文件或进程之前抛出
 */
struct path_violation : public oibox_exception {
    using oibox_exception::oibox_exception;
    const char *kind() const noexcept override;
};

/**
 * @brief 命令被拒绝：不在白名单中的可执行文件、含有 shell 元字符的参数、危险的调试脚本
 */
struct command_denied : public oibox_exception {
    using oibox_exception::oibox_exception;
    const char *kind() const noexcept override;
};

/**
 * @brief 参数不合法，比如非正的时间限制、不认识的语言标准
 */
struct validation_error : public oibox_exception {
    using oibox_exception::oibox_exception;
    const char *kind() const noexcept override;
};

/**
 * @brief 请求的资源（比如测试数据）不存在
 */
struct not_found : public oibox_exception {
    using oibox_exception::oibox_exception;
    const char *kind() const noexcept override;
};

/**
 * @brief 配置文件缺失或不合法，启动时发生则服务直接退出
 */
struct configuration_error : public oibox_exception {
    using oibox_exception::oibox_exception;
    const char *kind() const noexcept override;
};

/**
 * @brief 调用方取消了请求，子进程已经被杀死并回收
 */
struct invocation_cancelled : public oibox_exception {
    using oibox_exception::oibox_exception;
    const char *kind() const noexcept override;
};

/**
 * @brief 编译失败，保存编译器输出的原始诊断信息
 */
struct compilation_error : public oibox_exception {
    std::string error_log;
    int exit_code;

    compilation_error(const std::string &what, const std::string &error_log, int exit_code = -1);
    const char *kind() const noexcept override;
};

}  // namespace oibox
