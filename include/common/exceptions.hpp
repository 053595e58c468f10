#pragma once

#include <boost/stacktrace.hpp>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>

namespace runner {

/**
 * @brief 所有运行系统异常的基类
 * 携带错误信息以及抛出位置的调用栈，kind() 用于 HTTP 接口返回错误类别
 */
struct runner_exception : std::exception {
    runner_exception();
    explicit runner_exception(const std::string &message);

    friend std::ostream &operator<<(std::ostream &os, const runner_exception &ex);

    const char *what() const noexcept override;

    /**
     * @brief 错误类别，比如 "validation"、"not_found"
     */
    virtual const char *kind() const noexcept;

private:
    std::string message;
    std::shared_ptr<boost::stacktrace::stacktrace> stacktrace;
};

/**
 * @brief 请求格式错误，在创建容器之前同步返回给调用方
 */
struct validation_error : public runner_exception {
    explicit validation_error(const std::string &message);
    const char *kind() const noexcept override;
};

/**
 * @brief 请求的语言不在语言表中
 */
struct unsupported_language_error : public runner_exception {
    explicit unsupported_language_error(const std::string &language);
    const char *kind() const noexcept override;
};

/**
 * @brief 无法创建或启动沙箱容器（镜像不存在、容器引擎不可达等）
 */
struct provision_error : public runner_exception {
    explicit provision_error(const std::string &message);
    const char *kind() const noexcept override;
};

/**
 * @brief 无法将项目文件写入容器
 */
struct workspace_write_error : public runner_exception {
    explicit workspace_write_error(const std::string &message);
    const char *kind() const noexcept override;
};

/**
 * @brief 依赖安装失败
 * log_excerpt 为包管理器输出的末尾部分（至多 1000 字节）
 */
struct dependency_install_error : public runner_exception {
    enum class failure_kind {
        NETWORK,
        RESOLUTION,
        GENERIC
    };

    dependency_install_error(failure_kind failure, const std::string &message, const std::string &log_excerpt);
    const char *kind() const noexcept override;

    failure_kind failure;
    std::string log_excerpt;
};

const char *get_display_message(dependency_install_error::failure_kind failure);

/**
 * @brief 依赖安装或程序运行超时
 */
struct timeout_error : public runner_exception {
    explicit timeout_error(const std::string &message);
    const char *kind() const noexcept override;
};

/**
 * @brief 容器输出流格式错误或读写失败
 */
struct stream_error : public runner_exception {
    explicit stream_error(const std::string &message);
    const char *kind() const noexcept override;
};

struct session_not_found_error : public runner_exception {
    explicit session_not_found_error(const std::string &session_id);
    const char *kind() const noexcept override;
};

/**
 * @brief 清理容器失败，只记录日志，不会传递给调用方
 */
struct cleanup_error : public runner_exception {
    explicit cleanup_error(const std::string &message);
    const char *kind() const noexcept override;
};

/**
 * @brief 容器引擎返回了非 2xx 的 HTTP 状态码
 */
struct engine_error : public runner_exception {
    engine_error(long status, const std::string &message);
    const char *kind() const noexcept override;

    long status;
};

/**
 * @brief 表示网络错误，通常由 CURL 产生
 */
struct network_error : public runner_exception {
    explicit network_error(const std::string &message);
    const char *kind() const noexcept override;
};

/**
 * @brief 会话被停止，流水线需要立即退出
 */
struct operation_cancelled : public runner_exception {
    explicit operation_cancelled(const std::string &message);
    const char *kind() const noexcept override;
};

/**
 * @brief 表示运行系统的内部错误
 */
struct internal_error : public runner_exception {
    explicit internal_error(const std::string &message);
    const char *kind() const noexcept override;
};

}  // namespace runner
