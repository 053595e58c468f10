#pragma once

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "common/config.hpp"
#include "docker/engine.hpp"
#include "language/profile.hpp"
#include "program.hpp"
#include "sandbox/dependency.hpp"
#include "sandbox/library.hpp"
#include "sandbox/provisioner.hpp"
#include "sandbox/workspace.hpp"
#include "session/registry.hpp"
#include "session/session.hpp"

namespace runner::session {

/**
 * @brief 会话的生命周期管理器
 * 每个会话的流水线（创建容器、写入文件、安装依赖、运行程序）在单独的线程中执行，
 * 无论流水线以何种方式结束，容器都会被删除，会话都会从会话表中移除。
 */
struct session_manager {
    /**
     * @param libraries 自定义库存储，为空时忽略所有自定义库
     */
    session_manager(docker::engine &docker, sandbox::library_store *libraries,
                    const language_table &languages, const configuration &config);

    ~session_manager();

    /**
     * @brief 开始一个会话
     * 同 id 的旧会话将被停止并替换。参数检查在这里同步完成，流水线在后台执行。
     * @param proj 已经通过路径检查的项目
     * @throw validation_error session id 或依赖清单不合法
     * @throw unsupported_language_error 语言不存在
     */
    std::shared_ptr<execution_session> start(const std::string &session_id, const std::string &language,
                                             project proj);

    /**
     * @brief 停止会话并立即删除容器
     * 会话不存在时什么也不做，可以重复调用
     */
    void stop(const std::string &session_id);

    /**
     * @brief 向会话中运行的程序发送一行输入
     * @throw session_not_found_error 会话不存在或者已经结束
     */
    void send_input(const std::string &session_id, const std::string &text);

    /**
     * @return 找不到时返回 nullptr
     */
    std::shared_ptr<execution_session> find(const std::string &session_id) const;

    /**
     * @brief 停止所有会话，等待所有流水线退出
     * @param timeout 至多等待的时间
     * @return 所有流水线是否都已经退出
     */
    bool shutdown(std::chrono::milliseconds timeout);

    /**
     * @brief 仍在执行的流水线数量
     */
    size_t active() const;

    const session_registry &registry() const;

private:
    docker::engine &docker;
    sandbox::library_store *libraries;
    const language_table &languages;
    const configuration &config;

    sandbox::provisioner provisioner;
    sandbox::workspace_builder workspace;
    sandbox::dependency_installer installer;
    session_registry sessions;

    mutable std::mutex active_mutex;
    std::condition_variable active_cond;
    size_t active_pipelines = 0;
    bool shutting_down = false;

    void run_pipeline(std::shared_ptr<execution_session> session, std::shared_ptr<execution_session> previous,
                      const language_profile &profile, project proj,
                      std::optional<sandbox::dependency_manifest> manifest);

    /**
     * @brief 运行用户程序，将输出推送到输出通道
     * @return 程序的退出码，无法得知时返回空
     */
    std::optional<int> execute(execution_session &session, const sandbox::container_handle &handle,
                               const language_profile &profile, const project &proj,
                               const std::vector<sandbox::library_blob> &libs);

    void supersede(execution_session &previous);

    void release_pipeline();
};

}  // namespace runner::session
