#pragma once

namespace runner {

/**
 * @brief 执行会话的生命周期状态
 * Provisioning -> Workspace -> (Installing) -> Running -> {Completed, Failed, Stopped}
 */
enum class session_state {
    /**
     * @brief 正在创建并启动沙箱容器
     */
    PROVISIONING = 0,

    /**
     * @brief 正在向容器写入项目文件
     */
    WORKSPACE = 1,

    /**
     * @brief 正在安装依赖，只有项目声明了依赖时才会进入这个状态
     */
    INSTALLING = 2,

    /**
     * @brief 用户程序正在编译或运行
     */
    RUNNING = 3,

    /**
     * @brief 用户程序运行结束，无论退出码是多少
     * 编译错误、运行时错误都只是 stderr 的内容
     */
    COMPLETED = 4,

    /**
     * @brief 基础设施错误或超时导致会话中止
     */
    FAILED = 5,

    /**
     * @brief 调用方请求停止，或者输出流的订阅者断开了连接
     */
    STOPPED = 6
};

const char *get_display_message(session_state state);

/**
 * @brief 是否为终止状态，终止状态不会再发生转移
 */
bool is_terminal(session_state state);

}  // namespace runner
