#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include "common/concurrent_queue.hpp"
#include "common/messages.hpp"
#include "common/status.hpp"
#include "sandbox/provisioner.hpp"

namespace runner::session {

/**
 * @brief session id 是否合法
 * 1 到 64 个字符，只包含字母、数字、'_'、'.'、'-'，并且以字母或数字开头
 */
bool valid_session_id(const std::string &session_id);

/**
 * @brief 会话的输出通道
 * 输出事件按到达顺序排队，由唯一的订阅者取出。
 * 通道中只会出现一个终止事件（end 或 error），之后通道关闭，再推送的输出被忽略。
 */
struct output_channel {
    /**
     * @param max_pending_bytes 尚未被取出的输出的最大字节数，超出的输出将被丢弃
     */
    explicit output_channel(size_t max_pending_bytes);

    /**
     * @brief 推送一段标准输出
     * 被截断的 UTF-8 字符的前几个字节会留到同一个流的下一段输出中发送
     * @return 通道已经关闭时返回 false
     */
    bool push_stdout(const std::string &data);

    bool push_stderr(const std::string &data);

    /**
     * @brief 推送 end 事件并关闭通道
     * @return 通道已经关闭时返回 false，此时事件被忽略
     */
    bool finish_end(std::optional<int> exit_code);

    /**
     * @brief 推送 error 事件并关闭通道，错误信息至多 1000 字节
     */
    bool finish_error(const std::string &message);

    /**
     * @brief 取出下一个事件，至多等待 timeout
     * @return 超时或者通道已经关闭且为空时返回空
     */
    std::optional<message::output_event> next(std::chrono::milliseconds timeout);

    /**
     * @brief 是否已经推送了终止事件
     */
    bool finished() const;

    /**
     * @brief 通道已关闭并且所有事件都已被取出
     */
    bool drained() const;

    /**
     * @brief 成为通道的订阅者
     * @return 已经有订阅者时返回 false
     */
    bool subscribe();

    void unsubscribe();

    /**
     * @brief 因为积压过多被丢弃的字节数
     */
    size_t dropped() const;

private:
    size_t max_pending_bytes;

    concurrent_queue<message::output_event> queue;

    mutable std::mutex mut;
    std::string stdout_carry, stderr_carry;
    size_t pending_bytes = 0;
    size_t dropped_bytes = 0;
    bool terminated = false;
    bool subscribed = false;

    bool push_output(message::output_type type, std::string &carry, const std::string &data);
    void enqueue(message::output_event event);
    bool finish(message::output_event event);
};

/**
 * @brief 将调用方的输入转发给程序的标准输入
 * 输入按照到达的顺序写入（领号排队）；程序启动之前收到的输入先缓存，
 * 连接到标准输入后按顺序写出。
 */
struct input_relay {
    using writer = std::function<void(const std::string &)>;
    using closer = std::function<void()>;

    explicit input_relay(std::string session_id);

    /**
     * @brief 发送一行输入，自动追加换行符
     * @throw session_not_found_error 会话已经结束或者程序的标准输入已经关闭
     */
    void send(const std::string &text);

    /**
     * @brief 连接到程序的标准输入，先写出所有缓存的输入
     * @param out 写入函数，失败时抛出 runner_exception
     * @param eof 关闭程序标准输入的函数，由 finish 调用
     */
    void attach(writer out, closer eof = nullptr);

    /**
     * @brief 输入结束：已缓存的输入写出后关闭程序的标准输入，程序读到 EOF
     * 未连接时推迟到 attach 完成后执行，之后的输入将被拒绝
     */
    void finish();

    /**
     * @brief 断开标准输入，之后的输入将被拒绝
     */
    void close();

    /**
     * @brief 缓存中还未写出的输入行数
     */
    size_t pending() const;

private:
    std::string session_id;

    mutable std::mutex mut;
    std::condition_variable cond;
    uint64_t next_ticket = 0;
    uint64_t serving = 0;
    std::deque<std::string> buffered;
    writer out;
    closer eof;
    bool closed = false;
    bool finishing = false;

    uint64_t take_ticket(std::unique_lock<std::mutex> &lock);
    void release_ticket();
};

/**
 * @brief 一次代码执行会话
 * 由生命周期管理器创建和修改，输出通道和输入转发各自独立加锁
 */
struct execution_session {
    execution_session(std::string id, std::string language, std::string workspace_root, size_t max_pending_output);

    const std::string id;
    const std::string language;
    const std::string workspace_root;
    const std::chrono::system_clock::time_point created_at;

    output_channel output;
    input_relay input;

    session_state state() const;

    /**
     * @brief 转移到新状态
     * 终止状态不会再转移
     * @return 当前已经是终止状态时返回 false
     */
    bool transition(session_state next);

    void set_container(sandbox::container_handle handle);

    /**
     * @brief 取走容器，保证每个容器只被删除一次
     * @return 容器尚未创建或者已经被取走时返回空
     */
    std::optional<sandbox::container_handle> take_container();

    /**
     * @brief 请求停止会话，流水线会在下一次检查时退出
     */
    void cancel();

    bool cancelled() const;

    /**
     * @brief 等待 grace 时间，让订阅者取走最后的输出；cancel 或 wake 会提前结束等待
     */
    void wait_grace(std::chrono::milliseconds grace);

    void wake();

    /**
     * @brief 流水线已经退出，容器已经清理
     */
    void mark_finished();

    /**
     * @brief 等待流水线退出
     * @return 超时返回 false
     */
    bool wait_finished(std::chrono::milliseconds timeout);

private:
    mutable std::mutex mut;
    std::condition_variable cond;
    session_state current = session_state::PROVISIONING;
    std::optional<sandbox::container_handle> container;
    std::atomic<bool> cancel_requested{false};
    bool woken = false;
    bool finished = false;
};

}  // namespace runner::session
