#pragma once

#include <glog/logging.h>
#include <chrono>
#include <string>
#include <thread>
#include "common/exceptions.hpp"

namespace runner {

/**
 * @brief 重试策略
 * 第 n 次重试之前等待 interval * backoff^(n-1)
 */
struct retry_policy {
    /**
     * @brief 最多尝试的次数（包括第一次），至少为 1
     */
    int attempts = 3;

    std::chrono::milliseconds interval{500};

    double backoff = 2.0;
};

/**
 * @brief 按照策略执行 fn，遇到可以重试的错误时等待后重新执行
 * 容器创建、启动、exec 连接以及网络类的依赖安装错误都通过这里重试。
 * @param what 操作名称，用于日志
 * @param fn 被执行的操作，失败时抛出 runner_exception
 * @param is_transient 判断异常是否值得重试
 * @return fn 的返回值
 * @throw 最后一次失败的异常，或者第一个不可重试的异常
 */
template <typename Fn, typename Pred>
auto retry(const retry_policy &policy, const std::string &what, Fn &&fn, Pred &&is_transient) -> decltype(fn()) {
    auto delay = policy.interval;
    for (int attempt = 1;; ++attempt) {
        try {
            return fn();
        } catch (const runner_exception &ex) {
            if (attempt >= policy.attempts || !is_transient(ex))
                throw;
            LOG(WARNING) << what << " failed (attempt " << attempt << "/" << policy.attempts
                         << "): " << ex.what() << ", retrying in " << delay.count() << "ms";
        }
        std::this_thread::sleep_for(delay);
        delay = std::chrono::milliseconds(static_cast<long long>(delay.count() * policy.backoff));
    }
}

}  // namespace runner
