#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "session/session.hpp"

namespace runner::session {

/**
 * @brief 会话表，session id 到会话的映射
 * 所有操作都是原子的
 */
struct session_registry {
    /**
     * @brief 插入会话，替换同 id 的旧会话
     * @return 被替换的旧会话，没有时返回 nullptr
     */
    std::shared_ptr<execution_session> insert_or_replace(std::shared_ptr<execution_session> session);

    /**
     * @return 找不到时返回 nullptr
     */
    std::shared_ptr<execution_session> find(const std::string &session_id) const;

    /**
     * @brief 只有表中的会话仍然是 session 本身时才删除
     * 旧会话清理时不会删除已经替换它的新会话
     * @return 是否删除
     */
    bool erase_if_same(const std::shared_ptr<execution_session> &session);

    std::vector<std::shared_ptr<execution_session>> snapshot() const;

    size_t size() const;

private:
    mutable std::mutex mut;
    std::map<std::string, std::shared_ptr<execution_session>> sessions;
};

}  // namespace runner::session
