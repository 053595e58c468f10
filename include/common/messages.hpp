#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace runner::message {

enum class output_type {
    STDOUT,
    STDERR,
    END,
    ERROR
};

const char *get_display_message(output_type type);

/**
 * @brief 推送给调用方的一个输出事件
 * 对于 STDOUT/STDERR，data 为程序输出的一段字节；
 * 对于 ERROR，data 为错误信息；END 没有 data。
 */
struct output_event {
    output_type type;

    std::string data;

    /**
     * @brief 用户程序的退出码，只在 END 事件中出现，并且只有退出码已知时才有
     */
    std::optional<int> exit_code;

    bool terminal() const;
};

output_event make_stdout(const std::string &data);
output_event make_stderr(const std::string &data);
output_event make_end(std::optional<int> exit_code = std::nullopt);
output_event make_error(const std::string &message);

void to_json(nlohmann::json &j, const output_event &event);

/**
 * @brief 将事件编码为 server-sent events 的一帧
 * 格式为 "data: <json>\n\n"，非法的 UTF-8 字节会被替换为 U+FFFD
 */
std::string to_sse(const output_event &event);

}  // namespace runner::message
