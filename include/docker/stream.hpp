#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace runner::docker {

/**
 * @brief 多路复用流中帧的类型，即帧头的第一个字节
 */
enum class stream_type : uint8_t {
    STDIN = 0,
    STDOUT = 1,
    STDERR = 2
};

struct frame {
    stream_type type;
    std::string payload;
};

/**
 * @brief 容器引擎多路复用流的解析器
 * 每帧由 8 字节的帧头和负载组成：
 * 第 0 字节为流类型，1-3 字节保留，4-7 字节为大端序的负载长度。
 * 
 * 输入可以在任意位置被切分，不完整的帧会被缓存直到后续数据到达。
 * 未知类型（包括 stdin）的帧被丢弃，长度为 0 的帧不产生输出。
 */
struct frame_demuxer {
    static constexpr size_t header_size = 8;

    /**
     * @brief 单帧负载的上限，超过这个长度的帧头认为是流已经损坏
     */
    static constexpr uint32_t max_frame_size = 16u << 20;

    /**
     * @brief 输入一段数据，返回其中所有完整的帧
     * @throw stream_error 帧头声明的长度超过 max_frame_size
     */
    std::vector<frame> feed(const char *data, size_t size);

    std::vector<frame> feed(const std::string &chunk);

    /**
     * @brief 流结束时调用
     * @throw stream_error 还有未完成的帧
     */
    void finish() const;

    /**
     * @brief 已缓存但还不构成完整帧的字节数
     */
    size_t buffered() const;

private:
    std::string buffer;
};

/**
 * @brief 将负载编码为一帧
 */
std::string encode_frame(stream_type type, const std::string &payload);

}  // namespace runner::docker
