#include "docker/stream.hpp"
#include <fmt/core.h>
#include "common/exceptions.hpp"

namespace runner::docker {
using namespace std;

vector<frame> frame_demuxer::feed(const char *data, size_t size) {
    buffer.append(data, size);

    vector<frame> frames;
    size_t pos = 0;
    while (buffer.size() - pos >= header_size) {
        const unsigned char *header = reinterpret_cast<const unsigned char *>(buffer.data() + pos);
        uint32_t length = (uint32_t(header[4]) << 24) | (uint32_t(header[5]) << 16) |
                          (uint32_t(header[6]) << 8) | uint32_t(header[7]);
        if (length > max_frame_size)
            throw stream_error(fmt::format("frame length {} exceeds limit {}", length, max_frame_size));
        if (buffer.size() - pos - header_size < length)
            break;

        uint8_t type = header[0];
        if ((type == uint8_t(stream_type::STDOUT) || type == uint8_t(stream_type::STDERR)) && length > 0)
            frames.push_back({stream_type(type), buffer.substr(pos + header_size, length)});
        pos += header_size + length;
    }
    buffer.erase(0, pos);
    return frames;
}

vector<frame> frame_demuxer::feed(const string &chunk) {
    return feed(chunk.data(), chunk.size());
}

void frame_demuxer::finish() const {
    if (!buffer.empty())
        throw stream_error(fmt::format("stream ended inside a frame ({} bytes pending)", buffer.size()));
}

size_t frame_demuxer::buffered() const {
    return buffer.size();
}

string encode_frame(stream_type type, const string &payload) {
    uint32_t length = payload.size();
    string result(frame_demuxer::header_size, '\0');
    result[0] = char(type);
    result[4] = char((length >> 24) & 0xff);
    result[5] = char((length >> 16) & 0xff);
    result[6] = char((length >> 8) & 0xff);
    result[7] = char(length & 0xff);
    return result + payload;
}

}  // namespace runner::docker
