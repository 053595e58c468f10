#include "docker/tar.hpp"
#include <fmt/core.h>
#include <algorithm>
#include <cstring>
#include "common/exceptions.hpp"

namespace runner::docker {
using namespace std;

static constexpr size_t block_size = 512;

tar_writer::tar_writer(unsigned uid, unsigned gid) : uid(uid), gid(gid) {}

void tar_writer::add_directory(const string &path, unsigned mode) {
    string name = path;
    if (name.empty() || name.back() != '/') name += '/';
    add_entry(name, '5', "", mode);
}

void tar_writer::add_file(const string &path, const string &content, unsigned mode) {
    add_entry(path, '0', content, mode);
}

string tar_writer::finish() {
    if (!finished) {
        buffer.append(block_size * 2, '\0');
        finished = true;
    }
    return buffer;
}

void tar_writer::pad() {
    size_t rem = buffer.size() % block_size;
    if (rem) buffer.append(block_size - rem, '\0');
}

// 尝试把路径拆成 prefix/name 以放进 ustar 头
static bool split_ustar_path(const string &path, string &prefix, string &name) {
    if (path.size() <= 100) {
        prefix.clear();
        name = path;
        return true;
    }
    // 目录的结尾斜杠属于 name
    for (size_t pos = path.find('/'); pos != string::npos; pos = path.find('/', pos + 1)) {
        if (pos > 155) break;
        if (path.size() - pos - 1 <= 100 && pos + 1 < path.size()) {
            prefix = path.substr(0, pos);
            name = path.substr(pos + 1);
            return true;
        }
    }
    return false;
}

static void write_octal(char *field, size_t width, unsigned long long value) {
    string text = fmt::format("{:0{}o}", value, width - 1);
    memcpy(field, text.data(), min(text.size(), width - 1));
    field[width - 1] = '\0';
}

void tar_writer::write_header(const string &path, char type, size_t size, unsigned mode) {
    string prefix, name;
    if (!split_ustar_path(path, prefix, name)) {
        // PAX 记录格式为 "<len> path=<path>\n"，len 包括自身的位数
        string body = " path=" + path + "\n";
        size_t len = body.size() + 1;
        while (to_string(len).size() + body.size() != len)
            len = to_string(len).size() + body.size();
        string record = to_string(len) + body;
        write_header("PaxHeader", 'x', record.size(), 0644);
        buffer += record;
        pad();
        name = path.substr(path.size() > 100 ? path.size() - 100 : 0);
        prefix.clear();
    }

    char header[block_size];
    memset(header, 0, sizeof(header));
    memcpy(header, name.data(), min<size_t>(name.size(), 100));
    write_octal(header + 100, 8, mode);
    write_octal(header + 108, 8, uid);
    write_octal(header + 116, 8, gid);
    write_octal(header + 124, 12, size);
    write_octal(header + 136, 12, 0);
    header[156] = type;
    memcpy(header + 257, "ustar", 6);
    memcpy(header + 263, "00", 2);
    memcpy(header + 345, prefix.data(), min<size_t>(prefix.size(), 155));

    // 计算校验和时校验和字段视为 8 个空格
    memset(header + 148, ' ', 8);
    unsigned checksum = 0;
    for (size_t i = 0; i < block_size; ++i)
        checksum += (unsigned char)header[i];
    string text = fmt::format("{:06o}", checksum);
    memcpy(header + 148, text.data(), 6);
    header[154] = '\0';
    header[155] = ' ';

    buffer.append(header, block_size);
}

void tar_writer::add_entry(const string &path, char type, const string &content, unsigned mode) {
    if (finished)
        throw internal_error("tar archive already finished");
    write_header(path, type, content.size(), mode);
    buffer += content;
    pad();
}

static unsigned long long parse_octal(const char *field, size_t width) {
    unsigned long long value = 0;
    for (size_t i = 0; i < width && field[i]; ++i) {
        if (field[i] == ' ') continue;
        if (field[i] < '0' || field[i] > '7')
            throw stream_error("malformed tar header");
        value = value * 8 + (field[i] - '0');
    }
    return value;
}

static string parse_string(const char *field, size_t width) {
    return string(field, strnlen(field, width));
}

vector<tar_entry> read_tar(const string &archive) {
    vector<tar_entry> entries;
    string pax_path;
    for (size_t pos = 0; pos + block_size <= archive.size();) {
        const char *header = archive.data() + pos;
        if (all_of(header, header + block_size, [](char c) { return c == '\0'; }))
            break;

        size_t size = parse_octal(header + 124, 12);
        char type = header[156];
        size_t data_begin = pos + block_size;
        if (data_begin + size > archive.size())
            throw stream_error("truncated tar archive");
        string data = archive.substr(data_begin, size);
        pos = data_begin + (size + block_size - 1) / block_size * block_size;

        if (type == 'x') {
            auto key = data.find(" path=");
            if (key != string::npos) {
                auto end = data.find('\n', key);
                pax_path = data.substr(key + 6, end - key - 6);
            }
            continue;
        }

        tar_entry entry;
        string prefix = parse_string(header + 345, 155);
        string name = parse_string(header, 100);
        entry.path = !pax_path.empty() ? pax_path : (prefix.empty() ? name : prefix + "/" + name);
        pax_path.clear();
        entry.directory = type == '5';
        if (entry.directory && !entry.path.empty() && entry.path.back() == '/')
            entry.path.pop_back();
        entry.mode = parse_octal(header + 100, 8);
        entry.uid = parse_octal(header + 108, 8);
        entry.gid = parse_octal(header + 116, 8);
        entry.content = move(data);
        entries.push_back(move(entry));
    }
    return entries;
}

}  // namespace runner::docker
