#include "common/io_utils.hpp"
#include <boost/algorithm/string.hpp>
#include <fstream>
#include <vector>
#include "common/exceptions.hpp"

namespace runner {
using namespace std;

string read_file_content(filesystem::path const &path) {
    ifstream fin(path.string());
    string str((istreambuf_iterator<char>(fin)),
               (istreambuf_iterator<char>()));
    return str;
}

size_t utf8_incomplete_tail(const string &string) {
    size_t size = string.size();
    // 多字节序列最长 4 字节，只需要检查最后 3 个字节里有没有未完成的首字节
    for (size_t back = 1; back <= 3 && back <= size; ++back) {
        unsigned char c = string[size - back];
        if ((c & 0xC0) == 0x80) continue;  // 10bbbbbb，继续向前找首字节
        size_t expected;
        if ((c & 0xE0) == 0xC0)
            expected = 2;
        else if ((c & 0xF0) == 0xE0)
            expected = 3;
        else if ((c & 0xF8) == 0xF0)
            expected = 4;
        else
            return 0;  // ASCII 或者非法字节，序列已经结束
        return back < expected ? back : 0;
    }
    return 0;
}

string normalize_relative_path(const string &subpath) {
    if (subpath.empty())
        throw validation_error("file path must not be empty");
    if (subpath.find('\0') != string::npos)
        throw validation_error("file path contains NUL byte");
    if (subpath.find('\\') != string::npos)
        throw validation_error("file path must use '/' as separator: " + subpath);
    if (subpath.front() == '/')
        throw validation_error("file path must be relative: " + subpath);

    vector<string> parts, result;
    boost::split(parts, subpath, boost::is_any_of("/"));
    for (size_t i = 0; i < parts.size(); ++i) {
        const string &part = parts[i];
        if (part == ".") continue;
        if (part.empty())
            throw validation_error("file path contains empty component: " + subpath);
        if (part == "..")
            throw validation_error("file path escapes workspace: " + subpath);
        result.push_back(part);
    }
    if (result.empty())
        throw validation_error("file path does not name a file: " + subpath);
    return boost::algorithm::join(result, "/");
}

}  // namespace runner
