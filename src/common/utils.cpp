#include "common/utils.hpp"
#include <fmt/core.h>
#include <boost/uuid/detail/md5.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <algorithm>
#include <cstdlib>
using namespace std;

string get_env(const string &key, const string &def_value) {
    char *result = getenv(key.c_str());
    return !result ? def_value : string(result);
}

string shell_quote(const string &value) {
    string result = "'";
    for (char c : value) {
        if (c == '\'')
            result += "'\\''";
        else
            result += c;
    }
    result += "'";
    return result;
}

string md5_hex(const string &content) {
    boost::uuids::detail::md5 hash;
    boost::uuids::detail::md5::digest_type digest;
    hash.process_bytes(content.data(), content.size());
    hash.get_digest(digest);
    string result;
    // 摘要的每个元素按大端序保存
    for (auto word : digest)
        result += fmt::format("{:0{}x}", word, sizeof(word) * 2);
    return result;
}

string random_token() {
    static thread_local boost::uuids::random_generator generator;
    string token = boost::uuids::to_string(generator());
    token.erase(remove(token.begin(), token.end(), '-'), token.end());
    return token;
}

elapsed_time::elapsed_time() {
    start = chrono::steady_clock::now();
}
