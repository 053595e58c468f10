#include "language/command.hpp"
#include <fmt/format.h>
#include <boost/algorithm/string.hpp>
#include <regex>
#include "common/exceptions.hpp"
#include "common/utils.hpp"

namespace runner {
using namespace std;

// 去掉注释和字符串字面量，避免注释里的 "public class Foo" 被误认为主类
static string strip_java_comments(const string &source) {
    string result;
    result.reserve(source.size());
    for (size_t i = 0; i < source.size(); ++i) {
        char c = source[i];
        if (c == '/' && i + 1 < source.size() && source[i + 1] == '/') {
            while (i < source.size() && source[i] != '\n') ++i;
            result += '\n';
        } else if (c == '/' && i + 1 < source.size() && source[i + 1] == '*') {
            size_t end = source.find("*/", i + 2);
            if (end == string::npos) break;
            i = end + 1;
            result += ' ';
        } else if (c == '"' || c == '\'') {
            size_t j = i + 1;
            while (j < source.size() && source[j] != c && source[j] != '\n') {
                if (source[j] == '\\') ++j;
                ++j;
            }
            i = j;
            result += ' ';
        } else {
            result += c;
        }
    }
    return result;
}

string java_main_class(const string &source) {
    static const regex class_pattern(R"(public\s+(?:(?:final|abstract|static)\s+)*class\s+(\w+))");
    static const regex package_pattern(R"((?:^|[;\s])package\s+([\w.]+)\s*;)");

    string code = strip_java_comments(source);
    smatch class_match;
    if (!regex_search(code, class_match, class_pattern))
        return "Main";
    smatch package_match;
    if (regex_search(code, package_match, package_pattern))
        return package_match[1].str() + "." + class_match[1].str();
    return class_match[1].str();
}

string native_link_name(const string &file_name) {
    static const regex pattern(R"(^lib(.+?)\.(?:so(?:\.[0-9]+)*|a)$)");
    string base = file_name.substr(file_name.find_last_of('/') + 1);
    smatch match;
    if (regex_match(base, match, pattern))
        return match[1].str();
    return "";
}

static string dirname_of(const string &path) {
    auto pos = path.find_last_of('/');
    return pos == string::npos ? "" : path.substr(0, pos);
}

static vector<string> quoted_sources(const language_profile &profile, const project &proj) {
    string dir = dirname_of(proj.entry_file);
    vector<string> sources;
    for (auto &file : proj.files) {
        if (!profile.is_source(file.path)) continue;
        if (profile.sources_from_entry_directory && dirname_of(file.path) != dir) continue;
        bool excluded = false;
        for (auto &suffix : profile.excluded_suffixes)
            excluded |= boost::algorithm::ends_with(file.path, suffix);
        if (!excluded) sources.push_back(shell_quote(file.path));
    }
    return sources;
}

static string main_class_of(const language_profile &profile, const project &proj) {
    if (!profile.main_class) return "";
    if (!proj.entry_point.empty()) return proj.entry_point;
    auto entry_file = proj.find(proj.entry_file);
    return entry_file && profile.is_source(entry_file->path)
               ? profile.main_class(entry_file->content)
               : "Main";
}

string build_command(const language_profile &profile, const project &proj, const vector<string> &libraries) {
    if (profile.command_template.empty())
        throw unsupported_language_error(profile.name);

    string links;
    for (auto &library : libraries) {
        string name = native_link_name(library);
        if (!name.empty()) links += " -l" + shell_quote(name);
    }

    try {
        return fmt::format(fmt::runtime(profile.command_template),
                           fmt::arg("entry", shell_quote(proj.entry_file)),
                           fmt::arg("sources", boost::algorithm::join(quoted_sources(profile, proj), " ")),
                           fmt::arg("main_class", shell_quote(main_class_of(profile, proj))),
                           fmt::arg("links", links));
    } catch (const fmt::format_error &ex) {
        throw internal_error(fmt::format("malformed command template of {}: {}", profile.name, ex.what()));
    }
}

}  // namespace runner
