#include "language/profile.hpp"
#include <boost/algorithm/string.hpp>
#include "common/exceptions.hpp"
#include "language/command.hpp"

namespace runner {
using namespace std;

const char *get_display_message(package_manager manager) {
    switch (manager) {
        case package_manager::NPM:
            return "npm";
        case package_manager::PIP:
            return "pip";
        case package_manager::MAVEN:
            return "maven";
        case package_manager::CONAN:
            return "conan";
        default:
            return "none";
    }
}

bool language_profile::is_source(const string &path) const {
    for (auto &ext : source_extensions)
        if (boost::algorithm::ends_with(path, ext) && path.size() > ext.size())
            return true;
    return false;
}

static library_rule rule(const char *pattern, library_kind kind) {
    return {regex(pattern, regex::ECMAScript | regex::optimize), kind};
}

language_table::language_table() {
    static const char *tarball = R"(\.(tgz|tar\.gz)$)";

    language_profile python;
    python.name = "python";
    python.image = "nexusquest-python";
    python.entry_file = "main.py";
    python.source_extensions = {".py"};
    python.manifest_files = {"requirements.txt"};
    python.manager = package_manager::PIP;
    python.command_template = "PYTHONPATH=. PYTHONUSERBASE=\"$PWD/.pyuser\" python3 -u {entry}";
    python.library_rules = {rule(R"(\.(whl|zip|tgz|tar\.gz)$)", library_kind::PYTHON_PACKAGE)};
    profiles[python.name] = python;

    language_profile javascript;
    javascript.name = "javascript";
    javascript.image = "nexusquest-javascript";
    javascript.entry_file = "main.js";
    javascript.source_extensions = {".js", ".mjs", ".cjs"};
    javascript.manifest_files = {"package.json"};
    javascript.manager = package_manager::NPM;
    javascript.command_template = "NODE_PATH=\"$PWD/node_modules\" node {entry}";
    javascript.library_rules = {rule(tarball, library_kind::NPM_PACKAGE)};
    profiles[javascript.name] = javascript;

    language_profile java;
    java.name = "java";
    java.image = "nexusquest-java";
    java.entry_file = "Main.java";
    java.source_extensions = {".java"};
    java.manifest_files = {"pom.xml"};
    java.manager = package_manager::MAVEN;
    java.compiled = true;
    java.command_template = "javac -encoding UTF-8 -cp '.:lib/*' -d . {sources} && java -cp '.:lib/*' {main_class}";
    java.main_class = java_main_class;
    java.library_rules = {rule(R"(\.jar$)", library_kind::JAR)};
    profiles[java.name] = java;

    // conan 的 PkgConfigDeps 在 build/ 中生成 .pc 文件
    language_profile cpp;
    cpp.name = "cpp";
    cpp.image = "nexusquest-cpp";
    cpp.entry_file = "main.cpp";
    cpp.source_extensions = {".cpp", ".cc", ".cxx"};
    cpp.manifest_files = {"conanfile.txt", "conanfile.py"};
    cpp.manager = package_manager::CONAN;
    cpp.compiled = true;
    cpp.command_template =
        "g++ -std=c++20 -I. -Iinclude -Llib {sources} -o a.out "
        "$(if ls build/*.pc >/dev/null 2>&1; then "
        "PKG_CONFIG_PATH=build pkg-config --cflags --libs $(cd build && ls *.pc | sed 's/\\.pc$//'); fi)"
        "{links} && LD_LIBRARY_PATH=\"./lib:$LD_LIBRARY_PATH\" ./a.out";
    cpp.library_rules = {rule(R"(\.(so(\.[0-9]+)*|a)$)", library_kind::NATIVE_LIBRARY),
                         rule(R"(\.(h|hpp|hh|hxx)$)", library_kind::NATIVE_HEADER),
                         rule(R"(\.(tgz|tar\.gz|zip)$)", library_kind::NATIVE_ARCHIVE)};
    profiles[cpp.name] = cpp;

    // go run 只接受同一个目录下的文件
    language_profile go;
    go.name = "go";
    go.image = "nexusquest-go";
    go.entry_file = "main.go";
    go.source_extensions = {".go"};
    go.compiled = true;
    go.command_template = "GOCACHE=\"$PWD/.gocache\" GO111MODULE=auto go run {sources}";
    go.sources_from_entry_directory = true;
    go.excluded_suffixes = {"_test.go"};
    profiles[go.name] = go;

    aliases = {{"py", "python"}, {"python3", "python"},
               {"js", "javascript"}, {"node", "javascript"}, {"nodejs", "javascript"},
               {"c++", "cpp"}, {"cxx", "cpp"},
               {"golang", "go"}};
}

const language_profile *language_table::lookup(const string &language) const {
    string name = boost::algorithm::to_lower_copy(boost::algorithm::trim_copy(language));
    if (auto alias = aliases.find(name); alias != aliases.end())
        name = alias->second;
    auto it = profiles.find(name);
    return it == profiles.end() ? nullptr : &it->second;
}

void language_table::override_image(const string &language, const string &image) {
    auto profile = lookup(language);
    if (!profile) throw unsupported_language_error(language);
    profiles[profile->name].image = image;
}

const language_profile &language_table::at(const string &language) const {
    auto profile = lookup(language);
    if (!profile) throw unsupported_language_error(language);
    return *profile;
}

bool language_table::supports(const string &language) const {
    return lookup(language) != nullptr;
}

vector<string> language_table::names() const {
    vector<string> result;
    for (auto &[name, profile] : profiles)
        result.push_back(name);
    return result;
}

}  // namespace runner
