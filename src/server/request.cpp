#include "server/request.hpp"
#include <boost/algorithm/string.hpp>
#include <boost/beast/core/detail/base64.hpp>
#include <cctype>
#include <set>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"

namespace runner::server {
using namespace std;
using namespace nlohmann;
namespace base64 = boost::beast::detail::base64;

void from_json(const json &j, request_file &file) {
    if (j.count("name"))
        j.at("name").get_to(file.name);
    else
        j.at("path").get_to(file.name);
    j.at("content").get_to(file.content);
    if (j.count("encoding") && !j.at("encoding").is_null()) j.at("encoding").get_to(file.encoding);
}

static library_ref parse_library(const json &j) {
    if (j.is_string()) return {j.get<string>()};
    for (auto key : {"fileName", "originalName", "name"})
        if (j.count(key) && j.at(key).is_string())
            return {j.at(key).get<string>()};
    throw validation_error("custom library requires fileName: " + j.dump());
}

void from_json(const json &j, execution_request &request) {
    if (j.count("sessionId") && !j.at("sessionId").is_null()) j.at("sessionId").get_to(request.session_id);
    j.at("language").get_to(request.language);
    if (j.count("code") && !j.at("code").is_null()) request.code = j.at("code").get<string>();
    if (j.count("files") && !j.at("files").is_null()) j.at("files").get_to(request.files);
    if (j.count("mainFile") && !j.at("mainFile").is_null()) j.at("mainFile").get_to(request.main_file);
    if (j.count("entryPoint") && !j.at("entryPoint").is_null()) j.at("entryPoint").get_to(request.entry_point);
    if (j.count("projectId") && !j.at("projectId").is_null()) {
        auto &id = j.at("projectId");
        request.project_id = id.is_string() ? id.get<string>() : id.dump();
    }
    if (j.count("dependencies") && !j.at("dependencies").is_null()) {
        for (auto &item : j.at("dependencies").items()) {
            auto &version = item.value();
            request.dependencies[item.key()] = version.is_string() ? version.get<string>() : version.dump();
        }
    }
    if (j.count("customLibraries") && !j.at("customLibraries").is_null()) {
        for (auto &library : j.at("customLibraries"))
            request.libraries.push_back(parse_library(library));
    }
}

execution_request parse_execution_request(const string &body) {
    json j;
    try {
        j = json::parse(body);
    } catch (const json::exception &ex) {
        throw validation_error(string("malformed request: ") + ex.what());
    }
    return parse_execution_request(j);
}

execution_request parse_execution_request(const json &j) {
    try {
        return j.get<execution_request>();
    } catch (const json::exception &ex) {
        throw validation_error(string("malformed request: ") + ex.what());
    }
}

string decode_base64(const string &text) {
    string input;
    for (char c : text)
        if (!isspace(static_cast<unsigned char>(c))) input += c;

    string output(base64::decoded_size(input.size()), '\0');
    auto [written, read] = base64::decode(output.data(), input.data(), input.size());
    // decode 在填充字符或非法字符处停止，剩下的只能是不超过两个 '='
    size_t padding = input.size() - read;
    if (padding > 2 || input.find_first_not_of('=', read) != string::npos)
        throw validation_error("content is not valid base64");
    output.resize(written);
    return output;
}

static string decode_content(const request_file &file) {
    string encoding = boost::algorithm::to_lower_copy(file.encoding);
    if (encoding.empty() || encoding == "utf8" || encoding == "utf-8" || encoding == "text")
        return file.content;
    if (encoding == "base64")
        return decode_base64(file.content);
    throw validation_error("unsupported encoding " + file.encoding + " of " + file.name);
}

project build_project(const execution_request &request, const language_profile &profile) {
    project proj;

    if (!request.files.empty()) {
        set<string> seen;
        for (auto &file : request.files) {
            string path = normalize_relative_path(file.name);
            if (!seen.insert(path).second)
                throw validation_error("duplicate file " + path);
            proj.files.push_back({path, decode_content(file)});
        }
    } else if (request.code) {
        string name = profile.entry_file;
        if (!request.main_file.empty()) {
            name = normalize_relative_path(request.main_file);
        } else if (profile.main_class && !profile.source_extensions.empty()) {
            // javac 要求 public class 保存在同名文件中
            string main_class = profile.main_class(*request.code);
            name = main_class.substr(main_class.rfind('.') + 1) + profile.source_extensions.front();
        }
        proj.files.push_back({name, *request.code});
    } else {
        throw validation_error("either code or files is required");
    }

    if (!request.main_file.empty()) {
        proj.entry_file = normalize_relative_path(request.main_file);
        if (!proj.find(proj.entry_file))
            throw validation_error("main file " + proj.entry_file + " is not part of the project");
    } else if (proj.files.size() == 1) {
        proj.entry_file = proj.files.front().path;
    } else if (proj.find(profile.entry_file)) {
        proj.entry_file = profile.entry_file;
    } else {
        for (auto &file : proj.files) {
            if (profile.is_source(file.path)) {
                proj.entry_file = file.path;
                break;
            }
        }
        if (proj.entry_file.empty())
            throw validation_error("no " + profile.name + " source file to run");
    }

    proj.entry_point = request.entry_point;
    proj.project_id = request.project_id;
    proj.dependencies = request.dependencies;
    proj.libraries = request.libraries;
    if (!proj.libraries.empty() && proj.project_id.empty())
        throw validation_error("customLibraries requires projectId");
    for (auto &library : proj.libraries) {
        if (library.file_name.empty() || library.file_name.find('/') != string::npos ||
            library.file_name.find('\\') != string::npos || library.file_name == "." || library.file_name == "..")
            throw validation_error("invalid custom library name " + library.file_name);
    }
    return proj;
}

}  // namespace runner::server
