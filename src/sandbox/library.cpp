#include "sandbox/library.hpp"
#include <curl/curl.h>
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/algorithm/string.hpp>
#include <regex>
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"

namespace runner::sandbox {
using namespace std;
namespace ba = boost::algorithm;

library_kind infer_library_kind(const language_profile &profile, const string &file_name) {
    string name = ba::to_lower_copy(file_name);
    for (auto &rule : profile.library_rules)
        if (regex_search(name, rule.pattern))
            return rule.kind;
    return library_kind::UNKNOWN;
}

library_store::~library_store() = default;

local_library_store::local_library_store(const filesystem::path &root) : root(root) {}

optional<string> local_library_store::fetch(const string &project_id, const string &file_name) {
    if (project_id.find('/') != string::npos || file_name.find('/') != string::npos)
        return nullopt;
    auto path = root / project_id / file_name;
    if (!filesystem::is_regular_file(path))
        return nullopt;
    return read_file_content(path);
}

remote_library_store::remote_library_store(const string &base_url) : base_url(base_url) {}

static size_t append_body(char *ptr, size_t size, size_t nmemb, void *userdata) {
    static_cast<string *>(userdata)->append(ptr, size * nmemb);
    return size * nmemb;
}

optional<string> remote_library_store::fetch(const string &project_id, const string &file_name) {
    CURL *curl = curl_easy_init();
    if (!curl)
        throw network_error("unable to initialize curl");
    defer { curl_easy_cleanup(curl); };

    char *project = curl_easy_escape(curl, project_id.c_str(), (int)project_id.size());
    char *name = curl_easy_escape(curl, file_name.c_str(), (int)file_name.size());
    string url = fmt::format("{}/{}/{}", ba::trim_right_copy_if(base_url, ba::is_any_of("/")), project, name);
    curl_free(project);
    curl_free(name);

    string body;
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, append_body);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &body);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, 60L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    CURLcode res = curl_easy_perform(curl);
    if (res != CURLE_OK)
        throw network_error(fmt::format("unable to download {}: {}", url, curl_easy_strerror(res)));

    long status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
    if (status == 404)
        return nullopt;
    if (status != 200)
        throw network_error(fmt::format("unable to download {}: HTTP {}", url, status));
    return body;
}

vector<string> library_candidates(const string &file_name) {
    return {file_name, file_name + ".gz", file_name + ".tar.gz"};
}

vector<library_blob> resolve_libraries(library_store &store, const language_profile &profile, const project &proj) {
    vector<library_blob> result;
    for (auto &ref : proj.libraries) {
        bool found = false;
        try {
            for (auto &candidate : library_candidates(ref.file_name)) {
                auto content = store.fetch(proj.project_id, candidate);
                if (!content) continue;
                found = true;
                auto kind = infer_library_kind(profile, candidate);
                if (kind == library_kind::UNKNOWN) {
                    LOG(WARNING) << "Custom library " << candidate << " is not usable for " << profile.name << ", skipping";
                } else {
                    result.push_back({candidate, move(*content), kind});
                }
                break;
            }
        } catch (const network_error &ex) {
            LOG(WARNING) << "Unable to fetch custom library " << ref.file_name << ": " << ex.what();
            continue;
        }
        if (!found)
            LOG(WARNING) << "Custom library " << ref.file_name << " not found for project " << proj.project_id << ", skipping";
    }
    return result;
}

string npm_fallback_name(const string &file_name) {
    static const regex version_suffix(R"(-[0-9]+\.[0-9]+\.[0-9]+.*$)");
    string name = file_name;
    if (ba::ends_with(name, ".tar.gz"))
        name.erase(name.size() - 7);
    else if (ba::ends_with(name, ".tgz"))
        name.erase(name.size() - 4);
    return regex_replace(name, version_suffix, "");
}

// 解压 npm 包：去掉唯一的顶层目录，包名取 package.json 的 name 字段，
// 入口不是 index.js 时生成一个转发到真正入口的 index.js
static const char *merge_npm_function = R"SH(
merge_npm() {
    archive="$1"; fallback="$2"
    tmp=$(mktemp -d) || return 1
    tar -xzf "$archive" -C "$tmp" || return 1
    src="$tmp"
    if [ "$(ls -A "$tmp" | wc -l)" -eq 1 ] && [ -d "$tmp/$(ls -A "$tmp")" ]; then
        src="$tmp/$(ls -A "$tmp")"
    fi
    name=""
    main=""
    if [ -f "$src/package.json" ]; then
        name=$(grep -oE '"name"[[:space:]]*:[[:space:]]*"[^"]+"' "$src/package.json" | head -n1 | sed -E 's/.*"([^"]+)"$/\1/')
        main=$(grep -oE '"main"[[:space:]]*:[[:space:]]*"[^"]+"' "$src/package.json" | head -n1 | sed -E 's/.*"([^"]+)"$/\1/')
    fi
    [ -n "$name" ] || name="$fallback"
    entry=""
    if [ -n "$main" ] && [ -f "$src/$main" ]; then entry="$main"; fi
    if [ -z "$entry" ]; then
        for candidate in index.js src/index.js lib/index.js dist/index.js; do
            if [ -f "$src/$candidate" ]; then entry="$candidate"; break; fi
        done
    fi
    rm -rf "node_modules/$name" && mkdir -p "node_modules/$name" && cp -a "$src/." "node_modules/$name/" || return 1
    if [ -n "$entry" ] && [ "$entry" != "index.js" ] && [ ! -f "node_modules/$name/index.js" ]; then
        printf "module.exports = require('./%s');\n" "$entry" > "node_modules/$name/index.js"
    fi
    if [ "$name" != "$fallback" ] && [ ! -e "node_modules/$fallback" ]; then
        cp -a "node_modules/$name" "node_modules/$fallback"
    fi
    rm -rf "$tmp"
    echo "installed npm package $name"
}
)SH";

static const char *merge_native_function = R"SH(
merge_native() {
    tmp=$(mktemp -d) || return 1
    case "$1" in
        *.zip) unzip -q "$1" -d "$tmp" || return 1 ;;
        *) tar -xzf "$1" -C "$tmp" || return 1 ;;
    esac
    mkdir -p lib include
    find "$tmp" -type f \( -name '*.so' -o -name '*.so.*' -o -name '*.a' \) -exec cp -a {} lib/ \;
    headers=$(find "$tmp" -type d -name include | head -n1)
    if [ -n "$headers" ]; then
        cp -a "$headers/." include/
    else
        find "$tmp" -type f \( -name '*.h' -o -name '*.hpp' -o -name '*.hh' \) -exec cp -a {} include/ \;
    fi
    rm -rf "$tmp"
    echo "installed native archive $1"
}
)SH";

string merge_script(const language_profile &profile, const vector<library_blob> &libraries, const string &staging_root) {
    string script;
    bool npm = false, native = false;
    for (auto &library : libraries) {
        npm |= library.kind == library_kind::NPM_PACKAGE;
        native |= library.kind == library_kind::NATIVE_ARCHIVE;
    }
    if (npm) script += merge_npm_function;
    if (native) script += merge_native_function;

    for (auto &library : libraries) {
        string staged = shell_quote(staging_root + "/" + library.file_name);
        switch (library.kind) {
            case library_kind::NPM_PACKAGE:
                script += fmt::format("mkdir -p node_modules && merge_npm {} {} || exit 1\n",
                                      staged, shell_quote(npm_fallback_name(library.file_name)));
                break;
            case library_kind::JAR:
                script += fmt::format("mkdir -p lib && cp {} lib/ || exit 1\n", staged);
                break;
            case library_kind::PYTHON_PACKAGE:
                script += fmt::format("PYTHONUSERBASE=\"$PWD/.pyuser\" pip install --user --no-deps --no-index {} || exit 1\n", staged);
                break;
            case library_kind::NATIVE_LIBRARY:
                script += fmt::format("mkdir -p lib && cp {} lib/ || exit 1\n", staged);
                break;
            case library_kind::NATIVE_HEADER:
                script += fmt::format("mkdir -p include && cp {} include/ || exit 1\n", staged);
                break;
            case library_kind::NATIVE_ARCHIVE:
                script += fmt::format("merge_native {} || exit 1\n", staged);
                break;
            default:
                LOG(WARNING) << "Skipping custom library " << library.file_name << " for " << profile.name;
                break;
        }
    }
    return script;
}

vector<string> linkable_libraries(const vector<library_blob> &libraries) {
    vector<string> result;
    for (auto &library : libraries)
        if (library.kind == library_kind::NATIVE_LIBRARY)
            result.push_back(library.file_name);
    return result;
}

}  // namespace runner::sandbox
