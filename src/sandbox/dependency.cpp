#include "sandbox/dependency.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/algorithm/string.hpp>
#include <nlohmann/json.hpp>
#include <regex>
#include <set>
#include <sstream>
#include "common/retry.hpp"
#include "common/utils.hpp"

namespace runner::sandbox {
using namespace std;
using namespace nlohmann;
namespace ba = boost::algorithm;

vector<string> cmake_packages(const string &cmake_lists) {
    static const regex pattern(R"(find_package\s*\(\s*(\w+))", regex::icase);
    static const set<string> system_packages = {"Threads", "OpenMP", "CUDA", "CUDAToolkit", "MPI", "Boost", "PkgConfig"};

    vector<string> packages;
    set<string> seen;
    for (sregex_iterator it(cmake_lists.begin(), cmake_lists.end(), pattern), end; it != end; ++it) {
        string name = (*it)[1].str();
        if (system_packages.count(name) || !seen.insert(name).second) continue;
        packages.push_back(name);
    }
    return packages;
}

// conan 中常用包的默认版本
static const map<string, string> conan_default_versions = {
    {"fmt", "10.1.1"},
    {"nlohmann_json", "3.11.2"},
    {"spdlog", "1.12.0"},
    {"catch2", "3.4.0"},
    {"gtest", "1.14.0"}};

static optional<dependency_manifest> detect_npm(const project &proj) {
    auto package = proj.find("package.json");
    if (!package && proj.dependencies.empty()) return nullopt;

    json j;
    if (package) {
        j = json::parse(package->content, nullptr, false);
        if (j.is_discarded() || !j.is_object())
            throw validation_error("package.json is not a valid JSON object");
    } else {
        j = {{"name", "project"}, {"version", "1.0.0"}, {"private", true}, {"main", proj.entry_file}};
    }
    for (auto &[name, version] : proj.dependencies)
        j["dependencies"][name] = version;

    json identity = {{"dependencies", j.value("dependencies", json::object())},
                     {"devDependencies", j.value("devDependencies", json::object())}};
    if (identity["dependencies"].empty() && identity["devDependencies"].empty())
        return nullopt;

    dependency_manifest manifest{package_manager::NPM, {}, identity.dump(), {"node_modules"}};
    if (!package || !proj.dependencies.empty())
        manifest.generated.push_back({"package.json", j.dump(2)});
    return manifest;
}

static optional<dependency_manifest> detect_pip(const project &proj) {
    auto requirements = proj.find("requirements.txt");
    string content = requirements ? requirements->content : "";
    if (!proj.dependencies.empty()) {
        if (!content.empty() && content.back() != '\n') content += '\n';
        for (auto &[name, version] : proj.dependencies) {
            if (version.empty() || version == "*")
                content += name;
            else if (string("=<>!~").find(version.front()) != string::npos)
                content += name + version;
            else
                content += name + "==" + version;
            content += '\n';
        }
    }

    bool has_requirement = false;
    istringstream lines(content);
    for (string line; getline(lines, line);) {
        ba::trim(line);
        if (!line.empty() && line.front() != '#') has_requirement = true;
    }
    if (!has_requirement) return nullopt;

    dependency_manifest manifest{package_manager::PIP, {}, content, {".pyuser"}};
    if (!proj.dependencies.empty())
        manifest.generated.push_back({"requirements.txt", content});
    return manifest;
}

static optional<dependency_manifest> detect_conan(const project &proj) {
    for (auto name : {"conanfile.txt", "conanfile.py"})
        if (auto conanfile = proj.find(name))
            return dependency_manifest{package_manager::CONAN, {}, conanfile->content, {"build", ".conan2"}};

    map<string, string> requirements;
    if (auto cmake = proj.find("CMakeLists.txt")) {
        for (auto &package : cmake_packages(cmake->content)) {
            string name = ba::to_lower_copy(package);
            auto it = conan_default_versions.find(name);
            requirements[name] = it != conan_default_versions.end() ? it->second : "[*]";
        }
    }
    for (auto &[name, version] : proj.dependencies)
        requirements[name] = version.empty() || version == "*" ? "[*]" : version;
    if (requirements.empty()) return nullopt;

    string content = "[requires]\n";
    for (auto &[name, version] : requirements)
        content += name + "/" + version + "\n";
    content += "\n[generators]\nCMakeDeps\nCMakeToolchain\nPkgConfigDeps\n";
    return dependency_manifest{package_manager::CONAN, {{"conanfile.txt", content}}, content, {"build", ".conan2"}};
}

static optional<dependency_manifest> detect_maven(const project &proj) {
    if (auto pom = proj.find("pom.xml"))
        return dependency_manifest{package_manager::MAVEN, {}, pom->content, {"lib"}};
    if (proj.dependencies.empty()) return nullopt;

    string dependencies;
    for (auto &[name, version] : proj.dependencies) {
        vector<string> coordinate;
        ba::split(coordinate, name, ba::is_any_of(":"));
        if (coordinate.size() != 2 || coordinate[0].empty() || coordinate[1].empty())
            throw validation_error("java dependency must be named groupId:artifactId: " + name);
        dependencies += fmt::format(
            "    <dependency>\n"
            "      <groupId>{}</groupId>\n"
            "      <artifactId>{}</artifactId>\n"
            "      <version>{}</version>\n"
            "    </dependency>\n",
            coordinate[0], coordinate[1], version.empty() || version == "*" ? "LATEST" : version);
    }
    string content = fmt::format(
        "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
        "<project xmlns=\"http://maven.apache.org/POM/4.0.0\">\n"
        "  <modelVersion>4.0.0</modelVersion>\n"
        "  <groupId>project</groupId>\n"
        "  <artifactId>project</artifactId>\n"
        "  <version>1.0.0</version>\n"
        "  <dependencies>\n"
        "{}"
        "  </dependencies>\n"
        "</project>\n",
        dependencies);
    return dependency_manifest{package_manager::MAVEN, {{"pom.xml", content}}, content, {"lib"}};
}

optional<dependency_manifest> detect_manifest(const language_profile &profile, const project &proj) {
    switch (profile.manager) {
        case package_manager::NPM:
            return detect_npm(proj);
        case package_manager::PIP:
            return detect_pip(proj);
        case package_manager::CONAN:
            return detect_conan(proj);
        case package_manager::MAVEN:
            return detect_maven(proj);
        default:
            if (!proj.dependencies.empty())
                LOG(WARNING) << "Ignoring " << proj.dependencies.size() << " dependencies for " << profile.name;
            return nullopt;
    }
}

string cache_key(const language_profile &profile, const dependency_manifest &manifest) {
    return profile.name + "-" + md5_hex(string(get_display_message(manifest.manager)) + "\n" + manifest.identity);
}

dependency_install_error::failure_kind classify_install_log(const string &log) {
    static const vector<string> network_markers = {
        "eai_again", "getaddrinfo", "enotfound", "etimedout", "econnrefused", "econnreset",
        "could not resolve host", "temporary failure in name resolution", "name or service not known",
        "network is unreachable", "connection timed out", "read timed out", "failed to establish a new connection",
        "unknownhostexception", "connection refused"};
    static const vector<string> resolution_markers = {
        "e404", "404 not found", "etarget", "no matching version", "could not find a version",
        "no matching distribution", "could not resolve dependencies", "unable to find package",
        "not found in remote", "package not found", "eresolve", "version conflict", "conflict caused by"};

    string text = ba::to_lower_copy(log);
    for (auto &marker : network_markers)
        if (text.find(marker) != string::npos)
            return dependency_install_error::failure_kind::NETWORK;
    for (auto &marker : resolution_markers)
        if (text.find(marker) != string::npos)
            return dependency_install_error::failure_kind::RESOLUTION;
    return dependency_install_error::failure_kind::GENERIC;
}

string log_excerpt(const string &log, size_t limit) {
    return log.size() > limit ? log.substr(log.size() - limit) : log;
}

string install_command(const language_profile &profile, const dependency_manifest &manifest) {
    switch (manifest.manager) {
        case package_manager::NPM:
            return "npm install --legacy-peer-deps --no-audit --no-fund";
        case package_manager::PIP:
            return "PYTHONUSERBASE=\"$PWD/.pyuser\" pip install --user --no-warn-script-location -r requirements.txt";
        case package_manager::CONAN:
            return "export CONAN_HOME=\"$PWD/.conan2\"; "
                   "conan profile detect --force >/dev/null 2>&1; "
                   "conan install . --output-folder=build --build=missing";
        case package_manager::MAVEN:
            return "mvn -B -q -Dmaven.repo.local=\"$PWD/.m2\" dependency:copy-dependencies -DoutputDirectory=lib";
        default:
            throw internal_error("no package manager for " + profile.name);
    }
}

dependency_installer::dependency_installer(docker::engine &docker, const configuration &config)
    : docker(docker), config(config) {}

chrono::seconds dependency_installer::install_timeout(package_manager manager) const {
    switch (manager) {
        case package_manager::NPM:
            return config.timeouts.npm;
        case package_manager::PIP:
            return config.timeouts.pip;
        case package_manager::MAVEN:
            return config.timeouts.maven;
        case package_manager::CONAN:
            return config.timeouts.conan;
        default:
            return config.timeouts.helper;
    }
}

shared_ptr<timed_mutex> dependency_installer::key_lock(const string &key) {
    lock_guard<mutex> guard(locks_mutex);
    for (auto it = locks.begin(); it != locks.end();) {
        if (it->second.expired() && it->first != key)
            it = locks.erase(it);
        else
            ++it;
    }
    auto lock = locks[key].lock();
    if (!lock) {
        lock = make_shared<timed_mutex>();
        locks[key] = lock;
    }
    return lock;
}

unique_lock<timed_mutex> dependency_installer::acquire_key(timed_mutex &lock, const string &key,
                                                           chrono::milliseconds timeout,
                                                           const function<bool()> &cancelled) {
    static constexpr chrono::milliseconds slice(100);

    unique_lock<timed_mutex> guard(lock, defer_lock);
    auto deadline = chrono::steady_clock::now() + timeout;
    bool logged = false;
    while (!guard.try_lock_for(slice)) {
        if (cancelled && cancelled())
            throw operation_cancelled("waiting for dependency cache " + key + " cancelled");
        if (chrono::steady_clock::now() >= deadline)
            throw timeout_error(fmt::format("waited {}s for another install of dependency cache {}",
                                            chrono::duration_cast<chrono::seconds>(timeout).count(), key));
        if (!logged) {
            LOG(INFO) << "Waiting for another install of dependency cache " << key;
            logged = true;
        }
    }
    return guard;
}

docker::exec_options dependency_installer::sandbox_exec(const string &command) const {
    docker::exec_options options;
    options.cmd = {"sh", "-c", command};
    options.user = fmt::format("{}:{}", config.container.uid, config.container.gid);
    options.working_dir = config.container.workspace_root;
    options.env = {"HOME=" + config.container.workspace_root};
    return options;
}

bool dependency_installer::restore_cache(const container_handle &handle, const string &key,
                                         const function<bool()> &cancelled) {
    string dir = shell_quote(config.container.cache_root + "/cache/" + key);
    // 0: 命中并已复制，3: 未命中
    string script = fmt::format(
        "if [ -f {0}/.cache-complete ]; then cp -a {0}/. . && rm -f .cache-complete && exit 0; exit 1; fi; exit 3",
        dir);
    try {
        auto result = docker::run_to_completion(docker, handle.id, sandbox_exec(script), config.timeouts.helper, cancelled);
        if (result.exit_code == 0) return true;
        if (result.exit_code != 3)
            LOG(WARNING) << "Unable to restore dependency cache " << key << ": " << log_excerpt(result.combined);
    } catch (const timeout_error &ex) {
        LOG(WARNING) << "Restoring dependency cache " << key << " timed out: " << ex.what();
    }
    return false;
}

void dependency_installer::populate_cache(const container_handle &handle, const string &key,
                                          const dependency_manifest &manifest, const function<bool()> &cancelled) {
    string dir = shell_quote(config.container.cache_root + "/cache/" + key);
    string tmp = shell_quote(config.container.cache_root + "/cache/.tmp-" + key + "-" + random_token());
    vector<string> artifacts;
    for (auto &artifact : manifest.artifacts)
        artifacts.push_back(shell_quote(artifact));

    // 缓存只写一次，已经存在时放弃本次结果
    string script = fmt::format(
        "mkdir -p {1} && for a in {2}; do if [ -e \"$a\" ]; then cp -a \"$a\" {1}/ || exit 1; fi; done && "
        "touch {1}/.cache-complete && "
        "if [ -e {0} ]; then rm -rf {1}; else mv {1} {0} || rm -rf {1}; fi",
        dir, tmp, ba::join(artifacts, " "));
    try {
        auto result = docker::run_to_completion(docker, handle.id, sandbox_exec(script), install_timeout(manifest.manager), cancelled);
        if (result.exit_code != 0)
            LOG(WARNING) << "Unable to populate dependency cache " << key << ": " << log_excerpt(result.combined);
        else
            LOG(INFO) << "Populated dependency cache " << key;
    } catch (const timeout_error &ex) {
        LOG(WARNING) << "Populating dependency cache " << key << " timed out: " << ex.what();
    }
}

install_result dependency_installer::install(const container_handle &handle, const language_profile &profile,
                                             const dependency_manifest &manifest, const function<bool()> &cancelled) {
    string key = cache_key(profile, manifest);
    auto timeout = install_timeout(manifest.manager);
    auto lock = key_lock(key);
    auto guard = acquire_key(*lock, key, timeout, cancelled);

    bool use_cache = config.container.mount_dependency_cache;
    if (use_cache && restore_cache(handle, key, cancelled)) {
        LOG(INFO) << "Dependency cache hit " << key << " for " << handle.name;
        return {true, ""};
    }

    string command = install_command(profile, manifest);
    const char *manager = get_display_message(manifest.manager);
    LOG(INFO) << "Installing " << manager << " dependencies in " << handle.name << " (cache key " << key << ")";

    elapsed_time timer;
    auto result = retry(config.retry.install, fmt::format("{} install in {}", manager, handle.name), [&] {
        auto r = docker::run_to_completion(docker, handle.id, sandbox_exec(command), timeout, cancelled);
        if (r.exit_code != 0) {
            auto kind = classify_install_log(r.combined);
            throw dependency_install_error(kind,
                                           fmt::format("{} install failed with exit code {} ({} error)",
                                                       manager, r.exit_code, get_display_message(kind)),
                                           log_excerpt(r.combined));
        }
        return r;
    }, [](const runner_exception &ex) {
        auto err = dynamic_cast<const dependency_install_error *>(&ex);
        return err && err->failure == dependency_install_error::failure_kind::NETWORK;
    });
    LOG(INFO) << "Installed " << manager << " dependencies in " << handle.name << " in "
              << timer.duration<chrono::milliseconds>().count() << "ms";

    if (use_cache)
        populate_cache(handle, key, manifest, cancelled);
    return {false, result.combined};
}

}  // namespace runner::sandbox
