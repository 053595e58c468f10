#include "sandbox/workspace.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <set>
#include "common/retry.hpp"
#include "docker/tar.hpp"

namespace runner::sandbox {
using namespace std;

workspace_builder::workspace_builder(docker::engine &docker, const configuration &config)
    : docker(docker), config(config) {}

string workspace_builder::build_archive(const string &root, const vector<project_file> &files) const {
    docker::tar_writer writer(config.container.uid, config.container.gid);
    // 归档从 / 解压，所以路径不带开头的斜杠
    string base = root;
    while (!base.empty() && base.front() == '/') base.erase(0, 1);
    while (!base.empty() && base.back() == '/') base.pop_back();

    set<string> directories;
    auto add_directory = [&](const string &dir) {
        if (!dir.empty() && directories.insert(dir).second)
            writer.add_directory(dir);
    };

    for (size_t pos = base.find('/'); pos != string::npos; pos = base.find('/', pos + 1))
        add_directory(base.substr(0, pos));
    add_directory(base);

    for (auto &file : files) {
        string path = base.empty() ? file.path : base + "/" + file.path;
        for (size_t pos = path.find('/', base.size() + 1); pos != string::npos; pos = path.find('/', pos + 1))
            add_directory(path.substr(0, pos));
        writer.add_file(path, file.content);
    }
    return writer.finish();
}

void workspace_builder::upload(const container_handle &handle, const string &root, const vector<project_file> &files) {
    string archive = build_archive(root, files);
    try {
        retry(config.retry.engine, "upload archive to " + handle.name, [&] {
            docker.put_archive(handle.id, "/", archive);
        }, docker::is_transient);
    } catch (const runner_exception &ex) {
        throw workspace_write_error(fmt::format("unable to write {} file(s) to {}:{}: {}",
                                                files.size(), handle.name, root, ex.what()));
    }
}

void workspace_builder::materialize(const container_handle &handle, const vector<project_file> &files) {
    upload(handle, config.container.workspace_root, files);
    LOG(INFO) << "Wrote " << files.size() << " file(s) to " << handle.name << ":" << config.container.workspace_root;
}

void workspace_builder::stage_libraries(const container_handle &handle, const vector<library_blob> &libraries) {
    vector<project_file> files;
    for (auto &library : libraries)
        files.push_back({library.file_name, library.content});
    upload(handle, config.container.staging_root, files);
    LOG(INFO) << "Staged " << libraries.size() << " custom librar" << (libraries.size() == 1 ? "y" : "ies")
              << " in " << handle.name;
}

docker::exec_options workspace_builder::sandbox_exec(const string &command) const {
    docker::exec_options options;
    options.cmd = {"sh", "-c", command};
    options.user = fmt::format("{}:{}", config.container.uid, config.container.gid);
    options.working_dir = config.container.workspace_root;
    options.env = {"HOME=" + config.container.workspace_root};
    return options;
}

void workspace_builder::merge_libraries(const container_handle &handle, const language_profile &profile,
                                        const vector<library_blob> &libraries, const function<bool()> &cancelled) {
    string script = merge_script(profile, libraries, config.container.staging_root);
    auto result = docker::run_to_completion(docker, handle.id, sandbox_exec(script),
                                            config.timeouts.helper, cancelled);
    if (result.exit_code != 0) {
        string log = result.combined.size() > 1000 ? result.combined.substr(result.combined.size() - 1000) : result.combined;
        throw workspace_write_error(fmt::format("merging custom libraries failed with exit code {}: {}",
                                                result.exit_code, log));
    }
    DLOG(INFO) << "Merged custom libraries in " << handle.name << ": " << result.combined;
}

}  // namespace runner::sandbox
