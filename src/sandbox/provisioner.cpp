#include "sandbox/provisioner.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/algorithm/string.hpp>
#include "common/retry.hpp"

namespace runner::sandbox {
using namespace std;

provisioner::provisioner(docker::engine &docker, const configuration &config)
    : docker(docker), config(config) {}

string provisioner::container_name(const string &session_id) const {
    return config.container.name_prefix + session_id;
}

docker::container_spec provisioner::make_spec(const language_profile &profile, const string &session_id,
                                              bool needs_network) const {
    const auto &container = config.container;
    docker::container_spec spec;
    spec.name = container_name(session_id);
    spec.image = profile.image;
    spec.cmd = {"sh", "-c", "while true; do sleep 1; done"};
    spec.labels = {{container.label, session_id},
                   {container.label + ".language", profile.name}};
    spec.memory_bytes = container.memory_bytes;
    spec.nano_cpus = container.nano_cpus;
    spec.pids_limit = container.pids_limit;
    spec.tmpfs = {{"/tmp", container.tmpfs_options}};
    if (needs_network) {
        spec.network_mode = "bridge";
        spec.dns = container.dns;
    } else {
        spec.network_mode = "none";
    }
    if (container.mount_dependency_cache) {
        string volume = boost::algorithm::replace_all_copy(container.cache_volume, "{}", profile.name);
        spec.binds.push_back(volume + ":" + container.cache_root + ":rw");
    }
    return spec;
}

void provisioner::remove_existing(const string &name) {
    try {
        docker.remove_container(name, true);
        LOG(INFO) << "Removed existing container " << name;
    } catch (const engine_error &ex) {
        if (ex.status != 404)
            LOG(WARNING) << "Unable to remove existing container " << name << ": " << ex.what();
    }
}

container_handle provisioner::provision(const language_profile &profile, const string &session_id,
                                        bool needs_network, const function<bool()> &cancelled) {
    container_handle handle{"", container_name(session_id), session_id, profile.name};
    auto spec = make_spec(profile, session_id, needs_network);
    LOG(INFO) << "Provisioning container " << handle.name << " from image " << spec.image
              << (needs_network ? " with network access" : "");

    auto check_cancelled = [&] {
        if (cancelled && cancelled())
            throw operation_cancelled("provisioning of " + handle.name + " cancelled");
    };

    try {
        handle.id = retry(config.retry.engine, "create container " + handle.name, [&] {
            check_cancelled();
            // 每次创建之前都删除同名容器，409 重试时旧容器可能仍在删除中
            remove_existing(handle.name);
            return docker.create_container(spec);
        }, docker::is_transient);
    } catch (const engine_error &ex) {
        if (ex.status == 404)
            throw provision_error(fmt::format("image {} not found", spec.image));
        throw provision_error(fmt::format("unable to create container {}: {}", handle.name, ex.what()));
    } catch (const network_error &ex) {
        throw provision_error(fmt::format("container engine unreachable: {}", ex.what()));
    }

    try {
        check_cancelled();
        retry(config.retry.engine, "start container " + handle.name, [&] {
            check_cancelled();
            docker.start_container(handle.id);
        }, docker::is_transient);
    } catch (const operation_cancelled &) {
        teardown(handle);
        throw;
    } catch (const runner_exception &ex) {
        teardown(handle);
        throw provision_error(fmt::format("unable to start container {}: {}", handle.name, ex.what()));
    }

    // 依赖缓存卷默认属于 root，交给沙箱用户
    if (config.container.mount_dependency_cache) {
        docker::exec_options options;
        options.user = "0:0";
        options.cmd = {"sh", "-c", fmt::format("mkdir -p {0}/cache && chown {1}:{2} {0} {0}/cache",
                                               config.container.cache_root,
                                               config.container.uid, config.container.gid)};
        try {
            auto result = docker::run_to_completion(docker, handle.id, options,
                                                    config.timeouts.helper, cancelled);
            if (result.exit_code != 0)
                LOG(WARNING) << "Unable to prepare dependency cache in " << handle.name << ": " << result.combined;
        } catch (const operation_cancelled &) {
            teardown(handle);
            throw;
        } catch (const runner_exception &ex) {
            LOG(WARNING) << "Unable to prepare dependency cache in " << handle.name << ": " << ex.what();
        }
    }

    LOG(INFO) << "Container " << handle.name << " (" << handle.id.substr(0, 12) << ") started";
    return handle;
}

bool provisioner::teardown(const container_handle &handle) noexcept {
    try {
        try {
            docker.stop_container(handle.id, (int)config.timeouts.stop.count());
        } catch (const engine_error &ex) {
            // 304: 已经停止，404: 已经不存在，都可以继续删除
            if (ex.status != 304 && ex.status != 404)
                LOG(WARNING) << "Unable to stop container " << handle.name << ": " << ex.what();
        }

        retry(config.retry.engine, "remove container " + handle.name, [&] {
            try {
                docker.remove_container(handle.id, true);
            } catch (const engine_error &ex) {
                if (ex.status != 404) throw;
            }
        }, docker::is_transient);

        LOG(INFO) << "Container " << handle.name << " removed";
        return true;
    } catch (const std::exception &ex) {
        LOG(ERROR) << cleanup_error(fmt::format("unable to remove container {}: {}", handle.name, ex.what())).what();
        return false;
    }
}

size_t provisioner::prune_stale() {
    size_t count = 0;
    for (auto &container : docker.list_containers(config.container.label)) {
        try {
            docker.remove_container(container.id, true);
            ++count;
            LOG(INFO) << "Pruned stale container " << container.name;
        } catch (const engine_error &ex) {
            if (ex.status != 404)
                LOG(WARNING) << "Unable to prune container " << container.name << ": " << ex.what();
        }
    }
    return count;
}

}  // namespace runner::sandbox
