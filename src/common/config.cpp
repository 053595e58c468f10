#include "common/config.hpp"

namespace runner {
using namespace std;
using namespace nlohmann;

void from_json(const json &j, container_config &config) {
    if (j.count("name_prefix"))
        j.at("name_prefix").get_to(config.name_prefix);
    if (j.count("label"))
        j.at("label").get_to(config.label);
    if (j.count("workspace_root"))
        j.at("workspace_root").get_to(config.workspace_root);
    if (j.count("staging_root"))
        j.at("staging_root").get_to(config.staging_root);
    if (j.count("cache_root"))
        j.at("cache_root").get_to(config.cache_root);
    if (j.count("cache_volume"))
        j.at("cache_volume").get_to(config.cache_volume);
    if (j.count("mount_dependency_cache"))
        j.at("mount_dependency_cache").get_to(config.mount_dependency_cache);
    if (j.count("uid"))
        j.at("uid").get_to(config.uid);
    if (j.count("gid"))
        j.at("gid").get_to(config.gid);
    if (j.count("memory_bytes"))
        j.at("memory_bytes").get_to(config.memory_bytes);
    if (j.count("nano_cpus"))
        j.at("nano_cpus").get_to(config.nano_cpus);
    if (j.count("pids_limit"))
        j.at("pids_limit").get_to(config.pids_limit);
    if (j.count("tmpfs_options"))
        j.at("tmpfs_options").get_to(config.tmpfs_options);
    if (j.count("dns"))
        j.at("dns").get_to(config.dns);
}

static void get_seconds(const json &j, const char *key, chrono::seconds &value) {
    if (j.count(key))
        value = chrono::seconds(j.at(key).get<long long>());
}

void from_json(const json &j, timeout_config &config) {
    get_seconds(j, "execution", config.execution);
    get_seconds(j, "npm", config.npm);
    get_seconds(j, "pip", config.pip);
    get_seconds(j, "maven", config.maven);
    get_seconds(j, "conan", config.conan);
    get_seconds(j, "helper", config.helper);
    get_seconds(j, "stop", config.stop);
    get_seconds(j, "heartbeat", config.heartbeat);
    if (j.count("grace_ms"))
        config.grace = chrono::milliseconds(j.at("grace_ms").get<long long>());
}

void from_json(const json &j, retry_policy &policy) {
    if (j.count("attempts"))
        j.at("attempts").get_to(policy.attempts);
    if (j.count("interval_ms"))
        policy.interval = chrono::milliseconds(j.at("interval_ms").get<long long>());
    if (j.count("backoff"))
        j.at("backoff").get_to(policy.backoff);
    if (policy.attempts < 1)
        throw invalid_argument("retry attempts must be at least 1");
}

void from_json(const json &j, retry_config &config) {
    if (j.count("engine"))
        j.at("engine").get_to(config.engine);
    if (j.count("install"))
        j.at("install").get_to(config.install);
}

void from_json(const json &j, server_config &config) {
    if (j.count("address"))
        j.at("address").get_to(config.address);
    if (j.count("port"))
        j.at("port").get_to(config.port);
    if (j.count("allowed_origins"))
        j.at("allowed_origins").get_to(config.allowed_origins);
    if (j.count("max_body_bytes"))
        j.at("max_body_bytes").get_to(config.max_body_bytes);
}

void from_json(const json &j, configuration &config) {
    if (j.count("container"))
        j.at("container").get_to(config.container);
    if (j.count("timeouts"))
        j.at("timeouts").get_to(config.timeouts);
    if (j.count("retry"))
        j.at("retry").get_to(config.retry);
    if (j.count("server"))
        j.at("server").get_to(config.server);
    if (j.count("images"))
        j.at("images").get_to(config.images);
    if (j.count("max_pending_output"))
        j.at("max_pending_output").get_to(config.max_pending_output);
}

}  // namespace runner
