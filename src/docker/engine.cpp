#include "docker/engine.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include "common/defer.hpp"
#include "docker/stream.hpp"

namespace runner::docker {
using namespace std;
using namespace nlohmann;

exec_stream::~exec_stream() = default;

engine::~engine() = default;

void to_json(json &j, const container_spec &spec) {
    json host_config = {
        {"Memory", spec.memory_bytes},
        {"MemorySwap", spec.memory_bytes},  // 禁止使用 swap
        {"NanoCpus", spec.nano_cpus},
        {"PidsLimit", spec.pids_limit},
        {"NetworkMode", spec.network_mode},
        {"Binds", spec.binds},
        {"Tmpfs", spec.tmpfs},
        {"SecurityOpt", json::array({"no-new-privileges"})},
        {"AutoRemove", false}};
    if (!spec.dns.empty())
        host_config["Dns"] = spec.dns;

    j = {{"Image", spec.image},
         {"Cmd", spec.cmd},
         {"Env", spec.env},
         {"Labels", spec.labels},
         {"Tty", false},
         {"OpenStdin", false},
         {"AttachStdout", false},
         {"AttachStderr", false},
         {"HostConfig", host_config}};
}

void to_json(json &j, const exec_options &options) {
    j = {{"Cmd", options.cmd},
         {"AttachStdin", options.attach_stdin},
         {"AttachStdout", true},
         {"AttachStderr", true},
         {"Tty", false}};
    if (!options.user.empty())
        j["User"] = options.user;
    if (!options.working_dir.empty())
        j["WorkingDir"] = options.working_dir;
    if (!options.env.empty())
        j["Env"] = options.env;
}

bool is_transient(const runner_exception &ex) {
    if (dynamic_cast<const network_error *>(&ex))
        return true;
    if (auto err = dynamic_cast<const engine_error *>(&ex))
        return err->status == 409 || err->status >= 500;
    return false;
}

exec_result run_to_completion(engine &docker, const string &id, const exec_options &options,
                              chrono::milliseconds timeout, const function<bool()> &cancelled) {
    static constexpr chrono::milliseconds slice(200);

    auto stream = docker.exec(id, options);
    defer { stream->close(); };

    exec_result result;
    frame_demuxer demuxer;
    auto deadline = chrono::steady_clock::now() + timeout;
    while (true) {
        if (cancelled && cancelled())
            throw operation_cancelled("execution cancelled");
        auto now = chrono::steady_clock::now();
        if (now >= deadline)
            throw timeout_error(fmt::format("command did not finish within {}s",
                                            chrono::duration_cast<chrono::seconds>(timeout).count()));

        string chunk;
        auto remaining = chrono::duration_cast<chrono::milliseconds>(deadline - now);
        auto status = stream->read(chunk, min(slice, remaining));
        if (status == read_status::END) break;
        if (status == read_status::TIMEOUT) continue;

        for (auto &f : demuxer.feed(chunk)) {
            if (f.type == stream_type::STDOUT)
                result.out += f.payload;
            else
                result.err += f.payload;
            result.combined += f.payload;
        }
    }
    demuxer.finish();
    result.exit_code = stream->exit_code();
    DLOG(INFO) << "exec in " << id << " exited with " << result.exit_code;
    return result;
}

}  // namespace runner::docker
