#include "test/fake_engine.hpp"
#include <thread>
#include "docker/stream.hpp"
#include "docker/tar.hpp"

namespace runner::test {
using namespace std;

scripted_exec stdout_exec(const string &data, int exit_code) {
    scripted_exec result;
    result.chunks.push_back(docker::encode_frame(docker::stream_type::STDOUT, data));
    result.exit_code = exit_code;
    return result;
}

struct fake_exec_stream : public docker::exec_stream {
    explicit fake_exec_stream(scripted_exec script) : script(move(script)) {
        for (auto &chunk : this->script.chunks) pending.push_back(chunk);
    }

    docker::read_status read(string &chunk, chrono::milliseconds timeout) override {
        unique_lock<mutex> lock(mut);
        auto ready = [this] { return closed || !pending.empty() || finished(); };
        if (!cond.wait_for(lock, timeout, ready)) return docker::read_status::TIMEOUT;
        if (closed) return docker::read_status::END;
        if (!pending.empty()) {
            chunk = move(pending.front());
            pending.pop_front();
            return docker::read_status::DATA;
        }
        return docker::read_status::END;
    }

    void write(const string &data) override {
        lock_guard<mutex> guard(mut);
        if (closed || input_closed) throw stream_error("stdin is closed");
        if (script.echo_inputs > 0 || script.until_eof) {
            pending.push_back(docker::encode_frame(docker::stream_type::STDOUT, data));
            ++inputs;
        }
        cond.notify_all();
    }

    void close_input() override {
        lock_guard<mutex> guard(mut);
        input_closed = true;
        cond.notify_all();
    }

    void close() override {
        lock_guard<mutex> guard(mut);
        closed = true;
        cond.notify_all();
    }

    int exit_code() override {
        return script.exit_code;
    }

private:
    scripted_exec script;
    mutex mut;
    condition_variable cond;
    deque<string> pending;
    size_t inputs = 0;
    bool closed = false, input_closed = false;

    bool finished() const {
        if (script.hang) return false;
        if (script.until_eof) return input_closed;
        if (script.echo_inputs > 0) return inputs >= script.echo_inputs;
        return true;
    }
};

fake_engine::fake_engine() : handler([](const string &command, const docker::exec_options &) { return default_exec(command); }) {}

scripted_exec fake_engine::default_exec(const string &command) {
    scripted_exec result;
    if (command.find(".cache-complete ]") != string::npos) result.exit_code = 3;
    return result;
}

void fake_engine::set_handler(exec_handler handler) {
    lock_guard<mutex> guard(mut);
    this->handler = move(handler);
}

void fake_engine::fail_creates(long status, int n) {
    lock_guard<mutex> guard(mut);
    create_failure = status;
    create_failures = n;
}

void fake_engine::fail_starts(long status, int n) {
    lock_guard<mutex> guard(mut);
    start_failure = status;
    start_failures = n;
}

bool fake_engine::ping() {
    if (!reachable) throw network_error("connection refused");
    return true;
}

map<string, fake_engine::container>::iterator fake_engine::locate(const string &id_or_name) {
    auto it = containers.find(id_or_name);
    if (it != containers.end()) return it;
    for (it = containers.begin(); it != containers.end(); ++it)
        if (it->second.spec.name == id_or_name) return it;
    return containers.end();
}

string fake_engine::create_container(const docker::container_spec &spec) {
    lock_guard<mutex> guard(mut);
    if (!reachable) throw network_error("connection refused");
    if (create_failures > 0) {
        --create_failures;
        throw engine_error(create_failure, "injected create failure");
    }
    for (auto &[id, c] : containers)
        if (c.spec.name == spec.name) throw engine_error(409, "name " + spec.name + " is already in use");
    string id = "fake" + to_string(++next_id) + string(12, '0');
    containers[id] = {spec, false, {}, {}};
    created_specs.push_back(spec);
    peak = max(peak, containers.size());
    return id;
}

void fake_engine::start_container(const string &id) {
    lock_guard<mutex> guard(mut);
    if (start_failures > 0) {
        --start_failures;
        throw engine_error(start_failure, "injected start failure");
    }
    auto it = locate(id);
    if (it == containers.end()) throw engine_error(404, "no such container " + id);
    if (it->second.running) throw engine_error(304, "container already started");
    it->second.running = true;
}

void fake_engine::stop_container(const string &id, int) {
    lock_guard<mutex> guard(mut);
    auto it = locate(id);
    if (it == containers.end()) throw engine_error(404, "no such container " + id);
    if (!it->second.running) throw engine_error(304, "container already stopped");
    it->second.running = false;
}

void fake_engine::remove_container(const string &id, bool force) {
    lock_guard<mutex> guard(mut);
    auto it = locate(id);
    if (it == containers.end()) throw engine_error(404, "no such container " + id);
    if (it->second.running && !force) throw engine_error(409, "container is running");
    containers.erase(it);
}

vector<docker::container_info> fake_engine::list_containers(const string &label) {
    lock_guard<mutex> guard(mut);
    vector<docker::container_info> result;
    for (auto &[id, c] : containers)
        if (c.spec.labels.count(label))
            result.push_back({id, c.spec.name, c.running ? "running" : "exited", c.spec.labels});
    return result;
}

void fake_engine::put_archive(const string &id, const string &path, const string &archive) {
    auto entries = docker::read_tar(archive);
    lock_guard<mutex> guard(mut);
    auto it = locate(id);
    if (it == containers.end()) throw engine_error(404, "no such container " + id);
    string base = path == "/" ? "" : path;
    for (auto &entry : entries) {
        string full = base + "/" + entry.path;
        if (entry.directory) {
            it->second.directories.insert(full);
        } else {
            it->second.files[full] = entry.content;
            archive_files[full] = entry.content;
        }
    }
}

unique_ptr<docker::exec_stream> fake_engine::exec(const string &id, const docker::exec_options &options) {
    exec_handler h;
    string command = options.cmd.empty() ? "" : options.cmd.back();
    {
        lock_guard<mutex> guard(mut);
        auto it = locate(id);
        if (it == containers.end()) throw engine_error(404, "no such container " + id);
        if (!it->second.running) throw engine_error(409, "container " + id + " is not running");
        executed.push_back(command);
        h = handler;
    }
    return make_unique<fake_exec_stream>(h(command, options));
}

size_t fake_engine::live() const {
    lock_guard<mutex> guard(mut);
    return containers.size();
}

size_t fake_engine::max_live() const {
    lock_guard<mutex> guard(mut);
    return peak;
}

size_t fake_engine::created() const {
    lock_guard<mutex> guard(mut);
    return created_specs.size();
}

string fake_engine::file(const string &path) const {
    lock_guard<mutex> guard(mut);
    auto it = archive_files.find(path);
    return it == archive_files.end() ? "" : it->second;
}

bool fake_engine::has_file(const string &path) const {
    lock_guard<mutex> guard(mut);
    return archive_files.count(path) > 0;
}

vector<string> fake_engine::commands() const {
    lock_guard<mutex> guard(mut);
    return executed;
}

vector<docker::container_spec> fake_engine::specs() const {
    lock_guard<mutex> guard(mut);
    return created_specs;
}

}  // namespace runner::test
