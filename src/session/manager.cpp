#include "session/manager.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/exception/diagnostic_information.hpp>
#include <algorithm>
#include <system_error>
#include <thread>
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "common/retry.hpp"
#include "common/utils.hpp"
#include "docker/stream.hpp"
#include "language/command.hpp"

namespace runner::session {
using namespace std;

session_manager::session_manager(docker::engine &docker, sandbox::library_store *libraries,
                                 const language_table &languages, const configuration &config)
    : docker(docker),
      libraries(libraries),
      languages(languages),
      config(config),
      provisioner(docker, config),
      workspace(docker, config),
      installer(docker, config) {}

session_manager::~session_manager() {
    shutdown(config.timeouts.helper);
}

shared_ptr<execution_session> session_manager::start(const string &session_id, const string &language, project proj) {
    if (!valid_session_id(session_id))
        throw validation_error("invalid session id: " + session_id);
    const language_profile &profile = languages.at(language);
    if (proj.entry_file.empty() || !proj.find(proj.entry_file))
        throw validation_error("entry file " + proj.entry_file + " is not part of the project");
    auto manifest = sandbox::detect_manifest(profile, proj);

    auto session = make_shared<execution_session>(session_id, profile.name, config.container.workspace_root,
                                                  config.max_pending_output);
    {
        lock_guard<mutex> guard(active_mutex);
        if (shutting_down) throw internal_error("service is shutting down");
        ++active_pipelines;
    }

    auto previous = sessions.insert_or_replace(session);
    if (previous) {
        LOG(INFO) << "Session " << session_id << " is restarted, stopping the previous run";
        previous->cancel();
    }

    try {
        thread(&session_manager::run_pipeline, this, session, previous, cref(profile), move(proj), move(manifest)).detach();
    } catch (const system_error &ex) {
        sessions.erase_if_same(session);
        release_pipeline();
        throw internal_error(string("unable to start session pipeline: ") + ex.what());
    }

    LOG(INFO) << "Session " << session_id << " started (" << profile.name << ")";
    return session;
}

void session_manager::supersede(execution_session &previous) {
    if (previous.transition(session_state::STOPPED))
        previous.output.finish_end(nullopt);
    previous.input.close();
    if (!previous.wait_finished(config.timeouts.helper))
        LOG(WARNING) << "Previous run of session " << previous.id << " did not exit in time";
    if (auto handle = previous.take_container())
        provisioner.teardown(*handle);
}

void session_manager::run_pipeline(shared_ptr<execution_session> session, shared_ptr<execution_session> previous,
                                   const language_profile &profile, project proj,
                                   optional<sandbox::dependency_manifest> manifest) {
    auto cancelled = [session] { return session->cancelled(); };
    elapsed_time timer;

    try {
        // 同一个 id 至多只有一个容器，旧容器删除之后才创建新容器
        if (previous) supersede(*previous);
        previous.reset();

        auto handle = provisioner.provision(profile, session->id, manifest.has_value(), cancelled);
        session->set_container(handle);
        if (session->cancelled()) throw operation_cancelled("session " + session->id + " stopped");

        if (!session->transition(session_state::WORKSPACE))
            throw operation_cancelled("session " + session->id + " stopped");
        vector<project_file> files = proj.files;
        if (manifest) {
            for (auto &generated : manifest->generated) {
                auto it = find_if(files.begin(), files.end(), [&](const project_file &f) { return f.path == generated.path; });
                if (it != files.end())
                    it->content = generated.content;
                else
                    files.push_back(generated);
            }
        }
        workspace.materialize(handle, files);

        vector<sandbox::library_blob> libs;
        if (!proj.libraries.empty()) {
            if (libraries)
                libs = sandbox::resolve_libraries(*libraries, profile, proj);
            else
                LOG(WARNING) << "No library store configured, ignoring " << proj.libraries.size()
                             << " custom libraries of session " << session->id;
        }
        if (!libs.empty()) workspace.stage_libraries(handle, libs);

        if (manifest) {
            if (!session->transition(session_state::INSTALLING))
                throw operation_cancelled("session " + session->id + " stopped");
            installer.install(handle, profile, *manifest, cancelled);
        }
        if (!libs.empty()) workspace.merge_libraries(handle, profile, libs, cancelled);

        if (!session->transition(session_state::RUNNING))
            throw operation_cancelled("session " + session->id + " stopped");
        auto exit_code = execute(*session, handle, profile, proj, libs);

        if (session->transition(session_state::COMPLETED)) {
            session->output.finish_end(exit_code);
            LOG(INFO) << "Session " << session->id << " completed with exit code "
                      << (exit_code ? to_string(*exit_code) : "unknown") << " in "
                      << timer.duration<chrono::milliseconds>().count() << "ms";
        }
    } catch (const operation_cancelled &ex) {
        DLOG(INFO) << "Session " << session->id << " cancelled: " << ex.what();
    } catch (const runner_exception &ex) {
        if (session->transition(session_state::FAILED)) {
            LOG(WARNING) << "Session " << session->id << " failed (" << ex.kind() << "): " << ex.what();
            string message = ex.what();
            auto install_error = dynamic_cast<const dependency_install_error *>(&ex);
            if (install_error && !install_error->log_excerpt.empty() && message.size() + 1 < 1000)
                message += "\n" + sandbox::log_excerpt(install_error->log_excerpt, 1000 - message.size() - 1);
            session->output.finish_error(message);
        } else {
            DLOG(INFO) << "Session " << session->id << " stopped while " << ex.what();
        }
    } catch (const std::exception &ex) {
        LOG(ERROR) << "Session " << session->id << " crashed: " << boost::diagnostic_information(ex);
        if (session->transition(session_state::FAILED))
            session->output.finish_error(string("internal error: ") + ex.what());
    }

    session->input.close();
    if (session->state() != session_state::STOPPED)
        session->wait_grace(config.timeouts.grace);
    if (auto handle = session->take_container())
        provisioner.teardown(*handle);
    sessions.erase_if_same(session);
    session->mark_finished();
    release_pipeline();
}

optional<int> session_manager::execute(execution_session &session, const sandbox::container_handle &handle,
                                       const language_profile &profile, const project &proj,
                                       const vector<sandbox::library_blob> &libs) {
    static constexpr chrono::milliseconds slice(200);

    string command = build_command(profile, proj, sandbox::linkable_libraries(libs));
    DLOG(INFO) << "Session " << session.id << " runs: " << command;
    auto options = workspace.sandbox_exec(command);
    options.attach_stdin = true;

    shared_ptr<docker::exec_stream> stream = retry(config.retry.engine, "attach to " + handle.name, [&] {
        return docker.exec(handle.id, options);
    }, docker::is_transient);
    defer {
        session.input.close();
        stream->close();
    };
    session.input.attach([stream](const string &line) { stream->write(line); },
                         [stream] { stream->close_input(); });

    docker::frame_demuxer demuxer;
    auto timeout = chrono::duration_cast<chrono::milliseconds>(config.timeouts.execution);
    auto deadline = chrono::steady_clock::now() + timeout;
    string chunk;
    while (true) {
        if (session.cancelled())
            throw operation_cancelled("session " + session.id + " stopped");
        auto now = chrono::steady_clock::now();
        if (now >= deadline)
            throw timeout_error(fmt::format("execution timed out after {}s", config.timeouts.execution.count()));

        chunk.clear();
        auto remaining = chrono::duration_cast<chrono::milliseconds>(deadline - now);
        auto status = stream->read(chunk, min(slice, remaining));
        if (status == docker::read_status::END) break;
        if (status == docker::read_status::TIMEOUT) continue;

        for (auto &f : demuxer.feed(chunk)) {
            if (f.type == docker::stream_type::STDOUT)
                session.output.push_stdout(f.payload);
            else
                session.output.push_stderr(f.payload);
        }
    }
    demuxer.finish();

    int exit_code = stream->exit_code();
    if (exit_code < 0) return nullopt;
    return exit_code;
}

void session_manager::stop(const string &session_id) {
    auto session = sessions.find(session_id);
    if (!session) return;

    LOG(INFO) << "Stopping session " << session_id;
    session->cancel();
    if (session->transition(session_state::STOPPED))
        session->output.finish_end(nullopt);
    session->input.close();
    if (auto handle = session->take_container())
        provisioner.teardown(*handle);
    sessions.erase_if_same(session);
}

void session_manager::send_input(const string &session_id, const string &text) {
    auto session = sessions.find(session_id);
    if (!session || is_terminal(session->state()))
        throw session_not_found_error(session_id);
    session->input.send(text);
}

shared_ptr<execution_session> session_manager::find(const string &session_id) const {
    return sessions.find(session_id);
}

bool session_manager::shutdown(chrono::milliseconds timeout) {
    {
        lock_guard<mutex> guard(active_mutex);
        shutting_down = true;
    }
    for (auto &session : sessions.snapshot())
        stop(session->id);

    unique_lock<mutex> lock(active_mutex);
    bool exited = active_cond.wait_for(lock, timeout, [this] { return active_pipelines == 0; });
    if (!exited)
        LOG(WARNING) << active_pipelines << " session pipelines still running at shutdown";
    return exited;
}

size_t session_manager::active() const {
    lock_guard<mutex> guard(active_mutex);
    return active_pipelines;
}

const session_registry &session_manager::registry() const {
    return sessions;
}

void session_manager::release_pipeline() {
    lock_guard<mutex> guard(active_mutex);
    --active_pipelines;
    active_cond.notify_all();
}

}  // namespace runner::session
