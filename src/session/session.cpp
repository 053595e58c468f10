#include "session/session.hpp"
#include <glog/logging.h>
#include <cctype>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"

namespace runner::session {
using namespace std;

bool valid_session_id(const string &session_id) {
    if (session_id.empty() || session_id.size() > 64) return false;
    if (!isalnum(static_cast<unsigned char>(session_id.front()))) return false;
    for (char c : session_id)
        if (!isalnum(static_cast<unsigned char>(c)) && c != '_' && c != '.' && c != '-')
            return false;
    return true;
}

output_channel::output_channel(size_t max_pending_bytes)
    : max_pending_bytes(max_pending_bytes) {}

bool output_channel::push_stdout(const string &data) {
    lock_guard<mutex> guard(mut);
    return push_output(message::output_type::STDOUT, stdout_carry, data);
}

bool output_channel::push_stderr(const string &data) {
    lock_guard<mutex> guard(mut);
    return push_output(message::output_type::STDERR, stderr_carry, data);
}

bool output_channel::push_output(message::output_type type, string &carry, const string &data) {
    if (terminated) return false;

    string text = carry + data;
    size_t tail = utf8_incomplete_tail(text);
    carry = text.substr(text.size() - tail);
    text.resize(text.size() - tail);
    if (text.empty()) return true;

    if (pending_bytes + text.size() > max_pending_bytes) {
        if (dropped_bytes == 0)
            LOG(WARNING) << "Output channel is full, dropping output";
        dropped_bytes += text.size();
        return true;
    }
    pending_bytes += text.size();
    enqueue(type == message::output_type::STDOUT ? message::make_stdout(text) : message::make_stderr(text));
    return true;
}

void output_channel::enqueue(message::output_event event) {
    queue.push(move(event));
}

bool output_channel::finish(message::output_event event) {
    lock_guard<mutex> guard(mut);
    if (terminated) return false;
    terminated = true;

    // 流已经结束，剩下的半个字符也要发出去，序列化时会被替换
    if (!stdout_carry.empty()) enqueue(message::make_stdout(stdout_carry));
    if (!stderr_carry.empty()) enqueue(message::make_stderr(stderr_carry));
    stdout_carry.clear();
    stderr_carry.clear();

    enqueue(move(event));
    queue.close();
    return true;
}

bool output_channel::finish_end(optional<int> exit_code) {
    return finish(message::make_end(exit_code));
}

bool output_channel::finish_error(const string &message) {
    return finish(message::make_error(message.size() > 1000 ? message.substr(0, 1000) : message));
}

optional<message::output_event> output_channel::next(chrono::milliseconds timeout) {
    auto event = queue.pop_for(timeout);
    if (event && !event->terminal()) {
        lock_guard<mutex> guard(mut);
        pending_bytes -= min(pending_bytes, event->data.size());
    }
    return event;
}

bool output_channel::finished() const {
    lock_guard<mutex> guard(mut);
    return terminated;
}

bool output_channel::drained() const {
    return queue.drained();
}

bool output_channel::subscribe() {
    lock_guard<mutex> guard(mut);
    if (subscribed) return false;
    subscribed = true;
    return true;
}

void output_channel::unsubscribe() {
    lock_guard<mutex> guard(mut);
    subscribed = false;
}

size_t output_channel::dropped() const {
    lock_guard<mutex> guard(mut);
    return dropped_bytes;
}

input_relay::input_relay(string session_id)
    : session_id(move(session_id)) {}

uint64_t input_relay::take_ticket(unique_lock<mutex> &lock) {
    uint64_t ticket = next_ticket++;
    cond.wait(lock, [&] { return serving == ticket; });
    return ticket;
}

void input_relay::release_ticket() {
    ++serving;
    cond.notify_all();
}

void input_relay::send(const string &text) {
    unique_lock<mutex> lock(mut);
    if (closed || finishing) throw session_not_found_error(session_id);
    take_ticket(lock);
    if (closed || finishing) {
        release_ticket();
        throw session_not_found_error(session_id);
    }

    string line = text + "\n";
    if (!out) {
        buffered.push_back(move(line));
        release_ticket();
        return;
    }

    // 写入时不持有锁，后来的输入在领号处排队
    auto write = out;
    lock.unlock();
    try {
        write(line);
    } catch (const runner_exception &ex) {
        lock.lock();
        LOG(WARNING) << "Unable to write input of session " << session_id << ": " << ex.what();
        closed = true;
        out = nullptr;
        release_ticket();
        throw session_not_found_error(session_id);
    }
    lock.lock();
    release_ticket();
}

void input_relay::attach(writer sink, closer sink_eof) {
    unique_lock<mutex> lock(mut);
    if (closed) return;
    take_ticket(lock);
    try {
        while (!buffered.empty()) {
            sink(buffered.front());
            buffered.pop_front();
        }
        if (finishing) {
            closed = true;
            if (sink_eof) sink_eof();
        } else {
            out = move(sink);
            eof = move(sink_eof);
        }
    } catch (const runner_exception &ex) {
        LOG(WARNING) << "Unable to flush input of session " << session_id << ": " << ex.what();
        closed = true;
    }
    release_ticket();
}

void input_relay::finish() {
    unique_lock<mutex> lock(mut);
    if (closed || finishing) return;
    take_ticket(lock);
    finishing = true;
    if (!out) {
        // 未连接，attach 写出缓存后关闭
        release_ticket();
        return;
    }

    auto close_input = move(eof);
    closed = true;
    out = nullptr;
    eof = nullptr;
    lock.unlock();
    try {
        if (close_input) close_input();
    } catch (const runner_exception &ex) {
        LOG(WARNING) << "Unable to close input of session " << session_id << ": " << ex.what();
    }
    lock.lock();
    release_ticket();
}

void input_relay::close() {
    lock_guard<mutex> guard(mut);
    closed = true;
    out = nullptr;
    eof = nullptr;
    buffered.clear();
    cond.notify_all();
}

size_t input_relay::pending() const {
    lock_guard<mutex> guard(mut);
    return buffered.size();
}

execution_session::execution_session(string id, string language, string workspace_root, size_t max_pending_output)
    : id(move(id)),
      language(move(language)),
      workspace_root(move(workspace_root)),
      created_at(chrono::system_clock::now()),
      output(max_pending_output),
      input(this->id) {}

session_state execution_session::state() const {
    lock_guard<mutex> guard(mut);
    return current;
}

bool execution_session::transition(session_state next) {
    lock_guard<mutex> guard(mut);
    if (is_terminal(current)) return false;
    DLOG(INFO) << "Session " << id << ": " << get_display_message(current) << " -> " << get_display_message(next);
    current = next;
    return true;
}

void execution_session::set_container(sandbox::container_handle handle) {
    lock_guard<mutex> guard(mut);
    container = move(handle);
}

optional<sandbox::container_handle> execution_session::take_container() {
    lock_guard<mutex> guard(mut);
    optional<sandbox::container_handle> handle;
    handle.swap(container);
    return handle;
}

void execution_session::cancel() {
    cancel_requested = true;
    wake();
}

bool execution_session::cancelled() const {
    return cancel_requested;
}

void execution_session::wait_grace(chrono::milliseconds grace) {
    unique_lock<mutex> lock(mut);
    cond.wait_for(lock, grace, [this] { return woken; });
}

void execution_session::wake() {
    lock_guard<mutex> guard(mut);
    woken = true;
    cond.notify_all();
}

void execution_session::mark_finished() {
    lock_guard<mutex> guard(mut);
    finished = true;
    cond.notify_all();
}

bool execution_session::wait_finished(chrono::milliseconds timeout) {
    unique_lock<mutex> lock(mut);
    return cond.wait_for(lock, timeout, [this] { return finished; });
}

}  // namespace runner::session
