#include "session/registry.hpp"

namespace runner::session {
using namespace std;

shared_ptr<execution_session> session_registry::insert_or_replace(shared_ptr<execution_session> session) {
    lock_guard<mutex> guard(mut);
    auto &slot = sessions[session->id];
    auto previous = move(slot);
    slot = move(session);
    return previous;
}

shared_ptr<execution_session> session_registry::find(const string &session_id) const {
    lock_guard<mutex> guard(mut);
    auto it = sessions.find(session_id);
    return it == sessions.end() ? nullptr : it->second;
}

bool session_registry::erase_if_same(const shared_ptr<execution_session> &session) {
    lock_guard<mutex> guard(mut);
    auto it = sessions.find(session->id);
    if (it == sessions.end() || it->second != session) return false;
    sessions.erase(it);
    return true;
}

vector<shared_ptr<execution_session>> session_registry::snapshot() const {
    lock_guard<mutex> guard(mut);
    vector<shared_ptr<execution_session>> result;
    for (auto &[id, session] : sessions)
        result.push_back(session);
    return result;
}

size_t session_registry::size() const {
    lock_guard<mutex> guard(mut);
    return sessions.size();
}

}  // namespace runner::session
