#include "common/status.hpp"
#include <boost/assign.hpp>
#include <unordered_map>

namespace runner {
using namespace std;

// clang-format off
static const unordered_map<session_state, const char *> state_string = boost::assign::map_list_of
    (session_state::PROVISIONING, "Provisioning")
    (session_state::WORKSPACE, "Workspace")
    (session_state::INSTALLING, "Installing")
    (session_state::RUNNING, "Running")
    (session_state::COMPLETED, "Completed")
    (session_state::FAILED, "Failed")
    (session_state::STOPPED, "Stopped");
// clang-format on

const char *get_display_message(session_state state) {
    return state_string.at(state);
}

bool is_terminal(session_state state) {
    return state == session_state::COMPLETED ||
           state == session_state::FAILED ||
           state == session_state::STOPPED;
}

}  // namespace runner
