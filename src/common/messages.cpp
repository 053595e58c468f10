#include "common/messages.hpp"

namespace runner::message {
using namespace std;
using namespace nlohmann;

const char *get_display_message(output_type type) {
    switch (type) {
        case output_type::STDOUT:
            return "stdout";
        case output_type::STDERR:
            return "stderr";
        case output_type::END:
            return "end";
        default:
            return "error";
    }
}

bool output_event::terminal() const {
    return type == output_type::END || type == output_type::ERROR;
}

output_event make_stdout(const string &data) {
    return {output_type::STDOUT, data, nullopt};
}

output_event make_stderr(const string &data) {
    return {output_type::STDERR, data, nullopt};
}

output_event make_end(optional<int> exit_code) {
    return {output_type::END, "", exit_code};
}

output_event make_error(const string &message) {
    return {output_type::ERROR, message, nullopt};
}

void to_json(json &j, const output_event &event) {
    j = {{"type", get_display_message(event.type)}};
    if (event.type != output_type::END)
        j["data"] = event.data;
    if (event.exit_code)
        j["exitCode"] = *event.exit_code;
}

string to_sse(const output_event &event) {
    json j = event;
    return "data: " + j.dump(-1, ' ', false, json::error_handler_t::replace) + "\n\n";
}

}  // namespace runner::message
