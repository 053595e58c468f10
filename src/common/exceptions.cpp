#include "common/exceptions.hpp"
#include <boost/exception/diagnostic_information.hpp>

namespace runner {
using namespace std;

runner_exception::runner_exception()
    : runner_exception("") {}

runner_exception::runner_exception(const string &message)
    : message(message), stacktrace(make_shared<boost::stacktrace::stacktrace>()) {}

const char *runner_exception::what() const noexcept {
    return message.c_str();
}

const char *runner_exception::kind() const noexcept {
    return "internal";
}

std::ostream &operator<<(std::ostream &os, const runner_exception &ex) {
    os << boost::diagnostic_information(ex) << endl << *ex.stacktrace;
    return os;
}

validation_error::validation_error(const string &message)
    : runner_exception(message) {}

const char *validation_error::kind() const noexcept { return "validation"; }

unsupported_language_error::unsupported_language_error(const string &language)
    : runner_exception("unsupported language: " + language) {}

const char *unsupported_language_error::kind() const noexcept { return "unsupported"; }

provision_error::provision_error(const string &message)
    : runner_exception(message) {}

const char *provision_error::kind() const noexcept { return "provision"; }

workspace_write_error::workspace_write_error(const string &message)
    : runner_exception(message) {}

const char *workspace_write_error::kind() const noexcept { return "workspace"; }

dependency_install_error::dependency_install_error(failure_kind failure, const string &message, const string &log_excerpt)
    : runner_exception(message), failure(failure), log_excerpt(log_excerpt) {}

const char *dependency_install_error::kind() const noexcept { return "dependency"; }

const char *get_display_message(dependency_install_error::failure_kind failure) {
    switch (failure) {
        case dependency_install_error::failure_kind::NETWORK:
            return "network";
        case dependency_install_error::failure_kind::RESOLUTION:
            return "resolution";
        default:
            return "generic";
    }
}

timeout_error::timeout_error(const string &message)
    : runner_exception(message) {}

const char *timeout_error::kind() const noexcept { return "timeout"; }

stream_error::stream_error(const string &message)
    : runner_exception(message) {}

const char *stream_error::kind() const noexcept { return "stream"; }

session_not_found_error::session_not_found_error(const string &session_id)
    : runner_exception("session not found: " + session_id) {}

const char *session_not_found_error::kind() const noexcept { return "not_found"; }

cleanup_error::cleanup_error(const string &message)
    : runner_exception(message) {}

const char *cleanup_error::kind() const noexcept { return "cleanup"; }

engine_error::engine_error(long status, const string &message)
    : runner_exception(message), status(status) {}

const char *engine_error::kind() const noexcept { return "engine"; }

network_error::network_error(const string &message)
    : runner_exception(message) {}

const char *network_error::kind() const noexcept { return "network"; }

operation_cancelled::operation_cancelled(const string &message)
    : runner_exception(message) {}

const char *operation_cancelled::kind() const noexcept { return "cancelled"; }

internal_error::internal_error(const string &message)
    : runner_exception(message) {}

const char *internal_error::kind() const noexcept { return "internal"; }

}  // namespace runner
