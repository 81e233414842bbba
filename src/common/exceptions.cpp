#include "common/exceptions.hpp"
#include <boost/exception/diagnostic_information.hpp>

namespace oibox {
using namespace std;

oibox_exception::oibox_exception()
    : oibox_exception("") {}

oibox_exception::oibox_exception(const string &message)
    : message(message), stacktrace(make_shared<boost::stacktrace::stacktrace>()) {}

const char *oibox_exception::what() const noexcept {
    return message.c_str();
}

const char *oibox_exception::kind() const noexcept {
    return "internal_error";
}

std::ostream &operator<<(std::ostream &os, const oibox_exception &ex) {
    os << ex.kind() << ": " << boost::diagnostic_information(ex) << endl
       << *ex.stacktrace;
    return os;
}

const char *internal_error::kind() const noexcept {
    return "internal_error";
}

const char *path_violation::kind() const noexcept {
    return "path_violation";
}

const char *command_denied::kind() const noexcept {
    return "command_denied";
}

const char *validation_error::kind() const noexcept {
    return "validation_error";
}

const char *not_found::kind() const noexcept {
    return "not_found";
}

const char *configuration_error::kind() const noexcept {
    return "configuration_error";
}

const char *invocation_cancelled::kind() const noexcept {
    return "invocation_cancelled";
}

compilation_error::compilation_error(const string &what, const string &error_log, int exit_code)
    : oibox_exception(what), error_log(error_log), exit_code(exit_code) {}

const char *compilation_error::kind() const noexcept {
    return "compilation_error";
}

}  // namespace oibox
