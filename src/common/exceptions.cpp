#include "common/exceptions.hpp"
#include <fmt/core.h>
#include <boost/exception/diagnostic_information.hpp>

namespace hindsight {
using namespace std;

hindsight_exception::hindsight_exception()
    : hindsight_exception("") {}

hindsight_exception::hindsight_exception(const string &message)
    : message(message), full_message(message), stacktrace(make_shared<boost::stacktrace::stacktrace>()) {}

const char *hindsight_exception::what() const noexcept {
    return full_message.c_str();
}

const string &hindsight_exception::check() const {
    return check_name;
}

const string &hindsight_exception::test_case() const {
    return test_case_id;
}

void hindsight_exception::set_context(const string &check, const string &test_case) {
    check_name = check;
    test_case_id = test_case;
    if (test_case.empty())
        full_message = fmt::format("[{}] {}", check, message);
    else
        full_message = fmt::format("[{}:{}] {}", check, test_case, message);
}

std::ostream &operator<<(std::ostream &os, const hindsight_exception &ex) {
    os << boost::diagnostic_information(ex) << endl << *ex.stacktrace;
    return os;
}

configuration_error::configuration_error(const string &message)
    : hindsight_exception(message) {}

io_error::io_error(const string &message)
    : hindsight_exception(message) {}

compilation_error::compilation_error(const string &message, const string &error_log)
    : hindsight_exception(message), error_log(error_log) {}

analysis_unavailable_error::analysis_unavailable_error(const string &message)
    : hindsight_exception(message) {}

analysis_parse_error::analysis_parse_error(const string &message)
    : hindsight_exception(message) {}

execution_environment_error::execution_environment_error(const string &message)
    : hindsight_exception(message) {}

sandbox_unavailable_error::sandbox_unavailable_error(const string &message)
    : execution_environment_error(message) {}

}  // namespace hindsight
