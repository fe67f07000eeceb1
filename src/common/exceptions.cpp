#include "common/exceptions.hpp"
#include <boost/exception/diagnostic_information.hpp>

namespace pocketjudge {
using namespace std;

judge_exception::judge_exception(const string &message)
    : message(message), stacktrace(make_shared<boost::stacktrace::stacktrace>()) {}

const char *judge_exception::what() const noexcept {
    return message.c_str();
}

std::ostream &operator<<(std::ostream &os, const judge_exception &ex) {
    os << boost::diagnostic_information(ex) << endl << *ex.stacktrace;
    return os;
}

internal_error::internal_error(const string &message)
    : judge_exception(message) {}

spawn_error::spawn_error(const string &message)
    : judge_exception(message) {}

compilation_error::compilation_error(const string &what, const string &error_log)
    : judge_exception(what), error_log(error_log) {}

}  // namespace pocketjudge
