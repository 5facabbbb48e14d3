#include "ojudge/common/exceptions.hpp"
#include <boost/exception/diagnostic_information.hpp>

namespace ojudge {
using namespace std;

judge_exception::judge_exception()
    : judge_exception("") {}

judge_exception::judge_exception(const string &message)
    : message(message), stacktrace(make_shared<boost::stacktrace::stacktrace>()) {}

const char *judge_exception::what() const noexcept {
    return message.c_str();
}

std::ostream &operator<<(std::ostream &os, const judge_exception &ex) {
    os << boost::diagnostic_information(ex) << endl << *ex.stacktrace;
    return os;
}

unsupported_language::unsupported_language(const string &language)
    : judge_exception("unsupported language: " + language), language(language) {}

workspace_allocation_error::workspace_allocation_error(const string &message)
    : judge_exception(message) {}

invalid_task::invalid_task(const string &message)
    : judge_exception(message) {}

internal_error::internal_error()
    : judge_exception() {}

internal_error::internal_error(const string &message)
    : judge_exception(message) {}

}  // namespace ojudge
