#include "common/exceptions.hpp"
#include <boost/exception/diagnostic_information.hpp>

namespace codejudge {
using namespace std;

judge_exception::judge_exception(const string &message)
    : message(message), stacktrace(make_shared<boost::stacktrace::stacktrace>()) {}

const char *judge_exception::what() const noexcept {
    return message.c_str();
}

ostream &operator<<(ostream &os, const judge_exception &ex) {
    os << boost::diagnostic_information(ex) << endl
       << *ex.stacktrace;
    return os;
}

internal_error::internal_error(const string &message)
    : judge_exception(message) {}

sandbox_error::sandbox_error(const string &message)
    : judge_exception(message) {}

unsupported_language::unsupported_language(const string &language)
    : judge_exception("Unsupported language: " + language), language(language) {}

}  // namespace codejudge
