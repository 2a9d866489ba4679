#include "common/exceptions.hpp"
#include <boost/exception/diagnostic_information.hpp>

namespace verifier {
using namespace std;

verifier_exception::verifier_exception()
    : verifier_exception("") {}

verifier_exception::verifier_exception(const string &message)
    : message(message), stacktrace(make_shared<boost::stacktrace::stacktrace>()) {}

const char *verifier_exception::what() const noexcept {
    return message.c_str();
}

std::ostream &operator<<(std::ostream &os, const verifier_exception &ex) {
    os << boost::diagnostic_information(ex) << endl << *ex.stacktrace;
    return os;
}

internal_error::internal_error()
    : verifier_exception() {}

internal_error::internal_error(const string &message)
    : verifier_exception(message) {}

sandbox_error::sandbox_error()
    : verifier_exception() {}

sandbox_error::sandbox_error(const string &message)
    : verifier_exception(message) {}

invalid_request::invalid_request()
    : verifier_exception() {}

invalid_request::invalid_request(const string &message)
    : verifier_exception(message) {}

verification_cancelled::verification_cancelled()
    : verifier_exception("verification cancelled") {}

verification_cancelled::verification_cancelled(const string &message)
    : verifier_exception(message) {}

}  // namespace verifier
