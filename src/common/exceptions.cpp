#include "common/exceptions.hpp"
#include <boost/exception/diagnostic_information.hpp>

namespace codeeval {
using namespace std;

evaluation_error::evaluation_error(const string &message)
    : message(message), stacktrace(make_shared<boost::stacktrace::stacktrace>()) {}

const char *evaluation_error::what() const noexcept {
    return message.c_str();
}

std::ostream &operator<<(std::ostream &os, const evaluation_error &ex) {
    os << boost::diagnostic_information(ex) << endl << *ex.stacktrace;
    return os;
}

unknown_task_error::unknown_task_error(const string &task_id)
    : evaluation_error("sample references unknown task " + task_id) {}

incomplete_evaluation_error::incomplete_evaluation_error(const string &message)
    : evaluation_error(message) {}

dataset_error::dataset_error(const string &message)
    : evaluation_error(message) {}

}  // namespace codeeval
