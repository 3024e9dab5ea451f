#include "eval/checker.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/algorithm/string/trim.hpp>

namespace codeeval {
using namespace std;

string verdict::result() const {
    return to_result_string(outcome);
}

string build_check_program(const problem &prob, const string &completion) {
    return prob.prompt + completion + "\n" +
           prob.test + "\n" +
           "check(" + prob.entry_point + ")";
}

checker::~checker() {}

program_checker::program_checker(executor exec) : exec(move(exec)) {}

verdict program_checker::check(const problem &prob, const string &completion, double timeout, optional<size_t> completion_id) const {
    execution_outcome result = exec.execute(build_check_program(prob, completion), timeout);
    bool passed = get_status(result) == status::PASSED;

    if (auto p = get_if<outcome::passed>(&result)) {
        string output = boost::algorithm::trim_copy(p->output);
        if (!output.empty())
            LOG(INFO) << "Output of " << prob.task_id
                      << (completion_id ? fmt::format(" #{}", *completion_id) : "") << ": " << output;
    }

    return verdict{prob.task_id, completion_id, passed, move(result)};
}

const executor &program_checker::get_executor() const {
    return exec;
}

}  // namespace codeeval
