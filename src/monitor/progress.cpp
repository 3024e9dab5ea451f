#include "monitor/progress.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include "eval/evaluator.hpp"

namespace codeeval {
using namespace std;

progress_monitor::progress_monitor(size_t interval) : interval(interval) {}

void progress_monitor::start_evaluation(size_t total) {
    this->total = total;
    finished = passed = 0;
    timer = elapsed_time();
    LOG(INFO) << "Evaluating " << total << " samples";
}

void progress_monitor::end_sample(int worker_id, const verdict &result) {
    ++finished;
    if (result.passed) ++passed;

    if (!result.passed)
        DLOG(INFO) << "Worker " << worker_id << ": " << result.task_id << " " << result.result();

    if (interval > 0 && (finished % interval == 0 || finished == total)) {
        double elapsed = timer.seconds();
        LOG(INFO) << fmt::format("{}/{} samples evaluated, {} passed, {:.1f}s elapsed, {:.2f} samples/s",
                                 finished, total, passed, elapsed, elapsed > 0 ? finished / elapsed : 0.0);
    }
}

void progress_monitor::end_evaluation(const evaluation_result &result) {
    LOG(INFO) << fmt::format("Evaluated {} samples of {} problems in {:.1f}s",
                             result.n_samples, result.results.size(), timer.seconds());
}

}  // namespace codeeval
