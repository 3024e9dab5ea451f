#include "eval/evaluator.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/algorithm/string/join.hpp>
#include <boost/exception/diagnostic_information.hpp>
#include <algorithm>
#include <exception>
#include <mutex>
#include <thread>
#include "common/concurrent_queue.hpp"
#include "common/exceptions.hpp"
#include "common/messages.hpp"

namespace codeeval {
using namespace std;

map<string, task_counts> evaluation_result::counts() const {
    map<string, task_counts> result;
    for (auto &[task_id, verdicts] : results) {
        task_counts &count = result[task_id];
        count.total = verdicts.size();
        count.correct = count_if(verdicts.begin(), verdicts.end(), [](const verdict &v) { return v.passed; });
    }
    return result;
}

evaluator::evaluator(const checker &chk) : chk(chk) {}

void evaluator::register_monitor(unique_ptr<monitor> &&monitor) {
    monitors.push_back(move(monitor));
}

void evaluator::call_monitor(function<void(monitor &)> callback) {
    try {
        for (auto &monitor : monitors) callback(*monitor);
    } catch (std::exception &ex) {
        LOG(ERROR) << "Monitor has crashed when reporting progress, " << ex.what();
    }
}

/**
 * @brief 为每个样本分配 completion_id，生成评测任务
 * 在执行任何样本之前完成，因此引用了不存在的题目时不会浪费时间执行其他样本
 */
static vector<message::check_task> assign_tasks(const problem_set &problems, const vector<sample> &samples) {
    vector<message::check_task> tasks;
    map<string, size_t> next_id;
    tasks.reserve(samples.size());
    for (const sample &s : samples) {
        auto it = problems.find(s.task_id);
        if (it == problems.end())
            throw unknown_task_error(s.task_id);
        tasks.push_back({&it->second, next_id[s.task_id]++, &s.completion});
    }
    return tasks;
}

evaluation_result evaluator::evaluate(const problem_set &problems, const vector<sample> &samples, const evaluation_options &options) {
    if (options.workers == 0)
        throw invalid_argument("number of workers should be at least 1");

    vector<message::check_task> tasks = assign_tasks(problems, samples);

    evaluation_result result;
    result.n_samples = tasks.size();

    mutex result_mutex;
    auto record = [&](int worker_id, verdict &&v) {
        scoped_lock guard(result_mutex);
        call_monitor([&](monitor &m) { m.end_sample(worker_id, v); });
        result.results[v.task_id].push_back(move(v));
    };

    call_monitor([&](monitor &m) { m.start_evaluation(tasks.size()); });

    size_t workers = min(options.workers, max<size_t>(tasks.size(), 1));
    if (workers == 1) {
        for (auto &task : tasks)
            record(0, chk.check(*task.prob, *task.completion, options.timeout, task.completion_id));
    } else {
        concurrent_queue<message::check_task> task_queue;
        for (auto &task : tasks) task_queue.push(task);

        // 任何一个 worker 出现异常时，其他 worker 不再领取新任务，异常在所有 worker 结束后重新抛出
        exception_ptr error;
        bool stopped = false;

        vector<thread> worker_threads;
        for (size_t i = 0; i < workers; ++i) {
            worker_threads.emplace_back([&, worker_id = (int)i] {
                message::check_task task;
                while (true) {
                    {
                        scoped_lock guard(result_mutex);
                        if (stopped) break;
                    }
                    if (!task_queue.try_pop(task)) break;

                    try {
                        record(worker_id, chk.check(*task.prob, *task.completion, options.timeout, task.completion_id));
                    } catch (std::exception &ex) {
                        LOG(ERROR) << "Worker " << worker_id << " has crashed, " << ex.what() << endl
                                   << boost::diagnostic_information(ex);
                        scoped_lock guard(result_mutex);
                        if (!error) error = current_exception();
                        stopped = true;
                        break;
                    }
                }
            });
        }

        for (auto &th : worker_threads)
            th.join();

        if (error) rethrow_exception(error);
    }

    for (auto &[task_id, verdicts] : result.results)
        sort(verdicts.begin(), verdicts.end(), [](const verdict &a, const verdict &b) {
            return a.completion_id < b.completion_id;
        });

    if (result.results.size() != problems.size()) {
        vector<string> missing;
        for (auto &[task_id, prob] : problems)
            if (!result.results.count(task_id))
                missing.push_back(task_id);
        if (missing.size() > 5) {
            missing.resize(5);
            missing.push_back("...");
        }
        throw incomplete_evaluation_error(fmt::format("{} of {} problems have no samples: {}",
                                                      problems.size() - result.results.size(), problems.size(),
                                                      boost::algorithm::join(missing, ", ")));
    }

    call_monitor([&](monitor &m) { m.end_evaluation(result); });
    return result;
}

}  // namespace codeeval
