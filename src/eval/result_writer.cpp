#include "eval/result_writer.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <deque>
#include "common/exceptions.hpp"
#include "common/json_utils.hpp"
#include "common/jsonl.hpp"

namespace codeeval {
using namespace std;

size_t combine_and_write(const filesystem::path &sample_file, const evaluation_result &result,
                         const filesystem::path &out_path, bool append) {
    map<string, deque<const verdict *>> pending;
    for (auto &[task_id, verdicts] : result.results)
        for (auto &v : verdicts)
            pending[task_id].push_back(&v);

    jsonl_writer writer(out_path, append);
    stream_jsonl(sample_file, [&](nlohmann::json &record) {
        string task_id = nlohmann::get_value<string>(record, "task_id");
        auto &queue = pending[task_id];
        if (queue.empty())
            throw evaluation_error(fmt::format("no evaluation result left for sample {} of task {}", writer.count(), task_id));

        const verdict *v = queue.front();
        queue.pop_front();
        record["result"] = v->result();
        record["passed"] = v->passed;
        writer.write(record);
    });
    writer.close();

    LOG(INFO) << "Wrote " << writer.count() << " results to " << out_path;
    return writer.count();
}

}  // namespace codeeval
