#include "eval/problem.hpp"
#include <glog/logging.h>
#include "common/json_utils.hpp"
#include "common/jsonl.hpp"

namespace codeeval {
using namespace std;

void from_json(const nlohmann::json &j, problem &p) {
    p.task_id = nlohmann::get_value<string>(j, "task_id");
    p.prompt = nlohmann::get_value<string>(j, "prompt");
    p.entry_point = nlohmann::get_value<string>(j, "entry_point");
    p.test = nlohmann::get_value<string>(j, "test");
    if (nlohmann::exists(j, "canonical_solution"))
        p.canonical_solution = nlohmann::get_value<string>(j, "canonical_solution");
    else
        p.canonical_solution.reset();
}

void from_json(const nlohmann::json &j, sample &s) {
    s.task_id = nlohmann::get_value<string>(j, "task_id");
    s.completion = nlohmann::get_value<string>(j, "completion");
}

problem_set read_problems(const filesystem::path &path) {
    problem_set problems;
    stream_jsonl(path, [&](nlohmann::json &record) {
        problem p = record.get<problem>();
        string task_id = p.task_id;
        if (problems.count(task_id))
            LOG(WARNING) << "Duplicated task " << task_id << " in " << path << ", the later one is used";
        problems[task_id] = move(p);
    });
    LOG(INFO) << "Loaded " << problems.size() << " problems from " << path;
    return problems;
}

vector<sample> read_samples(const filesystem::path &path) {
    vector<sample> samples;
    stream_jsonl(path, [&](nlohmann::json &record) {
        samples.push_back(record.get<sample>());
    });
    return samples;
}

}  // namespace codeeval
