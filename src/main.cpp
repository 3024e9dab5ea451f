#include <glog/logging.h>
#include <boost/algorithm/string/join.hpp>
#include <boost/exception/diagnostic_information.hpp>
#include <boost/program_options.hpp>
#include <cmath>
#include <iostream>
#include <nlohmann/json.hpp>
#include "common/exceptions.hpp"
#include "common/utils.hpp"
#include "config.hpp"
#include "eval/checker.hpp"
#include "eval/evaluator.hpp"
#include "eval/pass_at_k.hpp"
#include "eval/result_writer.hpp"
#include "monitor/progress.hpp"
using namespace std;

int main(int argc, char* argv[]) {
    google::InitGoogleLogging(argv[0]);

    namespace po = boost::program_options;
    po::options_description desc("codeeval options");
    po::positional_options_description positional;
    po::variables_map vm;

    // clang-format off
    desc.add_options()
        ("sample-file", po::value<string>()->required(), "set the JSONL file of generated samples, each line contains task_id and completion. Can be given as the positional argument.")
        ("problem-file", po::value<string>(), "set the JSONL file (or .jsonl.gz) of problems. You can either pass it from environ PROBLEMFILE")
        ("k", po::value<string>()->default_value("1,10"), "set the comma separated list of k to compute pass@k")
        ("timeout", po::value<double>()->default_value(codeeval::DEFAULT_TIMEOUT), "set the time limit in seconds of each sample")
        ("workers", po::value<size_t>()->default_value(1), "set the number of samples to be executed concurrently")
        ("scratch-dir", po::value<string>(), "set the directory to store programs being executed, default to codeeval in system temporary directory. You can either pass it from environ SCRATCHDIR")
        ("python", po::value<string>(), "set the python interpreter to execute programs, default to python3. You can either pass it from environ PYTHON")
        ("append", "append to the result file instead of overwriting it")
        ("help", "display this help text")
        ("version", "display version of this application");
    // clang-format on
    positional.add("sample-file", 1);

    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(desc)
                      .positional(positional)
                      .run(),
                  vm);

        if (vm.count("help")) {
            cout << "codeeval: Evaluate functional correctness of generated code completions" << endl
                 << "Usage: " << argv[0] << " [options] <sample-file>" << endl;
            cout << desc << endl;
            return EXIT_SUCCESS;
        }

        if (vm.count("version")) {
            cout << "codeeval 1.0" << endl;
            return EXIT_SUCCESS;
        }

        po::notify(vm);
    } catch (po::error& e) {
        cerr << e.what() << endl
             << endl;
        cerr << desc << endl;
        return EXIT_FAILURE;
    }

    filesystem::path problem_file;
    if (vm.count("problem-file")) {
        problem_file = vm.at("problem-file").as<string>();
    } else {
        problem_file = codeeval::get_env("PROBLEMFILE", "");
    }
    if (problem_file.empty()) {
        cerr << "Problem file should be specified by --problem-file or environ PROBLEMFILE" << endl;
        return EXIT_FAILURE;
    }

    if (vm.count("scratch-dir")) {
        codeeval::SCRATCH_DIR = filesystem::path(vm.at("scratch-dir").as<string>());
    } else {
        codeeval::SCRATCH_DIR = filesystem::path(codeeval::get_env("SCRATCHDIR", codeeval::SCRATCH_DIR.string()));
    }

    if (vm.count("python")) {
        codeeval::PYTHON_EXECUTABLE = vm.at("python").as<string>();
    } else {
        codeeval::PYTHON_EXECUTABLE = codeeval::get_env("PYTHON", codeeval::PYTHON_EXECUTABLE);
    }

    filesystem::path sample_file = vm.at("sample-file").as<string>();
    double timeout = vm.at("timeout").as<double>();
    size_t workers = vm.at("workers").as<size_t>();
    bool append = vm.count("append") > 0;

    if (!isfinite(timeout) || timeout <= 0) {
        cerr << "Timeout should be a positive finite number" << endl;
        return EXIT_FAILURE;
    }
    if (workers == 0) {
        cerr << "Number of workers should be at least 1" << endl;
        return EXIT_FAILURE;
    }

    try {
        vector<size_t> ks = codeeval::parse_k_list(vm.at("k").as<string>());

        codeeval::problem_set problems = codeeval::read_problems(problem_file);
        vector<codeeval::sample> samples = codeeval::read_samples(sample_file);
        LOG(INFO) << "Read " << samples.size() << " samples from " << sample_file;

        codeeval::program_checker checker{codeeval::executor()};
        LOG(INFO) << "Executing programs with " << boost::algorithm::join(checker.get_executor().get_interpreter(), " ")
                  << " in " << checker.get_executor().get_scratch_dir();

        codeeval::evaluator evaluator(checker);
        evaluator.register_monitor(make_unique<codeeval::progress_monitor>(codeeval::PROGRESS_INTERVAL));
        codeeval::evaluation_result result = evaluator.evaluate(problems, samples, {timeout, workers});

        vector<codeeval::metric> metrics = codeeval::compute_pass_at_k(result.counts(), ks);

        filesystem::path out_file = sample_file.string() + "_eval_results.jsonl";
        codeeval::combine_and_write(sample_file, result, out_file, append);

        nlohmann::ordered_json report = nlohmann::ordered_json::object();
        for (auto& m : metrics)
            report[m.name] = m.value;
        cout << report.dump() << endl;
    } catch (codeeval::evaluation_error& e) {
        LOG(ERROR) << e;
        cerr << e.what() << endl;
        return EXIT_FAILURE;
    } catch (std::exception& e) {
        LOG(ERROR) << e.what() << endl
                   << boost::diagnostic_information(e);
        cerr << e.what() << endl;
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
