#include <signal.h>
#include <chrono>
#include <limits>
#include <thread>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/lexical_cast.hpp>
#include "gtest/gtest.h"
#include "common/io_utils.hpp"
#include "common/utils.hpp"
#include "config.hpp"
#include "eval/executor.hpp"
#include "test/assertions.hpp"
#include "test/environment.hpp"

using namespace std;
using namespace std::filesystem;
using namespace codeeval;

/**
 * @brief 进程是否还在运行（僵尸进程视为已经结束）
 * 进程被 SIGKILL 后需要一点时间才会真正退出，因此最多等待 2 秒
 */
static bool process_alive(pid_t pid) {
    for (int i = 0; i < 200; ++i) {
        path stat = path("/proc") / to_string(pid) / "stat";
        string content = read_file_content(stat, "");
        if (content.empty()) return false;
        // 格式为 "pid (comm) state ..."，comm 可能包含空格
        auto pos = content.rfind(')');
        if (pos != string::npos && pos + 2 < content.size() && content[pos + 2] == 'Z') return false;
        this_thread::sleep_for(chrono::milliseconds(10));
    }
    return true;
}

class ExecutorTest : public ::testing::Test {
protected:
    path scratch;
    path workdir;

    void SetUp() override {
        workdir = make_test_dir("executor");
        scratch = workdir / "scratch";
    }

    executor make_executor(size_t max_output = MAX_OUTPUT_SIZE) {
        return executor({PYTHON_EXECUTABLE}, scratch, max_output);
    }
};

TEST_F(ExecutorTest, PassedTest) {
    auto result = make_executor().execute("print('hello')\n", 5);
    ASSERT_OUTCOME(result, status::PASSED);
    EXPECT_EQ(get<outcome::passed>(result).output, "hello\n");
    EXPECT_EQ(count_files(scratch), 0u);
}

TEST_F(ExecutorTest, ExitCodeTest) {
    auto result = make_executor().execute("import sys\nsys.exit(3)\n", 5);
    ASSERT_OUTCOME(result, status::FAILED);
    EXPECT_EQ(get<outcome::failed>(result).message, "process exited with code 3");
    EXPECT_EQ(to_result_string(result), "failed: process exited with code 3");
}

TEST_F(ExecutorTest, UncaughtExceptionTest) {
    auto result = make_executor().execute("raise ValueError('boom')\n", 5);
    ASSERT_OUTCOME(result, status::FAILED);
    string message = get<outcome::failed>(result).message;
    EXPECT_TRUE(boost::algorithm::ends_with(message, "ValueError: boom")) << message;
    EXPECT_TRUE(boost::algorithm::starts_with(message, "Traceback")) << message;
}

TEST_F(ExecutorTest, SyntaxErrorTest) {
    auto result = make_executor().execute("def f(:\n    pass\n", 5);
    ASSERT_OUTCOME(result, status::FAILED);
    EXPECT_TRUE(boost::algorithm::contains(get<outcome::failed>(result).message, "SyntaxError"));
}

TEST_F(ExecutorTest, StderrMessageTest) {
    auto result = make_executor().execute("import sys\nsys.stderr.write('  oops\\n')\nsys.exit(1)\n", 5);
    ASSERT_OUTCOME(result, status::FAILED);
    EXPECT_EQ(get<outcome::failed>(result).message, "oops");
}

TEST_F(ExecutorTest, StderrIgnoredWhenPassedTest) {
    auto result = make_executor().execute("import sys\nsys.stderr.write('warning\\n')\n", 5);
    EXPECT_OUTCOME(result, status::PASSED);
}

TEST_F(ExecutorTest, TimeLimitTest) {
    path pid_file = workdir / "pid";
    string code = "import os\n"
                  "with open('" + pid_file.string() + "', 'w') as f:\n"
                  "    f.write(str(os.getpid()))\n"
                  "while True:\n"
                  "    pass\n";

    elapsed_time timer;
    auto result = make_executor().execute(code, 0.5);
    double elapsed = timer.seconds();

    EXPECT_OUTCOME(result, status::TIMED_OUT);
    EXPECT_EQ(to_result_string(result), "timed out");
    EXPECT_GE(elapsed, 0.5);
    EXPECT_LT(elapsed, 3.0);

    pid_t pid = boost::lexical_cast<pid_t>(read_file_content(pid_file));
    EXPECT_FALSE(process_alive(pid));
    EXPECT_EQ(count_files(scratch), 0u);
}

TEST_F(ExecutorTest, HugeTimeLimitTest) {
    // 超出 steady_clock 表示范围的时间限制不能导致立即超时
    for (double timeout : {1e10, 1e300, numeric_limits<double>::infinity()}) {
        auto result = make_executor().execute("print('hi')\n", timeout);
        ASSERT_OUTCOME(result, status::PASSED) << "timeout = " << timeout;
        EXPECT_EQ(get<outcome::passed>(result).output, "hi\n");
    }
}

TEST_F(ExecutorTest, NonPositiveTimeLimitTest) {
    for (double timeout : {0.0, -1.0, numeric_limits<double>::quiet_NaN()}) {
        elapsed_time timer;
        auto result = make_executor().execute("import time\ntime.sleep(100)\n", timeout);
        EXPECT_OUTCOME(result, status::TIMED_OUT);
        EXPECT_LT(timer.seconds(), 3.0);
    }
    EXPECT_EQ(count_files(scratch), 0u);
}

TEST_F(ExecutorTest, SleepTimeLimitTest) {
    elapsed_time timer;
    auto result = make_executor().execute("import time\ntime.sleep(100)\n", 0.5);
    EXPECT_OUTCOME(result, status::TIMED_OUT);
    EXPECT_LT(timer.seconds(), 3.0);
}

TEST_F(ExecutorTest, GrandchildKilledTest) {
    path pid_file = workdir / "pid";
    string code = "import subprocess\n"
                  "p = subprocess.Popen(['sleep', '100'])\n"
                  "with open('" + pid_file.string() + "', 'w') as f:\n"
                  "    f.write(str(p.pid))\n";

    auto result = make_executor().execute(code, 5);
    EXPECT_OUTCOME(result, status::PASSED);

    pid_t pid = boost::lexical_cast<pid_t>(read_file_content(pid_file));
    EXPECT_FALSE(process_alive(pid));
}

TEST_F(ExecutorTest, KilledBySignalTest) {
    auto result = make_executor().execute("import os, signal\nos.kill(os.getpid(), signal.SIGKILL)\n", 5);
    ASSERT_OUTCOME(result, status::FAILED);
    EXPECT_TRUE(boost::algorithm::starts_with(get<outcome::failed>(result).message, "process terminated by signal 9"));
}

TEST_F(ExecutorTest, OutputLimitTest) {
    // 子进程的输出远大于管道缓冲区，不能因为管道写满而阻塞
    auto result = make_executor(1024).execute("import sys\nsys.stdout.write('x' * (4 << 20))\nsys.stderr.write('y' * (4 << 20))\n", 10);
    ASSERT_OUTCOME(result, status::PASSED);
    EXPECT_EQ(get<outcome::passed>(result).output, string(1024, 'x'));
}

TEST_F(ExecutorTest, StdinIsEmptyTest) {
    auto result = make_executor().execute("import sys\nassert sys.stdin.read() == ''\n", 5);
    EXPECT_OUTCOME(result, status::PASSED);
}

TEST_F(ExecutorTest, MissingInterpreterTest) {
    executor exec({"/nonexistent/python"}, scratch, MAX_OUTPUT_SIZE);
    auto result = exec.execute("print(1)\n", 5);
    ASSERT_OUTCOME(result, status::FAILED);
    EXPECT_TRUE(boost::algorithm::starts_with(get<outcome::failed>(result).message, "unable to start /nonexistent/python"));
    EXPECT_EQ(count_files(scratch), 0u);
}

TEST_F(ExecutorTest, UnwritableScratchDirTest) {
    path file = workdir / "file";
    write_file_content(file, "");
    executor exec({PYTHON_EXECUTABLE}, file / "scratch", MAX_OUTPUT_SIZE);
    auto result = exec.execute("print(1)\n", 5);
    ASSERT_OUTCOME(result, status::FAILED);
    EXPECT_FALSE(get<outcome::failed>(result).message.empty());
}

TEST_F(ExecutorTest, ConcurrentExecutionTest) {
    executor exec = make_executor();
    vector<execution_outcome> results(8);
    vector<thread> threads;
    for (size_t i = 0; i < results.size(); ++i)
        threads.emplace_back([&, i] {
            results[i] = exec.execute("print(" + to_string(i) + ")\n", 10);
        });
    for (auto &th : threads) th.join();

    for (size_t i = 0; i < results.size(); ++i) {
        ASSERT_OUTCOME(results[i], status::PASSED);
        EXPECT_EQ(get<outcome::passed>(results[i]).output, to_string(i) + "\n");
    }
    EXPECT_EQ(count_files(scratch), 0u);
}

TEST_F(ExecutorTest, EmptyInterpreterTest) {
    EXPECT_THROW(executor({}, scratch, MAX_OUTPUT_SIZE), invalid_argument);
}
