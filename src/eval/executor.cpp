#include "eval/executor.hpp"
#include <fcntl.h>
#include <fmt/core.h>
#include <glog/logging.h>
#include <poll.h>
#include <signal.h>
#include <string.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include <boost/algorithm/string/trim.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <algorithm>
#include <chrono>
#include <system_error>
#include "common/defer.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"
#include "config.hpp"

namespace codeeval {
using namespace std;
namespace fs = std::filesystem;

static const int BUF_SIZE = 4096;

static const int PIPE_IN = 1;
static const int PIPE_OUT = 0;

// 子进程未退出时，每隔多久检查一次子进程状态
static const chrono::milliseconds POLL_INTERVAL(10);

static void error(int err, const string &message) {
    throw system_error(err, system_category(), message);
}

/**
 * @brief 子进程的一个输出流
 */
struct child_stream {
    int &fd;
    size_t limit;
    string data;
    size_t total = 0;  // 包括被丢弃部分的总字节数
};

static void close_fd(int &fd) {
    if (fd < 0) return;
    if (close(fd) != 0)
        LOG(WARNING) << "Unable to close fd " << fd << ": " << strerror(errno);
    fd = -1;
}

static void pump(child_stream &stream) {
    char buf[BUF_SIZE];
    ssize_t nread = read(stream.fd, buf, BUF_SIZE);
    if (nread < 0) {
        if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) return;
        error(errno, "reading child output");
    }
    if (nread == 0) {  // EOF
        close_fd(stream.fd);
        return;
    }
    stream.total += nread;
    if (stream.data.size() < stream.limit)
        stream.data.append(buf, min<size_t>(nread, stream.limit - stream.data.size()));
}

/**
 * @brief 等待任意一个输出流可读，并读取数据
 * @param timeout_ms 最多等待多少毫秒，为 0 时不等待
 * @return 是否有流可读
 */
static bool poll_streams(child_stream &out, child_stream &err, int timeout_ms) {
    child_stream *owners[2];
    pollfd fds[2];
    nfds_t n = 0;
    for (child_stream *stream : {&out, &err}) {
        if (stream->fd < 0) continue;
        fds[n].fd = stream->fd;
        fds[n].events = POLLIN;
        fds[n].revents = 0;
        owners[n++] = stream;
    }

    if (n == 0) {  // 子进程关闭了输出，但还没有退出
        if (timeout_ms > 0) usleep(timeout_ms * 1000);
        return false;
    }

    int r = poll(fds, n, timeout_ms);
    if (r < 0) {
        if (errno == EINTR) return false;
        error(errno, "waiting for child output");
    }
    for (nfds_t i = 0; i < n; ++i)
        if (fds[i].revents & (POLLIN | POLLHUP | POLLERR))
            pump(*owners[i]);
    return r > 0;
}

/**
 * @brief 检查子进程是否已经退出，但不回收子进程
 * 子进程保持僵尸状态时进程组仍然存在，之后可以安全地向进程组发送信号
 */
static bool child_exited(pid_t pid) {
    siginfo_t info;
    info.si_pid = 0;
    if (waitid(P_PID, pid, &info, WEXITED | WNOHANG | WNOWAIT) != 0) {
        if (errno == EINTR) return false;
        error(errno, "waiting on child");
    }
    return info.si_pid == pid;
}

static int reap(pid_t pid) {
    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) error(errno, "waiting on child");
    }
    return status;
}

static void kill_group(pid_t pid) {
    if (kill(-pid, SIGKILL) == 0) return;
    if (errno != ESRCH)
        LOG(WARNING) << "Unable to send SIGKILL to process group " << pid << ": " << strerror(errno);
    // 子进程可能还没来得及调用 setpgid
    if (kill(pid, SIGKILL) != 0 && errno != ESRCH)
        LOG(WARNING) << "Unable to send SIGKILL to process " << pid << ": " << strerror(errno);
}

/**
 * @brief 将以秒为单位的时间限制转换为 steady_clock 的时长
 * 超出 steady_clock 表示范围的时间限制（包括 inf）被截断为一半的最大值，
 * 负数和 nan 视为 0
 */
static chrono::steady_clock::duration to_duration(double timeout) {
    static const double MAX_TIMEOUT = chrono::duration<double>(chrono::steady_clock::duration::max()).count() / 2;
    if (!(timeout > 0)) return chrono::steady_clock::duration::zero();
    if (timeout >= MAX_TIMEOUT) return chrono::steady_clock::duration::max() / 2;
    return chrono::duration_cast<chrono::steady_clock::duration>(chrono::duration<double>(timeout));
}

// 子进程中只能调用 async-signal-safe 的函数
[[noreturn]] static void exit_with_errno(int status_fd) {
    int err = errno;
    ssize_t written = write(status_fd, &err, sizeof(err));
    (void)written;
    _exit(127);
}

executor::executor(vector<string> interpreter, fs::path scratch_dir, size_t max_output_size)
    : interpreter(move(interpreter)), scratch_dir(move(scratch_dir)), max_output_size(max_output_size) {
    if (this->interpreter.empty())
        throw invalid_argument("interpreter command should not be empty");
}

executor::executor()
    : executor({PYTHON_EXECUTABLE}, default_scratch_dir(), MAX_OUTPUT_SIZE) {}

const vector<string> &executor::get_interpreter() const {
    return interpreter;
}

const fs::path &executor::get_scratch_dir() const {
    return scratch_dir;
}

execution_outcome executor::execute(const string &code, double timeout) const {
    fs::path source_file;
    defer {
        if (source_file.empty()) return;
        error_code ec;
        fs::remove(source_file, ec);
        if (ec) LOG(WARNING) << "Unable to delete " << source_file << ": " << ec.message();
    };

    try {
        fs::create_directories(scratch_dir);
        // 每次执行使用不同的文件名，多个 worker 可以共享同一个 scratch_dir
        string uuid = boost::lexical_cast<string>(boost::uuids::random_generator()());
        source_file = scratch_dir / (uuid + ".py");
        write_file_content(source_file, code);
        return run(source_file, timeout);
    } catch (std::exception &ex) {
        LOG(WARNING) << "Unable to execute " << source_file << ": " << ex.what();
        return outcome::failed{ex.what()};
    }
}

execution_outcome executor::run(const fs::path &source_file, double timeout) const {
    vector<string> args;
    to_string_list(args, interpreter, source_file);
    vector<char *> argv;
    for (auto &arg : args) argv.push_back(arg.data());
    argv.push_back(nullptr);

    int stdout_pipe[2] = {-1, -1}, stderr_pipe[2] = {-1, -1}, status_pipe[2] = {-1, -1};
    defer {
        for (int *p : {stdout_pipe, stderr_pipe, status_pipe}) {
            close_fd(p[PIPE_IN]);
            close_fd(p[PIPE_OUT]);
        }
    };

    // 所有管道都设置 close-on-exec，避免并发执行时泄漏给其他子进程
    if (pipe2(stdout_pipe, O_CLOEXEC) != 0) error(errno, "creating pipe for stdout");
    if (pipe2(stderr_pipe, O_CLOEXEC) != 0) error(errno, "creating pipe for stderr");
    if (pipe2(status_pipe, O_CLOEXEC) != 0) error(errno, "creating status pipe");

    pid_t pid = fork();
    if (pid < 0) error(errno, "unable to fork");

    if (pid == 0) {  // 子进程
        setpgid(0, 0);

        sigset_t emptymask;
        sigemptyset(&emptymask);
        sigprocmask(SIG_SETMASK, &emptymask, nullptr);

        int devnull = open("/dev/null", O_RDONLY);
        if (devnull < 0 || dup2(devnull, STDIN_FILENO) < 0)
            exit_with_errno(status_pipe[PIPE_IN]);
        if (devnull > STDERR_FILENO) close(devnull);

        // dup2 产生的文件描述符不带 close-on-exec
        if (dup2(stdout_pipe[PIPE_IN], STDOUT_FILENO) < 0 ||
            dup2(stderr_pipe[PIPE_IN], STDERR_FILENO) < 0)
            exit_with_errno(status_pipe[PIPE_IN]);

        execvp(argv[0], argv.data());
        exit_with_errno(status_pipe[PIPE_IN]);
    }

    // 父进程
    bool reaped = false;
    defer {
        // 出现异常时也不能留下子进程
        if (reaped) return;
        kill_group(pid);
        int status;
        while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
    };

    // 和子进程同时设置进程组，避免 kill 时子进程还没有执行到 setpgid
    if (setpgid(pid, pid) != 0 && errno != EACCES && errno != ESRCH)
        LOG(WARNING) << "Unable to set process group of " << pid << ": " << strerror(errno);

    for (int *p : {stdout_pipe, stderr_pipe, status_pipe})
        close_fd(p[PIPE_IN]);

    // exec 成功时状态管道因为 close-on-exec 被关闭，读到 EOF；否则读到子进程的 errno
    int exec_errno = 0;
    ssize_t n;
    do {
        n = read(status_pipe[PIPE_OUT], &exec_errno, sizeof(exec_errno));
    } while (n < 0 && errno == EINTR);
    close_fd(status_pipe[PIPE_OUT]);

    if (n == sizeof(exec_errno)) {
        reap(pid);
        reaped = true;
        return outcome::failed{fmt::format("unable to start {}: {}", args[0], strerror(exec_errno))};
    }

    for (int fd : {stdout_pipe[PIPE_OUT], stderr_pipe[PIPE_OUT]}) {
        int flags = fcntl(fd, F_GETFL);
        if (flags == -1 || fcntl(fd, F_SETFL, flags | O_NONBLOCK) == -1)
            error(errno, "setting pipe to non-blocking mode");
    }

    child_stream out{stdout_pipe[PIPE_OUT], max_output_size};
    child_stream err{stderr_pipe[PIPE_OUT], max_output_size};

    auto deadline = chrono::steady_clock::now() + to_duration(timeout);
    bool timed_out = false;
    while (true) {
        if (child_exited(pid)) break;

        auto now = chrono::steady_clock::now();
        if (now >= deadline) {
            timed_out = true;
            break;
        }

        auto wait = min(chrono::ceil<chrono::milliseconds>(deadline - now), POLL_INTERVAL);
        poll_streams(out, err, (int)wait.count());
    }

    // 超时时杀死子进程；正常退出时清理子进程遗留在进程组中的孙进程
    kill_group(pid);
    int status = reap(pid);
    reaped = true;

    // 读出管道中剩余的数据
    while ((out.fd >= 0 || err.fd >= 0) && poll_streams(out, err, 0)) {}

    if (out.total > out.data.size() || err.total > err.data.size())
        DLOG(INFO) << "Output of " << source_file << " truncated, stdout " << out.total << " bytes, stderr " << err.total << " bytes";

    if (timed_out) {
        DLOG(INFO) << "Execution of " << source_file << " timed out after " << timeout << "s";
        return outcome::timed_out{};
    }

    if (WIFEXITED(status)) {
        int exitcode = WEXITSTATUS(status);
        if (exitcode == 0)
            return outcome::passed{move(out.data)};

        string message = boost::algorithm::trim_copy(err.data);
        if (message.empty()) message = fmt::format("process exited with code {}", exitcode);
        return outcome::failed{message};
    } else if (WIFSIGNALED(status)) {
        int sig = WTERMSIG(status);
        string message = boost::algorithm::trim_copy(err.data);
        if (message.empty()) message = fmt::format("process terminated by signal {} ({})", sig, strsignal(sig));
        return outcome::failed{message};
    } else {
        return outcome::failed{fmt::format("unknown status: {:x}", status)};
    }
}

}  // namespace codeeval
