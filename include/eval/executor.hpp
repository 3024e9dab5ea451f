#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include "common/status.hpp"

namespace codeeval {

/**
 * @brief 在独立的子进程中执行一段程序代码，并限制时钟时间
 *
 * 执行流程：
 * 1. 在 scratch_dir 中创建以随机 uuid 命名的源文件，写入代码
 * 2. 创建 stdout、stderr 两个管道，以及一个用于回报 exec 失败的状态管道，
 *    所有管道都设置了 close-on-exec，子进程只能看到自己的 stdout/stderr
 * 3. 调用 fork 创建子进程
 *    1. 子进程调用 setpgid 进入独立的进程组，以便超时时通过 SIGKILL 杀死整个进程组
 *    2. 子进程将 stdin 重定向到 /dev/null，stdout/stderr 重定向到管道，然后 exec 解释器
 * 4. 父进程通过 poll 读取两个管道，直到子进程退出或者超过时间限制
 *    1. 超时：向进程组发送 SIGKILL，waitpid 回收子进程，返回 timed_out
 *    2. 子进程退出：向进程组发送 SIGKILL 清理残留的孙进程，回收子进程后根据返回值分类
 * 5. 无论结果如何，删除源文件，删除失败只记录日志
 *
 * 评测结果只取决于返回值、是否超时、是否启动失败，不会因为评测系统自身的错误而抛出异常。
 */
struct executor {
    /**
     * @param interpreter 解释器命令行，如 {"python3"}，源文件路径会被追加到最后
     * @param scratch_dir 存放临时源文件的目录，不存在时会自动创建
     * @param max_output_size stdout、stderr 各自最多保留多少字节
     */
    executor(std::vector<std::string> interpreter, std::filesystem::path scratch_dir, std::size_t max_output_size);

    /**
     * @brief 使用 config.hpp 中的 PYTHON_EXECUTABLE、SCRATCH_DIR、MAX_OUTPUT_SIZE 构造
     */
    executor();

    /**
     * @brief 执行一段代码
     * @param code 完整的、自包含的程序代码
     * @param timeout 时钟时间限制，单位为秒
     * @return passed（返回值为 0）、timed_out（超时被杀死）或 failed（其他情况，包括无法启动）
     */
    execution_outcome execute(const std::string &code, double timeout) const;

    const std::vector<std::string> &get_interpreter() const;

    const std::filesystem::path &get_scratch_dir() const;

private:
    std::vector<std::string> interpreter;
    std::filesystem::path scratch_dir;
    std::size_t max_output_size;

    execution_outcome run(const std::filesystem::path &source_file, double timeout) const;
};

}  // namespace codeeval
