#pragma once

#include <cstddef>
#include <filesystem>
#include <string>

namespace codeeval {

/**
 * @brief 存放待执行程序的临时目录
 * 每次执行都会在这个目录下生成一个以随机 uuid 命名的 .py 文件，
 * 执行结束后（无论成功、失败、超时）该文件都会被删除。
 * 为空时使用系统临时目录下的 codeeval 文件夹，见 default_scratch_dir()
 *
 * SCRATCH_DIR
 * ├── 1b4e28ba-2fa1-11d2-883f-0016d3cca427.py // 正在执行的程序
 * └── ...
 */
extern std::filesystem::path SCRATCH_DIR;

/**
 * @brief 执行候选代码所使用的 Python 解释器
 * 可以是绝对路径，也可以是在 PATH 中查找的程序名
 */
extern std::string PYTHON_EXECUTABLE;

/**
 * @brief 每个样本的默认执行时间限制
 * @note 单位为秒
 */
extern double DEFAULT_TIMEOUT;

/**
 * @brief 子进程 stdout、stderr 各自最多保留多少字节
 * 超出部分仍会被读出（避免子进程因管道写满而阻塞），但会被丢弃
 */
extern std::size_t MAX_OUTPUT_SIZE;

/**
 * @brief 进度监控每评测多少个样本输出一次日志
 */
extern std::size_t PROGRESS_INTERVAL;

/**
 * @brief 根据 SCRATCH_DIR 计算实际使用的临时目录
 */
std::filesystem::path default_scratch_dir();

}  // namespace codeeval
