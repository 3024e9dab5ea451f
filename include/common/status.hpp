#pragma once

#include <string>
#include <variant>

namespace codeeval {

/**
 * @brief 表示一次执行的评测结果
 */
enum class status {
    /**
     * @brief 程序在时间限制内以返回值 0 退出
     * 程序的标准输出不影响评测结果
     */
    PASSED = 0,

    /**
     * @brief 程序运行时间超出限制，已被强制终止
     */
    TIMED_OUT = 1,

    /**
     * @brief 程序以非 0 返回值退出、被信号终止，或者根本无法启动
     * 测试用例中的 assert 失败、语法错误、未捕获的异常都属于这一类
     */
    FAILED = 2
};

const char *get_display_message(status);

namespace outcome {

struct passed {
    /**
     * @brief 程序的标准输出，仅供查看，不参与评测
     */
    std::string output;
};

struct timed_out {};

struct failed {
    /**
     * @brief 失败原因，一般是去掉首尾空白后的标准错误输出
     */
    std::string message;
};

}  // namespace outcome

/**
 * @brief 一次执行的结果，只能是通过、超时、失败三者之一
 */
using execution_outcome = std::variant<outcome::passed, outcome::timed_out, outcome::failed>;

status get_status(const execution_outcome &result);

/**
 * @brief 结果写入文件时使用的字符串
 * @return "passed"、"timed out" 或者 "failed: <message>"
 */
std::string to_result_string(const execution_outcome &result);

}  // namespace codeeval
