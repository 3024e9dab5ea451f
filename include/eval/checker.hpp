#pragma once

#include <optional>
#include <string>
#include "common/status.hpp"
#include "eval/executor.hpp"
#include "eval/problem.hpp"

namespace codeeval {

/**
 * @brief 一个候选代码的评测结论
 */
struct verdict {
    std::string task_id;

    /**
     * @brief 该样本在同一题目的所有样本中的编号，按照样本出现的顺序从 0 开始
     * 直接调用 checker 而不经过 evaluator 时可以为空
     */
    std::optional<std::size_t> completion_id;

    /**
     * @brief 当且仅当 outcome 为 passed 时为真
     */
    bool passed;

    execution_outcome outcome;

    /**
     * @brief 写入结果文件的字符串，见 to_result_string
     */
    std::string result() const;
};

/**
 * @brief 拼接出完整的测试程序
 * 程序由题面、候选代码、隐藏测试和对 check 函数的调用组成：
 * prompt + completion + "\n" + test + "\n" + "check(" + entry_point + ")"
 */
std::string build_check_program(const problem &prob, const std::string &completion);

/**
 * @brief 评测一个候选代码是否能通过题目的隐藏测试
 */
struct checker {
    virtual ~checker();

    /**
     * @brief 评测一个候选代码
     * 这个函数可以并发调用
     * @param prob 候选代码对应的题目
     * @param completion 候选代码
     * @param timeout 时间限制，单位为秒
     * @param completion_id 样本编号，原样保存在结果中
     */
    virtual verdict check(const problem &prob, const std::string &completion, double timeout,
                          std::optional<std::size_t> completion_id = std::nullopt) const = 0;
};

/**
 * @brief 在子进程中执行测试程序的评测器
 */
struct program_checker : public checker {
    explicit program_checker(executor exec);

    verdict check(const problem &prob, const std::string &completion, double timeout,
                  std::optional<std::size_t> completion_id = std::nullopt) const override;

    const executor &get_executor() const;

private:
    executor exec;
};

}  // namespace codeeval
