#pragma once

#include <cstddef>
#include "eval/checker.hpp"

namespace codeeval {

struct evaluation_result;

/**
 * @brief 执行监控行为
 * 监控器的回调函数在 evaluator 的锁内被调用，不会并发执行
 */
struct monitor {
    virtual ~monitor();

    /**
     * @brief 监控上报开始评测
     * @param total 本次评测的样本总数
     */
    virtual void start_evaluation(std::size_t total);

    /**
     * @brief 监控上报某个样本已经评测结束
     * @param worker_id 执行评测的 worker 编号，顺序评测时为 0
     * @param result 样本的评测结论
     */
    virtual void end_sample(int worker_id, const verdict &result);

    /**
     * @brief 监控上报所有样本都已评测结束
     */
    virtual void end_evaluation(const evaluation_result &result);
};

}  // namespace codeeval
