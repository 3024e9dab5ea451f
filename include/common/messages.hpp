#pragma once

#include <cstddef>
#include <string>

namespace codeeval {
struct problem;
}

namespace codeeval::message {

/**
 * @brief evaluator 分发给 worker 的评测任务
 * 一个任务对应样本文件中的一个样本
 */
struct check_task {
    /**
     * @brief 样本对应的题目，由 evaluator 在分发前查找
     * 指向评测期间只读的题目集合
     */
    const problem *prob;

    /**
     * @brief 样本在同一题目中的编号，在分发前按照样本出现的顺序分配
     */
    std::size_t completion_id;

    /**
     * @brief 候选代码，指向评测期间只读的样本列表
     */
    const std::string *completion;
};

}  // namespace codeeval::message
