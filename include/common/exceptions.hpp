#pragma once

#include <boost/stacktrace.hpp>
#include <memory>
#include <ostream>
#include <string>
#include <stdexcept>

namespace codeeval {

/**
 * @brief 评测过程中无法在本地恢复的错误的基类
 * 单个样本执行失败、超时都不会抛出异常，而是被记录成 execution_outcome，
 * 只有会导致整次评测结果不可信的错误才会抛出 evaluation_error。
 */
struct evaluation_error : std::exception {
    explicit evaluation_error(const std::string &message);

    friend std::ostream &operator<<(std::ostream &os, const evaluation_error &ex);

    const char *what() const noexcept override;

private:
    std::string message;
    std::shared_ptr<boost::stacktrace::stacktrace> stacktrace;
};

/**
 * @brief 样本引用了题目集合中不存在的 task_id
 * 说明样本文件和题目文件不匹配
 */
struct unknown_task_error : public evaluation_error {
    explicit unknown_task_error(const std::string &task_id);
};

/**
 * @brief 存在没有任何样本的题目，评测未完成
 * 此时计算出来的 pass@k 会产生误导，因此直接终止
 */
struct incomplete_evaluation_error : public evaluation_error {
    explicit incomplete_evaluation_error(const std::string &message);
};

/**
 * @brief 数据文件无法打开、某一行不是合法的 JSON，或者缺少必需的字段
 */
struct dataset_error : public evaluation_error {
    explicit dataset_error(const std::string &message);
};

}  // namespace codeeval
