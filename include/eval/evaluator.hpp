#pragma once

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>
#include "eval/checker.hpp"
#include "eval/problem.hpp"
#include "monitor/monitor.hpp"

/**
 * 评测驱动
 * evaluator 按照样本在文件中出现的顺序为每个样本分配 completion_id，
 * 然后将样本分发给 worker 评测。
 *
 * workers 为 1 时在当前线程中依次评测；否则启动 workers 个线程，
 * 每个线程不断从评测队列中取出任务并调用 checker，直到队列为空。
 * 由于 completion_id 在分发之前就已经确定，且评测结束后结果按照 completion_id 排序，
 * 并发评测和顺序评测的结果完全相同。
 */
namespace codeeval {

/**
 * @brief 一道题目的统计数据
 */
struct task_counts {
    std::size_t total = 0;
    std::size_t correct = 0;
};

/**
 * @brief 一次评测的全部结论
 */
struct evaluation_result {
    /**
     * @brief 每道题目的评测结论，按照 completion_id 排序
     */
    std::map<std::string, std::vector<verdict>> results;

    /**
     * @brief 样本总数
     */
    std::size_t n_samples = 0;

    /**
     * @brief 统计每道题目的样本数和通过数
     */
    std::map<std::string, task_counts> counts() const;
};

struct evaluation_options {
    /**
     * @brief 每个样本的时间限制，单位为秒
     */
    double timeout;

    /**
     * @brief 并发评测的线程数，至少为 1
     */
    std::size_t workers = 1;
};

struct evaluator {
    explicit evaluator(const checker &chk);

    /**
     * @brief 注册监控器
     * 必须在 evaluate 之前调用
     */
    void register_monitor(std::unique_ptr<monitor> &&monitor);

    /**
     * @brief 评测所有样本
     * @param problems 题目集合
     * @param samples 按照文件顺序排列的样本
     * @throw unknown_task_error 存在样本引用了不存在的题目，此时不会执行任何样本
     * @throw incomplete_evaluation_error 存在没有任何样本的题目
     * @throw std::invalid_argument workers 为 0
     */
    evaluation_result evaluate(const problem_set &problems, const std::vector<sample> &samples, const evaluation_options &options);

private:
    const checker &chk;
    std::vector<std::unique_ptr<monitor>> monitors;

    void call_monitor(std::function<void(monitor &)> callback);
};

}  // namespace codeeval
