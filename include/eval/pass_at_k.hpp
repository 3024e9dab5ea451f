#pragma once

#include <map>
#include <string>
#include <vector>
#include "eval/evaluator.hpp"

namespace codeeval {

/**
 * @brief 计算一道题目 pass@k 的无偏估计
 * 从 n 个样本（其中 c 个正确）中不放回地抽取 k 个，至少有一个正确的概率：
 * 1 - C(n-c, k) / C(n, k) = 1 - prod_{i=n-c+1}^{n} (1 - k / i)
 * 使用连乘而不是组合数，避免 n 较大时溢出。
 * @param n 样本数
 * @param c 正确的样本数
 * @param k 抽取的样本数
 * @return n - c < k 时为 1.0，否则为上式，结果在 [0, 1] 之间
 * @throw std::invalid_argument k 为 0，或者 c > n
 */
double estimate_pass_at_k(std::size_t n, std::size_t c, std::size_t k);

/**
 * @brief 对每道题目分别计算 pass@k 的无偏估计
 * @param totals 每道题目的样本数
 * @param corrects 每道题目正确的样本数
 * @throw std::invalid_argument totals 和 corrects 长度不同
 */
std::vector<double> estimate_pass_at_k(const std::vector<std::size_t> &totals, const std::vector<std::size_t> &corrects, std::size_t k);

/**
 * @brief 所有题目的样本数均为 total 时的 pass@k
 */
std::vector<double> estimate_pass_at_k(std::size_t total, const std::vector<std::size_t> &corrects, std::size_t k);

/**
 * @brief 一项评测指标，如 pass@10
 */
struct metric {
    std::string name;
    std::size_t k;
    double value;
};

/**
 * @brief 计算所有题目 pass@k 的平均值
 * 只有所有题目的样本数都不小于 k 时才会计算 pass@k，否则直接跳过该 k。
 * 没有题目时不产生任何指标。
 * @param counts 每道题目的统计数据
 * @param ks 需要计算的 k，按照给出的顺序输出，重复的 k 只输出一次
 */
std::vector<metric> compute_pass_at_k(const std::map<std::string, task_counts> &counts, const std::vector<std::size_t> &ks);

/**
 * @brief 解析以逗号分隔的 k 列表，如 "1,10,100"
 * @throw std::invalid_argument 存在不是正整数的项
 */
std::vector<std::size_t> parse_k_list(const std::string &literal);

}  // namespace codeeval
