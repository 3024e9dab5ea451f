#pragma once

#include <filesystem>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

/**
 * 这个头文件包含评测数据
 * 包含：
 * 1. problem 类（表示一道题目及其隐藏测试）
 * 2. sample 类（表示模型生成的一个候选代码）
 */
namespace codeeval {

/**
 * @brief 表示一道题目
 * 题目在评测开始前一次性读入，评测过程中只读
 */
struct problem {
    /**
     * @brief 题目的唯一标识，如 HumanEval/0
     * 用于关联样本、评测结果和统计数据
     */
    std::string task_id;

    /**
     * @brief 题面，一般是函数签名和文档字符串
     * 候选代码会直接拼接在 prompt 之后
     */
    std::string prompt;

    /**
     * @brief 被测试的函数名，会作为参数传给测试代码中的 check 函数
     */
    std::string entry_point;

    /**
     * @brief 隐藏测试代码，必须定义 check(candidate) 函数
     */
    std::string test;

    /**
     * @brief 参考答案，评测时不使用
     */
    std::optional<std::string> canonical_solution;
};

/**
 * @brief 模型为某道题目生成的一个候选代码
 * 同一 task_id 的样本按照在文件中出现的顺序从 0 开始编号（completion_id）
 */
struct sample {
    std::string task_id;

    /**
     * @brief 候选的函数体
     */
    std::string completion;
};

/**
 * @brief 以 task_id 为键的题目集合
 */
using problem_set = std::map<std::string, problem>;

void from_json(const nlohmann::json &j, problem &p);

void from_json(const nlohmann::json &j, sample &s);

/**
 * @brief 读取题目文件（JSONL，可以是 .gz 压缩的）
 * 同一个 task_id 出现多次时，后出现的记录覆盖先出现的记录
 * @throw dataset_error 文件无法读取，或者记录缺少必需的字段
 */
problem_set read_problems(const std::filesystem::path &path);

/**
 * @brief 按照文件中的顺序读取所有样本
 * @throw dataset_error 文件无法读取，或者记录缺少 task_id、completion
 */
std::vector<sample> read_samples(const std::filesystem::path &path);

}  // namespace codeeval
