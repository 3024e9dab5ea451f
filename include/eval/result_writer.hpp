#pragma once

#include <filesystem>
#include "eval/evaluator.hpp"

namespace codeeval {

/**
 * @brief 将评测结论合并到样本中并写入结果文件
 * 按照样本文件中的顺序重新读取每个样本，取出该样本所属题目中下一个尚未使用的评测结论
 * （按 completion_id 从小到大），在原样本的基础上加入 result 和 passed 两个字段后写出。
 * 样本中的其他字段原样保留。
 * @param sample_file 样本文件，必须和评测时使用的是同一个文件
 * @param result 评测结论
 * @param out_path 结果文件，以 .gz 结尾时使用 gzip 压缩
 * @param append 为真时追加到结果文件末尾，否则覆盖
 * @return 写出的记录数
 * @throw evaluation_error 某个样本已经没有对应的评测结论，说明样本文件和评测结论不匹配
 * @throw dataset_error 样本文件无法读取或者结果文件无法写入
 */
std::size_t combine_and_write(const std::filesystem::path &sample_file, const evaluation_result &result,
                              const std::filesystem::path &out_path, bool append = false);

}  // namespace codeeval
