#pragma once

#include <boost/iostreams/filtering_stream.hpp>
#include <filesystem>
#include <fstream>
#include <functional>
#include <nlohmann/json.hpp>
#include <vector>

/**
 * 这个头文件包含 JSON Lines 文件的读写
 * 每一行是一个 JSON 对象，空行（只包含空白字符的行）会被跳过。
 * 路径以 .gz 结尾时，读写都会经过 gzip 解压/压缩。
 */
namespace codeeval {

/**
 * @brief 逐行读取 JSONL 文件，每解析出一条记录就调用一次 callback
 * callback 中抛出的 std::invalid_argument 和 nlohmann::json::exception
 * 会被包装成带有文件名和行号的 dataset_error
 * @param path 文件路径
 * @param callback 处理一条记录，参数可以被移动走
 * @throw dataset_error 文件无法打开、gzip 数据损坏、某一行不是合法的 JSON
 */
void stream_jsonl(const std::filesystem::path &path, const std::function<void(nlohmann::json &)> &callback);

/**
 * @brief 读取整个 JSONL 文件
 */
std::vector<nlohmann::json> read_jsonl(const std::filesystem::path &path);

/**
 * @brief 以 JSONL 格式逐条写入文件
 * 以追加模式写入 gzip 文件时，会在文件末尾追加一个新的 gzip member，
 * 解压时多个 member 会被依次拼接。
 */
struct jsonl_writer {
    /**
     * @param path 文件路径
     * @param append 为真时追加到文件末尾，否则覆盖原文件
     * @throw dataset_error 文件无法打开
     */
    jsonl_writer(const std::filesystem::path &path, bool append = false);
    ~jsonl_writer();

    jsonl_writer(const jsonl_writer &) = delete;
    jsonl_writer &operator=(const jsonl_writer &) = delete;

    void write(const nlohmann::json &record);

    /**
     * @brief 写入 gzip 尾部并关闭文件
     * @throw dataset_error 写入失败
     */
    void close();

    std::size_t count() const;

private:
    std::filesystem::path path;
    std::ofstream file;
    boost::iostreams::filtering_ostream out;
    std::size_t written = 0;
    bool closed = false;
};

/**
 * @brief 将 records 写入 JSONL 文件
 */
void write_jsonl(const std::filesystem::path &path, const std::vector<nlohmann::json> &records, bool append = false);

}  // namespace codeeval
