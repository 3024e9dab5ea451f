#include "common/jsonl.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/iostreams/filter/gzip.hpp>
#include <algorithm>
#include <cctype>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"

namespace codeeval {
using namespace std;
namespace io = boost::iostreams;

static bool is_blank(const string &line) {
    return all_of(line.begin(), line.end(), [](unsigned char c) { return isspace(c); });
}

void stream_jsonl(const filesystem::path &path, const function<void(nlohmann::json &)> &callback) {
    ifstream file(path, ios::in | ios::binary);
    if (!file)
        throw dataset_error(fmt::format("unable to open {}", path));

    io::filtering_istream in;
    if (is_gzip_path(path)) in.push(io::gzip_decompressor());
    in.push(file);

    string line;
    size_t line_no = 0;
    try {
        while (getline(in, line)) {
            ++line_no;
            if (is_blank(line)) continue;

            try {
                nlohmann::json record = nlohmann::json::parse(line);
                callback(record);
            } catch (nlohmann::json::exception &e) {
                throw dataset_error(fmt::format("{}:{}: {}", path, line_no, e.what()));
            } catch (invalid_argument &e) {
                throw dataset_error(fmt::format("{}:{}: {}", path, line_no, e.what()));
            }
        }
    } catch (io::gzip_error &e) {
        throw dataset_error(fmt::format("{}: corrupted gzip stream after line {}: {}", path, line_no, e.what()));
    }

    // 流内部的异常默认不会抛出，只会设置 badbit
    if (in.bad())
        throw dataset_error(fmt::format("{}: read error after line {}", path, line_no));
}

vector<nlohmann::json> read_jsonl(const filesystem::path &path) {
    vector<nlohmann::json> records;
    stream_jsonl(path, [&](nlohmann::json &record) {
        records.push_back(move(record));
    });
    return records;
}

jsonl_writer::jsonl_writer(const filesystem::path &path, bool append)
    : path(path), file(path, ios::out | ios::binary | (append ? ios::app : ios::trunc)) {
    if (!file)
        throw dataset_error(fmt::format("unable to open {} for writing", path));
    if (is_gzip_path(path)) out.push(io::gzip_compressor());
    out.push(file);
}

jsonl_writer::~jsonl_writer() {
    if (closed) return;
    try {
        close();
    } catch (std::exception &e) {
        LOG(ERROR) << "Unable to finish writing " << path << ": " << e.what();
    }
}

void jsonl_writer::write(const nlohmann::json &record) {
    out << record.dump() << '\n';
    ++written;
}

void jsonl_writer::close() {
    if (closed) return;
    closed = true;
    out.reset();  // 弹出所有 filter，gzip_compressor 在此时写入尾部
    file.close();
    if (!file)
        throw dataset_error(fmt::format("unable to write {}", path));
}

size_t jsonl_writer::count() const {
    return written;
}

void write_jsonl(const filesystem::path &path, const vector<nlohmann::json> &records, bool append) {
    jsonl_writer writer(path, append);
    for (auto &record : records)
        writer.write(record);
    writer.close();
}

}  // namespace codeeval
