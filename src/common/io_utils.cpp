#include "common/io_utils.hpp"
#include <fstream>
#include <system_error>

namespace codeeval {
using namespace std;

void write_file_content(const filesystem::path &path, const string &content) {
    ofstream fout(path, ios::out | ios::binary | ios::trunc);
    if (!fout)
        throw system_error(errno, system_category(), "unable to create file " + path.string());
    fout.write(content.data(), content.size());
    fout.close();
    if (!fout)
        throw system_error(errno, system_category(), "unable to write file " + path.string());
}

bool is_gzip_path(const filesystem::path &path) {
    return path.extension() == ".gz";
}

}  // namespace codeeval
