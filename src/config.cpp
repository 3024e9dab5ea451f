#include "config.hpp"

namespace codeeval {
using namespace std;

filesystem::path SCRATCH_DIR;
string PYTHON_EXECUTABLE = "python3";
double DEFAULT_TIMEOUT = 3.0;          // 3s
size_t MAX_OUTPUT_SIZE = 1 << 20;      // 1M
size_t PROGRESS_INTERVAL = 100;

filesystem::path default_scratch_dir() {
    if (!SCRATCH_DIR.empty()) return SCRATCH_DIR;
    return filesystem::temp_directory_path() / "codeeval";
}

}  // namespace codeeval
