#include "monitor/monitor.hpp"

namespace codeeval {

monitor::~monitor() {}

void monitor::start_evaluation(std::size_t) {}

void monitor::end_sample(int, const verdict &) {}

void monitor::end_evaluation(const evaluation_result &) {}

}  // namespace codeeval
