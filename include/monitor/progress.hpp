#pragma once

#include "common/utils.hpp"
#include "monitor/monitor.hpp"

namespace codeeval {

/**
 * @brief 通过 glog 输出评测进度的监控器
 * 每评测 interval 个样本输出一次进度，评测结束时输出总耗时和通过率
 */
struct progress_monitor : public monitor {
    explicit progress_monitor(std::size_t interval);

    void start_evaluation(std::size_t total) override;
    void end_sample(int worker_id, const verdict &result) override;
    void end_evaluation(const evaluation_result &result) override;

private:
    std::size_t interval;
    std::size_t total = 0;
    std::size_t finished = 0;
    std::size_t passed = 0;
    elapsed_time timer;
};

}  // namespace codeeval
