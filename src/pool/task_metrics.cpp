// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file task_metrics.cpp
 * @brief Derived metrics and JSON serialization
 */

#include <arbor/transfer/pool/task_metrics.h>

#include <sstream>

namespace arbor::transfer {

auto task_metrics::success_rate() const -> double {
    auto total = total_tasks();
    if (total == 0) {
        return 0.0;
    }
    return static_cast<double>(completed_tasks()) / static_cast<double>(total) * 100.0;
}

auto task_metrics::elapsed_time() const -> std::chrono::duration<double> {
    return std::chrono::duration<double>(clock::now() - start_time_);
}

auto task_metrics::throughput() const -> double {
    auto elapsed = elapsed_time().count();
    if (elapsed <= 0.0) {
        return 0.0;
    }
    return static_cast<double>(total_bytes_processed()) / elapsed;
}

auto task_metrics::snapshot(uint64_t active_tasks, std::size_t max_workers,
                            execution_mode mode) const -> metrics_snapshot {
    metrics_snapshot snap;
    // Read completion counters before the total so completed + failed <= total
    snap.completed_tasks = completed_tasks();
    snap.failed_tasks = failed_tasks();
    snap.total_tasks = total_tasks();
    snap.active_tasks = active_tasks;
    snap.total_bytes_processed = total_bytes_processed();
    snap.elapsed_time = elapsed_time().count();
    snap.success_rate = snap.total_tasks == 0
                            ? 0.0
                            : static_cast<double>(snap.completed_tasks) /
                                  static_cast<double>(snap.total_tasks) * 100.0;
    snap.throughput_bytes_per_sec =
        snap.elapsed_time > 0.0
            ? static_cast<double>(snap.total_bytes_processed) / snap.elapsed_time
            : 0.0;
    snap.max_workers = max_workers;
    snap.mode = mode;
    return snap;
}

auto metrics_snapshot::to_json() const -> std::string {
    std::ostringstream oss;
    oss << "{";
    oss << "\"total_tasks\":" << total_tasks << ",";
    oss << "\"completed_tasks\":" << completed_tasks << ",";
    oss << "\"failed_tasks\":" << failed_tasks << ",";
    oss << "\"active_tasks\":" << active_tasks << ",";
    oss << "\"success_rate\":" << success_rate << ",";
    oss << "\"throughput_bytes_per_sec\":" << throughput_bytes_per_sec << ",";
    oss << "\"total_bytes_processed\":" << total_bytes_processed << ",";
    oss << "\"elapsed_time\":" << elapsed_time << ",";
    oss << "\"max_workers\":" << max_workers << ",";
    oss << "\"execution_mode\":\"" << to_string(mode) << "\"";
    oss << "}";
    return oss.str();
}

}  // namespace arbor::transfer
