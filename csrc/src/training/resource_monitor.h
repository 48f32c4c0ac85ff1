// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef LOGSENTINEL_SRC_TRAINING_RESOURCE_MONITOR_H
#define LOGSENTINEL_SRC_TRAINING_RESOURCE_MONITOR_H

#include <chrono>
#include <condition_variable>
#include <exception>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

#include "training/collaborators.h"

//! One point of the process resource time series.
struct ResourceSample {
    double TimeSec = 0.0;       ///< since start()
    double RssMiB = 0.0;
    double CpuTimeSec = 0.0;    ///< user + system
    double CpuPercent = 0.0;    ///< over the preceding interval
};

//! Reads the current process' resident set size and CPU time from /proc/self.
std::optional<ResourceSample> read_process_usage();

/**
 * @brief Background sampler of the process' memory and CPU usage.
 *
 * start() launches one sampling thread; stop() wakes and joins it and returns all samples as
 * `{"interval_ms": ..., "samples": [{"time_sec", "rss_mib", "cpu_time_sec", "cpu_percent"}, ...]}`.
 * The monitor runs at most once; calling stop() again returns the same series.
 */
class SystemResourceMonitor final : public IResourceMonitor {
public:
    explicit SystemResourceMonitor(std::chrono::milliseconds interval = std::chrono::milliseconds(1000));
    ~SystemResourceMonitor() override;

    void start() override;
    nlohmann::json stop() override;

    [[nodiscard]] std::size_t num_samples() const;

private:
    void sample_loop(std::stop_token stop);
    void record_sample(std::chrono::steady_clock::time_point begin);
    [[nodiscard]] nlohmann::json to_json() const;

    std::chrono::milliseconds mInterval;
    mutable std::mutex mMutex;
    std::condition_variable_any mWakeup;
    std::vector<ResourceSample> mSamples;
    std::exception_ptr mError;
    bool mStarted = false;
    std::jthread mThread;
};

#endif //LOGSENTINEL_SRC_TRAINING_RESOURCE_MONITOR_H
