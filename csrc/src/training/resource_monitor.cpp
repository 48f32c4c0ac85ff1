// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "training/resource_monitor.h"

#include <cstdio>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>

#include <unistd.h>

#include <fmt/core.h>

std::optional<ResourceSample> read_process_usage() {
    ResourceSample sample;

    std::ifstream status("/proc/self/status");
    if (!status.is_open()) return std::nullopt;
    std::string line;
    bool found_rss = false;
    while (std::getline(status, line)) {
        if (line.rfind("VmRSS:", 0) == 0) {
            std::istringstream fields(line.substr(6));
            long kib = 0;
            fields >> kib;
            sample.RssMiB = static_cast<double>(kib) / 1024.0;
            found_rss = true;
            break;
        }
    }
    if (!found_rss) return std::nullopt;

    std::ifstream stat("/proc/self/stat");
    if (!stat.is_open()) return std::nullopt;
    std::string content;
    std::getline(stat, content);
    // the command name may contain spaces; fields resume after the closing parenthesis
    auto close = content.rfind(')');
    if (close == std::string::npos) return std::nullopt;
    std::istringstream fields(content.substr(close + 2));
    std::string skip;
    // fields 3..13 precede utime (14) and stime (15)
    for (int i = 0; i < 11; ++i) fields >> skip;
    long utime = 0, stime = 0;
    fields >> utime >> stime;
    if (!fields) return std::nullopt;

    const long ticks = sysconf(_SC_CLK_TCK);
    sample.CpuTimeSec = static_cast<double>(utime + stime) / static_cast<double>(ticks > 0 ? ticks : 100);
    return sample;
}

SystemResourceMonitor::SystemResourceMonitor(std::chrono::milliseconds interval) : mInterval(interval) {
    if (interval.count() <= 0) {
        throw std::invalid_argument(fmt::format("SystemResourceMonitor: interval must be positive, got {} ms", interval.count()));
    }
}

SystemResourceMonitor::~SystemResourceMonitor() {
    if (mThread.joinable()) {
        mThread.request_stop();
        mWakeup.notify_all();
        mThread.join();
    }
}

void SystemResourceMonitor::start() {
    std::lock_guard<std::mutex> lock(mMutex);
    if (mStarted) {
        throw std::logic_error("SystemResourceMonitor: already started");
    }
    mStarted = true;
    mThread = std::jthread([this](std::stop_token stop) { sample_loop(stop); });
}

void SystemResourceMonitor::record_sample(std::chrono::steady_clock::time_point begin) {
    auto sample = read_process_usage();
    if (!sample) return;
    sample->TimeSec = std::chrono::duration<double>(std::chrono::steady_clock::now() - begin).count();

    std::lock_guard<std::mutex> lock(mMutex);
    if (!mSamples.empty()) {
        const auto& prev = mSamples.back();
        const double dt = sample->TimeSec - prev.TimeSec;
        if (dt > 0.0) {
            sample->CpuPercent = 100.0 * (sample->CpuTimeSec - prev.CpuTimeSec) / dt;
        }
    }
    mSamples.push_back(*sample);
}

void SystemResourceMonitor::sample_loop(std::stop_token stop) {
    try {
        const auto begin = std::chrono::steady_clock::now();
        record_sample(begin);
        while (!stop.stop_requested()) {
            {
                std::unique_lock<std::mutex> lock(mMutex);
                mWakeup.wait_for(lock, stop, mInterval, [] { return false; });
            }
            record_sample(begin);
        }
    } catch (const std::exception&) {
        std::lock_guard<std::mutex> lock(mMutex);
        mError = std::current_exception();
    }
}

/**
 * @brief Stop sampling, join the sampler and return the collected series.
 *
 * A final sample is taken when the sampler wakes up, so every started monitor returns at
 * least one sample. An error raised inside the sampler is rethrown here.
 */
nlohmann::json SystemResourceMonitor::stop() {
    if (mThread.joinable()) {
        mThread.request_stop();
        mWakeup.notify_all();
        mThread.join();
    }

    std::lock_guard<std::mutex> lock(mMutex);
    if (mError) {
        auto error = mError;
        mError = nullptr;
        std::rethrow_exception(error);
    }
    return to_json();
}

std::size_t SystemResourceMonitor::num_samples() const {
    std::lock_guard<std::mutex> lock(mMutex);
    return mSamples.size();
}

nlohmann::json SystemResourceMonitor::to_json() const {
    nlohmann::json samples = nlohmann::json::array();
    for (const auto& s : mSamples) {
        samples.push_back({{"time_sec", s.TimeSec}, {"rss_mib", s.RssMiB}, {"cpu_time_sec", s.CpuTimeSec},
                           {"cpu_percent", s.CpuPercent}});
    }
    return {{"interval_ms", mInterval.count()}, {"samples", samples}};
}
