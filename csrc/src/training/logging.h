// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// Copyright (c) 2025, IST Austria, developed by Erik Schultheis
// SPDX-License-Identifier: Apache-2.0
//

#ifndef LOGSENTINEL_SRC_TRAINING_LOGGING_H
#define LOGSENTINEL_SRC_TRAINING_LOGGING_H

#include <chrono>
#include <cstdint>
#include <fstream>
#include <functional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

class LogDataset;
class TensorAllocator;

class TrainingRunLogger
{
public:
    enum EVerbosity {
        SILENT = -2,
        QUIET = -1,
        DEFAULT = 0,
        VERBOSE = 1
    };

    using OptionValue = std::variant<bool, std::int64_t, float, std::string>;

    //! An empty `file_name` disables the JSON log file; console output is unaffected.
    TrainingRunLogger(const std::string& file_name, EVerbosity verbosity);
    ~TrainingRunLogger();

    void set_callback(std::function<void(std::string_view)> cb);
    [[nodiscard]] EVerbosity verbosity() const { return mVerbosity; }

    void log_options(const std::vector<std::pair<std::string, OptionValue>>& options);
    void log_dataset(const LogDataset& train, const LogDataset& test, std::size_t index_count);
    void log_phase_start(int phase, const std::string& name, int epochs, float lr, std::size_t trainable_params);
    void log_phase_end(int phase, const std::string& name, const std::string& result, long duration_ms);
    void log_step(int step, const std::string& phase, int duration_ms, float norm, float loss, float lr,
                  float progress, double etc_seconds, bool skipped);
    void log_eval(int records, int excluded, int duration_ms, float accuracy, float precision, float recall, float f1);
    void log_allocator(const TensorAllocator& allocator);

    // call at the beginning and end of a section of processing.
    // will record the time between the two calls
    class RAII_Section {
    public:
        ~RAII_Section() noexcept {
            if(mLogger)
                mLogger->log_section_end();
        };
    private:
        RAII_Section(TrainingRunLogger* l) : mLogger(l) {}
        RAII_Section(RAII_Section&&) = default;
        TrainingRunLogger* mLogger;

        friend class TrainingRunLogger;
    };

    void log_message(int step, const std::string& msg);
    RAII_Section log_section_start(int step, const std::string& info);
    void log_section_end();
private:
    void log_line(std::string_view line);
    std::string mFileName;
    std::fstream mLogFile;
    bool mFirst = true;

    EVerbosity mVerbosity;

    // loss trend for the console line
    float mPreviousLoss = -1.f;

    // arbitrary callback for log lines
    std::function<void(std::string_view)> mCallback;

    // log section is a two-step process, here we save intermediaries
    std::string mSectionInfo;
    int mSectionStep = 0;
    std::chrono::steady_clock::time_point mSectionStart;
};

#endif //LOGSENTINEL_SRC_TRAINING_LOGGING_H
