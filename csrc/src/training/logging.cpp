// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// Copyright (c) 2025, IST Austria, developed by Erik Schultheis
// SPDX-License-Identifier: Apache-2.0
//

#include "logging.h"

#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <type_traits>

#include <fmt/core.h>
#include <fmt/chrono.h>
#include <nlohmann/json.hpp>

#include "training/dataset.h"
#include "utilities/allocator.h"
#include "utilities/utils.h"

namespace {

//! JSON string literal (quoted and escaped).
std::string quoted(std::string_view text) {
    return nlohmann::json(std::string(text)).dump();
}

}  // namespace

/**
 * @brief Create a logger that writes a JSON array to @p file_name.
 *
 * Ensures the parent directory exists, opens the file for output, and initializes it as
 * a JSON array (writes "[ ... ]"). With an empty file name, only console output is produced.
 *
 * @param file_name Output path for the JSON log, or empty.
 * @param verbosity Verbosity level controlling stdout printing.
 */
TrainingRunLogger::TrainingRunLogger(const std::string& file_name, EVerbosity verbosity) :
    mFileName(file_name), mVerbosity(verbosity)
{
    if(!mFileName.empty()) {
        auto log_path = std::filesystem::path(mFileName).parent_path();
        if (!log_path.empty()) {
            std::filesystem::create_directories(log_path);
        }
        mLogFile.open(mFileName, std::fstream::out);
        if (!mLogFile.is_open()) {
            throw std::runtime_error(fmt::format("could not open log file {}", mFileName));
        }
        mLogFile << "[\n";
        mLogFile << "\n]\n";
    }
}

/**
 * @brief Destructor; closes the log file if open.
 */
TrainingRunLogger::~TrainingRunLogger()
{
    if(mLogFile.is_open()) mLogFile.close();
}

/**
 * @brief Log configuration options.
 *
 * Each option is written as a JSON log line; verbose runs also print them.
 *
 * @param options Vector of (name, value) pairs; value may be bool, int64, float, or std::string.
 */
void TrainingRunLogger::log_options(const std::vector<std::pair<std::string, OptionValue>>& options) {
    int option_length = 0;
    for(auto& [name, value]: options) {
        option_length = std::max(option_length, static_cast<int>(name.size()));
    }

    if (mVerbosity >= 1) {
        printf("[Options]\n");
    }
    for(auto& [name, value]: options) {
        auto log = [&](auto&& v){
            using V = std::remove_cvref_t<decltype(v)>;
            if constexpr (std::is_same_v<V, std::string>) {
                log_line(fmt::format(R"(  {{"log": "option", "time": "{}", "step": 0, "name": "{}", "value": {}}})",
                                     std::chrono::system_clock::now(), name, ::quoted(v)));
            } else {
                log_line(fmt::format(R"(  {{"log": "option", "time": "{}", "step": 0, "name": "{}", "value": {}}})",
                                     std::chrono::system_clock::now(), name, v));
            }
            if (mVerbosity >= 1) {
                printf("  %-*s : %s\n", option_length, name.c_str(), fmt::format("{}", v).c_str());
            }
        };
        std::visit(log, value);
    }
}

/**
 * @brief Log train/test dataset sizes and label balance.
 *
 * @param train Training split.
 * @param test Held-out split.
 * @param index_count Size of the (possibly oversampled) training index set.
 */
void TrainingRunLogger::log_dataset(const LogDataset& train, const LogDataset& test, std::size_t index_count) {
    auto format_split = [](const LogDataset& ds, const char* split, std::size_t indices) {
        return fmt::format(R"(  {{"log": "dataset", "split": "{}", "time": "{}", "step": 0, "samples": {}, "normal": {}, "anomalous": {}, "indices": {}}})",
                           split, std::chrono::system_clock::now(), ds.size(), ds.count_class(0), ds.count_class(1), indices);
    };
    log_line(format_split(train, "train", index_count));
    log_line(format_split(test, "test", test.size()));

    if (mVerbosity >= 0) {
        printf("[Dataset]\n");
        printf(" train: %6zu samples (%zu normal, %zu anomalous), %zu indices after oversampling\n",
               train.size(), train.count_class(0), train.count_class(1), index_count);
        printf(" test:  %6zu samples (%zu normal, %zu anomalous)\n\n",
               test.size(), test.count_class(0), test.count_class(1));
    }
}

void TrainingRunLogger::log_phase_start(int phase, const std::string& name, int epochs, float lr, std::size_t trainable_params) {
    log_line(fmt::format(R"(  {{"log": "phase", "event": "start", "time": "{}", "phase": {}, "name": {}, "epochs": {}, "lr": {}, "trainable": {}}})",
                         std::chrono::system_clock::now(), phase, ::quoted(name), epochs, lr, trainable_params));
    if (mVerbosity >= 1) {
        printf("[Phase %d] %s: %d epochs, lr %g, %zu trainable parameters\n", phase, name.c_str(), epochs, lr, trainable_params);
    }
}

void TrainingRunLogger::log_phase_end(int phase, const std::string& name, const std::string& result, long duration_ms) {
    log_line(fmt::format(R"(  {{"log": "phase", "event": "end", "time": "{}", "phase": {}, "name": {}, "result": {}, "duration_ms": {}}})",
                         std::chrono::system_clock::now(), phase, ::quoted(name), ::quoted(result), duration_ms));
    if (mVerbosity >= 1) {
        printf("[Phase %d] %s: %s after %ld ms\n", phase, name.c_str(), result.c_str(), duration_ms);
    }
}

/**
 * @brief Log one micro-batch of training.
 *
 * Writes a JSON line and optionally prints a compact progress line with the loss trend
 * and the estimated time to completion.
 *
 * @param step Global micro-batch index.
 * @param phase Epoch label of the phase, e.g. "Epoch 1/2 (Projector)".
 * @param duration_ms Micro-batch duration in milliseconds.
 * @param norm Gradient norm of the last optimizer step, or 0 if no step happened.
 * @param loss Unscaled micro-batch loss.
 * @param lr Learning rate of the phase.
 * @param progress Fraction of the planned training steps completed.
 * @param etc_seconds Estimated time to completion.
 * @param skipped True if the optimizer step was skipped because of non-finite gradients.
 */
void TrainingRunLogger::log_step(int step, const std::string& phase, int duration_ms, float norm, float loss, float lr,
                                 float progress, double etc_seconds, bool skipped)
{
    if(mVerbosity >= 0) {
        char trend = ' ';
        if (mPreviousLoss >= 0) {
            if (loss < mPreviousLoss) {
                trend = '\\';
            } else if (loss > mPreviousLoss) {
                trend = '/';
            }
        }
        mPreviousLoss = loss;

        printf(":: step %7d [%5.1f%%] %c loss %6.4f | norm %c%6.4f | %5d ms | eta %s | %s\n",
               step, 100.f * progress, trend, loss, skipped ? '!' : ' ', norm, duration_ms,
               format_duration(etc_seconds).c_str(), phase.c_str());
        fflush(stdout);
    }
    log_line(fmt::format(R"(  {{"log": "step", "time": "{}", "step": {}, "phase": {}, "duration_ms": {}, "norm": {}, "loss": {}, "lr": {}, "progress": {}, "etc": {}, "skipped": {}}})",
        std::chrono::system_clock::now(), step, ::quoted(phase), duration_ms, norm, loss, lr, progress, etc_seconds, skipped));
}

/**
 * @brief Log the final evaluation summary.
 *
 * @param records Number of records with a prediction.
 * @param excluded Number of records without a prediction.
 * @param duration_ms Evaluation duration in milliseconds.
 */
void TrainingRunLogger::log_eval(int records, int excluded, int duration_ms, float accuracy, float precision, float recall, float f1)
{
    if(mVerbosity >= -1) {
        printf("\x1b[1m>> eval  acc %6.4f | precision %6.4f | recall %6.4f | f1 %6.4f | %d records (%d excluded) | %5d ms\x1b[22m\n",
               accuracy, precision, recall, f1, records, excluded, duration_ms);
        fflush(stdout);
    }
    log_line(fmt::format(R"(  {{"log": "eval", "time": "{}", "records": {}, "excluded": {}, "duration_ms": {}, "accuracy": {}, "precision": {}, "recall": {}, "f1_score": {}}})",
        std::chrono::system_clock::now(), records, excluded, duration_ms, accuracy, precision, recall, f1));
}

/**
 * @brief Log parameter memory per allocation context.
 */
void TrainingRunLogger::log_allocator(const TensorAllocator& allocator) {
    auto segments = allocator.get_allocation_segments();
    for (const auto& [name, amount] : segments) {
        log_line(fmt::format(R"(  {{"log": "allocator", "time": "{}", "segment": {}, "bytes": {}}})",
                             std::chrono::system_clock::now(), ::quoted(name), amount));
    }
    if (mVerbosity >= 1) {
        printf("[Allocator]\n");
        for (const auto& [name, amount] : segments) {
            printf("  %-30s %10.2f MiB\n", name.c_str(), static_cast<double>(amount) / 1024.0 / 1024.0);
        }
        printf("  %-30s %10.2f MiB\n\n", "total", static_cast<double>(allocator.total_allocation()) / 1024.0 / 1024.0);
    }
}

/**
 * @brief Append one JSON object line into the JSON array log file.
 *
 * Rewrites the array closing bracket so the file stays valid JSON after every line.
 * The callback receives every line, including when no file is configured.
 *
 * @param line JSON object line to append.
 */
void TrainingRunLogger::log_line(std::string_view line) {
    if(mCallback)
        mCallback(line);

    if(!mLogFile.is_open())
        return;

    mLogFile.seekp(-3, std::ios::end);  // overwrite the array closing part
    if (!mFirst)
    {
        mLogFile << ",\n";
    }
    mLogFile << line << "\n]" << std::endl;
    mFirst = false;
}

/**
 * @brief Set a callback invoked for each JSON log line before file append.
 *
 * @param cb Callback taking the JSON line as a string_view; may be empty/null.
 */
void TrainingRunLogger::set_callback(std::function<void(std::string_view)> cb) {
    mCallback = std::move(cb);
}

/**
 * @brief Log an informational message.
 *
 * Prints to stdout (verbosity-dependent) and writes a JSON "info" record.
 *
 * @param step Step associated with this message.
 * @param msg Message text.
 */
void TrainingRunLogger::log_message(int step, const std::string& msg) {
    if(mVerbosity >= 0) {
        fprintf(stdout, "%s\n", msg.c_str());
    }
    log_line(fmt::format(R"(  {{"log": "info", "time": "{}", "step": {}, "message": {}}})",
                         std::chrono::system_clock::now(), step, ::quoted(msg)));
}

/**
 * @brief Begin a timed logging section.
 *
 * Stores section metadata in the logger and returns an RAII handle that will
 * call log_section_end() on destruction.
 */
TrainingRunLogger::RAII_Section TrainingRunLogger::log_section_start(int step, const std::string& info) {
    mSectionInfo = info;
    mSectionStep = step;
    mSectionStart = std::chrono::steady_clock::now();
    if(mVerbosity >= 0) {
        printf("%s ...\n", info.data());
    }
    return RAII_Section{this};
}

/**
 * @brief End the current timed section and emit its duration.
 */
void TrainingRunLogger::log_section_end() {
    auto duration = std::chrono::steady_clock::now() - mSectionStart;
    long milliseconds = std::chrono::duration_cast<std::chrono::milliseconds>(duration).count();
    log_line(fmt::format(R"(  {{"log": "info", "time": "{}", "step": {}, "message": {}, "duration_ms": {}}})",
                         std::chrono::system_clock::now(), mSectionStep, ::quoted(mSectionInfo), milliseconds ));

    if(mVerbosity >= 0) {
        if(milliseconds < 2000) {
            printf("  done in %ld ms\n\n", milliseconds);
        } else {
            printf("  done in %ld s\n\n", milliseconds / 1000);
        }
    }
}
