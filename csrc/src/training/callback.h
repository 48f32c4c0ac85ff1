// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef LOGSENTINEL_SRC_TRAINING_CALLBACK_H
#define LOGSENTINEL_SRC_TRAINING_CALLBACK_H

#include <atomic>
#include <functional>
#include <optional>
#include <string>

#include <nlohmann/json_fwd.hpp>

enum class ECallbackAction {
    CONTINUE,
    STOP
};

/**
 * @brief Structured progress/status event. Every field is optional; producers set the subset
 * that applies, e.g. `{epoch, progress, loss, etc}` per micro-batch or `{status, done}` at the end.
 */
struct TrainingEvent {
    std::optional<std::string> Log;
    std::optional<std::string> Epoch;
    std::optional<float> Progress;
    std::optional<float> Loss;
    std::optional<double> Etc;          ///< estimated seconds to completion
    std::optional<std::string> Error;
    std::optional<std::string> Status;
    std::optional<bool> Done;

    [[nodiscard]] nlohmann::json to_json() const;

    //! True for per-micro-batch training updates (progress, loss or epoch set).
    [[nodiscard]] bool is_progress() const { return Progress.has_value() || Loss.has_value() || Epoch.has_value(); }

    static TrainingEvent log(std::string message);
    static TrainingEvent error(std::string message);
};

//! Receives log and progress events.
class ILogSink {
public:
    virtual ~ILogSink() = default;
    virtual void on_event(const TrainingEvent& event) = 0;
};

//! Polled by the training loop after every micro-batch.
class ICancellationToken {
public:
    virtual ~ICancellationToken() = default;
    [[nodiscard]] virtual bool stop_requested() const = 0;
};

class NullLogSink final : public ILogSink {
public:
    void on_event(const TrainingEvent&) override {}
};

class NeverCancel final : public ICancellationToken {
public:
    [[nodiscard]] bool stop_requested() const override { return false; }
};

//! Cancellation flag that may be raised from any thread.
class AtomicCancellationToken final : public ICancellationToken {
public:
    void request_stop() { mStop.store(true, std::memory_order_relaxed); }
    [[nodiscard]] bool stop_requested() const override { return mStop.load(std::memory_order_relaxed); }
private:
    std::atomic<bool> mStop{false};
};

using TrainingCallback = std::function<ECallbackAction(const TrainingEvent&)>;

/**
 * @brief Adapts a single callback to both the sink and the token interface.
 *
 * Every event is forwarded to the callback. A STOP returned for a training progress event
 * latches a stop request for the rest of the channel's lifetime; the return value for log,
 * error and status events is ignored. An empty callback always continues.
 */
class CallbackChannel final : public ILogSink, public ICancellationToken {
public:
    explicit CallbackChannel(TrainingCallback callback);

    void on_event(const TrainingEvent& event) override;
    [[nodiscard]] bool stop_requested() const override { return mStopRequested; }

private:
    TrainingCallback mCallback;
    bool mStopRequested = false;
};

#endif //LOGSENTINEL_SRC_TRAINING_CALLBACK_H
