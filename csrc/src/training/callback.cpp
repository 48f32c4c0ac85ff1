// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "training/callback.h"

#include <nlohmann/json.hpp>

nlohmann::json TrainingEvent::to_json() const {
    nlohmann::json event = nlohmann::json::object();
    if (Log) event["log"] = *Log;
    if (Epoch) event["epoch"] = *Epoch;
    if (Progress) event["progress"] = *Progress;
    if (Loss) event["loss"] = *Loss;
    if (Etc) event["etc"] = *Etc;
    if (Error) event["error"] = *Error;
    if (Status) event["status"] = *Status;
    if (Done) event["done"] = *Done;
    return event;
}

TrainingEvent TrainingEvent::log(std::string message) {
    TrainingEvent event;
    event.Log = std::move(message);
    return event;
}

TrainingEvent TrainingEvent::error(std::string message) {
    TrainingEvent event;
    event.Error = std::move(message);
    return event;
}

CallbackChannel::CallbackChannel(TrainingCallback callback) : mCallback(std::move(callback)) {
}

void CallbackChannel::on_event(const TrainingEvent& event) {
    if (!mCallback) return;
    const ECallbackAction action = mCallback(event);
    if (action == ECallbackAction::STOP && event.is_progress()) {
        mStopRequested = true;
    }
}
