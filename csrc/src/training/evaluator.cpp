// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "training/evaluator.h"

#include <algorithm>
#include <chrono>
#include <stdexcept>

#include <fmt/core.h>
#include <nlohmann/json.hpp>

#include "training/callback.h"
#include "training/dataset.h"
#include "utilities/utils.h"

namespace {

double safe_ratio(long num, long den) {
    return den > 0 ? static_cast<double>(num) / static_cast<double>(den) : 0.0;
}

ClassMetrics class_metrics(long tp, long fp, long fn) {
    ClassMetrics m;
    m.Precision = safe_ratio(tp, tp + fp);
    m.Recall = safe_ratio(tp, tp + fn);
    m.F1 = (m.Precision + m.Recall) > 0.0 ? 2.0 * m.Precision * m.Recall / (m.Precision + m.Recall) : 0.0;
    m.Support = tp + fn;
    return m;
}

nlohmann::json class_json(const ClassMetrics& m) {
    return {{"precision", m.Precision}, {"recall", m.Recall}, {"f1", m.F1}, {"support", m.Support}};
}

} // namespace

nlohmann::json EvaluationMetrics::to_json() const {
    nlohmann::json overall = {
        {"accuracy", Accuracy},
        {"precision", Precision},
        {"recall", Recall},
        {"f1_score", F1},
        {"time_per_record_ms", TimePerRecordMs},
    };
    if (TotalRunTimeSec) {
        overall["total_run_time_sec"] = *TotalRunTimeSec;
    }

    nlohmann::json result;
    result["overall"] = overall;
    result["per_class"] = {{"normal", class_json(Normal)}, {"anomalous", class_json(Anomalous)}};
    result["confusion_matrix"] = ConfusionMatrix;
    result["training_loss_series"] = TrainingLossSeries;
    return result;
}

nlohmann::json EvaluationMetrics::overall_for_plot() const {
    return {{"accuracy", Accuracy}, {"precision", Precision}, {"recall", Recall}, {"f1_score", F1}};
}

EvaluationMetrics compute_metrics(const std::vector<int>& y_true, const std::vector<int>& y_pred) {
    if (y_true.size() != y_pred.size()) {
        throw std::invalid_argument(fmt::format("compute_metrics: {} labels but {} predictions", y_true.size(), y_pred.size()));
    }

    EvaluationMetrics metrics;
    auto& cm = metrics.ConfusionMatrix;
    for (std::size_t i = 0; i < y_true.size(); ++i) {
        const int t = y_true[i];
        const int p = y_pred[i];
        if (t < 0 || t > 1 || p < 0 || p > 1) {
            throw std::out_of_range(fmt::format("compute_metrics: class ids must be 0 or 1, got true={} pred={}", t, p));
        }
        ++cm[t][p];
    }

    const long tn = cm[0][0];
    const long fp = cm[0][1];
    const long fn = cm[1][0];
    const long tp = cm[1][1];

    metrics.Records = static_cast<long>(y_true.size());
    metrics.Accuracy = safe_ratio(tp + tn, metrics.Records);
    metrics.Anomalous = class_metrics(tp, fp, fn);
    metrics.Normal = class_metrics(tn, fn, fp);
    metrics.Precision = metrics.Anomalous.Precision;
    metrics.Recall = metrics.Anomalous.Recall;
    metrics.F1 = metrics.Anomalous.F1;
    return metrics;
}

std::optional<int> argmax(const std::optional<ClassLogits>& logits) {
    if (!logits) return std::nullopt;
    return (*logits)[1] > (*logits)[0] ? 1 : 0;
}

Evaluator::Evaluator(int batch_size, ILogSink& sink, bool show_progress) :
    mBatchSize(batch_size), mSink(sink), mShowProgress(show_progress) {
    if (batch_size <= 0) {
        throw std::invalid_argument(fmt::format("Evaluator: batch size must be positive, got {}", batch_size));
    }
}

/**
 * @brief Predict every record of @p dataset and score the predictions.
 *
 * Records without a prediction are dropped together with their ground-truth label before
 * scoring. The per-record latency is the total evaluation time divided by the number of
 * scored records.
 *
 * @param model Model to run in inference mode.
 * @param dataset Held-out records.
 * @param loss_series Training loss per micro-batch, copied into the result.
 */
EvaluationMetrics Evaluator::evaluate(IModel& model, const LogDataset& dataset, const std::vector<float>& loss_series) {
    const auto start = std::chrono::steady_clock::now();
    const auto ground_truth = dataset.all_classes();
    const std::size_t total = dataset.size();

    std::vector<int> y_true;
    std::vector<int> y_pred;
    y_true.reserve(total);
    y_pred.reserve(total);

    const int num_batches = static_cast<int>(div_ceil(total, static_cast<std::size_t>(mBatchSize)));
    for (int batch_idx = 0; batch_idx < num_batches; ++batch_idx) {
        const std::size_t begin = static_cast<std::size_t>(batch_idx) * mBatchSize;
        const std::size_t end = std::min(total, begin + mBatchSize);
        auto batch = dataset.get_range(begin, end);
        auto logits = model.forward(batch.Sequences);

        for (std::size_t i = 0; i < logits.size(); ++i) {
            if (auto pred = argmax(logits[i])) {
                y_true.push_back(ground_truth[begin + i]);
                y_pred.push_back(*pred);
            }
        }

        TrainingEvent event;
        event.Epoch = "Final Evaluation";
        event.Progress = static_cast<float>(end) / static_cast<float>(total);
        mSink.on_event(event);
        if (mShowProgress) {
            show_progress_bar(batch_idx, num_batches);
        }
    }

    const double elapsed_ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
    auto metrics = compute_metrics(y_true, y_pred);
    metrics.Excluded = static_cast<long>(total) - metrics.Records;
    metrics.TimePerRecordMs = metrics.Records > 0 ? elapsed_ms / static_cast<double>(metrics.Records) : 0.0;
    metrics.TrainingLossSeries = loss_series;
    return metrics;
}
