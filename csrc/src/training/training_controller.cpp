// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "training/training_controller.h"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <filesystem>
#include <stdexcept>

#include <fmt/core.h>
#include <nlohmann/json.hpp>

#include "kernels/kernels.h"
#include "training/evaluator.h"
#include "training/gradient_stepper.h"
#include "training/hybrid_model.h"
#include "training/precision_policy.h"
#include "utilities/dtype.h"

namespace {

constexpr const char* RUN_TYPE = "Training";
constexpr const char* FINAL_MODEL_DIR = "final_model";
constexpr int NUM_CLASSES = 2;

std::array<TrainingPhase, NUM_TRAINING_PHASES> make_phases(const Hyperparameters& hp) {
    constexpr std::array<ETrainingStage, NUM_TRAINING_PHASES> stages = {
        ETrainingStage::PROJECTOR_ONLY,
        ETrainingStage::CLASSIFIER_ONLY,
        ETrainingStage::PROJECTOR_AND_CLASSIFIER,
        ETrainingStage::FULL_WITH_ADAPTERS,
    };
    std::array<TrainingPhase, NUM_TRAINING_PHASES> phases;
    for (int i = 0; i < NUM_TRAINING_PHASES; ++i) {
        phases[i] = TrainingPhase{stage_name(stages[i]), stages[i], hp.Phases[i]};
    }
    return phases;
}

double seconds_since(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
}

} // namespace

const char* run_status_to_str(ERunStatus status) {
    switch (status) {
        case ERunStatus::RUNNING: return "RUNNING";
        case ERunStatus::COMPLETED: return "COMPLETED";
        case ERunStatus::ABORTED: return "ABORTED";
        case ERunStatus::FAILED: return "FAILED";
    }
    throw std::logic_error(fmt::format("unknown run status {}", static_cast<int>(status)));
}

const char* PhaseResult::outcome_str() const {
    switch (Outcome) {
        case EPhaseOutcome::COMPLETED: return "completed";
        case EPhaseOutcome::ABORTED: return "aborted";
        case EPhaseOutcome::FAILED: return "failed";
    }
    throw std::logic_error(fmt::format("unknown phase outcome {}", static_cast<int>(Outcome)));
}

ModelBuilder hybrid_model_builder(HybridModelConfig config) {
    return [config = std::move(config)](const Hyperparameters& hp, ILogSink& sink) -> std::unique_ptr<IModel> {
        PrecisionPolicy policy;
        policy.ModelDType = hp.ModelDType;
        return std::make_unique<HybridEncoderModel>(config, policy, hp.MaxContentLen, hp.MaxSeqLen,
                                                    std::nullopt, true, &sink);
    };
}

//! Runs TrainingController::teardown() when run() leaves, however it leaves.
class TrainingController::RunTeardown {
public:
    explicit RunTeardown(TrainingController* controller) : mController(controller) {}
    ~RunTeardown() { mController->teardown(); }
    RunTeardown(const RunTeardown&) = delete;
    RunTeardown& operator=(const RunTeardown&) = delete;
private:
    TrainingController* mController;
};

TrainingController::TrainingController(ControllerSettings settings, Hyperparameters hp, ModelBuilder builder,
                                       IRunStore& store, IDatasetSource& datasets, IResourceMonitor& monitor,
                                       VisualizerFactory visualizers, ILogSink& sink, ICancellationToken& token) :
    mSettings(std::move(settings)), mHP(hp), mBuilder(std::move(builder)), mStore(store), mDatasets(datasets),
    mMonitor(monitor), mVisualizerFactory(std::move(visualizers)), mSink(&sink), mToken(&token),
    mLogger(mSettings.LogFile, mSettings.Verbosity), mSampler(hp.Seed), mPhases(make_phases(hp)) {
    if (!mBuilder) {
        throw std::invalid_argument("TrainingController: a model builder is required");
    }
    mHP.validate();
    if (mSettings.LogLineCallback) {
        mLogger.set_callback(mSettings.LogLineCallback);
    }
}

TrainingController::TrainingController(ControllerSettings settings, Hyperparameters hp, ModelBuilder builder,
                                       IRunStore& store, IDatasetSource& datasets, IResourceMonitor& monitor,
                                       VisualizerFactory visualizers, TrainingCallback callback) :
    mSettings(std::move(settings)), mHP(hp), mBuilder(std::move(builder)), mStore(store), mDatasets(datasets),
    mMonitor(monitor), mVisualizerFactory(std::move(visualizers)),
    mOwnedChannel(std::make_unique<CallbackChannel>(std::move(callback))),
    mSink(mOwnedChannel.get()), mToken(mOwnedChannel.get()),
    mLogger(mSettings.LogFile, mSettings.Verbosity), mSampler(hp.Seed), mPhases(make_phases(hp)) {
    if (!mBuilder) {
        throw std::invalid_argument("TrainingController: a model builder is required");
    }
    mHP.validate();
    if (mSettings.LogLineCallback) {
        mLogger.set_callback(mSettings.LogLineCallback);
    }
}

TrainingController::~TrainingController() = default;

std::string TrainingController::report_dir() const {
    return mReportDir;
}

void TrainingController::log(const std::string& message) {
    mLogger.log_message(static_cast<int>(mGlobalStep), message);
    mSink->on_event(TrainingEvent::log(message));
}

/**
 * @brief Execute the run: record creation, data preparation, four training phases,
 * evaluation and persistence.
 *
 * Any exception ends the run as FAILED and is reported through the sink's `error` field;
 * a stop request ends it as ABORTED without metrics or artifacts.
 *
 * @return The terminal run status.
 * @throws std::logic_error if called more than once.
 */
ERunStatus TrainingController::run() {
    if (mStarted) {
        throw std::logic_error("TrainingController::run may only be called once");
    }
    mStarted = true;
    mStatus = ERunStatus::FAILED;
    RunTeardown teardown_guard(this);

    try {
        mMonitor.start();
        initialize_run();
        log_hyperparameters();

        mRunStart = std::chrono::steady_clock::now();
        mTrainData = std::make_unique<LogDataset>(mDatasets.load(mSettings.DatasetName, "train"));
        mTestData = std::make_unique<LogDataset>(mDatasets.load(mSettings.DatasetName, "test"));

        long added = 0;
        mIndices = mSampler.build_index_set(*mTrainData, mHP.MinLessPortion, &added);
        if (added > 0) {
            log(fmt::format("Oversampling minority class with {} samples.", added));
        }
        mLogger.log_dataset(*mTrainData, *mTestData, mIndices.size());

        mTotalSteps = DataSampler::total_training_steps(mHP, mIndices.size());
        log(fmt::format("Total training steps calculated: {}", mTotalSteps));

        {
            auto section = mLogger.log_section_start(0, "Building model");
            mModel = mBuilder(mHP, *mSink);
        }
        if (!mModel) {
            throw std::runtime_error("model builder returned no model");
        }
        mLogger.log_allocator(mModel->allocator());

        ParameterStager stager(mModel->parameter_groups());
        bool all_phases_completed = true;
        for (int i = 0; i < NUM_TRAINING_PHASES; ++i) {
            auto result = train_phase(i, stager);
            if (result.Outcome == EPhaseOutcome::ABORTED) {
                all_phases_completed = false;
                mStatus = ERunStatus::ABORTED;
                break;
            }
            if (result.Outcome == EPhaseOutcome::FAILED) {
                throw std::runtime_error(fmt::format("phase '{}' failed: {}", mPhases[i].Name, result.Reason));
            }
        }

        if (all_phases_completed) {
            auto metrics = evaluate();
            metrics.TotalRunTimeSec = seconds_since(mRunStart);
            mStore.save_performance_metrics(*mRunId, metrics.to_json());

            const auto final_model = std::filesystem::path(mReportDir) / FINAL_MODEL_DIR;
            mModel->save_finetuned(final_model.string());
            mStatus = ERunStatus::COMPLETED;
        }
    } catch (const std::exception& e) {
        mStatus = ERunStatus::FAILED;
        log(fmt::format("CRITICAL ERROR in run {}: {}", mRunId.value_or("None"), e.what()));
        mSink->on_event(TrainingEvent::error(e.what()));
    } catch (...) {
        mStatus = ERunStatus::FAILED;
        log(fmt::format("CRITICAL ERROR in run {}: unknown exception", mRunId.value_or("None")));
        mSink->on_event(TrainingEvent::error("unknown exception"));
    }

    return mStatus;
}

void TrainingController::initialize_run() {
    mRunId = mStore.create_new_run(RUN_TYPE, mSettings.ModelName, mSettings.DatasetName, mHP.to_json());
    if (!mRunId) {
        throw std::runtime_error("Failed to create a new run record");
    }
    log(fmt::format("Created new training run with ID: {}", *mRunId));

    mReportDir = (std::filesystem::path(mSettings.ReportsDir) / *mRunId).string();
    std::filesystem::create_directories(mReportDir);
    if (mVisualizerFactory) {
        mVisualizer = mVisualizerFactory(mReportDir);
    }
}

void TrainingController::log_hyperparameters() {
    std::vector<std::pair<std::string, TrainingRunLogger::OptionValue>> options = {
        {"batch_size", static_cast<std::int64_t>(mHP.BatchSize)},
        {"micro_batch_size", static_cast<std::int64_t>(mHP.MicroBatchSize)},
        {"grad_accum_steps", static_cast<std::int64_t>(mHP.grad_accum_steps())},
        {"max_content_len", static_cast<std::int64_t>(mHP.MaxContentLen)},
        {"max_seq_len", static_cast<std::int64_t>(mHP.MaxSeqLen)},
        {"min_less_portion", mHP.MinLessPortion},
        {"seed", static_cast<std::int64_t>(mHP.Seed)},
        {"optimizer", optimizers::to_string(mHP.Optimizer)},
        {"weight_decay", mHP.WeightDecay},
        {"max_grad_norm", mHP.MaxGradNorm},
        {"model_dtype", std::string(dtype_to_str(mHP.ModelDType))},
    };
    for (int i = 0; i < NUM_TRAINING_PHASES; ++i) {
        options.emplace_back(fmt::format("n_epochs_phase{}", i + 1), static_cast<std::int64_t>(mHP.Phases[i].Epochs));
        options.emplace_back(fmt::format("lr_phase{}", i + 1), mHP.Phases[i].LearningRate);
    }
    mLogger.log_options(options);
}

/**
 * @brief Activate a phase's parameter groups and train it.
 *
 * Phases without epochs or without trainable parameters complete without doing anything;
 * a phase without epochs does not touch the trainable set. A fresh optimizer state is
 * created for every phase that trains.
 */
PhaseResult TrainingController::train_phase(int phase_index, ParameterStager& stager) {
    const auto& phase = mPhases[phase_index];
    if (phase.Schedule.Epochs <= 0) {
        log(fmt::format("Phase '{}' skipped: No epochs configured.", phase.Name));
        return PhaseResult::completed();
    }

    stager.activate(phase.Stage);
    log(fmt::format("\n--- Starting Training Phase: {} ---", phase.Name));
    auto params = mModel->parameter_groups().trainable();
    if (params.empty()) {
        log(fmt::format("Phase '{}' skipped: No trainable parameters.", phase.Name));
        return PhaseResult::completed();
    }

    const auto& policy = mModel->precision_policy();
    const bool use_scaler = policy.use_loss_scaling();
    GradientStepper stepper(params, mHP.optimizer_config(phase_index), mHP.grad_accum_steps(), use_scaler);
    log(fmt::format("Model DType: {}. Using GradScaler: {}.", dtype_to_str(policy.ModelDType), use_scaler ? "True" : "False"));

    mLogger.log_phase_start(phase_index + 1, phase.Name, phase.Schedule.Epochs, phase.Schedule.LearningRate,
                            stager.num_trainable_elements());
    const auto start = std::chrono::steady_clock::now();
    auto result = run_epochs(phase, stepper);
    const long duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start).count();
    mLogger.log_phase_end(phase_index + 1, phase.Name, result.outcome_str(), duration_ms);
    return result;
}

/**
 * @brief Epoch loop of one phase.
 *
 * Every micro-batch counts towards the global step, including the trailing partial one and
 * micro-batches that lose all their samples during batch assembly; the latter produce no
 * loss and no progress event. The optimizer steps after every `grad_accum_steps` micro-batches
 * of an epoch; a trailing incomplete group is dropped when the next epoch resets gradients.
 */
PhaseResult TrainingController::run_epochs(const TrainingPhase& phase, GradientStepper& stepper) {
    const int micro_batch_size = mHP.MicroBatchSize;
    const int grad_accum = stepper.grad_accum_steps();
    const std::size_t num_indices = mIndices.size();

    for (int epoch = 0; epoch < phase.Schedule.Epochs; ++epoch) {
        const std::string epoch_str = fmt::format("Epoch {}/{} ({})", epoch + 1, phase.Schedule.Epochs, phase.Name);
        log(fmt::format("--- {} ---", epoch_str));
        mSampler.shuffle(mIndices);
        stepper.zero_grad();

        int micro_step = 0;
        for (std::size_t start = 0; start < num_indices; start += micro_batch_size, ++micro_step) {
            ++mGlobalStep;
            const auto step_start = std::chrono::steady_clock::now();
            const std::size_t end = std::min(num_indices, start + static_cast<std::size_t>(micro_batch_size));
            std::vector<long> batch_indices(mIndices.begin() + static_cast<long>(start), mIndices.begin() + static_cast<long>(end));
            auto batch = mTrainData->get_batch(batch_indices);

            auto out = mModel->train_helper(batch.Sequences, batch.Labels);
            if (out.empty()) {
                continue;
            }

            const int rows = out.rows();
            const float raw_loss = cross_entropy_forward(out.Logits.data(), out.Labels.data(), nullptr, rows, NUM_CLASSES);
            const float loss = raw_loss / static_cast<float>(grad_accum);
            if (!std::isfinite(loss) && !stepper.scaler().enabled()) {
                return PhaseResult::failed(fmt::format("non-finite loss {} at step {}", raw_loss, mGlobalStep));
            }

            std::vector<float> dlogits(out.Logits.size());
            cross_entropy_backward(dlogits.data(), out.Logits.data(), out.Labels.data(), stepper.dloss_multiplier(),
                                   rows, NUM_CLASSES);
            mModel->backward(dlogits.data(), rows);

            std::optional<StepResult> step;
            if ((micro_step + 1) % grad_accum == 0) {
                step = stepper.step();
                if (step->Applied) ++mOptimizerSteps;
            }

            const float current_loss = loss * static_cast<float>(grad_accum);
            mLossSeries.push_back(current_loss);

            const double elapsed = seconds_since(mRunStart);
            const float progress = mTotalSteps > 0
                ? std::min(1.f, static_cast<float>(mGlobalStep) / static_cast<float>(mTotalSteps)) : 0.f;
            const double etc = progress > 0.f ? elapsed * (1.0 - progress) / progress : 0.0;

            const int duration_ms = static_cast<int>(std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - step_start).count());
            mLogger.log_step(static_cast<int>(mGlobalStep), epoch_str, duration_ms, step ? step->GradNorm : 0.f,
                             current_loss, stepper.learning_rate(), progress, etc, step && !step->Applied);

            TrainingEvent status;
            status.Epoch = epoch_str;
            status.Progress = progress;
            status.Loss = current_loss;
            status.Etc = etc;
            mSink->on_event(status);
            if (mToken->stop_requested()) {
                log("Stop request received. Aborting training.");
                return PhaseResult::aborted();
            }
        }
    }
    return PhaseResult::completed();
}

EvaluationMetrics TrainingController::evaluate() {
    log("\n--- Starting Final Evaluation ---");
    const auto start = std::chrono::steady_clock::now();
    Evaluator evaluator(mHP.BatchSize, *mSink, mSettings.Verbosity >= TrainingRunLogger::DEFAULT);
    auto metrics = evaluator.evaluate(*mModel, *mTestData, mLossSeries);
    const int duration_ms = static_cast<int>(std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count());
    mLogger.log_eval(static_cast<int>(metrics.Records), static_cast<int>(metrics.Excluded), duration_ms,
                     static_cast<float>(metrics.Accuracy), static_cast<float>(metrics.Precision),
                     static_cast<float>(metrics.Recall), static_cast<float>(metrics.F1));

    if (mVisualizer) {
        mVisualizer->plot_confusion_matrix(nlohmann::json(metrics.ConfusionMatrix), {"Normal", "Anomalous"});
        mVisualizer->plot_overall_metrics(metrics.overall_for_plot());
        mVisualizer->plot_training_loss(mLossSeries);
    }
    return metrics;
}

void TrainingController::cleanup() {
    log("Cleaning up training resources...");
    mModel.reset();
    mTrainData.reset();
    mTestData.reset();
    mVisualizer.reset();
    log("Cleanup complete.");
}

/**
 * @brief Release everything the run acquired and publish the final status.
 *
 * Every step is attempted even if an earlier one fails; failures are only logged.
 */
void TrainingController::teardown() noexcept {
    if (mTornDown) return;
    mTornDown = true;

    auto attempt = [this](const char* what, auto&& action) {
        try {
            action();
        } catch (const std::exception& e) {
            fprintf(stderr, "[teardown] %s failed: %s\n", what, e.what());
            try {
                mLogger.log_message(static_cast<int>(mGlobalStep), fmt::format("{} failed during teardown: {}", what, e.what()));
            } catch (const std::exception& log_error) {
                fprintf(stderr, "[teardown] could not log failure: %s\n", log_error.what());
            }
        } catch (...) {
            fprintf(stderr, "[teardown] %s failed: unknown exception\n", what);
            try {
                mLogger.log_message(static_cast<int>(mGlobalStep), fmt::format("{} failed during teardown: unknown exception", what));
            } catch (const std::exception& log_error) {
                fprintf(stderr, "[teardown] could not log failure: %s\n", log_error.what());
            }
        }
    };

    nlohmann::json resource_metrics = nlohmann::json::object();
    attempt("stopping the resource monitor", [&] { resource_metrics = mMonitor.stop(); });

    if (mRunId) {
        attempt("saving resource metrics", [&] { mStore.save_resource_metrics(*mRunId, resource_metrics); });
        if (mVisualizer) {
            attempt("plotting resource usage", [&] { mVisualizer->plot_resource_usage(resource_metrics); });
        }
        attempt("updating the run status", [&] {
            std::optional<std::string> report_path;
            if (mStatus == ERunStatus::COMPLETED) report_path = mReportDir;
            mStore.update_run_status(*mRunId, run_status_to_str(mStatus), report_path);
        });
        attempt("logging the final status", [&] {
            log(fmt::format("Run {} finished with status: {}", *mRunId, run_status_to_str(mStatus)));
        });
    }

    attempt("releasing training resources", [&] { cleanup(); });
    attempt("sending the final event", [&] {
        TrainingEvent final_event;
        final_event.Status = run_status_to_str(mStatus);
        final_event.Done = true;
        mSink->on_event(final_event);
    });
}
