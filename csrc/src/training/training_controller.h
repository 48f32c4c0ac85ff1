// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef LOGSENTINEL_SRC_TRAINING_TRAINING_CONTROLLER_H
#define LOGSENTINEL_SRC_TRAINING_TRAINING_CONTROLLER_H

#include <array>
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "config/hyperparameters.h"
#include "config/model_config.h"
#include "training/callback.h"
#include "training/collaborators.h"
#include "training/data_sampler.h"
#include "training/dataset.h"
#include "training/logging.h"
#include "training/model.h"
#include "training/parameter_stager.h"

class GradientStepper;
struct EvaluationMetrics;

enum class ERunStatus {
    RUNNING,
    COMPLETED,
    ABORTED,
    FAILED
};

const char* run_status_to_str(ERunStatus status);

enum class EPhaseOutcome {
    COMPLETED,
    ABORTED,
    FAILED
};

//! Result of one training phase. `Reason` is set for failed phases.
struct PhaseResult {
    EPhaseOutcome Outcome = EPhaseOutcome::COMPLETED;
    std::string Reason;

    static PhaseResult completed() { return {EPhaseOutcome::COMPLETED, {}}; }
    static PhaseResult aborted() { return {EPhaseOutcome::ABORTED, {}}; }
    static PhaseResult failed(std::string reason) { return {EPhaseOutcome::FAILED, std::move(reason)}; }

    [[nodiscard]] const char* outcome_str() const;
};

//! One step of the training curriculum.
struct TrainingPhase {
    std::string Name;
    ETrainingStage Stage;
    PhaseSchedule Schedule;
};

struct ControllerSettings {
    std::string ModelName;
    std::string DatasetName;
    std::string ReportsDir = "reports";

    //! JSON log file; empty for console output only.
    std::string LogFile;
    TrainingRunLogger::EVerbosity Verbosity = TrainingRunLogger::DEFAULT;
    //! Receives every JSON log record.
    std::function<void(std::string_view)> LogLineCallback;
};

//! Builds the model for a run. The sink receives the model's informational messages.
using ModelBuilder = std::function<std::unique_ptr<IModel>(const Hyperparameters& hp, ILogSink& sink)>;

//! Builder creating a trainable HybridEncoderModel from `config` with fresh adapters.
ModelBuilder hybrid_model_builder(HybridModelConfig config);

/**
 * @brief Drives one training run from record creation to teardown.
 *
 * The run trains four phases in fixed order (Projector, Classifier, Projector+Classifier,
 * Fine-tuning All), evaluates on the test split and persists metrics and the fine-tuned
 * components. Progress goes to the log sink after every micro-batch; the cancellation token
 * is checked right after. Teardown (monitor stop, resource metrics, final run status, release
 * of model and datasets, final `{status, done}` event) runs exactly once on every exit path.
 */
class TrainingController {
public:
    TrainingController(ControllerSettings settings, Hyperparameters hp, ModelBuilder builder,
                       IRunStore& store, IDatasetSource& datasets, IResourceMonitor& monitor,
                       VisualizerFactory visualizers, ILogSink& sink, ICancellationToken& token);

    //! Single-callback form: every event goes to `callback`, which may answer STOP.
    TrainingController(ControllerSettings settings, Hyperparameters hp, ModelBuilder builder,
                       IRunStore& store, IDatasetSource& datasets, IResourceMonitor& monitor,
                       VisualizerFactory visualizers, TrainingCallback callback = {});

    ~TrainingController();

    //! Runs the whole lifecycle and returns the terminal status. May be called once.
    ERunStatus run();

    [[nodiscard]] ERunStatus status() const { return mStatus; }
    [[nodiscard]] const std::optional<std::string>& run_id() const { return mRunId; }
    [[nodiscard]] const std::vector<float>& loss_series() const { return mLossSeries; }
    [[nodiscard]] long total_training_steps() const { return mTotalSteps; }
    [[nodiscard]] long global_step() const { return mGlobalStep; }
    [[nodiscard]] long optimizer_steps() const { return mOptimizerSteps; }
    [[nodiscard]] std::size_t index_count() const { return mIndices.size(); }
    [[nodiscard]] const std::array<TrainingPhase, NUM_TRAINING_PHASES>& phases() const { return mPhases; }
    [[nodiscard]] std::string report_dir() const;

private:
    class RunTeardown;

    void log(const std::string& message);
    void initialize_run();
    void log_hyperparameters();
    PhaseResult train_phase(int phase_index, ParameterStager& stager);
    PhaseResult run_epochs(const TrainingPhase& phase, GradientStepper& stepper);
    EvaluationMetrics evaluate();
    void teardown() noexcept;
    void cleanup();

    ControllerSettings mSettings;
    Hyperparameters mHP;
    ModelBuilder mBuilder;
    IRunStore& mStore;
    IDatasetSource& mDatasets;
    IResourceMonitor& mMonitor;
    VisualizerFactory mVisualizerFactory;

    std::unique_ptr<CallbackChannel> mOwnedChannel;
    ILogSink* mSink;
    ICancellationToken* mToken;

    TrainingRunLogger mLogger;
    DataSampler mSampler;
    std::array<TrainingPhase, NUM_TRAINING_PHASES> mPhases;

    // run state
    bool mStarted = false;
    bool mTornDown = false;
    ERunStatus mStatus = ERunStatus::RUNNING;
    std::optional<std::string> mRunId;
    std::string mReportDir;
    std::chrono::steady_clock::time_point mRunStart;

    std::unique_ptr<LogDataset> mTrainData;
    std::unique_ptr<LogDataset> mTestData;
    std::unique_ptr<IModel> mModel;
    std::unique_ptr<IReportVisualizer> mVisualizer;

    std::vector<long> mIndices;
    std::vector<float> mLossSeries;
    long mTotalSteps = 0;
    long mGlobalStep = 0;
    long mOptimizerSteps = 0;
};

#endif //LOGSENTINEL_SRC_TRAINING_TRAINING_CONTROLLER_H
