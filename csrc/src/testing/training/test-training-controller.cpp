// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <filesystem>
#include <limits>
#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "modules/parameter.h"
#include "training/precision_policy.h"
#include "training/training_controller.h"
#include "utilities/allocator.h"
#include "../utilities/test_utils.h"

namespace {

using namespace testing_utils;

//! What the stub model observed at each backward call.
struct StubTrace {
    std::vector<float> GradBeforeBackward;               ///< first trainable gradient element
    std::vector<std::vector<std::string>> TrainableGroups;
};

//! Minimal model with one parameter per group whose logits are fixed.
//! Backward adds one to every element of every trainable gradient.
class StubModel final : public IModel {
public:
    StubModel(bool with_parameters, float logit, StubTrace* trace = nullptr) : mLogit(logit), mTrace(trace) {
        for (const char* group : {modules::PROJECTOR_GROUP, modules::CLASSIFIER_GROUP, modules::DECODER_LORA_GROUP}) {
            mRegistry.declare(group);
            if (!with_parameters) continue;
            auto& p = mParams.emplace_back(std::make_unique<modules::Parameter>());
            p->Name = fmt::format("{}.weight", group);
            p->Value = mAllocator.allocate(ETensorDType::FP32, "value", {2});
            p->Grad = mAllocator.allocate(ETensorDType::FP32, "grad", {2});
            fill_zero(p->Value);
            fill_zero(p->Grad);
            mRegistry.add(group, p.get());
        }
    }

    std::vector<std::optional<ClassLogits>> forward(const std::vector<LogSequence>& sequences) override {
        return std::vector<std::optional<ClassLogits>>(sequences.size(), ClassLogits{mLogit, 0.f});
    }

    TrainBatch train_helper(const std::vector<LogSequence>& sequences, const std::vector<std::string>& labels) override {
        TrainBatch batch;
        for (std::size_t i = 0; i < sequences.size(); ++i) {
            batch.Logits.push_back(mLogit);
            batch.Logits.push_back(0.f);
            batch.Labels.push_back(label_to_class(labels[i]));
            batch.SourceIndices.push_back(static_cast<int>(i));
        }
        return batch;
    }

    void backward(const float* dlogits, int rows) override {
        auto params = mRegistry.trainable();
        if (mTrace && !params.empty()) {
            mTrace->GradBeforeBackward.push_back(params.front()->grad()[0]);
            std::vector<std::string> groups;
            for (const auto& name : mRegistry.group_names()) {
                const auto& members = mRegistry.group(name);
                if (std::any_of(members.begin(), members.end(), [](const modules::Parameter* p) { return p->Trainable; })) {
                    groups.push_back(name);
                }
            }
            mTrace->TrainableGroups.push_back(std::move(groups));
        }
        for (modules::Parameter* p : params) {
            for (std::size_t i = 0; i < p->nelem(); ++i) p->grad()[i] += 1.f;
        }
    }

    modules::ParameterGroupRegistry& parameter_groups() override { return mRegistry; }
    [[nodiscard]] const PrecisionPolicy& precision_policy() const override { return mPolicy; }
    [[nodiscard]] const TensorAllocator& allocator() const override { return mAllocator; }

    void save_finetuned(const std::string& directory) override { std::filesystem::create_directories(directory); }

private:
    float mLogit;
    StubTrace* mTrace;
    PrecisionPolicy mPolicy;
    TensorAllocator mAllocator;
    std::vector<std::unique_ptr<modules::Parameter>> mParams;
    modules::ParameterGroupRegistry mRegistry;
};

ModelBuilder stub_builder(bool with_parameters, float logit, StubTrace* trace = nullptr) {
    return [=](const Hyperparameters&, ILogSink&) -> std::unique_ptr<IModel> {
        return std::make_unique<StubModel>(with_parameters, logit, trace);
    };
}

std::ptrdiff_t log_position(const RecordingSink& sink, const std::string& needle) {
    const auto messages = sink.log_messages();
    auto it = std::find_if(messages.begin(), messages.end(),
                           [&](const std::string& m) { return m.find(needle) != std::string::npos; });
    return it == messages.end() ? -1 : std::distance(messages.begin(), it);
}

//! Collaborators and settings shared by every controller test.
struct ControllerFixture {
    FakeRunStore Store;
    FakeDatasetSource Datasets;
    FakeResourceMonitor Monitor;
    VisualizerRecord Plots;
    RecordingSink Sink;
    Hyperparameters HP = tiny_hyperparameters();
    ControllerSettings Settings;
    std::filesystem::path Reports;

    explicit ControllerFixture(const std::string& name) {
        Reports = make_temp_dir(name);
        Settings.ModelName = "logsentinel-test";
        Settings.DatasetName = "synthetic";
        Settings.ReportsDir = Reports.string();
        Settings.Verbosity = TrainingRunLogger::QUIET;
        Datasets.Train = make_dataset(5, 3);
        Datasets.Test = make_dataset(3, 2);
    }

    std::unique_ptr<TrainingController> make(ModelBuilder builder) {
        return std::make_unique<TrainingController>(Settings, HP, std::move(builder), Store, Datasets, Monitor,
                                                    fake_visualizers(Plots), Sink, Sink);
    }

    std::unique_ptr<TrainingController> make() { return make(hybrid_model_builder(tiny_model_config())); }
};

} // namespace

TEST_CASE("completed run persists metrics, status and the fine-tuned model", "[training][controller]") {
    ControllerFixture fx("controller_completed");
    auto controller = fx.make();

    REQUIRE(controller->run() == ERunStatus::COMPLETED);
    REQUIRE(controller->status() == ERunStatus::COMPLETED);
    REQUIRE(controller->run_id() == std::optional<std::string>("run-1"));

    REQUIRE(fx.Store.CreateCalls == 1);
    REQUIRE(fx.Store.CreatedRunType == "Training");
    REQUIRE(fx.Store.CreatedHyperparameters["batch_size"] == 2);
    REQUIRE(fx.Store.CreatedHyperparameters["n_epochs_phase4"] == 1);
    REQUIRE(fx.Datasets.RequestedSplits == std::vector<std::string>{"train", "test"});

    // 8 indices, micro-batch 2, one epoch in each of four phases
    REQUIRE(controller->index_count() == 8);
    REQUIRE(controller->total_training_steps() == 16);
    REQUIRE(controller->global_step() == 16);
    REQUIRE(controller->optimizer_steps() == 16);
    REQUIRE(controller->loss_series().size() == 16);
    REQUIRE(fx.Sink.progress_events() == 16);

    REQUIRE(fx.Store.PerformanceMetrics.has_value());
    const auto& overall = (*fx.Store.PerformanceMetrics)["overall"];
    REQUIRE(overall.contains("total_run_time_sec"));
    REQUIRE(overall.contains("f1_score"));
    REQUIRE((*fx.Store.PerformanceMetrics)["training_loss_series"].size() == 16);
    REQUIRE(fx.Store.ResourceMetrics.has_value());

    const auto report_dir = (fx.Reports / "run-1").string();
    REQUIRE(controller->report_dir() == report_dir);
    REQUIRE(fx.Store.StatusUpdates.size() == 1);
    REQUIRE(fx.Store.StatusUpdates[0].RunId == "run-1");
    REQUIRE(fx.Store.StatusUpdates[0].Status == "COMPLETED");
    REQUIRE(fx.Store.StatusUpdates[0].ReportPath == std::optional<std::string>(report_dir));

    const auto final_model = fx.Reports / "run-1" / "final_model";
    REQUIRE(std::filesystem::exists(final_model / "projector.safetensors"));
    REQUIRE(std::filesystem::exists(final_model / "classifier.safetensors"));
    REQUIRE(std::filesystem::exists(final_model / "decoder_adapter" / "adapter_config.json"));

    REQUIRE(fx.Plots.Created == 1);
    REQUIRE(fx.Plots.ConfusionMatrix == 1);
    REQUIRE(fx.Plots.OverallMetrics == 1);
    REQUIRE(fx.Plots.TrainingLoss == 1);
    REQUIRE(fx.Plots.LossPoints == 16);
    REQUIRE(fx.Plots.ResourceUsage == 1);

    REQUIRE(fx.Monitor.StartCalls == 1);
    REQUIRE(fx.Monitor.StopCalls == 1);

    REQUIRE(fx.Sink.count_done_events() == 1);
    const auto& last = fx.Sink.Events.back();
    REQUIRE(last.Done == std::optional<bool>(true));
    REQUIRE(last.Status == std::optional<std::string>("COMPLETED"));

    REQUIRE(fx.Sink.has_log_containing("Created new training run with ID: run-1"));
    REQUIRE(fx.Sink.has_log_containing("Total training steps calculated: 16"));
    REQUIRE(fx.Sink.has_log_containing("--- Starting Training Phase: Fine-tuning All ---"));
    REQUIRE(fx.Sink.has_log_containing("Run run-1 finished with status: COMPLETED"));
    REQUIRE(fx.Sink.has_log_containing("Cleanup complete."));
    REQUIRE_FALSE(fx.Sink.has_log_containing("Oversampling"));
}

TEST_CASE("progress events carry epoch, progress, loss and etc", "[training][controller]") {
    ControllerFixture fx("controller_progress");
    auto controller = fx.make();
    REQUIRE(controller->run() == ERunStatus::COMPLETED);

    float previous = 0.f;
    int seen = 0;
    for (const auto& e : fx.Sink.Events) {
        if (!e.Loss) continue;
        ++seen;
        REQUIRE(e.Epoch.has_value());
        REQUIRE(e.Progress.has_value());
        REQUIRE(e.Etc.has_value());
        REQUIRE(*e.Progress > previous);
        REQUIRE(*e.Progress <= 1.f);
        REQUIRE(*e.Etc >= 0.0);
        previous = *e.Progress;
    }
    REQUIRE(seen == 16);
    REQUIRE(previous == 1.f);
}

TEST_CASE("stop request aborts the run without artifacts", "[training][controller]") {
    ControllerFixture fx("controller_abort");
    fx.Sink.StopAfterProgressEvents = 3;
    auto controller = fx.make();

    REQUIRE(controller->run() == ERunStatus::ABORTED);
    REQUIRE(controller->loss_series().size() == 3);
    REQUIRE(controller->global_step() == 3);
    REQUIRE_FALSE(fx.Store.PerformanceMetrics.has_value());
    REQUIRE_FALSE(std::filesystem::exists(fx.Reports / "run-1" / "final_model"));
    REQUIRE(fx.Plots.ConfusionMatrix == 0);

    REQUIRE(fx.Store.StatusUpdates.size() == 1);
    REQUIRE(fx.Store.StatusUpdates[0].Status == "ABORTED");
    REQUIRE_FALSE(fx.Store.StatusUpdates[0].ReportPath.has_value());
    REQUIRE(fx.Sink.has_log_containing("Stop request received. Aborting training."));
    REQUIRE(fx.Sink.count_done_events() == 1);
    REQUIRE(fx.Sink.Events.back().Status == std::optional<std::string>("ABORTED"));
}

TEST_CASE("callback form stops when the callback answers STOP", "[training][controller]") {
    ControllerFixture fx("controller_callback");
    std::vector<TrainingEvent> received;
    TrainingCallback callback = [&received](const TrainingEvent& e) {
        received.push_back(e);
        return e.Loss.has_value() ? ECallbackAction::STOP : ECallbackAction::CONTINUE;
    };
    TrainingController controller(fx.Settings, fx.HP, hybrid_model_builder(tiny_model_config()), fx.Store,
                                  fx.Datasets, fx.Monitor, fake_visualizers(fx.Plots), callback);

    REQUIRE(controller.run() == ERunStatus::ABORTED);
    REQUIRE(controller.loss_series().size() == 1);
    REQUIRE_FALSE(received.empty());
    REQUIRE(received.back().Done == std::optional<bool>(true));
    REQUIRE(received.back().Status == std::optional<std::string>("ABORTED"));
}

TEST_CASE("STOP answers to log events do not abort the run", "[training][controller]") {
    ControllerFixture fx("controller_log_stop");
    int progress = 0;
    TrainingCallback callback = [&progress](const TrainingEvent& e) {
        if (e.Loss) ++progress;
        return e.Log ? ECallbackAction::STOP : ECallbackAction::CONTINUE;
    };
    TrainingController controller(fx.Settings, fx.HP, stub_builder(true, 1.f), fx.Store, fx.Datasets, fx.Monitor,
                                  fake_visualizers(fx.Plots), callback);

    REQUIRE(controller.run() == ERunStatus::COMPLETED);
    REQUIRE(progress == 16);
    REQUIRE(controller.loss_series().size() == 16);
}

TEST_CASE("exceptions of foreign types fail the run", "[training][controller]") {
    ControllerFixture fx("controller_foreign_error");
    fx.Datasets.ThrowForeignOnLoad = true;
    auto controller = fx.make(stub_builder(true, 1.f));

    REQUIRE(controller->run() == ERunStatus::FAILED);
    REQUIRE(controller->status() == ERunStatus::FAILED);
    REQUIRE(fx.Store.StatusUpdates.size() == 1);
    REQUIRE(fx.Store.StatusUpdates[0].Status == "FAILED");
    REQUIRE(fx.Sink.has_log_containing("CRITICAL ERROR in run run-1: unknown exception"));

    bool error_event = false;
    for (const auto& e : fx.Sink.Events) {
        error_event = error_event || e.Error == std::optional<std::string>("unknown exception");
    }
    REQUIRE(error_event);
    REQUIRE(fx.Monitor.StopCalls == 1);
    REQUIRE(fx.Sink.count_done_events() == 1);
    REQUIRE(fx.Sink.Events.back().Status == std::optional<std::string>("FAILED"));
}

TEST_CASE("missing run record fails without a status update", "[training][controller]") {
    ControllerFixture fx("controller_no_record");
    fx.Store.NextRunId = std::nullopt;
    auto controller = fx.make();

    REQUIRE(controller->run() == ERunStatus::FAILED);
    REQUIRE_FALSE(controller->run_id().has_value());
    REQUIRE(fx.Store.StatusUpdates.empty());
    REQUIRE_FALSE(fx.Store.ResourceMetrics.has_value());
    REQUIRE(fx.Datasets.RequestedSplits.empty());
    REQUIRE(fx.Monitor.StopCalls == 1);
    REQUIRE(fx.Sink.has_log_containing("CRITICAL ERROR in run None: Failed to create a new run record"));
    REQUIRE(fx.Sink.count_done_events() == 1);
    REQUIRE(fx.Sink.Events.back().Status == std::optional<std::string>("FAILED"));
}

TEST_CASE("dataset errors fail the run and are reported", "[training][controller]") {
    ControllerFixture fx("controller_dataset_error");
    fx.Datasets.ThrowOnLoad = true;
    auto controller = fx.make();

    REQUIRE(controller->run() == ERunStatus::FAILED);
    REQUIRE(fx.Store.StatusUpdates.size() == 1);
    REQUIRE(fx.Store.StatusUpdates[0].Status == "FAILED");
    REQUIRE_FALSE(fx.Store.StatusUpdates[0].ReportPath.has_value());
    REQUIRE(fx.Sink.has_log_containing("CRITICAL ERROR in run run-1: dataset synthetic not found"));

    bool error_event = false;
    for (const auto& e : fx.Sink.Events) {
        error_event = error_event || e.Error == std::optional<std::string>("dataset synthetic not found");
    }
    REQUIRE(error_event);
    REQUIRE(fx.Sink.count_done_events() == 1);
}

TEST_CASE("failing model builder fails the run", "[training][controller]") {
    ControllerFixture fx("controller_builder_error");
    auto controller = fx.make([](const Hyperparameters&, ILogSink&) -> std::unique_ptr<IModel> {
        throw std::runtime_error("no weights");
    });
    REQUIRE(controller->run() == ERunStatus::FAILED);
    REQUIRE(fx.Store.StatusUpdates.size() == 1);
    REQUIRE(fx.Store.StatusUpdates[0].Status == "FAILED");
    REQUIRE(fx.Sink.has_log_containing("no weights"));
}

TEST_CASE("failing metrics store fails the run", "[training][controller]") {
    ControllerFixture fx("controller_metrics_error");
    fx.Store.ThrowOnPerformanceMetrics = true;
    auto controller = fx.make(stub_builder(true, 1.f));
    REQUIRE(controller->run() == ERunStatus::FAILED);
    REQUIRE(fx.Store.StatusUpdates.size() == 1);
    REQUIRE(fx.Store.StatusUpdates[0].Status == "FAILED");
    REQUIRE(fx.Sink.has_log_containing("metrics store unavailable"));
}

TEST_CASE("minority class is oversampled before training", "[training][controller]") {
    ControllerFixture fx("controller_oversampling");
    fx.Datasets.Train = make_dataset(9, 1);
    fx.HP.MinLessPortion = 0.3f;
    auto controller = fx.make(stub_builder(true, 1.f));

    REQUIRE(controller->run() == ERunStatus::COMPLETED);
    REQUIRE(controller->index_count() == 12);
    REQUIRE(controller->total_training_steps() == 24);
    REQUIRE(controller->global_step() == 24);
    REQUIRE(fx.Sink.has_log_containing("Oversampling minority class with 2 samples."));
}

TEST_CASE("trailing partial micro-batches still count as steps", "[training][controller]") {
    ControllerFixture fx("controller_partial");
    fx.Datasets.Train = make_dataset(4, 3);
    auto controller = fx.make(stub_builder(true, 1.f));

    REQUIRE(controller->run() == ERunStatus::COMPLETED);
    // 7 indices: 3 full micro-batches are planned per epoch, 4 are run
    REQUIRE(controller->total_training_steps() == 12);
    REQUIRE(controller->global_step() == 16);
    REQUIRE(fx.Sink.progress_events() == 16);
}

TEST_CASE("phases without epochs are skipped", "[training][controller]") {
    ControllerFixture fx("controller_no_epochs");
    for (auto& phase : fx.HP.Phases) phase.Epochs = 0;
    auto controller = fx.make(stub_builder(true, 1.f));

    REQUIRE(controller->run() == ERunStatus::COMPLETED);
    REQUIRE(controller->total_training_steps() == 0);
    REQUIRE(controller->loss_series().empty());
    REQUIRE(fx.Sink.progress_events() == 0);
    REQUIRE(fx.Store.PerformanceMetrics.has_value());
    REQUIRE((*fx.Store.PerformanceMetrics)["training_loss_series"].empty());
    REQUIRE_FALSE(fx.Sink.has_log_containing("Starting Training Phase"));
    REQUIRE(fx.Sink.has_log_containing("Phase 'Projector' skipped: No epochs configured."));
    REQUIRE(fx.Sink.has_log_containing("Phase 'Fine-tuning All' skipped: No epochs configured."));
}

TEST_CASE("only the phase with epochs activates its groups and trains", "[training][controller]") {
    ControllerFixture fx("controller_phase3_only");
    fx.HP.Phases[0].Epochs = 0;
    fx.HP.Phases[1].Epochs = 0;
    fx.HP.Phases[2].Epochs = 1;
    fx.HP.Phases[3].Epochs = 0;
    StubTrace trace;
    auto controller = fx.make(stub_builder(true, 1.f, &trace));

    REQUIRE(controller->run() == ERunStatus::COMPLETED);
    // 8 indices, micro-batch 2, one epoch in phase 3 only
    REQUIRE(controller->index_count() == 8);
    REQUIRE(controller->total_training_steps() == 4);
    REQUIRE(controller->global_step() == 4);
    REQUIRE(fx.Sink.progress_events() == 4);

    const auto skip1 = log_position(fx.Sink, "Phase 'Projector' skipped: No epochs configured.");
    const auto skip2 = log_position(fx.Sink, "Phase 'Classifier' skipped: No epochs configured.");
    const auto start3 = log_position(fx.Sink, "--- Starting Training Phase: Projector+Classifier ---");
    const auto skip4 = log_position(fx.Sink, "Phase 'Fine-tuning All' skipped: No epochs configured.");
    REQUIRE(skip1 >= 0);
    REQUIRE(skip1 < skip2);
    REQUIRE(skip2 < start3);
    REQUIRE(start3 < skip4);
    REQUIRE_FALSE(fx.Sink.has_log_containing("Phase 'Projector+Classifier' skipped"));
    REQUIRE_FALSE(fx.Sink.has_log_containing("Starting Training Phase: Projector ---"));
    REQUIRE_FALSE(fx.Sink.has_log_containing("Starting Training Phase: Fine-tuning All"));

    // the projector and classifier groups are the trainable set for every micro-batch
    REQUIRE(trace.TrainableGroups.size() == 4);
    const std::vector<std::string> expected = {modules::PROJECTOR_GROUP, modules::CLASSIFIER_GROUP};
    for (const auto& groups : trace.TrainableGroups) {
        REQUIRE(groups == expected);
    }

    std::optional<float> last_progress;
    for (const auto& e : fx.Sink.Events) {
        if (e.Progress) last_progress = e.Progress;
    }
    REQUIRE(last_progress == std::optional<float>(1.f));
}

TEST_CASE("gradient accumulation steps once per full group and resets every epoch", "[training][controller]") {
    ControllerFixture fx("controller_accumulation");
    fx.Datasets.Train = make_dataset(4, 2);
    fx.HP.BatchSize = 4;
    fx.HP.MicroBatchSize = 2;
    fx.HP.Phases[0].Epochs = 0;
    fx.HP.Phases[1].Epochs = 0;
    fx.HP.Phases[2].Epochs = 0;
    fx.HP.Phases[3].Epochs = 2;
    StubTrace trace;
    auto controller = fx.make(stub_builder(true, 1.f, &trace));

    REQUIRE(controller->run() == ERunStatus::COMPLETED);
    // 6 indices: 3 micro-batches per epoch, 2 micro-batches per optimizer step
    REQUIRE(controller->index_count() == 6);
    REQUIRE(controller->total_training_steps() == 6);
    REQUIRE(controller->global_step() == 6);
    REQUIRE(controller->optimizer_steps() == 2);
    REQUIRE(controller->loss_series().size() == 6);

    // the step clears the gradient after the second micro-batch; the third micro-batch leaves
    // an incomplete group behind, which the next epoch discards before its first backward
    REQUIRE(trace.GradBeforeBackward == std::vector<float>{0.f, 1.f, 0.f, 0.f, 1.f, 0.f});
}

TEST_CASE("phases without trainable parameters are skipped", "[training][controller]") {
    ControllerFixture fx("controller_no_params");
    auto controller = fx.make(stub_builder(false, 1.f));

    REQUIRE(controller->run() == ERunStatus::COMPLETED);
    REQUIRE(fx.Sink.has_log_containing("Phase 'Projector' skipped: No trainable parameters."));
    REQUIRE(fx.Sink.has_log_containing("Phase 'Fine-tuning All' skipped: No trainable parameters."));
    REQUIRE(controller->global_step() == 0);
}

TEST_CASE("non-finite loss fails the run", "[training][controller]") {
    ControllerFixture fx("controller_nan");
    auto controller = fx.make(stub_builder(true, std::numeric_limits<float>::quiet_NaN()));

    REQUIRE(controller->run() == ERunStatus::FAILED);
    REQUIRE(controller->global_step() == 1);
    REQUIRE(fx.Sink.has_log_containing("phase 'Projector' failed: non-finite loss"));
    REQUIRE(fx.Store.StatusUpdates.size() == 1);
    REQUIRE(fx.Store.StatusUpdates[0].Status == "FAILED");
}

TEST_CASE("controller rejects misuse", "[training][controller]") {
    ControllerFixture fx("controller_misuse");
    auto controller = fx.make(stub_builder(true, 1.f));
    REQUIRE(controller->run() == ERunStatus::COMPLETED);
    REQUIRE_THROWS_AS(controller->run(), std::logic_error);
    REQUIRE(fx.Sink.count_done_events() == 1);

    REQUIRE_THROWS_AS(fx.make(ModelBuilder{}), std::invalid_argument);
    fx.HP.MicroBatchSize = 3;
    REQUIRE_THROWS_AS(fx.make(stub_builder(true, 1.f)), std::invalid_argument);
}

TEST_CASE("phase names follow the curriculum order", "[training][controller]") {
    ControllerFixture fx("controller_phases");
    auto controller = fx.make(stub_builder(true, 1.f));
    const auto& phases = controller->phases();
    REQUIRE(phases[0].Name == "Projector");
    REQUIRE(phases[1].Name == "Classifier");
    REQUIRE(phases[2].Name == "Projector+Classifier");
    REQUIRE(phases[3].Name == "Fine-tuning All");
    REQUIRE(phases[3].Stage == ETrainingStage::FULL_WITH_ADAPTERS);
    REQUIRE(std::string(run_status_to_str(ERunStatus::ABORTED)) == "ABORTED");
    REQUIRE(std::string(PhaseResult::failed("x").outcome_str()) == "failed");
}
