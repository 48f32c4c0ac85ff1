// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef LOGSENTINEL_SRC_TRAINING_COLLABORATORS_H
#define LOGSENTINEL_SRC_TRAINING_COLLABORATORS_H

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "training/dataset.h"

//! Persistent store of run records and their metrics.
class IRunStore {
public:
    virtual ~IRunStore() = default;

    //! Returns the new run id, or nullopt if the record could not be created.
    virtual std::optional<std::string> create_new_run(const std::string& run_type, const std::string& model_name,
                                                      const std::string& dataset_name,
                                                      const nlohmann::json& hyperparameters) = 0;
    virtual void save_performance_metrics(const std::string& run_id, const nlohmann::json& metrics) = 0;
    virtual void save_resource_metrics(const std::string& run_id, const nlohmann::json& metrics) = 0;
    //! `report_path` is only given for completed runs.
    virtual void update_run_status(const std::string& run_id, const std::string& status,
                                   const std::optional<std::string>& report_path) = 0;
};

//! Source of labelled datasets; `split` is "train" or "test".
class IDatasetSource {
public:
    virtual ~IDatasetSource() = default;
    virtual LogDataset load(const std::string& dataset_name, const std::string& split) = 0;
};

//! Renders report plots into the run's report directory.
class IReportVisualizer {
public:
    virtual ~IReportVisualizer() = default;
    virtual void plot_confusion_matrix(const nlohmann::json& matrix, const std::vector<std::string>& labels) = 0;
    virtual void plot_overall_metrics(const nlohmann::json& metrics) = 0;
    virtual void plot_training_loss(const std::vector<float>& losses) = 0;
    virtual void plot_resource_usage(const nlohmann::json& resource_metrics) = 0;
};

//! Creates the visualizer for a report directory.
using VisualizerFactory = std::function<std::unique_ptr<IReportVisualizer>(const std::string& report_dir)>;

//! Samples system resource usage in the background between start() and stop().
class IResourceMonitor {
public:
    virtual ~IResourceMonitor() = default;
    virtual void start() = 0;
    //! Stops sampling and returns the collected time series.
    virtual nlohmann::json stop() = 0;
};

#endif //LOGSENTINEL_SRC_TRAINING_COLLABORATORS_H
