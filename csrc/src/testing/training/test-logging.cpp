// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0

#include <catch2/catch_test_macros.hpp>

#include <fstream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "training/logging.h"
#include "utilities/allocator.h"
#include "utilities/utils.h"
#include "../utilities/test_utils.h"

namespace {

nlohmann::json read_log(const std::filesystem::path& file) {
    std::ifstream in(file);
    REQUIRE(in.is_open());
    return nlohmann::json::parse(in);
}

} // namespace

TEST_CASE("run logger keeps the log file a valid JSON array", "[training][logging]") {
    auto dir = testing_utils::make_temp_dir("logger");
    auto file = dir / "nested" / "log.json";

    std::vector<std::string> forwarded;
    {
        TrainingRunLogger logger(file.string(), TrainingRunLogger::SILENT);
        REQUIRE(read_log(file).empty());

        logger.set_callback([&forwarded](std::string_view line) { forwarded.emplace_back(line); });
        logger.log_options({{"batch_size", std::int64_t{8}}, {"optimizer", std::string("adamw")},
                            {"min_less_portion", 0.25f}, {"shuffle", true}});
        logger.log_dataset(testing_utils::make_dataset(3, 1), testing_utils::make_dataset(2, 2), 5);
        logger.log_phase_start(1, "Projector", 2, 1e-3f, 128);
        logger.log_step(1, "Epoch 1/2 (Projector)", 3, 0.5f, 0.69f, 1e-3f, 0.25f, 12.5, false);
        logger.log_phase_end(1, "Projector", "completed", 40);
        logger.log_message(1, "a \"quoted\" message\nwith a newline");
        {
            auto section = logger.log_section_start(1, "Building model");
        }
        TensorAllocator alloc;
        {
            auto ctx = alloc.with_context("projector");
            alloc.allocate(ETensorDType::FP32, "w", {4});
        }
        logger.log_allocator(alloc);
        logger.log_eval(10, 1, 7, 0.9f, 0.8f, 0.7f, 0.75f);
    }

    auto log = read_log(file);
    REQUIRE(log.is_array());
    REQUIRE(log.size() == forwarded.size());

    std::vector<std::string> kinds;
    for (const auto& record : log) kinds.push_back(record["log"].get<std::string>());
    REQUIRE(kinds == std::vector<std::string>{"option", "option", "option", "option", "dataset", "dataset", "phase",
                                              "step", "phase", "info", "info", "allocator", "eval"});

    REQUIRE(log[1]["value"] == "adamw");
    REQUIRE(log[3]["value"] == true);
    REQUIRE(log[4]["split"] == "train");
    REQUIRE(log[4]["anomalous"] == 1);
    REQUIRE(log[4]["indices"] == 5);
    REQUIRE(log[5]["samples"] == 4);
    REQUIRE(log[6]["event"] == "start");
    REQUIRE(log[6]["trainable"] == 128);
    REQUIRE(log[7]["phase"] == "Epoch 1/2 (Projector)");
    REQUIRE(log[7]["skipped"] == false);
    REQUIRE(log[8]["result"] == "completed");
    REQUIRE(log[9]["message"] == "a \"quoted\" message\nwith a newline");
    REQUIRE(log[10]["message"] == "Building model");
    REQUIRE(log[10].contains("duration_ms"));
    REQUIRE(log[11]["segment"] == "projector");
    REQUIRE(log[11]["bytes"] == 16);
    REQUIRE(log[12]["records"] == 10);
    REQUIRE(log[12]["excluded"] == 1);

    for (const auto& line : forwarded) {
        REQUIRE_NOTHROW(nlohmann::json::parse(line));
    }
}

TEST_CASE("run logger without a file only forwards lines", "[training][logging]") {
    TrainingRunLogger logger("", TrainingRunLogger::SILENT);
    int lines = 0;
    logger.set_callback([&lines](std::string_view) { ++lines; });
    logger.log_message(0, "hello");
    logger.log_eval(1, 0, 1, 1.f, 1.f, 1.f, 1.f);
    REQUIRE(lines == 2);
    REQUIRE(logger.verbosity() == TrainingRunLogger::SILENT);
}

TEST_CASE("utility helpers", "[utilities]") {
    REQUIRE(div_exact(8, 2) == 4);
    REQUIRE_THROWS_AS(div_exact(7, 2), std::runtime_error);
    REQUIRE(narrow<int>(42L) == 42);
    REQUIRE_THROWS_AS(narrow<std::int8_t>(300), std::out_of_range);
    REQUIRE(div_ceil(7, 2) == 4);

    REQUIRE(format_duration(75.4) == "01m15s");
    REQUIRE(format_duration(3725.0) == "01h02m");
    REQUIRE(format_duration(-3.0) == "00m00s");
}
