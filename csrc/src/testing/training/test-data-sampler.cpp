// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <set>
#include <vector>

#include "config/hyperparameters.h"
#include "training/data_sampler.h"
#include "training/dataset.h"
#include "../utilities/test_utils.h"

TEST_CASE("dataset maps labels to classes", "[training][dataset]") {
    REQUIRE(label_to_class("anomalous") == 1);
    REQUIRE(label_to_class("normal") == 0);
    REQUIRE(label_to_class("something else") == 0);

    auto ds = testing_utils::make_dataset(3, 1);
    REQUIRE(ds.size() == 4);
    REQUIRE(ds.all_classes() == std::vector<int>{0, 0, 0, 1});
    REQUIRE(ds.minority_class() == 1);
    REQUIRE(ds.num_minority() == 1);
    REQUIRE(ds.num_majority() == 3);
    REQUIRE(ds.class_indices(1) == std::vector<long>{3});
    REQUIRE_THROWS_AS(ds.at(4), std::out_of_range);
    REQUIRE_THROWS_AS(ds.get_batch({-1}), std::out_of_range);

    auto batch = ds.get_batch({3, 3, 0});
    REQUIRE(batch.Labels == std::vector<std::string>{"anomalous", "anomalous", "normal"});
    REQUIRE(ds.get_range(2, 10).Labels.size() == 2);
}

TEST_CASE("minority class ties pick anomalous", "[training][dataset]") {
    auto ds = testing_utils::make_dataset(2, 2);
    REQUIRE(ds.minority_class() == 1);
    auto more_anomalies = testing_utils::make_dataset(1, 3);
    REQUIRE(more_anomalies.minority_class() == 0);
}

TEST_CASE("oversample_count lifts the minority fraction", "[training][sampler]") {
    // 10 minority vs 90 majority at 0.2: floor(0.2 * 90 / 0.8) - 10 = 12
    REQUIRE(DataSampler::oversample_count(10, 90, 0.2f) == 12);
    // already at or above the requested portion
    REQUIRE(DataSampler::oversample_count(30, 70, 0.2f) == 0);
    REQUIRE(DataSampler::oversample_count(10, 90, 0.f) == 0);
    REQUIRE(DataSampler::oversample_count(0, 90, 0.3f) == 0);
    REQUIRE_THROWS_AS(DataSampler::oversample_count(1, 90, 1.f), std::invalid_argument);
}

TEST_CASE("index set keeps every sample and appends minority duplicates", "[training][sampler]") {
    auto ds = testing_utils::make_dataset(18, 2);
    DataSampler sampler(3);
    long added = -1;
    auto indices = sampler.build_index_set(ds, 0.25f, &added);

    // floor(0.25 * 18 / 0.75) - 2 = 4
    REQUIRE(added == 4);
    REQUIRE(indices.size() == ds.size() + 4);
    for (long i = 0; i < static_cast<long>(ds.size()); ++i) REQUIRE(indices[i] == i);
    for (std::size_t i = ds.size(); i < indices.size(); ++i) {
        REQUIRE(label_to_class(ds.at(indices[i]).Label) == 1);
    }

    const auto minority = std::count_if(indices.begin(), indices.end(),
                                        [&](long i) { return label_to_class(ds.at(i).Label) == 1; });
    REQUIRE(static_cast<double>(minority) / static_cast<double>(indices.size()) >= 0.25 - 1e-9);
}

TEST_CASE("index set without oversampling is the identity", "[training][sampler]") {
    auto ds = testing_utils::make_dataset(5, 5);
    DataSampler sampler(3);
    long added = -1;
    auto indices = sampler.build_index_set(ds, 0.f, &added);
    REQUIRE(added == 0);
    REQUIRE(indices == std::vector<long>{0, 1, 2, 3, 4, 5, 6, 7, 8, 9});
}

TEST_CASE("shuffle permutes deterministically per seed", "[training][sampler]") {
    std::vector<long> base(50);
    for (long i = 0; i < 50; ++i) base[i] = i;

    auto a = base, b = base;
    DataSampler s1(9), s2(9);
    s1.shuffle(a);
    s2.shuffle(b);
    REQUIRE(a == b);
    REQUIRE(a != base);
    REQUIRE(std::set<long>(a.begin(), a.end()).size() == 50);
}

TEST_CASE("total training steps counts full micro-batches of every phase", "[training][sampler]") {
    Hyperparameters hp = testing_utils::tiny_hyperparameters();
    hp.MicroBatchSize = 4;
    hp.BatchSize = 8;
    hp.Phases[0].Epochs = 2;
    hp.Phases[1].Epochs = 0;
    hp.Phases[2].Epochs = 1;
    hp.Phases[3].Epochs = 3;
    // 10 indices -> 2 full micro-batches per epoch, 6 epochs
    REQUIRE(DataSampler::total_training_steps(hp, 10) == 12);
    REQUIRE(DataSampler::total_training_steps(hp, 3) == 0);

    hp.MicroBatchSize = 0;
    REQUIRE_THROWS_AS(DataSampler::total_training_steps(hp, 10), std::invalid_argument);
}
