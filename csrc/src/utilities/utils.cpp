// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "utils.h"

#include <algorithm>
#include <cstdio>

#include <fmt/format.h>

/**
 * @brief Throws a std::runtime_error indicating a non-divisible division attempt.
 *
 * @param dividend The dividend that could not be evenly divided.
 * @param divisor The divisor used in the attempted division.
 *
 * @throws std::runtime_error Always throws with a formatted error message.
 */
[[noreturn]] void throw_not_divisible(long long dividend, long long divisor) {
    throw std::runtime_error(fmt::format("Cannot divide {} by {}", dividend, divisor));
}

void show_progress_bar(int current, int total, std::string_view label) {
    if (total <= 0) return;
    constexpr int BAR_WIDTH = 40;
    const int done = std::min(current + 1, total);
    const int filled = BAR_WIDTH * done / total;

    std::string bar(BAR_WIDTH, ' ');
    std::fill_n(bar.begin(), filled, '=');
    if (filled < BAR_WIDTH) bar[filled] = '>';
    fmt::print(stderr, "\r{}: [{}] {}% ({}/{})", label, bar, 100 * done / total, done, total);
    if (done == total) {
        fmt::print(stderr, "\n");
    }
    std::fflush(stderr);
}

std::string format_duration(double seconds) {
    if (seconds < 0) seconds = 0;
    long total = static_cast<long>(seconds);
    long hours = total / 3600;
    long minutes = (total % 3600) / 60;
    if (hours > 0) {
        return fmt::format("{:02d}h{:02d}m", hours, minutes);
    }
    return fmt::format("{:02d}m{:02d}s", minutes, total % 60);
}
