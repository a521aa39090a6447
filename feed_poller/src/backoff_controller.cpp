#include "backoff_controller.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

BackoffController::BackoffController(int64_t base_interval_millis, double max_multiplier)
    : base_interval_millis_(base_interval_millis),
      max_multiplier_(std::max(max_multiplier, 1.0)) {
}

void BackoffController::on_success() {
    if (multiplier_ > 1.0) {
        spdlog::info("Backoff cleared after successful poll (was {}x)", multiplier_);
    }
    multiplier_ = 1.0;
}

void BackoffController::on_failure_or_throttle() {
    multiplier_ = std::min(multiplier_ * 2.0, max_multiplier_);
    spdlog::warn("Increased backoff to {}x ({} ms interval)", multiplier_, current_interval_millis());
}

void BackoffController::reset() {
    multiplier_ = 1.0;
}

int64_t BackoffController::current_interval_millis() const {
    return static_cast<int64_t>(static_cast<double>(base_interval_millis_) * multiplier_);
}
