#pragma once

#include <chrono>
#include <cstdint>
#include <optional>

namespace seedkeeper::storage {

// Persisted rate-controller state. schema_version records the layout the
// row was written with so older rows can be upgraded on load.
struct ControllerState {
    static constexpr int CURRENT_VERSION = 1;
    static constexpr double INITIAL_COVARIANCE = 1000.0;
    
    int schema_version = CURRENT_VERSION;
    uint64_t limit_bytes_per_sec = 0;
    double integral_term = 0.0;
    double previous_error = 0.0;
    double kalman_estimate = 0.0;
    double kalman_covariance = INITIAL_COVARIANCE;
    std::optional<std::chrono::system_clock::time_point> last_tick_at;
    
    static ControllerState initial(uint64_t starting_limit) {
        ControllerState state;
        state.limit_bytes_per_sec = starting_limit;
        return state;
    }
};

} // namespace seedkeeper::storage
