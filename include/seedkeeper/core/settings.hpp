#pragma once

#include "config.hpp"
#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace seedkeeper::core {

struct CleanupTier {
    int ordinal = 0;
    double free_space_gb = 0.0;
    double upload_kib = 0.0;
    double download_kib = 0.0;
    bool upload_requires_completion = false;
};

// Validated, immutable view of the configuration. Tasks hold a
// shared_ptr<const Settings> for the duration of one tick.
struct Settings {
    // Rate controller, speeds in bytes/s
    uint64_t min_upload_speed = 512ULL * 1024;
    uint64_t max_upload_speed = 102400ULL * 1024;
    double target_buffer_size = 51200.0;
    double pid_kp = 0.6;
    double pid_ki = 0.15;
    double pid_kd = 0.08;
    double kalman_q = 0.1;
    double kalman_r = 0.5;
    uint64_t min_limit_delta = 64ULL * 1024;
    std::chrono::milliseconds min_reapply_interval{60000};
    std::chrono::milliseconds control_interval{1000};
    std::chrono::milliseconds max_tick_gap{30000};
    int failure_threshold = 5;
    
    // Cleanup
    bool cleanup_enabled = false;
    std::chrono::milliseconds cleanup_interval{300000};
    std::chrono::milliseconds cleanup_cooldown{10000};
    std::chrono::milliseconds cleanup_reannounce_wait{5000};
    bool cleanup_delete_files = false;
    bool cleanup_reannounce_before_delete = true;
    std::string cleanup_tracker_keyword;
    std::filesystem::path cleanup_free_space_path;
    std::filesystem::path cleanup_directive_file{"cleanup_tasks.json"};
    std::array<CleanupTier, 3> cleanup_tiers{{
        {1, 10.0, 1024.0, 1024.0, false},
        {2, 20.0, 512.0, 512.0, true},
        {3, 5.0, 5120.0, 5120.0, false},
    }};
    
    // Client session and command intake
    size_t api_call_budget = 4;
    std::chrono::milliseconds api_call_timeout{10000};
    std::chrono::milliseconds command_poll_interval{200};
    
    std::filesystem::path database_path{"seedkeeper.db"};
    std::string log_level = "info";
    std::string log_file = "seedkeeper.log";
    
    const CleanupTier& tier(int ordinal) const { return cleanup_tiers.at(ordinal - 1); }
    
    // Empty string when valid, otherwise the first problem found.
    std::string validate() const;
    
    static std::optional<Settings> from_config(const Config& config, std::string& error);
};

class SettingsProvider {
public:
    explicit SettingsProvider(Settings initial, std::filesystem::path source = {});
    
    std::shared_ptr<const Settings> current() const;
    uint64_t generation() const { return generation_.load(); }
    const std::filesystem::path& source() const { return source_; }
    
    // Parses and validates before swapping; on failure the previous
    // snapshot stays in force.
    bool reload(std::string& error);
    bool reload_from(const std::filesystem::path& config_file, std::string& error);
    bool replace(Settings settings, std::string& error);

private:
    std::atomic<std::shared_ptr<const Settings>> current_;
    std::atomic<uint64_t> generation_{1};
    std::filesystem::path source_;
};

} // namespace seedkeeper::core
