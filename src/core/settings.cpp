#include "seedkeeper/core/settings.hpp"
#include "seedkeeper/core/logger.hpp"
#include "seedkeeper/core/utils.hpp"
#include <cmath>

namespace seedkeeper::core {

namespace {

class ConfigReader {
public:
    explicit ConfigReader(const Config& config) : config_(config) {}
    
    void number(const std::string& key, double& out) {
        if (!config_.contains(key) || !error_.empty()) {
            return;
        }
        auto value = config_.get_as<double>(key);
        if (!value || !std::isfinite(*value)) {
            error_ = "invalid numeric value for '" + key + "': " + config_.get_string(key);
            return;
        }
        out = *value;
    }
    
    void kib_speed(const std::string& key, uint64_t& out_bytes) {
        double kib = static_cast<double>(out_bytes) / 1024.0;
        number(key, kib);
        if (error_.empty() && config_.contains(key)) {
            if (kib < 0) {
                error_ = "'" + key + "' must not be negative";
                return;
            }
            out_bytes = static_cast<uint64_t>(std::llround(kib * 1024.0));
        }
    }
    
    void seconds(const std::string& key, std::chrono::milliseconds& out) {
        double secs = static_cast<double>(out.count()) / 1000.0;
        number(key, secs);
        if (error_.empty() && config_.contains(key)) {
            if (secs < 0) {
                error_ = "'" + key + "' must not be negative";
                return;
            }
            out = std::chrono::milliseconds(std::llround(secs * 1000.0));
        }
    }
    
    void integer(const std::string& key, int& out) {
        if (!config_.contains(key) || !error_.empty()) {
            return;
        }
        auto value = config_.get_as<int>(key);
        if (!value) {
            error_ = "invalid integer value for '" + key + "': " + config_.get_string(key);
            return;
        }
        out = *value;
    }
    
    void flag(const std::string& key, bool& out) {
        if (!config_.contains(key) || !error_.empty()) {
            return;
        }
        auto lower = utils::StringUtils::to_lower(config_.get_string(key));
        if (lower == "true" || lower == "1" || lower == "yes") {
            out = true;
        } else if (lower == "false" || lower == "0" || lower == "no") {
            out = false;
        } else {
            error_ = "invalid boolean value for '" + key + "': " + config_.get_string(key);
        }
    }
    
    void text(const std::string& key, std::string& out) {
        if (config_.contains(key)) {
            out = config_.get_string(key);
        }
    }
    
    void path(const std::string& key, std::filesystem::path& out) {
        if (config_.contains(key)) {
            auto value = config_.get_string(key);
            out = value.empty() ? std::filesystem::path() : utils::FileUtils::expand_home(value);
        }
    }
    
    const std::string& error() const { return error_; }

private:
    const Config& config_;
    std::string error_;
};

} // namespace

std::string Settings::validate() const {
    if (min_upload_speed == 0) {
        return "min_upload_speed must be positive";
    }
    if (min_upload_speed > max_upload_speed) {
        return "min_upload_speed is greater than max_upload_speed";
    }
    if (target_buffer_size < 0) {
        return "target_buffer_size must not be negative";
    }
    if (pid_kp < 0 || pid_ki < 0 || pid_kd < 0) {
        return "PID gains must not be negative";
    }
    if (kalman_q < 0 || kalman_r < 0) {
        return "Kalman noise terms must not be negative";
    }
    if (control_interval.count() <= 0) {
        return "control_interval must be positive";
    }
    if (max_tick_gap.count() <= 0) {
        return "max_tick_gap must be positive";
    }
    if (failure_threshold < 1) {
        return "failure_threshold must be at least 1";
    }
    if (cleanup_interval.count() <= 0) {
        return "cleanup_interval must be positive";
    }
    for (const auto& tier : cleanup_tiers) {
        if (tier.free_space_gb < 0 || tier.upload_kib < 0 || tier.download_kib < 0) {
            return "cleanup_space_rule" + std::to_string(tier.ordinal) + " thresholds must not be negative";
        }
    }
    if (cleanup_directive_file.empty()) {
        return "cleanup_directive_file must not be empty";
    }
    if (api_call_budget == 0) {
        return "api_call_budget must be at least 1";
    }
    if (api_call_timeout.count() <= 0) {
        return "api_call_timeout must be positive";
    }
    if (command_poll_interval.count() <= 0) {
        return "command_poll_interval must be positive";
    }
    if (database_path.empty()) {
        return "database_path must not be empty";
    }
    if (!Logger::parse_level(log_level)) {
        return "unknown log level: " + log_level;
    }
    return "";
}

std::optional<Settings> Settings::from_config(const Config& config, std::string& error) {
    Settings settings;
    ConfigReader reader(config);
    
    reader.kib_speed("min_upload_speed", settings.min_upload_speed);
    reader.kib_speed("max_upload_speed", settings.max_upload_speed);
    reader.number("target_buffer_size", settings.target_buffer_size);
    reader.number("pid_kp", settings.pid_kp);
    reader.number("pid_ki", settings.pid_ki);
    reader.number("pid_kd", settings.pid_kd);
    reader.number("kalman_q", settings.kalman_q);
    reader.number("kalman_r", settings.kalman_r);
    reader.kib_speed("min_limit_delta", settings.min_limit_delta);
    reader.seconds("min_reapply_interval", settings.min_reapply_interval);
    reader.seconds("control_interval", settings.control_interval);
    reader.seconds("max_tick_gap", settings.max_tick_gap);
    reader.integer("failure_threshold", settings.failure_threshold);
    
    reader.flag("cleanup_enabled", settings.cleanup_enabled);
    reader.seconds("cleanup_interval", settings.cleanup_interval);
    reader.seconds("cleanup_cooldown", settings.cleanup_cooldown);
    reader.seconds("cleanup_reannounce_wait", settings.cleanup_reannounce_wait);
    reader.flag("cleanup_delete_files", settings.cleanup_delete_files);
    reader.flag("cleanup_reannounce_before_delete", settings.cleanup_reannounce_before_delete);
    reader.text("cleanup_tracker_keyword", settings.cleanup_tracker_keyword);
    reader.path("cleanup_free_space_path", settings.cleanup_free_space_path);
    reader.path("cleanup_directive_file", settings.cleanup_directive_file);
    
    for (auto& tier : settings.cleanup_tiers) {
        auto prefix = "cleanup_space_rule" + std::to_string(tier.ordinal);
        reader.number(prefix + "_gb", tier.free_space_gb);
        reader.number(prefix + "_upload_kib", tier.upload_kib);
        reader.number(prefix + "_download_kib", tier.download_kib);
    }
    
    int budget = static_cast<int>(settings.api_call_budget);
    reader.integer("api_call_budget", budget);
    reader.seconds("api_call_timeout", settings.api_call_timeout);
    reader.seconds("command_poll_interval", settings.command_poll_interval);
    
    reader.path("database_path", settings.database_path);
    reader.text("log.level", settings.log_level);
    reader.text("log.file", settings.log_file);
    
    if (!reader.error().empty()) {
        error = reader.error();
        return std::nullopt;
    }
    if (budget < 1) {
        error = "api_call_budget must be at least 1";
        return std::nullopt;
    }
    settings.api_call_budget = static_cast<size_t>(budget);
    
    error = settings.validate();
    if (!error.empty()) {
        return std::nullopt;
    }
    return settings;
}

SettingsProvider::SettingsProvider(Settings initial, std::filesystem::path source)
    : current_(std::make_shared<const Settings>(std::move(initial)))
    , source_(std::move(source)) {
}

std::shared_ptr<const Settings> SettingsProvider::current() const {
    return current_.load();
}

bool SettingsProvider::reload(std::string& error) {
    if (source_.empty()) {
        error = "no configuration file to reload from";
        return false;
    }
    return reload_from(source_, error);
}

bool SettingsProvider::reload_from(const std::filesystem::path& config_file, std::string& error) {
    Config config;
    config.set_defaults();
    if (!config.load_from_file(config_file.string())) {
        error = "cannot read configuration file: " + config_file.string();
        LOG_ERROR("Configuration reload rejected: {}", error);
        return false;
    }
    
    auto settings = Settings::from_config(config, error);
    if (!settings) {
        LOG_ERROR("Configuration reload rejected: {}", error);
        return false;
    }
    return replace(std::move(*settings), error);
}

bool SettingsProvider::replace(Settings settings, std::string& error) {
    error = settings.validate();
    if (!error.empty()) {
        LOG_ERROR("Configuration rejected: {}", error);
        return false;
    }
    
    current_.store(std::make_shared<const Settings>(std::move(settings)));
    auto generation = generation_.fetch_add(1) + 1;
    LOG_INFO("Configuration applied (generation {})", generation);
    return true;
}

}
