#include "seedkeeper/core/config.hpp"
#include "seedkeeper/core/utils.hpp"
#include <algorithm>
#include <cctype>

namespace seedkeeper::core {

Config& Config::instance() {
    static Config instance;
    return instance;
}

bool Config::load_from_file(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        return false;
    }
    
    std::string line;
    while (std::getline(file, line)) {
        line = trim(line);
        
        if (line.empty() || line[0] == '#') {
            continue;
        }
        
        auto eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            continue;
        }
        
        std::string key = trim(line.substr(0, eq_pos));
        std::string value = trim(line.substr(eq_pos + 1));
        
        if (!key.empty()) {
            values_[key] = value;
        }
    }
    
    return true;
}

bool Config::save_to_file(const std::string& filename) const {
    std::ostringstream out;
    out << "# seedkeeper configuration\n\n";
    
    for (const auto& [key, value] : values_) {
        out << key << "=" << value << "\n";
    }
    
    return utils::FileUtils::write_file_atomic(filename, out.str());
}

void Config::set(const std::string& key, const std::string& value) {
    values_[key] = value;
}

std::optional<std::string> Config::get(const std::string& key) const {
    auto it = values_.find(key);
    if (it != values_.end()) {
        return it->second;
    }
    return std::nullopt;
}

bool Config::contains(const std::string& key) const {
    return values_.find(key) != values_.end();
}

bool Config::get_bool(const std::string& key, bool default_value) const {
    auto value = get(key);
    if (!value) return default_value;
    
    std::string lower = *value;
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);
    return lower == "true" || lower == "1" || lower == "yes";
}

int Config::get_int(const std::string& key, int default_value) const {
    auto value = get_as<int>(key);
    return value ? *value : default_value;
}

double Config::get_double(const std::string& key, double default_value) const {
    auto value = get_as<double>(key);
    return value ? *value : default_value;
}

std::string Config::get_string(const std::string& key, const std::string& default_value) const {
    auto value = get(key);
    return value ? *value : default_value;
}

void Config::set_defaults() {
    values_["min_upload_speed"] = "512";
    values_["max_upload_speed"] = "102400";
    values_["target_buffer_size"] = "51200";
    values_["pid_kp"] = "0.6";
    values_["pid_ki"] = "0.15";
    values_["pid_kd"] = "0.08";
    values_["kalman_q"] = "0.1";
    values_["kalman_r"] = "0.5";
    values_["control_interval"] = "1";
    values_["cleanup_enabled"] = "false";
    values_["cleanup_interval"] = "300";
    values_["cleanup_delete_files"] = "false";
    values_["cleanup_reannounce_before_delete"] = "true";
    values_["cleanup_reannounce_wait"] = "5";
    values_["database_path"] = "seedkeeper.db";
    values_["log.level"] = "info";
    values_["log.file"] = "seedkeeper.log";
}

std::string Config::trim(const std::string& str) const {
    return utils::StringUtils::trim(str);
}

}
