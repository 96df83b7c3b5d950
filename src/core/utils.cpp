#include "seedkeeper/core/utils.hpp"
#include <algorithm>
#include <sstream>
#include <fstream>
#include <iomanip>
#include <cstdlib>
#include <cctype>

namespace seedkeeper::core::utils {

std::vector<std::string> StringUtils::split(const std::string& str, char delimiter) {
    std::vector<std::string> result;
    std::stringstream ss(str);
    std::string item;
    
    while (std::getline(ss, item, delimiter)) {
        result.push_back(item);
    }
    
    return result;
}

std::string StringUtils::join(const std::vector<std::string>& parts, const std::string& delimiter) {
    if (parts.empty()) return "";
    
    std::ostringstream oss;
    oss << parts[0];
    
    for (size_t i = 1; i < parts.size(); ++i) {
        oss << delimiter << parts[i];
    }
    
    return oss.str();
}

std::string StringUtils::trim(const std::string& str) {
    auto start = std::find_if_not(str.begin(), str.end(),
        [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(str.rbegin(), str.rend(),
        [](unsigned char c) { return std::isspace(c); }).base();
    
    if (start >= end) {
        return "";
    }
    return std::string(start, end);
}

std::string StringUtils::to_lower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(), ::tolower);
    return result;
}

bool StringUtils::starts_with(const std::string& str, const std::string& prefix) {
    return str.size() >= prefix.size() && 
           str.compare(0, prefix.size(), prefix) == 0;
}

bool StringUtils::contains_ignore_case(const std::string& haystack, const std::string& needle) {
    if (needle.empty()) return true;
    return to_lower(haystack).find(to_lower(needle)) != std::string::npos;
}

std::string StringUtils::short_hash(const std::string& hash, size_t length) {
    return hash.size() <= length ? hash : hash.substr(0, length);
}

std::string StringUtils::format_bytes(uint64_t bytes) {
    const char* units[] = {"B", "KiB", "MiB", "GiB", "TiB"};
    int unit = 0;
    double size = static_cast<double>(bytes);
    
    while (size >= 1024.0 && unit < 4) {
        size /= 1024.0;
        unit++;
    }
    
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << size << " " << units[unit];
    return oss.str();
}

std::string StringUtils::format_speed(double bytes_per_second) {
    const char* units[] = {"B/s", "KiB/s", "MiB/s", "GiB/s"};
    int unit = 0;
    double speed = std::max(0.0, bytes_per_second);
    
    while (speed >= 1024.0 && unit < 3) {
        speed /= 1024.0;
        unit++;
    }
    
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << speed << " " << units[unit];
    return oss.str();
}

std::string StringUtils::format_duration(std::chrono::milliseconds duration) {
    auto ms = duration.count();
    
    if (ms < 1000) {
        return std::to_string(ms) + "ms";
    }
    
    auto seconds = ms / 1000;
    if (seconds < 60) {
        return std::to_string(seconds) + "s";
    }
    
    auto minutes = seconds / 60;
    seconds %= 60;
    
    if (minutes < 60) {
        return std::to_string(minutes) + "m " + std::to_string(seconds) + "s";
    }
    
    auto hours = minutes / 60;
    minutes %= 60;
    
    return std::to_string(hours) + "h " + std::to_string(minutes) + "m";
}

bool FileUtils::exists(const std::filesystem::path& path) {
    std::error_code ec;
    return std::filesystem::exists(path, ec);
}

std::optional<std::string> FileUtils::read_file(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) return std::nullopt;
    
    std::string content((std::istreambuf_iterator<char>(file)),
                       std::istreambuf_iterator<char>());
    return content;
}

bool FileUtils::write_file_atomic(const std::filesystem::path& path, const std::string& content) {
    auto temp_path = path;
    temp_path += ".tmp";
    
    {
        std::ofstream file(temp_path, std::ios::trunc);
        if (!file.is_open()) return false;
        
        file << content;
        file.flush();
        if (!file) return false;
    }
    
    std::error_code ec;
    std::filesystem::rename(temp_path, path, ec);
    if (ec) {
        std::filesystem::remove(temp_path, ec);
        return false;
    }
    return true;
}

std::optional<uint64_t> FileUtils::available_space(const std::filesystem::path& path) {
    std::error_code ec;
    auto info = std::filesystem::space(path, ec);
    if (ec) return std::nullopt;
    return static_cast<uint64_t>(info.available);
}

std::filesystem::path FileUtils::expand_home(const std::string& path) {
    if (!StringUtils::starts_with(path, "~")) {
        return std::filesystem::path(path);
    }
    
    const char* home = std::getenv("HOME");
    std::filesystem::path base = home ? std::filesystem::path(home) : std::filesystem::path(".");
    auto rest = path.substr(1);
    if (!rest.empty() && (rest[0] == '/' || rest[0] == '\\')) {
        rest = rest.substr(1);
    }
    return base / rest;
}

std::chrono::system_clock::time_point TimeUtils::now() {
    return std::chrono::system_clock::now();
}

int64_t TimeUtils::to_unix_millis(const std::chrono::system_clock::time_point& time) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(time.time_since_epoch()).count();
}

std::chrono::system_clock::time_point TimeUtils::from_unix_millis(int64_t millis) {
    return std::chrono::system_clock::time_point(std::chrono::milliseconds(millis));
}

std::string TimeUtils::format_timestamp(const std::chrono::system_clock::time_point& time) {
    auto time_t = std::chrono::system_clock::to_time_t(time);
    std::tm local_tm{};
    localtime_r(&time_t, &local_tm);
    
    std::ostringstream oss;
    oss << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}

}
