#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <optional>
#include <filesystem>
#include <cstdint>

namespace seedkeeper::core::utils {

class StringUtils {
public:
    static std::vector<std::string> split(const std::string& str, char delimiter);
    static std::string join(const std::vector<std::string>& parts, const std::string& delimiter);
    static std::string trim(const std::string& str);
    static std::string to_lower(const std::string& str);
    static bool starts_with(const std::string& str, const std::string& prefix);
    static bool contains_ignore_case(const std::string& haystack, const std::string& needle);
    static std::string short_hash(const std::string& hash, size_t length = 16);
    
    static std::string format_bytes(uint64_t bytes);
    static std::string format_speed(double bytes_per_second);
    static std::string format_duration(std::chrono::milliseconds duration);
};

class FileUtils {
public:
    static bool exists(const std::filesystem::path& path);
    static std::optional<std::string> read_file(const std::filesystem::path& path);
    
    // Writes to a sibling temp file, then renames over the target.
    static bool write_file_atomic(const std::filesystem::path& path, const std::string& content);
    
    static std::optional<uint64_t> available_space(const std::filesystem::path& path);
    static std::filesystem::path expand_home(const std::string& path);
};

class TimeUtils {
public:
    static std::chrono::system_clock::time_point now();
    static int64_t to_unix_millis(const std::chrono::system_clock::time_point& time);
    static std::chrono::system_clock::time_point from_unix_millis(int64_t millis);
    static std::string format_timestamp(const std::chrono::system_clock::time_point& time);
};

} // namespace seedkeeper::core::utils
