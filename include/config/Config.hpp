#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>
#include <nlohmann/json_fwd.hpp>

namespace skiff::config {

constexpr static uintmax_t DEFAULT_CHUNK_SIZE_BYTES = static_cast<uintmax_t>(8) * 1024 * 1024; // 8MB

struct CachingConfig {
    unsigned int max_age_minutes = 5;
    unsigned int cleanup_interval_ms = 10 * 60 * 1000;

    [[nodiscard]] std::chrono::minutes maxAge() const { return std::chrono::minutes(max_age_minutes); }
    [[nodiscard]] std::chrono::milliseconds cleanupInterval() const { return std::chrono::milliseconds(cleanup_interval_ms); }
};

struct TransfersConfig {
    uintmax_t chunk_size_bytes = DEFAULT_CHUNK_SIZE_BYTES;
    unsigned int max_concurrent_transfers = 3;
    unsigned int max_concurrent_loads = 2;
    std::vector<std::string> excluded_extensions = {".tif"};
    bool use_existing_folders = true;
};

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum skiff    = spdlog::level::info;   // Startup, shutdown, session wiring
    spdlog::level::level_enum cache    = spdlog::level::warn;   // Sweeps and failed loads
    spdlog::level::level_enum transfer = spdlog::level::info;   // Transfer lifecycle, failed files
    spdlog::level::level_enum remote   = spdlog::level::warn;   // Store adapter failures
    spdlog::level::level_enum config   = spdlog::level::warn;
};

struct LogLevelsConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::info;
    spdlog::level::level_enum file_log_level = spdlog::level::debug;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct LoggingConfig {
    std::filesystem::path log_dir;  // empty: paths::getLogPath()
    LogLevelsConfig levels;
};

struct Config {
    CachingConfig caching;
    TransfersConfig transfers;
    LoggingConfig logging;
};

Config loadConfig(const std::filesystem::path& path);

void to_json(nlohmann::json& j, const Config& c);
void from_json(const nlohmann::json& j, Config& c);
void to_json(nlohmann::json& j, const CachingConfig& c);
void from_json(const nlohmann::json& j, CachingConfig& c);
void to_json(nlohmann::json& j, const TransfersConfig& c);
void from_json(const nlohmann::json& j, TransfersConfig& c);
void to_json(nlohmann::json& j, const LoggingConfig& c);
void from_json(const nlohmann::json& j, LoggingConfig& c);
void to_json(nlohmann::json& j, const LogLevelsConfig& c);
void from_json(const nlohmann::json& j, LogLevelsConfig& c);
void to_json(nlohmann::json& j, const SubsystemLogLevelsConfig& c);
void from_json(const nlohmann::json& j, SubsystemLogLevelsConfig& c);

} // namespace skiff::config
