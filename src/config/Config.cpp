#include "config/Config.hpp"
#include "config/config_yaml.hpp"

#include <stdexcept>
#include <yaml-cpp/yaml.h>
#include <nlohmann/json.hpp>

namespace skiff::config {

template <typename T>
static void decodeSection(const YAML::Node& root, const std::string& key, T& out) {
    const auto node = root[key];
    if (!node) return;
    if (!YAML::convert<T>::decode(node, out))
        throw std::runtime_error("Invalid configuration section: " + key);
}

Config loadConfig(const std::filesystem::path& path) {
    Config cfg;
    if (!std::filesystem::exists(path)) return cfg;

    const YAML::Node root = YAML::LoadFile(path.string());
    if (!root || root.IsNull()) return cfg;

    decodeSection(root, "caching", cfg.caching);
    decodeSection(root, "transfers", cfg.transfers);
    decodeSection(root, "logging", cfg.logging);

    return cfg;
}

void to_json(nlohmann::json& j, const Config& c) {
    j = {
        {"caching", c.caching},
        {"transfers", c.transfers},
        {"logging", c.logging}
    };
}

void from_json(const nlohmann::json& j, Config& c) {
    if (j.contains("caching")) j.at("caching").get_to(c.caching);
    if (j.contains("transfers")) j.at("transfers").get_to(c.transfers);
    if (j.contains("logging")) j.at("logging").get_to(c.logging);
}

void to_json(nlohmann::json& j, const CachingConfig& c) {
    j = {
        {"max_age_minutes", c.max_age_minutes},
        {"cleanup_interval_ms", c.cleanup_interval_ms}
    };
}

void from_json(const nlohmann::json& j, CachingConfig& c) {
    c.max_age_minutes = j.value("max_age_minutes", 5u);
    c.cleanup_interval_ms = j.value("cleanup_interval_ms", 10u * 60u * 1000u);
}

void to_json(nlohmann::json& j, const TransfersConfig& c) {
    j = {
        {"chunk_size_bytes", c.chunk_size_bytes},
        {"max_concurrent_transfers", c.max_concurrent_transfers},
        {"max_concurrent_loads", c.max_concurrent_loads},
        {"excluded_extensions", c.excluded_extensions},
        {"use_existing_folders", c.use_existing_folders}
    };
}

void from_json(const nlohmann::json& j, TransfersConfig& c) {
    c.chunk_size_bytes = j.value("chunk_size_bytes", DEFAULT_CHUNK_SIZE_BYTES);
    c.max_concurrent_transfers = j.value("max_concurrent_transfers", 3u);
    c.max_concurrent_loads = j.value("max_concurrent_loads", 2u);
    c.excluded_extensions = j.value("excluded_extensions", std::vector<std::string>{".tif"});
    c.use_existing_folders = j.value("use_existing_folders", true);
}

void to_json(nlohmann::json& j, const LoggingConfig& c) {
    j = {
        {"log_dir", c.log_dir.string()},
        {"levels", c.levels}
    };
}

void from_json(const nlohmann::json& j, LoggingConfig& c) {
    c.log_dir = j.value("log_dir", std::string{});
    if (j.contains("levels")) j.at("levels").get_to(c.levels);
}

void to_json(nlohmann::json& j, const LogLevelsConfig& c) {
    j = {
        {"console", YAML::to_std_string(spdlog::level::to_string_view(c.console_log_level))},
        {"file", YAML::to_std_string(spdlog::level::to_string_view(c.file_log_level))},
        {"subsystems", c.subsystem_levels}
    };
}

void from_json(const nlohmann::json& j, LogLevelsConfig& c) {
    c.console_log_level = spdlog::level::from_str(j.value("console", std::string("info")));
    c.file_log_level = spdlog::level::from_str(j.value("file", std::string("debug")));
    if (j.contains("subsystems")) j.at("subsystems").get_to(c.subsystem_levels);
}

void to_json(nlohmann::json& j, const SubsystemLogLevelsConfig& c) {
    const auto str = [](const spdlog::level::level_enum l) { return YAML::to_std_string(spdlog::level::to_string_view(l)); };
    j = {
        {"skiff", str(c.skiff)},
        {"cache", str(c.cache)},
        {"transfer", str(c.transfer)},
        {"remote", str(c.remote)},
        {"config", str(c.config)}
    };
}

void from_json(const nlohmann::json& j, SubsystemLogLevelsConfig& c) {
    c.skiff = spdlog::level::from_str(j.value("skiff", std::string("info")));
    c.cache = spdlog::level::from_str(j.value("cache", std::string("warning")));
    c.transfer = spdlog::level::from_str(j.value("transfer", std::string("info")));
    c.remote = spdlog::level::from_str(j.value("remote", std::string("warning")));
    c.config = spdlog::level::from_str(j.value("config", std::string("warning")));
}

} // namespace skiff::config
