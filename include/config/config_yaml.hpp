#pragma once

#include "config/Config.hpp"
#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace skiff::config;

inline std::string to_std_string(const spdlog::string_view_t sv) { return {sv.data(), sv.size()}; }

inline spdlog::level::level_enum levelOr(const Node& node, const spdlog::level::level_enum def) {
    if (!node) return def;
    const auto lvl = spdlog::level::from_str(node.as<std::string>());
    // from_str() maps unknown names to "off"
    if (lvl == spdlog::level::off && node.as<std::string>() != "off") return def;
    return lvl;
}

template<>
struct convert<CachingConfig> {
    static Node encode(const CachingConfig& rhs) {
        Node node;
        node["max_age_minutes"] = rhs.max_age_minutes;
        node["cleanup_interval_ms"] = rhs.cleanup_interval_ms;
        return node;
    }

    static bool decode(const Node& node, CachingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.max_age_minutes = node["max_age_minutes"].as<unsigned int>(5);
        rhs.cleanup_interval_ms = node["cleanup_interval_ms"].as<unsigned int>(10 * 60 * 1000);
        return true;
    }
};

template<>
struct convert<TransfersConfig> {
    static Node encode(const TransfersConfig& rhs) {
        Node node;
        node["chunk_size_bytes"] = rhs.chunk_size_bytes;
        node["max_concurrent_transfers"] = rhs.max_concurrent_transfers;
        node["max_concurrent_loads"] = rhs.max_concurrent_loads;
        node["excluded_extensions"] = rhs.excluded_extensions;
        node["use_existing_folders"] = rhs.use_existing_folders;
        return node;
    }

    static bool decode(const Node& node, TransfersConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.chunk_size_bytes = node["chunk_size_bytes"].as<uintmax_t>(DEFAULT_CHUNK_SIZE_BYTES);
        rhs.max_concurrent_transfers = node["max_concurrent_transfers"].as<unsigned int>(3);
        rhs.max_concurrent_loads = node["max_concurrent_loads"].as<unsigned int>(2);
        if (node["excluded_extensions"]) rhs.excluded_extensions = node["excluded_extensions"].as<std::vector<std::string>>();
        rhs.use_existing_folders = node["use_existing_folders"].as<bool>(true);
        if (rhs.chunk_size_bytes == 0 || rhs.max_concurrent_transfers == 0 || rhs.max_concurrent_loads == 0) return false;
        return true;
    }
};

template<>
struct convert<SubsystemLogLevelsConfig> {
    static Node encode(const SubsystemLogLevelsConfig& rhs) {
        Node node;
        node["skiff"]    = to_std_string(spdlog::level::to_string_view(rhs.skiff));
        node["cache"]    = to_std_string(spdlog::level::to_string_view(rhs.cache));
        node["transfer"] = to_std_string(spdlog::level::to_string_view(rhs.transfer));
        node["remote"]   = to_std_string(spdlog::level::to_string_view(rhs.remote));
        node["config"]   = to_std_string(spdlog::level::to_string_view(rhs.config));
        return node;
    }

    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        const SubsystemLogLevelsConfig def;
        rhs.skiff    = levelOr(node["skiff"], def.skiff);
        rhs.cache    = levelOr(node["cache"], def.cache);
        rhs.transfer = levelOr(node["transfer"], def.transfer);
        rhs.remote   = levelOr(node["remote"], def.remote);
        rhs.config   = levelOr(node["config"], def.config);
        return true;
    }
};

template<>
struct convert<LogLevelsConfig> {
    static Node encode(const LogLevelsConfig& rhs) {
        Node node;
        node["console"] = to_std_string(spdlog::level::to_string_view(rhs.console_log_level));
        node["file"] = to_std_string(spdlog::level::to_string_view(rhs.file_log_level));
        node["subsystems"] = convert<SubsystemLogLevelsConfig>::encode(rhs.subsystem_levels);
        return node;
    }

    static bool decode(const Node& node, LogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        const LogLevelsConfig def;
        rhs.console_log_level = levelOr(node["console"], def.console_log_level);
        rhs.file_log_level = levelOr(node["file"], def.file_log_level);
        if (node["subsystems"]) convert<SubsystemLogLevelsConfig>::decode(node["subsystems"], rhs.subsystem_levels);
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static Node encode(const LoggingConfig& rhs) {
        Node node;
        node["log_dir"] = rhs.log_dir.string();
        node["levels"] = convert<LogLevelsConfig>::encode(rhs.levels);
        return node;
    }

    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.log_dir = node["log_dir"].as<std::string>("");
        if (node["levels"]) convert<LogLevelsConfig>::decode(node["levels"], rhs.levels);
        return true;
    }
};

}
