#include "util/paths.hpp"

#include <cstdlib>
#include <mutex>
#include <optional>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

std::mutex pathMutex;
std::optional<fs::path> configOverride;
std::optional<fs::path> logOverride;

fs::path homeOr(const fs::path& fallback) {
    if (const char* home = std::getenv("HOME"); home && *home) return fs::path(home);
    return fallback;
}

}

namespace skiff::paths {

fs::path getConfigPath() {
    std::scoped_lock lock(pathMutex);
    if (configOverride) return *configOverride;
    if (const char* env = std::getenv("SKIFF_CONFIG"); env && *env) return fs::path(env);
    if (::geteuid() == 0) return "/etc/skiff/config.yaml";
    return homeOr("/tmp") / ".config" / "skiff" / "config.yaml";
}

fs::path getStatePath() {
    if (const char* env = std::getenv("XDG_STATE_HOME"); env && *env) return fs::path(env) / "skiff";
    return homeOr("/tmp") / ".local" / "state" / "skiff";
}

fs::path getLogPath() {
    std::scoped_lock lock(pathMutex);
    if (logOverride) return *logOverride;
    if (::geteuid() == 0) return "/var/log/skiff";
    return getStatePath() / "log";
}

void setConfigPath(const fs::path& path) {
    std::scoped_lock lock(pathMutex);
    configOverride = path;
}

void setLogPath(const fs::path& path) {
    std::scoped_lock lock(pathMutex);
    logOverride = path;
}

void setLogPathForTesting() {
    setLogPath(fs::temp_directory_path() / ("skiff_test_logs_" + std::to_string(::getpid())));
}

}
