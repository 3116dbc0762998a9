#pragma once

#include <filesystem>

namespace skiff::paths {

std::filesystem::path getConfigPath();
std::filesystem::path getLogPath();
std::filesystem::path getStatePath();

void setConfigPath(const std::filesystem::path& path);
void setLogPath(const std::filesystem::path& path);

// Routes logs into a scratch directory under the system temp dir
void setLogPathForTesting();

}
