#pragma once

#include <filesystem>

namespace lv::paths {

std::filesystem::path getConfigPath();
std::filesystem::path getLogDir();

void setConfigPath(const std::filesystem::path& path);
void setLogDir(const std::filesystem::path& path);

// Points logs at a throwaway directory under the system temp dir
void setLogPathForTesting();

}
