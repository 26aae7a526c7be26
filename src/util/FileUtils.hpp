#pragma once
// FileUtils.hpp - XDG directory helpers and small filesystem wrappers

#include <filesystem>
#include <string>
#include "util/Result.hpp"

namespace lf::file {

namespace fs = std::filesystem;

fs::path configDir();
fs::path cacheDir();

// Creates the directory tree if missing; false if it could not be created
bool ensureDir(const fs::path& dir);

Result<std::string> readText(const fs::path& path);

// Expands a leading "~/" to $HOME
fs::path expandPath(std::string_view path);

} // namespace lf::file
