/**
 * @file ConfigLoader.hpp
 * @brief Reads and writes job configuration TOML files.
 *
 * Parse failures come back as ErrorKind::Config so a job never starts with a
 * half-applied configuration. Saves go through a temp file and a rename.
 *
 * @section Dependencies
 * - toml++
 * - ConfigParsers
 */

#pragma once
#include <filesystem>
#include <string_view>
#include "util/Result.hpp"

namespace lf {

class Config;

class ConfigLoader {
public:
    static Result<void> load(Config& config, const std::filesystem::path& path);
    static Result<void> loadFromString(Config& config, std::string_view toml);
    static Result<void> save(const Config& config,
                             const std::filesystem::path& path);

    // Loads <config dir>/config.toml, seeding it from the system default or
    // from built-in values when missing
    static Result<void> loadDefault(Config& config);
    static std::filesystem::path defaultPath();
};

} // namespace lf
