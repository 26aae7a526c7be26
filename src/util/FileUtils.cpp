#include "FileUtils.hpp"
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace lf::file {

namespace {

fs::path xdgDir(const char* envVar, const char* fallbackSuffix) {
    if (const char* xdg = std::getenv(envVar); xdg && *xdg) {
        return fs::path(xdg) / "lyricforge";
    }
    if (const char* home = std::getenv("HOME"); home && *home) {
        return fs::path(home) / fallbackSuffix / "lyricforge";
    }
    return fs::temp_directory_path() / "lyricforge";
}

} // namespace

fs::path configDir() {
    return xdgDir("XDG_CONFIG_HOME", ".config");
}

fs::path cacheDir() {
    return xdgDir("XDG_CACHE_HOME", ".cache");
}

bool ensureDir(const fs::path& dir) {
    if (dir.empty())
        return true;
    std::error_code ec;
    if (fs::exists(dir, ec))
        return fs::is_directory(dir, ec);
    return fs::create_directories(dir, ec) && !ec;
}

Result<std::string> readText(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return Result<std::string>::err(ErrorKind::Io,
                                        "Cannot open " + path.string());
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    return Result<std::string>::ok(ss.str());
}

fs::path expandPath(std::string_view path) {
    std::string p(path);
    if (p.starts_with("~/")) {
        if (const char* home = std::getenv("HOME")) {
            p = std::string(home) + p.substr(1);
        }
    }
    return fs::path(p);
}

} // namespace lf::file
