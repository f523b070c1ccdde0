// CaveGen Platform Layer
// file_io.cpp - File system helper implementation

#include <cavegen/platform/file_io.hpp>

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <fstream>
#include <iterator>

#if defined(CAVEGEN_PLATFORM_WINDOWS)
#include <shlobj.h>
#include <windows.h>
#else
#include <pwd.h>
#include <sys/types.h>
#include <unistd.h>
#endif

namespace cavegen::platform {

namespace {

#if !defined(CAVEGEN_PLATFORM_WINDOWS)
fs::path home_directory() {
    const char* home = std::getenv("HOME");
    if (home == nullptr) {
        struct passwd* pw = getpwuid(getuid());
        if (pw == nullptr) {
            return fs::current_path();
        }
        home = pw->pw_dir;
    }
    return fs::path(home);
}
#endif

}  // namespace

fs::path FileSystem::get_user_data_directory() {
#if defined(CAVEGEN_PLATFORM_MACOS)
    return home_directory() / "Library" / "Application Support" / "CaveGen";
#elif defined(CAVEGEN_PLATFORM_WINDOWS)
    wchar_t* path = nullptr;
    if (SUCCEEDED(SHGetKnownFolderPath(FOLDERID_LocalAppData, 0, nullptr, &path))) {
        fs::path result = fs::path(path) / "CaveGen";
        CoTaskMemFree(path);
        return result;
    }
    return fs::current_path() / "data";
#else
    const char* xdg_data = std::getenv("XDG_DATA_HOME");
    if (xdg_data != nullptr) {
        return fs::path(xdg_data) / "CaveGen";
    }
    return home_directory() / ".local" / "share" / "CaveGen";
#endif
}

std::optional<std::string> FileSystem::read_text(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        spdlog::warn("Cannot open '{}' for reading", path.string());
        return std::nullopt;
    }
    std::string content{std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>()};
    if (file.bad()) {
        spdlog::warn("Read error on '{}'", path.string());
        return std::nullopt;
    }
    return content;
}

bool FileSystem::write_text(const fs::path& path, std::string_view content) {
    if (path.has_parent_path() && !create_directories(path.parent_path())) {
        return false;
    }
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        spdlog::warn("Cannot open '{}' for writing", path.string());
        return false;
    }
    file.write(content.data(), static_cast<std::streamsize>(content.size()));
    if (!file.flush()) {
        spdlog::warn("Write error on '{}'", path.string());
        return false;
    }
    return true;
}

bool FileSystem::create_directories(const fs::path& path) {
    std::error_code ec;
    fs::create_directories(path, ec);
    if (ec) {
        spdlog::error("Cannot create directory '{}': {}", path.string(), ec.message());
        return false;
    }
    return true;
}

}  // namespace cavegen::platform
