// CaveGen Platform Layer
// file_io.hpp - File system helpers for configs, logs and exported levels

#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace cavegen::platform {

namespace fs = std::filesystem;

// Static utility class for file system operations. Failures are logged and
// reported through the return value; nothing here throws.
class FileSystem {
public:
    // Standard paths
    static fs::path get_user_data_directory();  // $XDG_DATA_HOME/CaveGen or ~/.local/share/CaveGen

    // Synchronous text I/O
    static std::optional<std::string> read_text(const fs::path& path);
    static bool write_text(const fs::path& path, std::string_view content);

    // Creates missing parents; true when the directory exists afterwards
    static bool create_directories(const fs::path& path);

private:
    FileSystem() = delete;  // Static class, no instances
};

}  // namespace cavegen::platform
