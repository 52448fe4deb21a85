#pragma once

#include "unflake/interfaces.hpp"
#include <string>

namespace unflake {

class FileSystem : public IFileSystem {
public:
    // Contents byte for byte; std::nullopt for directories and unreadable files
    auto read_file(const std::string& path) -> std::optional<std::string> override;
    auto write_file(const std::string& path, const std::string& content) -> bool override;
    auto is_directory(const std::string& path) -> bool override;
    // Sorted *.py files below directory, skipping hidden files and directories
    auto collect_python_files(const std::string& directory) -> std::vector<std::string> override;
};

} // namespace unflake
