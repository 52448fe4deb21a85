#include "unflake/io/file_system.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace unflake {

namespace {

auto is_hidden(const std::filesystem::path& path) -> bool {
    return path.filename().string().starts_with('.');
}

} // namespace

auto FileSystem::read_file(const std::string& path) -> std::optional<std::string> {
    if (is_directory(path)) {
        return std::nullopt;
    }

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return std::nullopt;
    }

    std::ostringstream content;
    content << file.rdbuf();
    if (file.bad()) {
        return std::nullopt;
    }
    return content.str();
}

auto FileSystem::write_file(const std::string& path, const std::string& content) -> bool {
    // Write to temporary file first for atomic operation
    std::string temp_path = path + ".tmp";

    {
        std::ofstream file(temp_path, std::ios::binary | std::ios::trunc);
        if (!file.is_open()) {
            return false;
        }

        file << content;
        file.flush();
        if (file.fail()) {
            std::error_code ignored;
            std::filesystem::remove(temp_path, ignored);
            return false;
        }
    } // File automatically closed here

    // Keep the original file's permissions
    std::error_code ec;
    auto original_permissions = std::filesystem::status(path, ec).permissions();
    if (!ec) {
        std::filesystem::permissions(temp_path, original_permissions, ec);
    }

    // Atomically replace original file
    std::filesystem::rename(temp_path, path, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(temp_path, ignored);
        return false;
    }
    return true;
}

auto FileSystem::is_directory(const std::string& path) -> bool {
    std::error_code ec;
    return std::filesystem::is_directory(path, ec);
}

auto FileSystem::collect_python_files(const std::string& directory) -> std::vector<std::string> {
    std::vector<std::string> files;
    std::error_code ec;
    std::filesystem::recursive_directory_iterator it(
        directory, std::filesystem::directory_options::skip_permission_denied, ec);

    for (; !ec && it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
        const auto& entry = *it;
        std::error_code entry_ec;
        if (is_hidden(entry.path())) {
            if (entry.is_directory(entry_ec)) {
                it.disable_recursion_pending();
            }
            continue;
        }
        if (entry.is_regular_file(entry_ec) && entry.path().extension() == ".py") {
            files.push_back(entry.path().string());
        }
    }

    std::sort(files.begin(), files.end());
    return files;
}

} // namespace unflake
