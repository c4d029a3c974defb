#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace council {

namespace fs = std::filesystem;

std::string trim(const std::string& s);
bool starts_with(const std::string& s, const std::string& prefix);
bool ends_with(const std::string& s, const std::string& suffix);
std::string join(const std::vector<std::string>& parts, const std::string& sep);

// Expands a leading ~ to $HOME.
std::string expand_path(const std::string& path);

// Expands ~ and makes relative paths relative to base_dir.
fs::path resolve_path(const std::string& path, const fs::path& base_dir);

bool file_exists(const fs::path& path);
bool dir_exists(const fs::path& path);

// Whole file as bytes; nullopt when it cannot be opened.
std::optional<std::string> read_file(const fs::path& path);

// Throws std::runtime_error when the file cannot be written.
void write_file(const fs::path& path, const std::string& content);

}  // namespace council
