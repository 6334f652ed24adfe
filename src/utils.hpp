#pragma once

#include "exception.hpp"
#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace fs = std::filesystem;

// Color codes
inline constexpr std::string_view COLOR_GREEN = "\033[1;32m";
inline constexpr std::string_view COLOR_WHITE = "\033[1;37m";
inline constexpr std::string_view COLOR_YELLOW = "\033[1;33m";
inline constexpr std::string_view COLOR_RED = "\033[1;31m";
inline constexpr std::string_view COLOR_RESET = "\033[0m";

// Log functions
void log_info(std::string_view msg);
void log_warning(std::string_view msg);
void log_error(std::string_view msg);
void log_progress(const std::string& msg, double percentage, int bar_width = 50);
// Terminates a progress bar line if one was drawn.
void log_progress_done();

// Filesystem utilities
void ensure_dir_exists(const fs::path& path);
std::vector<uint8_t> read_file_bytes(const fs::path& path);
void write_file_bytes(const fs::path& path, std::span<const uint8_t> data);

std::string trim(std::string_view text);

// A store URL or bare extension id, split into the id and a file-safe name.
struct ExtensionTarget {
    std::string id;
    std::string name;
};

ExtensionTarget parse_extension_target(const std::string& target);
bool looks_like_extension_id(std::string_view id);
std::string sanitize_name(std::string_view name);
