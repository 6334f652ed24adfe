#include "utils.hpp"

#include "exception.hpp"
#include "localization.hpp"

#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>

namespace {
    std::mutex log_mutex;
    bool is_stdout_tty = false;
    bool is_stderr_tty = false;
    bool tty_check_performed = false;
    bool progress_line_open = false;

    void check_tty() {
        if (!tty_check_performed) {
            is_stdout_tty = isatty(STDOUT_FILENO);
            is_stderr_tty = isatty(STDERR_FILENO);
            tty_check_performed = true;
        }
    }

    // Helper function to reduce code duplication in logging
    void log_internal(std::string_view prefix, std::string_view color, std::string_view msg, std::ostream& stream) {
        std::lock_guard<std::mutex> lock(log_mutex);
        check_tty();

        bool current_stream_is_tty = false;
        if (&stream == &std::cout) {
            current_stream_is_tty = is_stdout_tty;
        } else if (&stream == &std::cerr) {
            current_stream_is_tty = is_stderr_tty;
        }

        if (progress_line_open) {
            std::cout << std::endl;
            progress_line_open = false;
        }

        if (current_stream_is_tty) {
            stream << color << prefix << COLOR_WHITE << msg << COLOR_RESET << std::endl;
        } else {
            stream << prefix << msg << std::endl;
        }
    }
}

void log_info(std::string_view msg) {
    log_internal(get_string("info.log_prefix") + " ", COLOR_GREEN, msg, std::cout);
}

void log_warning(std::string_view msg) {
    log_internal(get_string("warning.prefix") + " ", COLOR_YELLOW, msg, std::cerr);
}

void log_error(std::string_view msg) {
    log_internal(get_string("error.prefix") + " ", COLOR_RED, msg, std::cerr);
}

void log_progress(const std::string& msg, double percentage, int bar_width) {
    std::lock_guard<std::mutex> lock(log_mutex);
    check_tty();
    if (!is_stdout_tty) {
        return;
    }

    percentage = std::clamp(percentage, 0.0, 100.0);
    int pos = static_cast<int>(bar_width * percentage / 100.0);

    std::cout << "\r" << COLOR_GREEN << "==> " << COLOR_WHITE << msg << " [";
    for (int i = 0; i < bar_width; ++i) {
        if (i < pos) std::cout << "#";
        else if (i == pos) std::cout << ">";
        else std::cout << "-";
    }
    std::cout << "] " << std::fixed << std::setprecision(1) << percentage << "%" << COLOR_RESET << std::flush;
    progress_line_open = true;
}

void log_progress_done() {
    std::lock_guard<std::mutex> lock(log_mutex);
    if (progress_line_open) {
        std::cout << std::endl;
        progress_line_open = false;
    }
}

void ensure_dir_exists(const fs::path& path) {
    if (!fs::exists(path)) {
        std::error_code ec;
        if (!fs::create_directories(path, ec)) {
            throw CrxgetException(string_format("error.create_dir_failed", path.string()) + ": " + ec.message());
        }
    }
    else if (!fs::is_directory(path)) {
        throw CrxgetException(string_format("error.path_not_dir", path.string()));
    }
}

std::vector<uint8_t> read_file_bytes(const fs::path& path) {
    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file.is_open()) {
        throw CrxgetException(string_format("error.open_file_failed", path.string()) + ": " + strerror(errno));
    }
    std::streamsize size = file.tellg();
    if (size < 0) {
        throw CrxgetException(string_format("error.read_file_failed", path.string()));
    }
    file.seekg(0, std::ios::beg);

    std::vector<uint8_t> data(static_cast<size_t>(size));
    if (size > 0 && !file.read(reinterpret_cast<char*>(data.data()), size)) {
        throw CrxgetException(string_format("error.read_file_failed", path.string()));
    }
    return data;
}

void write_file_bytes(const fs::path& path, std::span<const uint8_t> data) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        throw CrxgetException(string_format("error.create_file_failed", path.string()) + ": " + strerror(errno));
    }
    file.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    file.close();
    if (!file) {
        throw CrxgetException(string_format("error.write_file_failed", path.string()));
    }
}

std::string trim(std::string_view text) {
    const char* whitespace = " \t\r\n";
    size_t begin = text.find_first_not_of(whitespace);
    if (begin == std::string_view::npos) {
        return "";
    }
    size_t end = text.find_last_not_of(whitespace);
    return std::string(text.substr(begin, end - begin + 1));
}

bool looks_like_extension_id(std::string_view id) {
    return id.size() == 32 && std::all_of(id.begin(), id.end(), [](char c) { return c >= 'a' && c <= 'p'; });
}

std::string sanitize_name(std::string_view name) {
    std::string result;
    for (char c : name) {
        if ((c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_' || c == '-') {
            result += c;
        }
    }
    return result.empty() ? "extension" : result;
}

ExtensionTarget parse_extension_target(const std::string& target) {
    std::string_view text = target;
    // e.g. https://chromewebstore.google.com/detail/twitterx-feed-blocker/iofjnhbihgjfhdldcnlmjbfmighljfob
    size_t cut = text.find_first_of("?#");
    if (cut != std::string_view::npos) {
        text = text.substr(0, cut);
    }

    std::vector<std::string_view> parts;
    size_t start = 0;
    while (start <= text.size()) {
        size_t slash = text.find('/', start);
        if (slash == std::string_view::npos) slash = text.size();
        if (slash > start) {
            parts.push_back(text.substr(start, slash - start));
        }
        start = slash + 1;
    }

    if (parts.empty()) {
        throw CrxgetException(string_format("error.invalid_target", target));
    }

    ExtensionTarget result;
    result.id = trim(parts.back());
    if (result.id.empty()) {
        throw CrxgetException(string_format("error.invalid_target", target));
    }
    // The segment before the id is usually the store slug, not guaranteed to match the real name.
    result.name = sanitize_name(parts.size() >= 2 ? parts[parts.size() - 2] : parts.back());
    return result;
}
