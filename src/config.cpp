#include "config.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <charconv>
#include <cstdlib>
#include <fstream>

namespace fs = std::filesystem;

fs::path L10N_DIR = CRXGET_L10N_DIR;

namespace {
    template<typename T>
    T parse_number(const std::string& key, const std::string& value, const fs::path& path) {
        T result{};
        auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), result);
        if (ec != std::errc() || ptr != value.data() + value.size() || result < 0) {
            throw CrxgetException(string_format("error.invalid_config_value", key, value, path.string()));
        }
        return result;
    }
}

fs::path default_config_path() {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg && *xdg) {
        return fs::path(xdg) / "crxget" / "crxget.conf";
    }
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return fs::path(home) / ".config" / "crxget" / "crxget.conf";
    }
    return {};
}

void load_config_file(const fs::path& path, Settings& settings) {
    std::ifstream config_file(path);
    if (!config_file.is_open()) {
        throw CrxgetException(string_format("error.open_file_failed", path.string()));
    }

    std::string line;
    while (std::getline(config_file, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;

        size_t pos = line.find('=');
        if (pos == std::string::npos) {
            throw CrxgetException(string_format("error.invalid_config_line", line, path.string()));
        }
        std::string key = trim(std::string_view(line).substr(0, pos));
        std::string value = trim(std::string_view(line).substr(pos + 1));

        if (key == "update_url") {
            settings.update_url = value;
        } else if (key == "chrome_version") {
            settings.chrome_version = value;
        } else if (key == "output_dir") {
            settings.output_dir = value;
        } else if (key == "max_redirects") {
            settings.max_redirects = parse_number<int>(key, value, path);
        } else if (key == "connect_timeout") {
            settings.connect_timeout = parse_number<long>(key, value, path);
        } else if (key == "timeout") {
            settings.timeout = parse_number<long>(key, value, path);
        } else {
            log_warning(string_format("warning.unknown_config_key", key, path.string()));
        }
    }
}

Settings load_settings(const fs::path& explicit_path) {
    Settings settings;
    if (!explicit_path.empty()) {
        load_config_file(explicit_path, settings);
        return settings;
    }

    fs::path path = default_config_path();
    if (!path.empty() && fs::exists(path)) {
        load_config_file(path, settings);
    }
    return settings;
}
