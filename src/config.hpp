#pragma once

#include <string>
#include <filesystem>

// Localization directory (defaults to the compile-time CRXGET_L10N_DIR)
extern std::filesystem::path L10N_DIR;

// Built-in defaults
inline const std::string DEFAULT_UPDATE_URL = "https://clients2.google.com/service/update2/crx";
inline const std::string DEFAULT_CHROME_VERSION = "114.0.5735.133";
inline const std::filesystem::path DEFAULT_OUTPUT_DIR = "extensions";
inline constexpr int DEFAULT_MAX_REDIRECTS = 5;

struct Settings {
    std::string update_url = DEFAULT_UPDATE_URL;
    std::string chrome_version = DEFAULT_CHROME_VERSION;
    std::filesystem::path output_dir = DEFAULT_OUTPUT_DIR;
    int max_redirects = DEFAULT_MAX_REDIRECTS;
    long connect_timeout = 0; // seconds, 0 = transport default
    long timeout = 0;
};

// $XDG_CONFIG_HOME/crxget/crxget.conf or ~/.config/crxget/crxget.conf; empty if neither is resolvable.
std::filesystem::path default_config_path();

// Applies the key=value pairs of a configuration file on top of settings.
void load_config_file(const std::filesystem::path& path, Settings& settings);

// Loads the explicit file (must exist) or the default file (optional).
Settings load_settings(const std::filesystem::path& explicit_path = {});
