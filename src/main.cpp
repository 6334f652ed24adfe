#include "config.hpp"
#include "crx_header.hpp"
#include "exception.hpp"
#include "hash.hpp"
#include "http_client.hpp"
#include "localization.hpp"
#include "retriever.hpp"
#include "utils.hpp"

#include <cxxopts.hpp>

#include <functional>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;

void print_usage(const cxxopts::Options& options) {
    std::cerr << options.help({""});
    std::cerr << get_string("info.commands") << std::endl;
    std::cerr << get_string("info.fetch_desc") << std::endl;
    std::cerr << get_string("info.convert_desc") << std::endl;
    std::cerr << get_string("info.info_desc") << std::endl;
}

void pre_operation_check(const std::vector<std::string>& targets, std::function<void()> print_usage_func, size_t min, std::optional<size_t> max = std::nullopt) {
    if (targets.size() < min || (max.has_value() && targets.size() > max.value())) {
        print_usage_func();
        throw CrxgetException(get_string("error.invalid_arg_count"));
    }
}

void apply_overrides(const cxxopts::ParseResult& result, Settings& settings) {
    if (result.count("chrome-version")) {
        settings.chrome_version = result["chrome-version"].as<std::string>();
    }
    if (result.count("output-dir")) {
        settings.output_dir = result["output-dir"].as<std::string>();
    }
    if (result.count("update-url")) {
        settings.update_url = result["update-url"].as<std::string>();
    }
    if (result.count("max-redirects")) {
        settings.max_redirects = result["max-redirects"].as<int>();
    }
    if (result.count("connect-timeout")) {
        settings.connect_timeout = result["connect-timeout"].as<long>();
    }
    if (result.count("timeout")) {
        settings.timeout = result["timeout"].as<long>();
    }
    if (settings.max_redirects < 0 || settings.connect_timeout < 0 || settings.timeout < 0) {
        throw CrxgetException(get_string("error.negative_option"));
    }
}

void fetch_targets(const std::vector<std::string>& targets, const Settings& settings, const std::optional<std::string>& name_override) {
    for (const auto& target_arg : targets) {
        ExtensionTarget target = parse_extension_target(target_arg);
        if (name_override) {
            target.name = sanitize_name(*name_override);
        }
        if (!looks_like_extension_id(target.id)) {
            log_warning(string_format("warning.unusual_extension_id", target.id));
        }

        log_info(string_format("info.fetching_extension", target.name, target.id));
        log_info(string_format("info.using_chrome_version", settings.chrome_version));

        RetrievalRequest request = make_retrieval_request(target.id, settings);
        ConvertedPaths paths = retrieve_and_convert(request, settings.output_dir, target.name);
        log_info(string_format("info.fetch_complete", paths.container_path.string(), paths.archive_path.string()));
    }
}

void convert_files(const std::vector<std::string>& files, const std::optional<fs::path>& output_dir) {
    for (const auto& file : files) {
        fs::path crx_path(file);
        fs::path zip_path = crx_path;
        zip_path.replace_extension(".zip");
        if (output_dir) {
            ensure_dir_exists(*output_dir);
            zip_path = *output_dir / zip_path.filename();
        }
        convert_crx_to_zip(crx_path, zip_path);
    }
}

void show_info(const std::vector<std::string>& files) {
    for (const auto& file : files) {
        std::vector<uint8_t> buffer = read_file_bytes(file);
        CrxHeader header = parse_crx_header(buffer);

        log_info(string_format("info.crx_file", file));
        std::cout << string_format("info.crx_version", static_cast<uint32_t>(header.version)) << std::endl;
        switch (header.version) {
            case CrxVersion::V2:
                std::cout << string_format("info.crx_public_key_length", header.public_key_length) << std::endl;
                std::cout << string_format("info.crx_signature_length", header.signature_length) << std::endl;
                break;
            case CrxVersion::V3:
                std::cout << string_format("info.crx_header_size", header.header_size) << std::endl;
                break;
        }
        std::cout << string_format("info.crx_archive_offset", header.archive_offset) << std::endl;
        std::cout << string_format("info.crx_archive_size", buffer.size() - header.archive_offset) << std::endl;
        std::cout << string_format("info.crx_sha256", calculate_sha256(file)) << std::endl;
    }
}

int main(int argc, char* argv[]) {
    CurlGlobalInitializer curl_initializer;
    try {
        init_localization();

        cxxopts::Options options(argv[0]);
        options.custom_help(get_string("info.usage"));
        options.set_width(100);

        options.add_options()
            ("h,help", get_string("info.help_desc"))
            ("c,chrome-version", get_string("help.chrome_version"), cxxopts::value<std::string>())
            ("o,output-dir", get_string("help.output_dir"), cxxopts::value<std::string>())
            ("n,name", get_string("help.name"), cxxopts::value<std::string>())
            ("max-redirects", get_string("help.max_redirects"), cxxopts::value<int>())
            ("update-url", get_string("help.update_url"), cxxopts::value<std::string>())
            ("connect-timeout", get_string("help.connect_timeout"), cxxopts::value<long>())
            ("timeout", get_string("help.timeout"), cxxopts::value<long>())
            ("config", get_string("help.config"), cxxopts::value<std::string>())
            ("command", "", cxxopts::value<std::string>())
            ("targets", "", cxxopts::value<std::vector<std::string>>());

        options.parse_positional({"command", "targets"});

        auto result = options.parse(argc, argv);

        if (result.count("help")) {
            print_usage(options);
            return 0;
        }

        if (!result.count("command")) {
            print_usage(options);
            return 1;
        }

        std::string command = result["command"].as<std::string>();
        std::vector<std::string> targets;
        if (result.count("targets")) {
            targets = result["targets"].as<std::vector<std::string>>();
        }

        fs::path config_path;
        if (result.count("config")) {
            config_path = result["config"].as<std::string>();
        }
        Settings settings = load_settings(config_path);

        // Old form: crxget <extension_url> [<chrome_version>]
        if (command != "fetch" && command != "convert" && command != "info") {
            if (targets.size() > 1) {
                print_usage(options);
                throw CrxgetException(get_string("error.invalid_arg_count"));
            }
            if (targets.size() == 1 && !result.count("chrome-version")) {
                settings.chrome_version = targets[0];
            }
            targets = {command};
            command = "fetch";
        }

        apply_overrides(result, settings);

        auto usage_printer = [&]() { print_usage(options); };

        if (command == "fetch") {
            pre_operation_check(targets, usage_printer, 1);
            std::optional<std::string> name_override;
            if (result.count("name")) {
                pre_operation_check(targets, usage_printer, 1, 1);
                name_override = result["name"].as<std::string>();
            }
            fetch_targets(targets, settings, name_override);
        } else if (command == "convert") {
            pre_operation_check(targets, usage_printer, 1);
            std::optional<fs::path> output_dir;
            if (result.count("output-dir")) {
                output_dir = settings.output_dir;
            }
            convert_files(targets, output_dir);
        } else if (command == "info") {
            pre_operation_check(targets, usage_printer, 1);
            show_info(targets);
        }

    } catch (const cxxopts::exceptions::exception& e) {
        log_error(string_format("error.cmd_parse_error", e.what()));
        return 1;
    } catch (const CrxgetException& e) {
        log_error(string_format("error.crxget_error", e.what()));
        return 1;
    } catch (const std::exception& e) {
        log_error(string_format("error.unexpected_error", e.what()));
        return 1;
    }

    return 0;
}
