#include "retriever.hpp"
#include "crx_header.hpp"
#include "exception.hpp"
#include "hash.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <optional>
#include <span>
#include <vector>

namespace fs = std::filesystem;

namespace {
    constexpr size_t COPY_CHUNK_SIZE = 64 * 1024;

    // Copies the body into file. Returns the number of bytes written.
    uint64_t stream_to_file(ResponseStream& body, std::ofstream& file, const fs::path& output_path) {
        std::optional<uint64_t> total = body.content_length();
        std::vector<char> buffer(COPY_CHUNK_SIZE);
        uint64_t written = 0;

        size_t count = 0;
        while ((count = body.read(buffer.data(), buffer.size())) > 0) {
            file.write(buffer.data(), static_cast<std::streamsize>(count));
            if (!file) {
                throw CrxgetException(string_format("error.write_file_failed", output_path.string()));
            }
            written += count;
            if (total && *total > 0) {
                log_progress(get_string("info.downloading"), static_cast<double>(written) / static_cast<double>(*total) * 100.0);
            }
        }
        log_progress_done();
        return written;
    }
}

std::string build_update_url(const std::string& endpoint, const std::string& identifier, const std::string& chrome_version) {
    return endpoint + "?response=redirect&prodversion=" + chrome_version +
           "&acceptformat=crx2,crx3&x=id%3D" + identifier + "%26uc";
}

HeaderMap build_request_headers(const std::string& chrome_version) {
    return {
        {"User-Agent", "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 (KHTML, like Gecko) Chrome/" +
                           chrome_version + " Safari/537.36"},
        {"Accept", "*/*"},
    };
}

RetrievalRequest make_retrieval_request(const std::string& identifier, const Settings& settings) {
    RetrievalRequest request;
    request.identifier = identifier;
    request.chrome_version = settings.chrome_version;
    request.update_url = settings.update_url;
    request.max_redirects = settings.max_redirects;
    request.headers = build_request_headers(settings.chrome_version);
    request.fetch_options.connect_timeout = settings.connect_timeout;
    request.fetch_options.timeout = settings.timeout;
    return request;
}

void download_crx(const RetrievalRequest& request, const fs::path& output_path) {
    std::string url = build_update_url(request.update_url, request.identifier, request.chrome_version);
    log_info(string_format("info.download_attempt", url));

    HttpClient client(request.fetch_options);
    FetchResult result = client.fetch(url, request.headers, request.max_redirects);

    if (result.status_code != 200) {
        try {
            result.body->drain();
        } catch (const NetworkError& e) {
            // The status is the failure worth reporting.
            log_warning(e.what());
        }
        throw DownloadError(string_format("error.download_status", result.status_code), result.status_code);
    }

    std::ofstream file(output_path, std::ios::binary | std::ios::trunc);
    if (!file) {
        throw CrxgetException(string_format("error.create_file_failed", output_path.string()) + ": " + strerror(errno));
    }

    try {
        uint64_t written = stream_to_file(*result.body, file, output_path);
        file.close();
        if (!file) {
            throw CrxgetException(string_format("error.write_file_failed", output_path.string()));
        }
        log_info(string_format("info.crx_saved", output_path.string(), written));
    } catch (const std::exception&) {
        log_progress_done();
        if (file.is_open()) {
            file.close();
        }
        std::error_code ec;
        fs::remove(output_path, ec); // Clean up failed download
        throw;
    }
}

void convert_crx_to_zip(const fs::path& crx_path, const fs::path& zip_path) {
    if (fs::absolute(crx_path).lexically_normal() == fs::absolute(zip_path).lexically_normal()) {
        throw CrxgetException(string_format("error.convert_same_path", crx_path.string()));
    }

    std::error_code ec;
    if (fs::exists(crx_path, ec) && fs::exists(zip_path, ec) && fs::equivalent(crx_path, zip_path, ec)) {
        throw CrxgetException(string_format("error.convert_same_path", crx_path.string()));
    }

    fs::remove(zip_path, ec);
    if (ec) {
        throw CrxgetException(string_format("error.remove_file_failed", zip_path.string(), ec.message()));
    }

    std::vector<uint8_t> buffer = read_file_bytes(crx_path);
    CrxHeader header = parse_crx_header(buffer);

    std::span<const uint8_t> archive = std::span<const uint8_t>(buffer).subspan(header.archive_offset);
    write_file_bytes(zip_path, archive);
    log_info(string_format("info.zip_saved", zip_path.string(), archive.size(),
                           static_cast<uint32_t>(header.version), header.archive_offset));
}

ConvertedPaths retrieve_and_convert(const RetrievalRequest& request, const fs::path& destination_dir, const std::string& base_name) {
    ensure_dir_exists(destination_dir);

    ConvertedPaths paths;
    paths.container_path = destination_dir / (base_name + ".crx");
    paths.archive_path = destination_dir / (base_name + ".zip");

    download_crx(request, paths.container_path);
    convert_crx_to_zip(paths.container_path, paths.archive_path);

    log_info(string_format("info.sha256", paths.container_path.string(), calculate_sha256(paths.container_path)));
    log_info(string_format("info.sha256", paths.archive_path.string(), calculate_sha256(paths.archive_path)));
    return paths;
}
