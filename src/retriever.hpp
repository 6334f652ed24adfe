#pragma once

#include "config.hpp"
#include "http_client.hpp"

#include <filesystem>
#include <string>

struct RetrievalRequest {
    std::string identifier;
    std::string chrome_version = DEFAULT_CHROME_VERSION;
    std::string update_url = DEFAULT_UPDATE_URL;
    int max_redirects = DEFAULT_MAX_REDIRECTS;
    HeaderMap headers;
    FetchOptions fetch_options;
};

struct ConvertedPaths {
    std::filesystem::path container_path;
    std::filesystem::path archive_path;
};

// <endpoint>?response=redirect&prodversion=<version>&acceptformat=crx2,crx3&x=id%3D<id>%26uc
std::string build_update_url(const std::string& endpoint, const std::string& identifier, const std::string& chrome_version);

// Chrome user agent for chrome_version plus Accept: */*
HeaderMap build_request_headers(const std::string& chrome_version);

RetrievalRequest make_retrieval_request(const std::string& identifier, const Settings& settings);

// Streams the container to output_path, replacing any existing file.
// Throws DownloadError if the final status is not 200; a partial file is removed on failure.
void download_crx(const RetrievalRequest& request, const std::filesystem::path& output_path);

// Writes the ZIP part of crx_path to zip_path. On a parse error no ZIP is left at zip_path.
void convert_crx_to_zip(const std::filesystem::path& crx_path, const std::filesystem::path& zip_path);

// Downloads <destination_dir>/<base_name>.crx and converts it to <destination_dir>/<base_name>.zip.
ConvertedPaths retrieve_and_convert(const RetrievalRequest& request,
                                    const std::filesystem::path& destination_dir,
                                    const std::string& base_name);
