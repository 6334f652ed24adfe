#pragma once

#include "config.hpp"

#include <curl/curl.h>

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

// Header names are stored lower-cased.
using HeaderMap = std::map<std::string, std::string, std::less<>>;

// RAII for curl global init/cleanup
struct CurlGlobalInitializer {
    CurlGlobalInitializer() {
        curl_global_init(CURL_GLOBAL_DEFAULT);
    }
    ~CurlGlobalInitializer() {
        curl_global_cleanup();
    }
    CurlGlobalInitializer(const CurlGlobalInitializer&) = delete;
    CurlGlobalInitializer& operator=(const CurlGlobalInitializer&) = delete;
};

struct CurlDeleter {
    void operator()(CURL* curl) const {
        if (curl) {
            curl_easy_cleanup(curl);
        }
    }
};

struct CurlMultiDeleter {
    void operator()(CURLM* multi) const {
        if (multi) {
            curl_multi_cleanup(multi);
        }
    }
};

struct CurlSlistDeleter {
    void operator()(curl_slist* list) const {
        curl_slist_free_all(list);
    }
};

using CurlHandle = std::unique_ptr<CURL, CurlDeleter>;
using CurlMultiHandle = std::unique_ptr<CURLM, CurlMultiDeleter>;
using CurlSlist = std::unique_ptr<curl_slist, CurlSlistDeleter>;

struct FetchOptions {
    long connect_timeout = 0; // seconds, 0 = transport default
    long timeout = 0;
};

/*
 * Body of a single HTTP response, pulled on demand.
 *
 * The transfer runs on the owning HttpClient's multi handle and is only
 * advanced from read()/drain(). At most MAX_BUFFERED bytes are held before
 * the transfer is paused. A stream must not outlive the client that opened it.
 */
class ResponseStream {
    // Only HttpClient can name this, so only it can open streams.
    struct Token {
        explicit Token() = default;
    };

public:
    static constexpr size_t MAX_BUFFERED = 64 * 1024;

    ResponseStream(Token, CURLM* multi, const std::string& url, const HeaderMap& request_headers, const FetchOptions& options);

    ~ResponseStream();
    ResponseStream(const ResponseStream&) = delete;
    ResponseStream& operator=(const ResponseStream&) = delete;

    // Copies up to size bytes of body into buffer. Returns 0 once the body is complete.
    // Throws NetworkError if the transfer fails.
    size_t read(char* buffer, size_t size);

    // Reads and discards the rest of the body.
    void drain();

    long status_code() const { return status_code_; }
    const HeaderMap& headers() const { return headers_; }
    const std::string& url() const { return url_; }
    std::optional<uint64_t> content_length() const;
    // Location resolved against the request URL, empty if the response has none.
    std::string redirect_url() const;

private:
    friend class HttpClient;

    void wait_for_headers();
    void pump();
    void collect_messages();
    size_t available() const { return pending_.size() - pending_pos_; }

    static size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata);
    static size_t header_callback(char* ptr, size_t size, size_t nmemb, void* userdata);

    CURLM* multi_;
    CurlHandle easy_;
    CurlSlist request_headers_;
    std::string url_;
    char error_buffer_[CURL_ERROR_SIZE] = {};

    std::string pending_;
    size_t pending_pos_ = 0;
    bool attached_ = false;
    bool started_ = false;
    bool paused_ = false;
    bool headers_done_ = false;
    bool finished_ = false;

    long status_code_ = 0;
    HeaderMap headers_;
};

struct FetchResult {
    long status_code = 0;
    HeaderMap headers;
    std::unique_ptr<ResponseStream> body;
};

// One client per retrieval; its multi handle keeps the connection pool for all hops.
class HttpClient {
public:
    explicit HttpClient(FetchOptions options = {});

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    // Single GET, returns once the response headers are in.
    std::unique_ptr<ResponseStream> get(const std::string& url, const HeaderMap& headers);

    // GET that follows up to hop_budget redirects, sending the same headers on every hop.
    // 3xx responses without a Location and all other statuses are returned as-is.
    FetchResult fetch(const std::string& url, const HeaderMap& headers, int hop_budget = DEFAULT_MAX_REDIRECTS);

private:
    CurlMultiHandle multi_;
    FetchOptions options_;
};

bool is_redirect_status(long status_code);
