#include "http_client.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstring>

namespace {
    constexpr int POLL_TIMEOUT_MS = 1000;

    std::string to_lower(std::string_view text) {
        std::string result(text);
        std::transform(result.begin(), result.end(), result.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return result;
    }

    // "HTTP/1.1 302 Found" -> 302
    long parse_status_line(std::string_view line) {
        size_t space = line.find(' ');
        if (space == std::string_view::npos) {
            return 0;
        }
        long status = 0;
        std::string_view rest = line.substr(space + 1);
        std::from_chars(rest.data(), rest.data() + rest.size(), status);
        return status;
    }
}

bool is_redirect_status(long status_code) {
    return status_code >= 300 && status_code < 400;
}

ResponseStream::ResponseStream(Token, CURLM* multi, const std::string& url, const HeaderMap& request_headers, const FetchOptions& options)
    : multi_(multi), easy_(curl_easy_init()), url_(url) {
    if (!easy_) {
        throw NetworkError(string_format("error.curl_init_failed", url));
    }

    curl_slist* list = nullptr;
    for (const auto& [name, value] : request_headers) {
        std::string line = name + ": " + value;
        curl_slist* appended = curl_slist_append(list, line.c_str());
        if (!appended) {
            curl_slist_free_all(list);
            throw NetworkError(string_format("error.curl_init_failed", url));
        }
        list = appended;
    }
    request_headers_.reset(list);

    CURL* curl = easy_.get();
    curl_easy_setopt(curl, CURLOPT_URL, url_.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, request_headers_.get());
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 0L);
    curl_easy_setopt(curl, CURLOPT_PROTOCOLS_STR, "http,https");
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_SUPPRESS_CONNECT_HEADERS, 1L);
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, error_buffer_);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, this);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, this);
    if (options.connect_timeout > 0) {
        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, options.connect_timeout);
    }
    if (options.timeout > 0) {
        curl_easy_setopt(curl, CURLOPT_TIMEOUT, options.timeout);
    }

    CURLMcode mc = curl_multi_add_handle(multi_, curl);
    if (mc != CURLM_OK) {
        throw NetworkError(string_format("error.download_failed", url_) + ": " + curl_multi_strerror(mc));
    }
    attached_ = true;
}

ResponseStream::~ResponseStream() {
    if (attached_) {
        curl_multi_remove_handle(multi_, easy_.get());
    }
}

size_t ResponseStream::write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* self = static_cast<ResponseStream*>(userdata);
    size_t bytes = size * nmemb;
    if (self->available() >= MAX_BUFFERED) {
        self->paused_ = true;
        return CURL_WRITEFUNC_PAUSE;
    }
    if (self->pending_pos_ == self->pending_.size()) {
        self->pending_.clear();
        self->pending_pos_ = 0;
    }
    self->pending_.append(ptr, bytes);
    return bytes;
}

size_t ResponseStream::header_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* self = static_cast<ResponseStream*>(userdata);
    size_t bytes = size * nmemb;
    std::string_view line(ptr, bytes);
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
        line.remove_suffix(1);
    }

    if (line.starts_with("HTTP/")) {
        // A new response starts; forget headers of any interim 1xx response.
        self->headers_.clear();
        self->status_code_ = parse_status_line(line);
    } else if (line.empty()) {
        if (self->status_code_ >= 200 || self->status_code_ < 100) {
            self->headers_done_ = true;
        }
    } else {
        size_t colon = line.find(':');
        if (colon != std::string_view::npos) {
            std::string name = to_lower(trim(line.substr(0, colon)));
            std::string value = trim(line.substr(colon + 1));
            auto [it, inserted] = self->headers_.try_emplace(name, value);
            if (!inserted) {
                it->second += ", " + value;
            }
        }
    }
    return bytes;
}

void ResponseStream::collect_messages() {
    int remaining = 0;
    while (CURLMsg* msg = curl_multi_info_read(multi_, &remaining)) {
        if (msg->msg != CURLMSG_DONE || msg->easy_handle != easy_.get()) {
            continue;
        }
        finished_ = true;
        CURLcode result = msg->data.result;
        if (result != CURLE_OK) {
            const char* detail = error_buffer_[0] ? error_buffer_ : curl_easy_strerror(result);
            throw NetworkError(string_format("error.download_failed", url_) + ": " + detail);
        }
        long code = 0;
        if (curl_easy_getinfo(easy_.get(), CURLINFO_RESPONSE_CODE, &code) == CURLE_OK && code != 0) {
            status_code_ = code;
        }
        headers_done_ = true;
    }
}

void ResponseStream::pump() {
    if (started_) {
        CURLMcode mc = curl_multi_poll(multi_, nullptr, 0, POLL_TIMEOUT_MS, nullptr);
        if (mc != CURLM_OK) {
            throw NetworkError(string_format("error.download_failed", url_) + ": " + curl_multi_strerror(mc));
        }
    }
    started_ = true;

    int running = 0;
    CURLMcode mc = curl_multi_perform(multi_, &running);
    if (mc != CURLM_OK) {
        throw NetworkError(string_format("error.download_failed", url_) + ": " + curl_multi_strerror(mc));
    }
    collect_messages();
}

void ResponseStream::wait_for_headers() {
    while (!headers_done_ && !finished_) {
        pump();
    }
}

size_t ResponseStream::read(char* buffer, size_t size) {
    if (size == 0) {
        return 0;
    }
    while (available() == 0) {
        if (finished_) {
            return 0;
        }
        if (paused_) {
            // Unpausing may deliver the held chunk synchronously through write_callback.
            paused_ = false;
            CURLcode rc = curl_easy_pause(easy_.get(), CURLPAUSE_CONT);
            if (rc != CURLE_OK) {
                throw NetworkError(string_format("error.download_failed", url_) + ": " + curl_easy_strerror(rc));
            }
            continue;
        }
        pump();
    }

    size_t count = std::min(size, available());
    std::memcpy(buffer, pending_.data() + pending_pos_, count);
    pending_pos_ += count;
    return count;
}

void ResponseStream::drain() {
    char buffer[16 * 1024];
    while (read(buffer, sizeof(buffer)) > 0) {
    }
}

std::optional<uint64_t> ResponseStream::content_length() const {
    auto it = headers_.find("content-length");
    if (it == headers_.end()) {
        return std::nullopt;
    }
    uint64_t length = 0;
    const std::string& value = it->second;
    auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), length);
    if (ec != std::errc() || ptr != value.data() + value.size()) {
        return std::nullopt;
    }
    return length;
}

std::string ResponseStream::redirect_url() const {
    auto it = headers_.find("location");
    if (it == headers_.end() || it->second.empty()) {
        return "";
    }
    char* resolved = nullptr;
    if (curl_easy_getinfo(easy_.get(), CURLINFO_REDIRECT_URL, &resolved) == CURLE_OK && resolved) {
        return resolved;
    }
    return it->second;
}

HttpClient::HttpClient(FetchOptions options)
    : multi_(curl_multi_init()), options_(options) {
    if (!multi_) {
        throw NetworkError(get_string("error.curl_multi_init_failed"));
    }
}

std::unique_ptr<ResponseStream> HttpClient::get(const std::string& url, const HeaderMap& headers) {
    auto stream = std::make_unique<ResponseStream>(ResponseStream::Token{}, multi_.get(), url, headers, options_);
    stream->wait_for_headers();
    return stream;
}

FetchResult HttpClient::fetch(const std::string& url, const HeaderMap& headers, int hop_budget) {
    std::string current_url = url;
    const int max_redirects = std::max(hop_budget, 0);
    int hops_left = max_redirects;

    while (true) {
        std::unique_ptr<ResponseStream> stream = get(current_url, headers);
        long status = stream->status_code();
        std::string location = is_redirect_status(status) ? stream->redirect_url() : std::string();

        if (location.empty()) {
            FetchResult result;
            result.status_code = status;
            result.headers = stream->headers();
            result.body = std::move(stream);
            return result;
        }

        // Free the connection before failing or moving to the next hop.
        stream->drain();
        if (hops_left == 0) {
            throw TooManyRedirectsError(string_format("error.too_many_redirects", max_redirects), max_redirects);
        }
        log_info(string_format("info.following_redirect", status, location));
        stream.reset();
        current_url = location;
        --hops_left;
    }
}
