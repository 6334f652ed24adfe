#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

class CrxgetException : public std::runtime_error {
public:
    explicit CrxgetException(const std::string& message)
        : std::runtime_error(message) {}
};

// Transport level failure (DNS, TLS, connection reset, timeout).
class NetworkError : public CrxgetException {
public:
    explicit NetworkError(const std::string& message)
        : CrxgetException(message) {}
};

class TooManyRedirectsError : public CrxgetException {
public:
    TooManyRedirectsError(const std::string& message, int max_redirects)
        : CrxgetException(message), max_redirects_(max_redirects) {}

    int max_redirects() const { return max_redirects_; }

private:
    int max_redirects_;
};

// Final response status was not 200.
class DownloadError : public CrxgetException {
public:
    DownloadError(const std::string& message, long status_code)
        : CrxgetException(message), status_code_(status_code) {}

    long status_code() const { return status_code_; }

private:
    long status_code_;
};

// Bad magic, truncated buffer or length fields past the end of the buffer.
class FormatError : public CrxgetException {
public:
    explicit FormatError(const std::string& message)
        : CrxgetException(message) {}
};

class UnsupportedVersionError : public CrxgetException {
public:
    UnsupportedVersionError(const std::string& message, uint32_t version)
        : CrxgetException(message), version_(version) {}

    uint32_t version() const { return version_; }

private:
    uint32_t version_;
};
