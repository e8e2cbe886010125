// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <system_error>
#include <string>

namespace rangedl::core {

enum class DownloadErrc {
    success = 0,
    network_error,
    timeout,
    refused,
    not_found,
    server_error,
    bad_status,
    permission_denied,
    invalid_url,
    unsupported_protocol,
    invalid_range,
    invalid_argument,
    size_mismatch,
    checksum_mismatch,
    cancelled,
    busy,
    probe_failed,
    chunk_failed,
    too_many_redirects,
    ssl_error,
    dns_error,
    connection_lost,
};

namespace detail {

struct DownloadErrcCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "rangedl::download";
    }

    [[nodiscard]] std::string message(int ev) const override {
        switch (static_cast<DownloadErrc>(ev)) {
            case DownloadErrc::success:              return "Success";
            case DownloadErrc::network_error:        return "Network error";
            case DownloadErrc::timeout:              return "Operation timed out";
            case DownloadErrc::refused:              return "Connection refused";
            case DownloadErrc::not_found:            return "Resource not found (404)";
            case DownloadErrc::server_error:         return "Server error (5xx)";
            case DownloadErrc::bad_status:           return "Unexpected HTTP status";
            case DownloadErrc::permission_denied:    return "Permission denied";
            case DownloadErrc::invalid_url:          return "Invalid URL";
            case DownloadErrc::unsupported_protocol: return "Unsupported protocol";
            case DownloadErrc::invalid_range:        return "Invalid byte range";
            case DownloadErrc::invalid_argument:     return "Invalid argument";
            case DownloadErrc::size_mismatch:        return "Received size does not match range";
            case DownloadErrc::checksum_mismatch:    return "Checksum mismatch";
            case DownloadErrc::cancelled:            return "Download cancelled";
            case DownloadErrc::busy:                 return "A download is already running";
            case DownloadErrc::probe_failed:         return "Capability probe failed";
            case DownloadErrc::chunk_failed:         return "One or more chunks failed";
            case DownloadErrc::too_many_redirects:   return "Too many redirects";
            case DownloadErrc::ssl_error:            return "SSL/TLS error";
            case DownloadErrc::dns_error:            return "DNS resolution failed";
            case DownloadErrc::connection_lost:      return "Connection lost";
            default:                                 return "Unknown error";
        }
    }
};

} // namespace detail

inline const detail::DownloadErrcCategory& download_errc_category() noexcept {
    static detail::DownloadErrcCategory category;
    return category;
}

inline std::error_code make_error_code(DownloadErrc e) noexcept {
    return {static_cast<int>(e), download_errc_category()};
}

// Permanent errors are reported on the first attempt, everything else
// (transport, status, disk and size-mismatch failures) may be retried.
[[nodiscard]] inline bool is_retryable(const std::error_code& ec) noexcept {
    if (!ec) return false;
    if (ec.category() != download_errc_category()) return true;
    switch (static_cast<DownloadErrc>(ec.value())) {
        case DownloadErrc::invalid_url:
        case DownloadErrc::unsupported_protocol:
        case DownloadErrc::invalid_argument:
        case DownloadErrc::cancelled:
        case DownloadErrc::busy:
            return false;
        default:
            return true;
    }
}

} // namespace rangedl::core

namespace std {

template<>
struct is_error_code_enum<rangedl::core::DownloadErrc> : true_type {};

} // namespace std
