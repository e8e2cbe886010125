// Copyright (c) 2026 changcheng967. All rights reserved.

#include <rangedl/core/url.hpp>
#include <algorithm>
#include <cctype>
#include <new>

namespace rangedl::core {

std::expected<Url, std::error_code> Url::parse(std::string_view url_str) noexcept {
    try {
        Url url;

        auto scheme_end = url_str.find("://");
        if (scheme_end == std::string_view::npos || scheme_end == 0) {
            return std::unexpected(make_error_code(DownloadErrc::invalid_url));
        }

        for (std::size_t i = 0; i < scheme_end; ++i) {
            url.scheme_ += static_cast<char>(std::tolower(static_cast<unsigned char>(url_str[i])));
        }
        if (url.scheme_ != "http" && url.scheme_ != "https") {
            return std::unexpected(make_error_code(DownloadErrc::unsupported_protocol));
        }

        auto rest_start = scheme_end + 3;

        // Authority ends at the first of '/', '?', '#'
        auto host_end = url_str.find_first_of("/?#", rest_start);
        if (host_end == std::string_view::npos) {
            host_end = url_str.length();
        }
        auto authority = url_str.substr(rest_start, host_end - rest_start);

        // Drop userinfo
        auto at_pos = authority.rfind('@');
        if (at_pos != std::string_view::npos) {
            authority.remove_prefix(at_pos + 1);
        }

        if (!authority.empty() && authority.front() == '[') {
            // IPv6 literal [::1]:port
            auto bracket_end = authority.find(']');
            if (bracket_end == std::string_view::npos) {
                return std::unexpected(make_error_code(DownloadErrc::invalid_url));
            }
            url.host_ = std::string(authority.substr(0, bracket_end + 1));
            if (bracket_end + 1 < authority.size() && authority[bracket_end + 1] == ':') {
                url.port_ = std::string(authority.substr(bracket_end + 2));
            }
        } else {
            auto colon = authority.find(':');
            url.host_ = std::string(authority.substr(0, colon));
            if (colon != std::string_view::npos) {
                url.port_ = std::string(authority.substr(colon + 1));
            }
        }

        if (url.host_.empty()) {
            return std::unexpected(make_error_code(DownloadErrc::invalid_url));
        }
        if (!std::all_of(url.port_.begin(), url.port_.end(),
                         [](unsigned char c) { return std::isdigit(c) != 0; })) {
            return std::unexpected(make_error_code(DownloadErrc::invalid_url));
        }

        auto fragment_start = url_str.find('#', host_end);
        if (fragment_start == std::string_view::npos) {
            fragment_start = url_str.length();
        }
        auto query_start = url_str.find('?', host_end);
        if (query_start == std::string_view::npos || query_start > fragment_start) {
            query_start = fragment_start;
        }

        if (host_end < query_start && url_str[host_end] == '/') {
            url.path_ = std::string(url_str.substr(host_end, query_start - host_end));
        } else {
            url.path_ = "/";
        }
        if (query_start < fragment_start) {
            url.query_ = std::string(url_str.substr(query_start + 1, fragment_start - query_start - 1));
        }

        // Fragments never reach the server
        url.str_ = std::string(url_str.substr(0, fragment_start));
        return url;
    } catch (const std::bad_alloc&) {
        return std::unexpected(std::make_error_code(std::errc::not_enough_memory));
    }
}

std::uint16_t Url::default_port() const noexcept {
    if (scheme_ == "http") return 80;
    if (scheme_ == "https") return 443;
    return 0;
}

std::string Url::filename() const {
    auto last_slash = path_.rfind('/');
    std::string name = last_slash == std::string::npos ? path_ : path_.substr(last_slash + 1);
    if (name.find('.') == std::string::npos || name == "." || name == "..") {
        return {};
    }
    return name;
}

} // namespace rangedl::core
