// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <rangedl/core/error.hpp>
#include <cstdint>
#include <string>
#include <string_view>
#include <expected>

namespace rangedl::core {

class Url {
public:
    // Accepts http and https only; anything else is unsupported_protocol.
    static std::expected<Url, std::error_code> parse(std::string_view url_str) noexcept;

    [[nodiscard]] const std::string& scheme() const noexcept { return scheme_; }
    [[nodiscard]] const std::string& host() const noexcept { return host_; }
    [[nodiscard]] const std::string& port() const noexcept { return port_; }
    [[nodiscard]] const std::string& path() const noexcept { return path_; }
    [[nodiscard]] const std::string& query() const noexcept { return query_; }

    // The string as given to parse(); this is what goes on the wire.
    [[nodiscard]] const std::string& str() const noexcept { return str_; }
    [[nodiscard]] bool is_secure() const noexcept { return scheme_ == "https"; }
    [[nodiscard]] std::uint16_t default_port() const noexcept;

    // Last path segment, or empty when the path does not name a file
    // (trailing slash, or no extension).
    [[nodiscard]] std::string filename() const;

    Url() = default;

private:
    std::string str_;
    std::string scheme_;
    std::string host_;
    std::string port_;
    std::string path_;
    std::string query_;
};

} // namespace rangedl::core
