// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <rangedl/core/config.hpp>
#include <rangedl/core/error.hpp>
#include <cstdint>
#include <expected>
#include <functional>
#include <map>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>

namespace rangedl::core {

// What the capability probe learned about the resource
struct ResourceInfo {
    std::string url;
    std::int32_t status_code{0};
    std::map<std::string, std::string> headers;   // lower-case names
    std::optional<std::uint64_t> content_length;  // nullopt when not advertised
    bool accepts_ranges{false};
    std::string content_type;
    std::string last_modified;
    std::string etag;
    std::string filename;                          // From Content-Disposition
};

// Inclusive byte range, as it appears in "Range: bytes=first-last"
struct ByteRange {
    std::uint64_t first{0};
    std::uint64_t last{0};
};

struct FetchRequest {
    std::string url;
    std::optional<ByteRange> range;   // nullopt = whole resource
};

struct FetchResult {
    std::int32_t status_code{0};
    std::uint64_t body_bytes{0};      // bytes handed to the sink
    bool stopped_by_sink{false};
};

// Receives the response status and the next piece of the body.
// Return false to end the transfer early.
using BodySink = std::function<bool(std::int32_t status_code, std::string_view data)>;

// Seam between the transfer engine and the wire.
//
// fetch() only hands body bytes to the sink for 200 and 206 responses; any
// other status is reported as an error without touching the sink. A stop
// request on the token aborts the transfer with DownloadErrc::cancelled.
class Transport {
public:
    virtual ~Transport() = default;

    [[nodiscard]] virtual std::expected<ResourceInfo, std::error_code>
    probe(const std::string& url) noexcept = 0;

    [[nodiscard]] virtual std::expected<FetchResult, std::error_code>
    fetch(const FetchRequest& request, const BodySink& sink, std::stop_token stoken) noexcept = 0;
};

// libcurl implementation. One easy handle per call, so a single session may
// be shared by every worker thread.
class HttpSession final : public Transport {
public:
    HttpSession();
    explicit HttpSession(DownloadConfig config);
    ~HttpSession() override = default;

    HttpSession(const HttpSession&) = delete;
    HttpSession& operator=(const HttpSession&) = delete;

    // HEAD request; non-2xx is an error
    [[nodiscard]] std::expected<ResourceInfo, std::error_code>
    probe(const std::string& url) noexcept override;

    // GET request, optionally with a Range header
    [[nodiscard]] std::expected<FetchResult, std::error_code>
    fetch(const FetchRequest& request, const BodySink& sink, std::stop_token stoken) noexcept override;

    [[nodiscard]] const DownloadConfig& config() const noexcept { return config_; }

    // Global initialization (call once at startup)
    static void global_init() noexcept;
    static void global_cleanup() noexcept;

    // Parse Content-Disposition header value
    [[nodiscard]] static std::string parse_content_disposition(std::string_view content_disposition);

    // Status codes to error codes; 2xx maps to success
    [[nodiscard]] static std::error_code status_to_error(long http_code) noexcept;

private:
    DownloadConfig config_;
};

} // namespace rangedl::core
