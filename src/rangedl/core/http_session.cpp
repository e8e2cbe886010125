// Copyright (c) 2026 changcheng967. All rights reserved.

#include <rangedl/core/http_session.hpp>
#include <curl/curl.h>
#include <spdlog/spdlog.h>
#include <cctype>
#include <cstdlib>
#include <string>

namespace rangedl::core {

namespace {

// RAII curl handle cleanup
struct CurlHandle {
    CURL* ptr = nullptr;

    explicit CurlHandle(CURL* c) : ptr(c) {}
    ~CurlHandle() { if (ptr) curl_easy_cleanup(ptr); }

    CurlHandle(const CurlHandle&) = delete;
    CurlHandle& operator=(const CurlHandle&) = delete;
};

// RAII request header list
struct HeaderList {
    curl_slist* ptr = nullptr;

    HeaderList() = default;
    ~HeaderList() { if (ptr) curl_slist_free_all(ptr); }

    HeaderList(const HeaderList&) = delete;
    HeaderList& operator=(const HeaderList&) = delete;

    void append(const std::string& line) {
        if (auto* next = curl_slist_append(ptr, line.c_str())) {
            ptr = next;
        }
    }
};

void store_header(std::map<std::string, std::string>& headers, std::string_view header) {
    // A new status line starts a new response (redirect hop); keep only the last one
    if (header.starts_with("HTTP/")) {
        headers.clear();
        return;
    }

    auto colon = header.find(':');
    if (colon == std::string_view::npos) return;

    auto name = header.substr(0, colon);
    auto value = header.substr(colon + 1);

    while (!value.empty() && (value.front() == ' ' || value.front() == '\t')) {
        value.remove_prefix(1);
    }
    while (!value.empty() && (value.back() == '\r' || value.back() == '\n' || value.back() == ' ')) {
        value.remove_suffix(1);
    }

    std::string lower_name;
    lower_name.reserve(name.size());
    for (char c : name) {
        lower_name += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    headers[lower_name] = std::string(value);
}

// Header callback for HEAD responses
std::size_t header_callback(char* buffer, std::size_t size, std::size_t nitems, void* userdata) noexcept {
    std::size_t total = size * nitems;
    auto* headers = static_cast<std::map<std::string, std::string>*>(userdata);
    if (!headers) return total;

    try {
        store_header(*headers, std::string_view(buffer, total));
    } catch (const std::exception& e) {
        spdlog::error("Header parsing failed: {}", e.what());
        return 0;
    }
    return total;
}

struct TransferContext {
    CURL* curl{nullptr};
    const BodySink* sink{nullptr};
    std::stop_token stoken;
    long status{0};
    std::uint64_t bytes{0};
    bool status_rejected{false};
    bool stopped_by_sink{false};
};

std::size_t write_callback(char* ptr, std::size_t size, std::size_t nmemb, void* userdata) noexcept {
    auto* ctx = static_cast<TransferContext*>(userdata);
    std::size_t bytes = size * nmemb;

    if (ctx->status == 0) {
        curl_easy_getinfo(ctx->curl, CURLINFO_RESPONSE_CODE, &ctx->status);
    }
    if (ctx->status != 200 && ctx->status != 206) {
        ctx->status_rejected = true;
        return 0;
    }

    try {
        if (!(*ctx->sink)(static_cast<std::int32_t>(ctx->status), std::string_view(ptr, bytes))) {
            ctx->stopped_by_sink = true;
            return 0;
        }
    } catch (const std::exception& e) {
        spdlog::error("Body sink threw: {}", e.what());
        ctx->stopped_by_sink = true;
        return 0;
    }

    ctx->bytes += bytes;
    return bytes;
}

// Return 1 to abort the transfer
int progress_callback(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) noexcept {
    auto* ctx = static_cast<TransferContext*>(userdata);
    return ctx->stoken.stop_requested() ? 1 : 0;
}

std::error_code curl_to_error(CURLcode code) noexcept {
    switch (code) {
        case CURLE_OK:                     return {};
        case CURLE_ABORTED_BY_CALLBACK:    return make_error_code(DownloadErrc::cancelled);
        case CURLE_URL_MALFORMAT:          return make_error_code(DownloadErrc::invalid_url);
        case CURLE_UNSUPPORTED_PROTOCOL:   return make_error_code(DownloadErrc::unsupported_protocol);
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:  return make_error_code(DownloadErrc::dns_error);
        case CURLE_COULDNT_CONNECT:        return make_error_code(DownloadErrc::refused);
        case CURLE_OPERATION_TIMEDOUT:     return make_error_code(DownloadErrc::timeout);
        case CURLE_TOO_MANY_REDIRECTS:     return make_error_code(DownloadErrc::too_many_redirects);
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_PEER_FAILED_VERIFICATION:
        case CURLE_SSL_CERTPROBLEM:
        case CURLE_SSL_CIPHER:
        case CURLE_SSL_CACERT_BADFILE:     return make_error_code(DownloadErrc::ssl_error);
        case CURLE_RECV_ERROR:
        case CURLE_SEND_ERROR:
        case CURLE_PARTIAL_FILE:
        case CURLE_GOT_NOTHING:            return make_error_code(DownloadErrc::connection_lost);
        default:                           return make_error_code(DownloadErrc::network_error);
    }
}

void apply_common_options(CURL* curl, const std::string& url, const DownloadConfig& cfg,
                          HeaderList& headers) {
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, static_cast<long>(MAX_REDIRECTS));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, static_cast<long>(cfg.connect_timeout_sec));
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, cfg.verify_tls ? 1L : 0L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, cfg.verify_tls ? 2L : 0L);
    curl_easy_setopt(curl, CURLOPT_HTTP_VERSION, CURL_HTTP_VERSION_2TLS);

    if (!cfg.user_agent.empty()) {
        curl_easy_setopt(curl, CURLOPT_USERAGENT, cfg.user_agent.c_str());
    }
    for (const auto& h : cfg.headers) {
        headers.append(h);
    }
    if (headers.ptr) {
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers.ptr);
    }
}

} // namespace

//=============================================================================
// HttpSession
//=============================================================================

HttpSession::HttpSession() = default;

HttpSession::HttpSession(DownloadConfig config)
    : config_(std::move(config)) {}

std::expected<ResourceInfo, std::error_code>
HttpSession::probe(const std::string& url) noexcept {
    try {
        CurlHandle curl(curl_easy_init());
        if (!curl.ptr) {
            return std::unexpected(make_error_code(DownloadErrc::network_error));
        }

        ResourceInfo info{};
        info.url = url;

        HeaderList headers;
        apply_common_options(curl.ptr, url, config_, headers);

        // HEAD request
        curl_easy_setopt(curl.ptr, CURLOPT_NOBODY, 1L);
        curl_easy_setopt(curl.ptr, CURLOPT_HEADERFUNCTION, header_callback);
        curl_easy_setopt(curl.ptr, CURLOPT_HEADERDATA, &info.headers);

        CURLcode result = curl_easy_perform(curl.ptr);
        if (result != CURLE_OK) {
            spdlog::debug("HEAD {} failed: {}", url, curl_easy_strerror(result));
            return std::unexpected(curl_to_error(result));
        }

        long http_code = 0;
        curl_easy_getinfo(curl.ptr, CURLINFO_RESPONSE_CODE, &http_code);
        info.status_code = static_cast<std::int32_t>(http_code);
        if (http_code < 200 || http_code >= 300) {
            spdlog::debug("HEAD {} returned HTTP {}", url, http_code);
            return std::unexpected(status_to_error(http_code));
        }

        // Content length from the header (absent means unknown, not zero)
        auto cl_it = info.headers.find("content-length");
        if (cl_it != info.headers.end() && !cl_it->second.empty()) {
            char* end = nullptr;
            unsigned long long val = std::strtoull(cl_it->second.c_str(), &end, 10);
            if (end == cl_it->second.c_str() + cl_it->second.size()) {
                info.content_length = static_cast<std::uint64_t>(val);
            }
        }

        auto ar_it = info.headers.find("accept-ranges");
        info.accepts_ranges = ar_it != info.headers.end() &&
                              ar_it->second.find("bytes") != std::string::npos;

        if (auto it = info.headers.find("content-type"); it != info.headers.end()) {
            info.content_type = it->second;
        }
        if (auto it = info.headers.find("last-modified"); it != info.headers.end()) {
            info.last_modified = it->second;
        }
        if (auto it = info.headers.find("etag"); it != info.headers.end()) {
            info.etag = it->second;
        }
        if (auto it = info.headers.find("content-disposition"); it != info.headers.end()) {
            info.filename = parse_content_disposition(it->second);
        }

        return info;
    } catch (const std::exception& e) {
        spdlog::error("Probe of {} failed: {}", url, e.what());
        return std::unexpected(make_error_code(DownloadErrc::network_error));
    }
}

std::expected<FetchResult, std::error_code>
HttpSession::fetch(const FetchRequest& request, const BodySink& sink, std::stop_token stoken) noexcept {
    try {
        CurlHandle curl(curl_easy_init());
        if (!curl.ptr) {
            return std::unexpected(make_error_code(DownloadErrc::network_error));
        }

        HeaderList headers;
        apply_common_options(curl.ptr, request.url, config_, headers);

        std::string range;
        if (request.range) {
            range = std::to_string(request.range->first) + "-" + std::to_string(request.range->last);
            curl_easy_setopt(curl.ptr, CURLOPT_RANGE, range.c_str());
        }

        TransferContext ctx;
        ctx.curl = curl.ptr;
        ctx.sink = &sink;
        ctx.stoken = stoken;

        curl_easy_setopt(curl.ptr, CURLOPT_WRITEFUNCTION, write_callback);
        curl_easy_setopt(curl.ptr, CURLOPT_WRITEDATA, &ctx);
        curl_easy_setopt(curl.ptr, CURLOPT_XFERINFOFUNCTION, progress_callback);
        curl_easy_setopt(curl.ptr, CURLOPT_XFERINFODATA, &ctx);
        curl_easy_setopt(curl.ptr, CURLOPT_NOPROGRESS, 0L);

        // A connection that stops delivering bytes is treated as dead
        curl_easy_setopt(curl.ptr, CURLOPT_LOW_SPEED_LIMIT, 1L);
        curl_easy_setopt(curl.ptr, CURLOPT_LOW_SPEED_TIME, static_cast<long>(config_.stall_timeout_sec));
        curl_easy_setopt(curl.ptr, CURLOPT_BUFFERSIZE, static_cast<long>(IO_BUFFER_SIZE));
        curl_easy_setopt(curl.ptr, CURLOPT_TCP_NODELAY, 1L);

        CURLcode result = curl_easy_perform(curl.ptr);

        if (ctx.status == 0) {
            curl_easy_getinfo(curl.ptr, CURLINFO_RESPONSE_CODE, &ctx.status);
        }

        if (ctx.status_rejected) {
            spdlog::debug("GET {} [{}] returned HTTP {}", request.url, range, ctx.status);
            return std::unexpected(status_to_error(ctx.status));
        }

        FetchResult out;
        out.status_code = static_cast<std::int32_t>(ctx.status);
        out.body_bytes = ctx.bytes;
        out.stopped_by_sink = ctx.stopped_by_sink;

        if (result == CURLE_WRITE_ERROR && ctx.stopped_by_sink) {
            return out;
        }
        if (result != CURLE_OK) {
            spdlog::debug("GET {} [{}] failed: {}", request.url, range, curl_easy_strerror(result));
            return std::unexpected(curl_to_error(result));
        }
        if (ctx.status != 200 && ctx.status != 206) {
            return std::unexpected(status_to_error(ctx.status));
        }
        return out;
    } catch (const std::exception& e) {
        spdlog::error("Fetch failed: {}", e.what());
        return std::unexpected(make_error_code(DownloadErrc::network_error));
    }
}

std::error_code HttpSession::status_to_error(long http_code) noexcept {
    if (http_code >= 200 && http_code < 300) return {};
    if (http_code == 404) return make_error_code(DownloadErrc::not_found);
    if (http_code == 401 || http_code == 403) return make_error_code(DownloadErrc::permission_denied);
    if (http_code == 416) return make_error_code(DownloadErrc::invalid_range);
    if (http_code >= 500) return make_error_code(DownloadErrc::server_error);
    return make_error_code(DownloadErrc::bad_status);
}

std::string HttpSession::parse_content_disposition(std::string_view content_disposition) {
    // Parse "attachment; filename=file.zip"
    auto filename_pos = content_disposition.find("filename=");
    if (filename_pos == std::string_view::npos) {
        return {};
    }
    auto filename = content_disposition.substr(filename_pos + 9);
    auto semicolon = filename.find(';');
    if (semicolon != std::string_view::npos) {
        filename = filename.substr(0, semicolon);
    }
    if (filename.size() >= 2 && (filename.front() == '"' || filename.front() == '\'')) {
        filename.remove_prefix(1);
        filename.remove_suffix(1);
    }
    // Never let the server choose a directory
    auto slash = filename.find_last_of("/\\");
    if (slash != std::string_view::npos) {
        filename.remove_prefix(slash + 1);
    }
    if (filename == "." || filename == "..") {
        return {};
    }
    return std::string(filename);
}

//=============================================================================
// Global CURL initialization
//=============================================================================

void HttpSession::global_init() noexcept {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

void HttpSession::global_cleanup() noexcept {
    curl_global_cleanup();
}

} // namespace rangedl::core
