// Copyright (c) 2026 changcheng967. All rights reserved.

#include <rangedl/core/config.hpp>
#include <rangedl/disk/error.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <fstream>
#include <sstream>

namespace rangedl::core {

namespace {

std::expected<DownloadConfig, std::error_code> from_json(const nlohmann::json& j) noexcept {
    if (!j.is_object()) {
        return std::unexpected(make_error_code(DownloadErrc::invalid_argument));
    }

    try {
        DownloadConfig cfg;

        if (j.contains("max_attempts")) {
            cfg.max_attempts = j["max_attempts"].get<std::uint32_t>();
        }
        if (j.contains("retry_delay_ms")) {
            cfg.retry_delay = std::chrono::milliseconds{j["retry_delay_ms"].get<std::int64_t>()};
        }
        if (j.contains("chunk_timeout_sec")) {
            cfg.chunk_timeout = std::chrono::seconds{j["chunk_timeout_sec"].get<std::int64_t>()};
        }
        if (j.contains("chunked_threshold")) {
            cfg.chunked_threshold = j["chunked_threshold"].get<std::uint64_t>();
        }
        if (j.contains("connect_timeout_sec")) {
            cfg.connect_timeout_sec = j["connect_timeout_sec"].get<std::uint32_t>();
        }
        if (j.contains("stall_timeout_sec")) {
            cfg.stall_timeout_sec = j["stall_timeout_sec"].get<std::uint32_t>();
        }
        if (j.contains("progress_interval_ms")) {
            cfg.progress_interval = std::chrono::milliseconds{j["progress_interval_ms"].get<std::int64_t>()};
        }
        if (j.contains("user_agent")) {
            cfg.user_agent = j["user_agent"].get<std::string>();
        }
        if (j.contains("verify_tls")) {
            cfg.verify_tls = j["verify_tls"].get<bool>();
        }

        // Either {"Name": "value"} or ["Name: value", ...]
        if (j.contains("headers")) {
            const auto& headers = j["headers"];
            if (headers.is_object()) {
                for (auto& [key, value] : headers.items()) {
                    cfg.headers.push_back(key + ": " + value.get<std::string>());
                }
            } else if (headers.is_array()) {
                for (const auto& h : headers) {
                    cfg.headers.push_back(h.get<std::string>());
                }
            } else {
                return std::unexpected(make_error_code(DownloadErrc::invalid_argument));
            }
        }

        if (auto ec = cfg.validate()) {
            return std::unexpected(ec);
        }
        return cfg;
    } catch (const nlohmann::json::exception& e) {
        spdlog::error("Invalid configuration value: {}", e.what());
        return std::unexpected(make_error_code(DownloadErrc::invalid_argument));
    } catch (const std::exception& e) {
        spdlog::error("Invalid configuration: {}", e.what());
        return std::unexpected(make_error_code(DownloadErrc::invalid_argument));
    }
}

} // namespace

std::error_code DownloadConfig::validate() const noexcept {
    if (max_attempts == 0) {
        return make_error_code(DownloadErrc::invalid_argument);
    }
    if (retry_delay.count() < 0 || chunk_timeout.count() <= 0) {
        return make_error_code(DownloadErrc::invalid_argument);
    }
    if (progress_interval.count() <= 0) {
        return make_error_code(DownloadErrc::invalid_argument);
    }
    for (const auto& h : headers) {
        auto colon = h.find(':');
        if (colon == std::string::npos || colon == 0) {
            return make_error_code(DownloadErrc::invalid_argument);
        }
    }
    return {};
}

std::expected<DownloadConfig, std::error_code> parse_config(std::string_view json) noexcept {
    try {
        auto j = nlohmann::json::parse(json);
        return from_json(j);
    } catch (const nlohmann::json::exception& e) {
        spdlog::error("Configuration is not valid JSON: {}", e.what());
        return std::unexpected(make_error_code(DownloadErrc::invalid_argument));
    } catch (const std::exception& e) {
        spdlog::error("Invalid configuration: {}", e.what());
        return std::unexpected(make_error_code(DownloadErrc::invalid_argument));
    }
}

std::expected<DownloadConfig, std::error_code> load_config(std::string_view path) noexcept {
    try {
        std::ifstream file{std::string(path)};
        if (!file) {
            return std::unexpected(make_error_code(disk::DiskErrc::file_not_found));
        }
        std::ostringstream ss;
        ss << file.rdbuf();
        return parse_config(ss.str());
    } catch (const std::exception& e) {
        spdlog::error("Cannot read configuration {}: {}", path, e.what());
        return std::unexpected(make_error_code(disk::DiskErrc::read_error));
    }
}

} // namespace rangedl::core
