// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <rangedl/core/http_session.hpp>

using namespace rangedl::core;

TEST_CASE("HttpSession::status_to_error", "[http]") {
    CHECK(!HttpSession::status_to_error(200));
    CHECK(!HttpSession::status_to_error(206));
    CHECK(HttpSession::status_to_error(404) == DownloadErrc::not_found);
    CHECK(HttpSession::status_to_error(401) == DownloadErrc::permission_denied);
    CHECK(HttpSession::status_to_error(403) == DownloadErrc::permission_denied);
    CHECK(HttpSession::status_to_error(416) == DownloadErrc::invalid_range);
    CHECK(HttpSession::status_to_error(500) == DownloadErrc::server_error);
    CHECK(HttpSession::status_to_error(503) == DownloadErrc::server_error);
    CHECK(HttpSession::status_to_error(302) == DownloadErrc::bad_status);
    CHECK(HttpSession::status_to_error(418) == DownloadErrc::bad_status);
}

TEST_CASE("HttpSession::parse_content_disposition", "[http]") {
    CHECK(HttpSession::parse_content_disposition("attachment; filename=file.zip") == "file.zip");
    CHECK(HttpSession::parse_content_disposition("attachment; filename=\"my file.tar.gz\"") == "my file.tar.gz");
    CHECK(HttpSession::parse_content_disposition("attachment; filename=a.bin; size=10") == "a.bin");
    CHECK(HttpSession::parse_content_disposition("attachment; filename=\"../../etc/passwd\"") == "passwd");
    CHECK(HttpSession::parse_content_disposition("inline").empty());
}

TEST_CASE("HttpSession::parse_content_disposition - unusable names are dropped", "[http]") {
    CHECK(HttpSession::parse_content_disposition("attachment; filename=\"..\"").empty());
    CHECK(HttpSession::parse_content_disposition("attachment; filename=\".\"").empty());
    CHECK(HttpSession::parse_content_disposition("attachment; filename=..").empty());
    CHECK(HttpSession::parse_content_disposition("attachment; filename=\"\"").empty());
    CHECK(HttpSession::parse_content_disposition("attachment; filename=\"a/..\"").empty());
    CHECK(HttpSession::parse_content_disposition("attachment; filename=\"..data\"") == "..data");
}

TEST_CASE("Retry eligibility", "[http][error]") {
    CHECK(is_retryable(make_error_code(DownloadErrc::network_error)));
    CHECK(is_retryable(make_error_code(DownloadErrc::timeout)));
    CHECK(is_retryable(make_error_code(DownloadErrc::connection_lost)));
    CHECK(is_retryable(make_error_code(DownloadErrc::server_error)));
    CHECK(is_retryable(make_error_code(DownloadErrc::bad_status)));
    CHECK(is_retryable(make_error_code(DownloadErrc::size_mismatch)));

    CHECK(!is_retryable(make_error_code(DownloadErrc::invalid_url)));
    CHECK(!is_retryable(make_error_code(DownloadErrc::unsupported_protocol)));
    CHECK(!is_retryable(make_error_code(DownloadErrc::cancelled)));
    CHECK(!is_retryable(std::error_code{}));
}

TEST_CASE("Error categories", "[error]") {
    auto ec = make_error_code(DownloadErrc::chunk_failed);
    CHECK(std::string(ec.category().name()) == "rangedl::download");
    CHECK(!ec.message().empty());
}
