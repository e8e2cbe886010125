// Copyright (c) 2026 changcheng967. All rights reserved.

#include <rangedl/disk/merger.hpp>
#include <rangedl/disk/file_writer.hpp>
#include <rangedl/core/config.hpp>
#include <rangedl/core/error.hpp>
#include <openssl/evp.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <fstream>
#include <memory>
#include <vector>

namespace rangedl::disk {

namespace fs = std::filesystem;

namespace {

struct DigestCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const noexcept { EVP_MD_CTX_free(ctx); }
};

using DigestCtx = std::unique_ptr<EVP_MD_CTX, DigestCtxDeleter>;

const EVP_MD* evp_for(DigestAlgorithm algorithm) noexcept {
    switch (algorithm) {
        case DigestAlgorithm::md5:    return EVP_md5();
        case DigestAlgorithm::sha256: return EVP_sha256();
    }
    return nullptr;
}

// Append one segment to the output
std::error_code copy_into(const fs::path& segment, FileWriter& out, std::vector<char>& buffer) {
    std::ifstream in(segment, std::ios::binary);
    if (!in) {
        return make_error_code(DiskErrc::read_error);
    }

    while (in) {
        in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        auto got = in.gcount();
        if (got > 0) {
            if (auto ec = out.write(buffer.data(), static_cast<std::size_t>(got))) {
                return ec;
            }
        }
    }
    if (in.bad()) {
        return make_error_code(DiskErrc::read_error);
    }
    return {};
}

void discard(const fs::path& path) noexcept {
    std::error_code ec;
    fs::remove(path, ec);
    if (ec) {
        spdlog::warn("Could not remove temporary file {}: {}", path.string(), ec.message());
    }
}

} // namespace

std::string_view digest_name(DigestAlgorithm algorithm) noexcept {
    switch (algorithm) {
        case DigestAlgorithm::md5:    return "MD5";
        case DigestAlgorithm::sha256: return "SHA-256";
    }
    return "unknown";
}

//=============================================================================
// Merger
//=============================================================================

std::error_code Merger::check_segments(const SegmentLayout& layout,
                                       std::uint32_t chunk_count,
                                       bool allow_empty) const noexcept {
    for (std::uint32_t i = 0; i < chunk_count; ++i) {
        auto part = layout.segment_path(i);
        std::error_code ec;

        if (!fs::is_regular_file(part, ec)) {
            spdlog::error("Segment {} missing: {}", i, part.string());
            return make_error_code(DiskErrc::file_not_found);
        }

        std::ifstream probe(part, std::ios::binary);
        if (!probe) {
            spdlog::error("Segment {} not readable: {}", i, part.string());
            return make_error_code(DiskErrc::access_denied);
        }

        auto size = fs::file_size(part, ec);
        if (ec) {
            return make_error_code(DiskErrc::read_error);
        }
        if (size == 0 && !allow_empty) {
            spdlog::error("Segment {} is empty: {}", i, part.string());
            return make_error_code(DiskErrc::empty_segment);
        }
    }
    return {};
}

std::expected<MergeReport, std::error_code>
Merger::merge(const fs::path& segment_dir,
              std::uint32_t chunk_count,
              const fs::path& output_path,
              std::optional<std::uint64_t> expected_size) const noexcept {
    if (chunk_count == 0 || output_path.filename().empty()) {
        return std::unexpected(make_error_code(core::DownloadErrc::invalid_argument));
    }

    try {
        const SegmentLayout layout(segment_dir, output_path.filename().string());
        const bool zero_length = expected_size && *expected_size == 0;

        if (auto ec = check_segments(layout, chunk_count, zero_length)) {
            return std::unexpected(ec);
        }

        const fs::path temp = output_path.string() + ".tmp";
        spdlog::info("Merging {} segments into {}", chunk_count, output_path.string());

        FileWriter out;
        if (auto ec = out.open(temp)) {
            spdlog::error("Cannot create {}: {}", temp.string(), ec.message());
            return std::unexpected(ec);
        }

        std::vector<char> buffer(core::IO_BUFFER_SIZE);
        for (std::uint32_t i = 0; i < chunk_count; ++i) {
            auto part = layout.segment_path(i);
            auto before = out.bytes_written();
            if (auto ec = copy_into(part, out, buffer)) {
                spdlog::error("Merging segment {} failed: {}", i, ec.message());
                out.close();
                discard(temp);
                return std::unexpected(ec);
            }
            spdlog::debug("Merged segment {}/{} ({} bytes)", i + 1, chunk_count, out.bytes_written() - before);
        }

        if (auto ec = out.flush(true)) {
            out.close();
            discard(temp);
            return std::unexpected(ec);
        }
        const std::uint64_t merged = out.bytes_written();
        out.close();

        // Verify the temporary file before it can appear under the real name
        std::error_code size_ec;
        auto on_disk = fs::file_size(temp, size_ec);
        if (size_ec || on_disk != merged) {
            spdlog::error("Merged file {} has unexpected length", temp.string());
            discard(temp);
            return std::unexpected(make_error_code(DiskErrc::size_mismatch));
        }
        if (expected_size && on_disk != *expected_size) {
            spdlog::error("Merged {} bytes, expected {}", on_disk, *expected_size);
            discard(temp);
            return std::unexpected(make_error_code(DiskErrc::size_mismatch));
        }
        if (on_disk == 0 && !zero_length) {
            spdlog::error("Merged file is empty");
            discard(temp);
            return std::unexpected(make_error_code(DiskErrc::size_mismatch));
        }

        // rename(2) replaces an existing file atomically
        std::error_code rename_ec;
        fs::rename(temp, output_path, rename_ec);
        if (rename_ec) {
            spdlog::error("Cannot move {} to {}: {}", temp.string(), output_path.string(), rename_ec.message());
            discard(temp);
            return std::unexpected(make_error_code(DiskErrc::rename_failed));
        }

        MergeReport report;
        report.output = output_path;
        report.bytes = on_disk;
        report.segments = chunk_count;

        for (std::uint32_t i = 0; i < chunk_count; ++i) {
            auto part = layout.segment_path(i);
            std::error_code rm_ec;
            if (fs::remove(part, rm_ec)) {
                ++report.segments_removed;
            } else {
                spdlog::warn("Could not delete segment {}: {}", part.string(),
                             rm_ec ? rm_ec.message() : std::string("not found"));
            }
        }

        std::error_code final_ec;
        auto final_size = fs::file_size(output_path, final_ec);
        if (final_ec || (final_size == 0 && !zero_length)) {
            spdlog::warn("Final file {} looks wrong after merge", output_path.string());
        }

        spdlog::info("Merge complete: {} ({} bytes, {} segments removed)",
                     output_path.string(), report.bytes, report.segments_removed);
        return report;
    } catch (const std::exception& e) {
        spdlog::error("Merge failed: {}", e.what());
        return std::unexpected(make_error_code(DiskErrc::write_error));
    }
}

std::expected<std::string, std::error_code>
Merger::file_digest(const fs::path& path, DigestAlgorithm algorithm) noexcept {
    try {
        std::ifstream in(path, std::ios::binary);
        if (!in) {
            return std::unexpected(make_error_code(DiskErrc::file_not_found));
        }

        DigestCtx ctx(EVP_MD_CTX_new());
        if (!ctx || EVP_DigestInit_ex(ctx.get(), evp_for(algorithm), nullptr) != 1) {
            return std::unexpected(make_error_code(DiskErrc::read_error));
        }

        std::vector<char> buffer(core::IO_BUFFER_SIZE);
        while (in) {
            in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
            auto got = in.gcount();
            if (got > 0 && EVP_DigestUpdate(ctx.get(), buffer.data(), static_cast<std::size_t>(got)) != 1) {
                return std::unexpected(make_error_code(DiskErrc::read_error));
            }
        }
        if (in.bad()) {
            return std::unexpected(make_error_code(DiskErrc::read_error));
        }

        unsigned char digest[EVP_MAX_MD_SIZE];
        unsigned int digest_len = 0;
        if (EVP_DigestFinal_ex(ctx.get(), digest, &digest_len) != 1) {
            return std::unexpected(make_error_code(DiskErrc::read_error));
        }

        static constexpr char HEX[] = "0123456789abcdef";
        std::string hex;
        hex.reserve(digest_len * 2);
        for (unsigned int i = 0; i < digest_len; ++i) {
            hex += HEX[digest[i] >> 4];
            hex += HEX[digest[i] & 0x0F];
        }
        return hex;
    } catch (const std::exception& e) {
        spdlog::error("Digest of {} failed: {}", path.string(), e.what());
        return std::unexpected(make_error_code(DiskErrc::read_error));
    }
}

std::expected<bool, std::error_code>
Merger::verify_digest(const fs::path& path,
                      DigestAlgorithm algorithm,
                      std::string_view expected_hex) noexcept {
    if (expected_hex.empty()) {
        return std::unexpected(make_error_code(core::DownloadErrc::invalid_argument));
    }

    auto actual = file_digest(path, algorithm);
    if (!actual) {
        return std::unexpected(actual.error());
    }

    bool matches = actual->size() == expected_hex.size() &&
        std::equal(actual->begin(), actual->end(), expected_hex.begin(),
                   [](char a, char b) {
                       return std::tolower(static_cast<unsigned char>(a)) ==
                              std::tolower(static_cast<unsigned char>(b));
                   });

    spdlog::info("{} of {}: {} ({})", digest_name(algorithm), path.string(), *actual,
                 matches ? "match" : "MISMATCH");
    return matches;
}

} // namespace rangedl::disk
