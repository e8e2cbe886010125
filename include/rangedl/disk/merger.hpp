// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <rangedl/disk/error.hpp>
#include <rangedl/disk/segment_layout.hpp>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace rangedl::disk {

enum class DigestAlgorithm : std::uint8_t {
    md5,
    sha256
};

[[nodiscard]] std::string_view digest_name(DigestAlgorithm algorithm) noexcept;

struct MergeReport {
    std::filesystem::path output;
    std::uint64_t bytes{0};
    std::uint32_t segments{0};
    std::uint32_t segments_removed{0};
};

// Concatenates segment stores into the final file.
//
// The merge is a transaction: preconditions are checked before any output is
// written, segments are streamed into <output>.tmp, the temporary file is
// verified, and only then renamed over the final path. Segment stores are
// removed after the rename; failing to remove one is only a warning.
class Merger {
public:
    Merger() = default;

    // Segments are looked up as <segment_dir>/<output filename>.part<i>.
    // expected_size, when known, must match the merged length exactly; an
    // expected size of zero is the only case where empty segments are allowed.
    [[nodiscard]] std::expected<MergeReport, std::error_code>
    merge(const std::filesystem::path& segment_dir,
          std::uint32_t chunk_count,
          const std::filesystem::path& output_path,
          std::optional<std::uint64_t> expected_size = std::nullopt) const noexcept;

    // Lower-case hex digest of a whole file
    [[nodiscard]] static std::expected<std::string, std::error_code>
    file_digest(const std::filesystem::path& path, DigestAlgorithm algorithm) noexcept;

    // Case-insensitive comparison against a caller-supplied hex digest
    [[nodiscard]] static std::expected<bool, std::error_code>
    verify_digest(const std::filesystem::path& path,
                  DigestAlgorithm algorithm,
                  std::string_view expected_hex) noexcept;

private:
    [[nodiscard]] std::error_code check_segments(const SegmentLayout& layout,
                                                 std::uint32_t chunk_count,
                                                 bool allow_empty) const noexcept;
};

} // namespace rangedl::disk
