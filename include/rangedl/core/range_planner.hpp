// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <rangedl/core/error.hpp>
#include <cstdint>
#include <expected>
#include <vector>

namespace rangedl::core {

// One entry of a chunk plan: bytes [start, start + length)
struct ChunkRange {
    std::uint32_t index{0};
    std::uint64_t start{0};
    std::uint64_t length{0};

    // Inclusive last byte; only meaningful when !empty()
    [[nodiscard]] constexpr std::uint64_t end() const noexcept { return start + length - 1; }
    [[nodiscard]] constexpr bool empty() const noexcept { return length == 0; }

    constexpr bool operator==(const ChunkRange&) const = default;
};

// Split [0, total_size) into worker_count contiguous ranges. The last range
// absorbs the remainder of the integer division. A zero-sized resource yields
// a single empty range. Performs no clamping; worker_count <= 0 is
// invalid_argument.
[[nodiscard]] std::expected<std::vector<ChunkRange>, std::error_code>
plan_ranges(std::uint64_t total_size, std::int64_t worker_count);

} // namespace rangedl::core
