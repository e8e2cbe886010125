// Copyright (c) 2026 changcheng967. All rights reserved.

#include <rangedl/core/range_planner.hpp>

namespace rangedl::core {

std::expected<std::vector<ChunkRange>, std::error_code>
plan_ranges(std::uint64_t total_size, std::int64_t worker_count) {
    if (worker_count <= 0) {
        return std::unexpected(make_error_code(DownloadErrc::invalid_argument));
    }

    std::vector<ChunkRange> plan;

    if (total_size == 0) {
        plan.push_back(ChunkRange{0, 0, 0});
        return plan;
    }

    const auto count = static_cast<std::uint64_t>(worker_count);
    const std::uint64_t base = total_size / count;

    plan.reserve(count);
    std::uint64_t offset = 0;
    for (std::uint64_t i = 0; i < count; ++i) {
        std::uint64_t length = (i == count - 1) ? total_size - offset : base;
        plan.push_back(ChunkRange{static_cast<std::uint32_t>(i), offset, length});
        offset += length;
    }

    return plan;
}

} // namespace rangedl::core
