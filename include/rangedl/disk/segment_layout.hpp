// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

namespace rangedl::disk {

// Where the files of one download live:
//   <directory>/<name>           final output
//   <directory>/<name>.part<i>   segment store for chunk i
//   <directory>/<name>.tmp       merge / single-stream output before the rename
struct SegmentLayout {
    std::filesystem::path directory;
    std::string name;

    SegmentLayout() = default;
    SegmentLayout(std::filesystem::path dir, std::string file_name)
        : directory(std::move(dir)), name(std::move(file_name)) {}

    // Layout whose final output is the given path
    [[nodiscard]] static SegmentLayout for_output(const std::filesystem::path& output) {
        return {output.parent_path(), output.filename().string()};
    }

    [[nodiscard]] std::filesystem::path output_path() const {
        return directory / name;
    }

    [[nodiscard]] std::filesystem::path segment_path(std::uint32_t index) const {
        return directory / (name + ".part" + std::to_string(index));
    }

    [[nodiscard]] std::filesystem::path temp_path() const {
        return directory / (name + ".tmp");
    }
};

} // namespace rangedl::disk
