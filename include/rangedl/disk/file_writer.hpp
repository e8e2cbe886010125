// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <rangedl/disk/error.hpp>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <memory>
#include <string_view>

namespace rangedl::disk {

// Sequential binary writer. Opening truncates, so every open starts a
// fresh file; one writer per file, never shared between threads.
class FileWriter {
public:
    FileWriter() = default;
    ~FileWriter() { close(); }

    FileWriter(const FileWriter&) = delete;
    FileWriter& operator=(const FileWriter&) = delete;
    FileWriter(FileWriter&&) noexcept = default;
    FileWriter& operator=(FileWriter&&) noexcept = default;

    // Open (create or truncate) the file for writing
    [[nodiscard]] std::error_code open(const std::filesystem::path& path) noexcept;

    // Append data at the current end
    [[nodiscard]] std::error_code write(const void* data, std::size_t size) noexcept;
    [[nodiscard]] std::error_code write(std::string_view data) noexcept {
        return write(data.data(), data.size());
    }

    // Flush user-space buffers; with durable = true also fsync
    [[nodiscard]] std::error_code flush(bool durable = false) noexcept;

    void close() noexcept;

    [[nodiscard]] bool is_open() const noexcept { return file_ != nullptr; }
    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }
    [[nodiscard]] std::uint64_t bytes_written() const noexcept { return written_; }

private:
    struct FileCloser {
        void operator()(std::FILE* f) const noexcept { std::fclose(f); }
    };

    std::unique_ptr<std::FILE, FileCloser> file_;
    std::filesystem::path path_;
    std::uint64_t written_{0};
};

} // namespace rangedl::disk
