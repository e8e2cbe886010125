// Copyright (c) 2026 changcheng967. All rights reserved.

#include <rangedl/disk/file_writer.hpp>
#include <rangedl/core/config.hpp>
#include <cerrno>
#include <unistd.h>

namespace rangedl::disk {

//=============================================================================
// FileWriter
//=============================================================================

std::error_code FileWriter::open(const std::filesystem::path& path) noexcept {
    close();

    errno = 0;
    std::FILE* f = std::fopen(path.c_str(), "wb");
    if (!f) {
        return from_errno(errno, DiskErrc::write_error);
    }

    file_.reset(f);
    path_ = path;
    written_ = 0;

    // Bigger stdio buffer: network writes arrive in many small pieces
    std::setvbuf(f, nullptr, _IOFBF, core::IO_BUFFER_SIZE);
    return {};
}

std::error_code FileWriter::write(const void* data, std::size_t size) noexcept {
    if (!file_) {
        return make_error_code(DiskErrc::write_error);
    }
    if (size == 0) {
        return {};
    }

    errno = 0;
    std::size_t n = std::fwrite(data, 1, size, file_.get());
    if (n != size) {
        return from_errno(errno, DiskErrc::write_error);
    }

    written_ += n;
    return {};
}

std::error_code FileWriter::flush(bool durable) noexcept {
    if (!file_) {
        return make_error_code(DiskErrc::write_error);
    }

    errno = 0;
    if (std::fflush(file_.get()) != 0) {
        return from_errno(errno, DiskErrc::write_error);
    }
    if (durable && ::fsync(::fileno(file_.get())) != 0) {
        return make_error_code(DiskErrc::sync_error);
    }
    return {};
}

void FileWriter::close() noexcept {
    file_.reset();
}

} // namespace rangedl::disk
