// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cerrno>
#include <system_error>
#include <string>

namespace rangedl::disk {

enum class DiskErrc {
    success = 0,
    file_not_found,
    access_denied,
    disk_full,
    invalid_path,
    write_error,
    read_error,
    empty_segment,
    rename_failed,
    size_mismatch,
    sync_error,
};

namespace detail {

struct DiskErrcCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "rangedl::disk";
    }

    [[nodiscard]] std::string message(int ev) const override {
        switch (static_cast<DiskErrc>(ev)) {
            case DiskErrc::success:        return "Success";
            case DiskErrc::file_not_found: return "File not found";
            case DiskErrc::access_denied:  return "Access denied";
            case DiskErrc::disk_full:      return "Disk full";
            case DiskErrc::invalid_path:   return "Invalid path";
            case DiskErrc::write_error:    return "Write error";
            case DiskErrc::read_error:     return "Read error";
            case DiskErrc::empty_segment:  return "Segment file is empty";
            case DiskErrc::rename_failed:  return "Could not move file into place";
            case DiskErrc::size_mismatch:  return "File size does not match expected size";
            case DiskErrc::sync_error:     return "Could not sync file to disk";
            default:                       return "Unknown error";
        }
    }
};

} // namespace detail

inline const detail::DiskErrcCategory& disk_errc_category() noexcept {
    static detail::DiskErrcCategory category;
    return category;
}

inline std::error_code make_error_code(DiskErrc e) noexcept {
    return {static_cast<int>(e), disk_errc_category()};
}

// Map an errno value from the C stdio layer onto the disk category.
[[nodiscard]] inline std::error_code from_errno(int err, DiskErrc fallback) noexcept {
    switch (err) {
        case ENOENT:  return make_error_code(DiskErrc::file_not_found);
        case EACCES:
        case EPERM:   return make_error_code(DiskErrc::access_denied);
        case ENOSPC:  return make_error_code(DiskErrc::disk_full);
        case ENAMETOOLONG:
        case ENOTDIR: return make_error_code(DiskErrc::invalid_path);
        default:      return make_error_code(fallback);
    }
}

} // namespace rangedl::disk

namespace std {

template<>
struct is_error_code_enum<rangedl::disk::DiskErrc> : true_type {};

} // namespace std
