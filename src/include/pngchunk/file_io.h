#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

/**
 * \file file_io.h
 * \brief Whole-file read/write helpers used by the tools and bindings.
 */

namespace pngchunk {

/// Status code for file helpers.
enum class FileIoStatus : uint8_t {
    Ok,
    OpenFailed,
    ReadFailed,
    WriteFailed,
    TooLarge,
};

/**
 * \brief Reads the whole file at \p path into \p out.
 *
 * \p max_file_bytes is a hard cap (0 = unlimited). \p out is replaced.
 */
FileIoStatus
read_file_bytes(const char* path, uint64_t max_file_bytes,
                std::vector<std::byte>* out);

/// Creates or truncates \p path and writes \p bytes to it.
FileIoStatus
write_file_bytes(const char* path, std::span<const std::byte> bytes) noexcept;

const char*
file_io_status_name(FileIoStatus status) noexcept;

}  // namespace pngchunk
