#include "pngchunk/file_io.h"

#include <cstdio>
#include <limits>

namespace pngchunk {

FileIoStatus
read_file_bytes(const char* path, uint64_t max_file_bytes,
                std::vector<std::byte>* out)
{
    if (!path || !*path || !out) {
        return FileIoStatus::OpenFailed;
    }
    out->clear();

    std::FILE* f = std::fopen(path, "rb");
    if (!f) {
        return FileIoStatus::OpenFailed;
    }

    if (std::fseek(f, 0, SEEK_END) != 0) {
        std::fclose(f);
        return FileIoStatus::ReadFailed;
    }
    const long end = std::ftell(f);
    if (end < 0 || std::fseek(f, 0, SEEK_SET) != 0) {
        std::fclose(f);
        return FileIoStatus::ReadFailed;
    }

    const uint64_t size_u64 = static_cast<uint64_t>(end);
    if (max_file_bytes != 0U && size_u64 > max_file_bytes) {
        std::fclose(f);
        return FileIoStatus::TooLarge;
    }
    if (size_u64 > static_cast<uint64_t>(
                       std::numeric_limits<size_t>::max())) {
        std::fclose(f);
        return FileIoStatus::TooLarge;
    }

    out->resize(static_cast<size_t>(size_u64));
    size_t read = 0;
    if (!out->empty()) {
        read = std::fread(out->data(), 1, out->size(), f);
    }
    std::fclose(f);
    if (read != out->size()) {
        out->clear();
        return FileIoStatus::ReadFailed;
    }
    return FileIoStatus::Ok;
}


FileIoStatus
write_file_bytes(const char* path, std::span<const std::byte> bytes) noexcept
{
    if (!path || !*path) {
        return FileIoStatus::OpenFailed;
    }
    std::FILE* f = std::fopen(path, "wb");
    if (!f) {
        return FileIoStatus::OpenFailed;
    }
    size_t written = 0;
    if (!bytes.empty()) {
        written = std::fwrite(bytes.data(), 1, bytes.size(), f);
    }
    const bool closed = std::fclose(f) == 0;
    if (written != bytes.size() || !closed) {
        return FileIoStatus::WriteFailed;
    }
    return FileIoStatus::Ok;
}


const char*
file_io_status_name(FileIoStatus status) noexcept
{
    switch (status) {
    case FileIoStatus::Ok: return "ok";
    case FileIoStatus::OpenFailed: return "open_failed";
    case FileIoStatus::ReadFailed: return "read_failed";
    case FileIoStatus::WriteFailed: return "write_failed";
    case FileIoStatus::TooLarge: return "too_large";
    }
    return "unknown";
}

}  // namespace pngchunk
