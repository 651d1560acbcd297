#pragma once

#include <string>
#include <string_view>

/**
 * \file build_info.h
 * \brief Runtime information about how pngchunk was built.
 */

namespace pngchunk {

/**
 * \brief pngchunk build information.
 *
 * Values are compiled into the binary at build time.
 */
struct BuildInfo final {
    /// Version string (e.g. "0.1.0").
    std::string_view version;

    /// Build type string (e.g. "Release", "Debug").
    std::string_view build_type;

    /// Target platform and CPU architecture.
    std::string_view system_name;
    std::string_view system_processor;

    /// Compiler ID and version.
    std::string_view cxx_compiler_id;
    std::string_view cxx_compiler_version;

    /// zlib version the CRC routine was compiled against (`ZLIB_VERSION`).
    std::string_view zlib;

    /// True if this binary was built from the shared library target.
    bool linkage_shared = false;
};

/// Returns build information for the linked pngchunk library.
const BuildInfo&
build_info() noexcept;

/**
 * \brief Formats a stable, human-readable build info header (2 lines).
 *
 * Output format:
 * - `pngchunk vX.Y.Z <build_type> [zlib <version>] <linkage>`
 * - `built with <compiler> for <system>/<arch>`
 */
void
format_build_info_lines(const BuildInfo& info, std::string* line1,
                        std::string* line2);

/// Convenience overload for the linked library build.
void
format_build_info_lines(std::string* line1, std::string* line2);

}  // namespace pngchunk
