#pragma once

#include <string>
#include <string_view>

/**
 * \file build_info.h
 * \brief Version and toolchain of the linked datachunk library.
 */

namespace datachunk {

/// Configure-time facts about the datachunk build.
struct BuildInfo final {
    std::string_view version;
    /// CMake build type, or "multi-config".
    std::string_view build_type;
    /// Compiler id and version, e.g. "GNU 13.2.0".
    std::string_view compiler;
    /// Target system and processor, e.g. "Linux/x86_64".
    std::string_view platform;
    /// OpenSSL version providing the md5sum digest.
    std::string_view digest_backend;
    bool shared_library = false;
    bool with_python    = false;
    bool with_fuzzers   = false;
};

const BuildInfo&
build_info() noexcept;

/**
 * \brief One-line description of \p info.
 *
 * `datachunk 0.1.0 (Release, static) GNU 13.2.0 Linux/x86_64, OpenSSL 3.0.2`
 * followed by ` +python` / ` +fuzzers` for optional parts that were built.
 */
std::string
build_info_summary(const BuildInfo& info);

/// \ref build_info_summary of \ref build_info().
std::string
build_info_summary();

}  // namespace datachunk
