#pragma once

#include "datachunk/chunk_options.h"
#include "datachunk/chunk_status.h"
#include "datachunk/payload_codec.h"

#include <cstdint>
#include <string>

/**
 * \file chunk_settings.h
 * \brief Typed view of the recognized options of a data chunk.
 */

namespace datachunk {

/**
 * \brief Recognized data-chunk options, validated.
 *
 * String-valued options are unquoted. `loader.function`, `loader.ops` and
 * `eval` are host-engine code and stay verbatim.
 */
struct ChunkSettings final {
    PayloadFormat format     = PayloadFormat::Text;
    PayloadEncoding encoding = PayloadEncoding::Asis;
    std::string output_var;
    std::string output_file;
    std::string loader_function;
    std::string loader_ops;
    /// Expected payload digest (lowercase or uppercase hex); empty = none.
    std::string md5sum;
    bool echo = false;
    /// Max body lines to echo (0 = all).
    uint32_t max_echo = 0;
    std::string eval;
};

/**
 * \brief Interprets \p options into \p out.
 *
 * Absent options keep the \ref ChunkSettings defaults. An invalid value, or
 * `loader.function` without `output.var`, yields
 * \ref ChunkStatus::InvalidArguments with the key in \ref ChunkError::fragment.
 */
ChunkStatus
resolve_chunk_settings(const ChunkOptions& options, ChunkSettings* out,
                       ChunkError* error) noexcept;

}  // namespace datachunk
