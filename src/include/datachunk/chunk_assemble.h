#pragma once

#include "datachunk/chunk_status.h"
#include "datachunk/payload_codec.h"

#include <cstddef>
#include <span>
#include <string>
#include <vector>

/**
 * \file chunk_assemble.h
 * \brief Builds the complete text of a data chunk from payload bytes.
 */

namespace datachunk {

/**
 * \brief Already-resolved chunk parameters.
 *
 * Front ends apply their own defaulting (binary file -> base64, output file
 * -> eval guard) before filling this in; the assembler only fills in
 * format/encoding left at Auto. An Auto format becomes binary when the
 * payload sniffs as binary or is not valid UTF-8.
 */
struct ChunkAssembleRequest final {
    /// Bare header label (optional).
    std::string label;
    PayloadFormat format     = PayloadFormat::Auto;
    PayloadEncoding encoding = PayloadEncoding::Auto;
    /// Additional `key=value, ...` options, appended after the generated ones.
    std::string extra_options;
    std::string output_var;
    std::string output_file;
    /// Loader code (e.g. `read.csv`); requires \ref output_var.
    std::string loader_function;
    /// Store the payload MD5 in the header.
    bool md5sum = false;
    bool echo   = false;
    /// `eval=` expression, verbatim (optional).
    std::string eval;
};

struct AssembleOptions final {
    std::string engine = "data";
    EncodeOptions encode;
};

/**
 * \brief Assembles fence, header, body and closing fence into \p out_lines.
 *
 * The fence is one backtick longer than the longest backtick run starting
 * any body line (minimum three). The produced lines scan back as exactly one
 * chunk whose options and decoded payload match the request.
 *
 * Errors:
 * - \ref ChunkStatus::InvalidArguments: loader without output variable, bad
 *   label or variable name, multi-line values, or an extra option repeating a
 *   generated one.
 * - \ref ChunkStatus::InvalidEncodingChoice: `format=text` or `encoding=asis`
 *   with a payload that is not UTF-8 text.
 * - \ref ChunkStatus::MalformedHeader: unparsable extra options or code
 *   values (unbalanced quotes/brackets).
 */
ChunkStatus
assemble_chunk(std::span<const std::byte> payload,
               const ChunkAssembleRequest& request,
               const AssembleOptions& options,
               std::vector<std::string>* out_lines, ChunkError* error) noexcept;

}  // namespace datachunk
