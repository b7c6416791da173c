#pragma once

#include "datachunk/binary_sniff.h"
#include "datachunk/chunk_assemble.h"
#include "datachunk/chunk_scan.h"
#include "datachunk/chunk_status.h"

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

/**
 * \file chunk_request.h
 * \brief Front-end rules: defaulting a new chunk request and chunk selectors.
 */

namespace datachunk {

/// Chunk parameters as a user gave them, before defaulting.
struct ChunkRequestDraft final {
    ChunkAssembleRequest request;
    bool have_format   = false;
    bool have_encoding = false;
    bool have_eval     = false;
    bool have_loader   = false;
};

/// \ref ChunkStatus::InvalidArguments (fragment `output`) unless the request
/// names an output variable or an output file.
ChunkStatus
check_chunk_targets(const ChunkAssembleRequest& request,
                    ChunkError* error) noexcept;

/// `read.csv` for `.csv`, `readRDS` for `.rds` (any case), else empty.
std::string_view
guess_loader_function(std::string_view data_path) noexcept;

/// `!file.exists("<path>")` with \p path quoted.
std::string
file_exists_guard(std::string_view path);

/**
 * \brief Fills in what the user left unset in \p draft.
 *
 * - format/encoding: `binary`/`base64` when \p payload sniffs as binary or
 *   is not UTF-8 text, otherwise `text`/`asis`.
 * - `loader.function`: guessed from \p data_path when an output variable is
 *   set.
 * - `eval`: \ref file_exists_guard of the output file, when one is set.
 *
 * Fails with \ref ChunkStatus::InvalidArguments when no target is named
 * (fragment `output`) or a loader is given without an output variable
 * (fragment `loader.function`).
 */
ChunkStatus
apply_chunk_request_defaults(std::span<const std::byte> payload,
                             std::string_view data_path,
                             const SniffOptions& sniff, ChunkRequestDraft* draft,
                             ChunkError* error) noexcept;

/**
 * \brief Parses a 1-based line number into a 0-based line index.
 *
 * Only decimal digits are accepted; a sign, blanks, 0 or a value past
 * `INT64_MAX` is \ref ChunkStatus::InvalidPosition.
 */
ChunkStatus
parse_line_number(std::string_view text, uint64_t* out_index,
                  ChunkError* error) noexcept;

enum class ChunkSelectorKind : uint8_t {
    Label,
    Index,
    Lines,
};

struct ChunkSelector final {
    ChunkSelectorKind kind = ChunkSelectorKind::Label;
    std::string label;
    /// 0-based chunk index.
    uint64_t index = 0;
    /// 0-based, inclusive document lines.
    uint64_t first_line = 0;
    uint64_t last_line  = 0;
};

/**
 * \brief Parses `#N` (1-based chunk index), `first:last` (1-based inclusive
 * lines) or a chunk label.
 *
 * A `#` selector without a positive decimal number is
 * \ref ChunkStatus::InvalidArguments. Two decimal numbers around `:` form a
 * line selection, and line 0 is \ref ChunkStatus::InvalidPosition. Any other
 * text is taken as a label.
 */
ChunkStatus
parse_chunk_selector(std::string_view text, ChunkSelector* out,
                     ChunkError* error) noexcept;

/**
 * \brief Appends the indices of the chunks \p selector picks to \p out.
 *
 * An unknown label or an index past the last chunk is
 * \ref ChunkStatus::InvalidArguments. A line selection touching no chunk adds
 * nothing.
 */
ChunkStatus
select_chunks(std::span<const Chunk> chunks, const ChunkSelector& selector,
              std::vector<size_t>* out, ChunkError* error) noexcept;

}  // namespace datachunk
