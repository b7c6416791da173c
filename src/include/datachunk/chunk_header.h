#pragma once

#include "datachunk/chunk_options.h"
#include "datachunk/chunk_status.h"

#include <cstddef>
#include <string>
#include <string_view>

/**
 * \file chunk_header.h
 * \brief Parses and serializes chunk fence headers.
 *
 * Header syntax (one line):
 * \code
 * ```{engine[ label][, key=value]*}
 * \endcode
 * The fence is a run of at least three backticks, optionally indented.
 * Option values are kept as verbatim source text; commas inside quotes or
 * brackets do not separate options.
 */

namespace datachunk {

/// Minimum backtick run of a fence.
inline constexpr size_t kMinFenceBackticks = 3;

/// Geometry of a fence line.
struct FenceInfo final {
    size_t indent    = 0;
    size_t backticks = 0;
};

struct ChunkHeader final {
    /// Engine name following `{` (e.g. `data`).
    std::string engine;
    /// Bare label token; empty when the header has none.
    std::string label;
    ChunkOptions options;
};

/**
 * \brief Returns true if \p line is an opening fence (`` ```{ ``).
 *
 * Only the fence prefix is checked; use \ref parse_chunk_header for the rest.
 */
bool
is_chunk_header_line(std::string_view line, FenceInfo* out) noexcept;

/**
 * \brief Returns true if \p line is a plain fence: a backtick run of at least
 * \p min_backticks, optionally followed by an info string not starting with `{`.
 */
bool
is_plain_fence_line(std::string_view line, size_t min_backticks,
                    FenceInfo* out) noexcept;

/// Returns true if \p line closes a fence opened with \p min_backticks.
bool
is_closing_fence(std::string_view line, size_t min_backticks) noexcept;

/**
 * \brief Parses a full header line into \p out.
 *
 * \ref ChunkStatus::MalformedHeader (with \ref ChunkError::fragment naming the
 * offending text) on a missing fence or engine, unbalanced quotes/brackets,
 * empty or duplicate options, an option without `=`, or a bad key.
 */
ChunkStatus
parse_chunk_header(std::string_view line, ChunkHeader* out,
                   ChunkError* error) noexcept;

/**
 * \brief Parses a bare `key=value, ...` list (no engine, no label).
 *
 * Entries are appended to \p out; a key already present in \p out is reported
 * as a duplicate.
 */
ChunkStatus
parse_chunk_option_list(std::string_view list, ChunkOptions* out,
                        ChunkError* error) noexcept;

/**
 * \brief Serializes the `{...}` part of a header.
 *
 * Recognized keys (\ref canonical_option_keys) come first in canonical order,
 * then the remaining keys in their original order. Without a label the engine
 * is followed by `, `; with neither label nor options the result is
 * `{engine}`.
 */
std::string
serialize_chunk_header(std::string_view engine, std::string_view label,
                       const ChunkOptions& options);

/// Returns \p backticks backtick characters.
std::string
make_fence(size_t backticks);

}  // namespace datachunk
