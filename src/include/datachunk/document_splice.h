#pragma once

#include "datachunk/chunk_scan.h"
#include "datachunk/chunk_status.h"
#include "datachunk/document_text.h"

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

/**
 * \file document_splice.h
 * \brief Inserting chunk text into, and removing chunk ranges from, a document.
 *
 * Every operation returns a new line sequence; the input is never modified.
 * Line ranges obtained from an earlier scan are only valid for the snapshot
 * that was scanned.
 */

namespace datachunk {

/// "No removal" / "no line" cursor sentinel.
inline constexpr uint64_t kNoLine = UINT64_MAX;

/**
 * \brief Inserts \p chunk_lines before 0-based line \p position.
 *
 * A \p position past the end appends. Negative positions fail with
 * \ref ChunkStatus::InvalidPosition. \p out_cursor (optional) receives the
 * index of the first inserted line.
 */
ChunkStatus
insert_chunk_lines(std::span<const std::string> document, int64_t position,
                   std::span<const std::string> chunk_lines,
                   DocumentLines* out, uint64_t* out_cursor,
                   ChunkError* error) noexcept;

/**
 * \brief Sorts \p ranges by start and merges overlapping or touching ones.
 *
 * Empty ranges are dropped. Does not validate bounds.
 */
void
merge_line_ranges(std::span<const LineRange> ranges,
                  std::vector<LineRange>* out);

/**
 * \brief Removes the union of \p ranges from \p document.
 *
 * Ranges may overlap and come in any order; they are merged first and the
 * merged spans removed in one pass. \p out_first_removed (optional) receives
 * the start of the first merged span, the line where a cursor should land,
 * or \ref kNoLine when nothing was removed.
 *
 * A range with `start > end` or `end > document.size()` fails with
 * \ref ChunkStatus::InvalidPosition and leaves \p out empty.
 */
ChunkStatus
remove_chunk_ranges(std::span<const std::string> document,
                    std::span<const LineRange> ranges, DocumentLines* out,
                    uint64_t* out_first_removed, ChunkError* error) noexcept;

/**
 * \brief Indices of the chunks touching the inclusive line selection
 * `[first_line, last_line]` (0-based; the bounds may come in either order).
 */
std::vector<size_t>
find_chunks_in_selection(std::span<const Chunk> chunks, uint64_t first_line,
                         uint64_t last_line);

/// Gathers the ranges of `chunks[indices[i]]`; an out-of-range index fails.
ChunkStatus
collect_chunk_ranges(std::span<const Chunk> chunks,
                     std::span<const size_t> indices,
                     std::vector<LineRange>* out, ChunkError* error) noexcept;

}  // namespace datachunk
