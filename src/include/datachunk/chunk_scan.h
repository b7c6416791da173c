#pragma once

#include "datachunk/chunk_header.h"
#include "datachunk/chunk_options.h"
#include "datachunk/chunk_status.h"

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

/**
 * \file chunk_scan.h
 * \brief Locates chunks in a document's line sequence.
 */

namespace datachunk {

/// Half-open, 0-based line range `[start, end)`.
struct LineRange final {
    uint64_t start = 0;
    uint64_t end   = 0;

    uint64_t size() const noexcept { return end > start ? end - start : 0; }
    bool operator==(const LineRange&) const = default;
};

/**
 * \brief One chunk found by \ref ChunkScanner.
 *
 * \ref range spans the opening fence line through the closing fence line.
 * Ranges refer to the scanned snapshot only; re-scan after any document edit.
 */
struct Chunk final {
    std::string engine;
    /// Header label, `label=` option value, or `unnamed-chunk-N`.
    std::string label;
    bool label_synthesized = false;
    ChunkOptions options;
    /// Opening fence line, verbatim.
    std::string header_line;
    /// Lines between the fences, verbatim.
    std::vector<std::string> body_lines;
    LineRange range;
    /// Backtick run length of the opening fence.
    size_t fence_backticks = 0;

    bool operator==(const Chunk&) const = default;
};

struct ScanOptions final {
    /// Engine to report (empty = every chunk).
    std::string engine = "data";
};

/**
 * \brief Forward, restartable scanner over a document snapshot.
 *
 * Chunks are produced in document order, one per \ref next call. Content of
 * plain fenced code blocks is skipped. Unlabeled chunks of every engine are
 * numbered in document order for `unnamed-chunk-N` labels, so labels stay
 * stable whatever \ref ScanOptions::engine selects.
 *
 * \note The scanner keeps a view of \p lines; they must outlive it and must
 * not change while it is in use.
 */
class ChunkScanner final {
public:
    ChunkScanner(std::span<const std::string> lines,
                 const ScanOptions& options);

    /**
     * \brief Produces the next chunk.
     *
     * Returns false at the end of the document or on error; \ref status then
     * tells which. After an error every call returns false until \ref reset.
     */
    bool next(Chunk* out) noexcept;

    /// Restarts from the first line.
    void reset() noexcept;

    ChunkStatus status() const noexcept;
    const ChunkError& error() const noexcept;

private:
    bool fail(ChunkStatus status, uint64_t line_index, std::string_view label,
              std::string_view message) noexcept;

    std::span<const std::string> lines_;
    ScanOptions options_;
    uint64_t pos_      = 0;
    uint32_t unnamed_  = 0;
    ChunkError error_;
};

/**
 * \brief Scans all of \p lines and replaces \p out with the matching chunks.
 *
 * Fails with \ref ChunkStatus::UnterminatedChunk (opening line reported) when
 * the document ends inside a chunk, and \ref ChunkStatus::MalformedHeader on a
 * bad header or a nested opening fence of the same engine.
 */
ChunkStatus
scan_chunks(std::span<const std::string> lines, const ScanOptions& options,
            std::vector<Chunk>* out, ChunkError* error) noexcept;

}  // namespace datachunk
