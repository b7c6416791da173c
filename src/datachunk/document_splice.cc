#include "datachunk/document_splice.h"

#include <algorithm>
#include <cstddef>
#include <cstdio>

namespace datachunk {

ChunkStatus
insert_chunk_lines(std::span<const std::string> document, int64_t position,
                   std::span<const std::string> chunk_lines,
                   DocumentLines* out, uint64_t* out_cursor,
                   ChunkError* error) noexcept
{
    clear_chunk_error(error);
    if (out_cursor) {
        *out_cursor = kNoLine;
    }
    if (!out) {
        return set_chunk_error(error, ChunkStatus::InvalidArguments,
                               "null document output");
    }
    out->clear();
    if (position < 0) {
        return set_chunk_error(error, ChunkStatus::InvalidPosition,
                               "negative insert position");
    }

    const size_t at = static_cast<size_t>(std::min<uint64_t>(
        static_cast<uint64_t>(position), document.size()));
    const auto split = document.begin() + static_cast<std::ptrdiff_t>(at);
    out->reserve(document.size() + chunk_lines.size());
    out->insert(out->end(), document.begin(), split);
    out->insert(out->end(), chunk_lines.begin(), chunk_lines.end());
    out->insert(out->end(), split, document.end());
    if (out_cursor) {
        *out_cursor = at;
    }
    return ChunkStatus::Ok;
}


void
merge_line_ranges(std::span<const LineRange> ranges,
                  std::vector<LineRange>* out)
{
    out->clear();
    for (const LineRange& r : ranges) {
        if (r.end > r.start) {
            out->push_back(r);
        }
    }
    std::sort(out->begin(), out->end(),
              [](const LineRange& a, const LineRange& b) {
                  return a.start < b.start
                         || (a.start == b.start && a.end < b.end);
              });

    size_t w = 0;
    for (size_t i = 0; i < out->size(); ++i) {
        const LineRange r = (*out)[i];
        if (w > 0 && r.start <= (*out)[w - 1].end) {
            (*out)[w - 1].end = std::max((*out)[w - 1].end, r.end);
            continue;
        }
        (*out)[w++] = r;
    }
    out->resize(w);
}


ChunkStatus
remove_chunk_ranges(std::span<const std::string> document,
                    std::span<const LineRange> ranges, DocumentLines* out,
                    uint64_t* out_first_removed, ChunkError* error) noexcept
{
    clear_chunk_error(error);
    if (out_first_removed) {
        *out_first_removed = kNoLine;
    }
    if (!out) {
        return set_chunk_error(error, ChunkStatus::InvalidArguments,
                               "null document output");
    }
    out->clear();

    for (const LineRange& r : ranges) {
        if (r.start > r.end || r.end > document.size()) {
            if (error) {
                char buf[96];
                std::snprintf(buf, sizeof(buf), "[%llu, %llu)",
                              static_cast<unsigned long long>(r.start),
                              static_cast<unsigned long long>(r.end));
                error->fragment = buf;
            }
            return set_chunk_error(error, ChunkStatus::InvalidPosition,
                                   "range outside the document");
        }
    }

    std::vector<LineRange> merged;
    merge_line_ranges(ranges, &merged);

    uint64_t removed = 0;
    for (const LineRange& r : merged) {
        removed += r.size();
    }
    out->reserve(document.size() - removed);

    uint64_t pos = 0;
    for (const LineRange& r : merged) {
        out->insert(out->end(),
                    document.begin() + static_cast<std::ptrdiff_t>(pos),
                    document.begin() + static_cast<std::ptrdiff_t>(r.start));
        pos = r.end;
    }
    out->insert(out->end(), document.begin() + static_cast<std::ptrdiff_t>(pos),
                document.end());

    if (out_first_removed && !merged.empty()) {
        *out_first_removed = merged.front().start;
    }
    return ChunkStatus::Ok;
}


std::vector<size_t>
find_chunks_in_selection(std::span<const Chunk> chunks, uint64_t first_line,
                         uint64_t last_line)
{
    if (first_line > last_line) {
        std::swap(first_line, last_line);
    }
    std::vector<size_t> hits;
    for (size_t i = 0; i < chunks.size(); ++i) {
        const LineRange& r = chunks[i].range;
        if (r.end > r.start && r.start <= last_line && r.end - 1U >= first_line) {
            hits.push_back(i);
        }
    }
    return hits;
}


ChunkStatus
collect_chunk_ranges(std::span<const Chunk> chunks,
                     std::span<const size_t> indices,
                     std::vector<LineRange>* out, ChunkError* error) noexcept
{
    clear_chunk_error(error);
    if (!out) {
        return set_chunk_error(error, ChunkStatus::InvalidArguments,
                               "null range output");
    }
    out->clear();
    out->reserve(indices.size());
    for (size_t index : indices) {
        if (index >= chunks.size()) {
            out->clear();
            return set_chunk_error(error, ChunkStatus::InvalidArguments,
                                   "chunk index out of range");
        }
        out->push_back(chunks[index].range);
    }
    return ChunkStatus::Ok;
}

}  // namespace datachunk
