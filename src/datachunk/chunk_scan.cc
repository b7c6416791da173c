#include "datachunk/chunk_scan.h"

#include <cstdio>

namespace datachunk {
namespace {

    static bool engine_selected(const ScanOptions& options,
                                std::string_view engine) noexcept
    {
        return options.engine.empty() || options.engine == engine;
    }


    // Returns the engine of an opening fence line, or empty.
    static std::string header_engine(std::string_view line)
    {
        ChunkHeader header;
        (void)parse_chunk_header(line, &header, nullptr);
        return std::move(header.engine);
    }


    static void resolve_label(const ChunkHeader& header, uint32_t* unnamed,
                              std::string* label, bool* synthesized)
    {
        *synthesized = false;
        if (!header.label.empty()) {
            *label = header.label;
            return;
        }
        const std::string* opt = header.options.find("label");
        if (opt && option_string_value(*opt, label) && !label->empty()) {
            return;
        }
        *unnamed += 1;
        char buf[40];
        std::snprintf(buf, sizeof(buf), "unnamed-chunk-%u",
                      static_cast<unsigned>(*unnamed));
        label->assign(buf);
        *synthesized = true;
    }

}  // namespace

ChunkScanner::ChunkScanner(std::span<const std::string> lines,
                           const ScanOptions& options)
    : lines_(lines)
    , options_(options)
{
}


bool
ChunkScanner::fail(ChunkStatus status, uint64_t line_index,
                   std::string_view label, std::string_view message) noexcept
{
    error_.line = line_index + 1U;
    error_.label.assign(label.data(), label.size());
    set_chunk_error(&error_, status, message);
    pos_ = lines_.size();
    return false;
}


bool
ChunkScanner::next(Chunk* out) noexcept
{
    if (error_.status != ChunkStatus::Ok) {
        return false;
    }
    const uint64_t n = lines_.size();

    while (pos_ < n) {
        const std::string_view line = lines_[pos_];

        FenceInfo fence;
        if (!is_chunk_header_line(line, &fence)) {
            if (is_plain_fence_line(line, kMinFenceBackticks, &fence)) {
                // Verbatim code block; an unclosed one runs to the end.
                uint64_t j = pos_ + 1U;
                while (j < n && !is_closing_fence(lines_[j], fence.backticks)) {
                    j += 1;
                }
                pos_ = (j < n) ? j + 1U : n;
                continue;
            }
            pos_ += 1;
            continue;
        }

        const uint64_t open = pos_;
        ChunkHeader header;
        ChunkError header_error;
        const ChunkStatus hst = parse_chunk_header(line, &header,
                                                   &header_error);
        if (hst != ChunkStatus::Ok
            && (header.engine.empty()
                || engine_selected(options_, header.engine))) {
            error_.fragment = std::move(header_error.fragment);
            return fail(hst, open, std::string_view(), header_error.message);
        }

        std::string label;
        bool synthesized = false;
        resolve_label(header, &unnamed_, &label, &synthesized);

        uint64_t close = open + 1U;
        while (close < n) {
            const std::string_view body_line = lines_[close];
            if (is_closing_fence(body_line, fence.backticks)) {
                break;
            }
            FenceInfo inner;
            if (is_chunk_header_line(body_line, &inner)
                && inner.backticks >= fence.backticks
                && header_engine(body_line) == header.engine) {
                error_.fragment.assign(body_line.data(), body_line.size());
                return fail(ChunkStatus::MalformedHeader, close, label,
                            "nested chunk fence");
            }
            close += 1;
        }
        if (close >= n) {
            return fail(ChunkStatus::UnterminatedChunk, open, label,
                        "chunk is not closed before end of document");
        }

        pos_ = close + 1U;
        if (!engine_selected(options_, header.engine)) {
            continue;
        }

        if (out) {
            out->engine            = std::move(header.engine);
            out->label             = std::move(label);
            out->label_synthesized = synthesized;
            out->options           = std::move(header.options);
            out->header_line.assign(line.data(), line.size());
            out->body_lines.assign(lines_.begin() + static_cast<std::ptrdiff_t>(open + 1U),
                                   lines_.begin() + static_cast<std::ptrdiff_t>(close));
            out->range           = LineRange { open, close + 1U };
            out->fence_backticks = fence.backticks;
        }
        return true;
    }
    return false;
}


void
ChunkScanner::reset() noexcept
{
    pos_     = 0;
    unnamed_ = 0;
    clear_chunk_error(&error_);
}


ChunkStatus
ChunkScanner::status() const noexcept
{
    return error_.status;
}


const ChunkError&
ChunkScanner::error() const noexcept
{
    return error_;
}


ChunkStatus
scan_chunks(std::span<const std::string> lines, const ScanOptions& options,
            std::vector<Chunk>* out, ChunkError* error) noexcept
{
    if (!out) {
        return set_chunk_error(error, ChunkStatus::InvalidArguments,
                               "null chunk output");
    }
    out->clear();
    clear_chunk_error(error);

    ChunkScanner scanner(lines, options);
    Chunk chunk;
    while (scanner.next(&chunk)) {
        out->push_back(std::move(chunk));
        chunk = Chunk();
    }
    if (scanner.status() != ChunkStatus::Ok) {
        out->clear();
        if (error) {
            *error = scanner.error();
        }
        return scanner.status();
    }
    return ChunkStatus::Ok;
}

}  // namespace datachunk
