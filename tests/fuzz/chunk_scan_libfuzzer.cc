#include "datachunk/chunk_scan.h"
#include "datachunk/document_text.h"

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <string_view>
#include <vector>

namespace datachunk {

[[noreturn]] static void
fuzz_trap() noexcept
{
#if defined(__clang__) || defined(__GNUC__)
    __builtin_trap();
#else
    std::abort();
#endif
}


static void
verify_chunks(const DocumentLines& lines, const std::vector<Chunk>& chunks)
{
    uint64_t prev_end = 0;
    for (const Chunk& c : chunks) {
        if (c.range.start < prev_end || c.range.end > lines.size()) {
            fuzz_trap();
        }
        if (c.range.size() != c.body_lines.size() + 2U) {
            fuzz_trap();
        }
        if (lines[c.range.start] != c.header_line) {
            fuzz_trap();
        }
        if (c.label.empty()) {
            fuzz_trap();
        }
        prev_end = c.range.end;
    }
}

}  // namespace datachunk

extern "C" int
LLVMFuzzerTestOneInput(const uint8_t* data, size_t size)
{
    using namespace datachunk;

    const std::string_view text(reinterpret_cast<const char*>(data), size);
    DocumentLines lines;
    bool trailing = false;
    split_document_lines(text, &lines, &trailing);

    ScanOptions options;
    std::vector<Chunk> chunks;
    if (scan_chunks(lines, options, &chunks, nullptr) == ChunkStatus::Ok) {
        verify_chunks(lines, chunks);
    }

    options.engine.clear();
    if (scan_chunks(lines, options, &chunks, nullptr) == ChunkStatus::Ok) {
        verify_chunks(lines, chunks);
    }
    return 0;
}
