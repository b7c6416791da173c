#include "datachunk/chunk_status.h"

#include <cstdio>

namespace datachunk {

const char*
chunk_status_name(ChunkStatus status) noexcept
{
    switch (status) {
    case ChunkStatus::Ok: return "ok";
    case ChunkStatus::InvalidEncodingChoice: return "invalid_encoding_choice";
    case ChunkStatus::CorruptPayload: return "corrupt_payload";
    case ChunkStatus::ChecksumMismatch: return "checksum_mismatch";
    case ChunkStatus::MalformedHeader: return "malformed_header";
    case ChunkStatus::UnterminatedChunk: return "unterminated_chunk";
    case ChunkStatus::InvalidArguments: return "invalid_arguments";
    case ChunkStatus::InvalidPosition: return "invalid_position";
    }
    return "unknown";
}


void
clear_chunk_error(ChunkError* error) noexcept
{
    if (!error) {
        return;
    }
    error->status = ChunkStatus::Ok;
    error->line   = 0;
    error->label.clear();
    error->fragment.clear();
    error->expected_digest.clear();
    error->actual_digest.clear();
    error->message.clear();
}


ChunkStatus
set_chunk_error(ChunkError* error, ChunkStatus status,
                std::string_view message) noexcept
{
    if (!error) {
        return status;
    }
    error->status = status;
    error->message.assign(message.data(), message.size());
    return status;
}


std::string
format_chunk_error(const ChunkError& error)
{
    std::string out;
    out.reserve(96 + error.message.size());
    out.append(chunk_status_name(error.status));
    out.append(": ");
    if (error.line != 0U) {
        char buf[32];
        std::snprintf(buf, sizeof(buf), "line %llu: ",
                      static_cast<unsigned long long>(error.line));
        out.append(buf);
    }
    if (!error.label.empty()) {
        out.append("chunk '");
        out.append(error.label);
        out.append("': ");
    }
    out.append(error.message);
    if (!error.fragment.empty()) {
        out.append(" (");
        out.append(error.fragment);
        out.append(")");
    }
    if (error.status == ChunkStatus::ChecksumMismatch) {
        out.append(" expected=");
        out.append(error.expected_digest);
        out.append(" actual=");
        out.append(error.actual_digest);
    }
    return out;
}

}  // namespace datachunk
