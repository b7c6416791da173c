#pragma once

#include "datachunk/binary_sniff.h"
#include "datachunk/chunk_assemble.h"
#include "datachunk/chunk_decode.h"
#include "datachunk/chunk_scan.h"

#include <cstdint>
#include <string>

/**
 * \file datachunk_policy.h
 * \brief One place to hold the knobs of the chunk operations.
 */

namespace datachunk {

/**
 * \brief Settings shared by scan, assemble and decode.
 *
 * Front ends fill one policy (from flags, bindings arguments, ...) and copy
 * it into the per-operation option structs with \ref apply_policy.
 */
struct DatachunkPolicy final {
    /// Engine (chunk type) name in `{engine ...}` headers.
    std::string engine = "data";

    SniffOptions sniff;
    uint32_t base64_line_width = 76;

    bool verify_checksum = true;

    /// Cap on payload files read by tools (0 = unlimited).
    uint64_t max_payload_bytes = 0;
};

inline void
apply_policy(const DatachunkPolicy& policy, ScanOptions* scan) noexcept
{
    if (scan) {
        scan->engine = policy.engine;
    }
}

inline void
apply_policy(const DatachunkPolicy& policy, AssembleOptions* assemble) noexcept
{
    if (assemble) {
        assemble->engine            = policy.engine;
        assemble->encode.line_width = policy.base64_line_width;
        assemble->encode.sniff      = policy.sniff;
    }
}

inline void
apply_policy(const DatachunkPolicy& policy, DecodeOptions* decode) noexcept
{
    if (decode) {
        decode->verify_checksum = policy.verify_checksum;
    }
}

inline void
apply_policy(const DatachunkPolicy& policy, ScanOptions* scan,
             AssembleOptions* assemble, DecodeOptions* decode) noexcept
{
    apply_policy(policy, scan);
    apply_policy(policy, assemble);
    apply_policy(policy, decode);
}

}  // namespace datachunk
