#include "datachunk/payload_digest.h"

#include <openssl/crypto.h>
#include <openssl/evp.h>

#include <memory>

namespace datachunk {
namespace {

    struct MdCtxDeleter final {
        void operator()(EVP_MD_CTX* ctx) const noexcept { EVP_MD_CTX_free(ctx); }
    };

    using UniqueMdCtx = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;

    static char lower_ascii(char c) noexcept
    {
        return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
    }

}  // namespace

bool
payload_digest_hex(std::span<const std::byte> bytes,
                   std::string* out_hex) noexcept
{
    if (!out_hex) {
        return false;
    }
    out_hex->clear();

    UniqueMdCtx ctx(EVP_MD_CTX_new());
    if (!ctx) {
        return false;
    }
    if (EVP_DigestInit_ex(ctx.get(), EVP_md5(), nullptr) != 1) {
        return false;
    }
    static constexpr size_t kBlock = 64U * 1024U;
    for (size_t off = 0; off < bytes.size(); off += kBlock) {
        const size_t n = (bytes.size() - off < kBlock) ? bytes.size() - off
                                                       : kBlock;
        if (EVP_DigestUpdate(ctx.get(), bytes.data() + off, n) != 1) {
            return false;
        }
    }

    unsigned char md[EVP_MAX_MD_SIZE];
    unsigned int md_len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), md, &md_len) != 1) {
        return false;
    }

    static constexpr char kHex[] = "0123456789abcdef";
    out_hex->reserve(static_cast<size_t>(md_len) * 2U);
    for (unsigned int i = 0; i < md_len; ++i) {
        out_hex->push_back(kHex[(md[i] >> 4) & 0x0F]);
        out_hex->push_back(kHex[md[i] & 0x0F]);
    }
    return true;
}


ChunkStatus
verify_payload_digest(std::span<const std::byte> bytes,
                      std::string_view expected_hex, ChunkError* error) noexcept
{
    std::string actual;
    if (!payload_digest_hex(bytes, &actual)) {
        return set_chunk_error(error, ChunkStatus::ChecksumMismatch,
                               "digest backend failure");
    }

    bool same = expected_hex.size() == actual.size();
    for (size_t i = 0; same && i < actual.size(); ++i) {
        same = lower_ascii(expected_hex[i]) == actual[i];
    }
    if (same) {
        return ChunkStatus::Ok;
    }

    if (error) {
        error->expected_digest.assign(expected_hex.data(), expected_hex.size());
        error->actual_digest = std::move(actual);
    }
    return set_chunk_error(error, ChunkStatus::ChecksumMismatch,
                           "md5sum does not match decoded payload");
}


std::string_view
digest_backend_version() noexcept
{
    const char* v = OpenSSL_version(OPENSSL_VERSION);
    return v ? std::string_view(v) : std::string_view();
}

}  // namespace datachunk
