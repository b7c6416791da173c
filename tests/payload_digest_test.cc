#include "datachunk/payload_digest.h"

#include <gtest/gtest.h>

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace datachunk {
namespace {

    static std::vector<std::byte> bytes_of(std::string_view s)
    {
        std::vector<std::byte> out;
        for (char c : s) {
            out.push_back(std::byte { static_cast<uint8_t>(c) });
        }
        return out;
    }


    TEST(PayloadDigest, KnownVectors)
    {
        std::string hex;
        ASSERT_TRUE(payload_digest_hex({}, &hex));
        EXPECT_EQ(hex, "d41d8cd98f00b204e9800998ecf8427e");
        ASSERT_TRUE(payload_digest_hex(bytes_of("abc"), &hex));
        EXPECT_EQ(hex, "900150983cd24fb0d6963f7d28e17f72");
        EXPECT_EQ(hex.size(), kPayloadDigestHexSize);

        const std::vector<std::byte> bin = { std::byte { 0x00 },
                                             std::byte { 0xFF },
                                             std::byte { 0x10 } };
        ASSERT_TRUE(payload_digest_hex(bin, &hex));
        EXPECT_EQ(hex, "481e4551ec039aada760901cf52b1917");
    }


    TEST(PayloadDigest, LargeInputStreamsInBlocks)
    {
        // Spans several internal blocks; must equal a digest of the same
        // bytes computed in one go by a second call.
        std::vector<std::byte> big(200U * 1024U + 7U);
        for (size_t i = 0; i < big.size(); ++i) {
            big[i] = std::byte { static_cast<uint8_t>(i * 131U) };
        }
        std::string a;
        std::string b;
        ASSERT_TRUE(payload_digest_hex(big, &a));
        ASSERT_TRUE(payload_digest_hex(big, &b));
        EXPECT_EQ(a, b);
        big.back() ^= std::byte { 0x01 };
        ASSERT_TRUE(payload_digest_hex(big, &b));
        EXPECT_NE(a, b);
    }


    TEST(PayloadDigest, VerifyIsCaseInsensitive)
    {
        EXPECT_EQ(verify_payload_digest(bytes_of("abc"),
                                        "900150983CD24FB0D6963F7D28E17F72",
                                        nullptr),
                  ChunkStatus::Ok);
    }


    TEST(PayloadDigest, EverySingleBitFlipIsDetected)
    {
        const std::vector<std::byte> in = bytes_of("embedded payload\n");
        std::string hex;
        ASSERT_TRUE(payload_digest_hex(in, &hex));
        ASSERT_EQ(verify_payload_digest(in, hex, nullptr), ChunkStatus::Ok);

        for (size_t i = 0; i < in.size(); ++i) {
            for (uint32_t bit = 0; bit < 8; ++bit) {
                std::vector<std::byte> flipped = in;
                flipped[i] ^= std::byte { static_cast<uint8_t>(1U << bit) };
                EXPECT_EQ(verify_payload_digest(flipped, hex, nullptr),
                          ChunkStatus::ChecksumMismatch);
            }
        }
    }


    TEST(PayloadDigest, MismatchReportsBothDigests)
    {
        ChunkError error;
        ASSERT_EQ(verify_payload_digest(bytes_of("abc"), "not-a-digest",
                                        &error),
                  ChunkStatus::ChecksumMismatch);
        EXPECT_EQ(error.status, ChunkStatus::ChecksumMismatch);
        EXPECT_EQ(error.expected_digest, "not-a-digest");
        EXPECT_EQ(error.actual_digest, "900150983cd24fb0d6963f7d28e17f72");
    }


    TEST(PayloadDigest, BackendVersionIsReported)
    {
        EXPECT_FALSE(digest_backend_version().empty());
    }

}  // namespace
}  // namespace datachunk
