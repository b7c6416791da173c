#include "datachunk/chunk_assemble.h"
#include "datachunk/chunk_decode.h"
#include "datachunk/chunk_header.h"
#include "datachunk/chunk_scan.h"
#include "datachunk/document_splice.h"
#include "datachunk/document_text.h"
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


    static std::vector<std::string> assemble_ok(std::span<const std::byte> payload,
                                                const ChunkAssembleRequest& r)
    {
        std::vector<std::string> lines;
        ChunkError error;
        EXPECT_EQ(assemble_chunk(payload, r, AssembleOptions {}, &lines, &error),
                  ChunkStatus::Ok)
            << format_chunk_error(error);
        return lines;
    }


    static ChunkStatus assemble_status(std::string_view payload,
                                       const ChunkAssembleRequest& r,
                                       ChunkError* error)
    {
        std::vector<std::string> lines;
        const ChunkStatus st = assemble_chunk(bytes_of(payload), r,
                                              AssembleOptions {}, &lines, error);
        if (st != ChunkStatus::Ok) {
            EXPECT_TRUE(lines.empty());
        }
        return st;
    }


    TEST(ChunkAssemble, TextDefaultsToAsis)
    {
        const std::vector<std::string> lines = assemble_ok(bytes_of("abc"),
                                                           ChunkAssembleRequest {});
        ASSERT_EQ(lines.size(), 3U);
        EXPECT_EQ(lines[0],
                  "```{data, format=\"text\", encoding=\"asis\", echo=FALSE}");
        EXPECT_EQ(lines[1], "abc");
        EXPECT_EQ(lines[2], "```");
    }


    TEST(ChunkAssemble, BinaryWithChecksumDecodesBack)
    {
        const std::vector<std::byte> payload = { std::byte { 0x00 },
                                                 std::byte { 0xFF },
                                                 std::byte { 0x10 } };
        ChunkAssembleRequest r;
        r.label      = "bin";
        r.encoding   = PayloadEncoding::Base64;
        r.md5sum     = true;
        r.output_var = "raw";
        const std::vector<std::string> lines = assemble_ok(payload, r);
        ASSERT_EQ(lines.size(), 3U);
        EXPECT_EQ(lines[0],
                  "```{data bin, format=\"binary\", encoding=\"base64\", "
                  "output.var=\"raw\", "
                  "md5sum=\"481e4551ec039aada760901cf52b1917\", echo=FALSE}");
        EXPECT_EQ(lines[1], "AP8Q");

        std::vector<Chunk> chunks;
        ASSERT_EQ(scan_chunks(lines, ScanOptions {}, &chunks, nullptr),
                  ChunkStatus::Ok);
        ASSERT_EQ(chunks.size(), 1U);
        DecodedChunk decoded;
        ASSERT_EQ(decode_chunk_payload(chunks[0], DecodeOptions {}, &decoded,
                                       nullptr),
                  ChunkStatus::Ok);
        EXPECT_EQ(decoded.bytes, payload);
        EXPECT_TRUE(decoded.checksum_verified);
        EXPECT_EQ(decoded.settings.output_var, "raw");
    }


    TEST(ChunkAssemble, FullHeaderInCanonicalOrder)
    {
        ChunkAssembleRequest r;
        r.label           = "d";
        r.output_var      = "df";
        r.output_file     = "out/d.csv";
        r.loader_function = "read.csv";
        r.echo            = true;
        r.eval            = "!file.exists(\"out/d.csv\")";
        r.extra_options   = "fig.cap=\"a, b\", max.echo=5";
        const std::vector<std::string> lines = assemble_ok(bytes_of("a,b\n1,2\n"),
                                                           r);
        ASSERT_EQ(lines.size(), 4U);
        EXPECT_EQ(lines[0],
                  "```{data d, format=\"text\", encoding=\"asis\", "
                  "output.var=\"df\", output.file=\"out/d.csv\", "
                  "loader.function=read.csv, echo=TRUE, max.echo=5, "
                  "eval=!file.exists(\"out/d.csv\"), fig.cap=\"a, b\"}");
        EXPECT_EQ(lines[1], "a,b");
        EXPECT_EQ(lines[2], "1,2");
    }


    TEST(ChunkAssemble, AutoSniffsBinary)
    {
        const std::vector<std::byte> payload = { std::byte { 0x89 },
                                                 std::byte { 'P' },
                                                 std::byte { 'N' },
                                                 std::byte { 'G' },
                                                 std::byte { 0x00 } };
        const std::vector<std::string> lines = assemble_ok(payload,
                                                           ChunkAssembleRequest {});
        EXPECT_EQ(lines[0], "```{data, format=\"binary\", encoding=\"base64\", "
                            "echo=FALSE}");
    }


    TEST(ChunkAssemble, AutoTreatsStrayInvalidUtf8AsBinary)
    {
        // One bad byte in mostly ASCII text stays under the sniff threshold.
        const std::vector<std::string> lines = assemble_ok(
            bytes_of("plain text with one \xFF byte\n"), ChunkAssembleRequest {});
        EXPECT_EQ(lines[0], "```{data, format=\"binary\", encoding=\"base64\", "
                            "echo=FALSE}");
    }


    TEST(ChunkAssemble, ExplicitBinaryFormatUsesBase64)
    {
        ChunkAssembleRequest r;
        r.format = PayloadFormat::Binary;
        const std::vector<std::string> lines = assemble_ok(bytes_of("hi"), r);
        ASSERT_EQ(lines.size(), 3U);
        EXPECT_EQ(lines[1], "aGk=");
    }


    TEST(ChunkAssemble, LoaderRequiresOutputVariable)
    {
        ChunkAssembleRequest r;
        r.loader_function = "read.csv";
        r.output_file     = "x.csv";
        ChunkError error;
        EXPECT_EQ(assemble_status("a", r, &error),
                  ChunkStatus::InvalidArguments);
        EXPECT_EQ(error.fragment, "loader.function");
    }


    TEST(ChunkAssemble, TextFormatRejectsBinaryPayload)
    {
        ChunkAssembleRequest r;
        r.format = PayloadFormat::Text;
        ChunkError error;
        EXPECT_EQ(assemble_status(std::string_view("a\0b", 3), r, &error),
                  ChunkStatus::InvalidEncodingChoice);

        ChunkAssembleRequest asis;
        asis.format   = PayloadFormat::Binary;
        asis.encoding = PayloadEncoding::Asis;
        EXPECT_EQ(assemble_status("\xFF\xFE\xFD", asis, &error),
                  ChunkStatus::InvalidEncodingChoice);
    }


    TEST(ChunkAssemble, RejectsIncoherentArguments)
    {
        ChunkError error;
        ChunkAssembleRequest r;

        r.label = "two words";
        EXPECT_EQ(assemble_status("a", r, &error),
                  ChunkStatus::InvalidArguments);

        r       = ChunkAssembleRequest {};
        r.eval  = "TRUE\nFALSE";
        EXPECT_EQ(assemble_status("a", r, &error),
                  ChunkStatus::InvalidArguments);

        r            = ChunkAssembleRequest {};
        r.output_var = "not a name";
        EXPECT_EQ(assemble_status("a", r, &error),
                  ChunkStatus::InvalidArguments);

        r               = ChunkAssembleRequest {};
        r.extra_options = "format=\"binary\"";
        EXPECT_EQ(assemble_status("a", r, &error),
                  ChunkStatus::InvalidArguments);
        EXPECT_EQ(error.fragment, "format");

        r               = ChunkAssembleRequest {};
        r.md5sum        = true;
        r.extra_options = "md5sum=\"00\"";
        EXPECT_EQ(assemble_status("a", r, &error),
                  ChunkStatus::InvalidArguments);
    }


    TEST(ChunkAssemble, UnparsableCodeIsMalformed)
    {
        ChunkError error;
        ChunkAssembleRequest r;
        r.extra_options = "loader.ops=list(header=FALSE";
        EXPECT_EQ(assemble_status("a", r, &error),
                  ChunkStatus::MalformedHeader);

        r      = ChunkAssembleRequest {};
        r.eval = "f(\"x)";
        EXPECT_EQ(assemble_status("a", r, &error),
                  ChunkStatus::MalformedHeader);
    }


    TEST(ChunkAssemble, FenceOutgrowsBodyBackticks)
    {
        const std::string text = "```{data inner}\nx\n```\n````\n";
        const std::vector<std::string> lines = assemble_ok(bytes_of(text),
                                                           ChunkAssembleRequest {});
        EXPECT_EQ(lines.front().substr(0, 6), "`````{");
        EXPECT_EQ(lines.back(), "`````");

        std::vector<Chunk> chunks;
        ASSERT_EQ(scan_chunks(lines, ScanOptions {}, &chunks, nullptr),
                  ChunkStatus::Ok);
        ASSERT_EQ(chunks.size(), 1U);
        DecodedChunk decoded;
        ASSERT_EQ(decode_chunk_payload(chunks[0], DecodeOptions {}, &decoded,
                                       nullptr),
                  ChunkStatus::Ok);
        EXPECT_EQ(decoded.bytes, bytes_of(text));
    }


    TEST(ChunkAssemble, OtherEngineName)
    {
        AssembleOptions options;
        options.engine            = "payload";
        options.encode.line_width = 4;
        std::vector<std::string> lines;
        ChunkAssembleRequest r;
        r.encoding = PayloadEncoding::Base64;
        ASSERT_EQ(assemble_chunk(bytes_of("hello"), r, options, &lines, nullptr),
                  ChunkStatus::Ok);
        EXPECT_EQ(lines.front().substr(0, 12), "```{payload,");
        EXPECT_EQ(lines.size(), 4U);

        options.engine = "bad engine";
        EXPECT_EQ(assemble_chunk(bytes_of("hello"), r, options, &lines, nullptr),
                  ChunkStatus::InvalidArguments);
    }


    // Assembling, inserting and re-scanning gives back exactly one new chunk
    // with the same options and payload.
    TEST(ChunkAssemble, AssembleInsertScanRoundTrip)
    {
        const std::vector<std::string> doc = {
            "# Doc", "```{data first}", "eA==", "```", "", "```{r}", "1",
            "```", "tail",
        };
        std::vector<Chunk> before;
        ASSERT_EQ(scan_chunks(doc, ScanOptions {}, &before, nullptr),
                  ChunkStatus::Ok);

        struct Case final {
            std::string payload;
            ChunkAssembleRequest request;
        };
        std::vector<Case> cases(4);
        cases[0].payload           = "x,y\n1,2\n";
        cases[0].request.label     = "csv";
        cases[0].request.output_var = "df";
        cases[0].request.loader_function = "read.csv";
        cases[0].request.md5sum    = true;
        cases[1].payload           = std::string("\x00\x01\x02\xFF", 4);
        cases[1].request.output_file = "blob.bin";
        cases[1].request.eval      = "!file.exists(\"blob.bin\")";
        cases[1].request.md5sum    = true;
        cases[2].payload           = "";
        cases[2].request.extra_options = "max.echo=2, loader.ops=list(a=1)";
        cases[2].request.output_var = "e";
        cases[3].payload           = "```\nnested\n```\n";
        cases[3].request.format    = PayloadFormat::Binary;
        cases[3].request.encoding  = PayloadEncoding::Base64;
        cases[3].request.echo      = true;

        for (const Case& c : cases) {
            const std::vector<std::byte> payload = bytes_of(c.payload);
            const std::vector<std::string> lines = assemble_ok(payload,
                                                               c.request);
            ChunkHeader header;
            ASSERT_EQ(parse_chunk_header(lines.front(), &header, nullptr),
                      ChunkStatus::Ok);

            for (int64_t pos = 0; pos <= static_cast<int64_t>(doc.size());
                 pos += 4) {
                DocumentLines merged;
                ASSERT_EQ(insert_chunk_lines(doc, pos, lines, &merged, nullptr,
                                             nullptr),
                          ChunkStatus::Ok);
                std::vector<Chunk> after;
                ASSERT_EQ(scan_chunks(merged, ScanOptions {}, &after, nullptr),
                          ChunkStatus::Ok);
                ASSERT_EQ(after.size(), before.size() + 1U);

                const Chunk* found = nullptr;
                for (const Chunk& k : after) {
                    if (k.range.start == static_cast<uint64_t>(pos)) {
                        found = &k;
                    }
                }
                ASSERT_NE(found, nullptr) << "pos=" << pos;
                EXPECT_EQ(found->options, header.options);
                EXPECT_EQ(found->range.size(), lines.size());

                DecodedChunk decoded;
                ASSERT_EQ(decode_chunk_payload(*found, DecodeOptions {},
                                               &decoded, nullptr),
                          ChunkStatus::Ok);
                EXPECT_EQ(decoded.bytes, payload);
            }
        }
    }


    static std::vector<Chunk> rescan(const std::vector<std::string>& lines)
    {
        DocumentLines reread;
        bool trailing = false;
        split_document_lines(join_document_lines(lines, true), &reread,
                             &trailing);
        std::vector<Chunk> chunks;
        ChunkError error;
        EXPECT_EQ(scan_chunks(reread, ScanOptions {}, &chunks, &error),
                  ChunkStatus::Ok)
            << format_chunk_error(error);
        return chunks;
    }


    TEST(ChunkAssemble, AsisChecksumCoversNormalizedText)
    {
        struct Case final {
            std::string_view payload;
            std::string_view decoded;
        };
        static constexpr Case kCases[] = {
            { "abc", "abc\n" },
            { "a\r\nb\r\n", "a\nb\n" },
            { "a\rb", "a\nb\n" },
            { "abc\n", "abc\n" },
        };
        for (const Case& c : kCases) {
            ChunkAssembleRequest r;
            r.output_var = "x";
            r.md5sum     = true;
            const std::vector<std::string> lines = assemble_ok(bytes_of(c.payload),
                                                               r);
            const std::vector<Chunk> chunks = rescan(lines);
            ASSERT_EQ(chunks.size(), 1U);

            std::string expected;
            ASSERT_TRUE(payload_digest_hex(bytes_of(c.decoded), &expected));
            ASSERT_NE(chunks[0].options.find("md5sum"), nullptr);
            EXPECT_EQ(*chunks[0].options.find("md5sum"), "\"" + expected + "\"");

            DecodedChunk decoded;
            ChunkError error;
            ASSERT_EQ(decode_chunk_payload(chunks[0], DecodeOptions {}, &decoded,
                                           &error),
                      ChunkStatus::Ok)
                << format_chunk_error(error);
            EXPECT_TRUE(decoded.checksum_verified);
            EXPECT_EQ(decoded.bytes, bytes_of(c.decoded));
        }
    }


    TEST(ChunkAssemble, LineBreaksInOutputFileStayInHeader)
    {
        for (std::string_view path : { "a\rb", "a\nb", "a\r\nb" }) {
            ChunkAssembleRequest r;
            r.output_file.assign(path.data(), path.size());
            const std::vector<std::string> lines = assemble_ok(bytes_of("v\n"),
                                                               r);
            ASSERT_EQ(lines.size(), 3U);
            EXPECT_EQ(lines[0].find_first_of("\r\n"), std::string::npos);

            const std::vector<Chunk> chunks = rescan(lines);
            ASSERT_EQ(chunks.size(), 1U);
            ChunkSettings settings;
            ASSERT_EQ(resolve_chunk_settings(chunks[0].options, &settings,
                                             nullptr),
                      ChunkStatus::Ok);
            EXPECT_EQ(settings.output_file, path);
        }
    }

}  // namespace
}  // namespace datachunk
