#include "datachunk/build_info.h"
#include "datachunk/chunk_assemble.h"
#include "datachunk/chunk_decode.h"
#include "datachunk/chunk_header.h"
#include "datachunk/chunk_scan.h"
#include "datachunk/console_format.h"
#include "datachunk/datachunk_policy.h"
#include "datachunk/document_splice.h"
#include "datachunk/document_text.h"
#include "datachunk/payload_codec.h"
#include "datachunk/payload_digest.h"

#include <nanobind/nanobind.h>
#include <nanobind/stl/pair.h>
#include <nanobind/stl/string.h>
#include <nanobind/stl/vector.h>

#include <cstddef>
#include <cstdint>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace nb = nanobind;
using namespace nb::literals;

namespace datachunk {
namespace {

    static nb::str sv_to_py(std::string_view s)
    {
        return nb::str(s.data(), s.size());
    }


    static std::span<const std::byte> bytes_view(const nb::bytes& b) noexcept
    {
        return std::span<const std::byte>(
            reinterpret_cast<const std::byte*>(b.c_str()), b.size());
    }


    static nb::bytes bytes_to_py(const std::vector<std::byte>& v)
    {
        return nb::bytes(reinterpret_cast<const char*>(v.data()), v.size());
    }


    static void throw_chunk_error(const ChunkError& error)
    {
        if (error.status == ChunkStatus::InvalidArguments
            || error.status == ChunkStatus::InvalidPosition) {
            throw nb::value_error(format_chunk_error(error).c_str());
        }
        throw std::runtime_error(format_chunk_error(error));
    }


    static void check(ChunkStatus status, const ChunkError& error)
    {
        if (status != ChunkStatus::Ok) {
            throw_chunk_error(error);
        }
    }


    static nb::dict options_to_py(const ChunkOptions& options)
    {
        nb::dict d;
        for (const ChunkOption& o : options.entries()) {
            d[sv_to_py(o.key)] = sv_to_py(o.value);
        }
        return d;
    }


    static ChunkOptions options_from_py(const nb::dict& d)
    {
        ChunkOptions options;
        for (auto item : d) {
            options.set(nb::cast<std::string>(item.first),
                        nb::cast<std::string>(item.second));
        }
        return options;
    }


    static std::vector<Chunk> scan(const std::vector<std::string>& lines,
                                   const DatachunkPolicy& policy)
    {
        ScanOptions options;
        apply_policy(policy, &options);
        std::vector<Chunk> chunks;
        ChunkError error;
        check(scan_chunks(lines, options, &chunks, &error), error);
        return chunks;
    }


    static std::vector<std::string>
    assemble(const nb::bytes& payload, const ChunkAssembleRequest& request,
             const DatachunkPolicy& policy)
    {
        AssembleOptions options;
        apply_policy(policy, &options);
        std::vector<std::string> lines;
        ChunkError error;
        check(assemble_chunk(bytes_view(payload), request, options, &lines,
                             &error),
              error);
        return lines;
    }


    static nb::bytes decode_chunk(const Chunk& chunk,
                                  const DatachunkPolicy& policy)
    {
        DecodeOptions options;
        apply_policy(policy, &options);
        DecodedChunk decoded;
        ChunkError error;
        check(decode_chunk_payload(chunk, options, &decoded, &error), error);
        return bytes_to_py(decoded.bytes);
    }


    static std::pair<std::vector<std::string>, uint64_t>
    insert(const std::vector<std::string>& document, int64_t position,
           const std::vector<std::string>& chunk_lines)
    {
        DocumentLines out;
        uint64_t cursor = kNoLine;
        ChunkError error;
        check(insert_chunk_lines(document, position, chunk_lines, &out,
                                 &cursor, &error),
              error);
        return { std::move(out), cursor };
    }


    // Returns (lines, first removed line or None).
    static std::pair<std::vector<std::string>, nb::object>
    remove(const std::vector<std::string>& document,
           const std::vector<std::pair<uint64_t, uint64_t>>& ranges)
    {
        std::vector<LineRange> rs;
        rs.reserve(ranges.size());
        for (const auto& r : ranges) {
            rs.push_back(LineRange { r.first, r.second });
        }
        DocumentLines out;
        uint64_t first = kNoLine;
        ChunkError error;
        check(remove_chunk_ranges(document, rs, &out, &first, &error), error);
        nb::object pos = nb::none();
        if (first != kNoLine) {
            pos = nb::int_(first);
        }
        return { std::move(out), pos };
    }


    static std::string console_text(const std::string& s, uint32_t max_bytes)
    {
        std::string out;
        append_console_escaped_ascii(s, max_bytes, &out);
        return out;
    }

}  // namespace
}  // namespace datachunk

NB_MODULE(_datachunk, m)
{
    using namespace datachunk;

    m.doc()               = "Data chunk codec and document splicing (nanobind).";
    m.attr("__version__") = sv_to_py(build_info().version);

    nb::enum_<ChunkStatus>(m, "ChunkStatus")
        .value("Ok", ChunkStatus::Ok)
        .value("InvalidEncodingChoice", ChunkStatus::InvalidEncodingChoice)
        .value("CorruptPayload", ChunkStatus::CorruptPayload)
        .value("ChecksumMismatch", ChunkStatus::ChecksumMismatch)
        .value("MalformedHeader", ChunkStatus::MalformedHeader)
        .value("UnterminatedChunk", ChunkStatus::UnterminatedChunk)
        .value("InvalidArguments", ChunkStatus::InvalidArguments)
        .value("InvalidPosition", ChunkStatus::InvalidPosition);

    nb::enum_<PayloadFormat>(m, "PayloadFormat")
        .value("Auto", PayloadFormat::Auto)
        .value("Text", PayloadFormat::Text)
        .value("Binary", PayloadFormat::Binary);

    nb::enum_<PayloadEncoding>(m, "PayloadEncoding")
        .value("Auto", PayloadEncoding::Auto)
        .value("Asis", PayloadEncoding::Asis)
        .value("Base64", PayloadEncoding::Base64);

    nb::class_<SniffOptions>(m, "SniffOptions")
        .def(nb::init<>())
        .def_rw("sample_bytes", &SniffOptions::sample_bytes)
        .def_rw("max_nontext_percent", &SniffOptions::max_nontext_percent);

    nb::class_<DatachunkPolicy>(m, "DatachunkPolicy")
        .def(nb::init<>())
        .def_rw("engine", &DatachunkPolicy::engine)
        .def_rw("sniff", &DatachunkPolicy::sniff)
        .def_rw("base64_line_width", &DatachunkPolicy::base64_line_width)
        .def_rw("verify_checksum", &DatachunkPolicy::verify_checksum)
        .def_rw("max_payload_bytes", &DatachunkPolicy::max_payload_bytes);

    nb::class_<ChunkAssembleRequest>(m, "ChunkAssembleRequest")
        .def(nb::init<>())
        .def_rw("label", &ChunkAssembleRequest::label)
        .def_rw("format", &ChunkAssembleRequest::format)
        .def_rw("encoding", &ChunkAssembleRequest::encoding)
        .def_rw("extra_options", &ChunkAssembleRequest::extra_options)
        .def_rw("output_var", &ChunkAssembleRequest::output_var)
        .def_rw("output_file", &ChunkAssembleRequest::output_file)
        .def_rw("loader_function", &ChunkAssembleRequest::loader_function)
        .def_rw("md5sum", &ChunkAssembleRequest::md5sum)
        .def_rw("echo", &ChunkAssembleRequest::echo)
        .def_rw("eval", &ChunkAssembleRequest::eval);

    nb::class_<Chunk>(m, "Chunk")
        .def_ro("engine", &Chunk::engine)
        .def_ro("label", &Chunk::label)
        .def_ro("label_synthesized", &Chunk::label_synthesized)
        .def_ro("header_line", &Chunk::header_line)
        .def_ro("body_lines", &Chunk::body_lines)
        .def_prop_ro("options",
                     [](const Chunk& c) { return options_to_py(c.options); })
        .def_prop_ro("start", [](const Chunk& c) { return c.range.start; })
        .def_prop_ro("end", [](const Chunk& c) { return c.range.end; });

    m.def(
        "is_binary",
        [](const nb::bytes& data, const SniffOptions& options) {
            return is_binary(bytes_view(data), options);
        },
        "data"_a, "options"_a = SniffOptions {});

    m.def(
        "encode",
        [](const nb::bytes& data, PayloadEncoding encoding,
           uint32_t line_width) {
            EncodeOptions options;
            options.line_width = line_width;
            std::vector<std::string> lines;
            ChunkError error;
            check(encode_payload(bytes_view(data), encoding, options, &lines,
                                 &error),
                  error);
            return lines;
        },
        "data"_a, "encoding"_a = PayloadEncoding::Auto,
        "line_width"_a = 76U);

    m.def(
        "decode",
        [](const std::vector<std::string>& lines, PayloadEncoding encoding) {
            std::vector<std::byte> out;
            ChunkError error;
            check(decode_payload(lines, encoding, &out, &error), error);
            return bytes_to_py(out);
        },
        "lines"_a, "encoding"_a);

    m.def(
        "checksum",
        [](const nb::bytes& data) {
            std::string hex;
            if (!payload_digest_hex(bytes_view(data), &hex)) {
                throw std::runtime_error("digest backend failure");
            }
            return hex;
        },
        "data"_a);

    m.def(
        "verify",
        [](const nb::bytes& data, const std::string& expected) {
            return verify_payload_digest(bytes_view(data), expected, nullptr)
                   == ChunkStatus::Ok;
        },
        "data"_a, "expected"_a);

    m.def(
        "parse_header",
        [](const std::string& line) {
            ChunkHeader header;
            ChunkError error;
            check(parse_chunk_header(line, &header, &error), error);
            nb::dict d;
            d["engine"]  = sv_to_py(header.engine);
            d["label"]   = sv_to_py(header.label);
            d["options"] = options_to_py(header.options);
            return d;
        },
        "line"_a);

    m.def(
        "serialize_header",
        [](const std::string& engine, const std::string& label,
           const nb::dict& options) {
            return serialize_chunk_header(engine, label,
                                          options_from_py(options));
        },
        "engine"_a, "label"_a, "options"_a);

    m.def("split_lines", [](const std::string& text) {
        DocumentLines lines;
        bool trailing = false;
        split_document_lines(text, &lines, &trailing);
        return std::make_pair(std::move(lines), trailing);
    });
    m.def("join_lines", [](const std::vector<std::string>& lines,
                           bool trailing_newline) {
        return join_document_lines(lines, trailing_newline);
    });

    m.def("scan", &scan, "lines"_a, "policy"_a = DatachunkPolicy {});
    m.def("assemble", &assemble, "payload"_a, "request"_a,
          "policy"_a = DatachunkPolicy {});
    m.def("decode_chunk", &decode_chunk, "chunk"_a,
          "policy"_a = DatachunkPolicy {});
    m.def("insert", &insert, "document"_a, "position"_a, "chunk_lines"_a);
    m.def("remove", &remove, "document"_a, "ranges"_a);
    m.def(
        "find_chunks_in_selection",
        [](const std::vector<Chunk>& chunks, uint64_t first, uint64_t last) {
            return find_chunks_in_selection(chunks, first, last);
        },
        "chunks"_a, "first_line"_a, "last_line"_a);

    m.def("console_text", &console_text, "data"_a, "max_bytes"_a = 4096U);
    m.def("digest_backend_version",
          []() { return sv_to_py(digest_backend_version()); });
    m.def("build_info", []() { return build_info_summary(); });
}
