#include "datachunk/build_info.h"
#include "datachunk/chunk_assemble.h"
#include "datachunk/chunk_decode.h"
#include "datachunk/chunk_header.h"
#include "datachunk/chunk_options.h"
#include "datachunk/chunk_request.h"
#include "datachunk/chunk_scan.h"
#include "datachunk/console_format.h"
#include "datachunk/datachunk_policy.h"
#include "datachunk/document_splice.h"
#include "datachunk/document_text.h"
#include "datachunk/payload_codec.h"
#include "datachunk/payload_digest.h"

#include <cerrno>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace datachunk {
namespace {

    enum class ReadFileStatus : uint8_t {
        Ok,
        OpenFailed,
        IoFailed,
        TooLarge,
    };

    static ReadFileStatus read_file_bytes(const char* path,
                                          std::vector<std::byte>* out,
                                          uint64_t max_file_bytes,
                                          uint64_t* out_size)
    {
        out->clear();
        if (out_size) {
            *out_size = 0;
        }
        std::FILE* f = std::fopen(path, "rb");
        if (!f) {
            return ReadFileStatus::OpenFailed;
        }

        if (std::fseek(f, 0, SEEK_END) != 0) {
            std::fclose(f);
            return ReadFileStatus::IoFailed;
        }
        const long end = std::ftell(f);
        if (end < 0) {
            std::fclose(f);
            return ReadFileStatus::IoFailed;
        }
        if (std::fseek(f, 0, SEEK_SET) != 0) {
            std::fclose(f);
            return ReadFileStatus::IoFailed;
        }

        const uint64_t size_u64 = static_cast<uint64_t>(end);
        if (out_size) {
            *out_size = size_u64;
        }
        if (max_file_bytes != 0U && size_u64 > max_file_bytes) {
            std::fclose(f);
            return ReadFileStatus::TooLarge;
        }

        const size_t size = static_cast<size_t>(size_u64);
        out->resize(size);
        if (size != 0) {
            const size_t read = std::fread(out->data(), 1, size, f);
            if (read != size) {
                std::fclose(f);
                out->clear();
                return ReadFileStatus::IoFailed;
            }
        }
        std::fclose(f);
        return ReadFileStatus::Ok;
    }


    // Reads `path`, reporting failures on stderr.
    static bool load_file(const char* path, uint64_t max_file_bytes,
                          std::vector<std::byte>* out)
    {
        uint64_t file_size      = 0;
        const ReadFileStatus st = read_file_bytes(path, out, max_file_bytes,
                                                  &file_size);
        if (st == ReadFileStatus::Ok) {
            return true;
        }
        if (st == ReadFileStatus::TooLarge) {
            std::fprintf(
                stderr,
                "datachunk: refusing to read `%s` (size=%llu > --max-file-bytes=%llu)\n",
                path, static_cast<unsigned long long>(file_size),
                static_cast<unsigned long long>(max_file_bytes));
        } else if (st == ReadFileStatus::OpenFailed) {
            std::fprintf(stderr, "datachunk: failed to open `%s`\n", path);
        } else {
            std::fprintf(stderr, "datachunk: failed to read `%s`\n", path);
        }
        return false;
    }


    // Writes `bytes` to `path`, or stdout when `path` is null or "-".
    static bool write_output(const char* path, std::string_view bytes)
    {
        const bool to_stdout = !path || std::strcmp(path, "-") == 0;
        std::FILE* f         = to_stdout ? stdout : std::fopen(path, "wb");
        if (!f) {
            std::fprintf(stderr, "datachunk: failed to open `%s` for writing\n",
                         path);
            return false;
        }
        bool ok = bytes.empty()
                  || std::fwrite(bytes.data(), 1, bytes.size(), f)
                         == bytes.size();
        if (to_stdout) {
            ok = (std::fflush(f) == 0) && ok;
        } else {
            ok = (std::fclose(f) == 0) && ok;
        }
        if (!ok) {
            std::fprintf(stderr, "datachunk: failed to write `%s`\n",
                         to_stdout ? "<stdout>" : path);
        }
        return ok;
    }


    static std::string_view as_text(const std::vector<std::byte>& bytes) noexcept
    {
        return std::string_view(reinterpret_cast<const char*>(bytes.data()),
                                bytes.size());
    }


    static bool load_document(const char* path, uint64_t max_file_bytes,
                              DocumentLines* lines, bool* trailing_newline)
    {
        std::vector<std::byte> bytes;
        if (!load_file(path, max_file_bytes, &bytes)) {
            return false;
        }
        split_document_lines(as_text(bytes), lines, trailing_newline);
        return true;
    }


    static void print_chunk_error(const ChunkError& error)
    {
        std::string line;
        append_console_escaped_ascii(format_chunk_error(error), 0, &line);
        std::fprintf(stderr, "datachunk: %s\n", line.c_str());
    }


    static bool parse_u64_arg(const char* s, uint64_t* out)
    {
        // strtoull accepts a sign and leading blanks; require a digit.
        if (!s || *s < '0' || *s > '9') {
            return false;
        }
        errno                = 0;
        char* end            = nullptr;
        unsigned long long v = std::strtoull(s, &end, 10);
        if (!end || *end != '\0' || errno == ERANGE) {
            return false;
        }
        *out = static_cast<uint64_t>(v);
        return true;
    }


    static bool parse_u32_arg(const char* s, uint32_t* out)
    {
        uint64_t v = 0;
        if (!parse_u64_arg(s, &v) || v > 0xFFFFFFFFULL) {
            return false;
        }
        *out = static_cast<uint32_t>(v);
        return true;
    }


    static void usage(const char* argv0)
    {
        std::printf("usage: %s [options] <command> [args]\n", argv0);
        std::printf("commands:\n");
        std::printf("  list <doc>                         list data chunks\n");
        std::printf("  create [chunk-options] <data>      print a new data chunk\n");
        std::printf(
            "  insert [chunk-options] [--line N] [--out F] <doc> <data>\n"
            "                                     insert a new chunk before line N (default: end)\n");
        std::printf(
            "  remove [--out F] <doc> <sel>...    remove chunks; sel = label, #index or first:last\n");
        std::printf(
            "  extract [--out F] <doc> <sel>      decode a chunk (label, #index or first:last)\n");
        std::printf("options:\n");
        std::printf("  --version            print build info and exit\n");
        std::printf("  --engine NAME        chunk engine name (default: data)\n");
        std::printf("  --line-width N       base64 body line width (default: 76)\n");
        std::printf("  --no-verify          skip md5sum verification on extract\n");
        std::printf(
            "  --max-file-bytes N   refuse to read files larger than N bytes (default: 536870912; 0=unlimited)\n");
        std::printf("chunk-options:\n");
        std::printf("  --label L            chunk label\n");
        std::printf("  --format F           text|binary (default: sniffed)\n");
        std::printf("  --encoding E         asis|base64 (default: sniffed)\n");
        std::printf("  --output-var V       variable receiving the data\n");
        std::printf("  --output-file P      file receiving the data\n");
        std::printf("  --loader FN          loader function (guessed for .csv/.rds)\n");
        std::printf("  --eval EXPR          eval expression (default with --output-file: skip if the file exists)\n");
        std::printf("  --options STR        extra `key=value, ...` header options\n");
        std::printf("  --echo               echo chunk contents when rendered\n");
        std::printf("  --no-md5             do not store an md5sum\n");
    }


    static void print_build_info()
    {
        std::printf("%s\n", build_info_summary().c_str());
        std::printf("digest backend: %s\n",
                    std::string(digest_backend_version()).c_str());
    }


    // Returns 1 when argv[*i] (and possibly its value) was consumed, 0 when
    // it is not a chunk option, -1 on a bad value.
    static int parse_create_arg(int argc, char** argv, int* i,
                                ChunkRequestDraft* args)
    {
        const char* arg = argv[*i];
        if (std::strcmp(arg, "--echo") == 0) {
            args->request.echo = true;
            return 1;
        }
        if (std::strcmp(arg, "--no-md5") == 0) {
            args->request.md5sum = false;
            return 1;
        }
        if (*i + 1 >= argc) {
            return 0;
        }
        const char* value = argv[*i + 1];
        ChunkAssembleRequest& r = args->request;
        if (std::strcmp(arg, "--label") == 0) {
            r.label = value;
        } else if (std::strcmp(arg, "--format") == 0) {
            if (!parse_payload_format(value, &r.format)
                || r.format == PayloadFormat::Auto) {
                std::fprintf(stderr, "datachunk: invalid --format value\n");
                return -1;
            }
            args->have_format = true;
        } else if (std::strcmp(arg, "--encoding") == 0) {
            if (!parse_payload_encoding(value, &r.encoding)
                || r.encoding == PayloadEncoding::Auto) {
                std::fprintf(stderr, "datachunk: invalid --encoding value\n");
                return -1;
            }
            args->have_encoding = true;
        } else if (std::strcmp(arg, "--output-var") == 0) {
            r.output_var = value;
        } else if (std::strcmp(arg, "--output-file") == 0) {
            r.output_file = value;
        } else if (std::strcmp(arg, "--loader") == 0) {
            r.loader_function = value;
            args->have_loader = true;
        } else if (std::strcmp(arg, "--eval") == 0) {
            r.eval          = value;
            args->have_eval = true;
        } else if (std::strcmp(arg, "--options") == 0) {
            r.extra_options = value;
        } else {
            return 0;
        }
        *i += 1;
        return 1;
    }


    // Applies the front-end defaults and checks. Returns the exit code on
    // failure, 0 on success.
    static int prepare_chunk(const char* data_path, const DatachunkPolicy& policy,
                             ChunkRequestDraft* args,
                             std::vector<std::byte>* payload)
    {
        ChunkError error;
        if (check_chunk_targets(args->request, &error) != ChunkStatus::Ok) {
            print_chunk_error(error);
            return 2;
        }
        if (!load_file(data_path, policy.max_payload_bytes, payload)) {
            return 1;
        }
        if (apply_chunk_request_defaults(*payload, data_path, policy.sniff, args,
                                         &error)
            != ChunkStatus::Ok) {
            print_chunk_error(error);
            return 2;
        }
        return 0;
    }


    static bool assemble(const std::vector<std::byte>& payload,
                         const ChunkRequestDraft& args,
                         const DatachunkPolicy& policy,
                         std::vector<std::string>* lines)
    {
        AssembleOptions options;
        apply_policy(policy, &options);
        ChunkError error;
        if (assemble_chunk(payload, args.request, options, lines, &error)
            != ChunkStatus::Ok) {
            print_chunk_error(error);
            return false;
        }
        return true;
    }


    static bool scan_document(std::span<const std::string> lines,
                              const DatachunkPolicy& policy,
                              std::vector<Chunk>* chunks)
    {
        ScanOptions options;
        apply_policy(policy, &options);
        ChunkError error;
        if (scan_chunks(lines, options, chunks, &error) != ChunkStatus::Ok) {
            print_chunk_error(error);
            return false;
        }
        return true;
    }


    static bool pick_chunks(std::span<const Chunk> chunks, const char* text,
                            std::vector<size_t>* picked)
    {
        ChunkSelector selector;
        ChunkError error;
        if (parse_chunk_selector(text, &selector, &error) != ChunkStatus::Ok
            || select_chunks(chunks, selector, picked, &error)
                   != ChunkStatus::Ok) {
            print_chunk_error(error);
            return false;
        }
        return true;
    }


    static int cmd_list(int argc, char** argv, int argi,
                        const DatachunkPolicy& policy)
    {
        if (argi + 1 != argc) {
            usage(argv[0]);
            return 2;
        }
        DocumentLines lines;
        bool trailing = false;
        if (!load_document(argv[argi], policy.max_payload_bytes, &lines,
                           &trailing)) {
            return 1;
        }
        std::vector<Chunk> chunks;
        if (!scan_document(lines, policy, &chunks)) {
            return 1;
        }

        for (size_t i = 0; i < chunks.size(); ++i) {
            const Chunk& c = chunks[i];
            std::string line;
            line.append("#");
            line.append(std::to_string(i + 1U));
            line.append(" lines=");
            append_line_range(c.range, &line);
            line.append(" label=");
            append_console_escaped_ascii(c.label, 64, &line);
            if (c.label_synthesized) {
                line.append(" (unnamed)");
            }
            for (const ChunkOption& o : c.options.entries()) {
                line.append(" ");
                append_console_escaped_ascii(o.key, 64, &line);
                line.append("=");
                append_console_escaped_ascii(o.value, 64, &line);
            }
            line.append(" body_lines=");
            line.append(std::to_string(c.body_lines.size()));
            std::printf("%s\n", line.c_str());
        }
        return 0;
    }


    static int cmd_create(int argc, char** argv, int argi,
                          const DatachunkPolicy& policy)
    {
        ChunkRequestDraft args;
        args.request.md5sum = true;
        for (; argi < argc; ++argi) {
            const int r = parse_create_arg(argc, argv, &argi, &args);
            if (r < 0) {
                return 2;
            }
            if (r == 0) {
                break;
            }
        }
        if (argi + 1 != argc) {
            std::fprintf(stderr, "datachunk: a data file must be given\n");
            return 2;
        }

        std::vector<std::byte> payload;
        const int rc = prepare_chunk(argv[argi], policy, &args, &payload);
        if (rc != 0) {
            return rc;
        }
        std::vector<std::string> lines;
        if (!assemble(payload, args, policy, &lines)) {
            return 1;
        }
        return write_output(nullptr, join_document_lines(lines, true)) ? 0 : 1;
    }


    static int cmd_insert(int argc, char** argv, int argi,
                          const DatachunkPolicy& policy)
    {
        ChunkRequestDraft args;
        args.request.md5sum = true;
        int64_t position    = INT64_MAX;
        const char* out     = nullptr;
        for (; argi < argc; ++argi) {
            if (std::strcmp(argv[argi], "--line") == 0 && argi + 1 < argc) {
                uint64_t index = 0;
                ChunkError error;
                if (parse_line_number(argv[argi + 1], &index, &error)
                    != ChunkStatus::Ok) {
                    print_chunk_error(error);
                    return 2;
                }
                position = static_cast<int64_t>(index);
                argi += 1;
                continue;
            }
            if (std::strcmp(argv[argi], "--out") == 0 && argi + 1 < argc) {
                out = argv[argi + 1];
                argi += 1;
                continue;
            }
            const int r = parse_create_arg(argc, argv, &argi, &args);
            if (r < 0) {
                return 2;
            }
            if (r == 0) {
                break;
            }
        }
        if (argi + 2 != argc) {
            std::fprintf(stderr,
                         "datachunk: a document and a data file must be given\n");
            return 2;
        }

        DocumentLines doc;
        bool trailing = true;
        if (!load_document(argv[argi], policy.max_payload_bytes, &doc,
                           &trailing)) {
            return 1;
        }
        std::vector<std::byte> payload;
        const int rc = prepare_chunk(argv[argi + 1], policy, &args, &payload);
        if (rc != 0) {
            return rc;
        }
        std::vector<std::string> chunk_lines;
        if (!assemble(payload, args, policy, &chunk_lines)) {
            return 1;
        }

        DocumentLines result;
        uint64_t cursor = kNoLine;
        ChunkError error;
        if (insert_chunk_lines(doc, position, chunk_lines, &result, &cursor,
                               &error)
            != ChunkStatus::Ok) {
            print_chunk_error(error);
            return 1;
        }
        if (!write_output(out, join_document_lines(result, trailing || doc.empty()))) {
            return 1;
        }
        std::fprintf(stderr, "datachunk: inserted %zu lines, cursor line %llu\n",
                     chunk_lines.size(),
                     static_cast<unsigned long long>(cursor + 1U));
        return 0;
    }


    static int cmd_remove(int argc, char** argv, int argi,
                          const DatachunkPolicy& policy)
    {
        const char* out = nullptr;
        if (argi + 1 < argc && std::strcmp(argv[argi], "--out") == 0) {
            out = argv[argi + 1];
            argi += 2;
        }
        if (argi + 2 > argc) {
            usage(argv[0]);
            return 2;
        }

        DocumentLines doc;
        bool trailing = false;
        if (!load_document(argv[argi], policy.max_payload_bytes, &doc,
                           &trailing)) {
            return 1;
        }
        std::vector<Chunk> chunks;
        if (!scan_document(doc, policy, &chunks)) {
            return 1;
        }

        std::vector<size_t> picked;
        for (int i = argi + 1; i < argc; ++i) {
            if (!pick_chunks(chunks, argv[i], &picked)) {
                return 1;
            }
        }

        std::vector<LineRange> ranges;
        DocumentLines result;
        uint64_t cursor = kNoLine;
        ChunkError error;
        if (collect_chunk_ranges(chunks, picked, &ranges, &error)
                != ChunkStatus::Ok
            || remove_chunk_ranges(doc, ranges, &result, &cursor, &error)
                   != ChunkStatus::Ok) {
            print_chunk_error(error);
            return 1;
        }
        if (!write_output(out, join_document_lines(result, trailing))) {
            return 1;
        }
        if (cursor == kNoLine) {
            std::fprintf(stderr, "datachunk: nothing removed\n");
        } else {
            std::fprintf(stderr,
                         "datachunk: removed %zu lines, cursor line %llu\n",
                         doc.size() - result.size(),
                         static_cast<unsigned long long>(cursor + 1U));
        }
        return 0;
    }


    static int cmd_extract(int argc, char** argv, int argi,
                           const DatachunkPolicy& policy)
    {
        const char* out = nullptr;
        if (argi + 1 < argc && std::strcmp(argv[argi], "--out") == 0) {
            out = argv[argi + 1];
            argi += 2;
        }
        if (argi + 2 != argc) {
            usage(argv[0]);
            return 2;
        }

        DocumentLines doc;
        bool trailing = false;
        if (!load_document(argv[argi], policy.max_payload_bytes, &doc,
                           &trailing)) {
            return 1;
        }
        std::vector<Chunk> chunks;
        if (!scan_document(doc, policy, &chunks)) {
            return 1;
        }
        std::vector<size_t> picked;
        if (!pick_chunks(chunks, argv[argi + 1], &picked)) {
            return 1;
        }
        if (picked.empty()) {
            std::fprintf(stderr, "datachunk: no chunk in selection\n");
            return 1;
        }
        const size_t index = picked.front();

        DecodeOptions options;
        apply_policy(policy, &options);
        DecodedChunk decoded;
        ChunkError error;
        if (decode_chunk_payload(chunks[index], options, &decoded, &error)
            != ChunkStatus::Ok) {
            print_chunk_error(error);
            return 1;
        }
        if (!write_output(out, as_text(decoded.bytes))) {
            return 1;
        }
        if (out) {
            std::string size;
            append_byte_size(decoded.bytes.size(), &size);
            std::printf("%s%s\n", size.c_str(),
                        decoded.checksum_verified ? " (md5sum ok)" : "");
        }
        return 0;
    }

}  // namespace
}  // namespace datachunk

int
main(int argc, char** argv)
{
    using namespace datachunk;

    DatachunkPolicy policy;
    policy.max_payload_bytes = 512ULL * 1024ULL * 1024ULL;

    int i = 1;
    for (; i < argc; ++i) {
        const char* arg = argv[i];
        if (std::strcmp(arg, "--help") == 0) {
            usage(argv[0]);
            return 0;
        }
        if (std::strcmp(arg, "--version") == 0) {
            print_build_info();
            return 0;
        }
        if (std::strcmp(arg, "--no-verify") == 0) {
            policy.verify_checksum = false;
            continue;
        }
        if (std::strcmp(arg, "--engine") == 0 && i + 1 < argc) {
            policy.engine = argv[i + 1];
            i += 1;
            continue;
        }
        if (std::strcmp(arg, "--line-width") == 0 && i + 1 < argc) {
            uint32_t v = 0;
            if (!parse_u32_arg(argv[i + 1], &v)) {
                std::fprintf(stderr, "invalid --line-width value\n");
                return 2;
            }
            policy.base64_line_width = v;
            i += 1;
            continue;
        }
        if (std::strcmp(arg, "--max-file-bytes") == 0 && i + 1 < argc) {
            uint64_t v = 0;
            if (!parse_u64_arg(argv[i + 1], &v)) {
                std::fprintf(stderr, "invalid --max-file-bytes value\n");
                return 2;
            }
            policy.max_payload_bytes = v;
            i += 1;
            continue;
        }
        break;
    }

    if (i >= argc) {
        usage(argv[0]);
        return 2;
    }
    const char* command = argv[i];
    if (std::strcmp(command, "list") == 0) {
        return cmd_list(argc, argv, i + 1, policy);
    }
    if (std::strcmp(command, "create") == 0) {
        return cmd_create(argc, argv, i + 1, policy);
    }
    if (std::strcmp(command, "insert") == 0) {
        return cmd_insert(argc, argv, i + 1, policy);
    }
    if (std::strcmp(command, "remove") == 0) {
        return cmd_remove(argc, argv, i + 1, policy);
    }
    if (std::strcmp(command, "extract") == 0) {
        return cmd_extract(argc, argv, i + 1, policy);
    }
    std::fprintf(stderr, "datachunk: unknown command `%s`\n", command);
    usage(argv[0]);
    return 2;
}
