#include "datachunk/chunk_header.h"

#include "text_internal.h"

#include <vector>

namespace datachunk {
namespace {

    using text_internal::trim_blank;

    struct Fragment final {
        std::string_view text;
        /// Offset of the first top-level '=' in `text`, or npos.
        size_t eq = std::string_view::npos;
    };

    static ChunkStatus malformed(ChunkError* error, std::string_view fragment,
                                 std::string_view message) noexcept
    {
        if (error) {
            error->fragment.assign(fragment.data(), fragment.size());
        }
        return set_chunk_error(error, ChunkStatus::MalformedHeader, message);
    }


    static bool is_open_bracket(char c) noexcept
    {
        return c == '(' || c == '[' || c == '{';
    }


    static bool is_close_bracket(char c) noexcept
    {
        return c == ')' || c == ']' || c == '}';
    }


    static char matching_open(char c) noexcept
    {
        return c == ')' ? '(' : (c == ']' ? '[' : '{');
    }


    // Splits `list` at top-level commas, honoring quotes and brackets.
    static ChunkStatus split_fragments(std::string_view list,
                                       std::vector<Fragment>* out,
                                       ChunkError* error)
    {
        std::vector<char> brackets;
        char quote       = 0;
        size_t start     = 0;
        size_t eq        = std::string_view::npos;
        const size_t end = list.size();

        for (size_t i = 0; i <= end; ++i) {
            if (i == end || (list[i] == ',' && quote == 0 && brackets.empty())) {
                if (i == end && (quote != 0 || !brackets.empty())) {
                    return malformed(error, trim_blank(list.substr(start)),
                                     quote != 0 ? "unbalanced quote"
                                                : "unbalanced bracket");
                }
                const std::string_view raw = list.substr(start, i - start);
                const std::string_view text = trim_blank(raw);
                Fragment f;
                f.text = text;
                if (eq != std::string_view::npos) {
                    const size_t lead = static_cast<size_t>(text.data()
                                                            - raw.data());
                    f.eq = eq - start - lead;
                }
                out->push_back(f);
                start = i + 1;
                eq    = std::string_view::npos;
                continue;
            }

            const char c = list[i];
            if (quote != 0) {
                if (c == '\\' && i + 1 < end) {
                    i += 1;
                } else if (c == quote) {
                    quote = 0;
                }
                continue;
            }
            if (c == '"' || c == '\'' || c == '`') {
                quote = c;
                continue;
            }
            if (is_open_bracket(c)) {
                brackets.push_back(c);
                continue;
            }
            if (is_close_bracket(c)) {
                if (brackets.empty() || brackets.back() != matching_open(c)) {
                    return malformed(error, trim_blank(list.substr(start)),
                                     "unbalanced bracket");
                }
                brackets.pop_back();
                continue;
            }
            if (c == '=' && brackets.empty() && eq == std::string_view::npos) {
                eq = i;
            }
        }
        return ChunkStatus::Ok;
    }


    static ChunkStatus parse_label(std::string_view text, std::string* out,
                                   ChunkError* error)
    {
        if (text.front() == '"' || text.front() == '\'') {
            if (!option_string_value(text, out)) {
                return malformed(error, text, "bad quoted label");
            }
            return ChunkStatus::Ok;
        }
        for (char c : text) {
            if (text_internal::is_blank(c) || c == '"' || c == '\'') {
                return malformed(error, text,
                                 "label must be a single token");
            }
        }
        out->assign(text.data(), text.size());
        return ChunkStatus::Ok;
    }


    static ChunkStatus parse_fragments(std::string_view list, bool allow_label,
                                       std::string* label, ChunkOptions* out,
                                       ChunkError* error)
    {
        list = trim_blank(list);
        if (list.empty()) {
            return ChunkStatus::Ok;
        }

        std::vector<Fragment> fragments;
        const ChunkStatus st = split_fragments(list, &fragments, error);
        if (st != ChunkStatus::Ok) {
            return st;
        }

        for (size_t i = 0; i < fragments.size(); ++i) {
            const Fragment& f = fragments[i];
            if (f.text.empty()) {
                return malformed(error, list, "empty option");
            }
            if (f.eq == std::string_view::npos) {
                if (i == 0U && allow_label) {
                    const ChunkStatus lst = parse_label(f.text, label, error);
                    if (lst != ChunkStatus::Ok) {
                        return lst;
                    }
                    continue;
                }
                return malformed(error, f.text, "option without '='");
            }

            const std::string_view key   = trim_blank(f.text.substr(0, f.eq));
            const std::string_view value = trim_blank(f.text.substr(f.eq + 1));
            if (!text_internal::is_name(key)) {
                return malformed(error, f.text, "bad option name");
            }
            if (value.empty()) {
                return malformed(error, f.text, "empty option value");
            }
            if (out->contains(key)) {
                return malformed(error, f.text, "duplicate option");
            }
            out->set(key, value);
        }
        return ChunkStatus::Ok;
    }


    static void append_option(std::string* out, const ChunkOption& e)
    {
        out->append(e.key);
        out->push_back('=');
        out->append(e.value);
    }

}  // namespace

bool
is_chunk_header_line(std::string_view line, FenceInfo* out) noexcept
{
    const size_t indent = text_internal::indent_width(line);
    const size_t ticks  = text_internal::leading_backtick_run(line);
    if (ticks < kMinFenceBackticks) {
        return false;
    }
    size_t i = indent + ticks;
    while (i < line.size() && text_internal::is_blank(line[i])) {
        i += 1;
    }
    if (i >= line.size() || line[i] != '{') {
        return false;
    }
    if (out) {
        out->indent    = indent;
        out->backticks = ticks;
    }
    return true;
}


bool
is_plain_fence_line(std::string_view line, size_t min_backticks,
                    FenceInfo* out) noexcept
{
    const size_t indent = text_internal::indent_width(line);
    const size_t ticks  = text_internal::leading_backtick_run(line);
    if (ticks < min_backticks || ticks < kMinFenceBackticks) {
        return false;
    }
    const std::string_view info = trim_blank(line.substr(indent + ticks));
    if (!info.empty() && info.front() == '{') {
        return false;
    }
    // CommonMark: a backtick fence's info string cannot contain backticks.
    if (info.find('`') != std::string_view::npos) {
        return false;
    }
    if (out) {
        out->indent    = indent;
        out->backticks = ticks;
    }
    return true;
}


bool
is_closing_fence(std::string_view line, size_t min_backticks) noexcept
{
    const size_t indent = text_internal::indent_width(line);
    const size_t ticks  = text_internal::leading_backtick_run(line);
    if (ticks < min_backticks || ticks < kMinFenceBackticks) {
        return false;
    }
    return trim_blank(line.substr(indent + ticks)).empty();
}


ChunkStatus
parse_chunk_header(std::string_view line, ChunkHeader* out,
                   ChunkError* error) noexcept
{
    if (!out) {
        return set_chunk_error(error, ChunkStatus::InvalidArguments,
                               "null header output");
    }
    out->engine.clear();
    out->label.clear();
    out->options.clear();

    FenceInfo fence;
    if (!is_chunk_header_line(line, &fence)) {
        return malformed(error, trim_blank(line), "missing chunk fence");
    }

    const std::string_view body = trim_blank(
        line.substr(fence.indent + fence.backticks));
    if (body.size() < 2U || body.back() != '}') {
        return malformed(error, body, "header must end with '}'");
    }
    const std::string_view inner = body.substr(1, body.size() - 2U);

    size_t i = 0;
    while (i < inner.size() && text_internal::is_blank(inner[i])) {
        i += 1;
    }
    const size_t engine_begin = i;
    while (i < inner.size() && text_internal::is_name_char(inner[i])) {
        i += 1;
    }
    if (i == engine_begin) {
        return malformed(error, body, "missing engine name");
    }
    out->engine.assign(inner.data() + engine_begin, i - engine_begin);

    std::string_view rest = inner.substr(i);
    if (!rest.empty() && !text_internal::is_blank(rest.front())
        && rest.front() != ',') {
        return malformed(error, body, "bad engine name");
    }
    rest = trim_blank(rest);
    if (!rest.empty() && rest.front() == ',') {
        rest.remove_prefix(1);
    }

    return parse_fragments(rest, true, &out->label, &out->options, error);
}


ChunkStatus
parse_chunk_option_list(std::string_view list, ChunkOptions* out,
                        ChunkError* error) noexcept
{
    if (!out) {
        return set_chunk_error(error, ChunkStatus::InvalidArguments,
                               "null options output");
    }
    return parse_fragments(list, false, nullptr, out, error);
}


std::string
serialize_chunk_header(std::string_view engine, std::string_view label,
                       const ChunkOptions& options)
{
    std::string out;
    out.reserve(64);
    out.push_back('{');
    out.append(engine);
    if (!label.empty()) {
        out.push_back(' ');
        out.append(label);
    }

    for (const std::string_view key : canonical_option_keys()) {
        for (const ChunkOption& e : options.entries()) {
            if (e.key == key) {
                out.append(", ");
                append_option(&out, e);
            }
        }
    }
    for (const ChunkOption& e : options.entries()) {
        if (canonical_option_rank(e.key) < 0) {
            out.append(", ");
            append_option(&out, e);
        }
    }
    out.push_back('}');
    return out;
}


std::string
make_fence(size_t backticks)
{
    return std::string(backticks, '`');
}

}  // namespace datachunk
