#include "datachunk/document_text.h"

namespace datachunk {

void
split_document_lines(std::string_view text, DocumentLines* out,
                     bool* out_trailing_newline)
{
    if (out_trailing_newline) {
        *out_trailing_newline = false;
    }
    if (!out) {
        return;
    }
    out->clear();

    size_t start = 0;
    size_t i     = 0;
    while (i < text.size()) {
        const char c = text[i];
        if (c != '\n' && c != '\r') {
            i += 1;
            continue;
        }
        out->emplace_back(text.substr(start, i - start));
        if (c == '\r' && i + 1 < text.size() && text[i + 1] == '\n') {
            i += 1;
        }
        i += 1;
        start = i;
    }
    if (start < text.size()) {
        out->emplace_back(text.substr(start));
    } else if (!text.empty() && out_trailing_newline) {
        *out_trailing_newline = true;
    }
}


std::string
join_document_lines(std::span<const std::string> lines, bool trailing_newline)
{
    size_t total = 0;
    for (const std::string& line : lines) {
        total += line.size() + 1U;
    }
    std::string out;
    out.reserve(total);
    for (size_t i = 0; i < lines.size(); ++i) {
        if (i != 0U) {
            out.push_back('\n');
        }
        out.append(lines[i]);
    }
    if (trailing_newline && !lines.empty()) {
        out.push_back('\n');
    }
    return out;
}

}  // namespace datachunk
