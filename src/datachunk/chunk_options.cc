#include "datachunk/chunk_options.h"

#include "text_internal.h"

#include <array>

namespace datachunk {
namespace {

    static constexpr std::array<std::string_view, 11> kCanonicalKeys = {
        "label",       "format",          "encoding",   "output.var",
        "output.file", "loader.function", "loader.ops", "md5sum",
        "echo",        "max.echo",        "eval",
    };

}  // namespace

bool
ChunkOptions::set(std::string_view key, std::string_view value)
{
    for (ChunkOption& e : entries_) {
        if (e.key == key) {
            e.value.assign(value.data(), value.size());
            return false;
        }
    }
    ChunkOption e;
    e.key.assign(key.data(), key.size());
    e.value.assign(value.data(), value.size());
    entries_.push_back(std::move(e));
    return true;
}


const std::string*
ChunkOptions::find(std::string_view key) const noexcept
{
    for (const ChunkOption& e : entries_) {
        if (e.key == key) {
            return &e.value;
        }
    }
    return nullptr;
}


bool
ChunkOptions::contains(std::string_view key) const noexcept
{
    return find(key) != nullptr;
}


bool
ChunkOptions::erase(std::string_view key) noexcept
{
    for (auto it = entries_.begin(); it != entries_.end(); ++it) {
        if (it->key == key) {
            entries_.erase(it);
            return true;
        }
    }
    return false;
}


void
ChunkOptions::clear() noexcept
{
    entries_.clear();
}


std::span<const ChunkOption>
ChunkOptions::entries() const noexcept
{
    return std::span<const ChunkOption>(entries_.data(), entries_.size());
}


size_t
ChunkOptions::size() const noexcept
{
    return entries_.size();
}


bool
ChunkOptions::empty() const noexcept
{
    return entries_.empty();
}


std::span<const std::string_view>
canonical_option_keys() noexcept
{
    return std::span<const std::string_view>(kCanonicalKeys.data(),
                                             kCanonicalKeys.size());
}


int32_t
canonical_option_rank(std::string_view key) noexcept
{
    for (size_t i = 0; i < kCanonicalKeys.size(); ++i) {
        if (kCanonicalKeys[i] == key) {
            return static_cast<int32_t>(i);
        }
    }
    return -1;
}


bool
is_string_literal(std::string_view raw) noexcept
{
    if (raw.size() < 2U) {
        return false;
    }
    const char q = raw.front();
    if ((q != '"' && q != '\'') || raw.back() != q) {
        return false;
    }
    // The closing quote must not be escaped and no unescaped quote may
    // appear in between.
    for (size_t i = 1; i + 1 < raw.size(); ++i) {
        if (raw[i] == '\\') {
            i += 1;
            if (i + 1 >= raw.size()) {
                return false;
            }
            continue;
        }
        if (raw[i] == q) {
            return false;
        }
    }
    return true;
}


bool
option_string_value(std::string_view raw, std::string* out)
{
    raw = text_internal::trim_blank(raw);
    if (!out || !is_string_literal(raw)) {
        return false;
    }
    out->clear();
    out->reserve(raw.size() - 2U);
    for (size_t i = 1; i + 1 < raw.size(); ++i) {
        char c = raw[i];
        if (c == '\\' && i + 2 < raw.size()) {
            i += 1;
            c = raw[i];
            if (c == 'n') {
                c = '\n';
            } else if (c == 'r') {
                c = '\r';
            } else if (c == 't') {
                c = '\t';
            }
        }
        out->push_back(c);
    }
    return true;
}


bool
option_bool_value(std::string_view raw, bool* out) noexcept
{
    raw = text_internal::trim_blank(raw);
    if (raw == "TRUE" || raw == "T" || raw == "true") {
        *out = true;
        return true;
    }
    if (raw == "FALSE" || raw == "F" || raw == "false") {
        *out = false;
        return true;
    }
    return false;
}


std::string
quote_option_string(std::string_view s)
{
    std::string out;
    out.reserve(s.size() + 2U);
    out.push_back('"');
    for (char c : s) {
        if (c == '\n') {
            out.append("\\n");
            continue;
        }
        if (c == '\r') {
            out.append("\\r");
            continue;
        }
        if (c == '"' || c == '\\') {
            out.push_back('\\');
        }
        out.push_back(c);
    }
    out.push_back('"');
    return out;
}

}  // namespace datachunk
