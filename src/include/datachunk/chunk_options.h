#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

/**
 * \file chunk_options.h
 * \brief Ordered key/value option mapping carried by a chunk header.
 */

namespace datachunk {

/// One `key=value` pair. \ref value is the verbatim source text.
struct ChunkOption final {
    std::string key;
    std::string value;

    bool operator==(const ChunkOption&) const = default;
};

/**
 * \brief Insertion-ordered option mapping with unique keys.
 *
 * Values are opaque source text (quoted strings, identifiers or expressions)
 * that the host document engine interprets later; see the typed readers
 * below for the few values the core interprets itself.
 */
class ChunkOptions final {
public:
    ChunkOptions() = default;

    /// Sets \p key, keeping its position if present. Returns true if added.
    bool set(std::string_view key, std::string_view value);
    /// Returns the raw value for \p key or null.
    const std::string* find(std::string_view key) const noexcept;
    bool contains(std::string_view key) const noexcept;
    /// Removes \p key. Returns true if it was present.
    bool erase(std::string_view key) noexcept;
    void clear() noexcept;

    std::span<const ChunkOption> entries() const noexcept;
    size_t size() const noexcept;
    bool empty() const noexcept;

    bool operator==(const ChunkOptions&) const = default;

private:
    std::vector<ChunkOption> entries_;
};

/**
 * \brief Recognized option keys in serialization order.
 *
 * `label, format, encoding, output.var, output.file, loader.function,
 * loader.ops, md5sum, echo, max.echo, eval`
 */
std::span<const std::string_view>
canonical_option_keys() noexcept;

/// Position of \p key in \ref canonical_option_keys, or -1.
int32_t
canonical_option_rank(std::string_view key) noexcept;

/// True if \p raw is a complete single- or double-quoted string literal.
bool
is_string_literal(std::string_view raw) noexcept;

/**
 * \brief Reads a string literal option value.
 *
 * Quoted values are unquoted with `\\`, `\"`, `\'`, `\n`, `\r` and `\t` escapes
 * resolved. Returns false for anything that is not a string literal.
 */
bool
option_string_value(std::string_view raw, std::string* out);

/// Reads `TRUE`/`FALSE`/`T`/`F`/`true`/`false`. Returns false otherwise.
bool
option_bool_value(std::string_view raw, bool* out) noexcept;

/// Double-quotes \p s, escaping `\`, `"`, LF and CR.
std::string
quote_option_string(std::string_view s);

}  // namespace datachunk
