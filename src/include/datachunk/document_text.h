#pragma once

#include <span>
#include <string>
#include <string_view>
#include <vector>

/**
 * \file document_text.h
 * \brief Conversion between document text and its line sequence.
 */

namespace datachunk {

/// A document as an ordered line sequence (no line terminators).
using DocumentLines = std::vector<std::string>;

/**
 * \brief Splits \p text at LF, CRLF or CR into \p out (replaced).
 *
 * A terminator at the very end does not start an extra empty line; whether
 * it was present is reported through \p out_trailing_newline.
 */
void
split_document_lines(std::string_view text, DocumentLines* out,
                     bool* out_trailing_newline);

/// Joins \p lines with LF, appending a final LF when \p trailing_newline.
std::string
join_document_lines(std::span<const std::string> lines, bool trailing_newline);

}  // namespace datachunk
