#pragma once
/**
 * @file utf8.hpp
 * @brief Byte-level UTF-8 helpers for the callsign field.
 *
 * @details
 * Two jobs only:
 *  - sanitize(): best-effort decode. Every maximal invalid subpart is
 *    replaced by U+FFFD (EF BF BD), the way most UTF-8 decoders do it.
 *  - safe_prefix_length(): longest prefix of at most N bytes that does not
 *    end inside a multi-byte sequence.
 */

#include <cstddef>
#include <string>

namespace fmo {
namespace utf8 {

/// UTF-8 encoding of U+FFFD REPLACEMENT CHARACTER.
static constexpr const char* REPLACEMENT = "\xEF\xBF\xBD";

/**
 * @brief Copy @p len bytes into @p out, replacing invalid sequences.
 * @return true if the input was already valid UTF-8 (out == input).
 */
bool sanitize(const char* data, std::size_t len, std::string& out);

/// Validity check without producing output.
bool is_valid(const char* data, std::size_t len);

/**
 * @brief Length of the longest prefix of @p data that is <= @p max_bytes and
 *        does not split a character.
 *
 * A character straddling the limit is dropped as a whole. Works on any bytes;
 * for invalid input it only backs off stray continuation bytes at the cut.
 */
std::size_t safe_prefix_length(const char* data, std::size_t len, std::size_t max_bytes);

/// Convenience: @p s cut to at most @p max_bytes on a character boundary.
inline std::string truncate(const std::string& s, std::size_t max_bytes) {
  return s.substr(0, safe_prefix_length(s.data(), s.size(), max_bytes));
}

} // namespace utf8
} // namespace fmo
