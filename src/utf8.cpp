// ============================================================================
// utf8.cpp - implementation for utf8.hpp
// ============================================================================

#include "fmo/utf8.hpp"

#include <cstdint>

namespace fmo {
namespace utf8 {

// ---------------------------------------------------------------------------
// sequence_length()
// -----------------
// For a lead byte, report how many continuation bytes follow and the allowed
// range of the FIRST continuation byte. The narrowed ranges reject overlong
// forms (E0, F0), surrogates (ED) and code points above U+10FFFF (F4).
//
// Returns: number of continuation bytes, or -1 if @p b cannot start a sequence.
// ---------------------------------------------------------------------------
static int sequence_length(uint8_t b, uint8_t& lo, uint8_t& hi) {
  lo = 0x80; hi = 0xBF;
  if (b >= 0xC2 && b <= 0xDF) return 1;
  if (b == 0xE0)              { lo = 0xA0; return 2; }
  if (b >= 0xE1 && b <= 0xEC) return 2;
  if (b == 0xED)              { hi = 0x9F; return 2; }
  if (b >= 0xEE && b <= 0xEF) return 2;
  if (b == 0xF0)              { lo = 0x90; return 3; }
  if (b >= 0xF1 && b <= 0xF3) return 3;
  if (b == 0xF4)              { hi = 0x8F; return 3; }
  return -1;                  // 80..C1, F5..FF
}

// ---------------------------------------------------------------------------
// scan()
// ------
// Walk @p data once. Valid sequences are copied to @p out (when non-null);
// each maximal invalid subpart becomes one U+FFFD. The byte that broke a
// sequence is not consumed, so it gets a chance to start the next one.
// ---------------------------------------------------------------------------
static bool scan(const char* data, std::size_t len, std::string* out) {
  const auto* p = reinterpret_cast<const uint8_t*>(data);
  bool clean = true;
  std::size_t i = 0;

  while (i < len) {
    const uint8_t b = p[i];
    if (b < 0x80) {                              // ASCII fast path
      if (out) out->push_back(static_cast<char>(b));
      ++i;
      continue;
    }

    uint8_t lo = 0, hi = 0;
    const int need = sequence_length(b, lo, hi);
    if (need < 0) {                              // stray continuation / bad lead
      if (out) out->append(REPLACEMENT);
      clean = false;
      ++i;
      continue;
    }

    std::size_t j = i + 1;
    bool ok = true;
    for (int k = 0; k < need; ++k, ++j) {
      if (j >= len) { ok = false; break; }       // truncated at end of field
      const uint8_t c  = p[j];
      const uint8_t lk = (k == 0) ? lo : 0x80;
      const uint8_t hk = (k == 0) ? hi : 0xBF;
      if (c < lk || c > hk) { ok = false; break; }
    }

    if (ok) {
      if (out) out->append(data + i, j - i);
    } else {
      if (out) out->append(REPLACEMENT);
      clean = false;
    }
    i = j;                                       // resume at first unconsumed byte
  }
  return clean;
}

bool sanitize(const char* data, std::size_t len, std::string& out) {
  out.clear();
  out.reserve(len);
  return scan(data, len, &out);
}

bool is_valid(const char* data, std::size_t len) {
  return scan(data, len, nullptr);
}

std::size_t safe_prefix_length(const char* data, std::size_t len, std::size_t max_bytes) {
  if (len <= max_bytes) return len;
  const auto* p = reinterpret_cast<const uint8_t*>(data);
  std::size_t cut = max_bytes;
  // p[cut] is the first excluded byte; if it continues a character, that
  // character began inside the prefix and must go too.
  while (cut > 0 && (p[cut] & 0xC0) == 0x80) --cut;
  return cut;
}

} // namespace utf8
} // namespace fmo
