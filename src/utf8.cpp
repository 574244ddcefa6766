#include "mdlvocab/utf8.hpp"

namespace mdlvocab {

bool NextCodepoint(std::string_view s, std::size_t& i, std::uint32_t& cp) {
  if (i >= s.size()) {
    return false;
  }
  const auto c = static_cast<unsigned char>(s[i]);
  if (c < 0x80) {
    cp = c;
    i += 1;
    return true;
  }
  if ((c >> 5) == 0x6 && i + 1 < s.size()) {
    cp = ((c & 0x1Fu) << 6) | (static_cast<unsigned char>(s[i + 1]) & 0x3Fu);
    i += 2;
    return true;
  }
  if ((c >> 4) == 0xE && i + 2 < s.size()) {
    cp = ((c & 0x0Fu) << 12) | ((static_cast<unsigned char>(s[i + 1]) & 0x3Fu) << 6) |
         (static_cast<unsigned char>(s[i + 2]) & 0x3Fu);
    i += 3;
    return true;
  }
  if ((c >> 3) == 0x1E && i + 3 < s.size()) {
    cp = ((c & 0x07u) << 18) | ((static_cast<unsigned char>(s[i + 1]) & 0x3Fu) << 12) |
         ((static_cast<unsigned char>(s[i + 2]) & 0x3Fu) << 6) |
         (static_cast<unsigned char>(s[i + 3]) & 0x3Fu);
    i += 4;
    return true;
  }
  i += 1;
  cp = 0xFFFD;
  return true;
}

bool IsSpace(std::uint32_t cp) {
  if (cp <= 0x20) {
    return cp == 0x09 || cp == 0x0A || cp == 0x0B || cp == 0x0C || cp == 0x0D || cp == 0x20;
  }
  return cp == 0x85 || cp == 0xA0 || cp == 0x1680 || cp == 0x180E || (cp >= 0x2000 && cp <= 0x200A) ||
         cp == 0x2028 || cp == 0x2029 || cp == 0x202F || cp == 0x205F || cp == 0x3000;
}

std::size_t CodepointLength(std::string_view s) {
  std::size_t i = 0;
  std::size_t count = 0;
  std::uint32_t cp = 0;
  while (NextCodepoint(s, i, cp)) {
    ++count;
  }
  return count;
}

std::vector<std::string> SplitCodepoints(std::string_view s) {
  std::vector<std::string> out;
  out.reserve(s.size());
  std::size_t i = 0;
  std::uint32_t cp = 0;
  while (i < s.size()) {
    const std::size_t start = i;
    NextCodepoint(s, i, cp);
    out.emplace_back(s.substr(start, i - start));
  }
  return out;
}

std::string TruncateUtf8(std::string_view s, std::size_t max_chars) {
  if (max_chars == 0) {
    return std::string(s);
  }
  std::size_t i = 0;
  std::size_t count = 0;
  std::uint32_t cp = 0;
  while (count < max_chars && NextCodepoint(s, i, cp)) {
    ++count;
  }
  return std::string(s.substr(0, i));
}

}  // namespace mdlvocab
