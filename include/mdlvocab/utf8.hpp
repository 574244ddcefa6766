#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace mdlvocab {

// Decodes the code point starting at byte offset `i` and advances `i` past it.
// Malformed lead bytes decode as U+FFFD and advance by one byte.
bool NextCodepoint(std::string_view s, std::size_t& i, std::uint32_t& cp);

[[nodiscard]] bool IsSpace(std::uint32_t cp);

// Number of code points, the unit the cost model measures token length in.
[[nodiscard]] std::size_t CodepointLength(std::string_view s);

[[nodiscard]] std::vector<std::string> SplitCodepoints(std::string_view s);

[[nodiscard]] std::string TruncateUtf8(std::string_view s, std::size_t max_chars);

}  // namespace mdlvocab
