#pragma once

#include <string>
#include <string_view>

namespace nomen::unicode {

inline constexpr char32_t replacement_character = U'\uFFFD';

// Decodes UTF-8 into code points. Every byte that does not start a well-formed sequence
// (truncated, overlong, surrogate or out of range) decodes to U+FFFD and is consumed alone.
std::u32string decode_utf8(std::string_view text);

void append_utf8(std::string& out, char32_t cp);
std::string encode_utf8(std::u32string_view cps);

[[nodiscard]] bool is_letter(char32_t cp) noexcept;

[[nodiscard]] constexpr bool is_digit(char32_t cp) noexcept { return cp >= U'0' && cp <= U'9'; }

[[nodiscard]] bool is_upper(char32_t cp) noexcept;
[[nodiscard]] bool is_lower(char32_t cp) noexcept;

// Simple one-to-one case mapping; characters without a mapping are returned unchanged.
[[nodiscard]] char32_t to_upper(char32_t cp) noexcept;
[[nodiscard]] char32_t to_lower(char32_t cp) noexcept;

} // namespace nomen::unicode
