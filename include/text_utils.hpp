#pragma once

#include <cstddef>
#include <string>

namespace reflow {
namespace text {

// UTF-8 <-> UTF-32. Invalid byte sequences decode to U+FFFD.
std::u32string decode(const std::string& utf8);
std::string encode(const std::u32string& text);
std::string encode(char32_t ch);

// Wide copy for std::wregex matching (wchar_t is UTF-32 on the platforms we build for)
std::wstring to_wide(const std::u32string& text);
std::wstring to_wide(const std::string& utf8);

// Character classes
bool is_space(char32_t ch);
bool is_ascii_digit(char32_t ch);
bool is_latin(char32_t ch);           // ASCII letter or digit
bool is_punctuation(char32_t ch);     // Unicode P* and S* categories
bool is_foreign_script(char32_t ch);  // letter/number outside ASCII (kana, kanji, ...)
bool is_closing_bracket(char32_t ch); // closing quotes and brackets, both widths
bool is_line_break(char32_t ch);

inline bool contains(const std::u32string& set, char32_t ch) {
    return set.find(ch) != std::u32string::npos;
}

// Latin run next to a foreign-script run
inline bool is_script_boundary(char32_t left, char32_t right) {
    return (is_latin(left) && is_foreign_script(right)) ||
           (is_foreign_script(left) && is_latin(right));
}

std::string trim(const std::string& text);
std::u32string trim(const std::u32string& text);

bool starts_with(const std::u32string& text, const std::u32string& prefix, std::size_t pos = 0);

// Last character that is neither whitespace nor a closing bracket, or 0
char32_t last_significant(const std::u32string& text);

} // namespace text
} // namespace reflow
