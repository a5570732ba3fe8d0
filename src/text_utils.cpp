#include "text_utils.hpp"
#include <utf8proc.h>

namespace reflow {
namespace text {

namespace {

const std::u32string CLOSING_BRACKETS = U"」』”’）)】》〕〉］]｝}〗";

} // namespace

std::u32string decode(const std::string& utf8) {
    std::u32string out;
    out.reserve(utf8.size());

    const auto* data = reinterpret_cast<const utf8proc_uint8_t*>(utf8.data());
    const auto total = static_cast<utf8proc_ssize_t>(utf8.size());

    utf8proc_ssize_t i = 0;
    while (i < total) {
        utf8proc_int32_t codepoint = -1;
        const utf8proc_ssize_t n = utf8proc_iterate(data + i, total - i, &codepoint);
        if (n <= 0) {
            // Skip one byte of the broken sequence
            out.push_back(U'�');
            i += 1;
            continue;
        }
        out.push_back(static_cast<char32_t>(codepoint));
        i += n;
    }

    return out;
}

std::string encode(const std::u32string& text) {
    std::string out;
    out.reserve(text.size() * 3);

    utf8proc_uint8_t buf[4];
    for (char32_t ch : text) {
        const utf8proc_ssize_t n = utf8proc_encode_char(static_cast<utf8proc_int32_t>(ch), buf);
        if (n <= 0) {
            out += "\xEF\xBF\xBD";
            continue;
        }
        out.append(reinterpret_cast<const char*>(buf), static_cast<std::size_t>(n));
    }

    return out;
}

std::string encode(char32_t ch) {
    return encode(std::u32string(1, ch));
}

std::wstring to_wide(const std::u32string& text) {
    std::wstring out;
    out.reserve(text.size());
    for (char32_t ch : text) {
        out.push_back(static_cast<wchar_t>(ch));
    }
    return out;
}

std::wstring to_wide(const std::string& utf8) {
    return to_wide(decode(utf8));
}

bool is_space(char32_t ch) {
    if (ch == U' ' || ch == U'\t' || ch == U'\n' || ch == U'\r' || ch == U'\v' || ch == U'\f') {
        return true;
    }
    if (ch < 0x80) return false;

    switch (utf8proc_category(static_cast<utf8proc_int32_t>(ch))) {
        case UTF8PROC_CATEGORY_ZS:
        case UTF8PROC_CATEGORY_ZL:
        case UTF8PROC_CATEGORY_ZP:
            return true;
        default:
            return false;
    }
}

bool is_ascii_digit(char32_t ch) {
    return ch >= U'0' && ch <= U'9';
}

bool is_latin(char32_t ch) {
    return is_ascii_digit(ch) || (ch >= U'a' && ch <= U'z') || (ch >= U'A' && ch <= U'Z');
}

bool is_punctuation(char32_t ch) {
    switch (utf8proc_category(static_cast<utf8proc_int32_t>(ch))) {
        case UTF8PROC_CATEGORY_PC:
        case UTF8PROC_CATEGORY_PD:
        case UTF8PROC_CATEGORY_PS:
        case UTF8PROC_CATEGORY_PE:
        case UTF8PROC_CATEGORY_PI:
        case UTF8PROC_CATEGORY_PF:
        case UTF8PROC_CATEGORY_PO:
        case UTF8PROC_CATEGORY_SM:
        case UTF8PROC_CATEGORY_SC:
        case UTF8PROC_CATEGORY_SK:
        case UTF8PROC_CATEGORY_SO:
            return true;
        default:
            return false;
    }
}

bool is_foreign_script(char32_t ch) {
    if (ch < 0x80) return false;

    switch (utf8proc_category(static_cast<utf8proc_int32_t>(ch))) {
        case UTF8PROC_CATEGORY_LU:
        case UTF8PROC_CATEGORY_LL:
        case UTF8PROC_CATEGORY_LT:
        case UTF8PROC_CATEGORY_LM:
        case UTF8PROC_CATEGORY_LO:
        case UTF8PROC_CATEGORY_MN:
        case UTF8PROC_CATEGORY_MC:
        case UTF8PROC_CATEGORY_ND:
        case UTF8PROC_CATEGORY_NL:
        case UTF8PROC_CATEGORY_NO:
            return true;
        default:
            return false;
    }
}

bool is_closing_bracket(char32_t ch) {
    return contains(CLOSING_BRACKETS, ch);
}

bool is_line_break(char32_t ch) {
    return ch == U'\n' || ch == U'\r';
}

std::string trim(const std::string& text) {
    return encode(trim(decode(text)));
}

std::u32string trim(const std::u32string& text) {
    std::size_t start = 0;
    std::size_t end = text.size();

    while (start < end && is_space(text[start])) ++start;
    while (end > start && is_space(text[end - 1])) --end;

    return text.substr(start, end - start);
}

bool starts_with(const std::u32string& text, const std::u32string& prefix, std::size_t pos) {
    if (prefix.empty() || pos > text.size()) return false;
    return text.compare(pos, prefix.size(), prefix) == 0;
}

char32_t last_significant(const std::u32string& text) {
    for (auto it = text.rbegin(); it != text.rend(); ++it) {
        if (is_space(*it) || is_closing_bracket(*it)) continue;
        return *it;
    }
    return 0;
}

} // namespace text
} // namespace reflow
