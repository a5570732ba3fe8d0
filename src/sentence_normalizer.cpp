#include "sentence_normalizer.hpp"
#include "text_utils.hpp"

namespace reflow {

namespace {

char32_t first_char(const std::string& utf8, char32_t fallback) {
    const std::u32string decoded = text::decode(utf8);
    return decoded.empty() ? fallback : decoded[0];
}

} // namespace

bool is_numeric_separator(const std::u32string& text, std::size_t i) {
    if (text[i] != U'.' && text[i] != U',') return false;
    return i > 0 && i + 1 < text.size() &&
           text::is_ascii_digit(text[i - 1]) && text::is_ascii_digit(text[i + 1]);
}

SentenceNormalizer::SentenceNormalizer()
    : SentenceNormalizer(ReflowConfig{}) {}

SentenceNormalizer::SentenceNormalizer(const ReflowConfig& config)
    : terminal_marks_(text::decode(config.terminal_marks))
    , comma_marks_(text::decode(config.comma_marks))
    , default_terminal_(first_char(config.default_terminal_mark, U'。'))
    , period_replacement_(first_char(config.period_replacement, U'。'))
    , comma_replacement_(first_char(config.comma_replacement, U'、')) {}

std::string SentenceNormalizer::normalize(const std::string& sentence) const {
    std::u32string result = text::decode(sentence);
    if (text::trim(result).empty()) return "";

    result = canonicalize_punctuation(result);
    result = ensure_terminal(result);
    result = space_after_marks(result);
    result = space_script_boundaries(result);
    result = collapse_whitespace(result);

    return text::encode(result);
}

std::u32string SentenceNormalizer::canonicalize_punctuation(const std::u32string& sentence) const {
    std::u32string result = sentence;
    for (std::size_t i = 0; i < result.size(); ++i) {
        if (is_numeric_separator(result, i)) continue;

        if (result[i] == U'.') {
            result[i] = period_replacement_;
        } else if (result[i] == U',') {
            result[i] = comma_replacement_;
        }
    }
    return result;
}

std::u32string SentenceNormalizer::ensure_terminal(const std::u32string& sentence) const {
    std::u32string result = text::trim(sentence);
    if (result.empty()) return result;

    if (!text::contains(terminal_marks_, text::last_significant(result))) {
        result += default_terminal_;
    }
    return result;
}

std::u32string SentenceNormalizer::space_after_marks(const std::u32string& sentence) const {
    std::u32string result;
    result.reserve(sentence.size() + 8);

    for (std::size_t i = 0; i < sentence.size(); ++i) {
        const char32_t c = sentence[i];
        result += c;

        if (i + 1 >= sentence.size()) break;
        if (!text::contains(terminal_marks_, c) && !text::contains(comma_marks_, c)) continue;
        if (is_numeric_separator(sentence, i)) continue;

        const char32_t next = sentence[i + 1];
        if (!text::is_space(next) && !text::is_punctuation(next)) {
            result += U' ';
        }
    }

    return result;
}

std::u32string SentenceNormalizer::space_script_boundaries(const std::u32string& sentence) const {
    std::u32string result;
    result.reserve(sentence.size() + 8);

    for (std::size_t i = 0; i < sentence.size(); ++i) {
        if (i > 0 && text::is_script_boundary(sentence[i - 1], sentence[i])) {
            result += U' ';
        }
        result += sentence[i];
    }

    return result;
}

std::u32string SentenceNormalizer::collapse_whitespace(const std::u32string& sentence) const {
    std::u32string result;
    result.reserve(sentence.size());

    bool last_was_space = true;  // drops leading whitespace
    for (char32_t c : sentence) {
        if (text::is_space(c)) {
            if (!last_was_space) {
                result += U' ';
                last_was_space = true;
            }
        } else {
            result += c;
            last_was_space = false;
        }
    }

    if (!result.empty() && result.back() == U' ') {
        result.pop_back();
    }
    return result;
}

} // namespace reflow
