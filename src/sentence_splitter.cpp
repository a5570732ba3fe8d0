#include "sentence_splitter.hpp"
#include "text_utils.hpp"

namespace reflow {

SentenceSplitter::SentenceSplitter()
    : SentenceSplitter(ReflowConfig{}) {}

SentenceSplitter::SentenceSplitter(const ReflowConfig& config)
    : terminal_marks_(text::decode(config.terminal_marks)) {}

bool SentenceSplitter::is_boundary(const std::u32string& text, std::size_t i) const {
    const char32_t ch = text[i];
    if (!text::contains(terminal_marks_, ch)) return false;

    // Decimal point: "3.5"
    if (ch == U'.' && i > 0 && i + 1 < text.size() &&
        text::is_ascii_digit(text[i - 1]) && text::is_ascii_digit(text[i + 1])) {
        return false;
    }
    return true;
}

std::vector<std::string> SentenceSplitter::split(const std::string& text) const {
    std::vector<std::string> sentences;
    const std::u32string chars = text::decode(text);

    auto flush = [&](std::size_t begin, std::size_t end) {
        std::u32string sentence = text::trim(chars.substr(begin, end - begin));
        if (sentence.empty()) return;

        // Line breaks inside a sentence are plain whitespace
        for (char32_t& c : sentence) {
            if (text::is_line_break(c)) c = U' ';
        }
        sentences.push_back(text::encode(sentence));
    };

    std::size_t start = 0;
    std::size_t i = 0;
    while (i < chars.size()) {
        if (!is_boundary(chars, i)) {
            ++i;
            continue;
        }

        // Absorb "？！", "。」" and similar runs
        std::size_t end = i + 1;
        while (end < chars.size() &&
               (text::contains(terminal_marks_, chars[end]) || text::is_closing_bracket(chars[end]))) {
            ++end;
        }

        flush(start, end);
        start = end;
        i = end;
    }

    if (start < chars.size()) {
        flush(start, chars.size());
    }

    return sentences;
}

} // namespace reflow
