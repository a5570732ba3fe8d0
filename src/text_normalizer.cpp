#include "text_normalizer.hpp"
#include "sentence_normalizer.hpp"
#include "text_utils.hpp"
#include <algorithm>

namespace reflow {

namespace {

// Marks that may be repeated by the recognizer ("。。", "？？")
const std::u32string REPEATABLE_MARKS = U"、。！？";

// Punctuation that belongs to the text before it, besides terminals and commas
const std::u32string EXTRA_ATTACHING = U"：:；;…‥";

const int MAX_PASSES = 5;

bool is_inline_space(char32_t c) {
    return text::is_space(c) && !text::is_line_break(c);
}

char32_t ascii_lower(char32_t c) {
    return (c >= U'A' && c <= U'Z') ? c - U'A' + U'a' : c;
}

std::vector<std::u32string> decode_lexicon(const std::vector<std::string>& words) {
    std::vector<std::u32string> out;
    for (const auto& word : words) {
        std::u32string decoded = text::trim(text::decode(word));
        if (!decoded.empty()) out.push_back(std::move(decoded));
    }
    std::stable_sort(out.begin(), out.end(), [](const std::u32string& a, const std::u32string& b) {
        return a.size() > b.size();
    });
    return out;
}

void trim_trailing_inline_space(std::u32string& text) {
    while (!text.empty() && is_inline_space(text.back())) {
        text.pop_back();
    }
}

} // namespace

TextNormalizer::TextNormalizer()
    : TextNormalizer(ReflowConfig{}) {}

TextNormalizer::TextNormalizer(const ReflowConfig& config)
    : terminal_marks_(text::decode(config.terminal_marks))
    , comma_marks_(text::decode(config.comma_marks))
    , fillers_(decode_lexicon(config.filler_words))
    , units_(decode_lexicon(config.unit_words)) {
    const std::u32string mark = text::decode(config.default_terminal_mark);
    default_terminal_ = mark.empty() ? U'。' : mark[0];

    attaching_ = terminal_marks_ + comma_marks_ + EXTRA_ATTACHING;
}

std::string TextNormalizer::process(const std::string& text) const {
    if (text.empty()) return text;

    std::u32string result = text::decode(text);

    // Run until stable since one rewrite can expose work for an earlier one
    for (int pass = 0; pass < MAX_PASSES; ++pass) {
        std::u32string next = process_once(result);
        if (next == result) break;
        result = std::move(next);
    }

    return text::encode(result);
}

std::u32string TextNormalizer::process_once(const std::u32string& text) const {
    // Order matters: fillers go before the whitespace collapse that cleans up
    // after them, and terminal enforcement goes last
    std::u32string result = remove_space_before_punctuation(text);
    result = join_numbers_and_units(result);
    result = space_script_boundaries(result);
    result = remove_filler_words(result);
    result = collapse_whitespace(result);
    result = space_after_commas(result);
    result = ensure_paragraph_terminals(result);
    return result;
}

std::string TextNormalizer::apply(std::u32string (TextNormalizer::*rewrite)(const std::u32string&) const,
                                  const std::string& text) const {
    return text::encode((this->*rewrite)(text::decode(text)));
}

bool TextNormalizer::is_attaching(char32_t ch) const {
    return text::contains(attaching_, ch) || text::is_closing_bracket(ch);
}

std::size_t TextNormalizer::unit_at(const std::u32string& text, std::size_t pos) const {
    for (const auto& unit : units_) {
        if (text::starts_with(text, unit, pos)) return unit.size();
    }
    return 0;
}

std::size_t TextNormalizer::filler_at(const std::u32string& text, std::size_t pos) const {
    for (const auto& filler : fillers_) {
        if (pos + filler.size() > text.size()) continue;

        bool match = true;
        for (std::size_t k = 0; k < filler.size(); ++k) {
            if (ascii_lower(text[pos + k]) != ascii_lower(filler[k])) {
                match = false;
                break;
            }
        }
        if (!match) continue;

        // Whole token only: "あの人" keeps its "あの"
        const std::size_t end = pos + filler.size();
        if (end == text.size() || text::is_space(text[end]) || text::is_punctuation(text[end])) {
            return filler.size();
        }
    }
    return 0;
}

std::u32string TextNormalizer::remove_space_before_punctuation(const std::u32string& text) const {
    std::u32string result;
    result.reserve(text.size());

    std::size_t i = 0;
    while (i < text.size()) {
        if (is_inline_space(text[i])) {
            std::size_t end = i;
            while (end < text.size() && is_inline_space(text[end])) ++end;

            if (end < text.size() && is_attaching(text[end])) {
                i = end;
                continue;
            }
            result.append(text, i, end - i);
            i = end;
            continue;
        }

        // Fix repeated punctuation
        if (text::contains(REPEATABLE_MARKS, text[i]) && !result.empty() && result.back() == text[i]) {
            ++i;
            continue;
        }

        result += text[i];
        ++i;
    }

    return result;
}

std::u32string TextNormalizer::join_numbers_and_units(const std::u32string& text) const {
    std::u32string result;
    result.reserve(text.size());

    std::size_t i = 0;
    while (i < text.size()) {
        if (is_inline_space(text[i]) && !result.empty() && text::is_ascii_digit(result.back())) {
            std::size_t end = i;
            while (end < text.size() && is_inline_space(text[end])) ++end;

            if (end < text.size() && unit_at(text, end) > 0) {
                i = end;
                continue;
            }
        }
        result += text[i];
        ++i;
    }

    return result;
}

std::u32string TextNormalizer::space_script_boundaries(const std::u32string& text) const {
    std::u32string result;
    result.reserve(text.size() + 8);

    for (std::size_t i = 0; i < text.size(); ++i) {
        if (i > 0 && text::is_script_boundary(text[i - 1], text[i])) {
            // "10年" stays joined
            const bool number_unit = text::is_ascii_digit(text[i - 1]) && unit_at(text, i) > 0;
            if (!number_unit) result += U' ';
        }
        result += text[i];
    }

    return result;
}

std::u32string TextNormalizer::remove_filler_words(const std::u32string& text) const {
    if (fillers_.empty()) return text;

    std::u32string result;
    result.reserve(text.size());

    std::size_t i = 0;
    while (i < text.size()) {
        const bool at_token_start = result.empty() || text::is_space(result.back()) ||
                                    text::is_punctuation(result.back());
        const std::size_t len = at_token_start ? filler_at(text, i) : 0;
        if (len == 0) {
            result += text[i];
            ++i;
            continue;
        }

        // Drop the filler, a comma right after it, and the whitespace around it
        std::size_t j = i + len;
        if (j < text.size() && text::contains(comma_marks_, text[j])) ++j;
        while (j < text.size() && is_inline_space(text[j])) ++j;
        trim_trailing_inline_space(result);

        const char32_t prev = result.empty() ? 0 : result.back();
        const char32_t next = j < text.size() ? text[j] : 0;

        bool needs_gap = prev != 0 && next != 0 &&
                         !text::is_line_break(prev) && !text::is_line_break(next) &&
                         !is_attaching(next);
        if (needs_gap && text::is_punctuation(prev) &&
            !text::contains(comma_marks_, prev) && !text::contains(terminal_marks_, prev)) {
            needs_gap = false;  // opening bracket
        }
        if (needs_gap && text::is_ascii_digit(prev) && unit_at(text, j) > 0) {
            needs_gap = false;
        }
        if (needs_gap) result += U' ';

        i = j;
    }

    return result;
}

std::u32string TextNormalizer::collapse_whitespace(const std::u32string& text) const {
    // Split into lines, squeeze and strip each one
    std::vector<std::u32string> lines;
    std::u32string line;
    bool pending_space = false;

    for (char32_t c : text) {
        if (c == U'\r') continue;
        if (c == U'\n') {
            lines.push_back(line);
            line.clear();
            pending_space = false;
            continue;
        }
        if (text::is_space(c)) {
            pending_space = !line.empty();
            continue;
        }
        if (pending_space) {
            line += U' ';
            pending_space = false;
        }
        line += c;
    }
    lines.push_back(line);

    // At most one blank line between paragraphs, none at the edges
    std::u32string result;
    bool blank_pending = false;
    for (const auto& l : lines) {
        if (l.empty()) {
            blank_pending = !result.empty();
            continue;
        }
        if (!result.empty()) {
            result += blank_pending ? U"\n\n" : U"\n";
        }
        result += l;
        blank_pending = false;
    }

    return result;
}

std::u32string TextNormalizer::space_after_commas(const std::u32string& text) const {
    std::u32string result;
    result.reserve(text.size() + 8);

    for (std::size_t i = 0; i < text.size(); ++i) {
        result += text[i];

        if (i + 1 >= text.size()) continue;
        if (!text::contains(comma_marks_, text[i]) || is_numeric_separator(text, i)) continue;

        const char32_t next = text[i + 1];
        if (!text::is_space(next) && !text::is_punctuation(next)) {
            result += U' ';
        }
    }

    return result;
}

std::u32string TextNormalizer::ensure_paragraph_terminals(const std::u32string& text) const {
    std::vector<std::u32string> paragraphs;

    // Paragraphs are separated by blank lines
    std::size_t start = 0;
    while (start <= text.size()) {
        std::size_t end = text.find(U"\n\n", start);
        if (end == std::u32string::npos) end = text.size();
        paragraphs.push_back(text.substr(start, end - start));
        start = end + 2;
    }

    std::u32string result;
    for (auto& paragraph : paragraphs) {
        paragraph = text::trim(paragraph);
        while (!paragraph.empty() && text::contains(comma_marks_, paragraph.back())) {
            paragraph.pop_back();
            paragraph = text::trim(paragraph);
        }
        if (paragraph.empty()) continue;

        if (!text::contains(terminal_marks_, paragraph.back())) {
            paragraph += default_terminal_;
        }

        if (!result.empty()) result += U"\n\n";
        result += paragraph;
    }

    return result;
}

} // namespace reflow
