#pragma once

#include "config.hpp"
#include <string>

namespace reflow {

// Per-sentence punctuation and spacing cleanup. The steps run in a fixed order
// because later ones rely on the output of earlier ones.
class SentenceNormalizer {
public:
    SentenceNormalizer();
    explicit SentenceNormalizer(const ReflowConfig& config);

    std::string normalize(const std::string& sentence) const;

    // Individual steps (public for testing)
    std::u32string canonicalize_punctuation(const std::u32string& sentence) const;
    std::u32string ensure_terminal(const std::u32string& sentence) const;
    std::u32string space_after_marks(const std::u32string& sentence) const;
    std::u32string space_script_boundaries(const std::u32string& sentence) const;
    std::u32string collapse_whitespace(const std::u32string& sentence) const;

private:
    std::u32string terminal_marks_;
    std::u32string comma_marks_;
    char32_t default_terminal_;
    char32_t period_replacement_;
    char32_t comma_replacement_;
};

// "1,000" and "3.5" keep their ASCII separators
bool is_numeric_separator(const std::u32string& text, std::size_t i);

} // namespace reflow
