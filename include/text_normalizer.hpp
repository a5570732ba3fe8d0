#pragma once

#include "config.hpp"
#include <string>
#include <vector>

namespace reflow {

// Global rewrites over the paragraph-joined text (paragraphs separated by a blank line)
class TextNormalizer {
public:
    TextNormalizer();
    explicit TextNormalizer(const ReflowConfig& config);

    // Main processing function - applies every rewrite in order until the text
    // stops changing, so process(process(x)) == process(x)
    std::string process(const std::string& text) const;

    // Individual rewrites (public for testing)
    std::u32string remove_space_before_punctuation(const std::u32string& text) const;
    std::u32string join_numbers_and_units(const std::u32string& text) const;
    std::u32string space_script_boundaries(const std::u32string& text) const;
    std::u32string remove_filler_words(const std::u32string& text) const;
    std::u32string collapse_whitespace(const std::u32string& text) const;
    std::u32string space_after_commas(const std::u32string& text) const;
    std::u32string ensure_paragraph_terminals(const std::u32string& text) const;

    // UTF-8 convenience wrapper around the rewrites above
    std::string apply(std::u32string (TextNormalizer::*rewrite)(const std::u32string&) const,
                      const std::string& text) const;

private:
    std::u32string process_once(const std::u32string& text) const;

    bool is_attaching(char32_t ch) const;
    std::size_t unit_at(const std::u32string& text, std::size_t pos) const;
    std::size_t filler_at(const std::u32string& text, std::size_t pos) const;

    std::u32string terminal_marks_;
    std::u32string comma_marks_;
    std::u32string attaching_;
    char32_t default_terminal_;
    std::vector<std::u32string> fillers_;  // longest first
    std::vector<std::u32string> units_;
};

} // namespace reflow
