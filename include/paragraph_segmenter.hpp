#pragma once

#include "config.hpp"
#include <regex>
#include <string>
#include <vector>

namespace reflow {

// Ordered sentences forming one reading unit
using Paragraph = std::vector<std::string>;

// Which predicate ended a paragraph. Lower value = higher priority.
enum class BreakRule {
    None,
    Marker,             // next sentence opens with a dialogue or topic-shift marker
    Interrogative,      // current sentence is a question
    LengthDelta,        // sharp change in sentence length
    Speaker,            // next sentence starts with a speaker label
    ClosingExpression   // current sentence ends with a configured closing phrase
};

const char* to_string(BreakRule rule);

class ParagraphSegmenter {
public:
    ParagraphSegmenter();
    explicit ParagraphSegmenter(const ReflowConfig& config);

    // Single left-to-right pass. Every sentence lands in exactly one paragraph,
    // in source order; the last sentence always closes its paragraph.
    std::vector<Paragraph> segment(const std::vector<std::string>& sentences) const;

    // First matching rule for an adjacent pair
    BreakRule break_rule(const std::string& current, const std::string& next) const;

private:
    using Predicate = bool (ParagraphSegmenter::*)(const std::u32string&, const std::u32string&) const;

    BreakRule evaluate(const std::u32string& current, const std::u32string& next) const;

    bool starts_with_marker(const std::u32string& current, const std::u32string& next) const;
    bool ends_with_question(const std::u32string& current, const std::u32string& next) const;
    bool length_jump(const std::u32string& current, const std::u32string& next) const;
    bool starts_with_speaker(const std::u32string& current, const std::u32string& next) const;
    bool ends_with_closing(const std::u32string& current, const std::u32string& next) const;

    std::vector<std::u32string> markers_;
    std::vector<std::u32string> closings_;
    std::u32string interrogatives_;
    int length_delta_threshold_;
    int min_length_for_delta_rule_;
    std::wregex speaker_;
    bool has_speaker_ = false;
};

// Sentences of one paragraph joined by a single space
std::string join_paragraph(const Paragraph& paragraph);

// Paragraphs joined by a blank line
std::string join_paragraphs(const std::vector<Paragraph>& paragraphs);

} // namespace reflow
