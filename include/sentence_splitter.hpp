#pragma once

#include "config.hpp"
#include <string>
#include <vector>

namespace reflow {

// Punctuation-driven sentence segmentation. No linguistic lookahead.
class SentenceSplitter {
public:
    SentenceSplitter();
    explicit SentenceSplitter(const ReflowConfig& config);

    // Trimmed, non-empty sentences in source order. A terminal mark ends the
    // current sentence together with any marks and closing quotes right after it.
    std::vector<std::string> split(const std::string& text) const;

private:
    bool is_boundary(const std::u32string& text, std::size_t i) const;

    std::u32string terminal_marks_;
};

} // namespace reflow
