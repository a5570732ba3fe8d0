#include "config.hpp"
#include "text_utils.hpp"
#include <regex>

namespace reflow {

std::string validate_config(const ReflowConfig& config) {
    if (config.max_chunk_bytes == 0) {
        return "max_chunk_bytes must be positive";
    }
    if (config.length_delta_threshold < 0) {
        return "length_delta_threshold must not be negative";
    }
    if (config.min_length_for_delta_rule < 0) {
        return "min_length_for_delta_rule must not be negative";
    }
    if (config.segmenter_timeout_ms <= 0) {
        return "segmenter_timeout_ms must be positive";
    }

    const std::u32string terminals = text::decode(config.terminal_marks);
    if (terminals.empty()) {
        return "terminal_marks must not be empty";
    }

    const std::u32string mark = text::decode(config.default_terminal_mark);
    if (mark.size() != 1) {
        return "default_terminal_mark must be a single character";
    }
    if (!text::contains(terminals, mark[0])) {
        return "default_terminal_mark must be one of terminal_marks";
    }

    for (const auto* replacement : {&config.period_replacement, &config.comma_replacement}) {
        if (text::decode(*replacement).size() != 1) {
            return "punctuation replacements must be single characters";
        }
    }

    for (const auto* lexicon : {&config.dialogue_markers, &config.topic_shift_markers,
                                &config.filler_words, &config.unit_words,
                                &config.paragraph_endings}) {
        for (const auto& entry : *lexicon) {
            if (text::trim(entry).empty()) {
                return "lexicon entries must not be blank";
            }
        }
    }

    if (!config.speaker_pattern.empty()) {
        try {
            std::wregex compiled(text::to_wide(config.speaker_pattern), std::regex::ECMAScript);
            (void)compiled;
        } catch (const std::regex_error& e) {
            return std::string("speaker_pattern does not compile: ") + e.what();
        }
    }

    return "";
}

} // namespace reflow
