#include "paragraph_segmenter.hpp"
#include "text_utils.hpp"
#include <cstdlib>

namespace reflow {

const char* to_string(BreakRule rule) {
    switch (rule) {
        case BreakRule::None: return "none";
        case BreakRule::Marker: return "marker";
        case BreakRule::Interrogative: return "interrogative";
        case BreakRule::LengthDelta: return "length-delta";
        case BreakRule::Speaker: return "speaker";
        case BreakRule::ClosingExpression: return "closing-expression";
        default: return "unknown";
    }
}

ParagraphSegmenter::ParagraphSegmenter()
    : ParagraphSegmenter(ReflowConfig{}) {}

ParagraphSegmenter::ParagraphSegmenter(const ReflowConfig& config)
    : interrogatives_(text::decode(config.interrogative_marks))
    , length_delta_threshold_(config.length_delta_threshold)
    , min_length_for_delta_rule_(config.min_length_for_delta_rule) {
    for (const auto* lexicon : {&config.dialogue_markers, &config.topic_shift_markers}) {
        for (const auto& marker : *lexicon) {
            std::u32string decoded = text::trim(text::decode(marker));
            if (!decoded.empty()) markers_.push_back(std::move(decoded));
        }
    }
    for (const auto& ending : config.paragraph_endings) {
        std::u32string decoded = text::trim(text::decode(ending));
        if (!decoded.empty()) closings_.push_back(std::move(decoded));
    }

    if (!config.speaker_pattern.empty()) {
        try {
            speaker_ = std::wregex(text::to_wide(config.speaker_pattern), std::regex::ECMAScript);
            has_speaker_ = true;
        } catch (const std::regex_error&) {
            // validate_config reports this; the rule just stays off
            has_speaker_ = false;
        }
    }
}

BreakRule ParagraphSegmenter::evaluate(const std::u32string& current, const std::u32string& next) const {
    static const std::pair<BreakRule, Predicate> chain[] = {
        {BreakRule::Marker, &ParagraphSegmenter::starts_with_marker},
        {BreakRule::Interrogative, &ParagraphSegmenter::ends_with_question},
        {BreakRule::LengthDelta, &ParagraphSegmenter::length_jump},
        {BreakRule::Speaker, &ParagraphSegmenter::starts_with_speaker},
        {BreakRule::ClosingExpression, &ParagraphSegmenter::ends_with_closing},
    };

    for (const auto& [rule, test] : chain) {
        if ((this->*test)(current, next)) return rule;
    }
    return BreakRule::None;
}

BreakRule ParagraphSegmenter::break_rule(const std::string& current, const std::string& next) const {
    return evaluate(text::trim(text::decode(current)), text::trim(text::decode(next)));
}

std::vector<Paragraph> ParagraphSegmenter::segment(const std::vector<std::string>& sentences) const {
    std::vector<Paragraph> paragraphs;
    if (sentences.empty()) return paragraphs;

    Paragraph current;
    std::u32string this_sentence = text::trim(text::decode(sentences[0]));

    for (std::size_t i = 0; i < sentences.size(); ++i) {
        current.push_back(sentences[i]);

        if (i + 1 == sentences.size()) break;

        std::u32string next_sentence = text::trim(text::decode(sentences[i + 1]));
        if (evaluate(this_sentence, next_sentence) != BreakRule::None) {
            paragraphs.push_back(std::move(current));
            current = Paragraph{};
        }
        this_sentence = std::move(next_sentence);
    }

    paragraphs.push_back(std::move(current));
    return paragraphs;
}

bool ParagraphSegmenter::starts_with_marker(const std::u32string&, const std::u32string& next) const {
    for (const auto& marker : markers_) {
        if (text::starts_with(next, marker)) return true;
    }
    return false;
}

bool ParagraphSegmenter::ends_with_question(const std::u32string& current, const std::u32string&) const {
    const char32_t last = text::last_significant(current);
    return last != 0 && text::contains(interrogatives_, last);
}

bool ParagraphSegmenter::length_jump(const std::u32string& current, const std::u32string& next) const {
    const long len_current = static_cast<long>(current.size());
    const long len_next = static_cast<long>(next.size());

    return std::labs(len_current - len_next) > length_delta_threshold_ &&
           len_current > min_length_for_delta_rule_;
}

bool ParagraphSegmenter::starts_with_speaker(const std::u32string&, const std::u32string& next) const {
    if (!has_speaker_ || next.empty()) return false;
    const std::wstring wide = text::to_wide(next);
    return std::regex_search(wide, speaker_, std::regex_constants::match_continuous);
}

bool ParagraphSegmenter::ends_with_closing(const std::u32string& current, const std::u32string&) const {
    for (const auto& ending : closings_) {
        if (current.size() >= ending.size() &&
            current.compare(current.size() - ending.size(), ending.size(), ending) == 0) {
            return true;
        }
    }
    return false;
}

std::string join_paragraph(const Paragraph& paragraph) {
    std::string out;
    for (std::size_t i = 0; i < paragraph.size(); ++i) {
        if (i > 0) out += ' ';
        out += paragraph[i];
    }
    return out;
}

std::string join_paragraphs(const std::vector<Paragraph>& paragraphs) {
    std::string out;
    for (std::size_t i = 0; i < paragraphs.size(); ++i) {
        if (i > 0) out += "\n\n";
        out += join_paragraph(paragraphs[i]);
    }
    return out;
}

} // namespace reflow
