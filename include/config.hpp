#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace reflow {

// Reflow rule tables and thresholds. Defaults are tuned for Japanese transcripts.
struct ReflowConfig {
    // Hard input limit of the downstream sentence segmenter (bytes of UTF-8)
    std::size_t max_chunk_bytes = 35000;

    // Paragraph break when adjacent sentence lengths differ by more than this
    int length_delta_threshold = 20;
    // ...but only if the earlier sentence is longer than this (in characters)
    int min_length_for_delta_rule = 15;

    // Each code point is one mark
    std::string terminal_marks = "。！？.!?";
    std::string interrogative_marks = "？?";
    std::string comma_marks = "、，,";
    std::string default_terminal_mark = "。";

    // ASCII period/comma are rewritten to these
    std::string period_replacement = "。";
    std::string comma_replacement = "、";

    std::vector<std::string> dialogue_markers = {"「", "『", "“", "‘"};
    std::vector<std::string> topic_shift_markers = {
        "ところで", "さて", "それでは", "では次に", "次に", "最後に",
        "一方で", "話は変わりますが", "続いて", "まず最初に"
    };
    std::vector<std::string> filler_words = {
        "あの", "えーと", "えっと", "まぁ", "あー", "えー", "んー", "そのー"
    };
    std::vector<std::string> unit_words = {
        "年", "月", "日", "時", "分", "秒", "円", "人", "個", "回", "歳",
        "件", "本", "枚", "台", "階", "度", "倍", "%", "％"
    };

    // Sentence-closing expressions that end a paragraph (off by default)
    std::vector<std::string> paragraph_endings;

    // ECMAScript regex, matched against the start of the next sentence
    std::string speaker_pattern = "^([A-Z][A-Za-z]{0,19}|[一-龯ぁ-ヿ]{1,10})\\s?[:：]";

    // External sentence segmenter
    int segmenter_timeout_ms = 30000;

    // Process chunks on worker threads
    bool parallel_chunks = false;
};

// Returns an empty string when the config is usable, otherwise a description of the problem
std::string validate_config(const ReflowConfig& config);

// Quality modes for the whisper transcriber
enum class ModelQuality {
    Small,      // ggml-small - fastest usable model for Japanese
    Medium,     // ggml-medium
    LargeTurbo  // ggml-large-v3-turbo - highest accuracy
};

// Transcription parameter profiles
struct TranscriptionProfile {
    int best_of;
    int beam_size;
    float entropy_thold;
    float no_speech_thold;
    float temperature;
    const char* name;
};

// best_of: number of candidates, beam_size: beam search width
inline const TranscriptionProfile PROFILE_SMALL = {5, 5, 2.4f, 0.6f, 0.0f, "faster-whisper-small"};
inline const TranscriptionProfile PROFILE_MEDIUM = {5, 5, 2.8f, 0.5f, 0.0f, "faster-whisper-medium"};
inline const TranscriptionProfile PROFILE_LARGE_TURBO = {5, 8, 3.0f, 0.4f, 0.0f, "openai-whisper-large-v3-turbo"};

inline const TranscriptionProfile& get_profile(ModelQuality quality) {
    switch (quality) {
        case ModelQuality::Small: return PROFILE_SMALL;
        case ModelQuality::Medium: return PROFILE_MEDIUM;
        case ModelQuality::LargeTurbo: return PROFILE_LARGE_TURBO;
        default: return PROFILE_SMALL;
    }
}

inline std::string get_model_filename(ModelQuality quality) {
    switch (quality) {
        case ModelQuality::Small: return "ggml-small.bin";
        case ModelQuality::Medium: return "ggml-medium.bin";
        case ModelQuality::LargeTurbo: return "ggml-large-v3-turbo.bin";
        default: return "ggml-small.bin";
    }
}

struct TranscribeConfig {
    std::string model_dir = "models";
    ModelQuality model_quality = ModelQuality::Small;
    int n_threads = 4;
    std::string language = "ja";

    std::string get_model_path() const {
        return model_dir + "/" + get_model_filename(model_quality);
    }
};

} // namespace reflow
