#include "transcriber.hpp"
#include "text_utils.hpp"
#include "whisper.h"
#include <chrono>
#include <fstream>
#include <iostream>

namespace reflow {

Transcriber::Transcriber() = default;

Transcriber::~Transcriber() {
    shutdown();
}

bool Transcriber::initialize(const std::string& model_path, int n_threads) {
    if (ctx_) return true;

    n_threads_ = n_threads;

    struct whisper_context_params cparams = whisper_context_default_params();
    cparams.use_gpu = false;

    ctx_ = whisper_init_from_file_with_params(model_path.c_str(), cparams);
    if (!ctx_) {
        std::cerr << "Failed to load whisper model: " << model_path << std::endl;
        return false;
    }

    std::cerr << "Loaded whisper model: " << model_path << std::endl;
    return true;
}

void Transcriber::shutdown() {
    if (ctx_) {
        whisper_free(ctx_);
        ctx_ = nullptr;
    }
}

TranscriptionResult Transcriber::transcribe(const std::vector<float>& audio) {
    TranscriptionResult result;

    if (!ctx_) {
        result.error = "Transcriber not initialized";
        return result;
    }

    if (audio.empty()) {
        result.error = "No audio data";
        return result;
    }

    auto start_time = std::chrono::steady_clock::now();

    whisper_full_params wparams = whisper_full_default_params(
        profile_.beam_size > 1 ? WHISPER_SAMPLING_BEAM_SEARCH : WHISPER_SAMPLING_GREEDY
    );

    wparams.print_progress   = false;
    wparams.print_special    = false;
    wparams.print_realtime   = false;
    wparams.print_timestamps = false;
    wparams.translate        = false;
    wparams.single_segment   = false;  // Long recordings
    wparams.language         = language_.c_str();
    wparams.n_threads        = n_threads_;

    wparams.greedy.best_of        = profile_.best_of;
    wparams.beam_search.beam_size = profile_.beam_size;
    wparams.entropy_thold         = profile_.entropy_thold;
    wparams.no_speech_thold       = profile_.no_speech_thold;
    wparams.temperature           = profile_.temperature;

    if (progress_cb_) {
        wparams.progress_callback = [](struct whisper_context* ctx, struct whisper_state* state, int progress, void* user_data) {
            (void)ctx;
            (void)state;
            auto* cb = static_cast<ProgressCallback*>(user_data);
            (*cb)(progress);
        };
        wparams.progress_callback_user_data = &progress_cb_;
    }

    int ret = whisper_full(ctx_, wparams, audio.data(), static_cast<int>(audio.size()));
    if (ret != 0) {
        result.error = "Whisper inference failed";
        return result;
    }

    const int n_segments = whisper_full_n_segments(ctx_);
    std::string text;
    float total_confidence = 0.0f;

    for (int i = 0; i < n_segments; ++i) {
        const char* segment_text = whisper_full_get_segment_text(ctx_, i);
        if (!segment_text) continue;

        TranscriptSegment seg;
        // t0/t1 are in 10ms units
        seg.start = static_cast<double>(whisper_full_get_segment_t0(ctx_, i)) / 100.0;
        seg.end = static_cast<double>(whisper_full_get_segment_t1(ctx_, i)) / 100.0;
        seg.text = segment_text;
        seg.confidence = segment_confidence(i);
        total_confidence += seg.confidence;

        text += seg.text;
        text += ' ';
        result.transcript.segments.push_back(std::move(seg));
    }

    const int lang_id = whisper_full_lang_id(ctx_);
    const char* lang = lang_id >= 0 ? whisper_lang_str(lang_id) : nullptr;
    result.transcript.language = lang ? lang : language_;
    result.transcript.text = text::trim(text);

    auto end_time = std::chrono::steady_clock::now();
    result.duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time).count();
    result.confidence = n_segments > 0 ? total_confidence / static_cast<float>(n_segments) : 0.0f;
    result.success = true;

    std::cerr << "Transcription [" << profile_.name << "] took " << result.duration_ms << "ms, "
              << n_segments << " segments (conf: " << static_cast<int>(result.confidence * 100) << "%)"
              << std::endl;

    return result;
}

float Transcriber::segment_confidence(int segment) const {
    const int n_tokens = whisper_full_n_tokens(ctx_, segment);

    float total_prob = 0.0f;
    int total_tokens = 0;
    for (int tok = 0; tok < n_tokens; ++tok) {
        whisper_token_data token_data = whisper_full_get_token_data(ctx_, segment, tok);
        // Skip special tokens
        if (token_data.id >= 0 && token_data.p > 0.0f) {
            total_prob += token_data.p;
            total_tokens++;
        }
    }

    return total_tokens > 0 ? total_prob / static_cast<float>(total_tokens) : 0.0f;
}

bool load_pcm_f32(const std::string& path, std::vector<float>& samples, std::string& error) {
    std::ifstream in(path, std::ios::binary | std::ios::ate);
    if (!in) {
        error = "Input file not found: " + path;
        return false;
    }

    const std::streamsize size = in.tellg();
    if (size <= 0 || size % static_cast<std::streamsize>(sizeof(float)) != 0) {
        error = "Input is not raw float32 PCM: " + path;
        return false;
    }

    samples.resize(static_cast<std::size_t>(size) / sizeof(float));
    in.seekg(0);
    if (!in.read(reinterpret_cast<char*>(samples.data()), size)) {
        error = "Failed to read audio: " + path;
        return false;
    }
    return true;
}

} // namespace reflow
