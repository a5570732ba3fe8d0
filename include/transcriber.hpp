#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <vector>
#include "config.hpp"
#include "transcript.hpp"

// Forward declare whisper types
struct whisper_context;

namespace reflow {

struct TranscriptionResult {
    Transcript transcript;
    int64_t duration_ms = 0;
    float confidence = 0.0f;  // Average token probability (0.0 - 1.0)
    bool success = false;
    std::string error;
};

class Transcriber {
public:
    using ProgressCallback = std::function<void(int progress)>;

    Transcriber();
    ~Transcriber();

    Transcriber(const Transcriber&) = delete;
    Transcriber& operator=(const Transcriber&) = delete;

    // Initialize with model path
    bool initialize(const std::string& model_path, int n_threads = 4);
    void shutdown();
    bool is_initialized() const { return ctx_ != nullptr; }

    // Transcribe audio samples (16kHz mono float)
    TranscriptionResult transcribe(const std::vector<float>& audio);

    // Settings
    void set_language(const std::string& lang) { language_ = lang; }
    void set_profile(const TranscriptionProfile& profile) { profile_ = profile; }
    void set_progress_callback(ProgressCallback cb) { progress_cb_ = std::move(cb); }

private:
    whisper_context* ctx_ = nullptr;
    int n_threads_ = 4;
    std::string language_ = "ja";
    TranscriptionProfile profile_ = PROFILE_SMALL;
    ProgressCallback progress_cb_;

    // Average token probability of one segment
    float segment_confidence(int segment) const;
};

// Raw little-endian float32 samples, 16kHz mono (e.g. `ffmpeg -f f32le -ar 16000 -ac 1`)
bool load_pcm_f32(const std::string& path, std::vector<float>& samples, std::string& error);

} // namespace reflow
