#pragma once

#include "config.hpp"
#include "diagnostics.hpp"
#include "paragraph_segmenter.hpp"
#include "progress.hpp"
#include "segmentation.hpp"
#include "sentence_normalizer.hpp"
#include "text_normalizer.hpp"
#include <memory>
#include <string>
#include <vector>

namespace reflow {

struct ReflowResult {
    bool success = false;
    std::string text;      // formatted text, or the original input on failure
    std::string error;
    bool formatted_by_engine = false;

    // Run statistics
    std::size_t chunk_count = 0;
    std::size_t external_chunks = 0;  // chunks cut by the external segmenter
    std::size_t sentence_count = 0;
    std::size_t paragraph_count = 0;
};

// {"success": ..., "result": ..., "formattedByEngine": ..., "error": ...}
nlohmann::json to_json(const ReflowResult& result);

// Raw transcript in, paragraphed and normalized prose out. reflow() never throws.
class ReflowEngine {
public:
    ReflowEngine();
    explicit ReflowEngine(const ReflowConfig& config, DiagnosticSink* diagnostics = nullptr);

    ReflowResult reflow(const std::string& text) const;

    // Optional external sentence segmenter, consulted per chunk
    void set_segmenter(std::shared_ptr<SentenceSegmenter> segmenter) { segmenter_ = std::move(segmenter); }
    void set_progress_sink(ProgressSink* sink) { progress_sink_ = sink; }

    const ReflowConfig& config() const { return config_; }

private:
    std::vector<std::string> collect_sentences(const std::string& text,
                                               ProgressReporter& progress,
                                               ReflowResult& result) const;

    ReflowConfig config_;
    DiagnosticSink* diagnostics_;
    std::shared_ptr<SentenceSegmenter> segmenter_;
    ProgressSink* progress_sink_ = nullptr;

    SentenceSplitter splitter_;
    SentenceNormalizer sentence_normalizer_;
    ParagraphSegmenter paragraph_segmenter_;
    TextNormalizer text_normalizer_;
};

} // namespace reflow
