#include "reflow_engine.hpp"
#include "chunk_planner.hpp"
#include "text_utils.hpp"
#include <atomic>
#include <future>

namespace reflow {

namespace {

const char* STAGE = "formatting";

} // namespace

nlohmann::json to_json(const ReflowResult& result) {
    nlohmann::json out = {
        {"success", result.success},
        {"result", result.text},
        {"formattedByEngine", result.formatted_by_engine},
    };
    if (!result.error.empty()) {
        out["error"] = result.error;
    }
    return out;
}

ReflowEngine::ReflowEngine()
    : ReflowEngine(ReflowConfig{}) {}

ReflowEngine::ReflowEngine(const ReflowConfig& config, DiagnosticSink* diagnostics)
    : config_(config)
    , diagnostics_(diagnostics ? diagnostics : &null_diagnostics())
    , splitter_(config)
    , sentence_normalizer_(config)
    , paragraph_segmenter_(config)
    , text_normalizer_(config) {}

ReflowResult ReflowEngine::reflow(const std::string& text) const {
    ReflowResult result;
    result.text = text;

    ProgressReporter progress(progress_sink_, *diagnostics_);
    progress.report(STAGE, 5);

    const std::string config_error = validate_config(config_);
    if (!config_error.empty()) {
        result.error = "invalid configuration: " + config_error;
        diagnostics_->error(result.error);
        return result;
    }
    progress.report(STAGE, 10);

    try {
        if (text::trim(text).empty()) {
            result.text.clear();
            result.success = true;
            result.formatted_by_engine = true;
            progress.report(STAGE, 100);
            return result;
        }

        const std::vector<std::string> raw = collect_sentences(text, progress, result);

        std::vector<std::string> sentences;
        sentences.reserve(raw.size());
        for (const auto& sentence : raw) {
            std::string clean = sentence_normalizer_.normalize(sentence);
            if (!clean.empty()) sentences.push_back(std::move(clean));
        }
        result.sentence_count = sentences.size();
        progress.report(STAGE, 75);

        // Always over the whole sequence; chunk edges carry no meaning
        const std::vector<Paragraph> paragraphs = paragraph_segmenter_.segment(sentences);
        result.paragraph_count = paragraphs.size();
        progress.report(STAGE, 85);

        result.text = text_normalizer_.process(join_paragraphs(paragraphs));
        result.success = true;
        result.formatted_by_engine = true;
        progress.report(STAGE, 100);

        diagnostics_->info("reflowed " + std::to_string(result.sentence_count) + " sentences into " +
                           std::to_string(result.paragraph_count) + " paragraphs (" +
                           std::to_string(result.chunk_count) + " chunks, " +
                           std::to_string(result.external_chunks) + " via external segmenter)");
    } catch (const std::exception& e) {
        // Losing the transcript is worse than leaving it unformatted
        result = ReflowResult{};
        result.text = text;
        result.error = e.what();
        diagnostics_->error(std::string("reflow failed, returning input unchanged: ") + e.what());
    } catch (...) {
        result = ReflowResult{};
        result.text = text;
        result.error = "unknown error during reflow";
        diagnostics_->error("reflow failed with a non-standard exception, returning input unchanged");
    }

    return result;
}

std::vector<std::string> ReflowEngine::collect_sentences(const std::string& text,
                                                         ProgressReporter& progress,
                                                         ReflowResult& result) const {
    FallbackSegmenter segmenter(segmenter_, config_, *diagnostics_);

    // Small enough for the external segmenter in one go
    if (segmenter.has_primary() && text.size() <= config_.max_chunk_bytes) {
        Segmentation whole = segmenter.segment(text);
        result.chunk_count = 1;
        result.external_chunks = whole.external ? 1 : 0;
        progress.report(STAGE, 70, true);
        return whole.sentences;
    }

    const std::vector<Chunk> chunks = ChunkPlanner(config_.max_chunk_bytes).plan(splitter_.split(text));
    result.chunk_count = chunks.size();
    progress.report(STAGE, 20);

    for (const auto& chunk : chunks) {
        if (chunk.oversized(config_.max_chunk_bytes)) {
            diagnostics_->warn("sentence of " + std::to_string(chunk.bytes) +
                               " bytes exceeds the chunk budget, kept whole");
        }
    }

    std::vector<Segmentation> segmented(chunks.size());
    std::atomic<std::size_t> done{0};

    auto process_chunk = [&](std::size_t index) {
        Segmentation out;
        if (segmenter.has_primary()) {
            out = segmenter.segment(chunks[index].text());
        } else {
            out.sentences = chunks[index].sentences;
        }

        const std::size_t finished = ++done;
        progress.report(STAGE, 20 + static_cast<int>(50 * finished / chunks.size()), true);
        return out;
    };

    if (config_.parallel_chunks && chunks.size() > 1) {
        std::vector<std::future<Segmentation>> futures;
        futures.reserve(chunks.size());
        for (std::size_t i = 0; i < chunks.size(); ++i) {
            futures.push_back(std::async(std::launch::async, process_chunk, i));
        }
        // Reassemble in chunk order
        for (std::size_t i = 0; i < futures.size(); ++i) {
            segmented[i] = futures[i].get();
        }
    } else {
        for (std::size_t i = 0; i < chunks.size(); ++i) {
            segmented[i] = process_chunk(i);
        }
    }

    std::vector<std::string> sentences;
    for (auto& part : segmented) {
        if (part.external) ++result.external_chunks;
        for (auto& sentence : part.sentences) {
            sentences.push_back(std::move(sentence));
        }
    }
    return sentences;
}

} // namespace reflow
