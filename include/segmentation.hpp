#pragma once

#include "config.hpp"
#include "diagnostics.hpp"
#include "sentence_splitter.hpp"
#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace reflow {

// Anything that can cut text into sentences
class SentenceSegmenter {
public:
    virtual ~SentenceSegmenter() = default;

    // May throw; callers go through FallbackSegmenter
    virtual std::vector<std::string> segment(const std::string& text) = 0;
    virtual std::string name() const = 0;

    // Segmenters that can stop their own work override both. The bounded call
    // must return or throw within `timeout` and leave nothing running behind.
    virtual bool supports_deadline() const { return false; }
    virtual std::vector<std::string> segment_with_deadline(const std::string& text,
                                                           std::chrono::milliseconds timeout) {
        (void)timeout;
        return segment(text);
    }
};

class RuleBasedSegmenter : public SentenceSegmenter {
public:
    explicit RuleBasedSegmenter(const ReflowConfig& config) : splitter_(config) {}

    std::vector<std::string> segment(const std::string& text) override { return splitter_.split(text); }
    std::string name() const override { return "rule-based"; }

private:
    SentenceSplitter splitter_;
};

// Runs an external command (via /bin/sh) with the text on stdin and reads one
// sentence per output line. A non-zero exit status is an error. On a deadline
// the command's whole process group is killed and reaped before the call throws.
class CommandSegmenter : public SentenceSegmenter {
public:
    explicit CommandSegmenter(std::string command) : command_(std::move(command)) {}

    std::vector<std::string> segment(const std::string& text) override;
    std::string name() const override { return "command: " + command_; }

    bool supports_deadline() const override { return true; }
    std::vector<std::string> segment_with_deadline(const std::string& text,
                                                   std::chrono::milliseconds timeout) override;

private:
    std::vector<std::string> run(const std::string& text, const std::chrono::milliseconds* timeout);

    std::string command_;
};

struct Segmentation {
    std::vector<std::string> sentences;
    bool external = false;  // produced by the primary segmenter
};

// Consults an optional primary segmenter with a bounded wait and falls back to
// rule-based splitting when it is missing, throws, hangs or returns nothing.
// Deadline-aware primaries run on the calling thread; others run on a detached
// worker that is abandoned on timeout.
class FallbackSegmenter {
public:
    FallbackSegmenter(std::shared_ptr<SentenceSegmenter> primary,
                      const ReflowConfig& config,
                      DiagnosticSink& diagnostics = null_diagnostics());

    Segmentation segment(const std::string& text) const;

    bool has_primary() const { return primary_ != nullptr; }

private:
    bool run_primary(const std::string& text, std::vector<std::string>& sentences) const;
    bool run_primary_detached(const std::string& text, std::vector<std::string>& sentences) const;

    std::shared_ptr<SentenceSegmenter> primary_;
    SentenceSplitter fallback_;
    std::chrono::milliseconds timeout_;
    DiagnosticSink& diagnostics_;
};

} // namespace reflow
