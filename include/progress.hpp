#pragma once

#include "diagnostics.hpp"
#include <chrono>
#include <functional>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <ostream>
#include <string>

namespace reflow {

struct ProgressEvent {
    std::string stage;
    int percent = 0;  // 0..100
    std::optional<double> estimated_seconds_remaining;
};

// {"progress": {"stage": ..., "percent": ..., "estimatedTimeRemaining": ...}}
nlohmann::json to_json(const ProgressEvent& event);

class ProgressSink {
public:
    virtual ~ProgressSink() = default;

    // May throw when the underlying channel is gone
    virtual void emit(const ProgressEvent& event) = 0;
};

// One JSON object per line, flushed after each event
class JsonLineProgressSink : public ProgressSink {
public:
    explicit JsonLineProgressSink(std::ostream& out) : out_(out) {}

    void emit(const ProgressEvent& event) override;

private:
    std::ostream& out_;
};

class CallbackProgressSink : public ProgressSink {
public:
    using Callback = std::function<void(const ProgressEvent&)>;

    explicit CallbackProgressSink(Callback cb) : cb_(std::move(cb)) {}

    void emit(const ProgressEvent& event) override {
        if (cb_) cb_(event);
    }

private:
    Callback cb_;
};

// Per-run reporter: clamps to [0,100], never goes backwards, and never lets a
// failing sink interrupt the caller.
class ProgressReporter {
public:
    explicit ProgressReporter(ProgressSink* sink, DiagnosticSink& diagnostics = null_diagnostics());

    void report(const std::string& stage, int percent, bool with_estimate = false);

    int last_percent() const;

private:
    // Called with emit_mutex_ held
    void sink_failure(const std::string& what);

    ProgressSink* sink_;
    DiagnosticSink& diagnostics_;
    std::chrono::steady_clock::time_point start_;
    int last_percent_ = 0;
    bool sink_failed_ = false;        // guarded by emit_mutex_
    mutable std::mutex mutex_;        // guards last_percent_
    std::mutex emit_mutex_;
};

} // namespace reflow
