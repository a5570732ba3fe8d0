#include "progress.hpp"
#include <algorithm>
#include <ios>

namespace reflow {

nlohmann::json to_json(const ProgressEvent& event) {
    nlohmann::json data = {
        {"stage", event.stage},
        {"percent", event.percent},
    };
    if (event.estimated_seconds_remaining) {
        data["estimatedTimeRemaining"] = *event.estimated_seconds_remaining;
    }
    return nlohmann::json{{"progress", data}};
}

void JsonLineProgressSink::emit(const ProgressEvent& event) {
    out_ << to_json(event).dump() << '\n';
    out_.flush();
    if (!out_) {
        throw std::ios_base::failure("progress stream is not writable");
    }
}

ProgressReporter::ProgressReporter(ProgressSink* sink, DiagnosticSink& diagnostics)
    : sink_(sink)
    , diagnostics_(diagnostics)
    , start_(std::chrono::steady_clock::now()) {}

void ProgressReporter::report(const std::string& stage, int percent, bool with_estimate) {
    // Held across emit so events leave in the order they were numbered
    std::lock_guard<std::mutex> emit_lock(emit_mutex_);

    ProgressEvent event;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        percent = std::clamp(percent, 0, 100);
        percent = std::max(percent, last_percent_);
        last_percent_ = percent;
    }

    if (!sink_) return;

    event.stage = stage;
    event.percent = percent;

    if (with_estimate && percent > 0 && percent < 100) {
        const auto elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start_);
        event.estimated_seconds_remaining = elapsed.count() / percent * (100 - percent);
    }

    // The sink runs without the state lock, so it may call back into last_percent()
    try {
        sink_->emit(event);
    } catch (const std::exception& e) {
        sink_failure(e.what());
    } catch (...) {
        sink_failure("non-standard exception");
    }
}

void ProgressReporter::sink_failure(const std::string& what) {
    // Formatting continues without a progress channel; log the first failure only
    if (!sink_failed_) {
        diagnostics_.warn("progress channel failed: " + what);
    }
    sink_failed_ = true;
}

int ProgressReporter::last_percent() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_percent_;
}

} // namespace reflow
