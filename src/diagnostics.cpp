#include "diagnostics.hpp"

namespace reflow {

void StreamDiagnosticSink::info(const std::string& message) {
    if (verbose_) write("info", message);
}

void StreamDiagnosticSink::warn(const std::string& message) {
    write("warn", message);
}

void StreamDiagnosticSink::error(const std::string& message) {
    write("error", message);
}

void StreamDiagnosticSink::write(const char* level, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    out_ << "[reflow] " << level << ": " << message << std::endl;
}

DiagnosticSink& null_diagnostics() {
    static NullDiagnosticSink sink;
    return sink;
}

} // namespace reflow
