#pragma once

#include <iostream>
#include <mutex>
#include <string>

namespace reflow {

// Where the engine reports things that are not part of its result
class DiagnosticSink {
public:
    virtual ~DiagnosticSink() = default;

    virtual void info(const std::string& message) = 0;
    virtual void warn(const std::string& message) = 0;
    virtual void error(const std::string& message) = 0;
};

class NullDiagnosticSink : public DiagnosticSink {
public:
    void info(const std::string&) override {}
    void warn(const std::string&) override {}
    void error(const std::string&) override {}
};

// Writes "[reflow] level: message" lines, safe to share between chunk workers
class StreamDiagnosticSink : public DiagnosticSink {
public:
    explicit StreamDiagnosticSink(std::ostream& out = std::cerr, bool verbose = true)
        : out_(out), verbose_(verbose) {}

    void info(const std::string& message) override;
    void warn(const std::string& message) override;
    void error(const std::string& message) override;

private:
    void write(const char* level, const std::string& message);

    std::ostream& out_;
    bool verbose_;
    std::mutex mutex_;
};

// Shared do-nothing sink for callers that pass none
DiagnosticSink& null_diagnostics();

} // namespace reflow
