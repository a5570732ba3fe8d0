// Automated tests for the sentence segmenters

#include "segmentation.hpp"
#include <chrono>
#include <iostream>
#include <cassert>
#include <cerrno>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <set>
#include <stdexcept>
#include <thread>
#include <unistd.h>

using namespace reflow;

// Remembers warnings so tests can check that a fallback was reported
class RecordingDiagnostics : public DiagnosticSink {
public:
    void info(const std::string&) override {}
    void warn(const std::string& message) override {
        std::lock_guard<std::mutex> lock(mutex_);
        warnings_.push_back(message);
    }
    void error(const std::string& message) override { warn(message); }

    std::size_t warning_count() {
        std::lock_guard<std::mutex> lock(mutex_);
        return warnings_.size();
    }

private:
    std::vector<std::string> warnings_;
    std::mutex mutex_;
};

class FixedSegmenter : public SentenceSegmenter {
public:
    explicit FixedSegmenter(std::vector<std::string> sentences) : sentences_(std::move(sentences)) {}
    std::vector<std::string> segment(const std::string&) override { return sentences_; }
    std::string name() const override { return "fixed"; }

private:
    std::vector<std::string> sentences_;
};

class ThrowingSegmenter : public SentenceSegmenter {
public:
    std::vector<std::string> segment(const std::string&) override {
        throw std::runtime_error("model not loaded");
    }
    std::string name() const override { return "throwing"; }
};

class OddThrowSegmenter : public SentenceSegmenter {
public:
    std::vector<std::string> segment(const std::string&) override { throw 42; }
    std::string name() const override { return "odd"; }
};

class SlowSegmenter : public SentenceSegmenter {
public:
    std::vector<std::string> segment(const std::string& text) override {
        std::this_thread::sleep_for(std::chrono::milliseconds(500));
        return {text};
    }
    std::string name() const override { return "slow"; }
};

const std::string INPUT = "一文目です。二文目です。";

void test_rule_based() {
    std::cout << "Testing rule-based segmenter..." << std::endl;

    ReflowConfig config;
    RuleBasedSegmenter segmenter(config);
    auto sentences = segmenter.segment(INPUT);
    assert(sentences.size() == 2);
    assert(segmenter.name() == "rule-based");

    std::cout << "  PASS" << std::endl;
}

void test_no_primary() {
    std::cout << "Testing fallback without a primary..." << std::endl;

    ReflowConfig config;
    FallbackSegmenter segmenter(nullptr, config);
    assert(!segmenter.has_primary());

    Segmentation result = segmenter.segment(INPUT);
    assert(!result.external);
    assert(result.sentences.size() == 2);

    std::cout << "  PASS" << std::endl;
}

void test_primary_used() {
    std::cout << "Testing primary segmenter result..." << std::endl;

    ReflowConfig config;
    RecordingDiagnostics diagnostics;
    auto primary = std::make_shared<FixedSegmenter>(std::vector<std::string>{"一文目です。二文目です。"});
    FallbackSegmenter segmenter(primary, config, diagnostics);

    Segmentation result = segmenter.segment(INPUT);
    assert(result.external);
    assert(result.sentences.size() == 1);
    assert(diagnostics.warning_count() == 0);

    std::cout << "  PASS" << std::endl;
}

void test_primary_failures() {
    std::cout << "Testing primary failures fall back..." << std::endl;

    ReflowConfig config;
    RecordingDiagnostics diagnostics;

    FallbackSegmenter throwing(std::make_shared<ThrowingSegmenter>(), config, diagnostics);
    Segmentation result = throwing.segment(INPUT);
    assert(!result.external);
    assert(result.sentences.size() == 2);
    assert(diagnostics.warning_count() == 1);

    FallbackSegmenter odd(std::make_shared<OddThrowSegmenter>(), config, diagnostics);
    result = odd.segment(INPUT);
    assert(!result.external);
    assert(result.sentences.size() == 2);
    assert(diagnostics.warning_count() == 2);

    FallbackSegmenter empty(std::make_shared<FixedSegmenter>(std::vector<std::string>{}), config, diagnostics);
    result = empty.segment(INPUT);
    assert(!result.external);
    assert(result.sentences.size() == 2);
    assert(diagnostics.warning_count() == 3);

    std::cout << "  PASS" << std::endl;
}

void test_primary_timeout() {
    std::cout << "Testing primary timeout..." << std::endl;

    ReflowConfig config;
    config.segmenter_timeout_ms = 50;
    RecordingDiagnostics diagnostics;
    FallbackSegmenter segmenter(std::make_shared<SlowSegmenter>(), config, diagnostics);

    auto start = std::chrono::steady_clock::now();
    Segmentation result = segmenter.segment(INPUT);
    auto elapsed = std::chrono::steady_clock::now() - start;

    assert(!result.external);
    assert(result.sentences.size() == 2);
    assert(diagnostics.warning_count() == 1);
    assert(elapsed < std::chrono::milliseconds(400) && "Must not wait for a hung segmenter");

    std::cout << "  PASS" << std::endl;
}

void test_command_segmenter() {
    std::cout << "Testing command segmenter..." << std::endl;

    CommandSegmenter cat("cat");
    auto sentences = cat.segment("一文目です。\n  二文目です。  \n\n");
    assert(sentences.size() == 2);
    assert(sentences[0] == "一文目です。");
    assert(sentences[1] == "二文目です。");

    CommandSegmenter failing("false");
    bool threw = false;
    try {
        failing.segment("text");
    } catch (const std::runtime_error&) {
        threw = true;
    }
    assert(threw && "Non-zero exit status must be an error");

    std::cout << "  PASS" << std::endl;
}

void test_command_segmenter_fallback() {
    std::cout << "Testing failing command falls back..." << std::endl;

    ReflowConfig config;
    RecordingDiagnostics diagnostics;
    FallbackSegmenter segmenter(std::make_shared<CommandSegmenter>("false"), config, diagnostics);

    Segmentation result = segmenter.segment(INPUT);
    assert(!result.external);
    assert(result.sentences.size() == 2);
    assert(diagnostics.warning_count() == 1);

    std::cout << "  PASS" << std::endl;
}

static std::set<std::string> segmenter_temp_files() {
    std::set<std::string> names;
    for (const auto& entry : std::filesystem::directory_iterator(std::filesystem::temp_directory_path())) {
        const std::string name = entry.path().filename().string();
        if (name.rfind("reflow-segment-", 0) == 0) names.insert(name);
    }
    return names;
}

// Dead or a zombie waiting for init to reap it
static bool process_gone(pid_t pid) {
    for (int i = 0; i < 100; ++i) {
        if (kill(pid, 0) != 0 && errno == ESRCH) return true;

        std::ifstream stat("/proc/" + std::to_string(pid) + "/stat");
        std::string line;
        if (std::getline(stat, line)) {
            const std::size_t paren = line.rfind(')');
            if (paren != std::string::npos && paren + 2 < line.size() && line[paren + 2] == 'Z') return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return false;
}

void test_command_timeout_cleans_up() {
    std::cout << "Testing timed out command leaves nothing behind..." << std::endl;

    const std::string pid_file = (std::filesystem::temp_directory_path() /
                                  ("reflow-test-pids-" + std::to_string(getpid()))).string();
    std::filesystem::remove(pid_file);
    const auto before = segmenter_temp_files();

    // The shell and a grandchild record their pids, then hang
    const std::string command = "echo $$ > '" + pid_file + "'; "
                                "sh -c 'echo $$ >> \"" + pid_file + "\"; exec sleep 30'; cat";

    ReflowConfig config;
    config.segmenter_timeout_ms = 300;
    RecordingDiagnostics diagnostics;
    FallbackSegmenter segmenter(std::make_shared<CommandSegmenter>(command), config, diagnostics);

    auto start = std::chrono::steady_clock::now();
    Segmentation result = segmenter.segment(INPUT);
    auto elapsed = std::chrono::steady_clock::now() - start;

    assert(!result.external);
    assert(result.sentences.size() == 2);
    assert(diagnostics.warning_count() == 1);
    assert(elapsed < std::chrono::seconds(5));

    std::vector<pid_t> pids;
    std::ifstream in(pid_file);
    long pid = 0;
    while (in >> pid) pids.push_back(static_cast<pid_t>(pid));
    assert(pids.size() == 2);
    for (pid_t p : pids) {
        assert(process_gone(p) && "Segmenter processes must be killed on timeout");
    }

    for (const auto& name : segmenter_temp_files()) {
        assert(before.count(name) == 1 && "Segmenter input file must be removed on timeout");
    }

    std::filesystem::remove(pid_file);

    std::cout << "  PASS" << std::endl;
}

void test_command_deadline_met() {
    std::cout << "Testing command finishing within its deadline..." << std::endl;

    CommandSegmenter cat("cat");
    assert(cat.supports_deadline());
    auto sentences = cat.segment_with_deadline("一文目です。\n二文目です。\n", std::chrono::milliseconds(5000));
    assert(sentences.size() == 2);

    bool threw = false;
    try {
        CommandSegmenter slow("sleep 5");
        slow.segment_with_deadline("text", std::chrono::milliseconds(100));
    } catch (const std::runtime_error&) {
        threw = true;
    }
    assert(threw);

    std::cout << "  PASS" << std::endl;
}

int main() {
    std::cout << "\n=== Segmentation Test Suite ===" << std::endl << std::endl;

    test_rule_based();
    test_no_primary();
    test_primary_used();
    test_primary_failures();
    test_primary_timeout();
    test_command_segmenter();
    test_command_segmenter_fallback();
    test_command_deadline_met();
    test_command_timeout_cleans_up();

    std::cout << "\n=== All Tests Passed! ===" << std::endl << std::endl;
    return 0;
}
