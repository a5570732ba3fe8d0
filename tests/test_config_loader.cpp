// Automated tests for config validation and loading

#include "config.hpp"
#include "config_loader.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <cassert>

using namespace reflow;

void test_defaults_valid() {
    std::cout << "Testing default config..." << std::endl;

    ReflowConfig config;
    assert(validate_config(config).empty());
    assert(config.max_chunk_bytes == 35000);
    assert(config.length_delta_threshold == 20);
    assert(config.min_length_for_delta_rule == 15);

    std::cout << "  PASS" << std::endl;
}

void test_validation_errors() {
    std::cout << "Testing validation errors..." << std::endl;

    ReflowConfig config;
    config.max_chunk_bytes = 0;
    assert(!validate_config(config).empty());

    config = ReflowConfig{};
    config.default_terminal_mark = "★";
    assert(!validate_config(config).empty());

    config = ReflowConfig{};
    config.default_terminal_mark = "。。";
    assert(!validate_config(config).empty());

    config = ReflowConfig{};
    config.terminal_marks.clear();
    assert(!validate_config(config).empty());

    config = ReflowConfig{};
    config.filler_words.push_back("  ");
    assert(!validate_config(config).empty());

    config = ReflowConfig{};
    config.speaker_pattern = "([A-Z";
    assert(!validate_config(config).empty());

    config = ReflowConfig{};
    config.segmenter_timeout_ms = 0;
    assert(!validate_config(config).empty());

    std::cout << "  PASS" << std::endl;
}

void test_load_overrides() {
    std::cout << "Testing JSON overrides..." << std::endl;

    ReflowConfig config;
    std::string error;
    nlohmann::json doc = {
        {"max_chunk_bytes", 1000},
        {"length_delta_threshold", 30},
        {"filler_words", {"um", "uh"}},
        {"paragraph_endings", {"ました。"}},
        {"parallel_chunks", true},
    };

    assert(ConfigLoader::load_from_json(doc, config, error));
    assert(error.empty());
    assert(config.max_chunk_bytes == 1000);
    assert(config.length_delta_threshold == 30);
    assert(config.filler_words.size() == 2);
    assert(config.paragraph_endings.size() == 1);
    assert(config.parallel_chunks);

    // Untouched keys keep their defaults
    assert(config.min_length_for_delta_rule == 15);
    assert(config.default_terminal_mark == "。");

    std::cout << "  PASS" << std::endl;
}

void test_load_rejects_bad_values() {
    std::cout << "Testing bad values are rejected..." << std::endl;

    std::string error;

    ReflowConfig config;
    assert(!ConfigLoader::load_from_json({{"max_chunk_bytes", "big"}}, config, error));
    assert(!error.empty());
    assert(config.max_chunk_bytes == 35000 && "Failed load must leave the config unchanged");

    error.clear();
    assert(!ConfigLoader::load_from_json({{"max_chunk_bytes", -1}}, config, error));
    assert(!error.empty());

    error.clear();
    assert(!ConfigLoader::load_from_json({{"speaker_pattern", "([A-Z"}}, config, error));
    assert(!error.empty());
    assert(config.speaker_pattern == ReflowConfig{}.speaker_pattern);

    error.clear();
    assert(!ConfigLoader::load_from_json({{"default_terminal_mark", "★"}}, config, error));

    error.clear();
    assert(!ConfigLoader::load_from_json(nlohmann::json::array({1, 2}), config, error));

    std::cout << "  PASS" << std::endl;
}

void test_load_from_file() {
    std::cout << "Testing config file..." << std::endl;

    const auto dir = std::filesystem::temp_directory_path();
    const std::string good_path = (dir / "reflow-test-config.json").string();
    const std::string bad_path = (dir / "reflow-test-config-bad.json").string();

    {
        std::ofstream out(good_path);
        out << R"({"max_chunk_bytes": 2048, "topic_shift_markers": ["ところで"]})";
    }
    {
        std::ofstream out(bad_path);
        out << "{ not json";
    }

    ReflowConfig config;
    std::string error;
    assert(ConfigLoader::load_from_file(good_path, config, error));
    assert(config.max_chunk_bytes == 2048);
    assert(config.topic_shift_markers.size() == 1);

    error.clear();
    assert(!ConfigLoader::load_from_file(bad_path, config, error));
    assert(!error.empty());

    error.clear();
    assert(!ConfigLoader::load_from_file((dir / "reflow-no-such-file.json").string(), config, error));
    assert(!error.empty());

    std::filesystem::remove(good_path);
    std::filesystem::remove(bad_path);

    std::cout << "  PASS" << std::endl;
}

void test_to_json_roundtrip() {
    std::cout << "Testing config export..." << std::endl;

    ReflowConfig original;
    original.length_delta_threshold = 25;
    original.paragraph_endings = {"でした。"};

    ReflowConfig loaded;
    std::string error;
    assert(ConfigLoader::load_from_json(ConfigLoader::to_json(original), loaded, error));
    assert(loaded.length_delta_threshold == 25);
    assert(loaded.paragraph_endings == original.paragraph_endings);
    assert(loaded.speaker_pattern == original.speaker_pattern);
    assert(loaded.unit_words == original.unit_words);

    std::cout << "  PASS" << std::endl;
}

int main() {
    std::cout << "\n=== Config Loader Test Suite ===" << std::endl << std::endl;

    test_defaults_valid();
    test_validation_errors();
    test_load_overrides();
    test_load_rejects_bad_values();
    test_load_from_file();
    test_to_json_roundtrip();

    std::cout << "\n=== All Tests Passed! ===" << std::endl << std::endl;
    return 0;
}
