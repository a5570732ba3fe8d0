#include "config_loader.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace reflow {

namespace {

template <typename T>
void read_field(const nlohmann::json& doc, const char* key, T& target) {
    auto it = doc.find(key);
    if (it != doc.end()) {
        target = it->get<T>();
    }
}

} // namespace

std::string ConfigLoader::get_default_config_path() {
    const char* home = std::getenv("HOME");
    if (!home) return "";
    return std::string(home) + "/.reflow/config.json";
}

bool ConfigLoader::load_user_config(ReflowConfig& config, std::string& error) {
    const std::string path = get_default_config_path();
    if (path.empty() || !std::filesystem::exists(path)) {
        // No user config yet - that's OK
        return true;
    }
    return load_from_file(path, config, error);
}

bool ConfigLoader::load_from_file(const std::string& path, ReflowConfig& config, std::string& error) {
    std::ifstream file(path);
    if (!file.is_open()) {
        error = "cannot open config file: " + path;
        return false;
    }

    nlohmann::json doc;
    try {
        file >> doc;
    } catch (const nlohmann::json::parse_error& e) {
        error = "config file " + path + " is not valid JSON: " + e.what();
        return false;
    }

    if (!load_from_json(doc, config, error)) {
        error = path + ": " + error;
        return false;
    }

    std::cerr << "Loaded reflow config: " << path << std::endl;
    return true;
}

bool ConfigLoader::load_from_json(const nlohmann::json& doc, ReflowConfig& config, std::string& error) {
    if (!doc.is_object()) {
        error = "config must be a JSON object";
        return false;
    }

    // Work on a copy so a bad document leaves the caller's config intact
    ReflowConfig updated = config;
    try {
        long long max_chunk_bytes = static_cast<long long>(updated.max_chunk_bytes);
        read_field(doc, "max_chunk_bytes", max_chunk_bytes);
        if (max_chunk_bytes <= 0) {
            error = "max_chunk_bytes must be positive";
            return false;
        }
        updated.max_chunk_bytes = static_cast<std::size_t>(max_chunk_bytes);
        read_field(doc, "length_delta_threshold", updated.length_delta_threshold);
        read_field(doc, "min_length_for_delta_rule", updated.min_length_for_delta_rule);
        read_field(doc, "terminal_marks", updated.terminal_marks);
        read_field(doc, "interrogative_marks", updated.interrogative_marks);
        read_field(doc, "comma_marks", updated.comma_marks);
        read_field(doc, "default_terminal_mark", updated.default_terminal_mark);
        read_field(doc, "period_replacement", updated.period_replacement);
        read_field(doc, "comma_replacement", updated.comma_replacement);
        read_field(doc, "dialogue_markers", updated.dialogue_markers);
        read_field(doc, "topic_shift_markers", updated.topic_shift_markers);
        read_field(doc, "filler_words", updated.filler_words);
        read_field(doc, "unit_words", updated.unit_words);
        read_field(doc, "paragraph_endings", updated.paragraph_endings);
        read_field(doc, "speaker_pattern", updated.speaker_pattern);
        read_field(doc, "segmenter_timeout_ms", updated.segmenter_timeout_ms);
        read_field(doc, "parallel_chunks", updated.parallel_chunks);
    } catch (const nlohmann::json::exception& e) {
        error = std::string("bad config value: ") + e.what();
        return false;
    }

    std::string problem = validate_config(updated);
    if (!problem.empty()) {
        error = problem;
        return false;
    }

    config = std::move(updated);
    return true;
}

nlohmann::json ConfigLoader::to_json(const ReflowConfig& config) {
    return nlohmann::json{
        {"max_chunk_bytes", config.max_chunk_bytes},
        {"length_delta_threshold", config.length_delta_threshold},
        {"min_length_for_delta_rule", config.min_length_for_delta_rule},
        {"terminal_marks", config.terminal_marks},
        {"interrogative_marks", config.interrogative_marks},
        {"comma_marks", config.comma_marks},
        {"default_terminal_mark", config.default_terminal_mark},
        {"period_replacement", config.period_replacement},
        {"comma_replacement", config.comma_replacement},
        {"dialogue_markers", config.dialogue_markers},
        {"topic_shift_markers", config.topic_shift_markers},
        {"filler_words", config.filler_words},
        {"unit_words", config.unit_words},
        {"paragraph_endings", config.paragraph_endings},
        {"speaker_pattern", config.speaker_pattern},
        {"segmenter_timeout_ms", config.segmenter_timeout_ms},
        {"parallel_chunks", config.parallel_chunks},
    };
}

} // namespace reflow
