#include "transcript.hpp"

namespace reflow {

nlohmann::json to_json(const Transcript& transcript) {
    nlohmann::json segments = nlohmann::json::array();
    for (const auto& seg : transcript.segments) {
        segments.push_back({
            {"start", seg.start},
            {"end", seg.end},
            {"text", seg.text},
            {"confidence", seg.confidence},
        });
    }
    return nlohmann::json{
        {"text", transcript.text},
        {"segments", segments},
        {"language", transcript.language},
    };
}

bool parse_transcript(const std::string& json_text, Transcript& transcript, std::string& error) {
    nlohmann::json doc;
    try {
        doc = nlohmann::json::parse(json_text);
    } catch (const nlohmann::json::parse_error& e) {
        error = std::string("transcript is not valid JSON: ") + e.what();
        return false;
    }

    if (doc.is_object() && doc.contains("success")) {
        if (!doc["success"].is_boolean() || !doc["success"].get<bool>()) {
            error = doc.value("error", std::string("transcription reported failure"));
            return false;
        }
        if (!doc.contains("result")) {
            error = "transcript envelope has no result";
            return false;
        }
        doc = doc["result"];
    }

    if (!doc.is_object() || !doc.contains("text") || !doc["text"].is_string()) {
        error = "transcript has no text";
        return false;
    }

    Transcript parsed;
    try {
        parsed.text = doc["text"].get<std::string>();
        if (doc.contains("language") && doc["language"].is_string()) {
            parsed.language = doc["language"].get<std::string>();
        }

        if (doc.contains("segments") && doc["segments"].is_array()) {
            for (const auto& item : doc["segments"]) {
                TranscriptSegment seg;
                seg.start = item.value("start", 0.0);
                seg.end = item.value("end", 0.0);
                seg.text = item.value("text", std::string());
                seg.confidence = item.value("confidence", 0.0f);
                parsed.segments.push_back(std::move(seg));
            }
        }
    } catch (const nlohmann::json::exception& e) {
        error = std::string("malformed transcript: ") + e.what();
        return false;
    }

    transcript = std::move(parsed);
    return true;
}

} // namespace reflow
