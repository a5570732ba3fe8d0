#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace reflow {

struct TranscriptSegment {
    double start = 0.0;  // seconds
    double end = 0.0;
    std::string text;
    float confidence = 0.0f;
};

// What the speech-to-text stage hands over. Only text is needed for reflow.
struct Transcript {
    std::string text;
    std::vector<TranscriptSegment> segments;
    std::string language;
};

nlohmann::json to_json(const Transcript& transcript);

// Accepts either {"text": ..., "segments": [...], "language": ...} or the
// tool envelope {"success": true, "result": {...}}
bool parse_transcript(const std::string& json_text, Transcript& transcript, std::string& error);

} // namespace reflow
