#include "chunk_planner.hpp"

namespace reflow {

std::string Chunk::text() const {
    std::string out;
    out.reserve(bytes);
    for (std::size_t i = 0; i < sentences.size(); ++i) {
        if (i > 0) out += ' ';
        out += sentences[i];
    }
    return out;
}

std::vector<Chunk> ChunkPlanner::plan(const std::vector<std::string>& sentences) const {
    std::vector<Chunk> chunks;
    Chunk current;

    for (const auto& sentence : sentences) {
        const std::size_t added = current.sentences.empty() ? sentence.size() : sentence.size() + 1;

        if (!current.sentences.empty() && current.bytes + added > max_chunk_bytes_) {
            chunks.push_back(std::move(current));
            current = Chunk{};
        }

        current.bytes += current.sentences.empty() ? sentence.size() : sentence.size() + 1;
        current.sentences.push_back(sentence);
    }

    if (!current.sentences.empty()) {
        chunks.push_back(std::move(current));
    }

    return chunks;
}

} // namespace reflow
