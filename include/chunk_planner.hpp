#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace reflow {

// Sentence-aligned slice of the transcript
struct Chunk {
    std::vector<std::string> sentences;
    std::size_t bytes = 0;  // size of text(), separators included

    // Sentences joined by one space
    std::string text() const;

    // Only a lone sentence may exceed the budget
    bool oversized(std::size_t max_chunk_bytes) const { return bytes > max_chunk_bytes; }
};

class ChunkPlanner {
public:
    explicit ChunkPlanner(std::size_t max_chunk_bytes) : max_chunk_bytes_(max_chunk_bytes) {}

    // Greedy packing. Never splits a sentence; an oversized sentence becomes
    // its own chunk. Every chunk holds at least one sentence.
    std::vector<Chunk> plan(const std::vector<std::string>& sentences) const;

    std::size_t max_chunk_bytes() const { return max_chunk_bytes_; }

private:
    std::size_t max_chunk_bytes_;
};

} // namespace reflow
