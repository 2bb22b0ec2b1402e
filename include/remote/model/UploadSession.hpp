#pragma once

#include <cstdint>
#include <string>

namespace loft::remote::model {

/// Chunk plan for one resumable upload. Chunks are numbered from 1.
struct UploadSession {
    std::string identifier;
    uint64_t total_size = 0;
    uint64_t chunk_size = 0;
    uint64_t total_chunks = 0;
    uint64_t current_chunk = 0;
    uint64_t remaining = 0;

    UploadSession() = default;
    UploadSession(std::string id, uint64_t totalSize, uint64_t chunkSize);

    [[nodiscard]] static uint64_t chunkCount(uint64_t totalSize, uint64_t chunkSize);

    /// Length of chunk `index`; the last one carries the remainder.
    [[nodiscard]] uint64_t chunkLength(uint64_t index) const;

    [[nodiscard]] bool isLast(const uint64_t index) const { return index == total_chunks; }
};

}
