#pragma once

#include <cstdint>
#include <fstream>
#include <memory>

namespace loft::cache {

class Entry;

/// Positional reads against a cache entry, blocking until the bytes are on disk.
/// One reader per consumer; not shared across threads.
class RandomAccessReader {
public:
    explicit RandomAccessReader(std::shared_ptr<Entry> entry);

    /// Returns 0 at or past the end without touching the network.
    size_t readAt(char* buf, size_t len, uint64_t offset);

    /// Sequential read from the current position.
    size_t read(char* buf, size_t len);

    [[nodiscard]] uint64_t size() const;
    [[nodiscard]] uint64_t position() const { return pos_; }

    void close();

private:
    std::shared_ptr<Entry> entry_;
    std::ifstream in_;
    uint64_t pos_ = 0;
};

}
