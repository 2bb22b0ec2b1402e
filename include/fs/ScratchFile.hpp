#pragma once

#include <cstdint>
#include <filesystem>
#include <fstream>

namespace loft::fs {

/// Private local buffer for one write handle, removed on destruction.
class ScratchFile {
public:
    explicit ScratchFile(const std::filesystem::path& dir);
    ~ScratchFile();

    ScratchFile(const ScratchFile&) = delete;
    ScratchFile& operator=(const ScratchFile&) = delete;

    void writeAt(const char* data, size_t len, uint64_t offset);
    void truncate(uint64_t size);
    void flush();

    [[nodiscard]] uint64_t size();

    /// Independent read view over the flushed content.
    [[nodiscard]] std::ifstream openReader();

    [[nodiscard]] const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
    std::fstream io_;
};

}
