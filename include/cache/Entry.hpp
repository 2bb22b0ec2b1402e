#pragma once

#include <condition_variable>
#include <cstdint>
#include <exception>
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace loft::cache {

/// One cached remote file: a single producer appends, any number of readers wait on it.
class Entry {
public:
    enum class State { Pending, Complete, Failed };

    Entry(std::string id, std::filesystem::path finalPath, uint64_t expectedSize);

    /// Entry for a file already on disk.
    static std::shared_ptr<Entry> restored(std::string id, std::filesystem::path finalPath, uint64_t size);

    ~Entry();

    [[nodiscard]] const std::string& id() const { return id_; }
    [[nodiscard]] std::filesystem::path partPath() const;
    [[nodiscard]] const std::filesystem::path& finalPath() const { return finalPath_; }

    [[nodiscard]] State state() const;
    [[nodiscard]] uint64_t size() const;
    [[nodiscard]] uint64_t written() const;

    /// Blocks until `end` bytes are on disk or the copy is over. Rethrows a failed copy.
    uint64_t waitFor(uint64_t end);

    /// Opens whichever file currently holds the bytes, consistent with a concurrent finish().
    [[nodiscard]] std::ifstream openStream() const;

    // producer side
    void advance(uint64_t bytes);
    void finish();
    void fail(std::exception_ptr error);
    void adoptProducer(std::thread t);
    void joinProducer();

private:
    std::string id_;
    std::filesystem::path finalPath_;
    uint64_t size_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    State state_ = State::Pending;
    uint64_t written_ = 0;
    std::exception_ptr error_;
    std::thread producer_;
};

}
