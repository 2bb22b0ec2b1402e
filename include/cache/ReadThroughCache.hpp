#pragma once

#include "cache/Entry.hpp"
#include "cache/RandomAccessReader.hpp"
#include "http/Transport.hpp"

#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace loft::remote {
class Client;
}

namespace loft::cache {

/// Copies a whole remote file into a local store once, then serves every reader from disk.
class ReadThroughCache {
public:
    /// Streams the full content of one remote file into the sink.
    using Fetcher = std::function<void(const std::string& id, const http::Sink& sink, const http::CancelToken& cancel)>;

    ReadThroughCache(std::filesystem::path directory, Fetcher fetch);
    ReadThroughCache(std::filesystem::path directory, std::shared_ptr<remote::Client> client);
    ~ReadThroughCache();

    ReadThroughCache(const ReadThroughCache&) = delete;
    ReadThroughCache& operator=(const ReadThroughCache&) = delete;

    /// Starts the background copy on first use; returns immediately.
    [[nodiscard]] std::unique_ptr<RandomAccessReader> openRandomAccess(const std::string& fileId, uint64_t totalSize);

    [[nodiscard]] bool contains(const std::string& fileId) const;
    [[nodiscard]] std::shared_ptr<Entry> entry(const std::string& fileId) const;

    /// Drops a finished or failed entry and its file. Pending copies are left alone.
    bool evict(const std::string& fileId);

    [[nodiscard]] const std::filesystem::path& directory() const { return dir_; }

    [[nodiscard]] static std::string escapeId(const std::string& id);
    /// nullopt for names escapeId() could not have produced.
    [[nodiscard]] static std::optional<std::string> unescapeId(const std::string& name);

private:
    std::filesystem::path dir_;
    Fetcher fetch_;
    http::CancelToken cancel_ = http::CancelToken::make();

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<Entry>> entries_;

    void restore_();
    void produce_(Entry* entry);
};

}
