#include "cache/ReadThroughCache.hpp"
#include "remote/Client.hpp"
#include "log/Registry.hpp"

#include <cctype>
#include <charconv>
#include <fmt/core.h>
#include <mutex>

namespace loft::cache {

namespace {
constexpr auto kPartSuffix = ".part";

bool safeChar(const unsigned char c) {
    return std::isalnum(c) || c == '-' || c == '_' || c == '.';
}
}

std::string ReadThroughCache::escapeId(const std::string& id) {
    std::string out;
    out.reserve(id.size());
    for (const unsigned char c : id) {
        if (safeChar(c) && !(out.empty() && c == '.')) out += static_cast<char>(c);
        else out += fmt::format("%{:02X}", c);
    }
    return out;
}

std::optional<std::string> ReadThroughCache::unescapeId(const std::string& name) {
    std::string out;
    out.reserve(name.size());
    for (size_t i = 0; i < name.size(); ++i) {
        if (name[i] != '%') {
            out += name[i];
            continue;
        }
        if (i + 2 >= name.size()) return std::nullopt;

        unsigned int byte = 0;
        const auto* first = name.data() + i + 1;
        const auto [ptr, ec] = std::from_chars(first, first + 2, byte, 16);
        if (ec != std::errc{} || ptr != first + 2) return std::nullopt;
        out += static_cast<char>(byte);
        i += 2;
    }
    if (escapeId(out) != name) return std::nullopt;
    return out;
}

ReadThroughCache::ReadThroughCache(std::filesystem::path directory, Fetcher fetch)
    : dir_(std::move(directory)), fetch_(std::move(fetch)) {
    if (!fetch_) throw std::invalid_argument("ReadThroughCache requires a fetcher");
    std::filesystem::create_directories(dir_);
    restore_();
}

ReadThroughCache::ReadThroughCache(std::filesystem::path directory, std::shared_ptr<remote::Client> client)
    : ReadThroughCache(std::move(directory),
                       [client = std::move(client)](const std::string& id, const http::Sink& sink,
                                                    const http::CancelToken& cancel) {
                           client->downloadFile(id, sink, {}, cancel);
                       }) {}

ReadThroughCache::~ReadThroughCache() {
    cancel_.cancel();
    std::unique_lock lock(mutex_);
    for (auto& [_, e] : entries_) e->joinProducer();
}

void ReadThroughCache::restore_() {
    namespace fs = std::filesystem;

    for (const auto& item : fs::directory_iterator(dir_)) {
        if (!item.is_regular_file()) continue;
        const auto name = item.path().filename().string();

        if (name.ends_with(kPartSuffix)) {
            std::error_code ec;
            fs::remove(item.path(), ec);
            continue;
        }

        const auto id = unescapeId(name);
        if (!id) {
            log::Registry::cache()->warn("[Cache] Ignoring foreign file {} in {}", name, dir_.string());
            continue;
        }
        entries_[*id] = Entry::restored(*id, item.path(), item.file_size());
    }

    if (!entries_.empty())
        log::Registry::cache()->info("[Cache] Restored {} cached file(s) from {}", entries_.size(), dir_.string());
}

void ReadThroughCache::produce_(Entry* entry) {
    try {
        std::ofstream out(entry->partPath(), std::ios::binary | std::ios::app);
        if (!out) throw std::runtime_error("failed to open cache file " + entry->partPath().string());

        fetch_(entry->id(), [&](const char* data, const size_t len) {
            out.write(data, static_cast<std::streamsize>(len));
            out.flush();
            if (!out) return false;
            entry->advance(len);
            return true;
        }, cancel_);

        out.close();
        if (out.fail()) throw std::runtime_error("failed to write cache file " + entry->partPath().string());

        entry->finish();
        log::Registry::cache()->debug("[Cache] Cached {} ({} bytes)", entry->id(), entry->size());
    } catch (const std::exception& e) {
        log::Registry::cache()->error("[Cache] Copy of {} failed: {}", entry->id(), e.what());
        entry->fail(std::current_exception());
    }
}

std::unique_ptr<RandomAccessReader> ReadThroughCache::openRandomAccess(const std::string& fileId,
                                                                       const uint64_t totalSize) {
    std::shared_ptr<Entry> entry;
    {
        std::unique_lock lock(mutex_);
        if (const auto it = entries_.find(fileId); it != entries_.end() && it->second->state() != Entry::State::Failed)
            return std::make_unique<RandomAccessReader>(it->second);

        entry = std::make_shared<Entry>(fileId, dir_ / escapeId(fileId), totalSize);
        {
            std::ofstream touch(entry->partPath(), std::ios::binary | std::ios::trunc);
            if (!touch) throw std::runtime_error("failed to create cache file " + entry->partPath().string());
        }
        entries_[fileId] = entry;
    }

    log::Registry::cache()->debug("[Cache] Fetching {} ({} bytes) into {}", fileId, totalSize, dir_.string());

    auto reader = std::make_unique<RandomAccessReader>(entry);
    entry->adoptProducer(std::thread([this, raw = entry.get()] { produce_(raw); }));
    return reader;
}

bool ReadThroughCache::contains(const std::string& fileId) const {
    std::shared_lock lock(mutex_);
    return entries_.contains(fileId);
}

std::shared_ptr<Entry> ReadThroughCache::entry(const std::string& fileId) const {
    std::shared_lock lock(mutex_);
    const auto it = entries_.find(fileId);
    return it == entries_.end() ? nullptr : it->second;
}

bool ReadThroughCache::evict(const std::string& fileId) {
    std::unique_lock lock(mutex_);
    const auto it = entries_.find(fileId);
    if (it == entries_.end() || it->second->state() == Entry::State::Pending) return false;

    std::error_code ec;
    std::filesystem::remove(it->second->finalPath(), ec);
    entries_.erase(it);
    log::Registry::cache()->debug("[Cache] Evicted {}", fileId);
    return true;
}

}
