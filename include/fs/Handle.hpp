#pragma once

#include "fs/FileInfo.hpp"
#include "fs/ScratchFile.hpp"
#include "http/CancelToken.hpp"
#include "remote/model/File.hpp"
#include "remote/model/Folder.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace loft::remote {
class DownloadStream;
}

namespace loft::cache {
class RandomAccessReader;
}

namespace loft::fs {

class Filesystem;

/// An open file or folder. Writes go to a private scratch file and are uploaded on close().
/// The owning Filesystem must outlive the handle.
class Handle {
public:
    Handle(Filesystem& fs, std::string path, int flags,
           std::optional<remote::model::File> file, std::optional<remote::model::Folder> folder);
    ~Handle();

    Handle(const Handle&) = delete;
    Handle& operator=(const Handle&) = delete;

    /// Sequential read; served from the cache once readAt() opened it, streamed otherwise.
    size_t read(char* buf, size_t len);

    /// Requires a read-through cache (NotSupported otherwise).
    size_t readAt(char* buf, size_t len, uint64_t offset);

    size_t write(const char* data, size_t len);
    size_t writeAt(const char* data, size_t len, uint64_t offset);
    size_t writeString(std::string_view s);
    void truncate(uint64_t size);

    [[noreturn]] uint64_t seek(int64_t offset, int whence);

    void sync() {}

    /// Uploads buffered writes. On failure the buffer is kept and close() may be retried.
    void close(const http::CancelToken& cancel = {});

    [[nodiscard]] FileInfo stat() const;
    [[nodiscard]] std::vector<FileInfo> readDir(int count = -1) const;
    [[nodiscard]] std::vector<std::string> readDirNames(int count = -1) const;

    [[nodiscard]] std::string name() const;
    [[nodiscard]] std::string id() const;
    [[nodiscard]] const std::string& path() const { return path_; }
    [[nodiscard]] int flags() const { return flags_; }

    [[nodiscard]] bool isDir() const { return folder_.has_value(); }
    [[nodiscard]] bool hasPendingWrites() const { return scratch_ != nullptr; }
    [[nodiscard]] const std::optional<remote::model::File>& file() const { return file_; }

private:
    Filesystem& fs_;
    std::string path_;
    int flags_;
    std::optional<remote::model::File> file_;
    std::optional<remote::model::Folder> folder_;

    std::unique_ptr<ScratchFile> scratch_;
    uint64_t writePos_ = 0;

    std::unique_ptr<remote::DownloadStream> stream_;
    std::unique_ptr<cache::RandomAccessReader> cached_;

    ScratchFile& scratch_file_();
    void requireRemoteFile_(std::string_view op) const;
    void closeReaders_();
};

}
