#include "fs/Handle.hpp"
#include "fs/Filesystem.hpp"
#include "cache/ReadThroughCache.hpp"
#include "remote/ChunkedUploader.hpp"
#include "remote/DownloadStream.hpp"
#include "remote/errors.hpp"
#include "remote/path.hpp"
#include "log/Registry.hpp"

#include <fmt/core.h>

namespace loft::fs {

Handle::Handle(Filesystem& fs, std::string path, const int flags,
               std::optional<remote::model::File> file, std::optional<remote::model::Folder> folder)
    : fs_(fs), path_(std::move(path)), flags_(flags), file_(std::move(file)), folder_(std::move(folder)) {}

Handle::~Handle() {
    if (scratch_) log::Registry::fs()->warn("[Handle] Discarding unsaved writes to {}", path_);
    closeReaders_();
}

void Handle::requireRemoteFile_(const std::string_view op) const {
    if (!file_)
        throw std::filesystem::filesystem_error(fmt::format("{}: no remote content", op), path_,
                                                std::make_error_code(std::errc::no_such_file_or_directory));
}

ScratchFile& Handle::scratch_file_() {
    if (folder_)
        throw std::filesystem::filesystem_error("write", path_, std::make_error_code(std::errc::is_a_directory));
    if (!scratch_) scratch_ = std::make_unique<ScratchFile>(fs_.scratchDirectory());
    return *scratch_;
}

size_t Handle::read(char* buf, const size_t len) {
    requireRemoteFile_("read");

    if (cached_) return cached_->read(buf, len);

    if (!stream_) {
        log::Registry::fs()->debug("[Handle] Opening download stream for {}", path_);
        stream_ = fs_.client()->openDownload(file_->id);
    }
    return stream_->read(buf, len);
}

size_t Handle::readAt(char* buf, const size_t len, const uint64_t offset) {
    const auto& cache = fs_.cache();
    if (!cache) throw remote::NotSupported("random access reads need a read cache");

    requireRemoteFile_("readAt");
    if (offset >= file_->size) return 0;

    if (!cached_) {
        log::Registry::fs()->debug("[Handle] Opening cached reader for {}", path_);
        cached_ = cache->openRandomAccess(file_->id, file_->size);
    }
    return cached_->readAt(buf, len, offset);
}

size_t Handle::write(const char* data, const size_t len) {
    scratch_file_().writeAt(data, len, writePos_);
    writePos_ += len;
    return len;
}

size_t Handle::writeAt(const char* data, const size_t len, const uint64_t offset) {
    scratch_file_().writeAt(data, len, offset);
    return len;
}

size_t Handle::writeString(const std::string_view s) {
    return write(s.data(), s.size());
}

void Handle::truncate(const uint64_t size) {
    scratch_file_().truncate(size);
    if (writePos_ > size) writePos_ = size;
}

uint64_t Handle::seek(const int64_t offset, const int whence) {
    log::Registry::fs()->debug("[Handle] Seek on {} (offset {}, whence {}) refused", path_, offset, whence);
    throw remote::NotSupported("seek is not supported on remote files");
}

void Handle::closeReaders_() {
    if (stream_) {
        stream_->close();
        stream_.reset();
    }
    if (cached_) {
        cached_->close();
        cached_.reset();
    }
}

void Handle::close(const http::CancelToken& cancel) {
    closeReaders_();
    if (!scratch_) return;

    const auto size = scratch_->size();
    if (size == 0) throw remote::EmptyPayload(fmt::format("{}: file is empty", path_));

    auto in = scratch_->openReader();
    const auto previous = file_ ? file_->id : std::string{};

    file_ = fs_.uploader()->upload(in, path_, size, cancel);
    scratch_.reset();
    writePos_ = 0;

    if (!previous.empty() && previous != file_->id && fs_.cache()) fs_.cache()->evict(previous);
    log::Registry::fs()->info("[Handle] Saved {} ({} bytes)", path_, size);
}

FileInfo Handle::stat() const {
    if (file_) return FileInfo::of(*file_);
    if (folder_) return FileInfo::of(*folder_);
    throw std::filesystem::filesystem_error("stat", path_, std::make_error_code(std::errc::no_such_file_or_directory));
}

std::vector<FileInfo> Handle::readDir(const int count) const {
    if (!folder_) {
        if (file_) throw std::filesystem::filesystem_error("readdir", path_, std::make_error_code(std::errc::not_a_directory));
        throw std::filesystem::filesystem_error("readdir", path_, std::make_error_code(std::errc::no_such_file_or_directory));
    }

    std::vector<FileInfo> out;
    const auto full = [&] { return count > 0 && out.size() >= static_cast<size_t>(count); };

    for (const auto& sub : folder_->subfolders) {
        if (full()) return out;
        out.push_back(FileInfo::of(sub));
    }
    for (const auto& f : folder_->files) {
        if (full()) return out;
        out.push_back(FileInfo::of(f));
    }
    return out;
}

std::vector<std::string> Handle::readDirNames(const int count) const {
    std::vector<std::string> names;
    for (auto& info : readDir(count)) names.push_back(std::move(info.name));
    return names;
}

std::string Handle::name() const {
    if (file_) return file_->name;
    if (folder_) return folder_->name;
    return remote::parsePath(path_).leaf;
}

std::string Handle::id() const {
    return file_ ? file_->id : std::string{};
}

}
