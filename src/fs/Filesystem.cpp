#include "fs/Filesystem.hpp"
#include "cache/ReadThroughCache.hpp"
#include "remote/ChunkedUploader.hpp"
#include "remote/Client.hpp"
#include "remote/PathResolver.hpp"
#include "remote/errors.hpp"
#include "remote/path.hpp"
#include "log/Registry.hpp"

#include <fmt/core.h>

using namespace loft::remote;

namespace loft::fs {

namespace {

[[noreturn]] void throwErrc(const std::string& op, const std::string& path, const std::errc code) {
    throw std::filesystem::filesystem_error(op, path, std::make_error_code(code));
}

/// Runs f, turning the remote not-found family into ENOENT.
template <typename F>
auto mapNotFound(const std::string& op, const std::string& path, F&& f) -> decltype(f()) {
    try {
        return f();
    } catch (const NotFound& e) {
        log::Registry::fs()->debug("[Filesystem] {} {}: {}", op, path, e.what());
        throwErrc(op, path, std::errc::no_such_file_or_directory);
    }
}

}

Filesystem::Filesystem(std::shared_ptr<Client> client, std::filesystem::path scratchDir,
                       std::shared_ptr<cache::ReadThroughCache> cache)
    : Filesystem(client, std::move(scratchDir), std::move(cache), std::make_shared<ChunkedUploader>(client)) {}

Filesystem::Filesystem(std::shared_ptr<Client> client, std::filesystem::path scratchDir,
                       std::shared_ptr<cache::ReadThroughCache> cache, std::shared_ptr<ChunkedUploader> uploader)
    : client_(std::move(client)), uploader_(std::move(uploader)), cache_(std::move(cache)),
      scratchDir_(std::move(scratchDir)) {
    if (!client_) throw std::invalid_argument("Filesystem requires a client");
    if (!uploader_) throw std::invalid_argument("Filesystem requires an uploader");
    resolver_ = std::make_shared<PathResolver>(client_);
}

Filesystem::~Filesystem() = default;

std::unique_ptr<Handle> Filesystem::open(const std::string& path, const http::CancelToken& cancel) {
    return openFile(path, O_RDONLY, cancel);
}

std::unique_ptr<Handle> Filesystem::create(const std::string& path, const http::CancelToken& cancel) {
    return openFile(path, O_RDWR | O_CREAT | O_TRUNC, cancel);
}

std::unique_ptr<Handle> Filesystem::openFile(const std::string& path, const int flags, const http::CancelToken& cancel) {
    DirEntry entry;
    try {
        entry = resolver_->resolve(path, cancel);
    } catch (const NoFile&) {
        if (!(flags & O_CREAT)) throwErrc("open", path, std::errc::no_such_file_or_directory);
        log::Registry::fs()->debug("[Filesystem] {} does not exist yet, deferring creation", path);
        return std::make_unique<Handle>(*this, path, flags, std::nullopt, std::nullopt);
    } catch (const NoFolder&) {
        throwErrc("open", path, std::errc::no_such_file_or_directory);
    }

    if ((flags & O_CREAT) && (flags & O_EXCL)) throwErrc("open", path, std::errc::file_exists);

    if (auto* f = std::get_if<model::File>(&entry)) {
        log::Registry::fs()->debug("[Filesystem] Opening file {}", path);
        return std::make_unique<Handle>(*this, path, flags, std::move(*f), std::nullopt);
    }

    log::Registry::fs()->debug("[Filesystem] Opening folder {}", path);
    return std::make_unique<Handle>(*this, path, flags, std::nullopt, std::get<model::Folder>(std::move(entry)));
}

FileInfo Filesystem::stat(const std::string& path, const http::CancelToken& cancel) {
    const auto entry = mapNotFound("stat", path, [&] { return resolver_->resolve(path, cancel); });
    if (const auto* f = std::get_if<model::File>(&entry)) return FileInfo::of(*f);
    return FileInfo::of(std::get<model::Folder>(entry));
}

bool Filesystem::exists(const std::string& path, const http::CancelToken& cancel) {
    return !isMissing(resolver_->lookup(path, cancel));
}

std::vector<FileInfo> Filesystem::readDir(const std::string& path, const http::CancelToken& cancel) {
    const auto entry = mapNotFound("readdir", path, [&] { return resolver_->resolve(path, cancel); });
    const auto* folder = std::get_if<model::Folder>(&entry);
    if (!folder) throwErrc("readdir", path, std::errc::not_a_directory);

    std::vector<FileInfo> out;
    out.reserve(folder->subfolders.size() + folder->files.size());
    for (const auto& sub : folder->subfolders) out.push_back(FileInfo::of(sub));
    for (const auto& f : folder->files) out.push_back(FileInfo::of(f));
    return out;
}

void Filesystem::mkdir(const std::string& path, const http::CancelToken& cancel) {
    const auto parts = parsePath(path);
    if (parts.leaf.empty()) return;

    const auto parentFolder = mapNotFound("mkdir", path, [&] { return resolver_->folder(parts.parent, cancel); });

    if (parentFolder.subfolder(parts.leaf)) {
        log::Registry::fs()->debug("[Filesystem] Folder {} already exists", path);
        return;
    }
    if (parentFolder.file(parts.leaf)) throwErrc("mkdir", path, std::errc::file_exists);

    client_->createFolder(joinPath(parentFolder.path.empty() ? parts.parent : parentFolder.path, parts.leaf), cancel);
}

void Filesystem::mkdirAll(const std::string& path, const http::CancelToken& cancel) {
    const auto segments = splitPath(path);
    auto current = client_->getFolders(cancel).front();

    for (const auto& segment : segments) {
        const auto base = current.path.empty() ? std::string("/") : current.path;

        if (const auto* sub = current.subfolder(segment)) {
            // sub points into current.subfolders
            model::Folder next = *sub;
            current = std::move(next);
            continue;
        }
        if (current.file(segment)) throwErrc("mkdirAll", joinPath(base, segment), std::errc::not_a_directory);

        log::Registry::fs()->debug("[Filesystem] Creating folder {}", joinPath(base, segment));
        current = client_->createFolder(joinPath(base, segment), cancel);
        if (current.path.empty()) current.path = joinPath(base, segment);
    }
}

void Filesystem::remove(const std::string& path, const http::CancelToken& cancel) {
    const auto entry = mapNotFound("remove", path, [&] { return resolver_->resolve(path, cancel); });

    if (const auto* f = std::get_if<model::File>(&entry)) {
        log::Registry::fs()->debug("[Filesystem] Removing file {} ({})", path, f->id);
        client_->deleteFiles({f->id}, cancel);
        if (cache_) cache_->evict(f->id);
        return;
    }

    const auto& folder = std::get<model::Folder>(entry);
    if (isRoot(folder.path.empty() ? path : folder.path)) throwErrc("remove", path, std::errc::permission_denied);

    log::Registry::fs()->debug("[Filesystem] Removing folder {}", path);
    client_->deleteFolder(folder.path.empty() ? path : folder.path, cancel);
}

void Filesystem::removeAll(const std::string& path, const http::CancelToken& cancel) {
    remove(path, cancel);
}

void Filesystem::rename(const std::string& from, const std::string& to, const http::CancelToken& cancel) {
    const auto entry = mapNotFound("rename", from, [&] { return resolver_->resolve(from, cancel); });

    const auto oldParts = parsePath(from);
    const auto newParts = parsePath(to);
    if (newParts.leaf.empty()) throwErrc("rename", to, std::errc::invalid_argument);

    const bool parentChanged = oldParts.parent != newParts.parent;

    if (const auto* f = std::get_if<model::File>(&entry)) {
        if (parentChanged) {
            client_->moveFiles(newParts.parent, {f->id}, cancel);
            if (newParts.leaf != f->name) client_->renameFile(f->id, newParts.leaf, cancel);
        } else if (newParts.leaf != f->name) {
            client_->renameFile(f->id, newParts.leaf, cancel);
        }
        log::Registry::fs()->info("[Filesystem] Renamed {} to {}", from, to);
        return;
    }

    const auto& folder = std::get<model::Folder>(entry);
    client_->moveFolder(folder.path.empty() ? from : folder.path, parentChanged ? newParts.parent : std::string{},
                        newParts.leaf, cancel);
    log::Registry::fs()->info("[Filesystem] Renamed folder {} to {}", from, to);
}

void Filesystem::chmod(const std::string& path, const mode_t) {
    throw NotSupported("chmod is not supported: " + path);
}

void Filesystem::chown(const std::string& path, const uid_t, const gid_t) {
    throw NotSupported("chown is not supported: " + path);
}

void Filesystem::chtimes(const std::string& path, const std::time_t, const std::time_t) {
    throw NotSupported("chtimes is not supported: " + path);
}

}
