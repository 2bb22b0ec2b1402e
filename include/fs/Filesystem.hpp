#pragma once

#include "fs/FileInfo.hpp"
#include "fs/Handle.hpp"
#include "http/CancelToken.hpp"

#include <ctime>
#include <filesystem>
#include <fcntl.h>
#include <sys/types.h>
#include <memory>
#include <string>
#include <vector>

namespace loft::remote {
class Client;
class PathResolver;
class ChunkedUploader;
}

namespace loft::cache {
class ReadThroughCache;
}

namespace loft::fs {

/// Conventional file operations over the remote tree. Missing paths surface as
/// std::filesystem::filesystem_error(no_such_file_or_directory).
class Filesystem {
public:
    Filesystem(std::shared_ptr<remote::Client> client, std::filesystem::path scratchDir,
               std::shared_ptr<cache::ReadThroughCache> cache = nullptr);
    Filesystem(std::shared_ptr<remote::Client> client, std::filesystem::path scratchDir,
               std::shared_ptr<cache::ReadThroughCache> cache, std::shared_ptr<remote::ChunkedUploader> uploader);
    ~Filesystem();

    [[nodiscard]] std::unique_ptr<Handle> open(const std::string& path, const http::CancelToken& cancel = {});

    /// O_CREAT on a missing path defers creation until the first write and close().
    [[nodiscard]] std::unique_ptr<Handle> openFile(const std::string& path, int flags,
                                                   const http::CancelToken& cancel = {});

    [[nodiscard]] std::unique_ptr<Handle> create(const std::string& path, const http::CancelToken& cancel = {});

    [[nodiscard]] FileInfo stat(const std::string& path, const http::CancelToken& cancel = {});
    [[nodiscard]] bool exists(const std::string& path, const http::CancelToken& cancel = {});
    [[nodiscard]] std::vector<FileInfo> readDir(const std::string& path, const http::CancelToken& cancel = {});

    /// Succeeds without a request when the folder already exists.
    void mkdir(const std::string& path, const http::CancelToken& cancel = {});
    void mkdirAll(const std::string& path, const http::CancelToken& cancel = {});

    void remove(const std::string& path, const http::CancelToken& cancel = {});
    void removeAll(const std::string& path, const http::CancelToken& cancel = {});

    void rename(const std::string& from, const std::string& to, const http::CancelToken& cancel = {});

    // Permissions and times are not stored remotely.
    void chmod(const std::string& path, mode_t mode);
    void chown(const std::string& path, uid_t uid, gid_t gid);
    void chtimes(const std::string& path, std::time_t atime, std::time_t mtime);

    [[nodiscard]] static std::string name() { return "loft"; }

    [[nodiscard]] const std::shared_ptr<remote::Client>& client() const { return client_; }
    [[nodiscard]] const std::shared_ptr<remote::PathResolver>& resolver() const { return resolver_; }
    [[nodiscard]] const std::shared_ptr<remote::ChunkedUploader>& uploader() const { return uploader_; }
    [[nodiscard]] const std::shared_ptr<cache::ReadThroughCache>& cache() const { return cache_; }
    [[nodiscard]] const std::filesystem::path& scratchDirectory() const { return scratchDir_; }

private:
    std::shared_ptr<remote::Client> client_;
    std::shared_ptr<remote::PathResolver> resolver_;
    std::shared_ptr<remote::ChunkedUploader> uploader_;
    std::shared_ptr<cache::ReadThroughCache> cache_;
    std::filesystem::path scratchDir_;
};

}
