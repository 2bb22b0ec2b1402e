#pragma once

#include "remote/Client.hpp"
#include "remote/model/File.hpp"
#include "remote/model/UploadSession.hpp"

#include <cstdint>
#include <functional>
#include <istream>
#include <memory>
#include <string>

namespace loft::remote {

/// Pushes one file through the resumable multipart protocol, one chunk in flight.
class ChunkedUploader {
public:
    static constexpr uint64_t kDefaultChunkSize = 15 * 1024 * 1024;

    using Progress = std::function<void(uint64_t sent, uint64_t total)>;

    explicit ChunkedUploader(std::shared_ptr<Client> client, uint64_t chunkSize = kDefaultChunkSize);

    /// Reads exactly totalSize bytes from in. Returns the file record from the final chunk.
    model::File upload(std::istream& in, const std::string& destinationPath, uint64_t totalSize,
                       const http::CancelToken& cancel = {});

    void onProgress(Progress cb) { progress_ = std::move(cb); }

    [[nodiscard]] uint64_t chunkSize() const { return chunkSize_; }

private:
    std::shared_ptr<Client> client_;
    uint64_t chunkSize_;
    Progress progress_;

    [[nodiscard]] static std::string newSessionId();
};

}
