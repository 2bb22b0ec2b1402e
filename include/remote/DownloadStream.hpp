#pragma once

#include "http/Transport.hpp"

#include <condition_variable>
#include <cstdint>
#include <exception>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace loft::remote {

/// Pull-style view of one download. The transfer runs on its own thread and
/// hands bytes over through a bounded buffer; close() aborts it.
class DownloadStream {
public:
    static constexpr size_t kDefaultCapacity = 4 * 1024 * 1024;

    DownloadStream(std::shared_ptr<http::Transport> transport, http::Request req,
                   const http::CancelToken& cancel, size_t capacity = kDefaultCapacity);
    ~DownloadStream();

    DownloadStream(const DownloadStream&) = delete;
    DownloadStream& operator=(const DownloadStream&) = delete;

    /// Blocks until data is available. Returns 0 at end of data; rethrows a failed transfer.
    size_t read(char* buf, size_t len);

    /// Reads exactly len bytes unless the stream ends first.
    size_t readFull(char* buf, size_t len);

    void close();

    [[nodiscard]] uint64_t bytesRead() const { return bytesRead_; }

private:
    std::shared_ptr<http::Transport> transport_;
    http::Request req_;
    http::CancelToken cancel_;
    size_t capacity_;

    std::mutex mutex_;
    std::condition_variable dataReady_, spaceReady_;
    std::string buffer_;
    size_t head_ = 0;
    bool finished_ = false;
    bool closed_ = false;
    std::exception_ptr error_;
    uint64_t bytesRead_ = 0;

    std::thread worker_;

    void run_();
    bool push_(const char* data, size_t len);
};

}
