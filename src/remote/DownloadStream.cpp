#include "remote/DownloadStream.hpp"
#include "remote/errors.hpp"
#include "http/errors.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <cstring>
#include <fmt/core.h>

namespace loft::remote {

DownloadStream::DownloadStream(std::shared_ptr<http::Transport> transport, http::Request req,
                               const http::CancelToken& cancel, const size_t capacity)
    : transport_(std::move(transport)), req_(std::move(req)), cancel_(cancel.child()),
      capacity_(std::max<size_t>(capacity, 1)) {
    worker_ = std::thread([this] { run_(); });
}

DownloadStream::~DownloadStream() {
    close();
}

bool DownloadStream::push_(const char* data, const size_t len) {
    std::unique_lock lock(mutex_);
    spaceReady_.wait(lock, [&] { return closed_ || buffer_.size() - head_ < capacity_; });
    if (closed_) return false;

    if (head_ > 0 && head_ >= buffer_.size() / 2) {
        buffer_.erase(0, head_);
        head_ = 0;
    }
    buffer_.append(data, len);
    dataReady_.notify_all();
    return true;
}

void DownloadStream::run_() {
    std::exception_ptr error;
    try {
        const auto res = transport_->stream(req_, [this](const char* d, const size_t n) { return push_(d, n); }, cancel_);
        if (res.status != 200 && res.status != 206)
            throw UnexpectedStatus(fmt::format("download {} failed: unexpected status {}", req_.url, res.status), res.status);
    } catch (const http::Cancelled&) {
        std::scoped_lock lock(mutex_);
        if (!closed_) error = std::current_exception();
    } catch (const std::exception& e) {
        log::Registry::remote()->warn("[DownloadStream] {}", e.what());
        error = std::current_exception();
    }

    std::scoped_lock lock(mutex_);
    error_ = error;
    finished_ = true;
    dataReady_.notify_all();
}

size_t DownloadStream::read(char* buf, const size_t len) {
    if (len == 0) return 0;

    std::unique_lock lock(mutex_);
    dataReady_.wait(lock, [&] { return head_ < buffer_.size() || finished_ || closed_; });
    if (closed_) return 0;

    if (head_ < buffer_.size()) {
        const size_t n = std::min(len, buffer_.size() - head_);
        std::memcpy(buf, buffer_.data() + head_, n);
        head_ += n;
        bytesRead_ += n;
        spaceReady_.notify_all();
        return n;
    }

    if (error_) std::rethrow_exception(error_);
    return 0;
}

size_t DownloadStream::readFull(char* buf, const size_t len) {
    size_t total = 0;
    while (total < len) {
        const size_t n = read(buf + total, len - total);
        if (n == 0) break;
        total += n;
    }
    return total;
}

void DownloadStream::close() {
    {
        std::scoped_lock lock(mutex_);
        if (closed_ && !worker_.joinable()) return;
        closed_ = true;
    }
    cancel_.cancel();
    spaceReady_.notify_all();
    dataReady_.notify_all();
    if (worker_.joinable()) worker_.join();
}

}
