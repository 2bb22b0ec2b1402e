#include "cache/Entry.hpp"
#include "log/Registry.hpp"

namespace loft::cache {

Entry::Entry(std::string id, std::filesystem::path finalPath, const uint64_t expectedSize)
    : id_(std::move(id)), finalPath_(std::move(finalPath)), size_(expectedSize) {}

std::shared_ptr<Entry> Entry::restored(std::string id, std::filesystem::path finalPath, const uint64_t size) {
    auto e = std::make_shared<Entry>(std::move(id), std::move(finalPath), size);
    e->state_ = State::Complete;
    e->written_ = size;
    return e;
}

Entry::~Entry() {
    joinProducer();
}

std::filesystem::path Entry::partPath() const {
    auto p = finalPath_;
    p += ".part";
    return p;
}

Entry::State Entry::state() const {
    std::scoped_lock lock(mutex_);
    return state_;
}

uint64_t Entry::size() const {
    std::scoped_lock lock(mutex_);
    return size_;
}

uint64_t Entry::written() const {
    std::scoped_lock lock(mutex_);
    return written_;
}

uint64_t Entry::waitFor(const uint64_t end) {
    std::unique_lock lock(mutex_);
    cv_.wait(lock, [&] { return state_ != State::Pending || written_ >= end; });
    if (state_ == State::Failed) std::rethrow_exception(error_);
    return written_;
}

std::ifstream Entry::openStream() const {
    std::scoped_lock lock(mutex_);
    return std::ifstream(state_ == State::Complete ? finalPath_ : partPath(), std::ios::binary);
}

void Entry::advance(const uint64_t bytes) {
    std::scoped_lock lock(mutex_);
    written_ += bytes;
    cv_.notify_all();
}

void Entry::finish() {
    std::scoped_lock lock(mutex_);
    std::filesystem::rename(partPath(), finalPath_);
    if (written_ != size_) {
        log::Registry::cache()->warn("[Cache] {} finished with {} bytes, expected {}", id_, written_, size_);
        size_ = written_;
    }
    state_ = State::Complete;
    cv_.notify_all();
}

void Entry::fail(std::exception_ptr error) {
    std::scoped_lock lock(mutex_);
    error_ = std::move(error);
    state_ = State::Failed;
    std::error_code ec;
    std::filesystem::remove(partPath(), ec);
    cv_.notify_all();
}

void Entry::adoptProducer(std::thread t) {
    producer_ = std::move(t);
}

void Entry::joinProducer() {
    if (producer_.joinable() && producer_.get_id() != std::this_thread::get_id()) producer_.join();
}

}
