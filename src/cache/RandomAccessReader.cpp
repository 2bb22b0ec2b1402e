#include "cache/RandomAccessReader.hpp"
#include "cache/Entry.hpp"

#include <algorithm>
#include <stdexcept>

namespace loft::cache {

RandomAccessReader::RandomAccessReader(std::shared_ptr<Entry> entry) : entry_(std::move(entry)) {
    if (!entry_) throw std::invalid_argument("RandomAccessReader requires an entry");
    in_ = entry_->openStream();
    if (!in_) throw std::runtime_error("failed to open cache file for " + entry_->id());
}

uint64_t RandomAccessReader::size() const {
    return entry_ ? entry_->size() : 0;
}

size_t RandomAccessReader::readAt(char* buf, const size_t len, const uint64_t offset) {
    if (!entry_) throw std::logic_error("read on closed cache reader");

    const uint64_t total = entry_->size();
    if (len == 0 || offset >= total) return 0;

    const uint64_t end = std::min<uint64_t>(offset + len, total);
    const uint64_t available = entry_->waitFor(end);
    if (offset >= available) return 0;

    const auto n = static_cast<std::streamsize>(std::min(end, available) - offset);
    in_.clear();
    in_.seekg(static_cast<std::streamoff>(offset));
    in_.read(buf, n);
    return static_cast<size_t>(in_.gcount());
}

size_t RandomAccessReader::read(char* buf, const size_t len) {
    const auto n = readAt(buf, len, pos_);
    pos_ += n;
    return n;
}

void RandomAccessReader::close() {
    in_.close();
    entry_.reset();
}

}
