#include "remote/model/UploadSession.hpp"

#include <stdexcept>
#include <utility>

namespace loft::remote::model {

UploadSession::UploadSession(std::string id, const uint64_t totalSize, const uint64_t chunkSize)
    : identifier(std::move(id)), total_size(totalSize), chunk_size(chunkSize),
      total_chunks(chunkCount(totalSize, chunkSize)), remaining(totalSize) {}

uint64_t UploadSession::chunkCount(const uint64_t totalSize, const uint64_t chunkSize) {
    if (chunkSize == 0) throw std::invalid_argument("chunk size must be positive");
    return (totalSize + chunkSize - 1) / chunkSize;
}

uint64_t UploadSession::chunkLength(const uint64_t index) const {
    if (index == 0 || index > total_chunks)
        throw std::out_of_range("chunk index " + std::to_string(index) + " outside 1.." + std::to_string(total_chunks));
    if (index < total_chunks) return chunk_size;
    return total_size - chunk_size * (total_chunks - 1);
}

}
