#include "fs/ScratchFile.hpp"
#include "log/Registry.hpp"

#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

namespace loft::fs {

static std::string newScratchName() {
    static thread_local boost::uuids::random_generator gen;
    return boost::uuids::to_string(gen()) + ".scratch";
}

ScratchFile::ScratchFile(const std::filesystem::path& dir) {
    std::filesystem::create_directories(dir);
    path_ = dir / newScratchName();

    io_.open(path_, std::ios::in | std::ios::out | std::ios::binary | std::ios::trunc);
    if (!io_) throw std::filesystem::filesystem_error("failed to create scratch file", path_,
                                                      std::make_error_code(std::errc::io_error));
}

ScratchFile::~ScratchFile() {
    io_.close();
    std::error_code ec;
    std::filesystem::remove(path_, ec);
    if (ec) log::Registry::fs()->warn("[ScratchFile] Failed to remove {}: {}", path_.string(), ec.message());
}

void ScratchFile::writeAt(const char* data, const size_t len, const uint64_t offset) {
    io_.clear();
    io_.seekp(static_cast<std::streamoff>(offset));
    io_.write(data, static_cast<std::streamsize>(len));
    if (!io_) throw std::filesystem::filesystem_error("write to scratch file failed", path_,
                                                      std::make_error_code(std::errc::io_error));
}

void ScratchFile::flush() {
    io_.flush();
    if (!io_) throw std::filesystem::filesystem_error("flush of scratch file failed", path_,
                                                      std::make_error_code(std::errc::io_error));
}

void ScratchFile::truncate(const uint64_t size) {
    flush();
    std::filesystem::resize_file(path_, size);
}

uint64_t ScratchFile::size() {
    flush();
    return std::filesystem::file_size(path_);
}

std::ifstream ScratchFile::openReader() {
    flush();
    std::ifstream in(path_, std::ios::binary);
    if (!in) throw std::filesystem::filesystem_error("failed to reopen scratch file", path_,
                                                     std::make_error_code(std::errc::io_error));
    return in;
}

}
