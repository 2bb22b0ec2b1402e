#include "remote/ChunkedUploader.hpp"
#include "remote/errors.hpp"
#include "remote/path.hpp"
#include "log/Registry.hpp"

#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <nlohmann/json.hpp>
#include <fmt/core.h>

using json = nlohmann::json;

namespace loft::remote {

namespace {
constexpr auto kUploadEndpoint = "api/upload";
constexpr auto kDefaultFileType = "application/octet-stream";
constexpr auto kContextFileStorage = "file-storage";

std::string serverMessage(const std::string& body) {
    const auto j = json::parse(body, nullptr, false);
    if (j.is_object() && j.contains("message") && j["message"].is_string()) return j["message"].get<std::string>();
    return body;
}
}

ChunkedUploader::ChunkedUploader(std::shared_ptr<Client> client, const uint64_t chunkSize)
    : client_(std::move(client)), chunkSize_(chunkSize) {
    if (!client_) throw std::invalid_argument("ChunkedUploader requires a client");
    if (chunkSize_ == 0) throw std::invalid_argument("chunk size must be positive");
}

std::string ChunkedUploader::newSessionId() {
    static thread_local boost::uuids::random_generator gen;
    return boost::uuids::to_string(gen());
}

model::File ChunkedUploader::upload(std::istream& in, const std::string& destinationPath, const uint64_t totalSize,
                                    const http::CancelToken& cancel) {
    if (totalSize == 0) throw EmptyPayload(fmt::format("refusing to upload empty file to {}", destinationPath));

    const auto [folder, fileName] = parsePath(destinationPath);
    if (fileName.empty()) throw std::invalid_argument("upload destination has no file name: " + destinationPath);

    model::UploadSession session(newSessionId(), totalSize, chunkSize_);

    const std::vector<http::FormPart> fixed{
        {.name = "resumableChunkSize", .value = std::to_string(session.chunk_size)},
        {.name = "resumableTotalSize", .value = std::to_string(session.total_size)},
        {.name = "resumableIdentifier", .value = session.identifier},
        {.name = "resumableType", .value = kDefaultFileType},
        {.name = "resumableFilename", .value = fileName},
        {.name = "resumableRelativePath", .value = fileName},
        {.name = "resumableTotalChunks", .value = std::to_string(session.total_chunks)},
        {.name = "context", .value = kContextFileStorage},
        {.name = "contextData", .value = json{{"folder", folder}}.dump()},
    };

    log::Registry::upload()->info("[ChunkedUploader] Uploading {} ({} bytes, {} chunk(s), session {})",
                                  destinationPath, totalSize, session.total_chunks, session.identifier);

    std::string buf;
    for (uint64_t chunk = 1; chunk <= session.total_chunks; ++chunk) {
        session.current_chunk = chunk;
        const auto len = session.chunkLength(chunk);

        buf.resize(len);
        in.read(buf.data(), static_cast<std::streamsize>(len));
        if (static_cast<uint64_t>(in.gcount()) != len)
            throw ShortSource(fmt::format("upload of {} aborted: source ended after {} of {} bytes",
                                          destinationPath,
                                          totalSize - session.remaining + static_cast<uint64_t>(in.gcount()),
                                          totalSize));

        auto form = fixed;
        form.push_back({.name = "resumableChunkNumber", .value = std::to_string(chunk)});
        form.push_back({.name = "resumableCurrentChunkSize", .value = std::to_string(len)});
        form.push_back({.name = "file", .value = std::move(buf), .filename = fileName,
                        .content_type = std::string(kDefaultFileType)});
        buf = {};

        const auto res = client_->postForm(kUploadEndpoint, std::move(form), cancel);

        if (res.status != 200) {
            const auto msg = serverMessage(res.body);
            log::Registry::upload()->error("[ChunkedUploader] Chunk {}/{} of {} failed: status {}: {}",
                                           chunk, session.total_chunks, destinationPath, res.status, msg);
            throw UnexpectedStatus(fmt::format("chunk {} upload failed, status: {}, message: {}",
                                               chunk, res.status, msg), res.status);
        }

        session.remaining -= len;
        if (progress_) progress_(totalSize - session.remaining, totalSize);

        if (!session.isLast(chunk)) continue;

        const auto j = json::parse(res.body, nullptr, false);
        if (!j.is_object() || !j.contains("id") || !j["id"].is_string() || j["id"].get<std::string>().empty())
            throw ProtocolViolation(fmt::format("upload of {} finished without a file record", destinationPath));

        auto file = j.get<model::File>();
        log::Registry::upload()->info("[ChunkedUploader] Uploaded {} as {}", destinationPath, file.id);
        return file;
    }

    throw ProtocolViolation(fmt::format("upload of {} sent no chunks", destinationPath));
}

}
