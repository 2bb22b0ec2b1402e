#include "remote/Client.hpp"
#include "remote/errors.hpp"
#include "remote/path.hpp"
#include "log/Registry.hpp"
#include "util/url.hpp"

#include <nlohmann/json.hpp>
#include <fmt/core.h>

using json = nlohmann::json;

namespace loft::remote {

namespace {
constexpr auto kDiskUsage = "api/v1/filestorage/disk-usage-summary";
constexpr auto kFiles = "api/v1/filestorage/files";
constexpr auto kDeleteFiles = "api/v1/filestorage/delete-files";
constexpr auto kMoveFiles = "api/v1/filestorage/move-files";
constexpr auto kEditFile = "api/v1/filestorage/{fileId}/edit";
constexpr auto kGetFileLink = "api/v1/filestorage/{fileId}/getlink";
constexpr auto kFolder = "api/v1/filestorage/folder";
constexpr auto kFolders = "api/v1/filestorage/folders";
constexpr auto kPutFolder = "api/v1/filestorage/folder-put";
constexpr auto kDeleteFolder = "api/v1/filestorage/delete-folder";
constexpr auto kPatchFolder = "api/v1/filestorage/folder-patch";
constexpr auto kDownload = "api/v1/filestorage/{fileId}/download";

constexpr auto kFolderNotFound = "Folder not found";

template <typename T>
T decode(const json& j, const char* key, const std::string& what) {
    try {
        return key ? j.at(key).get<T>() : j.get<T>();
    } catch (const json::exception& e) {
        throw DecodeError(fmt::format("{}: malformed response: {}", what, e.what()));
    }
}
}

Client::Client(std::shared_ptr<http::Transport> transport, std::string apiUrl,
               std::shared_ptr<auth::TokenManager> tokens)
    : Client(std::move(transport), std::move(apiUrl), std::move(tokens), ClientOptions{}) {}

Client::Client(std::shared_ptr<http::Transport> transport, std::string apiUrl,
               std::shared_ptr<auth::TokenManager> tokens, ClientOptions opts)
    : transport_(std::move(transport)), apiUrl_(std::move(apiUrl)), tokens_(std::move(tokens)), opts_(opts) {
    if (!transport_) throw std::invalid_argument("Client requires a transport");
    if (!tokens_) throw std::invalid_argument("Client requires a token manager");
}

http::CancelToken Client::scoped_(const http::CancelToken& cancel) const {
    if (opts_.request_timeout.count() <= 0) return cancel;
    return cancel.withDeadline(http::CancelToken::clock::now() + opts_.request_timeout);
}

http::Request Client::authorized_(const http::Method method, const std::string& endpoint,
                                  const http::CancelToken& cancel) const {
    http::Request req{.method = method, .url = util::joinUrl(apiUrl_, endpoint)};
    req.setHeader("Authorization", "Bearer " + tokens_->getToken(cancel));
    return req;
}

http::Response Client::send_(http::Request req, const http::CancelToken& cancel) const {
    log::Registry::remote()->debug("[Client] {} {}", http::to_string(req.method), req.url);
    return transport_->perform(req, scoped_(cancel));
}

json Client::call_(const http::Method method, const std::string& endpoint, const json* body,
                   const std::string& what, const http::CancelToken& cancel, const bool requireSuccess) const {
    auto req = authorized_(method, endpoint, cancel);
    if (body) {
        req.body = body->dump();
        req.setHeader("Content-Type", "application/json");
    }

    const auto res = send_(std::move(req), cancel);

    if (res.status != 200) {
        log::Registry::remote()->warn("[Client] {} failed: status {}", what, res.status);
        throw UnexpectedStatus(fmt::format("{}: unexpected status {}", what, res.status), res.status);
    }

    json j;
    try {
        j = json::parse(res.body);
    } catch (const json::parse_error& e) {
        throw DecodeError(fmt::format("{}: response is not JSON: {}", what, e.what()));
    }

    const bool hasSuccess = j.is_object() && j.contains("success") && j["success"].is_boolean();
    const bool success = hasSuccess && j["success"].get<bool>();
    if (!success && (requireSuccess || hasSuccess)) {
        const auto message = j.is_object() ? j.value("message", std::string{}) : std::string{};
        throw RequestRejected(fmt::format("{}: rejected by server: {}", what, message), message);
    }

    return j;
}

model::DiskUsage Client::diskUsage(const http::CancelToken& cancel) {
    const auto j = call_(http::Method::Get, kDiskUsage, nullptr, "disk usage", cancel, false);
    return decode<model::DiskUsage>(j, "diskUsage", "disk usage");
}

std::vector<model::Folder> Client::getFolders(const http::CancelToken& cancel) {
    const auto j = call_(http::Method::Get, kFolders, nullptr, "list folders", cancel, false);
    return decode<model::Folder>(j, "folder", "list folders").flatten();
}

model::Folder Client::getFolder(const std::string& path, const http::CancelToken& cancel) {
    const json body = {{"folder", path}};
    const auto what = fmt::format("get folder '{}'", path);
    try {
        const auto j = call_(http::Method::Post, kFolder, &body, what, cancel, true);
        return decode<model::Folder>(j, "folder", what);
    } catch (const RequestRejected& e) {
        if (e.message() == kFolderNotFound) throw NoFolder(path);
        throw;
    }
}

std::vector<model::File> Client::getFiles(const std::vector<std::string>& ids, const http::CancelToken& cancel) {
    const json body = {{"fileIds", ids}};
    const auto j = call_(http::Method::Post, kFiles, &body, "get files", cancel, false);
    if (!j.contains("files") || j["files"].is_null()) return {};
    return decode<std::vector<model::File>>(j, "files", "get files");
}

void Client::deleteFiles(const std::vector<std::string>& ids, const http::CancelToken& cancel) {
    const json body = {{"fileIds", ids}};
    call_(http::Method::Post, kDeleteFiles, &body, fmt::format("delete {} file(s)", ids.size()), cancel, false);
    log::Registry::remote()->info("[Client] Deleted {} file(s)", ids.size());
}

void Client::moveFiles(const std::string& folder, const std::vector<std::string>& ids,
                       const http::CancelToken& cancel) {
    const json body = {{"newFolder", folder}, {"fileIDs", ids}};
    call_(http::Method::Post, kMoveFiles, &body, fmt::format("move files to '{}'", folder), cancel, true);
}

void Client::renameFile(const std::string& id, const std::string& newName, const http::CancelToken& cancel) {
    const json body = {{"newFilename", newName}};
    call_(http::Method::Post, util::expandTemplate(kEditFile, "fileId", id), &body,
          fmt::format("rename file {}", id), cancel, true);
}

void Client::editFile(const std::string& id, const model::EditFileParams& params, const http::CancelToken& cancel) {
    const json body = params;
    call_(http::Method::Post, util::expandTemplate(kEditFile, "fileId", id), &body,
          fmt::format("edit file {}", id), cancel, true);
}

model::FileLink Client::getLink(const std::string& id, const http::CancelToken& cancel) {
    const auto what = fmt::format("get link for {}", id);
    const auto j = call_(http::Method::Get, util::expandTemplate(kGetFileLink, "fileId", id), nullptr, what, cancel, true);
    return decode<model::FileLink>(j, nullptr, what);
}

model::Folder Client::createFolder(const std::string& path, const http::CancelToken& cancel) {
    const auto [parent, name] = parsePath(path);
    const json body = {{"parentFolder", parent}, {"folder", name}};
    const auto what = fmt::format("create folder '{}'", path);
    const auto j = call_(http::Method::Post, kPutFolder, &body, what, cancel, true);

    log::Registry::remote()->info("[Client] Created folder {}", path);

    if (!j.contains("folder") || j["folder"].is_null())
        return model::Folder{.name = name, .path = joinPath(parent, name)};
    return decode<model::Folder>(j, "folder", what);
}

void Client::deleteFolder(const std::string& path, const http::CancelToken& cancel) {
    const auto [parent, name] = parsePath(path);
    const json body = {{"parentFolder", parent}, {"folder", name}};
    call_(http::Method::Post, kDeleteFolder, &body, fmt::format("delete folder '{}'", path), cancel, true);
    log::Registry::remote()->info("[Client] Deleted folder {}", path);
}

void Client::moveFolder(const std::string& path, const std::string& newParent, const std::string& newName,
                        const http::CancelToken& cancel) {
    json body = {{"folder", path}, {"newFolderName", newName}};
    if (!newParent.empty()) body["newParentFolder"] = newParent;
    call_(http::Method::Post, kPatchFolder, &body, fmt::format("move folder '{}'", path), cancel, true);
}

http::Request Client::downloadRequest_(const std::string& id, const Headers& headers,
                                       const http::CancelToken& cancel) const {
    auto req = authorized_(http::Method::Get, util::expandTemplate(kDownload, "fileId", id), cancel);
    for (const auto& [k, v] : headers) req.setHeader(k, v);
    return req;
}

void Client::downloadFile(const std::string& id, const http::Sink& sink, const Headers& headers,
                          const http::CancelToken& cancel) {
    const auto req = downloadRequest_(id, headers, cancel);
    log::Registry::remote()->debug("[Client] GET {}", req.url);

    const auto res = transport_->stream(req, sink, cancel);
    if (res.status != 200 && res.status != 206)
        throw UnexpectedStatus(fmt::format("download {}: unexpected status {}", id, res.status), res.status);
}

std::unique_ptr<DownloadStream> Client::openDownload(const std::string& id, const Headers& headers,
                                                     const http::CancelToken& cancel) {
    return std::make_unique<DownloadStream>(transport_, downloadRequest_(id, headers, cancel), cancel);
}

std::string Client::getFileId(const std::string& dir, const std::string& fileName, const http::CancelToken& cancel) {
    const auto folder = isRoot(dir) ? getFolders(cancel).front() : getFolder(dir, cancel);
    if (const auto* f = folder.file(fileName)) return f->id;
    throw NoFile(joinPath(isRoot(dir) ? "/" : dir, fileName));
}

http::Response Client::postForm(const std::string& endpoint, std::vector<http::FormPart> form,
                                const http::CancelToken& cancel) {
    auto req = authorized_(http::Method::Post, endpoint, cancel);
    req.form = std::move(form);
    return send_(std::move(req), cancel);
}

}
