#pragma once

#include "auth/TokenManager.hpp"
#include "http/Transport.hpp"
#include "remote/DownloadStream.hpp"
#include "remote/model/DiskUsage.hpp"
#include "remote/model/EditFileParams.hpp"
#include "remote/model/File.hpp"
#include "remote/model/FileLink.hpp"
#include "remote/model/Folder.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace loft::remote {

using Headers = std::vector<std::pair<std::string, std::string>>;

struct ClientOptions {
    // 0 = no per-request deadline. Never applied to downloads.
    std::chrono::milliseconds request_timeout{0};
};

/// REST surface of the file storage API. Every request carries a fresh bearer token.
class Client {
public:
    Client(std::shared_ptr<http::Transport> transport, std::string apiUrl,
           std::shared_ptr<auth::TokenManager> tokens);
    Client(std::shared_ptr<http::Transport> transport, std::string apiUrl,
           std::shared_ptr<auth::TokenManager> tokens, ClientOptions opts);

    [[nodiscard]] model::DiskUsage diskUsage(const http::CancelToken& cancel = {});

    /// The whole tree, root first, flattened in pre-order.
    [[nodiscard]] std::vector<model::Folder> getFolders(const http::CancelToken& cancel = {});

    /// Throws NoFolder when the backend reports the folder as missing.
    [[nodiscard]] model::Folder getFolder(const std::string& path, const http::CancelToken& cancel = {});

    [[nodiscard]] std::vector<model::File> getFiles(const std::vector<std::string>& ids,
                                                    const http::CancelToken& cancel = {});

    void deleteFiles(const std::vector<std::string>& ids, const http::CancelToken& cancel = {});
    void moveFiles(const std::string& folder, const std::vector<std::string>& ids,
                   const http::CancelToken& cancel = {});
    void renameFile(const std::string& id, const std::string& newName, const http::CancelToken& cancel = {});
    void editFile(const std::string& id, const model::EditFileParams& params, const http::CancelToken& cancel = {});
    [[nodiscard]] model::FileLink getLink(const std::string& id, const http::CancelToken& cancel = {});

    model::Folder createFolder(const std::string& path, const http::CancelToken& cancel = {});
    void deleteFolder(const std::string& path, const http::CancelToken& cancel = {});

    /// An empty newParent keeps the folder where it is.
    void moveFolder(const std::string& path, const std::string& newParent, const std::string& newName,
                    const http::CancelToken& cancel = {});

    /// Streams the body into sink. Extra headers (Range...) go on the request as-is.
    void downloadFile(const std::string& id, const http::Sink& sink, const Headers& headers = {},
                      const http::CancelToken& cancel = {});

    [[nodiscard]] std::unique_ptr<DownloadStream> openDownload(const std::string& id, const Headers& headers = {},
                                                               const http::CancelToken& cancel = {});

    /// Throws NoFile when dir has no file named fileName.
    [[nodiscard]] std::string getFileId(const std::string& dir, const std::string& fileName,
                                        const http::CancelToken& cancel = {});

    /// Multipart POST used by the chunked uploader. Status checks are left to the caller.
    http::Response postForm(const std::string& endpoint, std::vector<http::FormPart> form,
                            const http::CancelToken& cancel = {});

    [[nodiscard]] const std::string& apiUrl() const { return apiUrl_; }
    [[nodiscard]] const std::shared_ptr<auth::TokenManager>& tokens() const { return tokens_; }

private:
    std::shared_ptr<http::Transport> transport_;
    std::string apiUrl_;
    std::shared_ptr<auth::TokenManager> tokens_;
    ClientOptions opts_;

    [[nodiscard]] http::CancelToken scoped_(const http::CancelToken& cancel) const;
    http::Request authorized_(http::Method method, const std::string& endpoint, const http::CancelToken& cancel) const;

    http::Response send_(http::Request req, const http::CancelToken& cancel) const;
    nlohmann::json call_(http::Method method, const std::string& endpoint, const nlohmann::json* body,
                         const std::string& what, const http::CancelToken& cancel, bool requireSuccess) const;
    http::Request downloadRequest_(const std::string& id, const Headers& headers, const http::CancelToken& cancel) const;
};

}
