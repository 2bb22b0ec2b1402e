#pragma once

#include "remote/Client.hpp"
#include "remote/path.hpp"
#include "remote/model/File.hpp"
#include "remote/model/Folder.hpp"

#include <memory>
#include <string>
#include <variant>

namespace loft::remote {

struct NotFoundEntry {
    std::string path;
};

/// What a path names on the remote side.
using DirEntry = std::variant<NotFoundEntry, model::File, model::Folder>;

[[nodiscard]] inline bool isFile(const DirEntry& e) { return std::holds_alternative<model::File>(e); }
[[nodiscard]] inline bool isFolder(const DirEntry& e) { return std::holds_alternative<model::Folder>(e); }
[[nodiscard]] inline bool isMissing(const DirEntry& e) { return std::holds_alternative<NotFoundEntry>(e); }

/// Maps slash-delimited paths onto the server's folder tree. A file wins over a
/// folder with the same name.
class PathResolver {
public:
    explicit PathResolver(std::shared_ptr<Client> client);

    /// Never throws NotFound: a missing leaf or parent yields NotFoundEntry.
    [[nodiscard]] DirEntry lookup(const std::string& path, const http::CancelToken& cancel = {}) const;

    /// Like lookup(), but a missing leaf throws NoFile and a missing parent NoFolder.
    [[nodiscard]] DirEntry resolve(const std::string& path, const http::CancelToken& cancel = {}) const;

    /// The folder snapshot a path names; throws NoFolder otherwise.
    [[nodiscard]] model::Folder folder(const std::string& path, const http::CancelToken& cancel = {}) const;

    /// Parent snapshot: the root tree for top-level paths, the folder endpoint otherwise.
    [[nodiscard]] model::Folder parentOf(const PathParts& parts, const http::CancelToken& cancel) const;

    [[nodiscard]] const std::shared_ptr<Client>& client() const { return client_; }

private:
    std::shared_ptr<Client> client_;

    [[nodiscard]] static DirEntry pick(const model::Folder& parent, const std::string& leaf, const std::string& path);
};

}
