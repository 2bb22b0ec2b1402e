#include "remote/PathResolver.hpp"
#include "remote/errors.hpp"
#include "log/Registry.hpp"

namespace loft::remote {

PathResolver::PathResolver(std::shared_ptr<Client> client) : client_(std::move(client)) {
    if (!client_) throw std::invalid_argument("PathResolver requires a client");
}

model::Folder PathResolver::parentOf(const PathParts& parts, const http::CancelToken& cancel) const {
    if (isRoot(parts.parent)) return client_->getFolders(cancel).front();
    return client_->getFolder(parts.parent, cancel);
}

DirEntry PathResolver::pick(const model::Folder& parent, const std::string& leaf, const std::string& path) {
    if (leaf.empty()) return parent;
    if (const auto* f = parent.file(leaf)) return *f;
    if (const auto* sub = parent.subfolder(leaf)) return *sub;
    return NotFoundEntry{path};
}

DirEntry PathResolver::lookup(const std::string& path, const http::CancelToken& cancel) const {
    const auto parts = parsePath(path);
    try {
        return pick(parentOf(parts, cancel), parts.leaf, path);
    } catch (const NoFolder&) {
        log::Registry::remote()->debug("[PathResolver] Parent of {} does not exist", path);
        return NotFoundEntry{path};
    }
}

DirEntry PathResolver::resolve(const std::string& path, const http::CancelToken& cancel) const {
    const auto parts = parsePath(path);
    auto entry = pick(parentOf(parts, cancel), parts.leaf, path);
    if (isMissing(entry)) throw NoFile(path);
    return entry;
}

model::Folder PathResolver::folder(const std::string& path, const http::CancelToken& cancel) const {
    auto entry = lookup(path, cancel);
    if (auto* f = std::get_if<model::Folder>(&entry)) return std::move(*f);
    throw NoFolder(path);
}

}
