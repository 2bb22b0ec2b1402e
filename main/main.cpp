#include "config/ConfigRegistry.hpp"
#include "fs/Filesystem.hpp"
#include "http/errors.hpp"
#include "log/Registry.hpp"
#include "remote/ChunkedUploader.hpp"
#include "remote/Client.hpp"
#include "remote/PathResolver.hpp"
#include "remote/errors.hpp"
#include "remote/path.hpp"
#include "runtime/Deps.hpp"
#include "util/timestamp.hpp"

#include <fmt/core.h>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

using namespace loft;
using namespace loft::config;

namespace {

constexpr int EXIT_NOT_FOUND = 2;

void usage() {
    fmt::print(stderr,
               "usage: loft [--config PATH] <command> [args]\n"
               "\n"
               "commands:\n"
               "  login                 check the configured credentials\n"
               "  du                    show storage usage\n"
               "  ls [PATH]             list a folder\n"
               "  tree                  list every folder\n"
               "  stat PATH             show one entry\n"
               "  get REMOTE [LOCAL]    download a file (stdout when LOCAL is omitted)\n"
               "  put LOCAL REMOTE      upload a file\n"
               "  mkdir [-p] PATH       create a folder\n"
               "  rm PATH               remove a file or folder\n"
               "  mv FROM TO            move or rename\n"
               "  link PATH             print the share links of a file\n");
}

std::string humanSize(const uint64_t bytes) {
    static constexpr const char* units[] = {"B", "KiB", "MiB", "GiB", "TiB"};
    auto v = static_cast<double>(bytes);
    size_t u = 0;
    while (v >= 1024.0 && u < 4) {
        v /= 1024.0;
        ++u;
    }
    return u == 0 ? fmt::format("{} B", bytes) : fmt::format("{:.1f} {}", v, units[u]);
}

void printInfo(const fs::FileInfo& info) {
    fmt::print("{} {:>10} {} {}\n", info.isDir() ? 'd' : '-', info.isDir() ? std::string("-") : humanSize(info.size),
               util::timestampToString(info.mtime), info.name);
}

void requireArgs(const std::vector<std::string>& args, const size_t n, const std::string& cmd) {
    if (args.size() < n) throw std::invalid_argument(fmt::format("{}: missing argument", cmd));
}

int cmdDu(const runtime::Deps& deps) {
    const auto du = deps.client->diskUsage();
    fmt::print("used:         {}\n", humanSize(du.used));
    fmt::print("allowed:      {}\n", humanSize(du.allowed));
    fmt::print("available:    {}\n", humanSize(du.available()));
    fmt::print("file storage: {}\n", humanSize(du.file_storage));
    fmt::print("mailboxes:    {}\n", humanSize(du.mailboxes));
    return 0;
}

int cmdGet(const runtime::Deps& deps, const std::vector<std::string>& args) {
    requireArgs(args, 1, "get");
    auto handle = deps.filesystem->open(args[0]);
    if (handle->isDir()) throw std::invalid_argument(args[0] + " is a folder");

    std::ofstream file;
    if (args.size() > 1) {
        file.open(args[1], std::ios::binary | std::ios::trunc);
        if (!file) throw std::runtime_error("cannot write " + args[1]);
    }
    std::ostream& out = args.size() > 1 ? static_cast<std::ostream&>(file) : std::cout;

    std::vector<char> buf(256 * 1024);
    uint64_t total = 0;
    while (const auto n = handle->read(buf.data(), buf.size())) {
        out.write(buf.data(), static_cast<std::streamsize>(n));
        total += n;
    }
    handle->close();
    out.flush();
    if (!out) throw std::runtime_error("write failed");

    log::Registry::loft()->info("[get] {} ({} bytes)", args[0], total);
    return 0;
}

int cmdPut(const runtime::Deps& deps, const std::vector<std::string>& args) {
    requireArgs(args, 2, "put");
    std::ifstream in(args[0], std::ios::binary);
    if (!in) throw std::runtime_error("cannot read " + args[0]);

    const auto size = std::filesystem::file_size(args[0]);
    auto destination = args[1];
    if (destination.ends_with('/')) destination += std::filesystem::path(args[0]).filename().string();

    const auto file = deps.filesystem->uploader()->upload(in, destination, size);
    fmt::print("{} {}\n", file.id, destination);
    return 0;
}

int cmdTree(const runtime::Deps& deps) {
    for (const auto& folder : deps.client->getFolders())
        fmt::print("{:<60} {:>6} file(s) {:>10}\n", folder.path.empty() ? "/" : folder.path, folder.files.size(),
                   humanSize(folder.size));
    return 0;
}

int cmdLink(const runtime::Deps& deps, const std::vector<std::string>& args) {
    requireArgs(args, 1, "link");
    const auto entry = deps.filesystem->resolver()->resolve(args[0]);
    const auto* file = std::get_if<remote::model::File>(&entry);
    if (!file) throw std::invalid_argument(args[0] + " is not a file");

    const auto link = deps.client->getLink(file->id);
    fmt::print("short:  {}\npublic: {}\n", link.short_link, link.public_link);
    return 0;
}

int run(const runtime::Deps& deps, const std::string& cmd, const std::vector<std::string>& args) {
    if (cmd == "login") {
        fmt::print("logged in as {}\n", ConfigRegistry::get().auth.username);
        return 0;
    }
    if (cmd == "du") return cmdDu(deps);
    if (cmd == "tree") return cmdTree(deps);
    if (cmd == "get") return cmdGet(deps, args);
    if (cmd == "put") return cmdPut(deps, args);
    if (cmd == "link") return cmdLink(deps, args);

    if (cmd == "ls") {
        for (const auto& info : deps.filesystem->readDir(args.empty() ? "/" : args[0])) printInfo(info);
        return 0;
    }
    if (cmd == "stat") {
        requireArgs(args, 1, cmd);
        const auto info = deps.filesystem->stat(args[0]);
        fmt::print("name:     {}\n", info.name);
        if (!info.id.empty()) fmt::print("id:       {}\n", info.id);
        fmt::print("type:     {}\n", info.isDir() ? "folder" : "file");
        fmt::print("size:     {} ({} bytes)\n", humanSize(info.size), info.size);
        fmt::print("mode:     {:o}\n", info.mode & 07777);
        fmt::print("modified: {}\n", util::timestampToString(info.mtime));
        return 0;
    }
    if (cmd == "mkdir") {
        const bool parents = !args.empty() && args[0] == "-p";
        const std::vector rest(args.begin() + (parents ? 1 : 0), args.end());
        requireArgs(rest, 1, cmd);
        if (parents) deps.filesystem->mkdirAll(rest[0]);
        else deps.filesystem->mkdir(rest[0]);
        return 0;
    }
    if (cmd == "rm") {
        requireArgs(args, 1, cmd);
        deps.filesystem->remove(args[0]);
        return 0;
    }
    if (cmd == "mv") {
        requireArgs(args, 2, cmd);
        deps.filesystem->rename(args[0], args[1]);
        return 0;
    }

    usage();
    return 1;
}

}

int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);

    std::filesystem::path configPath;
    if (args.size() >= 2 && args[0] == "--config") {
        configPath = args[1];
        args.erase(args.begin(), args.begin() + 2);
    }

    if (args.empty() || args[0] == "-h" || args[0] == "--help") {
        usage();
        return args.empty() ? 1 : 0;
    }

    const auto cmd = args[0];
    args.erase(args.begin());

    try {
        ConfigRegistry::init(configPath.empty() ? ConfigRegistry::defaultPath() : configPath);
        log::Registry::init();

        const auto& cfg = ConfigRegistry::get();
        const auto deps = runtime::Deps::build(cfg);
        deps.authenticate(cfg);

        return run(deps, cmd, args);
    } catch (const std::filesystem::filesystem_error& e) {
        const bool missing = e.code() == std::errc::no_such_file_or_directory;
        if (log::Registry::isInitialized()) log::Registry::loft()->error("[{}] {}", cmd, e.what());
        else fmt::print(stderr, "loft: {}\n", e.what());
        return missing ? EXIT_NOT_FOUND : 1;
    } catch (const remote::NotFound& e) {
        log::Registry::loft()->error("[{}] {}", cmd, e.what());
        return EXIT_NOT_FOUND;
    } catch (const std::exception& e) {
        if (log::Registry::isInitialized()) log::Registry::loft()->error("[{}] {}", cmd, e.what());
        else fmt::print(stderr, "loft: {}\n", e.what());
        return 1;
    }
}
