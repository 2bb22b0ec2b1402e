#include <gtest/gtest.h>
#include "fs/Filesystem.hpp"
#include "cache/ReadThroughCache.hpp"
#include "remote/Client.hpp"
#include "remote/errors.hpp"
#include "support/FakeBackend.hpp"

#include <unistd.h>

using namespace loft;
using namespace loft::fs;
using loft::test::FakeBackend;
using loft::test::FakeTransport;
namespace stdfs = std::filesystem;

namespace {

template <typename F>
std::errc errcOf(F&& f) {
    try {
        f();
    } catch (const stdfs::filesystem_error& e) {
        return static_cast<std::errc>(e.code().value());
    }
    return std::errc{};
}

}

class FilesystemTest : public ::testing::Test {
protected:
    std::shared_ptr<FakeTransport> transport = std::make_shared<FakeTransport>();
    FakeBackend backend;
    std::shared_ptr<remote::Client> client;
    std::shared_ptr<cache::ReadThroughCache> cache;
    std::unique_ptr<Filesystem> fs;
    stdfs::path workDir;

    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        workDir = stdfs::temp_directory_path() / ("loft-fs-" + std::to_string(::getpid()) + "-" + info->name());
        stdfs::remove_all(workDir);

        backend.attach(*transport);
        backend.addFile("/docs/readme.txt", "read me please");
        backend.mkdirs("/docs/old");
        backend.mkdirs("/photos");

        auto tokens = std::make_shared<auth::TokenManager>(
            transport, FakeBackend::kBaseUrl, auth::TokenManagerOptions{.default_user = FakeBackend::kUser});
        tokens->authenticate(FakeBackend::kUser, FakeBackend::kPassword, "");

        client = std::make_shared<remote::Client>(transport, FakeBackend::kBaseUrl, tokens);
        cache = std::make_shared<cache::ReadThroughCache>(workDir / "cache", client);
        fs = std::make_unique<Filesystem>(client, workDir / "scratch", cache);
    }

    void TearDown() override {
        fs.reset();
        cache.reset();
        std::error_code ec;
        stdfs::remove_all(workDir, ec);
    }

    size_t scratchFiles() const {
        if (!stdfs::exists(workDir / "scratch")) return 0;
        return static_cast<size_t>(std::distance(stdfs::directory_iterator(workDir / "scratch"),
                                                 stdfs::directory_iterator{}));
    }

    static std::string readAll(Handle& h) {
        std::string out;
        char buf[5];
        while (const auto n = h.read(buf, sizeof(buf))) out.append(buf, n);
        return out;
    }
};

TEST_F(FilesystemTest, Stat_FileAndFolder) {
    const auto file = fs->stat("/docs/readme.txt");
    EXPECT_TRUE(file.isRegular());
    EXPECT_EQ(file.name, "readme.txt");
    EXPECT_EQ(file.size, 14u);
    EXPECT_EQ(file.mode & 0777, 0644u);
    EXPECT_FALSE(file.id.empty());

    const auto dir = fs->stat("/docs");
    EXPECT_TRUE(dir.isDir());
    EXPECT_EQ(dir.mode & 0777, 0755u);
    EXPECT_TRUE(dir.id.empty());

    EXPECT_TRUE(fs->stat("/").isDir());
}

TEST_F(FilesystemTest, Stat_MissingPathsAreENOENT) {
    EXPECT_EQ(errcOf([&] { (void)fs->stat("/docs/nope.txt"); }), std::errc::no_such_file_or_directory);
    EXPECT_EQ(errcOf([&] { (void)fs->stat("/nope/readme.txt"); }), std::errc::no_such_file_or_directory);
    EXPECT_EQ(errcOf([&] { (void)fs->open("/docs/nope.txt"); }), std::errc::no_such_file_or_directory);
    EXPECT_FALSE(fs->exists("/nope/readme.txt"));
    EXPECT_TRUE(fs->exists("/docs/readme.txt"));
}

TEST_F(FilesystemTest, ReadDir_ListsFoldersThenFiles) {
    const auto entries = fs->readDir("/docs");
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].name, "old");
    EXPECT_TRUE(entries[0].isDir());
    EXPECT_EQ(entries[1].name, "readme.txt");

    EXPECT_EQ(errcOf([&] { (void)fs->readDir("/docs/readme.txt"); }), std::errc::not_a_directory);

    auto handle = fs->open("/docs");
    EXPECT_TRUE(handle->isDir());
    EXPECT_EQ(handle->readDirNames(1), std::vector<std::string>{"old"});
}

TEST_F(FilesystemTest, Open_StreamsContent) {
    auto handle = fs->open("/docs/readme.txt");
    EXPECT_EQ(handle->name(), "readme.txt");
    EXPECT_EQ(readAll(*handle), "read me please");
    handle->close();
}

TEST_F(FilesystemTest, ReadAt_UsesTheCache) {
    auto handle = fs->open("/docs/readme.txt");
    char buf[8];
    ASSERT_EQ(handle->readAt(buf, 2, 5), 2u);
    EXPECT_EQ(std::string(buf, 2), "me");
    EXPECT_EQ(handle->readAt(buf, 8, 14), 0u);
    EXPECT_TRUE(cache->contains(handle->id()));
    EXPECT_EQ(readAll(*handle), "read me please");
}

TEST_F(FilesystemTest, ReadAt_WithoutCacheIsNotSupported) {
    Filesystem bare(client, workDir / "scratch");
    auto handle = bare.open("/docs/readme.txt");
    char buf[4];
    EXPECT_THROW((void)handle->readAt(buf, 4, 0), remote::NotSupported);
    EXPECT_THROW((void)handle->seek(0, SEEK_SET), remote::NotSupported);
}

TEST_F(FilesystemTest, Mkdir_IsIdempotent) {
    fs->mkdir("/photos/2024");
    EXPECT_NE(backend.folder("/photos/2024"), nullptr);
    EXPECT_EQ(backend.calls("api/v1/filestorage/folder-put"), 1);

    fs->mkdir("/photos/2024");
    EXPECT_EQ(backend.calls("api/v1/filestorage/folder-put"), 1);

    fs->mkdir("/top");
    EXPECT_NE(backend.folder("/top"), nullptr);
}

TEST_F(FilesystemTest, Mkdir_MissingParentOrFileInTheWay) {
    EXPECT_EQ(errcOf([&] { fs->mkdir("/nope/child"); }), std::errc::no_such_file_or_directory);
    EXPECT_EQ(errcOf([&] { fs->mkdir("/docs/readme.txt"); }), std::errc::file_exists);
}

TEST_F(FilesystemTest, MkdirAll_CreatesOnlyMissingLevels) {
    fs->mkdirAll("/docs/a/b/c");
    EXPECT_NE(backend.folder("/docs/a/b/c"), nullptr);
    EXPECT_EQ(backend.calls("api/v1/filestorage/folder-put"), 3);

    fs->mkdirAll("/docs/a/b/c");
    EXPECT_EQ(backend.calls("api/v1/filestorage/folder-put"), 3);
}

TEST_F(FilesystemTest, MkdirAll_DescendsThroughExistingFolders) {
    fs->mkdirAll("/docs/old");
    EXPECT_EQ(backend.calls("api/v1/filestorage/folder-put"), 0);

    fs->mkdirAll("/docs/old/x");
    EXPECT_NE(backend.folder("/docs/old/x"), nullptr);
    EXPECT_EQ(backend.calls("api/v1/filestorage/folder-put"), 1);

    EXPECT_EQ(errcOf([&] { fs->mkdirAll("/docs/readme.txt/x"); }), std::errc::not_a_directory);
}

TEST_F(FilesystemTest, Remove_FilesAndFolders) {
    fs->remove("/docs/readme.txt");
    EXPECT_EQ(backend.file("/docs/readme.txt"), nullptr);

    fs->remove("/docs/old");
    EXPECT_EQ(backend.folder("/docs/old"), nullptr);

    EXPECT_EQ(errcOf([&] { fs->remove("/docs/readme.txt"); }), std::errc::no_such_file_or_directory);
    EXPECT_EQ(errcOf([&] { fs->remove("/"); }), std::errc::permission_denied);
}

TEST_F(FilesystemTest, Rename_FileInPlaceUsesOneRequest) {
    fs->rename("/docs/readme.txt", "/docs/README");
    EXPECT_NE(backend.file("/docs/README"), nullptr);
    EXPECT_EQ(backend.calls("api/v1/filestorage/move-files"), 0);
}

TEST_F(FilesystemTest, Rename_FileAcrossFoldersMovesThenRenames) {
    const auto id = backend.file("/docs/readme.txt")->id;

    fs->rename("/docs/readme.txt", "/photos/readme.txt");
    EXPECT_NE(backend.file("/photos/readme.txt"), nullptr);
    EXPECT_EQ(backend.calls("api/v1/filestorage/move-files"), 1);
    EXPECT_EQ(backend.calls("api/v1/filestorage/" + id + "/edit"), 0);

    fs->rename("/photos/readme.txt", "/docs/notes.txt");
    EXPECT_NE(backend.file("/docs/notes.txt"), nullptr);
    EXPECT_EQ(backend.file("/docs/notes.txt")->id, id);
    EXPECT_EQ(backend.calls("api/v1/filestorage/" + id + "/edit"), 1);
}

TEST_F(FilesystemTest, Rename_Folders) {
    fs->rename("/docs/old", "/docs/archive");
    EXPECT_NE(backend.folder("/docs/archive"), nullptr);
    EXPECT_EQ(backend.folder("/docs/old"), nullptr);

    fs->rename("/docs/archive", "/photos/archive");
    EXPECT_NE(backend.folder("/photos/archive"), nullptr);

    EXPECT_EQ(errcOf([&] { fs->rename("/nope", "/x"); }), std::errc::no_such_file_or_directory);
}

TEST_F(FilesystemTest, Create_WriteCloseUploads) {
    auto handle = fs->create("/docs/new.txt");
    EXPECT_EQ(backend.file("/docs/new.txt"), nullptr);

    handle->writeString("hello ");
    handle->writeString("world");
    EXPECT_TRUE(handle->hasPendingWrites());
    EXPECT_EQ(scratchFiles(), 1u);

    handle->close();
    EXPECT_FALSE(handle->hasPendingWrites());
    EXPECT_EQ(scratchFiles(), 0u);

    const auto* stored = backend.file("/docs/new.txt");
    ASSERT_NE(stored, nullptr);
    EXPECT_EQ(backend.content(stored->id), "hello world");
    EXPECT_EQ(handle->stat().size, 11u);
}

TEST_F(FilesystemTest, WriteAtAndTruncateShapeTheUpload) {
    auto handle = fs->create("/docs/shaped.txt");
    handle->writeString("abcdefgh");
    handle->writeAt("XY", 2, 2);
    handle->truncate(6);
    handle->close();

    EXPECT_EQ(backend.content(backend.file("/docs/shaped.txt")->id), "abXYef");
}

TEST_F(FilesystemTest, OpenExclusiveOnExistingFileFails) {
    EXPECT_EQ(errcOf([&] { (void)fs->openFile("/docs/readme.txt", O_RDWR | O_CREAT | O_EXCL); }),
              std::errc::file_exists);
    EXPECT_NO_THROW((void)fs->openFile("/docs/fresh.txt", O_RDWR | O_CREAT | O_EXCL));
}

TEST_F(FilesystemTest, ClosingAnEmptyFileIsRefused) {
    auto handle = fs->create("/docs/empty.txt");
    handle->truncate(0);
    EXPECT_THROW(handle->close(), remote::EmptyPayload);
    EXPECT_EQ(backend.file("/docs/empty.txt"), nullptr);
}

TEST_F(FilesystemTest, FailedUploadKeepsWritesForRetry) {
    auto handle = fs->create("/docs/retry.txt");
    handle->writeString("precious");

    backend.failUploadsWith(503);
    EXPECT_THROW(handle->close(), remote::UnexpectedStatus);
    EXPECT_TRUE(handle->hasPendingWrites());
    EXPECT_EQ(scratchFiles(), 1u);

    backend.failUploadsWith(0);
    handle->close();
    EXPECT_EQ(backend.content(backend.file("/docs/retry.txt")->id), "precious");
}

TEST_F(FilesystemTest, WritingToAFolderHandleFails) {
    auto handle = fs->open("/docs");
    EXPECT_EQ(errcOf([&] { handle->writeString("x"); }), std::errc::is_a_directory);
}

TEST_F(FilesystemTest, MetadataChangesAreNotSupported) {
    EXPECT_THROW(fs->chmod("/docs/readme.txt", 0600), remote::NotSupported);
    EXPECT_THROW(fs->chown("/docs/readme.txt", 0, 0), remote::NotSupported);
    EXPECT_THROW(fs->chtimes("/docs/readme.txt", 0, 0), remote::NotSupported);
    EXPECT_EQ(Filesystem::name(), "loft");
}
