#include <gtest/gtest.h>
#include "remote/Client.hpp"
#include "remote/errors.hpp"
#include "support/FakeTransport.hpp"
#include "util/timestamp.hpp"

using namespace loft;
using namespace loft::remote;
using loft::test::FakeTransport;
using json = nlohmann::json;
using namespace std::chrono_literals;

class ClientTest : public ::testing::Test {
protected:
    std::shared_ptr<FakeTransport> transport = std::make_shared<FakeTransport>();
    std::shared_ptr<auth::TokenManager> tokens;
    std::unique_ptr<Client> client;

    void SetUp() override {
        tokens = std::make_shared<auth::TokenManager>(transport, "https://storage.test",
                                                      auth::TokenManagerOptions{.default_user = "alice"});
        const auto now = std::chrono::system_clock::now();
        transport->enqueueJson(200, {
            {"accessToken", "tok"},
            {"accessTokenExpiration", util::formatRfc3339(now + 1h)},
            {"refreshToken", "ref"},
            {"refreshTokenExpiration", util::formatRfc3339(now + 24h)},
        });
        tokens->authenticate("alice", "pw", "");
        transport->clear();

        client = std::make_unique<Client>(transport, "https://storage.test", tokens);
    }

    static json tree() {
        return {
            {"success", true},
            {"folder", {
                {"name", ""}, {"path", "/"},
                {"subfolders", json::array({
                    {{"name", "A"}, {"path", "/A"}, {"files", json::array({
                        {{"id", "f1"}, {"fileName", "x.txt"}, {"size", 3}}
                    })}},
                })},
                {"files", json::array({{{"id", "f0"}, {"fileName", "top.bin"}, {"size", 10}}})},
            }},
        };
    }
};

TEST_F(ClientTest, EveryRequestCarriesBearerToken) {
    transport->enqueueJson(200, {{"diskUsage", {{"allowed", 100}, {"used", 40}}}});
    const auto usage = client->diskUsage();

    EXPECT_EQ(usage.allowed, 100);
    EXPECT_EQ(usage.available(), 60);

    const auto req = transport->last();
    EXPECT_EQ(req.method, http::Method::Get);
    EXPECT_EQ(req.url, "https://storage.test/api/v1/filestorage/disk-usage-summary");
    EXPECT_EQ(req.header("authorization").value_or(""), "Bearer tok");
}

TEST_F(ClientTest, GetFolders_FlattensTreeRootFirst) {
    transport->enqueueJson(200, tree());
    const auto folders = client->getFolders();

    ASSERT_EQ(folders.size(), 2u);
    EXPECT_EQ(folders[0].path, "/");
    EXPECT_EQ(folders[1].path, "/A");
    ASSERT_EQ(folders[1].files.size(), 1u);
    EXPECT_EQ(folders[1].files[0].id, "f1");
}

TEST_F(ClientTest, GetFolder_PostsPathAndDecodesSnapshot) {
    transport->enqueueJson(200, {{"success", true}, {"folder", {{"name", "A"}, {"path", "/A"}}}});
    const auto folder = client->getFolder("/A");

    EXPECT_EQ(folder.name, "A");
    const auto req = transport->last();
    EXPECT_EQ(req.method, http::Method::Post);
    EXPECT_EQ(req.url, "https://storage.test/api/v1/filestorage/folder");
    EXPECT_EQ(json::parse(req.body)["folder"], "/A");
    EXPECT_EQ(req.header("Content-Type").value_or(""), "application/json");
}

TEST_F(ClientTest, GetFolder_FolderNotFoundMapsToNoFolder) {
    transport->enqueueJson(200, {{"success", false}, {"message", "Folder not found"}});
    EXPECT_THROW((void)client->getFolder("/missing"), NoFolder);
}

TEST_F(ClientTest, GetFolder_OtherRejectionStaysRequestRejected) {
    transport->enqueueJson(200, {{"success", false}, {"message", "Quota exceeded"}});
    try {
        (void)client->getFolder("/A");
        FAIL() << "expected RequestRejected";
    } catch (const RequestRejected& e) {
        EXPECT_EQ(e.message(), "Quota exceeded");
    }
}

TEST_F(ClientTest, GetFolder_MissingSuccessFlagIsRejected) {
    transport->enqueueJson(200, {{"folder", {{"name", "A"}}}});
    EXPECT_THROW((void)client->getFolder("/A"), RequestRejected);
}

TEST_F(ClientTest, NonOkStatusThrowsUnexpectedStatus) {
    transport->enqueue(503, "down");
    try {
        (void)client->getFolders();
        FAIL() << "expected UnexpectedStatus";
    } catch (const UnexpectedStatus& e) {
        EXPECT_EQ(e.status(), 503);
    }
}

TEST_F(ClientTest, NonJsonBodyThrowsDecodeError) {
    transport->enqueue(200, "<html>");
    EXPECT_THROW((void)client->diskUsage(), DecodeError);
}

TEST_F(ClientTest, GetFiles_PostsIdsAndToleratesNullList) {
    transport->enqueueJson(200, {{"files", json::array({{{"id", "f1"}, {"fileName", "x.txt"}}})}});
    const auto files = client->getFiles({"f1"});
    ASSERT_EQ(files.size(), 1u);
    EXPECT_EQ(files[0].name, "x.txt");
    EXPECT_EQ(json::parse(transport->last().body)["fileIds"], json::array({"f1"}));

    transport->enqueueJson(200, {{"files", nullptr}});
    EXPECT_TRUE(client->getFiles({"nope"}).empty());
}

TEST_F(ClientTest, DeleteAndMoveFilesSendExpectedBodies) {
    transport->enqueueJson(200, {{"success", true}});
    client->deleteFiles({"f1", "f2"});
    EXPECT_EQ(transport->last().url, "https://storage.test/api/v1/filestorage/delete-files");
    EXPECT_EQ(json::parse(transport->last().body)["fileIds"].size(), 2u);

    transport->enqueueJson(200, {{"success", true}});
    client->moveFiles("/B", {"f1"});
    const auto body = json::parse(transport->last().body);
    EXPECT_EQ(transport->last().url, "https://storage.test/api/v1/filestorage/move-files");
    EXPECT_EQ(body["newFolder"], "/B");
    EXPECT_EQ(body["fileIDs"], json::array({"f1"}));
}

TEST_F(ClientTest, MoveFiles_RejectedEnvelopeThrows) {
    transport->enqueueJson(200, {{"success", false}, {"message", "nope"}});
    EXPECT_THROW(client->moveFiles("/B", {"f1"}), RequestRejected);
}

TEST_F(ClientTest, RenameFile_ExpandsIdIntoEditEndpoint) {
    transport->enqueueJson(200, {{"success", true}});
    client->renameFile("f1", "y.txt");

    EXPECT_EQ(transport->last().url, "https://storage.test/api/v1/filestorage/f1/edit");
    EXPECT_EQ(json::parse(transport->last().body)["newFilename"], "y.txt");
}

TEST_F(ClientTest, GetLink_DecodesLinkFields) {
    transport->enqueueJson(200, {{"success", true}, {"shortLink", "s/abc"},
                                 {"publicLink", "https://storage.test/p/abc"}, {"isPublic", true}});
    const auto link = client->getLink("f1");

    EXPECT_EQ(transport->last().url, "https://storage.test/api/v1/filestorage/f1/getlink");
    EXPECT_EQ(link.short_link, "s/abc");
    EXPECT_EQ(link.public_link, "https://storage.test/p/abc");
    EXPECT_TRUE(link.is_public);
}

TEST_F(ClientTest, CreateAndDeleteFolderSplitParentAndName) {
    transport->enqueueJson(200, {{"success", true}});
    const auto created = client->createFolder("/A/B");
    EXPECT_EQ(created.name, "B");
    EXPECT_EQ(created.path, "/A/B");

    auto body = json::parse(transport->last().body);
    EXPECT_EQ(transport->last().url, "https://storage.test/api/v1/filestorage/folder-put");
    EXPECT_EQ(body["parentFolder"], "/A");
    EXPECT_EQ(body["folder"], "B");

    transport->enqueueJson(200, {{"success", true}});
    client->deleteFolder("/A/B");
    body = json::parse(transport->last().body);
    EXPECT_EQ(transport->last().url, "https://storage.test/api/v1/filestorage/delete-folder");
    EXPECT_EQ(body["parentFolder"], "/A");
    EXPECT_EQ(body["folder"], "B");
}

TEST_F(ClientTest, MoveFolder_EmptyParentIsOmitted) {
    transport->enqueueJson(200, {{"success", true}});
    client->moveFolder("/A", "", "Renamed");
    auto body = json::parse(transport->last().body);
    EXPECT_EQ(transport->last().url, "https://storage.test/api/v1/filestorage/folder-patch");
    EXPECT_EQ(body["folder"], "/A");
    EXPECT_EQ(body["newFolderName"], "Renamed");
    EXPECT_FALSE(body.contains("newParentFolder"));

    transport->enqueueJson(200, {{"success", true}});
    client->moveFolder("/A", "/B", "A");
    body = json::parse(transport->last().body);
    EXPECT_EQ(body["newParentFolder"], "/B");
}

TEST_F(ClientTest, DownloadFile_StreamsBodyAndForwardsHeaders) {
    transport->setStreamChunk(3);
    transport->enqueue(206, "hello world");

    std::string received;
    client->downloadFile("f1", [&](const char* data, const size_t len) {
        received.append(data, len);
        return true;
    }, {{"Range", "bytes=0-10"}});

    EXPECT_EQ(received, "hello world");
    const auto req = transport->last();
    EXPECT_EQ(req.url, "https://storage.test/api/v1/filestorage/f1/download");
    EXPECT_EQ(req.header("Range").value_or(""), "bytes=0-10");
}

TEST_F(ClientTest, DownloadFile_ErrorStatusThrows) {
    transport->enqueue(404, "gone");
    EXPECT_THROW(client->downloadFile("f1", [](const char*, size_t) { return true; }), UnexpectedStatus);
}

TEST_F(ClientTest, GetFileId_SearchesRootOrFolder) {
    transport->enqueueJson(200, tree());
    EXPECT_EQ(client->getFileId("/", "top.bin"), "f0");
    EXPECT_EQ(transport->last().url, "https://storage.test/api/v1/filestorage/folders");

    transport->enqueueJson(200, {{"success", true}, {"folder", tree()["folder"]["subfolders"][0]}});
    EXPECT_EQ(client->getFileId("/A", "x.txt"), "f1");

    transport->enqueueJson(200, {{"success", true}, {"folder", tree()["folder"]["subfolders"][0]}});
    EXPECT_THROW((void)client->getFileId("/A", "nope.txt"), NoFile);
}
