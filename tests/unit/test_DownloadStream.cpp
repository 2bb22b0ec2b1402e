#include <gtest/gtest.h>
#include "remote/DownloadStream.hpp"
#include "remote/errors.hpp"
#include "http/errors.hpp"
#include "support/FakeTransport.hpp"

using namespace loft;
using namespace loft::remote;
using loft::test::FakeTransport;

class DownloadStreamTest : public ::testing::Test {
protected:
    std::shared_ptr<FakeTransport> transport = std::make_shared<FakeTransport>();
    http::Request req{.method = http::Method::Get, .url = "https://storage.test/api/v1/filestorage/f1/download"};

    static std::string drain(DownloadStream& s, const size_t step) {
        std::string out;
        std::vector<char> buf(step);
        while (const auto n = s.read(buf.data(), buf.size())) out.append(buf.data(), n);
        return out;
    }
};

TEST_F(DownloadStreamTest, DeliversWholeBodyThroughSmallBuffer) {
    std::string body;
    for (int i = 0; i < 1000; ++i) body += std::to_string(i) + ",";
    transport->setStreamChunk(7);
    transport->enqueue(200, body);

    DownloadStream stream(transport, req, {}, 16);
    EXPECT_EQ(drain(stream, 5), body);
    EXPECT_EQ(stream.bytesRead(), body.size());

    char c;
    EXPECT_EQ(stream.read(&c, 1), 0u);
}

TEST_F(DownloadStreamTest, ReadFullStopsAtEndOfData) {
    transport->enqueue(206, "partial");
    DownloadStream stream(transport, req, {});

    std::string buf(32, '\0');
    const auto n = stream.readFull(buf.data(), buf.size());
    EXPECT_EQ(n, 7u);
    EXPECT_EQ(buf.substr(0, n), "partial");
}

TEST_F(DownloadStreamTest, ErrorStatusSurfacesOnRead) {
    transport->enqueue(404, "gone");
    DownloadStream stream(transport, req, {});

    char buf[8];
    try {
        (void)stream.read(buf, sizeof(buf));
        FAIL() << "expected UnexpectedStatus";
    } catch (const UnexpectedStatus& e) {
        EXPECT_EQ(e.status(), 404);
    }
}

TEST_F(DownloadStreamTest, CancelledTokenFailsTheRead) {
    transport->enqueue(200, "never delivered");
    const auto cancel = http::CancelToken::make();
    cancel.cancel();

    DownloadStream stream(transport, req, cancel);
    char buf[8];
    EXPECT_THROW((void)stream.read(buf, sizeof(buf)), http::Cancelled);
}

TEST_F(DownloadStreamTest, CloseMidTransferAbortsWithoutError) {
    transport->setStreamChunk(4);
    transport->enqueue(200, std::string(1 << 20, 'q'));

    const auto parent = http::CancelToken::make();
    DownloadStream stream(transport, req, parent, 16);

    char buf[4];
    EXPECT_EQ(stream.readFull(buf, sizeof(buf)), 4u);
    stream.close();

    EXPECT_EQ(stream.read(buf, sizeof(buf)), 0u);
    EXPECT_FALSE(parent.cancelled());
}
